#include <cstring>
#include <memory>
#include <stdexcept>
#include <unistd.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include "mybsock/netconfig.hpp"

namespace WindTftp::MyBSock {
    static constexpr const char* tftp_port_cstr = "69";
    static constexpr auto getaddrinfo_ok = 0;
    static constexpr auto syscall_failed = -1;

    [[nodiscard]] static addrinfo datagramHints(int flags) noexcept {
        addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;
        hints.ai_flags = flags;

        return hints;
    }

    SocketGenerator::SocketGenerator(const char* host_cstr, const char* port_cstr)
    : m_head {nullptr}, m_cursor {nullptr} {
        const auto hints = datagramHints(AI_PASSIVE);

        if (const auto result = getaddrinfo(host_cstr, (port_cstr != nullptr) ? port_cstr : tftp_port_cstr, &hints, &m_head); result != getaddrinfo_ok) {
            throw std::runtime_error {gai_strerror(result)};
        }

        m_cursor = m_head;
    }

    SocketGenerator::~SocketGenerator() {
        if (m_head != nullptr) {
            freeaddrinfo(m_head);
        }
    }

    SocketGenerator::operator bool() const noexcept {
        return m_cursor != nullptr;
    }

    UDPSocket SocketGenerator::operator()() {
        if (m_cursor == nullptr) {
            return {};
        }

        const addrinfo& candidate = *m_cursor;
        m_cursor = candidate.ai_next;

        const auto fd = socket(candidate.ai_family, candidate.ai_socktype, candidate.ai_protocol);

        if (fd == syscall_failed) {
            return {};
        }

        if (bind(fd, candidate.ai_addr, candidate.ai_addrlen) == syscall_failed) {
            close(fd);
            return {};
        }

        return UDPSocket {fd};
    }

    UDPSocket makeBoundSocket(const char* host_cstr, const char* port_cstr) {
        SocketGenerator candidates {host_cstr, port_cstr};

        while (candidates) {
            if (auto bound = candidates(); bound.isUsable()) {
                return bound;
            }
        }

        return {};
    }

    std::optional<sockaddr_in> resolveAddress(const char* host_cstr, const char* port_cstr) {
        const auto hints = datagramHints(0);
        addrinfo* found = nullptr;

        if (getaddrinfo(host_cstr, port_cstr, &hints, &found) != getaddrinfo_ok) {
            return {};
        }

        std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> results {found, &freeaddrinfo};

        if (results == nullptr or results->ai_addrlen < sizeof(sockaddr_in)) {
            return {};
        }

        sockaddr_in resolved {};
        std::memcpy(&resolved, results->ai_addr, sizeof(sockaddr_in));

        return resolved;
    }
}
