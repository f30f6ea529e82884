#include <utility>
#include <sys/time.h>
#include "mybsock/sockets.hpp"

namespace WindTftp::MyBSock {
    static constexpr auto dud_socket_fd = -1;
    static constexpr auto sockopt_ok = 0;

    bool sameEndpoint(const sockaddr_in& lhs, const sockaddr_in& rhs) noexcept {
        return lhs.sin_family == rhs.sin_family and lhs.sin_port == rhs.sin_port and lhs.sin_addr.s_addr == rhs.sin_addr.s_addr;
    }

    bool UDPSocket::applyTimeout(int fd, int option, std::chrono::milliseconds timeout) noexcept {
        const auto whole_secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
        const auto rest_usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - whole_secs);

        timeval tv {};
        tv.tv_sec = static_cast<time_t>(whole_secs.count());
        tv.tv_usec = static_cast<suseconds_t>(rest_usecs.count());

        return setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) == sockopt_ok;
    }

    bool UDPSocket::isUsable() const noexcept {
        return not m_closed and m_ready;
    }

    std::uint16_t UDPSocket::localPort() const noexcept {
        if (not isUsable()) {
            return 0;
        }

        sockaddr_in self {};
        socklen_t sa_size = sizeof(sockaddr_in);

        if (getsockname(m_fd, reinterpret_cast<sockaddr*>(&self), &sa_size) != sockopt_ok) {
            return 0;
        }

        return ntohs(self.sin_port);
    }

    bool UDPSocket::connectTo(const sockaddr_in& peer) noexcept {
        if (not isUsable()) {
            return false;
        }

        return connect(m_fd, reinterpret_cast<const sockaddr*>(&peer), sizeof(sockaddr_in)) == sockopt_ok;
    }

    bool UDPSocket::setReadTimeout(std::chrono::milliseconds timeout) noexcept {
        return isUsable() and applyTimeout(m_fd, SO_RCVTIMEO, timeout);
    }

    bool UDPSocket::setWriteTimeout(std::chrono::milliseconds timeout) noexcept {
        return isUsable() and applyTimeout(m_fd, SO_SNDTIMEO, timeout);
    }

    UDPSocket::UDPSocket() noexcept
    : m_fd {dud_socket_fd}, m_ready {false}, m_closed {true} {}

    UDPSocket::UDPSocket(int fd) noexcept
    : m_fd {fd}, m_ready {fd != dud_socket_fd}, m_closed {not m_ready} {}

    UDPSocket::~UDPSocket() {
        if (not m_ready or m_closed) {
            return;
        }

        close(m_fd);
        m_closed = true;
    }

    UDPSocket::UDPSocket(UDPSocket&& other) noexcept
    : m_fd {std::exchange(other.m_fd, dud_socket_fd)},
    m_ready {std::exchange(other.m_ready, false)},
    m_closed {std::exchange(other.m_closed, true)} {}

    UDPSocket& UDPSocket::operator=(UDPSocket&& other) noexcept {
        if (&other == this) {
            return *this;
        }

        if (m_ready and not m_closed) {
            close(m_fd);
        }

        m_fd = std::exchange(other.m_fd, dud_socket_fd);
        m_ready = std::exchange(other.m_ready, false);
        m_closed = std::exchange(other.m_closed, true);

        return *this;
    }
}
