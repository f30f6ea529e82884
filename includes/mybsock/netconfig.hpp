#pragma once

#include <optional>
#include <netdb.h>
#include <netinet/in.h>
#include "mybsock/sockets.hpp"

namespace WindTftp::MyBSock {
    /// @note Walks the IPv4 datagram addresses `getaddrinfo` yields for a local host/port pair, binding one candidate per call.
    class SocketGenerator {
    public:
        SocketGenerator() = delete;
        SocketGenerator(const char* host_cstr, const char* port_cstr);
        ~SocketGenerator();

        SocketGenerator(const SocketGenerator& other) = delete;
        SocketGenerator& operator=(const SocketGenerator& other) = delete;

        explicit operator bool() const noexcept;

        /// @note Yields an unusable socket when the current candidate fails to bind.
        [[nodiscard]] UDPSocket operator()();

    private:
        addrinfo* m_head;
        addrinfo* m_cursor;
    };

    /// @note Binds the first usable local address, port "0" picks an ephemeral one.
    [[nodiscard]] UDPSocket makeBoundSocket(const char* host_cstr, const char* port_cstr);

    /// @note Resolves a remote host/port pair to its first IPv4 address.
    [[nodiscard]] std::optional<sockaddr_in> resolveAddress(const char* host_cstr, const char* port_cstr);
}
