#pragma once

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <unistd.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include "mybsock/buffers.hpp"

namespace WindTftp::MyBSock {
    enum class IOStatus {
        ok,
        timed_out,
        invalid_args,
        pipe_closed
    };

    struct IOResult {
        sockaddr_in data;
        IOStatus status;
    };

    [[nodiscard]] bool sameEndpoint(const sockaddr_in& lhs, const sockaddr_in& rhs) noexcept;

    class UDPSocket {
    private:
        int m_fd;
        bool m_ready;
        bool m_closed;

        [[nodiscard]] static bool applyTimeout(int fd, int option, std::chrono::milliseconds timeout) noexcept;

    public:
        UDPSocket() noexcept;
        explicit UDPSocket(int fd) noexcept;
        ~UDPSocket();

        UDPSocket(const UDPSocket& other) = delete;
        UDPSocket& operator=(const UDPSocket& other) = delete;

        UDPSocket(UDPSocket&& other) noexcept;
        UDPSocket& operator=(UDPSocket&& other) noexcept;

        [[nodiscard]] bool isUsable() const noexcept;

        /// @note Port in host order, 0 when the socket is unusable.
        [[nodiscard]] std::uint16_t localPort() const noexcept;

        /// @note Pins later `recieveFrom` calls to datagrams from `peer` only.
        [[nodiscard]] bool connectTo(const sockaddr_in& peer) noexcept;

        [[nodiscard]] bool setReadTimeout(std::chrono::milliseconds timeout) noexcept;
        [[nodiscard]] bool setWriteTimeout(std::chrono::milliseconds timeout) noexcept;

        template <typename BufferT, std::size_t BufferN>
        [[nodiscard]] IOResult recieveFrom(FixedBuffer<BufferT, BufferN>& buffer) {
            if (m_closed) {
                return { {}, IOStatus::pipe_closed };
            }

            buffer.reset();

            IOResult temp = {};

            auto* read_ptr = buffer.viewPtr();
            socklen_t sa_size = sizeof(sockaddr_in);
            const auto count = recvfrom(m_fd, read_ptr, buffer.getSize(), 0, reinterpret_cast<sockaddr*>(&temp.data), &sa_size);

            if (count >= 0) {
                buffer.markLength(static_cast<std::size_t>(count));
                temp.status = IOStatus::ok;
            } else if (errno == EAGAIN or errno == EWOULDBLOCK or errno == EINTR) {
                /// NOTE: a signal ends the wait like a timeout so the caller can look at its stop flag.
                temp.status = IOStatus::timed_out;
            } else {
                temp.status = IOStatus::pipe_closed;
            }

            return temp;
        }

        template <typename BufferT, std::size_t BufferN>
        [[nodiscard]] IOResult sendTo(const FixedBuffer<BufferT, BufferN>& buffer, const sockaddr_in& destination) {
            if (m_closed) {
                return { destination, IOStatus::pipe_closed };
            }

            if (buffer.isEmpty()) {
                return { destination, IOStatus::invalid_args };
            }

            IOResult temp = { destination, IOStatus::ok };

            const auto* read_ptr = buffer.viewPtr();
            const auto n = buffer.getLength();
            auto count = sendto(m_fd, read_ptr, n, 0, reinterpret_cast<const sockaddr*>(&temp.data), sizeof(sockaddr_in));

            while (count < 0 and errno == EINTR) {
                count = sendto(m_fd, read_ptr, n, 0, reinterpret_cast<const sockaddr*>(&temp.data), sizeof(sockaddr_in));
            }

            if (count == static_cast<ssize_t>(n)) {
                temp.status = IOStatus::ok;
            } else if (count < 0 and (errno == EAGAIN or errno == EWOULDBLOCK)) {
                temp.status = IOStatus::timed_out;
            } else {
                temp.status = IOStatus::pipe_closed;
            }

            return temp;
        }
    };
}
