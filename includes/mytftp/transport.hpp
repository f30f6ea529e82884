#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string_view>
#include <netinet/in.h>
#include "mybsock/buffers.hpp"
#include "mybsock/sockets.hpp"
#include "mytftp/types.hpp"

namespace WindTftp::MyTftp {
    enum class TransportStatus {
        ok,
        timed_out,
        malformed,
        io_error
    };

    [[nodiscard]] std::string_view toTransportMsg(TransportStatus status) noexcept;

    struct Received {
        Message msg;
        sockaddr_in source;
    };

    /// @note Message-level datagram I/O. Once `connect` succeeds, `send` and `receive` only talk to that peer.
    class Transport {
    public:
        virtual ~Transport() = default;

        [[nodiscard]] virtual TransportStatus sendTo(const Message& msg, const sockaddr_in& destination) = 0;
        [[nodiscard]] virtual TransportStatus send(const Message& msg) = 0;
        [[nodiscard]] virtual std::expected<Received, TransportStatus> receive() = 0;
        [[nodiscard]] virtual bool connect(const sockaddr_in& peer) = 0;
        [[nodiscard]] virtual bool setReadTimeout(std::chrono::milliseconds timeout) = 0;
        [[nodiscard]] virtual bool setWriteTimeout(std::chrono::milliseconds timeout) = 0;
    };

    class UdpTransport final : public Transport {
    private:
        MyBSock::DatagramBuffer m_in_buffer;
        MyBSock::DatagramBuffer m_out_buffer;
        MyBSock::UDPSocket m_socket;
        std::optional<sockaddr_in> m_peer;

    public:
        UdpTransport() = delete;
        explicit UdpTransport(MyBSock::UDPSocket socket);

        [[nodiscard]] bool isUsable() const noexcept;
        [[nodiscard]] std::uint16_t localPort() const noexcept;

        [[nodiscard]] TransportStatus sendTo(const Message& msg, const sockaddr_in& destination) override;
        [[nodiscard]] TransportStatus send(const Message& msg) override;
        [[nodiscard]] std::expected<Received, TransportStatus> receive() override;
        [[nodiscard]] bool connect(const sockaddr_in& peer) override;
        [[nodiscard]] bool setReadTimeout(std::chrono::milliseconds timeout) override;
        [[nodiscard]] bool setWriteTimeout(std::chrono::milliseconds timeout) override;
    };
}
