#include <array>
#include <utility>
#include "mytftp/messaging.hpp"
#include "mytftp/transport.hpp"

namespace WindTftp::MyTftp {
    static constexpr std::array<std::string_view, 4> transport_msgs = {
        "ok",
        "timed out",
        "malformed datagram",
        "socket I/O failure"
    };

    [[nodiscard]] static TransportStatus toTransportStatus(MyBSock::IOStatus io_status) noexcept {
        switch (io_status) {
            case MyBSock::IOStatus::ok:
                return TransportStatus::ok;
            case MyBSock::IOStatus::timed_out:
                return TransportStatus::timed_out;
            default:
                return TransportStatus::io_error;
        }
    }

    std::string_view toTransportMsg(TransportStatus status) noexcept {
        return transport_msgs[static_cast<std::size_t>(status)];
    }

    UdpTransport::UdpTransport(MyBSock::UDPSocket socket)
    : m_in_buffer {}, m_out_buffer {}, m_socket {std::move(socket)}, m_peer {} {}

    bool UdpTransport::isUsable() const noexcept {
        return m_socket.isUsable();
    }

    std::uint16_t UdpTransport::localPort() const noexcept {
        return m_socket.localPort();
    }

    TransportStatus UdpTransport::sendTo(const Message& msg, const sockaddr_in& destination) {
        if (not serializeMessage(m_out_buffer, msg)) {
            return TransportStatus::malformed;
        }

        return toTransportStatus(m_socket.sendTo(m_out_buffer, destination).status);
    }

    TransportStatus UdpTransport::send(const Message& msg) {
        if (not m_peer.has_value()) {
            return TransportStatus::io_error;
        }

        return sendTo(msg, m_peer.value());
    }

    std::expected<Received, TransportStatus> UdpTransport::receive() {
        const auto io_info = m_socket.recieveFrom(m_in_buffer);

        if (const auto status = toTransportStatus(io_info.status); status != TransportStatus::ok) {
            return std::unexpected {status};
        }

        auto msg = parseMessage(m_in_buffer);

        if (msg.op == Opcode::none) {
            return std::unexpected {TransportStatus::malformed};
        }

        return Received {std::move(msg), io_info.data};
    }

    bool UdpTransport::connect(const sockaddr_in& peer) {
        if (not m_socket.connectTo(peer)) {
            return false;
        }

        m_peer = peer;

        return true;
    }

    bool UdpTransport::setReadTimeout(std::chrono::milliseconds timeout) {
        return m_socket.setReadTimeout(timeout);
    }

    bool UdpTransport::setWriteTimeout(std::chrono::milliseconds timeout) {
        return m_socket.setWriteTimeout(timeout);
    }
}
