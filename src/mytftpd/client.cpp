#include <chrono>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>
#include <fmt/format.h>
#include "meta/logging.hpp"
#include "mytftpd/client.hpp"
#include "mybsock/netconfig.hpp"
#include "mytftpd/engine.hpp"

namespace WindTftp::Driver {
    using MyTftp::Opcode;
    using Meta::LogLevel;

    std::expected<std::unique_ptr<MyTftp::Transport>, TransferError> openClientTransport(const char* host_cstr, const char* port_cstr) {
        std::unique_ptr<MyTftp::UdpTransport> transport;

        try {
            transport = std::make_unique<MyTftp::UdpTransport>(MyBSock::makeBoundSocket(host_cstr, port_cstr));
        } catch (const std::runtime_error& err) {
            return transferFailure(TransferErrorKind::local_io, fmt::format("cannot bind {}:{}: {}", host_cstr, port_cstr, err.what()));
        }

        if (not transport->isUsable()) {
            return transferFailure(TransferErrorKind::local_io, "no local socket available");
        }

        return transport;
    }

    MyClient::MyClient(ClientConfig config, std::unique_ptr<MyTftp::Transport> transport)
    : m_config {std::move(config)}, m_transport {std::move(transport)} {}

    const ClientConfig& MyClient::config() const noexcept {
        return m_config;
    }

    std::unexpected<TransferError> MyClient::refuse(MyTftp::ErrorCode wire_code, TransferErrorKind kind, std::string message) {
        if (const auto status = m_transport->send(MyTftp::makeError(wire_code, message)); status != MyTftp::TransportStatus::ok) {
            Meta::logMessage<LogLevel::warning>("could not report error to server: {}", MyTftp::toTransportMsg(status));
        }

        Meta::logMessage<LogLevel::fatal>("{}: {}", toKindName(kind), message);

        return transferFailure(kind, std::move(message));
    }

    std::expected<MyTftp::Message, TransferError> MyClient::request(const MyTftp::Message& request) {
        if (not m_transport->setReadTimeout(m_config.request_timeout)) {
            return transferFailure(TransferErrorKind::local_io, "cannot set the request timeout");
        }

        const auto attempts = m_config.opt_local.retry_limit;

        for (unsigned int attempt = 1; attempt <= attempts; ++attempt) {
            if (const auto sent = m_transport->sendTo(request, m_config.remote_address); sent != MyTftp::TransportStatus::ok) {
                return transferFailure(TransferErrorKind::local_io, fmt::format("sending {} failed: {}", MyTftp::toOpcodeName(request.op), MyTftp::toTransportMsg(sent)));
            }

            auto received = m_transport->receive();

            if (received) {
                if (not m_transport->connect(received->source)) {
                    return transferFailure(TransferErrorKind::local_io, "cannot connect to the responding server");
                }

                return std::move(received->msg);
            }

            if (received.error() == MyTftp::TransportStatus::io_error) {
                return transferFailure(TransferErrorKind::local_io, "receive failed while waiting for the server");
            }

            Meta::logMessage<LogLevel::warning>("no usable answer to {} ({}), attempt {} of {}", MyTftp::toOpcodeName(request.op), MyTftp::toTransportMsg(received.error()), attempt, attempts);
        }

        return transferFailure(TransferErrorKind::timed_out, fmt::format("server did not answer {} after {} attempts", MyTftp::toOpcodeName(request.op), attempts));
    }

    TransferResult MyClient::launchEngine(const MyTftp::OptionSet& options, std::optional<MyTftp::Message> opening) {
        const auto exchange_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(options.timeout);

        if (not m_transport->setReadTimeout(exchange_timeout) or not m_transport->setWriteTimeout(exchange_timeout)) {
            return transferFailure(TransferErrorKind::local_io, "cannot apply the negotiated timeout");
        }

        Meta::logMessage<LogLevel::info>("{} {}: blksize={} windowsize={} timeout={}s", (m_config.mode == TransferMode::upload) ? "uploading" : "downloading", m_config.file_local.string(), options.block_size, options.windowsize, options.timeout.count());

        TransferEngine engine {std::move(m_transport), TransferSession {options, m_config.opt_local, m_config.file_local}};
        TransferResult outcome = transferFailure(TransferErrorKind::local_io, "transfer worker never ran");
        const auto mode = m_config.mode;

        std::thread worker {[&engine, &outcome, mode, opening = std::move(opening)]() mutable {
            try {
                outcome = (mode == TransferMode::upload) ? engine.send() : engine.receive(std::move(opening));
            } catch (const std::exception& err) {
                outcome = transferFailure(TransferErrorKind::local_io, err.what());
            }
        }};

        worker.join();

        return outcome;
    }

    TransferResult MyClient::upload() {
        const auto file_length = FileUtils::fileLength(m_config.file_local);

        if (not file_length) {
            return std::unexpected {file_length.error()};
        }

        if (m_config.file_remote.empty()) {
            auto base_name = FileUtils::baseName(m_config.file_local);

            if (not base_name) {
                return transferFailure(TransferErrorKind::local_io, fmt::format("{} has no file name", m_config.file_local.string()));
            }

            m_config.file_remote = std::move(base_name.value());
        }

        auto proposal = m_config.opt_common;
        proposal.transfer_size = file_length.value();

        Meta::logMessage<LogLevel::debug>("sending WRQ for {}", m_config.file_remote);

        auto response = request({Opcode::wrq, MyTftp::RWPayload {m_config.file_remote, Constants::octet_mode, proposal.prepare()}});

        if (not response) {
            return std::unexpected {std::move(response.error())};
        }

        auto& [msg_op, msg_body] = response.value();

        switch (msg_op) {
            case Opcode::oack: {
                const auto& accepted = std::get<MyTftp::OackPayload>(msg_body).options;
                const auto negotiated = MyTftp::negotiate(proposal, accepted);

                if (not negotiated) {
                    return refuse(MyTftp::ErrorCode::bad_options, TransferErrorKind::negotiation, std::string {MyTftp::toNegotiationMsg(negotiated.error())});
                }

                return launchEngine(negotiated.value(), {});
            }
            case Opcode::ack: {
                const auto ack_block = std::get<MyTftp::AckPayload>(msg_body).block_n;

                if (ack_block != Constants::request_ack_block) {
                    return refuse(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("WRQ answered with ACK {}", ack_block));
                }

                Meta::logMessage<LogLevel::debug>("server ignored options, using defaults");

                return launchEngine(MyTftp::OptionSet {}, {});
            }
            case Opcode::err: {
                auto& [errcode, text] = std::get<MyTftp::ErrorPayload>(msg_body);
                Meta::logMessage<LogLevel::fatal>("server refused WRQ: {}", text);

                return transferFailure(TransferErrorKind::peer_error, std::move(text), errcode);
            }
            default:
                return refuse(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("WRQ answered with {}", MyTftp::toOpcodeName(msg_op)));
        }
    }

    TransferResult MyClient::download() {
        if (m_config.file_remote.empty()) {
            auto base_name = FileUtils::baseName(m_config.file_local);

            if (not base_name) {
                return transferFailure(TransferErrorKind::local_io, fmt::format("{} has no file name", m_config.file_local.string()));
            }

            m_config.file_remote = m_config.file_local.string();
            m_config.file_local = m_config.receive_directory / base_name.value();
        } else {
            m_config.file_local = m_config.receive_directory / m_config.file_local;
        }

        auto proposal = m_config.opt_common;

        if (not proposal.transfer_size.has_value()) {
            proposal.transfer_size = 0;
        }

        Meta::logMessage<LogLevel::debug>("sending RRQ for {}", m_config.file_remote);

        auto response = request({Opcode::rrq, MyTftp::RWPayload {m_config.file_remote, Constants::octet_mode, proposal.prepare()}});

        if (not response) {
            return std::unexpected {std::move(response.error())};
        }

        auto& [msg_op, msg_body] = response.value();

        switch (msg_op) {
            case Opcode::oack: {
                const auto& accepted = std::get<MyTftp::OackPayload>(msg_body).options;
                const auto negotiated = MyTftp::negotiate(proposal, accepted);

                if (not negotiated) {
                    return refuse(MyTftp::ErrorCode::bad_options, TransferErrorKind::negotiation, std::string {MyTftp::toNegotiationMsg(negotiated.error())});
                }

                auto confirm = MyTftp::makeAck(Constants::request_ack_block);

                if (const auto sent = m_transport->send(confirm); sent != MyTftp::TransportStatus::ok) {
                    return transferFailure(TransferErrorKind::local_io, fmt::format("sending ACK 0 failed: {}", MyTftp::toTransportMsg(sent)));
                }

                return launchEngine(negotiated.value(), std::move(confirm));
            }
            case Opcode::data:
                return refuse(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, "server skipped option negotiation, which is unsupported");
            case Opcode::err: {
                auto& [errcode, text] = std::get<MyTftp::ErrorPayload>(msg_body);
                Meta::logMessage<LogLevel::fatal>("server refused RRQ: {}", text);

                return transferFailure(TransferErrorKind::peer_error, std::move(text), errcode);
            }
            default:
                return refuse(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("RRQ answered with {}", MyTftp::toOpcodeName(msg_op)));
        }
    }

    TransferResult MyClient::run() {
        if (not m_transport) {
            return transferFailure(TransferErrorKind::local_io, "client already ran");
        }

        try {
            return (m_config.mode == TransferMode::upload) ? upload() : download();
        } catch (const std::exception& err) {
            return transferFailure(TransferErrorKind::local_io, err.what());
        }
    }
}
