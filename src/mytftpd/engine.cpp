#include <thread>
#include <utility>
#include <fmt/format.h>
#include "meta/helpers.hpp"
#include "meta/logging.hpp"
#include "mytftpd/engine.hpp"

namespace WindTftp::Driver {
    using MyTftp::Opcode;
    using Meta::LogLevel;

    TransferEngine::TransferEngine(std::unique_ptr<MyTftp::Transport> transport, TransferSession session)
    : m_transport {std::move(transport)}, m_session {std::move(session)}, m_last_reply {}, m_failure {}, m_deadline {}, m_state {EngineState::filling}, m_eof_seen {false} {}

    /// @note Only use for unconditional state transitions.
    EngineState TransferEngine::transition(EngineState next) noexcept {
        return next;
    }

    EngineState TransferEngine::fail(TransferErrorKind kind, std::string message, MyTftp::ErrorCode peer_code) {
        Meta::logMessage<LogLevel::fatal>("{} failed: {}: {}", m_session.file.string(), toKindName(kind), message);
        m_failure = TransferError {kind, std::move(message), peer_code};

        return EngineState::failed;
    }

    EngineState TransferEngine::abortWith(MyTftp::ErrorCode wire_code, TransferErrorKind kind, std::string message) {
        if (const auto status = m_transport->send(MyTftp::makeError(wire_code, message)); status != MyTftp::TransportStatus::ok) {
            Meta::logMessage<LogLevel::warning>("could not report error to peer: {}", MyTftp::toTransportMsg(status));
        }

        return fail(kind, std::move(message));
    }

    bool TransferEngine::spendRetry() noexcept {
        ++m_session.retries;

        return m_session.retries < m_session.local.retry_limit;
    }

    bool TransferEngine::transmit(const MyTftp::Message& msg) {
        const auto status = m_transport->send(msg);

        if (status != MyTftp::TransportStatus::ok) {
            m_state = fail(TransferErrorKind::local_io, fmt::format("sending {} failed: {}", MyTftp::toOpcodeName(msg.op), MyTftp::toTransportMsg(status)));
            return false;
        }

        return true;
    }

    void TransferEngine::stateConfirming() {
        auto received = m_transport->receive();

        if (not received) {
            if (received.error() == MyTftp::TransportStatus::io_error) {
                m_state = fail(TransferErrorKind::local_io, "receive failed while waiting for ACK 0");
                return;
            }

            if (received.error() == MyTftp::TransportStatus::malformed) {
                Meta::logMessage<LogLevel::debug>("ignoring undecodable datagram");
                return;
            }

            if (not spendRetry()) {
                m_state = fail(TransferErrorKind::timed_out, "no ACK for option acknowledgement");
                return;
            }

            Meta::logMessage<LogLevel::warning>("repeating OACK, attempt {}", m_session.retries);

            if (transmit(m_last_reply.value())) {
                m_state = transition(EngineState::confirming);
            }

            return;
        }

        const auto& [msg_op, msg_body] = received->msg;

        if (msg_op == Opcode::ack and std::get<MyTftp::AckPayload>(msg_body).block_n == Constants::request_ack_block) {
            m_session.retries = 0;
            m_state = transition(EngineState::filling);
        } else if (msg_op == Opcode::err) {
            const auto& [errcode, text] = std::get<MyTftp::ErrorPayload>(msg_body);
            m_state = fail(TransferErrorKind::peer_error, text, errcode);
        } else {
            m_state = abortWith(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("expected ACK 0, got {}", MyTftp::toOpcodeName(msg_op)));
        }
    }

    void TransferEngine::stateFilling(WindowRead& window) {
        const auto filled = window.fill();

        if (not filled) {
            m_state = abortWith(MyTftp::ErrorCode::not_defined, TransferErrorKind::local_io, fmt::format("reading {}: {}", m_session.file.string(), toWindowMsg(filled.error())));
            return;
        }

        if (window.isEmpty()) {
            m_state = transition(EngineState::done);
            return;
        }

        m_state = transition(EngineState::sending);
    }

    void TransferEngine::stateSending(WindowRead& window) {
        const auto window_len = window.getLength();

        for (std::size_t index = 0; index < window_len; ++index) {
            const auto block_n = Meta::wrappingAdd(m_session.next_block, index);

            if (index > 0 and m_session.local.window_wait.count() > 0) {
                std::this_thread::sleep_for(m_session.local.window_wait);
            }

            if (not transmit({Opcode::data, MyTftp::DataPayload {block_n, window.chunkAt(index)}})) {
                return;
            }

            Meta::logMessage<LogLevel::debug>("sent DATA {} ({}B)", block_n, window.chunkAt(index).size());
        }

        window.prefetch();
        m_deadline = Clock::now() + m_session.options.timeout;
        m_state = transition(EngineState::awaiting_ack);
    }

    void TransferEngine::onRetransmitDue(WindowRead& window) {
        if (not spendRetry()) {
            m_state = fail(TransferErrorKind::timed_out, fmt::format("no ACK for blocks from {} after {} retries", m_session.next_block, m_session.local.retry_limit));
            return;
        }

        Meta::logMessage<LogLevel::warning>("resending window of {} from block {}, attempt {}", window.getLength(), m_session.next_block, m_session.retries);
        m_state = transition(EngineState::sending);
    }

    void TransferEngine::stateAwaitingAck(WindowRead& window) {
        if (Clock::now() >= m_deadline) {
            onRetransmitDue(window);
            return;
        }

        auto received = m_transport->receive();

        if (not received) {
            switch (received.error()) {
                case MyTftp::TransportStatus::timed_out:
                    onRetransmitDue(window);
                    break;
                case MyTftp::TransportStatus::malformed:
                    Meta::logMessage<LogLevel::debug>("ignoring undecodable datagram");
                    break;
                default:
                    m_state = fail(TransferErrorKind::local_io, "receive failed while waiting for ACK");
                    break;
            }

            return;
        }

        const auto& [msg_op, msg_body] = received->msg;

        if (msg_op == Opcode::err) {
            const auto& [errcode, text] = std::get<MyTftp::ErrorPayload>(msg_body);
            m_state = fail(TransferErrorKind::peer_error, text, errcode);
            return;
        }

        if (msg_op == Opcode::oack and m_session.bytes_moved == 0UL and m_session.next_block == Constants::first_data_block) {
            /// NOTE: the peer saw none of the first window and repeated its OACK.
            Meta::logMessage<LogLevel::debug>("repeated OACK, resending the first window");
            m_state = transition(EngineState::sending);
            return;
        }

        if (msg_op != Opcode::ack) {
            m_state = abortWith(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("expected ACK, got {}", MyTftp::toOpcodeName(msg_op)));
            return;
        }

        const auto ack_block = std::get<MyTftp::AckPayload>(msg_body).block_n;
        const auto distance = Meta::wrappingDistance(m_session.next_block, ack_block);

        if (distance >= window.getLength()) {
            /// NOTE: a late duplicate, leaves both the window and the retry budget alone.
            Meta::logMessage<LogLevel::debug>("ignoring stale ACK {}", ack_block);
            return;
        }

        const auto covered = static_cast<std::size_t>(distance) + 1UL;

        for (std::size_t index = 0; index < covered; ++index) {
            m_session.bytes_moved += window.chunkAt(index).size();
        }

        if (const auto drained = window.drainFront(covered); not drained) {
            m_state = fail(TransferErrorKind::local_io, std::string {toWindowMsg(drained.error())});
            return;
        }

        Meta::logMessage<LogLevel::debug>("ACK {} covers {} block(s)", ack_block, covered);

        m_session.next_block = Meta::wrappingAdd(ack_block, 1);
        m_session.last_acked = ack_block;
        m_session.retries = 0;

        if (window.isEmpty() and window.reachedEof()) {
            m_state = transition(EngineState::done);
        } else {
            m_state = transition(EngineState::filling);
        }
    }

    void TransferEngine::onData(WindowWrite& window, MyTftp::DataPayload data) {
        const auto& [block_n, payload] = data;
        const auto windowsize = static_cast<std::size_t>(m_session.options.windowsize);

        if (payload.size() > m_session.options.block_size) {
            m_state = abortWith(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("DATA {} carries {}B, block size is {}", block_n, payload.size(), m_session.options.block_size));
            return;
        }

        const auto ahead = static_cast<std::size_t>(Meta::wrappingDistance(m_session.next_block, block_n));

        if (ahead == 0UL) {
            const auto is_short = payload.size() < m_session.options.block_size;
            m_session.bytes_moved += payload.size();

            if (const auto added = window.add(std::move(data.data)); not added) {
                m_state = fail(TransferErrorKind::local_io, std::string {toWindowMsg(added.error())});
                return;
            }

            Meta::logMessage<LogLevel::debug>("got DATA {}", m_session.next_block);

            m_session.next_block = Meta::wrappingAdd(m_session.next_block, 1);
            m_session.retries = 0;
            m_eof_seen = is_short;

            if (is_short or window.isFull()) {
                m_state = transition(EngineState::flushing);
            }

            return;
        }

        if (ahead < windowsize) {
            Meta::logMessage<LogLevel::debug>("gap before DATA {}, acknowledging what arrived", block_n);
            m_state = transition(EngineState::flushing);
            return;
        }

        const auto behind = static_cast<std::size_t>(Meta::wrappingDistance(block_n, m_session.next_block));

        if (behind <= 2UL * windowsize) {
            Meta::logMessage<LogLevel::debug>("duplicate DATA {}", block_n);

            if (not window.isEmpty()) {
                m_state = transition(EngineState::flushing);
            } else {
                static_cast<void>(transmit(MyTftp::makeAck(m_session.last_acked)));
            }

            return;
        }

        m_state = abortWith(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("DATA {} is outside the window starting at {}", block_n, m_session.next_block));
    }

    void TransferEngine::stateAwaitingData(WindowWrite& window) {
        auto received = m_transport->receive();

        if (not received) {
            switch (received.error()) {
                case MyTftp::TransportStatus::timed_out:
                    if (not spendRetry()) {
                        m_state = fail(TransferErrorKind::timed_out, fmt::format("no DATA {} after {} retries", m_session.next_block, m_session.local.retry_limit));
                        break;
                    }

                    Meta::logMessage<LogLevel::warning>("repeating last reply, attempt {}", m_session.retries);

                    if (m_last_reply.has_value()) {
                        static_cast<void>(transmit(m_last_reply.value()));
                    }

                    break;
                case MyTftp::TransportStatus::malformed:
                    Meta::logMessage<LogLevel::debug>("ignoring undecodable datagram");
                    break;
                default:
                    m_state = fail(TransferErrorKind::local_io, "receive failed while waiting for DATA");
                    break;
            }

            return;
        }

        auto& [msg_op, msg_body] = received->msg;

        if (msg_op == Opcode::data) {
            onData(window, std::move(std::get<MyTftp::DataPayload>(msg_body)));
        } else if (msg_op == Opcode::err) {
            const auto& [errcode, text] = std::get<MyTftp::ErrorPayload>(msg_body);
            m_state = fail(TransferErrorKind::peer_error, text, errcode);
        } else if (msg_op == Opcode::oack and m_session.last_acked == Constants::request_ack_block and m_session.next_block == Constants::first_data_block and m_last_reply.has_value()) {
            /// NOTE: our ACK 0 got lost and the peer repeated its OACK.
            static_cast<void>(transmit(m_last_reply.value()));
        } else {
            m_state = abortWith(MyTftp::ErrorCode::bad_operation, TransferErrorKind::protocol_violation, fmt::format("expected DATA, got {}", MyTftp::toOpcodeName(msg_op)));
        }
    }

    void TransferEngine::stateFlushing(WindowWrite& window) {
        if (const auto flushed = window.flush(); not flushed) {
            m_state = abortWith(MyTftp::ErrorCode::storage_issue, TransferErrorKind::local_io, fmt::format("writing {}: {}", m_session.file.string(), toWindowMsg(flushed.error())));
            return;
        }

        m_session.last_acked = static_cast<MyTftp::tftp_u16>(m_session.next_block - 1);
        m_last_reply = MyTftp::makeAck(m_session.last_acked);

        if (not transmit(m_last_reply.value())) {
            return;
        }

        Meta::logMessage<LogLevel::debug>("sent ACK {}", m_session.last_acked);

        m_state = transition(m_eof_seen ? EngineState::done : EngineState::awaiting_data);
    }

    TransferResult TransferEngine::finish() {
        if (m_state == EngineState::failed) {
            return std::unexpected {m_failure.value_or(TransferError {TransferErrorKind::local_io, "transfer stopped"})};
        }

        Meta::logMessage<LogLevel::info>("{} done, {}B moved", m_session.file.string(), m_session.bytes_moved);

        return m_session.bytes_moved;
    }

    TransferResult TransferEngine::send(std::optional<MyTftp::Message> opening) {
        WindowRead window {m_session.options.windowsize, m_session.options.block_size, m_session.file};

        if (not window.isOpen()) {
            m_state = abortWith(MyTftp::ErrorCode::file_not_found, TransferErrorKind::local_io, fmt::format("cannot open {}", m_session.file.string()));
            return finish();
        }

        m_last_reply = std::move(opening);
        m_session.next_block = Constants::first_data_block;
        m_state = m_last_reply.has_value() ? EngineState::confirming : EngineState::filling;

        while (m_state != EngineState::done and m_state != EngineState::failed) {
            switch (m_state) {
                case EngineState::confirming:
                    stateConfirming();
                    break;
                case EngineState::filling:
                    stateFilling(window);
                    break;
                case EngineState::sending:
                    stateSending(window);
                    break;
                case EngineState::awaiting_ack:
                    stateAwaitingAck(window);
                    break;
                default:
                    m_state = fail(TransferErrorKind::local_io, "upload reached a download state");
                    break;
            }
        }

        return finish();
    }

    TransferResult TransferEngine::receive(std::optional<MyTftp::Message> opening) {
        WindowWrite window {m_session.options.windowsize, m_session.file};

        if (not window.isOpen()) {
            m_state = abortWith(MyTftp::ErrorCode::access_violation, TransferErrorKind::local_io, fmt::format("cannot create {}", m_session.file.string()));
            return finish();
        }

        m_last_reply = std::move(opening);
        m_session.next_block = Constants::first_data_block;
        m_session.last_acked = Constants::request_ack_block;
        m_state = transition(EngineState::awaiting_data);

        while (m_state != EngineState::done and m_state != EngineState::failed) {
            switch (m_state) {
                case EngineState::awaiting_data:
                    stateAwaitingData(window);
                    break;
                case EngineState::flushing:
                    stateFlushing(window);
                    break;
                default:
                    m_state = fail(TransferErrorKind::local_io, "download reached an upload state");
                    break;
            }
        }

        if (m_state == EngineState::failed and m_session.local.clean_on_error) {
            window.release();
            FileUtils::discardPartial(m_session.file);
        } else if (m_state == EngineState::done and m_session.options.transfer_size.has_value()
            and m_session.options.transfer_size.value() != m_session.bytes_moved) {
            Meta::logMessage<LogLevel::warning>("tsize announced {}B but {}B arrived", m_session.options.transfer_size.value(), m_session.bytes_moved);
        }

        return finish();
    }
}
