#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <arpa/inet.h>
#include <pthread.h>
#include <fmt/format.h>
#include "meta/logging.hpp"
#include "mybsock/netconfig.hpp"
#include "mytftp/options.hpp"
#include "mytftpd/driver.hpp"
#include "mytftpd/engine.hpp"

namespace WindTftp::Driver {
    using MyTftp::Opcode;
    using Meta::LogLevel;

    static constexpr std::chrono::milliseconds listen_poll_timeout {1000};
    static constexpr auto ephemeral_port_cstr = "0";

    [[nodiscard]] static std::string describePeer(const sockaddr_in& peer) {
        char host_cstr[INET_ADDRSTRLEN] = {};

        if (inet_ntop(AF_INET, &peer.sin_addr, host_cstr, sizeof(host_cstr)) == nullptr) {
            return "?";
        }

        return fmt::format("{}:{}", host_cstr, ntohs(peer.sin_port));
    }

    /// @note Keeps SIGINT / SIGTERM blocked while alive, so threads started meanwhile leave them to the listener.
    class StopSignalBlock {
    private:
        sigset_t m_previous;

    public:
        StopSignalBlock() noexcept
        : m_previous {} {
            sigset_t stop_signals;
            sigemptyset(&stop_signals);
            sigaddset(&stop_signals, SIGINT);
            sigaddset(&stop_signals, SIGTERM);
            pthread_sigmask(SIG_BLOCK, &stop_signals, &m_previous);
        }

        ~StopSignalBlock() {
            pthread_sigmask(SIG_SETMASK, &m_previous, nullptr);
        }

        StopSignalBlock(const StopSignalBlock& other) = delete;
        StopSignalBlock& operator=(const StopSignalBlock& other) = delete;
    };

    /// @note Body of one transfer thread. `echoed` empty means the client's options were all ignored.
    static void runSession(std::unique_ptr<MyTftp::Transport> transport, Opcode op, TransferSession session, MyTftp::OptionList echoed, std::string peer_name) {
        const auto exchange_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(session.options.timeout);

        if (not transport->setReadTimeout(exchange_timeout) or not transport->setWriteTimeout(exchange_timeout)) {
            Meta::logMessage<LogLevel::fatal>("{}: cannot apply the negotiated timeout", peer_name);
            return;
        }

        std::optional<MyTftp::Message> opening;

        if (not echoed.empty()) {
            opening = MyTftp::Message {Opcode::oack, MyTftp::OackPayload {std::move(echoed)}};
        } else if (op == Opcode::wrq) {
            opening = MyTftp::makeAck(Constants::request_ack_block);
        }

        if (opening.has_value()) {
            if (const auto sent = transport->send(opening.value()); sent != MyTftp::TransportStatus::ok) {
                Meta::logMessage<LogLevel::fatal>("{}: sending {} failed: {}", peer_name, MyTftp::toOpcodeName(opening->op), MyTftp::toTransportMsg(sent));
                return;
            }
        }

        TransferEngine engine {std::move(transport), std::move(session)};
        const auto outcome = (op == Opcode::rrq) ? engine.send(std::move(opening)) : engine.receive(std::move(opening));

        if (outcome) {
            Meta::logMessage<LogLevel::info>("{}: {} finished, {}B", peer_name, MyTftp::toOpcodeName(op), outcome.value());
        } else {
            Meta::logMessage<LogLevel::warning>("{}: {} ended: {}", peer_name, MyTftp::toOpcodeName(op), describe(outcome.error()));
        }
    }

    MyServer::MyServer(ServerConfig config, MyBSock::UDPSocket socket)
    : m_config {std::move(config)}, m_listener {std::move(socket)}, m_sessions {}, m_pending {}, m_refusal {}, m_state {ServerState::decode}, m_halt {} {}

    MyServer::~MyServer() {
        reapSessions(true);
    }

    std::uint16_t MyServer::localPort() const noexcept {
        return m_listener.localPort();
    }

    void MyServer::requestStop() noexcept {
        m_halt.test_and_set();
    }

    /// @note Only use for unconditional state transitions.
    ServerState MyServer::transition(ServerState next) noexcept {
        return next;
    }

    ServerState MyServer::refuse(MyTftp::ErrorCode code, std::string message) {
        m_refusal = Refusal {code, std::move(message)};

        return ServerState::error;
    }

    bool MyServer::isActivePeer(const sockaddr_in& peer) const noexcept {
        for (const auto& slot : m_sessions) {
            if (not slot.finished->test() and MyBSock::sameEndpoint(slot.peer, peer)) {
                return true;
            }
        }

        return false;
    }

    void MyServer::reapSessions(bool wait_all) {
        auto slot_it = m_sessions.begin();

        while (slot_it != m_sessions.end()) {
            if (wait_all or slot_it->finished->test()) {
                if (slot_it->worker.joinable()) {
                    slot_it->worker.join();
                }

                slot_it = m_sessions.erase(slot_it);
            } else {
                ++slot_it;
            }
        }
    }

    void MyServer::stateDecode() {
        auto received = m_listener.receive();

        if (received) {
            m_pending = std::move(received.value());
            m_state = transition(ServerState::dispatch);
            return;
        }

        switch (received.error()) {
            case MyTftp::TransportStatus::timed_out:
                break;
            case MyTftp::TransportStatus::malformed:
                Meta::logMessage<LogLevel::debug>("ignoring undecodable datagram on the listening port");
                break;
            default:
                Meta::logMessage<LogLevel::fatal>("listening socket failed");
                m_state = transition(ServerState::stop);
                break;
        }
    }

    void MyServer::stateDispatch() {
        auto& [msg, source] = m_pending.value();
        const auto peer_name = describePeer(source);

        if (msg.op != Opcode::rrq and msg.op != Opcode::wrq) {
            m_state = refuse(MyTftp::ErrorCode::bad_operation, fmt::format("expected a request, got {}", MyTftp::toOpcodeName(msg.op)));
            return;
        }

        if (isActivePeer(source)) {
            Meta::logMessage<LogLevel::debug>("{}: repeated request while its transfer runs", peer_name);
            m_state = transition(ServerState::decode);
            return;
        }

        auto& [filename, mode, requested] = std::get<MyTftp::RWPayload>(msg.payload);

        Meta::logMessage<LogLevel::info>("{}: {} {}", peer_name, MyTftp::toOpcodeName(msg.op), filename);

        if (mode != Constants::octet_mode) {
            m_state = refuse(MyTftp::ErrorCode::bad_operation, "only octet mode is supported");
            return;
        }

        const auto target = FileUtils::resolveInside(m_config.directory, filename);

        if (not target) {
            m_state = refuse(MyTftp::ErrorCode::access_violation, "path escapes the served directory");
            return;
        }

        std::error_code fs_error;
        std::optional<std::uint64_t> file_size;

        if (msg.op == Opcode::rrq) {
            if (not std::filesystem::is_regular_file(target.value(), fs_error)) {
                m_state = refuse(MyTftp::ErrorCode::file_not_found, std::string {MyTftp::toErrorMsg(MyTftp::ErrorCode::file_not_found)});
                return;
            }

            const auto length = FileUtils::fileLength(target.value());

            if (not length) {
                m_state = refuse(MyTftp::ErrorCode::access_violation, length.error().message);
                return;
            }

            file_size = length.value();
        } else if (m_config.read_only) {
            m_state = refuse(MyTftp::ErrorCode::access_violation, "server is read-only");
            return;
        } else if (not m_config.overwrite and std::filesystem::exists(target.value(), fs_error)) {
            m_state = refuse(MyTftp::ErrorCode::file_already_exists, std::string {MyTftp::toErrorMsg(MyTftp::ErrorCode::file_already_exists)});
            return;
        }

        auto [options, echoed] = MyTftp::acceptProposal(requested, file_size, m_config.limits);

        startSession(source, msg.op, TransferSession {options, m_config.opt_local, target.value()}, std::move(echoed));

        if (m_state == ServerState::decode) {
            m_pending.reset();
        }
    }

    void MyServer::startSession(const sockaddr_in& peer, Opcode op, TransferSession session, MyTftp::OptionList echoed) {
        std::unique_ptr<MyTftp::UdpTransport> transport;

        try {
            transport = std::make_unique<MyTftp::UdpTransport>(MyBSock::makeBoundSocket(m_config.host.c_str(), ephemeral_port_cstr));
        } catch (const std::runtime_error& err) {
            m_state = refuse(MyTftp::ErrorCode::not_defined, fmt::format("no transfer socket available: {}", err.what()));
            return;
        }

        if (not transport->isUsable() or not transport->connect(peer)) {
            m_state = refuse(MyTftp::ErrorCode::not_defined, "no transfer socket available");
            return;
        }

        auto finished = std::make_shared<std::atomic_flag>();
        auto peer_name = describePeer(peer);

        Meta::logMessage<LogLevel::debug>("{}: transfer port {}", peer_name, transport->localPort());

        StopSignalBlock worker_mask;
        std::thread worker {[transport = std::move(transport), op, session = std::move(session), echoed = std::move(echoed), peer_name = std::move(peer_name), finished]() mutable {
            try {
                runSession(std::move(transport), op, std::move(session), std::move(echoed), peer_name);
            } catch (const std::exception& err) {
                Meta::logMessage<LogLevel::fatal>("{}: transfer aborted: {}", peer_name, err.what());
            }

            finished->test_and_set();
        }};

        m_sessions.push_back(SessionSlot {std::move(worker), std::move(finished), peer});
        m_state = transition(ServerState::decode);
    }

    void MyServer::stateError() {
        const auto& source = m_pending.value().source;
        const auto& [errcode, message] = m_refusal.value();

        Meta::logMessage<LogLevel::warning>("{}: refused: {}", describePeer(source), message);

        if (const auto sent = m_listener.sendTo(MyTftp::makeError(errcode, message), source); sent != MyTftp::TransportStatus::ok) {
            Meta::logMessage<LogLevel::warning>("could not deliver refusal: {}", MyTftp::toTransportMsg(sent));
        }

        m_pending.reset();
        m_refusal.reset();
        m_state = transition(ServerState::decode);
    }

    bool MyServer::runService() {
        if (not m_listener.isUsable() or not m_listener.setReadTimeout(listen_poll_timeout)) {
            return false;
        }

        Meta::logMessage<LogLevel::info>("serving {} on port {}", m_config.directory.string(), localPort());

        while (not m_halt.test() and m_state != ServerState::stop) {
            reapSessions(false);

            switch (m_state) {
                case ServerState::decode:
                    stateDecode();
                    break;
                case ServerState::dispatch:
                    stateDispatch();
                    break;
                case ServerState::error:
                    stateError();
                    break;
                default:
                    break;
            }
        }

        Meta::logMessage<LogLevel::info>("stopping, waiting on {} transfer(s)", m_sessions.size());
        reapSessions(true);

        return m_state != ServerState::stop;
    }
}
