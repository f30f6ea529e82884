#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <netinet/in.h>
#include "mybsock/sockets.hpp"
#include "mytftp/transport.hpp"
#include "mytftp/types.hpp"
#include "mytftpd/config.hpp"
#include "mytftpd/transaction.hpp"

namespace WindTftp::Driver {
    enum class ServerState {
        decode,
        dispatch,
        error,
        stop
    };

    /// @note Why a request is turned away, sent back as an ERROR from the listening port.
    struct Refusal {
        MyTftp::ErrorCode code;
        std::string message;
    };

    struct SessionSlot {
        std::thread worker;
        std::shared_ptr<std::atomic_flag> finished;
        sockaddr_in peer;
    };

    /**
     * @brief Answers RRQ / WRQ on one listening socket, running each accepted transfer on its own socket and thread.
     */
    class MyServer {
    private:
        ServerConfig m_config;
        MyTftp::UdpTransport m_listener;
        std::vector<SessionSlot> m_sessions;
        std::optional<MyTftp::Received> m_pending;
        std::optional<Refusal> m_refusal;
        ServerState m_state;
        std::atomic_flag m_halt;

        [[nodiscard]] ServerState transition(ServerState next) noexcept;

        /// @note Ends in `ServerState::error` with `m_refusal` set.
        [[nodiscard]] ServerState refuse(MyTftp::ErrorCode code, std::string message);

        void stateDecode();
        void stateDispatch();
        void stateError();

        [[nodiscard]] bool isActivePeer(const sockaddr_in& peer) const noexcept;
        void startSession(const sockaddr_in& peer, MyTftp::Opcode op, TransferSession session, MyTftp::OptionList echoed);
        void reapSessions(bool wait_all);

    public:
        MyServer() = delete;
        MyServer(ServerConfig config, MyBSock::UDPSocket socket);
        ~MyServer();

        MyServer(const MyServer& other) = delete;
        MyServer& operator=(const MyServer& other) = delete;

        [[nodiscard]] std::uint16_t localPort() const noexcept;

        /// @note Safe to call from a signal handler or another thread.
        void requestStop() noexcept;

        /// @note Blocks until `requestStop` or a listening socket failure, then joins every running transfer.
        [[nodiscard]] bool runService();
    };
}
