#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "mytftp/transport.hpp"
#include "mytftp/types.hpp"
#include "mytftpd/transaction.hpp"
#include "mytftpd/window.hpp"

namespace WindTftp::Driver {
    enum class EngineState {
        confirming,
        filling,
        sending,
        awaiting_ack,
        awaiting_data,
        flushing,
        done,
        failed
    };

    /**
     * @brief Moves one file in one direction over an already connected transport.
     * @note Upload is go-back-N over a window of `windowsize` DATA blocks; download buffers a window and acknowledges it with one ACK.
     * Every failure ends the transfer; only network silence is retried, up to `LocalOptions::retry_limit` times.
     */
    class TransferEngine {
    private:
        using Clock = std::chrono::steady_clock;

        std::unique_ptr<MyTftp::Transport> m_transport;
        TransferSession m_session;
        std::optional<MyTftp::Message> m_last_reply;
        std::optional<TransferError> m_failure;
        Clock::time_point m_deadline;
        EngineState m_state;
        bool m_eof_seen;

        [[nodiscard]] EngineState transition(EngineState next) noexcept;
        [[nodiscard]] EngineState fail(TransferErrorKind kind, std::string message, MyTftp::ErrorCode peer_code = MyTftp::ErrorCode::not_defined);

        /// @note Tells the peer why the transfer stops before failing locally.
        [[nodiscard]] EngineState abortWith(MyTftp::ErrorCode wire_code, TransferErrorKind kind, std::string message);

        [[nodiscard]] bool spendRetry() noexcept;
        [[nodiscard]] bool transmit(const MyTftp::Message& msg);

        void stateConfirming();
        void stateFilling(WindowRead& window);
        void stateSending(WindowRead& window);
        void stateAwaitingAck(WindowRead& window);
        void stateAwaitingData(WindowWrite& window);
        void stateFlushing(WindowWrite& window);

        void onRetransmitDue(WindowRead& window);
        void onData(WindowWrite& window, MyTftp::DataPayload data);

        [[nodiscard]] TransferResult finish();

    public:
        TransferEngine() = delete;
        TransferEngine(std::unique_ptr<MyTftp::Transport> transport, TransferSession session);

        TransferEngine(const TransferEngine& other) = delete;
        TransferEngine& operator=(const TransferEngine& other) = delete;

        /// @note `opening` is an OACK already sent to the peer; the engine then waits for its ACK 0 first.
        [[nodiscard]] TransferResult send(std::optional<MyTftp::Message> opening = {});

        /// @note `opening` is the ACK 0 or OACK already sent to the peer, repeated while the first DATA is missing.
        [[nodiscard]] TransferResult receive(std::optional<MyTftp::Message> opening = {});
    };
}
