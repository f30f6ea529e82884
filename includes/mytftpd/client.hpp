#pragma once

#include <expected>
#include <memory>
#include <optional>
#include "mytftp/options.hpp"
#include "mytftp/transport.hpp"
#include "mytftp/types.hpp"
#include "mytftpd/config.hpp"
#include "mytftpd/transaction.hpp"

namespace WindTftp::Driver {
    /// @note Binds a UDP transport for one client run; resolver and bind failures come back as `local_io`.
    [[nodiscard]] std::expected<std::unique_ptr<MyTftp::Transport>, TransferError> openClientTransport(const char* host_cstr, const char* port_cstr);

    /**
     * @brief Client side of one transfer: a single request/response exchange settles the options, then an engine moves the file.
     * @note The transport is handed to the engine after the exchange, so each client runs once.
     */
    class MyClient {
    private:
        ClientConfig m_config;
        std::unique_ptr<MyTftp::Transport> m_transport;

        /// @note Sends `request` until something answers, then pins the transport to whoever answered.
        [[nodiscard]] std::expected<MyTftp::Message, TransferError> request(const MyTftp::Message& request);

        [[nodiscard]] TransferResult upload();
        [[nodiscard]] TransferResult download();
        [[nodiscard]] TransferResult launchEngine(const MyTftp::OptionSet& options, std::optional<MyTftp::Message> opening);

        /// @note Reports a broken handshake to the peer before failing.
        [[nodiscard]] std::unexpected<TransferError> refuse(MyTftp::ErrorCode wire_code, TransferErrorKind kind, std::string message);

    public:
        MyClient() = delete;
        MyClient(ClientConfig config, std::unique_ptr<MyTftp::Transport> transport);

        MyClient(const MyClient& other) = delete;
        MyClient& operator=(const MyClient& other) = delete;

        [[nodiscard]] TransferResult run();

        [[nodiscard]] const ClientConfig& config() const noexcept;
    };
}
