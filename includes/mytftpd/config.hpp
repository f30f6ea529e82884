#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <netinet/in.h>
#include "mytftp/options.hpp"

namespace WindTftp::Driver {
    enum class TransferMode {
        upload,
        download
    };

    struct ClientConfig {
        sockaddr_in remote_address {};
        std::chrono::milliseconds request_timeout {std::chrono::seconds {5}};
        TransferMode mode {TransferMode::download};
        std::filesystem::path file_local {};
        std::string file_remote {};
        std::filesystem::path receive_directory {"."};
        MyTftp::LocalOptions opt_local {};
        MyTftp::OptionSet opt_common {};
        bool verbose {false};
    };

    struct ServerConfig {
        std::string host {"0.0.0.0"};
        std::string port {"69"};
        std::filesystem::path directory {"."};
        bool read_only {false};
        bool overwrite {false};
        MyTftp::ServerLimits limits {};
        MyTftp::LocalOptions opt_local {};
        bool verbose {false};
    };

    [[nodiscard]] std::string_view clientUsage() noexcept;
    [[nodiscard]] std::string_view serverUsage() noexcept;

    /// @note `args` excludes the program name. Errors come back as a one-line reason.
    [[nodiscard]] std::expected<ClientConfig, std::string> parseClientArgs(std::span<const char* const> args);
    [[nodiscard]] std::expected<ServerConfig, std::string> parseServerArgs(std::span<const char* const> args);
}
