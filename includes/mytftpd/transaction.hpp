#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include "mytftp/options.hpp"
#include "mytftp/types.hpp"

namespace WindTftp::Driver {
    namespace Constants {
        inline constexpr MyTftp::tftp_u16 first_data_block = 1;
        inline constexpr MyTftp::tftp_u16 request_ack_block = 0;
        inline constexpr auto octet_mode = MyTftp::DataMode::octet;
    }

    enum class TransferErrorKind {
        negotiation,
        protocol_violation,
        peer_error,
        timed_out,
        local_io
    };

    [[nodiscard]] std::string_view toKindName(TransferErrorKind kind) noexcept;

    struct TransferError {
        TransferErrorKind kind;
        std::string message;
        MyTftp::ErrorCode peer_code {MyTftp::ErrorCode::not_defined};
    };

    [[nodiscard]] std::string describe(const TransferError& error);

    /// @note Bytes moved through the file on success.
    using TransferResult = std::expected<std::uint64_t, TransferError>;

    [[nodiscard]] inline std::unexpected<TransferError> transferFailure(TransferErrorKind kind, std::string message, MyTftp::ErrorCode peer_code = MyTftp::ErrorCode::not_defined) {
        return std::unexpected {TransferError {kind, std::move(message), peer_code}};
    }

    namespace FileUtils {
        [[nodiscard]] std::expected<std::uint64_t, TransferError> fileLength(const std::filesystem::path& path);
        [[nodiscard]] std::optional<std::string> baseName(const std::filesystem::path& path);

        /// @note Resolves a requested name under `root`, refusing absolute names and any `..` component.
        [[nodiscard]] std::optional<std::filesystem::path> resolveInside(const std::filesystem::path& root, std::string_view requested);

        void discardPartial(const std::filesystem::path& path);
    }

    /// @note Per-transfer state: lives from the first valid response until the EOF chunk is acknowledged.
    struct TransferSession {
        MyTftp::OptionSet options {};
        MyTftp::LocalOptions local {};
        std::filesystem::path file {};
        MyTftp::tftp_u16 next_block {Constants::first_data_block};
        MyTftp::tftp_u16 last_acked {Constants::request_ack_block};
        std::uint64_t bytes_moved {0};
        unsigned int retries {0};
    };
}
