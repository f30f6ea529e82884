#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <utility>
#include "mytftp/types.hpp"

namespace WindTftp::MyTftp {
    namespace OptionNames {
        inline constexpr std::string_view block_size = "blksize";
        inline constexpr std::string_view timeout = "timeout";
        inline constexpr std::string_view transfer_size = "tsize";
        inline constexpr std::string_view windowsize = "windowsize";
    }

    namespace Limits {
        inline constexpr tftp_u16 default_block_size = 512;
        inline constexpr tftp_u16 min_block_size = 8;
        inline constexpr tftp_u16 max_block_size = 65464;
        inline constexpr std::chrono::seconds default_timeout {5};
        inline constexpr std::chrono::seconds min_timeout {1};
        inline constexpr std::chrono::seconds max_timeout {255};
        inline constexpr tftp_u16 default_windowsize = 1;
        inline constexpr tftp_u16 min_windowsize = 1;
        inline constexpr tftp_u16 max_windowsize = 65535;
        /// NOTE: keeps one read window of a session at most 64 full blocks in memory.
        inline constexpr tftp_u16 default_server_windowsize = 64;
    }

    enum class NegotiationError {
        malformed_value,
        unknown_option,
        out_of_range
    };

    [[nodiscard]] std::string_view toNegotiationMsg(NegotiationError error) noexcept;

    /// @note The RFC 2347 family of options both peers must agree on. A default-constructed set holds the protocol defaults.
    struct OptionSet {
        tftp_u16 block_size {Limits::default_block_size};
        std::chrono::seconds timeout {Limits::default_timeout};
        tftp_u16 windowsize {Limits::default_windowsize};
        std::optional<std::uint64_t> transfer_size {};

        /// @note Lists only what differs from the defaults, plus `tsize` whenever it is set.
        [[nodiscard]] OptionList prepare() const;

        /// @note Installs each option the peer echoed. Every name must appear in `proposed`.
        [[nodiscard]] std::expected<void, NegotiationError> apply(const OptionList& accepted, const OptionList& proposed);

        [[nodiscard]] bool operator==(const OptionSet& other) const noexcept = default;
    };

    /// @note The options in effect after the peer's OACK: defaults plus exactly the accepted subset of what `requested` proposed.
    [[nodiscard]] std::expected<OptionSet, NegotiationError> negotiate(const OptionSet& requested, const OptionList& accepted);

    struct ServerLimits {
        tftp_u16 max_block_size {Limits::max_block_size};
        tftp_u16 max_windowsize {Limits::default_server_windowsize};
    };

    /// @note Responder side of negotiation: the options in effect and the OACK list to send back. Unknown or unparseable proposals are left out.
    [[nodiscard]] std::pair<OptionSet, OptionList> acceptProposal(const OptionList& requested, std::optional<std::uint64_t> file_size, const ServerLimits& limits);

    /// @note Knobs that never leave this host.
    struct LocalOptions {
        /// NOTE: consecutive timeouts that end a transfer.
        unsigned int retry_limit {5};
        std::chrono::milliseconds window_wait {0};
        bool clean_on_error {true};
    };
}
