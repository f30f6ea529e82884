#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <string>
#include "mytftp/options.hpp"

namespace WindTftp::MyTftp {
    static constexpr std::array<std::string_view, 3> negotiation_msgs = {
        "malformed option value",
        "option was never proposed",
        "option value out of range"
    };

    std::string_view toNegotiationMsg(NegotiationError error) noexcept {
        return negotiation_msgs[static_cast<std::size_t>(error)];
    }

    [[nodiscard]] static bool sameName(std::string_view lhs, std::string_view rhs) noexcept {
        return lhs.size() == rhs.size() and std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
        });
    }

    [[nodiscard]] static std::optional<std::uint64_t> parseUnsigned(std::string_view text) noexcept {
        std::uint64_t temp = 0;

        if (text.empty()) {
            return {};
        }

        const auto* text_end = text.data() + text.size();
        const auto [parse_end, parse_errc] = std::from_chars(text.data(), text_end, temp);

        if (parse_errc != std::errc {} or parse_end != text_end) {
            return {};
        }

        return temp;
    }

    [[nodiscard]] static const OptionEntry* findOption(const OptionList& options, std::string_view name) noexcept {
        const auto found = std::find_if(options.begin(), options.end(), [name](const OptionEntry& entry) {
            return sameName(entry.name, name);
        });

        return (found != options.end()) ? &*found : nullptr;
    }

    OptionList OptionSet::prepare() const {
        OptionList temp;

        if (block_size != Limits::default_block_size) {
            temp.push_back({std::string {OptionNames::block_size}, std::to_string(block_size)});
        }

        if (timeout != Limits::default_timeout) {
            temp.push_back({std::string {OptionNames::timeout}, std::to_string(timeout.count())});
        }

        if (transfer_size.has_value()) {
            temp.push_back({std::string {OptionNames::transfer_size}, std::to_string(transfer_size.value())});
        }

        if (windowsize != Limits::default_windowsize) {
            temp.push_back({std::string {OptionNames::windowsize}, std::to_string(windowsize)});
        }

        return temp;
    }

    std::expected<void, NegotiationError> OptionSet::apply(const OptionList& accepted, const OptionList& proposed) {
        for (const auto& [name, value] : accepted) {
            const auto* proposal = findOption(proposed, name);

            if (proposal == nullptr) {
                return std::unexpected {NegotiationError::unknown_option};
            }

            const auto parsed = parseUnsigned(value);

            if (not parsed.has_value()) {
                return std::unexpected {NegotiationError::malformed_value};
            }

            const auto asked = parseUnsigned(proposal->value).value_or(0);
            const auto got = parsed.value();

            if (sameName(name, OptionNames::block_size)) {
                if (got < Limits::min_block_size or got > Limits::max_block_size or got > asked) {
                    return std::unexpected {NegotiationError::out_of_range};
                }

                block_size = static_cast<tftp_u16>(got);
            } else if (sameName(name, OptionNames::windowsize)) {
                if (got < Limits::min_windowsize or got > Limits::max_windowsize or got > asked) {
                    return std::unexpected {NegotiationError::out_of_range};
                }

                windowsize = static_cast<tftp_u16>(got);
            } else if (sameName(name, OptionNames::timeout)) {
                if (got != asked or got < static_cast<std::uint64_t>(Limits::min_timeout.count()) or got > static_cast<std::uint64_t>(Limits::max_timeout.count())) {
                    return std::unexpected {NegotiationError::out_of_range};
                }

                timeout = std::chrono::seconds {static_cast<std::chrono::seconds::rep>(got)};
            } else if (sameName(name, OptionNames::transfer_size)) {
                transfer_size = got;
            } else {
                return std::unexpected {NegotiationError::unknown_option};
            }
        }

        return {};
    }

    std::expected<OptionSet, NegotiationError> negotiate(const OptionSet& requested, const OptionList& accepted) {
        OptionSet active {};

        if (auto applied = active.apply(accepted, requested.prepare()); not applied) {
            return std::unexpected {applied.error()};
        }

        return active;
    }

    std::pair<OptionSet, OptionList> acceptProposal(const OptionList& requested, std::optional<std::uint64_t> file_size, const ServerLimits& limits) {
        OptionSet active {};
        OptionList echoed;

        auto echo = [&echoed](std::string_view name, std::uint64_t value) {
            echoed.push_back({std::string {name}, std::to_string(value)});
        };

        auto already_echoed = [&echoed](std::string_view name) {
            return findOption(echoed, name) != nullptr;
        };

        for (const auto& [name, value] : requested) {
            const auto parsed = parseUnsigned(value);

            if (not parsed.has_value() or already_echoed(name)) {
                continue;
            }

            const auto asked = parsed.value();

            if (sameName(name, OptionNames::block_size) and asked >= Limits::min_block_size) {
                const auto granted = std::min<std::uint64_t>({asked, limits.max_block_size, Limits::max_block_size});
                active.block_size = static_cast<tftp_u16>(granted);
                echo(OptionNames::block_size, granted);
            } else if (sameName(name, OptionNames::windowsize) and asked >= Limits::min_windowsize) {
                const auto granted = std::min<std::uint64_t>({asked, limits.max_windowsize, Limits::max_windowsize});
                active.windowsize = static_cast<tftp_u16>(granted);
                echo(OptionNames::windowsize, granted);
            } else if (sameName(name, OptionNames::timeout)
                and asked >= static_cast<std::uint64_t>(Limits::min_timeout.count())
                and asked <= static_cast<std::uint64_t>(Limits::max_timeout.count())) {
                active.timeout = std::chrono::seconds {static_cast<std::chrono::seconds::rep>(asked)};
                echo(OptionNames::timeout, asked);
            } else if (sameName(name, OptionNames::transfer_size)) {
                const auto declared = file_size.value_or(asked);
                active.transfer_size = declared;
                echo(OptionNames::transfer_size, declared);
            }
        }

        return { active, std::move(echoed) };
    }
}
