#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include <fmt/format.h>
#include "mybsock/netconfig.hpp"
#include "mytftpd/config.hpp"

namespace WindTftp::Driver {
    static constexpr std::string_view client_usage_text =
        "usage: tftpc <file> [remote-file] [options]\n"
        "  -i <host>        server address (default 127.0.0.1)\n"
        "  -p <port>        server port (default 69)\n"
        "  -u | -d          upload or download (default download)\n"
        "  -b <blksize>     propose a block size (8-65464)\n"
        "  -w <windowsize>  propose a window size (1-65535)\n"
        "  -t <seconds>     propose a retransmission timeout (1-255)\n"
        "  -T <ms>          timeout while waiting for the request's answer\n"
        "  -rd <dir>        directory downloads are stored in (default .)\n"
        "  -R <count>       consecutive timeouts before giving up (default 5)\n"
        "  -W <ms>          pause between the packets of one window\n"
        "  --keep-on-error  keep a partially downloaded file\n"
        "  -v               debug logging\n";

    static constexpr std::string_view server_usage_text =
        "usage: tftpd [options]\n"
        "  -i <host>        address to listen on (default 0.0.0.0)\n"
        "  -p <port>        port to listen on (default 69)\n"
        "  -d <dir>         directory to serve (default .)\n"
        "  -r               read-only, refuse write requests\n"
        "  --overwrite      let write requests replace existing files\n"
        "  -b <blksize>     largest block size granted (default 65464)\n"
        "  -w <windowsize>  largest window size granted (default 64)\n"
        "  -R <count>       consecutive timeouts before giving up (default 5)\n"
        "  -W <ms>          pause between the packets of one window\n"
        "  --keep-on-error  keep a partially received file\n"
        "  -v               debug logging\n";

    static constexpr auto min_allowed_port = 1;
    static constexpr auto max_allowed_port = 65535;

    std::string_view clientUsage() noexcept {
        return client_usage_text;
    }

    std::string_view serverUsage() noexcept {
        return server_usage_text;
    }

    template <typename Number>
    [[nodiscard]] static std::optional<Number> parseNumber(std::string_view text, Number min_value, Number max_value) noexcept {
        Number temp {};
        const auto* text_end = text.data() + text.size();
        const auto [parse_end, parse_errc] = std::from_chars(text.data(), text_end, temp);

        if (text.empty() or parse_errc != std::errc {} or parse_end != text_end or temp < min_value or temp > max_value) {
            return {};
        }

        return temp;
    }

    /// @note Walks flag/value pairs, handing each flag its value when it takes one.
    class ArgCursor {
    private:
        std::span<const char* const> m_args;
        std::size_t m_pos;

    public:
        explicit ArgCursor(std::span<const char* const> args) noexcept
        : m_args {args}, m_pos {0} {}

        [[nodiscard]] bool hasNext() const noexcept {
            return m_pos < m_args.size();
        }

        [[nodiscard]] std::string_view next() noexcept {
            return m_args[m_pos++];
        }

        [[nodiscard]] std::optional<std::string_view> valueFor() noexcept {
            if (not hasNext()) {
                return {};
            }

            return next();
        }
    };

    [[nodiscard]] static std::unexpected<std::string> badValue(std::string_view flag) {
        return std::unexpected {fmt::format("missing or invalid value for {}", flag)};
    }

    std::expected<ClientConfig, std::string> parseClientArgs(std::span<const char* const> args) {
        ClientConfig temp {};
        std::string host {"127.0.0.1"};
        std::string port {"69"};
        std::vector<std::string_view> positional;
        ArgCursor cursor {args};

        while (cursor.hasNext()) {
            const auto flag = cursor.next();

            if (flag == "-h" or flag == "--help") {
                return std::unexpected {std::string {}};
            } else if (flag == "-u") {
                temp.mode = TransferMode::upload;
            } else if (flag == "-d") {
                temp.mode = TransferMode::download;
            } else if (flag == "-v") {
                temp.verbose = true;
            } else if (flag == "--keep-on-error") {
                temp.opt_local.clean_on_error = false;
            } else if (flag == "-i") {
                const auto value = cursor.valueFor();

                if (not value) {
                    return badValue(flag);
                }

                host = *value;
            } else if (flag == "-p") {
                const auto value = cursor.valueFor();

                if (not value or not parseNumber<int>(*value, min_allowed_port, max_allowed_port)) {
                    return badValue(flag);
                }

                port = *value;
            } else if (flag == "-b") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<std::uint16_t>(*value, MyTftp::Limits::min_block_size, MyTftp::Limits::max_block_size) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_common.block_size = *parsed;
            } else if (flag == "-w") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<std::uint16_t>(*value, MyTftp::Limits::min_windowsize, MyTftp::Limits::max_windowsize) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_common.windowsize = *parsed;
            } else if (flag == "-t") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<long>(*value, MyTftp::Limits::min_timeout.count(), MyTftp::Limits::max_timeout.count()) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_common.timeout = std::chrono::seconds {*parsed};
            } else if (flag == "-T") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<long>(*value, 1L, 600000L) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.request_timeout = std::chrono::milliseconds {*parsed};
            } else if (flag == "-rd") {
                const auto value = cursor.valueFor();

                if (not value) {
                    return badValue(flag);
                }

                temp.receive_directory = std::filesystem::path {*value};
            } else if (flag == "-R") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<unsigned int>(*value, 1U, 1000U) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_local.retry_limit = *parsed;
            } else if (flag == "-W") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<long>(*value, 0L, 10000L) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_local.window_wait = std::chrono::milliseconds {*parsed};
            } else if (flag.starts_with("-")) {
                return std::unexpected {fmt::format("unknown option {}", flag)};
            } else {
                positional.push_back(flag);
            }
        }

        if (positional.empty() or positional.size() > 2) {
            return std::unexpected {std::string {"expected one local file and an optional remote file"}};
        }

        temp.file_local = std::filesystem::path {positional[0]};

        if (positional.size() == 2) {
            temp.file_remote = std::string {positional[1]};
        }

        const auto resolved = MyBSock::resolveAddress(host.c_str(), port.c_str());

        if (not resolved) {
            return std::unexpected {fmt::format("cannot resolve {}:{}", host, port)};
        }

        temp.remote_address = *resolved;

        return temp;
    }

    std::expected<ServerConfig, std::string> parseServerArgs(std::span<const char* const> args) {
        ServerConfig temp {};
        ArgCursor cursor {args};

        while (cursor.hasNext()) {
            const auto flag = cursor.next();

            if (flag == "-h" or flag == "--help") {
                return std::unexpected {std::string {}};
            } else if (flag == "-r") {
                temp.read_only = true;
            } else if (flag == "--overwrite") {
                temp.overwrite = true;
            } else if (flag == "-v") {
                temp.verbose = true;
            } else if (flag == "--keep-on-error") {
                temp.opt_local.clean_on_error = false;
            } else if (flag == "-i") {
                const auto value = cursor.valueFor();

                if (not value) {
                    return badValue(flag);
                }

                temp.host = *value;
            } else if (flag == "-p") {
                const auto value = cursor.valueFor();

                if (not value or not parseNumber<int>(*value, 0, max_allowed_port)) {
                    return badValue(flag);
                }

                temp.port = *value;
            } else if (flag == "-d") {
                const auto value = cursor.valueFor();

                if (not value) {
                    return badValue(flag);
                }

                temp.directory = std::filesystem::path {*value};
            } else if (flag == "-b") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<std::uint16_t>(*value, MyTftp::Limits::min_block_size, MyTftp::Limits::max_block_size) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.limits.max_block_size = *parsed;
            } else if (flag == "-w") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<std::uint16_t>(*value, MyTftp::Limits::min_windowsize, MyTftp::Limits::max_windowsize) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.limits.max_windowsize = *parsed;
            } else if (flag == "-R") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<unsigned int>(*value, 1U, 1000U) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_local.retry_limit = *parsed;
            } else if (flag == "-W") {
                const auto value = cursor.valueFor();
                const auto parsed = value ? parseNumber<long>(*value, 0L, 10000L) : std::nullopt;

                if (not parsed) {
                    return badValue(flag);
                }

                temp.opt_local.window_wait = std::chrono::milliseconds {*parsed};
            } else {
                return std::unexpected {fmt::format("unknown option {}", flag)};
            }
        }

        if (std::error_code fs_error; not std::filesystem::is_directory(temp.directory, fs_error)) {
            return std::unexpected {fmt::format("{} is not a directory", temp.directory.string())};
        }

        return temp;
    }
}
