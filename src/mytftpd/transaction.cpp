#include <array>
#include <system_error>
#include <fmt/format.h>
#include "meta/logging.hpp"
#include "mytftpd/transaction.hpp"

namespace WindTftp::Driver {
    static constexpr std::array<std::string_view, 5> kind_names = {
        "negotiation error",
        "protocol violation",
        "peer error",
        "timed out",
        "local I/O error"
    };

    std::string_view toKindName(TransferErrorKind kind) noexcept {
        return kind_names[static_cast<std::size_t>(kind)];
    }

    std::string describe(const TransferError& error) {
        if (error.kind == TransferErrorKind::peer_error) {
            return fmt::format("{}: {}: {}", toKindName(error.kind), static_cast<int>(error.peer_code), error.message);
        }

        return fmt::format("{}: {}", toKindName(error.kind), error.message);
    }

    namespace FileUtils {
        std::expected<std::uint64_t, TransferError> fileLength(const std::filesystem::path& path) {
            std::error_code fs_error;
            const auto length = std::filesystem::file_size(path, fs_error);

            if (fs_error) {
                return transferFailure(TransferErrorKind::local_io, fmt::format("cannot stat {}: {}", path.string(), fs_error.message()));
            }

            return static_cast<std::uint64_t>(length);
        }

        std::optional<std::string> baseName(const std::filesystem::path& path) {
            auto name = path.filename().string();

            if (name.empty() or name == "." or name == "..") {
                return {};
            }

            return name;
        }

        std::optional<std::filesystem::path> resolveInside(const std::filesystem::path& root, std::string_view requested) {
            const std::filesystem::path relative {requested};

            if (requested.empty() or relative.has_root_path()) {
                return {};
            }

            for (const auto& part : relative) {
                if (part == "..") {
                    return {};
                }
            }

            return root / relative.relative_path();
        }

        void discardPartial(const std::filesystem::path& path) {
            std::error_code fs_error;

            if (not std::filesystem::remove(path, fs_error) and fs_error) {
                Meta::logMessage<Meta::LogLevel::warning>("could not remove partial file {}: {}", path.string(), fs_error.message());
            }
        }
    }
}
