#pragma once

#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace WindTftp::Meta {
    enum class LogLevel {
        debug,
        info,
        warning,
        fatal
    };

    /// @note Call once from `main` before any worker thread starts.
    void setupLogging(std::string_view program_name, bool verbose);

    template <LogLevel L, typename ... Args>
    void logMessage(spdlog::format_string_t<Args...> fmt, Args&& ... args) {
        if constexpr (L == LogLevel::debug) {
            spdlog::debug(fmt, std::forward<Args>(args)...);
        } else if constexpr (L == LogLevel::info) {
            spdlog::info(fmt, std::forward<Args>(args)...);
        } else if constexpr (L == LogLevel::warning) {
            spdlog::warn(fmt, std::forward<Args>(args)...);
        } else {
            spdlog::error(fmt, std::forward<Args>(args)...);
        }
    }
}
