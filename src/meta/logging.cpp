#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "meta/logging.hpp"

namespace WindTftp::Meta {
    void setupLogging(std::string_view program_name, bool verbose) {
        auto logger = spdlog::stderr_color_mt(std::string {program_name});

        logger->set_pattern("%n [%^%l%$]: %v");
        logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(std::move(logger));
    }
}
