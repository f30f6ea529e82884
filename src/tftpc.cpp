/**
 * @file tftpc.cpp
 * @brief Implements the command line TFTP client.
 */

#include <iostream>
#include <span>
#include "meta/logging.hpp"
#include "mytftpd/client.hpp"
#include "mytftpd/config.hpp"

static constexpr auto any_host_cstr = "0.0.0.0";
static constexpr auto ephemeral_port_cstr = "0";

int main(int argc, char* argv[]) {
    using namespace WindTftp;

    const char* const* args_begin = argv + 1;

    auto config = Driver::parseClientArgs(std::span<const char* const> {args_begin, static_cast<std::size_t>(argc - 1)});

    if (not config) {
        if (config.error().empty()) {
            std::cout << Driver::clientUsage();
            return 0;
        }

        std::cerr << "tftpc: " << config.error() << '\n' << Driver::clientUsage();
        return 1;
    }

    Meta::setupLogging("tftpc", config->verbose);

    auto transport = Driver::openClientTransport(any_host_cstr, ephemeral_port_cstr);

    if (not transport) {
        Meta::logMessage<Meta::LogLevel::fatal>("{}", transport.error().message);
        return 1;
    }

    Driver::MyClient app {std::move(config.value()), std::move(transport.value())};
    const auto outcome = app.run();

    if (not outcome) {
        std::cerr << "tftpc: " << Driver::describe(outcome.error()) << '\n';
        return 1;
    }

    Meta::logMessage<Meta::LogLevel::info>("{}B transferred", outcome.value());
}
