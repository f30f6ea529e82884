/**
 * @file tftpd.cpp
 * @brief Implements driver logic for the TFTP server.
 */

#include <atomic>
#include <csignal>
#include <iostream>
#include <span>
#include <stdexcept>
#include "meta/logging.hpp"
#include "mybsock/netconfig.hpp"
#include "mytftpd/config.hpp"
#include "mytftpd/driver.hpp"

static std::atomic<WindTftp::Driver::MyServer*> running_server {nullptr};

static_assert(std::atomic<WindTftp::Driver::MyServer*>::is_always_lock_free, "signal handler needs a lock-free server pointer");

extern "C" void onStopSignal(int) {
    if (auto* server = running_server.load(); server != nullptr) {
        server->requestStop();
    }
}

int main(int argc, char* argv[]) {
    using namespace WindTftp;

    const char* const* args_begin = argv + 1;

    auto config = Driver::parseServerArgs(std::span<const char* const> {args_begin, static_cast<std::size_t>(argc - 1)});

    if (not config) {
        if (config.error().empty()) {
            std::cout << Driver::serverUsage();
            return 0;
        }

        std::cerr << "tftpd: " << config.error() << '\n' << Driver::serverUsage();
        return 1;
    }

    Meta::setupLogging("tftpd", config->verbose);

    MyBSock::UDPSocket socket;

    try {
        socket = MyBSock::makeBoundSocket(config->host.c_str(), config->port.c_str());
    } catch (const std::runtime_error& err) {
        Meta::logMessage<Meta::LogLevel::fatal>("cannot bind {}:{}: {}", config->host, config->port, err.what());
        return 1;
    }

    Driver::MyServer app {std::move(config.value()), std::move(socket)};

    running_server.store(&app);
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    const auto served = app.runService();

    running_server.store(nullptr);

    if (not served) {
        Meta::logMessage<Meta::LogLevel::fatal>("listening socket failed, server stopped");
        return 1;
    }
}
