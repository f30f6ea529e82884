#include <iostream>
#include <string>
#include <vector>
#include <arpa/inet.h>
#include "mytftpd/config.hpp"
#include "test_common.hpp"

using namespace WindTftp;
using test::TestStats;
using test::check;

static std::expected<Driver::ClientConfig, std::string> client(std::vector<const char*> args) {
    return Driver::parseClientArgs(args);
}

static std::expected<Driver::ServerConfig, std::string> server(std::vector<const char*> args) {
    return Driver::parseServerArgs(args);
}

// =================== A. Client Arguments ===================
void testClientArgs(TestStats& stats) {
    std::cout << "\n[A. Client Arguments]\n";

    const auto plain = client({"boot.img"});
    check(stats, plain.has_value(), "single path parses");
    check(stats, plain->mode == Driver::TransferMode::download, "download is the default mode");
    check(stats, plain->file_local == "boot.img" && plain->file_remote.empty(), "one path leaves the remote name open");
    check(stats, plain->remote_address.sin_port == htons(69) && plain->remote_address.sin_addr.s_addr == htonl(INADDR_LOOPBACK),
          "server defaults to 127.0.0.1:69");
    check(stats, plain->opt_common == MyTftp::OptionSet {}, "no options proposed by default");
    check(stats, plain->opt_local.retry_limit == 5 && plain->opt_local.clean_on_error, "five retries and cleanup by default");

    const auto full = client({"-u", "local.bin", "remote.bin", "-i", "10.0.0.7", "-p", "6969", "-b", "1428", "-w", "16", "-t", "2",
                              "-T", "750", "-R", "9", "-W", "3", "--keep-on-error", "-v", "-rd", "/tmp/in"});
    check(stats, full.has_value(), "every flag together parses");
    check(stats, full->mode == Driver::TransferMode::upload && full->file_remote == "remote.bin", "upload with explicit remote name");
    check(stats, full->remote_address.sin_port == htons(6969), "port applied");

    in_addr expected_host {};
    inet_pton(AF_INET, "10.0.0.7", &expected_host);
    check(stats, full->remote_address.sin_addr.s_addr == expected_host.s_addr, "host applied");
    check(stats, full->opt_common.block_size == 1428 && full->opt_common.windowsize == 16 && full->opt_common.timeout == std::chrono::seconds {2},
          "blksize, windowsize and timeout proposed");
    check(stats, full->request_timeout == std::chrono::milliseconds {750}, "request timeout in milliseconds");
    check(stats, full->opt_local.retry_limit == 9 && full->opt_local.window_wait == std::chrono::milliseconds {3}, "retries and window pause");
    check(stats, !full->opt_local.clean_on_error && full->verbose, "keep-on-error and verbose");
    check(stats, full->receive_directory == "/tmp/in", "receive directory");

    const auto help = client({"-h"});
    check(stats, !help.has_value() && help.error().empty(), "help asks for usage with an empty reason");

    check(stats, !client({}).has_value(), "no path is an error");
    check(stats, !client({"a", "b", "c"}).has_value(), "three paths are an error");
    check(stats, !client({"a", "-b", "7"}).has_value(), "blksize below 8 is refused");
    check(stats, !client({"a", "-b", "65465"}).has_value(), "blksize above 65464 is refused");
    check(stats, !client({"a", "-w", "0"}).has_value(), "windowsize 0 is refused");
    check(stats, !client({"a", "-t", "256"}).has_value(), "timeout above 255 is refused");
    check(stats, !client({"a", "-p", "0"}).has_value(), "port 0 is refused for the server address");
    check(stats, !client({"a", "-R", "0"}).has_value(), "zero retries are refused");
    check(stats, !client({"a", "-b"}).has_value(), "flag without a value");
    check(stats, !client({"a", "-w", "4x"}).has_value(), "trailing garbage in a number");

    const auto unknown = client({"a", "--fast"});
    check(stats, !unknown.has_value() && unknown.error().find("--fast") != std::string::npos, "unknown flag is named in the error");
}

// =================== B. Server Arguments ===================
void testServerArgs(TestStats& stats) {
    std::cout << "\n[B. Server Arguments]\n";

    test::ScratchDir scratch {"config"};

    const auto plain = server({});
    check(stats, plain.has_value(), "no arguments parse");
    check(stats, plain->host == "0.0.0.0" && plain->port == "69" && plain->directory == ".", "listens on 0.0.0.0:69 serving .");
    check(stats, !plain->read_only && !plain->overwrite, "writable, no overwrite by default");
    check(stats, plain->limits.max_block_size == MyTftp::Limits::max_block_size && plain->limits.max_windowsize == 64,
          "block size defaults to the protocol maximum, windows to 64 blocks");

    const auto full = server({"-i", "127.0.0.1", "-p", "0", "-d", scratch.path().c_str(), "-r", "--overwrite", "-b", "1024", "-w", "8", "-R", "3", "-W", "1", "-v"});
    check(stats, full.has_value(), "every flag together parses");
    check(stats, full->host == "127.0.0.1" && full->port == "0", "port 0 asks for any free port");
    check(stats, full->directory == scratch.path() && full->read_only && full->overwrite, "directory, read-only and overwrite");
    check(stats, full->limits.max_block_size == 1024 && full->limits.max_windowsize == 8, "limits applied");
    check(stats, full->opt_local.retry_limit == 3 && full->opt_local.window_wait == std::chrono::milliseconds {1} && full->verbose, "local options applied");

    const auto wide = server({"-w", "65535"});
    check(stats, wide.has_value() && wide->limits.max_windowsize == 65535, "the window cap can still be raised to the protocol maximum");

    const auto missing = scratch / "absent";
    check(stats, !server({"-d", missing.c_str()}).has_value(), "missing directory is refused");

    const auto file = scratch / "plain.txt";
    test::writeFile(file, "x");
    check(stats, !server({"-d", file.c_str()}).has_value(), "a regular file is not a directory");

    check(stats, !server({"-p", "70000"}).has_value(), "port above 65535 is refused");
    check(stats, !server({"stray"}).has_value(), "positional argument is refused");

    const auto help = server({"--help"});
    check(stats, !help.has_value() && help.error().empty(), "help asks for usage with an empty reason");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Command Line Unit Tests\n";
    std::cout << "========================================\n";

    TestStats stats;

    try {
        testClientArgs(stats);
        testServerArgs(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return stats.finish();
}
