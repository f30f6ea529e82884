#include <filesystem>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include "meta/logging.hpp"
#include "mytftpd/engine.hpp"
#include "memory_transport.hpp"
#include "test_common.hpp"

using namespace WindTftp;
using MyTftp::Message;
using MyTftp::Opcode;
using test::TestStats;
using test::check;

static Driver::TransferSession makeSession(std::uint16_t block_size, std::uint16_t windowsize, const std::filesystem::path& file) {
    Driver::TransferSession session;
    session.options.block_size = block_size;
    session.options.windowsize = windowsize;
    session.file = file;
    return session;
}

static std::vector<MyTftp::tftp_u16> sentAcks(const test::ScriptState& transport) {
    std::vector<MyTftp::tftp_u16> acks;

    for (const auto& msg : transport.sent) {
        if (msg.op == Opcode::ack) {
            acks.push_back(std::get<MyTftp::AckPayload>(msg.payload).block_n);
        }
    }

    return acks;
}

// =================== A. Windowed Upload ===================
void testUpload(TestStats& stats) {
    std::cout << "\n[A. Windowed Upload]\n";

    test::ScratchDir scratch {"engine-upload"};

    struct Case {
        std::uint16_t block_size;
        std::uint16_t windowsize;
        std::size_t length;
    };

    for (const auto& [block_size, windowsize, length] : {Case {16, 4, 100}, Case {16, 4, 64}, Case {512, 1, 0}, Case {8, 7, 333}}) {
        const auto source = test::patternBytes(length);
        const auto path = scratch / "up.bin";
        test::writeFile(path, source);

        test::ReceiverPeer peer {block_size, windowsize};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = std::ref(peer);

        Driver::TransferEngine engine {std::move(transport), makeSession(block_size, windowsize, path)};
        const auto outcome = engine.send();

        const auto label = "blksize " + std::to_string(block_size) + ", windowsize " + std::to_string(windowsize) + ", " + std::to_string(length) + "B";
        check(stats, outcome.has_value() && outcome.value() == length, label + ": upload succeeds and counts every byte");
        check(stats, peer.complete && peer.received == source, label + ": peer holds the exact bytes");
        check(stats, wire->countSent(Opcode::data) == length / block_size + 1, label + ": each block sent once");
    }
}

// =================== B. Upload Retries ===================
void testUploadRetries(TestStats& stats) {
    std::cout << "\n[B. Upload Retries]\n";

    test::ScratchDir scratch {"engine-upload-retry"};
    const auto path = scratch / "up.bin";
    const auto source = test::patternBytes(40);
    test::writeFile(path, source);

    for (unsigned int lost = 0; lost <= 5; ++lost) {
        test::ReceiverPeer peer {16, 1};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = std::ref(peer);
        wire->lose_replies = lost;

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.send();

        if (lost < 5) {
            check(stats, outcome.has_value() && peer.received == source, std::to_string(lost) + " lost ACK(s): upload still succeeds");
        } else {
            check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::timed_out,
                  "5 lost ACKs: upload fails with a timeout");
            check(stats, wire->countSent(Opcode::data) == 5, "DATA 1 went out once plus four retransmissions");
        }
    }
}

// =================== C. Upload Handshake And Failures ===================
void testUploadFailures(TestStats& stats) {
    std::cout << "\n[C. Upload Handshake And Failures]\n";

    test::ScratchDir scratch {"engine-upload-fail"};
    const auto path = scratch / "up.bin";
    const auto source = test::patternBytes(50);
    test::writeFile(path, source);

    {
        // Server side of a RRQ: the OACK went out first, DATA waits for ACK 0.
        test::ReceiverPeer peer {16, 2};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [&peer](const Message& msg) -> std::vector<Message> {
            if (msg.op == Opcode::oack) {
                return {MyTftp::makeAck(0)};
            }

            return peer(msg);
        };

        const Message oack {Opcode::oack, MyTftp::OackPayload {{{"blksize", "16"}, {"windowsize", "2"}}}};
        Driver::TransferEngine engine {std::move(transport), makeSession(16, 2, path)};
        const auto outcome = engine.send(oack);

        check(stats, outcome.has_value() && peer.received == source, "missing ACK 0 is recovered by repeating the OACK");
        check(stats, !wire->sent.empty() && wire->sent.front().op == Opcode::oack, "OACK repeated before any DATA");
    }

    {
        // Undecodable datagrams while waiting for ACK 0 neither repeat the OACK nor use up retries.
        test::ReceiverPeer peer {16, 1};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [&peer](const Message& msg) -> std::vector<Message> {
            if (msg.op == Opcode::oack) {
                return {MyTftp::makeAck(0)};
            }

            return peer(msg);
        };

        const Message oack {Opcode::oack, MyTftp::OackPayload {{{"blksize", "16"}}}};
        wire->prime(oack);
        wire->garbled_reads = 6;

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.send(oack);

        check(stats, outcome.has_value() && peer.received == source, "garbage before ACK 0 is skipped");
        check(stats, wire->countSent(Opcode::oack) == 0, "OACK is not repeated for garbage");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [](const Message& msg) -> std::vector<Message> {
            if (msg.op == Opcode::data && std::get<MyTftp::DataPayload>(msg.payload).block_n == 2) {
                return {MyTftp::makeError(MyTftp::ErrorCode::storage_issue, "disk full")};
            }

            return {MyTftp::makeAck(std::get<MyTftp::DataPayload>(msg.payload).block_n)};
        };

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.send();

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::peer_error, "peer ERROR ends the upload");
        check(stats, !outcome.has_value() && outcome.error().peer_code == MyTftp::ErrorCode::storage_issue && outcome.error().message == "disk full",
              "peer code and message are kept verbatim");
        check(stats, wire->countSent(Opcode::err) == 0, "no ERROR is echoed back");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [](const Message&) -> std::vector<Message> {
            return {{Opcode::data, MyTftp::DataPayload {1, test::toChunk("x")}}};
        };

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.send();

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::protocol_violation, "DATA during upload is a protocol violation");
        check(stats, !wire->sent.empty() && wire->sent.back().op == Opcode::err, "peer is told with an ERROR");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, scratch / "absent.bin")};
        const auto outcome = engine.send();

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::local_io, "missing source is a local I/O failure");
        check(stats, wire->countSent(Opcode::err) == 1 && wire->countSent(Opcode::data) == 0, "peer gets an ERROR and no DATA");
    }
}

// =================== D. Windowed Download ===================
void testDownload(TestStats& stats) {
    std::cout << "\n[D. Windowed Download]\n";

    test::ScratchDir scratch {"engine-download"};
    const auto path = scratch / "down.bin";
    const auto source = test::patternBytes(100);

    {
        test::SenderPeer peer {source, 16, 4};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = std::ref(peer);
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 4, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        check(stats, outcome.has_value() && outcome.value() == source.size(), "download of 100B succeeds");
        check(stats, test::readFile(path) == source, "file holds the exact bytes");
        check(stats, sentAcks(*wire) == std::vector<MyTftp::tftp_u16> {4, 7}, "one ACK per window: 4, then 7 for the short block");
    }

    {
        // DATA 2 goes missing from the first window.
        test::SenderPeer peer {source, 16, 4};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        bool first = true;
        wire->responder = [&peer, &first](const Message& msg) -> std::vector<Message> {
            if (first) {
                first = false;
                return {{Opcode::data, peer.blockAt(1)}, {Opcode::data, peer.blockAt(3)}, {Opcode::data, peer.blockAt(4)}};
            }

            return peer(msg);
        };
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 4, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));
        const auto acks = sentAcks(*wire);

        check(stats, outcome.has_value() && test::readFile(path) == source, "gap in the window is recovered");
        check(stats, !acks.empty() && acks.front() == 1, "gap is answered with ACK of the last in-order block");
    }

    {
        test::SenderPeer peer {source, 16, 1};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        bool repeated = false;
        wire->responder = [&peer, &repeated](const Message& msg) -> std::vector<Message> {
            auto replies = peer(msg);

            if (!repeated && std::get<MyTftp::AckPayload>(msg.payload).block_n == 1) {
                repeated = true;
                replies.insert(replies.begin(), Message {Opcode::data, peer.blockAt(1)});
            }

            return replies;
        };
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));
        const auto acks = sentAcks(*wire);

        check(stats, outcome.has_value() && test::readFile(path) == source, "duplicate DATA does not corrupt the file");
        check(stats, acks.size() >= 3 && acks[0] == 1 && acks[1] == 1, "duplicate DATA 1 repeats ACK 1");
    }
}

// =================== E. Download Retries And Failures ===================
void testDownloadFailures(TestStats& stats) {
    std::cout << "\n[E. Download Retries And Failures]\n";

    test::ScratchDir scratch {"engine-download-fail"};
    const auto path = scratch / "down.bin";
    const auto source = test::patternBytes(40);

    for (unsigned int lost = 0; lost <= 5; ++lost) {
        test::SenderPeer peer {source, 16, 1};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = std::ref(peer);
        wire->lose_replies = lost;
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 1, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        if (lost < 5) {
            check(stats, outcome.has_value() && test::readFile(path) == source, std::to_string(lost) + " lost DATA: download still succeeds");
        } else {
            check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::timed_out, "5 lost DATA: download fails with a timeout");
            check(stats, !std::filesystem::exists(path), "partial file is removed");
        }
    }

    {
        test::SenderPeer peer {source, 16, 4};
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = std::ref(peer);
        wire->lose_replies = 3;
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 4, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        check(stats, outcome.has_value() && test::readFile(path) == source, "whole first window lost: repeated ACK 0 recovers it");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [](const Message&) -> std::vector<Message> {
            return {{Opcode::data, MyTftp::DataPayload {300, test::toChunk("stray")}}};
        };
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 4, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::protocol_violation, "DATA far outside the window is a protocol violation");
        check(stats, !wire->sent.empty() && wire->sent.back().op == Opcode::err, "peer is told with an ERROR");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [](const Message&) -> std::vector<Message> {
            return {{Opcode::data, MyTftp::DataPayload {1, MyTftp::Chunk(20, 0xAB)}}};
        };
        wire->prime(MyTftp::makeAck(0));

        Driver::TransferEngine engine {std::move(transport), makeSession(16, 4, path)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::protocol_violation, "DATA larger than blksize is a protocol violation");
    }

    {
        auto wire = std::make_shared<test::ScriptState>();
        auto transport = std::make_unique<test::ScriptedTransport>(wire);
        wire->responder = [](const Message&) -> std::vector<Message> {
            return {{Opcode::data, MyTftp::DataPayload {1, MyTftp::Chunk(16, 0x11)}}, MyTftp::makeError(MyTftp::ErrorCode::not_defined, "gone")};
        };
        wire->prime(MyTftp::makeAck(0));

        auto session = makeSession(16, 4, path);
        session.local.clean_on_error = false;

        Driver::TransferEngine engine {std::move(transport), std::move(session)};
        const auto outcome = engine.receive(MyTftp::makeAck(0));

        check(stats, !outcome.has_value() && outcome.error().kind == Driver::TransferErrorKind::peer_error && outcome.error().message == "gone",
              "peer ERROR mid-download is surfaced");
        check(stats, std::filesystem::exists(path), "partial file kept when cleanup is off");
    }
}

// =================== F. Round Trip Over A Linked Pair ===================
/// @note `opening` plays the receiver's OACK, already answered by the sender's side before the engines start.
static bool roundTrip(const std::vector<MyTftp::tftp_u8>& source, std::uint16_t block_size, std::uint16_t windowsize, unsigned int lose_first, std::optional<Message> opening = {}) {
    test::ScratchDir scratch {"engine-roundtrip"};
    const auto from = scratch / "from.bin";
    const auto to = scratch / "to.bin";
    test::writeFile(from, source);

    auto [upload_end, download_end] = test::LinkedTransport::makePair();
    upload_end->loseNext(lose_first);
    static_cast<void>(upload_end->setReadTimeout(std::chrono::milliseconds {100}));
    static_cast<void>(download_end->setReadTimeout(std::chrono::milliseconds {100}));

    Driver::TransferEngine sender {std::move(upload_end), makeSession(block_size, windowsize, from)};
    Driver::TransferEngine receiver {std::move(download_end), makeSession(block_size, windowsize, to)};

    Driver::TransferResult sent = Driver::transferFailure(Driver::TransferErrorKind::local_io, "not run");
    Driver::TransferResult received = Driver::transferFailure(Driver::TransferErrorKind::local_io, "not run");

    std::thread receiving {[&receiver, &received, &opening]() { received = receiver.receive(std::move(opening)); }};
    std::thread sending {[&sender, &sent]() { sent = sender.send(); }};

    sending.join();
    receiving.join();

    return sent.has_value() && received.has_value() && sent.value() == source.size() && received.value() == source.size()
        && test::readFile(to) == source;
}

void testRoundTrip(TestStats& stats) {
    std::cout << "\n[F. Round Trip Over A Linked Pair]\n";

    check(stats, roundTrip({}, 512, 1, 0), "empty file, defaults");
    check(stats, roundTrip(test::patternBytes(1024), 512, 1, 0), "two full blocks, stop-and-wait");
    check(stats, roundTrip(test::patternBytes(100), 8, 3, 0), "100B, blksize 8, windowsize 3");
    check(stats, roundTrip(test::patternBytes(4097), 32, 16, 0), "4097B, blksize 32, windowsize 16");
    check(stats, roundTrip(test::patternBytes(1000), 16, 4, 2), "first two DATA lost, windowsize 4");
    check(stats, roundTrip(test::patternBytes(8U * 70000U + 3U), 8, 32, 0), "block numbers wrap past 65535");

    const Message stop_and_wait {Opcode::oack, MyTftp::OackPayload {{{"blksize", "16"}, {"windowsize", "1"}}}};
    check(stats, roundTrip(test::patternBytes(100), 16, 1, 1, stop_and_wait), "DATA 1 lost after an OACK, windowsize 1");

    const Message windowed {Opcode::oack, MyTftp::OackPayload {{{"blksize", "16"}, {"windowsize", "4"}}}};
    check(stats, roundTrip(test::patternBytes(1000), 16, 4, 4, windowed), "whole first window lost after an OACK");
}

int main() {
    std::cout << "========================================\n";
    std::cout << "  Transfer Engine Unit Tests\n";
    std::cout << "========================================\n";

    Meta::setupLogging("test_engine", false);

    TestStats stats;

    try {
        testUpload(stats);
        testUploadRetries(stats);
        testUploadFailures(stats);
        testDownload(stats);
        testDownloadFailures(stats);
        testRoundTrip(stats);
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Exception caught: " << e.what() << "\n";
        return 1;
    }

    return stats.finish();
}
