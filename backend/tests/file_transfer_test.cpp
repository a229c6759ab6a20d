#include "controlChannel.hpp"
#include "transferEngine.hpp"
#include "fileTransferClient.hpp"
#include "fileTransferServer.hpp"
#include "offerChannel.hpp"
#include "framedSocket.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <future>
#include <iterator>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static std::string read_all(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

static bool write_file(const fs::path& p, const std::string& contents) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << contents;
    return static_cast<bool>(out);
}

static std::string random_bytes(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::string data(n, '\0');
    for (auto& c : data) c = static_cast<char>(dist(rng));
    return data;
}

static size_t count_files(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) return 0;
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file()) n++;
    }
    return n;
}

// Collects callback outcomes from worker threads
struct OutcomeBox {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<TransferOutcome> outcomes;

    TransferCallback callback() {
        return [this](const TransferOutcome& outcome) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                outcomes.push_back(outcome);
            }
            cv.notify_all();
        };
    }

    bool waitFor(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this, n]() { return outcomes.size() >= n; });
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return outcomes.size();
    }

    TransferOutcome first() {
        std::lock_guard<std::mutex> lock(mutex);
        return outcomes.front();
    }
};

static NodeConfig makeConfig(const fs::path& downloads) {
    NodeConfig config;
    config.download_dir = downloads.string();
    config.offer_timeout_sec = 5;
    config.accept_timeout_sec = 5;
    config.io_timeout_sec = 5;
    config.chunk_pacing_us = 0;
    config.shutdown_grace_ms = 2000;
    return config;
}

// Control channel plus engine on loopback, torn down engine first so no worker outlives the socket
struct TestNode {
    ControlChannel control;
    TransferEngine engine;

    explicit TestNode(const NodeConfig& config) : control(0, 1), engine(control, config, "127.0.0.1") {}
    ~TestNode() {
        engine.stop();
        control.stop();
    }

    bool start() { return control.start(); }
    int port() const { return control.getPort(); }
};

static bool test_accepted_transfer(const fs::path& workdir) {
    const auto src = workdir / "notes.txt";
    const auto downloads = workdir / "accept_downloads";
    TEST_ASSERT(write_file(src, "0123456789"), "Failed to create source file");

    TestNode sender(makeConfig(workdir / "unused"));
    TestNode receiver(makeConfig(downloads));
    receiver.engine.setDecisionProvider([](const IncomingOffer& offer) {
        return offer.offer.file_name == "notes.txt";
    });

    OutcomeBox sent;
    OutcomeBox received;
    receiver.engine.setReceiveCallback(received.callback());

    TEST_ASSERT(sender.start() && receiver.start(), "Control channels did not start");
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", receiver.port(), src.string(), sent.callback()),
                "sendOffer failed");

    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(10)), "Sender never completed");
    TEST_ASSERT(received.waitFor(1, std::chrono::seconds(10)), "Receiver never completed");

    TransferOutcome out = sent.first();
    TEST_ASSERT(out.success, "Sender reported " << out.reason);
    TEST_ASSERT(out.reason == "completed", "Unexpected reason " << out.reason);
    TEST_ASSERT(out.bytes == 10, "Sender moved " << out.bytes << " bytes");

    TransferOutcome in = received.first();
    TEST_ASSERT(in.success, "Receiver reported " << in.reason);
    TEST_ASSERT(fs::path(in.path).filename() == "notes.txt", "Stored as " << in.path);
    TEST_ASSERT(read_all(in.path) == "0123456789", "Received bytes differ");
    TEST_ASSERT(calculateChecksum(in.path) == calculateChecksum(src.string()), "Received hash differs");

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    TEST_ASSERT(sent.size() == 1, "Sender callback fired " << sent.size() << " times");
    TEST_ASSERT(sender.engine.pendingOfferCount() == 0, "Pending offer left behind");
    return true;
}

static bool test_rejected_offer(const fs::path& workdir) {
    const auto src = workdir / "secret.txt";
    const auto downloads = workdir / "reject_downloads";
    TEST_ASSERT(write_file(src, "do not send"), "Failed to create source file");

    TestNode sender(makeConfig(workdir / "unused"));
    TestNode receiver(makeConfig(downloads));
    receiver.engine.setDecisionProvider([](const IncomingOffer&) { return false; });

    OutcomeBox sent;
    OutcomeBox received;
    receiver.engine.setReceiveCallback(received.callback());

    TEST_ASSERT(sender.start() && receiver.start(), "Control channels did not start");
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", receiver.port(), src.string(), sent.callback()),
                "sendOffer failed");

    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(10)), "Sender never heard back");
    TransferOutcome out = sent.first();
    TEST_ASSERT(!out.success && out.reason == "rejected", "Expected rejected, got " << out.reason);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    TEST_ASSERT(received.size() == 0, "Receiver reported a session for a rejected offer");
    TEST_ASSERT(count_files(downloads) == 0, "Rejected offer wrote to disk");
    // No transfer port was opened, so no worker is left waiting for a connection
    TEST_ASSERT(receiver.engine.activeTransferCount() == 0,
                "Receiver still has " << receiver.engine.activeTransferCount() << " active transfer(s)");
    TEST_ASSERT(sender.engine.activeTransferCount() == 0, "Sender opened a transfer for a rejected offer");
    return true;
}

static bool test_offer_without_provider_is_rejected(const fs::path& workdir) {
    const auto src = workdir / "unasked.txt";
    TEST_ASSERT(write_file(src, "nobody decides"), "Failed to create source file");

    TestNode sender(makeConfig(workdir / "unused"));
    TestNode receiver(makeConfig(workdir / "noprovider_downloads"));

    OutcomeBox sent;
    TEST_ASSERT(sender.start() && receiver.start(), "Control channels did not start");
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", receiver.port(), src.string(), sent.callback()),
                "sendOffer failed");

    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(10)), "Sender never heard back");
    TEST_ASSERT(sent.first().reason == "rejected", "Expected rejected, got " << sent.first().reason);
    return true;
}

// UDP socket that is bound but never read
static int silent_socket(int& port) {
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) return -1;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(sock);
        return -1;
    }
    socklen_t len = sizeof(addr);
    getsockname(sock, (struct sockaddr*)&addr, &len);
    port = ntohs(addr.sin_port);
    return sock;
}

static bool test_silent_peer_times_out(const fs::path& workdir) {
    const auto src = workdir / "waiting.txt";
    TEST_ASSERT(write_file(src, "anyone there?"), "Failed to create source file");

    int silent_port = 0;
    int silent = silent_socket(silent_port);
    TEST_ASSERT(silent >= 0, "Could not open the silent peer");

    NodeConfig config = makeConfig(workdir / "unused");
    config.offer_timeout_sec = 1;
    TestNode sender(config);
    TEST_ASSERT(sender.start(), "Control channel did not start");

    OutcomeBox sent;
    auto started = std::chrono::steady_clock::now();
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", silent_port, src.string(), sent.callback()),
                "sendOffer failed");
    TEST_ASSERT(sender.engine.pendingOfferCount() == 1, "Offer not pending");

    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(5)), "Watchdog never fired");
    auto waited = std::chrono::steady_clock::now() - started;
    TEST_ASSERT(sent.first().reason == "timeout", "Expected timeout, got " << sent.first().reason);
    TEST_ASSERT(waited >= std::chrono::milliseconds(900), "Timed out too early");
    TEST_ASSERT(sender.engine.pendingOfferCount() == 0, "Timed out offer still pending");

    close(silent);
    return true;
}

static bool test_second_offer_replaces_first(const fs::path& workdir) {
    const auto first = workdir / "draft_a.txt";
    const auto second = workdir / "draft_b.txt";
    TEST_ASSERT(write_file(first, "first draft"), "Failed to create first file");
    TEST_ASSERT(write_file(second, "second draft"), "Failed to create second file");

    int silent_port = 0;
    int silent = silent_socket(silent_port);
    TEST_ASSERT(silent >= 0, "Could not open the silent peer");

    // Declared before the node so it outlives every worker
    OutcomeBox sent;
    NodeConfig config = makeConfig(workdir / "unused");
    config.offer_timeout_sec = 1;
    TestNode sender(config);
    TEST_ASSERT(sender.start(), "Control channel did not start");

    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", silent_port, first.string(), sent.callback()),
                "First sendOffer failed");
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", silent_port, second.string(), sent.callback()),
                "Second sendOffer failed");
    TEST_ASSERT(sender.engine.pendingOfferCount() == 1,
                "Expected one pending offer, got " << sender.engine.pendingOfferCount());

    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(5)), "Watchdog never fired");
    // Long enough for the replaced offer's watchdog to fire too, had it not retired
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    TEST_ASSERT(sent.size() == 1, "Callback fired " << sent.size() << " times");
    TransferOutcome out = sent.first();
    TEST_ASSERT(out.reason == "timeout", "Expected timeout, got " << out.reason);
    TEST_ASSERT(out.path == second.string(), "Outcome belongs to " << out.path);
    TEST_ASSERT(sender.engine.pendingOfferCount() == 0, "Timed out offer still pending");

    close(silent);
    return true;
}

static bool test_stop_settles_pending_offers(const fs::path& workdir) {
    const auto src = workdir / "interrupted.txt";
    TEST_ASSERT(write_file(src, "stop me"), "Failed to create source file");

    int silent_port = 0;
    int silent = silent_socket(silent_port);
    TEST_ASSERT(silent >= 0, "Could not open the silent peer");

    TestNode sender(makeConfig(workdir / "unused"));
    TEST_ASSERT(sender.start(), "Control channel did not start");

    OutcomeBox sent;
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", silent_port, src.string(), sent.callback()),
                "sendOffer failed");

    sender.control.stop();
    sender.engine.stop();
    sender.engine.stop();

    TEST_ASSERT(sent.size() == 1, "Stop left the offer unsettled");
    TEST_ASSERT(sent.first().reason == "transfer failed: node stopped", "Got " << sent.first().reason);
    TEST_ASSERT(!sender.engine.sendOffer("127.0.0.1", silent_port, src.string(), sent.callback()),
                "Stopped engine accepted an offer");

    close(silent);
    return true;
}

static bool test_local_failures_are_synchronous(const fs::path& workdir) {
    TestNode sender(makeConfig(workdir / "unused"));
    TEST_ASSERT(sender.start(), "Control channel did not start");

    OutcomeBox sent;
    TEST_ASSERT(!sender.engine.sendOffer("127.0.0.1", 9, (workdir / "missing.bin").string(), sent.callback()),
                "Missing file accepted");
    TEST_ASSERT(!sender.engine.sendOffer("127.0.0.1", 9, workdir.string(), sent.callback()),
                "Directory accepted");

    const auto src = workdir / "valid.txt";
    TEST_ASSERT(write_file(src, "x"), "Failed to create source file");
    TEST_ASSERT(!sender.engine.sendOffer("not-an-ip", 9, src.string(), sent.callback()), "Bad address accepted");

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    TEST_ASSERT(sent.size() == 0, "Synchronous failure also fired the callback");
    TEST_ASSERT(sender.engine.pendingOfferCount() == 0, "Failed offer left pending state");
    return true;
}

static bool test_collision_renames(const fs::path& workdir) {
    const auto src = workdir / "report.txt";
    const auto downloads = workdir / "collision_downloads";
    std::error_code ec;
    fs::create_directories(downloads, ec);
    TEST_ASSERT(write_file(src, "second version"), "Failed to create source file");
    TEST_ASSERT(write_file(downloads / "report.txt", "first version"), "Failed to create existing file");

    TestNode sender(makeConfig(workdir / "unused"));
    TestNode receiver(makeConfig(downloads));
    receiver.engine.setDecisionProvider([](const IncomingOffer&) { return true; });

    OutcomeBox sent;
    OutcomeBox received;
    receiver.engine.setReceiveCallback(received.callback());

    TEST_ASSERT(sender.start() && receiver.start(), "Control channels did not start");
    TEST_ASSERT(sender.engine.sendOffer("127.0.0.1", receiver.port(), src.string(), sent.callback()),
                "sendOffer failed");
    TEST_ASSERT(received.waitFor(1, std::chrono::seconds(10)), "Receiver never completed");
    TEST_ASSERT(sent.waitFor(1, std::chrono::seconds(10)), "Sender never completed");

    TransferOutcome in = received.first();
    TEST_ASSERT(in.success, "Receiver reported " << in.reason);
    TEST_ASSERT(fs::path(in.path).filename() == "report_1.txt", "Stored as " << in.path);
    TEST_ASSERT(read_all(downloads / "report.txt") == "first version", "Existing file was overwritten");
    TEST_ASSERT(read_all(downloads / "report_1.txt") == "second version", "Renamed copy has wrong content");

    TEST_ASSERT(claimDestinationPath(downloads.string(), "../report.txt") == (downloads / "report_2.txt").string(),
                "Remote directories must be stripped");
    return true;
}

static bool test_hash_mismatch_discards_file(const fs::path& workdir) {
    const auto original = workdir / "payload.bin";
    const auto corrupted = workdir / "payload_corrupted.bin";
    const auto downloads = workdir / "mismatch_downloads";

    std::string data = random_bytes(100 * 1024, 7);
    TEST_ASSERT(write_file(original, data), "Failed to create source file");
    data[5000] = static_cast<char>(data[5000] ^ 0xFF);
    TEST_ASSERT(write_file(corrupted, data), "Failed to create corrupted file");

    SendOffer offer;
    offer.sender_ip = "127.0.0.1";
    offer.sender_port = 12000;
    offer.file_name = "payload.bin";
    offer.file_size = data.size();
    offer.file_md5 = calculateChecksum(original.string());
    offer.timestamp = unixTimestamp();

    FileTransferServer server(downloads.string(), 5, 5);
    TEST_ASSERT(server.start(), "Server did not start");
    auto receiving = std::async(std::launch::async, [&server, &offer]() { return server.receive(offer); });

    FileTransferClient client("127.0.0.1", server.getPort());
    TEST_ASSERT(client.connect(), "Client could not connect");
    // The corrupted bytes travel under the original file's hash
    TransferOutcome out = client.sendFile(corrupted.string(), offer.file_md5);
    client.disconnect();
    TransferOutcome in = receiving.get();

    TEST_ASSERT(!out.success && out.reason == "hash mismatch", "Sender got " << out.reason);
    TEST_ASSERT(!in.success && in.reason == "hash mismatch", "Receiver got " << in.reason);
    TEST_ASSERT(count_files(downloads) == 0, "Mismatched file was kept");
    return true;
}

static bool test_oversized_block_size_is_refused(const fs::path& workdir) {
    const auto downloads = workdir / "oversized_downloads";

    SendOffer offer;
    offer.sender_ip = "127.0.0.1";
    offer.sender_port = 12000;
    offer.file_name = "tiny.txt";
    offer.file_size = 10;
    offer.file_md5 = "781e5e245d69b566979b86e28d23f2c7";
    offer.timestamp = unixTimestamp();

    FileTransferServer server(downloads.string(), 5, 5);
    TEST_ASSERT(server.start(), "Server did not start");
    auto receiving = std::async(std::launch::async, [&server, &offer]() { return server.receive(offer); });

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    TEST_ASSERT(fd >= 0, "Could not create client socket");
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(server.getPort());
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        receiving.wait();
        TEST_ASSERT(false, "Could not connect: " << strerror(errno));
    }
    setStreamTimeouts(fd);

    // One chunk of up to 4 GiB satisfies the chunk count for a 10 byte file
    FileMeta meta;
    meta.file_name = "tiny.txt";
    meta.total_blocks = 1;
    meta.block_size = 0xFFFFFFFF;
    std::string wire;
    const std::string meta_json = TransferMessage{meta}.serialize();
    appendLengthPrefix(wire, static_cast<uint32_t>(meta_json.size()));
    wire += meta_json;

    std::string reply_error;
    try {
        StreamLimits limits;
        limits.idle_timeout_sec = 5;
        sendAll(fd, wire.data(), wire.size(), limits);
        TransferMessage reply = recvMessage(fd, limits);
        if (reply.is<ErrorMessage>()) reply_error = reply.as<ErrorMessage>().error;
    } catch (const std::exception& e) {
        reply_error = std::string("client side: ") + e.what();
    }
    close(fd);
    TransferOutcome in = receiving.get();

    TEST_ASSERT(!in.success, "Oversized block size was accepted");
    TEST_ASSERT(in.reason.rfind("transfer failed: ", 0) == 0, "Receiver got " << in.reason);
    TEST_ASSERT(in.reason.find("block_size") != std::string::npos, "Refused for another reason: " << in.reason);
    TEST_ASSERT(reply_error.rfind("transfer failed: ", 0) == 0, "Sender was told " << reply_error);
    TEST_ASSERT(count_files(downloads) == 0, "Refused session left a file behind");
    return true;
}

static bool test_control_send_during_stop() {
    ControlChannel control(0, 1);
    TEST_ASSERT(control.start(), "Control channel did not start");

    ReceiveReject reject;
    reject.timestamp = unixTimestamp();
    const TransferMessage msg{reject};

    std::atomic<bool> sending(true);
    std::atomic<int> attempts(0);
    std::thread sender([&]() {
        while (sending) {
            control.sendTo("127.0.0.1", 9, msg);
            attempts++;
        }
    });

    while (attempts < 50) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    control.stop();
    const int after_stop = attempts;
    while (attempts < after_stop + 50) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    sending = false;
    sender.join();

    TEST_ASSERT(!control.isRunning(), "Control channel still running");
    TEST_ASSERT(!control.sendTo("127.0.0.1", 9, msg), "Send succeeded on a stopped control channel");
    return true;
}

static bool test_multi_chunk_transfer(const fs::path& workdir) {
    const auto src = workdir / "big.bin";
    const auto downloads = workdir / "chunk_downloads";
    const std::string data = random_bytes(2 * BLOCK_SIZE + 10, 11);
    TEST_ASSERT(write_file(src, data), "Failed to create source file");

    SendOffer offer;
    offer.sender_ip = "127.0.0.1";
    offer.sender_port = 12000;
    offer.file_name = "big.bin";
    offer.file_size = data.size();
    offer.file_md5 = calculateChecksum(src.string());
    offer.timestamp = unixTimestamp();

    FileTransferServer server(downloads.string(), 5, 5);
    std::vector<int> progress;
    server.setProgressCallback([&progress](const std::string&, int pct) { progress.push_back(pct); });
    TEST_ASSERT(server.start(), "Server did not start");
    auto receiving = std::async(std::launch::async, [&server, &offer]() { return server.receive(offer); });

    FileTransferClient client("127.0.0.1", server.getPort(), StreamLimits(), 0);
    TEST_ASSERT(client.connect(), "Client could not connect");
    TransferOutcome out = client.sendFile(src.string(), offer.file_md5);
    client.disconnect();
    TransferOutcome in = receiving.get();

    TEST_ASSERT(out.success, "Sender got " << out.reason);
    TEST_ASSERT(in.success, "Receiver got " << in.reason);
    TEST_ASSERT(client.getChunksSent() == 3, "Sent " << client.getChunksSent() << " chunks");
    TEST_ASSERT(server.getSession().chunks_received == 3, "Received " << server.getSession().chunks_received);
    TEST_ASSERT(server.getSession().bytes_received == data.size(), "Wrong byte count");
    TEST_ASSERT(read_all(in.path) == data, "Received bytes differ");
    TEST_ASSERT(!progress.empty() && progress.back() == 100, "Progress never reached 100%");
    return true;
}

static bool test_offer_channel() {
    IncomingOffer incoming;
    incoming.offer.sender_ip = "10.0.0.2";
    incoming.offer.sender_port = 12000;
    incoming.offer.file_name = "photo.jpg";

    OfferChannel channel(std::chrono::seconds(5));
    auto decision = std::async(std::launch::async, [&channel, &incoming]() { return channel.decide(incoming); });

    auto request = channel.next(std::chrono::seconds(2));
    TEST_ASSERT(request != nullptr, "Request never queued");
    TEST_ASSERT(request->offer.offer.file_name == "photo.jpg", "Wrong request");
    channel.answer(request, true);
    TEST_ASSERT(decision.get(), "Accept not delivered");

    TEST_ASSERT(channel.next(std::chrono::milliseconds(50)) == nullptr, "Empty channel returned a request");

    OfferChannel impatient(std::chrono::seconds(1));
    TEST_ASSERT(!impatient.decide(incoming), "Unanswered offer should be rejected");
    TEST_ASSERT(impatient.next(std::chrono::milliseconds(50)) == nullptr, "Expired request still handed out");

    OfferChannel closing(std::chrono::seconds(30));
    auto pending = std::async(std::launch::async, [&closing, &incoming]() { return closing.decide(incoming); });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (closing.pending() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    closing.close();
    TEST_ASSERT(!pending.get(), "Close should reject queued offers");
    TEST_ASSERT(!closing.decide(incoming), "Closed channel accepted an offer");
    return true;
}

int main() {
    const auto workdir = fs::temp_directory_path() / "landrop_transfer_tests";
    std::error_code ec;
    fs::remove_all(workdir, ec);
    fs::create_directories(workdir, ec);

    std::cout << "--- File transfer tests (" << workdir << ") ---" << std::endl;

    if (test_accepted_transfer(workdir)) std::cout << "PASS: accepted transfer" << std::endl;
    if (test_rejected_offer(workdir)) std::cout << "PASS: rejected offer" << std::endl;
    if (test_offer_without_provider_is_rejected(workdir)) std::cout << "PASS: no provider rejects" << std::endl;
    if (test_silent_peer_times_out(workdir)) std::cout << "PASS: silent peer times out" << std::endl;
    if (test_second_offer_replaces_first(workdir)) std::cout << "PASS: second offer replaces first" << std::endl;
    if (test_stop_settles_pending_offers(workdir)) std::cout << "PASS: stop settles pending offers" << std::endl;
    if (test_local_failures_are_synchronous(workdir)) std::cout << "PASS: local failures are synchronous" << std::endl;
    if (test_collision_renames(workdir)) std::cout << "PASS: collision renames" << std::endl;
    if (test_hash_mismatch_discards_file(workdir)) std::cout << "PASS: hash mismatch discards file" << std::endl;
    if (test_oversized_block_size_is_refused(workdir)) std::cout << "PASS: oversized block size refused" << std::endl;
    if (test_control_send_during_stop()) std::cout << "PASS: control send during stop" << std::endl;
    if (test_multi_chunk_transfer(workdir)) std::cout << "PASS: multi-chunk transfer" << std::endl;
    if (test_offer_channel()) std::cout << "PASS: offer channel" << std::endl;

    fs::remove_all(workdir, ec);

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
