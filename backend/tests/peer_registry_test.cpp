#include "peerRegistry.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static PeerRecord makePeer(const std::string& name, const std::string& ip, int port) {
    PeerRecord record;
    record.name = name;
    record.ip = ip;
    record.port = port;
    record.platform = "Linux";
    record.timestamp = 1700000000;
    return record;
}

static bool test_upsert_is_last_writer_wins() {
    PeerRegistry registry;

    TEST_ASSERT(registry.upsert(makePeer("node_1", "10.0.0.2", 12000)), "First upsert should be new");
    PeerRecord renamed = makePeer("kitchen", "10.0.0.2", 12000);
    renamed.timestamp = 1700000009;
    TEST_ASSERT(!registry.upsert(renamed), "Second upsert of the same key should not be new");

    TEST_ASSERT(registry.count() == 1, "Same key must not be duplicated");
    auto stored = registry.get("10.0.0.2:12000");
    TEST_ASSERT(stored.has_value(), "Record missing");
    TEST_ASSERT(stored->name == "kitchen", "Later fields should win");
    TEST_ASSERT(stored->timestamp == 1700000009, "Later timestamp should win");

    TEST_ASSERT(registry.upsert(makePeer("node_1", "10.0.0.2", 12001)), "Other port is another peer");
    TEST_ASSERT(registry.count() == 2, "Expected two peers");
    return true;
}

static bool test_snapshot_is_a_copy() {
    PeerRegistry registry;
    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));

    std::vector<PeerRecord> snapshot = registry.all();
    registry.upsert(makePeer("node_2", "10.0.0.3", 12000));
    registry.remove("10.0.0.2:12000");

    TEST_ASSERT(snapshot.size() == 1, "Snapshot changed after the registry did");
    TEST_ASSERT(snapshot[0].name == "node_1", "Snapshot record changed");
    TEST_ASSERT(!registry.get("10.0.0.2:12000").has_value(), "remove() did not remove");
    TEST_ASSERT(!registry.remove("10.0.0.2:12000"), "Second remove() should report nothing removed");
    return true;
}

static bool test_sweep_respects_ttl() {
    PeerRegistry registry(std::chrono::seconds(10), std::chrono::seconds(5));
    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));
    auto seen = registry.get("10.0.0.2:12000")->last_seen;

    TEST_ASSERT(registry.sweepExpired(seen + std::chrono::seconds(9)).empty(), "Evicted before the TTL");
    TEST_ASSERT(registry.sweepExpired(seen + std::chrono::seconds(10)).empty(), "Evicted at exactly the TTL");

    auto removed = registry.sweepExpired(seen + std::chrono::seconds(11));
    TEST_ASSERT(removed.size() == 1 && removed[0] == "10.0.0.2:12000", "Stale record not evicted");
    TEST_ASSERT(registry.count() == 0, "Registry should be empty after the sweep");
    return true;
}

static bool test_refresh_keeps_peer_alive() {
    PeerRegistry registry(std::chrono::seconds(10), std::chrono::seconds(5));
    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));
    auto first = registry.get("10.0.0.2:12000")->last_seen;

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));
    auto second = registry.get("10.0.0.2:12000")->last_seen;

    TEST_ASSERT(second >= first, "last_seen moved backwards");
    TEST_ASSERT(registry.sweepExpired(first + std::chrono::seconds(10) + std::chrono::milliseconds(10)).empty(),
                "Refreshed record was evicted on its old last_seen");
    TEST_ASSERT(registry.isOnline("10.0.0.2:12000"), "Fresh record should be online");
    TEST_ASSERT(!registry.isOnline("10.0.0.9:12000"), "Unknown key reported online");
    return true;
}

static bool test_background_sweep_and_stop() {
    PeerRegistry registry(std::chrono::seconds(1), std::chrono::seconds(1));
    registry.start();
    registry.start();
    TEST_ASSERT(registry.isRunning(), "Sweep not running after start()");

    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (registry.count() != 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    TEST_ASSERT(registry.count() == 0, "Background sweep never evicted the stale peer");

    registry.stop();
    registry.stop();
    TEST_ASSERT(!registry.isRunning(), "Sweep still running after stop()");
    return true;
}

static bool test_unique_node_names() {
    PeerRegistry registry;
    TEST_ASSERT(generateUniqueNodeName(registry) == "node_1", "Empty network should give node_1");

    registry.upsert(makePeer("node_1", "10.0.0.2", 12000));
    registry.upsert(makePeer("node_3", "10.0.0.3", 12000));
    registry.upsert(makePeer("node_x", "10.0.0.4", 12000));
    TEST_ASSERT(generateUniqueNodeName(registry) == "node_2", "Should take the smallest free number");

    registry.upsert(makePeer("node_2", "10.0.0.5", 12000));
    TEST_ASSERT(generateUniqueNodeName(registry) == "node_4", "Should skip every taken number");
    return true;
}

static bool test_peer_table() {
    PeerRegistry registry;
    registry.upsert(makePeer("kitchen", "10.0.0.2", 12000));
    std::string table = formatPeerTable(registry.all());

    TEST_ASSERT(table.find("kitchen") != std::string::npos, "Name missing from table");
    TEST_ASSERT(table.find("10.0.0.2") != std::string::npos, "IP missing from table");
    TEST_ASSERT(table.find("Total: 1") != std::string::npos, "Total line missing");
    TEST_ASSERT(formatPeerTable({}).find("No other peers") != std::string::npos, "Empty table has no notice");
    return true;
}

int main() {
    std::cout << "--- PeerRegistry tests ---" << std::endl;

    if (test_upsert_is_last_writer_wins()) std::cout << "PASS: upsert last writer wins" << std::endl;
    if (test_snapshot_is_a_copy()) std::cout << "PASS: snapshot is a copy" << std::endl;
    if (test_sweep_respects_ttl()) std::cout << "PASS: sweep respects TTL" << std::endl;
    if (test_refresh_keeps_peer_alive()) std::cout << "PASS: refresh keeps peer alive" << std::endl;
    if (test_background_sweep_and_stop()) std::cout << "PASS: background sweep and stop" << std::endl;
    if (test_unique_node_names()) std::cout << "PASS: unique node names" << std::endl;
    if (test_peer_table()) std::cout << "PASS: peer table" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }

    std::cout << "ALL PASS" << std::endl;
    return 0;
}
