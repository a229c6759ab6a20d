#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <condition_variable>
#include <cstdint>

/**
 * One known peer, as last announced
 */
struct PeerRecord {
	std::string name;
	std::string ip;
	int port = 0;
	std::string platform;
	int64_t timestamp = 0;                              // Sender's clock, from the announce
	std::chrono::steady_clock::time_point last_seen;    // Local clock, set by the registry

	std::string key() const { return ip + ":" + std::to_string(port); }
};

/**
 * PeerRegistry keeps the membership table of peers heard on the network
 * Records are keyed by "ip:port" and evicted once they have not been
 * refreshed for longer than the TTL. All access goes through one mutex and
 * readers always get copies.
 */
class PeerRegistry {
private:
	std::map<std::string, PeerRecord> peers;
	mutable std::mutex peers_mutex;

	std::chrono::seconds ttl;
	std::chrono::seconds sweep_interval;

	std::atomic<bool> is_running;
	std::thread sweep_thread;
	std::mutex sweep_mutex;
	std::condition_variable sweep_cv;

	void sweepLoop();

public:
	/**
	 * @param ttl: Age after which a record is considered stale (default: 10s)
	 * @param sweep_interval: Cadence of the background sweep (default: 5s)
	 */
	explicit PeerRegistry(std::chrono::seconds ttl = std::chrono::seconds(10),
	                      std::chrono::seconds sweep_interval = std::chrono::seconds(5));
	~PeerRegistry();

	PeerRegistry(const PeerRegistry&) = delete;
	PeerRegistry& operator=(const PeerRegistry&) = delete;

	// Starts the background sweep; no-op if already running
	void start();

	// Stops the background sweep; safe to call repeatedly
	void stop();

	/**
	 * Inserts or replaces the record for record.key() and refreshes last-seen
	 * @return: true if the key was not present before
	 */
	bool upsert(const PeerRecord& record);

	bool remove(const std::string& key);

	std::optional<PeerRecord> get(const std::string& key) const;

	// Snapshot of every record
	std::vector<PeerRecord> all() const;

	size_t count() const;

	// Present and refreshed within the TTL
	bool isOnline(const std::string& key) const;

	/**
	 * Evicts every record older than the TTL at the given time
	 * @return: keys that were removed
	 */
	std::vector<std::string> sweepExpired(std::chrono::steady_clock::time_point now);

	bool isRunning() const { return is_running; }

	std::chrono::seconds getTtl() const { return ttl; }
};

/**
 * Picks the smallest "node_N" name not already announced by a known peer
 */
std::string generateUniqueNodeName(const PeerRegistry& registry);

/**
 * Renders the records as a fixed-width table for the console
 */
std::string formatPeerTable(const std::vector<PeerRecord>& records);
