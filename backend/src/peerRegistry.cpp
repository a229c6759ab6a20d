#include "peerRegistry.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <set>
#include <ctime>

PeerRegistry::PeerRegistry(std::chrono::seconds ttl, std::chrono::seconds sweep_interval)
	: ttl(ttl), sweep_interval(sweep_interval), is_running(false) {}

PeerRegistry::~PeerRegistry() {
	stop();
}

void PeerRegistry::start() {
	std::lock_guard<std::mutex> lock(sweep_mutex);
	if (is_running) return;

	is_running = true;
	sweep_thread = std::thread(&PeerRegistry::sweepLoop, this);
}

void PeerRegistry::stop() {
	{
		std::lock_guard<std::mutex> lock(sweep_mutex);
		if (!is_running) return;
		is_running = false;
	}
	sweep_cv.notify_all();

	if (sweep_thread.joinable()) {
		sweep_thread.join();
	}
}

bool PeerRegistry::upsert(const PeerRecord& record) {
	PeerRecord fresh = record;
	auto now = std::chrono::steady_clock::now();

	std::lock_guard<std::mutex> lock(peers_mutex);
	auto it = peers.find(fresh.key());
	if (it == peers.end()) {
		fresh.last_seen = now;
		peers.emplace(fresh.key(), fresh);
		return true;
	}

	// last-seen never moves backwards while the record exists
	fresh.last_seen = std::max(now, it->second.last_seen);
	it->second = fresh;
	return false;
}

bool PeerRegistry::remove(const std::string& key) {
	std::lock_guard<std::mutex> lock(peers_mutex);
	return peers.erase(key) > 0;
}

std::optional<PeerRecord> PeerRegistry::get(const std::string& key) const {
	std::lock_guard<std::mutex> lock(peers_mutex);
	auto it = peers.find(key);
	if (it == peers.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::vector<PeerRecord> PeerRegistry::all() const {
	std::lock_guard<std::mutex> lock(peers_mutex);
	std::vector<PeerRecord> snapshot;
	snapshot.reserve(peers.size());
	for (const auto& entry : peers) {
		snapshot.push_back(entry.second);
	}
	return snapshot;
}

size_t PeerRegistry::count() const {
	std::lock_guard<std::mutex> lock(peers_mutex);
	return peers.size();
}

bool PeerRegistry::isOnline(const std::string& key) const {
	std::lock_guard<std::mutex> lock(peers_mutex);
	auto it = peers.find(key);
	if (it == peers.end()) {
		return false;
	}
	return std::chrono::steady_clock::now() - it->second.last_seen <= ttl;
}

std::vector<std::string> PeerRegistry::sweepExpired(std::chrono::steady_clock::time_point now) {
	std::vector<std::string> expired;
	{
		std::lock_guard<std::mutex> lock(peers_mutex);
		for (const auto& entry : peers) {
			if (now - entry.second.last_seen > ttl) {
				expired.push_back(entry.first);
			}
		}
	}

	if (expired.empty()) {
		return expired;
	}

	std::vector<std::string> removed;
	std::lock_guard<std::mutex> lock(peers_mutex);
	for (const auto& key : expired) {
		auto it = peers.find(key);
		// A record refreshed between the two critical sections survives
		if (it != peers.end() && now - it->second.last_seen > ttl) {
			std::cout << "Peer expired: " << it->second.name << " (" << key << ")" << std::endl;
			peers.erase(it);
			removed.push_back(key);
		}
	}
	return removed;
}

/**
 * Background sweep, wakes every sweep_interval or immediately on stop()
 */
void PeerRegistry::sweepLoop() {
	std::unique_lock<std::mutex> lock(sweep_mutex);
	while (is_running) {
		sweep_cv.wait_for(lock, sweep_interval, [this]() { return !is_running; });
		if (!is_running) break;

		lock.unlock();
		try {
			sweepExpired(std::chrono::steady_clock::now());
		} catch (const std::exception& e) {
			std::cerr << "Peer sweep failed: " << e.what() << std::endl;
		}
		lock.lock();
	}
}

std::string generateUniqueNodeName(const PeerRegistry& registry) {
	std::set<int> used;
	for (const auto& peer : registry.all()) {
		if (peer.name.rfind("node_", 0) != 0) continue;
		try {
			size_t consumed = 0;
			int n = std::stoi(peer.name.substr(5), &consumed);
			if (consumed == peer.name.size() - 5 && n > 0) {
				used.insert(n);
			}
		} catch (const std::exception&) {
			// not a generated name
		}
	}

	int candidate = 1;
	while (used.count(candidate)) {
		++candidate;
	}
	return "node_" + std::to_string(candidate);
}

std::string formatPeerTable(const std::vector<PeerRecord>& records) {
	std::ostringstream out;
	out << "Online peers:\n";
	out << std::left << std::setw(16) << "Name" << std::setw(16) << "IP"
	    << std::setw(8) << "Port" << std::setw(12) << "Last seen" << "Platform\n";
	out << std::string(62, '-') << "\n";

	if (records.empty()) {
		out << "No other peers discovered yet\n";
	}

	auto steady_now = std::chrono::steady_clock::now();
	auto wall_now = std::chrono::system_clock::now();
	for (const auto& peer : records) {
		// Translate the local monotonic last-seen into wall time for display
		auto wall = wall_now - std::chrono::duration_cast<std::chrono::system_clock::duration>(
			steady_now - peer.last_seen);
		std::time_t t = std::chrono::system_clock::to_time_t(wall);
		std::tm tm_buf{};
		localtime_r(&t, &tm_buf);

		std::ostringstream seen;
		seen << std::put_time(&tm_buf, "%H:%M:%S");

		out << std::left << std::setw(16) << peer.name << std::setw(16) << peer.ip
		    << std::setw(8) << peer.port << std::setw(12) << seen.str() << peer.platform << "\n";
	}

	out << std::string(62, '-') << "\n";
	out << "Total: " << records.size() << " peer(s) online";
	return out.str();
}
