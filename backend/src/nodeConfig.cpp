#include "nodeConfig.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <typename T>
void readField(const json& j, const char* key, T& target) {
	if (!j.contains(key)) return;
	try {
		target = j.at(key).get<T>();
	} catch (const json::exception& e) {
		throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
	}
}

} // namespace

NodeConfig NodeConfig::fromFile(const std::string& path) {
	std::ifstream in(path);
	if (!in.is_open()) {
		throw std::runtime_error("cannot open config file: " + path);
	}

	json j;
	try {
		in >> j;
	} catch (const json::exception& e) {
		throw std::runtime_error("invalid config file " + path + ": " + e.what());
	}
	if (!j.is_object()) {
		throw std::runtime_error("config file " + path + " must contain a JSON object");
	}

	NodeConfig config;
	readField(j, "node_name", config.node_name);
	readField(j, "local_ip", config.local_ip);
	readField(j, "control_port", config.control_port);
	readField(j, "port_search_attempts", config.port_search_attempts);
	readField(j, "discovery_port", config.discovery_port);
	readField(j, "broadcast_address", config.broadcast_address);
	readField(j, "announce_interval_ms", config.announce_interval_ms);
	readField(j, "announce_burst_count", config.announce_burst_count);
	readField(j, "announce_burst_spacing_ms", config.announce_burst_spacing_ms);
	readField(j, "startup_scan_ms", config.startup_scan_ms);
	readField(j, "peer_ttl_sec", config.peer_ttl_sec);
	readField(j, "sweep_interval_sec", config.sweep_interval_sec);
	readField(j, "download_dir", config.download_dir);
	readField(j, "offer_timeout_sec", config.offer_timeout_sec);
	readField(j, "accept_timeout_sec", config.accept_timeout_sec);
	readField(j, "io_timeout_sec", config.io_timeout_sec);
	readField(j, "chunk_pacing_us", config.chunk_pacing_us);
	readField(j, "shutdown_grace_ms", config.shutdown_grace_ms);

	config.validate();
	return config;
}

void NodeConfig::validate() const {
	if (control_port < 0 || control_port > 65535) {
		throw std::runtime_error("control_port out of range");
	}
	if (discovery_port <= 0 || discovery_port > 65535) {
		throw std::runtime_error("discovery_port out of range");
	}
	if (port_search_attempts < 1) {
		throw std::runtime_error("port_search_attempts must be at least 1");
	}
	if (announce_interval_ms <= 0 || announce_burst_spacing_ms < 0 || announce_burst_count < 0) {
		throw std::runtime_error("announce timing must be positive");
	}
	if (peer_ttl_sec <= 0 || sweep_interval_sec <= 0) {
		throw std::runtime_error("peer_ttl_sec and sweep_interval_sec must be positive");
	}
	if (offer_timeout_sec <= 0 || accept_timeout_sec <= 0 || io_timeout_sec <= 0) {
		throw std::runtime_error("transfer timeouts must be positive");
	}
	if (chunk_pacing_us < 0 || startup_scan_ms < 0 || shutdown_grace_ms < 0) {
		throw std::runtime_error("delays cannot be negative");
	}
	if (download_dir.empty()) {
		throw std::runtime_error("download_dir cannot be empty");
	}
}
