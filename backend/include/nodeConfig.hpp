#pragma once

#include <string>

/**
 * Runtime settings of a node
 * Every field has a usable default; fromFile() overrides the ones present
 * in a JSON config file.
 */
struct NodeConfig {
	std::string node_name;                  // Empty: pick a unique node_N after the startup scan
	std::string local_ip;                   // Empty: resolve the outward-facing address
	int control_port = 12000;               // UDP control/business port, 0 lets the kernel choose
	int port_search_attempts = 100;         // Consecutive ports tried when control_port is taken

	int discovery_port = 23333;
	std::string broadcast_address;          // Empty: directed broadcast on every interface
	int announce_interval_ms = 1000;
	int announce_burst_count = 3;
	int announce_burst_spacing_ms = 200;
	int startup_scan_ms = 3000;             // Listen-only scan before naming; 0 disables it

	int peer_ttl_sec = 10;
	int sweep_interval_sec = 5;

	std::string download_dir = "./downloads";
	int offer_timeout_sec = 30;             // Sender waits this long for accept/reject
	int accept_timeout_sec = 30;            // Receiver waits this long for the bulk connection
	int io_timeout_sec = 10;                // Longest silence tolerated on a bulk connection
	int chunk_pacing_us = 1000;             // Pause between chunk sends
	int shutdown_grace_ms = 2000;

	/**
	 * Loads a JSON object of overrides on top of the defaults
	 * @param path: Path to the JSON file
	 * @throws std::runtime_error if the file cannot be read, is not JSON,
	 *         or a known key has the wrong type or an invalid value
	 */
	static NodeConfig fromFile(const std::string& path);

	// Rejects values the node cannot run with
	void validate() const;
};
