#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include "nodeConfig.hpp"
#include "peerRegistry.hpp"
#include "controlChannel.hpp"
#include "networkDiscovery.hpp"
#include "transferEngine.hpp"
#include "offerChannel.hpp"

/**
 * P2PNode wires one node together
 * The control channel, registry and transfer engine exist from construction;
 * discovery is created in start() once the control port is known, since the
 * port is part of every announce. A node is started and stopped once.
 */
class P2PNode {
private:
	NodeConfig config;
	std::string local_ip;

	ControlChannel control;
	PeerRegistry registry;
	OfferChannel offers;
	TransferEngine engine;
	std::unique_ptr<NetworkDiscovery> discovery;

	std::atomic<bool> is_running;
	std::mutex lifecycle_mutex;
	std::chrono::steady_clock::time_point start_time;

	// Listens without announcing so the chosen name does not collide
	std::string scanForName();

public:
	explicit P2PNode(const NodeConfig& config);
	~P2PNode();

	P2PNode(const P2PNode&) = delete;
	P2PNode& operator=(const P2PNode&) = delete;

	/**
	 * Opens the control port, runs the startup scan when no name is
	 * configured, then starts the registry sweep, control listener and discovery
	 * @return: false if a socket could not be opened
	 */
	bool start();

	// Stops every part in dependency order; safe to call repeatedly
	void stop();

	std::vector<PeerRecord> listPeers() const;

	/**
	 * Offers a file to a peer
	 * @param target: "ip:port" of the peer's control channel
	 */
	bool sendFile(const std::string& target, const std::string& file_path, TransferCallback callback);
	bool sendFile(const std::string& ip, int port, const std::string& file_path, TransferCallback callback);

	// Multi-line summary for the console
	std::string info() const;

	std::chrono::seconds uptime() const;

	// Queue the console answers incoming offers from
	OfferChannel& offerChannel() { return offers; }

	PeerRegistry& getRegistry() { return registry; }
	TransferEngine& getEngine() { return engine; }

	std::string getName() const;
	const std::string& getLocalIp() const { return local_ip; }
	int getControlPort() const { return control.getPort(); }
	bool isRunning() const { return is_running; }
};

/**
 * Outward-facing IPv4 address of this host
 * Reads the source address the kernel picks for a route to a public address,
 * then falls back to the hostname's address, then to 127.0.0.1.
 */
std::string resolveLocalIp();

/**
 * Splits "ip:port"
 * @return: false if the port is missing or not in 1..65535
 */
bool parseTarget(const std::string& target, std::string& ip, int& port);
