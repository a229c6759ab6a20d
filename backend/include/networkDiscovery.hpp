#pragma once

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <functional>
#include <chrono>
#include <condition_variable>
#include <netinet/in.h>
#include "protocol.hpp"
#include "peerRegistry.hpp"
#include "nodeConfig.hpp"

/**
 * NetworkDiscovery finds other nodes on the local network
 * Uses UDP broadcast (UDP because discovery needs no reliable delivery, and
 * TCP cannot broadcast). Two halves run on their own threads:
 *  - the announcer broadcasts this node's identity every interval
 *  - the listener turns announces from other nodes into registry entries
 */
class NetworkDiscovery {
private:
	PeerRegistry& registry;

	std::string node_name;
	mutable std::mutex name_mutex;
	std::string local_ip;
	int local_port;                    // Control port advertised in announces

	int discovery_port;
	std::string broadcast_address;
	std::chrono::milliseconds announce_interval;
	int burst_count;
	std::chrono::milliseconds burst_spacing;

	int announce_socket;               // UDP socket with SO_BROADCAST
	int listen_socket;                 // UDP socket bound to the discovery port
	int bound_port;

	std::atomic<bool> is_announcing;
	std::atomic<bool> is_listening;
	std::thread announce_thread;
	std::thread listen_thread;
	std::mutex lifecycle_mutex;
	std::mutex wait_mutex;
	std::condition_variable wait_cv;   // Cuts announce sleeps short on stop

	std::function<void(const PeerRecord&)> peer_found_callback;

	void announceLoop();
	void listenLoop();

	// Sleeps up to the given time; returns false if announcing was stopped meanwhile
	bool waitFor(std::chrono::milliseconds duration);

	// Destinations of one announce round
	std::vector<struct sockaddr_in> broadcastTargets() const;

public:
	/**
	 * @param registry: Membership table fed by the listener
	 * @param config: Discovery port, broadcast target and announce timing
	 * @param local_ip: This node's outward IP, advertised and used for self-filtering
	 * @param local_port: This node's control port, advertised and used for self-filtering
	 */
	NetworkDiscovery(PeerRegistry& registry, const NodeConfig& config,
	                 const std::string& local_ip, int local_port);
	~NetworkDiscovery();

	NetworkDiscovery(const NetworkDiscovery&) = delete;
	NetworkDiscovery& operator=(const NetworkDiscovery&) = delete;

	// Starts both halves
	bool start();

	// Stops both halves; safe to call repeatedly
	void stop();

	/**
	 * Binds the discovery port (address/port reuse enabled) and starts the
	 * listener thread
	 */
	bool startListening();
	void stopListening();

	// Starts the announcer: a short burst, then one announce per interval
	bool startAnnouncing();
	void stopAnnouncing();

	/**
	 * Sends one announce to every broadcast target
	 * @return: true if at least one datagram went out
	 */
	bool broadcastDiscovery();

	DiscoveryMessage buildAnnounce() const;

	/**
	 * Decodes one datagram and feeds it to handleAnnounce()
	 * Malformed and non-announce payloads are dropped silently.
	 * @return: true if the registry was updated
	 */
	bool handleDatagram(const std::string& payload);

	// Drops self-announces, upserts everything else
	bool handleAnnounce(const DiscoveryMessage& announce);

	void setName(const std::string& name);
	std::string getName() const;

	// Port the listener is bound to (differs from the configured one when that was 0)
	int getListenPort() const { return bound_port; }

	bool isListening() const { return is_listening; }
	bool isAnnouncing() const { return is_announcing; }

	// Called on the first sighting of a peer key
	void setPeerFoundCallback(std::function<void(const PeerRecord&)> callback) {
		peer_found_callback = callback;
	}
};

// OS name carried in the platform field, e.g. "Linux"
std::string platformName();
