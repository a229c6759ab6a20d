#include "networkDiscovery.hpp"
#include <iostream>
#include <cstring>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/utsname.h>
#include <net/if.h>       // For network interfaces
#include <ifaddrs.h>      // For getting network interface addresses
#include <unistd.h>

NetworkDiscovery::NetworkDiscovery(PeerRegistry& registry, const NodeConfig& config,
                                   const std::string& local_ip, int local_port)
	: registry(registry),
	  node_name(config.node_name),
	  local_ip(local_ip),
	  local_port(local_port),
	  discovery_port(config.discovery_port),
	  broadcast_address(config.broadcast_address),
	  announce_interval(config.announce_interval_ms),
	  burst_count(config.announce_burst_count),
	  burst_spacing(config.announce_burst_spacing_ms),
	  announce_socket(-1),
	  listen_socket(-1),
	  bound_port(-1),
	  is_announcing(false),
	  is_listening(false) {}

NetworkDiscovery::~NetworkDiscovery() {
	stop();
}

bool NetworkDiscovery::start() {
	if (!startListening()) {
		return false;
	}
	if (!startAnnouncing()) {
		stopListening();
		return false;
	}
	return true;
}

void NetworkDiscovery::stop() {
	stopAnnouncing();
	stopListening();
}

bool NetworkDiscovery::startListening() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (is_listening) return true;

	listen_socket = socket(AF_INET, SOCK_DGRAM, 0);
	if (listen_socket < 0) {
		std::cerr << "Failed to create discovery listen socket: " << strerror(errno) << std::endl;
		return false;
	}

	// Several nodes on one host all listen on the same discovery port
	int reuse = 1;
	setsockopt(listen_socket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
	setsockopt(listen_socket, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

	struct sockaddr_in listen_addr;
	std::memset(&listen_addr, 0, sizeof(listen_addr));
	listen_addr.sin_family = AF_INET;
	listen_addr.sin_addr.s_addr = INADDR_ANY;  // Listen on all interfaces
	listen_addr.sin_port = htons(discovery_port);

	if (bind(listen_socket, (struct sockaddr*)&listen_addr, sizeof(listen_addr)) < 0) {
		std::cerr << "Failed to bind discovery port " << discovery_port << ": " << strerror(errno) << std::endl;
		close(listen_socket);
		listen_socket = -1;
		return false;
	}

	socklen_t addr_len = sizeof(listen_addr);
	if (getsockname(listen_socket, (struct sockaddr*)&listen_addr, &addr_len) == 0) {
		bound_port = ntohs(listen_addr.sin_port);
	}

	// 1 second receive timeout so the loop notices stop requests
	struct timeval timeout;
	timeout.tv_sec = 1;
	timeout.tv_usec = 0;
	setsockopt(listen_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	is_listening = true;
	listen_thread = std::thread(&NetworkDiscovery::listenLoop, this);

	std::cout << "Discovery listener started on port " << bound_port << std::endl;
	return true;
}

void NetworkDiscovery::stopListening() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (!is_listening) return;

	is_listening = false;
	// Wakes a blocked recvfrom(); the 1s timeout covers platforms where it does not
	shutdown(listen_socket, SHUT_RDWR);

	if (listen_thread.joinable()) {
		listen_thread.join();
	}
	close(listen_socket);
	listen_socket = -1;

	std::cout << "Discovery listener stopped" << std::endl;
}

bool NetworkDiscovery::startAnnouncing() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (is_announcing) return true;

	announce_socket = socket(AF_INET, SOCK_DGRAM, 0);
	if (announce_socket < 0) {
		std::cerr << "Failed to create announce socket: " << strerror(errno) << std::endl;
		return false;
	}

	// SO_BROADCAST: Allows sending to broadcast addresses
	int broadcast_enable = 1;
	if (setsockopt(announce_socket, SOL_SOCKET, SO_BROADCAST,
	               &broadcast_enable, sizeof(broadcast_enable)) < 0) {
		std::cerr << "Failed to set broadcast option: " << strerror(errno) << std::endl;
		close(announce_socket);
		announce_socket = -1;
		return false;
	}

	{
		std::lock_guard<std::mutex> wait_lock(wait_mutex);
		is_announcing = true;
	}
	announce_thread = std::thread(&NetworkDiscovery::announceLoop, this);

	std::cout << "Announcer started, broadcasting to port " << discovery_port << std::endl;
	return true;
}

void NetworkDiscovery::stopAnnouncing() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (!is_announcing) return;

	{
		std::lock_guard<std::mutex> wait_lock(wait_mutex);
		is_announcing = false;
	}
	wait_cv.notify_all();

	if (announce_thread.joinable()) {
		announce_thread.join();
	}
	close(announce_socket);
	announce_socket = -1;

	std::cout << "Announcer stopped" << std::endl;
}

bool NetworkDiscovery::waitFor(std::chrono::milliseconds duration) {
	std::unique_lock<std::mutex> lock(wait_mutex);
	wait_cv.wait_for(lock, duration, [this]() { return !is_announcing; });
	return is_announcing;
}

void NetworkDiscovery::announceLoop() {
	// Burst right after start so peers notice us quickly
	for (int i = 0; i < burst_count && is_announcing; i++) {
		broadcastDiscovery();
		if (i + 1 < burst_count && !waitFor(burst_spacing)) {
			return;
		}
	}

	while (waitFor(announce_interval)) {
		broadcastDiscovery();
	}
}

std::vector<struct sockaddr_in> NetworkDiscovery::broadcastTargets() const {
	std::vector<struct sockaddr_in> targets;

	struct sockaddr_in target;
	std::memset(&target, 0, sizeof(target));
	target.sin_family = AF_INET;
	target.sin_port = htons(discovery_port);

	if (!broadcast_address.empty()) {
		if (inet_pton(AF_INET, broadcast_address.c_str(), &target.sin_addr) == 1) {
			targets.push_back(target);
		} else {
			std::cerr << "Invalid broadcast address: " << broadcast_address << std::endl;
		}
		return targets;
	}

	// One directed broadcast per IPv4 interface
	struct ifaddrs* interfaces = nullptr;
	if (getifaddrs(&interfaces) == 0) {
		for (struct ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
			if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET || !ifa->ifa_netmask) {
				continue;
			}
			if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP)) {
				continue;
			}

			// Calculate broadcast address for this interface
			struct sockaddr_in* addr = (struct sockaddr_in*)ifa->ifa_addr;
			struct sockaddr_in* netmask = (struct sockaddr_in*)ifa->ifa_netmask;
			uint32_t ip = ntohl(addr->sin_addr.s_addr);
			uint32_t mask = ntohl(netmask->sin_addr.s_addr);
			target.sin_addr.s_addr = htonl(ip | ~mask);
			targets.push_back(target);
		}
		freeifaddrs(interfaces);
	}

	if (targets.empty()) {
		target.sin_addr.s_addr = htonl(INADDR_BROADCAST);  // 255.255.255.255
		targets.push_back(target);
	}
	return targets;
}

DiscoveryMessage NetworkDiscovery::buildAnnounce() const {
	DiscoveryMessage announce;
	announce.name = getName();
	announce.ip = local_ip;
	announce.port = local_port;
	announce.platform = platformName();
	announce.timestamp = unixTimestamp();
	return announce;
}

bool NetworkDiscovery::broadcastDiscovery() {
	if (announce_socket < 0) {
		std::cerr << "Announce socket not initialized" << std::endl;
		return false;
	}

	std::string message;
	try {
		message = TransferMessage{buildAnnounce()}.serialize();
	} catch (const ProtocolError& e) {
		std::cerr << "Cannot build announce: " << e.what() << std::endl;
		return false;
	}

	bool any_sent = false;
	for (const auto& target : broadcastTargets()) {
		ssize_t sent = sendto(announce_socket, message.data(), message.size(), 0,
		                      (const struct sockaddr*)&target, sizeof(target));
		if (sent < 0) {
			char ip_str[INET_ADDRSTRLEN];
			inet_ntop(AF_INET, &target.sin_addr, ip_str, INET_ADDRSTRLEN);
			std::cerr << "Failed to send announce to " << ip_str << ": " << strerror(errno) << std::endl;
			continue;
		}
		any_sent = true;
	}
	return any_sent;
}

void NetworkDiscovery::listenLoop() {
	char buffer[4096];

	while (is_listening) {
		struct sockaddr_in sender_addr;
		socklen_t sender_len = sizeof(sender_addr);
		ssize_t received = recvfrom(listen_socket, buffer, sizeof(buffer), 0,
		                            (struct sockaddr*)&sender_addr, &sender_len);

		if (received < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}
			if (!is_listening) break;
			std::cerr << "Discovery receive error: " << strerror(errno) << std::endl;
			std::this_thread::sleep_for(std::chrono::seconds(1));
			continue;
		}
		if (received == 0) {
			continue;
		}

		handleDatagram(std::string(buffer, static_cast<size_t>(received)));
	}
}

bool NetworkDiscovery::handleDatagram(const std::string& payload) {
	try {
		TransferMessage msg = TransferMessage::deserialize(payload);
		if (!msg.is<DiscoveryMessage>()) {
			return false;
		}
		return handleAnnounce(msg.as<DiscoveryMessage>());
	} catch (const ProtocolError&) {
		// Not one of ours, ignore
		return false;
	}
}

bool NetworkDiscovery::handleAnnounce(const DiscoveryMessage& announce) {
	if (announce.ip == local_ip && announce.port == local_port) {
		return false;
	}

	PeerRecord record;
	record.name = announce.name;
	record.ip = announce.ip;
	record.port = announce.port;
	record.platform = announce.platform;
	record.timestamp = announce.timestamp;

	if (registry.upsert(record)) {
		std::cout << "Discovered peer: " << record.name << " at " << record.key()
		          << " (" << record.platform << ")" << std::endl;
		if (peer_found_callback) {
			peer_found_callback(record);
		}
	}
	return true;
}

void NetworkDiscovery::setName(const std::string& name) {
	std::lock_guard<std::mutex> lock(name_mutex);
	node_name = name;
}

std::string NetworkDiscovery::getName() const {
	std::lock_guard<std::mutex> lock(name_mutex);
	return node_name;
}

std::string platformName() {
	struct utsname info;
	if (uname(&info) == 0) {
		return info.sysname;
	}
	return "Unknown";
}
