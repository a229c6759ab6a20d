#include "p2pNode.hpp"
#include <iostream>
#include <sstream>
#include <cstring>
#include <thread>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>

std::string resolveLocalIp() {
	// connect() on a UDP socket sends nothing, it only picks the route
	int sock = socket(AF_INET, SOCK_DGRAM, 0);
	if (sock >= 0) {
		struct sockaddr_in remote;
		std::memset(&remote, 0, sizeof(remote));
		remote.sin_family = AF_INET;
		remote.sin_port = htons(80);
		inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

		if (connect(sock, (struct sockaddr*)&remote, sizeof(remote)) == 0) {
			struct sockaddr_in local;
			socklen_t len = sizeof(local);
			if (getsockname(sock, (struct sockaddr*)&local, &len) == 0) {
				char ip_str[INET_ADDRSTRLEN];
				inet_ntop(AF_INET, &local.sin_addr, ip_str, INET_ADDRSTRLEN);
				close(sock);
				return ip_str;
			}
		}
		close(sock);
	}

	char hostname[256];
	if (gethostname(hostname, sizeof(hostname)) == 0) {
		hostname[sizeof(hostname) - 1] = '\0';

		struct addrinfo hints;
		std::memset(&hints, 0, sizeof(hints));
		hints.ai_family = AF_INET;
		struct addrinfo* result = nullptr;
		if (getaddrinfo(hostname, nullptr, &hints, &result) == 0 && result) {
			char ip_str[INET_ADDRSTRLEN];
			auto* addr = (struct sockaddr_in*)result->ai_addr;
			inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN);
			freeaddrinfo(result);
			return ip_str;
		}
	}

	std::cerr << "Could not determine local IP, using 127.0.0.1" << std::endl;
	return "127.0.0.1";
}

bool parseTarget(const std::string& target, std::string& ip, int& port) {
	auto colon = target.rfind(':');
	if (colon == std::string::npos || colon == 0 || colon + 1 >= target.size()) {
		return false;
	}

	try {
		size_t consumed = 0;
		int parsed = std::stoi(target.substr(colon + 1), &consumed);
		if (consumed != target.size() - colon - 1 || parsed <= 0 || parsed > 65535) {
			return false;
		}
		ip = target.substr(0, colon);
		port = parsed;
		return true;
	} catch (const std::exception&) {
		return false;
	}
}

P2PNode::P2PNode(const NodeConfig& config)
	: config(config),
	  local_ip(config.local_ip.empty() ? resolveLocalIp() : config.local_ip),
	  control(config.control_port, config.port_search_attempts),
	  registry(std::chrono::seconds(config.peer_ttl_sec), std::chrono::seconds(config.sweep_interval_sec)),
	  offers(std::chrono::seconds(config.offer_timeout_sec)),
	  engine(control, config, local_ip),
	  is_running(false) {
	engine.setDecisionProvider(offers.provider());
}

P2PNode::~P2PNode() {
	stop();
}

std::string P2PNode::scanForName() {
	std::cout << "Scanning for peers for " << config.startup_scan_ms << " ms..." << std::endl;

	if (discovery->startListening()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(config.startup_scan_ms));
		discovery->stopListening();
	}
	return generateUniqueNodeName(registry);
}

bool P2PNode::start() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (is_running) return true;
	if (discovery) {
		std::cerr << "Node was already stopped and cannot be restarted" << std::endl;
		return false;
	}

	if (!control.open()) {
		return false;
	}

	discovery = std::make_unique<NetworkDiscovery>(registry, config, local_ip, control.getPort());
	control.setAnnounceHandler([this](const DiscoveryMessage& announce) {
		discovery->handleAnnounce(announce);
	});
	discovery->setPeerFoundCallback([](const PeerRecord& peer) {
		std::cout << "Found peer: " << peer.name << " (" << peer.key() << ", " << peer.platform << ")" << std::endl;
	});

	if (config.node_name.empty()) {
		if (config.startup_scan_ms > 0) {
			discovery->setName(scanForName());
		} else {
			discovery->setName(generateUniqueNodeName(registry));
		}
	}

	registry.start();
	if (!control.start()) {
		registry.stop();
		return false;
	}
	if (!discovery->start()) {
		control.stop();
		registry.stop();
		return false;
	}

	start_time = std::chrono::steady_clock::now();
	is_running = true;
	std::cout << "Node " << discovery->getName() << " running at " << local_ip << ":" << control.getPort() << std::endl;
	return true;
}

void P2PNode::stop() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (!is_running) {
		// Never started: workers may still exist from direct engine use
		offers.close();
		engine.stop();
		return;
	}
	is_running = false;

	std::cout << "Stopping node..." << std::endl;
	discovery->stop();
	// Unblocks receive workers still waiting for a decision
	offers.close();
	// Workers reply through the control socket, close it only after they are gone
	engine.stop();
	control.stop();
	registry.stop();
	std::cout << "Node stopped" << std::endl;
}

std::vector<PeerRecord> P2PNode::listPeers() const {
	return registry.all();
}

bool P2PNode::sendFile(const std::string& target, const std::string& file_path, TransferCallback callback) {
	std::string ip;
	int port = 0;
	if (!parseTarget(target, ip, port)) {
		std::cerr << "Invalid target, expected ip:port: " << target << std::endl;
		return false;
	}
	return sendFile(ip, port, file_path, callback);
}

bool P2PNode::sendFile(const std::string& ip, int port, const std::string& file_path, TransferCallback callback) {
	if (!is_running) {
		std::cerr << "Node is not running" << std::endl;
		return false;
	}
	return engine.sendOffer(ip, port, file_path, callback);
}

std::string P2PNode::getName() const {
	if (discovery) {
		return discovery->getName();
	}
	return config.node_name;
}

std::chrono::seconds P2PNode::uptime() const {
	if (!is_running) {
		return std::chrono::seconds(0);
	}
	return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time);
}

std::string P2PNode::info() const {
	std::ostringstream out;
	out << "Name:           " << getName() << "\n"
	    << "Address:        " << local_ip << ":" << control.getPort() << "\n"
	    << "Platform:       " << platformName() << "\n"
	    << "Discovery port: " << config.discovery_port << "\n"
	    << "Downloads:      " << config.download_dir << "\n"
	    << "Known peers:    " << registry.count() << "\n"
	    << "Uptime:         " << uptime().count() << "s";
	return out.str();
}
