#include "controlChannel.hpp"
#include <iostream>
#include <cstring>
#include <chrono>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

ControlChannel::ControlChannel(int port, int search_attempts)
	: control_socket(-1), requested_port(port), search_attempts(search_attempts), port(-1),
	  is_running(false) {}

ControlChannel::~ControlChannel() {
	stop();
}

bool ControlChannel::open() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (control_socket >= 0) return true;

	int attempts = requested_port == 0 ? 1 : search_attempts;
	for (int i = 0; i < attempts; i++) {
		int candidate = requested_port == 0 ? 0 : requested_port + i;
		if (candidate > 65535) break;

		int sock = socket(AF_INET, SOCK_DGRAM, 0);
		if (sock < 0) {
			std::cerr << "Failed to create control socket: " << strerror(errno) << std::endl;
			return false;
		}

		struct sockaddr_in addr;
		std::memset(&addr, 0, sizeof(addr));
		addr.sin_family = AF_INET;
		addr.sin_addr.s_addr = INADDR_ANY;
		addr.sin_port = htons(candidate);

		if (bind(sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
			int bind_errno = errno;
			close(sock);
			if (bind_errno == EADDRINUSE) {
				std::cout << "Port " << candidate << " is in use, trying " << candidate + 1 << std::endl;
				continue;
			}
			std::cerr << "Failed to bind control port " << candidate << ": " << strerror(bind_errno) << std::endl;
			return false;
		}

		socklen_t addr_len = sizeof(addr);
		getsockname(sock, (struct sockaddr*)&addr, &addr_len);
		port = ntohs(addr.sin_port);

		// 1 second receive timeout so the loop notices stop requests
		struct timeval timeout;
		timeout.tv_sec = 1;
		timeout.tv_usec = 0;
		setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

		std::lock_guard<std::mutex> socket_lock(socket_mutex);
		control_socket = sock;
		return true;
	}

	std::cerr << "No free control port in " << requested_port << ".."
	          << requested_port + search_attempts - 1 << std::endl;
	return false;
}

bool ControlChannel::start() {
	if (!open()) {
		return false;
	}

	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (is_running) return true;

	is_running = true;
	listen_thread = std::thread(&ControlChannel::listenLoop, this);

	std::cout << "Control channel listening on port " << port << std::endl;
	return true;
}

void ControlChannel::stop() {
	std::lock_guard<std::mutex> lock(lifecycle_mutex);
	if (is_running) {
		is_running = false;
		shutdown(control_socket, SHUT_RDWR);
		if (listen_thread.joinable()) {
			listen_thread.join();
		}
		std::cout << "Control channel stopped" << std::endl;
	}

	// Listener is joined, only senders can still hold the fd
	std::lock_guard<std::mutex> socket_lock(socket_mutex);
	if (control_socket >= 0) {
		close(control_socket);
		control_socket = -1;
	}
}

bool ControlChannel::sendTo(const std::string& ip, int target_port, const TransferMessage& msg) {
	struct sockaddr_in target;
	std::memset(&target, 0, sizeof(target));
	target.sin_family = AF_INET;
	target.sin_port = htons(target_port);
	if (inet_pton(AF_INET, ip.c_str(), &target.sin_addr) != 1) {
		std::cerr << "Invalid address: " << ip << std::endl;
		return false;
	}

	std::string payload;
	try {
		payload = msg.serialize();
	} catch (const ProtocolError& e) {
		std::cerr << "Refusing to send " << messageTypeName(msg.type()) << ": " << e.what() << std::endl;
		return false;
	}

	std::lock_guard<std::mutex> lock(socket_mutex);
	if (control_socket < 0) {
		std::cerr << "Control socket not open" << std::endl;
		return false;
	}

	ssize_t sent = sendto(control_socket, payload.data(), payload.size(), 0,
	                      (const struct sockaddr*)&target, sizeof(target));
	if (sent < 0) {
		std::cerr << "Failed to send " << messageTypeName(msg.type()) << " to " << ip << ":"
		          << target_port << ": " << strerror(errno) << std::endl;
		return false;
	}
	return true;
}

void ControlChannel::listenLoop() {
	char buffer[65536];

	while (is_running) {
		struct sockaddr_in sender_addr;
		socklen_t sender_len = sizeof(sender_addr);
		ssize_t received = recvfrom(control_socket, buffer, sizeof(buffer), 0,
		                            (struct sockaddr*)&sender_addr, &sender_len);

		if (received < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}
			if (!is_running) break;
			std::cerr << "Control receive error: " << strerror(errno) << std::endl;
			std::this_thread::sleep_for(std::chrono::seconds(1));
			continue;
		}
		if (received == 0) {
			continue;
		}

		char ip_str[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &(sender_addr.sin_addr), ip_str, INET_ADDRSTRLEN);

		try {
			dispatch(std::string(buffer, static_cast<size_t>(received)), ip_str, ntohs(sender_addr.sin_port));
		} catch (const std::exception& e) {
			// A failing handler must not take the listener down
			std::cerr << "Error handling control message from " << ip_str << ": " << e.what() << std::endl;
		}
	}
}

bool ControlChannel::dispatch(const std::string& payload, const std::string& source_ip, int source_port) {
	TransferMessage msg;
	try {
		msg = TransferMessage::deserialize(payload);
	} catch (const ProtocolError& e) {
		std::cerr << "Dropping malformed control message from " << source_ip << ": " << e.what() << std::endl;
		return false;
	}

	switch (msg.type()) {
		case MessageType::NODE_DISCOVERY:
			if (!announce_handler) return false;
			announce_handler(msg.as<DiscoveryMessage>());
			return true;

		case MessageType::SEND_OFFER:
			if (!offer_handler) return false;
			offer_handler(msg.as<SendOffer>(), source_ip, source_port);
			return true;

		case MessageType::RECEIVE_CONFIRM:
		case MessageType::RECEIVE_REJECT:
			if (!response_handler) return false;
			response_handler(msg, source_ip, source_port);
			return true;

		default:
			// Bulk-phase messages never travel over UDP
			std::cerr << "Unexpected " << messageTypeName(msg.type()) << " on control port from "
			          << source_ip << std::endl;
			return false;
	}
}
