#pragma once

#include <string>
#include <thread>
#include <mutex>
#include <atomic>
#include <functional>
#include "protocol.hpp"

/**
 * ControlChannel owns this node's UDP control (business) port
 * Every inbound control datagram is decoded once here and handed to the
 * matching handler: announces to discovery, offers to the receiving side of
 * the transfer engine, confirm/reject to the sending side. Outbound offers
 * and replies leave from the same socket, so peers see one address per node.
 *
 * Handlers must be installed before start().
 */
class ControlChannel {
private:
	int control_socket;
	int requested_port;
	int search_attempts;
	int port;                           // Port actually bound

	std::atomic<bool> is_running;
	std::thread listen_thread;
	std::mutex lifecycle_mutex;
	std::mutex socket_mutex;            // Guards control_socket between sendTo() and close

	std::function<void(const DiscoveryMessage&)> announce_handler;
	std::function<void(const SendOffer&, const std::string& ip, int port)> offer_handler;
	std::function<void(const TransferMessage&, const std::string& ip, int port)> response_handler;

	void listenLoop();

public:
	/**
	 * @param port: Preferred control port; 0 lets the kernel choose
	 * @param search_attempts: Ports tried upward from port when it is taken (default: 100)
	 */
	explicit ControlChannel(int port = 12000, int search_attempts = 100);
	~ControlChannel();

	ControlChannel(const ControlChannel&) = delete;
	ControlChannel& operator=(const ControlChannel&) = delete;

	/**
	 * Binds the first free port starting at the preferred one
	 * @return: false if no port in the search range could be bound
	 */
	bool open();

	// Opens if needed and starts the listener thread
	bool start();

	// Stops the listener and closes the socket; safe to call repeatedly
	void stop();

	/**
	 * Sends one control message to ip:port from the control socket
	 * Safe to call from any thread, also while stop() runs.
	 * @return: true if the datagram was handed to the kernel; false once the
	 *          socket is closed or the message cannot be encoded
	 */
	bool sendTo(const std::string& ip, int port, const TransferMessage& msg);

	/**
	 * Decodes a datagram and routes it; malformed or unexpected messages are dropped
	 * @return: true if a handler took the message
	 */
	bool dispatch(const std::string& payload, const std::string& source_ip, int source_port);

	int getPort() const { return port; }
	bool isRunning() const { return is_running; }

	void setAnnounceHandler(std::function<void(const DiscoveryMessage&)> handler) {
		announce_handler = handler;
	}

	void setOfferHandler(std::function<void(const SendOffer&, const std::string&, int)> handler) {
		offer_handler = handler;
	}

	void setResponseHandler(std::function<void(const TransferMessage&, const std::string&, int)> handler) {
		response_handler = handler;
	}
};
