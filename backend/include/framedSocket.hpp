#pragma once

#include <string>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include "protocol.hpp"

/**
 * Raised when a bulk-phase connection cannot carry on: peer closed,
 * short read, socket error, idle limit reached, or the owner stopped
 */
class TransferError : public std::runtime_error {
public:
	explicit TransferError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Blocking helpers for the length-prefixed TCP stream
 * Every read/write uses the socket's 1 second timeout and retries until
 * idle_timeout_sec seconds pass without progress, so a cleared running flag
 * is noticed within a second.
 */
struct StreamLimits {
	int idle_timeout_sec = 10;
	const std::atomic<bool>* running = nullptr;   // Optional: abort when it turns false
};

// Applies the 1 second per-call send/receive timeouts used by the helpers below
void setStreamTimeouts(int fd);

void sendAll(int fd, const char* data, size_t length, const StreamLimits& limits);

// Length prefix followed by the payload
void sendFrame(int fd, const std::string& payload, const StreamLimits& limits);
void sendFrame(int fd, const char* data, uint32_t length, const StreamLimits& limits);

void sendMessage(int fd, const TransferMessage& msg, const StreamLimits& limits);

void recvExact(int fd, char* buffer, size_t length, const StreamLimits& limits);

/**
 * Reads one frame into buffer
 * @param max_length: Frames announcing more than this are rejected
 * @return: payload length
 */
uint32_t recvFrame(int fd, std::string& buffer, uint32_t max_length, const StreamLimits& limits);

// Reads one frame and decodes it; ProtocolError on a malformed payload
TransferMessage recvMessage(int fd, const StreamLimits& limits);
