#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include "protocol.hpp"

// Terminal reasons reported through TransferCallback
namespace transfer_reason {
constexpr const char* COMPLETED = "completed";
constexpr const char* REJECTED = "rejected";
constexpr const char* TIMEOUT = "timeout";
constexpr const char* HASH_MISMATCH = "hash mismatch";
constexpr const char* FAILED_PREFIX = "transfer failed: ";
}

/**
 * Final result of one transfer, delivered exactly once
 */
struct TransferOutcome {
	bool success = false;
	std::string reason;      // One of transfer_reason, or "transfer failed: <cause>"
	std::string path;        // Sender: source file. Receiver: final destination (on success)
	uint64_t bytes = 0;      // Bytes moved over the bulk connection

	static TransferOutcome completed(const std::string& path, uint64_t bytes) {
		return TransferOutcome{true, transfer_reason::COMPLETED, path, bytes};
	}
	static TransferOutcome failed(const std::string& reason, const std::string& path = "") {
		return TransferOutcome{false, reason, path, 0};
	}
};

using TransferCallback = std::function<void(const TransferOutcome&)>;

/**
 * A decoded SEND_OFFER as seen by the receiving node
 */
struct IncomingOffer {
	SendOffer offer;
	std::string source_ip;   // Address the datagram actually came from
	int source_port = 0;

	std::string senderKey() const { return offer.sender_ip + ":" + std::to_string(offer.sender_port); }
};

// Returns true to accept the offer; may block until someone decides
using DecisionProvider = std::function<bool(const IncomingOffer&)>;
