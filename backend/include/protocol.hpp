//this header file defines the structure of the messages exchanged between nodes
#pragma once
#include <string>
#include <cstdint>
#include <stdexcept>
#include <variant>
#include <vector>

// Fixed size of one bulk-phase data chunk (64 KiB)
constexpr uint32_t BLOCK_SIZE = 64 * 1024;

// Largest control message (meta / complete / ack / err) accepted from a stream
constexpr uint32_t MAX_CONTROL_FRAME = 1024 * 1024;

enum class MessageType {
	NODE_DISCOVERY,
	SEND_OFFER,
	RECEIVE_CONFIRM,
	RECEIVE_REJECT,
	FILE_META,
	TRANSFER_COMPLETE,
	ACK,
	ERR
};

/**
 * Thrown when a buffer cannot be turned into a TransferMessage:
 * not JSON, unknown type tag, missing or mistyped field
 */
class ProtocolError : public std::runtime_error {
public:
	explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// Periodic announce broadcast on the discovery port
struct DiscoveryMessage {
	std::string name;
	std::string ip;
	int port = 0;
	std::string platform;
	int64_t timestamp = 0;

	bool operator==(const DiscoveryMessage& o) const {
		return name == o.name && ip == o.ip && port == o.port &&
		       platform == o.platform && timestamp == o.timestamp;
	}
};

// Sender -> receiver control port: "may I send you this file?"
struct SendOffer {
	std::string sender_ip;
	int sender_port = 0;
	std::string file_name;
	uint64_t file_size = 0;
	std::string file_md5;
	int64_t timestamp = 0;

	bool operator==(const SendOffer& o) const {
		return sender_ip == o.sender_ip && sender_port == o.sender_port &&
		       file_name == o.file_name && file_size == o.file_size &&
		       file_md5 == o.file_md5 && timestamp == o.timestamp;
	}
};

// Receiver accepted; tcp_port is where the receiver is waiting for the bulk connection
struct ReceiveConfirm {
	int64_t timestamp = 0;
	int tcp_port = 0;

	bool operator==(const ReceiveConfirm& o) const {
		return timestamp == o.timestamp && tcp_port == o.tcp_port;
	}
};

struct ReceiveReject {
	int64_t timestamp = 0;

	bool operator==(const ReceiveReject& o) const { return timestamp == o.timestamp; }
};

// First frame on the bulk connection
struct FileMeta {
	std::string file_name;
	uint64_t total_blocks = 0;
	uint32_t block_size = BLOCK_SIZE;

	bool operator==(const FileMeta& o) const {
		return file_name == o.file_name && total_blocks == o.total_blocks &&
		       block_size == o.block_size;
	}
};

// Last sender frame on the bulk connection
struct TransferComplete {
	std::string file_md5;
	int64_t timestamp = 0;

	bool operator==(const TransferComplete& o) const {
		return file_md5 == o.file_md5 && timestamp == o.timestamp;
	}
};

struct AckMessage {
	uint64_t block_number = 0;

	bool operator==(const AckMessage& o) const { return block_number == o.block_number; }
};

struct ErrorMessage {
	std::string error;
	int64_t timestamp = 0;

	bool operator==(const ErrorMessage& o) const {
		return error == o.error && timestamp == o.timestamp;
	}
};

using MessageBody = std::variant<DiscoveryMessage, SendOffer, ReceiveConfirm, ReceiveReject,
                                 FileMeta, TransferComplete, AckMessage, ErrorMessage>;

struct TransferMessage {
	MessageBody body;

	MessageType type() const;

	template <typename T>
	bool is() const { return std::holds_alternative<T>(body); }

	template <typename T>
	const T& as() const { return std::get<T>(body); }

	std::string serialize() const;
	static TransferMessage deserialize(const std::string& jsonStr);

	bool operator==(const TransferMessage& o) const { return body == o.body; }
};

const char* messageTypeName(MessageType type);

// Current wall clock in Unix seconds, as carried in the timestamp fields
int64_t unixTimestamp();

// Number of BLOCK_SIZE chunks needed for a file of the given size
uint64_t blockCount(uint64_t file_size, uint32_t block_size = BLOCK_SIZE);

/**
 * 4-byte big-endian length prefix used in front of every bulk-phase frame
 */
void appendLengthPrefix(std::string& out, uint32_t length);
uint32_t readLengthPrefix(const unsigned char* bytes);

/**
 * Streaming MD5 of a file, as 32 lowercase hex digits
 * @return: empty string if the file cannot be read
 */
std::string calculateChecksum(const std::string& filepath);

// Hex digests compared without regard to case
bool sameDigest(const std::string& a, const std::string& b);

// Human readable size, e.g. "1.5 MB"
std::string formatFileSize(uint64_t size_bytes);
