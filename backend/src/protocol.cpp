#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <memory>

using json = nlohmann::json;

namespace {

const char* const kTypeNames[] = {
	"NODE_DISCOVERY",
	"SEND_OFFER",
	"RECEIVE_CONFIRM",
	"RECEIVE_REJECT",
	"FILE_META",
	"TRANSFER_COMPLETE",
	"ACK",
	"ERR",
};

MessageType parseType(const std::string& type_str) {
	for (size_t i = 0; i < sizeof(kTypeNames) / sizeof(kTypeNames[0]); ++i) {
		if (type_str == kTypeNames[i]) {
			return static_cast<MessageType>(i);
		}
	}
	throw ProtocolError("unknown message type: " + type_str);
}

std::string requireString(const json& j, const char* field) {
	if (!j.contains(field) || !j[field].is_string()) {
		throw ProtocolError(std::string("missing or non-string field: ") + field);
	}
	return j[field].get<std::string>();
}

uint64_t requireUnsigned(const json& j, const char* field) {
	if (!j.contains(field) || !j[field].is_number_unsigned()) {
		throw ProtocolError(std::string("missing or non-unsigned field: ") + field);
	}
	return j[field].get<uint64_t>();
}

int requirePort(const json& j, const char* field) {
	uint64_t port = requireUnsigned(j, field);
	if (port == 0 || port > 65535) {
		throw ProtocolError(std::string("port out of range: ") + field);
	}
	return static_cast<int>(port);
}

// Timestamps travel as decimal strings; integer timestamps are accepted too
int64_t requireTimestamp(const json& j) {
	if (!j.contains("timestamp")) {
		throw ProtocolError("missing field: timestamp");
	}
	const json& ts = j["timestamp"];
	if (ts.is_number_integer()) {
		return ts.get<int64_t>();
	}
	if (ts.is_string()) {
		const std::string s = ts.get<std::string>();
		try {
			size_t used = 0;
			int64_t value = std::stoll(s, &used);
			if (used == s.size()) {
				return value;
			}
		} catch (const std::exception&) {
		}
		throw ProtocolError("malformed timestamp: " + s);
	}
	throw ProtocolError("malformed timestamp");
}

bool isMd5Hex(const std::string& md5) {
	if (md5.size() != 32) return false;
	for (char c : md5) {
		if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
	}
	return true;
}

// Case is kept as sent so a decoded message equals the encoded one
std::string requireMd5(const json& j) {
	std::string md5 = requireString(j, "file_md5");
	if (!isMd5Hex(md5)) {
		throw ProtocolError("file_md5 must be 32 hex digits");
	}
	return md5;
}

void checkPort(int port, const char* field) {
	if (port <= 0 || port > 65535) {
		throw ProtocolError(std::string("port out of range: ") + field);
	}
}

void checkMd5(const std::string& md5) {
	if (!isMd5Hex(md5)) {
		throw ProtocolError("file_md5 must be 32 hex digits");
	}
}

// Encoding refuses every value the decoder would refuse
struct Encoder {
	json& j;

	void operator()(const DiscoveryMessage& m) const {
		if (m.ip.empty()) {
			throw ProtocolError("empty ip in NODE_DISCOVERY");
		}
		checkPort(m.port, "port");
		j["name"] = m.name;
		j["ip"] = m.ip;
		j["port"] = m.port;
		j["platform"] = m.platform;
		j["timestamp"] = std::to_string(m.timestamp);
	}
	void operator()(const SendOffer& m) const {
		if (m.sender_ip.empty() || m.file_name.empty()) {
			throw ProtocolError("incomplete SEND_OFFER");
		}
		checkPort(m.sender_port, "sender_port");
		checkMd5(m.file_md5);
		j["sender_ip"] = m.sender_ip;
		j["sender_port"] = m.sender_port;
		j["file_name"] = m.file_name;
		j["file_size"] = m.file_size;
		j["file_md5"] = m.file_md5;
		j["timestamp"] = std::to_string(m.timestamp);
	}
	void operator()(const ReceiveConfirm& m) const {
		checkPort(m.tcp_port, "tcp_port");
		j["timestamp"] = std::to_string(m.timestamp);
		j["tcp_port"] = m.tcp_port;
	}
	void operator()(const ReceiveReject& m) const {
		j["timestamp"] = std::to_string(m.timestamp);
	}
	void operator()(const FileMeta& m) const {
		if (m.block_size == 0) {
			throw ProtocolError("block_size out of range");
		}
		j["file_name"] = m.file_name;
		j["total_blocks"] = m.total_blocks;
		j["block_size"] = m.block_size;
	}
	void operator()(const TransferComplete& m) const {
		checkMd5(m.file_md5);
		j["file_md5"] = m.file_md5;
		j["timestamp"] = std::to_string(m.timestamp);
	}
	void operator()(const AckMessage& m) const {
		j["block_number"] = m.block_number;
	}
	void operator()(const ErrorMessage& m) const {
		j["error"] = m.error;
		j["timestamp"] = std::to_string(m.timestamp);
	}
};

} // namespace

const char* messageTypeName(MessageType type) {
	return kTypeNames[static_cast<size_t>(type)];
}

MessageType TransferMessage::type() const {
	// variant alternatives are declared in MessageType order
	return static_cast<MessageType>(body.index());
}

/**
 * Serialize a TransferMessage to a JSON string for network transmission
 * Only the fields of the active alternative are written
 * Throws ProtocolError for a value deserialize() would reject
 */
std::string TransferMessage::serialize() const {
	json j;
	j["type"] = messageTypeName(type());
	std::visit(Encoder{j}, body);
	return j.dump();
}

/**
 * Deserialize a JSON string back to a TransferMessage
 * The type tag selects exactly one alternative; anything else is a ProtocolError
 */
TransferMessage TransferMessage::deserialize(const std::string& jsonStr) {
	json j;
	try {
		j = json::parse(jsonStr);
	} catch (const json::exception& e) {
		throw ProtocolError(std::string("invalid JSON: ") + e.what());
	}
	if (!j.is_object()) {
		throw ProtocolError("message is not a JSON object");
	}

	TransferMessage msg;
	try {
		switch (parseType(requireString(j, "type"))) {
			case MessageType::NODE_DISCOVERY: {
				DiscoveryMessage m;
				m.name = requireString(j, "name");
				m.ip = requireString(j, "ip");
				m.port = requirePort(j, "port");
				m.platform = j.contains("platform") && j["platform"].is_string()
					? j["platform"].get<std::string>() : "Unknown";
				m.timestamp = requireTimestamp(j);
				if (m.ip.empty()) {
					throw ProtocolError("empty ip in NODE_DISCOVERY");
				}
				msg.body = m;
				break;
			}

			case MessageType::SEND_OFFER: {
				SendOffer m;
				m.sender_ip = requireString(j, "sender_ip");
				m.sender_port = requirePort(j, "sender_port");
				m.file_name = requireString(j, "file_name");
				m.file_size = requireUnsigned(j, "file_size");
				m.file_md5 = requireMd5(j);
				m.timestamp = requireTimestamp(j);
				if (m.sender_ip.empty() || m.file_name.empty()) {
					throw ProtocolError("incomplete SEND_OFFER");
				}
				msg.body = m;
				break;
			}

			case MessageType::RECEIVE_CONFIRM: {
				ReceiveConfirm m;
				m.timestamp = requireTimestamp(j);
				m.tcp_port = requirePort(j, "tcp_port");
				msg.body = m;
				break;
			}

			case MessageType::RECEIVE_REJECT: {
				ReceiveReject m;
				m.timestamp = requireTimestamp(j);
				msg.body = m;
				break;
			}

			case MessageType::FILE_META: {
				FileMeta m;
				m.file_name = requireString(j, "file_name");
				m.total_blocks = requireUnsigned(j, "total_blocks");
				uint64_t block_size = requireUnsigned(j, "block_size");
				if (block_size == 0 || block_size > 0xFFFFFFFFull) {
					throw ProtocolError("block_size out of range");
				}
				m.block_size = static_cast<uint32_t>(block_size);
				msg.body = m;
				break;
			}

			case MessageType::TRANSFER_COMPLETE: {
				TransferComplete m;
				m.file_md5 = requireMd5(j);
				m.timestamp = requireTimestamp(j);
				msg.body = m;
				break;
			}

			case MessageType::ACK: {
				AckMessage m;
				m.block_number = requireUnsigned(j, "block_number");
				msg.body = m;
				break;
			}

			case MessageType::ERR: {
				ErrorMessage m;
				m.error = requireString(j, "error");
				m.timestamp = requireTimestamp(j);
				msg.body = m;
				break;
			}
		}
	} catch (const json::exception& e) {
		throw ProtocolError(std::string("malformed message: ") + e.what());
	}

	return msg;
}

int64_t unixTimestamp() {
	return std::chrono::duration_cast<std::chrono::seconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

uint64_t blockCount(uint64_t file_size, uint32_t block_size) {
	return (file_size + block_size - 1) / block_size;
}

void appendLengthPrefix(std::string& out, uint32_t length) {
	out.push_back(static_cast<char>((length >> 24) & 0xFF));
	out.push_back(static_cast<char>((length >> 16) & 0xFF));
	out.push_back(static_cast<char>((length >> 8) & 0xFF));
	out.push_back(static_cast<char>(length & 0xFF));
}

uint32_t readLengthPrefix(const unsigned char* bytes) {
	return (static_cast<uint32_t>(bytes[0]) << 24) |
	       (static_cast<uint32_t>(bytes[1]) << 16) |
	       (static_cast<uint32_t>(bytes[2]) << 8) |
	       static_cast<uint32_t>(bytes[3]);
}

/**
 * Calculate the MD5 checksum of a file
 * Reads in 4 KiB pieces so memory stays bounded for any file size
 */
std::string calculateChecksum(const std::string& filepath) {
	std::ifstream file(filepath, std::ios::binary);
	if (!file.is_open()) {
		return "";
	}

	std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
	if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
		return "";
	}

	char buffer[4096];
	while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
		if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
			return "";
		}
	}
	if (file.bad()) {
		return "";
	}

	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_len = 0;
	if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
		return "";
	}

	static const char hex[] = "0123456789abcdef";
	std::string result;
	result.reserve(digest_len * 2);
	for (unsigned int i = 0; i < digest_len; ++i) {
		result.push_back(hex[digest[i] >> 4]);
		result.push_back(hex[digest[i] & 0x0F]);
	}
	return result;
}

bool sameDigest(const std::string& a, const std::string& b) {
	if (a.size() != b.size()) return false;
	for (size_t i = 0; i < a.size(); ++i) {
		if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
			return false;
		}
	}
	return true;
}

std::string formatFileSize(uint64_t size_bytes) {
	char buf[32];
	if (size_bytes < 1024) {
		std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(size_bytes));
	} else if (size_bytes < 1024ull * 1024) {
		std::snprintf(buf, sizeof(buf), "%.1f KB", size_bytes / 1024.0);
	} else if (size_bytes < 1024ull * 1024 * 1024) {
		std::snprintf(buf, sizeof(buf), "%.1f MB", size_bytes / (1024.0 * 1024));
	} else {
		std::snprintf(buf, sizeof(buf), "%.1f GB", size_bytes / (1024.0 * 1024 * 1024));
	}
	return buf;
}
