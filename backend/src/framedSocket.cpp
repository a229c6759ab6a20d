#include "framedSocket.hpp"
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>

namespace {

// Called after a timed-out call; throws once the stream has been idle too long
void checkIdle(int& idle_seconds, const StreamLimits& limits, const char* what) {
	if (limits.running && !*limits.running) {
		throw TransferError("stopped");
	}
	if (++idle_seconds >= limits.idle_timeout_sec) {
		throw TransferError(std::string(what) + " timed out");
	}
}

} // namespace

void setStreamTimeouts(int fd) {
	struct timeval timeout;
	timeout.tv_sec = 1;
	timeout.tv_usec = 0;
	setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
	setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
}

void sendAll(int fd, const char* data, size_t length, const StreamLimits& limits) {
	size_t total_sent = 0;
	int idle_seconds = 0;

	while (total_sent < length) {
		if (limits.running && !*limits.running) {
			throw TransferError("stopped");
		}

		// MSG_NOSIGNAL: a peer that hung up must not raise SIGPIPE
		ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);
		if (sent < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK) {
				checkIdle(idle_seconds, limits, "send");
				continue;
			}
			throw TransferError(std::string("send failed: ") + strerror(errno));
		}

		total_sent += static_cast<size_t>(sent);
		idle_seconds = 0;
	}
}

void sendFrame(int fd, const char* data, uint32_t length, const StreamLimits& limits) {
	std::string prefix;
	appendLengthPrefix(prefix, length);
	sendAll(fd, prefix.data(), prefix.size(), limits);
	sendAll(fd, data, length, limits);
}

void sendFrame(int fd, const std::string& payload, const StreamLimits& limits) {
	sendFrame(fd, payload.data(), static_cast<uint32_t>(payload.size()), limits);
}

void sendMessage(int fd, const TransferMessage& msg, const StreamLimits& limits) {
	sendFrame(fd, msg.serialize(), limits);
}

void recvExact(int fd, char* buffer, size_t length, const StreamLimits& limits) {
	size_t total_received = 0;
	int idle_seconds = 0;

	while (total_received < length) {
		if (limits.running && !*limits.running) {
			throw TransferError("stopped");
		}

		ssize_t received = recv(fd, buffer + total_received, length - total_received, 0);
		if (received < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK) {
				checkIdle(idle_seconds, limits, "receive");
				continue;
			}
			throw TransferError(std::string("receive failed: ") + strerror(errno));
		}

		if (received == 0) {
			throw TransferError("connection closed by peer");
		}

		total_received += static_cast<size_t>(received);
		idle_seconds = 0;
	}
}

uint32_t recvFrame(int fd, std::string& buffer, uint32_t max_length, const StreamLimits& limits) {
	unsigned char prefix[4];
	recvExact(fd, reinterpret_cast<char*>(prefix), sizeof(prefix), limits);

	uint32_t length = readLengthPrefix(prefix);
	if (length > max_length) {
		throw TransferError("frame of " + std::to_string(length) + " bytes exceeds limit of " +
		                    std::to_string(max_length));
	}

	buffer.resize(length);
	if (length > 0) {
		recvExact(fd, &buffer[0], length, limits);
	}
	return length;
}

TransferMessage recvMessage(int fd, const StreamLimits& limits) {
	std::string payload;
	recvFrame(fd, payload, MAX_CONTROL_FRAME, limits);
	return TransferMessage::deserialize(payload);
}
