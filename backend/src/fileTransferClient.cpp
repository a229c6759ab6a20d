#include "fileTransferClient.hpp"
#include <iostream>
#include <fstream>
#include <cstring>
#include <thread>
#include <chrono>
#include <vector>
#include <algorithm>
#include <sys/socket.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace {

// The receiver hashes the whole file before answering, allow it more than one idle period
constexpr int VERIFY_TIMEOUT_SEC = 30;

}

FileTransferClient::FileTransferClient(const std::string& ip, int port, const StreamLimits& limits,
                                       int chunk_pacing_us)
	: client_fd(-1), server_ip(ip), port(port), connected(false), limits(limits),
	  chunk_pacing_us(chunk_pacing_us), chunks_sent(0) {

	// SOCK_STREAM: ordered, reliable byte stream (TCP)
	// Why TCP? We need guaranteed delivery and ordered chunks for file transfers
	client_fd = socket(AF_INET, SOCK_STREAM, 0);

	if (client_fd < 0) {
		std::cerr << "Failed to create socket. Error: " << strerror(errno) << std::endl;
	}
}

FileTransferClient::~FileTransferClient() {
	disconnect();
}

/**
 * Establishes TCP connection to the receiver
 */
bool FileTransferClient::connect() {
	if (client_fd < 0) {
		std::cerr << "Invalid socket descriptor" << std::endl;
		return false;
	}

	struct sockaddr_in server_addr;
	std::memset(&server_addr, 0, sizeof(server_addr));
	server_addr.sin_family = AF_INET;
	server_addr.sin_port = htons(port);

	if (inet_pton(AF_INET, server_ip.c_str(), &server_addr.sin_addr) <= 0) {
		std::cerr << "Invalid address: " << server_ip << std::endl;
		return false;
	}

	// SO_SNDTIMEO bounds connect() on Linux
	struct timeval connect_timeout;
	connect_timeout.tv_sec = 10;
	connect_timeout.tv_usec = 0;
	setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &connect_timeout, sizeof(connect_timeout));

	if (::connect(client_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
		std::cerr << "Connection failed to " << server_ip << ":" << port << ". Error: " << strerror(errno) << std::endl;
		return false;
	}

	// Disable Nagle's algorithm, frames are written in two pieces
	int flag = 1;
	setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
	setStreamTimeouts(client_fd);

	connected = true;
	std::cout << "Connected to " << server_ip << ":" << port << std::endl;
	return true;
}

void FileTransferClient::streamFile(const std::string& filepath, const std::string& file_md5,
                                    uint64_t& bytes_sent) {
	// Open file in binary mode to handle all file types correctly
	std::ifstream file(filepath, std::ios::binary | std::ios::ate);
	if (!file.is_open()) {
		throw TransferError("cannot open " + filepath);
	}

	// Get file size (ate flag positions pointer at end)
	uint64_t file_size = static_cast<uint64_t>(file.tellg());
	file.seekg(0, std::ios::beg);

	// Extract filename from path
	size_t last_slash = filepath.find_last_of("/\\");
	std::string filename = (last_slash != std::string::npos) ?
		filepath.substr(last_slash + 1) : filepath;

	FileMeta meta;
	meta.file_name = filename;
	meta.total_blocks = blockCount(file_size);
	meta.block_size = BLOCK_SIZE;
	sendMessage(client_fd, TransferMessage{meta}, limits);

	std::cout << "Starting file transfer: " << filename << " (" << formatFileSize(file_size)
	          << ", " << meta.total_blocks << " chunks)" << std::endl;

	// Send file data in chunks to avoid loading entire file into memory
	std::vector<char> buffer(BLOCK_SIZE);
	int last_percentage = -1;

	while (chunks_sent < meta.total_blocks) {
		file.read(buffer.data(), BLOCK_SIZE);
		std::streamsize bytes_read = file.gcount();
		if (bytes_read <= 0) {
			throw TransferError("file shrank while sending");
		}

		sendFrame(client_fd, buffer.data(), static_cast<uint32_t>(bytes_read), limits);
		bytes_sent += static_cast<uint64_t>(bytes_read);
		chunks_sent++;

		// Calculate and report progress
		int percentage = static_cast<int>((bytes_sent * 100) / std::max<uint64_t>(file_size, 1));
		if (percentage != last_percentage && percentage % 10 == 0) {
			std::cout << "Progress: " << percentage << "% ("
				<< bytes_sent << "/" << file_size << " bytes)" << std::endl;
			last_percentage = percentage;
		}

		if (progress_callback) {
			progress_callback(percentage, bytes_sent, file_size);
		}

		// Fixed pacing so the local socket buffer is not flooded
		if (chunk_pacing_us > 0) {
			std::this_thread::sleep_for(std::chrono::microseconds(chunk_pacing_us));
		}
	}

	TransferComplete complete;
	complete.file_md5 = file_md5;
	complete.timestamp = unixTimestamp();
	sendMessage(client_fd, TransferMessage{complete}, limits);
}

/**
 * Sends a file to the receiver and reads back its ACK or ERR
 */
TransferOutcome FileTransferClient::sendFile(const std::string& filepath, const std::string& file_md5) {
	if (!connected) {
		std::cerr << "Not connected to receiver" << std::endl;
		return TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "not connected", filepath);
	}

	chunks_sent = 0;
	uint64_t bytes_sent = 0;

	try {
		streamFile(filepath, file_md5, bytes_sent);

		std::cout << "File sent, waiting for verification..." << std::endl;

		StreamLimits verify_limits = limits;
		verify_limits.idle_timeout_sec = std::max(limits.idle_timeout_sec, VERIFY_TIMEOUT_SEC);
		TransferMessage response = recvMessage(client_fd, verify_limits);

		if (response.is<AckMessage>()) {
			std::cout << "File transfer complete, checksum verified by receiver" << std::endl;
			return TransferOutcome::completed(filepath, bytes_sent);
		}
		if (response.is<ErrorMessage>()) {
			const std::string& error = response.as<ErrorMessage>().error;
			std::cerr << "Receiver reported error: " << error << std::endl;
			if (error == transfer_reason::HASH_MISMATCH) {
				return TransferOutcome::failed(transfer_reason::HASH_MISMATCH, filepath);
			}
			if (error.rfind(transfer_reason::FAILED_PREFIX, 0) == 0) {
				return TransferOutcome::failed(error, filepath);
			}
			return TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + error, filepath);
		}

		std::cerr << "Unexpected response " << messageTypeName(response.type()) << std::endl;
		return TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "unexpected response " +
		                               messageTypeName(response.type()), filepath);
	} catch (const std::exception& e) {
		std::cerr << "File transfer failed: " << e.what() << std::endl;
		return TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + e.what(), filepath);
	}
}

/**
 * Closes the connection (sends FIN for TCP termination)
 */
void FileTransferClient::disconnect() {
	if (client_fd >= 0) {
		close(client_fd);
		client_fd = -1;
	}
	if (connected) {
		connected = false;
		std::cout << "Disconnected from " << server_ip << ":" << port << std::endl;
	}
}
