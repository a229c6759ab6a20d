#include "fileTransferServer.hpp"
#include <algorithm>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <cstring>
#include <chrono>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

/**
 * Constructor - only records settings, sockets are opened by start()
 */
FileTransferServer::FileTransferServer(const std::string& download_dir, int accept_timeout_sec,
                                       int io_timeout_sec)
	: server_fd(-1), client_fd(-1), port(-1), is_running(false), download_dir(download_dir),
	  accept_timeout_sec(accept_timeout_sec), file_created(false) {
	limits.idle_timeout_sec = io_timeout_sec;
	limits.running = &is_running;
}

FileTransferServer::~FileTransferServer() {
	stop();
	closeSockets();
}

/**
 * Starts the server on a kernel-chosen port
 */
bool FileTransferServer::start() {
	std::lock_guard<std::mutex> lock(fd_mutex);
	if (server_fd >= 0) {
		return true;
	}

	server_fd = socket(AF_INET, SOCK_STREAM, 0);
	if (server_fd < 0) {
		std::cerr << "Failed to create server socket. Error: " << strerror(errno) << std::endl;
		return false;
	}

	int opt = 1;
	setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

	struct sockaddr_in server_addr;
	std::memset(&server_addr, 0, sizeof(server_addr));
	server_addr.sin_family = AF_INET;
	server_addr.sin_addr.s_addr = INADDR_ANY;
	server_addr.sin_port = 0;

	if (bind(server_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
		std::cerr << "Failed to bind transfer socket: " << strerror(errno) << std::endl;
		close(server_fd);
		server_fd = -1;
		return false;
	}

	if (listen(server_fd, 1) < 0) {
		std::cerr << "Failed to listen on socket: " << strerror(errno) << std::endl;
		close(server_fd);
		server_fd = -1;
		return false;
	}

	socklen_t addr_len = sizeof(server_addr);
	if (getsockname(server_fd, (struct sockaddr*)&server_addr, &addr_len) < 0) {
		std::cerr << "Failed to read transfer port: " << strerror(errno) << std::endl;
		close(server_fd);
		server_fd = -1;
		return false;
	}
	port = ntohs(server_addr.sin_port);

	// Set socket timeout for accept() to allow checking is_running
	struct timeval timeout;
	timeout.tv_sec = 1;
	timeout.tv_usec = 0;
	setsockopt(server_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	is_running = true;
	std::cout << "Waiting for transfer connection on port " << port << std::endl;
	return true;
}

/**
 * Stops the server; unblocks accept() and recv() in the receiving thread
 */
void FileTransferServer::stop() {
	is_running = false;

	std::lock_guard<std::mutex> lock(fd_mutex);
	if (server_fd >= 0) {
		shutdown(server_fd, SHUT_RDWR);
	}
	if (client_fd >= 0) {
		shutdown(client_fd, SHUT_RDWR);
	}
}

void FileTransferServer::closeSockets() {
	std::lock_guard<std::mutex> lock(fd_mutex);
	if (client_fd >= 0) {
		close(client_fd);
		client_fd = -1;
	}
	if (server_fd >= 0) {
		close(server_fd);
		server_fd = -1;
	}
}

bool FileTransferServer::acceptConnection() {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(accept_timeout_sec);

	while (is_running && std::chrono::steady_clock::now() < deadline) {
		struct sockaddr_in client_addr;
		socklen_t client_len = sizeof(client_addr);

		// accept() times out after 1 second if no connection
		int accepted = accept(server_fd, (struct sockaddr*)&client_addr, &client_len);

		if (accepted < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
				continue;
			}
			if (is_running) {
				std::cerr << "Failed to accept connection: " << strerror(errno) << std::endl;
			}
			return false;
		}

		int flag = 1;
		setsockopt(accepted, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
		setStreamTimeouts(accepted);

		char client_ip[INET_ADDRSTRLEN];
		inet_ntop(AF_INET, &(client_addr.sin_addr), client_ip, INET_ADDRSTRLEN);
		session.peer_ip = client_ip;

		{
			std::lock_guard<std::mutex> lock(fd_mutex);
			client_fd = accepted;
			// Exactly one connection per transfer
			if (server_fd >= 0) {
				close(server_fd);
				server_fd = -1;
			}
		}

		std::cout << "Transfer connection from " << client_ip << ":" << ntohs(client_addr.sin_port) << std::endl;
		return true;
	}
	return false;
}

/**
 * Receives one file over the accepted connection
 */
TransferOutcome FileTransferServer::receive(const SendOffer& offer) {
	session = TransferSession();
	session.expected_size = offer.file_size;
	session.expected_md5 = offer.file_md5;
	file_created = false;

	TransferOutcome outcome;

	if (server_fd < 0 && !start()) {
		outcome = TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "cannot open transfer port");
	} else if (!acceptConnection()) {
		std::cerr << "No transfer connection for " << offer.file_name << std::endl;
		outcome = TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) +
		                                  (is_running ? "sender never connected" : "stopped"));
	} else {
		try {
			outcome = receiveFile();
		} catch (const std::exception& e) {
			std::cerr << "File receive failed: " << e.what() << std::endl;

			// Best-effort cleanup of the partial file
			if (file_created) {
				std::error_code ec;
				fs::remove(session.destination_path, ec);
			}
			sendError(std::string(transfer_reason::FAILED_PREFIX) + e.what());
			outcome = TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + e.what());
		}
	}

	is_running = false;
	closeSockets();
	return outcome;
}

TransferOutcome FileTransferServer::receiveFile() {
	// 1. meta
	TransferMessage first = recvMessage(client_fd, limits);
	if (!first.is<FileMeta>()) {
		throw ProtocolError(std::string("expected FILE_META, got ") + messageTypeName(first.type()));
	}
	const FileMeta meta = first.as<FileMeta>();
	session.file_name = meta.file_name;
	session.total_blocks = meta.total_blocks;

	// Chunk size is fixed, a larger value would only raise the frame cap
	if (meta.block_size != BLOCK_SIZE) {
		throw ProtocolError("FILE_META block_size " + std::to_string(meta.block_size) +
		                    ", expected " + std::to_string(BLOCK_SIZE));
	}
	if (meta.total_blocks != blockCount(session.expected_size)) {
		throw ProtocolError("FILE_META announces " + std::to_string(meta.total_blocks) +
		                    " chunks for a file of " + std::to_string(session.expected_size) + " bytes");
	}

	// 2. destination
	session.destination_path = claimDestinationPath(download_dir, meta.file_name);
	file_created = true;

	std::ofstream output_file(session.destination_path, std::ios::binary | std::ios::trunc);
	if (!output_file.is_open()) {
		throw TransferError("cannot open " + session.destination_path + " for writing");
	}

	std::cout << "Receiving " << meta.file_name << " (" << formatFileSize(session.expected_size)
	          << ", " << meta.total_blocks << " chunks) into " << session.destination_path << std::endl;

	// 3. chunks, index implied by arrival order
	std::string chunk;
	int last_percentage = -1;
	for (uint64_t i = 0; i < meta.total_blocks; ++i) {
		uint32_t length = recvFrame(client_fd, chunk, BLOCK_SIZE, limits);

		output_file.write(chunk.data(), length);
		if (!output_file) {
			throw TransferError("write to " + session.destination_path + " failed");
		}
		session.bytes_received += length;
		session.chunks_received++;

		int percentage = static_cast<int>((session.bytes_received * 100) /
		                                  std::max<uint64_t>(session.expected_size, 1));
		if (percentage != last_percentage && percentage % 10 == 0) {
			std::cout << "Receiving from " << session.peer_ip << ": " << percentage << "% "
				<< "(" << session.bytes_received << "/" << session.expected_size << " bytes)" << std::endl;
			last_percentage = percentage;

			if (progress_callback) {
				progress_callback(session.peer_ip, percentage);
			}
		}
	}

	output_file.close();
	if (!output_file) {
		throw TransferError("closing " + session.destination_path + " failed");
	}

	// 4. completion
	TransferMessage last = recvMessage(client_fd, limits);
	if (!last.is<TransferComplete>()) {
		throw ProtocolError(std::string("expected TRANSFER_COMPLETE, got ") + messageTypeName(last.type()));
	}
	const std::string& declared_md5 = last.as<TransferComplete>().file_md5;

	// 5. verification against the completion message and the original offer
	std::cout << "Verifying file integrity..." << std::endl;
	std::string received_md5 = calculateChecksum(session.destination_path);

	if (received_md5.empty() || !sameDigest(received_md5, declared_md5) ||
	    !sameDigest(declared_md5, session.expected_md5) ||
	    session.bytes_received != session.expected_size) {
		std::cerr << "Checksum mismatch for " << session.destination_path
		          << " (expected " << declared_md5 << ", got " << received_md5 << ")" << std::endl;

		std::error_code ec;
		fs::remove(session.destination_path, ec);
		file_created = false;

		sendError(transfer_reason::HASH_MISMATCH);
		return TransferOutcome::failed(transfer_reason::HASH_MISMATCH);
	}

	AckMessage ack;
	ack.block_number = session.chunks_received;
	sendMessage(client_fd, TransferMessage{ack}, limits);

	std::cout << "File received successfully: " << session.destination_path
		<< " (" << session.bytes_received << " bytes)" << std::endl;

	return TransferOutcome::completed(session.destination_path, session.bytes_received);
}

void FileTransferServer::sendError(const std::string& error) {
	if (client_fd < 0) return;

	ErrorMessage err;
	err.error = error;
	err.timestamp = unixTimestamp();
	try {
		StreamLimits quick = limits;
		quick.running = nullptr;
		quick.idle_timeout_sec = 1;
		sendMessage(client_fd, TransferMessage{err}, quick);
	} catch (const std::exception& e) {
		std::cerr << "Could not report error to sender: " << e.what() << std::endl;
	}
}

std::string claimDestinationPath(const std::string& dir, const std::string& file_name) {
	// Only the last path component of a remote name is ever used
	std::string base = fs::path(file_name).filename().string();
	if (base.empty() || base == "." || base == "..") {
		throw TransferError("unusable file name: '" + file_name + "'");
	}

	std::error_code ec;
	fs::create_directories(dir, ec);
	if (ec) {
		throw TransferError("cannot create " + dir + ": " + ec.message());
	}

	const fs::path stem = fs::path(base).stem();
	const fs::path extension = fs::path(base).extension();

	fs::path candidate = fs::path(dir) / base;
	for (int counter = 1; ; ++counter) {
		// O_EXCL makes the existence check and the creation one step
		int fd = open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
		if (fd >= 0) {
			close(fd);
			return candidate.string();
		}
		if (errno != EEXIST) {
			throw TransferError("cannot create " + candidate.string() + ": " + strerror(errno));
		}
		candidate = fs::path(dir) / (stem.string() + "_" + std::to_string(counter) + extension.string());
	}
}
