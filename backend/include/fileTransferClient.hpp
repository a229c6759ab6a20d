#pragma once

#include <string>
#include <functional>  // For callback functions
#include <cstdint>
#include "protocol.hpp"
#include "framedSocket.hpp"
#include "transferTypes.hpp"

/**
 * FileTransferClient runs the sender side of the bulk phase
 * It connects to the port a receiver advertised in RECEIVE_CONFIRM and
 * streams FILE_META, the data chunks and TRANSFER_COMPLETE over one TCP
 * connection, then waits for the receiver's ACK or ERR.
 */
class FileTransferClient {
private:
	int client_fd;           // Socket file descriptor
	std::string server_ip;   // IP address of the receiving device
	int port;
	bool connected;

	StreamLimits limits;
	int chunk_pacing_us;
	uint64_t chunks_sent;

	// Callback function for progress updates
	// This allows the UI to show transfer progress
	std::function<void(int percentage, uint64_t transferred, uint64_t total)> progress_callback;

	// Meta, chunks and completion; throws on any connection failure
	void streamFile(const std::string& filepath, const std::string& file_md5, uint64_t& bytes_sent);

public:
	/**
	 * Constructor - initializes the client with receiver details
	 * @param ip: IP address of the receiving device
	 * @param port: TCP port from the receiver's RECEIVE_CONFIRM
	 * @param limits: Idle limit and stop flag for the connection
	 * @param chunk_pacing_us: Pause between chunks (default: 1ms)
	 */
	FileTransferClient(const std::string& ip, int port, const StreamLimits& limits = StreamLimits(),
	                   int chunk_pacing_us = 1000);

	//Destructor - ensures socket is closed properly
	~FileTransferClient();

	FileTransferClient(const FileTransferClient&) = delete;
	FileTransferClient& operator=(const FileTransferClient&) = delete;

	//Establishes TCP connection to the receiver (10s timeout)
	bool connect();

	/**
	 * Sends a file to the connected receiver and waits for its verdict
	 * @param filepath: Path to the file to send
	 * @param file_md5: Hash announced in the offer, repeated in TRANSFER_COMPLETE
	 * @return: success, or the reason the transfer failed
	 */
	TransferOutcome sendFile(const std::string& filepath, const std::string& file_md5);

	/**
	 * Closes the connection
	 */
	void disconnect();

	/**
	 * Sets a callback function to receive progress updates
	 * @param callback: Function taking (percentage, transferred_bytes, total_bytes)
	 */
	void setProgressCallback(std::function<void(int, uint64_t, uint64_t)> callback) {
		progress_callback = callback;
	}

	bool isConnected() const { return connected; }

	// Data chunks written by the last sendFile()
	uint64_t getChunksSent() const { return chunks_sent; }
};
