#pragma once

#include <string>
#include <functional>
#include <cstdint>
#include <atomic>
#include <mutex>
#include "protocol.hpp"
#include "framedSocket.hpp"
#include "transferTypes.hpp"

/**
 * Receiver-side state of one bulk transfer
 * Lives only as long as the single TCP connection carrying the file
 */
struct TransferSession {
	std::string peer_ip;
	std::string file_name;            // Name from FILE_META
	std::string destination_path;     // After collision renaming
	uint64_t expected_size = 0;       // From the offer
	std::string expected_md5;         // From the offer
	uint64_t total_blocks = 0;
	uint64_t bytes_received = 0;
	uint64_t chunks_received = 0;
};

/**
 * FileTransferServer runs the receiver side of the bulk phase for one
 * accepted offer: it listens on an ephemeral TCP port, accepts exactly one
 * connection and writes the streamed file into the downloads directory.
 * Both sockets are released on every exit path.
 */
class FileTransferServer {
private:
	int server_fd;                       // Listening socket
	int client_fd;                       // The one accepted connection
	int port;                            // Bound ephemeral port
	std::atomic<bool> is_running;        // Server status flag
	std::mutex fd_mutex;                 // Guards fds against a concurrent stop()

	std::string download_dir;
	int accept_timeout_sec;
	StreamLimits limits;

	TransferSession session;
	bool file_created;

	// Callback for progress updates
	std::function<void(const std::string& client_ip, int percentage)> progress_callback;

	/**
	 * Waits for the sender to connect
	 * @return: true once a connection is accepted, false on timeout or stop
	 */
	bool acceptConnection();

	// Steps meta -> chunks -> completion -> verification; throws on failure
	TransferOutcome receiveFile();

	void sendError(const std::string& error);
	void closeSockets();

public:
	/**
	 * Constructor
	 * @param download_dir: Directory receiving the file (created if missing)
	 * @param accept_timeout_sec: How long to wait for the sender to connect (default: 30s)
	 * @param io_timeout_sec: Longest silence tolerated on the connection (default: 10s)
	 */
	explicit FileTransferServer(const std::string& download_dir, int accept_timeout_sec = 30,
	                            int io_timeout_sec = 10);

	/**
	 * Destructor - ensures clean shutdown
	 */
	~FileTransferServer();

	FileTransferServer(const FileTransferServer&) = delete;
	FileTransferServer& operator=(const FileTransferServer&) = delete;

	/**
	 * Binds an ephemeral port and starts listening
	 * @return: true if server started successfully
	 */
	bool start();

	/**
	 * Accepts the sender's connection and receives one file
	 * @param offer: The offer that was accepted; its size and hash are checked
	 * @return: success with the final path, or the failure reason
	 */
	TransferOutcome receive(const SendOffer& offer);

	/**
	 * Aborts a receive() in progress from another thread
	 */
	void stop();

	void setProgressCallback(std::function<void(const std::string&, int)> callback) {
		progress_callback = callback;
	}

	bool isRunning() const { return is_running; }

	/**
	 * Gets the port server is listening on
	 * @return: Port number, advertised in RECEIVE_CONFIRM
	 */
	int getPort() const { return port; }

	const TransferSession& getSession() const { return session; }
};

/**
 * Picks a free path for file_name inside dir and creates it empty
 * "report.txt" becomes "report_1.txt", "report_2.txt", ... when taken;
 * an existing file is never overwritten.
 * @throws TransferError if the name is unusable or the file cannot be created
 */
std::string claimDestinationPath(const std::string& dir, const std::string& file_name);
