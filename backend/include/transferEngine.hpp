#pragma once

#include <string>
#include <map>
#include <set>
#include <list>
#include <vector>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <condition_variable>
#include "protocol.hpp"
#include "nodeConfig.hpp"
#include "transferTypes.hpp"
#include "controlChannel.hpp"

class FileTransferServer;

/**
 * TransferEngine drives both sides of a file transfer
 *
 * Sending:   sendOffer() -> SEND_OFFER over UDP -> RECEIVE_CONFIRM starts the
 *            bulk phase on its own thread, RECEIVE_REJECT or the watchdog
 *            end it. Whoever erases the pending entry first owns the outcome,
 *            so each offer's callback fires exactly once.
 * Receiving: each SEND_OFFER gets a worker that asks the decision provider,
 *            replies, and on accept runs a FileTransferServer for the one
 *            bulk connection.
 */
class TransferEngine {
private:
	struct PendingOffer {
		uint64_t id = 0;
		std::string target_ip;
		int target_port = 0;
		std::string file_path;
		uint64_t file_size = 0;
		std::string file_md5;
		std::chrono::steady_clock::time_point created;
		TransferCallback callback;
	};

	ControlChannel& control;
	std::string local_ip;
	std::string download_dir;
	std::chrono::seconds offer_timeout;
	int accept_timeout_sec;
	int io_timeout_sec;
	int chunk_pacing_us;
	std::chrono::milliseconds shutdown_grace;

	std::atomic<bool> is_running;

	// Sender side: at most one pending offer per "ip:port"
	std::map<std::string, PendingOffer> pending_offers;
	std::mutex pending_mutex;
	std::condition_variable pending_cv;
	uint64_t next_offer_id;

	// Receiver side
	DecisionProvider decision_provider;
	TransferCallback receive_callback;
	std::function<void(const std::string& peer, int percentage)> progress_callback;
	std::mutex callbacks_mutex;

	// Per-transfer worker threads
	std::list<std::thread> workers;
	std::vector<std::thread::id> finished_workers;
	std::set<FileTransferServer*> active_servers;
	size_t active_workers;
	std::mutex workers_mutex;
	std::condition_variable workers_cv;

	bool spawnWorker(std::function<void()> task);
	void reapFinishedWorkers();

	void watchOffer(const std::string& key, uint64_t id);
	void runSend(PendingOffer offer, const std::string& ip, int tcp_port);
	void runReceive(IncomingOffer incoming);
	bool reply(const SendOffer& offer, const TransferMessage& msg);

	static void deliver(const TransferCallback& callback, const TransferOutcome& outcome);

public:
	/**
	 * Installs the offer and response handlers on the control channel,
	 * so it must be created before control.start()
	 * @param control: The node's control channel
	 * @param config: Download directory, timeouts and pacing
	 * @param local_ip: Address advertised as sender_ip in offers
	 */
	TransferEngine(ControlChannel& control, const NodeConfig& config, const std::string& local_ip);
	~TransferEngine();

	TransferEngine(const TransferEngine&) = delete;
	TransferEngine& operator=(const TransferEngine&) = delete;

	/**
	 * Offers a local file to a peer's control port
	 * Fails synchronously (no network traffic, no callback) when the file is
	 * missing or unreadable, the address is invalid or the engine is stopped.
	 * Otherwise the callback later receives exactly one outcome: completed,
	 * "rejected", "timeout", "hash mismatch" or "transfer failed: <cause>".
	 * A second offer to the same target replaces the first one's pending state.
	 * @return: true if the offer went out
	 */
	bool sendOffer(const std::string& target_ip, int target_port, const std::string& file_path,
	               TransferCallback callback);

	// RECEIVE_CONFIRM / RECEIVE_REJECT from the control channel
	void handleResponse(const TransferMessage& msg, const std::string& source_ip, int source_port);

	// SEND_OFFER from the control channel; never blocks the caller
	void handleOffer(const SendOffer& offer, const std::string& source_ip, int source_port);

	/**
	 * Aborts in-flight transfers, completes pending offers with
	 * "transfer failed: node stopped" and joins all workers; safe to call repeatedly
	 */
	void stop();

	// Decides incoming offers; without one every offer is rejected
	void setDecisionProvider(DecisionProvider provider);

	// Outcome of every accepted incoming transfer
	void setReceiveCallback(TransferCallback callback);

	void setProgressCallback(std::function<void(const std::string&, int)> callback);

	size_t pendingOfferCount();
	size_t activeTransferCount();

	bool isRunning() const { return is_running; }
};
