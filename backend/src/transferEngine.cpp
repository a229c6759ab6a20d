#include "transferEngine.hpp"
#include "fileTransferClient.hpp"
#include "fileTransferServer.hpp"
#include <iostream>
#include <algorithm>
#include <filesystem>
#include <arpa/inet.h>

namespace fs = std::filesystem;

TransferEngine::TransferEngine(ControlChannel& control, const NodeConfig& config, const std::string& local_ip)
	: control(control),
	  local_ip(local_ip),
	  download_dir(config.download_dir),
	  offer_timeout(config.offer_timeout_sec),
	  accept_timeout_sec(config.accept_timeout_sec),
	  io_timeout_sec(config.io_timeout_sec),
	  chunk_pacing_us(config.chunk_pacing_us),
	  shutdown_grace(config.shutdown_grace_ms),
	  is_running(true),
	  next_offer_id(0),
	  active_workers(0) {

	control.setOfferHandler([this](const SendOffer& offer, const std::string& ip, int port) {
		handleOffer(offer, ip, port);
	});
	control.setResponseHandler([this](const TransferMessage& msg, const std::string& ip, int port) {
		handleResponse(msg, ip, port);
	});
}

TransferEngine::~TransferEngine() {
	stop();
}

void TransferEngine::setDecisionProvider(DecisionProvider provider) {
	std::lock_guard<std::mutex> lock(callbacks_mutex);
	decision_provider = provider;
}

void TransferEngine::setReceiveCallback(TransferCallback callback) {
	std::lock_guard<std::mutex> lock(callbacks_mutex);
	receive_callback = callback;
}

void TransferEngine::setProgressCallback(std::function<void(const std::string&, int)> callback) {
	std::lock_guard<std::mutex> lock(callbacks_mutex);
	progress_callback = callback;
}

size_t TransferEngine::pendingOfferCount() {
	std::lock_guard<std::mutex> lock(pending_mutex);
	return pending_offers.size();
}

size_t TransferEngine::activeTransferCount() {
	std::lock_guard<std::mutex> lock(workers_mutex);
	return active_workers;
}

void TransferEngine::deliver(const TransferCallback& callback, const TransferOutcome& outcome) {
	if (!callback) return;
	try {
		callback(outcome);
	} catch (const std::exception& e) {
		std::cerr << "Transfer callback threw: " << e.what() << std::endl;
	}
}

bool TransferEngine::spawnWorker(std::function<void()> task) {
	std::lock_guard<std::mutex> lock(workers_mutex);
	if (!is_running) {
		return false;
	}
	reapFinishedWorkers();

	active_workers++;
	workers.emplace_back([this, task]() {
		try {
			task();
		} catch (const std::exception& e) {
			std::cerr << "Transfer worker failed: " << e.what() << std::endl;
		}

		{
			std::lock_guard<std::mutex> done_lock(workers_mutex);
			active_workers--;
			finished_workers.push_back(std::this_thread::get_id());
		}
		workers_cv.notify_all();
	});
	return true;
}

// Caller holds workers_mutex
void TransferEngine::reapFinishedWorkers() {
	const auto self = std::this_thread::get_id();
	for (auto it = workers.begin(); it != workers.end();) {
		auto id = it->get_id();
		if (id != self && std::find(finished_workers.begin(), finished_workers.end(), id) != finished_workers.end()) {
			// Already past its last use of workers_mutex, join returns at once
			it->join();
			finished_workers.erase(std::find(finished_workers.begin(), finished_workers.end(), id));
			it = workers.erase(it);
		} else {
			++it;
		}
	}
}

void TransferEngine::stop() {
	{
		std::lock_guard<std::mutex> lock(pending_mutex);
		if (!is_running) return;
		is_running = false;
	}
	// Watchdogs wake and settle their offers
	pending_cv.notify_all();

	std::list<std::thread> to_join;
	{
		std::unique_lock<std::mutex> lock(workers_mutex);
		for (FileTransferServer* server : active_servers) {
			server->stop();
		}

		if (!workers_cv.wait_for(lock, shutdown_grace, [this]() { return active_workers == 0; })) {
			std::cerr << "Waiting for " << active_workers << " transfer worker(s) to finish" << std::endl;
		}
		to_join.swap(workers);
		finished_workers.clear();
	}

	for (auto& worker : to_join) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	std::cout << "Transfer engine stopped" << std::endl;
}

bool TransferEngine::sendOffer(const std::string& target_ip, int target_port, const std::string& file_path,
                               TransferCallback callback) {
	if (!is_running) {
		std::cerr << "Transfer engine is stopped" << std::endl;
		return false;
	}

	std::error_code ec;
	if (!fs::is_regular_file(file_path, ec)) {
		std::cerr << "File does not exist: " << file_path << std::endl;
		return false;
	}
	uint64_t file_size = fs::file_size(file_path, ec);
	if (ec) {
		std::cerr << "Cannot read size of " << file_path << ": " << ec.message() << std::endl;
		return false;
	}

	struct in_addr parsed_addr;
	if (inet_pton(AF_INET, target_ip.c_str(), &parsed_addr) != 1 || target_port <= 0 || target_port > 65535) {
		std::cerr << "Invalid target address: " << target_ip << ":" << target_port << std::endl;
		return false;
	}

	std::string file_md5 = calculateChecksum(file_path);
	if (file_md5.empty()) {
		std::cerr << "Cannot read file: " << file_path << std::endl;
		return false;
	}

	SendOffer offer;
	offer.sender_ip = local_ip;
	offer.sender_port = control.getPort();
	offer.file_name = fs::path(file_path).filename().string();
	offer.file_size = file_size;
	offer.file_md5 = file_md5;
	offer.timestamp = unixTimestamp();

	const std::string key = target_ip + ":" + std::to_string(target_port);
	uint64_t id = 0;
	{
		std::lock_guard<std::mutex> lock(pending_mutex);
		id = ++next_offer_id;

		auto existing = pending_offers.find(key);
		if (existing != pending_offers.end()) {
			std::cout << "Replacing pending offer of " << existing->second.file_path << " to " << key << std::endl;
		}

		PendingOffer pending;
		pending.id = id;
		pending.target_ip = target_ip;
		pending.target_port = target_port;
		pending.file_path = file_path;
		pending.file_size = file_size;
		pending.file_md5 = file_md5;
		pending.created = std::chrono::steady_clock::now();
		pending.callback = callback;
		pending_offers[key] = pending;
	}
	// A replaced offer's watchdog sees the new id and retires
	pending_cv.notify_all();

	auto discard = [this, &key, id]() {
		std::lock_guard<std::mutex> lock(pending_mutex);
		auto it = pending_offers.find(key);
		if (it != pending_offers.end() && it->second.id == id) {
			pending_offers.erase(it);
		}
	};

	if (!spawnWorker([this, key, id]() { watchOffer(key, id); })) {
		discard();
		return false;
	}

	if (!control.sendTo(target_ip, target_port, TransferMessage{offer})) {
		discard();
		pending_cv.notify_all();
		return false;
	}

	std::cout << "Offering " << offer.file_name << " (" << formatFileSize(file_size) << ") to " << key
	          << ", waiting for confirmation..." << std::endl;
	return true;
}

void TransferEngine::watchOffer(const std::string& key, uint64_t id) {
	PendingOffer expired;
	{
		std::unique_lock<std::mutex> lock(pending_mutex);
		auto still_ours = [this, &key, id]() {
			auto it = pending_offers.find(key);
			return it != pending_offers.end() && it->second.id == id;
		};

		pending_cv.wait_for(lock, offer_timeout, [this, &still_ours]() { return !is_running || !still_ours(); });

		// A response (or a newer offer) got there first
		if (!still_ours()) {
			return;
		}
		auto it = pending_offers.find(key);
		expired = it->second;
		pending_offers.erase(it);
	}

	if (is_running) {
		std::cout << "No response from " << key << " for " << expired.file_path << ", offer timed out" << std::endl;
		deliver(expired.callback, TransferOutcome::failed(transfer_reason::TIMEOUT, expired.file_path));
	} else {
		deliver(expired.callback, TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "node stopped",
		                                                  expired.file_path));
	}
}

void TransferEngine::handleResponse(const TransferMessage& msg, const std::string& source_ip, int source_port) {
	const std::string key = source_ip + ":" + std::to_string(source_port);

	PendingOffer claimed;
	bool found = false;
	{
		std::lock_guard<std::mutex> lock(pending_mutex);
		auto it = pending_offers.find(key);
		if (it == pending_offers.end()) {
			// Peers that answer from another port are matched by IP
			it = std::find_if(pending_offers.begin(), pending_offers.end(),
			                  [&source_ip](const std::pair<const std::string, PendingOffer>& entry) {
				                  return entry.second.target_ip == source_ip;
			                  });
		}
		if (it != pending_offers.end()) {
			// Erasing the entry is what makes this response the winner
			claimed = it->second;
			pending_offers.erase(it);
			found = true;
		}
	}

	if (!found) {
		std::cout << "Ignoring " << messageTypeName(msg.type()) << " from " << key << ": no pending offer" << std::endl;
		return;
	}
	pending_cv.notify_all();

	if (msg.is<ReceiveConfirm>()) {
		int tcp_port = msg.as<ReceiveConfirm>().tcp_port;
		std::cout << "Offer accepted by " << key << ", starting transfer..." << std::endl;

		TransferCallback callback = claimed.callback;
		std::string path = claimed.file_path;
		if (!spawnWorker([this, claimed, source_ip, tcp_port]() { runSend(claimed, source_ip, tcp_port); })) {
			deliver(callback, TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "node stopped", path));
		}
	} else {
		std::cout << key << " rejected " << claimed.file_path << std::endl;
		deliver(claimed.callback, TransferOutcome::failed(transfer_reason::REJECTED, claimed.file_path));
	}
}

void TransferEngine::runSend(PendingOffer offer, const std::string& ip, int tcp_port) {
	StreamLimits limits;
	limits.idle_timeout_sec = io_timeout_sec;
	limits.running = &is_running;

	FileTransferClient client(ip, tcp_port, limits, chunk_pacing_us);

	std::function<void(const std::string&, int)> progress;
	{
		std::lock_guard<std::mutex> lock(callbacks_mutex);
		progress = progress_callback;
	}
	if (progress) {
		const std::string peer = offer.target_ip + ":" + std::to_string(offer.target_port);
		client.setProgressCallback([progress, peer](int percentage, uint64_t, uint64_t) {
			progress(peer, percentage);
		});
	}

	TransferOutcome outcome;
	if (!client.connect()) {
		outcome = TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "cannot connect to " + ip +
		                                  ":" + std::to_string(tcp_port), offer.file_path);
	} else {
		outcome = client.sendFile(offer.file_path, offer.file_md5);
		client.disconnect();
	}

	deliver(offer.callback, outcome);
}

void TransferEngine::handleOffer(const SendOffer& offer, const std::string& source_ip, int source_port) {
	IncomingOffer incoming;
	incoming.offer = offer;
	incoming.source_ip = source_ip;
	incoming.source_port = source_port;

	// The decision may take a while, never hold up the control listener
	if (!spawnWorker([this, incoming]() { runReceive(incoming); })) {
		std::cout << "Ignoring offer from " << incoming.senderKey() << ": engine stopped" << std::endl;
	}
}

bool TransferEngine::reply(const SendOffer& offer, const TransferMessage& msg) {
	return control.sendTo(offer.sender_ip, offer.sender_port, msg);
}

void TransferEngine::runReceive(IncomingOffer incoming) {
	const SendOffer& offer = incoming.offer;
	std::cout << "Incoming file offer from " << incoming.senderKey() << ": " << offer.file_name
	          << " (" << formatFileSize(offer.file_size) << ")" << std::endl;

	DecisionProvider provider;
	TransferCallback on_received;
	std::function<void(const std::string&, int)> progress;
	{
		std::lock_guard<std::mutex> lock(callbacks_mutex);
		provider = decision_provider;
		on_received = receive_callback;
		progress = progress_callback;
	}

	bool accept = false;
	if (!provider) {
		std::cout << "No decision provider installed, rejecting offer" << std::endl;
	} else {
		try {
			accept = provider(incoming);
		} catch (const std::exception& e) {
			std::cerr << "Decision provider failed: " << e.what() << std::endl;
			accept = false;
		}
	}

	ReceiveReject reject;
	reject.timestamp = unixTimestamp();

	if (!accept || !is_running) {
		reply(offer, TransferMessage{reject});
		std::cout << "Rejected " << offer.file_name << " from " << incoming.senderKey() << std::endl;
		return;
	}

	// Nothing touches the disk until the sender connects after this point
	FileTransferServer server(download_dir, accept_timeout_sec, io_timeout_sec);
	if (progress) {
		server.setProgressCallback(progress);
	}

	if (!server.start()) {
		std::cerr << "Cannot open a transfer port, rejecting " << offer.file_name << std::endl;
		reply(offer, TransferMessage{reject});
		return;
	}

	{
		std::lock_guard<std::mutex> lock(workers_mutex);
		if (!is_running) {
			reply(offer, TransferMessage{reject});
			return;
		}
		active_servers.insert(&server);
	}

	ReceiveConfirm confirm;
	confirm.timestamp = unixTimestamp();
	confirm.tcp_port = server.getPort();

	TransferOutcome outcome;
	if (!reply(offer, TransferMessage{confirm})) {
		outcome = TransferOutcome::failed(std::string(transfer_reason::FAILED_PREFIX) + "cannot reach " +
		                                  incoming.senderKey());
	} else {
		std::cout << "Accepted " << offer.file_name << ", receiving..." << std::endl;
		outcome = server.receive(offer);
	}

	{
		std::lock_guard<std::mutex> lock(workers_mutex);
		active_servers.erase(&server);
	}

	deliver(on_received, outcome);
}
