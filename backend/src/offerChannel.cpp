#include "offerChannel.hpp"
#include <iostream>

OfferChannel::OfferChannel(std::chrono::seconds decision_timeout)
	: closed(false), decision_timeout(decision_timeout) {}

OfferChannel::~OfferChannel() {
	close();
}

bool OfferChannel::decide(const IncomingOffer& offer) {
	auto request = std::make_shared<OfferRequest>(offer);
	std::future<bool> answer_future = request->decision.get_future();

	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		if (closed) {
			return false;
		}
		queue.push_back(request);
	}
	queue_cv.notify_one();

	if (answer_future.wait_for(decision_timeout) != std::future_status::ready) {
		request->expired = true;
		std::cout << "No decision for " << offer.offer.file_name << " from " << offer.senderKey()
		          << ", rejecting" << std::endl;
		return false;
	}
	return answer_future.get();
}

std::shared_ptr<OfferRequest> OfferChannel::next(std::chrono::milliseconds wait) {
	std::unique_lock<std::mutex> lock(queue_mutex);
	auto deadline = std::chrono::steady_clock::now() + wait;

	while (true) {
		// Requests the producer gave up on are dropped unanswered
		while (!queue.empty() && queue.front()->expired) {
			queue.pop_front();
		}
		if (!queue.empty()) {
			auto request = queue.front();
			queue.pop_front();
			return request;
		}
		if (closed) {
			return nullptr;
		}
		if (queue_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
			return nullptr;
		}
	}
}

void OfferChannel::answer(const std::shared_ptr<OfferRequest>& request, bool accept) {
	if (!request) return;
	try {
		request->decision.set_value(accept);
	} catch (const std::future_error& e) {
		std::cerr << "Offer already answered: " << e.what() << std::endl;
	}
}

void OfferChannel::close() {
	std::deque<std::shared_ptr<OfferRequest>> remaining;
	{
		std::lock_guard<std::mutex> lock(queue_mutex);
		if (closed) return;
		closed = true;
		remaining.swap(queue);
	}
	queue_cv.notify_all();

	for (auto& request : remaining) {
		answer(request, false);
	}
}

size_t OfferChannel::pending() {
	std::lock_guard<std::mutex> lock(queue_mutex);
	return queue.size();
}
