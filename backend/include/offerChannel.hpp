#pragma once

#include <deque>
#include <mutex>
#include <memory>
#include <atomic>
#include <future>
#include <chrono>
#include <condition_variable>
#include "transferTypes.hpp"

/**
 * One incoming offer waiting for an accept/reject answer
 */
struct OfferRequest {
	IncomingOffer offer;
	std::promise<bool> decision;
	std::atomic<bool> expired{false};   // The network side stopped waiting

	explicit OfferRequest(const IncomingOffer& offer) : offer(offer) {}
};

/**
 * OfferChannel hands incoming offers from the network worker to whatever
 * context takes the decision (the console prompt, a policy thread) and
 * carries the answer back.
 *
 * The network side calls decide(), which blocks until the consumer answers,
 * the decision timeout passes, or the channel is closed. The consumer side
 * polls next() and fulfils each request with answer().
 */
class OfferChannel {
private:
	std::deque<std::shared_ptr<OfferRequest>> queue;
	std::mutex queue_mutex;
	std::condition_variable queue_cv;
	bool closed;
	std::chrono::seconds decision_timeout;

public:
	/**
	 * @param decision_timeout: An unanswered offer is rejected after this long
	 */
	explicit OfferChannel(std::chrono::seconds decision_timeout = std::chrono::seconds(30));
	~OfferChannel();

	OfferChannel(const OfferChannel&) = delete;
	OfferChannel& operator=(const OfferChannel&) = delete;

	/**
	 * Producer side: queue the offer and wait for the answer
	 * @return: true if accepted; false on reject, timeout or closed channel
	 */
	bool decide(const IncomingOffer& offer);

	/**
	 * Consumer side: next unanswered request, waiting up to the given time
	 * @return: nullptr on timeout or when the channel is closed
	 */
	std::shared_ptr<OfferRequest> next(std::chrono::milliseconds wait);

	// Consumer side: deliver the answer for a request obtained from next()
	void answer(const std::shared_ptr<OfferRequest>& request, bool accept);

	// Rejects everything still queued and makes decide() fail fast
	void close();

	size_t pending();

	// Adapter for TransferEngine::setDecisionProvider()
	DecisionProvider provider() {
		return [this](const IncomingOffer& offer) { return decide(offer); };
	}
};
