#ifndef __TVH_RESPONSE_CORRELATOR__
#define __TVH_RESPONSE_CORRELATOR__

#include "Headers.hpp"
#include "HtspMessage.hpp"

namespace tvh {
/**
 * @brief Receives the reply to one request.
 */
class HtspResponseHandler {
 public:
  virtual ~HtspResponseHandler() {}

  virtual void handleResponse(const HtspMessage& response) = 0;
};

typedef std::function<void(const HtspMessage&)> PushHandler;

enum DispatchResult {
  DISPATCHED_RESPONSE = 0,
  DISPATCHED_PUSH = 1,
  DISCARDED = 2,
};

/**
 * @brief Routes every inbound message either to the handler of the request
 * it answers (matched on `seq`) or, by `method`, to the push subscribers.
 *
 * Each pending request receives at most one response: the entry is removed
 * before its handler runs.  Push events nobody subscribed to are dropped.
 */
class ResponseCorrelator {
 public:
  ResponseCorrelator();

  /** @brief Hands out the correlation key for a new request. */
  int64_t nextSequenceNumber();

  /**
   * @brief Registers the handler that must receive the reply to `seq`.
   * @throws std::logic_error when `seq` still has an unresolved entry.
   */
  void registerRequest(int64_t seq, shared_ptr<HtspResponseHandler> handler);

  /** @brief Forgets a pending request.  Returns false if it was not pending. */
  bool unregisterRequest(int64_t seq);

  /**
   * @brief Adds a push subscriber for one message method.  Must be called
   * before the receive loop starts.
   */
  void subscribe(const string& method, PushHandler handler);

  /**
   * @brief Routes one inbound message.  Called only from the receive loop.
   */
  DispatchResult dispatch(const HtspMessage& message);

  /**
   * @brief Drops every pending request without notifying its handler.
   * Waiters find out through their own timeout or cancellation.
   */
  void abandonAll();

  size_t getPendingCount();
  int64_t getDiscardedCount();

 protected:
  std::mutex correlatorMutex;
  int64_t nextSeq;
  int64_t discardedCount;
  map<int64_t, shared_ptr<HtspResponseHandler>> pendingRequests;
  map<string, vector<PushHandler>> subscriptions;
};
}  // namespace tvh

#endif  // __TVH_RESPONSE_CORRELATOR__
