#include "ResponseCorrelator.hpp"

namespace tvh {
ResponseCorrelator::ResponseCorrelator() : nextSeq(1), discardedCount(0) {}

int64_t ResponseCorrelator::nextSequenceNumber() {
  lock_guard<std::mutex> guard(correlatorMutex);
  return nextSeq++;
}

void ResponseCorrelator::registerRequest(
    int64_t seq, shared_ptr<HtspResponseHandler> handler) {
  lock_guard<std::mutex> guard(correlatorMutex);
  if (pendingRequests.find(seq) != pendingRequests.end()) {
    throw std::logic_error("Correlation key " + to_string(seq) +
                           " is still waiting for a response");
  }
  pendingRequests[seq] = handler;
}

bool ResponseCorrelator::unregisterRequest(int64_t seq) {
  lock_guard<std::mutex> guard(correlatorMutex);
  return pendingRequests.erase(seq) > 0;
}

void ResponseCorrelator::subscribe(const string& method, PushHandler handler) {
  lock_guard<std::mutex> guard(correlatorMutex);
  subscriptions[method].push_back(handler);
}

DispatchResult ResponseCorrelator::dispatch(const HtspMessage& message) {
  shared_ptr<HtspResponseHandler> responseHandler;
  vector<PushHandler> pushHandlers;
  {
    lock_guard<std::mutex> guard(correlatorMutex);
    if (message.hasField("seq")) {
      auto it = pendingRequests.find(message.getS64("seq", -1));
      if (it != pendingRequests.end()) {
        responseHandler = it->second;
        pendingRequests.erase(it);
      }
    }
    if (!responseHandler) {
      auto it = subscriptions.find(message.getMethod());
      if (it != subscriptions.end()) {
        pushHandlers = it->second;
      } else {
        discardedCount++;
      }
    }
  }

  if (responseHandler) {
    VLOG(2) << "Response for seq " << message.getS64("seq", -1);
    responseHandler->handleResponse(message);
    return DISPATCHED_RESPONSE;
  }
  if (pushHandlers.empty()) {
    VLOG(3) << "Ignoring message with method '" << message.getMethod() << "'";
    return DISCARDED;
  }
  for (const auto& pushHandler : pushHandlers) {
    pushHandler(message);
  }
  return DISPATCHED_PUSH;
}

void ResponseCorrelator::abandonAll() {
  lock_guard<std::mutex> guard(correlatorMutex);
  if (!pendingRequests.empty()) {
    LOG(INFO) << "Abandoning " << pendingRequests.size()
              << " pending requests";
  }
  pendingRequests.clear();
}

size_t ResponseCorrelator::getPendingCount() {
  lock_guard<std::mutex> guard(correlatorMutex);
  return pendingRequests.size();
}

int64_t ResponseCorrelator::getDiscardedCount() {
  lock_guard<std::mutex> guard(correlatorMutex);
  return discardedCount;
}
}  // namespace tvh
