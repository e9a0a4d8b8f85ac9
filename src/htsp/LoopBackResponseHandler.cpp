#include "LoopBackResponseHandler.hpp"

namespace tvh {
void LoopBackResponseHandler::handleResponse(const HtspMessage& response) {
  {
    lock_guard<std::mutex> guard(responseMutex);
    message = response;
    received = true;
  }
  responseCondition.notify_all();
}

bool LoopBackResponseHandler::waitForResponse(
    HtspMessage* response, shared_ptr<CancellationToken> token,
    std::chrono::milliseconds maxWait) {
  auto start = std::chrono::steady_clock::now();
  std::unique_lock<std::mutex> guard(responseMutex);
  while (!received) {
    if (token->isCancelled()) {
      VLOG(1) << "Stopped waiting for a response: cancelled";
      return false;
    }
    std::chrono::milliseconds slice(CANCELLATION_POLL_MS);
    if (maxWait.count() >= 0) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      if (elapsed >= maxWait) {
        VLOG(1) << "Stopped waiting for a response after " << elapsed.count()
                << " ms";
        return false;
      }
      slice = min(slice, maxWait - elapsed);
    }
    responseCondition.wait_for(guard, slice);
  }
  *response = message;
  return true;
}
}  // namespace tvh
