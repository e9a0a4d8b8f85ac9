#ifndef __TVH_LOOP_BACK_RESPONSE_HANDLER__
#define __TVH_LOOP_BACK_RESPONSE_HANDLER__

#include "CancellationToken.hpp"
#include "Headers.hpp"
#include "ResponseCorrelator.hpp"

namespace tvh {
/**
 * @brief One-shot handler that parks the reply until a caller picks it up.
 * Turns the asynchronous request path into a blocking call.
 */
class LoopBackResponseHandler : public HtspResponseHandler {
 public:
  LoopBackResponseHandler() : received(false) {}
  virtual ~LoopBackResponseHandler() {}

  virtual void handleResponse(const HtspMessage& response);

  /**
   * @brief Blocks until the reply arrives, the token is cancelled or
   * `maxWait` elapses.  A negative `maxWait` waits without a deadline.
   * @return true when `response` was filled in.
   */
  bool waitForResponse(HtspMessage* response,
                       shared_ptr<CancellationToken> token,
                       std::chrono::milliseconds maxWait);

 protected:
  std::mutex responseMutex;
  std::condition_variable responseCondition;
  bool received;
  HtspMessage message;
};
}  // namespace tvh

#endif  // __TVH_LOOP_BACK_RESPONSE_HANDLER__
