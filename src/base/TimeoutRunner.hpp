#ifndef __TVH_TIMEOUT_RUNNER__
#define __TVH_TIMEOUT_RUNNER__

#include "CancellationToken.hpp"
#include "Headers.hpp"

namespace tvh {
/**
 * @brief Outcome of a supervised operation.  `result` is default constructed
 * when `hasTimeout` is set.
 */
template <typename T>
struct TimeoutResult {
  TimeoutResult() : hasTimeout(true), result() {}

  bool hasTimeout;
  T result;
};

/**
 * @brief Races an operation running on a worker pool against a deadline.
 *
 * When the deadline wins, the operation's token is cancelled and its future
 * is dropped.  The operation is not interrupted: it keeps its worker thread
 * until it reaches its next cancellation check (or finishes) and whatever it
 * returns is discarded.  A network exchange already on the wire is never
 * aborted.
 */
class TimeoutRunner {
 public:
  TimeoutRunner(shared_ptr<ThreadPool> _pool,
                std::chrono::milliseconds _timeout)
      : pool(_pool), timeout(_timeout) {}

  /**
   * @brief Runs `operation` and waits for it for at most the deadline.
   * @param callerToken Parent of the token handed to the operation, so a
   * caller-side cancellation reaches the operation too.
   * @throws whatever the operation threw, when it finished in time.
   */
  template <typename T>
  TimeoutResult<T> runWithTimeout(
      std::function<T(shared_ptr<CancellationToken>)> operation,
      shared_ptr<CancellationToken> callerToken) {
    shared_ptr<CancellationToken> token(new CancellationToken(callerToken));
    std::future<T> future = pool->enqueue(operation, token);

    TimeoutResult<T> retval;
    if (future.wait_for(timeout) != std::future_status::ready) {
      token->cancel();
      LOG(WARNING) << "Operation did not finish within " << timeout.count()
                   << " ms, abandoning it";
      return retval;
    }
    retval.result = future.get();
    retval.hasTimeout = false;
    return retval;
  }

  inline std::chrono::milliseconds getTimeout() const { return timeout; }

 protected:
  shared_ptr<ThreadPool> pool;
  std::chrono::milliseconds timeout;
};
}  // namespace tvh

#endif  // __TVH_TIMEOUT_RUNNER__
