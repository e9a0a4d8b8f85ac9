#ifndef __TVH_CANCELLATION_TOKEN__
#define __TVH_CANCELLATION_TOKEN__

#include "Headers.hpp"

namespace tvh {
/**
 * @brief Cooperative cancellation flag shared between a caller and the work
 * it started.
 *
 * A token created with parents also reports cancellation once any ancestor
 * has been cancelled.  Blocking waits check the token at least every
 * CANCELLATION_POLL_MS.
 */
class CancellationToken {
 public:
  CancellationToken() : cancelled(false) {}
  explicit CancellationToken(shared_ptr<CancellationToken> parent)
      : cancelled(false) {
    if (parent.get() != NULL) {
      parents.push_back(parent);
    }
  }
  CancellationToken(shared_ptr<CancellationToken> first,
                    shared_ptr<CancellationToken> second)
      : cancelled(false) {
    if (first.get() != NULL) {
      parents.push_back(first);
    }
    if (second.get() != NULL) {
      parents.push_back(second);
    }
  }

  inline void cancel() { cancelled = true; }

  inline bool isCancelled() const {
    if (cancelled) {
      return true;
    }
    for (const auto& parent : parents) {
      if (parent->isCancelled()) {
        return true;
      }
    }
    return false;
  }

  /** @brief Convenience for callers that do not want to cancel anything. */
  static shared_ptr<CancellationToken> none() {
    return shared_ptr<CancellationToken>(new CancellationToken());
  }

 protected:
  std::atomic<bool> cancelled;
  vector<shared_ptr<CancellationToken>> parents;
};
}  // namespace tvh

#endif  // __TVH_CANCELLATION_TOKEN__
