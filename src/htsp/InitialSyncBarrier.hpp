#ifndef __TVH_INITIAL_SYNC_BARRIER__
#define __TVH_INITIAL_SYNC_BARRIER__

#include "CancellationToken.hpp"
#include "Headers.hpp"

namespace tvh {
enum SyncState {
  SYNC_DISCONNECTED = 0,
  SYNC_CONNECTED = 1,
  SYNC_IN_PROGRESS = 2,
  SYNC_COMPLETE = 3,
};

string syncStateName(SyncState state);

/**
 * @brief Gate that keeps cache readers out until the server has finished
 * replaying its catalog to the current session.
 *
 * Only complete() opens the gate, and only while a sync is in progress.
 * Every waiter is woken when it opens or when the barrier is reset.
 */
class InitialSyncBarrier {
 public:
  InitialSyncBarrier() : state(SYNC_DISCONNECTED), generation(0) {}

  /** @brief Back to SYNC_DISCONNECTED.  Called when the session is lost. */
  void reset();
  void markConnected();
  /** @brief Enters SYNC_IN_PROGRESS.  The caches must be clean already. */
  void beginSync();
  /**
   * @brief Handles the sync completed marker.
   * @return false when no sync was in progress and the marker was ignored.
   */
  bool complete();

  SyncState getState();
  /** @brief Incremented on every sync that starts. */
  int64_t getGeneration();

  /**
   * @brief Blocks until the sync is complete, the token is cancelled or
   * `ceiling` elapses.
   * @return true only when the barrier is open.
   */
  bool waitForCompletion(std::chrono::milliseconds ceiling,
                         shared_ptr<CancellationToken> token);

 protected:
  void setState(SyncState newState);

  std::mutex barrierMutex;
  std::condition_variable barrierCondition;
  SyncState state;
  int64_t generation;
};
}  // namespace tvh

#endif  // __TVH_INITIAL_SYNC_BARRIER__
