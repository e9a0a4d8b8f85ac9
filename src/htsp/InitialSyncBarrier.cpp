#include "InitialSyncBarrier.hpp"

namespace tvh {
string syncStateName(SyncState state) {
  switch (state) {
    case SYNC_DISCONNECTED:
      return "Disconnected";
    case SYNC_CONNECTED:
      return "Connected";
    case SYNC_IN_PROGRESS:
      return "SyncInProgress";
    case SYNC_COMPLETE:
      return "SyncComplete";
  }
  return "Unknown";
}

void InitialSyncBarrier::reset() { setState(SYNC_DISCONNECTED); }

void InitialSyncBarrier::markConnected() { setState(SYNC_CONNECTED); }

void InitialSyncBarrier::beginSync() {
  {
    lock_guard<std::mutex> guard(barrierMutex);
    generation++;
  }
  setState(SYNC_IN_PROGRESS);
}

bool InitialSyncBarrier::complete() {
  {
    lock_guard<std::mutex> guard(barrierMutex);
    if (state != SYNC_IN_PROGRESS) {
      LOG(WARNING) << "Ignoring sync completed marker in state "
                   << syncStateName(state);
      return false;
    }
  }
  setState(SYNC_COMPLETE);
  return true;
}

SyncState InitialSyncBarrier::getState() {
  lock_guard<std::mutex> guard(barrierMutex);
  return state;
}

int64_t InitialSyncBarrier::getGeneration() {
  lock_guard<std::mutex> guard(barrierMutex);
  return generation;
}

bool InitialSyncBarrier::waitForCompletion(std::chrono::milliseconds ceiling,
                                           shared_ptr<CancellationToken> token) {
  auto deadline = std::chrono::steady_clock::now() + ceiling;
  std::unique_lock<std::mutex> guard(barrierMutex);
  while (state != SYNC_COMPLETE) {
    if (token->isCancelled()) {
      VLOG(1) << "Stopped waiting for the initial sync: cancelled";
      return false;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      LOG(WARNING) << "Initial sync did not complete within "
                   << ceiling.count() << " ms";
      return false;
    }
    auto slice = min(std::chrono::steady_clock::duration(
                         std::chrono::milliseconds(CANCELLATION_POLL_MS)),
                     deadline - now);
    barrierCondition.wait_for(guard, slice);
  }
  return true;
}

void InitialSyncBarrier::setState(SyncState newState) {
  {
    lock_guard<std::mutex> guard(barrierMutex);
    if (state == newState) {
      return;
    }
    LOG(INFO) << "Initial sync: " << syncStateName(state) << " -> "
              << syncStateName(newState);
    state = newState;
  }
  barrierCondition.notify_all();
}
}  // namespace tvh
