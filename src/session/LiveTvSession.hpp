#ifndef __TVH_LIVE_TV_SESSION__
#define __TVH_LIVE_TV_SESSION__

#include "AutorecDataHelper.hpp"
#include "CancellationToken.hpp"
#include "ChannelDataHelper.hpp"
#include "DvrDataHelper.hpp"
#include "Headers.hpp"
#include "HtspConnection.hpp"
#include "InitialSyncBarrier.hpp"
#include "SessionConfig.hpp"
#include "TimeoutRunner.hpp"
#include "TunerDataHelper.hpp"

namespace tvh {
typedef std::function<void()> SessionCallback;

/**
 * @brief Owns the HTSP session and the entity caches, and exposes the
 * backend as a set of supervised operations.
 *
 * Every public operation first makes sure an authenticated session exists,
 * then runs on the worker pool under the operation timeout.  Queries hand
 * back an empty result when the backend is unreachable, slow or the caller
 * cancelled; mutations only log their failures.  The constructor is the only
 * place that throws (ConfigurationError).
 */
class LiveTvSession : public HtspConnectionListener {
 public:
  LiveTvSession(const SessionConfig& _config,
                shared_ptr<SocketHandler> _socketHandler);
  virtual ~LiveTvSession();

  /**
   * @brief Called by the connection when its transport failed.  The failed
   * connection is detached at once and stopped on the callback thread.
   */
  virtual void onError(const string& error);

  /** @brief Fired after every recording or rule change pushed by the server. */
  void setRecordingStatusChangedCallback(SessionCallback callback);
  /** @brief Fired when the session to the backend was lost. */
  void setDataSourceChangedCallback(SessionCallback callback);

  /**
   * @brief Opens, authenticates and starts the catalog replay if there is no
   * healthy session.  Only one caller at a time performs the handshake.
   * @return false when the backend could not be reached or refused us.
   */
  bool ensureConnected();

  vector<Channel> getChannels(shared_ptr<CancellationToken> token);
  vector<RecordingInfo> getRecordings(shared_ptr<CancellationToken> token);
  vector<RecordingInfo> getTimers(shared_ptr<CancellationToken> token);
  vector<SeriesTimerInfo> getSeriesTimers(shared_ptr<CancellationToken> token);
  vector<TunerInput> getTuners(shared_ptr<CancellationToken> token);
  /**
   * @brief Guide events of a channel that lie completely inside
   * [startTime, endTime], ordered by start.
   */
  vector<ProgramEvent> getPrograms(uint32_t channelId, int64_t startTime,
                                   int64_t endTime,
                                   shared_ptr<CancellationToken> token);
  StatusInfo getStatusInfo(shared_ptr<CancellationToken> token);

  void deleteRecording(uint32_t recordingId,
                       shared_ptr<CancellationToken> token);
  void cancelTimer(uint32_t timerId, shared_ptr<CancellationToken> token);
  void createTimer(const TimerRequest& info,
                   shared_ptr<CancellationToken> token);
  void updateTimer(const TimerRequest& info,
                   shared_ptr<CancellationToken> token);
  void createSeriesTimer(const SeriesTimerRequest& info,
                         shared_ptr<CancellationToken> token);
  void updateSeriesTimer(const SeriesTimerRequest& info,
                         shared_ptr<CancellationToken> token);
  void cancelSeriesTimer(const string& ruleId,
                         shared_ptr<CancellationToken> token);

  PlaybackTicket getChannelStream(uint32_t channelId,
                                  shared_ptr<CancellationToken> token);
  PlaybackTicket getRecordingStream(uint32_t recordingId,
                                    shared_ptr<CancellationToken> token);

  /** @brief Stops the session and cancels every running operation. */
  void shutdown();

  inline const SessionConfig& getConfig() const { return config; }
  inline shared_ptr<InitialSyncBarrier> getSyncBarrier() { return barrier; }
  inline shared_ptr<ChannelDataHelper> getChannelHelper() {
    return channelHelper;
  }
  inline shared_ptr<TunerDataHelper> getTunerHelper() { return tunerHelper; }
  inline shared_ptr<DvrDataHelper> getDvrHelper() { return dvrHelper; }
  inline shared_ptr<AutorecDataHelper> getAutorecHelper() {
    return autorecHelper;
  }

  static ProgramEvent parseProgramEvent(const HtspMessage& message);

 protected:
  /**
   * @brief Runs `operation` under the operation timeout.  Timeouts,
   * cancellation and failures all yield `fallback`.
   */
  template <typename T>
  T supervise(const string& name,
              std::function<T(shared_ptr<CancellationToken>)> operation,
              shared_ptr<CancellationToken> callerToken, const T& fallback) {
    shared_ptr<CancellationToken> token(
        new CancellationToken(callerToken, sessionToken));
    if (token->isCancelled()) {
      LOG(INFO) << name << ": cancelled before it started";
      return fallback;
    }
    try {
      TimeoutResult<T> result =
          timeoutRunner->runWithTimeout<T>(operation, token);
      if (result.hasTimeout) {
        LOG(ERROR) << name << ": timed out";
        return fallback;
      }
      if (token->isCancelled()) {
        LOG(INFO) << name << ": cancelled";
        return fallback;
      }
      return result.result;
    } catch (const std::runtime_error& err) {
      LOG(ERROR) << name << ": " << err.what();
      return fallback;
    }
  }

  template <typename T>
  vector<T> supervisedSnapshot(const string& name,
                               std::function<vector<T>()> build,
                               shared_ptr<CancellationToken> callerToken) {
    std::function<vector<T>(shared_ptr<CancellationToken>)> operation =
        [this, build](shared_ptr<CancellationToken> token) {
          if (!waitForReadyCatalog(token)) {
            return vector<T>();
          }
          return build();
        };
    return supervise<vector<T>>(name, operation, callerToken, vector<T>());
  }

  /** @brief Connected and past the initial sync barrier. */
  bool waitForReadyCatalog(shared_ptr<CancellationToken> token);

  /**
   * @brief Sends a request on the current session and waits for the reply.
   * @throws ConnectionError when the request could not be sent.
   */
  bool sendRequest(const HtspMessage& request, HtspMessage* response,
                   shared_ptr<CancellationToken> token);

  /** @brief Sends a mutation and logs a failure reported by the server. */
  void runMutation(const string& name, const HtspMessage& request,
                   shared_ptr<CancellationToken> token);

  PlaybackTicket requestTicket(const string& name, const HtspMessage& request,
                               shared_ptr<CancellationToken> token);

  void subscribeHandlers(shared_ptr<ResponseCorrelator> correlator);
  void cleanCaches();
  /** @brief Coalesces a burst of recording deltas into one callback. */
  void notifyRecordingsChanged();
  void fireCallback(const SessionCallback& callback);
  /** @brief Queues work on the callback thread. */
  bool runOnCallbackThread(std::function<void()> task);
  shared_ptr<HtspConnection> getConnection();

  SessionConfig config;
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<CancellationToken> sessionToken;

  shared_ptr<InitialSyncBarrier> barrier;
  shared_ptr<TunerDataHelper> tunerHelper;
  shared_ptr<ChannelDataHelper> channelHelper;
  shared_ptr<DvrDataHelper> dvrHelper;
  shared_ptr<AutorecDataHelper> autorecHelper;

  std::mutex ensureMutex;
  std::mutex connectionMutex;
  shared_ptr<HtspConnection> connection;

  std::mutex callbackMutex;
  SessionCallback recordingStatusChanged;
  SessionCallback dataSourceChanged;
  std::atomic<bool> recordingsChangedPending;

  std::mutex streamMutex;
  int32_t nextStreamId;

  shared_ptr<ThreadPool> pool;
  shared_ptr<TimeoutRunner> timeoutRunner;
  // Callbacks and connection teardown, never shared with supervised work.
  shared_ptr<ThreadPool> callbackPool;
};
}  // namespace tvh

#endif  // __TVH_LIVE_TV_SESSION__
