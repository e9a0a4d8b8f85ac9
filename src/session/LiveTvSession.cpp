#include "LiveTvSession.hpp"

namespace tvh {
namespace {
const char* CLIENT_NAME = "tvhsync";
}

LiveTvSession::LiveTvSession(const SessionConfig& _config,
                             shared_ptr<SocketHandler> _socketHandler)
    : config(_config),
      socketHandler(_socketHandler),
      sessionToken(new CancellationToken()),
      barrier(new InitialSyncBarrier()),
      tunerHelper(new TunerDataHelper()),
      recordingsChangedPending(false),
      nextStreamId(0) {
  config.validate();
  config.priority = config.getEffectivePriority();
  channelHelper.reset(new ChannelDataHelper(tunerHelper));
  dvrHelper.reset(new DvrDataHelper(channelHelper));
  autorecHelper.reset(new AutorecDataHelper(channelHelper));
  pool.reset(new ThreadPool(config.workerThreads));
  timeoutRunner.reset(new TimeoutRunner(
      pool, std::chrono::seconds(config.operationTimeoutSeconds)));
  callbackPool.reset(new ThreadPool(1));
  LOG(INFO) << "Session for " << config.username << "@" << config.serverName
            << ":" << config.htspPort << " created";
}

LiveTvSession::~LiveTvSession() {
  shutdown();
  // Callbacks may still run supervised operations.
  callbackPool.reset();
  timeoutRunner.reset();
  // Joins the workers.
  pool.reset();
}

void LiveTvSession::onError(const string& error) {
  LOG(WARNING) << "Lost the session to " << config.serverName << ": "
               << error;
  barrier->reset();
  shared_ptr<HtspConnection> failedConnection;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    failedConnection = connection;
    connection.reset();
  }
  if (failedConnection.get()) {
    // stop() joins the receive thread, which is the one calling us.
    runOnCallbackThread([failedConnection]() { failedConnection->stop(); });
  }
  SessionCallback callback;
  {
    lock_guard<std::mutex> guard(callbackMutex);
    callback = dataSourceChanged;
  }
  fireCallback(callback);
}

void LiveTvSession::setRecordingStatusChangedCallback(SessionCallback callback) {
  lock_guard<std::mutex> guard(callbackMutex);
  recordingStatusChanged = callback;
}

void LiveTvSession::setDataSourceChangedCallback(SessionCallback callback) {
  lock_guard<std::mutex> guard(callbackMutex);
  dataSourceChanged = callback;
}

bool LiveTvSession::ensureConnected() {
  lock_guard<std::mutex> ensureGuard(ensureMutex);
  if (sessionToken->isCancelled()) {
    return false;
  }
  shared_ptr<HtspConnection> current = getConnection();
  if (current.get() && !current->needsRestart() &&
      current->isAuthenticated()) {
    return true;
  }

  if (current.get()) {
    LOG(INFO) << "Session needs a restart, recreating it";
    current->stop();
    lock_guard<std::mutex> guard(connectionMutex);
    connection.reset();
  }
  barrier->reset();

  shared_ptr<HtspConnection> newConnection(
      new HtspConnection(socketHandler, this, CLIENT_NAME, TVH_VERSION));
  subscribeHandlers(newConnection->getCorrelator());
  try {
    newConnection->open(SocketEndpoint(config.serverName, config.htspPort));
  } catch (const ConnectionError& err) {
    LOG(ERROR) << err.what();
    return false;
  }
  barrier->markConnected();

  if (!newConnection->authenticate(config.username, config.password)) {
    newConnection->stop();
    barrier->reset();
    return false;
  }

  // The server pushes nothing before enableAsyncMetadata.
  cleanCaches();
  barrier->beginSync();
  {
    lock_guard<std::mutex> guard(connectionMutex);
    connection = newConnection;
  }
  try {
    newConnection->startAsyncMetadata();
  } catch (const ConnectionError& err) {
    LOG(ERROR) << "Could not start the catalog replay: " << err.what();
    return false;
  }
  return true;
}

vector<Channel> LiveTvSession::getChannels(
    shared_ptr<CancellationToken> token) {
  return supervisedSnapshot<Channel>(
      "getChannels", [this]() { return channelHelper->buildChannelSnapshot(); },
      token);
}

vector<RecordingInfo> LiveTvSession::getRecordings(
    shared_ptr<CancellationToken> token) {
  return supervisedSnapshot<RecordingInfo>(
      "getRecordings",
      [this]() { return dvrHelper->buildRecordingSnapshot(); }, token);
}

vector<RecordingInfo> LiveTvSession::getTimers(
    shared_ptr<CancellationToken> token) {
  return supervisedSnapshot<RecordingInfo>(
      "getTimers", [this]() { return dvrHelper->buildTimerSnapshot(); },
      token);
}

vector<SeriesTimerInfo> LiveTvSession::getSeriesTimers(
    shared_ptr<CancellationToken> token) {
  return supervisedSnapshot<SeriesTimerInfo>(
      "getSeriesTimers",
      [this]() { return autorecHelper->buildSeriesTimerSnapshot(); }, token);
}

vector<TunerInput> LiveTvSession::getTuners(
    shared_ptr<CancellationToken> token) {
  return supervisedSnapshot<TunerInput>(
      "getTuners", [this]() { return tunerHelper->buildTunerSnapshot(); },
      token);
}

vector<ProgramEvent> LiveTvSession::getPrograms(
    uint32_t channelId, int64_t startTime, int64_t endTime,
    shared_ptr<CancellationToken> token) {
  std::function<vector<ProgramEvent>(shared_ptr<CancellationToken>)>
      operation = [this, channelId, startTime,
                   endTime](shared_ptr<CancellationToken> opToken) {
        vector<ProgramEvent> retval;
        if (!waitForReadyCatalog(opToken)) {
          return retval;
        }
        HtspMessage request("getEvents");
        request.putS64("channelId", channelId);
        request.putS64("maxTime", endTime);
        HtspMessage response;
        if (!sendRequest(request, &response, opToken)) {
          return retval;
        }
        for (const auto& eventMessage : response.getMessageList("events")) {
          ProgramEvent event = parseProgramEvent(eventMessage);
          if (event.start() >= startTime && event.stop() <= endTime) {
            retval.push_back(event);
          }
        }
        std::sort(retval.begin(), retval.end(),
                  [](const ProgramEvent& a, const ProgramEvent& b) {
                    if (a.start() != b.start()) {
                      return a.start() < b.start();
                    }
                    return a.id() < b.id();
                  });
        VLOG(1) << "getEvents for channel " << channelId << ": "
                << retval.size() << " events in range";
        return retval;
      };
  return supervise<vector<ProgramEvent>>("getPrograms", operation, token,
                                         vector<ProgramEvent>());
}

StatusInfo LiveTvSession::getStatusInfo(shared_ptr<CancellationToken> token) {
  std::function<StatusInfo(shared_ptr<CancellationToken>)> operation =
      [this](shared_ptr<CancellationToken> opToken) {
        StatusInfo status;
        if (!waitForReadyCatalog(opToken)) {
          return status;
        }
        shared_ptr<HtspConnection> current = getConnection();
        if (current.get() == NULL) {
          return status;
        }
        ServerInfo server = current->getServerInfo();
        *status.mutable_server() = server;
        ostringstream versionMessage;
        versionMessage << server.name() << " " << server.version()
                       << ", HTSP protocol version "
                       << server.protocol_version() << ", free disk space "
                       << server.free_disk_space() << " bytes";
        status.set_version_message(versionMessage.str());
        for (const auto& tuner : tunerHelper->buildTunerSnapshot()) {
          *status.add_tuners() = tuner;
        }
        status.set_status(SERVICE_OK);
        return status;
      };
  return supervise<StatusInfo>("getStatusInfo", operation, token,
                               StatusInfo());
}

void LiveTvSession::deleteRecording(uint32_t recordingId,
                                    shared_ptr<CancellationToken> token) {
  HtspMessage request("deleteDvrEntry");
  request.putS64("id", recordingId);
  runMutation("deleteRecording", request, token);
}

void LiveTvSession::cancelTimer(uint32_t timerId,
                                shared_ptr<CancellationToken> token) {
  HtspMessage request("cancelDvrEntry");
  request.putS64("id", timerId);
  runMutation("cancelTimer", request, token);
}

void LiveTvSession::createTimer(const TimerRequest& info,
                                shared_ptr<CancellationToken> token) {
  HtspMessage request("addDvrEntry");
  request.putS64("channelId", info.channel_id());
  request.putS64("start", info.start());
  request.putS64("stop", info.stop());
  // The server counts padding in minutes.
  request.putS64("startExtra", info.pre_padding_seconds() / 60);
  request.putS64("stopExtra", info.post_padding_seconds() / 60);
  request.putS64("priority", config.priority);
  if (!config.profile.empty()) {
    request.putString("configName", config.profile);
  }
  request.putString("description", info.description());
  request.putString("title", info.title());
  request.putString("creator", config.username);
  runMutation("createTimer", request, token);
}

void LiveTvSession::updateTimer(const TimerRequest& info,
                                shared_ptr<CancellationToken> token) {
  HtspMessage request("updateDvrEntry");
  request.putS64("id", info.id());
  request.putS64("startExtra", info.pre_padding_seconds() / 60);
  request.putS64("stopExtra", info.post_padding_seconds() / 60);
  runMutation("updateTimer", request, token);
}

namespace {
void putSeriesFields(const SeriesTimerRequest& info, int priority,
                     const string& profile, HtspMessage* request) {
  request->putString("title", info.title());
  if (info.has_channel_id()) {
    request->putS64("channelId", info.channel_id());
  }
  request->putS64("enabled", info.enabled() ? 1 : 0);
  request->putS64("minDuration", info.min_duration());
  request->putS64("maxDuration", info.max_duration());
  request->putS64("daysOfWeek", info.days_of_week());
  if (info.has_start()) {
    request->putS64("approxTime", info.start());
    request->putS64("start", info.start());
  }
  if (info.has_start_window()) {
    request->putS64("startWindow", info.start_window());
  }
  request->putS64("startExtra", info.pre_padding_seconds() / 60);
  request->putS64("stopExtra", info.post_padding_seconds() / 60);
  request->putS64("priority", priority);
  if (!profile.empty()) {
    request->putString("configName", profile);
  }
  request->putString("comment", info.comment());
}
}  // namespace

void LiveTvSession::createSeriesTimer(const SeriesTimerRequest& info,
                                      shared_ptr<CancellationToken> token) {
  HtspMessage request("addAutorecEntry");
  putSeriesFields(info, config.priority, config.profile,
                  &request);
  request.putString("creator", config.username);
  runMutation("createSeriesTimer", request, token);
}

void LiveTvSession::updateSeriesTimer(const SeriesTimerRequest& info,
                                      shared_ptr<CancellationToken> token) {
  HtspMessage request("updateAutorecEntry");
  request.putString("id", info.id());
  putSeriesFields(info, config.priority, config.profile,
                  &request);
  runMutation("updateSeriesTimer", request, token);
}

void LiveTvSession::cancelSeriesTimer(const string& ruleId,
                                      shared_ptr<CancellationToken> token) {
  HtspMessage request("deleteAutorecEntry");
  request.putString("id", ruleId);
  runMutation("cancelSeriesTimer", request, token);
}

PlaybackTicket LiveTvSession::getChannelStream(
    uint32_t channelId, shared_ptr<CancellationToken> token) {
  HtspMessage request("getTicket");
  request.putS64("channelId", channelId);
  return requestTicket("getChannelStream", request, token);
}

PlaybackTicket LiveTvSession::getRecordingStream(
    uint32_t recordingId, shared_ptr<CancellationToken> token) {
  HtspMessage request("getTicket");
  request.putS64("dvrId", recordingId);
  return requestTicket("getRecordingStream", request, token);
}

void LiveTvSession::shutdown() {
  sessionToken->cancel();
  lock_guard<std::mutex> ensureGuard(ensureMutex);
  shared_ptr<HtspConnection> current;
  {
    lock_guard<std::mutex> guard(connectionMutex);
    current = connection;
    connection.reset();
  }
  if (current.get()) {
    current->stop();
  }
  barrier->reset();
}

ProgramEvent LiveTvSession::parseProgramEvent(const HtspMessage& message) {
  ProgramEvent event;
  event.set_id(uint32_t(message.getS64("eventId", 0)));
  event.set_channel_id(uint32_t(message.getS64("channelId", 0)));
  event.set_start(message.getS64("start", 0));
  event.set_stop(message.getS64("stop", 0));
  event.set_title(message.getString("title", ""));
  if (message.hasField("subtitle")) {
    event.set_subtitle(message.getString("subtitle", ""));
  }
  if (message.hasField("summary")) {
    event.set_summary(message.getString("summary", ""));
  }
  if (message.hasField("description")) {
    event.set_description(message.getString("description", ""));
  }
  if (message.hasField("contentType")) {
    event.set_content_type(uint32_t(message.getS64("contentType", 0)));
  }
  if (message.hasField("ageRating")) {
    event.set_age_rating(uint32_t(message.getS64("ageRating", 0)));
  }
  if (message.hasField("seasonNumber")) {
    event.set_season_number(uint32_t(message.getS64("seasonNumber", 0)));
  }
  if (message.hasField("episodeNumber")) {
    event.set_episode_number(uint32_t(message.getS64("episodeNumber", 0)));
  }
  if (message.hasField("nextEventId")) {
    event.set_next_event_id(uint32_t(message.getS64("nextEventId", 0)));
  }
  return event;
}

bool LiveTvSession::waitForReadyCatalog(shared_ptr<CancellationToken> token) {
  if (!ensureConnected()) {
    return false;
  }
  return barrier->waitForCompletion(
      std::chrono::seconds(config.initialSyncTimeoutSeconds), token);
}

bool LiveTvSession::sendRequest(const HtspMessage& request,
                                HtspMessage* response,
                                shared_ptr<CancellationToken> token) {
  if (!ensureConnected()) {
    return false;
  }
  shared_ptr<HtspConnection> current = getConnection();
  if (current.get() == NULL) {
    return false;
  }
  // The operation timeout bounds this wait through the token.
  return current->sendAndWait(request, response, token,
                              std::chrono::milliseconds(-1));
}

void LiveTvSession::runMutation(const string& name, const HtspMessage& request,
                                shared_ptr<CancellationToken> token) {
  std::function<bool(shared_ptr<CancellationToken>)> operation =
      [this, name, request](shared_ptr<CancellationToken> opToken) {
        if (!waitForReadyCatalog(opToken)) {
          return false;
        }
        HtspMessage response;
        if (!sendRequest(request, &response, opToken)) {
          return false;
        }
        if (response.getInt("success", 0) != 1) {
          LOG(ERROR) << name << " failed: '"
                     << response.getString("error", "") << "'";
          return false;
        }
        LOG(INFO) << name << " succeeded";
        return true;
      };
  supervise<bool>(name, operation, token, false);
}

PlaybackTicket LiveTvSession::requestTicket(
    const string& name, const HtspMessage& request,
    shared_ptr<CancellationToken> token) {
  std::function<PlaybackTicket(shared_ptr<CancellationToken>)> operation =
      [this, request](shared_ptr<CancellationToken> opToken) {
        PlaybackTicket ticket;
        if (!waitForReadyCatalog(opToken)) {
          return ticket;
        }
        HtspMessage response;
        if (!sendRequest(request, &response, opToken)) {
          return ticket;
        }
        if (!response.hasField("ticket")) {
          LOG(ERROR) << "getTicket failed: '"
                     << response.getString("error", "") << "'";
          return ticket;
        }
        int32_t streamId;
        {
          lock_guard<std::mutex> guard(streamMutex);
          if (nextStreamId == INT32_MAX) {
            nextStreamId = 0;
          }
          streamId = nextStreamId++;
        }
        ticket.set_stream_id(to_string(streamId));
        ticket.set_path(response.getString("path", ""));
        ticket.set_ticket(response.getString("ticket", ""));
        ticket.set_url("http://" + config.serverName + ":" +
                       to_string(config.httpPort) + ticket.path() +
                       "?ticket=" + ticket.ticket());
        return ticket;
      };
  return supervise<PlaybackTicket>(name, operation, token, PlaybackTicket());
}

void LiveTvSession::subscribeHandlers(
    shared_ptr<ResponseCorrelator> correlator) {
  correlator->subscribe("channelAdd", [this](const HtspMessage& message) {
    channelHelper->channelAdd(message);
  });
  correlator->subscribe("channelUpdate", [this](const HtspMessage& message) {
    channelHelper->channelUpdate(message);
  });
  correlator->subscribe("channelDelete", [this](const HtspMessage& message) {
    channelHelper->channelDelete(message);
  });

  correlator->subscribe("dvrEntryAdd", [this](const HtspMessage& message) {
    dvrHelper->dvrEntryAdd(message);
    notifyRecordingsChanged();
  });
  correlator->subscribe("dvrEntryUpdate", [this](const HtspMessage& message) {
    dvrHelper->dvrEntryUpdate(message);
    notifyRecordingsChanged();
  });
  correlator->subscribe("dvrEntryDelete", [this](const HtspMessage& message) {
    dvrHelper->dvrEntryDelete(message);
    notifyRecordingsChanged();
  });

  correlator->subscribe("autorecEntryAdd", [this](const HtspMessage& message) {
    autorecHelper->autorecEntryAdd(message);
    notifyRecordingsChanged();
  });
  correlator->subscribe("autorecEntryUpdate",
                        [this](const HtspMessage& message) {
                          autorecHelper->autorecEntryUpdate(message);
                          notifyRecordingsChanged();
                        });
  correlator->subscribe("autorecEntryDelete",
                        [this](const HtspMessage& message) {
                          autorecHelper->autorecEntryDelete(message);
                          notifyRecordingsChanged();
                        });

  correlator->subscribe("initialSyncCompleted",
                        [this](const HtspMessage& message) {
                          barrier->complete();
                        });
  // tag* and event* pushes are dropped by the correlator.
}

void LiveTvSession::cleanCaches() {
  LOG(INFO) << "Clearing the entity caches";
  channelHelper->clean();
  dvrHelper->clean();
  autorecHelper->clean();
}

void LiveTvSession::notifyRecordingsChanged() {
  if (recordingsChangedPending.exchange(true)) {
    return;
  }
  bool queued = runOnCallbackThread([this]() {
    recordingsChangedPending = false;
    SessionCallback callback;
    {
      lock_guard<std::mutex> guard(callbackMutex);
      callback = recordingStatusChanged;
    }
    if (callback && !sessionToken->isCancelled()) {
      callback();
    }
  });
  if (!queued) {
    recordingsChangedPending = false;
  }
}

void LiveTvSession::fireCallback(const SessionCallback& callback) {
  if (!callback || sessionToken->isCancelled()) {
    return;
  }
  runOnCallbackThread(callback);
}

bool LiveTvSession::runOnCallbackThread(std::function<void()> task) {
  // Never on the receive thread.
  try {
    callbackPool->enqueue(task);
  } catch (const std::runtime_error& err) {
    LOG(WARNING) << "Could not queue a session callback: " << err.what();
    return false;
  }
  return true;
}

shared_ptr<HtspConnection> LiveTvSession::getConnection() {
  lock_guard<std::mutex> guard(connectionMutex);
  return connection;
}
}  // namespace tvh
