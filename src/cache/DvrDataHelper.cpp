#include "DvrDataHelper.hpp"

#include "HtspErrors.hpp"

namespace tvh {
namespace {
const char* STATE_SCHEDULED = "scheduled";
}

DvrDataHelper::DvrDataHelper(shared_ptr<ChannelDataHelper> _channelHelper)
    : channelHelper(_channelHelper), entries("dvr entry") {}

void DvrDataHelper::clean() { entries.clean(); }

void DvrDataHelper::dvrEntryAdd(const HtspMessage& message) {
  DvrEntry entry = parseDvrEntry(message);
  VLOG(2) << "dvrEntryAdd " << entry.id() << " '" << entry.title() << "'";
  entries.add(entry.id(), entry);
}

void DvrDataHelper::dvrEntryUpdate(const HtspMessage& message) {
  DvrEntry delta = parseDvrEntry(message);
  VLOG(2) << "dvrEntryUpdate " << delta.id();
  entries.update(delta.id(), delta);
}

void DvrDataHelper::dvrEntryDelete(const HtspMessage& message) {
  DvrEntry entry = parseDvrEntry(message);
  VLOG(2) << "dvrEntryDelete " << entry.id();
  entries.remove(entry.id());
}

vector<RecordingInfo> DvrDataHelper::buildRecordingSnapshot() {
  return buildSnapshot(false);
}

vector<RecordingInfo> DvrDataHelper::buildTimerSnapshot() {
  return buildSnapshot(true);
}

vector<RecordingInfo> DvrDataHelper::buildSnapshot(bool scheduled) {
  vector<RecordingInfo> retval;
  for (const auto& entry : entries.snapshot()) {
    if ((entry.state() == STATE_SCHEDULED) != scheduled) {
      continue;
    }
    RecordingInfo info;
    *info.mutable_entry() = entry;
    info.set_channel_name(channelHelper->getChannelName(entry.channel()));
    info.set_status(scheduled ? RECORDING_SCHEDULED : recordingStatus(entry));
    retval.push_back(info);
  }
  std::sort(retval.begin(), retval.end(),
            [](const RecordingInfo& a, const RecordingInfo& b) {
              if (a.entry().start() != b.entry().start()) {
                return a.entry().start() < b.entry().start();
              }
              return a.entry().id() < b.entry().id();
            });
  return retval;
}

RecordingStatus DvrDataHelper::recordingStatus(const DvrEntry& entry) {
  if (entry.state() == "recording") {
    return RECORDING_IN_PROGRESS;
  }
  if (entry.state() == "completed") {
    return RECORDING_COMPLETED;
  }
  if (entry.state() == "missed" || entry.state() == "invalid" ||
      !entry.error().empty()) {
    return RECORDING_ERROR;
  }
  return RECORDING_COMPLETED;
}

DvrEntry DvrDataHelper::parseDvrEntry(const HtspMessage& message) {
  if (!message.hasField("id")) {
    throw ProtocolError("DVR message without id: " + message.toString());
  }
  DvrEntry entry;
  entry.set_id(uint32_t(message.getS64("id", 0)));
  if (message.hasField("channel")) {
    entry.set_channel(uint32_t(message.getS64("channel", 0)));
  }
  if (message.hasField("start")) {
    entry.set_start(message.getS64("start", 0));
  }
  if (message.hasField("stop")) {
    entry.set_stop(message.getS64("stop", 0));
  }
  if (message.hasField("startExtra")) {
    entry.set_start_extra(message.getS64("startExtra", 0));
  }
  if (message.hasField("stopExtra")) {
    entry.set_stop_extra(message.getS64("stopExtra", 0));
  }
  if (message.hasField("title")) {
    entry.set_title(message.getString("title", ""));
  }
  if (message.hasField("subtitle")) {
    entry.set_subtitle(message.getString("subtitle", ""));
  }
  if (message.hasField("summary")) {
    entry.set_summary(message.getString("summary", ""));
  }
  if (message.hasField("description")) {
    entry.set_description(message.getString("description", ""));
  }
  if (message.hasField("state")) {
    entry.set_state(message.getString("state", ""));
  }
  if (message.hasField("error")) {
    entry.set_error(message.getString("error", ""));
  }
  if (message.hasField("priority")) {
    entry.set_priority(uint32_t(message.getS64("priority", 0)));
  }
  if (message.hasField("retention")) {
    entry.set_retention(uint32_t(message.getS64("retention", 0)));
  }
  if (message.hasField("creator")) {
    entry.set_creator(message.getString("creator", ""));
  }
  if (message.hasField("path")) {
    entry.set_path(message.getString("path", ""));
  }
  if (message.hasField("autorecId")) {
    entry.set_autorec_id(message.getString("autorecId", ""));
  }
  if (message.hasField("eventId")) {
    entry.set_event_id(uint32_t(message.getS64("eventId", 0)));
  }
  if (message.hasField("contentType")) {
    entry.set_content_type(uint32_t(message.getS64("contentType", 0)));
  }
  return entry;
}
}  // namespace tvh
