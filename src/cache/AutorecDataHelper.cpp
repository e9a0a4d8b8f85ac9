#include "AutorecDataHelper.hpp"

#include "HtspErrors.hpp"

namespace tvh {
AutorecDataHelper::AutorecDataHelper(
    shared_ptr<ChannelDataHelper> _channelHelper)
    : channelHelper(_channelHelper), rules("autorec entry") {}

void AutorecDataHelper::clean() { rules.clean(); }

void AutorecDataHelper::autorecEntryAdd(const HtspMessage& message) {
  AutorecEntry rule = parseAutorecEntry(message);
  VLOG(2) << "autorecEntryAdd " << rule.id() << " '" << rule.title() << "'";
  rules.add(rule.id(), rule);
}

void AutorecDataHelper::autorecEntryUpdate(const HtspMessage& message) {
  AutorecEntry delta = parseAutorecEntry(message);
  VLOG(2) << "autorecEntryUpdate " << delta.id();
  rules.update(delta.id(), delta);
}

void AutorecDataHelper::autorecEntryDelete(const HtspMessage& message) {
  AutorecEntry rule = parseAutorecEntry(message);
  VLOG(2) << "autorecEntryDelete " << rule.id();
  rules.remove(rule.id());
}

vector<SeriesTimerInfo> AutorecDataHelper::buildSeriesTimerSnapshot() {
  vector<SeriesTimerInfo> retval;
  for (const auto& rule : rules.snapshot()) {
    SeriesTimerInfo info;
    *info.mutable_rule() = rule;
    if (rule.has_channel()) {
      info.set_channel_name(channelHelper->getChannelName(rule.channel()));
    }
    retval.push_back(info);
  }
  return retval;
}

AutorecEntry AutorecDataHelper::parseAutorecEntry(const HtspMessage& message) {
  // Older servers send the id as an integer; getString renders it either way.
  string id = message.getString("id", "");
  if (id.empty()) {
    throw ProtocolError("Autorec message without id: " + message.toString());
  }
  AutorecEntry rule;
  rule.set_id(id);
  if (message.hasField("enabled")) {
    rule.set_enabled(message.getS64("enabled", 0) != 0);
  }
  if (message.hasField("title")) {
    rule.set_title(message.getString("title", ""));
  }
  if (message.hasField("name")) {
    rule.set_name(message.getString("name", ""));
  }
  if (message.hasField("channel")) {
    rule.set_channel(uint32_t(message.getS64("channel", 0)));
  }
  if (message.hasField("minDuration")) {
    rule.set_min_duration(uint32_t(message.getS64("minDuration", 0)));
  }
  if (message.hasField("maxDuration")) {
    rule.set_max_duration(uint32_t(message.getS64("maxDuration", 0)));
  }
  if (message.hasField("daysOfWeek")) {
    rule.set_days_of_week(uint32_t(message.getS64("daysOfWeek", 0)));
  }
  if (message.hasField("approxTime")) {
    rule.set_approx_time(int32_t(message.getS64("approxTime", 0)));
  }
  if (message.hasField("start")) {
    rule.set_start(int32_t(message.getS64("start", 0)));
  }
  if (message.hasField("startWindow")) {
    rule.set_start_window(int32_t(message.getS64("startWindow", 0)));
  }
  if (message.hasField("startExtra")) {
    rule.set_start_extra(message.getS64("startExtra", 0));
  }
  if (message.hasField("stopExtra")) {
    rule.set_stop_extra(message.getS64("stopExtra", 0));
  }
  if (message.hasField("priority")) {
    rule.set_priority(uint32_t(message.getS64("priority", 0)));
  }
  if (message.hasField("retention")) {
    rule.set_retention(uint32_t(message.getS64("retention", 0)));
  }
  if (message.hasField("creator")) {
    rule.set_creator(message.getString("creator", ""));
  }
  if (message.hasField("comment")) {
    rule.set_comment(message.getString("comment", ""));
  }
  return rule;
}
}  // namespace tvh
