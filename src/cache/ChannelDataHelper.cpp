#include "ChannelDataHelper.hpp"

#include "HtspErrors.hpp"

namespace tvh {
ChannelDataHelper::ChannelDataHelper(shared_ptr<TunerDataHelper> _tunerHelper)
    : tunerHelper(_tunerHelper), channels("channel") {}

void ChannelDataHelper::clean() {
  channels.clean();
  tunerHelper->clean();
}

void ChannelDataHelper::channelAdd(const HtspMessage& message) {
  Channel channel = parseChannel(message);
  VLOG(2) << "channelAdd " << channel.id() << " '" << channel.name() << "'";
  channels.add(channel.id(), channel);
  tunerHelper->setChannelTuners(channel.id(), parseTuners(message));
}

void ChannelDataHelper::channelUpdate(const HtspMessage& message) {
  Channel delta = parseChannel(message);
  VLOG(2) << "channelUpdate " << delta.id();
  vector<string> replacedLists;
  if (message.hasField("tags")) {
    replacedLists.push_back("tag_ids");
  }
  if (message.hasField("services")) {
    replacedLists.push_back("tuner_names");
  }
  channels.update(delta.id(), delta, replacedLists);
  if (message.hasField("services")) {
    tunerHelper->setChannelTuners(delta.id(), parseTuners(message));
  }
}

void ChannelDataHelper::channelDelete(const HtspMessage& message) {
  Channel channel = parseChannel(message);
  VLOG(2) << "channelDelete " << channel.id();
  channels.remove(channel.id());
  tunerHelper->removeChannel(channel.id());
}

vector<Channel> ChannelDataHelper::buildChannelSnapshot() {
  vector<Channel> retval = channels.snapshot();
  std::sort(retval.begin(), retval.end(),
            [](const Channel& a, const Channel& b) {
              if (a.number() != b.number()) {
                return a.number() < b.number();
              }
              if (a.number_minor() != b.number_minor()) {
                return a.number_minor() < b.number_minor();
              }
              return a.id() < b.id();
            });
  return retval;
}

string ChannelDataHelper::getChannelName(uint32_t channelId) {
  Channel channel;
  if (!channels.get(channelId, &channel)) {
    return "";
  }
  return channel.name();
}

Channel ChannelDataHelper::parseChannel(const HtspMessage& message) {
  if (!message.hasField("channelId")) {
    throw ProtocolError("Channel message without channelId: " +
                        message.toString());
  }
  Channel channel;
  channel.set_id(uint32_t(message.getS64("channelId", 0)));
  if (message.hasField("channelNumber")) {
    channel.set_number(uint32_t(message.getS64("channelNumber", 0)));
  }
  if (message.hasField("channelNumberMinor")) {
    channel.set_number_minor(
        uint32_t(message.getS64("channelNumberMinor", 0)));
  }
  if (message.hasField("channelName")) {
    channel.set_name(message.getString("channelName", ""));
  }
  if (message.hasField("channelIcon")) {
    channel.set_icon(message.getString("channelIcon", ""));
  }
  if (message.hasField("eventId")) {
    channel.set_event_id(uint32_t(message.getS64("eventId", 0)));
  }
  if (message.hasField("nextEventId")) {
    channel.set_next_event_id(uint32_t(message.getS64("nextEventId", 0)));
  }
  for (int64_t tag : message.getS64List("tags")) {
    channel.add_tag_ids(uint32_t(tag));
  }
  for (const auto& service : message.getMessageList("services")) {
    channel.add_tuner_names(service.getString("name", ""));
  }
  return channel;
}

vector<TunerInput> ChannelDataHelper::parseTuners(const HtspMessage& message) {
  vector<TunerInput> retval;
  for (const auto& service : message.getMessageList("services")) {
    TunerInput tuner;
    tuner.set_name(service.getString("name", ""));
    if (service.hasField("type")) {
      tuner.set_type(service.getString("type", ""));
    }
    retval.push_back(tuner);
  }
  return retval;
}
}  // namespace tvh
