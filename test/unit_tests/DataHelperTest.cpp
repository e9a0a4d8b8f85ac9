#include "AutorecDataHelper.hpp"
#include "ChannelDataHelper.hpp"
#include "DvrDataHelper.hpp"
#include "FakeHtspServer.hpp"
#include "HtspErrors.hpp"
#include "TestHeaders.hpp"
#include "TunerDataHelper.hpp"

using namespace tvh;

namespace {
struct Helpers {
  Helpers()
      : tuners(new TunerDataHelper()),
        channels(new ChannelDataHelper(tuners)),
        dvr(new DvrDataHelper(channels)),
        autorec(new AutorecDataHelper(channels)) {}

  shared_ptr<TunerDataHelper> tuners;
  shared_ptr<ChannelDataHelper> channels;
  shared_ptr<DvrDataHelper> dvr;
  shared_ptr<AutorecDataHelper> autorec;
};

HtspMessage makeAutorec(const string& method, const string& id,
                        const string& title) {
  HtspMessage message(method);
  message.putString("id", id);
  message.putString("title", title);
  message.putS64("enabled", 1);
  message.putS64("channel", 1);
  return message;
}
}  // namespace

TEST_CASE("Channels are listed by number", "[ChannelDataHelper]") {
  Helpers helpers;
  helpers.channels->channelAdd(makeChannelAdd(3, 20, "Three", {}));
  helpers.channels->channelAdd(makeChannelAdd(1, 5, "One", {}));
  HtspMessage minor = makeChannelAdd(2, 5, "One Plus", {});
  minor.putS64("channelNumberMinor", 1);
  helpers.channels->channelAdd(minor);

  vector<Channel> channels = helpers.channels->buildChannelSnapshot();
  REQUIRE(channels.size() == 3);
  REQUIRE(channels[0].id() == 1);
  REQUIRE(channels[1].id() == 2);
  REQUIRE(channels[2].id() == 3);
  REQUIRE(helpers.channels->getChannelName(2) == "One Plus");
  REQUIRE(helpers.channels->getChannelName(99) == "");
}

TEST_CASE("Channel updates keep unspecified fields", "[ChannelDataHelper]") {
  Helpers helpers;
  helpers.channels->channelAdd(makeChannelAdd(1, 5, "One", {"Tuner A"}));
  HtspMessage update("channelUpdate");
  update.putS64("channelId", 1);
  update.putS64("eventId", 777);
  helpers.channels->channelUpdate(update);

  vector<Channel> channels = helpers.channels->buildChannelSnapshot();
  REQUIRE(channels.size() == 1);
  REQUIRE(channels[0].name() == "One");
  REQUIRE(channels[0].event_id() == 777);
  REQUIRE(channels[0].tuner_names_size() == 1);
}

TEST_CASE("Tuners follow the services of their channels",
          "[TunerDataHelper]") {
  Helpers helpers;
  helpers.channels->channelAdd(
      makeChannelAdd(1, 1, "One", {"Tuner B", "Tuner A"}));
  helpers.channels->channelAdd(makeChannelAdd(2, 2, "Two", {"Tuner A"}));

  vector<TunerInput> tuners = helpers.tuners->buildTunerSnapshot();
  REQUIRE(tuners.size() == 2);
  REQUIRE(tuners[0].name() == "Tuner A");
  REQUIRE(tuners[0].channel_ids_size() == 2);
  REQUIRE(tuners[0].type() == "DVB-T");
  REQUIRE(tuners[1].name() == "Tuner B");

  HtspMessage remove("channelDelete");
  remove.putS64("channelId", 1);
  helpers.channels->channelDelete(remove);

  tuners = helpers.tuners->buildTunerSnapshot();
  REQUIRE(tuners.size() == 1);
  REQUIRE(tuners[0].name() == "Tuner A");
  REQUIRE(tuners[0].channel_ids_size() == 1);
  REQUIRE(tuners[0].channel_ids(0) == 2);

  HtspMessage moved("channelUpdate");
  moved.putS64("channelId", 2);
  HtspMessage service;
  service.putString("name", "Tuner C");
  moved.putMessageList("services", {service});
  helpers.channels->channelUpdate(moved);

  tuners = helpers.tuners->buildTunerSnapshot();
  REQUIRE(tuners.size() == 1);
  REQUIRE(tuners[0].name() == "Tuner C");
}

TEST_CASE("Scheduled entries are timers, the rest are recordings",
          "[DvrDataHelper]") {
  Helpers helpers;
  helpers.channels->channelAdd(makeChannelAdd(1, 1, "One", {}));
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 10, 1, "completed", 300));
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 11, 1, "recording", 100));
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 12, 2, "scheduled", 900));
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 13, 1, "missed", 200));

  vector<RecordingInfo> recordings = helpers.dvr->buildRecordingSnapshot();
  REQUIRE(recordings.size() == 3);
  REQUIRE(recordings[0].entry().id() == 11);
  REQUIRE(recordings[0].status() == RECORDING_IN_PROGRESS);
  REQUIRE(recordings[0].channel_name() == "One");
  REQUIRE(recordings[1].entry().id() == 13);
  REQUIRE(recordings[1].status() == RECORDING_ERROR);
  REQUIRE(recordings[2].entry().id() == 10);
  REQUIRE(recordings[2].status() == RECORDING_COMPLETED);

  vector<RecordingInfo> timers = helpers.dvr->buildTimerSnapshot();
  REQUIRE(timers.size() == 1);
  REQUIRE(timers[0].entry().id() == 12);
  REQUIRE(timers[0].status() == RECORDING_SCHEDULED);
  // Channel 2 was never announced.
  REQUIRE(timers[0].channel_name() == "");
}

TEST_CASE("A timer becomes a recording when its state changes",
          "[DvrDataHelper]") {
  Helpers helpers;
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 10, 1, "scheduled", 0));
  REQUIRE(helpers.dvr->buildTimerSnapshot().size() == 1);

  HtspMessage update("dvrEntryUpdate");
  update.putS64("id", 10);
  update.putString("state", "recording");
  helpers.dvr->dvrEntryUpdate(update);

  REQUIRE(helpers.dvr->buildTimerSnapshot().empty());
  vector<RecordingInfo> recordings = helpers.dvr->buildRecordingSnapshot();
  REQUIRE(recordings.size() == 1);
  REQUIRE(recordings[0].entry().title() == "Entry 10");
}

TEST_CASE("Recording status is derived from state and error",
          "[DvrDataHelper]") {
  DvrEntry entry;
  entry.set_state("completed");
  REQUIRE(DvrDataHelper::recordingStatus(entry) == RECORDING_COMPLETED);
  entry.set_state("invalid");
  REQUIRE(DvrDataHelper::recordingStatus(entry) == RECORDING_ERROR);
  entry.set_state("somethingNew");
  REQUIRE(DvrDataHelper::recordingStatus(entry) == RECORDING_COMPLETED);
  entry.set_error("File missing");
  REQUIRE(DvrDataHelper::recordingStatus(entry) == RECORDING_ERROR);
}

TEST_CASE("Deleted recordings disappear from the snapshot",
          "[DvrDataHelper]") {
  Helpers helpers;
  helpers.dvr->dvrEntryAdd(makeDvrEntry("dvrEntryAdd", 10, 1, "completed", 0));
  HtspMessage remove("dvrEntryDelete");
  remove.putS64("id", 10);
  helpers.dvr->dvrEntryDelete(remove);
  REQUIRE(helpers.dvr->buildRecordingSnapshot().empty());
  REQUIRE(helpers.dvr->getStats().deletes == 1);
}

TEST_CASE("Messages without an id are protocol errors", "[DvrDataHelper]") {
  Helpers helpers;
  HtspMessage broken("dvrEntryAdd");
  broken.putString("title", "No id");
  REQUIRE_THROWS_AS(helpers.dvr->dvrEntryAdd(broken), ProtocolError);
  REQUIRE_THROWS_AS(helpers.channels->channelAdd(HtspMessage("channelAdd")),
                    ProtocolError);
  REQUIRE_THROWS_AS(
      helpers.autorec->autorecEntryAdd(HtspMessage("autorecEntryAdd")),
      ProtocolError);
}

TEST_CASE("Rules are listed by id with their channel name",
          "[AutorecDataHelper]") {
  Helpers helpers;
  helpers.channels->channelAdd(makeChannelAdd(1, 1, "One", {}));
  helpers.autorec->autorecEntryAdd(
      makeAutorec("autorecEntryAdd", "b2", "Documentaries"));
  helpers.autorec->autorecEntryAdd(makeAutorec("autorecEntryAdd", "a1", "News"));

  HtspMessage update("autorecEntryUpdate");
  update.putString("id", "b2");
  update.putS64("enabled", 0);
  helpers.autorec->autorecEntryUpdate(update);

  vector<SeriesTimerInfo> rules = helpers.autorec->buildSeriesTimerSnapshot();
  REQUIRE(rules.size() == 2);
  REQUIRE(rules[0].rule().id() == "a1");
  REQUIRE(rules[0].channel_name() == "One");
  REQUIRE(rules[1].rule().id() == "b2");
  REQUIRE(rules[1].rule().title() == "Documentaries");
  REQUIRE_FALSE(rules[1].rule().enabled());

  HtspMessage remove("autorecEntryDelete");
  remove.putString("id", "a1");
  helpers.autorec->autorecEntryDelete(remove);
  REQUIRE(helpers.autorec->buildSeriesTimerSnapshot().size() == 1);
}

TEST_CASE("Integer rule ids read as strings", "[AutorecDataHelper]") {
  HtspMessage message("autorecEntryAdd");
  message.putS64("id", 42);
  REQUIRE(AutorecDataHelper::parseAutorecEntry(message).id() == "42");
}
