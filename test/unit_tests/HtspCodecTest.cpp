#include "HtspCodec.hpp"
#include "HtspErrors.hpp"
#include "TestHeaders.hpp"

using namespace tvh;

namespace {
string field(uint8_t type, const string& name, const string& data) {
  string s;
  s.push_back(char(type));
  s.push_back(char(name.length()));
  s.push_back(char((data.length() >> 24) & 0xFF));
  s.push_back(char((data.length() >> 16) & 0xFF));
  s.push_back(char((data.length() >> 8) & 0xFF));
  s.push_back(char(data.length() & 0xFF));
  return s + name + data;
}
}  // namespace

TEST_CASE("Integers use the minimal little endian encoding", "[HtspCodec]") {
  HtspMessage message;
  message.putS64("zero", 0);
  REQUIRE(HtspCodec::serialize(message) == field(HMF_S64, "zero", ""));

  message = HtspMessage();
  message.putS64("seq", 0x0102);
  REQUIRE(HtspCodec::serialize(message) ==
          field(HMF_S64, "seq", string("\x02\x01", 2)));

  message = HtspMessage();
  message.putS64("neg", -1);
  REQUIRE(HtspCodec::serialize(message) ==
          field(HMF_S64, "neg", string(8, '\xff')));
  REQUIRE(HtspCodec::deserialize(HtspCodec::serialize(message))
              .getS64("neg", 0) == -1);
}

TEST_CASE("Decodes nested maps and lists", "[HtspCodec]") {
  string service = field(HMF_STR, "name", "Tuner A");
  string services = field(HMF_LIST, "services", field(HMF_MAP, "", service));
  string tags = field(HMF_LIST, "tags",
                      field(HMF_S64, "", "\x05") + field(HMF_S64, "", "\x07"));
  string body = field(HMF_STR, "method", "channelAdd") +
                field(HMF_S64, "channelId", "\x2a") + services + tags;

  HtspMessage message = HtspCodec::deserialize(body);
  REQUIRE(message.getMethod() == "channelAdd");
  REQUIRE(message.getS64("channelId", 0) == 42);
  vector<HtspMessage> serviceList = message.getMessageList("services");
  REQUIRE(serviceList.size() == 1);
  REQUIRE(serviceList[0].getString("name", "") == "Tuner A");
  REQUIRE(message.getS64List("tags") == vector<int64_t>({5, 7}));

  // Re-encoding yields the same bytes.
  REQUIRE(HtspCodec::serialize(message) == body);
}

TEST_CASE("Rejects malformed bodies", "[HtspCodec]") {
  string good = field(HMF_STR, "title", "News");

  SECTION("truncated header") {
    REQUIRE_THROWS_AS(HtspCodec::deserialize(good.substr(0, 4)),
                      ProtocolError);
  }
  SECTION("truncated data") {
    REQUIRE_THROWS_AS(HtspCodec::deserialize(good.substr(0, good.size() - 1)),
                      ProtocolError);
  }
  SECTION("unknown field type") {
    REQUIRE_THROWS_AS(HtspCodec::deserialize(field(9, "x", "abc")),
                      ProtocolError);
  }
  SECTION("oversized integer") {
    REQUIRE_THROWS_AS(HtspCodec::deserialize(field(HMF_S64, "x", string(9, 1))),
                      ProtocolError);
  }
}

TEST_CASE("Accessors convert between integers and strings", "[HtspMessage]") {
  HtspMessage message("autorecEntryAdd");
  message.putS64("id", 17);
  message.putString("count", "123");
  message.putString("title", "Film");

  REQUIRE(message.getString("id", "") == "17");
  REQUIRE(message.getS64("count", 0) == 123);
  REQUIRE(message.getS64("title", -5) == -5);
  REQUIRE(message.getString("missing", "default") == "default");

  message.putS64("id", 18);
  REQUIRE(message.getS64("id", 0) == 18);
  REQUIRE(message.getFields().size() == 4);

  message.removeField("title");
  REQUIRE_FALSE(message.hasField("title"));
}
