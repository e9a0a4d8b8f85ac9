#include "SessionConfig.hpp"
#include "TestHeaders.hpp"

using namespace tvh;

namespace {
string writeConfigFile(const string& contents) {
  string path = (fs::temp_directory_path() /
                 ("tvhsync_config_" + to_string(::getpid()) + ".ini"))
                    .string();
  ofstream out(path);
  out << contents;
  return path;
}
}  // namespace

TEST_CASE("Loads settings from an ini file", "[SessionConfig]") {
  string path = writeConfigFile(
      "[Server]\n"
      "host = tv.example.lan\n"
      "htspport = 19982\n"
      "workers = 2\n"
      "\n"
      "[Account]\n"
      "user = kodi\n"
      "password = pa55\n"
      "\n"
      "[Recording]\n"
      "priority = 1\n"
      "profile = HD\n"
      "\n"
      "[Timeouts]\n"
      "operation = 30\n");
  SessionConfig config = SessionConfig::loadFromFile(path);
  fs::remove(path);

  REQUIRE(config.serverName == "tv.example.lan");
  REQUIRE(config.htspPort == 19982);
  REQUIRE(config.httpPort == DEFAULT_HTTP_PORT);
  REQUIRE(config.workerThreads == 2);
  REQUIRE(config.username == "kodi");
  REQUIRE(config.password == "pa55");
  REQUIRE(config.getEffectivePriority() == 1);
  REQUIRE(config.profile == "HD");
  REQUIRE(config.operationTimeoutSeconds == 30);
  REQUIRE(config.initialSyncTimeoutSeconds ==
          DEFAULT_INITIAL_SYNC_TIMEOUT_SECONDS);
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("A missing config file is a configuration error",
          "[SessionConfig]") {
  REQUIRE_THROWS_AS(
      SessionConfig::loadFromFile("/nonexistent/tvhsync/config.ini"),
      ConfigurationError);
}

TEST_CASE("Validation names the first bad setting", "[SessionConfig]") {
  SessionConfig config;
  config.serverName = "backend";
  config.username = "user";
  config.password = "secret";
  REQUIRE_NOTHROW(config.validate());

  SECTION("Missing server") {
    config.serverName = "";
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }
  SECTION("Missing user") {
    config.username = "";
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }
  SECTION("Bad port") {
    config.htspPort = 70000;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }
  SECTION("Zero timeout") {
    config.operationTimeoutSeconds = 0;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }
  SECTION("No workers") {
    config.workerThreads = 0;
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
  }
}

TEST_CASE("Out of range priorities fall back to the default",
          "[SessionConfig]") {
  SessionConfig config;
  REQUIRE(config.getEffectivePriority() == DEFAULT_RECORDING_PRIORITY);
  config.priority = 0;
  REQUIRE(config.getEffectivePriority() == 0);
  config.priority = 4;
  REQUIRE(config.getEffectivePriority() == 4);
  config.priority = 5;
  REQUIRE(config.getEffectivePriority() == DEFAULT_RECORDING_PRIORITY);
  config.priority = -1;
  REQUIRE(config.getEffectivePriority() == DEFAULT_RECORDING_PRIORITY);
}
