#include <cxxopts.hpp>

#include "Headers.hpp"
#include "LiveTvSession.hpp"
#include "LogHandler.hpp"
#include "TcpSocketHandler.hpp"

using namespace tvh;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

string formatTime(int64_t epochSeconds) {
  time_t rawtime = time_t(epochSeconds);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M", localtime(&rawtime));
  return string(buffer);
}

string statusName(RecordingStatus status) {
  switch (status) {
    case RECORDING_COMPLETED:
      return "completed";
    case RECORDING_IN_PROGRESS:
      return "recording";
    case RECORDING_ERROR:
      return "error";
    case RECORDING_SCHEDULED:
      return "scheduled";
  }
  return "unknown";
}

void printRecordings(const vector<RecordingInfo>& recordings) {
  for (const auto& info : recordings) {
    CLOG(INFO, "stdout") << info.entry().id() << "\t"
                         << formatTime(info.entry().start()) << "\t"
                         << statusName(info.status()) << "\t"
                         << info.channel_name() << "\t"
                         << info.entry().title() << endl;
  }
}

int runCommand(LiveTvSession* session, const string& command,
               const cxxopts::ParseResult& result) {
  shared_ptr<CancellationToken> token(new CancellationToken());
  if (command == "channels") {
    for (const auto& channel : session->getChannels(token)) {
      CLOG(INFO, "stdout") << channel.number() << "."
                           << channel.number_minor() << "\t" << channel.id()
                           << "\t" << channel.name() << endl;
    }
  } else if (command == "recordings") {
    printRecordings(session->getRecordings(token));
  } else if (command == "timers") {
    printRecordings(session->getTimers(token));
  } else if (command == "series") {
    for (const auto& info : session->getSeriesTimers(token)) {
      CLOG(INFO, "stdout") << info.rule().id() << "\t"
                           << (info.rule().enabled() ? "enabled" : "disabled")
                           << "\t" << info.channel_name() << "\t"
                           << info.rule().title() << endl;
    }
  } else if (command == "tuners") {
    for (const auto& tuner : session->getTuners(token)) {
      CLOG(INFO, "stdout") << tuner.name() << "\t" << tuner.type() << "\t"
                           << tuner.channel_ids_size() << " channels" << endl;
    }
  } else if (command == "status") {
    StatusInfo status = session->getStatusInfo(token);
    if (status.status() != SERVICE_OK) {
      CLOG(INFO, "stdout") << "Backend unavailable" << endl;
      return 1;
    }
    CLOG(INFO, "stdout") << status.version_message() << endl;
    for (const auto& capability : status.server().capabilities()) {
      CLOG(INFO, "stdout") << "  " << capability << endl;
    }
  } else if (command == "programs") {
    if (!result.count("channel")) {
      CLOG(INFO, "stdout") << "--channel is required for programs" << endl;
      return 1;
    }
    int64_t now = nowEpochSeconds();
    int64_t end = now + int64_t(result["hours"].as<int>()) * 3600;
    for (const auto& event :
         session->getPrograms(result["channel"].as<uint32_t>(), now, end,
                              token)) {
      CLOG(INFO, "stdout") << formatTime(event.start()) << " - "
                           << formatTime(event.stop()) << "\t" << event.title()
                           << endl;
    }
  } else if (command == "ticket") {
    PlaybackTicket ticket;
    if (result.count("recording")) {
      ticket = session->getRecordingStream(result["recording"].as<uint32_t>(),
                                           token);
    } else if (result.count("channel")) {
      ticket =
          session->getChannelStream(result["channel"].as<uint32_t>(), token);
    } else {
      CLOG(INFO, "stdout") << "--channel or --recording is required" << endl;
      return 1;
    }
    if (ticket.ticket().empty()) {
      CLOG(INFO, "stdout") << "No ticket" << endl;
      return 1;
    }
    CLOG(INFO, "stdout") << ticket.url() << endl;
  } else {
    CLOG(INFO, "stdout") << "Unknown command: " << command << endl;
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tvh::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tvh::InterruptSignalHandler);

  int retval = 0;
  cxxopts::Options options("tvhclient",
                           "Query and schedule recordings on a TV backend");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("host", "Backend host name",
         cxxopts::value<std::string>())  //
        ("port", "Backend HTSP port",
         cxxopts::value<int>())  //
        ("httpport", "Backend HTTP port used for stream URLs",
         cxxopts::value<int>())  //
        ("user", "User name",
         cxxopts::value<std::string>())  //
        ("password", "Password",
         cxxopts::value<std::string>())  //
        ("command",
         "One of channels, recordings, timers, series, tuners, status, "
         "programs, ticket",
         cxxopts::value<std::string>()->default_value("status"))  //
        ("channel", "Channel id for programs and ticket",
         cxxopts::value<uint32_t>())  //
        ("recording", "Recording id for ticket",
         cxxopts::value<uint32_t>())  //
        ("hours", "How many hours of guide data to list",
         cxxopts::value<int>()->default_value("6"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("logtostdout", "Write log to stdout")      //
        ("logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(GetTempDirectory()));

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tvhclient version " << TVH_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "tvhclient", result.count("logtostdout"));
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("client-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    SessionConfig config;
    string cfgfile = result["cfgfile"].as<string>();
    if (!cfgfile.empty()) {
      config = SessionConfig::loadFromFile(cfgfile);
    }
    if (result.count("host")) {
      config.serverName = result["host"].as<string>();
    }
    if (result.count("port")) {
      config.htspPort = result["port"].as<int>();
    }
    if (result.count("httpport")) {
      config.httpPort = result["httpport"].as<int>();
    }
    if (result.count("user")) {
      config.username = result["user"].as<string>();
    }
    if (result.count("password")) {
      config.password = result["password"].as<string>();
    }

    shared_ptr<SocketHandler> socketHandler(new TcpSocketHandler());
    LiveTvSession session(config, socketHandler);
    retval = runCommand(&session, result["command"].as<string>(), result);
    session.shutdown();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const ConfigurationError& ce) {
    CLOG(INFO, "stdout") << "Configuration error: " << ce.what() << endl;
    retval = 1;
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  google::protobuf::ShutdownProtobufLibrary();
  return retval;
}
