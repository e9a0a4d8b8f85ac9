#define CATCH_CONFIG_RUNNER

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tvh;

int main(int argc, char **argv) {
  srand(1);

  // Setup easylogging configurations
  el::Configurations defaultConf =
      tvh::LogHandler::setupLogHandler(&argc, &argv);
  tvh::LogHandler::setupStdoutLogger();

  tvh::HandleTerminate();

  // Writes to a socketpair whose peer is gone must fail, not kill the runner.
  ::signal(SIGPIPE, SIG_IGN);

  string logDirectoryPattern =
      GetTempDirectory() + string("tvhsync_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  tvh::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log");

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
