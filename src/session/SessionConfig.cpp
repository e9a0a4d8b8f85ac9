#include "SessionConfig.hpp"

#include "SimpleIni.h"

namespace tvh {
SessionConfig::SessionConfig()
    : htspPort(DEFAULT_HTSP_PORT),
      httpPort(DEFAULT_HTTP_PORT),
      priority(DEFAULT_RECORDING_PRIORITY),
      operationTimeoutSeconds(DEFAULT_OPERATION_TIMEOUT_SECONDS),
      initialSyncTimeoutSeconds(DEFAULT_INITIAL_SYNC_TIMEOUT_SECONDS),
      workerThreads(DEFAULT_WORKER_THREADS) {}

SessionConfig SessionConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, true, true);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc != SI_OK) {
    throw ConfigurationError("Invalid config file: " + path);
  }

  SessionConfig config;
  config.serverName = ini.GetValue("Server", "host", "");
  config.htspPort = int(ini.GetLongValue("Server", "htspport", config.htspPort));
  config.httpPort = int(ini.GetLongValue("Server", "httpport", config.httpPort));
  config.workerThreads =
      int(ini.GetLongValue("Server", "workers", config.workerThreads));
  config.username = ini.GetValue("Account", "user", "");
  config.password = ini.GetValue("Account", "password", "");
  config.priority =
      int(ini.GetLongValue("Recording", "priority", config.priority));
  config.profile = ini.GetValue("Recording", "profile", "");
  config.operationTimeoutSeconds = int(ini.GetLongValue(
      "Timeouts", "operation", config.operationTimeoutSeconds));
  config.initialSyncTimeoutSeconds = int(ini.GetLongValue(
      "Timeouts", "initialsync", config.initialSyncTimeoutSeconds));
  LOG(INFO) << "Loaded config from " << path << " for server "
            << config.serverName;
  return config;
}

void SessionConfig::validate() const {
  if (serverName.empty()) {
    throw ConfigurationError("No server name configured");
  }
  if (username.empty()) {
    throw ConfigurationError("No username configured");
  }
  if (password.empty()) {
    throw ConfigurationError("No password configured");
  }
  if (htspPort <= 0 || htspPort > 65535) {
    throw ConfigurationError("Invalid HTSP port: " + to_string(htspPort));
  }
  if (httpPort <= 0 || httpPort > 65535) {
    throw ConfigurationError("Invalid HTTP port: " + to_string(httpPort));
  }
  if (operationTimeoutSeconds <= 0 || initialSyncTimeoutSeconds <= 0) {
    throw ConfigurationError("Timeouts must be positive");
  }
  if (workerThreads <= 0) {
    throw ConfigurationError("Need at least one worker thread");
  }
}

int SessionConfig::getEffectivePriority() const {
  if (priority < 0 || priority > 4) {
    LOG(INFO) << "Recording priority " << priority
              << " is out of range, using " << DEFAULT_RECORDING_PRIORITY;
    return DEFAULT_RECORDING_PRIORITY;
  }
  return priority;
}
}  // namespace tvh
