#ifndef __TVH_SESSION_CONFIG__
#define __TVH_SESSION_CONFIG__

#include "Headers.hpp"
#include "HtspErrors.hpp"

namespace tvh {
const int DEFAULT_RECORDING_PRIORITY = 2;
const int DEFAULT_WORKER_THREADS = 8;

/**
 * @brief Connection and recording settings handed to a LiveTvSession.
 */
class SessionConfig {
 public:
  SessionConfig();

  /**
   * @brief Reads an INI file with [Server], [Account], [Recording] and
   * [Timeouts] sections.  Missing keys keep their defaults.
   * @throws ConfigurationError if the file cannot be parsed.
   */
  static SessionConfig loadFromFile(const string& path);

  /**
   * @brief Checks that the session can be started with these settings.
   * @throws ConfigurationError naming the first missing or invalid setting.
   */
  void validate() const;

  /** @brief The configured priority, or the default when out of range. */
  int getEffectivePriority() const;

  string serverName;
  int htspPort;
  int httpPort;
  string username;
  string password;
  int priority;
  string profile;
  int operationTimeoutSeconds;
  int initialSyncTimeoutSeconds;
  int workerThreads;
};
}  // namespace tvh

#endif  // __TVH_SESSION_CONFIG__
