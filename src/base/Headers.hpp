#ifndef __TVH_HEADERS__
#define __TVH_HEADERS__

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "Htsp.pb.h"
#include "ThreadPool.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// The HTSP protocol version announced in the hello message
static const int HTSP_PROTOCOL_VERSION = 25;

// Default ports of the backend
const int DEFAULT_HTSP_PORT = 9982;
const int DEFAULT_HTTP_PORT = 9981;

// Every supervised operation gives up after this many seconds.
const int DEFAULT_OPERATION_TIMEOUT_SECONDS = 5 * 60;
// The initial catalog replay may take a long time on large installations.
const int DEFAULT_INITIAL_SYNC_TIMEOUT_SECONDS = 15 * 60;
// Bound on every handshake round trip (hello, authenticate, getDiskSpace).
const int HANDSHAKE_TIMEOUT_SECONDS = 10;
// Cancellation is observed at least this often by blocking waits.
const int CANCELLATION_POLL_MS = 100;

// Largest frame we accept from the wire.
const int64_t MAX_FRAME_SIZE = 128 * 1024 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef TVH_VERSION
#define TVH_VERSION "unknown"
#endif

inline int GetErrno() { return errno; }

namespace tvh {
inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}

/** @brief Seconds since the epoch, the unit every HTSP timestamp uses. */
inline int64_t nowEpochSeconds() { return int64_t(time(NULL)); }
}  // namespace tvh

#endif
