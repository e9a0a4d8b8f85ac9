#ifndef __TVH_HTSP_ERRORS__
#define __TVH_HTSP_ERRORS__

#include "Headers.hpp"

namespace tvh {
/**
 * @brief Required connection settings are missing.  Never retried.
 */
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The backend is unreachable or refused the handshake.
 */
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief A frame could not be decoded or did not fit the protocol.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const string& what) : std::runtime_error(what) {}
};
}  // namespace tvh

#endif  // __TVH_HTSP_ERRORS__
