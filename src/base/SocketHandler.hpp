#ifndef __TVH_SOCKET_HANDLER__
#define __TVH_SOCKET_HANDLER__

#include "Headers.hpp"
#include "HtspCodec.hpp"
#include "SocketEndpoint.hpp"

namespace tvh {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most sec/usec until fd is readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  inline bool hasData(int fd) { return waitForData(fd, 0, 0); }
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads one length-prefixed message from the socket.
   * @throws ProtocolError on an invalid length or body,
   * std::runtime_error when the socket fails.
   */
  HtspMessage readMessage(int fd, bool timeout);

  /**
   * @brief Serializes and writes a length-prefixed message.
   */
  void writeMessage(int fd, const HtspMessage& message, bool timeout);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace tvh

#endif  // __TVH_SOCKET_HANDLER__
