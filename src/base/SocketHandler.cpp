#include "SocketHandler.hpp"

namespace tvh {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    if (!waitForData(fd, 1, 0)) {
      time_t currentTime = time(NULL);
      if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
        throw std::runtime_error("Socket Timeout");
      }
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // Connection is closed.  Report it like a broken pipe.
      errno = EPIPE;
      bytesRead = -1;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        LOG(INFO) << "Got EAGAIN, waiting...";
      } else {
        VLOG(1) << "Failed a call to readAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to readAll");
      }
    } else {
      pos += bytesRead;
      startTime = time(NULL);
    }
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        // This is fine, just keep retrying at 10hz
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}

HtspMessage SocketHandler::readMessage(int fd, bool timeout) {
  unsigned char lengthBytes[4];
  readAll(fd, lengthBytes, sizeof(lengthBytes), timeout);
  int64_t length = (int64_t(lengthBytes[0]) << 24) |
                   (int64_t(lengthBytes[1]) << 16) |
                   (int64_t(lengthBytes[2]) << 8) | int64_t(lengthBytes[3]);
  if (length > MAX_FRAME_SIZE) {
    // If the message is too big, assume this is a bad packet and throw
    throw ProtocolError("Invalid size (>128 MB): " + to_string(length));
  }
  if (length == 0) {
    return HtspMessage();
  }
  string s(length, '\0');
  readAll(fd, &s[0], length, timeout);
  return HtspCodec::deserialize(s);
}

void SocketHandler::writeMessage(int fd, const HtspMessage& message,
                                 bool timeout) {
  string s = HtspCodec::serialize(message);
  int64_t length = s.length();
  if (length > MAX_FRAME_SIZE) {
    STFATAL << "Invalid message length: " << length;
  }
  // 4-byte big endian length, then the body
  string frame(4, '\0');
  frame[0] = char((length >> 24) & 0xFF);
  frame[1] = char((length >> 16) & 0xFF);
  frame[2] = char((length >> 8) & 0xFF);
  frame[3] = char(length & 0xFF);
  frame.append(s);
  writeAllOrThrow(fd, &frame[0], frame.length(), timeout);
}
}  // namespace tvh
