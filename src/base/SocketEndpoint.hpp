#ifndef __TVH_SOCKET_ENDPOINT__
#define __TVH_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace tvh {
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace tvh

#endif  // __TVH_SOCKET_ENDPOINT__
