#ifndef __TVH_TCP_SOCKET_HANDLER__
#define __TVH_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace tvh {
/**
 * @brief Implements IPv4/IPv6 client sockets built on top of UnixSocketHandler.
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects non-blockingly to the server.
   */
  virtual int connect(const SocketEndpoint& endpoint);

 protected:
  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace tvh

#endif  // __TVH_TCP_SOCKET_HANDLER__
