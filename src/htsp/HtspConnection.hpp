#ifndef __TVH_HTSP_CONNECTION__
#define __TVH_HTSP_CONNECTION__

#include "CancellationToken.hpp"
#include "Headers.hpp"
#include "HtspErrors.hpp"
#include "LoopBackResponseHandler.hpp"
#include "ResponseCorrelator.hpp"
#include "SocketHandler.hpp"

namespace tvh {
/**
 * @brief Told about transport failures.  Invoked on the thread that saw the
 * failure (usually the receive loop) after the connection has marked itself
 * as failed.
 */
class HtspConnectionListener {
 public:
  virtual ~HtspConnectionListener() {}

  virtual void onError(const string& error) = 0;
};

/**
 * @brief One HTSP session over a single socket.
 *
 * open() performs the hello exchange and then starts the receive loop, which
 * is the only reader of the socket and the only caller of the correlator's
 * dispatch.  A connection that failed is never repaired: needsRestart()
 * turns true and the owner builds a new one.
 */
class HtspConnection {
 public:
  HtspConnection(shared_ptr<SocketHandler> _socketHandler,
                 HtspConnectionListener* _listener, const string& _clientName,
                 const string& _clientVersion);

  virtual ~HtspConnection();

  /**
   * @brief Connects and performs the hello exchange.
   * @throws ConnectionError when the server is unreachable or the
   * handshake fails.
   */
  void open(const SocketEndpoint& endpoint);

  /**
   * @brief Sends the credentials and fetches the disk space.  On failure the
   * session stays open but unauthenticated.
   */
  bool authenticate(const string& username, const string& password);

  /** @brief Asks the server to start pushing its catalog. */
  void startAsyncMetadata();

  /**
   * @brief Sends a request.  The reply is delivered to `handler`; a null
   * handler sends without waiting for a reply.
   * @throws ConnectionError when the connection is down or the write fails.
   */
  void sendMessage(HtspMessage message,
                   shared_ptr<HtspResponseHandler> handler);

  /**
   * @brief Sends a request and blocks for its reply.
   * @return false on cancellation or when `maxWait` elapsed first.
   * @throws ConnectionError when the request could not be sent.
   */
  bool sendAndWait(const HtspMessage& request, HtspMessage* response,
                   shared_ptr<CancellationToken> token,
                   std::chrono::milliseconds maxWait);

  /** @brief True once the transport can no longer carry traffic. */
  bool needsRestart();
  bool isConnected();
  bool isAuthenticated();

  /**
   * @brief Stops the receive loop and closes the socket.  Joins the receive
   * thread, so it must not be called from a listener callback.
   */
  void stop();

  inline shared_ptr<ResponseCorrelator> getCorrelator() { return correlator; }

  ServerInfo getServerInfo();

 protected:
  void receiveLoop();
  /** @brief Marks the connection failed and reports to the listener. */
  void fail(const string& reason);
  string computeDigest(const string& password);

  shared_ptr<SocketHandler> socketHandler;
  HtspConnectionListener* listener;
  string clientName;
  string clientVersion;
  shared_ptr<ResponseCorrelator> correlator;
  int socketFd;
  bool connected;
  bool authenticated;
  bool failed;
  bool shuttingDown;
  string challenge;
  ServerInfo serverInfo;
  shared_ptr<std::thread> receiveThread;
  recursive_mutex connectionMutex;
  std::mutex writeMutex;
};
}  // namespace tvh

#endif  // __TVH_HTSP_CONNECTION__
