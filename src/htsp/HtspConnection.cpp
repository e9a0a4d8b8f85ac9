#include "HtspConnection.hpp"

#include <openssl/sha.h>

namespace tvh {
HtspConnection::HtspConnection(shared_ptr<SocketHandler> _socketHandler,
                               HtspConnectionListener* _listener,
                               const string& _clientName,
                               const string& _clientVersion)
    : socketHandler(_socketHandler),
      listener(_listener),
      clientName(_clientName),
      clientVersion(_clientVersion),
      correlator(new ResponseCorrelator()),
      socketFd(-1),
      connected(false),
      authenticated(false),
      failed(false),
      shuttingDown(false) {}

HtspConnection::~HtspConnection() {
  if (!shuttingDown) {
    stop();
  }
}

void HtspConnection::open(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  if (socketFd != -1 || shuttingDown) {
    throw ConnectionError("Connection can only be opened once");
  }
  LOG(INFO) << "Connecting to " << endpoint;
  int fd = socketHandler->connect(endpoint);
  if (fd == -1) {
    failed = true;
    throw ConnectionError("Could not connect to " + endpoint.getName() + ":" +
                          to_string(endpoint.getPort()));
  }

  try {
    HtspMessage hello("hello");
    hello.putS64("htspversion", HTSP_PROTOCOL_VERSION);
    hello.putString("clientname", clientName);
    hello.putString("clientversion", clientVersion);
    hello.putS64("seq", correlator->nextSequenceNumber());
    socketHandler->writeMessage(fd, hello, true);

    HtspMessage reply = socketHandler->readMessage(fd, true);
    if (reply.hasField("error")) {
      throw ConnectionError("Server rejected hello: " +
                            reply.getString("error", ""));
    }
    challenge = reply.getBin("challenge");
    serverInfo.set_name(reply.getString("servername", ""));
    serverInfo.set_version(reply.getString("serverversion", ""));
    serverInfo.set_protocol_version(reply.getInt("htspversion", 0));
    for (const auto& capability : reply.getStringList("servercapability")) {
      serverInfo.add_capabilities(capability);
    }
  } catch (const std::runtime_error& err) {
    socketHandler->close(fd);
    failed = true;
    throw ConnectionError(string("Handshake failed: ") + err.what());
  }

  LOG(INFO) << "Connected to " << serverInfo.name() << " "
            << serverInfo.version() << " (HTSP v"
            << serverInfo.protocol_version() << ")";
  socketFd = fd;
  connected = true;
  receiveThread.reset(new std::thread(&HtspConnection::receiveLoop, this));
}

bool HtspConnection::authenticate(const string& username,
                                  const string& password) {
  std::chrono::milliseconds handshakeWait(HANDSHAKE_TIMEOUT_SECONDS * 1000);
  try {
    HtspMessage request("authenticate");
    request.putString("username", username);
    request.putBin("digest", computeDigest(password));
    HtspMessage response;
    if (!sendAndWait(request, &response, CancellationToken::none(),
                     handshakeWait)) {
      LOG(ERROR) << "No reply to authenticate from the server";
      return false;
    }
    if (response.getInt("noaccess", 0) == 1) {
      LOG(ERROR) << "Access denied for user '" << username << "'";
      return false;
    }

    HtspMessage diskRequest("getDiskSpace");
    HtspMessage diskResponse;
    if (sendAndWait(diskRequest, &diskResponse, CancellationToken::none(),
                    handshakeWait)) {
      lock_guard<std::recursive_mutex> guard(connectionMutex);
      serverInfo.set_free_disk_space(diskResponse.getS64("freediskspace", 0));
      serverInfo.set_total_disk_space(
          diskResponse.getS64("totaldiskspace", 0));
    } else {
      LOG(WARNING) << "No reply to getDiskSpace, disk space is unknown";
    }
  } catch (const ConnectionError& err) {
    LOG(ERROR) << "Authentication failed: " << err.what();
    return false;
  }

  lock_guard<std::recursive_mutex> guard(connectionMutex);
  authenticated = true;
  LOG(INFO) << "Authenticated as '" << username << "'";
  return true;
}

void HtspConnection::startAsyncMetadata() {
  HtspMessage request("enableAsyncMetadata");
  sendMessage(request, shared_ptr<HtspResponseHandler>());
}

void HtspConnection::sendMessage(HtspMessage message,
                                 shared_ptr<HtspResponseHandler> handler) {
  int fd;
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (!connected || failed || socketFd == -1) {
      throw ConnectionError("Not connected, cannot send '" +
                            message.getMethod() + "'");
    }
    fd = socketFd;
  }

  if (!message.hasField("seq")) {
    message.putS64("seq", correlator->nextSequenceNumber());
  }
  int64_t seq = message.getS64("seq", 0);
  if (handler.get()) {
    correlator->registerRequest(seq, handler);
  }

  try {
    lock_guard<std::mutex> guard(writeMutex);
    VLOG(2) << "Sending '" << message.getMethod() << "' seq " << seq;
    socketHandler->writeMessage(fd, message, true);
  } catch (const std::runtime_error& err) {
    if (handler.get()) {
      correlator->unregisterRequest(seq);
    }
    fail(string("Write failed: ") + err.what());
    throw ConnectionError(string("Could not send '") + message.getMethod() +
                          "': " + err.what());
  }
}

bool HtspConnection::sendAndWait(const HtspMessage& request,
                                 HtspMessage* response,
                                 shared_ptr<CancellationToken> token,
                                 std::chrono::milliseconds maxWait) {
  HtspMessage message = request;
  if (!message.hasField("seq")) {
    message.putS64("seq", correlator->nextSequenceNumber());
  }
  int64_t seq = message.getS64("seq", 0);
  shared_ptr<LoopBackResponseHandler> handler(new LoopBackResponseHandler());
  sendMessage(message, handler);
  if (!handler->waitForResponse(response, token, maxWait)) {
    // A late reply is then discarded by the correlator.
    correlator->unregisterRequest(seq);
    return false;
  }
  return true;
}

bool HtspConnection::needsRestart() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return failed || shuttingDown;
}

bool HtspConnection::isConnected() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return connected && !failed;
}

bool HtspConnection::isAuthenticated() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return authenticated && connected && !failed;
}

void HtspConnection::stop() {
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (shuttingDown) {
      return;
    }
    LOG(INFO) << "Shutting down HTSP connection";
    shuttingDown = true;
    connected = false;
  }
  if (receiveThread.get()) {
    receiveThread->join();
    receiveThread.reset();
  }
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (socketFd != -1) {
      socketHandler->close(socketFd);
      socketFd = -1;
    }
  }
  correlator->abandonAll();
}

ServerInfo HtspConnection::getServerInfo() {
  lock_guard<std::recursive_mutex> guard(connectionMutex);
  return serverInfo;
}

void HtspConnection::receiveLoop() {
  el::Helpers::setThreadName("htsp-receive");
  VLOG(1) << "Receive loop started";
  while (true) {
    int fd;
    {
      lock_guard<std::recursive_mutex> guard(connectionMutex);
      if (shuttingDown || failed || socketFd == -1) {
        break;
      }
      fd = socketFd;
    }
    try {
      if (!socketHandler->waitForData(fd, 0, CANCELLATION_POLL_MS * 1000)) {
        continue;
      }
      HtspMessage message = socketHandler->readMessage(fd, true);
      VLOG(3) << "Received " << message;
      correlator->dispatch(message);
    } catch (const std::runtime_error& err) {
      {
        lock_guard<std::recursive_mutex> guard(connectionMutex);
        if (shuttingDown) {
          break;
        }
      }
      fail(err.what());
      break;
    }
  }
  VLOG(1) << "Receive loop finished";
}

void HtspConnection::fail(const string& reason) {
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    if (failed || shuttingDown) {
      return;
    }
    LOG(ERROR) << "HTSP connection failed: " << reason;
    failed = true;
    connected = false;
  }
  correlator->abandonAll();
  if (listener != NULL) {
    listener->onError(reason);
  }
}

string HtspConnection::computeDigest(const string& password) {
  string input;
  {
    lock_guard<std::recursive_mutex> guard(connectionMutex);
    input = password + challenge;
  }
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1((const unsigned char*)input.data(), input.size(), digest);
  return string((const char*)digest, SHA_DIGEST_LENGTH);
}
}  // namespace tvh
