#include "FakeHtspServer.hpp"
#include "HtspConnection.hpp"
#include "TestHeaders.hpp"

using namespace tvh;

namespace {
class RecordingListener : public HtspConnectionListener {
 public:
  virtual void onError(const string& error) {
    lock_guard<std::mutex> guard(listenerMutex);
    errors.push_back(error);
  }

  size_t errorCount() {
    lock_guard<std::mutex> guard(listenerMutex);
    return errors.size();
  }

  std::mutex listenerMutex;
  vector<string> errors;
};

const SocketEndpoint ENDPOINT("backend", DEFAULT_HTSP_PORT);
const std::chrono::milliseconds WAIT(5000);
}  // namespace

TEST_CASE("Performs the hello and authenticate handshake",
          "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  FakeHtspServer server(handler);
  server.start();
  RecordingListener listener;

  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  connection.open(ENDPOINT);
  REQUIRE(connection.isConnected());
  REQUIRE_FALSE(connection.isAuthenticated());

  ServerInfo info = connection.getServerInfo();
  REQUIRE(info.name() == "Fake Backend");
  REQUIRE(info.version() == "4.2.8");
  REQUIRE(info.protocol_version() == HTSP_PROTOCOL_VERSION);
  REQUIRE(info.capabilities_size() == 2);

  REQUIRE(connection.authenticate("user", "secret"));
  REQUIRE(connection.isAuthenticated());
  REQUIRE(connection.getServerInfo().free_disk_space() == 1000000);
  REQUIRE(connection.getServerInfo().total_disk_space() == 5000000);

  vector<HtspMessage> hellos = server.getRequests("hello");
  REQUIRE(hellos.size() == 1);
  REQUIRE(hellos[0].getString("clientname", "") == "tvhsync-test");
  REQUIRE(hellos[0].getInt("htspversion", 0) == HTSP_PROTOCOL_VERSION);
  vector<HtspMessage> auths = server.getRequests("authenticate");
  REQUIRE(auths.size() == 1);
  REQUIRE(auths[0].getString("username", "") == "user");

  connection.stop();
  REQUIRE(listener.errorCount() == 0);
}

TEST_CASE("A wrong password leaves the session unauthenticated",
          "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  FakeHtspServer server(handler);
  server.start();
  RecordingListener listener;

  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  connection.open(ENDPOINT);
  REQUIRE_FALSE(connection.authenticate("user", "wrong"));
  REQUIRE(connection.isConnected());
  REQUIRE_FALSE(connection.isAuthenticated());
  REQUIRE(server.getRequests("getDiskSpace").empty());
  connection.stop();
}

TEST_CASE("An unreachable server is a connection error", "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  RecordingListener listener;
  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  REQUIRE_THROWS_AS(connection.open(ENDPOINT), ConnectionError);
  REQUIRE(connection.needsRestart());
  REQUIRE_THROWS_AS(connection.sendMessage(HtspMessage("getDiskSpace"),
                                           shared_ptr<HtspResponseHandler>()),
                    ConnectionError);
}

TEST_CASE("Replies are matched even when the server reorders them",
          "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  FakeHtspServer server(handler);

  // Hold the first getTicket reply back until the second request arrived,
  // then answer both in reverse order.
  std::mutex heldMutex;
  vector<HtspMessage> held;
  server.setResponder([&](const HtspMessage& request, HtspMessage* reply) {
    lock_guard<std::mutex> guard(heldMutex);
    reply->putString("ticket",
                     "ticket-" + request.getString("channelId", ""));
    held.push_back(*reply);
    if (held.size() < 2) {
      return false;
    }
    server.push(held[1]);
    server.push(held[0]);
    return false;
  });
  server.start();
  RecordingListener listener;

  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  connection.open(ENDPOINT);
  REQUIRE(connection.authenticate("user", "secret"));

  HtspMessage firstResponse;
  HtspMessage secondResponse;
  std::atomic<bool> firstAnswered(false);
  std::thread first([&]() {
    HtspMessage request("getTicket");
    request.putS64("channelId", 1);
    firstAnswered = connection.sendAndWait(request, &firstResponse,
                                           CancellationToken::none(), WAIT);
  });
  REQUIRE(server.waitForRequest("getTicket", 5000));
  HtspMessage request("getTicket");
  request.putS64("channelId", 2);
  REQUIRE(connection.sendAndWait(request, &secondResponse,
                                 CancellationToken::none(), WAIT));
  first.join();

  REQUIRE(firstAnswered);
  REQUIRE(firstResponse.getString("ticket", "") == "ticket-1");
  REQUIRE(secondResponse.getString("ticket", "") == "ticket-2");
  REQUIRE(connection.getCorrelator()->getPendingCount() == 0);
  connection.stop();
}

TEST_CASE("Push events are dispatched from the receive loop",
          "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  FakeHtspServer server(handler);
  server.start();
  RecordingListener listener;

  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  std::mutex pushMutex;
  vector<int64_t> channelIds;
  connection.getCorrelator()->subscribe(
      "channelAdd", [&](const HtspMessage& message) {
        lock_guard<std::mutex> guard(pushMutex);
        channelIds.push_back(message.getS64("channelId", 0));
      });
  connection.open(ENDPOINT);
  REQUIRE(connection.authenticate("user", "secret"));

  server.push(makeChannelAdd(1, 1, "One", {}));
  server.push(makeChannelAdd(2, 2, "Two", {}));
  for (int i = 0; i < 500; i++) {
    {
      lock_guard<std::mutex> guard(pushMutex);
      if (channelIds.size() == 2) {
        break;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  {
    lock_guard<std::mutex> guard(pushMutex);
    REQUIRE(channelIds == vector<int64_t>({1, 2}));
  }
  connection.stop();
}

TEST_CASE("A lost connection is reported and needs a restart",
          "[HtspConnection]") {
  shared_ptr<SocketPairHandler> handler(new SocketPairHandler());
  FakeHtspServer server(handler);
  server.start();
  RecordingListener listener;

  HtspConnection connection(handler, &listener, "tvhsync-test", "1.0");
  connection.open(ENDPOINT);
  REQUIRE(connection.authenticate("user", "secret"));
  REQUIRE_FALSE(connection.needsRestart());

  server.disconnect();
  for (int i = 0; i < 500 && listener.errorCount() == 0; i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(listener.errorCount() == 1);
  REQUIRE(connection.needsRestart());
  REQUIRE_FALSE(connection.isConnected());
  REQUIRE_THROWS_AS(connection.sendMessage(HtspMessage("getDiskSpace"),
                                           shared_ptr<HtspResponseHandler>()),
                    ConnectionError);
  connection.stop();
}
