#include "BridgeTransport.hpp"

#include "ControlCodec.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
/**
 * @brief Accepts raw TCP connections on an ephemeral loopback port and
 * either upgrades them or answers with a plain HTTP status.
 */
class LoopbackServer {
 public:
  LoopbackServer()
      : ioContext(new asio::io_context()),
        acceptor(*ioContext, tcp::endpoint(asio::ip::make_address("127.0.0.1"),
                                           0)) {}

  int getPort() { return acceptor.local_endpoint().port(); }

  SocketEndpoint endpoint() {
    SocketEndpoint se;
    se.set_name("127.0.0.1");
    se.set_port(getPort());
    return se;
  }

  shared_ptr<WebSocketConnection> acceptWebSocket(string* target = NULL) {
    tcp::socket socket(*ioContext);
    acceptor.accept(socket);
    beast::flat_buffer buffer;
    http::request<http::empty_body> request;
    http::read(socket, buffer, request);
    if (target) {
      *target = string(request.target());
    }
    return WebSocketConnection::accept(ioContext, std::move(socket), request);
  }

  void refuseWith(http::status status) {
    tcp::socket socket(*ioContext);
    acceptor.accept(socket);
    beast::flat_buffer buffer;
    http::request<http::empty_body> request;
    http::read(socket, buffer, request);
    http::response<http::string_body> response(status, request.version());
    response.body() = "{\"error\":\"denied\"}";
    response.keep_alive(false);
    response.prepare_payload();
    http::write(socket, response);
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

 protected:
  shared_ptr<asio::io_context> ioContext;
  tcp::acceptor acceptor;
};

struct Pair {
  shared_ptr<WebSocketConnection> server;
  shared_ptr<BridgeTransport> client;
};

Pair connectPair(LoopbackServer* server) {
  auto accepted = std::async(std::launch::async,
                             [server] { return server->acceptWebSocket(); });
  Pair pair;
  pair.client = make_shared<BridgeTransport>(
      WebSocketConnection::connect(server->endpoint(), "/ws/default/web-0"));
  pair.server = accepted.get();
  return pair;
}

WebSocketConnection::Message readMessage(shared_ptr<WebSocketConnection> ws) {
  WebSocketConnection::Message message;
  REQUIRE(ws->read(&message, 5000) == WebSocketConnection::ReadResult::MESSAGE);
  return message;
}

string readData(shared_ptr<BridgeTransport> transport) {
  string payload;
  REQUIRE(transport->read(&payload, 5000) == TransportReadResult::DATA);
  return payload;
}
}  // namespace

TEST_CASE("The WebSocket path names the target, user and size",
          "[BridgeTransport]") {
  REQUIRE(BridgeExecutor::websocketPath(makeTargetRef("default", "web-0"),
                                        "alice", makeGeometry(120, 40)) ==
          "/ws/default/web-0?chinesename=alice&cols=120&rows=40");
  REQUIRE(BridgeExecutor::websocketPath(makeTargetRef("ns", "pod"),
                                        "\xe7\x8e\x8b \xe4\xba\x94",
                                        makeGeometry(80, 24)) ==
          "/ws/ns/pod?chinesename=%E7%8E%8B%20%E4%BA%94&cols=80&rows=24");
}

TEST_CASE("Data goes binary and resizes go as JSON text",
          "[BridgeTransport]") {
  LoopbackServer server;
  auto pair = connectPair(&server);

  pair.client->write("ls -l\r");
  auto data = readMessage(pair.server);
  REQUIRE(data.payload == "ls -l\r");
  REQUIRE_FALSE(data.text);

  pair.client->write(ControlCodec::encodeHeartbeat());
  REQUIRE(ControlCodec::isHeartbeat(readMessage(pair.server).payload));

  pair.client->resize(makeGeometry(100, 30));
  auto resize = readMessage(pair.server);
  REQUIRE(resize.text);
  auto decoded = ControlCodec::decode(resize.payload, true);
  REQUIRE(decoded.kind == ControlMessageKind::RESIZE);
  REQUIRE(decoded.geometry.cols() == 100);
  REQUIRE(decoded.geometry.rows() == 30);

  pair.server->write("total 0\r\n", false);
  REQUIRE(readData(pair.client) == "total 0\r\n");

  pair.client->close();
  WebSocketConnection::Message message;
  REQUIRE(pair.server->read(&message, 5000) ==
          WebSocketConnection::ReadResult::CLOSED);
  REQUIRE(pair.server->getCloseCode() == WS_CLOSE_NORMAL);
}

TEST_CASE("A normal server close ends the stream", "[BridgeTransport]") {
  LoopbackServer server;
  auto pair = connectPair(&server);
  pair.server->write("bye\r\n", false);
  pair.server->close(WS_CLOSE_NORMAL, "Shell exited");

  // Output sent before the close is still delivered
  REQUIRE(readData(pair.client) == "bye\r\n");
  string payload;
  REQUIRE(pair.client->read(&payload, 5000) == TransportReadResult::CLOSED);
  pair.client->close();
}

TEST_CASE("Other close codes break the transport", "[BridgeTransport]") {
  LoopbackServer server;
  auto pair = connectPair(&server);
  pair.server->close(WS_CLOSE_TARGET_UNREACHABLE, "Pod not found");

  string payload;
  try {
    pair.client->read(&payload, 5000);
    FAIL("read should have thrown");
  } catch (const TransportBroken& tb) {
    string what = tb.what();
    REQUIRE(what.find("4404") != string::npos);
    REQUIRE(what.find("Pod not found") != string::npos);
  }
  pair.client->close();
}

TEST_CASE("Declined upgrades map to attach errors", "[BridgeTransport]") {
  LoopbackServer server;
  BridgeExecutor executor(server.endpoint(), "alice");

  SECTION("403 is a permission error") {
    auto refused = std::async(std::launch::async, [&server] {
      server.refuseWith(http::status::forbidden);
    });
    REQUIRE_THROWS_AS(executor.attach(makeTargetRef("default", "web-0"),
                                      makeGeometry(80, 24)),
                      PermissionDenied);
    refused.get();
  }

  SECTION("404 means the target is unreachable") {
    auto refused = std::async(std::launch::async, [&server] {
      server.refuseWith(http::status::not_found);
    });
    REQUIRE_THROWS_AS(executor.attach(makeTargetRef("default", "web-0"),
                                      makeGeometry(80, 24)),
                      TargetUnreachable);
    refused.get();
  }
}

TEST_CASE("Refused connections mean the target is unreachable",
          "[BridgeTransport]") {
  SocketEndpoint endpoint;
  endpoint.set_name("127.0.0.1");
  {
    // Grab a free port, then release it
    LoopbackServer server;
    endpoint.set_port(server.getPort());
  }
  BridgeExecutor executor(endpoint, "alice");
  REQUIRE_THROWS_AS(
      executor.attach(makeTargetRef("default", "web-0"), makeGeometry(80, 24)),
      TargetUnreachable);
}
