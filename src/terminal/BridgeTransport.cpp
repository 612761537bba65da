#include "BridgeTransport.hpp"

#include "ControlCodec.hpp"
#include "UrlUtils.hpp"

namespace wt {
TransportReadResult BridgeTransport::read(string* payload, int timeoutMs) {
  WebSocketConnection::Message message;
  auto result = connection->read(&message, timeoutMs);
  switch (result) {
    case WebSocketConnection::ReadResult::MESSAGE:
      *payload = message.payload;
      return TransportReadResult::DATA;
    case WebSocketConnection::ReadResult::TIMEOUT:
      return TransportReadResult::TIMEOUT;
    case WebSocketConnection::ReadResult::CLOSED:
      break;
  }
  int code = connection->getCloseCode();
  if (code == WS_CLOSE_NORMAL) {
    return TransportReadResult::CLOSED;
  }
  string reason = connection->getCloseReason();
  throw TransportBroken("Server closed the connection with code " +
                        to_string(code) + (reason.empty() ? "" : ": ") +
                        reason);
}

void BridgeTransport::write(const string& payload) {
  connection->write(payload, false);
}

void BridgeTransport::resize(const TerminalGeometry& geometry) {
  connection->write(ControlCodec::encodeResize(geometry), true);
}

void BridgeTransport::close() {
  connection->close(WS_CLOSE_NORMAL);
  connection->shutdown();
}

string BridgeExecutor::websocketPath(const TargetRef& target,
                                     const string& userIdentity,
                                     const TerminalGeometry& geometry) {
  return "/ws/" + UrlUtils::encode(target.ns()) + "/" +
         UrlUtils::encode(target.name()) +
         "?chinesename=" + UrlUtils::encode(userIdentity) +
         "&cols=" + to_string(geometry.cols()) +
         "&rows=" + to_string(geometry.rows());
}

shared_ptr<RemoteTransport> BridgeExecutor::attach(
    const TargetRef& target, const TerminalGeometry& geometry) {
  string path = websocketPath(target, userIdentity, geometry);
  VLOG(1) << "Dialing " << serverEndpoint << path;
  return make_shared<BridgeTransport>(
      WebSocketConnection::connect(serverEndpoint, path));
}
}  // namespace wt
