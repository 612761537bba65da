#ifndef __WT_BRIDGE_TRANSPORT__
#define __WT_BRIDGE_TRANSPORT__

#include "Headers.hpp"
#include "RemoteExec.hpp"
#include "WebSocketConnection.hpp"

namespace wt {
/**
 * @brief Client side of the bridge: a RemoteTransport carried over the
 * wtserver WebSocket.
 *
 * Terminal bytes and heartbeats travel as binary frames, resizes as JSON
 * text frames.
 */
class BridgeTransport : public RemoteTransport {
 public:
  explicit BridgeTransport(shared_ptr<WebSocketConnection> _connection)
      : connection(_connection) {}

  virtual ~BridgeTransport() {}

  /**
   * @brief A close with code 1000 is a clean end of stream.  Any other code
   * raises TransportBroken so the session ends abnormally.
   */
  virtual TransportReadResult read(string* payload, int timeoutMs);

  virtual void write(const string& payload);

  virtual void resize(const TerminalGeometry& geometry);

  virtual void close();

 protected:
  shared_ptr<WebSocketConnection> connection;
};

/**
 * @brief Opens BridgeTransports by dialing wtserver.
 */
class BridgeExecutor : public RemoteExecutor {
 public:
  BridgeExecutor(const SocketEndpoint& _serverEndpoint,
                 const string& _userIdentity)
      : serverEndpoint(_serverEndpoint), userIdentity(_userIdentity) {}

  virtual ~BridgeExecutor() {}

  virtual shared_ptr<RemoteTransport> attach(const TargetRef& target,
                                             const TerminalGeometry& geometry);

  /** @brief Request target for the terminal WebSocket of `target`. */
  static string websocketPath(const TargetRef& target,
                              const string& userIdentity,
                              const TerminalGeometry& geometry);

 protected:
  SocketEndpoint serverEndpoint;
  string userIdentity;
};
}  // namespace wt

#endif  // __WT_BRIDGE_TRANSPORT__
