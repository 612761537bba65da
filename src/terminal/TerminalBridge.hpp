#ifndef __WT_TERMINAL_BRIDGE__
#define __WT_TERMINAL_BRIDGE__

#include "Clock.hpp"
#include "Headers.hpp"
#include "RemoteExec.hpp"
#include "Session.hpp"
#include "SessionRegistry.hpp"
#include "WebSocketConnection.hpp"

namespace wt {
struct BridgeConfig {
  int idleTimeoutSeconds = DEFAULT_IDLE_TIMEOUT_SECONDS;
  int connectionTimeoutSeconds = DEFAULT_CONNECTION_TIMEOUT_SECONDS;
  /** @brief How often the bridge wakes up to check its timeouts. */
  int pollMs = 100;
};

/**
 * @brief Remote output going back to the browser as binary frames.
 */
class WebSocketSink : public TerminalSink {
 public:
  explicit WebSocketSink(shared_ptr<WebSocketConnection> _connection)
      : connection(_connection) {}

  virtual ~WebSocketSink() {}

  virtual void write(const string& s) { connection->write(s, false); }

 protected:
  shared_ptr<WebSocketConnection> connection;
};

/**
 * @brief Serves one upgraded WebSocket: opens a Session on the target and
 * relays frames both ways until either side ends.
 */
class TerminalBridge {
 public:
  TerminalBridge(shared_ptr<WebSocketConnection> _connection,
                 shared_ptr<RemoteExecutor> _executor,
                 shared_ptr<AuditSink> _auditSink,
                 shared_ptr<SessionRegistry> _registry,
                 shared_ptr<Clock> _clock, const BridgeConfig& _config,
                 const TargetRef& _target, const string& _userIdentity);

  /** @brief Blocks until the bridge is done.  Always closes the socket. */
  void run(const TerminalGeometry& initialGeometry);

  /** @brief WebSocket close code for a Session that ended with `reason`. */
  static int closeCodeFor(CloseReason reason) {
    return reason == CloseReason::NORMAL ? WS_CLOSE_NORMAL : WS_CLOSE_ABNORMAL;
  }

 protected:
  /** @brief Handles one client frame.  Returns false to stop relaying. */
  bool handleMessage(const WebSocketConnection::Message& message);

  void finish(int code, const string& detail);

  shared_ptr<WebSocketConnection> connection;
  shared_ptr<RemoteExecutor> executor;
  shared_ptr<AuditSink> auditSink;
  shared_ptr<SessionRegistry> registry;
  shared_ptr<Clock> clock;
  BridgeConfig config;
  TargetRef target;
  string userIdentity;
  shared_ptr<Session> session;
  Clock::TimePoint lastClientActivity;
};
}  // namespace wt

#endif  // __WT_TERMINAL_BRIDGE__
