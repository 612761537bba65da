#include "TerminalBridge.hpp"

#include "ControlCodec.hpp"
#include "LogAuditSink.hpp"

namespace wt {
TerminalBridge::TerminalBridge(shared_ptr<WebSocketConnection> _connection,
                               shared_ptr<RemoteExecutor> _executor,
                               shared_ptr<AuditSink> _auditSink,
                               shared_ptr<SessionRegistry> _registry,
                               shared_ptr<Clock> _clock,
                               const BridgeConfig& _config,
                               const TargetRef& _target,
                               const string& _userIdentity)
    : connection(_connection),
      executor(_executor),
      auditSink(_auditSink),
      registry(_registry),
      clock(_clock),
      config(_config),
      target(_target),
      userIdentity(_userIdentity) {}

void TerminalBridge::run(const TerminalGeometry& initialGeometry) {
  recordAuditEvent(auditSink, "connect", target, userIdentity);

  // The far end is a raw shell: it cannot answer heartbeats and already
  // applies its own pacing, so both are off on this side.
  SessionConfig sessionConfig;
  sessionConfig.livenessTimeoutMs = 0;
  sessionConfig.chunking.threshold = 0;
  session.reset(new Session(executor, target, userIdentity,
                            make_shared<WebSocketSink>(connection),
                            sessionConfig, clock));
  try {
    session->open(initialGeometry);
  } catch (const TargetUnreachable& tu) {
    finish(WS_CLOSE_TARGET_UNREACHABLE, tu.what());
    return;
  } catch (const PermissionDenied& pd) {
    finish(WS_CLOSE_PERMISSION_DENIED, pd.what());
    return;
  } catch (const std::runtime_error& re) {
    finish(WS_CLOSE_ABNORMAL, re.what());
    return;
  }
  registry->add(session);

  auto startedAt = clock->now();
  lastClientActivity = startedAt;
  auto idleTimeout = std::chrono::seconds(config.idleTimeoutSeconds);
  auto connectionTimeout = std::chrono::seconds(config.connectionTimeoutSeconds);

  int code = WS_CLOSE_NORMAL;
  string detail;
  while (true) {
    if (session->getState() == SessionState::CLOSED) {
      code = closeCodeFor(session->getCloseReason());
      detail = session->getCloseDetail();
      break;
    }
    auto now = clock->now();
    if (config.idleTimeoutSeconds > 0 && now - lastClientActivity > idleTimeout) {
      LOG(INFO) << "Session " << session->getId() << " idle for "
                << config.idleTimeoutSeconds << "s, closing";
      detail = "Idle timeout";
      break;
    }
    if (config.connectionTimeoutSeconds > 0 &&
        now - startedAt > connectionTimeout) {
      LOG(INFO) << "Session " << session->getId() << " reached the "
                << config.connectionTimeoutSeconds << "s connection limit";
      detail = "Connection timeout";
      break;
    }

    WebSocketConnection::Message message;
    try {
      auto result = connection->read(&message, config.pollMs);
      if (result == WebSocketConnection::ReadResult::TIMEOUT) {
        continue;
      }
      if (result == WebSocketConnection::ReadResult::CLOSED) {
        detail = "Client closed the connection";
        break;
      }
      if (!handleMessage(message)) {
        detail = "Client went away";
        break;
      }
    } catch (const TransportBroken& tb) {
      LOG(INFO) << "Client link for " << target << " broke: " << tb.what();
      code = WS_CLOSE_ABNORMAL;
      detail = tb.what();
      break;
    }
  }

  session->close(code == WS_CLOSE_NORMAL ? CloseReason::NORMAL
                                         : CloseReason::ABNORMAL,
                 detail);
  if (!session->waitForClose(5000)) {
    LOG(WARNING) << "Session " << session->getId() << " did not stop in time";
  }
  registry->remove(session->getId());
  finish(code, detail);
}

bool TerminalBridge::handleMessage(const WebSocketConnection::Message& message) {
  ControlMessage control;
  try {
    control = ControlCodec::decode(message.payload, message.text);
  } catch (const ProtocolViolation& pv) {
    LOG(WARNING) << "Dropping bad control message from '" << userIdentity
                 << "': " << pv.what();
    return true;
  }
  switch (control.kind) {
    case ControlMessageKind::HEARTBEAT:
      VLOG(2) << "Answering heartbeat";
      try {
        connection->write(ControlCodec::encodeHeartbeat(), false);
      } catch (const TransportBroken& tb) {
        LOG(INFO) << "Could not answer heartbeat: " << tb.what();
        return false;
      }
      return true;
    case ControlMessageKind::RESIZE:
      lastClientActivity = clock->now();
      session->resize(control.geometry);
      return true;
    case ControlMessageKind::DATA:
      lastClientActivity = clock->now();
      session->send(control.data);
      return true;
  }
  return true;
}

void TerminalBridge::finish(int code, const string& detail) {
  LOG(INFO) << "Closing WebSocket for " << target << " with code " << code
            << (detail.empty() ? "" : ": ") << detail;
  connection->close(code, detail);
  connection->shutdown();
  recordAuditEvent(auditSink, "disconnect", target, userIdentity,
                   "code=" + to_string(code) +
                       (detail.empty() ? "" : " " + detail));
}
}  // namespace wt
