#ifndef __WT_SESSION__
#define __WT_SESSION__

#include "ChunkedTransferSplitter.hpp"
#include "Clock.hpp"
#include "ControlCodec.hpp"
#include "Headers.hpp"
#include "RemoteExec.hpp"

namespace wt {
enum class SessionState { CONNECTING, OPEN, CLOSING, CLOSED };

enum class CloseReason {
  /** @brief Explicit user or protocol-level clean shutdown. */
  NORMAL,
  /** @brief Transport error or remote-side failure. */
  ABNORMAL
};

inline const char* sessionStateName(SessionState state) {
  switch (state) {
    case SessionState::CONNECTING:
      return "CONNECTING";
    case SessionState::OPEN:
      return "OPEN";
    case SessionState::CLOSING:
      return "CLOSING";
    case SessionState::CLOSED:
      return "CLOSED";
  }
  return "UNKNOWN";
}

struct SessionConfig {
  /**
   * @brief Inbound silence after which a heartbeat is emitted.  0 disables
   * heartbeats (used when the remote end is a raw shell).
   */
  int livenessTimeoutMs = DEFAULT_LIVENESS_TIMEOUT_MS;
  /**
   * @brief Close abnormally when a heartbeat goes unanswered for a full
   * liveness timeout.
   */
  bool closeOnMissedHeartbeat = true;
  /** @brief Upper bound on one transport read, so pumps notice closes. */
  int readTimeoutMs = 50;
  /** @brief Large paste handling.  A threshold of 0 disables splitting. */
  ChunkingConfig chunking;
};

/**
 * @brief One client-to-remote relay.
 *
 * Lifecycle is CONNECTING -> OPEN -> CLOSING -> CLOSED.  While OPEN an
 * inbound pump copies remote output to the sink and an outbound pump drains
 * the send queue into the transport.  A closed Session is never reopened.
 */
class Session {
 public:
  typedef function<void(CloseReason reason, const string& detail)>
      CloseCallback;

  Session(shared_ptr<RemoteExecutor> _executor, const TargetRef& _target,
          const string& _userIdentity, shared_ptr<TerminalSink> _sink,
          const SessionConfig& _config, shared_ptr<Clock> _clock);

  /** @brief Closes normally and joins the pumps. */
  virtual ~Session();

  /**
   * @brief Attaches to the target and starts both pumps.
   *
   * The geometry pushed on open is the most recent resize() requested while
   * CONNECTING, or `initialGeometry` if there was none.
   *
   * @throws TargetUnreachable, PermissionDenied, TransportBroken
   */
  void open(const TerminalGeometry& initialGeometry);

  /**
   * @brief Queues client bytes for the remote side.  Inputs above the chunk
   * threshold become a paced ChunkedTransfer.  Dropped with a warning unless
   * OPEN.
   */
  void send(const string& bytes);

  /** @brief Updates geometry.  Remembered until open if still CONNECTING. */
  void resize(const TerminalGeometry& newGeometry);

  void resize(int cols, int rows) { resize(makeGeometry(cols, rows)); }

  /**
   * @brief Begins teardown.  Idempotent and never blocks on the pumps.  The
   * close callback fires once the transport has been released.
   */
  void close(CloseReason reason, const string& detail = "");

  /** @brief Must be set before open(). */
  void setCloseCallback(CloseCallback callback);

  /** @brief Blocks until CLOSED or the timeout passes. */
  bool waitForClose(int timeoutMs);

  SessionState getState();

  CloseReason getCloseReason();

  string getCloseDetail();

  TerminalGeometry getGeometry();

  Clock::TimePoint getLastActivity();

  const TargetRef& getTarget() const { return target; }

  const string& getUserIdentity() const { return userIdentity; }

  const string& getId() const { return id; }

 protected:
  struct OutboundItem {
    enum Kind { DATA, RESIZE, TRANSFER };
    Kind kind;
    string data;
    TerminalGeometry geometry;
    shared_ptr<ChunkedTransfer> transfer;
  };

  void inboundLoop();

  void outboundLoop();

  /**
   * @brief Sends every fragment in order, pausing between fragments.
   * @return False if the session left OPEN mid transfer.
   */
  bool deliverTransfer(shared_ptr<ChunkedTransfer> transfer);

  /** @brief Heartbeat bookkeeping.  Caller holds sessionMutex. */
  void checkLivenessLocked();

  /** @brief Moves OPEN to CLOSING.  Caller holds sessionMutex. */
  void requestCloseLocked(CloseReason reason, const string& detail);

  void markActivity();

  void pumpFinished();

  shared_ptr<RemoteExecutor> executor;
  TargetRef target;
  string userIdentity;
  string id;
  shared_ptr<TerminalSink> sink;
  SessionConfig config;
  shared_ptr<Clock> clock;
  ChunkedTransferSplitter splitter;

  shared_ptr<RemoteTransport> transport;
  shared_ptr<thread> inboundThread;
  shared_ptr<thread> outboundThread;

  std::mutex sessionMutex;
  std::condition_variable sessionCv;
  SessionState state;
  CloseReason closeReason;
  string closeDetail;
  CloseCallback closeCallback;
  deque<OutboundItem> outbound;
  TerminalGeometry geometry;
  bool resizeRequestedBeforeOpen;
  Clock::TimePoint lastActivity;
  bool waitingOnHeartbeat;
  Clock::TimePoint heartbeatSentAt;
  int runningPumps;
};
}  // namespace wt

#endif  // __WT_SESSION__
