#ifndef __WT_RECONNECTION_SUPERVISOR__
#define __WT_RECONNECTION_SUPERVISOR__

#include "Headers.hpp"
#include "Session.hpp"
#include "TimerScheduler.hpp"

namespace wt {
enum class SupervisorState { IDLE, CONNECTED, RECONNECTING, EXHAUSTED };

inline const char* supervisorStateName(SupervisorState state) {
  switch (state) {
    case SupervisorState::IDLE:
      return "IDLE";
    case SupervisorState::CONNECTED:
      return "CONNECTED";
    case SupervisorState::RECONNECTING:
      return "RECONNECTING";
    case SupervisorState::EXHAUSTED:
      return "EXHAUSTED";
  }
  return "UNKNOWN";
}

struct ReconnectPolicy {
  int maxAttempts = DEFAULT_MAX_RECONNECT_ATTEMPTS;
  int backoffBaseMs = DEFAULT_BACKOFF_BASE_MS;
  double backoffMultiplier = DEFAULT_BACKOFF_MULTIPLIER;
  /** @brief Cap applied to the computed delay. */
  int maxBackoffMs = 60 * 1000;
};

/**
 * @brief Keeps one logical terminal attached across transport failures.
 *
 * IDLE --connect()--> CONNECTED.  A normal close returns to IDLE.  An
 * abnormal close arms a single backoff timer (RECONNECTING); each expiry
 * builds a fresh Session.  After maxAttempts failed attempts, or any
 * PermissionDenied, the supervisor is EXHAUSTED for good.
 *
 * Must be owned by a shared_ptr: callbacks hold weak references.
 */
class ReconnectionSupervisor
    : public std::enable_shared_from_this<ReconnectionSupervisor> {
 public:
  /** @brief Builds a new, unopened Session for each attempt. */
  typedef function<shared_ptr<Session>()> SessionFactory;

  /**
   * @brief Observes transitions.  `delay` is only meaningful for
   * RECONNECTING.  Runs with the supervisor lock held.
   */
  typedef function<void(SupervisorState state, int attemptCount,
                        std::chrono::milliseconds delay, const string& detail)>
      StateListener;

  ReconnectionSupervisor(SessionFactory _factory,
                         shared_ptr<TimerScheduler> _timers,
                         const ReconnectPolicy& _policy,
                         const TerminalGeometry& initialGeometry);

  virtual ~ReconnectionSupervisor();

  /**
   * @brief Opens the first Session.  Failures propagate and leave the
   * supervisor IDLE.
   */
  void connect();

  /** @brief User-initiated close.  Cancels any pending reconnect. */
  void disconnect();

  /** @brief Forwards to the live Session; dropped with a warning otherwise. */
  void send(const string& bytes);

  /** @brief Remembers the geometry for future Sessions and forwards it. */
  void resize(const TerminalGeometry& newGeometry);

  void setStateListener(StateListener listener);

  SupervisorState getState();

  int getAttemptCount();

  shared_ptr<Session> getSession();

  /** @brief Delay before reconnect attempt `attempt` (1-based). */
  std::chrono::milliseconds backoffDelay(int attempt) const;

 protected:
  void startSessionLocked();

  void onSessionClosed(uint64_t sessionGeneration, CloseReason reason,
                       const string& detail);

  void onTimer(uint64_t timerGeneration);

  /** @brief Counts a failure and either arms the timer or gives up. */
  void handleFailureLocked(const string& detail);

  void setStateLocked(SupervisorState newState, const string& detail,
                      std::chrono::milliseconds delay =
                          std::chrono::milliseconds(0));

  void cancelTimerLocked();

  SessionFactory factory;
  shared_ptr<TimerScheduler> timers;
  ReconnectPolicy policy;

  recursive_mutex supervisorMutex;
  SupervisorState state;
  int attemptCount;
  TerminalGeometry geometry;
  shared_ptr<Session> session;
  uint64_t sessionGeneration;
  bool timerPending;
  TimerScheduler::TimerId pendingTimer;
  uint64_t timerGeneration;
  StateListener stateListener;
};
}  // namespace wt

#endif  // __WT_RECONNECTION_SUPERVISOR__
