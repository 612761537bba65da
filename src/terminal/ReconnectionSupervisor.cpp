#include "ReconnectionSupervisor.hpp"

namespace wt {
ReconnectionSupervisor::ReconnectionSupervisor(
    SessionFactory _factory, shared_ptr<TimerScheduler> _timers,
    const ReconnectPolicy& _policy, const TerminalGeometry& initialGeometry)
    : factory(_factory),
      timers(_timers),
      policy(_policy),
      state(SupervisorState::IDLE),
      attemptCount(0),
      geometry(initialGeometry),
      sessionGeneration(0),
      timerPending(false),
      pendingTimer(0),
      timerGeneration(0) {}

ReconnectionSupervisor::~ReconnectionSupervisor() {
  shared_ptr<Session> oldSession;
  {
    lock_guard<recursive_mutex> guard(supervisorMutex);
    cancelTimerLocked();
    oldSession = session;
    session.reset();
    sessionGeneration++;
  }
  if (oldSession) {
    oldSession->close(CloseReason::NORMAL, "Terminal closed");
  }
}

void ReconnectionSupervisor::setStateListener(StateListener listener) {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  stateListener = listener;
}

SupervisorState ReconnectionSupervisor::getState() {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  return state;
}

int ReconnectionSupervisor::getAttemptCount() {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  return attemptCount;
}

shared_ptr<Session> ReconnectionSupervisor::getSession() {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  return session;
}

std::chrono::milliseconds ReconnectionSupervisor::backoffDelay(
    int attempt) const {
  double delay = policy.backoffBaseMs;
  for (int a = 1; a < attempt; a++) {
    delay *= policy.backoffMultiplier;
    if (delay >= policy.maxBackoffMs) {
      break;
    }
  }
  delay = min(delay, double(policy.maxBackoffMs));
  return std::chrono::milliseconds(int64_t(delay));
}

void ReconnectionSupervisor::connect() {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  if (state != SupervisorState::IDLE) {
    throw std::runtime_error(string("Cannot connect while ") +
                             supervisorStateName(state));
  }
  attemptCount = 0;
  startSessionLocked();
  setStateLocked(SupervisorState::CONNECTED, "Connected");
}

void ReconnectionSupervisor::disconnect() {
  shared_ptr<Session> oldSession;
  {
    lock_guard<recursive_mutex> guard(supervisorMutex);
    cancelTimerLocked();
    oldSession = session;
    session.reset();
    // Ignore the close callback of the session we are about to close.
    sessionGeneration++;
    if (state != SupervisorState::EXHAUSTED &&
        state != SupervisorState::IDLE) {
      setStateLocked(SupervisorState::IDLE, "Disconnected by user");
    }
  }
  if (oldSession) {
    oldSession->close(CloseReason::NORMAL, "Disconnected by user");
  }
}

void ReconnectionSupervisor::send(const string& bytes) {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  if (state != SupervisorState::CONNECTED || !session) {
    LOG(WARNING) << "Dropping " << bytes.size() << " bytes while "
                 << supervisorStateName(state);
    return;
  }
  session->send(bytes);
}

void ReconnectionSupervisor::resize(const TerminalGeometry& newGeometry) {
  if (!isValidGeometry(newGeometry)) {
    LOG(WARNING) << "Ignoring invalid geometry " << newGeometry;
    return;
  }
  lock_guard<recursive_mutex> guard(supervisorMutex);
  geometry = newGeometry;
  if (state == SupervisorState::CONNECTED && session) {
    session->resize(newGeometry);
  }
}

void ReconnectionSupervisor::startSessionLocked() {
  shared_ptr<Session> newSession = factory();
  uint64_t generation = ++sessionGeneration;
  std::weak_ptr<ReconnectionSupervisor> weakSelf = shared_from_this();
  newSession->setCloseCallback(
      [weakSelf, generation](CloseReason reason, const string& detail) {
        auto self = weakSelf.lock();
        if (self) {
          self->onSessionClosed(generation, reason, detail);
        }
      });
  newSession->open(geometry);
  session = newSession;
}

void ReconnectionSupervisor::onSessionClosed(uint64_t closedGeneration,
                                             CloseReason reason,
                                             const string& detail) {
  lock_guard<recursive_mutex> guard(supervisorMutex);
  if (closedGeneration != sessionGeneration ||
      state != SupervisorState::CONNECTED) {
    VLOG(1) << "Ignoring close of a stale session";
    return;
  }
  if (reason == CloseReason::NORMAL) {
    LOG(INFO) << "Session ended normally: " << detail;
    setStateLocked(SupervisorState::IDLE, detail);
    return;
  }
  LOG(INFO) << "Session ended abnormally: " << detail;
  handleFailureLocked(detail);
}

void ReconnectionSupervisor::handleFailureLocked(const string& detail) {
  if (attemptCount >= policy.maxAttempts) {
    LOG(WARNING) << "Giving up after " << attemptCount
                 << " reconnect attempts";
    setStateLocked(SupervisorState::EXHAUSTED, detail);
    return;
  }
  attemptCount++;
  auto delay = backoffDelay(attemptCount);
  cancelTimerLocked();
  uint64_t generation = ++timerGeneration;
  std::weak_ptr<ReconnectionSupervisor> weakSelf = shared_from_this();
  pendingTimer = timers->schedule(delay, [weakSelf, generation]() {
    auto self = weakSelf.lock();
    if (self) {
      self->onTimer(generation);
    }
  });
  timerPending = true;
  LOG(INFO) << "Reconnect attempt " << attemptCount << "/"
            << policy.maxAttempts << " in " << delay.count() << " ms";
  setStateLocked(SupervisorState::RECONNECTING, detail, delay);
}

void ReconnectionSupervisor::onTimer(uint64_t firedGeneration) {
  shared_ptr<Session> oldSession;
  {
    lock_guard<recursive_mutex> guard(supervisorMutex);
    if (firedGeneration != timerGeneration || !timerPending ||
        state != SupervisorState::RECONNECTING) {
      return;
    }
    timerPending = false;
    oldSession = session;
    session.reset();
    try {
      startSessionLocked();
      // Listeners see which attempt succeeded before the count resets.
      setStateLocked(SupervisorState::CONNECTED, "Reconnected");
      attemptCount = 0;
    } catch (const PermissionDenied& pd) {
      LOG(WARNING) << "Reconnect denied: " << pd.what();
      setStateLocked(SupervisorState::EXHAUSTED, pd.what());
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Reconnect attempt " << attemptCount
                   << " failed: " << re.what();
      handleFailureLocked(re.what());
    }
  }
  // Joined outside the lock: its pumps may be waiting on it.
  oldSession.reset();
}

void ReconnectionSupervisor::setStateLocked(SupervisorState newState,
                                            const string& detail,
                                            std::chrono::milliseconds delay) {
  VLOG(1) << "Supervisor " << supervisorStateName(state) << " -> "
          << supervisorStateName(newState);
  state = newState;
  if (stateListener) {
    stateListener(state, attemptCount, delay, detail);
  }
}

void ReconnectionSupervisor::cancelTimerLocked() {
  if (timerPending) {
    timers->cancel(pendingTimer);
    timerPending = false;
  }
  // Invalidate a callback that is already running.
  timerGeneration++;
}
}  // namespace wt
