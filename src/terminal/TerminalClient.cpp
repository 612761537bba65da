#include "TerminalClient.hpp"

#define BUF_SIZE (16 * 1024)

namespace wt {
TerminalClient::TerminalClient(shared_ptr<Console> _console,
                               shared_ptr<RemoteExecutor> _executor,
                               shared_ptr<TimerScheduler> _timers,
                               shared_ptr<Clock> _clock,
                               const TargetRef& _target,
                               const string& _userIdentity,
                               const ClientConfig& _config, int _inputFd)
    : console(_console),
      executor(_executor),
      timers(_timers),
      clock(_clock),
      target(_target),
      userIdentity(_userIdentity),
      config(_config),
      inputFd(_inputFd),
      shuttingDown(false) {}

TerminalClient::~TerminalClient() {
  if (supervisor) {
    supervisor->disconnect();
  }
}

string TerminalClient::describeTransition(SupervisorState state,
                                          int attemptCount, int maxAttempts,
                                          std::chrono::milliseconds delay,
                                          const string& detail) {
  switch (state) {
    case SupervisorState::RECONNECTING:
      return "Connection lost (" + detail + "). Reconnecting in " +
             to_string(delay.count()) + " ms (attempt " +
             to_string(attemptCount) + "/" + to_string(maxAttempts) + ")";
    case SupervisorState::EXHAUSTED:
      return "Connection lost: " + detail;
    case SupervisorState::CONNECTED:
      if (attemptCount > 0) {
        return "Reconnected";
      }
      return "";
    case SupervisorState::IDLE:
      return "";
  }
  return "";
}

int TerminalClient::run() {
  TerminalGeometry geometry = console->getGeometry();
  auto sink = make_shared<ConsoleSink>(console);
  auto sessionExecutor = executor;
  auto sessionClock = clock;
  auto sessionTarget = target;
  auto sessionUser = userIdentity;
  auto sessionConfig = config.session;
  supervisor = make_shared<ReconnectionSupervisor>(
      [sessionExecutor, sessionTarget, sessionUser, sink, sessionConfig,
       sessionClock]() {
        return make_shared<Session>(sessionExecutor, sessionTarget,
                                    sessionUser, sink, sessionConfig,
                                    sessionClock);
      },
      timers, config.reconnect, geometry);
  int maxAttempts = config.reconnect.maxAttempts;
  supervisor->setStateListener(
      [this, maxAttempts](SupervisorState state, int attemptCount,
                          std::chrono::milliseconds delay,
                          const string& detail) {
        string text = describeTransition(state, attemptCount, maxAttempts,
                                         delay, detail);
        LOG(INFO) << "Supervisor is " << supervisorStateName(state)
                  << (text.empty() ? "" : ": ") << text;
        if (!text.empty()) {
          console->write("\r\n[wt] " + text + "\r\n");
        }
      });

  try {
    supervisor->connect();
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not connect to " << target << ": " << re.what();
    console->write("[wt] Could not connect to " + targetKey(target) + ": " +
                   re.what() + "\r\n");
    return 1;
  }
  console->setup();

  int exitCode = 0;
  char buf[BUF_SIZE];
  while (!isShuttingDown()) {
    SupervisorState state = supervisor->getState();
    if (state == SupervisorState::IDLE) {
      LOG(INFO) << "Session ended";
      break;
    }
    if (state == SupervisorState::EXHAUSTED) {
      exitCode = 1;
      break;
    }

    TerminalGeometry currentGeometry = console->getGeometry();
    if (currentGeometry != geometry) {
      geometry = currentGeometry;
      supervisor->resize(geometry);
    }

    if (!waitOnSocketData(inputFd, 10)) {
      continue;
    }
    ssize_t rc = ::read(inputFd, buf, BUF_SIZE);
    if (rc < 0) {
      if (GetErrno() == EAGAIN || GetErrno() == EINTR) {
        continue;
      }
      LOG(ERROR) << "Error reading input: " << strerror(GetErrno());
      supervisor->disconnect();
      exitCode = 1;
      break;
    }
    if (rc == 0) {
      LOG(INFO) << "Input closed";
      supervisor->disconnect();
      break;
    }
    supervisor->send(string(buf, rc));
  }

  console->teardown();
  supervisor->disconnect();
  return exitCode;
}
}  // namespace wt
