#ifndef __WT_TERMINAL_CLIENT__
#define __WT_TERMINAL_CLIENT__

#include "Clock.hpp"
#include "Console.hpp"
#include "Headers.hpp"
#include "ReconnectionSupervisor.hpp"
#include "RemoteExec.hpp"
#include "Session.hpp"
#include "TimerScheduler.hpp"

namespace wt {
struct ClientConfig {
  SessionConfig session;
  ReconnectPolicy reconnect;
};

/**
 * @brief Drives one interactive terminal: console in, supervisor out.
 */
class TerminalClient {
 public:
  TerminalClient(shared_ptr<Console> _console,
                 shared_ptr<RemoteExecutor> _executor,
                 shared_ptr<TimerScheduler> _timers, shared_ptr<Clock> _clock,
                 const TargetRef& _target, const string& _userIdentity,
                 const ClientConfig& _config, int _inputFd = STDIN_FILENO);

  virtual ~TerminalClient();

  /**
   * @brief Runs until the session ends cleanly, reconnection gives up or
   * input reaches EOF.
   * @return 0 for a clean end, 1 otherwise.
   */
  int run();

  /**
   * @brief Flags the client loop to exit gracefully on the next iteration.
   */
  void shutdown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    shuttingDown = true;
  }

  /** @brief Console text for a supervisor transition, or "" for none. */
  static string describeTransition(SupervisorState state, int attemptCount,
                                   int maxAttempts,
                                   std::chrono::milliseconds delay,
                                   const string& detail);

  shared_ptr<ReconnectionSupervisor> getSupervisor() { return supervisor; }

 protected:
  bool isShuttingDown() {
    lock_guard<recursive_mutex> guard(shutdownMutex);
    return shuttingDown;
  }

  shared_ptr<Console> console;
  shared_ptr<RemoteExecutor> executor;
  shared_ptr<TimerScheduler> timers;
  shared_ptr<Clock> clock;
  TargetRef target;
  string userIdentity;
  ClientConfig config;
  int inputFd;
  shared_ptr<ReconnectionSupervisor> supervisor;
  /** @brief Guarded flag that ends `run()` when set. */
  bool shuttingDown;
  recursive_mutex shutdownMutex;
};
}  // namespace wt

#endif  // __WT_TERMINAL_CLIENT__
