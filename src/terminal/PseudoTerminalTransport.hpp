#ifndef __WT_PSEUDO_TERMINAL_TRANSPORT__
#define __WT_PSEUDO_TERMINAL_TRANSPORT__

#include "Headers.hpp"
#include "RemoteExec.hpp"
#include "TargetExistenceCache.hpp"

namespace wt {
/**
 * @brief RemoteTransport over the master side of a pty whose slave runs the
 * remote-exec client (kubectl exec -t).
 */
class PseudoTerminalTransport : public RemoteTransport {
 public:
  PseudoTerminalTransport(int _masterFd, pid_t _pid);

  virtual ~PseudoTerminalTransport();

  virtual TransportReadResult read(string* payload, int timeoutMs);

  virtual void write(const string& payload);

  virtual void resize(const TerminalGeometry& geometry);

  virtual void close();

  pid_t getPid() const { return pid; }

 protected:
  /** @brief Reaps the child after the pty hung up. */
  TransportReadResult childExited();

  std::mutex transportMutex;
  int masterFd;
  pid_t pid;
  bool closed;
};

/**
 * @brief Attaches by forkpty()ing a command built for the target.
 */
class PseudoTerminalExecutor : public RemoteExecutor {
 public:
  typedef function<vector<string>(const TargetRef&)> CommandBuilder;

  /**
   * @param _existenceCache When set, targets it reports missing are rejected
   * without spawning anything.
   */
  PseudoTerminalExecutor(CommandBuilder _commandBuilder,
                         shared_ptr<TargetExistenceCache> _existenceCache =
                             shared_ptr<TargetExistenceCache>());

  virtual ~PseudoTerminalExecutor() {}

  virtual shared_ptr<RemoteTransport> attach(const TargetRef& target,
                                             const TerminalGeometry& geometry);

 protected:
  CommandBuilder commandBuilder;
  shared_ptr<TargetExistenceCache> existenceCache;
};
}  // namespace wt

#endif  // __WT_PSEUDO_TERMINAL_TRANSPORT__
