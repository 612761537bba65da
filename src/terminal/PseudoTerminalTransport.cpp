#include "PseudoTerminalTransport.hpp"

#include "RawSocketUtils.hpp"
#include "SubprocessUtils.hpp"

namespace wt {
namespace {
winsize toWinsize(const TerminalGeometry& geometry) {
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = (unsigned short)geometry.cols();
  win.ws_row = (unsigned short)geometry.rows();
  return win;
}
}  // namespace

PseudoTerminalTransport::PseudoTerminalTransport(int _masterFd, pid_t _pid)
    : masterFd(_masterFd), pid(_pid), closed(false) {}

PseudoTerminalTransport::~PseudoTerminalTransport() { close(); }

TransportReadResult PseudoTerminalTransport::read(string* payload,
                                                  int timeoutMs) {
  if (!waitOnSocketData(masterFd, timeoutMs)) {
    return TransportReadResult::TIMEOUT;
  }
  char buf[16 * 1024];
  ssize_t rc = ::read(masterFd, buf, sizeof(buf));
  if (rc > 0) {
    payload->assign(buf, rc);
    return TransportReadResult::DATA;
  }
  if (rc < 0) {
    int localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EINTR) {
      return TransportReadResult::TIMEOUT;
    }
    if (localErrno != EIO) {
      throw TransportBroken(string("Error reading from pty: ") +
                            strerror(localErrno));
    }
  }
  // EOF, or EIO once the slave side has no more writers.
  return childExited();
}

TransportReadResult PseudoTerminalTransport::childExited() {
  pid_t child;
  {
    lock_guard<std::mutex> guard(transportMutex);
    child = pid;
    pid = -1;
  }
  if (child <= 0) {
    return TransportReadResult::CLOSED;
  }
  int exitCode = SubprocessUtils::waitForExit(child);
  LOG(INFO) << "Remote command " << child << " exited with " << exitCode;
  if (exitCode != 0) {
    throw TransportBroken("Remote command exited with status " +
                          to_string(exitCode));
  }
  return TransportReadResult::CLOSED;
}

void PseudoTerminalTransport::write(const string& payload) {
  try {
    RawSocketUtils::writeAll(masterFd, payload.data(), payload.size());
  } catch (const std::runtime_error& re) {
    throw TransportBroken(re.what());
  }
}

void PseudoTerminalTransport::resize(const TerminalGeometry& geometry) {
  winsize win = toWinsize(geometry);
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw TransportBroken(string("Cannot resize pty: ") +
                          strerror(GetErrno()));
  }
}

void PseudoTerminalTransport::close() {
  pid_t child;
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (closed) {
      return;
    }
    closed = true;
    child = pid;
    pid = -1;
  }
  if (child > 0) {
    SubprocessUtils::terminate(child);
  }
  ::close(masterFd);
}

PseudoTerminalExecutor::PseudoTerminalExecutor(
    CommandBuilder _commandBuilder,
    shared_ptr<TargetExistenceCache> _existenceCache)
    : commandBuilder(_commandBuilder), existenceCache(_existenceCache) {}

shared_ptr<RemoteTransport> PseudoTerminalExecutor::attach(
    const TargetRef& target, const TerminalGeometry& geometry) {
  if (existenceCache && !existenceCache->exists(target)) {
    throw TargetUnreachable("Target " + targetKey(target) + " does not exist");
  }
  vector<string> argv = commandBuilder(target);
  if (argv.empty()) {
    throw TargetUnreachable("No command for target " + targetKey(target));
  }
  vector<char*> argsArray;
  for (const auto& arg : argv) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  winsize win = toWinsize(geometry);
  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &win);
  if (pid == -1) {
    throw TargetUnreachable(string("forkpty failed: ") +
                            strerror(GetErrno()));
  }
  if (pid == 0) {
    // Child: the remote-exec client owns SIGCHLD from here on.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    execvp(argsArray[0], argsArray.data());
    static const char execError[] = "Could not start remote-exec client\r\n";
    ssize_t ignored = ::write(STDERR_FILENO, execError, sizeof(execError) - 1);
    (void)ignored;
    _exit(127);
  }

  VLOG(1) << "Started " << argv[0] << " as " << pid << " for " << target;
  return make_shared<PseudoTerminalTransport>(masterFd, pid);
}
}  // namespace wt
