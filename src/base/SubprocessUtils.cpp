#include "SubprocessUtils.hpp"

namespace wt {
namespace {
int decodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
}  // namespace

int SubprocessUtils::runToString(const string& command,
                                 const vector<string>& args, string* output) {
  vector<string> argv = {command};
  argv.insert(argv.end(), args.begin(), args.end());
  ChildProcess child = spawn(argv, false);
  *output = drain(child.outputFd);
  int exitCode = waitForExit(child.pid);
  VLOG(1) << command << " exited with " << exitCode;
  return exitCode;
}

ChildProcess SubprocessUtils::spawn(const vector<string>& argv,
                                    bool pipeStdin) {
  if (argv.empty()) {
    throw std::runtime_error("Cannot spawn an empty command");
  }
  int stdinPipe[2] = {-1, -1};
  int outputPipe[2] = {-1, -1};
  if (pipeStdin && ::pipe(stdinPipe) == -1) {
    throw std::runtime_error(string("pipe: ") + strerror(GetErrno()));
  }
  if (::pipe(outputPipe) == -1) {
    int localErrno = GetErrno();
    if (pipeStdin) {
      ::close(stdinPipe[0]);
      ::close(stdinPipe[1]);
    }
    throw std::runtime_error(string("pipe: ") + strerror(localErrno));
  }

  // Build argv before forking: only async-signal-safe calls in the child.
  vector<char*> argsArray;
  for (const auto& arg : argv) {
    argsArray.push_back(const_cast<char*>(arg.c_str()));
  }
  argsArray.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    if (pipeStdin) {
      dup2(stdinPipe[0], STDIN_FILENO);
      ::close(stdinPipe[0]);
      ::close(stdinPipe[1]);
    }
    dup2(outputPipe[1], STDOUT_FILENO);
    dup2(outputPipe[1], STDERR_FILENO);
    ::close(outputPipe[0]);
    ::close(outputPipe[1]);
    signal(SIGPIPE, SIG_DFL);
    execvp(argsArray[0], argsArray.data());

    static const char execError[] = "execvp error\n";
    ssize_t ignored = ::write(STDERR_FILENO, execError, sizeof(execError) - 1);
    (void)ignored;
    _exit(127);
  } else if (pid < 0) {
    int localErrno = GetErrno();
    if (pipeStdin) {
      ::close(stdinPipe[0]);
      ::close(stdinPipe[1]);
    }
    ::close(outputPipe[0]);
    ::close(outputPipe[1]);
    throw std::runtime_error(string("Failed to fork: ") + strerror(localErrno));
  }

  // parent process
  ChildProcess child;
  child.pid = pid;
  if (pipeStdin) {
    ::close(stdinPipe[0]);
    child.stdinFd = stdinPipe[1];
  }
  ::close(outputPipe[1]);
  child.outputFd = outputPipe[0];
  return child;
}

string SubprocessUtils::drain(int fd) {
  string result;
  char buf[4096];
  while (true) {
    ssize_t nbytes = ::read(fd, buf, sizeof(buf));
    if (nbytes < 0 && GetErrno() == EINTR) {
      continue;
    }
    if (nbytes <= 0) {
      break;
    }
    result.append(buf, nbytes);
  }
  ::close(fd);
  return result;
}

int SubprocessUtils::waitForExit(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      LOG(WARNING) << "waitpid failed for " << pid << ": "
                   << strerror(GetErrno());
      return -1;
    }
  }
  return decodeStatus(status);
}

int SubprocessUtils::terminate(pid_t pid, int graceMs) {
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == pid) {
    return decodeStatus(status);
  }
  ::kill(pid, SIGTERM);
  for (int waited = 0; waited < graceMs; waited += 10) {
    rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      return decodeStatus(status);
    }
    if (rc == -1 && GetErrno() != EINTR) {
      return -1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  LOG(WARNING) << "Child " << pid << " ignored SIGTERM, killing";
  ::kill(pid, SIGKILL);
  return waitForExit(pid);
}
}  // namespace wt
