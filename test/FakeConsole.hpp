#ifndef __WT_FAKE_CONSOLE__
#define __WT_FAKE_CONSOLE__

#include "Console.hpp"
#include "Headers.hpp"

namespace wt {
/**
 * @brief Console whose output lands on one end of a socketpair.  The test
 * reads the other end.
 */
class FakeConsole : public Console {
 public:
  FakeConsole() : setupCount(0), teardownCount(0) {
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    int flags = ::fcntl(fds[1], F_GETFL, 0);
    FATAL_FAIL(::fcntl(fds[1], F_SETFL, flags | O_NONBLOCK));
    geometry = makeGeometry(80, 24);
  }

  virtual ~FakeConsole() {
    ::close(fds[0]);
    ::close(fds[1]);
  }

  virtual TerminalGeometry getGeometry() {
    lock_guard<std::mutex> guard(consoleMutex);
    return geometry;
  }

  virtual void setup() {
    lock_guard<std::mutex> guard(consoleMutex);
    setupCount++;
  }

  virtual void teardown() {
    lock_guard<std::mutex> guard(consoleMutex);
    teardownCount++;
  }

  virtual int getFd() { return fds[0]; }

  void setGeometry(const TerminalGeometry& newGeometry) {
    lock_guard<std::mutex> guard(consoleMutex);
    geometry = newGeometry;
  }

  int getSetupCount() {
    lock_guard<std::mutex> guard(consoleMutex);
    return setupCount;
  }

  int getTeardownCount() {
    lock_guard<std::mutex> guard(consoleMutex);
    return teardownCount;
  }

  /** @brief Everything written to the console so far. */
  string getOutput() {
    lock_guard<std::mutex> guard(consoleMutex);
    char buf[4096];
    while (true) {
      ssize_t rc = ::read(fds[1], buf, sizeof(buf));
      if (rc <= 0) {
        break;
      }
      output.append(buf, rc);
    }
    return output;
  }

  bool waitForOutput(const string& expected, int timeoutMs = 5000) {
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
      if (getOutput().find(expected) != string::npos) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return getOutput().find(expected) != string::npos;
  }

 protected:
  std::mutex consoleMutex;
  int fds[2];
  TerminalGeometry geometry;
  int setupCount;
  int teardownCount;
  string output;
};
}  // namespace wt

#endif  // __WT_FAKE_CONSOLE__
