#include "TerminalClient.hpp"

#include "FakeClock.hpp"
#include "FakeConsole.hpp"
#include "FakeRemoteExec.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
struct ClientHarness {
  shared_ptr<FakeConsole> console;
  shared_ptr<FakeRemoteExecutor> executor;
  shared_ptr<ManualTimerScheduler> timers;
  int inputPipe[2];
  shared_ptr<TerminalClient> client;
  shared_ptr<thread> runThread;
  std::atomic<int> exitCode;
  std::atomic<bool> finished;

  explicit ClientHarness(int maxAttempts = 3)
      : console(new FakeConsole()),
        executor(new FakeRemoteExecutor()),
        timers(new ManualTimerScheduler()),
        exitCode(-1),
        finished(false) {
    FATAL_FAIL(::pipe(inputPipe));
    ClientConfig config;
    config.session.livenessTimeoutMs = 0;
    config.session.readTimeoutMs = 10;
    config.reconnect.maxAttempts = maxAttempts;
    config.reconnect.backoffBaseMs = 100;
    client.reset(new TerminalClient(console, executor, timers,
                                    make_shared<SystemClock>(),
                                    makeTargetRef("default", "web-0"), "alice",
                                    config, inputPipe[0]));
  }

  ~ClientHarness() {
    closeInput();
    if (runThread) {
      runThread->join();
    }
    client.reset();
    ::close(inputPipe[0]);
  }

  void start() {
    runThread.reset(new thread([this]() {
      exitCode = client->run();
      finished = true;
    }));
  }

  void type(const string& keys) {
    REQUIRE(::write(inputPipe[1], keys.data(), keys.size()) ==
            ssize_t(keys.size()));
  }

  void closeInput() {
    if (inputPipe[1] >= 0) {
      ::close(inputPipe[1]);
      inputPipe[1] = -1;
    }
  }

  bool waitForExit(int timeoutMs = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
      if (finished) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return finished;
  }

  shared_ptr<FakeTransport> waitForTransport(size_t count = 1) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (executor->transportCount() >= count) {
        return executor->lastTransport();
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return executor->lastTransport();
  }
};
}  // namespace

TEST_CASE("Transitions are described for the user", "[TerminalClient]") {
  REQUIRE(TerminalClient::describeTransition(
              SupervisorState::RECONNECTING, 2, 5,
              std::chrono::milliseconds(2000), "broken pipe") ==
          "Connection lost (broken pipe). Reconnecting in 2000 ms (attempt "
          "2/5)");
  REQUIRE(TerminalClient::describeTransition(SupervisorState::EXHAUSTED, 5, 5,
                                             std::chrono::milliseconds(0),
                                             "refused") ==
          "Connection lost: refused");
  REQUIRE(TerminalClient::describeTransition(SupervisorState::CONNECTED, 1, 5,
                                             std::chrono::milliseconds(0),
                                             "Reconnected") == "Reconnected");
  REQUIRE(TerminalClient::describeTransition(SupervisorState::CONNECTED, 0, 5,
                                             std::chrono::milliseconds(0),
                                             "Connected")
              .empty());
  REQUIRE(TerminalClient::describeTransition(SupervisorState::IDLE, 0, 5,
                                             std::chrono::milliseconds(0), "")
              .empty());
}

TEST_CASE("Keystrokes go out and output comes back", "[TerminalClient]") {
  ClientHarness harness;
  harness.executor->setEcho(true);
  harness.start();
  auto transport = harness.waitForTransport();
  REQUIRE(transport);

  harness.type("uname -a\r");
  REQUIRE(harness.console->waitForOutput("uname -a\r"));
  REQUIRE(transport->getWrittenData() == "uname -a\r");

  // EOF on input ends the client cleanly
  harness.closeInput();
  REQUIRE(harness.waitForExit());
  REQUIRE(harness.exitCode.load() == 0);
  REQUIRE(harness.console->getSetupCount() == 1);
  REQUIRE(harness.console->getTeardownCount() == 1);
  REQUIRE(transport->getCloseCount() == 1);
}

TEST_CASE("Window changes are forwarded", "[TerminalClient]") {
  ClientHarness harness;
  harness.console->setGeometry(makeGeometry(120, 40));
  harness.start();
  auto transport = harness.waitForTransport();
  REQUIRE(transport);
  REQUIRE((harness.executor->getAttachGeometries().at(0) ==
           makeGeometry(120, 40)));

  harness.console->setGeometry(makeGeometry(200, 50));
  REQUIRE(transport->waitFor([&] {
    auto resizes = transport->getResizes();
    return !resizes.empty() && resizes.back() == makeGeometry(200, 50);
  }));
}

TEST_CASE("A clean remote exit ends the client", "[TerminalClient]") {
  ClientHarness harness;
  harness.start();
  auto transport = harness.waitForTransport();
  REQUIRE(transport);
  transport->pushInbound("logout\r\n");
  transport->endRemote();
  REQUIRE(harness.waitForExit());
  REQUIRE(harness.exitCode.load() == 0);
  REQUIRE(harness.console->getOutput().find("logout") != string::npos);
  REQUIRE(harness.timers->pendingCount() == 0);
}

TEST_CASE("A failed first connect is reported", "[TerminalClient]") {
  ClientHarness harness;
  harness.executor->failNextAttach(TargetUnreachable("pod web-0 not found"));
  harness.start();
  REQUIRE(harness.waitForExit());
  REQUIRE(harness.exitCode.load() == 1);
  REQUIRE(harness.console->getOutput().find(
              "Could not connect to default/web-0: pod web-0 not found") !=
          string::npos);
  REQUIRE(harness.console->getSetupCount() == 0);
}

TEST_CASE("Lost connections are retried and announced", "[TerminalClient]") {
  ClientHarness harness;
  harness.executor->setEcho(true);
  harness.start();
  auto first = harness.waitForTransport();
  REQUIRE(first);

  first->breakLink();
  REQUIRE(harness.console->waitForOutput("Reconnecting in 100 ms (attempt 1/3)"));
  REQUIRE(harness.timers->fireNext());
  REQUIRE(harness.console->waitForOutput("[wt] Reconnected"));

  auto second = harness.waitForTransport(2);
  REQUIRE(second != first);
  harness.type("ls\r");
  REQUIRE(second->waitFor([&] { return second->getWrittenData() == "ls\r"; }));
}

TEST_CASE("The client gives up once retries run out", "[TerminalClient]") {
  ClientHarness harness(0);
  harness.start();
  auto transport = harness.waitForTransport();
  REQUIRE(transport);
  transport->breakLink();
  REQUIRE(harness.waitForExit());
  REQUIRE(harness.exitCode.load() == 1);
  REQUIRE(harness.console->getOutput().find(
              "[wt] Connection lost: fake transport broke") != string::npos);
}
