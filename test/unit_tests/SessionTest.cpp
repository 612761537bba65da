#include "Session.hpp"

#include "FakeClock.hpp"
#include "FakeRemoteExec.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
bool waitUntil(function<bool()> predicate, int timeoutMs = 5000) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

SessionConfig quietConfig() {
  SessionConfig config;
  config.livenessTimeoutMs = 0;
  config.readTimeoutMs = 10;
  return config;
}

struct SessionHarness {
  shared_ptr<FakeRemoteExecutor> executor;
  shared_ptr<RecordingSink> sink;
  shared_ptr<FakeClock> clock;
  std::atomic<int> callbacks;
  std::atomic<int> lastReason;
  shared_ptr<Session> session;

  explicit SessionHarness(const SessionConfig& config)
      : executor(new FakeRemoteExecutor()),
        sink(new RecordingSink()),
        clock(new FakeClock()),
        callbacks(0),
        lastReason(-1) {
    session.reset(new Session(executor, makeTargetRef("default", "web-0"),
                              "alice", sink, config, clock));
    session->setCloseCallback([this](CloseReason reason, const string&) {
      lastReason = int(reason);
      callbacks++;
    });
  }

  ~SessionHarness() { session.reset(); }

  shared_ptr<FakeTransport> open() {
    session->open(makeGeometry(80, 24));
    return executor->lastTransport();
  }
};
/** @brief Holds attach() until release() is called. */
class GatedExecutor : public FakeRemoteExecutor {
 public:
  GatedExecutor() : entered(false), released(false) {}

  virtual shared_ptr<RemoteTransport> attach(const TargetRef& target,
                                             const TerminalGeometry& geometry) {
    {
      std::unique_lock<std::mutex> lock(gateMutex);
      entered = true;
      gateCv.notify_all();
      gateCv.wait(lock, [this] { return released; });
    }
    return FakeRemoteExecutor::attach(target, geometry);
  }

  void waitForAttach() {
    std::unique_lock<std::mutex> lock(gateMutex);
    gateCv.wait(lock, [this] { return entered; });
  }

  void release() {
    lock_guard<std::mutex> guard(gateMutex);
    released = true;
    gateCv.notify_all();
  }

 protected:
  std::mutex gateMutex;
  std::condition_variable gateCv;
  bool entered;
  bool released;
};
}  // namespace

TEST_CASE("Session relays bytes in both directions in order", "[Session]") {
  SessionHarness harness(quietConfig());
  auto transport = harness.open();
  REQUIRE(harness.session->getState() == SessionState::OPEN);

  for (int i = 0; i < 50; i++) {
    harness.session->send(to_string(i) + ",");
  }
  string expected;
  for (int i = 0; i < 50; i++) {
    expected += to_string(i) + ",";
  }
  REQUIRE(transport->waitFor(
      [&] { return transport->getWrittenData() == expected; }));

  transport->pushInbound("hello ");
  transport->pushInbound("world");
  REQUIRE(harness.sink->waitForOutput("hello world"));
}

TEST_CASE("Session echoes through a loopback target", "[Session]") {
  SessionHarness harness(quietConfig());
  harness.executor->setEcho(true);
  harness.open();
  harness.session->send("whoami\r");
  REQUIRE(harness.sink->waitForOutput("whoami\r"));
}

TEST_CASE("Heartbeats count as activity but never reach the terminal",
          "[Session]") {
  SessionHarness harness(quietConfig());
  auto transport = harness.open();

  harness.clock->advance(std::chrono::milliseconds(1000));
  transport->pushInbound(ControlCodec::encodeHeartbeat());
  REQUIRE(waitUntil([&] {
    return harness.session->getLastActivity() == harness.clock->now();
  }));

  transport->pushInbound("$ ");
  REQUIRE(harness.sink->waitForOutput("$ "));
  for (const auto& write : harness.sink->getWrites()) {
    REQUIRE_FALSE(ControlCodec::isHeartbeat(write));
  }
}

TEST_CASE("The last resize before open wins", "[Session]") {
  SessionHarness harness(quietConfig());
  harness.session->resize(100, 50);
  harness.session->resize(132, 43);
  auto transport = harness.open();

  // Protobuf messages compare through the MessageLite operators
  REQUIRE((harness.executor->getAttachGeometries().at(0) ==
           makeGeometry(132, 43)));
  REQUIRE((transport->getResizes().at(0) == makeGeometry(132, 43)));
  REQUIRE((harness.session->getGeometry() == makeGeometry(132, 43)));
}

TEST_CASE("Resizes while open reach the transport once per change",
          "[Session]") {
  SessionHarness harness(quietConfig());
  auto transport = harness.open();
  REQUIRE(transport->getResizes().size() == 1);

  harness.session->resize(80, 24);
  harness.session->resize(90, 30);
  harness.session->resize(90, 30);
  harness.session->resize(0, 30);
  harness.session->send("x");
  REQUIRE(transport->waitFor([&] { return transport->getWrittenData() == "x"; }));

  auto resizes = transport->getResizes();
  REQUIRE(resizes.size() == 2);
  REQUIRE((resizes[1] == makeGeometry(90, 30)));
}

TEST_CASE("A resize during attach reaches the remote once open",
          "[Session]") {
  auto executor = make_shared<GatedExecutor>();
  auto session = make_shared<Session>(
      executor, makeTargetRef("default", "web-0"), "alice",
      make_shared<RecordingSink>(), quietConfig(), make_shared<FakeClock>());
  thread opener([&] { session->open(makeGeometry(80, 24)); });
  executor->waitForAttach();
  session->resize(132, 43);
  executor->release();
  opener.join();

  REQUIRE(session->getState() == SessionState::OPEN);
  auto transport = executor->lastTransport();
  REQUIRE(transport->waitFor([&] {
    auto resizes = transport->getResizes();
    return !resizes.empty() && resizes.back() == makeGeometry(132, 43);
  }));

  // Asking again for the same geometry changes nothing
  session->resize(132, 43);
  session->send("x");
  REQUIRE(transport->waitFor([&] { return transport->getWrittenData() == "x"; }));
  REQUIRE((transport->getResizes().back() == makeGeometry(132, 43)));
  session->close(CloseReason::NORMAL, "done");
}

TEST_CASE("Close is idempotent and fires the callback once", "[Session]") {
  SessionHarness harness(quietConfig());
  auto transport = harness.open();

  harness.session->close(CloseReason::NORMAL, "user hung up");
  harness.session->close(CloseReason::ABNORMAL, "second close");
  REQUIRE(harness.session->waitForClose(5000));
  REQUIRE(waitUntil([&] { return harness.callbacks == 1; }));
  REQUIRE(harness.session->getCloseReason() == CloseReason::NORMAL);
  REQUIRE(harness.session->getCloseDetail() == "user hung up");

  harness.session->close(CloseReason::NORMAL);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE(harness.callbacks.load() == 1);
  REQUIRE(transport->getCloseCount() == 1);
}

TEST_CASE("Bytes sent outside OPEN are dropped", "[Session]") {
  SessionHarness harness(quietConfig());
  harness.session->send("too early");
  auto transport = harness.open();
  harness.session->close(CloseReason::NORMAL);
  REQUIRE(harness.session->waitForClose(5000));
  harness.session->send("too late");
  REQUIRE(transport->getWrittenData().empty());
}

TEST_CASE("A clean remote exit closes normally", "[Session]") {
  SessionHarness harness(quietConfig());
  auto transport = harness.open();
  transport->pushInbound("bye");
  transport->endRemote();
  REQUIRE(harness.session->waitForClose(5000));
  REQUIRE(harness.session->getCloseReason() == CloseReason::NORMAL);
  REQUIRE(harness.sink->getOutput() == "bye");
  REQUIRE(waitUntil([&] { return harness.callbacks == 1; }));
  REQUIRE(harness.lastReason.load() == int(CloseReason::NORMAL));
}

TEST_CASE("Transport failures close abnormally", "[Session]") {
  SECTION("read failure") {
    SessionHarness harness(quietConfig());
    auto transport = harness.open();
    transport->breakLink();
    REQUIRE(harness.session->waitForClose(5000));
    REQUIRE(harness.session->getCloseReason() == CloseReason::ABNORMAL);
    REQUIRE(waitUntil([&] { return harness.callbacks == 1; }));
    REQUIRE(harness.lastReason.load() == int(CloseReason::ABNORMAL));
  }

  SECTION("write failure") {
    SessionHarness harness(quietConfig());
    auto transport = harness.open();
    transport->setFailWrites(true);
    harness.session->send("ls\r");
    REQUIRE(harness.session->waitForClose(5000));
    REQUIRE(harness.session->getCloseReason() == CloseReason::ABNORMAL);
    REQUIRE(transport->getCloseCount() == 1);
  }
}

TEST_CASE("A rejected attach leaves the session closed", "[Session]") {
  SessionHarness harness(quietConfig());
  harness.executor->failNextAttach(TargetUnreachable("pod not found"));
  REQUIRE_THROWS_AS(harness.session->open(makeGeometry(80, 24)),
                    TargetUnreachable);
  REQUIRE(harness.session->getState() == SessionState::CLOSED);
  REQUIRE(harness.session->getCloseReason() == CloseReason::ABNORMAL);
  REQUIRE(harness.callbacks.load() == 0);

  // Never reopened
  REQUIRE_THROWS(harness.session->open(makeGeometry(80, 24)));
  REQUIRE(harness.executor->getAttachCount() == 1);
}

TEST_CASE("Permission errors surface from open", "[Session]") {
  SessionHarness harness(quietConfig());
  harness.executor->failNextAttach(PermissionDenied("forbidden"));
  REQUIRE_THROWS_AS(harness.session->open(makeGeometry(80, 24)),
                    PermissionDenied);
}

TEST_CASE("Large pastes are delivered as paced fragments", "[Session]") {
  SessionConfig config = quietConfig();
  config.chunking.threshold = 16;
  config.chunking.fragmentSize = 8;
  config.chunking.interFragmentDelay = std::chrono::milliseconds(1);
  SessionHarness harness(config);
  auto transport = harness.open();

  string paste = "echo one\necho two\necho three\n";
  harness.session->send(paste);
  harness.session->send("!");
  string expected =
      ChunkedTransferSplitter::normalizeNewlines(paste) + string("!");
  REQUIRE(transport->waitFor(
      [&] { return transport->getWrittenData() == expected; }));

  auto writes = transport->getWrites();
  REQUIRE(writes.size() > 2);
  for (const auto& write : writes) {
    REQUIRE(write.size() <= 8);
  }
}

TEST_CASE("Idle sessions probe with heartbeats", "[Session]") {
  SessionConfig config = quietConfig();
  config.livenessTimeoutMs = 300;

  SECTION("an unanswered heartbeat closes the session") {
    SessionHarness harness(config);
    auto transport = harness.open();

    harness.clock->advance(std::chrono::milliseconds(400));
    REQUIRE(transport->waitFor([&] { return transport->countHeartbeats() == 1; }));
    REQUIRE(harness.session->getState() == SessionState::OPEN);

    harness.clock->advance(std::chrono::milliseconds(400));
    REQUIRE(harness.session->waitForClose(5000));
    REQUIRE(harness.session->getCloseReason() == CloseReason::ABNORMAL);
    REQUIRE(harness.session->getCloseDetail() == "Missed heartbeat");
  }

  SECTION("an answered heartbeat keeps the session open") {
    SessionHarness harness(config);
    harness.executor->setAnswerHeartbeats(true);
    auto transport = harness.open();

    harness.clock->advance(std::chrono::milliseconds(400));
    REQUIRE(transport->waitFor([&] { return transport->countHeartbeats() == 1; }));
    REQUIRE(waitUntil([&] {
      return harness.session->getLastActivity() == harness.clock->now();
    }));

    harness.clock->advance(std::chrono::milliseconds(400));
    REQUIRE(transport->waitFor([&] { return transport->countHeartbeats() == 2; }));
    REQUIRE(harness.session->getState() == SessionState::OPEN);
  }

  SECTION("heartbeats are disabled by a zero timeout") {
    SessionHarness harness(quietConfig());
    auto transport = harness.open();
    harness.clock->advance(std::chrono::milliseconds(60 * 1000));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(transport->countHeartbeats() == 0);
    REQUIRE(harness.session->getState() == SessionState::OPEN);
  }
}
