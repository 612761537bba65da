#include "SessionRegistry.hpp"

#include "FakeRemoteExec.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
shared_ptr<Session> openSession(shared_ptr<FakeRemoteExecutor> executor,
                                const TargetRef& target, const string& user) {
  SessionConfig config;
  config.livenessTimeoutMs = 0;
  config.readTimeoutMs = 10;
  config.chunking.threshold = 0;
  auto session =
      make_shared<Session>(executor, target, user, make_shared<RecordingSink>(),
                           config, make_shared<SystemClock>());
  session->open(makeGeometry(80, 24));
  return session;
}
}  // namespace

TEST_CASE("Nudges reach only the uploader's sessions on that target",
          "[SessionRegistry]") {
  auto executor = make_shared<FakeRemoteExecutor>();
  auto web = makeTargetRef("default", "web-0");
  auto db = makeTargetRef("default", "db-0");
  SessionRegistry registry;

  auto mine = openSession(executor, web, "alice");
  auto mine2 = openSession(executor, web, "alice");
  auto otherUser = openSession(executor, web, "bob");
  auto otherTarget = openSession(executor, db, "alice");
  for (auto s : {mine, mine2, otherUser, otherTarget}) {
    registry.add(s);
  }
  REQUIRE(registry.size() == 4);

  REQUIRE(executor->transportCount() == 4);
  REQUIRE(registry.nudge(web, "alice") == 2);

  registry.remove(mine2->getId());
  REQUIRE(registry.size() == 3);
  REQUIRE(registry.nudge(web, "alice") == 1);
  REQUIRE(registry.nudge(web, "carol") == 0);
}

TEST_CASE("Closed and destroyed sessions are skipped", "[SessionRegistry]") {
  auto executor = make_shared<FakeRemoteExecutor>();
  auto web = makeTargetRef("default", "web-0");
  SessionRegistry registry;

  auto closed = openSession(executor, web, "alice");
  registry.add(closed);
  closed->close(CloseReason::NORMAL);
  REQUIRE(closed->waitForClose(5000));
  REQUIRE(registry.nudge(web, "alice") == 0);

  {
    auto gone = openSession(executor, web, "alice");
    registry.add(gone);
  }
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.nudge(web, "alice") == 0);
}

TEST_CASE("Nudged sessions receive the keystrokes", "[SessionRegistry]") {
  auto executor = make_shared<FakeRemoteExecutor>();
  auto web = makeTargetRef("default", "web-0");
  SessionRegistry registry;
  auto session = openSession(executor, web, "alice");
  registry.add(session);
  auto transport = executor->lastTransport();

  REQUIRE(registry.nudge(web, "alice") == 1);
  REQUIRE(registry.nudge(web, "alice", "ls\r") == 1);
  REQUIRE(transport->waitFor(
      [&] { return transport->getWrittenData() == "\rls\r"; }));
}
