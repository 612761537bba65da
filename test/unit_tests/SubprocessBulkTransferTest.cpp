#include "SubprocessBulkTransfer.hpp"

#include "TestHeaders.hpp"
#include "UploadInjector.hpp"

using namespace wt;

namespace {
// Runs the "remote" command on this machine.
vector<string> runLocally(const TargetRef&, const vector<string>& command) {
  return command;
}

string readFile(const string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct TempDir {
  string path;

  TempDir() {
    string pattern = GetTempDirectory() + string("wt_bulk_XXXXXXXX");
    path = string(mkdtemp(&pattern[0]));
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};
}  // namespace

TEST_CASE("put streams the source to the destination",
          "[SubprocessBulkTransfer]") {
  TempDir dir;
  SubprocessBulkTransfer transfer(runLocally);
  // Several chunks, and the destination directory does not exist yet
  string payload;
  for (int i = 0; i < 5000; i++) {
    payload += to_string(i) + "\n";
  }
  string dest = dir.path + "/nested/out.txt";
  StringByteSource source(payload);
  vector<int64_t> progress;
  transfer.put(makeTargetRef("local", "host"), dest, &source,
               [&progress](int64_t sent) {
                 progress.push_back(sent);
                 return true;
               });

  REQUIRE(readFile(dest) == payload);
  REQUIRE_FALSE(fs::exists(dest + ".partial"));
  REQUIRE(progress.size() > 1);
  REQUIRE(progress.back() == int64_t(payload.size()));
}

TEST_CASE("put replaces an existing file", "[SubprocessBulkTransfer]") {
  TempDir dir;
  string dest = dir.path + "/config.yaml";
  {
    std::ofstream out(dest);
    out << "old contents";
  }
  SubprocessBulkTransfer transfer(runLocally);
  StringByteSource source("new contents");
  transfer.put(makeTargetRef("local", "host"), dest, &source,
               BulkTransfer::ProgressFn());
  REQUIRE(readFile(dest) == "new contents");
}

TEST_CASE("A cancelled put leaves the old file alone",
          "[SubprocessBulkTransfer]") {
  TempDir dir;
  string dest = dir.path + "/data.bin";
  {
    std::ofstream out(dest);
    out << "keep me";
  }
  SubprocessBulkTransfer transfer(runLocally);
  StringByteSource source(string(SubprocessBulkTransfer::CHUNK_SIZE * 4, 'q'));
  REQUIRE_THROWS_AS(transfer.put(makeTargetRef("local", "host"), dest, &source,
                                 [](int64_t) { return false; }),
                    UploadTransportFailed);
  REQUIRE(readFile(dest) == "keep me");
  REQUIRE_FALSE(fs::exists(dest + ".partial"));
}

TEST_CASE("A failing receiver reports its output",
          "[SubprocessBulkTransfer]") {
  TempDir dir;
  // mkdir -p cannot create a directory below a regular file
  string blocker = dir.path + "/blocker";
  {
    std::ofstream out(blocker);
    out << "x";
  }
  SubprocessBulkTransfer transfer(runLocally);
  StringByteSource source("payload");
  try {
    transfer.put(makeTargetRef("local", "host"), blocker + "/sub/file.txt",
                 &source, BulkTransfer::ProgressFn());
    FAIL("put should have thrown");
  } catch (const UploadTransportFailed& utf) {
    REQUIRE(string(utf.what()).find("exit code") != string::npos);
  }
}

TEST_CASE("A receiver that cannot start is a transport failure",
          "[SubprocessBulkTransfer]") {
  SubprocessBulkTransfer transfer(
      [](const TargetRef&, const vector<string>& command) {
        if (command[0] == "rm") {
          return command;
        }
        return vector<string>({"/nonexistent/kubectl"});
      });
  StringByteSource source("payload");
  REQUIRE_THROWS_AS(transfer.put(makeTargetRef("local", "host"),
                                 "/tmp/wt-never-written", &source,
                                 BulkTransfer::ProgressFn()),
                    UploadTransportFailed);
  REQUIRE_FALSE(fs::exists("/tmp/wt-never-written"));
}

TEST_CASE("Receive commands carry the destination as arguments",
          "[SubprocessBulkTransfer]") {
  auto command = SubprocessBulkTransfer::receiveCommand("/tmp/a b/c.txt", 12);
  REQUIRE(command.size() == 7);
  REQUIRE(command[0] == "sh");
  REQUIRE(command[4] == "/tmp/a b");
  REQUIRE(command[5] == "/tmp/a b/c.txt");
  REQUIRE(command[6] == "12");

  REQUIRE(SubprocessBulkTransfer::cleanupCommand("/tmp/c.txt") ==
          vector<string>({"rm", "-f", "/tmp/c.txt.partial"}));
}
