#include "UploadClient.hpp"

#include "TestHeaders.hpp"

using namespace wt;

TEST_CASE("Upload answers carry the destination in message",
          "[UploadClient]") {
  auto ok = UploadClient::parseResponse(
      200, "{\"message\":\"/tmp/uploads/a.txt\",\"path\":\"/tmp/uploads/a.txt\"}");
  REQUIRE(ok.status_code() == 200);
  REQUIRE(ok.message() == "/tmp/uploads/a.txt");
  REQUIRE(ok.path() == "/tmp/uploads/a.txt");
  REQUIRE(ok.error().empty());

  // Servers that only send message still yield a path
  auto bare = UploadClient::parseResponse(200, "{\"message\":\"/data/b.bin\"}");
  REQUIRE(bare.path() == "/data/b.bin");
}

TEST_CASE("Upload failures keep the server's reason", "[UploadClient]") {
  auto rejected =
      UploadClient::parseResponse(400, "{\"error\":\"Invalid file name\"}");
  REQUIRE(rejected.error() == "Invalid file name");
  REQUIRE(rejected.path().empty());

  auto opaque = UploadClient::parseResponse(502, "Bad Gateway");
  REQUIRE(opaque.status_code() == 502);
  REQUIRE(opaque.error() == "Server answered 502: Bad Gateway");
}

TEST_CASE("Upload paths encode the target and file", "[UploadClient]") {
  REQUIRE(UploadClient::uploadPath(makeTargetRef("default", "web-0"),
                                   "my notes.txt", "alice") ==
          "/upload/default/web-0?filename=my%20notes.txt&chinesename=alice");
}
