#include "TestHeaders.hpp"
#include "UrlUtils.hpp"

using namespace wt;

TEST_CASE("Request targets split into path and query", "[UrlUtils]") {
  auto parsed = UrlUtils::parseTarget(
      "/ws/default/web-0?chinesename=%E5%BC%A0%E4%B8%89&cols=120&rows=40");
  REQUIRE(parsed.path == "/ws/default/web-0");
  REQUIRE(parsed.query.size() == 3);
  REQUIRE(parsed.query["chinesename"] == "\xe5\xbc\xa0\xe4\xb8\x89");
  REQUIRE(parsed.query["cols"] == "120");

  auto bare = UrlUtils::parseTarget("/health");
  REQUIRE(bare.path == "/health");
  REQUIRE(bare.query.empty());
}

TEST_CASE("Query parsing handles odd input", "[UrlUtils]") {
  auto parsed = UrlUtils::parseTarget("/x?a=1&a=2&&flag&name=John+Doe&e=");
  REQUIRE(parsed.query["a"] == "1");
  REQUIRE(parsed.query.count("flag") == 1);
  REQUIRE(parsed.query["flag"].empty());
  REQUIRE(parsed.query["name"] == "John Doe");
  REQUIRE(parsed.query["e"].empty());
}

TEST_CASE("Percent decoding keeps malformed escapes", "[UrlUtils]") {
  REQUIRE(UrlUtils::decode("a%20b") == "a b");
  REQUIRE(UrlUtils::decode("a+b") == "a+b");
  REQUIRE(UrlUtils::decode("a+b", true) == "a b");
  REQUIRE(UrlUtils::decode("100%") == "100%");
  REQUIRE(UrlUtils::decode("%zz") == "%zz");
  REQUIRE(UrlUtils::decode("%4") == "%4");
}

TEST_CASE("Encoding escapes everything but unreserved bytes", "[UrlUtils]") {
  REQUIRE(UrlUtils::encode("web-0_a.b~c") == "web-0_a.b~c");
  REQUIRE(UrlUtils::encode("a b/c?d") == "a%20b%2Fc%3Fd");
  REQUIRE(UrlUtils::encode("\xe6\x9d\x8e") == "%E6%9D%8E");
  REQUIRE(UrlUtils::decode(UrlUtils::encode("report 2024/Q1.csv")) ==
          "report 2024/Q1.csv");
}

TEST_CASE("Path segments skip empty pieces", "[UrlUtils]") {
  REQUIRE(UrlUtils::pathSegments("/ws//default/web-0/") ==
          vector<string>({"ws", "default", "web-0"}));
  REQUIRE(UrlUtils::pathSegments("/upload/ns/my%20pod") ==
          vector<string>({"upload", "ns", "my pod"}));
  REQUIRE(UrlUtils::pathSegments("/").empty());
}

TEST_CASE("Prefixes only strip on a segment boundary", "[UrlUtils]") {
  REQUIRE(UrlUtils::stripPrefix("/api/v1/health", "/api/v1") == "/health");
  REQUIRE(UrlUtils::stripPrefix("/api/v1", "/api/v1") == "/");
  REQUIRE(UrlUtils::stripPrefix("/api/v10/health", "/api/v1") ==
          "/api/v10/health");
  REQUIRE(UrlUtils::stripPrefix("/health", "/api/v1") == "/health");
}

TEST_CASE("Integer query values fall back to defaults", "[UrlUtils]") {
  map<string, string> query = {
      {"cols", "132"}, {"rows", "4x"}, {"big", "99999999999"}};
  REQUIRE(UrlUtils::queryInt(query, "cols", 80) == 132);
  REQUIRE(UrlUtils::queryInt(query, "rows", 24) == 24);
  REQUIRE(UrlUtils::queryInt(query, "big", 7) == 7);
  REQUIRE(UrlUtils::queryInt(query, "missing", 5) == 5);
}
