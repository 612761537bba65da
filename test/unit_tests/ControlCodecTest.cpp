#include "ControlCodec.hpp"
#include "TestHeaders.hpp"

using namespace wt;

TEST_CASE("A lone NUL byte is a heartbeat", "[ControlCodec]") {
  REQUIRE(ControlCodec::decode(string(1, '\0')).kind ==
          ControlMessageKind::HEARTBEAT);
  REQUIRE(ControlCodec::decode(string(1, '\0'), false).kind ==
          ControlMessageKind::HEARTBEAT);
  REQUIRE(ControlCodec::isHeartbeat(ControlCodec::encodeHeartbeat()));

  // A NUL inside real data is just data
  string embedded("a\0b", 3);
  auto message = ControlCodec::decode(embedded);
  REQUIRE(message.kind == ControlMessageKind::DATA);
  REQUIRE(message.data == embedded);
}

TEST_CASE("Resize messages decode to geometry", "[ControlCodec]") {
  auto message = ControlCodec::decode("{\"type\":\"resize\",\"cols\":120,"
                                      "\"rows\":40}");
  REQUIRE(message.kind == ControlMessageKind::RESIZE);
  REQUIRE(message.geometry.cols() == 120);
  REQUIRE(message.geometry.rows() == 40);
  REQUIRE(message.data.empty());

  auto encoded = ControlCodec::encodeResize(makeGeometry(100, 30));
  auto decoded = ControlCodec::decode(encoded);
  REQUIRE(decoded.kind == ControlMessageKind::RESIZE);
  REQUIRE((decoded.geometry == makeGeometry(100, 30)));
}

TEST_CASE("Plain text and binary frames are data", "[ControlCodec]") {
  auto typed = ControlCodec::decode("ls -la\r");
  REQUIRE(typed.kind == ControlMessageKind::DATA);
  REQUIRE(typed.data == "ls -la\r");

  // JSON without a type is something the user typed
  auto jsonText = ControlCodec::decode("{\"cols\":1}");
  REQUIRE(jsonText.kind == ControlMessageKind::DATA);
  REQUIRE(jsonText.data == "{\"cols\":1}");

  auto broken = ControlCodec::decode("{not json");
  REQUIRE(broken.kind == ControlMessageKind::DATA);

  // Binary frames are never interpreted
  string resize = ControlCodec::encodeResize(makeGeometry(10, 10));
  auto binary = ControlCodec::decode(resize, false);
  REQUIRE(binary.kind == ControlMessageKind::DATA);
  REQUIRE(binary.data == resize);
}

TEST_CASE("Bad control messages are protocol violations", "[ControlCodec]") {
  REQUIRE_THROWS_AS(ControlCodec::decode("{\"type\":\"reboot\"}"),
                    ProtocolViolation);
  REQUIRE_THROWS_AS(ControlCodec::decode("{\"type\":7}"), ProtocolViolation);
  REQUIRE_THROWS_AS(ControlCodec::decode("{\"type\":\"resize\",\"cols\":80}"),
                    ProtocolViolation);
  REQUIRE_THROWS_AS(
      ControlCodec::decode("{\"type\":\"resize\",\"cols\":0,\"rows\":24}"),
      ProtocolViolation);
  REQUIRE_THROWS_AS(
      ControlCodec::decode("{\"type\":\"resize\",\"cols\":\"80\",\"rows\":24}"),
      ProtocolViolation);
  REQUIRE_THROWS_AS(
      ControlCodec::decode("{\"type\":\"resize\",\"cols\":80,\"rows\":70000}"),
      ProtocolViolation);
}
