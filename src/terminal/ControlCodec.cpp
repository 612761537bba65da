#include "ControlCodec.hpp"

#include "JsonLib.hpp"

namespace wt {
namespace {
int readDimension(const json& j, const char* field) {
  auto it = j.find(field);
  if (it == j.end() || !it->is_number_integer()) {
    throw ProtocolViolation(string("resize is missing integer field ") +
                            field);
  }
  int64_t value = it->get<int64_t>();
  if (value <= 0 || value > 0xFFFF) {
    throw ProtocolViolation(string("resize field out of range: ") + field +
                            "=" + to_string(value));
  }
  return int(value);
}
}  // namespace

ControlMessage ControlCodec::decode(const string& payload, bool textFrame) {
  ControlMessage message;
  if (isHeartbeat(payload)) {
    message.kind = ControlMessageKind::HEARTBEAT;
    return message;
  }

  message.kind = ControlMessageKind::DATA;
  message.data = payload;
  if (!textFrame) {
    return message;
  }

  size_t firstChar = payload.find_first_not_of(" \t\r\n");
  if (firstChar == string::npos || payload[firstChar] != '{') {
    return message;
  }
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("type")) {
    // Looks like JSON but is not a control envelope: pass it through as typed
    // text.
    return message;
  }

  const json& type = j["type"];
  if (!type.is_string()) {
    throw ProtocolViolation("control message type is not a string");
  }
  if (type.get<string>() != "resize") {
    throw ProtocolViolation("unknown control message type: " +
                            type.get<string>());
  }
  message.kind = ControlMessageKind::RESIZE;
  message.data.clear();
  message.geometry.set_cols(readDimension(j, "cols"));
  message.geometry.set_rows(readDimension(j, "rows"));
  return message;
}

string ControlCodec::encodeResize(const TerminalGeometry& geometry) {
  json j;
  j["type"] = "resize";
  j["cols"] = geometry.cols();
  j["rows"] = geometry.rows();
  return j.dump();
}
}  // namespace wt
