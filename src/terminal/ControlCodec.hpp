#ifndef __WT_CONTROL_CODEC__
#define __WT_CONTROL_CODEC__

#include "Headers.hpp"
#include "SessionErrors.hpp"

namespace wt {
enum class ControlMessageKind { DATA, RESIZE, HEARTBEAT };

/**
 * @brief One decoded frame from the session channel.
 */
struct ControlMessage {
  ControlMessageKind kind = ControlMessageKind::DATA;
  /** @brief Terminal bytes, set only for DATA. */
  string data;
  /** @brief New geometry, set only for RESIZE. */
  TerminalGeometry geometry;
};

/**
 * @brief Encodes and decodes the inline control vocabulary carried next to
 * terminal bytes on one channel.
 *
 * Wire contract:
 *  - A payload consisting of exactly one HEARTBEAT_BYTE is a heartbeat.
 *  - A text frame holding a JSON object with a "type" member is a control
 *    message.  The only known type is {"type":"resize","cols":C,"rows":R}.
 *  - Every other frame, and every binary frame, is raw terminal data.
 */
class ControlCodec {
 public:
  /**
   * @brief Classifies a received frame.
   * @throws ProtocolViolation for a control message with an unknown type or
   * invalid fields.
   */
  static ControlMessage decode(const string& payload, bool textFrame = true);

  /** @brief Serializes a resize control message. */
  static string encodeResize(const TerminalGeometry& geometry);

  static string encodeHeartbeat() { return string(1, HEARTBEAT_BYTE); }

  static bool isHeartbeat(const string& payload) {
    return payload.size() == 1 && payload[0] == HEARTBEAT_BYTE;
  }
};
}  // namespace wt

#endif  // __WT_CONTROL_CODEC__
