/**
 * @file cec_message.hpp
 * @brief CecMessage: one immutable bus message (source, destination, opcode, params).
 *
 * @details
 * ## Role
 * Everything the engine sends or receives is a `CecMessage`. It is a small
 * value type: copy it, compare it, queue it. There are no setters; a message
 * is fully formed by its constructor and checked once against the addressing
 * rules and the opcode's parameter schema.
 *
 * ## Wire shape
 * ```
 *   byte 0   : header = (source << 4) | destination
 *   byte 1   : opcode
 *   byte 2.. : parameters (0..14 bytes)
 * ```
 * A one-byte frame (header only) is a bus poll and never reaches this layer.
 *
 * ## Validation
 * - Both addresses must fit in 4 bits (0..15).
 * - At most `MAX_PARAMS` parameter bytes.
 * - Opcodes with a known schema (see cec_constants.hpp) must carry exactly
 *   that many parameters. Unknown opcodes are accepted as-is.
 *
 * A message that fails validation keeps its fields for logging but reports a
 * non-Ok `status()`. The local device drops such messages at its boundary.
 *
 * @code
 * uint8_t raw[] = {0x04, 0x90, 0x00};          // TV -> playback 1, power on
 * cecflow::CecMessage m = cecflow::CecMessage::from_bytes(raw, sizeof raw);
 * if (m.valid() && m.opcode() == cecflow::OP_REPORT_POWER_STATUS) { ... }
 * @endcode
 */
#pragma once
#include <stdint.h>
#include <stddef.h>
#include <vector>
#include "etl/vector.h"
#include "cec_constants.hpp"

namespace cecflow {

/// Result codes for constructing / parsing a CecMessage.
enum class MessageStatus : uint8_t {
  Ok = 0,
  Empty,          // default-constructed, never filled
  TooShort,       // frame shorter than header + opcode
  BadAddress,     // source or destination outside 0..15
  TooManyParams,  // more than MAX_PARAMS parameter bytes
  ParamMismatch   // parameter count does not match the opcode schema
};

class CecMessage {
public:
  static constexpr size_t MAX_PARAMS = 14;   ///< 16-byte CEC frame minus header and opcode
  using Params = etl::vector<uint8_t, MAX_PARAMS>;

  // -------- Constructors --------

  /// Default: empty message, invalid until replaced.
  CecMessage() = default;

  /// Message without parameters.
  CecMessage(uint8_t source, uint8_t destination, uint8_t opcode);

  /// Message with `n` parameter bytes copied from `params`.
  CecMessage(uint8_t source, uint8_t destination, uint8_t opcode,
             const uint8_t* params, size_t n);

  /// Parse a raw frame (header, opcode, params).
  static CecMessage from_bytes(const uint8_t* data, size_t n);
  static CecMessage from_bytes(const std::vector<uint8_t>& frame) {
    return from_bytes(frame.data(), frame.size());
  }

  // -------- Status --------

  MessageStatus status() const { return status_; }
  bool valid() const { return status_ == MessageStatus::Ok; }

  // -------- Fields --------

  uint8_t source()      const { return source_; }
  uint8_t destination() const { return destination_; }
  uint8_t opcode()      const { return opcode_; }
  const Params& params() const { return params_; }

  bool is_broadcast() const { return destination_ == ADDR_BROADCAST; }

  // -------- Encoding --------

  /// Header byte as it goes on the wire.
  uint8_t header() const {
    return static_cast<uint8_t>(((source_ & 0x0F) << 4) | (destination_ & 0x0F));
  }

  /// Raw frame: header, opcode, params.
  std::vector<uint8_t> to_bytes() const;

  bool operator==(const CecMessage& other) const;
  bool operator!=(const CecMessage& other) const { return !(*this == other); }

  /**
   * @brief Expected parameter count for a known opcode.
   * @return Count, or -1 when the opcode has no fixed schema here.
   */
  static int expected_params(uint8_t opcode);

private:
  MessageStatus validate(size_t param_count) const;

  uint8_t source_{ADDR_UNREGISTERED};
  uint8_t destination_{ADDR_BROADCAST};
  uint8_t opcode_{OP_FEATURE_ABORT};
  Params  params_{};
  MessageStatus status_{MessageStatus::Empty};
};

} // namespace cecflow
