// -----------------------------------------------------------------------------
// message_builder.cpp: builders and text helpers for CecMessage.
//
// The builders are intentionally one-liners over the CecMessage constructors;
// the parameter layouts live here and nowhere else.
// -----------------------------------------------------------------------------
#include "cecflow/message_builder.hpp"

#include <cctype>
#include <cstdio>
#include <sstream>
#include <vector>

namespace cecflow {

// ---------- builders ----------

CecMessage build_text_view_on(uint8_t src, uint8_t dst) {
  return CecMessage(src, dst, OP_TEXT_VIEW_ON);
}

CecMessage build_image_view_on(uint8_t src, uint8_t dst) {
  return CecMessage(src, dst, OP_IMAGE_VIEW_ON);
}

CecMessage build_active_source(uint8_t src, uint16_t physical_addr) {
  const uint8_t params[2] = {
    static_cast<uint8_t>(physical_addr >> 8),    // big endian on the wire
    static_cast<uint8_t>(physical_addr & 0xFF)
  };
  return CecMessage(src, ADDR_BROADCAST, OP_ACTIVE_SOURCE, params, sizeof params);
}

CecMessage build_give_device_power_status(uint8_t src, uint8_t dst) {
  return CecMessage(src, dst, OP_GIVE_DEVICE_POWER_STATUS);
}

CecMessage build_report_power_status(uint8_t src, uint8_t dst, uint8_t power_status) {
  return CecMessage(src, dst, OP_REPORT_POWER_STATUS, &power_status, 1);
}

CecMessage build_standby(uint8_t src, uint8_t dst) {
  return CecMessage(src, dst, OP_STANDBY);
}

// ---------- text helpers ----------

std::string opcode_name(uint8_t opcode) {
  switch (opcode) {
    case OP_FEATURE_ABORT:            return "feature_abort";
    case OP_IMAGE_VIEW_ON:            return "image_view_on";
    case OP_TEXT_VIEW_ON:             return "text_view_on";
    case OP_STANDBY:                  return "standby";
    case OP_ACTIVE_SOURCE:            return "active_source";
    case OP_GIVE_DEVICE_POWER_STATUS: return "give_device_power_status";
    case OP_REPORT_POWER_STATUS:      return "report_power_status";
    default: {
      char buf[8];
      std::snprintf(buf, sizeof buf, "0x%02X", opcode);
      return buf;
    }
  }
}

std::string describe(const CecMessage& msg) {
  std::ostringstream os;
  os << "src=" << int(msg.source())
     << " dst=" << int(msg.destination())
     << " op=" << opcode_name(msg.opcode())
     << " params=";
  char buf[4];
  for (size_t i = 0; i < msg.params().size(); ++i) {
    std::snprintf(buf, sizeof buf, "%02X", msg.params()[i]);
    if (i) os << ':';
    os << buf;
  }
  return os.str();
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool parse_hex_frame(const std::string& text, CecMessage& out, std::string& err) {
  std::vector<uint8_t> bytes;
  int digits = 0;      // digits collected for the current byte
  int value  = 0;

  for (char c : text) {
    if (c == ':' || c == ' ' || c == '-' || c == '\t') {
      if (digits) { bytes.push_back(static_cast<uint8_t>(value)); digits = 0; value = 0; }
      continue;
    }
    int v = hex_value(c);
    if (v < 0 || digits == 2) { err = "bad_hex"; return false; }
    value = value * 16 + v;
    ++digits;
  }
  if (digits) bytes.push_back(static_cast<uint8_t>(value));

  if (bytes.empty()) { err = "empty"; return false; }

  out = CecMessage::from_bytes(bytes);
  if (!out.valid()) { err = "invalid_message"; return false; }
  return true;
}

} // namespace cecflow
