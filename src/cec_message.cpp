// -----------------------------------------------------------------------------
// cec_message.cpp: construction, validation and encoding for CecMessage.
//
// API & wire shape: see include/cecflow/cec_message.hpp
// -----------------------------------------------------------------------------
#include "cecflow/cec_message.hpp"

namespace cecflow {

CecMessage::CecMessage(uint8_t source, uint8_t destination, uint8_t opcode)
: source_(source), destination_(destination), opcode_(opcode) {
  status_ = validate(0);
}

CecMessage::CecMessage(uint8_t source, uint8_t destination, uint8_t opcode,
                       const uint8_t* params, size_t n)
: source_(source), destination_(destination), opcode_(opcode) {
  // keep what fits; the status records the overflow
  for (size_t i = 0; params && i < n && !params_.full(); ++i) {
    params_.push_back(params[i]);
  }
  status_ = validate(params ? n : 0);
}

CecMessage CecMessage::from_bytes(const uint8_t* data, size_t n) {
  CecMessage m;
  if (!data || n < 2) {
    m.status_ = MessageStatus::TooShort;
    return m;
  }
  // header nibbles are 4-bit by construction
  return CecMessage(static_cast<uint8_t>(data[0] >> 4),
                    static_cast<uint8_t>(data[0] & 0x0F),
                    data[1], data + 2, n - 2);
}

std::vector<uint8_t> CecMessage::to_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(2 + params_.size());
  out.push_back(header());
  out.push_back(opcode_);
  out.insert(out.end(), params_.begin(), params_.end());
  return out;
}

bool CecMessage::operator==(const CecMessage& other) const {
  if (source_ != other.source_ || destination_ != other.destination_) return false;
  if (opcode_ != other.opcode_) return false;
  if (params_.size() != other.params_.size()) return false;
  for (size_t i = 0; i < params_.size(); ++i) {
    if (params_[i] != other.params_[i]) return false;
  }
  return true;
}

int CecMessage::expected_params(uint8_t opcode) {
  switch (opcode) {
    case OP_IMAGE_VIEW_ON:
    case OP_TEXT_VIEW_ON:
    case OP_STANDBY:
    case OP_GIVE_DEVICE_POWER_STATUS:
      return 0;
    case OP_REPORT_POWER_STATUS:
      return 1;
    case OP_ACTIVE_SOURCE:
    case OP_FEATURE_ABORT:
      return 2;
    default:
      return -1;
  }
}

MessageStatus CecMessage::validate(size_t param_count) const {
  if (source_ > ADDR_MAX || destination_ > ADDR_MAX) return MessageStatus::BadAddress;
  if (param_count > MAX_PARAMS) return MessageStatus::TooManyParams;

  int expected = expected_params(opcode_);
  if (expected >= 0 && static_cast<size_t>(expected) != param_count) {
    return MessageStatus::ParamMismatch;
  }
  return MessageStatus::Ok;
}

} // namespace cecflow
