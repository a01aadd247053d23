#pragma once

/**
 * @page cf-slip cecflow SLIP Framing
 * @file slip.hpp
 * @brief SLIP encoder and incremental decoder for the serial bridge link.
 *
 * @details
 * OVERVIEW
 * --------
 * The serial bridge speaks in small binary frames (one bus message, or one
 * send status). SLIP gives those frames boundaries on a plain byte stream:
 *
 *   END     (0xC0) opens and closes a frame.
 *   ESC     (0xDB) introduces an escaped byte.
 *   ESC_END (0xDC) stands for a literal END inside a frame.
 *   ESC_ESC (0xDD) stands for a literal ESC inside a frame.
 *
 * DECODER RULES
 * -------------
 * - Bytes before the first END are noise (bridge boot chatter) and ignored.
 * - END END is an empty frame and is skipped.
 * - ESC followed by anything other than ESC_END / ESC_ESC drops the frame.
 * - A frame longer than `Decoder::MAX_FRAME` is dropped; a bridge frame is
 *   never longer than a bus message plus one type byte.
 *
 * The decoder keeps its state between calls, so bytes can be fed as they
 * trickle out of a non-blocking read.
 *
 * @code
 *   cecflow::slip::Decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : chunk) {
 *     if (dec.feed(b, frame)) handle(frame);
 *   }
 * @endcode
 */

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace cecflow {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Encode `n` bytes at `in` as one frame into `out` (cleared first).
inline void encode(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n * 2 + 2);
  out.push_back(END);
  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (b == END)      { out.push_back(ESC); out.push_back(ESC_END); }
    else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
    else               out.push_back(b);
  }
  out.push_back(END);
}

inline void encode(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
  encode(in.data(), in.size(), out);
}

class Decoder {
public:
  static constexpr size_t MAX_FRAME = 32;

  /**
   * @brief Feed one byte.
   * @return true when `b` closed a non-empty frame; its payload is in `frame`.
   */
  bool feed(uint8_t b, std::vector<uint8_t>& frame) {
    if (b == END) {
      if (in_frame_ && !buf_.empty() && !overflow_) {
        frame = buf_;
        reset_frame();
        in_frame_ = false;
        return true;
      }
      if (overflow_) ++dropped_;
      reset_frame();
      in_frame_ = true;     // END always (re)opens
      return false;
    }
    if (!in_frame_) return false;

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) b = END;
      else if (b == ESC_ESC) b = ESC;
      else {
        ++dropped_;
        reset_frame();
        in_frame_ = false;  // resync on next END
        return false;
      }
    } else if (b == ESC) {
      esc_ = true;
      return false;
    }

    if (buf_.size() >= MAX_FRAME) { overflow_ = true; return false; }
    buf_.push_back(b);
    return false;
  }

  void reset() { reset_frame(); in_frame_ = false; }

  /// Frames thrown away (bad escape or too long) since construction.
  size_t dropped() const { return dropped_; }

private:
  void reset_frame() { buf_.clear(); esc_ = false; overflow_ = false; }

  std::vector<uint8_t> buf_;
  bool   in_frame_{false};
  bool   esc_{false};
  bool   overflow_{false};
  size_t dropped_{0};
};

} // namespace slip
} // namespace cecflow
