#pragma once
/**
 * @file slip.hpp
 * @brief SLIP (RFC 1055) record framing for the relay byte stream.
 *
 * TCP is a byte stream; platoon messages are records. Every record goes on the
 * wire as
 *
 * @code
 *   END  <payload with END/ESC escaped>  END
 * @endcode
 *
 * The leading END lets a receiver that joined mid-stream (or saw garbage)
 * resynchronise on the next boundary. The relay decodes each frame and forwards
 * the canonical re-encoding of its payload. Platoon peers only emit canonical
 * frames, so what they receive is byte-identical to what was sent.
 *
 * Header-only; `Decoder` is a tiny state machine fed one byte at a time so it can
 * sit directly behind `read(2)` calls of arbitrary size.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace platoon {
namespace slip {

static constexpr uint8_t END     = 0xC0;  ///< frame boundary
static constexpr uint8_t ESC     = 0xDB;  ///< escape introducer
static constexpr uint8_t ESC_END = 0xDC;  ///< ESC ESC_END => literal END
static constexpr uint8_t ESC_ESC = 0xDD;  ///< ESC ESC_ESC => literal ESC

/// Largest decoded payload a Decoder accepts; longer records are dropped.
static constexpr size_t MAX_FRAME = 1024;

/// Encode @p n bytes into a complete frame (replaces @p out).
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

inline std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
  std::vector<uint8_t> out;
  encode(payload.data(), payload.size(), out);
  return out;
}

/**
 * @brief Incremental frame decoder.
 *
 * Feed raw bytes; `feed()` returns true exactly when a non-empty frame closed,
 * leaving the payload in the caller's vector. Empty frames (END END) are the
 * normal inter-frame filler and are skipped. A malformed escape or an oversize
 * record discards the partial frame and waits for the next END.
 */
class Decoder {
public:
  bool feed(uint8_t b, std::vector<uint8_t>& frame) {
    if (b == END) {
      const bool complete = in_frame_ && !buf_.empty() && !overflow_;
      if (complete) frame.swap(buf_);
      buf_.clear();
      in_frame_ = true;       // closing END doubles as the next opening END
      esc_ = false;
      overflow_ = false;
      return complete;
    }

    if (!in_frame_) return false;

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) b = END;
      else if (b == ESC_ESC) b = ESC;
      else { drop(); return false; }
    } else if (b == ESC) {
      esc_ = true;
      return false;
    }

    if (buf_.size() >= MAX_FRAME) { overflow_ = true; return false; }
    buf_.push_back(b);
    return false;
  }

  /// Forget any partial frame (used after a reconnect).
  void reset() { buf_.clear(); in_frame_ = false; esc_ = false; overflow_ = false; }

  /// Number of frames discarded for malformed escapes.
  size_t dropped() const { return dropped_; }

private:
  void drop() { buf_.clear(); in_frame_ = false; ++dropped_; }

  std::vector<uint8_t> buf_;
  bool   in_frame_{false};
  bool   esc_{false};
  bool   overflow_{false};
  size_t dropped_{0};
};

} // namespace slip
} // namespace platoon
