/**
 * @file frame_codec.hpp
 * @brief Radio serial framing: stateless encoder and resynchronizing decoder.
 *
 * Wire format (header fields big-endian):
 *
 *   +------+------+--------+--------+----------------------+
 *   | 0x94 | 0xC3 | len_hi | len_lo | payload[len]         |
 *   +------+------+--------+--------+----------------------+
 *
 *   0 < len <= kMaxPayloadSize (512)
 *
 * The decoder keeps bytes that do not yet form a complete frame and skips
 * one byte at a time past anything that is not a plausible header, so line
 * noise or a corrupted length costs at most the affected frame.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MESHLINK_FRAME_CODEC_HPP_
#define MESHLINK_FRAME_CODEC_HPP_

#include "meshlink/platform.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

namespace meshlink {

// ============================================================================
// Frame Constants
// ============================================================================

static constexpr uint8_t kFrameMagic1 = 0x94U;
static constexpr uint8_t kFrameMagic2 = 0xC3U;

/// Header: magic(2) + length(2)
static constexpr uint32_t kFrameHeaderSize = 4U;

#ifndef MESHLINK_MAX_PAYLOAD_SIZE
#define MESHLINK_MAX_PAYLOAD_SIZE 512U
#endif

static constexpr uint32_t kMaxPayloadSize = MESHLINK_MAX_PAYLOAD_SIZE;
static constexpr uint32_t kMaxFrameSize = kFrameHeaderSize + kMaxPayloadSize;

/// Decode buffer holds one maximal partial frame plus one incoming slice.
static constexpr uint32_t kDecodeBufferSize = 2U * kMaxFrameSize;

static_assert(kMaxPayloadSize > 0U && kMaxPayloadSize <= 0xFFFFU,
              "payload length must fit the 16-bit length field");

// ============================================================================
// Encoder
// ============================================================================

/**
 * @brief Encode one payload into a frame.
 *
 * @param payload  Payload bytes (may be nullptr when size is 0).
 * @param size     Payload size.
 * @param out      Output buffer.
 * @param out_cap  Output capacity; must hold kFrameHeaderSize + size.
 * @return Frame length (kFrameHeaderSize + size), or kPayloadTooLarge when
 *         size exceeds kMaxPayloadSize. Nothing is written on error.
 */
inline expected<uint32_t, LinkError> EncodeFrame(const uint8_t* payload,
                                                 uint32_t size, uint8_t* out,
                                                 uint32_t out_cap) noexcept {
  if (size > kMaxPayloadSize) {
    return expected<uint32_t, LinkError>::error(LinkError::kPayloadTooLarge);
  }
  const uint32_t total = kFrameHeaderSize + size;
  MESHLINK_ASSERT(out != nullptr);
  if (out_cap < total) {
    return expected<uint32_t, LinkError>::error(LinkError::kPayloadTooLarge);
  }
  out[0] = kFrameMagic1;
  out[1] = kFrameMagic2;
  out[2] = static_cast<uint8_t>((size >> 8) & 0xFFU);
  out[3] = static_cast<uint8_t>(size & 0xFFU);
  if (size > 0U) {
    MESHLINK_ASSERT(payload != nullptr);
    std::memcpy(out + kFrameHeaderSize, payload, size);
  }
  return expected<uint32_t, LinkError>::success(total);
}

// ============================================================================
// Decoder
// ============================================================================

/// Decoder counters.
struct FrameStats {
  uint64_t bytes_fed = 0U;
  uint64_t frames_decoded = 0U;
  uint64_t bytes_discarded = 0U;    ///< Skipped while hunting for a header.
  uint64_t spurious_lengths = 0U;   ///< Magic matched, length 0 or too big.
};

/// @brief Callback for each decoded payload. Pointer valid for the call only.
using FramePayloadFn = void (*)(const uint8_t* payload, uint32_t size,
                                void* ctx);

/**
 * @brief Stateful decoder owning the decode buffer of one byte stream.
 *
 * Not thread-safe: feed from a single thread. The payload callback must not
 * re-enter Feed() on the same decoder.
 */
class FrameDecoder final {
 public:
  FrameDecoder() noexcept : len_(0U), stats_{} {}

  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;

  /**
   * @brief Append incoming bytes and emit every complete frame, in order.
   *
   * Input larger than the free buffer space is consumed in slices; the
   * output is identical to a single pass over the whole input.
   *
   * @return Number of payloads emitted.
   */
  uint32_t Feed(const uint8_t* data, uint32_t size, FramePayloadFn fn,
                void* ctx) noexcept {
    uint32_t emitted = 0U;
    while (size > 0U) {
      const uint32_t space = kDecodeBufferSize - len_;
      const uint32_t n = (size < space) ? size : space;
      MESHLINK_ASSERT(n > 0U);
      std::memcpy(buf_ + len_, data, n);
      len_ += n;
      data += n;
      size -= n;
      stats_.bytes_fed += n;
      emitted += Scan(fn, ctx);
    }
    return emitted;
  }

  /// @brief Bytes currently held (unconsumed tail).
  uint32_t BufferedSize() const noexcept { return len_; }

  /// @brief Read-only view of the unconsumed tail.
  const uint8_t* BufferedData() const noexcept { return buf_; }

  void Reset() noexcept { len_ = 0U; }

  const FrameStats& GetStats() const noexcept { return stats_; }

 private:
  uint32_t Scan(FramePayloadFn fn, void* ctx) noexcept {
    uint32_t emitted = 0U;
    uint32_t i = 0U;

    while (len_ - i >= kFrameHeaderSize) {
      if (buf_[i] != kFrameMagic1 || buf_[i + 1U] != kFrameMagic2) {
        ++i;
        ++stats_.bytes_discarded;
        continue;
      }

      const uint32_t plen = (static_cast<uint32_t>(buf_[i + 2U]) << 8) |
                            static_cast<uint32_t>(buf_[i + 3U]);
      if (plen == 0U || plen > kMaxPayloadSize) {
        // Magic bytes inside noise; real header may start at i + 1.
        ++i;
        ++stats_.bytes_discarded;
        ++stats_.spurious_lengths;
        continue;
      }

      if (len_ - i < kFrameHeaderSize + plen) {
        break;
      }

      ++stats_.frames_decoded;
      ++emitted;
      if (fn != nullptr) {
        fn(buf_ + i + kFrameHeaderSize, plen, ctx);
      }
      i += kFrameHeaderSize + plen;
    }

    if (i > 0U) {
      std::memmove(buf_, buf_ + i, len_ - i);
      len_ -= i;
    }
    return emitted;
  }

  uint8_t buf_[kDecodeBufferSize];
  uint32_t len_;
  FrameStats stats_;
};

}  // namespace meshlink

#endif  // MESHLINK_FRAME_CODEC_HPP_
