/**
 * @file messages.hpp
 * @brief Application payload schemas carried inside link frames.
 *
 * Every payload starts with a one-byte type tag followed by little-endian
 * fixed fields and length-prefixed strings:
 *
 *   0x01 TextMessage    packet_id:u32 len:u8 text[len]
 *   0x02 HealthReport   packet_id:u32 version:u8 risk:u8 alert:u8
 *                       timestamp_ms:u64 person_len:u8 person[]
 *                       rec_len:u8 recommendation[]
 *   0x10 ConfigRequest  config_id:u32
 *   0x11 Heartbeat      nonce:u16
 *   0x12 ConfigComplete config_id:u32
 *   0x13 NodeInfo       node_num:u32 name_len:u8 long_name[]
 *
 * packet_id is the sending session's local packet counter (0 = unset).
 * Strings are UTF-8 and never cut inside a code point.
 *
 * Inbound payloads decode into the closed InboundMessage variant; anything
 * that fails to decode becomes UnrecognizedMessage with a reason.
 */

#ifndef MESHLINK_MESSAGES_HPP_
#define MESHLINK_MESSAGES_HPP_

#include "meshlink/platform.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <variant>

namespace meshlink {

// ============================================================================
// Message Types
// ============================================================================

enum class MessageType : uint8_t {
  kTextMessage = 0x01U,
  kHealthReport = 0x02U,
  kConfigRequest = 0x10U,
  kHeartbeat = 0x11U,
  kConfigComplete = 0x12U,
  kNodeInfo = 0x13U,
};

enum class RiskLevel : uint8_t {
  kGreen = 0U,
  kYellow = 1U,
  kRed = 2U,
};

inline const char* RiskLevelName(RiskLevel r) noexcept {
  switch (r) {
    case RiskLevel::kGreen:
      return "green";
    case RiskLevel::kYellow:
      return "yellow";
    case RiskLevel::kRed:
      return "red";
    default:
      return "unknown";
  }
}

static constexpr uint32_t kMaxTextLength = 200U;
static constexpr uint32_t kMaxPersonLength = 31U;
static constexpr uint32_t kMaxRecommendationLength = 160U;
static constexpr uint32_t kMaxNodeNameLength = 39U;
static constexpr uint8_t kHealthReportVersion = 1U;

struct TextMessage {
  uint32_t packet_id = 0U;
  FixedString<kMaxTextLength> text;
};

struct HealthReport {
  uint32_t packet_id = 0U;
  uint8_t version = kHealthReportVersion;
  RiskLevel risk = RiskLevel::kGreen;
  bool alert = false;
  uint64_t timestamp_ms = 0U;
  FixedString<kMaxPersonLength> person;
  FixedString<kMaxRecommendationLength> recommendation;
};

struct ConfigRequest {
  uint32_t config_id = 0U;
};

struct Heartbeat {
  uint16_t nonce = 0U;
};

struct ConfigComplete {
  uint32_t config_id = 0U;
};

struct NodeInfo {
  uint32_t node_num = 0U;
  FixedString<kMaxNodeNameLength> long_name;
};

enum class DecodeFailure : uint8_t {
  kEmpty,
  kUnknownType,
  kUnexpectedType,  ///< Known tag that only flows outbound.
  kTruncated,
  kInvalidField,
  kTrailingBytes,
};

inline const char* DecodeFailureName(DecodeFailure f) noexcept {
  switch (f) {
    case DecodeFailure::kEmpty:
      return "empty";
    case DecodeFailure::kUnknownType:
      return "unknown type";
    case DecodeFailure::kUnexpectedType:
      return "unexpected type";
    case DecodeFailure::kTruncated:
      return "truncated";
    case DecodeFailure::kInvalidField:
      return "invalid field";
    case DecodeFailure::kTrailingBytes:
      return "trailing bytes";
    default:
      return "unknown";
  }
}

struct UnrecognizedMessage {
  uint8_t type = 0U;
  DecodeFailure reason = DecodeFailure::kEmpty;
  uint32_t size = 0U;
};

/// Closed set of schemas the radio sends to us.
using InboundMessage = std::variant<UnrecognizedMessage, TextMessage,
                                    HealthReport, ConfigComplete, NodeInfo>;

/// @brief Length of the longest prefix of @p str, at most @p max bytes, that
///        does not end inside a UTF-8 sequence.
inline uint32_t Utf8PrefixLength(const char* str, uint32_t len,
                                 uint32_t max) noexcept {
  if (len <= max) {
    return len;
  }
  uint32_t n = max;
  while (n > 0U && (static_cast<uint8_t>(str[n]) & 0xC0U) == 0x80U) {
    --n;
  }
  return n;
}

/// @brief Copy @p str into @p out, truncating on a code point boundary.
template <uint32_t N>
inline void AssignUtf8(FixedString<N>& out, const char* str) noexcept {
  if (str == nullptr) {
    out.clear();
    return;
  }
  const uint32_t len = static_cast<uint32_t>(std::strlen(str));
  out.assign(TruncateToCapacity, str, Utf8PrefixLength(str, len, N));
}

// ============================================================================
// Byte Writer / Reader
// ============================================================================

namespace detail {

class ByteWriter final {
 public:
  ByteWriter(uint8_t* buf, uint32_t cap) noexcept
      : buf_(buf), cap_(cap), pos_(0U), ok_(true) {}

  void U8(uint8_t v) noexcept {
    if (Reserve(1U)) {
      buf_[pos_++] = v;
    }
  }

  void U16(uint16_t v) noexcept {
    if (Reserve(2U)) {
      buf_[pos_++] = static_cast<uint8_t>(v & 0xFFU);
      buf_[pos_++] = static_cast<uint8_t>((v >> 8) & 0xFFU);
    }
  }

  void U32(uint32_t v) noexcept {
    if (Reserve(4U)) {
      for (uint32_t i = 0U; i < 4U; ++i) {
        buf_[pos_++] = static_cast<uint8_t>((v >> (8U * i)) & 0xFFU);
      }
    }
  }

  void U64(uint64_t v) noexcept {
    if (Reserve(8U)) {
      for (uint32_t i = 0U; i < 8U; ++i) {
        buf_[pos_++] = static_cast<uint8_t>((v >> (8U * i)) & 0xFFU);
      }
    }
  }

  void Str(const char* s, uint32_t len) noexcept {
    if (len > 0xFFU) {
      ok_ = false;
      return;
    }
    U8(static_cast<uint8_t>(len));
    if (Reserve(len)) {
      std::memcpy(buf_ + pos_, s, len);
      pos_ += len;
    }
  }

  bool ok() const noexcept { return ok_; }
  uint32_t size() const noexcept { return pos_; }

 private:
  bool Reserve(uint32_t n) noexcept {
    if (!ok_ || cap_ - pos_ < n) {
      ok_ = false;
      return false;
    }
    return true;
  }

  uint8_t* buf_;
  uint32_t cap_;
  uint32_t pos_;
  bool ok_;
};

class ByteReader final {
 public:
  ByteReader(const uint8_t* data, uint32_t size) noexcept
      : data_(data), size_(size), pos_(0U), ok_(true) {}

  uint8_t U8() noexcept { return Need(1U) ? data_[pos_++] : 0U; }

  uint16_t U16() noexcept {
    if (!Need(2U)) {
      return 0U;
    }
    const uint16_t v = static_cast<uint16_t>(
        static_cast<uint16_t>(data_[pos_]) |
        static_cast<uint16_t>(static_cast<uint16_t>(data_[pos_ + 1U]) << 8));
    pos_ += 2U;
    return v;
  }

  uint32_t U32() noexcept {
    if (!Need(4U)) {
      return 0U;
    }
    uint32_t v = 0U;
    for (uint32_t i = 0U; i < 4U; ++i) {
      v |= static_cast<uint32_t>(data_[pos_++]) << (8U * i);
    }
    return v;
  }

  uint64_t U64() noexcept {
    if (!Need(8U)) {
      return 0U;
    }
    uint64_t v = 0U;
    for (uint32_t i = 0U; i < 8U; ++i) {
      v |= static_cast<uint64_t>(data_[pos_++]) << (8U * i);
    }
    return v;
  }

  /// Reads a length-prefixed string; lengths above max_len are invalid.
  template <uint32_t N>
  bool Str(FixedString<N>& out, uint32_t max_len) noexcept {
    const uint32_t len = U8();
    if (!ok_) {
      return false;
    }
    if (len > max_len) {
      invalid_ = true;
      return false;
    }
    if (!Need(len)) {
      return false;
    }
    out.assign(TruncateToCapacity, reinterpret_cast<const char*>(data_ + pos_),
               len);
    pos_ += len;
    return true;
  }

  bool ok() const noexcept { return ok_ && !invalid_; }
  bool truncated() const noexcept { return !ok_; }
  bool invalid() const noexcept { return invalid_; }
  bool at_end() const noexcept { return pos_ == size_; }
  void mark_invalid() noexcept { invalid_ = true; }

 private:
  bool Need(uint32_t n) noexcept {
    if (!ok_ || size_ - pos_ < n) {
      ok_ = false;
      return false;
    }
    return true;
  }

  const uint8_t* data_;
  uint32_t size_;
  uint32_t pos_;
  bool ok_;
  bool invalid_ = false;
};

inline expected<uint32_t, LinkError> Finish(const ByteWriter& w) noexcept {
  if (!w.ok()) {
    return expected<uint32_t, LinkError>::error(LinkError::kPayloadTooLarge);
  }
  return expected<uint32_t, LinkError>::success(w.size());
}

}  // namespace detail

// ============================================================================
// Encoders
// ============================================================================
//
// Each returns the payload length written into @p out, or kPayloadTooLarge
// when the message does not fit @p cap or a field exceeds its limit.

inline expected<uint32_t, LinkError> EncodeTextMessage(
    const TextMessage& msg, uint8_t* out, uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kTextMessage));
  w.U32(msg.packet_id);
  w.Str(msg.text.c_str(), msg.text.size());
  return detail::Finish(w);
}

inline expected<uint32_t, LinkError> EncodeHealthReport(
    const HealthReport& msg, uint8_t* out, uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kHealthReport));
  w.U32(msg.packet_id);
  w.U8(msg.version);
  w.U8(static_cast<uint8_t>(msg.risk));
  w.U8(msg.alert ? 1U : 0U);
  w.U64(msg.timestamp_ms);
  w.Str(msg.person.c_str(), msg.person.size());
  w.Str(msg.recommendation.c_str(), msg.recommendation.size());
  return detail::Finish(w);
}

inline expected<uint32_t, LinkError> EncodeConfigRequest(
    const ConfigRequest& msg, uint8_t* out, uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kConfigRequest));
  w.U32(msg.config_id);
  return detail::Finish(w);
}

inline expected<uint32_t, LinkError> EncodeHeartbeat(const Heartbeat& msg,
                                                     uint8_t* out,
                                                     uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kHeartbeat));
  w.U16(msg.nonce);
  return detail::Finish(w);
}

inline expected<uint32_t, LinkError> EncodeConfigComplete(
    const ConfigComplete& msg, uint8_t* out, uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kConfigComplete));
  w.U32(msg.config_id);
  return detail::Finish(w);
}

inline expected<uint32_t, LinkError> EncodeNodeInfo(const NodeInfo& msg,
                                                    uint8_t* out,
                                                    uint32_t cap) noexcept {
  detail::ByteWriter w(out, cap);
  w.U8(static_cast<uint8_t>(MessageType::kNodeInfo));
  w.U32(msg.node_num);
  w.Str(msg.long_name.c_str(), msg.long_name.size());
  return detail::Finish(w);
}

// ============================================================================
// Decoder
// ============================================================================

namespace detail {

inline InboundMessage Unrecognized(uint8_t type, DecodeFailure reason,
                                   uint32_t size) noexcept {
  UnrecognizedMessage u;
  u.type = type;
  u.reason = reason;
  u.size = size;
  return InboundMessage(u);
}

inline InboundMessage Conclude(ByteReader& r, uint8_t type, uint32_t size,
                               InboundMessage decoded) noexcept {
  if (r.invalid()) {
    return Unrecognized(type, DecodeFailure::kInvalidField, size);
  }
  if (r.truncated()) {
    return Unrecognized(type, DecodeFailure::kTruncated, size);
  }
  if (!r.at_end()) {
    return Unrecognized(type, DecodeFailure::kTrailingBytes, size);
  }
  return decoded;
}

}  // namespace detail

/// @brief Decode one payload. Never fails: bad input yields
///        UnrecognizedMessage.
inline InboundMessage DecodeMessage(const uint8_t* data,
                                    uint32_t size) noexcept {
  if (data == nullptr || size == 0U) {
    return detail::Unrecognized(0U, DecodeFailure::kEmpty, 0U);
  }
  const uint8_t type = data[0];
  detail::ByteReader r(data + 1, size - 1U);

  switch (static_cast<MessageType>(type)) {
    case MessageType::kTextMessage: {
      TextMessage m;
      m.packet_id = r.U32();
      (void)r.Str(m.text, kMaxTextLength);
      return detail::Conclude(r, type, size, InboundMessage(m));
    }
    case MessageType::kHealthReport: {
      HealthReport m;
      m.packet_id = r.U32();
      m.version = r.U8();
      const uint8_t risk = r.U8();
      const uint8_t alert = r.U8();
      m.timestamp_ms = r.U64();
      (void)r.Str(m.person, kMaxPersonLength);
      (void)r.Str(m.recommendation, kMaxRecommendationLength);
      if (!r.truncated() &&
          (risk > static_cast<uint8_t>(RiskLevel::kRed) || alert > 1U ||
           m.version == 0U)) {
        r.mark_invalid();
      }
      m.risk = static_cast<RiskLevel>(risk);
      m.alert = (alert == 1U);
      return detail::Conclude(r, type, size, InboundMessage(m));
    }
    case MessageType::kConfigComplete: {
      ConfigComplete m;
      m.config_id = r.U32();
      return detail::Conclude(r, type, size, InboundMessage(m));
    }
    case MessageType::kNodeInfo: {
      NodeInfo m;
      m.node_num = r.U32();
      (void)r.Str(m.long_name, kMaxNodeNameLength);
      return detail::Conclude(r, type, size, InboundMessage(m));
    }
    case MessageType::kConfigRequest:
    case MessageType::kHeartbeat:
      return detail::Unrecognized(type, DecodeFailure::kUnexpectedType, size);
    default:
      return detail::Unrecognized(type, DecodeFailure::kUnknownType, size);
  }
}

// ============================================================================
// ControlEncoder
// ============================================================================

/**
 * @brief Produces the link-control payloads the connection manager sends on
 *        its own: the handshake config request and the keepalive heartbeat.
 */
class ControlEncoder {
 public:
  virtual ~ControlEncoder() = default;

  virtual expected<uint32_t, LinkError> EncodeHandshake(
      uint32_t config_id, uint8_t* out, uint32_t cap) const noexcept = 0;

  virtual expected<uint32_t, LinkError> EncodeKeepalive(
      uint16_t nonce, uint8_t* out, uint32_t cap) const noexcept = 0;
};

/// Default control encoder using the tagged schemas above.
class TaggedControlEncoder final : public ControlEncoder {
 public:
  expected<uint32_t, LinkError> EncodeHandshake(
      uint32_t config_id, uint8_t* out, uint32_t cap) const noexcept override {
    ConfigRequest req;
    req.config_id = config_id;
    return EncodeConfigRequest(req, out, cap);
  }

  expected<uint32_t, LinkError> EncodeKeepalive(
      uint16_t nonce, uint8_t* out, uint32_t cap) const noexcept override {
    Heartbeat hb;
    hb.nonce = nonce;
    return EncodeHeartbeat(hb, out, cap);
  }
};

}  // namespace meshlink

#endif  // MESHLINK_MESSAGES_HPP_
