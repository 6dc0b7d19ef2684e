/**
 * @file message_pipeline.hpp
 * @brief Application-facing send path and typed inbound dispatch.
 *
 * Outbound payloads go to the connection manager untouched. Inbound payloads
 * are numbered in arrival order, decoded into InboundMessage and passed to
 * the registered handler; undecodable payloads arrive as
 * UnrecognizedMessage and are logged, never dropped silently.
 *
 * Handlers run on the connection manager's engine thread.
 */

#ifndef MESHLINK_MESSAGE_PIPELINE_HPP_
#define MESHLINK_MESSAGE_PIPELINE_HPP_

#include "meshlink/connection_manager.hpp"
#include "meshlink/log.hpp"
#include "meshlink/messages.hpp"
#include "meshlink/vocabulary.hpp"

#include <atomic>
#include <variant>

namespace meshlink {

using MessageHandler = FixedFunction<void(uint64_t seq, const InboundMessage&)>;

using RawPayloadFn = void (*)(uint64_t seq, const uint8_t* payload,
                              uint32_t size, void* ctx);

struct PipelineStats {
  uint64_t sent = 0U;
  uint64_t send_failures = 0U;
  uint64_t received = 0U;
  uint64_t unrecognized = 0U;
};

class MessagePipeline final {
 public:
  /// Installs itself as @p manager's payload handler.
  explicit MessagePipeline(ConnectionManager& manager) noexcept
      : manager_(manager),
        raw_fn_(nullptr),
        raw_ctx_(nullptr),
        next_seq_(0U),
        sent_(0U),
        send_failures_(0U),
        received_(0U),
        unrecognized_(0U) {
    manager_.SetPayloadHandler(&MessagePipeline::OnPayload, this);
  }

  ~MessagePipeline() { manager_.SetPayloadHandler(nullptr, nullptr); }

  MessagePipeline(const MessagePipeline&) = delete;
  MessagePipeline& operator=(const MessagePipeline&) = delete;

  void SetMessageHandler(MessageHandler handler) noexcept {
    handler_ = static_cast<MessageHandler&&>(handler);
  }

  /// @brief Also receive every payload undecoded, before the typed handler.
  void SetRawHandler(RawPayloadFn fn, void* ctx) noexcept {
    raw_fn_ = fn;
    raw_ctx_ = ctx;
  }

  /// @brief Forward @p payload verbatim.
  expected<void, LinkError> Send(const uint8_t* payload,
                                 uint32_t size) noexcept {
    auto r = manager_.Send(payload, size);
    if (r) {
      sent_.fetch_add(1U, std::memory_order_relaxed);
    } else {
      send_failures_.fetch_add(1U, std::memory_order_relaxed);
    }
    return r;
  }

  /**
   * @brief Encode and send a text message stamped with the session's next
   *        packet id. Blank text is rejected; long text is cut on a UTF-8
   *        boundary.
   */
  expected<void, LinkError> SendText(const char* text) noexcept {
    if (IsBlank(text)) {
      return expected<void, LinkError>::error(LinkError::kEmptyPayload);
    }
    TextMessage msg;
    AssignUtf8(msg.text, text);
    auto id = StampPacketId();
    if (!id) {
      return expected<void, LinkError>::error(id.get_error());
    }
    msg.packet_id = id.value();

    uint8_t buf[kMaxPayloadSize];
    auto enc = EncodeTextMessage(msg, buf, sizeof(buf));
    if (!enc) {
      return expected<void, LinkError>::error(enc.get_error());
    }
    return Send(buf, enc.value());
  }

  /// @brief Send @p report; its packet_id is replaced by the session's next.
  expected<void, LinkError> SendHealthReport(
      const HealthReport& report) noexcept {
    auto id = StampPacketId();
    if (!id) {
      return expected<void, LinkError>::error(id.get_error());
    }
    HealthReport stamped = report;
    stamped.packet_id = id.value();

    uint8_t buf[kMaxPayloadSize];
    auto enc = EncodeHealthReport(stamped, buf, sizeof(buf));
    if (!enc) {
      return expected<void, LinkError>::error(enc.get_error());
    }
    return Send(buf, enc.value());
  }

  PipelineStats GetStats() const noexcept {
    PipelineStats s;
    s.sent = sent_.load(std::memory_order_relaxed);
    s.send_failures = send_failures_.load(std::memory_order_relaxed);
    s.received = received_.load(std::memory_order_relaxed);
    s.unrecognized = unrecognized_.load(std::memory_order_relaxed);
    return s;
  }

 private:
  static bool IsBlank(const char* text) noexcept {
    if (text == nullptr) {
      return true;
    }
    for (const char* p = text; *p != '\0'; ++p) {
      if (*p != ' ' && *p != '\t' && *p != '\r' && *p != '\n') {
        return false;
      }
    }
    return true;
  }

  expected<uint32_t, LinkError> StampPacketId() noexcept {
    auto id = manager_.NextPacketId();
    if (!id) {
      send_failures_.fetch_add(1U, std::memory_order_relaxed);
    }
    return id;
  }

  static void OnPayload(const uint8_t* payload, uint32_t size, void* ctx) {
    static_cast<MessagePipeline*>(ctx)->Deliver(payload, size);
  }

  void Deliver(const uint8_t* payload, uint32_t size) noexcept {
    const uint64_t seq = ++next_seq_;
    received_.fetch_add(1U, std::memory_order_relaxed);
    if (raw_fn_ != nullptr) {
      raw_fn_(seq, payload, size, raw_ctx_);
    }

    const InboundMessage msg = DecodeMessage(payload, size);
    if (const auto* bad = std::get_if<UnrecognizedMessage>(&msg)) {
      unrecognized_.fetch_add(1U, std::memory_order_relaxed);
      MESHLINK_LOG_WARN("PIPELINE",
                        "message #%llu unrecognized: type 0x%02x, %u bytes, %s",
                        static_cast<unsigned long long>(seq), bad->type,
                        bad->size, DecodeFailureName(bad->reason));
    }
    if (handler_) {
      handler_(seq, msg);
    }
  }

  ConnectionManager& manager_;
  MessageHandler handler_;
  RawPayloadFn raw_fn_;
  void* raw_ctx_;
  uint64_t next_seq_;  // engine thread only
  std::atomic<uint64_t> sent_;
  std::atomic<uint64_t> send_failures_;
  std::atomic<uint64_t> received_;
  std::atomic<uint64_t> unrecognized_;
};

}  // namespace meshlink

#endif  // MESHLINK_MESSAGE_PIPELINE_HPP_
