/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file link_session.hpp
 * @brief One physical connection: channel ownership, framed send path and
 *        receive-side deframing.
 *
 * Threading:
 * - Send() may be called from any thread; writes are serialized by a
 *   per-session mutex so at most one frame is on the wire at a time.
 * - OnBytes() runs on the manager's engine thread only (decode buffer is
 *   not shared).
 * - Close() marks the session closed and interrupts the channel before it
 *   waits for an in-flight write, so a Send() blocked in the channel or
 *   racing Close() returns kChannelClosed promptly.
 *
 * Channel callbacks are forwarded, tagged with the session id, so that the
 * owner can discard events from a session it has already replaced.
 */

#ifndef MESHLINK_LINK_SESSION_HPP_
#define MESHLINK_LINK_SESSION_HPP_

#include "meshlink/frame_codec.hpp"
#include "meshlink/log.hpp"
#include "meshlink/platform.hpp"
#include "meshlink/serial_channel.hpp"
#include "meshlink/vocabulary.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace meshlink {

// ============================================================================
// Session Callbacks
// ============================================================================

/// Events raised by a session toward its owner (reader thread context).
struct SessionCallbacks {
  void (*on_bytes)(SessionId id, const uint8_t* data, uint32_t size,
                   void* ctx) = nullptr;
  void (*on_failure)(SessionId id, LinkError error, void* ctx) = nullptr;
  void* ctx = nullptr;
};

struct SessionStats {
  uint64_t frames_sent = 0U;
  uint64_t bytes_sent = 0U;
  uint64_t send_failures = 0U;
};

// ============================================================================
// LinkSession
// ============================================================================

class LinkSession final {
 public:
  LinkSession(SessionId id, std::unique_ptr<ByteChannel> channel) noexcept
      : id_(id),
        channel_(static_cast<std::unique_ptr<ByteChannel>&&>(channel)),
        closed_(false),
        failed_(false),
        next_packet_id_(0U),
        stats_{} {
    MESHLINK_ASSERT(channel_ != nullptr);
  }

  ~LinkSession() { Close(); }

  LinkSession(const LinkSession&) = delete;
  LinkSession& operator=(const LinkSession&) = delete;

  /**
   * @brief Open the owned channel; bytes and failures start flowing to
   *        @p callbacks.
   */
  expected<void, LinkError> Open(const ChannelConfig& cfg,
                                 const SessionCallbacks& callbacks) noexcept {
    callbacks_ = callbacks;
    auto r = channel_->Open(cfg, &LinkSession::ChannelRx,
                            &LinkSession::ChannelError, this);
    if (!r) {
      closed_.store(true, std::memory_order_release);
      return r;
    }
    MESHLINK_LOG_INFO("SESSION", "session %u open on %s", id_.value(),
                      cfg.port_name);
    return r;
  }

  /**
   * @brief Frame and write one payload.
   *
   * kChannelIoFailure additionally raises the session failure event; every
   * other error leaves the session usable.
   */
  expected<void, LinkError> Send(const uint8_t* payload,
                                 uint32_t size) noexcept {
    if (size == 0U) {
      return expected<void, LinkError>::error(LinkError::kEmptyPayload);
    }
    if (size > kMaxPayloadSize) {
      MESHLINK_LOG_WARN("SESSION", "payload of %u bytes exceeds %u", size,
                        kMaxPayloadSize);
      return expected<void, LinkError>::error(LinkError::kPayloadTooLarge);
    }
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, LinkError>::error(LinkError::kChannelClosed);
    }

    uint8_t frame[kMaxFrameSize];
    auto enc = EncodeFrame(payload, size, frame, sizeof(frame));
    if (!enc) {
      return expected<void, LinkError>::error(enc.get_error());
    }

    std::lock_guard<std::mutex> lock(write_mtx_);
    if (closed_.load(std::memory_order_acquire)) {
      return expected<void, LinkError>::error(LinkError::kChannelClosed);
    }
    auto w = channel_->Write(frame, enc.value());
    if (!w) {
      ++stats_.send_failures;
      if (w.get_error() == LinkError::kChannelIoFailure) {
        RaiseFailure(LinkError::kChannelIoFailure);
      }
      return w;
    }
    ++stats_.frames_sent;
    stats_.bytes_sent += enc.value();
    return w;
  }

  /**
   * @brief Feed received bytes; each complete payload is passed to @p fn in
   *        arrival order before this call returns.
   */
  uint32_t OnBytes(const uint8_t* data, uint32_t size, FramePayloadFn fn,
                   void* ctx) noexcept {
    return decoder_.Feed(data, size, fn, ctx);
  }

  /// @brief Idempotent; safe after an I/O failure.
  void Close() noexcept {
    const bool was_closed = closed_.exchange(true, std::memory_order_acq_rel);
    if (!was_closed) {
      channel_->Interrupt();
    }
    std::lock_guard<std::mutex> lock(write_mtx_);
    channel_->Close();
    if (!was_closed) {
      MESHLINK_LOG_INFO("SESSION", "session %u closed", id_.value());
    }
  }

  /// @brief Next local packet id: 1, 2, ... wrapping past 0.
  uint32_t NextPacketId() noexcept {
    uint32_t id = next_packet_id_.fetch_add(1U, std::memory_order_relaxed) + 1U;
    if (id == 0U) {
      id = next_packet_id_.fetch_add(1U, std::memory_order_relaxed) + 1U;
    }
    return id;
  }

  SessionId Id() const noexcept { return id_; }
  bool IsClosed() const noexcept {
    return closed_.load(std::memory_order_acquire);
  }
  const FrameDecoder& Decoder() const noexcept { return decoder_; }
  SessionStats GetStats() noexcept {
    std::lock_guard<std::mutex> lock(write_mtx_);
    return stats_;
  }

 private:
  static void ChannelRx(const uint8_t* data, uint32_t size, void* ctx) {
    auto* self = static_cast<LinkSession*>(ctx);
    if (self->callbacks_.on_bytes != nullptr) {
      self->callbacks_.on_bytes(self->id_, data, size, self->callbacks_.ctx);
    }
  }

  static void ChannelError(LinkError error, void* ctx) {
    static_cast<LinkSession*>(ctx)->RaiseFailure(error);
  }

  void RaiseFailure(LinkError error) noexcept {
    if (failed_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    if (callbacks_.on_failure != nullptr) {
      callbacks_.on_failure(id_, error, callbacks_.ctx);
    }
  }

  const SessionId id_;
  std::unique_ptr<ByteChannel> channel_;
  SessionCallbacks callbacks_;
  FrameDecoder decoder_;

  std::mutex write_mtx_;
  std::atomic<bool> closed_;
  std::atomic<bool> failed_;
  std::atomic<uint32_t> next_packet_id_;
  SessionStats stats_;
};

}  // namespace meshlink

#endif  // MESHLINK_LINK_SESSION_HPP_
