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
 * @file connection_manager.hpp
 * @brief HSM-driven radio link lifecycle: discovery, permission, open,
 *        handshake, keepalive and failure handling.
 *
 * States:
 *   Root
 *   +-- Idle (initial)
 *   +-- AwaitingPermission
 *   +-- Opening
 *   +-- Connected       -- owns the one live LinkSession
 *
 * Every transition runs on a single logical thread. Public entry points
 * (Connect, Disconnect, OnPermissionResult) and channel callbacks only post
 * events into a bounded queue; the queue is drained by the engine thread
 * (Start/Stop) or, without a thread, by ProcessPending().
 *
 * Queue policy: byte events are dropped (and counted) once the queue reaches
 * its control reserve, so a flooding reader can never block or starve
 * Connect / Disconnect / I/O-failure events.
 *
 * There is no automatic reconnection: after an I/O failure the manager stays
 * in Idle until Connect() is called again.
 */

#ifndef MESHLINK_CONNECTION_MANAGER_HPP_
#define MESHLINK_CONNECTION_MANAGER_HPP_

#include "meshlink/device_provider.hpp"
#include "meshlink/frame_codec.hpp"
#include "meshlink/hsm.hpp"
#include "meshlink/link_session.hpp"
#include "meshlink/log.hpp"
#include "meshlink/messages.hpp"
#include "meshlink/platform.hpp"
#include "meshlink/serial_channel.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdio>
#include <cstring>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#ifndef MESHLINK_LINK_EVENT_QUEUE_DEPTH
#define MESHLINK_LINK_EVENT_QUEUE_DEPTH 64U
#endif

#ifndef MESHLINK_LINK_CONTROL_RESERVE
#define MESHLINK_LINK_CONTROL_RESERVE 8U
#endif

#ifndef MESHLINK_MAX_STATUS_OBSERVERS
#define MESHLINK_MAX_STATUS_OBSERVERS 4U
#endif

namespace meshlink {

static_assert(MESHLINK_LINK_CONTROL_RESERVE < MESHLINK_LINK_EVENT_QUEUE_DEPTH,
              "control reserve must leave room for byte events");

// ============================================================================
// Link State / Status
// ============================================================================

enum class LinkState : uint8_t {
  kIdle,
  kAwaitingPermission,
  kOpening,
  kConnected,
};

inline const char* LinkStateName(LinkState s) noexcept {
  switch (s) {
    case LinkState::kIdle:
      return "Idle";
    case LinkState::kAwaitingPermission:
      return "AwaitingPermission";
    case LinkState::kOpening:
      return "Opening";
    case LinkState::kConnected:
      return "Connected";
    default:
      return "Unknown";
  }
}

namespace status_text {
static constexpr const char kNotConnected[] = "Not connected";
static constexpr const char kNoDevice[] = "No serial drivers matched";
static constexpr const char kRequestingPermission[] =
    "Requesting USB permission";
static constexpr const char kPermissionDenied[] = "USB permission denied";
static constexpr const char kOpening[] = "Opening device";
static constexpr const char kNoDriver[] = "No serial driver";
static constexpr const char kNoPorts[] = "No ports on device";
static constexpr const char kOpenFailed[] = "Failed to open device";
static constexpr const char kConnectionLost[] = "Connection lost";
static constexpr const char kDisconnected[] = "Disconnected";
}  // namespace status_text

/// Snapshot published on every transition and every I/O failure.
struct LinkStatus {
  LinkState state = LinkState::kIdle;
  FixedString<63> text{status_text::kNotConnected};
  bool has_error = false;                          ///< Latest change was an error
  LinkError last_error = LinkError::kChannelOpenFailure;  ///< Valid once has_error was set
  SessionId session_id;                            ///< 0 when no session
};

using LinkStatusFn = void (*)(const LinkStatus& status, void* ctx);

/// Monotonic milliseconds; injectable for tests.
using ClockFn = FixedFunction<uint64_t()>;

struct LinkManagerConfig {
  ChannelConfig channel;                   ///< port_name is filled per device
  uint32_t keepalive_interval_ms = 10000U;
};

struct LinkManagerStats {
  uint64_t events_processed = 0U;
  uint64_t bytes_events_dropped = 0U;
  uint64_t stale_events = 0U;
  uint64_t sessions_opened = 0U;
  uint64_t handshakes_sent = 0U;
  uint64_t keepalives_sent = 0U;
  uint64_t keepalive_failures = 0U;
};

// ============================================================================
// Events
// ============================================================================

enum LinkEventId : uint32_t {
  kLinkEvtConnect = 1,
  kLinkEvtDisconnect,
  kLinkEvtPermissionResult,
  kLinkEvtOpenDevice,
  kLinkEvtBytes,
  kLinkEvtIoFailure,
  kLinkEvtKeepaliveDue,
};

struct LinkEvent {
  uint32_t id = 0U;
  SessionId session;
  uint32_t request_id = 0U;  ///< Permission request / open attempt
  bool granted = false;
  LinkError error = LinkError::kChannelIoFailure;
  uint32_t size = 0U;
  uint8_t data[kChannelChunkSize];
};

class ConnectionManager;

static constexpr uint32_t kLinkSmMaxStates = 8U;
struct LinkSmContext;
using LinkSm = StateMachine<LinkSmContext, kLinkSmMaxStates>;

struct LinkSmContext {
  ConnectionManager* mgr = nullptr;
  LinkSm* sm = nullptr;
  const LinkEvent* evt = nullptr;

  int32_t si_root = -1;
  int32_t si_idle = -1;
  int32_t si_permission = -1;
  int32_t si_opening = -1;
  int32_t si_connected = -1;
};

// ============================================================================
// ConnectionManager
// ============================================================================

class ConnectionManager final {
 public:
  /**
   * @param provider Device discovery / permission / driver source; must
   *                 outlive the manager.
   * @param cfg      Port parameters and keepalive interval.
   * @param encoder  Handshake/keepalive payload builder; nullptr selects
   *                 TaggedControlEncoder. Must outlive the manager.
   * @param clock    Millisecond clock; empty selects SteadyNowMs.
   */
  explicit ConnectionManager(DeviceProvider& provider,
                             const LinkManagerConfig& cfg = {},
                             const ControlEncoder* encoder = nullptr,
                             ClockFn clock = ClockFn()) noexcept;

  ~ConnectionManager() {
    Stop();
    CloseSession();
  }

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // ==========================================================================
  // Commands (any thread)
  // ==========================================================================

  /// @brief Start a connection attempt; an existing session is closed first.
  expected<void, LinkError> Connect() noexcept {
    LinkEvent e;
    e.id = kLinkEvtConnect;
    return PostControl(e);
  }

  expected<void, LinkError> Disconnect() noexcept {
    LinkEvent e;
    e.id = kLinkEvtDisconnect;
    return PostControl(e);
  }

  /// @brief Host answer to a DeviceProvider::RequestPermission() call.
  void OnPermissionResult(uint32_t request_id, bool granted) noexcept {
    LinkEvent e;
    e.id = kLinkEvtPermissionResult;
    e.request_id = request_id;
    e.granted = granted;
    auto r = PostControl(e);
    if (!r) {
      MESHLINK_LOG_ERROR("LINK", "permission result %u lost: %s", request_id,
                         LinkErrorName(r.get_error()));
    }
  }

  /**
   * @brief Send one application payload through the live session.
   * @return kSendRejected without a session; otherwise the session result.
   */
  expected<void, LinkError> Send(const uint8_t* payload,
                                 uint32_t size) noexcept {
    std::shared_ptr<LinkSession> session;
    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      session = session_;
    }
    if (session == nullptr) {
      return expected<void, LinkError>::error(LinkError::kSendRejected);
    }
    return session->Send(payload, size);
  }

  /// @brief Next packet id of the live session: 1, 2, ... per session.
  expected<uint32_t, LinkError> NextPacketId() noexcept {
    std::lock_guard<std::mutex> lock(session_mtx_);
    if (session_ == nullptr) {
      return expected<uint32_t, LinkError>::error(LinkError::kSendRejected);
    }
    return expected<uint32_t, LinkError>::success(session_->NextPacketId());
  }

  // ==========================================================================
  // Registration (before Start)
  // ==========================================================================

  /// @brief Consumer of decoded payloads; called on the engine thread.
  void SetPayloadHandler(FramePayloadFn fn, void* ctx) noexcept {
    payload_fn_ = fn;
    payload_ctx_ = ctx;
  }

  bool AddStatusObserver(LinkStatusFn fn, void* ctx) noexcept {
    MESHLINK_ASSERT(fn != nullptr);
    std::lock_guard<std::mutex> lock(status_mtx_);
    return observers_.push_back(StatusObserver{fn, ctx});
  }

  // ==========================================================================
  // Engine
  // ==========================================================================

  /**
   * @brief Drain queued events and fire a due keepalive.
   *
   * Use either this (single-threaded / tests) or Start(), not both.
   * @return Number of events dispatched.
   */
  uint32_t ProcessPending() noexcept {
    uint32_t processed = 0U;
    while (PopEvent(scratch_)) {
      DispatchEvent(scratch_);
      ++processed;
    }
    if (FireKeepaliveIfDue()) {
      ++processed;
      // A failed keepalive may have queued an I/O failure.
      while (PopEvent(scratch_)) {
        DispatchEvent(scratch_);
        ++processed;
      }
    }
    return processed;
  }

  void Start() noexcept {
    if (running_.exchange(true)) {
      return;
    }
    engine_ = std::thread([this]() { EngineLoop(); });
    MESHLINK_LOG_DEBUG("LINK", "engine started");
  }

  void Stop() noexcept {
    if (!running_.exchange(false)) {
      return;
    }
    queue_cv_.notify_all();
    if (engine_.joinable()) {
      engine_.join();
    }
    MESHLINK_LOG_DEBUG("LINK", "engine stopped");
  }

  bool IsRunning() const noexcept { return running_.load(); }

  // ==========================================================================
  // Query
  // ==========================================================================

  LinkState State() const noexcept { return state_.load(); }

  LinkStatus GetStatus() const noexcept {
    std::lock_guard<std::mutex> lock(status_mtx_);
    return status_;
  }

  bool HasSession() const noexcept {
    std::lock_guard<std::mutex> lock(session_mtx_);
    return session_ != nullptr;
  }

  SessionId CurrentSessionId() const noexcept {
    std::lock_guard<std::mutex> lock(session_mtx_);
    return (session_ != nullptr) ? session_->Id() : SessionId(0U);
  }

  /// @brief Correlation id of the most recent handshake.
  uint32_t LastConfigId() const noexcept { return last_config_id_.load(); }

  uint32_t PendingEvents() const noexcept {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    return queue_count_;
  }

  LinkManagerStats GetStats() const noexcept {
    std::lock_guard<std::mutex> lock(status_mtx_);
    LinkManagerStats s = stats_;
    s.bytes_events_dropped = bytes_dropped_.load();
    return s;
  }

  const char* CurrentStateName() const noexcept {
    return sm_.CurrentStateName();
  }

 private:
  struct StatusObserver {
    LinkStatusFn fn;
    void* ctx;
  };

  using TR = TransitionResult;

  // ==========================================================================
  // State handlers
  // ==========================================================================

  static TR StateRoot(LinkSmContext& ctx, const Event& ev) {
    ConnectionManager& m = *ctx.mgr;
    switch (ev.id) {
      case kLinkEvtConnect:
        // One session at most: drop the current one before discovery.
        m.CloseSession();
        return m.BeginAttempt();
      case kLinkEvtDisconnect:
        m.SetPendingStatus(status_text::kDisconnected);
        if (ctx.sm->CurrentState() == ctx.si_idle) {
          return TR::kHandled;
        }
        return ctx.sm->RequestTransition(ctx.si_idle);
      default:
        // Bytes, failures and answers addressed to a state we already left.
        {
          std::lock_guard<std::mutex> lock(m.status_mtx_);
          ++m.stats_.stale_events;
        }
        MESHLINK_LOG_DEBUG("LINK", "stale event %u in %s", ev.id,
                           ctx.sm->CurrentStateName());
        return TR::kHandled;
    }
  }

  static TR StateIdle(LinkSmContext& /*ctx*/, const Event& /*ev*/) {
    return TR::kUnhandled;
  }

  static TR StateAwaitingPermission(LinkSmContext& ctx, const Event& ev) {
    ConnectionManager& m = *ctx.mgr;
    if (ev.id != kLinkEvtPermissionResult ||
        ctx.evt->request_id != m.permission_request_id_) {
      return TR::kUnhandled;
    }
    if (ctx.evt->granted) {
      MESHLINK_LOG_INFO("LINK", "permission granted for %s",
                        m.candidate_.path.c_str());
      return ctx.sm->RequestTransition(ctx.si_opening);
    }
    MESHLINK_LOG_WARN("LINK", "permission denied for %s",
                      m.candidate_.path.c_str());
    m.SetPendingError(status_text::kPermissionDenied,
                      LinkError::kChannelOpenFailure);
    return ctx.sm->RequestTransition(ctx.si_idle);
  }

  static TR StateOpening(LinkSmContext& ctx, const Event& ev) {
    ConnectionManager& m = *ctx.mgr;
    if (ev.id != kLinkEvtOpenDevice || ctx.evt->request_id != m.attempt_) {
      return TR::kUnhandled;
    }
    if (m.OpenSession()) {
      return ctx.sm->RequestTransition(ctx.si_connected);
    }
    return ctx.sm->RequestTransition(ctx.si_idle);
  }

  static TR StateConnected(LinkSmContext& ctx, const Event& ev) {
    ConnectionManager& m = *ctx.mgr;
    switch (ev.id) {
      case kLinkEvtBytes:
        if (ctx.evt->session != m.live_session_id_) {
          return TR::kUnhandled;
        }
        m.DeliverBytes(*ctx.evt);
        return TR::kHandled;
      case kLinkEvtIoFailure:
        if (ctx.evt->session != m.live_session_id_) {
          return TR::kUnhandled;
        }
        MESHLINK_LOG_ERROR("LINK", "session %u lost: %s",
                           ctx.evt->session.value(),
                           LinkErrorName(ctx.evt->error));
        m.SetPendingError(status_text::kConnectionLost,
                          LinkError::kChannelIoFailure);
        return ctx.sm->RequestTransition(ctx.si_idle);
      case kLinkEvtKeepaliveDue:
        m.SendKeepalive();
        return TR::kHandled;
      default:
        return TR::kUnhandled;
    }
  }

  static void EnterIdle(LinkSmContext& ctx) {
    ctx.mgr->state_.store(LinkState::kIdle);
  }

  static void EnterAwaitingPermission(LinkSmContext& ctx) {
    ConnectionManager& m = *ctx.mgr;
    m.state_.store(LinkState::kAwaitingPermission);
    m.SetPendingStatus(status_text::kRequestingPermission);
    m.permission_request_id_ = m.attempt_;
    MESHLINK_LOG_INFO("LINK", "requesting permission for %s",
                      m.candidate_.path.c_str());
    m.provider_.RequestPermission(m.candidate_, m.permission_request_id_,
                                  &ConnectionManager::PermissionTrampoline,
                                  &m);
  }

  static void EnterOpening(LinkSmContext& ctx) {
    ConnectionManager& m = *ctx.mgr;
    m.state_.store(LinkState::kOpening);
    m.SetPendingStatus(status_text::kOpening);
    // Dispatched by DispatchEvent() once this transition completes; it does
    // not go through the queue, so a saturated queue cannot strand Opening.
    m.open_pending_ = m.attempt_;
  }

  static void EnterConnected(LinkSmContext& ctx) {
    ConnectionManager& m = *ctx.mgr;
    m.state_.store(LinkState::kConnected);
    char text[64];
    (void)std::snprintf(text, sizeof(text), "Connected (%u)",
                        m.cfg_.channel.baud_rate);
    m.SetPendingStatus(text);
    m.SendHandshake();
    m.next_keepalive_ms_ = m.clock_() + m.cfg_.keepalive_interval_ms;
  }

  static void ExitConnected(LinkSmContext& ctx) {
    ctx.mgr->next_keepalive_ms_ = 0U;
    ctx.mgr->CloseSession();
  }

  // ==========================================================================
  // Actions (engine thread)
  // ==========================================================================

  TR BeginAttempt() noexcept {
    ++attempt_;
    DeviceList devices = provider_.Discover();
    if (devices.empty()) {
      MESHLINK_LOG_WARN("LINK", "no candidate device");
      SetPendingError(status_text::kNoDevice, LinkError::kChannelOpenFailure);
      return sm_.RequestTransition(ctx_.si_idle);
    }
    candidate_ = devices[0];
    MESHLINK_LOG_INFO("LINK", "attempt %u: candidate %s (%04x:%04x)",
                      attempt_, candidate_.path.c_str(),
                      candidate_.vendor_id, candidate_.product_id);
    if (!provider_.HasPermission(candidate_)) {
      return sm_.RequestTransition(ctx_.si_permission);
    }
    return sm_.RequestTransition(ctx_.si_opening);
  }

  bool OpenSession() noexcept {
    std::unique_ptr<ByteChannel> channel = provider_.CreateChannel(candidate_);
    if (channel == nullptr) {
      MESHLINK_LOG_WARN("LINK", "no driver for %s", candidate_.path.c_str());
      SetPendingError(status_text::kNoDriver, LinkError::kChannelOpenFailure);
      return false;
    }
    if (candidate_.port_count == 0U) {
      MESHLINK_LOG_WARN("LINK", "%s exposes no ports",
                        candidate_.path.c_str());
      SetPendingError(status_text::kNoPorts, LinkError::kChannelOpenFailure);
      return false;
    }

    ChannelConfig cc = cfg_.channel;
    (void)std::snprintf(cc.port_name, sizeof(cc.port_name), "%s",
                        candidate_.path.c_str());

    const SessionId id(++session_seq_);
    auto session = std::make_shared<LinkSession>(
        id, static_cast<std::unique_ptr<ByteChannel>&&>(channel));
    SessionCallbacks cb;
    cb.on_bytes = &ConnectionManager::SessionBytesTrampoline;
    cb.on_failure = &ConnectionManager::SessionFailureTrampoline;
    cb.ctx = this;

    auto r = session->Open(cc, cb);
    if (!r) {
      MESHLINK_LOG_WARN("LINK", "open %s failed: %s", cc.port_name,
                        LinkErrorName(r.get_error()));
      SetPendingError(status_text::kOpenFailed, r.get_error());
      return false;
    }

    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      session_ = session;
    }
    live_session_id_ = id;
    {
      std::lock_guard<std::mutex> lock(status_mtx_);
      ++stats_.sessions_opened;
    }
    return true;
  }

  void CloseSession() noexcept {
    std::shared_ptr<LinkSession> session;
    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      session.swap(session_);
    }
    live_session_id_ = SessionId(0U);
    if (session != nullptr) {
      session->Close();
    }
  }

  void SendHandshake() noexcept {
    const uint32_t config_id =
        static_cast<uint32_t>(clock_() & 0x7FFFFFFFULL);
    last_config_id_.store(config_id);

    uint8_t buf[32];
    auto enc = encoder_->EncodeHandshake(config_id, buf, sizeof(buf));
    if (!enc) {
      MESHLINK_LOG_ERROR("LINK", "handshake encode failed: %s",
                         LinkErrorName(enc.get_error()));
      return;
    }
    auto r = Send(buf, enc.value());
    if (!r) {
      MESHLINK_LOG_WARN("LINK", "handshake send failed: %s",
                        LinkErrorName(r.get_error()));
      return;
    }
    std::lock_guard<std::mutex> lock(status_mtx_);
    ++stats_.handshakes_sent;
    MESHLINK_LOG_INFO("LINK", "handshake sent, config id %u", config_id);
  }

  void SendKeepalive() noexcept {
    nonce_ = static_cast<uint16_t>((nonce_ + 1U) & 0xFFFFU);
    uint8_t buf[32];
    auto enc = encoder_->EncodeKeepalive(nonce_, buf, sizeof(buf));
    if (!enc) {
      MESHLINK_LOG_ERROR("LINK", "keepalive encode failed: %s",
                         LinkErrorName(enc.get_error()));
      return;
    }
    auto r = Send(buf, enc.value());
    std::lock_guard<std::mutex> lock(status_mtx_);
    if (!r) {
      ++stats_.keepalive_failures;
      MESHLINK_LOG_WARN("LINK", "keepalive failed: %s",
                        LinkErrorName(r.get_error()));
      return;
    }
    ++stats_.keepalives_sent;
    MESHLINK_LOG_DEBUG("LINK", "keepalive nonce %u", nonce_);
  }

  void DeliverBytes(const LinkEvent& e) noexcept {
    std::shared_ptr<LinkSession> session;
    {
      std::lock_guard<std::mutex> lock(session_mtx_);
      session = session_;
    }
    if (session == nullptr) {
      return;
    }
    (void)session->OnBytes(e.data, e.size, payload_fn_, payload_ctx_);
  }

  /// Fires at most one keepalive; missed periods are skipped, not replayed.
  bool FireKeepaliveIfDue() noexcept {
    if (next_keepalive_ms_ == 0U || state_.load() != LinkState::kConnected) {
      return false;
    }
    const uint64_t now = clock_();
    if (now < next_keepalive_ms_) {
      return false;
    }
    const uint64_t period = cfg_.keepalive_interval_ms;
    next_keepalive_ms_ += period;
    while (next_keepalive_ms_ <= now) {
      next_keepalive_ms_ += period;
    }
    LinkEvent e;
    e.id = kLinkEvtKeepaliveDue;
    DispatchEvent(e);
    return true;
  }

  // ==========================================================================
  // Status
  // ==========================================================================

  void SetPendingStatus(const char* text) noexcept {
    pending_text_.assign(TruncateToCapacity, text);
    pending_has_error_ = false;
    status_dirty_ = true;
  }

  void SetPendingError(const char* text, LinkError error) noexcept {
    pending_text_.assign(TruncateToCapacity, text);
    pending_has_error_ = true;
    pending_error_ = error;
    status_dirty_ = true;
  }

  void PublishStatusIfChanged(LinkState before) noexcept {
    const LinkState now = state_.load();
    if (!status_dirty_ && now == before) {
      return;
    }
    LinkStatus snapshot;
    FixedVector<StatusObserver, MESHLINK_MAX_STATUS_OBSERVERS> observers;
    {
      std::lock_guard<std::mutex> lock(status_mtx_);
      status_.state = now;
      if (status_dirty_) {
        status_.text = pending_text_;
        status_.has_error = pending_has_error_;
        if (pending_has_error_) {
          status_.last_error = pending_error_;
        }
      }
      status_.session_id = live_session_id_;
      snapshot = status_;
      observers = observers_;
    }
    status_dirty_ = false;

    MESHLINK_LOG_INFO("LINK", "[%s] %s", LinkStateName(snapshot.state),
                      snapshot.text.c_str());
    for (const auto& o : observers) {
      o.fn(snapshot, o.ctx);
    }
  }

  // ==========================================================================
  // Event queue
  // ==========================================================================

  void DispatchEvent(const LinkEvent& e) noexcept {
    const LinkState before = state_.load();
    ctx_.evt = &e;
    sm_.Dispatch(Event{e.id, &e});
    ctx_.evt = nullptr;
    {
      std::lock_guard<std::mutex> lock(status_mtx_);
      ++stats_.events_processed;
    }
    PublishStatusIfChanged(before);

    if (open_pending_ != 0U) {
      LinkEvent open;
      open.id = kLinkEvtOpenDevice;
      open.request_id = open_pending_;
      open_pending_ = 0U;
      DispatchEvent(open);
    }
  }

  expected<void, LinkError> PostControl(const LinkEvent& e) noexcept {
    {
      std::lock_guard<std::mutex> lock(queue_mtx_);
      if (queue_count_ >= MESHLINK_LINK_EVENT_QUEUE_DEPTH) {
        MESHLINK_LOG_ERROR("LINK", "event queue full, event %u rejected",
                           e.id);
        return expected<void, LinkError>::error(LinkError::kQueueFull);
      }
      PushLocked(e);
    }
    queue_cv_.notify_one();
    return expected<void, LinkError>::success();
  }

  void PostBytes(SessionId id, const uint8_t* data, uint32_t size) noexcept {
    while (size > 0U) {
      const uint32_t n = (size < kChannelChunkSize) ? size : kChannelChunkSize;
      {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        if (queue_count_ >= MESHLINK_LINK_EVENT_QUEUE_DEPTH -
                                MESHLINK_LINK_CONTROL_RESERVE) {
          const uint64_t dropped = bytes_dropped_.fetch_add(1U) + 1U;
          if (dropped == 1U || (dropped % 100U) == 0U) {
            MESHLINK_LOG_WARN("LINK", "event queue saturated, %llu byte "
                              "chunk(s) dropped",
                              static_cast<unsigned long long>(dropped));
          }
          return;
        }
        LinkEvent& slot = queue_[(queue_head_ + queue_count_) %
                                 MESHLINK_LINK_EVENT_QUEUE_DEPTH];
        slot.id = kLinkEvtBytes;
        slot.session = id;
        slot.size = n;
        std::memcpy(slot.data, data, n);
        ++queue_count_;
      }
      queue_cv_.notify_one();
      data += n;
      size -= n;
    }
  }

  void PushLocked(const LinkEvent& e) noexcept {
    LinkEvent& slot =
        queue_[(queue_head_ + queue_count_) % MESHLINK_LINK_EVENT_QUEUE_DEPTH];
    slot.id = e.id;
    slot.session = e.session;
    slot.request_id = e.request_id;
    slot.granted = e.granted;
    slot.error = e.error;
    slot.size = 0U;
    ++queue_count_;
  }

  bool PopEvent(LinkEvent& out) noexcept {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    if (queue_count_ == 0U) {
      return false;
    }
    const LinkEvent& slot = queue_[queue_head_];
    out.id = slot.id;
    out.session = slot.session;
    out.request_id = slot.request_id;
    out.granted = slot.granted;
    out.error = slot.error;
    out.size = slot.size;
    if (slot.size > 0U) {
      std::memcpy(out.data, slot.data, slot.size);
    }
    queue_head_ = (queue_head_ + 1U) % MESHLINK_LINK_EVENT_QUEUE_DEPTH;
    --queue_count_;
    return true;
  }

  void EngineLoop() noexcept {
    static constexpr uint64_t kIdleWaitMs = 1000U;
    while (running_.load()) {
      {
        std::unique_lock<std::mutex> lock(queue_mtx_);
        if (queue_count_ == 0U) {
          uint64_t wait_ms = kIdleWaitMs;
          if (next_keepalive_ms_ != 0U) {
            const uint64_t now = clock_();
            wait_ms = (next_keepalive_ms_ > now)
                          ? (next_keepalive_ms_ - now)
                          : 0U;
            if (wait_ms > kIdleWaitMs) {
              wait_ms = kIdleWaitMs;
            }
          }
          (void)queue_cv_.wait_for(
              lock, std::chrono::milliseconds(wait_ms),
              [this]() { return queue_count_ > 0U || !running_.load(); });
        }
      }
      if (!running_.load()) {
        break;
      }
      (void)ProcessPending();
    }
  }

  // ==========================================================================
  // Trampolines (reader / provider threads)
  // ==========================================================================

  static void SessionBytesTrampoline(SessionId id, const uint8_t* data,
                                     uint32_t size, void* ctx) {
    static_cast<ConnectionManager*>(ctx)->PostBytes(id, data, size);
  }

  static void SessionFailureTrampoline(SessionId id, LinkError error,
                                       void* ctx) {
    LinkEvent e;
    e.id = kLinkEvtIoFailure;
    e.session = id;
    e.error = error;
    auto r = static_cast<ConnectionManager*>(ctx)->PostControl(e);
    if (!r) {
      MESHLINK_LOG_ERROR("LINK", "I/O failure of session %u lost",
                         id.value());
    }
  }

  static void PermissionTrampoline(uint32_t request_id, bool granted,
                                   void* ctx) {
    static_cast<ConnectionManager*>(ctx)->OnPermissionResult(request_id,
                                                             granted);
  }

  // ==========================================================================
  // Data members
  // ==========================================================================

  DeviceProvider& provider_;
  LinkManagerConfig cfg_;
  TaggedControlEncoder default_encoder_;
  const ControlEncoder* encoder_;
  ClockFn clock_;

  LinkSmContext ctx_;
  LinkSm sm_;
  std::atomic<LinkState> state_;

  // Engine-thread state
  DeviceInfo candidate_;
  uint32_t attempt_;
  uint32_t permission_request_id_;
  uint32_t open_pending_;  // attempt to open after the current dispatch
  uint32_t session_seq_;
  SessionId live_session_id_;
  uint64_t next_keepalive_ms_;
  uint16_t nonce_;
  std::atomic<uint32_t> last_config_id_;
  FramePayloadFn payload_fn_;
  void* payload_ctx_;
  LinkEvent scratch_;

  FixedString<63> pending_text_;
  bool pending_has_error_;
  LinkError pending_error_;
  bool status_dirty_;

  mutable std::mutex session_mtx_;
  std::shared_ptr<LinkSession> session_;

  mutable std::mutex status_mtx_;
  LinkStatus status_;
  LinkManagerStats stats_;
  FixedVector<StatusObserver, MESHLINK_MAX_STATUS_OBSERVERS> observers_;

  mutable std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  LinkEvent queue_[MESHLINK_LINK_EVENT_QUEUE_DEPTH];
  uint32_t queue_head_;
  uint32_t queue_count_;
  std::atomic<uint64_t> bytes_dropped_;

  std::atomic<bool> running_;
  std::thread engine_;
};

// ============================================================================
// Construction (after the handlers are complete)
// ============================================================================

inline ConnectionManager::ConnectionManager(DeviceProvider& provider,
                                            const LinkManagerConfig& cfg,
                                            const ControlEncoder* encoder,
                                            ClockFn clock) noexcept
    : provider_(provider),
      cfg_(cfg),
      default_encoder_(),
      encoder_((encoder != nullptr) ? encoder : &default_encoder_),
      clock_(static_cast<ClockFn&&>(clock)),
      ctx_(),
      sm_(ctx_),
      state_(LinkState::kIdle),
      candidate_(),
      attempt_(0U),
      permission_request_id_(0U),
      open_pending_(0U),
      session_seq_(0U),
      live_session_id_(0U),
      next_keepalive_ms_(0U),
      nonce_(0U),
      last_config_id_(0U),
      payload_fn_(nullptr),
      payload_ctx_(nullptr),
      pending_has_error_(false),
      pending_error_(LinkError::kChannelOpenFailure),
      status_dirty_(false),
      queue_head_(0U),
      queue_count_(0U),
      bytes_dropped_(0U),
      running_(false) {
  if (!clock_) {
    clock_ = ClockFn(&SteadyNowMs);
  }
  if (cfg_.keepalive_interval_ms == 0U) {
    MESHLINK_LOG_WARN("LINK", "keepalive interval 0, using 10000 ms");
    cfg_.keepalive_interval_ms = 10000U;
  }
  nonce_ = static_cast<uint16_t>(clock_() & 0xFFFFU);

  ctx_.mgr = this;
  ctx_.sm = &sm_;

  using Cfg = StateConfig<LinkSmContext>;
  ctx_.si_root = sm_.AddState(Cfg{"Root", -1, StateRoot, nullptr, nullptr,
                                  nullptr});
  ctx_.si_idle = sm_.AddState(Cfg{"Idle", ctx_.si_root, StateIdle, EnterIdle,
                                  nullptr, nullptr});
  ctx_.si_permission = sm_.AddState(
      Cfg{"AwaitingPermission", ctx_.si_root, StateAwaitingPermission,
          EnterAwaitingPermission, nullptr, nullptr});
  ctx_.si_opening = sm_.AddState(Cfg{"Opening", ctx_.si_root, StateOpening,
                                     EnterOpening, nullptr, nullptr});
  ctx_.si_connected =
      sm_.AddState(Cfg{"Connected", ctx_.si_root, StateConnected,
                       EnterConnected, ExitConnected, nullptr});
  sm_.SetInitialState(ctx_.si_idle);
  sm_.Start();
}

}  // namespace meshlink

#endif  // MESHLINK_CONNECTION_MANAGER_HPP_
