/**
 * @file test_connection_manager.cpp
 * @brief Tests for connection_manager.hpp: lifecycle, failure paths,
 *        keepalive timing and event queue policy.
 */

#include "meshlink/connection_manager.hpp"

#include "link_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using meshlink::LinkError;
using meshlink::LinkState;
using meshlink::MessageType;
using meshlink_test::Bytes;
using meshlink_test::FakeDeviceProvider;
using meshlink_test::ManualClock;

namespace {

struct StatusLog {
  std::vector<meshlink::LinkStatus> entries;

  static void OnStatus(const meshlink::LinkStatus& s, void* ctx) {
    static_cast<StatusLog*>(ctx)->entries.push_back(s);
  }

  bool Saw(const char* text) const {
    for (const auto& e : entries) {
      if (e.text == text) {
        return true;
      }
    }
    return false;
  }
};

void CollectPayload(const uint8_t* data, uint32_t size, void* ctx) {
  static_cast<std::vector<Bytes>*>(ctx)->emplace_back(data, data + size);
}

struct Harness {
  FakeDeviceProvider provider;
  ManualClock clock;
  meshlink::ConnectionManager mgr{provider, meshlink::LinkManagerConfig{},
                                  nullptr, clock.Fn()};
  StatusLog status;
  std::vector<Bytes> received;

  Harness() {
    REQUIRE(mgr.AddStatusObserver(&StatusLog::OnStatus, &status));
    mgr.SetPayloadHandler(&CollectPayload, &received);
  }

  void ConnectAndSettle() {
    REQUIRE(mgr.Connect().has_value());
    (void)mgr.ProcessPending();
  }
};

uint32_t ConfigIdOf(const Bytes& payload) {
  REQUIRE(payload.size() == 5U);
  return static_cast<uint32_t>(payload[1]) |
         (static_cast<uint32_t>(payload[2]) << 8) |
         (static_cast<uint32_t>(payload[3]) << 16) |
         (static_cast<uint32_t>(payload[4]) << 24);
}

}  // namespace

// ============================================================================
// Initial state
// ============================================================================

TEST_CASE("connection_manager - starts idle and not connected",
          "[connection_manager]") {
  Harness h;
  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(std::string(h.mgr.CurrentStateName()) == "Idle");
  REQUIRE(h.mgr.GetStatus().text == "Not connected");
  REQUIRE(!h.mgr.HasSession());
  REQUIRE(h.mgr.CurrentSessionId() == meshlink::SessionId(0U));
}

TEST_CASE("connection_manager - send without session is rejected",
          "[connection_manager]") {
  Harness h;
  const uint8_t payload[] = {0x01};
  auto r = h.mgr.Send(payload, 1U);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == LinkError::kSendRejected);
  REQUIRE(h.mgr.NextPacketId().get_error() == LinkError::kSendRejected);
}

// ============================================================================
// Connect paths
// ============================================================================

TEST_CASE("connection_manager - connect reaches Connected and handshakes once",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();

  REQUIRE(h.mgr.State() == LinkState::kConnected);
  REQUIRE(h.mgr.HasSession());
  REQUIRE(h.mgr.GetStatus().text == "Connected (115200)");
  REQUIRE(!h.mgr.GetStatus().has_error);
  REQUIRE(h.status.Saw("Connected (115200)"));

  auto wire = h.provider.LastWire();
  REQUIRE(wire != nullptr);
  REQUIRE(std::string(wire->last_cfg.port_name) == "/dev/ttyACM0");
  REQUIRE(wire->last_cfg.baud_rate == 115200U);

  auto payloads = wire->Payloads();
  REQUIRE(payloads.size() == 1U);
  REQUIRE(payloads[0][0] == static_cast<uint8_t>(MessageType::kConfigRequest));
  const uint32_t config_id = ConfigIdOf(payloads[0]);
  REQUIRE(config_id == h.mgr.LastConfigId());
  REQUIRE((config_id & 0x80000000U) == 0U);
  REQUIRE(h.mgr.GetStats().handshakes_sent == 1U);
}

TEST_CASE("connection_manager - permission granted later opens the device",
          "[connection_manager]") {
  Harness h;
  h.provider.has_permission = false;
  h.ConnectAndSettle();

  REQUIRE(h.mgr.State() == LinkState::kAwaitingPermission);
  REQUIRE(h.mgr.GetStatus().text == "Requesting USB permission");
  REQUIRE(h.provider.permission_requests == 1U);

  h.mgr.OnPermissionResult(h.provider.last_request_id, true);
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kConnected);
}

TEST_CASE("connection_manager - permission denied returns to Idle",
          "[connection_manager]") {
  Harness h;
  h.provider.has_permission = false;
  h.ConnectAndSettle();

  h.mgr.OnPermissionResult(h.provider.last_request_id, false);
  (void)h.mgr.ProcessPending();

  REQUIRE(h.mgr.State() == LinkState::kIdle);
  auto st = h.mgr.GetStatus();
  REQUIRE(st.text == "USB permission denied");
  REQUIRE(st.has_error);
  REQUIRE(st.last_error == LinkError::kChannelOpenFailure);
  REQUIRE(h.provider.wires.empty());
}

TEST_CASE("connection_manager - answer to an old permission request is ignored",
          "[connection_manager]") {
  Harness h;
  h.provider.has_permission = false;
  h.ConnectAndSettle();

  h.mgr.OnPermissionResult(h.provider.last_request_id + 10U, true);
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kAwaitingPermission);
  REQUIRE(h.mgr.GetStats().stale_events == 1U);
}

TEST_CASE("connection_manager - disconnect while waiting for permission",
          "[connection_manager]") {
  Harness h;
  h.provider.has_permission = false;
  h.ConnectAndSettle();
  const uint32_t request = h.provider.last_request_id;

  REQUIRE(h.mgr.Disconnect().has_value());
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);

  h.mgr.OnPermissionResult(request, true);
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(h.provider.wires.empty());
}

TEST_CASE("connection_manager - open failures report status and go Idle",
          "[connection_manager]") {
  Harness h;

  SECTION("no device") {
    h.provider.devices.clear();
    h.ConnectAndSettle();
    REQUIRE(h.mgr.GetStatus().text == "No serial drivers matched");
  }
  SECTION("no driver") {
    h.provider.no_driver = true;
    h.ConnectAndSettle();
    REQUIRE(h.mgr.GetStatus().text == "No serial driver");
  }
  SECTION("no ports") {
    h.provider.devices.clear();
    h.provider.AddDevice("/dev/ttyUSB3", 0U);
    h.ConnectAndSettle();
    REQUIRE(h.mgr.GetStatus().text == "No ports on device");
  }
  SECTION("open fails") {
    h.provider.fail_open = true;
    h.ConnectAndSettle();
    REQUIRE(h.mgr.GetStatus().text == "Failed to open device");
  }

  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(!h.mgr.HasSession());
  auto st = h.mgr.GetStatus();
  REQUIRE(st.has_error);
  REQUIRE(st.last_error == LinkError::kChannelOpenFailure);
}

TEST_CASE("connection_manager - connect while connected replaces the session",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto first_wire = h.provider.LastWire();
  const meshlink::SessionId first = h.mgr.CurrentSessionId();

  h.ConnectAndSettle();

  REQUIRE(h.provider.wires.size() == 2U);
  REQUIRE(!first_wire->open);
  REQUIRE(first_wire->close_calls == 1U);
  REQUIRE(h.provider.LastWire()->open);
  REQUIRE(h.mgr.State() == LinkState::kConnected);
  REQUIRE(h.mgr.CurrentSessionId() != first);
}

TEST_CASE("connection_manager - explicit disconnect", "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();

  REQUIRE(h.mgr.Disconnect().has_value());
  (void)h.mgr.ProcessPending();

  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(!h.mgr.HasSession());
  REQUIRE(!wire->open);
  REQUIRE(h.mgr.GetStatus().text == "Disconnected");
  REQUIRE(!h.mgr.GetStatus().has_error);
}

// ============================================================================
// Failure and recovery
// ============================================================================

TEST_CASE("connection_manager - I/O failure returns to Idle without session",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();

  wire->Fail();
  (void)h.mgr.ProcessPending();

  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(!h.mgr.HasSession());
  REQUIRE(!wire->open);
  auto st = h.mgr.GetStatus();
  REQUIRE(st.text == "Connection lost");
  REQUIRE(st.has_error);
  REQUIRE(st.last_error == LinkError::kChannelIoFailure);
  REQUIRE(st.session_id == meshlink::SessionId(0U));

  // No automatic reconnection.
  h.clock.Advance(60000U);
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(h.provider.wires.size() == 1U);
}

TEST_CASE("connection_manager - write I/O failure tears the session down",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();
  {
    std::lock_guard<std::mutex> lock(wire->mtx);
    wire->fail_writes = true;
    wire->write_error = LinkError::kChannelIoFailure;
  }
  const uint8_t payload[] = {0x01, 0x05, 'h', 'e', 'l', 'l', 'o'};
  auto r = h.mgr.Send(payload, sizeof(payload));
  REQUIRE(r.get_error() == LinkError::kChannelIoFailure);

  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(h.mgr.GetStatus().text == "Connection lost");
}

TEST_CASE("connection_manager - full session scenario on a manual clock",
          "[connection_manager][scenario]") {
  Harness h;
  h.ConnectAndSettle();
  REQUIRE(h.mgr.State() == LinkState::kConnected);
  auto wire = h.provider.LastWire();
  const meshlink::SessionId first = h.mgr.CurrentSessionId();

  REQUIRE(wire->CountType(MessageType::kConfigRequest) == 1U);
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 0U);

  // Nothing before the first period elapses.
  h.clock.Advance(9999U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 0U);

  h.clock.Advance(1U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 1U);

  for (int i = 0; i < 2; ++i) {
    h.clock.Advance(10000U);
    (void)h.mgr.ProcessPending();
  }
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 3U);
  REQUIRE(wire->CountType(MessageType::kConfigRequest) == 1U);
  REQUIRE(h.mgr.GetStats().keepalives_sent == 3U);

  wire->Fail();
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);
  REQUIRE(!h.mgr.HasSession());

  h.clock.Advance(10000U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 3U);

  h.ConnectAndSettle();
  REQUIRE(h.mgr.State() == LinkState::kConnected);
  REQUIRE(h.provider.wires.size() == 2U);
  REQUIRE(h.mgr.CurrentSessionId() != first);
  REQUIRE(h.provider.LastWire()->CountType(MessageType::kConfigRequest) == 1U);
  REQUIRE(h.mgr.GetStats().sessions_opened == 2U);
}

TEST_CASE("connection_manager - handshake uses a fresh id per session",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  const uint32_t first = h.mgr.LastConfigId();
  h.clock.Advance(1234U);
  h.ConnectAndSettle();
  REQUIRE(h.mgr.LastConfigId() != first);
  REQUIRE(ConfigIdOf(h.provider.LastWire()->Payloads()[0]) ==
          h.mgr.LastConfigId());
}

TEST_CASE("connection_manager - missed keepalive periods are not replayed",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();

  h.clock.Advance(35000U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 1U);

  h.clock.Advance(4999U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 1U);

  h.clock.Advance(1U);
  (void)h.mgr.ProcessPending();
  REQUIRE(wire->CountType(MessageType::kHeartbeat) == 2U);
}

TEST_CASE("connection_manager - keepalive nonces rotate",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();
  h.clock.Advance(10000U);
  (void)h.mgr.ProcessPending();
  h.clock.Advance(10000U);
  (void)h.mgr.ProcessPending();

  std::vector<Bytes> beats;
  for (const auto& p : wire->Payloads()) {
    if (p[0] == static_cast<uint8_t>(MessageType::kHeartbeat)) {
      beats.push_back(p);
    }
  }
  REQUIRE(beats.size() == 2U);
  REQUIRE(beats[0].size() == 3U);
  REQUIRE(beats[0] != beats[1]);
}

// ============================================================================
// Inbound bytes and queue policy
// ============================================================================

TEST_CASE("connection_manager - inbound frames reach the payload handler",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();

  Bytes a = {0x01, 0x02, 'h', 'i'};
  Bytes big(512U, 0x33);
  Bytes stream = meshlink_test::Frame(a);
  Bytes second = meshlink_test::Frame(big);
  stream.insert(stream.end(), second.begin(), second.end());
  wire->Inject(stream);
  (void)h.mgr.ProcessPending();

  REQUIRE(h.received.size() == 2U);
  REQUIRE(h.received[0] == a);
  REQUIRE(h.received[1] == big);
}

TEST_CASE("connection_manager - bytes from a replaced session are dropped",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto old_wire = h.provider.LastWire();

  REQUIRE(h.mgr.Connect().has_value());
  old_wire->Inject(meshlink_test::Frame({0x01, 0x01, 'x'}));
  (void)h.mgr.ProcessPending();

  REQUIRE(h.mgr.State() == LinkState::kConnected);
  REQUIRE(h.received.empty());
  REQUIRE(h.mgr.GetStats().stale_events >= 1U);
}

TEST_CASE("connection_manager - byte flood keeps room for control events",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  auto wire = h.provider.LastWire();

  for (int i = 0; i < 200; ++i) {
    wire->Inject({0x55, 0x55, 0x55, 0x55});
  }
  REQUIRE(h.mgr.PendingEvents() ==
          MESHLINK_LINK_EVENT_QUEUE_DEPTH - MESHLINK_LINK_CONTROL_RESERVE);
  REQUIRE(h.mgr.GetStats().bytes_events_dropped ==
          200U - (MESHLINK_LINK_EVENT_QUEUE_DEPTH -
                  MESHLINK_LINK_CONTROL_RESERVE));

  REQUIRE(h.mgr.Disconnect().has_value());
  (void)h.mgr.ProcessPending();
  REQUIRE(h.mgr.State() == LinkState::kIdle);
}

TEST_CASE("connection_manager - opening proceeds with a saturated queue",
          "[connection_manager]") {
  Harness h;
  // Fill every slot with stale permission answers while the attempt runs.
  h.provider.on_permission_check = [&h]() {
    while (h.mgr.PendingEvents() < MESHLINK_LINK_EVENT_QUEUE_DEPTH) {
      h.mgr.OnPermissionResult(9999U, false);
    }
  };
  REQUIRE(h.mgr.Connect().has_value());
  (void)h.mgr.ProcessPending();

  REQUIRE(h.mgr.State() == LinkState::kConnected);
  REQUIRE(h.mgr.HasSession());
  REQUIRE(h.status.Saw("Opening device"));
  REQUIRE(h.mgr.GetStats().stale_events >= MESHLINK_LINK_EVENT_QUEUE_DEPTH);
}

// ============================================================================
// Observers, encoder seam, engine thread
// ============================================================================

TEST_CASE("connection_manager - observers see every transition",
          "[connection_manager]") {
  Harness h;
  h.ConnectAndSettle();
  h.provider.LastWire()->Fail();
  (void)h.mgr.ProcessPending();

  REQUIRE(h.status.Saw("Opening device"));
  REQUIRE(h.status.Saw("Connected (115200)"));
  REQUIRE(h.status.Saw("Connection lost"));
  REQUIRE(h.status.entries.back().state == LinkState::kIdle);
  REQUIRE(h.status.entries.back().has_error);
}

namespace {

class FixedEncoder final : public meshlink::ControlEncoder {
 public:
  meshlink::expected<uint32_t, LinkError> EncodeHandshake(
      uint32_t, uint8_t* out, uint32_t cap) const noexcept override {
    if (cap < 2U) {
      return meshlink::expected<uint32_t, LinkError>::error(
          LinkError::kPayloadTooLarge);
    }
    out[0] = 0xAA;
    out[1] = 0x01;
    return meshlink::expected<uint32_t, LinkError>::success(2U);
  }

  meshlink::expected<uint32_t, LinkError> EncodeKeepalive(
      uint16_t, uint8_t* out, uint32_t cap) const noexcept override {
    if (cap < 1U) {
      return meshlink::expected<uint32_t, LinkError>::error(
          LinkError::kPayloadTooLarge);
    }
    out[0] = 0xBB;
    return meshlink::expected<uint32_t, LinkError>::success(1U);
  }
};

}  // namespace

TEST_CASE("connection_manager - custom control encoder", "[connection_manager]") {
  FakeDeviceProvider provider;
  ManualClock clock;
  FixedEncoder encoder;
  meshlink::LinkManagerConfig cfg;
  cfg.keepalive_interval_ms = 500U;
  meshlink::ConnectionManager mgr(provider, cfg, &encoder, clock.Fn());

  REQUIRE(mgr.Connect().has_value());
  (void)mgr.ProcessPending();
  clock.Advance(500U);
  (void)mgr.ProcessPending();

  auto payloads = provider.LastWire()->Payloads();
  REQUIRE(payloads.size() == 2U);
  REQUIRE(payloads[0] == Bytes({0xAA, 0x01}));
  REQUIRE(payloads[1] == Bytes({0xBB}));
}

TEST_CASE("connection_manager - engine thread drives the lifecycle",
          "[connection_manager][thread]") {
  Harness h;
  h.mgr.Start();
  REQUIRE(h.mgr.IsRunning());
  REQUIRE(h.mgr.Connect().has_value());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.mgr.State() != LinkState::kConnected &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(h.mgr.State() == LinkState::kConnected);

  h.provider.LastWire()->Fail();
  deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.mgr.State() != LinkState::kIdle &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(h.mgr.State() == LinkState::kIdle);

  h.mgr.Stop();
  REQUIRE(!h.mgr.IsRunning());
}
