/**
 * @file test_device_provider.cpp
 * @brief Tests for device_provider.hpp (TtyDeviceProvider).
 */

#include "meshlink/device_provider.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

#include <unistd.h>

namespace {

meshlink::TtyProviderConfig ConfigWith(const char* dir, const char* prefixes) {
  meshlink::TtyProviderConfig cfg;
  std::snprintf(cfg.device_dir, sizeof(cfg.device_dir), "%s", dir);
  std::snprintf(cfg.prefixes, sizeof(cfg.prefixes), "%s", prefixes);
  return cfg;
}

struct PermissionAnswer {
  int calls = 0;
  uint32_t request_id = 0U;
  bool granted = false;

  static void OnResult(uint32_t id, bool granted, void* ctx) {
    auto* self = static_cast<PermissionAnswer*>(ctx);
    ++self->calls;
    self->request_id = id;
    self->granted = granted;
  }
};

}  // namespace

TEST_CASE("device_provider - prefix match picks character devices",
          "[device_provider]") {
  meshlink::TtyDeviceProvider provider(ConfigWith("/dev", "zero,null"));
  auto list = provider.Discover();
  REQUIRE(list.size() == 2U);
  // Sorted by name regardless of prefix order.
  REQUIRE(list[0].name == "null");
  REQUIRE(list[0].path == "/dev/null");
  REQUIRE(list[1].name == "zero");
  REQUIRE(list[0].vendor_id == 0U);
  REQUIRE(list[0].port_count == 1U);
}

TEST_CASE("device_provider - regular files are not devices",
          "[device_provider]") {
  char dir[] = "/tmp/meshlink_devXXXXXX";
  REQUIRE(::mkdtemp(dir) != nullptr);
  std::string file = std::string(dir) + "/ttyACM0";
  FILE* f = std::fopen(file.c_str(), "w");
  REQUIRE(f != nullptr);
  (void)std::fclose(f);

  meshlink::TtyDeviceProvider provider(ConfigWith(dir, "ttyACM"));
  REQUIRE(provider.Discover().empty());

  (void)::unlink(file.c_str());
  (void)::rmdir(dir);
}

TEST_CASE("device_provider - missing directory yields no devices",
          "[device_provider]") {
  meshlink::TtyDeviceProvider provider(
      ConfigWith("/nonexistent/meshlink", "ttyACM"));
  REQUIRE(provider.Discover().empty());
}

TEST_CASE("device_provider - explicit device is the only candidate",
          "[device_provider]") {
  meshlink::TtyProviderConfig cfg = ConfigWith("/dev", "null");
  std::snprintf(cfg.explicit_device, sizeof(cfg.explicit_device),
                "/dev/ttyRADIO9");
  meshlink::TtyDeviceProvider provider(cfg);
  auto list = provider.Discover();
  REQUIRE(list.size() == 1U);
  REQUIRE(list[0].path == "/dev/ttyRADIO9");
  REQUIRE(list[0].name == "ttyRADIO9");
}

TEST_CASE("device_provider - permission follows access rights",
          "[device_provider]") {
  meshlink::TtyDeviceProvider provider;
  meshlink::DeviceInfo dev;
  dev.path = "/dev/null";
  REQUIRE(provider.HasPermission(dev));

  meshlink::DeviceInfo missing;
  missing.path = "/dev/meshlink_absent";
  REQUIRE(!provider.HasPermission(missing));

  PermissionAnswer answer;
  provider.RequestPermission(missing, 42U, &PermissionAnswer::OnResult,
                             &answer);
  REQUIRE(answer.calls == 1);
  REQUIRE(answer.request_id == 42U);
  REQUIRE(!answer.granted);

  provider.RequestPermission(dev, 43U, &PermissionAnswer::OnResult, &answer);
  REQUIRE(answer.calls == 2);
  REQUIRE(answer.granted);
}

TEST_CASE("device_provider - creates a closed serial channel",
          "[device_provider]") {
  meshlink::TtyDeviceProvider provider;
  meshlink::DeviceInfo dev;
  dev.path = "/dev/ttyACM0";
  auto ch = provider.CreateChannel(dev);
  REQUIRE(ch != nullptr);
  REQUIRE(!ch->IsOpen());
}
