/**
 * @file link_config.hpp
 * @brief Typed link settings read from a ConfigStore.
 *
 * Recognised keys (all optional):
 *
 *   [serial]  device_dir, device_prefixes, device, baud_rate
 *   [link]    keepalive_interval_ms, write_timeout_ms
 *   [log]     level   (debug | info | warn | error | fatal | off)
 *
 * Invalid values are reported with a warning and replaced by the default;
 * loading never fails.
 */

#ifndef MESHLINK_LINK_CONFIG_HPP_
#define MESHLINK_LINK_CONFIG_HPP_

#include "meshlink/config.hpp"
#include "meshlink/connection_manager.hpp"
#include "meshlink/device_provider.hpp"
#include "meshlink/log.hpp"
#include "meshlink/serial_channel.hpp"

#include <cstdio>

namespace meshlink {

struct LinkSettings {
  // [serial]
  FixedString<63> device_dir{"/dev"};
  FixedString<63> device_prefixes{"ttyACM,ttyUSB"};
  FixedString<63> device;  ///< Fixed device path; empty = discover
  uint32_t baud_rate = 115200U;
  // [link]
  uint32_t keepalive_interval_ms = 10000U;
  uint32_t write_timeout_ms = 1000U;
  // [log]
  log::Level log_level = log::Level::kInfo;
};

static constexpr uint32_t kMinKeepaliveIntervalMs = 100U;

/// @brief Number of settings that fell back to their default.
inline uint32_t LoadLinkSettings(const ConfigStore& store,
                                 LinkSettings& out) noexcept {
  uint32_t rejected = 0U;
  const LinkSettings defaults;

  out.device_dir.assign(
      TruncateToCapacity,
      store.GetString("serial", "device_dir", defaults.device_dir.c_str()));
  out.device_prefixes.assign(
      TruncateToCapacity, store.GetString("serial", "device_prefixes",
                                          defaults.device_prefixes.c_str()));
  out.device.assign(TruncateToCapacity, store.GetString("serial", "device"));

  out.baud_rate = store.GetUint("serial", "baud_rate", defaults.baud_rate);
  if (!IsSupportedBaudRate(out.baud_rate) ||
      (store.HasKey("serial", "baud_rate") &&
       !store.FindUint("serial", "baud_rate").has_value())) {
    MESHLINK_LOG_WARN("CONFIG", "serial.baud_rate %s unsupported, using %u",
                      store.GetString("serial", "baud_rate"),
                      defaults.baud_rate);
    out.baud_rate = defaults.baud_rate;
    ++rejected;
  }

  out.keepalive_interval_ms = store.GetUint("link", "keepalive_interval_ms",
                                            defaults.keepalive_interval_ms);
  if (out.keepalive_interval_ms < kMinKeepaliveIntervalMs ||
      (store.HasKey("link", "keepalive_interval_ms") &&
       !store.FindUint("link", "keepalive_interval_ms").has_value())) {
    MESHLINK_LOG_WARN("CONFIG", "link.keepalive_interval_ms %s invalid, "
                      "using %u",
                      store.GetString("link", "keepalive_interval_ms"),
                      defaults.keepalive_interval_ms);
    out.keepalive_interval_ms = defaults.keepalive_interval_ms;
    ++rejected;
  }

  out.write_timeout_ms = store.GetUint("link", "write_timeout_ms",
                                       defaults.write_timeout_ms);
  if (out.write_timeout_ms == 0U ||
      (store.HasKey("link", "write_timeout_ms") &&
       !store.FindUint("link", "write_timeout_ms").has_value())) {
    MESHLINK_LOG_WARN("CONFIG", "link.write_timeout_ms %s invalid, using %u",
                      store.GetString("link", "write_timeout_ms"),
                      defaults.write_timeout_ms);
    out.write_timeout_ms = defaults.write_timeout_ms;
    ++rejected;
  }

  out.log_level = defaults.log_level;
  if (store.HasKey("log", "level")) {
    log::Level lvl;
    if (log::ParseLevel(store.GetString("log", "level"), lvl)) {
      out.log_level = lvl;
    } else {
      MESHLINK_LOG_WARN("CONFIG", "log.level '%s' unknown",
                        store.GetString("log", "level"));
      ++rejected;
    }
  }
  return rejected;
}

inline LinkManagerConfig ToManagerConfig(const LinkSettings& s) noexcept {
  LinkManagerConfig cfg;
  cfg.channel.baud_rate = s.baud_rate;
  cfg.channel.write_timeout_ms = s.write_timeout_ms;
  cfg.keepalive_interval_ms = s.keepalive_interval_ms;
  return cfg;
}

inline TtyProviderConfig ToProviderConfig(const LinkSettings& s) noexcept {
  TtyProviderConfig cfg;
  (void)std::snprintf(cfg.device_dir, sizeof(cfg.device_dir), "%s",
                      s.device_dir.c_str());
  (void)std::snprintf(cfg.prefixes, sizeof(cfg.prefixes), "%s",
                      s.device_prefixes.c_str());
  (void)std::snprintf(cfg.explicit_device, sizeof(cfg.explicit_device), "%s",
                      s.device.c_str());
  return cfg;
}

}  // namespace meshlink

#endif  // MESHLINK_LINK_CONFIG_HPP_
