/**
 * @file device_provider.hpp
 * @brief Radio device discovery, access permission and channel creation.
 *
 * DeviceProvider is the host-specific seam in front of the connection
 * manager: it lists candidate devices, answers whether the process may use
 * one, asks the host for access (answer delivered asynchronously), and
 * creates the ByteChannel driver for a device.
 *
 * TtyDeviceProvider scans a device directory (default /dev) for character
 * devices whose names start with one of the configured prefixes
 * (ttyACM, ttyUSB), reads USB vendor/product ids from sysfs when present,
 * and decides permission with access(R_OK | W_OK).
 */

#ifndef MESHLINK_DEVICE_PROVIDER_HPP_
#define MESHLINK_DEVICE_PROVIDER_HPP_

#include "meshlink/log.hpp"
#include "meshlink/platform.hpp"
#include "meshlink/serial_channel.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <memory>

#if defined(MESHLINK_PLATFORM_POSIX)
#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace meshlink {

// ============================================================================
// DeviceInfo
// ============================================================================

#ifndef MESHLINK_MAX_DEVICES
#define MESHLINK_MAX_DEVICES 8U
#endif

struct DeviceInfo {
  FixedString<63> path;      ///< e.g. "/dev/ttyACM0"
  FixedString<31> name;      ///< e.g. "ttyACM0"
  uint16_t vendor_id = 0U;   ///< USB VID, 0 if unknown
  uint16_t product_id = 0U;  ///< USB PID, 0 if unknown
  uint8_t port_count = 1U;   ///< Serial ports exposed by the device
};

using DeviceList = FixedVector<DeviceInfo, MESHLINK_MAX_DEVICES>;

/// @brief Permission answer. request_id echoes RequestPermission().
using PermissionResultFn = void (*)(uint32_t request_id, bool granted,
                                    void* ctx);

// ============================================================================
// DeviceProvider
// ============================================================================

class DeviceProvider {
 public:
  virtual ~DeviceProvider() = default;

  /// @brief Candidate devices, most preferred first.
  virtual DeviceList Discover() noexcept = 0;

  virtual bool HasPermission(const DeviceInfo& dev) noexcept = 0;

  /**
   * @brief Ask the host to grant access to @p dev.
   *
   * The answer is reported through @p fn exactly once, either before this
   * call returns or later from any thread.
   */
  virtual void RequestPermission(const DeviceInfo& dev, uint32_t request_id,
                                 PermissionResultFn fn, void* ctx) noexcept = 0;

  /// @brief Driver for @p dev, or nullptr when no driver matches.
  virtual std::unique_ptr<ByteChannel> CreateChannel(
      const DeviceInfo& dev) noexcept = 0;
};

// ============================================================================
// TtyDeviceProvider
// ============================================================================

struct TtyProviderConfig {
  char device_dir[64] = "/dev";
  char prefixes[64] = "ttyACM,ttyUSB";  ///< Comma-separated name prefixes
  char explicit_device[64] = "";        ///< If set, the only candidate
};

class TtyDeviceProvider final : public DeviceProvider {
 public:
  explicit TtyDeviceProvider(const TtyProviderConfig& cfg = {}) noexcept
      : cfg_(cfg) {}

  DeviceList Discover() noexcept override {
    DeviceList list;
#if defined(MESHLINK_PLATFORM_POSIX)
    if (cfg_.explicit_device[0] != '\0') {
      DeviceInfo dev;
      dev.path.assign(TruncateToCapacity, cfg_.explicit_device);
      dev.name.assign(TruncateToCapacity, BaseName(cfg_.explicit_device));
      ReadUsbIds(dev);
      (void)list.push_back(dev);
      return list;
    }

    DIR* dir = ::opendir(cfg_.device_dir);
    if (dir == nullptr) {
      MESHLINK_LOG_WARN("DISCOVERY", "cannot scan %s", cfg_.device_dir);
      return list;
    }
    MESHLINK_SCOPE_EXIT((void)::closedir(dir));

    for (struct dirent* ent = ::readdir(dir); ent != nullptr;
         ent = ::readdir(dir)) {
      if (!MatchesPrefix(ent->d_name)) {
        continue;
      }
      DeviceInfo dev;
      char path[128];
      (void)std::snprintf(path, sizeof(path), "%s/%s", cfg_.device_dir,
                          ent->d_name);
      struct stat st;
      if (::stat(path, &st) != 0 || !S_ISCHR(st.st_mode)) {
        continue;
      }
      dev.path.assign(TruncateToCapacity, path);
      dev.name.assign(TruncateToCapacity, ent->d_name);
      ReadUsbIds(dev);
      if (!list.push_back(dev)) {
        MESHLINK_LOG_WARN("DISCOVERY", "device list full, ignoring %s",
                          ent->d_name);
        break;
      }
    }

    std::sort(list.begin(), list.end(),
              [](const DeviceInfo& a, const DeviceInfo& b) {
                return std::strcmp(a.name.c_str(), b.name.c_str()) < 0;
              });
#endif
    MESHLINK_LOG_DEBUG("DISCOVERY", "%u candidate device(s)", list.size());
    return list;
  }

  bool HasPermission(const DeviceInfo& dev) noexcept override {
#if defined(MESHLINK_PLATFORM_POSIX)
    return ::access(dev.path.c_str(), R_OK | W_OK) == 0;
#else
    (void)dev;
    return false;
#endif
  }

  /// No interactive grant on a tty: the current access rights are the answer.
  void RequestPermission(const DeviceInfo& dev, uint32_t request_id,
                         PermissionResultFn fn, void* ctx) noexcept override {
    const bool granted = HasPermission(dev);
    if (!granted) {
      MESHLINK_LOG_WARN("DISCOVERY", "no read/write access to %s",
                        dev.path.c_str());
    }
    if (fn != nullptr) {
      fn(request_id, granted, ctx);
    }
  }

  std::unique_ptr<ByteChannel> CreateChannel(
      const DeviceInfo& /*dev*/) noexcept override {
    return std::make_unique<SerialChannel>();
  }

 private:
  bool MatchesPrefix(const char* name) const noexcept {
    const char* p = cfg_.prefixes;
    while (*p != '\0') {
      const char* comma = std::strchr(p, ',');
      const size_t len =
          (comma != nullptr) ? static_cast<size_t>(comma - p) : std::strlen(p);
      if (len > 0U && std::strncmp(name, p, len) == 0) {
        return true;
      }
      if (comma == nullptr) {
        break;
      }
      p = comma + 1;
    }
    return false;
  }

  static const char* BaseName(const char* path) noexcept {
    const char* slash = std::strrchr(path, '/');
    return (slash != nullptr) ? slash + 1 : path;
  }

  // /sys/class/tty/<name>/device/../idVendor; absent for non-USB ttys.
  static void ReadUsbIds(DeviceInfo& dev) noexcept {
    char path[160];
    (void)std::snprintf(path, sizeof(path),
                        "/sys/class/tty/%s/device/../idVendor",
                        dev.name.c_str());
    dev.vendor_id = ReadHex16(path);
    (void)std::snprintf(path, sizeof(path),
                        "/sys/class/tty/%s/device/../idProduct",
                        dev.name.c_str());
    dev.product_id = ReadHex16(path);
  }

  static uint16_t ReadHex16(const char* path) noexcept {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return 0U;
    }
    char line[16] = {};
    const bool ok = std::fgets(line, sizeof(line), f) != nullptr;
    (void)std::fclose(f);
    if (!ok) {
      return 0U;
    }
    return static_cast<uint16_t>(std::strtoul(line, nullptr, 16) & 0xFFFFU);
  }

  TtyProviderConfig cfg_;
};

}  // namespace meshlink

#endif  // MESHLINK_DEVICE_PROVIDER_HPP_
