/**
 * @file log.hpp
 * @brief Lightweight printf-style logger with compile-time and runtime level
 *        filtering.
 *
 * Output format (stderr):
 *   [2026-01-01 12:00:00.123] [INFO] [LINK] message (file.hpp:42)
 *
 * - Compile-time floor: MESHLINK_LOG_MIN_LEVEL (0=Debug .. 5=Off). Calls
 *   below the floor compile to nothing.
 * - Runtime level: log::SetLevel() / log::GetLevel(), atomic.
 * - FATAL logs then aborts.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MESHLINK_LOG_HPP_
#define MESHLINK_LOG_HPP_

#include "meshlink/platform.hpp"

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <atomic>
#include <chrono>

#ifndef MESHLINK_LOG_MIN_LEVEL
#ifdef NDEBUG
#define MESHLINK_LOG_MIN_LEVEL 1
#else
#define MESHLINK_LOG_MIN_LEVEL 0
#endif
#endif

#ifndef MESHLINK_LOG_LINE_SIZE
#define MESHLINK_LOG_LINE_SIZE 512U
#endif

namespace meshlink {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<uint8_t>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    default:
      return "OFF";
  }
}

/// Strip directories so that only the file name is printed.
inline const char* BaseName(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/' || *p == '\\') {
      base = p + 1;
    }
  }
  return base;
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void Init() noexcept { detail::InitializedRef().store(true); }

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false);
}

inline bool IsInitialized() noexcept { return detail::InitializedRef().load(); }

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(static_cast<uint8_t>(level),
                              std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LogLevelRef().load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", "error", "fatal",
 *        "off").
 * @return true on success, @p out untouched on failure.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) {
    return false;
  }
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    const char* a = name;
    const char* b = n.name;
    while (*a != '\0' && *b != '\0') {
      const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) {
        break;
      }
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = n.level;
      return true;
    }
  }
  return false;
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < detail::LogLevelRef().load(
                                        std::memory_order_relaxed)) {
    return;
  }

  char msg[MESHLINK_LOG_LINE_SIZE];
  const int n = std::vsnprintf(msg, sizeof(msg), fmt, args);
  if (n < 0) {
    msg[0] = '\0';
  }

  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const int64_t ms = static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          now.time_since_epoch())
          .count() %
      1000);
  struct tm tm_buf;
  (void)::localtime_r(&secs, &tm_buf);
  char ts[32];
  (void)std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

  // Single fprintf call: stdio locks the stream per call.
  (void)std::fprintf(stderr, "[%s.%03d] [%s] [%s] %s (%s:%d)\n", ts,
                     static_cast<int>(ms), detail::LevelTag(level),
                     (category != nullptr) ? category : "-", msg,
                     detail::BaseName(file), line);

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

MESHLINK_PRINTF_FMT(5, 6)
inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace meshlink

// ============================================================================
// Macros
// ============================================================================

#define MESHLINK_LOG_IMPL(lvl, lvl_num, cat, fmt, ...)                      \
  do {                                                                      \
    if (MESHLINK_LOG_MIN_LEVEL <= (lvl_num)) {                              \
      ::meshlink::log::LogWrite(lvl, cat, __FILE__, __LINE__, fmt,          \
                                ##__VA_ARGS__);                             \
    }                                                                       \
  } while (0)

#define MESHLINK_LOG_DEBUG(cat, fmt, ...) \
  MESHLINK_LOG_IMPL(::meshlink::log::Level::kDebug, 0, cat, fmt, ##__VA_ARGS__)
#define MESHLINK_LOG_INFO(cat, fmt, ...) \
  MESHLINK_LOG_IMPL(::meshlink::log::Level::kInfo, 1, cat, fmt, ##__VA_ARGS__)
#define MESHLINK_LOG_WARN(cat, fmt, ...) \
  MESHLINK_LOG_IMPL(::meshlink::log::Level::kWarn, 2, cat, fmt, ##__VA_ARGS__)
#define MESHLINK_LOG_ERROR(cat, fmt, ...) \
  MESHLINK_LOG_IMPL(::meshlink::log::Level::kError, 3, cat, fmt, ##__VA_ARGS__)
#define MESHLINK_LOG_FATAL(cat, fmt, ...) \
  MESHLINK_LOG_IMPL(::meshlink::log::Level::kFatal, 4, cat, fmt, ##__VA_ARGS__)

#endif  // MESHLINK_LOG_HPP_
