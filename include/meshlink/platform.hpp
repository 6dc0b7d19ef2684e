/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and monotonic
 *        clock helpers.
 */

#ifndef MESHLINK_PLATFORM_HPP_
#define MESHLINK_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace meshlink {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MESHLINK_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MESHLINK_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MESHLINK_PLATFORM_WINDOWS 1
#endif

#if defined(MESHLINK_PLATFORM_LINUX) || defined(MESHLINK_PLATFORM_MACOS)
#define MESHLINK_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define MESHLINK_LIKELY(x) __builtin_expect(!!(x), 1)
#define MESHLINK_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define MESHLINK_UNUSED __attribute__((unused))
#define MESHLINK_PRINTF_FMT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define MESHLINK_LIKELY(x) (x)
#define MESHLINK_UNLIKELY(x) (x)
#define MESHLINK_UNUSED
#define MESHLINK_PRINTF_FMT(fmt_idx, arg_idx)
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "MESHLINK_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MESHLINK_ASSERT(cond) ((void)0)
#else
#define MESHLINK_ASSERT(cond) \
  ((cond) ? ((void)0)         \
          : ::meshlink::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define MESHLINK_CONCAT_IMPL(a, b) a##b
#define MESHLINK_CONCAT(a, b) MESHLINK_CONCAT_IMPL(a, b)

// ============================================================================
// Monotonic Clock
// ============================================================================

/// @brief Milliseconds on the steady clock (arbitrary epoch).
inline uint64_t SteadyNowMs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Microseconds on the steady clock (arbitrary epoch).
inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

}  // namespace meshlink

#endif  // MESHLINK_PLATFORM_HPP_
