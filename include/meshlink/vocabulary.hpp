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
 * @file vocabulary.hpp
 * @brief Fixed-capacity vocabulary types shared by every meshlink module.
 *
 * - expected<V, E>  : value-or-error return without exceptions
 * - optional<T>     : maybe-value without heap
 * - FixedFunction   : small-buffer type-erased callable (no heap)
 * - FixedString<N>  : stack string with explicit truncation
 * - FixedVector<T,N>: stack vector, push_back reports overflow
 * - NewType<T, Tag> : strong typedef for identifiers
 * - ScopeGuard      : RAII cleanup, MESHLINK_SCOPE_EXIT
 *
 * Error enums for every module live here so that any header can return them.
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MESHLINK_VOCABULARY_HPP_
#define MESHLINK_VOCABULARY_HPP_

#include "meshlink/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <new>
#include <type_traits>
#include <utility>

namespace meshlink {

// ============================================================================
// Error Enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
};

/// Errors surfaced by the link engine (codec, channel, session, manager).
enum class LinkError : uint8_t {
  kPayloadTooLarge,     ///< Payload exceeds the frame limit, nothing sent.
  kEmptyPayload,        ///< Zero-length payload rejected before encoding.
  kMalformedFrame,      ///< Counted by the decoder, never returned to callers.
  kChannelOpenFailure,  ///< No device, driver, port or permission.
  kChannelIoFailure,    ///< Read/write failure on an open channel (fatal).
  kSendRejected,        ///< Send attempted with no live session.
  kSendFailed,          ///< Write did not complete in time (non-fatal).
  kChannelClosed,       ///< Session was closed before or during the send.
  kQueueFull,           ///< Control event could not be queued.
};

/// @brief Human-readable name of a LinkError.
inline const char* LinkErrorName(LinkError e) noexcept {
  switch (e) {
    case LinkError::kPayloadTooLarge:
      return "PayloadTooLarge";
    case LinkError::kEmptyPayload:
      return "EmptyPayload";
    case LinkError::kMalformedFrame:
      return "MalformedFrame";
    case LinkError::kChannelOpenFailure:
      return "ChannelOpenFailure";
    case LinkError::kChannelIoFailure:
      return "ChannelIOFailure";
    case LinkError::kSendRejected:
      return "SendRejected";
    case LinkError::kSendFailed:
      return "SendFailed";
    case LinkError::kChannelClosed:
      return "ChannelClosed";
    case LinkError::kQueueFull:
      return "QueueFull";
    default:
      return "Unknown";
  }
}

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value V or an error E.
 *
 * Constructed only through success() / error() so that the intent is always
 * explicit at the return site.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) noexcept {
    expected r;
    ::new (&r.storage_) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) noexcept {
    expected r;
    ::new (&r.storage_) V(static_cast<V&&>(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.err_ = e;
    r.has_value_ = false;
    return r;
  }

  expected(const expected& other) noexcept
      : err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.Ref());
    }
  }

  expected(expected&& other) noexcept
      : err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.Ref()));
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(other.Ref());
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      Destroy();
      err_ = other.err_;
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.Ref()));
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() noexcept {
    MESHLINK_ASSERT(has_value_);
    return Ref();
  }

  const V& value() const noexcept {
    MESHLINK_ASSERT(has_value_);
    return Ref();
  }

  E get_error() const noexcept {
    MESHLINK_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& fallback) const noexcept {
    return has_value_ ? Ref() : fallback;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  V& Ref() noexcept { return *std::launder(reinterpret_cast<V*>(&storage_)); }
  const V& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const V*>(&storage_));
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ref().~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_;
  E err_;
  bool has_value_;
};

/// @brief expected<void, E>: success carries no value.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept { return expected(true, E{}); }
  static expected error(E e) noexcept { return expected(false, e); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    MESHLINK_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) noexcept : err_(e), has_value_(ok) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& v) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(v);
  }

  optional(T&& v) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(v));
  }

  optional(const optional& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.Ref());
    }
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(static_cast<T&&>(other.Ref()));
    }
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(other.Ref());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (&storage_) T(static_cast<T&&>(other.Ref()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    MESHLINK_ASSERT(has_value_);
    return Ref();
  }

  const T& value() const noexcept {
    MESHLINK_ASSERT(has_value_);
    return Ref();
  }

  T value_or(const T& fallback) const noexcept {
    return has_value_ ? Ref() : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      Ref().~T();
      has_value_ = false;
    }
  }

 private:
  T& Ref() noexcept { return *std::launder(reinterpret_cast<T*>(&storage_)); }
  const T& Ref() const noexcept {
    return *std::launder(reinterpret_cast<const T*>(&storage_));
  }

  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// FixedFunction<Sig, BufferSize>
// ============================================================================

#ifndef MESHLINK_FIXED_FUNCTION_BUFFER
#define MESHLINK_FIXED_FUNCTION_BUFFER (4U * sizeof(void*))
#endif

template <typename Signature, size_t BufferSize = MESHLINK_FIXED_FUNCTION_BUFFER>
class FixedFunction;

/**
 * @brief Move-only type-erased callable stored inline.
 *
 * Callables larger than BufferSize are rejected at compile time.
 */
template <typename Ret, typename... Args, size_t BufferSize>
class FixedFunction<Ret(Args...), BufferSize> final {
 public:
  FixedFunction() noexcept : invoke_(nullptr), manage_(nullptr) {}

  template <typename F,
            typename = typename std::enable_if<!std::is_same<
                typename std::decay<F>::type, FixedFunction>::value>::type>
  FixedFunction(F&& f) noexcept  // NOLINT
      : invoke_(nullptr), manage_(nullptr) {
    using Fn = typename std::decay<F>::type;
    static_assert(sizeof(Fn) <= BufferSize,
                  "callable too large for FixedFunction buffer");
    static_assert(alignof(Fn) <= alignof(std::max_align_t),
                  "callable over-aligned for FixedFunction buffer");
    ::new (static_cast<void*>(buf_)) Fn(static_cast<F&&>(f));
    invoke_ = &Invoke<Fn>;
    manage_ = &Manage<Fn>;
  }

  FixedFunction(FixedFunction&& other) noexcept
      : invoke_(other.invoke_), manage_(other.manage_) {
    if (manage_ != nullptr) {
      manage_(buf_, other.buf_);
      other.invoke_ = nullptr;
      other.manage_ = nullptr;
    }
  }

  FixedFunction& operator=(FixedFunction&& other) noexcept {
    if (this != &other) {
      Reset();
      invoke_ = other.invoke_;
      manage_ = other.manage_;
      if (manage_ != nullptr) {
        manage_(buf_, other.buf_);
        other.invoke_ = nullptr;
        other.manage_ = nullptr;
      }
    }
    return *this;
  }

  FixedFunction(const FixedFunction&) = delete;
  FixedFunction& operator=(const FixedFunction&) = delete;

  ~FixedFunction() { Reset(); }

  Ret operator()(Args... args) const {
    MESHLINK_ASSERT(invoke_ != nullptr);
    return invoke_(const_cast<unsigned char*>(buf_),
                   static_cast<Args&&>(args)...);
  }

  explicit operator bool() const noexcept { return invoke_ != nullptr; }

 private:
  using InvokeFn = Ret (*)(void*, Args&&...);
  // dst != nullptr: move-construct src into dst and destroy src.
  // dst == nullptr: destroy src.
  using ManageFn = void (*)(void* dst, void* src);

  template <typename Fn>
  static Ret Invoke(void* obj, Args&&... args) {
    return (*static_cast<Fn*>(obj))(static_cast<Args&&>(args)...);
  }

  template <typename Fn>
  static void Manage(void* dst, void* src) {
    Fn* s = static_cast<Fn*>(src);
    if (dst != nullptr) {
      ::new (dst) Fn(static_cast<Fn&&>(*s));
    }
    s->~Fn();
  }

  void Reset() noexcept {
    if (manage_ != nullptr) {
      manage_(nullptr, buf_);
    }
    invoke_ = nullptr;
    manage_ = nullptr;
  }

  alignas(std::max_align_t) unsigned char buf_[BufferSize];
  InvokeFn invoke_;
  ManageFn manage_;
};

// ============================================================================
// FixedString<N>
// ============================================================================

struct TruncateToCapacity_t {
  explicit constexpr TruncateToCapacity_t() = default;
};
constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with fixed capacity N (excluding '\0').
 *
 * Construction from a literal is checked at compile time; runtime strings
 * must opt into truncation explicitly via TruncateToCapacity.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept : size_(0U) { buf_[0] = '\0'; }

  template <size_t M>
  FixedString(const char (&str)[M]) noexcept : size_(0U) {  // NOLINT
    static_assert(M - 1U <= Capacity, "literal exceeds FixedString capacity");
    std::memcpy(buf_, str, M - 1U);
    size_ = static_cast<uint32_t>(M - 1U);
    buf_[size_] = '\0';
  }

  FixedString(TruncateToCapacity_t, const char* str) noexcept : size_(0U) {
    assign(TruncateToCapacity, str);
  }

  FixedString(TruncateToCapacity_t, const char* str, uint32_t len) noexcept
      : size_(0U) {
    assign(TruncateToCapacity, str, len);
  }

  void assign(TruncateToCapacity_t, const char* str) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    assign(TruncateToCapacity, str,
           static_cast<uint32_t>(std::strlen(str)));
  }

  void assign(TruncateToCapacity_t, const char* str, uint32_t len) noexcept {
    if (str == nullptr) {
      clear();
      return;
    }
    const uint32_t n = (len < Capacity) ? len : Capacity;
    std::memmove(buf_, str, n);
    size_ = n;
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  const char* data() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0U; }

  void clear() noexcept {
    size_ = 0U;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& other) const noexcept {
    return size_ == other.size() &&
           std::memcmp(buf_, other.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& other) const noexcept {
    return !(*this == other);
  }

  bool operator==(const char* str) const noexcept {
    return (str != nullptr) && std::strcmp(buf_, str) == 0;
  }

  bool operator!=(const char* str) const noexcept { return !(*this == str); }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_;
};

// ============================================================================
// FixedVector<T, N>
// ============================================================================

template <typename T, uint32_t Capacity>
class FixedVector final {
 public:
  using value_type = T;
  using iterator = T*;
  using const_iterator = const T*;

  FixedVector() noexcept : size_(0U) {}

  FixedVector(const FixedVector& other) noexcept : size_(0U) {
    for (uint32_t i = 0U; i < other.size_; ++i) {
      ::new (Slot(i)) T(other[i]);
    }
    size_ = other.size_;
  }

  FixedVector(FixedVector&& other) noexcept : size_(0U) {
    for (uint32_t i = 0U; i < other.size_; ++i) {
      ::new (Slot(i)) T(static_cast<T&&>(other[i]));
    }
    size_ = other.size_;
    other.clear();
  }

  FixedVector& operator=(const FixedVector& other) noexcept {
    if (this != &other) {
      clear();
      for (uint32_t i = 0U; i < other.size_; ++i) {
        ::new (Slot(i)) T(other[i]);
      }
      size_ = other.size_;
    }
    return *this;
  }

  FixedVector& operator=(FixedVector&& other) noexcept {
    if (this != &other) {
      clear();
      for (uint32_t i = 0U; i < other.size_; ++i) {
        ::new (Slot(i)) T(static_cast<T&&>(other[i]));
      }
      size_ = other.size_;
      other.clear();
    }
    return *this;
  }

  ~FixedVector() { clear(); }

  bool push_back(const T& v) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (Slot(size_)) T(v);
    ++size_;
    return true;
  }

  bool push_back(T&& v) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (Slot(size_)) T(static_cast<T&&>(v));
    ++size_;
    return true;
  }

  template <typename... A>
  bool emplace_back(A&&... args) noexcept {
    if (size_ >= Capacity) {
      return false;
    }
    ::new (Slot(size_)) T(static_cast<A&&>(args)...);
    ++size_;
    return true;
  }

  bool pop_back() noexcept {
    if (size_ == 0U) {
      return false;
    }
    --size_;
    (*this)[size_].~T();
    return true;
  }

  /// @brief Remove element at index by moving the last element into its slot.
  bool erase_unordered(uint32_t index) noexcept {
    if (index >= size_) {
      return false;
    }
    const uint32_t last = size_ - 1U;
    if (index != last) {
      (*this)[index] = static_cast<T&&>((*this)[last]);
    }
    return pop_back();
  }

  void clear() noexcept {
    while (size_ > 0U) {
      (void)pop_back();
    }
  }

  T& operator[](uint32_t i) noexcept {
    MESHLINK_ASSERT(i < size_);
    return data()[i];
  }

  const T& operator[](uint32_t i) const noexcept {
    MESHLINK_ASSERT(i < size_);
    return data()[i];
  }

  T* data() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* data() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  iterator begin() noexcept { return data(); }
  iterator end() noexcept { return data() + size_; }
  const_iterator begin() const noexcept { return data(); }
  const_iterator end() const noexcept { return data() + size_; }

  uint32_t size() const noexcept { return size_; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }
  bool empty() const noexcept { return size_ == 0U; }
  bool full() const noexcept { return size_ >= Capacity; }

 private:
  void* Slot(uint32_t i) noexcept { return &storage_[i * sizeof(T)]; }
  const void* Slot(uint32_t i) const noexcept {
    return &storage_[i * sizeof(T)];
  }

  alignas(T) unsigned char storage_[sizeof(T) * Capacity];
  uint32_t size_;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/// @brief Strong typedef: distinct Tag types cannot be mixed.
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_{} {}
  explicit constexpr NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(const NewType& o) const noexcept {
    return value_ == o.value_;
  }
  constexpr bool operator!=(const NewType& o) const noexcept {
    return value_ != o.value_;
  }
  constexpr bool operator<(const NewType& o) const noexcept {
    return value_ < o.value_;
  }

 private:
  T value_;
};

struct SessionIdTag {};
/// Identifies one link session; 0 means "no session".
using SessionId = NewType<uint32_t, SessionIdTag>;

// ============================================================================
// ScopeGuard
// ============================================================================

class ScopeGuard final {
 public:
  explicit ScopeGuard(FixedFunction<void()> cleanup) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(cleanup)),
        active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(static_cast<FixedFunction<void()>&&>(other.cleanup_)),
        active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  FixedFunction<void()> cleanup_;
  bool active_;
};

#define MESHLINK_SCOPE_EXIT(...)                               \
  ::meshlink::ScopeGuard MESHLINK_CONCAT(scope_exit_, __LINE__)( \
      ::meshlink::FixedFunction<void()>([&]() { __VA_ARGS__; }))

}  // namespace meshlink

#endif  // MESHLINK_VOCABULARY_HPP_
