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
 * @file serial_channel.hpp
 * @brief Byte channel abstraction and POSIX termios serial implementation.
 *
 * A ByteChannel is a full-duplex byte pipe to the radio. Once opened it owns
 * a reader that delivers raw chunks through ChannelRxFn and reports a fatal
 * condition exactly once through ChannelErrorFn. Both callbacks run on the
 * reader thread and must not block; the connection manager only enqueues.
 *
 * SerialChannel:
 * - open(O_RDWR | O_NOCTTY | O_NONBLOCK), raw termios, baud + 8N1
 * - reader thread: poll() on the port and a self-pipe used to wake it on
 *   Close(); POLLHUP / POLLERR / fatal read errors end the reader
 * - Write(): loops until every byte is written; on EAGAIN it polls for
 *   POLLOUT and the same self-pipe until the configured write timeout, so
 *   Interrupt() ends a blocked write with kChannelClosed
 *
 * Header-only, C++17.
 */

#ifndef MESHLINK_SERIAL_CHANNEL_HPP_
#define MESHLINK_SERIAL_CHANNEL_HPP_

#include "meshlink/log.hpp"
#include "meshlink/platform.hpp"
#include "meshlink/vocabulary.hpp"

#include <cstdint>
#include <cstring>

#include <atomic>
#include <mutex>
#include <thread>

#if defined(MESHLINK_PLATFORM_POSIX)
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace meshlink {

// ============================================================================
// Channel Config
// ============================================================================

/// Read chunk size of the reader thread.
static constexpr uint32_t kChannelChunkSize = 256U;

/// @brief Port parameters fixed at open time.
struct ChannelConfig {
  char port_name[64] = "";
  uint32_t baud_rate = 115200U;
  uint8_t data_bits = 8U;
  uint8_t stop_bits = 1U;
  uint8_t parity = 0U;                   // 0=None, 1=Odd, 2=Even
  uint32_t write_timeout_ms = 1000U;
};

static_assert(sizeof(ChannelConfig) < 128U, "ChannelConfig should be compact");

/// @brief Raw chunk delivered by the reader. Pointer valid for the call only.
using ChannelRxFn = void (*)(const uint8_t* data, uint32_t size, void* ctx);

/// @brief Fatal channel condition, reported at most once per Open().
using ChannelErrorFn = void (*)(LinkError error, void* ctx);

// ============================================================================
// ByteChannel
// ============================================================================

class ByteChannel {
 public:
  virtual ~ByteChannel() = default;

  /**
   * @brief Open and configure the channel and start delivering bytes.
   * @return kChannelOpenFailure when the port cannot be opened or configured.
   */
  virtual expected<void, LinkError> Open(const ChannelConfig& cfg,
                                         ChannelRxFn on_rx,
                                         ChannelErrorFn on_error,
                                         void* ctx) noexcept = 0;

  /**
   * @brief Write all bytes or fail.
   * @return kChannelClosed if not open or interrupted, kSendFailed on
   *         timeout, kChannelIoFailure when the port is gone.
   */
  virtual expected<void, LinkError> Write(const uint8_t* data,
                                          uint32_t size) noexcept = 0;

  /**
   * @brief Begin closing: wake a Write() blocked in another thread and make
   *        further writes fail with kChannelClosed. Close() must follow.
   *
   * May be called from any thread, concurrently with Write().
   */
  virtual void Interrupt() noexcept = 0;

  /// @brief Stop the reader and release the port. Idempotent.
  virtual void Close() noexcept = 0;

  virtual bool IsOpen() const noexcept = 0;
};

// ============================================================================
// SerialChannel
// ============================================================================

/// Channel counters.
struct SerialChannelStats {
  uint64_t bytes_read = 0U;
  uint64_t bytes_written = 0U;
  uint64_t write_retries = 0U;
  uint64_t write_timeouts = 0U;
};

class SerialChannel final : public ByteChannel {
 public:
  SerialChannel() noexcept
      : fd_(-1),
        wake_rd_(-1),
        wake_wr_(-1),
        running_(false),
        on_rx_(nullptr),
        on_error_(nullptr),
        cb_ctx_(nullptr),
        stats_{} {}

  ~SerialChannel() override { Close(); }

  SerialChannel(const SerialChannel&) = delete;
  SerialChannel& operator=(const SerialChannel&) = delete;

  expected<void, LinkError> Open(const ChannelConfig& cfg, ChannelRxFn on_rx,
                                 ChannelErrorFn on_error,
                                 void* ctx) noexcept override {
#if defined(MESHLINK_PLATFORM_POSIX)
    if (fd_ >= 0) {
      return expected<void, LinkError>::success();
    }
    cfg_ = cfg;

    const int fd = ::open(cfg_.port_name, O_RDWR | O_NOCTTY | O_NONBLOCK |
                                              O_CLOEXEC);
    if (fd < 0) {
      MESHLINK_LOG_WARN("SERIAL", "open %s failed: %s", cfg_.port_name,
                        std::strerror(errno));
      return expected<void, LinkError>::error(LinkError::kChannelOpenFailure);
    }
    bool keep_fd = false;
    MESHLINK_SCOPE_EXIT(if (!keep_fd) { (void)::close(fd); });

    if (!ConfigurePort(fd)) {
      MESHLINK_LOG_WARN("SERIAL", "configure %s failed: %s", cfg_.port_name,
                        std::strerror(errno));
      return expected<void, LinkError>::error(LinkError::kChannelOpenFailure);
    }

    int pipe_fds[2] = {-1, -1};
    if (::pipe(pipe_fds) != 0) {
      MESHLINK_LOG_ERROR("SERIAL", "wake pipe failed: %s",
                         std::strerror(errno));
      return expected<void, LinkError>::error(LinkError::kChannelOpenFailure);
    }
    for (int p : pipe_fds) {
      (void)::fcntl(p, F_SETFL, ::fcntl(p, F_GETFL, 0) | O_NONBLOCK);
      (void)::fcntl(p, F_SETFD, FD_CLOEXEC);
    }

    keep_fd = true;
    fd_ = fd;
    wake_rd_ = pipe_fds[0];
    wake_wr_ = pipe_fds[1];
    on_rx_ = on_rx;
    on_error_ = on_error;
    cb_ctx_ = ctx;
    running_.store(true, std::memory_order_release);
    reader_ = std::thread([this]() { ReaderLoop(); });

    MESHLINK_LOG_INFO("SERIAL", "opened %s at %u baud", cfg_.port_name,
                      cfg_.baud_rate);
    return expected<void, LinkError>::success();
#else
    (void)cfg;
    (void)on_rx;
    (void)on_error;
    (void)ctx;
    return expected<void, LinkError>::error(LinkError::kChannelOpenFailure);
#endif
  }

  expected<void, LinkError> Write(const uint8_t* data,
                                  uint32_t size) noexcept override {
#if defined(MESHLINK_PLATFORM_POSIX)
    if (fd_ < 0) {
      return expected<void, LinkError>::error(LinkError::kChannelClosed);
    }
    MESHLINK_ASSERT(data != nullptr || size == 0U);

    const uint64_t deadline = SteadyNowMs() + cfg_.write_timeout_ms;
    uint32_t written = 0U;

    while (written < size) {
      if (!running_.load(std::memory_order_acquire)) {
        return expected<void, LinkError>::error(LinkError::kChannelClosed);
      }
      const ssize_t n = ::write(fd_, data + written, size - written);
      if (n < 0) {
        const int err = errno;
        if (err == EINTR) {
          continue;
        }
        if (err == EAGAIN || err == EWOULDBLOCK) {
          const uint64_t now = SteadyNowMs();
          if (now >= deadline) {
            ++stats_.write_timeouts;
            MESHLINK_LOG_WARN("SERIAL", "write timeout after %u ms (%u/%u)",
                              cfg_.write_timeout_ms, written, size);
            return expected<void, LinkError>::error(LinkError::kSendFailed);
          }
          ++stats_.write_retries;
          if (!WaitWritable(deadline - now)) {
            MESHLINK_LOG_DEBUG("SERIAL", "write interrupted (%u/%u)", written,
                               size);
            return expected<void, LinkError>::error(LinkError::kChannelClosed);
          }
          continue;
        }
        MESHLINK_LOG_ERROR("SERIAL", "write failed: %s", std::strerror(err));
        return expected<void, LinkError>::error(LinkError::kChannelIoFailure);
      }
      written += static_cast<uint32_t>(n);
    }

    stats_.bytes_written += size;
    return expected<void, LinkError>::success();
#else
    (void)data;
    (void)size;
    return expected<void, LinkError>::error(LinkError::kChannelClosed);
#endif
  }

  void Interrupt() noexcept override {
#if defined(MESHLINK_PLATFORM_POSIX)
    running_.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(wake_mtx_);
    if (wake_wr_ >= 0) {
      const uint8_t b = 1U;
      (void)::write(wake_wr_, &b, 1U);
    }
#endif
  }

  void Close() noexcept override {
#if defined(MESHLINK_PLATFORM_POSIX)
    Interrupt();
    if (reader_.joinable()) {
      if (reader_.get_id() == std::this_thread::get_id()) {
        // Closed from inside a reader callback: the loop exits on return.
        reader_.detach();
      } else {
        reader_.join();
      }
    }
    {
      std::lock_guard<std::mutex> lock(wake_mtx_);
      CloseFd(wake_rd_);
      CloseFd(wake_wr_);
    }
    if (fd_ >= 0) {
      CloseFd(fd_);
      MESHLINK_LOG_DEBUG("SERIAL", "closed %s", cfg_.port_name);
    }
#endif
  }

  bool IsOpen() const noexcept override { return fd_ >= 0; }

  int GetFd() const noexcept { return fd_; }

  const SerialChannelStats& GetStats() const noexcept { return stats_; }

 private:
#if defined(MESHLINK_PLATFORM_POSIX)
  static void CloseFd(int& fd) noexcept {
    if (fd >= 0) {
      (void)::close(fd);
      fd = -1;
    }
  }

  /// False when woken by Interrupt(); true to retry the write.
  bool WaitWritable(uint64_t timeout_ms) noexcept {
    struct pollfd fds[2];
    fds[0].fd = fd_;
    fds[0].events = POLLOUT;
    fds[0].revents = 0;
    fds[1].fd = wake_rd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    const int wait_ms =
        (timeout_ms > 0x7FFFFFFFULL) ? 0x7FFFFFFF : static_cast<int>(timeout_ms);
    if (::poll(fds, 2, wait_ms) > 0 && fds[1].revents != 0) {
      return false;
    }
    return running_.load(std::memory_order_acquire);
  }

  void ReaderLoop() noexcept {
    uint8_t buf[kChannelChunkSize];
    struct pollfd fds[2];
    fds[0].fd = fd_;
    fds[0].events = POLLIN;
    fds[1].fd = wake_rd_;
    fds[1].events = POLLIN;

    while (running_.load(std::memory_order_acquire)) {
      fds[0].revents = 0;
      fds[1].revents = 0;
      const int r = ::poll(fds, 2, -1);
      if (r < 0) {
        if (errno == EINTR) {
          continue;
        }
        ReportError("poll", errno);
        return;
      }
      if (fds[1].revents != 0 || !running_.load(std::memory_order_acquire)) {
        return;
      }

      if ((fds[0].revents & POLLIN) != 0) {
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
          stats_.bytes_read += static_cast<uint64_t>(n);
          if (on_rx_ != nullptr) {
            on_rx_(buf, static_cast<uint32_t>(n), cb_ctx_);
          }
          continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
            errno != EINTR) {
          ReportError("read", errno);
          return;
        }
      }

      if ((fds[0].revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
        ReportError("hangup", EIO);
        return;
      }
    }
  }

  void ReportError(const char* what, int err) noexcept {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    MESHLINK_LOG_ERROR("SERIAL", "%s on %s: %s", what, cfg_.port_name,
                       std::strerror(err));
    if (on_error_ != nullptr) {
      on_error_(LinkError::kChannelIoFailure, cb_ctx_);
    }
  }

  bool ConfigurePort(int fd) noexcept {
    struct termios tio;
    std::memset(&tio, 0, sizeof(tio));

    if (::tcgetattr(fd, &tio) != 0) {
      return false;
    }

    tio.c_iflag &= static_cast<tcflag_t>(~(IGNBRK | BRKINT | PARMRK | ISTRIP |
                                           INLCR | IGNCR | ICRNL | IXON |
                                           IXOFF | IXANY));
    tio.c_oflag &= static_cast<tcflag_t>(~OPOST);
    tio.c_lflag &= static_cast<tcflag_t>(~(ECHO | ECHONL | ICANON | ISIG |
                                           IEXTEN));
    tio.c_cflag &= static_cast<tcflag_t>(~(CSIZE | PARENB | PARODD | CSTOPB));
    tio.c_cflag |= static_cast<tcflag_t>(CLOCAL | CREAD);

    switch (cfg_.data_bits) {
      case 7U:
        tio.c_cflag |= CS7;
        break;
      default:
        tio.c_cflag |= CS8;
        break;
    }

    if (cfg_.parity == 1U) {
      tio.c_cflag |= static_cast<tcflag_t>(PARENB | PARODD);
    } else if (cfg_.parity == 2U) {
      tio.c_cflag |= PARENB;
    }

    if (cfg_.stop_bits == 2U) {
      tio.c_cflag |= CSTOPB;
    }

    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    const speed_t speed = BaudToSpeed(cfg_.baud_rate);
    (void)::cfsetispeed(&tio, speed);
    (void)::cfsetospeed(&tio, speed);

    if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
      return false;
    }
    (void)::tcflush(fd, TCIOFLUSH);
    return true;
  }

  static speed_t BaudToSpeed(uint32_t baud) noexcept {
    switch (baud) {
      case 9600U:
        return B9600;
      case 19200U:
        return B19200;
      case 38400U:
        return B38400;
      case 57600U:
        return B57600;
      case 230400U:
        return B230400;
#ifdef B460800
      case 460800U:
        return B460800;
#endif
#ifdef B921600
      case 921600U:
        return B921600;
#endif
      default:
        return B115200;
    }
  }
#endif

  ChannelConfig cfg_;
  int fd_;
  int wake_rd_;
  int wake_wr_;
  std::atomic<bool> running_;
  std::thread reader_;
  std::mutex wake_mtx_;  // guards wake_wr_ against Interrupt() vs Close()

  ChannelRxFn on_rx_;
  ChannelErrorFn on_error_;
  void* cb_ctx_;

  SerialChannelStats stats_;
};

/// @brief Baud rates SerialChannel maps to a termios speed.
inline bool IsSupportedBaudRate(uint32_t baud) noexcept {
  switch (baud) {
    case 9600U:
    case 19200U:
    case 38400U:
    case 57600U:
    case 115200U:
    case 230400U:
#ifdef B460800
    case 460800U:
#endif
#ifdef B921600
    case 921600U:
#endif
      return true;
    default:
      return false;
  }
}

}  // namespace meshlink

#endif  // MESHLINK_SERIAL_CHANNEL_HPP_
