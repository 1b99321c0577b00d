#ifndef ADDY_PLATFORM_LINUX_EVENTFD_HPP_
#define ADDY_PLATFORM_LINUX_EVENTFD_HPP_

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <string>

#include "addy/hal/isignal_mechanism.hpp"

namespace addy {
namespace platform {

/**
 * LinuxEventFdSignal - Linux eventfd-based wakeup mechanism
 *
 * Uses Linux eventfd for waking the dispatcher from a signal handler.
 * Features:
 * - write(2) on an eventfd is async-signal-safe
 * - Counter semantics, a Notify() before Wait() is never lost
 * - Non-blocking descriptor, Wait() blocks in poll(2)
 */
class LinuxEventFdSignal : public hal::ISignalMechanism {
 public:
  LinuxEventFdSignal() : fd_(-1), valid_(false) {}

  ~LinuxEventFdSignal() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  LinuxEventFdSignal(const LinuxEventFdSignal&) = delete;
  LinuxEventFdSignal& operator=(const LinuxEventFdSignal&) = delete;

  bool Notify() noexcept override {
    if (!valid_) {
      return false;
    }

    uint64_t value = 1;
    ssize_t written = ::write(fd_, &value, sizeof(value));
    return written == sizeof(value);
  }

  bool Wait(uint32_t timeout_ms) override {
    if (!valid_) {
      last_error_ = "eventfd is not open";
      return false;
    }

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    const int timeout = timeout_ms == 0 ? -1 : static_cast<int>(timeout_ms);
    int ret;
    do {
      ret = ::poll(&pfd, 1, timeout);
    } while (ret < 0 && errno == EINTR);

    if (ret < 0) {
      last_error_ = "poll failed: " + std::string(strerror(errno));
      return false;
    }
    if (ret == 0) {
      last_error_.clear();
      return false;  // Timeout
    }
    if ((pfd.revents & (POLLERR | POLLNVAL)) != 0) {
      last_error_ = "eventfd reported an error condition";
      return false;
    }

    // Reset the counter, EAGAIN here only means someone else drained it
    uint64_t value;
    ssize_t n;
    do {
      n = ::read(fd_, &value, sizeof(value));
    } while (n < 0 && errno == EINTR);
    return true;
  }

  bool IsValid() const override {
    return valid_ && fd_ >= 0;
  }

  bool Create(uint64_t initial_value = 0,
              int flags = EFD_NONBLOCK | EFD_CLOEXEC) {
    fd_ = ::eventfd(static_cast<unsigned int>(initial_value), flags);
    if (fd_ < 0) {
      last_error_ = strerror(errno);
      return false;
    }

    valid_ = true;
    return true;
  }

  const char* GetLastError() const override {
    return last_error_.c_str();
  }

 private:
  int fd_;
  bool valid_;
  std::string last_error_;
};

}  // namespace platform
}  // namespace addy

#endif  // ADDY_PLATFORM_LINUX_EVENTFD_HPP_
