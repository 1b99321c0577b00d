#ifndef ADDY_HAL_ISIGNAL_MECHANISM_HPP_
#define ADDY_HAL_ISIGNAL_MECHANISM_HPP_

#include <cstdint>

namespace addy {
namespace hal {

/**
 * ISignalMechanism - Wakeup primitive between a producer and a waiting thread
 *
 * Not to be confused with POSIX signals: this is the doorbell the
 * notification channel rings after it has queued something. Implementations
 * include Linux eventfd.
 *
 * Design principles:
 * - Notify() is async-signal-safe (no allocation, no locks, errno preserved
 *   by the caller)
 * - Counter semantics: notifications before Wait() are not lost
 * - Single waiter
 */
class ISignalMechanism {
 public:
  virtual ~ISignalMechanism() = default;

  /**
   * Wake the waiting thread
   * Safe to call from a signal handler.
   * @return true if notification succeeded
   */
  virtual bool Notify() noexcept = 0;

  /**
   * Wait for a notification
   * Blocks until notification or timeout, retrying on EINTR
   * @param timeout_ms Maximum time to wait in milliseconds (0 = infinite)
   * @return true if notified, false on timeout or error (see GetLastError)
   */
  virtual bool Wait(uint32_t timeout_ms = 0) = 0;

  /**
   * Check if the mechanism is valid/open
   * @return true if valid
   */
  virtual bool IsValid() const = 0;

  /**
   * Get the last error message
   * @return Error description string, empty after a timeout
   */
  virtual const char* GetLastError() const = 0;
};

}  // namespace hal
}  // namespace addy

#endif  // ADDY_HAL_ISIGNAL_MECHANISM_HPP_
