#ifndef ADDY_HAL_ISIGNAL_INTERCEPTOR_HPP_
#define ADDY_HAL_ISIGNAL_INTERCEPTOR_HPP_

#include "addy/catalog/signal.hpp"
#include "addy/core/error.hpp"

namespace addy {
namespace hal {

/**
 * ISignalInterceptor - Changes the OS disposition of a signal
 *
 * The registry drives this interface while holding the lock of the
 * signal's entry, so implementations see at most one call per signal at a
 * time. Implementations:
 * - platform::PosixInterceptor (sigaction)
 * - test doubles that only record the calls
 */
class ISignalInterceptor {
 public:
  virtual ~ISignalInterceptor() = default;

  /**
   * Install the capturing hook for a signal
   * Installing again replaces the previous hook.
   * @return kSuccess or kHandlerInstallFailed
   */
  virtual core::Error Install(catalog::Signal signal) = 0;

  /**
   * Restore the OS default action
   * @return kSuccess or kHandlerInstallFailed
   */
  virtual core::Error UninstallToDefault(catalog::Signal signal) = 0;

  /**
   * Make the OS ignore the signal
   * @return kSuccess or kHandlerInstallFailed
   */
  virtual core::Error UninstallToIgnore(catalog::Signal signal) = 0;
};

}  // namespace hal
}  // namespace addy

#endif  // ADDY_HAL_ISIGNAL_INTERCEPTOR_HPP_
