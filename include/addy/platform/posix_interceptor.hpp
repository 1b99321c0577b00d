#ifndef ADDY_PLATFORM_POSIX_INTERCEPTOR_HPP_
#define ADDY_PLATFORM_POSIX_INTERCEPTOR_HPP_

#include "addy/catalog/signal.hpp"
#include "addy/channel/notification_channel.hpp"
#include "addy/core/error.hpp"
#include "addy/hal/isignal_interceptor.hpp"

namespace addy {
namespace platform {

/**
 * PosixInterceptor - sigaction based interception layer
 *
 * Installs one process-wide handler. When a hooked signal arrives, the
 * handler only pushes a Notification into the attached channel:
 * - no allocation, no locks, no registry access, no user code
 * - errno is preserved
 * - a full or missing channel drops the notification
 *
 * The attached channel is process-wide state shared by all instances; the
 * engine owns the single instance used in production.
 */
class PosixInterceptor : public hal::ISignalInterceptor {
 public:
  PosixInterceptor() = default;
  ~PosixInterceptor() override = default;

  PosixInterceptor(const PosixInterceptor&) = delete;
  PosixInterceptor& operator=(const PosixInterceptor&) = delete;

  /**
   * Route handler notifications into a channel
   * @param channel Channel that outlives the attachment
   */
  void Attach(channel::NotificationChannel* channel);

  /**
   * Stop routing notifications, later signals are dropped
   */
  void Detach();

  /**
   * Get the channel the handler currently pushes into
   */
  static channel::NotificationChannel* AttachedChannel();

  core::Error Install(catalog::Signal signal) override;
  core::Error UninstallToDefault(catalog::Signal signal) override;
  core::Error UninstallToIgnore(catalog::Signal signal) override;
};

}  // namespace platform
}  // namespace addy

#endif  // ADDY_PLATFORM_POSIX_INTERCEPTOR_HPP_
