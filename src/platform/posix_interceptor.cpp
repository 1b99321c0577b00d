#include "addy/platform/posix_interceptor.hpp"

#include <cerrno>
#include <cstring>
#include <signal.h>

#include <atomic>
#include <iostream>

namespace addy {
namespace platform {
namespace {

std::atomic<channel::NotificationChannel*> g_channel{nullptr};

static_assert(std::atomic<channel::NotificationChannel*>::is_always_lock_free,
              "g_channel is loaded inside the signal handler");

// Runs in signal context
void HandleSignal(int signum) {
  const int saved_errno = errno;

  channel::NotificationChannel* channel =
      g_channel.load(std::memory_order_acquire);
  if (channel != nullptr) {
    protocol::Notification notification;
    notification.signal_number = signum;
    // A full or closed channel counts the drop itself
    (void)channel->TryPush(notification);
  }

  errno = saved_errno;
}

core::Error SetDisposition(catalog::Signal signal, void (*handler)(int)) {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = handler;
  action.sa_flags = SA_RESTART;
  // No nesting of our own handler inside itself
  sigfillset(&action.sa_mask);

  if (::sigaction(signal.Number(), &action, nullptr) != 0) {
    std::cerr << "Failed to change disposition of " << signal << ": "
              << strerror(errno) << std::endl;
    return core::Error::kHandlerInstallFailed;
  }
  return core::Error::kSuccess;
}

}  // namespace

void PosixInterceptor::Attach(channel::NotificationChannel* channel) {
  g_channel.store(channel, std::memory_order_release);
}

void PosixInterceptor::Detach() {
  g_channel.store(nullptr, std::memory_order_release);
}

channel::NotificationChannel* PosixInterceptor::AttachedChannel() {
  return g_channel.load(std::memory_order_acquire);
}

core::Error PosixInterceptor::Install(catalog::Signal signal) {
  return SetDisposition(signal, &HandleSignal);
}

core::Error PosixInterceptor::UninstallToDefault(catalog::Signal signal) {
  return SetDisposition(signal, SIG_DFL);
}

core::Error PosixInterceptor::UninstallToIgnore(catalog::Signal signal) {
  return SetDisposition(signal, SIG_IGN);
}

}  // namespace platform
}  // namespace addy
