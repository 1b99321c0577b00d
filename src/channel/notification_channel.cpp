/**
 * Addy Notification Channel Implementation
 */

#include "addy/channel/notification_channel.hpp"

namespace addy {
namespace channel {

bool NotificationChannel::Open() {
  if (wakeup_.IsValid()) {
    return true;
  }
  if (!wakeup_.Create()) {
    last_error_ = "eventfd failed: " + std::string(wakeup_.GetLastError());
    return false;
  }
  return true;
}

bool NotificationChannel::TryPush(
    const protocol::Notification& notification) noexcept {
  if (closed_.load(std::memory_order_acquire)) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  if (!queue_.TryPush(notification)) {
    // Full: coalesce with what is already queued
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  // Ring after publishing so the consumer cannot miss the element
  wakeup_.Notify();
  return true;
}

std::optional<protocol::Notification> NotificationChannel::Receive() {
  while (true) {
    if (closed_.load(std::memory_order_acquire)) {
      return std::nullopt;
    }

    protocol::Notification notification;
    if (queue_.TryPop(notification)) {
      return notification;
    }

    // Queue looked empty: sleep until a producer or Close() rings
    if (!wakeup_.Wait(0)) {
      last_error_ = "Wait failed: " + std::string(wakeup_.GetLastError());
      Close();
      return std::nullopt;
    }
  }
}

std::optional<protocol::Notification> NotificationChannel::TryReceive() {
  if (closed_.load(std::memory_order_acquire)) {
    return std::nullopt;
  }

  protocol::Notification notification;
  if (queue_.TryPop(notification)) {
    return notification;
  }
  return std::nullopt;
}

void NotificationChannel::Close() {
  if (closed_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  wakeup_.Notify();
}

bool NotificationChannel::IsClosed() const {
  return closed_.load(std::memory_order_acquire);
}

std::size_t NotificationChannel::Pending() const {
  return queue_.Size();
}

uint64_t NotificationChannel::DroppedCount() const {
  return dropped_.load(std::memory_order_relaxed);
}

const std::string& NotificationChannel::GetLastError() const {
  return last_error_;
}

}  // namespace channel
}  // namespace addy
