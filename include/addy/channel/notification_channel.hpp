/**
 * Addy Notification Channel
 *
 * Bounded conduit from signal handlers to the dispatcher thread.
 *
 * Usage:
 *   NotificationChannel channel;
 *   channel.Open();
 *   channel.TryPush({SIGWINCH});          // from a signal handler
 *   auto notification = channel.Receive();  // from the dispatcher
 */

#ifndef ADDY_CHANNEL_NOTIFICATION_CHANNEL_HPP_
#define ADDY_CHANNEL_NOTIFICATION_CHANNEL_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "addy/core/mpsc_ring_buffer.hpp"
#include "addy/platform/linux_eventfd.hpp"
#include "addy/protocol/notification.hpp"

namespace addy {
namespace channel {

/**
 * Multi-producer single-consumer channel of Notification
 *
 * Producers never block: a full or closed channel drops the notification
 * and counts it. The consumer blocks on an eventfd while the queue is empty.
 * Closing is terminal.
 */
class NotificationChannel {
 public:
  static constexpr std::size_t kCapacity = 128;

  NotificationChannel() = default;
  ~NotificationChannel() = default;

  // Non-copyable, non-movable
  NotificationChannel(const NotificationChannel&) = delete;
  NotificationChannel& operator=(const NotificationChannel&) = delete;
  NotificationChannel(NotificationChannel&&) = delete;
  NotificationChannel& operator=(NotificationChannel&&) = delete;

  /**
   * Create the wakeup eventfd
   * @return true if the channel can be used, see GetLastError() otherwise
   */
  bool Open();

  /**
   * Queue a notification and wake the consumer
   * Async-signal-safe. Never blocks.
   * @param notification Notification to queue
   * @return true if queued, false if dropped (full or closed)
   */
  bool TryPush(const protocol::Notification& notification) noexcept;

  /**
   * Receive the next notification, blocking while the queue is empty
   * @return Notification, or nullopt once the channel is closed
   */
  std::optional<protocol::Notification> Receive();

  /**
   * Receive without blocking
   * @return Notification, or nullopt if none is published or closed
   */
  std::optional<protocol::Notification> TryReceive();

  /**
   * Close the channel permanently and wake the consumer
   */
  void Close();

  bool IsClosed() const;

  /**
   * Number of notifications waiting (approximate)
   */
  std::size_t Pending() const;

  /**
   * Number of notifications dropped since creation
   */
  uint64_t DroppedCount() const;

  const std::string& GetLastError() const;

 private:
  static_assert(std::atomic<bool>::is_always_lock_free,
                "closed_ is read inside signal handlers");

  core::MpscRingBuffer<protocol::Notification, kCapacity> queue_;
  platform::LinuxEventFdSignal wakeup_;
  std::atomic<bool> closed_{false};
  std::atomic<uint64_t> dropped_{0};
  std::string last_error_;
};

}  // namespace channel
}  // namespace addy

#endif  // ADDY_CHANNEL_NOTIFICATION_CHANNEL_HPP_
