#ifndef ADDY_DISPATCH_DISPATCHER_HPP_
#define ADDY_DISPATCH_DISPATCHER_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "addy/catalog/signal.hpp"
#include "addy/channel/notification_channel.hpp"
#include "addy/protocol/notification.hpp"
#include "addy/registry/signal_registry.hpp"

namespace addy {
namespace dispatch {

/**
 * DispatcherOptions - Behaviour knobs of the dispatcher thread
 */
struct DispatcherOptions {
  std::string thread_name = "addy-dispatch";  // Truncated to 15 characters
  bool restore_defaults_on_exit = true;
  bool log_callback_failures = true;
};

/**
 * DispatcherStats - Counters since Start()
 */
struct DispatcherStats {
  uint64_t notifications_received;
  uint64_t notifications_dispatched;  // Signal was captured, callbacks ran
  uint64_t notifications_discarded;   // Signal was ignored/default by then
  uint64_t callbacks_invoked;
  uint64_t callback_failures;
};

/**
 * Dispatcher - The single thread that runs user callbacks
 *
 * Responsibilities:
 * - Drain the notification channel
 * - Snapshot the registry entry of each notified signal
 * - Run its callbacks in registration order, one at a time
 * - Isolate callbacks that throw
 * - Restore OS defaults when the channel closes
 *
 * No registry lock is held while a callback runs, so callbacks may use any
 * SignalHandle operation, including removing themselves.
 */
class Dispatcher {
 public:
  Dispatcher(registry::SignalRegistry& registry,
             channel::NotificationChannel& channel,
             DispatcherOptions options = DispatcherOptions());

  /**
   * Destructor - stops the thread and waits for it
   * Only when destroyed on the dispatcher thread itself (process exit from a
   * callback) is the thread detached.
   */
  ~Dispatcher();

  // Non-copyable, non-movable
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  /**
   * Start the dispatcher thread
   * @return true if the thread is running, see GetLastError() otherwise
   */
  bool Start();

  /**
   * Close the channel and wait for the thread to exit
   * Called from a callback, it only closes the channel: the thread finishes
   * once the callback returns and is joined by a later Stop() from another
   * thread or by the destructor.
   */
  void Stop();

  bool IsRunning() const;

  DispatcherStats GetStats() const;

  const std::string& GetLastError() const;

 private:
  void Run();
  bool OnDispatcherThread() const;
  void Dispatch(const protocol::Notification& notification);
  void Invoke(const registry::NamedCallback& slot, catalog::Signal signal);
  void ReportFailure(const registry::NamedCallback& slot,
                     catalog::Signal signal, const char* what);

  registry::SignalRegistry& registry_;
  channel::NotificationChannel& channel_;
  DispatcherOptions options_;

  std::thread thread_;
  std::mutex thread_mutex_;  // Guards thread_ against concurrent Start/Stop
  std::atomic<std::thread::id> run_thread_id_{std::thread::id()};
  std::atomic<bool> running_{false};
  std::string last_error_;

  // Statistics
  std::atomic<uint64_t> notifications_received_{0};
  std::atomic<uint64_t> notifications_dispatched_{0};
  std::atomic<uint64_t> notifications_discarded_{0};
  std::atomic<uint64_t> callbacks_invoked_{0};
  std::atomic<uint64_t> callback_failures_{0};
};

}  // namespace dispatch
}  // namespace addy

#endif  // ADDY_DISPATCH_DISPATCHER_HPP_
