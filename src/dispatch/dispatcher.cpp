#include "addy/dispatch/dispatcher.hpp"

#include <pthread.h>

#include <exception>
#include <iostream>
#include <system_error>
#include <utility>

namespace addy {
namespace dispatch {

Dispatcher::Dispatcher(registry::SignalRegistry& registry,
                       channel::NotificationChannel& channel,
                       DispatcherOptions options)
    : registry_(registry),
      channel_(channel),
      options_(std::move(options)) {}

Dispatcher::~Dispatcher() {
  if (OnDispatcherThread()) {
    // exit() from inside a callback, there is nobody left to join us
    channel_.Close();
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
      thread_.detach();
    }
    return;
  }
  Stop();
}

bool Dispatcher::Start() {
  if (running_.load()) {
    return true;
  }
  if (channel_.IsClosed()) {
    last_error_ = "Notification channel is closed";
    return false;
  }

  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (thread_.joinable()) {
    last_error_ = "Dispatcher thread was already started";
    return false;
  }

  running_.store(true);
  try {
    thread_ = std::thread(&Dispatcher::Run, this);
  } catch (const std::system_error& e) {
    running_.store(false);
    last_error_ = "Failed to start dispatcher thread: " + std::string(e.what());
    return false;
  }
  return true;
}

void Dispatcher::Stop() {
  channel_.Close();

  // From a callback: Run() ends once the callback returns
  if (OnDispatcherThread()) {
    return;
  }

  std::lock_guard<std::mutex> lock(thread_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool Dispatcher::IsRunning() const {
  return running_.load();
}

DispatcherStats Dispatcher::GetStats() const {
  DispatcherStats stats;
  stats.notifications_received = notifications_received_.load();
  stats.notifications_dispatched = notifications_dispatched_.load();
  stats.notifications_discarded = notifications_discarded_.load();
  stats.callbacks_invoked = callbacks_invoked_.load();
  stats.callback_failures = callback_failures_.load();
  return stats;
}

const std::string& Dispatcher::GetLastError() const {
  return last_error_;
}

void Dispatcher::Run() {
  run_thread_id_.store(std::this_thread::get_id());

  const std::string name = options_.thread_name.substr(0, 15);
  if (!name.empty() && pthread_setname_np(pthread_self(), name.c_str()) != 0) {
    std::cerr << "Failed to name dispatcher thread \"" << name << "\""
              << std::endl;
  }

  while (auto notification = channel_.Receive()) {
    Dispatch(*notification);
  }

  if (!channel_.GetLastError().empty()) {
    std::cerr << "Dispatcher stopped: " << channel_.GetLastError() << std::endl;
  }

  // No disposition change may slip in after this
  registry_.Close(options_.restore_defaults_on_exit);
  running_.store(false);
}

bool Dispatcher::OnDispatcherThread() const {
  return run_thread_id_.load() == std::this_thread::get_id();
}

void Dispatcher::Dispatch(const protocol::Notification& notification) {
  notifications_received_++;

  if (!notification.IsValid()) {
    notifications_discarded_++;
    return;
  }

  const catalog::Signal signal(notification.signal_number);

  // Latest mode wins: a signal ignored after it was queued is dropped here
  registry::Snapshot snapshot = registry_.TakeSnapshot(signal);
  if (snapshot.mode != protocol::Mode::kCaptured) {
    notifications_discarded_++;
    return;
  }

  notifications_dispatched_++;
  for (const auto& slot : snapshot.callbacks) {
    Invoke(slot, signal);
  }
}

void Dispatcher::Invoke(const registry::NamedCallback& slot,
                        catalog::Signal signal) {
  if (!slot.callback || !*slot.callback) {
    return;
  }

  callbacks_invoked_++;
  try {
    (*slot.callback)(signal);
  } catch (const std::exception& e) {
    ReportFailure(slot, signal, e.what());
  } catch (...) {
    ReportFailure(slot, signal, "unknown exception");
  }
}

void Dispatcher::ReportFailure(const registry::NamedCallback& slot,
                               catalog::Signal signal, const char* what) {
  callback_failures_++;
  if (options_.log_callback_failures) {
    std::cerr << "Callback \"" << slot.name << "\" for " << signal
              << " failed: " << what << std::endl;
  }
}

}  // namespace dispatch
}  // namespace addy
