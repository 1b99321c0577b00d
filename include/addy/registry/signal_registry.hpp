#ifndef ADDY_REGISTRY_SIGNAL_REGISTRY_HPP_
#define ADDY_REGISTRY_SIGNAL_REGISTRY_HPP_

#include <signal.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "addy/catalog/signal.hpp"
#include "addy/core/error.hpp"
#include "addy/hal/isignal_interceptor.hpp"
#include "addy/protocol/notification.hpp"

namespace addy {
namespace registry {

/**
 * Callback - User logic run on the dispatcher thread
 */
using Callback = std::function<void(catalog::Signal signal)>;

/**
 * NamedCallback - One slot of a signal's callback list
 */
struct NamedCallback {
  std::string name;
  std::shared_ptr<const Callback> callback;
};

/**
 * RegistryEntry - State of one signal kind
 *
 * Every field is guarded by mutex. Callbacks stay in registration order.
 */
struct RegistryEntry {
  std::mutex mutex;
  protocol::Mode mode = protocol::Mode::kDefault;
  bool hooked = false;  // Capturing handler currently installed
  std::vector<NamedCallback> callbacks;
};

/**
 * Snapshot - Consistent copy of an entry taken for one dispatch
 */
struct Snapshot {
  protocol::Mode mode = protocol::Mode::kDefault;
  std::vector<NamedCallback> callbacks;
};

/**
 * SignalRegistry - Process-wide table of signal entries
 *
 * One lazily created entry per signal number, each with its own lock, so
 * operations on unrelated signals never contend. Disposition changes go
 * through the injected interceptor while the entry lock is held, which keeps
 * the installed hook and the recorded mode in step.
 *
 * The signal handler never touches this class.
 */
class SignalRegistry {
 public:
  static constexpr std::size_t kMaxEntries = NSIG;

  explicit SignalRegistry(hal::ISignalInterceptor& interceptor);
  ~SignalRegistry() = default;

  // Non-copyable, non-movable
  SignalRegistry(const SignalRegistry&) = delete;
  SignalRegistry& operator=(const SignalRegistry&) = delete;
  SignalRegistry(SignalRegistry&&) = delete;
  SignalRegistry& operator=(SignalRegistry&&) = delete;

  /**
   * Add a callback, or replace the one registered under the same name
   * A replaced callback keeps its position in the invocation order.
   */
  void UpsertCallback(catalog::Signal signal, const std::string& name,
                      Callback callback);

  /**
   * Remove a callback by name
   * @return false if no callback had that name
   */
  bool RemoveCallback(catalog::Signal signal, const std::string& name);

  /**
   * Remove every callback, mode is left unchanged
   */
  void Clear(catalog::Signal signal);

  /**
   * Change the disposition of a signal
   *
   * kCaptured installs the hook unless it is already installed, kIgnored and
   * kDefault replace it with SIG_IGN / SIG_DFL. On failure the entry is left
   * untouched.
   * @return kSuccess, kChannelClosed after Close(), or the interceptor's error
   */
  core::Error SetMode(catalog::Signal signal, protocol::Mode mode);

  /**
   * Clear callbacks and restore the default disposition in one step
   * @return kChannelClosed after Close(), nothing is cleared then
   */
  core::Error Release(catalog::Signal signal);

  /**
   * Copy the mode and callback list of a signal under its lock
   */
  Snapshot TakeSnapshot(catalog::Signal signal);

  /**
   * Restore SIG_DFL for every hooked signal and mark it kDefault
   * Callbacks are kept. Used when the dispatcher goes away.
   * @return Number of signals restored
   */
  std::size_t RestoreAllDefaults();

  /**
   * Refuse every later disposition change
   *
   * Each entry is visited under its lock after the flag is set, so a
   * SetMode() racing this call either finishes first (and is restored here
   * when restore_defaults is set) or returns kChannelClosed.
   * @return Number of signals restored
   */
  std::size_t Close(bool restore_defaults);

  bool IsClosed() const;

  // Diagnostics
  protocol::Mode GetMode(catalog::Signal signal);
  bool IsHooked(catalog::Signal signal);
  std::size_t CallbackCount(catalog::Signal signal);
  std::vector<std::string> CallbackNames(catalog::Signal signal);

 private:
  /**
   * Get the entry of a signal, creating it on first access
   * Signal numbers outside [1, kMaxEntries) must be rejected by the caller.
   */
  RegistryEntry& GetOrCreate(catalog::Signal signal);

  static std::size_t Index(catalog::Signal signal);

  // Caller holds entry.mutex
  bool RestoreLocked(RegistryEntry& entry, catalog::Signal signal);

  hal::ISignalInterceptor& interceptor_;

  std::array<std::once_flag, kMaxEntries> created_once_;
  std::array<std::unique_ptr<RegistryEntry>, kMaxEntries> entries_;
  std::array<std::atomic<bool>, kMaxEntries> created_{};
  std::atomic<bool> closed_{false};
};

}  // namespace registry
}  // namespace addy

#endif  // ADDY_REGISTRY_SIGNAL_REGISTRY_HPP_
