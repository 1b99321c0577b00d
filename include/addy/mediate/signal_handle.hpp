/**
 * Addy Signal Handle
 *
 * Fluent façade over the engine for one signal.
 *
 * Usage:
 *   auto result = addy::Mediate(SIGWINCH)
 *                     .Register("print", [](addy::Signal) { Redraw(); })
 *                     .Enable();
 *   if (!result) {
 *     std::cerr << result.ErrorMessage() << std::endl;
 *   }
 */

#ifndef ADDY_MEDIATE_SIGNAL_HANDLE_HPP_
#define ADDY_MEDIATE_SIGNAL_HANDLE_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "addy/catalog/signal.hpp"
#include "addy/core/error.hpp"
#include "addy/protocol/notification.hpp"
#include "addy/registry/signal_registry.hpp"

namespace addy {
namespace mediate {

class Engine;
class HandleResult;

/**
 * SignalHandle - Reference to the engine state of one signal
 *
 * Cheap to copy and safe to share between threads; it owns nothing, every
 * operation goes through the engine's registry. Dropping a handle does not
 * stop the signal from being captured, use Release() for that.
 *
 * Each operation fails with kChannelClosed once the engine has shut down,
 * then with kUnsupportedSignal if the signal is not in the platform catalog.
 */
class SignalHandle {
 public:
  SignalHandle(Engine* engine, catalog::Signal signal);

  catalog::Signal GetSignal() const;

  /**
   * Add a named callback, replacing any callback with the same name
   * The replaced callback keeps its place in the invocation order. Does
   * not start capturing by itself.
   */
  HandleResult Register(const std::string& name,
                        registry::Callback callback) const;

  /**
   * Remove a named callback, absent names are not an error
   */
  HandleResult Remove(const std::string& name) const;

  /**
   * Remove all callbacks, the signal stays captured if it was
   */
  HandleResult Clear() const;

  /**
   * Capture the signal and run its callbacks (alias of Resume)
   */
  HandleResult Enable() const;

  /**
   * Capture the signal again after Ignore() or Default()
   */
  HandleResult Resume() const;

  /**
   * Let the OS ignore the signal, callbacks are kept
   */
  HandleResult Ignore() const;

  /**
   * Restore the OS default action, callbacks are kept
   */
  HandleResult Default() const;

  /**
   * Clear() followed by Default()
   */
  HandleResult Release() const;

  // Diagnostics
  protocol::Mode GetMode() const;
  std::vector<std::string> CallbackNames() const;

 private:
  core::Error Check() const;
  HandleResult Finish(core::Error error) const;

  Engine* engine_;
  catalog::Signal signal_;
};

/**
 * HandleResult - Outcome of a SignalHandle operation
 *
 * Carries the handle so calls can be chained. Once an operation has failed,
 * chained operations are skipped and the first error is kept.
 */
class HandleResult {
 public:
  HandleResult(const SignalHandle& handle, core::Error error);

  bool Ok() const;
  explicit operator bool() const;

  core::Error GetError() const;
  const char* ErrorMessage() const;

  const SignalHandle& Handle() const;

  HandleResult Register(const std::string& name,
                        registry::Callback callback) const;
  HandleResult Remove(const std::string& name) const;
  HandleResult Clear() const;
  HandleResult Enable() const;
  HandleResult Resume() const;
  HandleResult Ignore() const;
  HandleResult Default() const;
  HandleResult Release() const;

 private:
  SignalHandle handle_;
  core::Error error_;
};

}  // namespace mediate
}  // namespace addy

#endif  // ADDY_MEDIATE_SIGNAL_HANDLE_HPP_
