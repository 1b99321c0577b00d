#ifndef ADDY_MEDIATE_ENGINE_HPP_
#define ADDY_MEDIATE_ENGINE_HPP_

#include "addy/channel/notification_channel.hpp"
#include "addy/dispatch/dispatcher.hpp"
#include "addy/mediate/engine_types.hpp"
#include "addy/platform/posix_interceptor.hpp"
#include "addy/registry/signal_registry.hpp"

namespace addy {
namespace mediate {

/**
 * Engine - Process-wide owner of the signal mediation machinery
 *
 * Created on first use and kept for the life of the process:
 * - NotificationChannel: handler -> dispatcher conduit
 * - PosixInterceptor: sigaction hooks, attached to the channel
 * - SignalRegistry: per-signal modes and callbacks
 * - Dispatcher: the callback thread
 *
 * If the channel or the thread cannot be set up, the engine starts closed
 * and every handle operation reports kChannelClosed.
 */
class Engine {
 public:
  /**
   * Get the engine, creating and starting it on first call
   */
  static Engine& Instance();

  /**
   * Set the configuration used by Instance()
   * @return false if the engine already exists
   */
  static bool Configure(const EngineConfig& config);

  ~Engine();

  // Non-copyable, non-movable
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;
  Engine(Engine&&) = delete;
  Engine& operator=(Engine&&) = delete;

  registry::SignalRegistry& Registry();

  /**
   * Check if the channel has shut down for good
   */
  bool IsClosed() const;

  /**
   * Detach the handler, close the channel and stop the dispatcher
   * Irreversible.
   */
  void Shutdown();

  EngineStats GetStats() const;

  const EngineConfig& GetConfig() const;

 private:
  explicit Engine(const EngineConfig& config);

  EngineConfig config_;
  channel::NotificationChannel channel_;
  platform::PosixInterceptor interceptor_;
  registry::SignalRegistry registry_;
  dispatch::Dispatcher dispatcher_;
};

/**
 * Get the configuration used when none was set
 */
EngineConfig GetDefaultConfig();

}  // namespace mediate
}  // namespace addy

#endif  // ADDY_MEDIATE_ENGINE_HPP_
