#include "addy/mediate/engine.hpp"

#include <iostream>
#include <mutex>

namespace addy {
namespace mediate {
namespace {

/**
 * Configuration waiting for the engine to start
 * Function-local so Configure() may run from any static initializer.
 */
struct ConfigState {
  std::mutex mutex;
  EngineConfig config = GetDefaultConfig();
  bool engine_created = false;
};

ConfigState& GetConfigState() {
  static ConfigState state;
  return state;
}

EngineConfig TakeConfig() {
  ConfigState& state = GetConfigState();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.engine_created = true;
  return state.config;
}

dispatch::DispatcherOptions ToDispatcherOptions(const EngineConfig& config) {
  dispatch::DispatcherOptions options;
  options.thread_name = config.dispatcher_name;
  options.restore_defaults_on_exit = config.restore_defaults_on_exit;
  options.log_callback_failures = config.log_callback_failures;
  return options;
}

}  // namespace

EngineConfig GetDefaultConfig() {
  EngineConfig config;
  config.dispatcher_name = "addy-dispatch";
  config.restore_defaults_on_exit = true;
  config.log_callback_failures = true;
  return config;
}

Engine& Engine::Instance() {
  static Engine engine(TakeConfig());
  return engine;
}

bool Engine::Configure(const EngineConfig& config) {
  ConfigState& state = GetConfigState();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.engine_created) {
    return false;
  }
  state.config = config;
  return true;
}

Engine::Engine(const EngineConfig& config)
    : config_(config),
      registry_(interceptor_),
      dispatcher_(registry_, channel_, ToDispatcherOptions(config)) {
  if (!channel_.Open()) {
    std::cerr << "Failed to open notification channel: "
              << channel_.GetLastError() << std::endl;
    channel_.Close();
    return;
  }

  interceptor_.Attach(&channel_);

  if (!dispatcher_.Start()) {
    std::cerr << dispatcher_.GetLastError() << std::endl;
    interceptor_.Detach();
    channel_.Close();
  }
}

Engine::~Engine() {
  Shutdown();
}

registry::SignalRegistry& Engine::Registry() {
  return registry_;
}

bool Engine::IsClosed() const {
  return channel_.IsClosed();
}

void Engine::Shutdown() {
  // Signals arriving from now on are dropped by the handler
  if (platform::PosixInterceptor::AttachedChannel() == &channel_) {
    interceptor_.Detach();
  }

  // Joins the thread, which restores the default dispositions on its way out
  dispatcher_.Stop();
}

EngineStats Engine::GetStats() const {
  const dispatch::DispatcherStats dispatched = dispatcher_.GetStats();

  EngineStats stats;
  stats.notifications_received = dispatched.notifications_received;
  stats.notifications_dispatched = dispatched.notifications_dispatched;
  stats.notifications_discarded = dispatched.notifications_discarded;
  stats.notifications_dropped = channel_.DroppedCount();
  stats.callbacks_invoked = dispatched.callbacks_invoked;
  stats.callback_failures = dispatched.callback_failures;
  return stats;
}

const EngineConfig& Engine::GetConfig() const {
  return config_;
}

}  // namespace mediate
}  // namespace addy
