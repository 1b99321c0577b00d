#ifndef ADDY_MEDIATE_ENGINE_TYPES_HPP_
#define ADDY_MEDIATE_ENGINE_TYPES_HPP_

#include <cstdint>
#include <string>

namespace addy {
namespace mediate {

/**
 * EngineConfig - Configuration applied when the engine first starts
 */
struct EngineConfig {
  std::string dispatcher_name;    // Thread name, at most 15 characters used
  bool restore_defaults_on_exit;  // SIG_DFL for hooked signals on shutdown
  bool log_callback_failures;     // Report throwing callbacks on stderr
};

/**
 * EngineStats - Process-wide delivery counters
 */
struct EngineStats {
  uint64_t notifications_received;
  uint64_t notifications_dispatched;
  uint64_t notifications_discarded;
  uint64_t notifications_dropped;  // Coalesced in signal context
  uint64_t callbacks_invoked;
  uint64_t callback_failures;
};

}  // namespace mediate
}  // namespace addy

#endif  // ADDY_MEDIATE_ENGINE_TYPES_HPP_
