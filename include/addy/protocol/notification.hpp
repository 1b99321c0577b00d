#ifndef ADDY_PROTOCOL_NOTIFICATION_HPP_
#define ADDY_PROTOCOL_NOTIFICATION_HPP_

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace addy {
namespace protocol {

/**
 * Notification - Payload passed from the signal handler to the dispatcher
 *
 * Written inside the signal handler, so it must stay trivially copyable
 * and carry no heap data.
 *
 * Layout:
 * - 4 bytes: signal_number (OS signal number that fired)
 * - Total: 4 bytes
 */
struct Notification {
  int32_t signal_number;  // OS signal number, 0 is never delivered

  // Constants
  static constexpr std::size_t kSize = 4;
  static constexpr int32_t kInvalidSignal = 0;

  // Validation
  bool IsValid() const {
    return signal_number != kInvalidSignal;
  }
};

static_assert(sizeof(Notification) == Notification::kSize,
              "Notification must stay fixed size");
static_assert(std::is_trivially_copyable<Notification>::value,
              "Notification is copied inside signal handlers");

/**
 * Disposition of a signal as seen by the registry
 */
enum class Mode : uint8_t {
  kDefault = 0,   // OS default action, callbacks retained but not run
  kIgnored = 1,   // OS ignores the signal, callbacks retained but not run
  kCaptured = 2,  // Handler installed, callbacks run on the dispatcher
};

/**
 * Get the name of a mode
 */
inline const char* ModeToString(Mode mode) {
  switch (mode) {
    case Mode::kDefault:
      return "Default";
    case Mode::kIgnored:
      return "Ignored";
    case Mode::kCaptured:
      return "Captured";
  }
  return "Unknown";
}

}  // namespace protocol
}  // namespace addy

#endif  // ADDY_PROTOCOL_NOTIFICATION_HPP_
