#ifndef ADDY_CATALOG_SIGNAL_HPP_
#define ADDY_CATALOG_SIGNAL_HPP_

#include <csignal>
#include <iosfwd>
#include <vector>

namespace addy {
namespace catalog {

/**
 * Signal - One OS interrupt kind
 *
 * Thin value wrapper around the OS signal number. Equality is by number.
 * Whether a signal exists on this platform is answered at runtime by
 * IsAvailable(); any int can be wrapped.
 *
 * Usage:
 *   catalog::Signal winch(SIGWINCH);
 *   std::cout << winch << std::endl;  // "SIGWINCH"
 */
class Signal {
 public:
  constexpr Signal() : number_(0) {}
  constexpr explicit Signal(int number) : number_(number) {}

  /**
   * Get the OS signal number
   */
  constexpr int Number() const { return number_; }

  /**
   * Get the conventional name (e.g. "SIGINT")
   * @return Static string, "UNKNOWN" if not in the catalog
   */
  const char* Name() const;

  /**
   * Get a short description of what raises this signal
   * @return Static string, empty if not in the catalog
   */
  const char* Description() const;

  /**
   * Check if this signal is recognized on the current platform
   */
  bool IsAvailable() const;

  /**
   * Every signal recognized on the current platform, in catalog order
   */
  static const std::vector<Signal>& All();

  friend constexpr bool operator==(Signal lhs, Signal rhs) {
    return lhs.number_ == rhs.number_;
  }
  friend constexpr bool operator!=(Signal lhs, Signal rhs) {
    return lhs.number_ != rhs.number_;
  }
  friend constexpr bool operator<(Signal lhs, Signal rhs) {
    return lhs.number_ < rhs.number_;
  }

 private:
  int number_;
};

std::ostream& operator<<(std::ostream& os, Signal signal);

}  // namespace catalog
}  // namespace addy

#endif  // ADDY_CATALOG_SIGNAL_HPP_
