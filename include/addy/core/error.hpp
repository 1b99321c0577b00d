#ifndef ADDY_CORE_ERROR_HPP_
#define ADDY_CORE_ERROR_HPP_

namespace addy {
namespace core {

/**
 * Result of a signal handle operation
 */
enum class Error {
  kSuccess = 0,
  kHandlerInstallFailed = 1,  // sigaction refused to (un)install the hook
  kChannelClosed = 2,         // Engine permanently shut down
  kUnsupportedSignal = 3      // Signal not available on this platform
};

/**
 * Get a human readable description of an error
 * @param error Error value
 * @return Static string, never null
 */
const char* ErrorToString(Error error);

}  // namespace core
}  // namespace addy

#endif  // ADDY_CORE_ERROR_HPP_
