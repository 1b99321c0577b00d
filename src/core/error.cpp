#include "addy/core/error.hpp"

namespace addy {
namespace core {

const char* ErrorToString(Error error) {
  switch (error) {
    case Error::kSuccess:
      return "Success";
    case Error::kHandlerInstallFailed:
      return "Failed to change the signal disposition";
    case Error::kChannelClosed:
      return "Notification channel is closed, the dispatcher has stopped";
    case Error::kUnsupportedSignal:
      return "Signal is not supported on this platform";
    default:
      return "Unknown error";
  }
}

}  // namespace core
}  // namespace addy
