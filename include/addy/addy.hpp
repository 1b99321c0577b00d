/**
 * Addy - Signal mediation for ordinary code
 *
 * Register named callbacks for POSIX signals; they run on a background
 * thread instead of inside the signal handler, so they may allocate, lock
 * and print.
 *
 * Usage:
 *   addy::Mediate(SIGWINCH)
 *       .Register("print", [](addy::Signal) { std::cout << "Resized\n"; })
 *       .Enable();
 */

#ifndef ADDY_ADDY_HPP_
#define ADDY_ADDY_HPP_

#include "addy/catalog/signal.hpp"
#include "addy/core/error.hpp"
#include "addy/mediate/engine_types.hpp"
#include "addy/mediate/signal_handle.hpp"
#include "addy/protocol/notification.hpp"
#include "addy/registry/signal_registry.hpp"

namespace addy {

using Signal = catalog::Signal;
using Callback = registry::Callback;
using Error = core::Error;
using Mode = protocol::Mode;
using SignalHandle = mediate::SignalHandle;
using HandleResult = mediate::HandleResult;
using EngineConfig = mediate::EngineConfig;
using EngineStats = mediate::EngineStats;

/**
 * Get a handle for a signal
 * The first call starts the engine and its dispatcher thread.
 */
SignalHandle Mediate(Signal signal);
SignalHandle Mediate(int signum);

/**
 * Get the configuration the engine uses when Configure() was never called
 */
EngineConfig DefaultConfig();

/**
 * Configure the engine before its first use
 * @return false if the engine already started, the config is then ignored
 */
bool Configure(const EngineConfig& config);

/**
 * Stop capturing everything and shut the engine down for good
 * Hooked signals get their default action back; every later handle
 * operation fails with Error::kChannelClosed.
 */
void Shutdown();

/**
 * Delivery counters since the engine started
 */
EngineStats GetStats();

}  // namespace addy

#endif  // ADDY_ADDY_HPP_
