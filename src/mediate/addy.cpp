#include "addy/addy.hpp"

#include "addy/mediate/engine.hpp"

namespace addy {

SignalHandle Mediate(Signal signal) {
  return SignalHandle(&mediate::Engine::Instance(), signal);
}

SignalHandle Mediate(int signum) {
  return Mediate(Signal(signum));
}

EngineConfig DefaultConfig() {
  return mediate::GetDefaultConfig();
}

bool Configure(const EngineConfig& config) {
  return mediate::Engine::Configure(config);
}

void Shutdown() {
  mediate::Engine::Instance().Shutdown();
}

EngineStats GetStats() {
  return mediate::Engine::Instance().GetStats();
}

}  // namespace addy
