#include "addy/registry/signal_registry.hpp"

#include <algorithm>
#include <utility>

namespace addy {
namespace registry {
namespace {

std::vector<NamedCallback>::iterator FindByName(
    std::vector<NamedCallback>& callbacks, const std::string& name) {
  return std::find_if(
      callbacks.begin(), callbacks.end(),
      [&name](const NamedCallback& slot) { return slot.name == name; });
}

bool InRange(catalog::Signal signal) {
  return signal.Number() > 0 &&
         static_cast<std::size_t>(signal.Number()) < SignalRegistry::kMaxEntries;
}

}  // namespace

SignalRegistry::SignalRegistry(hal::ISignalInterceptor& interceptor)
    : interceptor_(interceptor) {
  for (auto& flag : created_) {
    flag.store(false, std::memory_order_relaxed);
  }
}

void SignalRegistry::UpsertCallback(catalog::Signal signal,
                                    const std::string& name,
                                    Callback callback) {
  if (!InRange(signal)) {
    return;
  }

  // Allocate outside the lock
  auto shared = std::make_shared<const Callback>(std::move(callback));

  RegistryEntry& entry = GetOrCreate(signal);
  std::shared_ptr<const Callback> replaced;  // Destroyed after unlocking
  std::lock_guard<std::mutex> lock(entry.mutex);

  auto it = FindByName(entry.callbacks, name);
  if (it != entry.callbacks.end()) {
    replaced = std::move(it->callback);
    it->callback = std::move(shared);
    return;
  }
  entry.callbacks.push_back(NamedCallback{name, std::move(shared)});
}

bool SignalRegistry::RemoveCallback(catalog::Signal signal,
                                    const std::string& name) {
  if (!InRange(signal)) {
    return false;
  }

  RegistryEntry& entry = GetOrCreate(signal);
  std::shared_ptr<const Callback> removed;  // Destroyed after unlocking
  std::lock_guard<std::mutex> lock(entry.mutex);

  auto it = FindByName(entry.callbacks, name);
  if (it == entry.callbacks.end()) {
    return false;
  }
  removed = std::move(it->callback);
  entry.callbacks.erase(it);
  return true;
}

void SignalRegistry::Clear(catalog::Signal signal) {
  if (!InRange(signal)) {
    return;
  }

  RegistryEntry& entry = GetOrCreate(signal);
  std::vector<NamedCallback> cleared;
  {
    std::lock_guard<std::mutex> lock(entry.mutex);
    cleared.swap(entry.callbacks);
  }
}

core::Error SignalRegistry::SetMode(catalog::Signal signal,
                                    protocol::Mode mode) {
  if (!InRange(signal)) {
    return core::Error::kUnsupportedSignal;
  }

  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  if (closed_.load()) {
    return core::Error::kChannelClosed;
  }

  core::Error result = core::Error::kSuccess;
  switch (mode) {
    case protocol::Mode::kCaptured:
      if (!entry.hooked) {
        result = interceptor_.Install(signal);
      }
      if (result == core::Error::kSuccess) {
        entry.hooked = true;
      }
      break;
    case protocol::Mode::kIgnored:
      result = interceptor_.UninstallToIgnore(signal);
      if (result == core::Error::kSuccess) {
        entry.hooked = false;
      }
      break;
    case protocol::Mode::kDefault:
      result = interceptor_.UninstallToDefault(signal);
      if (result == core::Error::kSuccess) {
        entry.hooked = false;
      }
      break;
  }

  if (result == core::Error::kSuccess) {
    entry.mode = mode;
  }
  return result;
}

core::Error SignalRegistry::Release(catalog::Signal signal) {
  if (!InRange(signal)) {
    return core::Error::kUnsupportedSignal;
  }

  RegistryEntry& entry = GetOrCreate(signal);
  std::vector<NamedCallback> released;
  core::Error result;
  {
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (closed_.load()) {
      return core::Error::kChannelClosed;
    }
    released.swap(entry.callbacks);

    result = interceptor_.UninstallToDefault(signal);
    if (result == core::Error::kSuccess) {
      entry.hooked = false;
      entry.mode = protocol::Mode::kDefault;
    }
  }
  // Callbacks are destroyed here, outside the lock
  return result;
}

Snapshot SignalRegistry::TakeSnapshot(catalog::Signal signal) {
  Snapshot snapshot;
  if (!InRange(signal)) {
    return snapshot;
  }

  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  snapshot.mode = entry.mode;
  if (entry.mode == protocol::Mode::kCaptured) {
    snapshot.callbacks = entry.callbacks;
  }
  return snapshot;
}

std::size_t SignalRegistry::RestoreAllDefaults() {
  std::size_t restored = 0;
  for (std::size_t i = 1; i < kMaxEntries; ++i) {
    if (!created_[i].load(std::memory_order_acquire)) {
      continue;
    }

    RegistryEntry& entry = *entries_[i];
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (RestoreLocked(entry, catalog::Signal(static_cast<int>(i)))) {
      ++restored;
    }
  }
  return restored;
}

std::size_t SignalRegistry::Close(bool restore_defaults) {
  closed_.store(true);

  // Every entry, created or not: one created concurrently must still be
  // serialized against the flag through its lock
  std::size_t restored = 0;
  for (std::size_t i = 1; i < kMaxEntries; ++i) {
    const catalog::Signal signal(static_cast<int>(i));
    RegistryEntry& entry = GetOrCreate(signal);
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (restore_defaults && RestoreLocked(entry, signal)) {
      ++restored;
    }
  }
  return restored;
}

bool SignalRegistry::IsClosed() const {
  return closed_.load();
}

protocol::Mode SignalRegistry::GetMode(catalog::Signal signal) {
  if (!InRange(signal)) {
    return protocol::Mode::kDefault;
  }
  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  return entry.mode;
}

bool SignalRegistry::IsHooked(catalog::Signal signal) {
  if (!InRange(signal)) {
    return false;
  }
  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  return entry.hooked;
}

std::size_t SignalRegistry::CallbackCount(catalog::Signal signal) {
  if (!InRange(signal)) {
    return 0;
  }
  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  return entry.callbacks.size();
}

std::vector<std::string> SignalRegistry::CallbackNames(catalog::Signal signal) {
  std::vector<std::string> names;
  if (!InRange(signal)) {
    return names;
  }
  RegistryEntry& entry = GetOrCreate(signal);
  std::lock_guard<std::mutex> lock(entry.mutex);
  names.reserve(entry.callbacks.size());
  for (const auto& slot : entry.callbacks) {
    names.push_back(slot.name);
  }
  return names;
}

RegistryEntry& SignalRegistry::GetOrCreate(catalog::Signal signal) {
  const std::size_t index = Index(signal);
  std::call_once(created_once_[index], [this, index] {
    entries_[index] = std::make_unique<RegistryEntry>();
    created_[index].store(true, std::memory_order_release);
  });
  return *entries_[index];
}

std::size_t SignalRegistry::Index(catalog::Signal signal) {
  return static_cast<std::size_t>(signal.Number());
}

bool SignalRegistry::RestoreLocked(RegistryEntry& entry,
                                   catalog::Signal signal) {
  if (!entry.hooked) {
    return false;
  }
  if (interceptor_.UninstallToDefault(signal) != core::Error::kSuccess) {
    return false;
  }
  entry.hooked = false;
  entry.mode = protocol::Mode::kDefault;
  return true;
}

}  // namespace registry
}  // namespace addy
