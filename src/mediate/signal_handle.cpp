#include "addy/mediate/signal_handle.hpp"

#include <utility>

#include "addy/mediate/engine.hpp"

namespace addy {
namespace mediate {

SignalHandle::SignalHandle(Engine* engine, catalog::Signal signal)
    : engine_(engine), signal_(signal) {}

catalog::Signal SignalHandle::GetSignal() const {
  return signal_;
}

HandleResult SignalHandle::Register(const std::string& name,
                                    registry::Callback callback) const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    engine_->Registry().UpsertCallback(signal_, name, std::move(callback));
  }
  return Finish(error);
}

HandleResult SignalHandle::Remove(const std::string& name) const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    engine_->Registry().RemoveCallback(signal_, name);
  }
  return Finish(error);
}

HandleResult SignalHandle::Clear() const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    engine_->Registry().Clear(signal_);
  }
  return Finish(error);
}

HandleResult SignalHandle::Enable() const {
  return Resume();
}

HandleResult SignalHandle::Resume() const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    error = engine_->Registry().SetMode(signal_, protocol::Mode::kCaptured);
  }
  return Finish(error);
}

HandleResult SignalHandle::Ignore() const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    error = engine_->Registry().SetMode(signal_, protocol::Mode::kIgnored);
  }
  return Finish(error);
}

HandleResult SignalHandle::Default() const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    error = engine_->Registry().SetMode(signal_, protocol::Mode::kDefault);
  }
  return Finish(error);
}

HandleResult SignalHandle::Release() const {
  core::Error error = Check();
  if (error == core::Error::kSuccess) {
    error = engine_->Registry().Release(signal_);
  }
  return Finish(error);
}

protocol::Mode SignalHandle::GetMode() const {
  if (Check() != core::Error::kSuccess) {
    return protocol::Mode::kDefault;
  }
  return engine_->Registry().GetMode(signal_);
}

std::vector<std::string> SignalHandle::CallbackNames() const {
  if (Check() != core::Error::kSuccess) {
    return {};
  }
  return engine_->Registry().CallbackNames(signal_);
}

core::Error SignalHandle::Check() const {
  if (engine_ == nullptr || engine_->IsClosed()) {
    return core::Error::kChannelClosed;
  }
  if (!signal_.IsAvailable()) {
    return core::Error::kUnsupportedSignal;
  }
  return core::Error::kSuccess;
}

HandleResult SignalHandle::Finish(core::Error error) const {
  return HandleResult(*this, error);
}

// HandleResult

HandleResult::HandleResult(const SignalHandle& handle, core::Error error)
    : handle_(handle), error_(error) {}

bool HandleResult::Ok() const {
  return error_ == core::Error::kSuccess;
}

HandleResult::operator bool() const {
  return Ok();
}

core::Error HandleResult::GetError() const {
  return error_;
}

const char* HandleResult::ErrorMessage() const {
  return core::ErrorToString(error_);
}

const SignalHandle& HandleResult::Handle() const {
  return handle_;
}

HandleResult HandleResult::Register(const std::string& name,
                                    registry::Callback callback) const {
  return Ok() ? handle_.Register(name, std::move(callback)) : *this;
}

HandleResult HandleResult::Remove(const std::string& name) const {
  return Ok() ? handle_.Remove(name) : *this;
}

HandleResult HandleResult::Clear() const {
  return Ok() ? handle_.Clear() : *this;
}

HandleResult HandleResult::Enable() const {
  return Ok() ? handle_.Enable() : *this;
}

HandleResult HandleResult::Resume() const {
  return Ok() ? handle_.Resume() : *this;
}

HandleResult HandleResult::Ignore() const {
  return Ok() ? handle_.Ignore() : *this;
}

HandleResult HandleResult::Default() const {
  return Ok() ? handle_.Default() : *this;
}

HandleResult HandleResult::Release() const {
  return Ok() ? handle_.Release() : *this;
}

}  // namespace mediate
}  // namespace addy
