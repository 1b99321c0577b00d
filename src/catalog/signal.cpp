#include "addy/catalog/signal.hpp"

#include <signal.h>

#include <ostream>

namespace addy {
namespace catalog {
namespace {

struct SignalInfo {
  int number;
  const char* name;
  const char* description;
};

// Platform specific members are compiled in only where the platform has them
const SignalInfo kCatalog[] = {
    {SIGHUP, "SIGHUP", "Hangup detected on controlling terminal"},
    {SIGINT, "SIGINT", "Interrupt from keyboard"},
    {SIGQUIT, "SIGQUIT", "Quit from keyboard"},
    {SIGILL, "SIGILL", "Illegal instruction"},
    {SIGTRAP, "SIGTRAP", "Trace/breakpoint trap"},
    {SIGABRT, "SIGABRT", "Abort signal from abort(3)"},
    {SIGBUS, "SIGBUS", "Bus error (bad memory access)"},
    {SIGFPE, "SIGFPE", "Floating-point exception"},
    {SIGKILL, "SIGKILL", "Kill signal"},
    {SIGUSR1, "SIGUSR1", "User-defined signal 1"},
    {SIGSEGV, "SIGSEGV", "Invalid memory reference"},
    {SIGUSR2, "SIGUSR2", "User-defined signal 2"},
    {SIGPIPE, "SIGPIPE", "Broken pipe: write to pipe with no readers"},
    {SIGALRM, "SIGALRM", "Timer signal from alarm(2)"},
    {SIGTERM, "SIGTERM", "Termination signal"},
#ifdef SIGSTKFLT
    {SIGSTKFLT, "SIGSTKFLT", "Stack fault on coprocessor"},
#endif
    {SIGCHLD, "SIGCHLD", "Child stopped or terminated"},
    {SIGCONT, "SIGCONT", "Continue if stopped"},
    {SIGSTOP, "SIGSTOP", "Stop process"},
    {SIGTSTP, "SIGTSTP", "Stop typed at terminal"},
    {SIGTTIN, "SIGTTIN", "Terminal input for background process"},
    {SIGTTOU, "SIGTTOU", "Terminal output for background process"},
    {SIGURG, "SIGURG", "Urgent condition on socket"},
    {SIGXCPU, "SIGXCPU", "CPU time limit exceeded"},
    {SIGXFSZ, "SIGXFSZ", "File size limit exceeded"},
    {SIGVTALRM, "SIGVTALRM", "Virtual alarm clock"},
    {SIGPROF, "SIGPROF", "Profiling timer expired"},
    {SIGWINCH, "SIGWINCH", "Window resize signal"},
    {SIGIO, "SIGIO", "I/O now possible"},
#ifdef SIGPWR
    {SIGPWR, "SIGPWR", "Power failure"},
#endif
    {SIGSYS, "SIGSYS", "Bad system call"},
#ifdef SIGEMT
    {SIGEMT, "SIGEMT", "Emulator trap"},
#endif
#if defined(SIGINFO) && (!defined(SIGPWR) || SIGINFO != SIGPWR)
    {SIGINFO, "SIGINFO", "Status request from keyboard"},
#endif
};

const SignalInfo* Find(int number) {
  for (const auto& info : kCatalog) {
    if (info.number == number) {
      return &info;
    }
  }
  return nullptr;
}

}  // namespace

const char* Signal::Name() const {
  const SignalInfo* info = Find(number_);
  return info ? info->name : "UNKNOWN";
}

const char* Signal::Description() const {
  const SignalInfo* info = Find(number_);
  return info ? info->description : "";
}

bool Signal::IsAvailable() const {
  return number_ > 0 && number_ < NSIG && Find(number_) != nullptr;
}

const std::vector<Signal>& Signal::All() {
  static const std::vector<Signal> all = [] {
    std::vector<Signal> signals;
    signals.reserve(sizeof(kCatalog) / sizeof(kCatalog[0]));
    for (const auto& info : kCatalog) {
      signals.emplace_back(info.number);
    }
    return signals;
  }();
  return all;
}

std::ostream& operator<<(std::ostream& os, Signal signal) {
  if (signal.IsAvailable()) {
    return os << signal.Name();
  }
  return os << "signal " << signal.Number();
}

}  // namespace catalog
}  // namespace addy
