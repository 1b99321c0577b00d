/**
 * Resize Watcher Example
 *
 * Prints the terminal size every time the window is resized. Ctrl+C stops
 * the watcher; `kill -USR1 <pid>` pauses and resumes the resize reports.
 */

#include <sys/ioctl.h>
#include <unistd.h>

#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>

#include "addy/addy.hpp"

namespace {

std::mutex g_mutex;
std::condition_variable g_cv;
bool g_quit = false;
bool g_paused = false;

void PrintSize() {
  winsize size{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &size) != 0) {
    std::cout << "Window resized (size unavailable)" << std::endl;
    return;
  }
  std::cout << "Window resized: " << size.ws_col << "x" << size.ws_row
            << std::endl;
}

void TogglePause(addy::Signal) {
  bool paused;
  {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_paused = !g_paused;
    paused = g_paused;
  }

  // Callbacks run on the dispatcher thread, so they may reconfigure signals
  auto result = paused ? addy::Mediate(SIGWINCH).Ignore()
                       : addy::Mediate(SIGWINCH).Resume();
  if (!result) {
    std::cerr << "Failed to toggle SIGWINCH: " << result.ErrorMessage()
              << std::endl;
    return;
  }
  std::cout << (paused ? "Paused" : "Resumed") << std::endl;
}

}  // namespace

int main() {
  std::cout << "=== Addy Resize Watcher ===" << std::endl;
  std::cout << "PID: " << getpid() << std::endl;

  auto winch = addy::Mediate(SIGWINCH)
                   .Register("print", [](addy::Signal) { PrintSize(); })
                   .Enable();
  if (!winch) {
    std::cerr << "Failed to watch SIGWINCH: " << winch.ErrorMessage()
              << std::endl;
    return 1;
  }

  auto pause = addy::Mediate(SIGUSR1).Register("toggle", TogglePause).Enable();
  if (!pause) {
    std::cerr << "Failed to watch SIGUSR1: " << pause.ErrorMessage()
              << std::endl;
    return 1;
  }

  auto quit = addy::Mediate(SIGINT)
                  .Register("quit",
                            [](addy::Signal signal) {
                              std::cout << "\nReceived " << signal << std::endl;
                              std::lock_guard<std::mutex> lock(g_mutex);
                              g_quit = true;
                              g_cv.notify_all();
                            })
                  .Enable();
  if (!quit) {
    std::cerr << "Failed to watch SIGINT: " << quit.ErrorMessage()
              << std::endl;
    return 1;
  }

  PrintSize();
  std::cout << "Resize the window, Ctrl+C to exit" << std::endl;

  {
    std::unique_lock<std::mutex> lock(g_mutex);
    g_cv.wait(lock, [] { return g_quit; });
  }

  addy::EngineStats stats = addy::GetStats();
  addy::Shutdown();

  std::cout << "Notifications dispatched: " << stats.notifications_dispatched
            << std::endl;
  std::cout << "Notifications dropped: " << stats.notifications_dropped
            << std::endl;
  return 0;
}
