/**
 * Addy Stress and Concurrency Tests
 *
 * - Concurrent callback registration and removal on one signal
 * - Snapshots taken while the callback list is being mutated
 * - Signal bursts that overflow the notification channel
 * - Signals raised from several threads at once
 *
 * A notification is either dispatched or counted as dropped, so every
 * burst test checks that the two add up to the number of signals raised.
 */

#include <gtest/gtest.h>

#include <pthread.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "addy/addy.hpp"
#include "addy/registry/signal_registry.hpp"
#include "fake_interceptor.hpp"

namespace addy {
namespace test {

// ============================================================================
// Test Configuration Constants
// ============================================================================

constexpr int kMutatorThreads = 8;
constexpr int kMutationsPerThread = 2000;
constexpr int kBurstSignals = 5000;
constexpr int kRaiserThreads = 4;
constexpr int kRaisesPerThread = 1000;
constexpr auto kDrainTimeout = std::chrono::seconds(20);

using Counter = std::shared_ptr<std::atomic<uint64_t>>;

Counter MakeCounter() {
  return std::make_shared<std::atomic<uint64_t>>(0);
}

// Counters are captured by value, a late callback never touches a dead frame
Callback CountingCallback(Counter counter) {
  return [counter](Signal) { counter->fetch_add(1); };
}

/**
 * Wait until every raised signal has been dispatched or dropped
 */
bool WaitForDrain(const Counter& handled, const EngineStats& before,
                  uint64_t raised) {
  const auto deadline = std::chrono::steady_clock::now() + kDrainTimeout;
  for (;;) {
    const uint64_t dropped =
        GetStats().notifications_dropped - before.notifications_dropped;
    if (handled->load() + dropped >= raised) {
      return true;
    }
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

// ============================================================================
// Registry Stress Tests
// ============================================================================

class RegistryStressTest : public ::testing::Test {
 protected:
  RegistryStressTest() : registry_(interceptor_) {}

  const catalog::Signal signal_{SIGUSR1};
  FakeInterceptor interceptor_;
  registry::SignalRegistry registry_;
};

TEST_F(RegistryStressTest, ConcurrentRegisterAndRemove) {
  std::vector<std::thread> threads;
  for (int t = 0; t < kMutatorThreads; ++t) {
    threads.emplace_back([this, t] {
      const std::string own = "thread-" + std::to_string(t);
      for (int i = 0; i < kMutationsPerThread; ++i) {
        registry_.UpsertCallback(signal_, own + "-temp", [](Signal) {});
        registry_.UpsertCallback(signal_, "shared-" + std::to_string(i % 4),
                                 [](Signal) {});
        registry_.RemoveCallback(signal_, own + "-temp");
      }
      registry_.UpsertCallback(signal_, own + "-keep", [](Signal) {});
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::vector<std::string> names = registry_.CallbackNames(signal_);
  const std::set<std::string> unique(names.begin(), names.end());
  EXPECT_EQ(unique.size(), names.size()) << "Duplicate callback names";

  std::set<std::string> expected = {"shared-0", "shared-1", "shared-2",
                                    "shared-3"};
  for (int t = 0; t < kMutatorThreads; ++t) {
    expected.insert("thread-" + std::to_string(t) + "-keep");
  }
  EXPECT_EQ(unique, expected);
}

TEST_F(RegistryStressTest, SnapshotsStayConsistentWhileMutating) {
  ASSERT_EQ(registry_.SetMode(signal_, Mode::kCaptured), Error::kSuccess);
  registry_.UpsertCallback(signal_, "anchor", [](Signal) {});

  std::atomic<bool> stop{false};
  std::atomic<uint64_t> inconsistent{0};
  std::atomic<uint64_t> snapshots{0};

  std::thread reader([&] {
    while (!stop.load()) {
      registry::Snapshot snapshot = registry_.TakeSnapshot(signal_);
      std::set<std::string> seen;
      bool anchor = false;
      for (const auto& named : snapshot.callbacks) {
        if (!named.callback || !seen.insert(named.name).second) {
          inconsistent.fetch_add(1);
        }
        anchor = anchor || named.name == "anchor";
      }
      if (!anchor) {
        inconsistent.fetch_add(1);
      }
      snapshots.fetch_add(1);
    }
  });

  std::vector<std::thread> writers;
  for (int t = 0; t < kMutatorThreads / 2; ++t) {
    writers.emplace_back([this, t] {
      for (int i = 0; i < kMutationsPerThread; ++i) {
        const std::string name = "w" + std::to_string(t) + "-" +
                                 std::to_string(i % 16);
        registry_.UpsertCallback(signal_, name, [](Signal) {});
        if (i % 3 == 0) {
          registry_.RemoveCallback(signal_, name);
        }
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  stop = true;
  reader.join();

  GTEST_LOG_(INFO) << "Snapshots taken: " << snapshots.load();
  EXPECT_GT(snapshots.load(), 0u);
  EXPECT_EQ(inconsistent.load(), 0u);
}

TEST_F(RegistryStressTest, ConcurrentModeChangesInstallOncePerCapture) {
  std::vector<std::thread> threads;
  for (int t = 0; t < kMutatorThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < 500; ++i) {
        EXPECT_EQ(registry_.SetMode(signal_, Mode::kCaptured),
                  Error::kSuccess);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry_.GetMode(signal_), Mode::kCaptured);
  EXPECT_TRUE(registry_.IsHooked(signal_));
  EXPECT_EQ(interceptor_.CountOf("install"), 1u);
}

TEST(RegistryCloseStressTest, CaptureRacingCloseNeverStaysHooked) {
  constexpr int kRounds = 300;
  const catalog::Signal signal(SIGUSR2);
  int hooked_after_close = 0;
  uint64_t refused = 0;

  for (int round = 0; round < kRounds; ++round) {
    FakeInterceptor interceptor;
    registry::SignalRegistry registry(interceptor);
    std::atomic<bool> go{false};
    std::atomic<uint64_t> closed_errors{0};

    std::thread toggler([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      for (int i = 0; i < 200; ++i) {
        for (Mode mode : {Mode::kDefault, Mode::kCaptured}) {
          if (registry.SetMode(signal, mode) == Error::kChannelClosed) {
            closed_errors.fetch_add(1);
          }
        }
      }
    });

    go = true;
    registry.Close(true);
    toggler.join();

    if (registry.IsHooked(signal) ||
        registry.GetMode(signal) == Mode::kCaptured) {
      ++hooked_after_close;
    }
    refused += closed_errors.load();
  }

  GTEST_LOG_(INFO) << "Mode changes refused after close: " << refused;
  EXPECT_EQ(hooked_after_close, 0);
}

// ============================================================================
// Signal Burst Tests
// ============================================================================

class SignalBurstTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (int signum : used_) {
      EXPECT_TRUE(Mediate(signum).Release()) << Signal(signum);
    }
  }

  SignalHandle Use(int signum) {
    used_.push_back(signum);
    return Mediate(signum);
  }

  std::vector<int> used_;
};

TEST_F(SignalBurstTest, OverflowIsCountedAsDropped) {
  Counter handled = MakeCounter();
  ASSERT_TRUE(Use(SIGUSR1)
                  .Register("slow",
                            [handled](Signal) {
                              std::this_thread::sleep_for(
                                  std::chrono::microseconds(200));
                              handled->fetch_add(1);
                            })
                  .Enable());

  const EngineStats before = GetStats();
  for (int i = 0; i < kBurstSignals; ++i) {
    ASSERT_EQ(raise(SIGUSR1), 0);
  }

  ASSERT_TRUE(WaitForDrain(handled, before, kBurstSignals));
  const EngineStats after = GetStats();
  const uint64_t dropped =
      after.notifications_dropped - before.notifications_dropped;

  GTEST_LOG_(INFO) << "Burst results:";
  GTEST_LOG_(INFO) << "  Raised: " << kBurstSignals;
  GTEST_LOG_(INFO) << "  Dispatched: " << handled->load();
  GTEST_LOG_(INFO) << "  Dropped: " << dropped;

  EXPECT_EQ(handled->load() + dropped, static_cast<uint64_t>(kBurstSignals));
  EXPECT_GT(dropped, 0u);
  EXPECT_GT(handled->load(), 0u);
  EXPECT_EQ(after.notifications_dispatched - before.notifications_dispatched,
            handled->load());
}

TEST_F(SignalBurstTest, ManyThreadsRaisingAtOnce) {
  Counter handled = MakeCounter();
  ASSERT_TRUE(Use(SIGUSR2).Register("count", CountingCallback(handled))
                  .Enable());

  const EngineStats before = GetStats();
  std::atomic<int> failed_raises{0};
  std::vector<std::thread> raisers;
  for (int t = 0; t < kRaiserThreads; ++t) {
    raisers.emplace_back([&failed_raises] {
      for (int i = 0; i < kRaisesPerThread; ++i) {
        // Runs the handler on this thread, concurrently with the others
        if (pthread_kill(pthread_self(), SIGUSR2) != 0) {
          failed_raises.fetch_add(1);
        }
      }
    });
  }
  for (auto& raiser : raisers) {
    raiser.join();
  }
  ASSERT_EQ(failed_raises.load(), 0);

  const uint64_t raised = kRaiserThreads * kRaisesPerThread;
  ASSERT_TRUE(WaitForDrain(handled, before, raised));
  const uint64_t dropped =
      GetStats().notifications_dropped - before.notifications_dropped;
  EXPECT_EQ(handled->load() + dropped, raised);
}

TEST_F(SignalBurstTest, MutatingCallbacksWhileSignalsFire) {
  SignalHandle winch = Use(SIGWINCH);
  Counter handled = MakeCounter();
  ASSERT_TRUE(winch.Register("count", CountingCallback(handled)).Enable());

  const EngineStats before = GetStats();
  std::atomic<bool> stop{false};
  std::vector<std::thread> mutators;
  for (int t = 0; t < kMutatorThreads / 2; ++t) {
    mutators.emplace_back([winch, t, &stop] {
      const std::string name = "mutator-" + std::to_string(t);
      Counter local = MakeCounter();
      while (!stop.load()) {
        EXPECT_TRUE(winch.Register(name, CountingCallback(local)));
        EXPECT_TRUE(winch.Remove(name));
      }
      EXPECT_TRUE(winch.Register(name + "-keep", CountingCallback(local)));
    });
  }

  for (int i = 0; i < kBurstSignals; ++i) {
    ASSERT_EQ(raise(SIGWINCH), 0);
  }
  stop = true;
  for (auto& mutator : mutators) {
    mutator.join();
  }

  ASSERT_TRUE(WaitForDrain(handled, before, kBurstSignals));

  std::vector<std::string> names = winch.CallbackNames();
  ASSERT_EQ(names.size(), static_cast<std::size_t>(1 + kMutatorThreads / 2));
  EXPECT_EQ(names.front(), "count");
  std::sort(names.begin() + 1, names.end());
  for (int t = 0; t < kMutatorThreads / 2; ++t) {
    EXPECT_EQ(names[1 + t], "mutator-" + std::to_string(t) + "-keep");
  }
}

// === Main ===

}  // namespace test
}  // namespace addy

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
