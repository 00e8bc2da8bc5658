#include <gtest/gtest.h>

#include "core/coordination_gate.h"
#include "core/resource_lock.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dagrun::core;

TEST(CoordinationGate, FinishedRunsTransformOnce) {
  CoordinationGate gate;
  int calls = 0;

  gate.with_state_lock([&](ResourceLockState &) {
    ++calls;
    return Disposition::Finished;
  });

  EXPECT_EQ(calls, 1);
}

TEST(CoordinationGate, FinishedKeepsAcquiredLocks) {
  CoordinationGate gate;
  ExclusiveResourceLock lock("db");

  gate.with_state_lock([&](ResourceLockState &state) {
    EXPECT_TRUE(lock.try_lock(state));
    return Disposition::Finished;
  });

  EXPECT_TRUE(lock.is_locked());
}

TEST(CoordinationGate, RetryBlocksUntilStateChangeIsSignaled) {
  CoordinationGate gate;
  bool ready = false; // Guarded by the gate
  std::atomic<int> passes{0};

  std::thread waiter([&]() {
    gate.with_state_lock([&](ResourceLockState &) {
      ++passes;
      return ready ? Disposition::Finished : Disposition::Retry;
    });
  });

  // Give the waiter time to park; it must not spin while parked.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(passes.load(), 1);

  gate.with_state_lock([&](ResourceLockState &state) {
    ready = true;
    state.notify_state_change();
    return Disposition::Finished;
  });

  waiter.join();
  EXPECT_EQ(passes.load(), 2);
}

TEST(CoordinationGate, ExternalNotifyWakesRetryingTransform) {
  CoordinationGate gate;
  std::atomic<bool> release{false};
  std::atomic<int> passes{0};

  std::thread waiter([&]() {
    gate.with_state_lock([&](ResourceLockState &) {
      ++passes;
      return release.load() ? Disposition::Finished : Disposition::Retry;
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  release = true;
  gate.notify_state_change();
  waiter.join();

  EXPECT_GE(passes.load(), 1);
}

TEST(CoordinationGate, OwnNotificationDoesNotWakeItself) {
  CoordinationGate gate;
  std::atomic<int> passes{0};
  std::atomic<bool> done{false};

  std::thread self_notifier([&]() {
    gate.with_state_lock([&](ResourceLockState &state) {
      ++passes;
      state.notify_state_change();
      return done.load() ? Disposition::Finished : Disposition::Retry;
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(passes.load(), 1);

  done = true;
  gate.notify_state_change();
  self_notifier.join();
  EXPECT_EQ(passes.load(), 2);
}

TEST(CoordinationGate, RetryRollsBackLocksAcquiredDuringThePass) {
  CoordinationGate gate;
  ExclusiveResourceLock lock("db");
  std::atomic<int> passes{0};
  std::atomic<bool> finish{false};

  std::thread worker([&]() {
    gate.with_state_lock([&](ResourceLockState &state) {
      ++passes;
      EXPECT_TRUE(lock.try_lock(state));
      return finish.load() ? Disposition::Finished : Disposition::Retry;
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  gate.with_state_lock([&](ResourceLockState &) {
    // The retried pass must have released the lock before parking.
    EXPECT_FALSE(lock.is_locked());
    return Disposition::Finished;
  });

  finish = true;
  gate.notify_state_change();
  worker.join();
  EXPECT_TRUE(lock.is_locked());
}

TEST(CoordinationGate, ThrowingTransformReleasesLocksAndPropagates) {
  CoordinationGate gate;
  ExclusiveResourceLock lock("db");

  EXPECT_THROW(gate.with_state_lock([&](ResourceLockState &state) -> Disposition {
    lock.try_lock(state);
    throw std::runtime_error("bookkeeping failed");
  }),
               std::runtime_error);

  EXPECT_FALSE(lock.is_locked());

  // The gate is usable afterwards.
  int calls = 0;
  gate.with_state_lock([&](ResourceLockState &) {
    ++calls;
    return Disposition::Finished;
  });
  EXPECT_EQ(calls, 1);
}

TEST(CoordinationGate, ReportsTimeBlockedWaitingForStateChange) {
  CoordinationGate gate;
  std::atomic<bool> release{false};
  CoordinationGate::Clock::duration blocked{};

  std::thread waiter([&]() {
    blocked = gate.with_state_lock([&](ResourceLockState &) {
      return release.load() ? Disposition::Finished : Disposition::Retry;
    });
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  release = true;
  gate.notify_state_change();
  waiter.join();

  EXPECT_GE(blocked, std::chrono::milliseconds(40));
}

TEST(CoordinationGate, TransformsNeverOverlap) {
  CoordinationGate gate;
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};
  int counter = 0;

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < 200; ++i) {
        gate.with_state_lock([&](ResourceLockState &) {
          const int now = ++inside;
          int observed = max_inside.load();
          while (observed < now && !max_inside.compare_exchange_weak(observed, now)) {
          }
          ++counter;
          --inside;
          return Disposition::Finished;
        });
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(max_inside.load(), 1);
  EXPECT_EQ(counter, 800);
}
