#pragma once

#include "core/resource_lock.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>

namespace dagrun::core {

/// Outcome of one gate-guarded pass.
enum class Disposition {
  Finished, // Release the gate and return to the caller
  Retry     // Block until another holder signals a state change, then rerun
};

/// The single exclusive lock guarding all plan state.
///
/// Callers never wait on their own condition variables; they run a transform
/// under the gate and say, through its return value, whether they are done or
/// need the state to change first. A retrying caller sleeps until some other
/// pass signals a change and then re-evaluates from the top, so there is no
/// polling and no wakeup can be missed: a change signaled while the caller
/// held the gate is always visible to its next pass.
class CoordinationGate {
public:
  using Clock = std::chrono::steady_clock;
  using Transform = std::function<Disposition(ResourceLockState &)>;

  CoordinationGate() = default;
  CoordinationGate(const CoordinationGate &) = delete;
  CoordinationGate &operator=(const CoordinationGate &) = delete;

  /// Run `transform` under the gate until it returns Finished.
  ///
  /// Locks acquired during a pass that returns Retry or throws are released
  /// before the gate is given up. Exceptions from `transform` propagate.
  /// Returns the time the caller spent blocked, either on the mutex or
  /// waiting for a state change.
  Clock::duration with_state_lock(const Transform &transform);

  /// Wake every blocked transform. Must not be called from inside a
  /// transform; use ResourceLockState::notify_state_change() there.
  void notify_state_change();

private:
  void publish_locked(const ResourceLockState &state);

  std::mutex mutex_;
  std::condition_variable state_changed_;
  std::uint64_t generation_ = 0;
};

} // namespace dagrun::core
