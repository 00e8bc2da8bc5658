#include "core/coordination_gate.h"

namespace dagrun::core {

CoordinationGate::Clock::duration
CoordinationGate::with_state_lock(const Transform &transform) {
  Clock::duration blocked{};
  auto wait_start = Clock::now();
  std::unique_lock<std::mutex> lock(mutex_);
  blocked += Clock::now() - wait_start;

  while (true) {
    ResourceLockState state;
    Disposition disposition = Disposition::Finished;
    try {
      disposition = transform(state);
    } catch (...) {
      state.release_locks();
      publish_locked(state);
      throw;
    }

    if (disposition == Disposition::Finished) {
      state.commit();
      publish_locked(state);
      return blocked;
    }

    // Nothing acquired by a retried pass was ever visible to another thread,
    // so rolling it back is not a state change by itself.
    state.release_locks();
    publish_locked(state);

    const std::uint64_t seen = generation_;
    wait_start = Clock::now();
    state_changed_.wait(lock, [this, seen]() { return generation_ != seen; });
    blocked += Clock::now() - wait_start;
  }
}

void CoordinationGate::notify_state_change() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
  }
  state_changed_.notify_all();
}

void CoordinationGate::publish_locked(const ResourceLockState &state) {
  if (state.state_changed()) {
    ++generation_;
    state_changed_.notify_all();
  }
}

} // namespace dagrun::core
