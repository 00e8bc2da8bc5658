#pragma once

#include <string>
#include <vector>

namespace dagrun::core {

class ResourceLockState;

/// A lock over a resource that at most one owner may hold at a time.
///
/// Locks are plan state: every method must be called while the coordination
/// gate is held. That is the only synchronization they get.
class ResourceLock {
public:
  virtual ~ResourceLock() = default;

  [[nodiscard]] virtual std::string display_name() const = 0;

  [[nodiscard]] virtual bool is_locked() const = 0;

  /// Attempt to acquire the lock. On success it is registered with `state`
  /// so the current gate pass can roll it back.
  virtual bool try_lock(ResourceLockState &state) = 0;

  /// Release the lock. Releasing an unlocked lock is a no-op.
  virtual void unlock() = 0;
};

/// Named lock bound to a node for the duration of its execution, e.g. a
/// shared output directory two nodes must not write concurrently.
class ExclusiveResourceLock final : public ResourceLock {
public:
  explicit ExclusiveResourceLock(std::string name);

  [[nodiscard]] std::string display_name() const override;
  [[nodiscard]] bool is_locked() const override { return locked_; }
  bool try_lock(ResourceLockState &state) override;
  void unlock() override;

private:
  std::string name_;
  bool locked_ = false;
};

/// Book-keeping for one pass of a gate-guarded transform.
///
/// Tracks the locks acquired during the pass so they can be released when
/// the pass retries or throws, and records whether the pass changed state
/// other threads may be waiting on.
class ResourceLockState {
public:
  ResourceLockState() = default;
  ResourceLockState(const ResourceLockState &) = delete;
  ResourceLockState &operator=(const ResourceLockState &) = delete;

  void register_locked(ResourceLock &lock);

  /// Release every lock acquired during this pass.
  void release_locks();

  /// Keep the locks acquired during this pass; they stay held.
  void commit() { acquired_.clear(); }

  /// Wake blocked gate waiters once this pass ends.
  void notify_state_change() { state_changed_ = true; }

  [[nodiscard]] bool state_changed() const { return state_changed_; }

  [[nodiscard]] std::size_t acquired_count() const { return acquired_.size(); }

private:
  std::vector<ResourceLock *> acquired_;
  bool state_changed_ = false;
};

} // namespace dagrun::core
