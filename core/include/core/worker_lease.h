#pragma once

#include "core/resource_lock.h"

#include <atomic>
#include <memory>
#include <string>

namespace dagrun::core {

class CoordinationGate;

/// A concurrency permit.
///
/// Leases form a tree: the root is owned by the code that invokes the
/// executor and each worker creates one child for its lifetime. Every lease
/// in the tree draws on the root's budget, so no more than `max_locked`
/// leases beneath the root can be locked at once. A worker locks its lease
/// when it selects a node and unlocks it when the node completes.
///
/// The budget has no lock of its own: it is guarded by the coordination gate
/// the tree is bound to, and every lock/unlock must happen under that gate.
class WorkerLease final : public ResourceLock {
  struct Passkey {
    explicit Passkey() = default;
  };
  struct Budget;

public:
  /// Create a root lease allowing `max_locked` descendants locked at once.
  static std::shared_ptr<WorkerLease> create_root(std::string name,
                                                  int max_locked);

  /// Create a child drawing on the same budget. Safe to call without the
  /// gate; locking and unlocking are not.
  [[nodiscard]] std::unique_ptr<WorkerLease> create_child();

  /// Bind the whole tree to the gate guarding its budget. Returns false if
  /// it is already bound to a different gate; binding again to the same
  /// gate succeeds.
  bool bind_gate(const CoordinationGate &gate);

  WorkerLease(Passkey, std::shared_ptr<Budget> budget, std::string name);

  [[nodiscard]] std::string display_name() const override;
  [[nodiscard]] bool is_locked() const override { return locked_; }
  bool try_lock(ResourceLockState &state) override;
  void unlock() override;

  [[nodiscard]] int max_locked() const;
  [[nodiscard]] int locked_count() const;
  [[nodiscard]] int peak_locked_count() const;

private:
  struct Budget {
    std::string root_name;
    int max_locked = 1;
    int locked = 0;
    int peak = 0;
    std::atomic<int> children_created{0};
    std::atomic<const CoordinationGate *> gate{nullptr};
  };

  std::shared_ptr<Budget> budget_;
  std::string name_;
  bool locked_ = false;
};

} // namespace dagrun::core
