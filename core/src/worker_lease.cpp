#include "core/worker_lease.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dagrun::core {

std::shared_ptr<WorkerLease> WorkerLease::create_root(std::string name,
                                                      int max_locked) {
  if (max_locked < 1) {
    throw std::invalid_argument("Worker lease budget must be at least 1, got " +
                                std::to_string(max_locked));
  }
  auto budget = std::make_shared<Budget>();
  budget->root_name = name;
  budget->max_locked = max_locked;
  return std::make_shared<WorkerLease>(Passkey{}, std::move(budget),
                                       std::move(name));
}

WorkerLease::WorkerLease(Passkey, std::shared_ptr<Budget> budget,
                         std::string name)
    : budget_(std::move(budget)), name_(std::move(name)) {}

std::unique_ptr<WorkerLease> WorkerLease::create_child() {
  const int index = ++budget_->children_created;
  return std::make_unique<WorkerLease>(
      Passkey{}, budget_,
      budget_->root_name + " lease " + std::to_string(index));
}

bool WorkerLease::bind_gate(const CoordinationGate &gate) {
  const CoordinationGate *expected = nullptr;
  if (budget_->gate.compare_exchange_strong(expected, &gate)) {
    return true;
  }
  return expected == &gate;
}

std::string WorkerLease::display_name() const { return "worker lease '" + name_ + "'"; }

bool WorkerLease::try_lock(ResourceLockState &state) {
  if (locked_) {
    return true;
  }
  if (budget_->locked >= budget_->max_locked) {
    return false;
  }
  locked_ = true;
  ++budget_->locked;
  budget_->peak = std::max(budget_->peak, budget_->locked);
  state.register_locked(*this);
  return true;
}

void WorkerLease::unlock() {
  if (!locked_) {
    return;
  }
  locked_ = false;
  --budget_->locked;
}

int WorkerLease::max_locked() const { return budget_->max_locked; }

int WorkerLease::locked_count() const { return budget_->locked; }

int WorkerLease::peak_locked_count() const { return budget_->peak; }

} // namespace dagrun::core
