#include "core/resource_lock.h"

#include <utility>

namespace dagrun::core {

ExclusiveResourceLock::ExclusiveResourceLock(std::string name)
    : name_(std::move(name)) {}

std::string ExclusiveResourceLock::display_name() const {
  return "resource '" + name_ + "'";
}

bool ExclusiveResourceLock::try_lock(ResourceLockState &state) {
  if (locked_) {
    return false;
  }
  locked_ = true;
  state.register_locked(*this);
  return true;
}

void ExclusiveResourceLock::unlock() { locked_ = false; }

void ResourceLockState::register_locked(ResourceLock &lock) {
  acquired_.push_back(&lock);
}

void ResourceLockState::release_locks() {
  // Newest first, so nested acquisitions unwind in reverse.
  for (auto it = acquired_.rbegin(); it != acquired_.rend(); ++it) {
    (*it)->unlock();
  }
  acquired_.clear();
}

} // namespace dagrun::core
