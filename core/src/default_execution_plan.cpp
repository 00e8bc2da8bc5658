#include "core/default_execution_plan.h"

#include "core/worker_lease.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace dagrun::core {

DefaultExecutionPlan::DefaultExecutionPlan(std::string display_name,
                                           PlanConfig config)
    : display_name_(std::move(display_name)), config_(config) {}

DefaultExecutionPlan::~DefaultExecutionPlan() = default;

Result<void, TaskError>
DefaultExecutionPlan::add_node(std::string node_id,
                               std::vector<std::string> deps,
                               std::vector<std::string> exclusive_resources) {
  if (enumeration_started_) {
    return Result<void, TaskError>::Err(TaskError::Internal(
        "Cannot add node '" + node_id + "' after execution has started"));
  }
  if (node_id.empty()) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("node_id must not be empty"));
  }
  if (index_.find(node_id) != index_.end()) {
    return Result<void, TaskError>::Err(
        TaskError::Internal("Duplicate node_id: " + node_id));
  }
  for (const auto &dep_id : deps) {
    if (dep_id == node_id) {
      return Result<void, TaskError>::Err(
          TaskError::Internal("Node cannot depend on itself: " + node_id));
    }
    if (index_.find(dep_id) == index_.end()) {
      return Result<void, TaskError>::Err(
          TaskError::Internal("Dependency not found: " + dep_id));
    }
  }

  auto entry = std::make_unique<Entry>();
  entry->node = std::make_unique<PlanNode>();
  entry->node->node_id = std::move(node_id);
  entry->node->deps = std::move(deps);
  entry->node->exclusive_resources = std::move(exclusive_resources);

  for (const auto &dep_id : entry->node->deps) {
    index_.at(dep_id)->successors.push_back(entry->node.get());
  }
  for (const auto &name : entry->node->exclusive_resources) {
    auto &lock = resource_locks_[name];
    if (!lock) {
      lock = std::make_unique<ExclusiveResourceLock>(name);
    }
  }

  index_.emplace(entry->node->node_id, entry.get());
  nodes_.push_back(std::move(entry));
  ++remaining_;
  return Result<void, TaskError>::Ok();
}

const PlanNode *DefaultExecutionPlan::find_node(const std::string &node_id) const {
  auto it = index_.find(node_id);
  return it == index_.end() ? nullptr : it->second->node.get();
}

std::string DefaultExecutionPlan::display_name() const { return display_name_; }

bool DefaultExecutionPlan::all_nodes_complete() const { return remaining_ == 0; }

bool DefaultExecutionPlan::has_nodes_remaining() const { return remaining_ > 0; }

bool DefaultExecutionPlan::all_nodes_queued() const {
  return enumeration_started_ && next_to_enumerate_ == nodes_.size();
}

void DefaultExecutionPlan::collect_failures(std::vector<TaskError> &failures) {
  if (failures_collected_) {
    return;
  }
  failures_collected_ = true;

  for (const auto &entry : nodes_) {
    const PlanNode &node = *entry->node;
    if (node.state == NodeState::Failed && node.failure.has_value()) {
      failures.push_back(*node.failure);
    }
  }
  for (auto &failure : plan_failures_) {
    failures.push_back(std::move(failure));
  }
  plan_failures_.clear();
}

bool DefaultExecutionPlan::cancel_execution() {
  canceled_ = true;
  const bool changed = skip_unscheduled();
  if (changed && !cancel_recorded_) {
    cancel_recorded_ = true;
    plan_failures_.push_back(TaskError(
        ErrorCategory::Canceled, 1, false, "Build cancelled",
        "Cancellation requested while nodes were still unscheduled",
        {{"plan", display_name_}}));
  }
  return changed;
}

void DefaultExecutionPlan::populate_ready_queue() {
  enumeration_started_ = true;
  while (next_to_enumerate_ < nodes_.size()) {
    enumerate(*nodes_[next_to_enumerate_]);
    ++next_to_enumerate_;
  }
}

PlanNode *DefaultExecutionPlan::select_next(WorkerLease &lease,
                                            ResourceLockState &state) {
  if (ready_queue_.empty()) {
    return nullptr;
  }

  const bool lease_was_locked = lease.is_locked();
  if (!lease.try_lock(state)) {
    // Every permit is in use.
    return nullptr;
  }

  for (auto it = ready_queue_.begin(); it != ready_queue_.end(); ++it) {
    PlanNode *node = *it;
    if (!try_lock_resources(*node, state)) {
      continue;
    }
    ready_queue_.erase(it);
    node->held_locks.insert(node->held_locks.begin(), &lease);
    apply(*node, NodeState::Executing);
    return node;
  }

  if (!lease_was_locked) {
    lease.unlock();
  }
  return nullptr;
}

void DefaultExecutionPlan::node_complete(PlanNode &node) {
  for (auto *lock : node.held_locks) {
    lock->unlock();
  }
  node.held_locks.clear();

  if (node.state != NodeState::Executing) {
    return;
  }

  const bool failed = node.failure.has_value();
  mark_terminal(node, failed ? NodeState::Failed : NodeState::Succeeded);

  if (failed) {
    if (config_.continue_on_failure) {
      skip_dependents(node);
    } else {
      skip_unscheduled();
    }
    return;
  }

  for (PlanNode *succ : entry_for(node).successors) {
    Entry &succ_entry = entry_for(*succ);
    if (!succ_entry.enumerated || succ->state != NodeState::NotReady ||
        succ_entry.unmet_deps == 0) {
      continue;
    }
    if (--succ_entry.unmet_deps == 0) {
      mark_ready(succ_entry);
    }
  }
}

void DefaultExecutionPlan::abort_all_and_fail(TaskError error) {
  aborted_ = true;
  error.details.emplace("plan", display_name_);
  plan_failures_.push_back(std::move(error));
  skip_unscheduled();
}

DefaultExecutionPlan::Entry &DefaultExecutionPlan::entry_for(const PlanNode &node) {
  return *index_.at(node.node_id);
}

bool DefaultExecutionPlan::try_lock_resources(PlanNode &node,
                                              ResourceLockState &state) {
  std::vector<ResourceLock *> acquired;
  acquired.reserve(node.exclusive_resources.size());
  for (const auto &name : node.exclusive_resources) {
    ResourceLock *lock = resource_locks_.at(name).get();
    if (!lock->try_lock(state)) {
      for (auto *held : acquired) {
        held->unlock();
      }
      return false;
    }
    acquired.push_back(lock);
  }
  node.held_locks = std::move(acquired);
  return true;
}

void DefaultExecutionPlan::enumerate(Entry &entry) {
  entry.enumerated = true;
  PlanNode &node = *entry.node;
  if (node.state != NodeState::NotReady) {
    return;
  }
  if (canceled_ || aborted_) {
    mark_terminal(node, NodeState::Skipped);
    return;
  }

  entry.unmet_deps = 0;
  for (const auto &dep_id : node.deps) {
    const NodeState dep_state = index_.at(dep_id)->node->state;
    if (dep_state == NodeState::Succeeded) {
      continue;
    }
    if (dep_state == NodeState::Failed || dep_state == NodeState::Skipped) {
      mark_terminal(node, NodeState::Skipped);
      return;
    }
    ++entry.unmet_deps;
  }

  if (entry.unmet_deps == 0) {
    mark_ready(entry);
  }
}

void DefaultExecutionPlan::mark_ready(Entry &entry) {
  apply(*entry.node, NodeState::Ready);
  ready_queue_.push_back(entry.node.get());
}

void DefaultExecutionPlan::mark_terminal(PlanNode &node, NodeState state) {
  apply(node, state);
  --remaining_;
}

void DefaultExecutionPlan::skip_dependents(const PlanNode &root) {
  std::vector<const PlanNode *> stack{&root};
  std::unordered_set<const PlanNode *> visited;

  while (!stack.empty()) {
    const PlanNode *current = stack.back();
    stack.pop_back();

    for (PlanNode *succ : entry_for(*current).successors) {
      if (!visited.insert(succ).second) {
        continue;
      }
      if (succ->state == NodeState::Ready) {
        ready_queue_.erase(
            std::remove(ready_queue_.begin(), ready_queue_.end(), succ),
            ready_queue_.end());
      }
      if (succ->state == NodeState::NotReady ||
          succ->state == NodeState::Ready) {
        mark_terminal(*succ, NodeState::Skipped);
      }
      stack.push_back(succ);
    }
  }
}

bool DefaultExecutionPlan::skip_unscheduled() {
  bool changed = false;
  for (auto &entry : nodes_) {
    PlanNode &node = *entry->node;
    entry->enumerated = true;
    if (node.state == NodeState::NotReady || node.state == NodeState::Ready) {
      mark_terminal(node, NodeState::Skipped);
      changed = true;
    }
  }
  ready_queue_.clear();
  enumeration_started_ = true;
  next_to_enumerate_ = nodes_.size();
  return changed;
}

void DefaultExecutionPlan::apply(PlanNode &node, NodeState state) {
  auto result = node.transition_to(state);
  if (result.is_err()) {
    throw std::logic_error(result.error().internal_message);
  }
}

} // namespace dagrun::core
