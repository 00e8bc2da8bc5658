#pragma once

#include "core/execution_plan.h"
#include "core/resource_lock.h"
#include "core/result.h"

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace dagrun::core {

struct PlanConfig {
  /// Keep running nodes that do not depend on a failed node. When false the
  /// first node failure skips every node not yet selected.
  bool continue_on_failure = true;
};

/// In-memory execution plan.
///
/// Nodes are added up front, dependencies first, which keeps the graph
/// acyclic by construction. The first populate_ready_queue() call freezes the
/// node set and enumerates it; from then on readiness is driven by
/// node_complete().
class DefaultExecutionPlan : public IExecutionPlan {
public:
  explicit DefaultExecutionPlan(std::string display_name, PlanConfig config = {});
  ~DefaultExecutionPlan() override;

  DefaultExecutionPlan(const DefaultExecutionPlan &) = delete;
  DefaultExecutionPlan &operator=(const DefaultExecutionPlan &) = delete;

  /// Add a node. Rejects empty or duplicate ids, unknown or self
  /// dependencies, and additions once enumeration has started.
  Result<void, TaskError>
  add_node(std::string node_id, std::vector<std::string> deps = {},
           std::vector<std::string> exclusive_resources = {});

  [[nodiscard]] const PlanNode *find_node(const std::string &node_id) const;
  [[nodiscard]] std::size_t node_count() const { return nodes_.size(); }
  [[nodiscard]] std::size_t ready_count() const { return ready_queue_.size(); }

  // IExecutionPlan
  [[nodiscard]] std::string display_name() const override;
  [[nodiscard]] bool all_nodes_complete() const override;
  void collect_failures(std::vector<TaskError> &failures) override;
  bool cancel_execution() override;
  void populate_ready_queue() override;
  [[nodiscard]] bool all_nodes_queued() const override;
  [[nodiscard]] bool has_nodes_remaining() const override;
  PlanNode *select_next(WorkerLease &lease, ResourceLockState &state) override;
  void node_complete(PlanNode &node) override;
  void abort_all_and_fail(TaskError error) override;

private:
  struct Entry {
    std::unique_ptr<PlanNode> node;
    std::vector<PlanNode *> successors;
    std::size_t unmet_deps = 0;
    bool enumerated = false;
  };

  Entry &entry_for(const PlanNode &node);
  bool try_lock_resources(PlanNode &node, ResourceLockState &state);
  void enumerate(Entry &entry);
  void mark_ready(Entry &entry);
  void mark_terminal(PlanNode &node, NodeState state);
  void skip_dependents(const PlanNode &root);
  bool skip_unscheduled();
  void apply(PlanNode &node, NodeState state);

  std::string display_name_;
  PlanConfig config_;

  std::vector<std::unique_ptr<Entry>> nodes_; // Insertion order
  std::unordered_map<std::string, Entry *> index_;
  std::unordered_map<std::string, std::unique_ptr<ExclusiveResourceLock>>
      resource_locks_;

  std::deque<PlanNode *> ready_queue_;
  std::size_t next_to_enumerate_ = 0;
  std::size_t remaining_ = 0; // Non-terminal nodes
  bool enumeration_started_ = false;

  bool canceled_ = false;
  bool cancel_recorded_ = false;
  bool aborted_ = false;
  bool failures_collected_ = false;
  std::vector<TaskError> plan_failures_;
};

} // namespace dagrun::core
