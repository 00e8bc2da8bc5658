#pragma once

#include "core/node.h"
#include "core/task_error.h"

#include <string>
#include <vector>

namespace dagrun::core {

class ResourceLockState;
class WorkerLease;

/// The dependency graph an executor drives.
///
/// The plan decides what work exists and when a node becomes ready; the
/// executor decides when, and by which worker, a ready node runs. Apart from
/// display_name(), every method is plan state and must be called while the
/// coordination gate is held.
class IExecutionPlan {
public:
  virtual ~IExecutionPlan() = default;

  /// Label used for diagnostics and worker pool naming.
  [[nodiscard]] virtual std::string display_name() const = 0;

  /// True once every node is terminal.
  [[nodiscard]] virtual bool all_nodes_complete() const = 0;

  /// Append every captured node and plan failure to `failures`. Draining:
  /// a second call in the same run appends nothing.
  virtual void collect_failures(std::vector<TaskError> &failures) = 0;

  /// Mark unscheduled nodes as skipped. Returns true if any node changed
  /// state.
  virtual bool cancel_execution() = 0;

  /// Promote newly-ready nodes into the ready queue. Idempotent.
  virtual void populate_ready_queue() = 0;

  /// True once enumeration is exhausted.
  [[nodiscard]] virtual bool all_nodes_queued() const = 0;

  /// True while any non-terminal node exists, including executing ones.
  [[nodiscard]] virtual bool has_nodes_remaining() const = 0;

  /// Select a ready node, locking `lease` and the node's exclusive resources
  /// through `state` in the same step. Returns nullptr when nothing is
  /// selectable right now.
  virtual PlanNode *select_next(WorkerLease &lease, ResourceLockState &state) = 0;

  /// Record that a selected node finished (successfully or with a captured
  /// failure), releasing its lease and resources.
  virtual void node_complete(PlanNode &node) = 0;

  /// Record a fatal failure and stop scheduling any further work.
  virtual void abort_all_and_fail(TaskError error) = 0;
};

} // namespace dagrun::core
