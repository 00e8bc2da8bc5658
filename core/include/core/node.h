#pragma once

#include "core/result.h"
#include "core/task_error.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace dagrun::core {

class ResourceLock;

// ---- Node State Enum ----

enum class NodeState {
  NotReady,  // Enumerated or pending, dependencies not yet satisfied
  Ready,     // In the ready queue, waiting for a worker
  Executing, // Selected by exactly one worker
  Succeeded, // Work completed (terminal)
  Failed,    // Work raised a failure (terminal)
  Skipped    // Canceled, aborted or a dependency did not succeed (terminal)
};

const char *to_string(NodeState state);

bool is_terminal(NodeState state);

// ---- Plan Node ----

/// A schedulable unit of work owned by an execution plan.
///
/// Plan state: mutated only while the coordination gate is held, except by
/// the single worker that owns the node between selection and completion.
struct PlanNode {
  std::string node_id;
  std::vector<std::string> deps;                // Prerequisite node ids
  std::vector<std::string> exclusive_resources; // Resource lock names

  NodeState state = NodeState::NotReady;
  std::optional<TaskError> failure;

  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;

  // Bound at selection, released at completion.
  std::vector<ResourceLock *> held_locks;

  /// Attempt a state transition. Returns Err if the transition is illegal.
  /// Legal transitions:
  ///   NotReady  -> Ready, Skipped
  ///   Ready     -> Executing, Skipped
  ///   Executing -> Succeeded, Failed
  Result<void, TaskError> transition_to(NodeState new_state);

  /// Attach the failure raised while executing this node. The first failure
  /// wins.
  void set_execution_failure(TaskError error);

  [[nodiscard]] bool is_complete() const { return is_terminal(state); }
};

} // namespace dagrun::core
