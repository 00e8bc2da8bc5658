#include "core/node.h"

#include <utility>

namespace dagrun::core {

const char *to_string(NodeState state) {
  switch (state) {
  case NodeState::NotReady:
    return "NotReady";
  case NodeState::Ready:
    return "Ready";
  case NodeState::Executing:
    return "Executing";
  case NodeState::Succeeded:
    return "Succeeded";
  case NodeState::Failed:
    return "Failed";
  case NodeState::Skipped:
    return "Skipped";
  }
  return "Unknown";
}

bool is_terminal(NodeState state) {
  switch (state) {
  case NodeState::Succeeded:
  case NodeState::Failed:
  case NodeState::Skipped:
    return true;
  default:
    return false;
  }
}

Result<void, TaskError> PlanNode::transition_to(NodeState new_state) {
  bool legal = false;

  switch (state) {
  case NodeState::NotReady:
    legal = (new_state == NodeState::Ready || new_state == NodeState::Skipped);
    break;
  case NodeState::Ready:
    legal =
        (new_state == NodeState::Executing || new_state == NodeState::Skipped);
    break;
  case NodeState::Executing:
    legal =
        (new_state == NodeState::Succeeded || new_state == NodeState::Failed);
    break;
  case NodeState::Succeeded:
  case NodeState::Failed:
  case NodeState::Skipped:
    // Terminal states: a node never moves backward.
    legal = false;
    break;
  }

  if (!legal) {
    return Result<void, TaskError>::Err(TaskError(
        ErrorCategory::Internal, 4001, false, "Illegal node state transition",
        std::string("Illegal state transition: ") + to_string(state) + " -> " +
            to_string(new_state) + " (node_id=" + node_id + ")",
        {{"node_id", node_id}}));
  }

  state = new_state;
  if (new_state == NodeState::Executing) {
    started_at = Clock::now();
  }
  if (is_terminal(new_state)) {
    finished_at = Clock::now();
  }
  return Result<void, TaskError>::Ok();
}

void PlanNode::set_execution_failure(TaskError error) {
  if (failure.has_value()) {
    return;
  }
  error.details.emplace("node_id", node_id);
  failure = std::move(error);
}

} // namespace dagrun::core
