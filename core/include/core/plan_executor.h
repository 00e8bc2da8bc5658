#pragma once

#include "core/execution_plan.h"
#include "core/node.h"
#include "core/result.h"
#include "core/task_error.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dagrun::core {

class CancelToken;
class CoordinationGate;
class ILogger;
class WorkerLease;

/// Executor runtime configuration.
struct PlanExecutorConfig {
  int max_workers = 0; // 0 = auto: hardware concurrency (4 if unknown)
};

/// Number of workers an executor built from `config` runs. Resolves 0 to the
/// automatic count; a negative count is passed through for the factory to
/// reject.
int effective_worker_count(const PlanExecutorConfig &config);

/// Time accounting for one executor thread, in milliseconds.
/// busy_ms + idle_ms + wait_ms is the thread's lifetime within the run.
struct ExecutorStats {
  std::string thread_label;
  long long busy_ms = 0; // Executing nodes
  long long idle_ms = 0; // Neither executing nor blocked on the gate
  long long wait_ms = 0; // Blocked on the gate
};

/// Runs one node. An Err result or an exception is captured on the node as
/// its failure; neither aborts the run.
using NodeAction = std::function<Result<void, TaskError>(PlanNode &)>;

/// Executes an IExecutionPlan on a pool of worker threads.
///
/// One queuer runs on the calling thread and enumerates ready nodes while
/// `max_workers` workers select and execute them. All plan decisions go
/// through a single CoordinationGate; node execution is the only work done
/// outside it.
class IPlanExecutor {
public:
  virtual ~IPlanExecutor() = default;

  /// Run `plan` to completion. Returns only once every node is terminal and
  /// every worker thread has been joined; captured failures are appended to
  /// `failures` exactly once. If a worker fails outside a node action the run
  /// is aborted and that exception is rethrown after the join.
  virtual void process(IExecutionPlan &plan, std::vector<TaskError> &failures,
                       const NodeAction &node_action) = 0;

  /// Stats entries of every run so far: one per worker plus one for the
  /// queuer, per run.
  [[nodiscard]] virtual std::vector<ExecutorStats> stats() const = 0;

  [[nodiscard]] virtual int worker_count() const = 0;
};

/// Create an executor. `root_lease` bounds how many nodes run at once;
/// `cancel_token` and `logger` may be null. Rejects a negative worker count,
/// a missing gate or root lease, and a root lease already bound to a
/// different gate: the gate is what guards the lease budget, so executors
/// sharing a root lease must share its gate too.
Result<std::unique_ptr<IPlanExecutor>, TaskError>
create_plan_executor(const PlanExecutorConfig &config,
                     std::shared_ptr<WorkerLease> root_lease,
                     std::shared_ptr<CancelToken> cancel_token,
                     std::shared_ptr<CoordinationGate> gate,
                     std::shared_ptr<ILogger> logger);

} // namespace dagrun::core
