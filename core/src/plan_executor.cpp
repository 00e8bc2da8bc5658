#include "core/plan_executor.h"

#include "core/cancel_token.h"
#include "core/coordination_gate.h"
#include "core/logger.h"
#include "core/worker_lease.h"
#include "core/worker_pool.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace dagrun::core {
namespace {

using Clock = std::chrono::steady_clock;

long long to_millis(Clock::duration d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

std::string format_duration(Clock::duration d) {
  const long long ms = to_millis(d);
  if (ms < 1000) {
    return std::to_string(ms) + " ms";
  }
  std::ostringstream os;
  os << std::fixed << std::setprecision(3) << static_cast<double>(ms) / 1000.0
     << " secs";
  return os.str();
}

/// Append-only stats list, guarded by its own mutex rather than the gate.
class StatsCollector {
public:
  void record(std::string label, Clock::duration busy, Clock::duration wait,
              Clock::duration total) {
    ExecutorStats entry;
    entry.thread_label = std::move(label);
    entry.busy_ms = to_millis(busy);
    entry.wait_ms = to_millis(wait);
    entry.idle_ms =
        std::max(0LL, to_millis(total) - entry.busy_ms - entry.wait_ms);

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(entry));
  }

  [[nodiscard]] std::vector<ExecutorStats> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<ExecutorStats> entries_;
};

/// Wakes gate waiters when cancellation is requested during a run.
class CancelWakeup {
public:
  CancelWakeup(std::shared_ptr<CancelToken> token,
               std::shared_ptr<CoordinationGate> gate)
      : token_(std::move(token)) {
    if (token_) {
      id_ = token_->on_cancel([gate]() { gate->notify_state_change(); });
    }
  }

  ~CancelWakeup() {
    if (token_ && id_ != 0) {
      token_->remove_callback(id_);
    }
  }

  CancelWakeup(const CancelWakeup &) = delete;
  CancelWakeup &operator=(const CancelWakeup &) = delete;

private:
  std::shared_ptr<CancelToken> token_;
  CancelToken::CallbackId id_ = 0;
};

/// Shared by the queuer and the workers: everything a gate pass touches.
struct RunContext {
  IExecutionPlan &plan;
  CoordinationGate &gate;
  CancelToken *cancel_token;
  ILogger *logger;
  StatsCollector &stats;

  // Set once a worker thread fails outside a node action. The node it owned
  // may never complete, so nobody may wait for it. Guarded by the gate.
  bool worker_failed = false;

  /// Cancel unscheduled work if cancellation was requested. Call under the
  /// gate at the top of every pass.
  void poll_cancellation(ResourceLockState &state) const {
    if (cancel_token && cancel_token->is_canceled() && plan.cancel_execution()) {
      state.notify_state_change();
    }
  }

  /// Plan-fatal path: roll back this pass and fail the whole run.
  void abort_run(ResourceLockState &state, std::exception_ptr error) const {
    state.release_locks();
    TaskError failure = TaskError::from_exception(error, ErrorCategory::Plan);
    const std::string message = failure.internal_message;
    state.notify_state_change();
    plan.abort_all_and_fail(std::move(failure));
    if (logger) {
      logger->error(plan.display_name(), "executor", "plan_aborted", message);
    }
  }
};

/// Enumerates ready nodes on the calling thread until the plan reports
/// every node queued.
class ExecutorQueuer {
public:
  explicit ExecutorQueuer(RunContext &ctx) : ctx_(ctx) {}

  void run() {
    const auto total_start = Clock::now();
    Clock::duration wait{};
    while (!queue_nodes(wait)) {
    }
    const auto total = Clock::now() - total_start;

    std::string label = WorkerPool::current_thread_name();
    if (label.empty()) {
      label = "Execution queuer for '" + ctx_.plan.display_name() + "'";
    }
    ctx_.stats.record(std::move(label), Clock::duration::zero(), wait, total);
  }

private:
  bool queue_nodes(Clock::duration &wait) {
    bool all_nodes_queued = false;

    // Enumeration mutates plan state, so it stays under the gate like every
    // other plan decision.
    wait += ctx_.gate.with_state_lock([&](ResourceLockState &state) {
      ctx_.poll_cancellation(state);

      try {
        ctx_.plan.populate_ready_queue();
        all_nodes_queued = ctx_.plan.all_nodes_queued();
        state.notify_state_change();
      } catch (...) {
        ctx_.abort_run(state, std::current_exception());
        all_nodes_queued = true;
      }

      return all_nodes_queued ? Disposition::Finished : Disposition::Retry;
    });

    return all_nodes_queued;
  }

  RunContext &ctx_;
};

/// Selects and executes nodes until the plan has none remaining.
class ExecutorWorker {
public:
  ExecutorWorker(RunContext &ctx, const NodeAction &node_action,
                 WorkerLease &parent_lease)
      : ctx_(ctx), node_action_(node_action), parent_lease_(parent_lease) {}

  void run() {
    const auto total_start = Clock::now();
    Clock::duration busy{};
    Clock::duration wait{};

    std::unique_ptr<WorkerLease> lease = parent_lease_.create_child();
    try {
      while (execute_next_node(*lease, busy, wait)) {
      }

      const auto total = Clock::now() - total_start;
      const std::string label = WorkerPool::current_thread_name();
      if (ctx_.logger) {
        ctx_.logger->debug(ctx_.plan.display_name(), "executor",
                           "worker_finished",
                           "Execution worker [" + label + "] finished, busy: " +
                               format_duration(busy) +
                               ", idle: " + format_duration(total - busy));
      }
      ctx_.stats.record(label, busy, wait, total);
    } catch (...) {
      fail_run(*lease, std::current_exception());
      throw;
    }
  }

private:
  /// Select a ready node and execute it. Blocks on the gate while nodes
  /// remain but none is selectable. Returns false once no nodes remain.
  bool execute_next_node(WorkerLease &lease, Clock::duration &busy,
                         Clock::duration &wait) {
    PlanNode *selected = nullptr;
    bool nodes_remaining = false;

    wait += ctx_.gate.with_state_lock([&](ResourceLockState &state) {
      ctx_.poll_cancellation(state);

      nodes_remaining = !ctx_.worker_failed && ctx_.plan.has_nodes_remaining();
      if (!nodes_remaining) {
        return Disposition::Finished;
      }

      try {
        selected = ctx_.plan.select_next(lease, state);
      } catch (...) {
        ctx_.abort_run(state, std::current_exception());
        selected = nullptr;
        nodes_remaining = false;
      }

      if (selected == nullptr && nodes_remaining) {
        return Disposition::Retry;
      }
      in_flight_ = selected;
      return Disposition::Finished;
    });

    if (selected != nullptr) {
      execute(*selected, busy);
    }
    return nodes_remaining;
  }

  void execute(PlanNode &node, Clock::duration &busy) {
    if (!node.is_complete()) {
      const auto start = Clock::now();
      try {
        run_action(node, start);
      } catch (...) {
        node.set_execution_failure(TaskError::from_exception(
            std::current_exception(), ErrorCategory::Execution));
      }
      busy += Clock::now() - start;
    }

    ctx_.gate.with_state_lock([&](ResourceLockState &state) {
      ctx_.plan.node_complete(node);
      state.notify_state_change();
      return Disposition::Finished;
    });
    in_flight_ = nullptr;
  }

  /// Everything thrown between selection and completion, logging included,
  /// is a failure of this node.
  void run_action(PlanNode &node, Clock::time_point start) {
    const std::string thread = WorkerPool::current_thread_name();
    if (ctx_.logger) {
      ctx_.logger->info(ctx_.plan.display_name(), "executor", "node_started",
                        node.node_id + " (" + thread + ") started.");
    }

    auto result = node_action_(node);
    if (result.is_err()) {
      node.set_execution_failure(result.error());
    }

    if (ctx_.logger) {
      ctx_.logger->info(ctx_.plan.display_name(), "executor", "node_completed",
                        node.node_id + " (" + thread + ") completed. Took " +
                            format_duration(Clock::now() - start) + ".");
    }
  }

  /// The worker is dying outside a node action: release what it holds and
  /// abort the run, so no thread waits on the node it owned.
  void fail_run(WorkerLease &lease, std::exception_ptr error) {
    ctx_.gate.with_state_lock([&](ResourceLockState &state) {
      ctx_.worker_failed = true;
      if (in_flight_ != nullptr) {
        for (auto *lock : in_flight_->held_locks) {
          lock->unlock();
        }
        in_flight_->held_locks.clear();
        in_flight_ = nullptr;
      }
      lease.unlock();
      ctx_.abort_run(state, error);
      return Disposition::Finished;
    });
  }

  RunContext &ctx_;
  const NodeAction &node_action_;
  WorkerLease &parent_lease_;
  PlanNode *in_flight_ = nullptr; // Selected and not yet completed
};

class PlanExecutor final : public IPlanExecutor {
public:
  PlanExecutor(int worker_count, std::shared_ptr<WorkerLease> root_lease,
               std::shared_ptr<CancelToken> cancel_token,
               std::shared_ptr<CoordinationGate> gate,
               std::shared_ptr<ILogger> logger)
      : worker_count_(worker_count), root_lease_(std::move(root_lease)),
        cancel_token_(std::move(cancel_token)), gate_(std::move(gate)),
        logger_(std::move(logger)) {}

  void process(IExecutionPlan &plan, std::vector<TaskError> &failures,
               const NodeAction &node_action) override {
    // Declared before the pool: workers reference it until they are joined.
    RunContext ctx{plan, *gate_, cancel_token_.get(), logger_.get(), stats_};
    CancelWakeup wakeup(cancel_token_, gate_);
    WorkerPool pool("Execution worker for '" + plan.display_name() + "'",
                    static_cast<std::size_t>(worker_count_));

    try {
      start_workers(ctx, node_action, pool);
      ExecutorQueuer(ctx).run();
      await_completion(ctx, failures);
    } catch (...) {
      // Workers already started must be able to drain before the pool joins.
      const auto error = std::current_exception();
      gate_->with_state_lock([&](ResourceLockState &state) {
        ctx.abort_run(state, error);
        return Disposition::Finished;
      });
      throw;
    }

    pool.stop();
  }

  [[nodiscard]] std::vector<ExecutorStats> stats() const override {
    return stats_.snapshot();
  }

  [[nodiscard]] int worker_count() const override { return worker_count_; }

private:
  void start_workers(RunContext &ctx, const NodeAction &node_action,
                     WorkerPool &pool) {
    if (logger_) {
      logger_->debug(ctx.plan.display_name(), "executor", "workers_start",
                     "Using " + std::to_string(worker_count_) +
                         " parallel executor threads");
    }
    for (int i = 0; i < worker_count_; ++i) {
      pool.execute([&ctx, &node_action, this]() {
        ExecutorWorker(ctx, node_action, *root_lease_).run();
      });
    }
  }

  /// Blocks until every node in the plan is terminal, or a worker failure
  /// ended the run early, then drains failures.
  void await_completion(RunContext &ctx, std::vector<TaskError> &failures) {
    gate_->with_state_lock([&](ResourceLockState &) {
      if (ctx.worker_failed || ctx.plan.all_nodes_complete()) {
        ctx.plan.collect_failures(failures);
        return Disposition::Finished;
      }
      return Disposition::Retry;
    });
  }

  int worker_count_;
  std::shared_ptr<WorkerLease> root_lease_;
  std::shared_ptr<CancelToken> cancel_token_;
  std::shared_ptr<CoordinationGate> gate_;
  std::shared_ptr<ILogger> logger_;
  StatsCollector stats_;
};

} // namespace

int effective_worker_count(const PlanExecutorConfig &config) {
  if (config.max_workers > 0) {
    return config.max_workers;
  }
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  return hw > 0 ? hw : 4;
}

Result<std::unique_ptr<IPlanExecutor>, TaskError>
create_plan_executor(const PlanExecutorConfig &config,
                     std::shared_ptr<WorkerLease> root_lease,
                     std::shared_ptr<CancelToken> cancel_token,
                     std::shared_ptr<CoordinationGate> gate,
                     std::shared_ptr<ILogger> logger) {
  using ExecutorResult = Result<std::unique_ptr<IPlanExecutor>, TaskError>;

  if (config.max_workers < 0) {
    return ExecutorResult::Err(TaskError(
        ErrorCategory::Internal, 4002, false,
        "Not a valid number of parallel executors: " +
            std::to_string(config.max_workers),
        "PlanExecutorConfig.max_workers must be >= 0 (0 = auto)",
        {{"max_workers", std::to_string(config.max_workers)}}));
  }
  if (!root_lease) {
    return ExecutorResult::Err(
        TaskError::Internal("Plan executor requires a root worker lease"));
  }
  if (!gate) {
    return ExecutorResult::Err(
        TaskError::Internal("Plan executor requires a coordination gate"));
  }
  if (!root_lease->bind_gate(*gate)) {
    return ExecutorResult::Err(TaskError::Internal(
        "Root " + root_lease->display_name() +
        " is already guarded by another coordination gate"));
  }

  const int workers = effective_worker_count(config);
  return ExecutorResult::Ok(std::make_unique<PlanExecutor>(
      workers, std::move(root_lease), std::move(cancel_token), std::move(gate),
      std::move(logger)));
}

} // namespace dagrun::core
