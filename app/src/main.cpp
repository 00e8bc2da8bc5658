#include "core/cancel_token.h"
#include "core/coordination_gate.h"
#include "core/default_execution_plan.h"
#include "core/logger.h"
#include "core/plan_executor.h"
#include "core/worker_lease.h"
#include "infra/config.h"
#include "infra/logger.h"

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace dagrun;

namespace {

/// Demo plan: N compile nodes, one test node per compile node, and a final
/// package node that needs every test and the shared artifact store.
core::Result<void, core::TaskError>
build_demo_plan(core::DefaultExecutionPlan &plan, int width) {
  std::vector<std::string> tests;
  for (int i = 0; i < width; ++i) {
    const std::string compile = "compile-" + std::to_string(i);
    const std::string test = "test-" + std::to_string(i);

    auto added = plan.add_node(compile);
    if (added.is_err()) {
      return added;
    }
    added = plan.add_node(test, {compile});
    if (added.is_err()) {
      return added;
    }
    tests.push_back(test);
  }
  auto added = plan.add_node("publish-docs", {}, {"artifact-store"});
  if (added.is_err()) {
    return added;
  }
  return plan.add_node("package", tests, {"artifact-store"});
}

} // namespace

int main() {
  std::shared_ptr<core::ILogger> logger = infra::create_console_logger();
  const auto settings = infra::ExecutorSettings::from_environment(logger);
  // Same underlying spdlog logger, now at the configured level.
  logger = infra::create_console_logger(settings.log_level);

  const int width = infra::parse_env_int("DAGRUN_DEMO_NODES", 6, false, logger);
  const char *fail_env = std::getenv("DAGRUN_DEMO_FAIL");
  const std::string fail_node = fail_env ? fail_env : "";

  core::DefaultExecutionPlan plan("demo", settings.plan_config());
  auto built = build_demo_plan(plan, width);
  if (built.is_err()) {
    logger->error("demo", "app", "plan_invalid", built.error().internal_message);
    return 2;
  }

  auto config = settings.executor_config();
  const int budget = core::effective_worker_count(config);

  auto cancel_token = core::CancelToken::create();
  auto created = core::create_plan_executor(
      config, core::WorkerLease::create_root("demo", budget), cancel_token,
      std::make_shared<core::CoordinationGate>(), logger);
  if (created.is_err()) {
    logger->error("demo", "app", "executor_invalid",
                  created.error().user_message);
    return 2;
  }
  auto executor = std::move(created).value();

  std::vector<core::TaskError> failures;
  executor->process(
      plan, failures,
      [&](core::PlanNode &node) -> core::Result<void, core::TaskError> {
        for (int step = 0; step < 5; ++step) {
          cancel_token->throw_if_canceled();
          std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        if (node.node_id == fail_node) {
          return core::Result<void, core::TaskError>::Err(
              core::TaskError::Execution("Injected failure in " + node.node_id));
        }
        return core::Result<void, core::TaskError>::Ok();
      });

  for (const auto &failure : failures) {
    logger->error("demo", "app", "failure",
                  std::string(core::to_string(failure.category)) + ": " +
                      failure.user_message);
  }
  for (const auto &entry : executor->stats()) {
    logger->info("demo", "app", "stats",
                 entry.thread_label + " busy=" + std::to_string(entry.busy_ms) +
                     "ms idle=" + std::to_string(entry.idle_ms) +
                     "ms wait=" + std::to_string(entry.wait_ms) + "ms");
  }

  return failures.empty() ? 0 : 1;
}
