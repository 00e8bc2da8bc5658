#pragma once

#include "core/default_execution_plan.h"
#include "core/plan_executor.h"

#include <memory>
#include <string>

namespace dagrun::core {
class ILogger;
}

namespace dagrun::infra {

/// Executor settings, overridable from the environment:
///   DAGRUN_MAX_WORKERS          >= 0, 0 = auto
///   DAGRUN_CONTINUE_ON_FAILURE  1/0, true/false, yes/no
///   DAGRUN_LOG_LEVEL            spdlog level name
struct ExecutorSettings {
  int max_workers = 0;
  bool continue_on_failure = true;
  std::string log_level = "info";

  /// Read settings from the environment. Invalid values are reported through
  /// `logger` (if any) and replaced by the defaults above.
  static ExecutorSettings
  from_environment(const std::shared_ptr<core::ILogger> &logger = nullptr);

  [[nodiscard]] core::PlanExecutorConfig executor_config() const;
  [[nodiscard]] core::PlanConfig plan_config() const;
};

/// Parse an integer environment variable, falling back on absence or on an
/// invalid value.
int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger);

/// Parse a boolean environment variable, falling back on absence or on an
/// invalid value.
bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<core::ILogger> &logger);

} // namespace dagrun::infra
