#include "infra/config.h"

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace dagrun::infra {
namespace {

void warn_invalid(const std::shared_ptr<core::ILogger> &logger,
                  const char *name, const char *raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

} // namespace

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && (allow_zero ? value >= 0 : value > 0) &&
                     value <= 4096;
  if (!valid) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }
  return static_cast<int>(value);
}

bool parse_env_bool(const char *name, bool fallback,
                    const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "1" || value == "true" || value == "yes") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no") {
    return false;
  }
  warn_invalid(logger, name, raw, fallback ? "true" : "false");
  return fallback;
}

ExecutorSettings
ExecutorSettings::from_environment(const std::shared_ptr<core::ILogger> &logger) {
  ExecutorSettings settings;
  settings.max_workers =
      parse_env_int("DAGRUN_MAX_WORKERS", settings.max_workers, true, logger);
  settings.continue_on_failure = parse_env_bool(
      "DAGRUN_CONTINUE_ON_FAILURE", settings.continue_on_failure, logger);

  const char *level = std::getenv("DAGRUN_LOG_LEVEL");
  if (level && level[0] != '\0') {
    settings.log_level = level;
  }
  return settings;
}

core::PlanExecutorConfig ExecutorSettings::executor_config() const {
  core::PlanExecutorConfig config;
  config.max_workers = max_workers;
  return config;
}

core::PlanConfig ExecutorSettings::plan_config() const {
  core::PlanConfig config;
  config.continue_on_failure = continue_on_failure;
  return config;
}

} // namespace dagrun::infra
