#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace dagrun::infra {
namespace {

/// ConsoleLogger: spdlog-based structured logger.
class ConsoleLogger : public core::ILogger {
public:
  explicit ConsoleLogger(spdlog::level::level_enum level) {
    logger_ = spdlog::get("dagrun");
    if (!logger_) {
      logger_ = spdlog::stderr_color_mt("dagrun");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] [%t] %v");
    logger_->set_level(level);
  }

  void debug(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->debug("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<core::ILogger> create_console_logger(const std::string &level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"; only honour "off" when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  return std::make_unique<ConsoleLogger>(parsed);
}

} // namespace dagrun::infra
