#pragma once

#include <string>

namespace dagrun::core {

/// Logger interface used by the executor. Concrete implementations live in
/// infra. Every entry carries the plan it belongs to as trace_id.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void debug(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace dagrun::core
