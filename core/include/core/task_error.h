#pragma once

#include <exception>
#include <map>
#include <string>

namespace dagrun::core {

/// Error categories: lets callers branch on the failure class without
/// string parsing.
enum class ErrorCategory {
  Execution, // A node's own work failed (node-local)
  Plan,      // Graph bookkeeping failed (plan-fatal)
  Canceled,  // Cancellation requested before work was scheduled
  Internal,  // Invalid configuration / programming error
  Unknown
};

/// Structured error type for every failure the executor reports.
struct TaskError {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0; // Numeric code for telemetry aggregation

  bool retryable = false;
  std::string user_message;     // Short, stable message
  std::string internal_message; // Technical details for logging
  std::map<std::string, std::string> details; // e.g. {"node_id", "compile"}

  TaskError() = default;

  TaskError(ErrorCategory cat, int c, std::string msg)
      : category(cat), code(c), user_message(msg),
        internal_message(std::move(msg)) {}

  TaskError(ErrorCategory cat, int c, bool retry, std::string user_msg,
            std::string internal_msg,
            std::map<std::string, std::string> dets = {})
      : category(cat), code(c), retryable(retry),
        user_message(std::move(user_msg)),
        internal_message(std::move(internal_msg)), details(std::move(dets)) {}

  static TaskError Canceled(std::string msg = "Build cancelled") {
    return {ErrorCategory::Canceled, 1, std::move(msg)};
  }
  static TaskError Execution(std::string msg) {
    return {ErrorCategory::Execution, 2, std::move(msg)};
  }
  static TaskError Plan(std::string msg) {
    return {ErrorCategory::Plan, 3, std::move(msg)};
  }
  static TaskError Internal(std::string msg) {
    return {ErrorCategory::Internal, 4, std::move(msg)};
  }

  /// Convert a captured exception into a TaskError of the given category.
  /// std::exception subclasses keep their what() text.
  static TaskError from_exception(std::exception_ptr error,
                                  ErrorCategory category);
};

/// Convert ErrorCategory to string for logging.
inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Execution:
    return "Execution";
  case ErrorCategory::Plan:
    return "Plan";
  case ErrorCategory::Canceled:
    return "Canceled";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace dagrun::core
