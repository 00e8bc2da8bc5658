#include "core/task_error.h"

#include <stdexcept>

namespace dagrun::core {

TaskError TaskError::from_exception(std::exception_ptr error,
                                    ErrorCategory category) {
  const int code = category == ErrorCategory::Plan ? 5001 : 5002;
  if (!error) {
    return TaskError(category, code, false, "Unknown failure",
                     "from_exception called without an active exception");
  }

  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return TaskError(category, code, false, e.what(),
                     std::string("Uncaught exception: ") + e.what());
  } catch (...) {
    return TaskError(category, code, false, "Unknown failure",
                     "Uncaught exception of non-standard type");
  }
}

} // namespace dagrun::core
