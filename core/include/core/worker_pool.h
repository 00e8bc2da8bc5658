#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dagrun::core {

/// A named, fixed-capacity set of threads scoped to its owner.
///
/// Each execute() call starts one thread named "<pool name> Thread <n>".
/// Destruction joins every thread, so a pool declared in a function body is
/// torn down on every exit path.
class WorkerPool {
public:
  WorkerPool(std::string name, std::size_t max_threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Run `job` on a new pool thread. Throws std::logic_error once the pool
  /// is at capacity or stopped.
  void execute(std::function<void()> job);

  /// Join every thread, then rethrow the first exception a job let escape.
  void stop();

  [[nodiscard]] const std::string &name() const { return name_; }

  /// Name of the calling thread if it belongs to a pool, else empty.
  static std::string current_thread_name();

private:
  void join_all();

  std::string name_;
  std::size_t max_threads_;
  std::vector<std::thread> threads_;
  bool stopped_ = false;

  std::mutex failure_mutex_;
  std::exception_ptr first_failure_;
};

} // namespace dagrun::core
