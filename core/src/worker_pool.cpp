#include "core/worker_pool.h"

#include <stdexcept>
#include <utility>

namespace dagrun::core {
namespace {

thread_local std::string t_thread_name;

} // namespace

WorkerPool::WorkerPool(std::string name, std::size_t max_threads)
    : name_(std::move(name)), max_threads_(max_threads) {
  threads_.reserve(max_threads_);
}

WorkerPool::~WorkerPool() { join_all(); }

void WorkerPool::execute(std::function<void()> job) {
  if (stopped_) {
    throw std::logic_error("Worker pool '" + name_ + "' has been stopped");
  }
  if (threads_.size() >= max_threads_) {
    throw std::logic_error("Worker pool '" + name_ + "' is at capacity (" +
                           std::to_string(max_threads_) + " threads)");
  }

  std::string thread_name =
      name_ + " Thread " + std::to_string(threads_.size() + 1);
  threads_.emplace_back(
      [this, thread_name = std::move(thread_name), job = std::move(job)]() {
        t_thread_name = thread_name;
        try {
          job();
        } catch (...) {
          std::lock_guard<std::mutex> lock(failure_mutex_);
          if (!first_failure_) {
            first_failure_ = std::current_exception();
          }
        }
      });
}

void WorkerPool::stop() {
  join_all();
  std::exception_ptr failure;
  {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    failure = std::exchange(first_failure_, nullptr);
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
}

std::string WorkerPool::current_thread_name() { return t_thread_name; }

void WorkerPool::join_all() {
  stopped_ = true;
  for (auto &t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

} // namespace dagrun::core
