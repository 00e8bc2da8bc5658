#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace dagrun::core {

/// Thread-safe, one-way cancellation flag.
///
/// Workers and the queuer poll is_canceled() at the top of every gate pass;
/// the flag itself never blocks. Callbacks let an executor wake threads that
/// are parked on the coordination gate so they observe the request promptly.
class CancelToken {
public:
  using Callback = std::function<void()>;
  using CallbackId = std::uint64_t;

  CancelToken() = default;

  /// Request cancellation. Thread-safe, idempotent. Callbacks run on the
  /// calling thread, outside the token's own lock, on the first request only.
  /// Must not be called from inside a coordination gate transform.
  void request_cancel();

  [[nodiscard]] bool is_canceled() const noexcept;

  /// Throw std::runtime_error if cancellation was requested. Meant for
  /// checkpoints inside long-running node actions.
  void throw_if_canceled() const;

  /// Register a callback invoked when cancellation is requested. If already
  /// canceled the callback runs immediately and 0 is returned.
  CallbackId on_cancel(Callback cb);

  /// Unregister a callback. Unknown ids are ignored.
  void remove_callback(CallbackId id);

  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
  std::mutex cb_mutex_;
  CallbackId next_id_ = 1;
  std::vector<std::pair<CallbackId, Callback>> callbacks_;
};

} // namespace dagrun::core
