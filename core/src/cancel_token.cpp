#include "core/cancel_token.h"

#include <algorithm>
#include <stdexcept>

namespace dagrun::core {

void CancelToken::request_cancel() {
  bool expected = false;
  if (!canceled_.compare_exchange_strong(expected, true,
                                         std::memory_order_release,
                                         std::memory_order_relaxed)) {
    return;
  }

  std::vector<std::pair<CallbackId, Callback>> callbacks;
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    callbacks.swap(callbacks_);
  }
  for (auto &entry : callbacks) {
    if (entry.second) {
      entry.second();
    }
  }
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

void CancelToken::throw_if_canceled() const {
  if (is_canceled()) {
    throw std::runtime_error("CancelToken: operation canceled");
  }
}

CancelToken::CallbackId CancelToken::on_cancel(Callback cb) {
  {
    std::lock_guard<std::mutex> lock(cb_mutex_);
    if (!is_canceled()) {
      const CallbackId id = next_id_++;
      callbacks_.emplace_back(id, std::move(cb));
      return id;
    }
  }
  // Already canceled: request_cancel() has drained the list, run inline.
  if (cb) {
    cb();
  }
  return 0;
}

void CancelToken::remove_callback(CallbackId id) {
  std::lock_guard<std::mutex> lock(cb_mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const auto &entry) {
                                    return entry.first == id;
                                  }),
                   callbacks_.end());
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace dagrun::core
