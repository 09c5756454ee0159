#pragma once

#include <atomic>
#include <chrono>

namespace gateway {

class CancelToken {
 public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel() { cancelled_.store(true); }

  // timeout_seconds <= 0 means no deadline.
  void SetTimeout(int timeout_seconds) {
    if (timeout_seconds <= 0) {
      has_deadline_ = false;
      return;
    }
    deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    has_deadline_ = true;
  }

  bool IsCancelled() const {
    if (cancelled_.load()) return true;
    return has_deadline_ && std::chrono::steady_clock::now() >= deadline_;
  }

 private:
  std::atomic<bool> cancelled_{false};
  bool has_deadline_ = false;
  std::chrono::steady_clock::time_point deadline_;
};

}  // namespace gateway
