#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vindex {

// One-shot cancellation signal shared between a supervisor and its task.
class CancellationToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cancelled_;
  }

  // Sleeps up to d; returns true as soon as the token is cancelled.
  template <class Rep, class Period>
  bool waitFor(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, d, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
  bool cancelled_ = false;
};

} // namespace vindex
