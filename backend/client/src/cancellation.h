#ifndef CONVERTHUB_CLIENT_CANCELLATION_H
#define CONVERTHUB_CLIENT_CANCELLATION_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace converthub::client {

// Lets one thread abandon another's wait. Cancel() wakes any sleeper immediately.
class CancellationToken {
 public:
  void Cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Wakes sleepers without cancelling them, so they re-check outside state.
  void Notify() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++generation_;
    }
    cv_.notify_all();
  }

  std::uint64_t generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
  }

  // Sleeps up to `duration`, or until Cancel() or a Notify() issued after `since`.
  // Returns true if the token is cancelled.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> duration, std::uint64_t since) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this, since]() { return cancelled_ || generation_ != since; });
    return cancelled_;
  }

  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> duration) {
    return WaitFor(duration, generation());
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancelled_ = false;
  std::uint64_t generation_ = 0;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_CANCELLATION_H
