#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace cis {

// Cancellation signal with interruptible sleeps. Raised once, never reset.
class CancelToken {
  std::atomic<bool> raised_{false};
  mutable std::mutex m_;
  std::condition_variable cv_;
public:
  void raise(){
    { std::lock_guard<std::mutex> lk(m_); raised_.store(true); }
    cv_.notify_all();
  }
  bool raised() const { return raised_.load(); }

  // false when cancelled before the full duration elapsed
  template <class Rep, class Period>
  bool sleep_for(std::chrono::duration<Rep,Period> d){
    std::unique_lock<std::mutex> lk(m_);
    return !cv_.wait_for(lk, d, [this]{ return raised_.load(); });
  }
};

} // namespace cis
