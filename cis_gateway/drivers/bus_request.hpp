#pragma once
#include <chrono>
#include <cstdint>
#include <vector>
#include "../common/error.hpp"
#include "../core/cancel.hpp"
#include "../core/channel.hpp"

namespace cis {

// One outgoing bus transaction. Lives for a single driver invocation.
struct BusRequest {
  std::vector<uint8_t> payload;
  uint32_t expected_id = 0;          // LIN PID or CAN response arbitration id
  size_t response_length = 0;        // bytes expected after the header
  std::chrono::milliseconds timeout{1000};
  int retry_budget = 0;
};

struct RetryPolicy {
  int retries = 0;                   // attempts = retries + 1
  std::chrono::milliseconds delay{0};
  bool exponential = false;          // delay doubles after each attempt
};

struct DriverStats {
  uint64_t transactions = 0;
  uint64_t retries = 0;
  uint64_t timeouts = 0;
  uint64_t protocol_errors = 0;
  uint64_t failures = 0;             // budget exhausted
};

// Runs `attempt(err)` until it succeeds, fails with a non-retryable error,
// the budget is spent, the deadline passes or `cancel` is raised.
template <class Attempt>
bool run_with_retries(const RetryPolicy& p, CancelToken& cancel, Clock::time_point deadline,
                      Attempt attempt, Error& err, int* attempts_out = nullptr){
  std::chrono::milliseconds delay = p.delay;
  for(int i=0; i<=p.retries; i++){
    if(attempts_out) *attempts_out = i+1;
    if(cancel.raised()){ err.set(ErrorKind::Cancelled, "cancelled"); return false; }
    if(Clock::now()>=deadline){
      if(err.ok()) err.set(ErrorKind::Timeout, "task deadline reached");
      return false;
    }
    Error e;
    if(attempt(e)){ err.clear(); return true; }
    err = e;
    if(!err.retryable() || i==p.retries) return false;
    if(delay.count()>0 && !cancel.sleep_for(delay)){
      err.set(ErrorKind::Cancelled, "cancelled during retry delay");
      return false;
    }
    if(p.exponential) delay *= 2;
  }
  return false;
}

} // namespace cis
