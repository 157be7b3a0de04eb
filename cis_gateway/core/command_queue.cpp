#include "command_queue.hpp"
#include <cmath>

namespace cis {

bool validate_pin(int pin, Error& err){
  if(pin<0){ err.set(ErrorKind::Validation, "invalid pin "+std::to_string(pin)); return false; }
  return true;
}

bool validate_frequency(int hz, Error& err){
  if(hz<=0){ err.set(ErrorKind::Validation, "frequency must be > 0, got "+std::to_string(hz)); return false; }
  return true;
}

bool validate_duty(double percent, Error& err){
  if(!std::isfinite(percent) || percent<0.0 || percent>100.0){
    err.set(ErrorKind::Validation, "duty cycle must be within 0..100, got "+std::to_string(percent));
    return false;
  }
  return true;
}

void CommandQueue::set_notify(std::function<void()> fn){
  std::lock_guard<std::mutex> lk(m_);
  notify_ = std::move(fn);
}

bool CommandQueue::submit(PwmOp op, int pin, int frequency, double duty, std::future<Error>& result, Error& err){
  if(!validate_pin(pin, err)) return false;
  if(op==PwmOp::Init && !validate_frequency(frequency, err)) return false;
  if(op==PwmOp::Duty && !validate_duty(duty, err)) return false;

  std::function<void()> notify;
  {
    std::lock_guard<std::mutex> lk(m_);
    if(q_.size()>=depth_){
      err.set(ErrorKind::Busy, "command queue full");
      return false;
    }
    PwmCommand c;
    c.op=op; c.pin=pin; c.frequency=frequency; c.duty=duty;
    result = c.done.get_future();
    q_.push_back(std::move(c));
    notify = notify_;
  }
  if(notify) notify();
  return true;
}

size_t CommandQueue::drain(std::vector<PwmCommand>& out){
  std::lock_guard<std::mutex> lk(m_);
  size_t n=q_.size();
  for(auto& c : q_) out.push_back(std::move(c));
  q_.clear();
  return n;
}

size_t CommandQueue::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return q_.size();
}

} // namespace cis
