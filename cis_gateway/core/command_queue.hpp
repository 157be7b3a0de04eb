#pragma once
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <vector>
#include "../common/error.hpp"

namespace cis {

enum class PwmOp { Init, Duty, Enable, Disable };

inline const char* pwm_op_str(PwmOp op){
  switch(op){
    case PwmOp::Init:    return "init";
    case PwmOp::Duty:    return "duty";
    case PwmOp::Enable:  return "enable";
    case PwmOp::Disable: return "disable";
  }
  return "init";
}

bool validate_pin(int pin, Error& err);
bool validate_frequency(int hz, Error& err);
bool validate_duty(double percent, Error& err);

struct PwmCommand {
  PwmOp op = PwmOp::Duty;
  int pin = 0;
  int frequency = 0;   // Init only
  double duty = 0.0;   // Duty only
  std::promise<Error> done;
};

// Bounded queue between command issuers (HTTP, MQTT) and the PWM task.
class CommandQueue {
  mutable std::mutex m_;
  std::deque<PwmCommand> q_;
  size_t depth_;
  std::function<void()> notify_;
public:
  explicit CommandQueue(size_t depth = 32) : depth_(depth) {}

  // Runs after every accepted submit, outside the queue lock.
  void set_notify(std::function<void()> fn);

  // Validates locally, then enqueues. The future resolves once the daemon
  // acknowledged or the command failed.
  bool submit(PwmOp op, int pin, int frequency, double duty, std::future<Error>& result, Error& err);
  size_t drain(std::vector<PwmCommand>& out);
  size_t size() const;
};

} // namespace cis
