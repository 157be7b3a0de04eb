#include "pwm_client.hpp"
#include <future>
#include "../common/json_fields.hpp"

namespace cis {

PwmSettings PwmSettings::from(const Config& C){
  PwmSettings S;
  S.timeout = std::chrono::milliseconds(C.pwm_timeout_ms);
  S.retry.retries = C.pwm_retries;
  S.retry.delay = std::chrono::milliseconds(C.pwm_retry_backoff_ms);
  S.retry.exponential = true;
  S.pins = C.pwm_pins;
  S.frequency = C.pwm_frequency;
  S.initial_duty = C.pwm_initial_duty;
  S.status_interval = std::chrono::milliseconds(C.pwm_status_interval_ms);
  return S;
}

std::chrono::milliseconds PwmSettings::call_budget() const {
  std::chrono::milliseconds total = timeout*(retry.retries+1);
  std::chrono::milliseconds d = retry.delay;
  for(int i=0; i<retry.retries; i++){
    total += d;
    if(retry.exponential) d *= 2;
  }
  return total;
}

std::chrono::milliseconds PwmSettings::run_budget() const {
  return call_budget()*(long long)(pins.size()*2 + 2);
}

bool parse_pwm_status(const std::string& body, std::vector<PwmChannelState>& out, Error& err){
  std::vector<std::string> items;
  if(!json_objects(body, "pins", items)){
    err.set(ErrorKind::Protocol, "status reply has no pins array");
    return false;
  }
  out.clear();
  for(const auto& it : items){
    PwmChannelState s;
    if(!json_int(it, "gpio_pin", s.pin)){
      err.set(ErrorKind::Protocol, "status entry without gpio_pin: "+it);
      return false;
    }
    json_int(it, "frequency", s.frequency);
    json_number(it, "duty_cycle", s.duty);
    json_bool(it, "enabled", s.enabled);
    s.has_rpm = json_number(it, "rpm", s.rpm);
    s.lifecycle = s.enabled ? PwmLifecycle::Enabled : PwmLifecycle::Initialized;
    out.push_back(s);
  }
  return true;
}

PwmClient::PwmClient(const PwmSettings& S, HttpTransport& http, StateStore& store, Logger& log)
: S_(S), http_(http), owner_(store.attach(TransportKind::PWM, "pwm")), log_(log) {}

std::mutex& PwmClient::pin_lock(int pin){
  std::lock_guard<std::mutex> lk(m_);
  auto& p = locks_[pin];
  if(!p) p = std::make_unique<std::mutex>();
  return *p;
}

PwmChannelState PwmClient::tracked(int pin) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = pins_.find(pin);
  if(it!=pins_.end()) return it->second;
  PwmChannelState s;
  s.pin = pin;
  return s;
}

bool PwmClient::state(int pin, PwmChannelState& out) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = pins_.find(pin);
  if(it==pins_.end()) return false;
  out = it->second;
  return true;
}

void PwmClient::publish(const PwmChannelState& s, Health h){
  {
    std::lock_guard<std::mutex> lk(m_);
    pins_[s.pin] = s;
  }
  owner_.set_pwm(std::to_string(s.pin), s, h);
}

bool PwmClient::request(const std::string& method, const std::string& path, const std::string& body,
                        HttpResponse& resp, Error& err){
  HttpRequest req;
  req.method = method;
  req.path = path;
  req.body = body;
  req.timeout = S_.timeout;
  int attempts=0;
  const bool ok = run_with_retries(S_.retry, cancel_, Clock::time_point::max(), [&](Error& a){
    requests_++;
    resp = HttpResponse();
    if(!http_.perform(req, resp, a)) return false;
    if(resp.status<200 || resp.status>=300){
      // The daemon answered; repeating the request cannot change its mind.
      a.set(ErrorKind::Daemon, method+" "+path+" -> HTTP "+std::to_string(resp.status)+" "+resp.body);
      return false;
    }
    return true;
  }, err, &attempts);
  if(ok) return true;
  if(err.kind==ErrorKind::Transport || err.kind==ErrorKind::Timeout)
    err.set(ErrorKind::Daemon, err.what+" (after "+std::to_string(attempts)+" attempts)");
  return false;
}

bool PwmClient::command(PwmOp op, int pin, int frequency, double duty, Error& err){
  if(!validate_pin(pin, err)) return false;
  if(op==PwmOp::Init && !validate_frequency(frequency, err)) return false;
  if(op==PwmOp::Duty && !validate_duty(duty, err)) return false;

  std::lock_guard<std::mutex> pl(pin_lock(pin));
  PwmChannelState s = tracked(pin);
  if(op!=PwmOp::Init && s.lifecycle==PwmLifecycle::Uninitialized){
    err.set(ErrorKind::Validation, "pin "+std::to_string(pin)+" is not initialized");
    return false;
  }
  const std::string id = std::to_string(pin);
  std::string claim_err;
  if(!owner_.claim(id, claim_err)){
    err.set(ErrorKind::Validation, claim_err);
    return false;
  }

  JsonWriter w;
  w.integer("gpio_pin", pin);
  if(op==PwmOp::Init) w.integer("frequency", frequency);
  if(op==PwmOp::Duty) w.num("duty_cycle", duty);

  HttpResponse resp;
  if(!request("POST", std::string("/")+pwm_op_str(op), w.done(), resp, err)){
    if(err.kind!=ErrorKind::Cancelled) owner_.mark_unconfirmed(id);
    log_.log(LogLevel::WARN, "pwm %s pin %d failed: %s", pwm_op_str(op), pin, err.what.c_str());
    return false;
  }

  switch(op){
    case PwmOp::Init:
      s.frequency = frequency;
      s.enabled = false;
      s.lifecycle = PwmLifecycle::Initialized;
      break;
    case PwmOp::Duty:
      s.duty = duty;
      break;
    case PwmOp::Enable:
      s.enabled = true;
      s.lifecycle = PwmLifecycle::Enabled;
      break;
    case PwmOp::Disable:
      s.enabled = false;
      s.lifecycle = PwmLifecycle::Disabled;
      break;
  }
  s.pin = pin;
  s.last_ack = WallClock::now();
  publish(s, Health::Fresh);
  log_.log(LogLevel::DEBUG, "pwm %s pin %d acknowledged", pwm_op_str(op), pin);
  return true;
}

bool PwmClient::init(int pin, int frequency, Error& err){ return command(PwmOp::Init, pin, frequency, 0.0, err); }
bool PwmClient::set_duty(int pin, double percent, Error& err){ return command(PwmOp::Duty, pin, 0, percent, err); }
bool PwmClient::enable(int pin, Error& err){ return command(PwmOp::Enable, pin, 0, 0.0, err); }
bool PwmClient::disable(int pin, Error& err){ return command(PwmOp::Disable, pin, 0, 0.0, err); }

bool PwmClient::status(std::vector<PwmChannelState>& pins, Error& err){
  std::vector<int> known;
  {
    std::lock_guard<std::mutex> lk(m_);
    for(const auto& kv : pins_) known.push_back(kv.first);
  }
  HttpResponse resp;
  if(!request("GET", "/status", std::string(), resp, err) || !parse_pwm_status(resp.body, pins, err)){
    for(int pin : known) owner_.mark_unconfirmed(std::to_string(pin));
    return false;
  }

  const auto now = WallClock::now();
  for(const auto& d : pins){
    if(d.pin<0) continue;
    std::lock_guard<std::mutex> pl(pin_lock(d.pin));
    std::string claim_err;
    if(!owner_.claim(std::to_string(d.pin), claim_err)){
      log_.log(LogLevel::WARN, "pwm status: %s", claim_err.c_str());
      continue;
    }
    PwmChannelState s = tracked(d.pin);
    s.frequency = d.frequency;
    s.duty = d.duty;
    s.enabled = d.enabled;
    s.rpm = d.rpm;
    s.has_rpm = d.has_rpm;
    if(d.enabled) s.lifecycle = PwmLifecycle::Enabled;
    else if(s.lifecycle==PwmLifecycle::Enabled) s.lifecycle = PwmLifecycle::Disabled;
    else if(s.lifecycle==PwmLifecycle::Uninitialized) s.lifecycle = PwmLifecycle::Initialized;
    s.last_ack = now;
    publish(s, Health::Fresh);
  }

  // A pin the daemon no longer reports has lost its configuration there.
  for(int pin : known){
    bool reported=false;
    for(const auto& d : pins) if(d.pin==pin){ reported=true; break; }
    if(reported) continue;
    std::lock_guard<std::mutex> pl(pin_lock(pin));
    PwmChannelState s = tracked(pin);
    if(s.lifecycle==PwmLifecycle::Uninitialized) continue;
    log_.log(LogLevel::WARN, "pwm pin %d missing from daemon status", pin);
    s.lifecycle = PwmLifecycle::Uninitialized;
    s.enabled = false;
    publish(s, Health::Unconfirmed);
  }
  return true;
}

void PwmClient::execute(PwmCommand& cmd){
  Error err;
  switch(cmd.op){
    case PwmOp::Init:    init(cmd.pin, cmd.frequency, err); break;
    case PwmOp::Duty:    set_duty(cmd.pin, cmd.duty, err); break;
    case PwmOp::Enable:  enable(cmd.pin, err); break;
    case PwmOp::Disable: disable(cmd.pin, err); break;
  }
  cmd.done.set_value(err);
}

// ---- PwmTask ----

PwmTask::PwmTask(PwmClient& client, CommandQueue& queue, const PwmSettings& S, Logger& log)
: client_(client), queue_(queue), S_(S), log_(log), configured_(S.pins.size(), 0) {}

bool PwmTask::bring_up(TaskContext& ctx, Error& err){
  bool ok=true;
  for(size_t i=0; i<S_.pins.size() && !ctx.cancelled(); i++){
    const int pin = S_.pins[i];
    PwmChannelState prev;
    const bool known = client_.state(pin, prev);
    if(known && prev.lifecycle!=PwmLifecycle::Uninitialized && configured_[i]) continue;

    Error e;
    if(!known || prev.lifecycle==PwmLifecycle::Uninitialized){
      if(!client_.init(pin, S_.frequency, e)){ ok=false; err=e; continue; }
    }
    // After a daemon restart the last acknowledged duty is restored.
    const double duty = configured_[i] ? prev.duty : S_.initial_duty;
    if(!client_.set_duty(pin, duty, e)){ ok=false; err=e; continue; }
    if(!configured_[i])
      log_.log(LogLevel::INFO, "PWM pin %d up at %d Hz, duty %.1f%%.", pin, S_.frequency, duty);
    configured_[i]=1;
  }
  return ok;
}

bool PwmTask::run(TaskContext& ctx, Error& err){
  Error up_err;
  const bool up = bring_up(ctx, up_err);

  std::vector<PwmCommand> cmds;
  if(queue_.drain(cmds)){
    std::map<int, std::vector<PwmCommand*>> by_pin;
    for(auto& c : cmds) by_pin[c.pin].push_back(&c);
    if(by_pin.size()==1){
      for(auto* c : by_pin.begin()->second) client_.execute(*c);
    } else {
      std::vector<std::future<void>> jobs;
      for(auto& kv : by_pin){
        std::vector<PwmCommand*>* list = &kv.second;
        jobs.push_back(std::async(std::launch::async, [this, list]{
          for(auto* c : *list) client_.execute(*c);
        }));
      }
      for(auto& j : jobs) j.get();
    }
  }

  bool st=true;
  if(!ctx.cancelled() && Clock::now()>=next_status_){
    std::vector<PwmChannelState> pins;
    st = client_.status(pins, err);
    next_status_ = Clock::now() + S_.status_interval;
  }
  if(!up){ err=up_err; return false; }
  return st;
}

size_t PwmTask::abandon(){
  std::vector<PwmCommand> cmds;
  queue_.drain(cmds);
  for(auto& c : cmds){
    Error e;
    e.set(ErrorKind::Cancelled, "gateway shutting down");
    c.done.set_value(e);
  }
  return cmds.size();
}

} // namespace cis
