#include "can_driver.hpp"
#include <algorithm>
#include <cstdio>

namespace cis {

CanSettings CanSettings::from(const Config& C){
  CanSettings S;
  S.signals = C.can_signals;
  S.timeout = std::chrono::milliseconds(C.can_timeout_ms);
  S.retry.retries = C.can_retries;
  S.retry.delay = std::chrono::milliseconds(C.can_retry_delay_ms);
  return S;
}

BusRequest can_request(const CanSignalSpec& s, const CanSettings& S){
  BusRequest r;
  r.expected_id = (uint32_t)s.response_id;
  r.response_length = (size_t)(s.offset + s.length);
  r.timeout = S.timeout;
  r.retry_budget = S.retry.retries;
  return r;
}

bool can_decode(const CanSignalSpec& s, const CanFrame& f, double& value, Error& err){
  if(f.dlc < s.offset + s.length){
    char msg[80];
    std::snprintf(msg, sizeof(msg), "CAN 0x%X: dlc %d too short for %s", (unsigned)f.id, f.dlc, s.name.c_str());
    err.set(ErrorKind::Protocol, msg);
    return false;
  }
  uint32_t raw=0;
  for(int i=0; i<s.length; i++) raw |= (uint32_t)f.data[s.offset+i] << (8*i);
  value = raw * s.scale;
  return true;
}

CanDriver::CanDriver(const CanSettings& S, CanBus& bus, StateStore& store, Logger& log)
: S_(S), bus_(bus), owner_(store.attach(TransportKind::CAN, "can")), log_(log) {}

bool CanDriver::claim_channels(std::string& err){
  if(!owner_.claim(STATUS_ID, err)) return false;
  for(const auto& s : S_.signals){
    if(!owner_.claim(s.name, err)) return false;
  }
  return true;
}

bool CanDriver::transact(const CanSignalSpec& sig, const BusRequest& req, TaskContext& ctx,
                         double& value, Error& err){
  stats_.transactions++;
  if(sig.request_id>=0){
    CanFrame out;
    out.id = (uint32_t)sig.request_id;
    out.extended = sig.request_id > 0x7FF;
    out.dlc = 0;
    if(!bus_.send(out, err)) return false;
  }
  const auto deadline = std::min(Clock::now()+req.timeout, ctx.deadline());
  for(;;){
    if(ctx.cancelled()){ err.set(ErrorKind::Cancelled, "can transaction cancelled"); return false; }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline-Clock::now());
    if(left.count()<=0) break;
    CanFrame f;
    const int rc = bus_.receive(f, left, err);
    if(rc<0) return false;
    if(rc==0) continue;
    activity_ = true;
    // Unrelated traffic is ignored; matching is by id only.
    if(f.id!=req.expected_id) continue;
    if(!can_decode(sig, f, value, err)){
      stats_.protocol_errors++;
      return false;
    }
    return true;
  }
  stats_.timeouts++;
  char msg[64];
  std::snprintf(msg, sizeof(msg), "no CAN response with id 0x%X", (unsigned)req.expected_id);
  err.set(ErrorKind::Timeout, msg);
  return false;
}

bool CanDriver::listen(TaskContext& ctx, Error& err){
  const auto deadline = std::min(Clock::now()+S_.timeout, ctx.deadline());
  while(!activity_){
    if(ctx.cancelled()) return true;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline-Clock::now());
    if(left.count()<=0) break;
    CanFrame f;
    const int rc = bus_.receive(f, left, err);
    if(rc<0) return false;
    if(rc>0) activity_ = true;
  }
  return true;
}

bool CanDriver::poll(TaskContext& ctx, Error& err){
  activity_ = false;
  ChannelOwner::Batch b;
  Error last;
  int failed=0;
  bool bus_ok=true;

  for(const auto& sig : S_.signals){
    const BusRequest req = can_request(sig, S_);
    double value=0.0;
    int attempts=0;
    Error e;
    RetryPolicy policy = S_.retry;
    policy.retries = req.retry_budget;
    const bool ok = run_with_retries(policy, ctx.token(), ctx.deadline(),
                                     [&](Error& a){ return transact(sig, req, ctx, value, a); }, e, &attempts);
    if(attempts>1) stats_.retries += attempts-1;
    if(ok){
      b.set(sig.name, Reading::number(value, sig.unit));
      continue;
    }
    if(e.kind==ErrorKind::Cancelled){
      owner_.commit(b);
      err=e;
      return false;
    }
    stats_.failures++;
    failed++;
    last=e;
    b.mark(sig.name, Health::Stale);
    log_.log(LogLevel::DEBUG, "can %s: %s after %d attempt(s)", sig.name.c_str(), e.what.c_str(), attempts);
  }

  if(!activity_){
    Error e;
    if(!listen(ctx, e)){ bus_ok=false; last=e; }
  }
  b.set(STATUS_ID, Reading::label(activity_ ? "ON" : "OFF"));
  owner_.commit(b);

  if(!bus_ok){
    err.set(ErrorKind::Transport, "can bus: "+last.what);
    return false;
  }
  if(failed && failed==(int)S_.signals.size()){
    err.set(last.kind, "all "+std::to_string(failed)+" can signal(s) failed: "+last.what);
    return false;
  }
  return true;
}

} // namespace cis
