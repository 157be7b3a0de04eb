#include "lin_driver.hpp"
#include <algorithm>
#include <cstdio>

namespace cis {

LinSettings LinSettings::from(const Config& C){
  LinSettings S;
  S.frames = C.lin_frames;
  S.response_timeout = std::chrono::milliseconds(C.lin_response_timeout_ms);
  S.break_length = std::chrono::microseconds(C.lin_break_us);
  S.retry.retries = C.lin_retries;
  S.retry.delay = std::chrono::milliseconds(C.lin_retry_delay_ms);
  return S;
}

uint8_t lin_checksum(uint8_t pid, const uint8_t* data, size_t n){
  unsigned sum = pid;
  for(size_t i=0; i<n; i++) sum += data[i];
  return (uint8_t)(~(sum & 0xFF));
}

BusRequest lin_request(const LinFrameSpec& f, const LinSettings& S){
  BusRequest r;
  r.payload = { LIN_SYNC, (uint8_t)f.pid };
  r.expected_id = (uint32_t)f.pid;
  r.response_length = 3;
  r.timeout = S.response_timeout;
  r.retry_budget = S.retry.retries;
  return r;
}

bool lin_extract(const std::vector<uint8_t>& buf, uint8_t pid, size_t len, std::vector<uint8_t>& out){
  for(size_t i=0; i+1<buf.size(); i++){
    if(buf[i]!=LIN_SYNC || buf[i+1]!=pid) continue;
    if(buf.size() < i+2+len) return false;
    out.assign(buf.begin()+i+2, buf.begin()+i+2+len);
    return true;
  }
  return false;
}

bool lin_decode(uint8_t pid, const std::vector<uint8_t>& resp, double& value, Error& err){
  if(resp.size()!=3){
    err.set(ErrorKind::Protocol, "LIN response length "+std::to_string(resp.size()));
    return false;
  }
  const uint8_t expect = lin_checksum(pid, resp.data(), 2);
  if(resp[2]!=expect){
    char msg[64];
    std::snprintf(msg, sizeof(msg), "LIN checksum mismatch pid=0x%02X got=0x%02X want=0x%02X",
                  pid, resp[2], expect);
    err.set(ErrorKind::Protocol, msg);
    return false;
  }
  value = (resp[0] | (resp[1] << 8)) / 100.0;
  return true;
}

LinDriver::LinDriver(const LinSettings& S, SerialPort& port, StateStore& store, Logger& log)
: S_(S), port_(port), owner_(store.attach(TransportKind::LIN, "lin")), log_(log) {}

bool LinDriver::claim_channels(std::string& err){
  for(const auto& f : S_.frames){
    if(!owner_.claim(f.name, err)) return false;
  }
  return true;
}

bool LinDriver::transact(const BusRequest& req, TaskContext& ctx, double& value, Error& err){
  stats_.transactions++;
  port_.flush_input();
  if(!port_.send_break(S_.break_length, err)) return false;
  if(!port_.write(req.payload.data(), req.payload.size(), err)) return false;

  const auto deadline = std::min(Clock::now()+req.timeout, ctx.deadline());
  const uint8_t pid = (uint8_t)req.expected_id;
  std::vector<uint8_t> buf, resp;
  uint8_t chunk[32];
  for(;;){
    if(ctx.cancelled()){ err.set(ErrorKind::Cancelled, "lin transaction cancelled"); return false; }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline-Clock::now());
    if(left.count()<=0) break;
    const long n = port_.read(chunk, sizeof(chunk), std::min(left, std::chrono::milliseconds(50)), err);
    if(n<0) return false;
    if(n==0) continue;
    buf.insert(buf.end(), chunk, chunk+n);
    if(lin_extract(buf, pid, req.response_length, resp)){
      if(!lin_decode(pid, resp, value, err)){
        stats_.protocol_errors++;
        return false;
      }
      return true;
    }
  }
  stats_.timeouts++;
  char msg[64];
  std::snprintf(msg, sizeof(msg), "no LIN response for pid=0x%02X (%zu bytes)", pid, buf.size());
  err.set(ErrorKind::Timeout, msg);
  return false;
}

bool LinDriver::poll(TaskContext& ctx, Error& err){
  ChannelOwner::Batch b;
  Error last;
  int failed=0;
  for(const auto& f : S_.frames){
    const BusRequest req = lin_request(f, S_);
    double value=0.0;
    int attempts=0;
    Error e;
    RetryPolicy policy = S_.retry;
    policy.retries = req.retry_budget;
    const bool ok = run_with_retries(policy, ctx.token(), ctx.deadline(),
                                     [&](Error& a){ return transact(req, ctx, value, a); }, e, &attempts);
    if(attempts>1) stats_.retries += attempts-1;
    if(ok){
      b.set(f.name, Reading::number(value, f.unit));
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
    b.mark(f.name, Health::Stale);
    log_.log(LogLevel::DEBUG, "lin %s: %s after %d attempt(s)", f.name.c_str(), e.what.c_str(), attempts);
  }
  owner_.commit(b);
  // A dead frame only goes stale; the task backs off when nothing answers.
  if(failed && failed==(int)S_.frames.size()){
    err.set(last.kind, "all "+std::to_string(failed)+" lin frame(s) failed: "+last.what);
    return false;
  }
  return true;
}

} // namespace cis
