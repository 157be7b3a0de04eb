#include "scheduler.hpp"
#include <algorithm>
#include <exception>

namespace cis {

Scheduler::Scheduler(Logger& log, Millis max_backoff)
: log_(log), max_backoff_(max_backoff) {}

Scheduler::~Scheduler(){
  stop(Millis(0));
}

Millis Scheduler::backoff_for(Millis interval, int failures, Millis cap){
  if(failures<=0) return interval;
  const Millis top = std::max(cap, interval);
  Millis b = interval;
  for(int i=0; i<failures && b<top; i++) b *= 2;
  return std::min(b, top);
}

bool Scheduler::register_task(const std::string& name, const std::string& transport,
                              Millis interval, Millis timeout, TaskFn fn, std::string& err){
  std::lock_guard<std::mutex> lk(m_);
  if(started_){ err="cannot register '"+name+"' after start"; return false; }
  if(interval.count()<=0 || timeout.count()<=0){ err="task '"+name+"' needs a positive interval and timeout"; return false; }
  if(!fn){ err="task '"+name+"' has no body"; return false; }
  for(const auto& s : slots_)
    if(s->rec.name==name){ err="task '"+name+"' registered twice"; return false; }
  auto s = std::make_unique<Slot>();
  s->rec.name=name;
  s->rec.transport=transport;
  s->rec.interval=interval;
  s->rec.timeout=timeout;
  s->rec.backoff=interval;
  s->fn=std::move(fn);
  slots_.push_back(std::move(s));
  return true;
}

void Scheduler::start(){
  std::lock_guard<std::mutex> lk(m_);
  if(started_) return;
  started_=true;
  const auto now = Clock::now();
  for(auto& s : slots_){
    s->next_due = now;
    Slot* raw = s.get();
    s->th = std::thread([this, raw]{ worker(raw); });
  }
  log_.log(LogLevel::INFO, "Scheduler started with %zu tasks.", slots_.size());
}

void Scheduler::worker(Slot* s){
  std::unique_lock<std::mutex> lk(m_);
  for(;;){
    while(!stopping_ && !s->wake && Clock::now()<s->next_due)
      cv_.wait_until(lk, s->next_due);
    if(stopping_) break;

    s->wake=false;
    s->rec.running=true;
    in_flight_++;
    const auto started = Clock::now();
    s->rec.last_run = started;
    const auto deadline = started + s->rec.timeout;
    lk.unlock();

    TaskContext ctx(cancel_, deadline);
    Error err;
    bool ok=false;
    try {
      ok = s->fn(ctx, err);
    } catch(const std::exception& e){
      ok=false;
      err.set(ErrorKind::Transport, std::string("unhandled exception: ")+e.what());
    }
    if(ok && Clock::now()>deadline){
      ok=false;
      err.set(ErrorKind::Timeout, "run exceeded its timeout");
    }
    if(!ok && err.ok()) err.set(ErrorKind::Transport, "run failed");

    lk.lock();
    finish_run(s, ok, err, started);
    s->rec.running=false;
    in_flight_--;
    cv_.notify_all();
  }
}

// Called with m_ held.
void Scheduler::finish_run(Slot* s, bool ok, const Error& err, Clock::time_point started){
  TaskRecord& r = s->rec;
  r.runs++;
  const auto now = Clock::now();
  if(ok){
    if(r.consecutive_failures>0)
      log_.log(LogLevel::INFO, "Task %s recovered after %d failed runs.", r.name.c_str(), r.consecutive_failures);
    r.consecutive_failures=0;
    r.backoff=r.interval;
    s->next_due = started + r.interval;
    if(s->next_due<now){
      const auto missed = (now - s->next_due) / r.interval + 1;
      s->next_due += r.interval * missed;
      r.skipped += (uint64_t)missed;
      log_.log(LogLevel::DEBUG, "Task %s overran, skipped %lld slot(s).", r.name.c_str(), (long long)missed);
    }
    return;
  }
  r.failures++;
  r.consecutive_failures++;
  r.backoff = backoff_for(r.interval, r.consecutive_failures, max_backoff_);
  s->next_due = now + r.backoff;
  log_.log(LogLevel::WARN, "Task %s failed (%s: %s), %d in a row, next run in %lld ms.",
           r.name.c_str(), kind_str(err.kind), err.what.c_str(), r.consecutive_failures,
           (long long)r.backoff.count());
}

void Scheduler::stop(Millis grace){
  std::unique_lock<std::mutex> lk(m_);
  if(!started_) return;
  if(!stopping_){
    stopping_=true;
    cv_.notify_all();
    if(!cv_.wait_for(lk, grace, [this]{ return in_flight_==0; }))
      log_.log(LogLevel::WARN, "%d task(s) still running after %lld ms grace, cancelling.",
               in_flight_, (long long)grace.count());
  }
  lk.unlock();
  cancel_.raise();
  for(auto& s : slots_)
    if(s->th.joinable()) s->th.join();
}

bool Scheduler::trigger(const std::string& name){
  std::lock_guard<std::mutex> lk(m_);
  for(auto& s : slots_){
    if(s->rec.name==name){
      s->wake=true;
      cv_.notify_all();
      return true;
    }
  }
  return false;
}

std::vector<TaskRecord> Scheduler::records() const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<TaskRecord> out;
  for(const auto& s : slots_) out.push_back(s->rec);
  return out;
}

bool Scheduler::record(const std::string& name, TaskRecord& out) const {
  std::lock_guard<std::mutex> lk(m_);
  for(const auto& s : slots_)
    if(s->rec.name==name){ out=s->rec; return true; }
  return false;
}

} // namespace cis
