#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../common/error.hpp"
#include "../common/logger.hpp"
#include "cancel.hpp"
#include "channel.hpp"

namespace cis {

using Millis = std::chrono::milliseconds;

struct TaskRecord {
  std::string name;
  std::string transport;        // "adc", "lin", ... or "mqtt"
  Millis interval{0};
  Millis timeout{0};
  Clock::time_point last_run{};
  int consecutive_failures = 0;
  Millis backoff{0};            // delay before the next run
  uint64_t runs = 0;
  uint64_t failures = 0;
  uint64_t skipped = 0;         // missed slots while a run overran
  bool running = false;
};

// Handed to every run: deadline and the cancellation signal of the engine.
class TaskContext {
  CancelToken& token_;
  Clock::time_point deadline_;
public:
  TaskContext(CancelToken& token, Clock::time_point deadline) : token_(token), deadline_(deadline) {}
  bool cancelled() const { return token_.raised(); }
  Clock::time_point deadline() const { return deadline_; }
  // false when cancelled during the sleep
  bool sleep_for(Millis d){ return token_.sleep_for(d); }
  CancelToken& token(){ return token_; }
};

// A run returns true on success; on false, err tells the scheduler why.
using TaskFn = std::function<bool(TaskContext&, Error&)>;

// One worker thread per task:
// - at most one run of a task at a time, overrun slots are skipped
// - failures back off exponentially up to max_backoff, success resets
// - stop(grace) lets in-flight runs finish, then raises cancellation
class Scheduler {
  struct Slot {
    TaskRecord rec;
    TaskFn fn;
    Clock::time_point next_due{};
    bool wake = false;
    std::thread th;
  };

  Logger& log_;
  const Millis max_backoff_;
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::vector<std::unique_ptr<Slot>> slots_;
  CancelToken cancel_;
  bool started_ = false;
  bool stopping_ = false;
  int in_flight_ = 0;

  void worker(Slot* s);
  void finish_run(Slot* s, bool ok, const Error& err, Clock::time_point started);
public:
  Scheduler(Logger& log, Millis max_backoff);
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  bool register_task(const std::string& name, const std::string& transport,
                     Millis interval, Millis timeout, TaskFn fn, std::string& err);
  void start();
  void stop(Millis grace);
  // Run the task as soon as it is idle. Coalesces: one pending wake at most.
  bool trigger(const std::string& name);
  std::vector<TaskRecord> records() const;
  bool record(const std::string& name, TaskRecord& out) const;

  static Millis backoff_for(Millis interval, int failures, Millis cap);
};

} // namespace cis
