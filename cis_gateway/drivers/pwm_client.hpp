#pragma once
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/cancel.hpp"
#include "../core/command_queue.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "bus_request.hpp"
#include "http_transport.hpp"

namespace cis {

struct PwmSettings {
  std::chrono::milliseconds timeout{3000};
  RetryPolicy retry;                 // transport failures only
  std::vector<int> pins;             // brought up by the PWM task
  int frequency = 26000;
  double initial_duty = 10.0;
  std::chrono::milliseconds status_interval{5000};

  static PwmSettings from(const Config& C);
  // Worst case for one call: every attempt times out, plus the backoff waits.
  std::chrono::milliseconds call_budget() const;
  // Worst case for one PwmTask run: init and duty for every pin, plus status.
  std::chrono::milliseconds run_budget() const;
};

// Client of the PWM daemon's HTTP control protocol.
// Same-pin calls are serialized; calls for different pins run concurrently.
class PwmClient {
  PwmSettings S_;
  HttpTransport& http_;
  ChannelOwner owner_;
  Logger& log_;
  CancelToken cancel_;
  mutable std::mutex m_;                                // guards pins_ and locks_
  std::map<int, PwmChannelState> pins_;
  std::map<int, std::unique_ptr<std::mutex>> locks_;
  std::atomic<uint64_t> requests_{0};

  std::mutex& pin_lock(int pin);
  PwmChannelState tracked(int pin) const;
  bool request(const std::string& method, const std::string& path, const std::string& body,
               HttpResponse& resp, Error& err);
  bool command(PwmOp op, int pin, int frequency, double duty, Error& err);
  void publish(const PwmChannelState& s, Health h);
public:
  PwmClient(const PwmSettings& S, HttpTransport& http, StateStore& store, Logger& log);

  bool init(int pin, int frequency, Error& err);
  bool set_duty(int pin, double percent, Error& err);
  bool enable(int pin, Error& err);
  bool disable(int pin, Error& err);
  // Daemon view of every pin; tracked pins are reconciled with it.
  bool status(std::vector<PwmChannelState>& pins, Error& err);

  // Runs a queued command and resolves its promise.
  void execute(PwmCommand& cmd);

  bool state(int pin, PwmChannelState& out) const;
  // Aborts retry waits; requests in flight end at their own timeout.
  void shutdown(){ cancel_.raise(); }
  uint64_t requests() const { return requests_.load(); }
};

// Parses the daemon's {"pins":[...]} reply.
bool parse_pwm_status(const std::string& body, std::vector<PwmChannelState>& out, Error& err);

// Scheduler task body for the actuation channel: pin bring-up, queued
// commands and periodic status reconciliation.
class PwmTask {
  PwmClient& client_;
  CommandQueue& queue_;
  PwmSettings S_;
  Logger& log_;
  Clock::time_point next_status_{};
  std::vector<char> configured_;     // initial duty applied, per S_.pins

  bool bring_up(TaskContext& ctx, Error& err);
public:
  PwmTask(PwmClient& client, CommandQueue& queue, const PwmSettings& S, Logger& log);
  bool run(TaskContext& ctx, Error& err);
  // Resolves whatever is still queued as cancelled. Used at shutdown.
  size_t abandon();
};

} // namespace cis
