#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "bus_request.hpp"
#include "can_bus.hpp"

namespace cis {

struct CanSettings {
  std::vector<CanSignalSpec> signals;
  std::chrono::milliseconds timeout{1000};
  RetryPolicy retry;

  static CanSettings from(const Config& C);
};

// Empty payload for passive signals, which only wait for the response id.
BusRequest can_request(const CanSignalSpec& s, const CanSettings& S);

// Little endian unsigned field at offset/length, times scale.
bool can_decode(const CanSignalSpec& s, const CanFrame& f, double& value, Error& err);

class CanDriver {
  CanSettings S_;
  CanBus& bus_;
  ChannelOwner owner_;
  Logger& log_;
  DriverStats stats_;
  bool activity_ = false;     // any frame seen during the current poll

  bool transact(const CanSignalSpec& sig, const BusRequest& req, TaskContext& ctx, double& value, Error& err);
  bool listen(TaskContext& ctx, Error& err);
public:
  static constexpr const char* STATUS_ID = "status";

  CanDriver(const CanSettings& S, CanBus& bus, StateStore& store, Logger& log);

  bool claim_channels(std::string& err);
  bool poll(TaskContext& ctx, Error& err);

  const DriverStats& stats() const { return stats_; }
};

} // namespace cis
