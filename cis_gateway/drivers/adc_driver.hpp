#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "bus_request.hpp"
#include "spi_bus.hpp"

namespace cis {

struct AdcSettings {
  double vref = 3.3;
  double resolution = 1023.0;
  double voltage_multiplier = 3.31;
  double resistance_reference = 10000.0;
  double voltage_threshold = 0.02;
  std::vector<AdcChannelSpec> channels;
  RetryPolicy retry;

  static AdcSettings from(const Config& C);
};

// MCP3008 single-ended read: start bit, SGL/DIFF + channel, padding.
void mcp3008_command(int input, uint8_t tx[3]);
// 10-bit result; fails when the null bit is set (no device answering).
bool mcp3008_decode(const uint8_t rx[3], int& raw, Error& err);

double adc_voltage(int raw, const AdcSettings& S);
double adc_resistance(int raw, const AdcSettings& S);

// Moving average followed by an exponential moving average.
class SampleFilter {
  std::deque<double> window_;
  size_t size_;
  double alpha_;
  double floor_;              // results below are clamped to 0 (<= 0 disables)
  bool primed_ = false;
  double ema_ = 0.0;
public:
  SampleFilter(size_t window, double alpha, double floor = 0.0)
  : size_(window ? window : 1), alpha_(alpha), floor_(floor) {}
  double update(double x);
  double value() const { return ema_; }
};

class AdcDriver {
  AdcSettings S_;
  SpiBus& spi_;
  ChannelOwner owner_;
  Logger& log_;
  std::vector<SampleFilter> filters_;
  std::vector<std::string> ids_;
  DriverStats stats_;

  bool sample(int input, int& raw, Error& err);
public:
  AdcDriver(const AdcSettings& S, SpiBus& spi, StateStore& store, Logger& log);

  bool claim_channels(std::string& err);
  // One duty cycle: sample every channel, filter, commit as one version.
  bool poll(TaskContext& ctx, Error& err);

  const DriverStats& stats() const { return stats_; }
  static std::string channel_id(const AdcChannelSpec& c);
};

} // namespace cis
