#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "bus_request.hpp"
#include "serial_port.hpp"

namespace cis {

constexpr uint8_t LIN_SYNC = 0x55;

struct LinSettings {
  std::vector<LinFrameSpec> frames;
  std::chrono::milliseconds response_timeout{2000};
  std::chrono::microseconds break_length{1350};
  RetryPolicy retry;

  static LinSettings from(const Config& C);
};

uint8_t lin_checksum(uint8_t pid, const uint8_t* data, size_t n);

// Header [SYNC, PID]; two data bytes and a checksum follow the echo.
BusRequest lin_request(const LinFrameSpec& f, const LinSettings& S);

// Looks for the [SYNC, pid] echo in `buf` and copies the `len` bytes after
// it into `out`. false while the header or its payload is still incomplete.
bool lin_extract(const std::vector<uint8_t>& buf, uint8_t pid, size_t len, std::vector<uint8_t>& out);

// Verifies the checksum and turns the little endian payload into value/100.
bool lin_decode(uint8_t pid, const std::vector<uint8_t>& resp, double& value, Error& err);

class LinDriver {
  LinSettings S_;
  SerialPort& port_;
  ChannelOwner owner_;
  Logger& log_;
  DriverStats stats_;
public:
  LinDriver(const LinSettings& S, SerialPort& port, StateStore& store, Logger& log);

  bool claim_channels(std::string& err);
  // One transaction (with retries) per configured frame.
  bool poll(TaskContext& ctx, Error& err);
  // A single attempt: break, header, wait for the correlated response.
  bool transact(const BusRequest& req, TaskContext& ctx, double& value, Error& err);

  const DriverStats& stats() const { return stats_; }
};

} // namespace cis
