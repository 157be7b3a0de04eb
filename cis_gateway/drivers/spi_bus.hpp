#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "../common/error.hpp"

namespace cis {

// Full-duplex synchronous transfer on one chip select.
class SpiBus {
public:
  virtual ~SpiBus() = default;
  virtual bool transfer(const uint8_t* tx, uint8_t* rx, size_t n, Error& err) = 0;
};

// Linux spidev character device.
class SpidevBus : public SpiBus {
  int fd_ = -1;
  uint32_t speed_hz_ = 0;
public:
  SpidevBus() = default;
  ~SpidevBus() override;
  SpidevBus(const SpidevBus&) = delete;
  SpidevBus& operator=(const SpidevBus&) = delete;

  bool open(const std::string& device, uint32_t speed_hz, uint8_t mode, Error& err);
  void close();
  bool transfer(const uint8_t* tx, uint8_t* rx, size_t n, Error& err) override;
};

} // namespace cis
