#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include "../common/error.hpp"

namespace cis {

struct CanFrame {
  uint32_t id = 0;
  bool extended = false;
  uint8_t dlc = 0;
  uint8_t data[8] = {0};
};

class CanBus {
public:
  virtual ~CanBus() = default;
  virtual bool send(const CanFrame& f, Error& err) = 0;
  // 1 when a frame was read, 0 on timeout, -1 on error.
  virtual int receive(CanFrame& f, std::chrono::milliseconds timeout, Error& err) = 0;
};

// Raw SocketCAN socket bound to one interface.
class SocketCanBus : public CanBus {
  int sock_ = -1;
  std::string iface_;
public:
  SocketCanBus() = default;
  ~SocketCanBus() override;
  SocketCanBus(const SocketCanBus&) = delete;
  SocketCanBus& operator=(const SocketCanBus&) = delete;

  bool open(const std::string& iface, Error& err);
  void close();
  bool send(const CanFrame& f, Error& err) override;
  int receive(CanFrame& f, std::chrono::milliseconds timeout, Error& err) override;
};

} // namespace cis
