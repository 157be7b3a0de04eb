#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include "../common/error.hpp"

namespace cis {

class SerialPort {
public:
  virtual ~SerialPort() = default;
  virtual bool write(const uint8_t* data, size_t n, Error& err) = 0;
  // Holds the line dominant for `d`, then releases it.
  virtual bool send_break(std::chrono::microseconds d, Error& err) = 0;
  // Bytes read (>0), 0 when nothing arrived within `timeout`, -1 on error.
  virtual long read(uint8_t* buf, size_t max, std::chrono::milliseconds timeout, Error& err) = 0;
  virtual void flush_input() = 0;
};

// Raw 8N1 UART through termios.
class TermiosSerialPort : public SerialPort {
  int fd_ = -1;
  std::string device_;
public:
  TermiosSerialPort() = default;
  ~TermiosSerialPort() override;
  TermiosSerialPort(const TermiosSerialPort&) = delete;
  TermiosSerialPort& operator=(const TermiosSerialPort&) = delete;

  bool open(const std::string& device, int baud, Error& err);
  void close();

  bool write(const uint8_t* data, size_t n, Error& err) override;
  bool send_break(std::chrono::microseconds d, Error& err) override;
  long read(uint8_t* buf, size_t max, std::chrono::milliseconds timeout, Error& err) override;
  void flush_input() override;
};

} // namespace cis
