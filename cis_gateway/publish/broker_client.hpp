#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include "../common/error.hpp"

namespace cis {

// Telemetry broker session. connect() establishes the session once; a
// dropped session may come back on its own, and every (re)established
// session bumps epoch().
class BrokerClient {
public:
  using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;

  virtual ~BrokerClient() = default;
  virtual void set_will(const std::string& topic, const std::string& payload, bool retain) = 0;
  // Messages on subscribed topics; called from the client's network thread.
  virtual void set_message_handler(MessageHandler h) = 0;
  virtual bool connect(Error& err) = 0;
  virtual void disconnect() = 0;
  virtual bool connected() const = 0;
  virtual uint64_t epoch() const = 0;
  virtual bool publish(const std::string& topic, const std::string& payload, bool retain, Error& err) = 0;
  virtual bool subscribe(const std::string& pattern, Error& err) = 0;
};

} // namespace cis
