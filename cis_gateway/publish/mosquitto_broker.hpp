#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "broker_client.hpp"

struct mosquitto;
struct mosquitto_message;

namespace cis {

struct BrokerSettings {
  std::string host = "localhost";
  int port = 1883;
  std::string username;
  std::string password;
  std::string client_id;
  int keepalive_s = 60;
  std::chrono::milliseconds connack_timeout{3000};
  int reconnect_max_s = 60;

  static BrokerSettings from(const Config& C);
};

// libmosquitto client with its own network thread. After the first
// successful connect the library reconnects by itself with exponential
// delay; connect() then only reports whether the session is back.
class MosquittoBroker : public BrokerClient {
  BrokerSettings S_;
  Logger& log_;
  struct mosquitto* mosq_ = nullptr;
  bool started_ = false;
  std::string will_topic_, will_payload_;
  bool will_retain_ = false;
  mutable std::mutex m_;
  std::condition_variable cv_;
  MessageHandler handler_;
  std::atomic<bool> connected_{false};
  std::atomic<uint64_t> epoch_{0};

  static void on_connect(struct mosquitto*, void* self, int rc);
  static void on_disconnect(struct mosquitto*, void* self, int rc);
  static void on_message(struct mosquitto*, void* self, const struct mosquitto_message* msg);
public:
  MosquittoBroker(const BrokerSettings& S, Logger& log);
  ~MosquittoBroker() override;
  MosquittoBroker(const MosquittoBroker&) = delete;
  MosquittoBroker& operator=(const MosquittoBroker&) = delete;

  void set_will(const std::string& topic, const std::string& payload, bool retain) override;
  void set_message_handler(MessageHandler h) override;
  bool connect(Error& err) override;
  void disconnect() override;
  bool connected() const override { return connected_.load(); }
  uint64_t epoch() const override { return epoch_.load(); }
  bool publish(const std::string& topic, const std::string& payload, bool retain, Error& err) override;
  bool subscribe(const std::string& pattern, Error& err) override;
};

} // namespace cis
