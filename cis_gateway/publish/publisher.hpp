#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/command_queue.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "broker_client.hpp"

namespace cis {

struct PublisherSettings {
  std::string base_topic = "cis3";
  std::string discovery_prefix = "homeassistant";
  std::string device_id = "cis3_device";
  std::string device_name = "CIS3 Device";
  std::string device_model = "CIS3 PCB V3.0";
  std::string device_manufacturer = "biCOMM Design Ltd";

  static PublisherSettings from(const Config& C);
  std::string availability_topic() const { return base_topic + "/status"; }
};

// One Home Assistant entity derived from a channel. A PWM channel yields
// several (duty number, enable switch, rpm sensor).
struct Entity {
  std::string unique_id;
  std::string component;       // sensor, number, switch
  std::string state_topic;
  std::string value;           // payload for the state topic
  std::string discovery;       // retained config JSON
};

std::vector<Entity> entities_for(const Channel& c, const PublisherSettings& S);

class Publisher {
  PublisherSettings S_;
  BrokerClient& broker_;
  CommandQueue& commands_;
  Logger& log_;
  std::shared_ptr<Subscription> sub_;
  SnapshotPtr current_;
  uint64_t epoch_ = 0;
  std::set<std::string> discovered_;
  std::map<std::string, std::string> last_sent_;   // unique_id -> payload

  bool on_session(Error& err);
public:
  Publisher(const PublisherSettings& S, BrokerClient& broker, StateStore& store, Logger& log);

  // Scheduler task body: keeps the session up and publishes what changed.
  bool run(TaskContext& ctx, Error& err);
  // Command topics: <base>/pwm/<pin>/duty/set and <base>/pwm/<pin>/enable/set.
  bool handle_message(const std::string& topic, const std::string& payload, Error& err);
  // Retained offline, then disconnect.
  void shutdown();
};

} // namespace cis
