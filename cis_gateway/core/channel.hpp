#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace cis {

using Clock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

enum class TransportKind { ADC, LIN, CAN, PWM };
enum class Health { Fresh, Stale, Unconfirmed };
enum class PwmLifecycle { Uninitialized, Initialized, Enabled, Disabled };

inline const char* transport_str(TransportKind k){
  switch(k){
    case TransportKind::ADC: return "adc";
    case TransportKind::LIN: return "lin";
    case TransportKind::CAN: return "can";
    case TransportKind::PWM: return "pwm";
  }
  return "adc";
}

inline const char* health_str(Health h){
  switch(h){
    case Health::Fresh:       return "fresh";
    case Health::Stale:       return "stale";
    case Health::Unconfirmed: return "unconfirmed";
  }
  return "fresh";
}

inline const char* lifecycle_str(PwmLifecycle l){
  switch(l){
    case PwmLifecycle::Uninitialized: return "uninitialized";
    case PwmLifecycle::Initialized:   return "initialized";
    case PwmLifecycle::Enabled:       return "enabled";
    case PwmLifecycle::Disabled:      return "disabled";
  }
  return "uninitialized";
}

inline std::string channel_key(TransportKind k, const std::string& id){
  return std::string(transport_str(k)) + ":" + id;
}

struct Reading {
  double value = 0.0;
  std::string text;     // set for non-numeric readings (e.g. CAN "ON"/"OFF")
  std::string unit;
  bool numeric = true;

  static Reading number(double v, const std::string& unit = std::string()){
    Reading r; r.value=v; r.unit=unit; return r;
  }
  static Reading label(const std::string& t){
    Reading r; r.text=t; r.numeric=false; return r;
  }
};

struct PwmChannelState {
  int pin = -1;
  int frequency = 0;      // Hz, > 0 once initialized
  double duty = 0.0;      // 0..100
  bool enabled = false;
  WallClock::time_point last_ack{};
  PwmLifecycle lifecycle = PwmLifecycle::Uninitialized;
  double rpm = 0.0;
  bool has_rpm = false;
};

struct Channel {
  TransportKind kind = TransportKind::ADC;
  std::string id;
  Reading reading;
  Health health = Health::Fresh;
  WallClock::time_point updated{};
  bool has_pwm = false;
  PwmChannelState pwm;

  std::string key() const { return channel_key(kind, id); }
};

struct StateSnapshot {
  uint64_t version = 0;
  std::map<std::string, Channel> channels;

  const Channel* find(const std::string& key) const {
    auto it = channels.find(key);
    return it==channels.end() ? nullptr : &it->second;
  }
};

using SnapshotPtr = std::shared_ptr<const StateSnapshot>;

} // namespace cis
