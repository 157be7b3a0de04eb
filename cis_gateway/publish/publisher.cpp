#include "publisher.hpp"
#include <cctype>
#include <cstdlib>
#include <future>
#include "../common/json_fields.hpp"

namespace cis {

PublisherSettings PublisherSettings::from(const Config& C){
  PublisherSettings S;
  S.base_topic = C.mqtt_base_topic;
  S.discovery_prefix = C.mqtt_discovery_prefix;
  return S;
}

static std::string sanitize(const std::string& s){
  std::string o;
  for(char c : s) o += std::isalnum((unsigned char)c) ? (char)std::tolower((unsigned char)c) : '_';
  return o;
}

static std::string upper(const std::string& s){
  std::string o;
  for(char c : s) o += (char)std::toupper((unsigned char)c);
  return o;
}

// "channel_0_voltage" -> "Channel 0 Voltage"
static std::string title(const std::string& id){
  std::string o;
  bool start=true;
  for(char c : id){
    if(c=='_' || c=='-'){ o+=' '; start=true; continue; }
    o += start ? (char)std::toupper((unsigned char)c) : c;
    start=false;
  }
  return o;
}

static std::string display_unit(const std::string& u){
  if(u=="C") return "°C";
  return u;
}

static void describe(const std::string& unit, TransportKind kind, const char*& device_class, const char*& icon){
  device_class=nullptr;
  icon="mdi:gauge";
  if(unit=="V"){ device_class="voltage"; icon="mdi:flash"; }
  else if(unit=="C" || unit=="°C"){ device_class="temperature"; icon="mdi:thermometer"; }
  else if(unit=="%" && kind==TransportKind::LIN){ device_class="humidity"; icon="mdi:water-percent"; }
  else if(unit=="Ω"){ icon="mdi:water-percent"; }
}

static std::string device_json(const PublisherSettings& S){
  return JsonWriter()
      .raw("identifiers", "[\""+json_escape(S.device_id)+"\"]")
      .str("name", S.device_name)
      .str("model", S.device_model)
      .str("manufacturer", S.device_manufacturer)
      .done();
}

static JsonWriter common_fields(const PublisherSettings& S, const std::string& name,
                                const std::string& uid, const std::string& state_topic){
  JsonWriter w;
  w.str("name", name)
   .str("unique_id", uid)
   .str("state_topic", state_topic)
   .str("availability_topic", S.availability_topic())
   .str("payload_available", "online")
   .str("payload_not_available", "offline")
   .raw("device", device_json(S));
  return w;
}

std::vector<Entity> entities_for(const Channel& c, const PublisherSettings& S){
  std::vector<Entity> out;
  const std::string brand = upper(S.base_topic);
  const std::string uid = S.base_topic+"_"+transport_str(c.kind)+"_"+sanitize(c.id);

  if(c.kind==TransportKind::PWM && c.has_pwm){
    const std::string base = S.base_topic+"/pwm/"+c.id;
    const std::string name = brand+" PWM "+c.id;

    Entity duty;
    duty.unique_id = uid+"_duty";
    duty.component = "number";
    duty.state_topic = base+"/duty";
    duty.value = format_number(c.pwm.duty);
    duty.discovery = common_fields(S, name+" Duty", duty.unique_id, duty.state_topic)
        .str("command_topic", base+"/duty/set")
        .num("min", 0).num("max", 100).num("step", 1)
        .str("unit_of_measurement", "%")
        .str("mode", "slider")
        .str("icon", "mdi:fan")
        .done();
    out.push_back(duty);

    Entity en;
    en.unique_id = uid+"_enable";
    en.component = "switch";
    en.state_topic = base+"/enable";
    en.value = c.pwm.enabled ? "ON" : "OFF";
    en.discovery = common_fields(S, name+" Enable", en.unique_id, en.state_topic)
        .str("command_topic", base+"/enable/set")
        .str("payload_on", "ON").str("payload_off", "OFF")
        .str("state_on", "ON").str("state_off", "OFF")
        .str("icon", "mdi:power")
        .done();
    out.push_back(en);

    if(c.pwm.has_rpm){
      Entity rpm;
      rpm.unique_id = uid+"_rpm";
      rpm.component = "sensor";
      rpm.state_topic = base+"/rpm";
      rpm.value = format_number(c.pwm.rpm);
      rpm.discovery = common_fields(S, name+" Speed", rpm.unique_id, rpm.state_topic)
          .str("unit_of_measurement", "rpm")
          .str("icon", "mdi:fan")
          .str("value_template", "{{ value }}")
          .done();
      out.push_back(rpm);
    }
    return out;
  }

  Entity e;
  e.unique_id = uid;
  e.component = "sensor";
  e.state_topic = S.base_topic+"/"+transport_str(c.kind)+"/"+c.id;
  e.value = c.reading.numeric ? format_number(c.reading.value) : c.reading.text;

  std::string name;
  switch(c.kind){
    case TransportKind::ADC: name = brand+" "+title(c.id); break;
    case TransportKind::LIN: name = brand+" LIN "+title(c.id); break;
    case TransportKind::CAN: name = c.id=="status" ? brand+" CAN Communication" : brand+" CAN "+title(c.id); break;
    case TransportKind::PWM: name = brand+" PWM "+c.id; break;
  }
  JsonWriter w = common_fields(S, name, e.unique_id, e.state_topic);
  if(c.reading.numeric){
    const char* device_class=nullptr;
    const char* icon=nullptr;
    describe(c.reading.unit, c.kind, device_class, icon);
    if(!c.reading.unit.empty()) w.str("unit_of_measurement", display_unit(c.reading.unit));
    if(device_class) w.str("device_class", device_class);
    w.str("icon", icon);
  } else {
    w.str("icon", c.kind==TransportKind::CAN ? "mdi:bus-alert" : "mdi:information-outline");
  }
  w.str("value_template", "{{ value }}");
  e.discovery = w.done();
  out.push_back(e);
  return out;
}

Publisher::Publisher(const PublisherSettings& S, BrokerClient& broker, StateStore& store, Logger& log)
: S_(S), broker_(broker), commands_(store.commands()), log_(log), sub_(store.subscribe(4)) {
  broker_.set_will(S_.availability_topic(), "offline", true);
  broker_.set_message_handler([this](const std::string& topic, const std::string& payload){
    Error e;
    if(!handle_message(topic, payload, e))
      log_.log(LogLevel::WARN, "MQTT command on %s rejected: %s", topic.c_str(), e.what.c_str());
  });
}

bool Publisher::on_session(Error& err){
  const uint64_t ep = broker_.epoch();
  if(!broker_.publish(S_.availability_topic(), "online", true, err)) return false;
  if(!broker_.subscribe(S_.base_topic+"/pwm/+/+/set", err)) return false;
  // A new session may talk to a broker that lost its retained messages.
  discovered_.clear();
  last_sent_.clear();
  epoch_ = ep;
  log_.log(LogLevel::INFO, "MQTT session %llu up, announcing %s online.",
           (unsigned long long)ep, S_.availability_topic().c_str());
  return true;
}

bool Publisher::run(TaskContext& ctx, Error& err){
  if(!broker_.connected() && !broker_.connect(err)) return false;
  if(broker_.epoch()!=epoch_ && !on_session(err)) return false;

  SnapshotPtr snap;
  if(sub_->latest(snap)) current_ = snap;
  if(!current_) return true;

  int sent=0, failed=0;
  Error last;
  for(const auto& kv : current_->channels){
    if(ctx.cancelled()) break;
    const Channel& c = kv.second;
    for(const Entity& e : entities_for(c, S_)){
      if(!discovered_.count(e.unique_id)){
        Error pe;
        const std::string topic = S_.discovery_prefix+"/"+e.component+"/"+e.unique_id+"/config";
        if(!broker_.publish(topic, e.discovery, true, pe)){ failed++; last=pe; continue; }
        discovered_.insert(e.unique_id);
        log_.log(LogLevel::INFO, "Published MQTT discovery for %s to %s", e.unique_id.c_str(), topic.c_str());
      }
      // Stale values stay unpublished until the channel is Fresh again.
      if(c.health==Health::Stale) continue;
      auto it = last_sent_.find(e.unique_id);
      if(it!=last_sent_.end() && it->second==e.value) continue;
      Error pe;
      if(!broker_.publish(e.state_topic, e.value, false, pe)){ failed++; last=pe; continue; }
      last_sent_[e.unique_id] = e.value;
      sent++;
    }
  }
  if(sent) log_.log(LogLevel::DEBUG, "Published %d MQTT update(s) for version %llu.", sent,
                    (unsigned long long)current_->version);
  if(failed){
    err.set(ErrorKind::Broker, std::to_string(failed)+" MQTT publish(es) failed: "+last.what);
    return false;
  }
  return true;
}

bool Publisher::handle_message(const std::string& topic, const std::string& payload, Error& err){
  const std::string prefix = S_.base_topic+"/pwm/";
  if(topic.compare(0, prefix.size(), prefix)!=0){
    err.set(ErrorKind::Validation, "not a command topic");
    return false;
  }
  const std::string rest = topic.substr(prefix.size());
  const size_t a = rest.find('/');
  const size_t b = a==std::string::npos ? std::string::npos : rest.find('/', a+1);
  if(b==std::string::npos || rest.substr(b+1)!="set"){
    err.set(ErrorKind::Validation, "expected <pin>/<duty|enable>/set");
    return false;
  }
  const std::string pin_s = rest.substr(0, a);
  const std::string what = rest.substr(a+1, b-a-1);
  char* end=nullptr;
  const long pin = std::strtol(pin_s.c_str(), &end, 10);
  if(pin_s.empty() || *end!='\0'){
    err.set(ErrorKind::Validation, "bad pin '"+pin_s+"'");
    return false;
  }

  std::string value;
  for(char c : payload) if(!std::isspace((unsigned char)c)) value+=c;

  std::future<Error> done;
  if(what=="duty"){
    const double duty = std::strtod(value.c_str(), &end);
    if(value.empty() || *end!='\0'){
      err.set(ErrorKind::Validation, "bad duty '"+payload+"'");
      return false;
    }
    if(!commands_.submit(PwmOp::Duty, (int)pin, 0, duty, done, err)) return false;
  } else if(what=="enable"){
    const std::string v = upper(value);
    if(v!="ON" && v!="OFF"){
      err.set(ErrorKind::Validation, "enable expects ON or OFF, got '"+payload+"'");
      return false;
    }
    if(!commands_.submit(v=="ON" ? PwmOp::Enable : PwmOp::Disable, (int)pin, 0, 0.0, done, err)) return false;
  } else {
    err.set(ErrorKind::Validation, "unknown command '"+what+"'");
    return false;
  }
  log_.log(LogLevel::INFO, "MQTT command %s=%s queued for pin %ld.", what.c_str(), value.c_str(), pin);
  return true;
}

void Publisher::shutdown(){
  if(broker_.connected()){
    Error err;
    if(!broker_.publish(S_.availability_topic(), "offline", true, err))
      log_.log(LogLevel::WARN, "Could not announce offline: %s", err.what.c_str());
  }
  broker_.disconnect();
}

} // namespace cis
