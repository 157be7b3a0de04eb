#include "config.hpp"
#include "json_fields.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace cis {

static std::vector<std::string> split(const std::string& s, char sep){
  std::vector<std::string> parts;
  std::string cur;
  for(char c : s){
    if(c==sep){ parts.push_back(cur); cur.clear(); }
    else if(c!=' ' && c!='\t') cur+=c;
  }
  parts.push_back(cur);
  return parts;
}

static bool to_int(const std::string& s, int& out){
  if(s.empty()) return false;
  char* end=nullptr;
  long v = std::strtol(s.c_str(), &end, 0); // accepts 0x prefix
  if(*end!='\0') return false;
  out=(int)v; return true;
}

static bool to_double(const std::string& s, double& out){
  if(s.empty()) return false;
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if(*end!='\0') return false;
  out=v; return true;
}

bool parse_int_list(const std::string& s, std::vector<int>& out, std::string& err){
  out.clear();
  if(s.empty()) return true;
  for(const auto& p : split(s,',')){
    int v=0;
    if(!to_int(p,v)){ err="bad integer '"+p+"' in list '"+s+"'"; return false; }
    out.push_back(v);
  }
  return true;
}

bool parse_adc_channels(const std::string& voltage, const std::string& resistance,
                        std::vector<AdcChannelSpec>& out, std::string& err){
  std::vector<int> v, r;
  if(!parse_int_list(voltage, v, err)) return false;
  if(!parse_int_list(resistance, r, err)) return false;
  out.clear();
  for(int i : v) out.push_back(AdcChannelSpec{i, AdcQuantity::Voltage});
  for(int i : r) out.push_back(AdcChannelSpec{i, AdcQuantity::Resistance});
  for(size_t a=0;a<out.size();a++){
    if(out[a].input<0 || out[a].input>7){ err="ADC input out of range 0..7: "+std::to_string(out[a].input); return false; }
    for(size_t b=a+1;b<out.size();b++)
      if(out[a].input==out[b].input){ err="ADC input listed twice: "+std::to_string(out[a].input); return false; }
  }
  return true;
}

// "name:pid:unit,..."
bool parse_lin_frames(const std::string& s, std::vector<LinFrameSpec>& out, std::string& err){
  out.clear();
  if(s.empty()) return true;
  for(const auto& item : split(s,',')){
    auto f = split(item,':');
    if(f.size()<2 || f.size()>3 || f[0].empty()){ err="bad LIN frame '"+item+"' (name:pid[:unit])"; return false; }
    LinFrameSpec L;
    L.name=f[0];
    if(!to_int(f[1],L.pid) || L.pid<0 || L.pid>0xFF){ err="bad LIN PID in '"+item+"'"; return false; }
    if(f.size()==3) L.unit=f[2];
    for(const auto& o : out)
      if(o.name==L.name || o.pid==L.pid){ err="duplicate LIN frame '"+item+"'"; return false; }
    out.push_back(L);
  }
  return true;
}

// "name:req:resp:offset:len:scale[:unit],..." with req "-" for passive signals
bool parse_can_signals(const std::string& s, std::vector<CanSignalSpec>& out, std::string& err){
  out.clear();
  if(s.empty()) return true;
  for(const auto& item : split(s,',')){
    auto f = split(item,':');
    if(f.size()<6 || f.size()>7 || f[0].empty()){ err="bad CAN signal '"+item+"' (name:req:resp:offset:len:scale[:unit])"; return false; }
    CanSignalSpec S;
    S.name=f[0];
    if(f[1]!="-" && !to_int(f[1],S.request_id)){ err="bad CAN request id in '"+item+"'"; return false; }
    if(!to_int(f[2],S.response_id) || S.response_id<0 || S.response_id>0x1FFFFFFF){ err="bad CAN response id in '"+item+"'"; return false; }
    if(!to_int(f[3],S.offset) || !to_int(f[4],S.length) || S.offset<0 || S.length<1 || S.length>4 || S.offset+S.length>8){
      err="bad CAN byte range in '"+item+"'"; return false;
    }
    if(!to_double(f[5],S.scale)){ err="bad CAN scale in '"+item+"'"; return false; }
    if(f.size()==7) S.unit=f[6];
    for(const auto& o : out)
      if(o.name==S.name){ err="duplicate CAN signal '"+S.name+"'"; return false; }
    out.push_back(S);
  }
  return true;
}

Config::Config(){
  std::string err;
  parse_adc_channels("0,1,2,3", "4,5", adc_channels, err);
  parse_lin_frames("temperature:0x50:C,humidity:0x51:%", lin_frames, err);
  pwm_pins.push_back(12);
}

bool load_config_json(const std::string& path, Config& C, std::string& err){
  std::ifstream f(path);
  if(!f){ err="Could not open config: "+path; return false; }
  std::ostringstream ss; ss<<f.rdbuf();
  std::string s=ss.str();

  json_int(s,"http_port", C.http_port);
  json_string(s,"static_dir", C.static_dir);

  json_string(s,"spi_device", C.spi_device);
  json_int(s,"spi_speed_hz", C.spi_speed_hz);
  json_int(s,"spi_mode", C.spi_mode);
  json_number(s,"adc_vref", C.adc_vref);
  json_number(s,"adc_resolution", C.adc_resolution);
  json_number(s,"adc_voltage_multiplier", C.adc_voltage_multiplier);
  json_number(s,"adc_resistance_reference", C.adc_resistance_reference);
  json_number(s,"adc_voltage_threshold", C.adc_voltage_threshold);
  std::string adc_v="0,1,2,3", adc_r="4,5";
  bool have_v = json_string(s,"adc_voltage_channels", adc_v);
  bool have_r = json_string(s,"adc_resistance_channels", adc_r);
  if((have_v || have_r) && !parse_adc_channels(adc_v, adc_r, C.adc_channels, err)) return false;
  json_int(s,"adc_interval_ms", C.adc_interval_ms);
  json_int(s,"adc_timeout_ms", C.adc_timeout_ms);
  json_int(s,"adc_retries", C.adc_retries);
  json_int(s,"adc_retry_delay_ms", C.adc_retry_delay_ms);

  json_string(s,"lin_device", C.lin_device);
  json_int(s,"lin_baud", C.lin_baud);
  json_int(s,"lin_break_us", C.lin_break_us);
  std::string lin;
  if(json_string(s,"lin_frames", lin) && !parse_lin_frames(lin, C.lin_frames, err)) return false;
  json_int(s,"lin_interval_ms", C.lin_interval_ms);
  json_int(s,"lin_response_timeout_ms", C.lin_response_timeout_ms);
  json_int(s,"lin_retries", C.lin_retries);
  json_int(s,"lin_retry_delay_ms", C.lin_retry_delay_ms);

  json_string(s,"can_interface", C.can_interface);
  std::string can;
  if(json_string(s,"can_signals", can) && !parse_can_signals(can, C.can_signals, err)) return false;
  json_int(s,"can_interval_ms", C.can_interval_ms);
  json_int(s,"can_timeout_ms", C.can_timeout_ms);
  json_int(s,"can_retries", C.can_retries);
  json_int(s,"can_retry_delay_ms", C.can_retry_delay_ms);

  json_string(s,"pwm_daemon_url", C.pwm_daemon_url);
  json_int(s,"pwm_timeout_ms", C.pwm_timeout_ms);
  json_int(s,"pwm_retries", C.pwm_retries);
  json_int(s,"pwm_retry_backoff_ms", C.pwm_retry_backoff_ms);
  std::string pins;
  if(json_string(s,"pwm_pins", pins) && !parse_int_list(pins, C.pwm_pins, err)) return false;
  json_int(s,"pwm_frequency", C.pwm_frequency);
  json_number(s,"pwm_initial_duty", C.pwm_initial_duty);
  json_int(s,"pwm_status_interval_ms", C.pwm_status_interval_ms);

  json_string(s,"mqtt_host", C.mqtt_host);
  json_int(s,"mqtt_port", C.mqtt_port);
  json_string(s,"mqtt_username", C.mqtt_username);
  json_string(s,"mqtt_password", C.mqtt_password);
  json_string(s,"mqtt_client_id", C.mqtt_client_id);
  json_string(s,"mqtt_discovery_prefix", C.mqtt_discovery_prefix);
  json_string(s,"mqtt_base_topic", C.mqtt_base_topic);
  json_int(s,"mqtt_interval_ms", C.mqtt_interval_ms);

  json_int(s,"max_backoff_ms", C.max_backoff_ms);
  json_int(s,"shutdown_grace_ms", C.shutdown_grace_ms);
  json_string(s,"log_level", C.log_level);
  json_string(s,"log_file", C.log_file);

  // Secrets from the addon environment win over the file.
  if(const char* u = std::getenv("CIS_MQTT_USERNAME")) C.mqtt_username=u;
  if(const char* p = std::getenv("CIS_MQTT_PASSWORD")) C.mqtt_password=p;

  return validate_config(C, err);
}

bool validate_config(const Config& C, std::string& err){
  if(C.http_port<=0 || C.http_port>65535){ err="http_port out of range"; return false; }
  if(C.mqtt_port<=0 || C.mqtt_port>65535){ err="mqtt_port out of range"; return false; }
  if(C.adc_resolution<=0){ err="adc_resolution must be > 0"; return false; }
  if(C.pwm_frequency<=0){ err="pwm_frequency must be > 0"; return false; }
  if(C.pwm_initial_duty<0 || C.pwm_initial_duty>100){ err="pwm_initial_duty must be within 0..100"; return false; }
  const int intervals[] = {C.adc_interval_ms, C.lin_interval_ms, C.can_interval_ms, C.mqtt_interval_ms,
                           C.pwm_status_interval_ms, C.adc_timeout_ms, C.lin_response_timeout_ms,
                           C.can_timeout_ms, C.pwm_timeout_ms, C.max_backoff_ms};
  for(int v : intervals) if(v<=0){ err="intervals and timeouts must be > 0"; return false; }
  if(C.adc_retries<0 || C.lin_retries<0 || C.can_retries<0 || C.pwm_retries<0){ err="retry budgets must be >= 0"; return false; }
  if(C.adc_retry_delay_ms<0 || C.lin_retry_delay_ms<0 || C.can_retry_delay_ms<0 || C.pwm_retry_backoff_ms<0){
    err="retry delays must be >= 0"; return false;
  }
  if(C.shutdown_grace_ms<0){ err="shutdown_grace_ms must be >= 0"; return false; }
  for(int p : C.pwm_pins) if(p<0){ err="pwm pin must be >= 0"; return false; }
  return true;
}

} // namespace cis
