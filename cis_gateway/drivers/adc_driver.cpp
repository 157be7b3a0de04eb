#include "adc_driver.hpp"
#include <cmath>

namespace cis {

AdcSettings AdcSettings::from(const Config& C){
  AdcSettings S;
  S.vref = C.adc_vref;
  S.resolution = C.adc_resolution;
  S.voltage_multiplier = C.adc_voltage_multiplier;
  S.resistance_reference = C.adc_resistance_reference;
  S.voltage_threshold = C.adc_voltage_threshold;
  S.channels = C.adc_channels;
  S.retry.retries = C.adc_retries;
  S.retry.delay = std::chrono::milliseconds(C.adc_retry_delay_ms);
  return S;
}

void mcp3008_command(int input, uint8_t tx[3]){
  tx[0] = 0x01;
  tx[1] = (uint8_t)((8 + (input & 7)) << 4);
  tx[2] = 0x00;
}

bool mcp3008_decode(const uint8_t rx[3], int& raw, Error& err){
  // The null bit precedes the conversion result and always reads 0.
  if(rx[1] & 0x04){
    err.set(ErrorKind::Protocol, "MCP3008 null bit set");
    return false;
  }
  raw = ((rx[1] & 0x03) << 8) | rx[2];
  return true;
}

double adc_voltage(int raw, const AdcSettings& S){
  return raw / S.resolution * S.vref * S.voltage_multiplier;
}

double adc_resistance(int raw, const AdcSettings& S){
  if(raw<=0) return 0.0;
  return (S.resistance_reference * (S.resolution - raw) / raw) / 10.0;
}

double SampleFilter::update(double x){
  window_.push_back(x);
  if(window_.size()>size_) window_.pop_front();
  double sum=0.0;
  for(double v : window_) sum+=v;
  const double avg = sum / window_.size();
  if(!primed_){ ema_=avg; primed_=true; }
  else ema_ = alpha_*avg + (1.0-alpha_)*ema_;
  if(floor_>0.0 && ema_<floor_) ema_=0.0;
  return ema_;
}

static double round2(double v){ return std::round(v*100.0)/100.0; }

std::string AdcDriver::channel_id(const AdcChannelSpec& c){
  return "channel_" + std::to_string(c.input) +
         (c.quantity==AdcQuantity::Voltage ? "_voltage" : "_resistance");
}

AdcDriver::AdcDriver(const AdcSettings& S, SpiBus& spi, StateStore& store, Logger& log)
: S_(S), spi_(spi), owner_(store.attach(TransportKind::ADC, "adc")), log_(log) {
  for(const auto& c : S_.channels){
    if(c.quantity==AdcQuantity::Voltage) filters_.emplace_back(20, 0.2, S_.voltage_threshold);
    else filters_.emplace_back(30, 0.1);
    ids_.push_back(channel_id(c));
  }
}

bool AdcDriver::claim_channels(std::string& err){
  for(const auto& id : ids_){
    if(!owner_.claim(id, err)) return false;
  }
  return true;
}

bool AdcDriver::sample(int input, int& raw, Error& err){
  uint8_t tx[3], rx[3] = {0,0,0};
  mcp3008_command(input, tx);
  stats_.transactions++;
  if(!spi_.transfer(tx, rx, 3, err)) return false;
  if(!mcp3008_decode(rx, raw, err)){
    stats_.protocol_errors++;
    return false;
  }
  return true;
}

bool AdcDriver::poll(TaskContext& ctx, Error& err){
  const int n = (int)S_.channels.size();
  std::vector<double> scaled(n, 0.0);
  std::vector<char> ok(n, 0);
  Error last;
  int failed=0;

  for(int i=0; i<n; i++){
    if(ctx.cancelled()){ err.set(ErrorKind::Cancelled, "adc poll cancelled"); return false; }
    const AdcChannelSpec& c = S_.channels[i];
    int raw=0, attempts=0;
    Error e;
    if(run_with_retries(S_.retry, ctx.token(), ctx.deadline(),
                        [&](Error& a){ return sample(c.input, raw, a); }, e, &attempts)){
      scaled[i] = c.quantity==AdcQuantity::Voltage ? adc_voltage(raw, S_) : adc_resistance(raw, S_);
      ok[i] = 1;
    } else {
      if(e.kind==ErrorKind::Cancelled){ err=e; return false; }
      stats_.failures++;
      failed++;
      last=e;
      log_.log(LogLevel::DEBUG, "adc %s: %s", ids_[i].c_str(), e.what.c_str());
    }
    if(attempts>1) stats_.retries += attempts-1;
  }

  // Filter state is per channel, so channels are independent.
#ifdef _OPENMP
  #pragma omp parallel for schedule(static) if(n >= 8)
#endif
  for(int i=0; i<n; i++){
    if(ok[i]) scaled[i] = round2(filters_[i].update(scaled[i]));
  }

  ChannelOwner::Batch b;
  for(int i=0; i<n; i++){
    const char* unit = S_.channels[i].quantity==AdcQuantity::Voltage ? "V" : "\u03A9";
    if(ok[i]) b.set(ids_[i], Reading::number(scaled[i], unit));
    else b.mark(ids_[i], Health::Stale);
  }
  owner_.commit(b);

  if(failed && failed==n){
    err.set(last.kind==ErrorKind::Protocol ? ErrorKind::Protocol : ErrorKind::Transport,
            "all "+std::to_string(n)+" adc channels failed: "+last.what);
    return false;
  }
  return true;
}

} // namespace cis
