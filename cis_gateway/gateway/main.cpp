// Gateway process: opens the buses, runs the polling/actuation/telemetry tasks
// and the dashboard until SIGINT or SIGTERM.
// Run: ./cis_gateway --config /etc/cis-gateway/config.json
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include "../common/config.hpp"
#include "../common/logger.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "../drivers/adc_driver.hpp"
#include "../drivers/can_driver.hpp"
#include "../drivers/http_transport.hpp"
#include "../drivers/lin_driver.hpp"
#include "../drivers/pwm_client.hpp"
#include "../publish/mosquitto_broker.hpp"
#include "../publish/publisher.hpp"
#include "../web/http_server.hpp"
#include "../web/viewer_hub.hpp"

using cis::Logger; using cis::LogLevel; using cis::Millis;

static void usage(){
  std::cerr<<"Usage: cis_gateway --config path/to/config.json [--log-level debug|info|warn|error] [--log-file path]\n";
}

// Worst case for one LIN or CAN cycle with every attempt timing out.
static Millis bus_budget(size_t items, const cis::RetryPolicy& r, Millis per_attempt){
  const long long n = (long long)(items ? items : 1);
  return Millis(n*(r.retries+1)*(per_attempt.count()+r.delay.count()) + 500);
}

int main(int argc, char** argv){
  std::string cfgPath="config/config.json", level, logFile;
  for(int i=1;i<argc;i++){
    std::string a=argv[i];
    if(a=="--config" && i+1<argc) cfgPath=argv[++i];
    else if(a=="--log-level" && i+1<argc) level=argv[++i];
    else if(a=="--log-file" && i+1<argc) logFile=argv[++i];
    else if(a=="-h"||a=="--help"){ usage(); return 0; }
    else { usage(); return 1; }
  }

  Logger log;
  cis::Config C; std::string err;
  if(!cis::load_config_json(cfgPath, C, err)){
    log.log(LogLevel::ERROR, "Config load failed: %s", err.c_str());
    return 1;
  }
  if(!level.empty()) C.log_level=level;
  if(!logFile.empty()) C.log_file=logFile;
  LogLevel L=LogLevel::INFO;
  if(!cis::parse_level(C.log_level, L)){
    log.log(LogLevel::ERROR, "Unknown log level '%s'.", C.log_level.c_str());
    return 1;
  }
  log.set_level(L);
  if(!C.log_file.empty() && !log.open(C.log_file)){
    log.log(LogLevel::ERROR, "Cannot open log file %s: %s", C.log_file.c_str(), std::strerror(errno));
    return 1;
  }

  // Every thread started below inherits the blocked set; main waits for them.
  sigset_t sigs;
  sigemptyset(&sigs);
  sigaddset(&sigs, SIGINT);
  sigaddset(&sigs, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigs, nullptr);

  // Seeded from the wall clock so versions keep increasing across restarts.
  const uint64_t v0 = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
      cis::WallClock::now().time_since_epoch()).count();
  cis::StateStore store(v0);

  cis::Error e;
  cis::SpidevBus spi;
  if(!spi.open(C.spi_device, (uint32_t)C.spi_speed_hz, (uint8_t)C.spi_mode, e)){
    log.log(LogLevel::ERROR, "ADC unavailable: %s", e.what.c_str());
    return 1;
  }
  cis::TermiosSerialPort uart;
  if(!uart.open(C.lin_device, C.lin_baud, e)){
    log.log(LogLevel::ERROR, "LIN unavailable: %s", e.what.c_str());
    return 1;
  }
  cis::SocketCanBus can;
  if(!can.open(C.can_interface, e)){
    log.log(LogLevel::ERROR, "CAN unavailable: %s", e.what.c_str());
    return 1;
  }
  cis::CurlTransport http(C.pwm_daemon_url);

  const cis::AdcSettings adcS = cis::AdcSettings::from(C);
  const cis::LinSettings linS = cis::LinSettings::from(C);
  const cis::CanSettings canS = cis::CanSettings::from(C);
  const cis::PwmSettings pwmS = cis::PwmSettings::from(C);

  cis::AdcDriver adc(adcS, spi, store, log);
  cis::LinDriver lin(linS, uart, store, log);
  cis::CanDriver canDrv(canS, can, store, log);
  cis::PwmClient pwm(pwmS, http, store, log);
  cis::PwmTask pwmTask(pwm, store.commands(), pwmS, log);
  if(!adc.claim_channels(err) || !lin.claim_channels(err) || !canDrv.claim_channels(err)){
    log.log(LogLevel::ERROR, "Channel setup failed: %s", err.c_str());
    return 1;
  }

  cis::MosquittoBroker broker(cis::BrokerSettings::from(C), log);
  cis::Publisher publisher(cis::PublisherSettings::from(C), broker, store, log);

  cis::Scheduler sched(log, Millis(C.max_backoff_ms));
  const Millis linBudget = bus_budget(linS.frames.size(), linS.retry,
                                      linS.response_timeout + Millis(C.lin_break_us/1000 + 1));
  const Millis canBudget = bus_budget(canS.signals.size() + 1, canS.retry, canS.timeout);
  const Millis pwmBudget = pwmS.run_budget();
  const bool ok =
      sched.register_task("adc_poll", "adc", Millis(C.adc_interval_ms), Millis(C.adc_timeout_ms),
                          [&](cis::TaskContext& ctx, cis::Error& er){ return adc.poll(ctx, er); }, err) &&
      sched.register_task("lin_poll", "lin", Millis(C.lin_interval_ms), linBudget,
                          [&](cis::TaskContext& ctx, cis::Error& er){ return lin.poll(ctx, er); }, err) &&
      sched.register_task("can_poll", "can", Millis(C.can_interval_ms), canBudget,
                          [&](cis::TaskContext& ctx, cis::Error& er){ return canDrv.poll(ctx, er); }, err) &&
      sched.register_task("pwm_commands", "pwm", Millis(250), pwmBudget,
                          [&](cis::TaskContext& ctx, cis::Error& er){ return pwmTask.run(ctx, er); }, err) &&
      sched.register_task("mqtt_publish", "mqtt", Millis(C.mqtt_interval_ms), Millis(10000),
                          [&](cis::TaskContext& ctx, cis::Error& er){ return publisher.run(ctx, er); }, err);
  if(!ok){
    log.log(LogLevel::ERROR, "Task setup failed: %s", err.c_str());
    return 1;
  }
  store.commands().set_notify([&sched]{ sched.trigger("pwm_commands"); });

  cis::ViewerHub hub(store);
  cis::HttpServer web(cis::HttpSettings::from(C), store, hub, &sched, log);
  if(!web.start(e))
    log.log(LogLevel::ERROR, "Dashboard disabled: %s", e.what.c_str());

  log.log(LogLevel::INFO, "Gateway up: %zu ADC, %zu LIN, %zu CAN signal(s), %zu PWM pin(s); daemon %s, broker %s:%d.",
          adcS.channels.size(), linS.frames.size(), canS.signals.size(), pwmS.pins.size(),
          C.pwm_daemon_url.c_str(), C.mqtt_host.c_str(), C.mqtt_port);
  sched.start();

  int sig=0;
  sigwait(&sigs, &sig);
  log.log(LogLevel::INFO, "Received %s, shutting down.", sig==SIGINT ? "SIGINT" : "SIGTERM");

  web.stop();
  pwm.shutdown();
  sched.stop(Millis(C.shutdown_grace_ms));
  store.commands().set_notify(nullptr);
  const size_t dropped = pwmTask.abandon();
  if(dropped) log.log(LogLevel::WARN, "%zu PWM command(s) dropped at shutdown.", dropped);
  publisher.shutdown();

  for(const auto& r : sched.records())
    log.log(LogLevel::INFO, "Task %s: %llu runs, %llu failures, %llu skipped.", r.name.c_str(),
            (unsigned long long)r.runs, (unsigned long long)r.failures, (unsigned long long)r.skipped);
  log.log(LogLevel::INFO, "Gateway stopped.");
  return 0;
}
