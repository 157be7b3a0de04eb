#include "mosquitto_broker.hpp"
#include <algorithm>
#include <mosquitto.h>

namespace cis {

BrokerSettings BrokerSettings::from(const Config& C){
  BrokerSettings S;
  S.host = C.mqtt_host;
  S.port = C.mqtt_port;
  S.username = C.mqtt_username;
  S.password = C.mqtt_password;
  S.client_id = C.mqtt_client_id;
  S.reconnect_max_s = std::max(1, C.max_backoff_ms/1000);
  return S;
}

MosquittoBroker::MosquittoBroker(const BrokerSettings& S, Logger& log) : S_(S), log_(log) {
  static std::once_flag mosq_once;
  std::call_once(mosq_once, []() { mosquitto_lib_init(); });
}

MosquittoBroker::~MosquittoBroker(){
  disconnect();
  if(mosq_) mosquitto_destroy(mosq_);
}

void MosquittoBroker::set_will(const std::string& topic, const std::string& payload, bool retain){
  will_topic_=topic; will_payload_=payload; will_retain_=retain;
}

void MosquittoBroker::set_message_handler(MessageHandler h){
  std::lock_guard<std::mutex> lk(m_);
  handler_ = std::move(h);
}

void MosquittoBroker::on_connect(struct mosquitto*, void* self, int rc){
  auto* b = static_cast<MosquittoBroker*>(self);
  if(rc!=0){
    b->log_.log(LogLevel::ERROR, "MQTT broker refused connection: %s", mosquitto_connack_string(rc));
    return;
  }
  {
    std::lock_guard<std::mutex> lk(b->m_);
    b->connected_.store(true);
    b->epoch_++;
  }
  b->cv_.notify_all();
  b->log_.log(LogLevel::INFO, "Connected to MQTT broker %s:%d.", b->S_.host.c_str(), b->S_.port);
}

void MosquittoBroker::on_disconnect(struct mosquitto*, void* self, int rc){
  auto* b = static_cast<MosquittoBroker*>(self);
  b->connected_.store(false);
  if(rc!=0) b->log_.log(LogLevel::WARN, "Unexpected MQTT disconnection (%s), reconnecting.", mosquitto_strerror(rc));
}

void MosquittoBroker::on_message(struct mosquitto*, void* self, const struct mosquitto_message* msg){
  auto* b = static_cast<MosquittoBroker*>(self);
  MessageHandler h;
  {
    std::lock_guard<std::mutex> lk(b->m_);
    h = b->handler_;
  }
  if(!h || !msg || !msg->topic) return;
  std::string payload;
  if(msg->payload && msg->payloadlen>0) payload.assign(static_cast<const char*>(msg->payload), (size_t)msg->payloadlen);
  h(msg->topic, payload);
}

bool MosquittoBroker::connect(Error& err){
  if(connected_.load()) return true;
  if(started_){
    err.set(ErrorKind::Broker, "broker session lost, reconnect pending");
    return false;
  }
  if(!mosq_){
    mosq_ = mosquitto_new(S_.client_id.empty() ? nullptr : S_.client_id.c_str(), true, this);
    if(!mosq_){ err.set(ErrorKind::Broker, "mosquitto_new failed"); return false; }
    mosquitto_connect_callback_set(mosq_, &MosquittoBroker::on_connect);
    mosquitto_disconnect_callback_set(mosq_, &MosquittoBroker::on_disconnect);
    mosquitto_message_callback_set(mosq_, &MosquittoBroker::on_message);
    mosquitto_reconnect_delay_set(mosq_, 1, (unsigned)S_.reconnect_max_s, true);
    if(!S_.username.empty())
      mosquitto_username_pw_set(mosq_, S_.username.c_str(), S_.password.empty() ? nullptr : S_.password.c_str());
    if(!will_topic_.empty())
      mosquitto_will_set(mosq_, will_topic_.c_str(), (int)will_payload_.size(), will_payload_.data(), 1, will_retain_);
  }

  int rc = mosquitto_connect(mosq_, S_.host.c_str(), S_.port, S_.keepalive_s);
  if(rc!=MOSQ_ERR_SUCCESS){
    err.set(ErrorKind::Broker, "connect to "+S_.host+":"+std::to_string(S_.port)+": "+
            (rc==MOSQ_ERR_ERRNO ? std::string("network error") : std::string(mosquitto_strerror(rc))));
    return false;
  }
  rc = mosquitto_loop_start(mosq_);
  if(rc!=MOSQ_ERR_SUCCESS){
    mosquitto_disconnect(mosq_);
    err.set(ErrorKind::Broker, std::string("mosquitto_loop_start: ")+mosquitto_strerror(rc));
    return false;
  }
  started_ = true;

  std::unique_lock<std::mutex> lk(m_);
  if(!cv_.wait_for(lk, S_.connack_timeout, [this]{ return connected_.load(); })){
    err.set(ErrorKind::Broker, "no CONNACK from "+S_.host);
    return false;
  }
  return true;
}

void MosquittoBroker::disconnect(){
  if(!mosq_ || !started_) return;
  mosquitto_disconnect(mosq_);
  mosquitto_loop_stop(mosq_, false);
  started_ = false;
  connected_.store(false);
}

bool MosquittoBroker::publish(const std::string& topic, const std::string& payload, bool retain, Error& err){
  if(!mosq_ || !connected_.load()){ err.set(ErrorKind::Broker, "not connected"); return false; }
  const int rc = mosquitto_publish(mosq_, nullptr, topic.c_str(), (int)payload.size(), payload.data(), 0, retain);
  if(rc!=MOSQ_ERR_SUCCESS){
    err.set(ErrorKind::Broker, "publish "+topic+": "+mosquitto_strerror(rc));
    return false;
  }
  return true;
}

bool MosquittoBroker::subscribe(const std::string& pattern, Error& err){
  if(!mosq_ || !connected_.load()){ err.set(ErrorKind::Broker, "not connected"); return false; }
  const int rc = mosquitto_subscribe(mosq_, nullptr, pattern.c_str(), 1);
  if(rc!=MOSQ_ERR_SUCCESS){
    err.set(ErrorKind::Broker, "subscribe "+pattern+": "+mosquitto_strerror(rc));
    return false;
  }
  return true;
}

} // namespace cis
