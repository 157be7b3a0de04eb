#include "http_server.hpp"
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <sstream>
#include <event2/buffer.h>
#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/http.h>
#include <event2/keyvalq_struct.h>
#include <event2/thread.h>
#include "../common/json_fields.hpp"
#include "../drivers/pwm_client.hpp"

namespace cis {

HttpSettings HttpSettings::from(const Config& C){
  HttpSettings S;
  S.port = C.http_port;
  S.static_dir = C.static_dir;
  // A command queued just after a drain waits out the rest of that run,
  // then the next run's bring-up, before its own call.
  S.command_timeout = PwmSettings::from(C).run_budget()*2 + std::chrono::milliseconds(1000);
  return S;
}

int status_for(const Error& err){
  switch(err.kind){
    case ErrorKind::None:       return 200;
    case ErrorKind::Validation: return 400;
    case ErrorKind::Busy:       return 503;
    case ErrorKind::Cancelled:  return 503;
    case ErrorKind::Daemon:     return 502;
    case ErrorKind::Timeout:    return 504;
    default:                    return 500;
  }
}

static const char* reason_for(int code){
  switch(code){
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 502: return "Bad Gateway";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default:  return "Internal Server Error";
  }
}

static void reply(evhttp_request* req, int code, const std::string& body, const char* type = "application/json"){
  evkeyvalq* h = evhttp_request_get_output_headers(req);
  evhttp_add_header(h, "Content-Type", type);
  evhttp_add_header(h, "Cache-Control", "no-cache");
  evbuffer* buf = evbuffer_new();
  evbuffer_add(buf, body.data(), body.size());
  evhttp_send_reply(req, code, reason_for(code), buf);
  evbuffer_free(buf);
}

static void reply_error(evhttp_request* req, int code, const std::string& what){
  reply(req, code, JsonWriter().boolean("ok", false).str("error", what).done());
}

HttpServer::HttpServer(const HttpSettings& S, StateStore& store, ViewerHub& hub, const Scheduler* sched, Logger& log)
: S_(S), store_(store), hub_(hub), sched_(sched), log_(log) {}

HttpServer::~HttpServer(){ stop(); }

bool HttpServer::start(Error& err){
  static std::once_flag ev_once;
  std::call_once(ev_once, []() { evthread_use_pthreads(); });

  base_ = event_base_new();
  if(!base_){ err.set(ErrorKind::Transport, "event_base_new failed"); return false; }
  http_ = evhttp_new(base_);
  if(!http_){ err.set(ErrorKind::Transport, "evhttp_new failed"); stop(); return false; }
  evhttp_set_allowed_methods(http_, EVHTTP_REQ_GET | EVHTTP_REQ_POST);
  evhttp_set_gencb(http_, &HttpServer::on_request, this);
  if(!evhttp_bind_socket_with_handle(http_, "0.0.0.0", (uint16_t)S_.port)){
    err.set(ErrorKind::Transport, "cannot bind HTTP port "+std::to_string(S_.port));
    stop();
    return false;
  }
  timer_ = event_new(base_, -1, EV_PERSIST, &HttpServer::on_timer, this);
  const long long us = (long long)S_.push_interval.count()*1000;
  timeval tv;
  tv.tv_sec = (time_t)(us/1000000);
  tv.tv_usec = (suseconds_t)(us%1000000);
  if(!timer_ || event_add(timer_, &tv)!=0){
    err.set(ErrorKind::Transport, "cannot arm push timer");
    stop();
    return false;
  }
  th_ = std::thread([this]{ event_base_dispatch(base_); });
  log_.log(LogLevel::INFO, "Dashboard listening on port %d.", S_.port);
  return true;
}

void HttpServer::stop(){
  if(!base_) return;
  event_base_loopbreak(base_);
  if(th_.joinable()) th_.join();
  if(timer_){ event_free(timer_); timer_=nullptr; }
  if(http_){ evhttp_free(http_); http_=nullptr; }
  streams_.clear();
  pending_.clear();
  event_base_free(base_);
  base_=nullptr;
}

void HttpServer::on_request(evhttp_request* req, void* self){
  auto* s = static_cast<HttpServer*>(self);
  const evhttp_uri* uri = evhttp_request_get_evhttp_uri(req);
  const char* p = uri ? evhttp_uri_get_path(uri) : nullptr;
  const std::string path = p && *p ? p : "/";
  const bool get = evhttp_request_get_command(req)==EVHTTP_REQ_GET;

  if(path.compare(0, 5, "/pwm/")==0){
    if(get){ reply_error(req, 405, "POST required"); return; }
    const std::string op = path.substr(5);
    if(op=="init" || op=="duty" || op=="enable" || op=="disable"){ s->serve_command(req, op); return; }
    reply_error(req, 404, "unknown PWM operation '"+op+"'");
    return;
  }
  if(!get){ reply_error(req, 405, "GET required"); return; }
  if(path=="/" || path=="/index.html") s->serve_index(req);
  else if(path=="/data") s->serve_data(req);
  else if(path=="/health") s->serve_health(req);
  else if(path=="/events") s->serve_events(req);
  else reply_error(req, 404, "not found: "+path);
}

void HttpServer::on_timer(int, short, void* self){
  auto* s = static_cast<HttpServer*>(self);
  s->push_streams();
  s->settle_commands();
}

// Single close hook for every connection that holds a stream or a
// pending command. Requests on a closed connection are never touched again.
void HttpServer::on_close(evhttp_connection* conn, void* self){
  auto* s = static_cast<HttpServer*>(self);
  auto it = s->streams_.find(conn);
  if(it!=s->streams_.end()){
    s->hub_.disconnect(it->second.viewer);
    s->streams_.erase(it);
    s->log_.log(LogLevel::DEBUG, "Viewer disconnected, %zu left.", s->streams_.size());
  }
  for(auto& p : s->pending_)
    if(p->conn==conn) p->gone = true;
}

void HttpServer::serve_index(evhttp_request* req){
  std::ifstream f(S_.static_dir + "/index.html");
  if(!f){ reply_error(req, 404, "no index page in "+S_.static_dir); return; }
  std::ostringstream ss; ss<<f.rdbuf();
  reply(req, 200, ss.str(), "text/html; charset=utf-8");
}

void HttpServer::serve_data(evhttp_request* req){
  reply(req, 200, snapshot_json(*store_.snapshot()));
}

void HttpServer::serve_health(evhttp_request* req){
  std::string tasks = "[";
  if(sched_){
    bool first=true;
    for(const auto& r : sched_->records()){
      if(!first) tasks += ",";
      first=false;
      tasks += JsonWriter()
          .str("name", r.name).str("transport", r.transport)
          .integer("runs", (long long)r.runs).integer("failures", (long long)r.failures)
          .integer("consecutive_failures", r.consecutive_failures)
          .integer("skipped", (long long)r.skipped)
          .integer("backoff_ms", (long long)r.backoff.count())
          .boolean("running", r.running)
          .done();
    }
  }
  tasks += "]";
  reply(req, 200, JsonWriter()
      .str("status", "ok")
      .integer("version", (long long)store_.version())
      .integer("viewers", (long long)hub_.viewers())
      .raw("tasks", tasks)
      .done());
}

void HttpServer::serve_events(evhttp_request* req){
  uint64_t last_seen=0;
  const char* h = evhttp_find_header(evhttp_request_get_input_headers(req), "Last-Event-ID");
  if(h) last_seen = parse_event_id(h, hub_.session());

  evhttp_connection* conn = evhttp_request_get_connection(req);
  if(!conn){ reply_error(req, 500, "no connection"); return; }
  evkeyvalq* out = evhttp_request_get_output_headers(req);
  evhttp_add_header(out, "Content-Type", "text/event-stream");
  evhttp_add_header(out, "Cache-Control", "no-cache");
  evhttp_send_reply_start(req, 200, "OK");

  Stream st;
  st.viewer = hub_.connect(last_seen);
  st.req = req;
  streams_[conn] = st;
  evhttp_connection_set_closecb(conn, &HttpServer::on_close, this);
  log_.log(LogLevel::DEBUG, "Viewer connected (last seen %llu), %zu open.",
           (unsigned long long)last_seen, streams_.size());
  push_streams();
}

void HttpServer::push_streams(){
  hub_.pump();
  for(auto& kv : streams_){
    bufferevent* bev = evhttp_connection_get_bufferevent(kv.first);
    // A viewer that stopped reading is left alone until its queue overflows.
    if(bev && evbuffer_get_length(bufferevent_get_output(bev))>S_.max_stream_backlog) continue;
    std::vector<ViewerEvent> events;
    if(!hub_.take(kv.second.viewer, events) || events.empty()) continue;
    evbuffer* buf = evbuffer_new();
    for(const auto& e : events){
      evbuffer_add_printf(buf, "id: %s\nevent: %s\ndata: ", event_id(hub_.session(), e.version).c_str(), e.type.c_str());
      evbuffer_add(buf, e.data.data(), e.data.size());
      evbuffer_add(buf, "\n\n", 2);
    }
    evhttp_send_reply_chunk(kv.second.req, buf);
    evbuffer_free(buf);
  }
}

void HttpServer::serve_command(evhttp_request* req, const std::string& op){
  evbuffer* in = evhttp_request_get_input_buffer(req);
  std::string body(evbuffer_get_length(in), '\0');
  if(!body.empty()) evbuffer_copyout(in, &body[0], body.size());

  int pin=0, frequency=0;
  double duty=0.0;
  if(!json_int(body, "gpio_pin", pin)){ reply_error(req, 400, "gpio_pin required"); return; }
  PwmOp o = PwmOp::Enable;
  if(op=="init"){
    o = PwmOp::Init;
    if(!json_int(body, "frequency", frequency)){ reply_error(req, 400, "frequency required"); return; }
  } else if(op=="duty"){
    o = PwmOp::Duty;
    if(!json_number(body, "duty_cycle", duty)){ reply_error(req, 400, "duty_cycle required"); return; }
  } else if(op=="disable"){
    o = PwmOp::Disable;
  }

  auto p = std::make_unique<Pending>();
  Error err;
  if(!store_.commands().submit(o, pin, frequency, duty, p->done, err)){
    reply_error(req, status_for(err), err.what);
    return;
  }
  p->req = req;
  p->conn = evhttp_request_get_connection(req);
  p->deadline = Clock::now() + S_.command_timeout;
  p->op = op;
  p->pin = pin;
  if(p->conn) evhttp_connection_set_closecb(p->conn, &HttpServer::on_close, this);
  pending_.push_back(std::move(p));
}

void HttpServer::settle_commands(){
  const auto now = Clock::now();
  for(auto it = pending_.begin(); it!=pending_.end(); ){
    Pending& p = **it;
    const bool ready = p.done.wait_for(std::chrono::seconds(0))==std::future_status::ready;
    if(!ready && now<p.deadline){ ++it; continue; }
    if(p.gone){
      log_.log(LogLevel::DEBUG, "Client left before PWM %s pin %d finished.", p.op.c_str(), p.pin);
    } else if(!ready){
      reply_error(p.req, 504, "no acknowledgement from PWM task");
    } else {
      const Error e = p.done.get();
      if(e.ok()) reply(p.req, 200, JsonWriter().boolean("ok", true).str("op", p.op).integer("gpio_pin", p.pin).done());
      else reply_error(p.req, status_for(e), e.what);
    }
    it = pending_.erase(it);
  }
}

} // namespace cis
