#pragma once
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"
#include "../core/scheduler.hpp"
#include "../core/state_store.hpp"
#include "viewer_hub.hpp"

struct event_base;
struct event;
struct evhttp;
struct evhttp_request;
struct evhttp_connection;

namespace cis {

struct HttpSettings {
  int port = 8099;
  std::string static_dir;
  std::chrono::milliseconds push_interval{250};
  size_t max_stream_backlog = 256*1024;      // bytes buffered for one viewer
  std::chrono::milliseconds command_timeout{10000};

  static HttpSettings from(const Config& C);
};

// Maps a resolved PWM command to the status code of the reply.
int status_for(const Error& err);

// Dashboard endpoints on a libevent loop running in its own thread.
class HttpServer {
  struct Stream {
    uint64_t viewer = 0;
    evhttp_request* req = nullptr;
  };
  struct Pending {
    evhttp_request* req = nullptr;
    evhttp_connection* conn = nullptr;
    std::future<Error> done;
    Clock::time_point deadline;
    bool gone = false;
    std::string op;
    int pin = 0;
  };

  HttpSettings S_;
  StateStore& store_;
  ViewerHub& hub_;
  const Scheduler* sched_;
  Logger& log_;
  event_base* base_ = nullptr;
  evhttp* http_ = nullptr;
  event* timer_ = nullptr;
  std::thread th_;
  std::map<evhttp_connection*, Stream> streams_;
  std::vector<std::unique_ptr<Pending>> pending_;

  static void on_request(evhttp_request* req, void* self);
  static void on_timer(int, short, void* self);
  static void on_close(evhttp_connection* conn, void* self);

  void serve_index(evhttp_request* req);
  void serve_data(evhttp_request* req);
  void serve_health(evhttp_request* req);
  void serve_events(evhttp_request* req);
  void serve_command(evhttp_request* req, const std::string& op);
  void push_streams();
  void settle_commands();
public:
  HttpServer(const HttpSettings& S, StateStore& store, ViewerHub& hub, const Scheduler* sched, Logger& log);
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  bool start(Error& err);
  void stop();
};

} // namespace cis
