#pragma once
#include <chrono>
#include <memory>
#include <string>
#include "../common/error.hpp"

namespace cis {

struct HttpRequest {
  std::string method = "GET";
  std::string path;          // relative to the transport's base URL
  std::string body;          // JSON, empty for GET
  std::chrono::milliseconds timeout{3000};
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// One request/response exchange. false only when no HTTP response arrived
// (connect failure, timeout); a non-2xx reply is still a true return.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual bool perform(const HttpRequest& req, HttpResponse& resp, Error& err) = 0;
};

struct CurlShareLocks;

// libcurl easy handles, one per call; connections are pooled through a
// shared connection cache so concurrent pins reuse sockets.
class CurlTransport : public HttpTransport {
  std::string base_;
  void* share_ = nullptr;    // CURLSH*
  std::unique_ptr<CurlShareLocks> share_lock_;
public:
  explicit CurlTransport(std::string base_url);
  ~CurlTransport() override;
  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  bool perform(const HttpRequest& req, HttpResponse& resp, Error& err) override;
};

} // namespace cis
