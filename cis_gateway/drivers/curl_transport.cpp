#include "http_transport.hpp"
#include <curl/curl.h>
#include <mutex>

namespace cis {

struct CurlShareLocks {
  std::mutex m[CURL_LOCK_DATA_LAST];
};

namespace {

void share_lock(CURL*, curl_lock_data data, curl_lock_access, void* user){
  static_cast<CurlShareLocks*>(user)->m[data].lock();
}

void share_unlock(CURL*, curl_lock_data data, void* user){
  static_cast<CurlShareLocks*>(user)->m[data].unlock();
}

size_t collect(char* ptr, size_t size, size_t nmemb, void* user){
  static_cast<std::string*>(user)->append(ptr, size*nmemb);
  return size*nmemb;
}

} // namespace

CurlTransport::CurlTransport(std::string base_url) : base_(std::move(base_url)) {
  static std::once_flag curl_once;
  std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  while(!base_.empty() && base_.back()=='/') base_.pop_back();

  share_lock_ = std::make_unique<CurlShareLocks>();
  CURLSH* sh = curl_share_init();
  if(sh){
    curl_share_setopt(sh, CURLSHOPT_LOCKFUNC, share_lock);
    curl_share_setopt(sh, CURLSHOPT_UNLOCKFUNC, share_unlock);
    curl_share_setopt(sh, CURLSHOPT_USERDATA, share_lock_.get());
    curl_share_setopt(sh, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(sh, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
  }
  share_ = sh;
}

CurlTransport::~CurlTransport(){
  if(share_) curl_share_cleanup(static_cast<CURLSH*>(share_));
}

bool CurlTransport::perform(const HttpRequest& req, HttpResponse& resp, Error& err){
  CURL* curl = curl_easy_init();
  if(!curl){ err.set(ErrorKind::Transport, "curl_easy_init failed"); return false; }

  const std::string url = base_ + req.path;
  std::string body;
  struct curl_slist* headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)req.timeout.count());
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)req.timeout.count());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, collect);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  if(share_) curl_easy_setopt(curl, CURLOPT_SHARE, static_cast<CURLSH*>(share_));
  if(req.method=="POST"){
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  const CURLcode res = curl_easy_perform(curl);
  long status = 0;
  if(res==CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if(res!=CURLE_OK){
    err.set(res==CURLE_OPERATION_TIMEDOUT ? ErrorKind::Timeout : ErrorKind::Transport,
            req.method+" "+url+": "+curl_easy_strerror(res));
    return false;
  }
  resp.status = status;
  resp.body = std::move(body);
  return true;
}

} // namespace cis
