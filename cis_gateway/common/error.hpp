#pragma once
#include <string>
#include <utility>

namespace cis {

// Failure taxonomy shared by every driver and consumer.
enum class ErrorKind {
  None,
  Transport,   // I/O failure on a bus, serial or socket handle
  Protocol,    // malformed or unverifiable response
  Daemon,      // PWM daemon non-2xx, or retries exhausted
  Validation,  // rejected locally before any I/O
  Broker,      // telemetry broker connection
  Timeout,
  Busy,        // bounded queue full
  Cancelled
};

inline const char* kind_str(ErrorKind k){
  switch(k){
    case ErrorKind::None:       return "none";
    case ErrorKind::Transport:  return "transport";
    case ErrorKind::Protocol:   return "protocol";
    case ErrorKind::Daemon:     return "daemon";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Broker:     return "broker";
    case ErrorKind::Timeout:    return "timeout";
    case ErrorKind::Busy:       return "busy";
    case ErrorKind::Cancelled:  return "cancelled";
  }
  return "none";
}

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string what;

  bool ok() const { return kind==ErrorKind::None; }
  void set(ErrorKind k, std::string msg){ kind=k; what=std::move(msg); }
  void clear(){ kind=ErrorKind::None; what.clear(); }
  // Timeouts on a bus are I/O failures for retry purposes.
  bool retryable() const { return kind==ErrorKind::Transport || kind==ErrorKind::Timeout || kind==ErrorKind::Protocol; }
};

} // namespace cis
