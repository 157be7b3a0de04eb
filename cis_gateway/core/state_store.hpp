#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "channel.hpp"
#include "command_queue.hpp"

namespace cis {

// Bounded drop-oldest mailbox of snapshot versions for one consumer.
class Subscription {
  std::mutex m_;
  std::condition_variable cv_;
  std::deque<SnapshotPtr> q_;
  size_t depth_;
  uint64_t dropped_ = 0;
  bool closed_ = false;
public:
  explicit Subscription(size_t depth) : depth_(depth ? depth : 1) {}

  void push(SnapshotPtr s);
  // Oldest pending snapshot, waiting up to `wait`. false on timeout or close.
  bool next(SnapshotPtr& out, std::chrono::milliseconds wait);
  // Newest pending snapshot, discarding older ones. Never blocks.
  bool latest(SnapshotPtr& out);
  void close();
  uint64_t dropped();
};

class StateStore;

// A single change inside a commit.
struct ChannelChange {
  enum class Op { Value, Pwm, Health };
  Op op = Op::Value;
  std::string id;
  Reading reading;
  PwmChannelState pwm;
  Health health = Health::Fresh;
};

// Write handle of one driver. Channels are claimed once; a claimed channel
// can only be written through the handle that claimed it.
class ChannelOwner {
  StateStore* store_ = nullptr;
  TransportKind kind_ = TransportKind::ADC;
  uint64_t token_ = 0;
  std::string name_;
  friend class StateStore;
  ChannelOwner(StateStore* s, TransportKind k, uint64_t token, std::string name)
  : store_(s), kind_(k), token_(token), name_(std::move(name)) {}
public:
  ChannelOwner() = default;

  class Batch {
    std::vector<ChannelChange> changes_;
    friend class ChannelOwner;
  public:
    Batch& set(const std::string& id, const Reading& r);
    Batch& set_pwm(const std::string& id, const PwmChannelState& s, Health h = Health::Fresh);
    Batch& mark(const std::string& id, Health h);
    bool empty() const { return changes_.empty(); }
  };

  TransportKind kind() const { return kind_; }
  const std::string& name() const { return name_; }
  bool valid() const { return store_!=nullptr; }

  bool claim(const std::string& id, std::string& err);
  bool owns(const std::string& id) const;

  bool set(const std::string& id, const Reading& r);
  bool set_pwm(const std::string& id, const PwmChannelState& s, Health h = Health::Fresh);
  bool mark_stale(const std::string& id);
  bool mark_unconfirmed(const std::string& id);
  // All changes land in one version, or none do.
  bool commit(const Batch& b);
};

class StateStore {
public:
  // initial_version lets a restarted process keep versions increasing
  explicit StateStore(uint64_t initial_version = 0, size_t command_depth = 32);

  ChannelOwner attach(TransportKind kind, const std::string& driver);

  bool get(const std::string& key, Channel& out) const;
  SnapshotPtr snapshot() const;
  uint64_t version() const;

  // The first item delivered is the snapshot current at subscribe time.
  std::shared_ptr<Subscription> subscribe(size_t depth = 4);

  CommandQueue& commands(){ return commands_; }

private:
  friend class ChannelOwner;
  bool claim(TransportKind kind, uint64_t token, const std::string& id, std::string& err);
  bool owned_by(TransportKind kind, uint64_t token, const std::string& id) const;
  bool commit(TransportKind kind, uint64_t token, const std::vector<ChannelChange>& changes);

  mutable std::mutex m_;
  SnapshotPtr current_;
  std::map<std::string, uint64_t> claims_; // channel key -> owner token
  uint64_t next_token_ = 1;
  std::vector<std::weak_ptr<Subscription>> subs_;
  CommandQueue commands_;
};

} // namespace cis
