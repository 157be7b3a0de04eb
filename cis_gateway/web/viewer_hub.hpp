#pragma once
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../core/state_store.hpp"

namespace cis {

std::string channel_json(const Channel& c);
// {"version":N,"channels":{key:channel,...}}
std::string snapshot_json(const StateSnapshot& s);
// {"version":N,"from":M,"changed":{key:channel,...}}
std::string diff_json(const StateSnapshot& from, const StateSnapshot& to);

// SSE event id "<session hex>-<version>". Browsers send it back as Last-Event-ID.
std::string event_id(uint64_t session, uint64_t version);
// Version a reconnecting viewer holds; 0 when the id was issued by another
// process (or is malformed), so the viewer starts over from a snapshot.
uint64_t parse_event_id(const std::string& id, uint64_t session);

struct ViewerEvent {
  std::string type;      // "snapshot" or "diff"
  uint64_t version = 0;
  std::string data;
};

// Fans store versions out to dashboard viewers. Every viewer has its own
// bounded queue; overflow drops the queue and the viewer resyncs from a
// full snapshot. Events a viewer receives are strictly newer than the
// version it reported or was last given.
class ViewerHub {
  struct Viewer {
    uint64_t base = 0;           // version the viewer holds once its queue is drained
    bool sent_any = false;
    bool resync = true;
    std::deque<ViewerEvent> q;
    uint64_t overflows = 0;
  };

  std::shared_ptr<Subscription> sub_;
  size_t depth_;
  mutable std::mutex m_;
  SnapshotPtr last_;
  std::map<uint64_t, Viewer> viewers_;
  uint64_t next_id_ = 1;
  const uint64_t session_;
public:
  ViewerHub(StateStore& store, size_t queue_depth = 16);

  // Random per process, so versions from a previous run are never trusted.
  uint64_t session() const { return session_; }

  // last_seen: version the viewer already holds (0 for a new viewer).
  uint64_t connect(uint64_t last_seen);
  void disconnect(uint64_t id);
  // Pulls new store versions and queues a diff for every viewer.
  size_t pump();
  // Pending events for one viewer, oldest first. false for unknown ids.
  bool take(uint64_t id, std::vector<ViewerEvent>& out);

  size_t viewers() const;
  uint64_t overflows(uint64_t id) const;
};

} // namespace cis
