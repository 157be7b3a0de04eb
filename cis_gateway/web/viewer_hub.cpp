#include "viewer_hub.hpp"
#include <cstdio>
#include <cstdlib>
#include <random>
#include "../common/json_fields.hpp"

namespace cis {

static long long epoch_ms(WallClock::time_point t){
  return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::string channel_json(const Channel& c){
  JsonWriter w;
  w.str("kind", transport_str(c.kind)).str("id", c.id);
  if(c.reading.numeric) w.num("value", c.reading.value);
  else w.str("text", c.reading.text);
  if(!c.reading.unit.empty()) w.str("unit", c.reading.unit);
  w.str("health", health_str(c.health)).integer("updated", epoch_ms(c.updated));
  if(c.has_pwm){
    JsonWriter p;
    p.integer("pin", c.pwm.pin)
     .integer("frequency", c.pwm.frequency)
     .num("duty", c.pwm.duty)
     .boolean("enabled", c.pwm.enabled)
     .str("lifecycle", lifecycle_str(c.pwm.lifecycle))
     .integer("last_ack", epoch_ms(c.pwm.last_ack));
    if(c.pwm.has_rpm) p.num("rpm", c.pwm.rpm);
    w.raw("pwm", p.done());
  }
  return w.done();
}

static std::string channels_object(const std::map<std::string, Channel>& m){
  JsonWriter w;
  for(const auto& kv : m) w.raw(kv.first.c_str(), channel_json(kv.second));
  return w.done();
}

std::string snapshot_json(const StateSnapshot& s){
  return JsonWriter().integer("version", (long long)s.version).raw("channels", channels_object(s.channels)).done();
}

static bool same(const Channel& a, const Channel& b){
  return a.updated==b.updated && a.health==b.health && a.has_pwm==b.has_pwm &&
         a.reading.numeric==b.reading.numeric && a.reading.value==b.reading.value &&
         a.reading.text==b.reading.text && a.pwm.last_ack==b.pwm.last_ack;
}

std::string diff_json(const StateSnapshot& from, const StateSnapshot& to){
  std::map<std::string, Channel> changed;
  for(const auto& kv : to.channels){
    const Channel* old = from.find(kv.first);
    if(!old || !same(*old, kv.second)) changed.insert(kv);
  }
  return JsonWriter()
      .integer("version", (long long)to.version)
      .integer("from", (long long)from.version)
      .raw("changed", channels_object(changed))
      .done();
}

std::string event_id(uint64_t session, uint64_t version){
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%llx-%llu", (unsigned long long)session, (unsigned long long)version);
  return buf;
}

uint64_t parse_event_id(const std::string& id, uint64_t session){
  const size_t dash = id.find('-');
  if(dash==std::string::npos || dash==0 || dash+1>=id.size()) return 0;
  char* end=nullptr;
  const std::string head = id.substr(0, dash);
  const unsigned long long s = std::strtoull(head.c_str(), &end, 16);
  if(*end!='\0' || s!=session) return 0;
  const std::string tail = id.substr(dash+1);
  const unsigned long long v = std::strtoull(tail.c_str(), &end, 10);
  if(*end!='\0') return 0;
  return (uint64_t)v;
}

static uint64_t new_session(){
  std::random_device rd;
  const uint64_t s = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
  return s ? s : 1;
}

ViewerHub::ViewerHub(StateStore& store, size_t queue_depth)
: sub_(store.subscribe(8)), depth_(queue_depth ? queue_depth : 1), last_(store.snapshot()),
  session_(new_session()) {}

uint64_t ViewerHub::connect(uint64_t last_seen){
  std::lock_guard<std::mutex> lk(m_);
  Viewer v;
  v.base = last_seen;
  v.sent_any = last_seen!=0;
  // A viewer that already holds the current version just waits for diffs.
  v.resync = !(last_seen!=0 && last_ && last_seen==last_->version);
  const uint64_t id = next_id_++;
  viewers_[id] = std::move(v);
  return id;
}

void ViewerHub::disconnect(uint64_t id){
  std::lock_guard<std::mutex> lk(m_);
  viewers_.erase(id);
}

size_t ViewerHub::pump(){
  SnapshotPtr snap;
  if(!sub_->latest(snap)) return 0;
  std::lock_guard<std::mutex> lk(m_);
  if(last_ && snap->version<=last_->version) return 0;
  const SnapshotPtr prev = last_;
  last_ = snap;
  if(!prev) return 0;

  std::string diff;
  size_t queued=0;
  for(auto& kv : viewers_){
    Viewer& v = kv.second;
    if(v.resync) continue;
    if(v.base!=prev->version){ v.resync=true; v.q.clear(); continue; }
    if(v.q.size()>=depth_){
      v.q.clear();
      v.resync=true;
      v.overflows++;
      continue;
    }
    if(diff.empty()) diff = diff_json(*prev, *snap);
    ViewerEvent e;
    e.type="diff"; e.version=snap->version; e.data=diff;
    v.q.push_back(std::move(e));
    v.base = snap->version;
    queued++;
  }
  return queued;
}

bool ViewerHub::take(uint64_t id, std::vector<ViewerEvent>& out){
  std::lock_guard<std::mutex> lk(m_);
  auto it = viewers_.find(id);
  if(it==viewers_.end()) return false;
  Viewer& v = it->second;
  if(v.resync && last_ && (!v.sent_any || last_->version>v.base)){
    ViewerEvent e;
    e.type="snapshot"; e.version=last_->version; e.data=snapshot_json(*last_);
    out.push_back(std::move(e));
    v.base = last_->version;
    v.sent_any = true;
    v.resync = false;
    v.q.clear();
    return true;
  }
  for(auto& e : v.q) out.push_back(std::move(e));
  v.q.clear();
  return true;
}

size_t ViewerHub::viewers() const {
  std::lock_guard<std::mutex> lk(m_);
  return viewers_.size();
}

uint64_t ViewerHub::overflows(uint64_t id) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = viewers_.find(id);
  return it==viewers_.end() ? 0 : it->second.overflows;
}

} // namespace cis
