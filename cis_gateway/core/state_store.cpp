#include "state_store.hpp"
#include <algorithm>

namespace cis {

void Subscription::push(SnapshotPtr s){
  {
    std::lock_guard<std::mutex> lk(m_);
    if(closed_) return;
    if(q_.size()>=depth_){ q_.pop_front(); dropped_++; }
    q_.push_back(std::move(s));
  }
  cv_.notify_one();
}

bool Subscription::next(SnapshotPtr& out, std::chrono::milliseconds wait){
  std::unique_lock<std::mutex> lk(m_);
  if(!cv_.wait_for(lk, wait, [this]{ return closed_ || !q_.empty(); })) return false;
  if(q_.empty()) return false;
  out = std::move(q_.front());
  q_.pop_front();
  return true;
}

bool Subscription::latest(SnapshotPtr& out){
  std::lock_guard<std::mutex> lk(m_);
  if(q_.empty()) return false;
  out = std::move(q_.back());
  q_.clear();
  return true;
}

void Subscription::close(){
  { std::lock_guard<std::mutex> lk(m_); closed_=true; q_.clear(); }
  cv_.notify_all();
}

uint64_t Subscription::dropped(){
  std::lock_guard<std::mutex> lk(m_);
  return dropped_;
}

// ---- ChannelOwner ----

ChannelOwner::Batch& ChannelOwner::Batch::set(const std::string& id, const Reading& r){
  ChannelChange c; c.op=ChannelChange::Op::Value; c.id=id; c.reading=r;
  changes_.push_back(std::move(c));
  return *this;
}

ChannelOwner::Batch& ChannelOwner::Batch::set_pwm(const std::string& id, const PwmChannelState& s, Health h){
  ChannelChange c; c.op=ChannelChange::Op::Pwm; c.id=id; c.pwm=s; c.health=h;
  changes_.push_back(std::move(c));
  return *this;
}

ChannelOwner::Batch& ChannelOwner::Batch::mark(const std::string& id, Health h){
  ChannelChange c; c.op=ChannelChange::Op::Health; c.id=id; c.health=h;
  changes_.push_back(std::move(c));
  return *this;
}

bool ChannelOwner::claim(const std::string& id, std::string& err){
  if(!store_){ err="detached owner"; return false; }
  return store_->claim(kind_, token_, id, err);
}

bool ChannelOwner::owns(const std::string& id) const {
  return store_ && store_->owned_by(kind_, token_, id);
}

bool ChannelOwner::set(const std::string& id, const Reading& r){
  Batch b; b.set(id, r); return commit(b);
}

bool ChannelOwner::set_pwm(const std::string& id, const PwmChannelState& s, Health h){
  Batch b; b.set_pwm(id, s, h); return commit(b);
}

bool ChannelOwner::mark_stale(const std::string& id){
  Batch b; b.mark(id, Health::Stale); return commit(b);
}

bool ChannelOwner::mark_unconfirmed(const std::string& id){
  Batch b; b.mark(id, Health::Unconfirmed); return commit(b);
}

bool ChannelOwner::commit(const Batch& b){
  if(!store_) return false;
  return store_->commit(kind_, token_, b.changes_);
}

// ---- StateStore ----

StateStore::StateStore(uint64_t initial_version, size_t command_depth)
: commands_(command_depth) {
  auto s = std::make_shared<StateSnapshot>();
  s->version = initial_version;
  current_ = s;
}

ChannelOwner StateStore::attach(TransportKind kind, const std::string& driver){
  std::lock_guard<std::mutex> lk(m_);
  return ChannelOwner(this, kind, next_token_++, driver);
}

bool StateStore::claim(TransportKind kind, uint64_t token, const std::string& id, std::string& err){
  if(id.empty()){ err="empty channel id"; return false; }
  std::lock_guard<std::mutex> lk(m_);
  const std::string key = channel_key(kind, id);
  auto it = claims_.find(key);
  if(it!=claims_.end()){
    if(it->second==token) return true;
    err="channel "+key+" already owned by another driver";
    return false;
  }
  claims_[key]=token;
  return true;
}

bool StateStore::owned_by(TransportKind kind, uint64_t token, const std::string& id) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = claims_.find(channel_key(kind, id));
  return it!=claims_.end() && it->second==token;
}

bool StateStore::commit(TransportKind kind, uint64_t token, const std::vector<ChannelChange>& changes){
  if(changes.empty()) return true;
  std::lock_guard<std::mutex> lk(m_);
  for(const auto& c : changes){
    auto it = claims_.find(channel_key(kind, c.id));
    if(it==claims_.end() || it->second!=token) return false;
  }

  auto next = std::make_shared<StateSnapshot>(*current_);
  const auto now = WallClock::now();
  bool changed=false;
  for(const auto& c : changes){
    const std::string key = channel_key(kind, c.id);
    auto it = next->channels.find(key);
    switch(c.op){
      case ChannelChange::Op::Value: {
        Channel& ch = next->channels[key];
        ch.kind=kind; ch.id=c.id;
        ch.reading=c.reading;
        ch.health=Health::Fresh;
        ch.updated=now;
        changed=true;
        break;
      }
      case ChannelChange::Op::Pwm: {
        Channel& ch = next->channels[key];
        ch.kind=kind; ch.id=c.id;
        ch.has_pwm=true;
        ch.pwm=c.pwm;
        ch.reading=Reading::number(c.pwm.duty, "%");
        ch.health=c.health;
        ch.updated=now;
        changed=true;
        break;
      }
      case ChannelChange::Op::Health:
        // Health of a channel that never produced a value is not tracked.
        if(it!=next->channels.end() && it->second.health!=c.health){
          it->second.health=c.health;
          changed=true;
        }
        break;
    }
  }
  if(!changed) return true;

  next->version = current_->version + 1;
  current_ = next;
  // Delivered under the lock so every mailbox sees versions in order.
  // push() never waits on a consumer.
  subs_.erase(std::remove_if(subs_.begin(), subs_.end(),
                             [](const std::weak_ptr<Subscription>& w){ return w.expired(); }),
              subs_.end());
  for(auto& w : subs_){
    if(auto s = w.lock()) s->push(current_);
  }
  return true;
}

bool StateStore::get(const std::string& key, Channel& out) const {
  std::lock_guard<std::mutex> lk(m_);
  const Channel* c = current_->find(key);
  if(!c) return false;
  out=*c;
  return true;
}

SnapshotPtr StateStore::snapshot() const {
  std::lock_guard<std::mutex> lk(m_);
  return current_;
}

uint64_t StateStore::version() const {
  std::lock_guard<std::mutex> lk(m_);
  return current_->version;
}

std::shared_ptr<Subscription> StateStore::subscribe(size_t depth){
  auto s = std::make_shared<Subscription>(depth);
  std::lock_guard<std::mutex> lk(m_);
  s->push(current_);
  subs_.push_back(s);
  return s;
}

} // namespace cis
