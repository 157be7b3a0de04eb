#include "core/state_store.hpp"
#include <atomic>
#include <thread>
#include <vector>
#include <unity.h>

using namespace cis;

void setUp(void) {}

void tearDown(void) {}

static int delta(const StateStore& store, uint64_t base){
  return (int)(store.version() - base);
}

// Test: Each single write bumps the version by exactly one
void test_version_increments_per_write(void) {
  StateStore store(1000);
  ChannelOwner adc = store.attach(TransportKind::ADC, "adc");
  std::string err;
  TEST_ASSERT_TRUE(adc.claim("channel_0_voltage", err));

  TEST_ASSERT_TRUE(adc.set("channel_0_voltage", Reading::number(1.25, "V")));
  TEST_ASSERT_EQUAL_INT(1, delta(store, 1000));
  TEST_ASSERT_TRUE(adc.set("channel_0_voltage", Reading::number(1.30, "V")));
  TEST_ASSERT_EQUAL_INT(2, delta(store, 1000));

  Channel ch;
  TEST_ASSERT_TRUE(store.get("adc:channel_0_voltage", ch));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.30f, (float)ch.reading.value);
  TEST_ASSERT_EQUAL_STRING("V", ch.reading.unit.c_str());
  TEST_ASSERT_TRUE(ch.health==Health::Fresh);
}

// Test: A batch with several channels lands in a single version
void test_batch_commit_is_one_version(void) {
  StateStore store;
  ChannelOwner lin = store.attach(TransportKind::LIN, "lin");
  std::string err;
  TEST_ASSERT_TRUE(lin.claim("temperature", err));
  TEST_ASSERT_TRUE(lin.claim("humidity", err));

  ChannelOwner::Batch b;
  b.set("temperature", Reading::number(21.5, "C")).set("humidity", Reading::number(40.0, "%"));
  TEST_ASSERT_TRUE(lin.commit(b));
  TEST_ASSERT_EQUAL_INT(1, delta(store, 0));

  SnapshotPtr snap = store.snapshot();
  TEST_ASSERT_NOT_NULL(snap->find("lin:temperature"));
  TEST_ASSERT_NOT_NULL(snap->find("lin:humidity"));
}

// Test: A channel has exactly one writer
void test_claimed_channel_rejects_other_writer(void) {
  StateStore store;
  ChannelOwner a = store.attach(TransportKind::CAN, "can");
  ChannelOwner b = store.attach(TransportKind::CAN, "can-2");
  std::string err;
  TEST_ASSERT_TRUE(a.claim("rpm", err));
  TEST_ASSERT_TRUE(a.claim("rpm", err));
  TEST_ASSERT_FALSE(b.claim("rpm", err));
  TEST_ASSERT_TRUE(err.find("can:rpm")!=std::string::npos);

  TEST_ASSERT_FALSE(b.set("rpm", Reading::number(1.0)));
  TEST_ASSERT_FALSE(a.set("unclaimed", Reading::number(1.0)));
  TEST_ASSERT_EQUAL_INT(0, delta(store, 0));
  TEST_ASSERT_TRUE(a.owns("rpm"));
  TEST_ASSERT_FALSE(b.owns("rpm"));
}

// Test: A batch with one unowned channel changes nothing
void test_batch_is_all_or_nothing(void) {
  StateStore store;
  ChannelOwner a = store.attach(TransportKind::ADC, "adc");
  std::string err;
  TEST_ASSERT_TRUE(a.claim("x", err));

  ChannelOwner::Batch b;
  b.set("x", Reading::number(1.0)).set("y", Reading::number(2.0));
  TEST_ASSERT_FALSE(a.commit(b));
  Channel ch;
  TEST_ASSERT_FALSE(store.get("adc:x", ch));
  TEST_ASSERT_EQUAL_INT(0, delta(store, 0));
}

// Test: Stale marking keeps the value, repeats do not bump the version
void test_stale_keeps_last_value(void) {
  StateStore store;
  ChannelOwner lin = store.attach(TransportKind::LIN, "lin");
  std::string err;
  TEST_ASSERT_TRUE(lin.claim("temp1", err));

  // Nothing to mark before the first value
  TEST_ASSERT_TRUE(lin.mark_stale("temp1"));
  TEST_ASSERT_EQUAL_INT(0, delta(store, 0));

  TEST_ASSERT_TRUE(lin.set("temp1", Reading::number(22.4, "C")));
  TEST_ASSERT_TRUE(lin.mark_stale("temp1"));
  TEST_ASSERT_EQUAL_INT(2, delta(store, 0));
  TEST_ASSERT_TRUE(lin.mark_stale("temp1"));
  TEST_ASSERT_EQUAL_INT(2, delta(store, 0));

  Channel ch;
  TEST_ASSERT_TRUE(store.get("lin:temp1", ch));
  TEST_ASSERT_TRUE(ch.health==Health::Stale);
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 22.4f, (float)ch.reading.value);

  TEST_ASSERT_TRUE(lin.set("temp1", Reading::number(22.6, "C")));
  TEST_ASSERT_TRUE(store.get("lin:temp1", ch));
  TEST_ASSERT_TRUE(ch.health==Health::Fresh);
}

// Test: PWM state is published with its duty as the reading
void test_pwm_state_channel(void) {
  StateStore store;
  ChannelOwner pwm = store.attach(TransportKind::PWM, "pwm");
  std::string err;
  TEST_ASSERT_TRUE(pwm.claim("12", err));

  PwmChannelState s;
  s.pin = 12;
  s.frequency = 26000;
  s.duty = 75.0;
  s.lifecycle = PwmLifecycle::Initialized;
  TEST_ASSERT_TRUE(pwm.set_pwm("12", s));
  TEST_ASSERT_TRUE(pwm.mark_unconfirmed("12"));

  Channel ch;
  TEST_ASSERT_TRUE(store.get("pwm:12", ch));
  TEST_ASSERT_TRUE(ch.has_pwm);
  TEST_ASSERT_EQUAL_INT(26000, ch.pwm.frequency);
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 75.0f, (float)ch.reading.value);
  TEST_ASSERT_TRUE(ch.health==Health::Unconfirmed);
}

// Test: Snapshots are immutable once handed out
void test_snapshot_is_immutable(void) {
  StateStore store;
  ChannelOwner a = store.attach(TransportKind::ADC, "adc");
  std::string err;
  TEST_ASSERT_TRUE(a.claim("x", err));
  SnapshotPtr before = store.snapshot();
  TEST_ASSERT_TRUE(a.set("x", Reading::number(3.0)));

  TEST_ASSERT_TRUE(before->version==0);
  TEST_ASSERT_NULL(before->find("adc:x"));
  TEST_ASSERT_NOT_NULL(store.snapshot()->find("adc:x"));
}

// Test: A subscriber first sees the current snapshot, then each change
void test_subscription_delivers_in_order(void) {
  StateStore store(50);
  ChannelOwner a = store.attach(TransportKind::ADC, "adc");
  std::string err;
  TEST_ASSERT_TRUE(a.claim("x", err));
  auto sub = store.subscribe(4);

  SnapshotPtr s;
  TEST_ASSERT_TRUE(sub->next(s, std::chrono::milliseconds(10)));
  TEST_ASSERT_TRUE(s->version==50);
  TEST_ASSERT_FALSE(sub->next(s, std::chrono::milliseconds(5)));

  TEST_ASSERT_TRUE(a.set("x", Reading::number(1.0)));
  TEST_ASSERT_TRUE(sub->next(s, std::chrono::milliseconds(10)));
  TEST_ASSERT_TRUE(s->version==51);
}

// Test: A slow subscriber loses the oldest versions, never the newest
void test_subscription_drops_oldest(void) {
  StateStore store;
  ChannelOwner a = store.attach(TransportKind::ADC, "adc");
  std::string err;
  TEST_ASSERT_TRUE(a.claim("x", err));
  auto sub = store.subscribe(2);
  for(int i=0; i<5; i++) TEST_ASSERT_TRUE(a.set("x", Reading::number(i)));

  TEST_ASSERT_EQUAL_INT(4, (int)sub->dropped());
  SnapshotPtr s;
  TEST_ASSERT_TRUE(sub->next(s, std::chrono::milliseconds(10)));
  TEST_ASSERT_TRUE(s->version==4);
  TEST_ASSERT_TRUE(sub->next(s, std::chrono::milliseconds(10)));
  TEST_ASSERT_TRUE(s->version==5);

  TEST_ASSERT_TRUE(a.set("x", Reading::number(9)));
  TEST_ASSERT_TRUE(a.set("x", Reading::number(10)));
  TEST_ASSERT_TRUE(sub->latest(s));
  TEST_ASSERT_TRUE(s->version==7);
  TEST_ASSERT_FALSE(sub->latest(s));
}

// Test: Concurrent writers produce gap-free, strictly increasing versions
void test_concurrent_writers_are_monotonic(void) {
  StateStore store(7);
  auto sub = store.subscribe(4096);
  const int writers = 4, writes = 250;
  std::vector<ChannelOwner> owners;
  std::string err;
  for(int w=0; w<writers; w++){
    owners.push_back(store.attach(TransportKind::ADC, "w"+std::to_string(w)));
    TEST_ASSERT_TRUE(owners.back().claim("ch"+std::to_string(w), err));
  }

  std::atomic<int> failed{0};
  std::vector<std::thread> th;
  for(int w=0; w<writers; w++){
    th.emplace_back([&, w]{
      for(int i=0; i<writes; i++)
        if(!owners[w].set("ch"+std::to_string(w), Reading::number(i))) failed++;
    });
  }
  for(auto& t : th) t.join();

  TEST_ASSERT_EQUAL_INT(0, failed.load());
  TEST_ASSERT_EQUAL_INT(writers*writes, delta(store, 7));

  uint64_t prev = 0;
  int seen = 0;
  SnapshotPtr s;
  while(sub->next(s, std::chrono::milliseconds(0))){
    if(seen>0) TEST_ASSERT_TRUE(s->version==prev+1);
    prev = s->version;
    seen++;
  }
  TEST_ASSERT_EQUAL_INT(writers*writes+1, seen);
  TEST_ASSERT_TRUE(prev==store.version());
}

// Test: Commands are validated before they are queued
void test_command_queue_validates(void) {
  StateStore store;
  std::future<Error> f;
  Error err;
  TEST_ASSERT_FALSE(store.commands().submit(PwmOp::Duty, 12, 0, 150.0, f, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Validation);
  err.clear();
  TEST_ASSERT_FALSE(store.commands().submit(PwmOp::Init, 12, 0, 0.0, f, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Validation);
  err.clear();
  TEST_ASSERT_FALSE(store.commands().submit(PwmOp::Enable, -1, 0, 0.0, f, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Validation);
  TEST_ASSERT_EQUAL_INT(0, (int)store.commands().size());
}

// Test: A full queue reports Busy and wakes the consumer on accept
void test_command_queue_bounded(void) {
  StateStore store(0, 2);
  int notified = 0;
  store.commands().set_notify([&notified]{ notified++; });
  std::future<Error> f1, f2, f3;
  Error err;
  TEST_ASSERT_TRUE(store.commands().submit(PwmOp::Duty, 12, 0, 40.0, f1, err));
  TEST_ASSERT_TRUE(store.commands().submit(PwmOp::Enable, 12, 0, 0.0, f2, err));
  TEST_ASSERT_FALSE(store.commands().submit(PwmOp::Disable, 12, 0, 0.0, f3, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Busy);
  TEST_ASSERT_EQUAL_INT(2, notified);

  std::vector<PwmCommand> cmds;
  TEST_ASSERT_EQUAL_INT(2, (int)store.commands().drain(cmds));
  TEST_ASSERT_TRUE(cmds[0].op==PwmOp::Duty);
  TEST_ASSERT_TRUE(cmds[1].op==PwmOp::Enable);
  Error ok;
  cmds[0].done.set_value(ok);
  TEST_ASSERT_TRUE(f1.get().ok());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_version_increments_per_write);
  RUN_TEST(test_batch_commit_is_one_version);
  RUN_TEST(test_claimed_channel_rejects_other_writer);
  RUN_TEST(test_batch_is_all_or_nothing);
  RUN_TEST(test_stale_keeps_last_value);
  RUN_TEST(test_pwm_state_channel);
  RUN_TEST(test_snapshot_is_immutable);
  RUN_TEST(test_subscription_delivers_in_order);
  RUN_TEST(test_subscription_drops_oldest);
  RUN_TEST(test_concurrent_writers_are_monotonic);
  RUN_TEST(test_command_queue_validates);
  RUN_TEST(test_command_queue_bounded);
  return UNITY_END();
}
