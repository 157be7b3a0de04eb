#include "web/viewer_hub.hpp"
#include "web/http_server.hpp"
#include "drivers/pwm_client.hpp"
#include <memory>
#include <unity.h>

using namespace cis;

static std::unique_ptr<StateStore> store;
static ChannelOwner adc;

void setUp(void) {
  store = std::make_unique<StateStore>(100);
  adc = store->attach(TransportKind::ADC, "adc");
  std::string err;
  adc.claim("a", err);
  adc.claim("b", err);
}

void tearDown(void) {
  store.reset();
}

static void put(const char* id, double v){
  TEST_ASSERT_TRUE(adc.set(id, Reading::number(v, "V")));
}

static std::vector<ViewerEvent> take(ViewerHub& hub, uint64_t id){
  std::vector<ViewerEvent> ev;
  TEST_ASSERT_TRUE(hub.take(id, ev));
  return ev;
}

// Test: A new viewer gets a snapshot first, then diffs
void test_new_viewer_snapshot_then_diff(void) {
  ViewerHub hub(*store, 4);
  put("a", 1.0);
  hub.pump();

  const uint64_t id = hub.connect(0);
  auto ev = take(hub, id);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("snapshot", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==101);
  TEST_ASSERT_TRUE(ev[0].data.find("\"adc:a\"")!=std::string::npos);

  put("b", 2.0);
  TEST_ASSERT_EQUAL_INT(1, (int)hub.pump());
  ev = take(hub, id);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("diff", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==102);
  TEST_ASSERT_TRUE(ev[0].data.find("\"from\":101")!=std::string::npos);
  TEST_ASSERT_TRUE(ev[0].data.find("\"adc:b\"")!=std::string::npos);
  TEST_ASSERT_TRUE(ev[0].data.find("\"adc:a\"")==std::string::npos);

  TEST_ASSERT_EQUAL_INT(0, (int)take(hub, id).size());
}

// Test: A full queue collapses into one snapshot of the newest version
void test_overflow_resyncs_with_snapshot(void) {
  ViewerHub hub(*store, 2);
  const uint64_t id = hub.connect(0);
  take(hub, id);

  for(int i=0; i<4; i++){ put("a", i); hub.pump(); }
  TEST_ASSERT_EQUAL_INT(1, (int)hub.overflows(id));

  auto ev = take(hub, id);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("snapshot", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==store->version());

  put("b", 5.0);
  hub.pump();
  ev = take(hub, id);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("diff", ev[0].type.c_str());
}

// Test: One slow viewer does not hold the others back
void test_slow_viewer_isolated(void) {
  ViewerHub hub(*store, 2);
  const uint64_t slow = hub.connect(0);
  const uint64_t fast = hub.connect(0);
  take(hub, slow);
  take(hub, fast);

  uint64_t prev = store->version();
  for(int i=0; i<6; i++){
    put("a", i);
    hub.pump();
    auto ev = take(hub, fast);
    TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
    TEST_ASSERT_EQUAL_STRING("diff", ev[0].type.c_str());
    TEST_ASSERT_TRUE(ev[0].version==prev+1);
    prev = ev[0].version;
  }
  TEST_ASSERT_TRUE(hub.overflows(slow)>=1);
  TEST_ASSERT_EQUAL_INT(0, (int)hub.overflows(fast));
  TEST_ASSERT_EQUAL_INT(2, (int)hub.viewers());
  hub.disconnect(slow);
  TEST_ASSERT_EQUAL_INT(1, (int)hub.viewers());
}

// Test: A reconnecting viewer never receives a version it already holds
void test_reconnect_never_older(void) {
  ViewerHub hub(*store, 4);
  put("a", 1.0);
  hub.pump();
  const uint64_t held = store->version();

  // Holds the current version: diffs only
  const uint64_t same = hub.connect(held);
  TEST_ASSERT_EQUAL_INT(0, (int)take(hub, same).size());
  put("a", 2.0);
  hub.pump();
  auto ev = take(hub, same);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("diff", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==held+1);

  // Claims a version ahead of this process: nothing until the store passes it
  const uint64_t ahead = hub.connect(held+1000);
  put("a", 3.0);
  hub.pump();
  ev = take(hub, ahead);
  for(const auto& e : ev) TEST_ASSERT_TRUE(e.version>held+1000);
  TEST_ASSERT_EQUAL_INT(0, (int)ev.size());

  // Behind: a full snapshot
  const uint64_t behind = hub.connect(held-1);
  ev = take(hub, behind);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("snapshot", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==store->version());
}

// Test: Event ids carry the process session; ids from another run start over
void test_event_id_session(void) {
  ViewerHub hub(*store, 4);
  const uint64_t s = hub.session();
  TEST_ASSERT_TRUE(s!=0);
  TEST_ASSERT_TRUE(parse_event_id(event_id(s, 12345), s)==12345);
  TEST_ASSERT_TRUE(parse_event_id(event_id(s+1, 12345), s)==0);
  TEST_ASSERT_TRUE(parse_event_id("12345", s)==0);
  TEST_ASSERT_TRUE(parse_event_id("-12", s)==0);
  TEST_ASSERT_TRUE(parse_event_id(event_id(s, 7)+"x", s)==0);

  // A previous process reached a much higher version than this one
  put("a", 1.0);
  hub.pump();
  const std::string old_id = event_id(s ^ 0x5A5A, store->version() + 1000000);
  const uint64_t id = hub.connect(parse_event_id(old_id, s));
  auto ev = take(hub, id);
  TEST_ASSERT_EQUAL_INT(1, (int)ev.size());
  TEST_ASSERT_EQUAL_STRING("snapshot", ev[0].type.c_str());
  TEST_ASSERT_TRUE(ev[0].version==store->version());
}

// Test: Unknown viewer ids are reported
void test_unknown_viewer(void) {
  ViewerHub hub(*store);
  std::vector<ViewerEvent> ev;
  TEST_ASSERT_FALSE(hub.take(42, ev));
  TEST_ASSERT_EQUAL_INT(0, (int)hub.overflows(42));
}

// Test: Channel JSON carries health and PWM state
void test_channel_json(void) {
  Channel c;
  c.kind = TransportKind::PWM;
  c.id = "12";
  c.has_pwm = true;
  c.pwm.pin = 12;
  c.pwm.frequency = 26000;
  c.pwm.duty = 75.0;
  c.pwm.lifecycle = PwmLifecycle::Initialized;
  c.reading = Reading::number(75.0, "%");
  c.health = Health::Unconfirmed;
  const std::string j = channel_json(c);
  TEST_ASSERT_TRUE(j.find("\"health\":\"unconfirmed\"")!=std::string::npos);
  TEST_ASSERT_TRUE(j.find("\"frequency\":26000")!=std::string::npos);
  TEST_ASSERT_TRUE(j.find("\"lifecycle\":\"initialized\"")!=std::string::npos);
  TEST_ASSERT_TRUE(j.find("\"duty\":75")!=std::string::npos);

  Channel s;
  s.kind = TransportKind::CAN;
  s.id = "status";
  s.reading = Reading::label("OFF");
  TEST_ASSERT_TRUE(channel_json(s).find("\"text\":\"OFF\"")!=std::string::npos);
}

// Test: Snapshot JSON is keyed by channel
void test_snapshot_json(void) {
  put("a", 1.25);
  const std::string j = snapshot_json(*store->snapshot());
  TEST_ASSERT_TRUE(j.find("\"version\":101")!=std::string::npos);
  TEST_ASSERT_TRUE(j.find("\"adc:a\":{")!=std::string::npos);
  TEST_ASSERT_TRUE(j.find("\"value\":1.25")!=std::string::npos);
}

// Test: Command outcomes map to HTTP status codes
void test_status_codes(void) {
  Error e;
  TEST_ASSERT_EQUAL_INT(200, status_for(e));
  e.set(ErrorKind::Validation, "duty");
  TEST_ASSERT_EQUAL_INT(400, status_for(e));
  e.set(ErrorKind::Busy, "full");
  TEST_ASSERT_EQUAL_INT(503, status_for(e));
  e.set(ErrorKind::Daemon, "HTTP 500");
  TEST_ASSERT_EQUAL_INT(502, status_for(e));
  e.set(ErrorKind::Timeout, "late");
  TEST_ASSERT_EQUAL_INT(504, status_for(e));
}

// Test: The dashboard waits longer than one full PWM call
void test_command_timeout_covers_retries(void) {
  Config C;
  const HttpSettings S = HttpSettings::from(C);
  TEST_ASSERT_EQUAL_INT(8099, S.port);
  TEST_ASSERT_TRUE(S.command_timeout > PwmSettings::from(C).call_budget());

  // Several pins: a command may sit behind a whole run of bring-up calls
  std::string err;
  TEST_ASSERT_TRUE(parse_int_list("12,13,18", C.pwm_pins, err));
  const PwmSettings P = PwmSettings::from(C);
  TEST_ASSERT_TRUE(P.run_budget() == P.call_budget()*8);
  TEST_ASSERT_TRUE(HttpSettings::from(C).command_timeout > P.run_budget() + P.call_budget()*7);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_new_viewer_snapshot_then_diff);
  RUN_TEST(test_overflow_resyncs_with_snapshot);
  RUN_TEST(test_slow_viewer_isolated);
  RUN_TEST(test_reconnect_never_older);
  RUN_TEST(test_event_id_session);
  RUN_TEST(test_unknown_viewer);
  RUN_TEST(test_channel_json);
  RUN_TEST(test_snapshot_json);
  RUN_TEST(test_status_codes);
  RUN_TEST(test_command_timeout_covers_retries);
  return UNITY_END();
}
