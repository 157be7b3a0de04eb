#include "drivers/can_driver.hpp"
#include <algorithm>
#include <deque>
#include <map>
#include <thread>
#include <unity.h>

using namespace cis;

static Logger quiet(LogLevel::ERROR);

static CanFrame frame(uint32_t id, std::vector<uint8_t> data){
  CanFrame f;
  f.id = id;
  f.dlc = (uint8_t)data.size();
  for(size_t i=0; i<data.size() && i<8; i++) f.data[i] = data[i];
  return f;
}

// Bus stand-in: each request id triggers a scripted list of frames.
class FakeCan : public CanBus {
public:
  std::map<uint32_t, std::vector<CanFrame>> on_request;
  std::deque<CanFrame> rx;
  std::vector<CanFrame> sent;
  bool broken = false;

  bool send(const CanFrame& f, Error& err) override {
    if(broken){ err.set(ErrorKind::Transport, "ENETDOWN"); return false; }
    sent.push_back(f);
    auto it = on_request.find(f.id);
    if(it!=on_request.end()) rx.insert(rx.end(), it->second.begin(), it->second.end());
    return true;
  }
  int receive(CanFrame& f, std::chrono::milliseconds timeout, Error& err) override {
    if(broken){ err.set(ErrorKind::Transport, "ENETDOWN"); return -1; }
    if(rx.empty()){
      std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(1)));
      return 0;
    }
    f = rx.front();
    rx.pop_front();
    return 1;
  }
};

static CanSettings settings(const std::string& signals){
  Config C;
  std::string err;
  TEST_ASSERT_TRUE(parse_can_signals(signals, C.can_signals, err));
  CanSettings S = CanSettings::from(C);
  S.timeout = std::chrono::milliseconds(20);
  S.retry.delay = std::chrono::milliseconds(1);
  return S;
}

void setUp(void) {}

void tearDown(void) {}

// Test: Little endian field with scale
void test_decode_field(void) {
  CanSignalSpec s;
  s.offset = 1;
  s.length = 2;
  s.scale = 0.5;
  double v = 0.0;
  Error err;
  TEST_ASSERT_TRUE(can_decode(s, frame(0x101, {0xFF, 0x10, 0x27}), v, err));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 5000.0f, (float)v);

  TEST_ASSERT_FALSE(can_decode(s, frame(0x101, {0xFF, 0x10}), v, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Protocol);
}

// Test: Request/response pairs are matched by arbitration id
void test_response_matched_by_id(void) {
  StateStore store;
  FakeCan bus;
  bus.on_request[0x100] = { frame(0x200, {1,2,3,4,5,6,7,8}), frame(0x101, {0x10, 0x27}) };
  CanDriver can(settings("rpm:0x100:0x101:0:2:0.5:rpm"), bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  TEST_ASSERT_EQUAL_INT(1, (int)bus.sent.size());
  TEST_ASSERT_EQUAL_HEX32(0x100, bus.sent[0].id);
  TEST_ASSERT_FALSE(bus.sent[0].extended);

  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:rpm", ch));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 5000.0f, (float)ch.reading.value);
  TEST_ASSERT_EQUAL_STRING("rpm", ch.reading.unit.c_str());
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("ON", ch.reading.text.c_str());
  TEST_ASSERT_TRUE(store.version()==1);
}

// Test: Request ids above 11 bits go out as extended frames
void test_extended_request(void) {
  StateStore store;
  FakeCan bus;
  bus.on_request[0x18DA10F1] = { frame(0x18DAF110, {0x2A}) };
  CanDriver can(settings("soc:0x18DA10F1:0x18DAF110:0:1:1:%"), bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  TEST_ASSERT_TRUE(bus.sent[0].extended);
  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:soc", ch));
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 42.0f, (float)ch.reading.value);
}

// Test: Passive signals wait for the broadcast without sending
void test_passive_signal(void) {
  StateStore store;
  FakeCan bus;
  bus.rx.push_back(frame(0x300, {0x64, 0x00, 0x00, 0x00}));
  CanDriver can(settings("pack_v:-:0x300:0:2:0.1:V"), bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  TEST_ASSERT_EQUAL_INT(0, (int)bus.sent.size());
  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:pack_v", ch));
  TEST_ASSERT_FLOAT_WITHIN(1e-5f, 10.0f, (float)ch.reading.value);
}

// Test: A frame too short for the signal is retried, then the channel goes stale
void test_short_dlc_goes_stale(void) {
  StateStore store;
  FakeCan bus;
  bus.on_request[0x100] = { frame(0x101, {0x10, 0x27}) };
  CanSettings S = settings("rpm:0x100:0x101:0:2:1");
  S.retry.retries = 2;
  CanDriver can(S, bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));

  bus.on_request[0x100] = { frame(0x101, {0x10}) };
  TEST_ASSERT_FALSE(can.poll(ctx, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Protocol);
  TEST_ASSERT_EQUAL_INT(3, (int)can.stats().protocol_errors);

  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:rpm", ch));
  TEST_ASSERT_TRUE(ch.health==Health::Stale);
  // The bus itself still carries traffic
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("ON", ch.reading.text.c_str());
}

// Test: One absent signal goes stale while the others keep the poll healthy
void test_absent_signal_does_not_fail_poll(void) {
  StateStore store;
  FakeCan bus;
  bus.on_request[0x100] = { frame(0x101, {0x10, 0x27}) };
  CanSettings S = settings("rpm:0x100:0x101:0:2:1,soc:0x110:0x111:0:1:1");
  S.retry.retries = 1;
  CanDriver can(S, bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  TEST_ASSERT_EQUAL_INT(1, (int)can.stats().failures);

  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:rpm", ch));
  TEST_ASSERT_TRUE(ch.health==Health::Fresh);
  TEST_ASSERT_FALSE(store.get("can:soc", ch));
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("ON", ch.reading.text.c_str());
}

// Test: A silent bus reads OFF without failing the poll
void test_silent_bus_is_off(void) {
  StateStore store;
  FakeCan bus;
  CanDriver can(settings(""), bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("OFF", ch.reading.text.c_str());

  bus.rx.push_back(frame(0x7DF, {0x02, 0x01, 0x0C}));
  TEST_ASSERT_TRUE(can.poll(ctx, err));
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("ON", ch.reading.text.c_str());
}

// Test: A socket error fails the poll as a transport error
void test_bus_error_is_transport(void) {
  StateStore store;
  FakeCan bus;
  bus.broken = true;
  CanDriver can(settings(""), bus, store, quiet);
  std::string cerr;
  TEST_ASSERT_TRUE(can.claim_channels(cerr));

  CancelToken tok;
  TaskContext ctx(tok, Clock::now() + std::chrono::seconds(5));
  Error err;
  TEST_ASSERT_FALSE(can.poll(ctx, err));
  TEST_ASSERT_TRUE(err.kind==ErrorKind::Transport);
  Channel ch;
  TEST_ASSERT_TRUE(store.get("can:status", ch));
  TEST_ASSERT_EQUAL_STRING("OFF", ch.reading.text.c_str());
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_decode_field);
  RUN_TEST(test_response_matched_by_id);
  RUN_TEST(test_extended_request);
  RUN_TEST(test_passive_signal);
  RUN_TEST(test_short_dlc_goes_stale);
  RUN_TEST(test_absent_signal_does_not_fail_poll);
  RUN_TEST(test_silent_bus_is_off);
  RUN_TEST(test_bus_error_is_transport);
  return UNITY_END();
}
