#include "common/config.hpp"
#include "common/json_fields.hpp"
#include "common/logger.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unity.h>

using namespace cis;

static const char* kPath = "test_config.json";

static void write_file(const std::string& body){
  std::ofstream f(kPath);
  f << body;
}

void setUp(void) {
  unsetenv("CIS_MQTT_USERNAME");
  unsetenv("CIS_MQTT_PASSWORD");
}

void tearDown(void) {
  std::remove(kPath);
}

// Test: Defaults describe the stock board
void test_defaults(void) {
  Config C;
  TEST_ASSERT_EQUAL_INT(8099, C.http_port);
  TEST_ASSERT_EQUAL_INT(6, (int)C.adc_channels.size());
  TEST_ASSERT_TRUE(C.adc_channels[0].quantity==AdcQuantity::Voltage);
  TEST_ASSERT_TRUE(C.adc_channels[4].quantity==AdcQuantity::Resistance);
  TEST_ASSERT_EQUAL_INT(2, (int)C.lin_frames.size());
  TEST_ASSERT_EQUAL_STRING("temperature", C.lin_frames[0].name.c_str());
  TEST_ASSERT_EQUAL_HEX8(0x50, C.lin_frames[0].pid);
  TEST_ASSERT_EQUAL_INT(1, (int)C.pwm_pins.size());
  TEST_ASSERT_EQUAL_INT(12, C.pwm_pins[0]);
  TEST_ASSERT_EQUAL_STRING("cis3", C.mqtt_base_topic.c_str());
  std::string err;
  TEST_ASSERT_TRUE(validate_config(C, err));
}

// Test: LIN frame lists parse and reject duplicates
void test_parse_lin_frames(void) {
  std::vector<LinFrameSpec> out;
  std::string err;
  TEST_ASSERT_TRUE(parse_lin_frames("temp1:0x50:C, pressure:81", out, err));
  TEST_ASSERT_EQUAL_INT(2, (int)out.size());
  TEST_ASSERT_EQUAL_INT(81, out[1].pid);
  TEST_ASSERT_EQUAL_STRING("", out[1].unit.c_str());

  TEST_ASSERT_FALSE(parse_lin_frames("a:0x50,b:0x50", out, err));
  TEST_ASSERT_FALSE(parse_lin_frames("a:0x150", out, err));
  TEST_ASSERT_FALSE(parse_lin_frames("a", out, err));
}

// Test: CAN signal lists parse, including passive signals
void test_parse_can_signals(void) {
  std::vector<CanSignalSpec> out;
  std::string err;
  TEST_ASSERT_TRUE(parse_can_signals("rpm:0x100:0x101:0:2:0.5:rpm,volts:-:0x300:2:2:0.01:V", out, err));
  TEST_ASSERT_EQUAL_INT(2, (int)out.size());
  TEST_ASSERT_EQUAL_INT(0x100, out[0].request_id);
  TEST_ASSERT_EQUAL_INT(-1, out[1].request_id);
  TEST_ASSERT_EQUAL_INT(2, out[1].offset);
  TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.01f, (float)out[1].scale);

  TEST_ASSERT_FALSE(parse_can_signals("x:1:2:6:4:1", out, err));
  TEST_ASSERT_FALSE(parse_can_signals("x:1:2:0:5:1", out, err));
  TEST_ASSERT_FALSE(parse_can_signals("x:1:2:0:2", out, err));
  TEST_ASSERT_TRUE(err.find("x:1:2:0:2")!=std::string::npos);
}

// Test: ADC channel lists are bounded to the eight MCP3008 inputs
void test_parse_adc_channels(void) {
  std::vector<AdcChannelSpec> out;
  std::string err;
  TEST_ASSERT_TRUE(parse_adc_channels("0,1", "7", out, err));
  TEST_ASSERT_EQUAL_INT(3, (int)out.size());
  TEST_ASSERT_FALSE(parse_adc_channels("0,8", "", out, err));
  TEST_ASSERT_FALSE(parse_adc_channels("0,1", "1", out, err));
}

// Test: File values override defaults, environment overrides secrets
void test_load_overrides(void) {
  write_file("{\n"
             "  \"http_port\": 9000,\n"
             "  \"adc_voltage_channels\": \"0,1\",\n"
             "  \"adc_resistance_channels\": \"\",\n"
             "  \"lin_frames\": \"temp1:0x50:C\",\n"
             "  \"can_signals\": \"rpm:0x100:0x101:0:2:1:rpm\",\n"
             "  \"pwm_pins\": \"12,13\",\n"
             "  \"pwm_initial_duty\": 25.5,\n"
             "  \"adc_retry_delay_ms\": 7,\n"
             "  \"can_retry_delay_ms\": 0,\n"
             "  \"mqtt_host\": \"broker.local\",\n"
             "  \"mqtt_username\": \"from_file\"\n"
             "}\n");
  setenv("CIS_MQTT_USERNAME", "from_env", 1);
  Config C;
  std::string err;
  TEST_ASSERT_TRUE(load_config_json(kPath, C, err));
  TEST_ASSERT_EQUAL_INT(9000, C.http_port);
  TEST_ASSERT_EQUAL_INT(2, (int)C.adc_channels.size());
  TEST_ASSERT_EQUAL_INT(1, (int)C.lin_frames.size());
  TEST_ASSERT_EQUAL_INT(1, (int)C.can_signals.size());
  TEST_ASSERT_EQUAL_INT(2, (int)C.pwm_pins.size());
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 25.5f, (float)C.pwm_initial_duty);
  TEST_ASSERT_EQUAL_INT(7, C.adc_retry_delay_ms);
  TEST_ASSERT_EQUAL_INT(0, C.can_retry_delay_ms);
  TEST_ASSERT_EQUAL_INT(100, C.lin_retry_delay_ms);
  TEST_ASSERT_EQUAL_STRING("broker.local", C.mqtt_host.c_str());
  TEST_ASSERT_EQUAL_STRING("from_env", C.mqtt_username.c_str());
  TEST_ASSERT_EQUAL_STRING("mqtt_pass", C.mqtt_password.c_str());
}

// Test: Invalid settings are refused before anything opens a device
void test_load_rejects_bad_values(void) {
  Config C;
  std::string err;
  TEST_ASSERT_FALSE(load_config_json("does/not/exist.json", C, err));
  TEST_ASSERT_TRUE(err.find("does/not/exist.json")!=std::string::npos);

  write_file("{\"pwm_initial_duty\": 120}");
  Config D;
  TEST_ASSERT_FALSE(load_config_json(kPath, D, err));
  TEST_ASSERT_TRUE(err.find("pwm_initial_duty")!=std::string::npos);

  write_file("{\"lin_retries\": -1}");
  Config E;
  TEST_ASSERT_FALSE(load_config_json(kPath, E, err));

  write_file("{\"can_retry_delay_ms\": -5}");
  Config G;
  TEST_ASSERT_FALSE(load_config_json(kPath, G, err));
  TEST_ASSERT_TRUE(err.find("retry delays")!=std::string::npos);

  write_file("{\"lin_frames\": \"broken\"}");
  Config F;
  TEST_ASSERT_FALSE(load_config_json(kPath, F, err));
  TEST_ASSERT_TRUE(err.find("broken")!=std::string::npos);
}

// Test: Flat JSON field helpers
void test_json_fields(void) {
  const std::string s = "{\"a\": 1.5, \"b\": true, \"c\": \"x\\\"y\", \"list\": [{\"p\":1},{\"p\":2}]}";
  double d = 0;
  bool b = false;
  std::string str;
  std::vector<std::string> objs;
  TEST_ASSERT_TRUE(json_number(s, "a", d));
  TEST_ASSERT_FLOAT_WITHIN(1e-9f, 1.5f, (float)d);
  TEST_ASSERT_TRUE(json_bool(s, "b", b));
  TEST_ASSERT_TRUE(b);
  TEST_ASSERT_TRUE(json_string(s, "c", str));
  TEST_ASSERT_EQUAL_STRING("x\"y", str.c_str());
  TEST_ASSERT_TRUE(json_objects(s, "list", objs));
  TEST_ASSERT_EQUAL_INT(2, (int)objs.size());
  TEST_ASSERT_FALSE(json_number(s, "missing", d));

  TEST_ASSERT_EQUAL_STRING("{\"k\":\"a\\\"b\",\"n\":null}",
                           JsonWriter().str("k", "a\"b").num("n", std::nan("")).done().c_str());
}

// Test: Log level names
void test_log_levels(void) {
  LogLevel L = LogLevel::INFO;
  TEST_ASSERT_TRUE(parse_level("warning", L));
  TEST_ASSERT_TRUE(L==LogLevel::WARN);
  TEST_ASSERT_FALSE(parse_level("loud", L));
  TEST_ASSERT_TRUE(L==LogLevel::WARN);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_defaults);
  RUN_TEST(test_parse_lin_frames);
  RUN_TEST(test_parse_can_signals);
  RUN_TEST(test_parse_adc_channels);
  RUN_TEST(test_load_overrides);
  RUN_TEST(test_load_rejects_bad_values);
  RUN_TEST(test_json_fields);
  RUN_TEST(test_log_levels);
  return UNITY_END();
}
