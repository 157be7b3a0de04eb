#pragma once
#include <string>
#include <vector>

namespace cis {

enum class AdcQuantity { Voltage, Resistance };

struct AdcChannelSpec {
  int input = 0;          // MCP3008 input 0..7
  AdcQuantity quantity = AdcQuantity::Voltage;
};

struct LinFrameSpec {
  std::string name;       // channel id, e.g. "temperature"
  int pid = 0;
  std::string unit;
};

struct CanSignalSpec {
  std::string name;
  int request_id = -1;    // -1: passive, wait for the broadcast id
  int response_id = 0;
  int offset = 0;         // first data byte
  int length = 2;         // 1..4 bytes, little endian
  double scale = 1.0;
  std::string unit;
};

struct Config {
  // Presentation
  int http_port = 8099;
  std::string static_dir = "/usr/share/cis-gateway";
  // ADC over SPI (MCP3008)
  std::string spi_device = "/dev/spidev1.1";
  int spi_speed_hz = 1000000;
  int spi_mode = 0;
  double adc_vref = 3.3;
  double adc_resolution = 1023.0;
  double adc_voltage_multiplier = 3.31;
  double adc_resistance_reference = 10000.0; // ohms
  double adc_voltage_threshold = 0.02;       // volts, below reads as 0
  std::vector<AdcChannelSpec> adc_channels;
  int adc_interval_ms = 100;
  int adc_timeout_ms = 500;
  int adc_retries = 2;
  int adc_retry_delay_ms = 5;
  // LIN over UART
  std::string lin_device = "/dev/ttyAMA2";
  int lin_baud = 9600;
  int lin_break_us = 1350;
  std::vector<LinFrameSpec> lin_frames;
  int lin_interval_ms = 2000;
  int lin_response_timeout_ms = 2000;
  int lin_retries = 2;
  int lin_retry_delay_ms = 100;
  // CAN over SocketCAN
  std::string can_interface = "can0";
  std::vector<CanSignalSpec> can_signals;
  int can_interval_ms = 1000;
  int can_timeout_ms = 1000;
  int can_retries = 2;
  int can_retry_delay_ms = 50;
  // PWM daemon
  std::string pwm_daemon_url = "http://127.0.0.1:5001";
  int pwm_timeout_ms = 3000;
  int pwm_retries = 2;
  int pwm_retry_backoff_ms = 200;
  std::vector<int> pwm_pins;
  int pwm_frequency = 26000;
  double pwm_initial_duty = 10.0;
  int pwm_status_interval_ms = 5000;
  // MQTT
  std::string mqtt_host = "localhost";
  int mqtt_port = 1883;
  std::string mqtt_username = "mqtt";
  std::string mqtt_password = "mqtt_pass";
  std::string mqtt_client_id = "cis3_adc_mqtt_client";
  std::string mqtt_discovery_prefix = "homeassistant";
  std::string mqtt_base_topic = "cis3";
  int mqtt_interval_ms = 1000;
  // Engine
  int max_backoff_ms = 60000;
  int shutdown_grace_ms = 3000;
  std::string log_level = "info";
  std::string log_file;

  Config();
};

bool parse_adc_channels(const std::string& voltage, const std::string& resistance,
                        std::vector<AdcChannelSpec>& out, std::string& err);
bool parse_lin_frames(const std::string& s, std::vector<LinFrameSpec>& out, std::string& err);
bool parse_can_signals(const std::string& s, std::vector<CanSignalSpec>& out, std::string& err);
bool parse_int_list(const std::string& s, std::vector<int>& out, std::string& err);

bool load_config_json(const std::string& path, Config& C, std::string& err);
// Range checks that must hold before any device is opened.
bool validate_config(const Config& C, std::string& err);

} // namespace cis
