#pragma once

#include "devices/autofire.hpp"
#include "devices/playfield.hpp"
#include "devices/servo_device.hpp"
#include "rules/driver.hpp"
#include "rules/gpio_platform.hpp"
#include "rules/switch.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace runtime {

enum class PlatformKind : uint8_t {
  Virtual = 0,
  Gpio = 1,
};

enum class ServoControllerType : uint8_t {
  Pca9685 = 0,
  Maestro = 1,
  Fast = 2,
  Pkone = 3,
  Pwm = 4,
  Virtual = 5,
};

struct MachineSection {
  PlatformKind platform = PlatformKind::Virtual;
  uint32_t loop_hz = 1000;
  uint32_t log_period_ms = 1000;
  double run_duration_s = 0.0;  // 0 runs until SIGINT/SIGTERM
  uint32_t default_pulse_ms = rules::kDefaultPulseMs;
  // Posted once after machine_reset_phase_3, e.g. "ball_started" for a bench run.
  std::vector<std::string> start_events;
};

struct GpioSection {
  rules::GpioPlatform::Config lines;
  bool sim = false;  // in-memory lines instead of libgpiod
};

struct SwitchSection {
  std::string name;
  rules::Switch::Config cfg;
};

struct CoilSection {
  std::string name;
  rules::DriverConfig cfg;
};

struct AutofireSection {
  std::string name;
  bool kickback = false;
  devices::AutofireConfig cfg;
};

struct ServoControllerSection {
  std::string name;
  ServoControllerType type = ServoControllerType::Virtual;
  std::string i2c_bus = "/dev/i2c-1";
  std::string port = "/dev/ttyACM0";
  uint32_t baud = 115200;
  uint32_t channel_count = 24;
  uint32_t coil_count = 10;
  uint32_t servo_count = 4;
  uint32_t chip = 0;
  uint64_t period_ns = 20'000'000ULL;
  // Raw output range; unset uses the backend default.
  std::optional<uint32_t> min_value;
  std::optional<uint32_t> max_value;
};

struct ServoSection {
  std::string name;
  devices::ServoDeviceConfig cfg;
};

struct MachineConfig {
  MachineSection machine;
  GpioSection gpio;
  devices::BallSearchConfig playfield;
  std::vector<SwitchSection> switches;
  std::vector<CoilSection> coils;
  std::vector<AutofireSection> autofires;
  std::vector<ServoControllerSection> servo_controllers;
  std::vector<ServoSection> servos;
};

MachineConfig load_machine_config(const std::string& path);
MachineConfig parse_machine_config_string(const std::string& text);

const char* platform_kind_name(PlatformKind kind) noexcept;
const char* servo_controller_type_name(ServoControllerType type) noexcept;
PlatformKind parse_platform_kind(const std::string& value);
ServoControllerType parse_servo_controller_type(const std::string& value);

std::string machine_config_to_string(const MachineConfig& cfg);

}  // namespace runtime
