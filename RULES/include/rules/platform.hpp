#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace rules {

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Pulse/power/hold request outside what the driver is configured to allow.
class DriverLimitsError : public ConfigError {
 public:
  using ConfigError::ConfigError;
};

class PlatformError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class SwitchType : uint8_t {
  NormallyOpen = 0,
  NormallyClosed = 1,
};

enum class DebounceMode : uint8_t {
  Auto = 0,
  Quick = 1,
  Normal = 2,
};

struct HwSwitch {
  std::string number;
};

struct HwDriver {
  std::string number;
};

inline bool operator==(const HwSwitch& a, const HwSwitch& b) { return a.number == b.number; }
inline bool operator==(const HwDriver& a, const HwDriver& b) { return a.number == b.number; }

struct PulseSettings {
  uint32_t duration_ms = 0;
  double power = 1.0;
};

struct HoldSettings {
  double power = 0.0;
};

// Fully resolved trigger as handed to a backend. invert is relative to the raw hardware level.
struct SwitchSettings {
  HwSwitch hw_switch;
  bool invert = false;
  bool debounce = false;
};

struct DriverSettings {
  HwDriver hw_driver;
  PulseSettings pulse{};
  std::optional<HoldSettings> hold;
  bool recycle = false;
};

struct PlatformFeatures {
  uint32_t max_pulse_ms = 255;
  bool fractional_power = true;
};

// Raw (unpolarized) switch level change reported by a backend.
using SwitchChangeListener =
    std::function<void(const std::string& number, bool raw_active, uint64_t now_ms)>;

class Platform {
 public:
  virtual ~Platform() = default;

  [[nodiscard]] virtual const std::string& name() const noexcept = 0;
  [[nodiscard]] virtual PlatformFeatures features() const noexcept = 0;

  virtual HwSwitch configure_switch(const std::string& number, DebounceMode debounce) = 0;
  virtual HwDriver configure_driver(const std::string& number) = 0;
  virtual void set_switch_listener(SwitchChangeListener listener) = 0;

  virtual void set_pulse_on_hit_and_release_rule(const SwitchSettings& enable_switch,
                                                 const DriverSettings& driver) = 0;
  virtual void set_pulse_on_hit_and_enable_and_release_rule(const SwitchSettings& enable_switch,
                                                            const DriverSettings& driver) = 0;
  virtual void set_pulse_on_hit_rule(const SwitchSettings& enable_switch,
                                     const DriverSettings& driver) = 0;
  virtual void set_pulse_on_hit_and_enable_and_release_and_disable_rule(
      const SwitchSettings& enable_switch, const SwitchSettings& disable_switch,
      const DriverSettings& driver) = 0;

  // Removing a binding that does not exist must be a no-op.
  virtual void clear_hw_rule(const SwitchSettings& switch_settings,
                             const DriverSettings& driver) = 0;

  virtual void pulse(const HwDriver& driver, const PulseSettings& pulse) = 0;
  virtual void enable(const HwDriver& driver, const PulseSettings& pulse,
                      const HoldSettings& hold) = 0;
  virtual void disable(const HwDriver& driver) = 0;

  // Backends evaluating rules in software do their work here; called once per loop tick.
  virtual void service(uint64_t now_ms) { (void)now_ms; }
};

const char* switch_type_name(SwitchType type) noexcept;
const char* debounce_mode_name(DebounceMode mode) noexcept;
SwitchType parse_switch_type(const std::string& value);
DebounceMode parse_debounce_mode(const std::string& value);

}  // namespace rules
