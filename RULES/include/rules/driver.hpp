#pragma once

#include "rules/platform.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace rules {

constexpr uint32_t kDefaultPulseMs = 10;

struct DriverConfig {
  std::string number;
  std::optional<uint32_t> default_pulse_ms;
  std::optional<double> default_pulse_power;
  std::optional<double> default_hold_power;
  std::optional<uint32_t> max_pulse_ms;
  double max_pulse_power = 1.0;
  std::optional<double> max_hold_power;
  bool allow_enable = false;
  bool default_recycle = false;
};

class Driver {
 public:
  Driver(std::string name, DriverConfig cfg, Platform& platform,
         uint32_t machine_default_pulse_ms = kDefaultPulseMs);

  Driver(const Driver&) = delete;
  Driver& operator=(const Driver&) = delete;

  // Resolve an optional override against this driver's defaults and limits.
  // Throws DriverLimitsError when the result is not allowed.
  [[nodiscard]] uint32_t get_and_verify_pulse_ms(std::optional<uint32_t> pulse_ms) const;
  [[nodiscard]] double get_and_verify_pulse_power(std::optional<double> pulse_power) const;
  [[nodiscard]] double get_and_verify_hold_power(std::optional<double> hold_power) const;

  void pulse(std::optional<uint32_t> pulse_ms = std::nullopt,
             std::optional<double> pulse_power = std::nullopt);
  void enable(std::optional<double> hold_power = std::nullopt,
              std::optional<uint32_t> pulse_ms = std::nullopt);
  void disable();

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const DriverConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] Platform& platform() const noexcept { return *platform_; }
  [[nodiscard]] const HwDriver& hw_driver() const noexcept { return hw_driver_; }
  [[nodiscard]] uint32_t max_pulse_ms() const noexcept;

 private:
  std::string name_;
  DriverConfig cfg_;
  Platform* platform_;
  HwDriver hw_driver_;
  uint32_t machine_default_pulse_ms_;
};

}  // namespace rules
