#include "rules/driver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace rules {

namespace {

bool in_unit_range(double value) { return std::isfinite(value) && value >= 0.0 && value <= 1.0; }

std::string describe(const std::string& driver, const std::string& what, double value) {
  std::ostringstream oss;
  oss << "Driver '" << driver << "': " << what << " " << value;
  return oss.str();
}

}  // namespace

Driver::Driver(std::string name, DriverConfig cfg, Platform& platform,
               uint32_t machine_default_pulse_ms)
    : name_(std::move(name)),
      cfg_(std::move(cfg)),
      platform_(&platform),
      machine_default_pulse_ms_(machine_default_pulse_ms) {
  if (name_.empty()) {
    throw ConfigError("Driver requires a name");
  }
  if (cfg_.number.empty()) {
    throw ConfigError("Driver '" + name_ + "' requires a number");
  }
  if (!in_unit_range(cfg_.max_pulse_power)) {
    throw ConfigError(describe(name_, "max_pulse_power must be in [0, 1], got", cfg_.max_pulse_power));
  }
  if (cfg_.max_hold_power && !in_unit_range(*cfg_.max_hold_power)) {
    throw ConfigError(describe(name_, "max_hold_power must be in [0, 1], got", *cfg_.max_hold_power));
  }

  // Defaults have to satisfy the limits, otherwise every later resolution would fail.
  (void)get_and_verify_pulse_ms(std::nullopt);
  (void)get_and_verify_pulse_power(std::nullopt);
  (void)get_and_verify_hold_power(std::nullopt);

  hw_driver_ = platform_->configure_driver(cfg_.number);
}

uint32_t Driver::max_pulse_ms() const noexcept {
  const uint32_t platform_max = platform_->features().max_pulse_ms;
  if (cfg_.max_pulse_ms) {
    return std::min(*cfg_.max_pulse_ms, platform_max);
  }
  return platform_max;
}

uint32_t Driver::get_and_verify_pulse_ms(std::optional<uint32_t> pulse_ms) const {
  const uint32_t value = pulse_ms ? *pulse_ms : cfg_.default_pulse_ms.value_or(machine_default_pulse_ms_);
  const uint32_t limit = max_pulse_ms();
  if (value > limit) {
    throw DriverLimitsError("Driver '" + name_ + "' cannot be pulsed longer than " +
                            std::to_string(limit) + "ms. Requested: " + std::to_string(value) + "ms");
  }
  return value;
}

double Driver::get_and_verify_pulse_power(std::optional<double> pulse_power) const {
  const double value = pulse_power ? *pulse_power : cfg_.default_pulse_power.value_or(1.0);
  if (!in_unit_range(value)) {
    throw DriverLimitsError(describe(name_, "pulse_power must be in [0, 1], got", value));
  }
  if (value > cfg_.max_pulse_power) {
    throw DriverLimitsError(describe(name_, "pulse_power exceeds max_pulse_power, got", value));
  }
  return value;
}

double Driver::get_and_verify_hold_power(std::optional<double> hold_power) const {
  std::optional<double> value = hold_power;
  if (!value && cfg_.default_hold_power) {
    value = cfg_.default_hold_power;
  }
  if (!value && cfg_.max_hold_power) {
    value = cfg_.max_hold_power;
  }
  if (!value && cfg_.allow_enable) {
    value = 1.0;
  }
  const double resolved = value.value_or(0.0);

  if (!in_unit_range(resolved)) {
    throw DriverLimitsError(describe(name_, "hold_power must be in [0, 1], got", resolved));
  }
  if (resolved > 0.0 && cfg_.max_hold_power && resolved > *cfg_.max_hold_power) {
    throw DriverLimitsError(describe(name_, "hold_power exceeds max_hold_power, got", resolved));
  }
  if (resolved > 0.0 && !cfg_.max_hold_power && !cfg_.allow_enable) {
    throw DriverLimitsError("Driver '" + name_ +
                            "' may not be enabled. Set allow_enable or max_hold_power.");
  }
  return resolved;
}

void Driver::pulse(std::optional<uint32_t> pulse_ms, std::optional<double> pulse_power) {
  PulseSettings settings;
  settings.duration_ms = get_and_verify_pulse_ms(pulse_ms);
  settings.power = get_and_verify_pulse_power(pulse_power);
  if (settings.duration_ms == 0) {
    return;
  }
  platform_->pulse(hw_driver_, settings);
}

void Driver::enable(std::optional<double> hold_power, std::optional<uint32_t> pulse_ms) {
  PulseSettings pulse;
  pulse.duration_ms = get_and_verify_pulse_ms(pulse_ms);
  pulse.power = get_and_verify_pulse_power(std::nullopt);

  HoldSettings hold;
  hold.power = get_and_verify_hold_power(hold_power);
  if (hold.power <= 0.0) {
    throw DriverLimitsError("Driver '" + name_ + "' cannot be enabled with zero hold power");
  }
  platform_->enable(hw_driver_, pulse, hold);
}

void Driver::disable() { platform_->disable(hw_driver_); }

}  // namespace rules
