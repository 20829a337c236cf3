#include "rules/gpio_platform.hpp"

#include <iostream>
#include <utility>

namespace rules {

GpioPlatform::GpioPlatform(Config cfg, std::unique_ptr<GpioLinesOut> out,
                           std::unique_ptr<GpioLinesIn> in)
    : cfg_(std::move(cfg)), out_(std::move(out)), in_(std::move(in)) {
  if (!out_ || !in_) {
    throw GpioError("GPIO platform requires output and input line banks");
  }
  if (cfg_.debounce_samples == 0) {
    throw ConfigError("gpio.debounce_samples must be >= 1");
  }
}

GpioPlatform::~GpioPlatform() { stop(); }

PlatformFeatures GpioPlatform::features() const noexcept {
  PlatformFeatures features;
  features.max_pulse_ms = cfg_.max_pulse_ms;
  features.fractional_power = false;
  return features;
}

uint32_t GpioPlatform::parse_line(const std::string& number, const char* what) {
  std::size_t used = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(number, &used, 10);
  } catch (const std::exception&) {
    throw PlatformError(std::string("gpio: ") + what + " number '" + number +
                        "' is not a line offset");
  }
  if (used != number.size() || value > 0xFFFFFFFFUL) {
    throw PlatformError(std::string("gpio: ") + what + " number '" + number +
                        "' is not a line offset");
  }
  return static_cast<uint32_t>(value);
}

HwSwitch GpioPlatform::configure_switch(const std::string& number, DebounceMode debounce) {
  const uint32_t offset = parse_line(number, "switch");
  if (started_) {
    throw PlatformError("gpio: switch " + number + " configured after start");
  }
  const uint32_t samples = debounce == DebounceMode::Quick ? 1U : cfg_.debounce_samples;
  auto it = switches_.find(number);
  if (it == switches_.end()) {
    SwitchLine line;
    line.index = input_lines_.size();
    line.required_samples = samples;
    input_lines_.push_back(offset);
    switches_.emplace(number, line);
  } else {
    it->second.required_samples = samples;
  }
  return HwSwitch{number};
}

HwDriver GpioPlatform::configure_driver(const std::string& number) {
  const uint32_t offset = parse_line(number, "driver");
  if (started_) {
    throw PlatformError("gpio: driver " + number + " configured after start");
  }
  if (drivers_.count(number) == 0) {
    DriverLine line;
    line.index = output_lines_.size();
    output_lines_.push_back(offset);
    drivers_.emplace(number, line);
  }
  return HwDriver{number};
}

void GpioPlatform::set_switch_listener(SwitchChangeListener listener) {
  listener_ = std::move(listener);
}

void GpioPlatform::set_pulse_on_hit_and_release_rule(const SwitchSettings& enable_switch,
                                                     const DriverSettings& driver) {
  add_rule(RuleTopology::PulseOnHitAndRelease, BindingRole::Enable, enable_switch, driver);
}

void GpioPlatform::set_pulse_on_hit_and_enable_and_release_rule(const SwitchSettings& enable_switch,
                                                                const DriverSettings& driver) {
  if (!driver.hold) {
    throw PlatformError("gpio: pulse_on_hit_and_enable_and_release requires hold settings");
  }
  add_rule(RuleTopology::PulseOnHitAndEnableAndRelease, BindingRole::Enable, enable_switch, driver);
}

void GpioPlatform::set_pulse_on_hit_rule(const SwitchSettings& enable_switch,
                                         const DriverSettings& driver) {
  add_rule(RuleTopology::PulseOnHit, BindingRole::Enable, enable_switch, driver);
}

void GpioPlatform::set_pulse_on_hit_and_enable_and_release_and_disable_rule(
    const SwitchSettings& enable_switch, const SwitchSettings& disable_switch,
    const DriverSettings& driver) {
  if (!driver.hold) {
    throw PlatformError(
        "gpio: pulse_on_hit_and_enable_and_release_and_disable requires hold settings");
  }
  (void)switch_line(disable_switch.hw_switch.number);
  add_rule(RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable, BindingRole::Enable,
           enable_switch, driver);
  add_rule(RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable, BindingRole::Disable,
           disable_switch, driver);
}

void GpioPlatform::clear_hw_rule(const SwitchSettings& switch_settings,
                                 const DriverSettings& driver) {
  const auto it = rules_.find(RuleKey{switch_settings.hw_switch.number, driver.hw_driver.number});
  if (it == rules_.end()) {
    return;
  }
  const bool drives_coil = it->second.role == BindingRole::Enable;
  rules_.erase(it);
  // Once the rule is gone nothing releases a held coil, so drop it here. Pulses run out on
  // their own.
  DriverLine& line = driver_line(driver.hw_driver.number);
  if (drives_coil && line.on && line.holding) {
    switch_off(line);
    flush_outputs();
  }
}

void GpioPlatform::pulse(const HwDriver& driver, const PulseSettings& pulse) {
  if (pulse.power != 1.0) {
    throw PlatformError("gpio: driver " + driver.number + " cannot pulse at fractional power");
  }
  DriverLine& line = driver_line(driver.number);
  if (pulse.duration_ms == 0) {
    return;
  }
  line.on = true;
  line.holding = false;
  line.pulse_end_ms = now_ms_ + pulse.duration_ms;
  flush_outputs();
}

void GpioPlatform::enable(const HwDriver& driver, const PulseSettings& pulse,
                          const HoldSettings& hold) {
  if (pulse.power != 1.0 || hold.power != 1.0) {
    throw PlatformError("gpio: driver " + driver.number + " cannot be enabled at fractional power");
  }
  DriverLine& line = driver_line(driver.number);
  line.on = true;
  line.holding = true;
  flush_outputs();
}

void GpioPlatform::disable(const HwDriver& driver) {
  DriverLine& line = driver_line(driver.number);
  if (line.on) {
    switch_off(line);
  }
  flush_outputs();
}

void GpioPlatform::start() {
  if (started_) {
    return;
  }
  if (!output_lines_.empty()) {
    out_->open(cfg_.output_chip, output_lines_);
    written_.assign(output_lines_.size(), 0);
  }
  if (!input_lines_.empty()) {
    in_->open(cfg_.input_chip, input_lines_);
    const std::vector<uint8_t> values = in_->read_values();
    for (auto& entry : switches_) {
      const bool level = values.at(entry.second.index) != 0;
      entry.second.raw = level;
      entry.second.stable = level;
      entry.second.candidate = level;
    }
  }
  started_ = true;

  // Report the boot levels so normally closed switches start out correct.
  if (listener_) {
    for (const auto& entry : switches_) {
      listener_(entry.first, entry.second.stable, now_ms_);
    }
  }
}

void GpioPlatform::stop() noexcept {
  if (!started_) {
    return;
  }
  for (auto& entry : drivers_) {
    entry.second.on = false;
    entry.second.holding = false;
  }
  if (!output_lines_.empty()) {
    try {
      out_->set_values(std::vector<uint8_t>(output_lines_.size(), 0));
    } catch (const std::exception& e) {
      std::cerr << "gpio: failed to drive coils low on stop: " << e.what() << "\n";
    }
    out_->close();
  }
  in_->close();
  started_ = false;
}

void GpioPlatform::service(uint64_t now_ms) {
  now_ms_ = now_ms;
  if (!started_) {
    throw PlatformError("gpio: service() before start()");
  }

  std::vector<std::string> stable_changes;
  if (!input_lines_.empty()) {
    const std::vector<uint8_t> values = in_->read_values();
    for (auto& entry : switches_) {
      SwitchLine& sw = entry.second;
      const bool level = values.at(sw.index) != 0;
      const bool raw_changed = level != sw.raw;
      sw.raw = level;

      bool stable_changed = false;
      if (level == sw.stable) {
        sw.candidate_count = 0;
      } else {
        if (level == sw.candidate && sw.candidate_count > 0) {
          ++sw.candidate_count;
        } else {
          sw.candidate = level;
          sw.candidate_count = 1;
        }
        if (sw.candidate_count >= sw.required_samples) {
          sw.stable = level;
          sw.candidate_count = 0;
          stable_changed = true;
        }
      }

      if (raw_changed || stable_changed) {
        evaluate_rules(entry.first, raw_changed, stable_changed);
      }
      if (stable_changed) {
        stable_changes.push_back(entry.first);
      }
    }
  }

  for (auto& entry : drivers_) {
    DriverLine& line = entry.second;
    if (line.on && !line.holding && now_ms_ >= line.pulse_end_ms) {
      switch_off(line);
    }
  }
  flush_outputs();

  if (listener_) {
    for (const auto& number : stable_changes) {
      listener_(number, switches_.at(number).stable, now_ms_);
    }
  }
}

bool GpioPlatform::driver_on(const std::string& number) const {
  const auto it = drivers_.find(number);
  if (it == drivers_.end()) {
    throw PlatformError("gpio: driver " + number + " is not configured");
  }
  return it->second.on;
}

GpioPlatform::SwitchLine& GpioPlatform::switch_line(const std::string& number) {
  const auto it = switches_.find(number);
  if (it == switches_.end()) {
    throw PlatformError("gpio: switch " + number + " is not configured");
  }
  return it->second;
}

GpioPlatform::DriverLine& GpioPlatform::driver_line(const std::string& number) {
  const auto it = drivers_.find(number);
  if (it == drivers_.end()) {
    throw PlatformError("gpio: driver " + number + " is not configured");
  }
  return it->second;
}

void GpioPlatform::check_no_fractional_power(const DriverSettings& driver) const {
  if (driver.pulse.power != 1.0) {
    throw PlatformError("gpio: driver " + driver.hw_driver.number +
                        " rule uses fractional pulse power");
  }
  if (driver.hold && driver.hold->power != 1.0) {
    throw PlatformError("gpio: driver " + driver.hw_driver.number +
                        " rule uses fractional hold power");
  }
}

void GpioPlatform::add_rule(RuleTopology topology, BindingRole role,
                            const SwitchSettings& switch_settings, const DriverSettings& driver) {
  (void)switch_line(switch_settings.hw_switch.number);
  (void)driver_line(driver.hw_driver.number);
  check_no_fractional_power(driver);
  rules_[RuleKey{switch_settings.hw_switch.number, driver.hw_driver.number}] =
      Rule{topology, role, switch_settings, driver};
}

void GpioPlatform::evaluate_rules(const std::string& number, bool raw_changed,
                                  bool stable_changed) {
  const SwitchLine& sw = switches_.at(number);
  for (const auto& entry : rules_) {
    if (entry.first.first != number) {
      continue;
    }
    const Rule& rule = entry.second;
    const bool changed = rule.switch_settings.debounce ? stable_changed : raw_changed;
    if (!changed) {
      continue;
    }
    const bool level = rule.switch_settings.debounce ? sw.stable : sw.raw;
    const bool triggered = level != rule.switch_settings.invert;

    if (rule.role == BindingRole::Disable) {
      if (triggered) {
        release(rule);
      }
    } else if (triggered) {
      fire(rule);
    } else {
      release(rule);
    }
  }
}

void GpioPlatform::fire(const Rule& rule) {
  DriverLine& line = drivers_.at(rule.driver_settings.hw_driver.number);
  if (line.on) {
    return;
  }
  if (rule.driver_settings.recycle && line.off_since_ms != 0 &&
      now_ms_ < line.off_since_ms + cfg_.recycle_ms) {
    return;
  }
  if (rule.driver_settings.hold) {
    line.on = true;
    line.holding = true;
    return;
  }
  if (rule.driver_settings.pulse.duration_ms == 0) {
    return;
  }
  line.on = true;
  line.holding = false;
  line.pulse_end_ms = now_ms_ + rule.driver_settings.pulse.duration_ms;
}

void GpioPlatform::release(const Rule& rule) {
  if (rule.topology == RuleTopology::PulseOnHit) {
    return;
  }
  DriverLine& line = drivers_.at(rule.driver_settings.hw_driver.number);
  if (line.on) {
    switch_off(line);
  }
}

void GpioPlatform::switch_off(DriverLine& line) {
  line.on = false;
  line.holding = false;
  line.pulse_end_ms = 0;
  line.off_since_ms = now_ms_;
}

void GpioPlatform::flush_outputs() {
  if (!started_ || output_lines_.empty()) {
    return;
  }
  std::vector<uint8_t> desired(output_lines_.size(), 0);
  for (const auto& entry : drivers_) {
    desired[entry.second.index] = entry.second.on ? 1U : 0U;
  }
  if (desired != written_) {
    out_->set_values(desired);
    written_ = desired;
  }
}

}  // namespace rules
