#include "rules/platform_controller.hpp"

#include <exception>

namespace rules {

Platform& PlatformController::check_and_get_platform(const SwitchRuleSettings& input,
                                                     const DriverRuleSettings& driver) {
  if (input.input == nullptr) {
    throw ConfigError("Hardware rule requires a switch");
  }
  if (driver.driver == nullptr) {
    throw ConfigError("Hardware rule requires a driver");
  }
  if (&input.input->platform() != &driver.driver->platform()) {
    throw ConfigError("Switch '" + input.input->name() + "' (platform " +
                      input.input->platform().name() + ") and driver '" + driver.driver->name() +
                      "' (platform " + driver.driver->platform().name() +
                      ") have to use the same platform");
  }
  return driver.driver->platform();
}

SwitchSettings PlatformController::configured_switch(const SwitchRuleSettings& input) {
  SwitchSettings settings;
  settings.hw_switch = input.input->hw_switch();
  settings.invert = input.invert != input.input->invert();
  settings.debounce = input.debounce;
  return settings;
}

DriverSettings PlatformController::configured_driver_no_hold(
    const DriverRuleSettings& driver, const std::optional<PulseRuleSettings>& pulse) {
  DriverSettings settings;
  settings.hw_driver = driver.driver->hw_driver();
  settings.pulse.duration_ms =
      driver.driver->get_and_verify_pulse_ms(pulse ? pulse->duration_ms : std::nullopt);
  settings.pulse.power = driver.driver->get_and_verify_pulse_power(pulse ? pulse->power : std::nullopt);
  settings.recycle = driver.recycle;
  return settings;
}

DriverSettings PlatformController::configured_driver_with_hold(
    const DriverRuleSettings& driver, const std::optional<PulseRuleSettings>& pulse,
    const std::optional<HoldRuleSettings>& hold) {
  DriverSettings settings = configured_driver_no_hold(driver, pulse);
  settings.hold = HoldSettings{driver.driver->get_and_verify_hold_power(hold ? hold->power : std::nullopt)};
  return settings;
}

HardwareRule PlatformController::set_pulse_on_hit_and_release_rule(
    const SwitchRuleSettings& enable_switch, const DriverRuleSettings& driver,
    const std::optional<PulseRuleSettings>& pulse) const {
  Platform& platform = check_and_get_platform(enable_switch, driver);
  const SwitchSettings enable_settings = configured_switch(enable_switch);
  const DriverSettings driver_settings = configured_driver_no_hold(driver, pulse);

  platform.set_pulse_on_hit_and_release_rule(enable_settings, driver_settings);
  return HardwareRule{&platform, {enable_settings}, driver_settings};
}

HardwareRule PlatformController::set_pulse_on_hit_and_enable_and_release_rule(
    const SwitchRuleSettings& enable_switch, const DriverRuleSettings& driver,
    const std::optional<PulseRuleSettings>& pulse, const std::optional<HoldRuleSettings>& hold) const {
  Platform& platform = check_and_get_platform(enable_switch, driver);
  const SwitchSettings enable_settings = configured_switch(enable_switch);
  const DriverSettings driver_settings = configured_driver_with_hold(driver, pulse, hold);

  platform.set_pulse_on_hit_and_enable_and_release_rule(enable_settings, driver_settings);
  return HardwareRule{&platform, {enable_settings}, driver_settings};
}

HardwareRule PlatformController::set_pulse_on_hit_rule(
    const SwitchRuleSettings& enable_switch, const DriverRuleSettings& driver,
    const std::optional<PulseRuleSettings>& pulse) const {
  Platform& platform = check_and_get_platform(enable_switch, driver);
  const SwitchSettings enable_settings = configured_switch(enable_switch);
  const DriverSettings driver_settings = configured_driver_no_hold(driver, pulse);

  platform.set_pulse_on_hit_rule(enable_settings, driver_settings);
  return HardwareRule{&platform, {enable_settings}, driver_settings};
}

HardwareRule PlatformController::set_pulse_on_hit_and_enable_and_release_and_disable_rule(
    const SwitchRuleSettings& enable_switch, const SwitchRuleSettings& disable_switch,
    const DriverRuleSettings& driver, const std::optional<PulseRuleSettings>& pulse,
    const std::optional<HoldRuleSettings>& hold) const {
  Platform& platform = check_and_get_platform(enable_switch, driver);
  (void)check_and_get_platform(disable_switch, driver);

  const SwitchSettings enable_settings = configured_switch(enable_switch);
  const SwitchSettings disable_settings = configured_switch(disable_switch);
  const DriverSettings driver_settings = configured_driver_with_hold(driver, pulse, hold);

  platform.set_pulse_on_hit_and_enable_and_release_and_disable_rule(enable_settings, disable_settings,
                                                                     driver_settings);
  return HardwareRule{&platform, {enable_settings, disable_settings}, driver_settings};
}

void PlatformController::clear_hw_rule(const HardwareRule& rule) const {
  if (rule.platform == nullptr) {
    throw ConfigError("Cannot clear a hardware rule without a platform");
  }

  // Attempt every entry, rethrow the first failure, never retry.
  std::exception_ptr first_failure;
  for (const auto& switch_settings : rule.switch_settings) {
    try {
      rule.platform->clear_hw_rule(switch_settings, rule.driver_settings);
    } catch (const std::exception&) {
      if (!first_failure) {
        first_failure = std::current_exception();
      }
    }
  }
  if (first_failure) {
    std::rethrow_exception(first_failure);
  }
}

}  // namespace rules
