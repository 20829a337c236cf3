#pragma once

#include "rules/hardware_rule.hpp"

#include <optional>

namespace rules {

// Stateless front end for hardware rules. Every set_* call validates first and then issues
// exactly one platform primitive; nothing reaches the platform when validation fails.
class PlatformController {
 public:
  // Pulse the driver while the switch is active; releasing the switch cuts the pulse short.
  HardwareRule set_pulse_on_hit_and_release_rule(
      const SwitchRuleSettings& enable_switch, const DriverRuleSettings& driver,
      const std::optional<PulseRuleSettings>& pulse = std::nullopt) const;

  // Pulse, then hold at hold power until the switch is released.
  HardwareRule set_pulse_on_hit_and_enable_and_release_rule(
      const SwitchRuleSettings& enable_switch, const DriverRuleSettings& driver,
      const std::optional<PulseRuleSettings>& pulse = std::nullopt,
      const std::optional<HoldRuleSettings>& hold = std::nullopt) const;

  // Always complete the full pulse.
  HardwareRule set_pulse_on_hit_rule(const SwitchRuleSettings& enable_switch,
                                     const DriverRuleSettings& driver,
                                     const std::optional<PulseRuleSettings>& pulse = std::nullopt) const;

  // Pulse and hold; cancelled on release or when the disable switch activates.
  HardwareRule set_pulse_on_hit_and_enable_and_release_and_disable_rule(
      const SwitchRuleSettings& enable_switch, const SwitchRuleSettings& disable_switch,
      const DriverRuleSettings& driver,
      const std::optional<PulseRuleSettings>& pulse = std::nullopt,
      const std::optional<HoldRuleSettings>& hold = std::nullopt) const;

  // Releases every switch binding of the rule. All entries are attempted; the first failure
  // is rethrown afterwards.
  void clear_hw_rule(const HardwareRule& rule) const;

 private:
  static Platform& check_and_get_platform(const SwitchRuleSettings& input,
                                          const DriverRuleSettings& driver);
  static SwitchSettings configured_switch(const SwitchRuleSettings& input);
  static DriverSettings configured_driver_no_hold(const DriverRuleSettings& driver,
                                                  const std::optional<PulseRuleSettings>& pulse);
  static DriverSettings configured_driver_with_hold(const DriverRuleSettings& driver,
                                                    const std::optional<PulseRuleSettings>& pulse,
                                                    const std::optional<HoldRuleSettings>& hold);
};

}  // namespace rules
