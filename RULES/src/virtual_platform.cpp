#include "rules/virtual_platform.hpp"

#include <algorithm>
#include <utility>

namespace rules {

const char* topology_name(RuleTopology topology) noexcept {
  switch (topology) {
    case RuleTopology::PulseOnHitAndRelease:
      return "pulse_on_hit_and_release";
    case RuleTopology::PulseOnHitAndEnableAndRelease:
      return "pulse_on_hit_and_enable_and_release";
    case RuleTopology::PulseOnHit:
      return "pulse_on_hit";
    case RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable:
      return "pulse_on_hit_and_enable_and_release_and_disable";
  }
  return "unknown";
}

VirtualPlatform::VirtualPlatform(std::string name, PlatformFeatures features)
    : name_(std::move(name)), features_(features) {}

HwSwitch VirtualPlatform::configure_switch(const std::string& number, DebounceMode debounce) {
  (void)debounce;
  if (number.empty()) {
    throw PlatformError(name_ + ": switch number must not be empty");
  }
  switches_.insert(number);
  switch_levels_.emplace(number, false);
  record("configure_switch", number, "");
  return HwSwitch{number};
}

HwDriver VirtualPlatform::configure_driver(const std::string& number) {
  if (number.empty()) {
    throw PlatformError(name_ + ": driver number must not be empty");
  }
  drivers_.emplace(number, DriverState{});
  record("configure_driver", "", number);
  return HwDriver{number};
}

void VirtualPlatform::set_switch_listener(SwitchChangeListener listener) {
  listener_ = std::move(listener);
}

void VirtualPlatform::set_pulse_on_hit_and_release_rule(const SwitchSettings& enable_switch,
                                                        const DriverSettings& driver) {
  add_binding(RuleTopology::PulseOnHitAndRelease, BindingRole::Enable, enable_switch, driver);
  record("set_pulse_on_hit_and_release_rule", enable_switch.hw_switch.number,
         driver.hw_driver.number);
}

void VirtualPlatform::set_pulse_on_hit_and_enable_and_release_rule(
    const SwitchSettings& enable_switch, const DriverSettings& driver) {
  if (!driver.hold) {
    throw PlatformError(name_ + ": pulse_on_hit_and_enable_and_release requires hold settings");
  }
  add_binding(RuleTopology::PulseOnHitAndEnableAndRelease, BindingRole::Enable, enable_switch,
              driver);
  record("set_pulse_on_hit_and_enable_and_release_rule", enable_switch.hw_switch.number,
         driver.hw_driver.number);
}

void VirtualPlatform::set_pulse_on_hit_rule(const SwitchSettings& enable_switch,
                                            const DriverSettings& driver) {
  add_binding(RuleTopology::PulseOnHit, BindingRole::Enable, enable_switch, driver);
  record("set_pulse_on_hit_rule", enable_switch.hw_switch.number, driver.hw_driver.number);
}

void VirtualPlatform::set_pulse_on_hit_and_enable_and_release_and_disable_rule(
    const SwitchSettings& enable_switch, const SwitchSettings& disable_switch,
    const DriverSettings& driver) {
  if (!driver.hold) {
    throw PlatformError(name_ +
                        ": pulse_on_hit_and_enable_and_release_and_disable requires hold settings");
  }
  require_switch(disable_switch.hw_switch);
  add_binding(RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable, BindingRole::Enable,
              enable_switch, driver);
  add_binding(RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable, BindingRole::Disable,
              disable_switch, driver);
  record("set_pulse_on_hit_and_enable_and_release_and_disable_rule",
         enable_switch.hw_switch.number, driver.hw_driver.number);
}

void VirtualPlatform::clear_hw_rule(const SwitchSettings& switch_settings,
                                    const DriverSettings& driver) {
  const auto it = bindings_.find(BindingKey{switch_settings.hw_switch.number, driver.hw_driver.number});
  if (it != bindings_.end()) {
    const bool drives_coil = it->second.role == BindingRole::Enable;
    bindings_.erase(it);
    // A coil held by the cleared rule would otherwise stay on with nothing left to release it.
    const auto state = drivers_.find(driver.hw_driver.number);
    if (drives_coil && state != drivers_.end() && state->second.holding) {
      state->second.on = false;
      state->second.holding = false;
      state->second.hold_power = 0.0;
      state->second.pulse_end_ms = 0;
    }
  }
  record("clear_hw_rule", switch_settings.hw_switch.number, driver.hw_driver.number);
}

void VirtualPlatform::pulse(const HwDriver& driver, const PulseSettings& pulse) {
  require_driver(driver);
  DriverState& state = drivers_[driver.number];
  state.on = true;
  state.holding = false;
  ++state.pulse_count;
  state.last_pulse_ms = pulse.duration_ms;
  state.last_pulse_power = pulse.power;
  state.pulse_end_ms = now_ms_ + pulse.duration_ms;
  record("pulse", "", driver.number);
}

void VirtualPlatform::enable(const HwDriver& driver, const PulseSettings& pulse,
                             const HoldSettings& hold) {
  require_driver(driver);
  DriverState& state = drivers_[driver.number];
  state.on = true;
  state.holding = true;
  state.last_pulse_ms = pulse.duration_ms;
  state.last_pulse_power = pulse.power;
  state.hold_power = hold.power;
  record("enable", "", driver.number);
}

void VirtualPlatform::disable(const HwDriver& driver) {
  require_driver(driver);
  DriverState& state = drivers_[driver.number];
  state.on = false;
  state.holding = false;
  state.hold_power = 0.0;
  record("disable", "", driver.number);
}

void VirtualPlatform::service(uint64_t now_ms) {
  now_ms_ = now_ms;
  for (auto& entry : drivers_) {
    DriverState& state = entry.second;
    if (state.on && !state.holding && now_ms >= state.pulse_end_ms) {
      state.on = false;
      state.pulse_end_ms = 0;
    }
  }
}

void VirtualPlatform::simulate_switch(const std::string& number, bool raw_active,
                                      uint64_t now_ms) {
  require_switch(HwSwitch{number});
  now_ms_ = now_ms;
  switch_levels_[number] = raw_active;

  // Copy first: a listener may rearrange the rule table.
  std::vector<Binding> matching;
  for (const auto& entry : bindings_) {
    if (entry.first.first == number) {
      matching.push_back(entry.second);
    }
  }

  for (const auto& binding : matching) {
    const bool triggered = raw_active != binding.switch_settings.invert;
    if (binding.role == BindingRole::Disable) {
      if (triggered) {
        release_rule(binding);
      }
      continue;
    }
    if (triggered) {
      fire_rule(binding, now_ms);
    } else {
      release_rule(binding);
    }
  }

  if (listener_) {
    listener_(number, raw_active, now_ms);
  }
}

bool VirtualPlatform::has_binding(const std::string& switch_number,
                                  const std::string& driver_number) const {
  return bindings_.count(BindingKey{switch_number, driver_number}) != 0;
}

const VirtualPlatform::Binding* VirtualPlatform::find_binding(
    const std::string& switch_number, const std::string& driver_number) const {
  const auto it = bindings_.find(BindingKey{switch_number, driver_number});
  return it == bindings_.end() ? nullptr : &it->second;
}

std::size_t VirtualPlatform::count_calls(const std::string& kind) const {
  return static_cast<std::size_t>(
      std::count_if(calls_.begin(), calls_.end(), [&](const Call& c) { return c.kind == kind; }));
}

VirtualPlatform::DriverState VirtualPlatform::driver_state(const std::string& number) const {
  const auto it = drivers_.find(number);
  if (it == drivers_.end()) {
    throw PlatformError(name_ + ": unknown driver " + number);
  }
  return it->second;
}

bool VirtualPlatform::switch_level(const std::string& number) const {
  const auto it = switch_levels_.find(number);
  if (it == switch_levels_.end()) {
    throw PlatformError(name_ + ": unknown switch " + number);
  }
  return it->second;
}

void VirtualPlatform::require_switch(const HwSwitch& hw_switch) const {
  if (switches_.count(hw_switch.number) == 0) {
    throw PlatformError(name_ + ": switch " + hw_switch.number + " is not configured");
  }
}

void VirtualPlatform::require_driver(const HwDriver& hw_driver) const {
  if (drivers_.count(hw_driver.number) == 0) {
    throw PlatformError(name_ + ": driver " + hw_driver.number + " is not configured");
  }
}

void VirtualPlatform::add_binding(RuleTopology topology, BindingRole role,
                                  const SwitchSettings& switch_settings,
                                  const DriverSettings& driver) {
  require_switch(switch_settings.hw_switch);
  require_driver(driver.hw_driver);
  if (!features_.fractional_power && driver.pulse.power < 1.0) {
    throw PlatformError(name_ + ": fractional pulse power is not supported");
  }
  bindings_[BindingKey{switch_settings.hw_switch.number, driver.hw_driver.number}] =
      Binding{topology, role, switch_settings, driver};
}

void VirtualPlatform::record(const std::string& kind, const std::string& switch_number,
                             const std::string& driver_number) {
  if (!log_calls_) {
    return;
  }
  calls_.push_back(Call{kind, switch_number, driver_number});
}

void VirtualPlatform::fire_rule(const Binding& binding, uint64_t now_ms) {
  DriverState& state = drivers_[binding.driver_settings.hw_driver.number];
  ++state.pulse_count;
  state.on = true;
  state.last_pulse_ms = binding.driver_settings.pulse.duration_ms;
  state.last_pulse_power = binding.driver_settings.pulse.power;
  if (binding.driver_settings.hold) {
    state.holding = true;
    state.hold_power = binding.driver_settings.hold->power;
    state.pulse_end_ms = 0;
  } else {
    state.holding = false;
    state.pulse_end_ms = now_ms + binding.driver_settings.pulse.duration_ms;
  }
}

void VirtualPlatform::release_rule(const Binding& binding) {
  if (binding.topology == RuleTopology::PulseOnHit) {
    return;
  }
  DriverState& state = drivers_[binding.driver_settings.hw_driver.number];
  state.on = false;
  state.holding = false;
  state.hold_power = 0.0;
  state.pulse_end_ms = 0;
}

}  // namespace rules
