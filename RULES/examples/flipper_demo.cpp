#include "rules/platform_controller.hpp"
#include "rules/virtual_platform.hpp"

#include <cstdint>
#include <iostream>

int main() {
  rules::VirtualPlatform platform;

  rules::Switch button("s_left_flipper", rules::Switch::Config{"1"}, platform);
  rules::Switch eos("s_left_flipper_eos", rules::Switch::Config{"2", rules::SwitchType::NormallyClosed},
                    platform);

  rules::DriverConfig coil_cfg;
  coil_cfg.number = "10";
  coil_cfg.default_pulse_ms = 30;
  coil_cfg.max_hold_power = 0.375;
  rules::Driver flipper("c_left_flipper_main", coil_cfg, platform);

  rules::PlatformController controller;
  const rules::HardwareRule rule =
      controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&button}, {&eos}, {&flipper});

  struct Step {
    uint64_t t_ms;
    const char* sw;
    bool raw;
  };
  // eos is NC: raw low means the flipper reached end of stroke.
  const Step steps[] = {
      {0, "2", true}, {100, "1", true}, {130, "2", false}, {400, "1", false},
  };

  std::cout << "t_ms,switch,raw,on,holding,hold_power\n";
  for (const auto& step : steps) {
    platform.simulate_switch(step.sw, step.raw, step.t_ms);
    platform.service(step.t_ms);
    const auto state = platform.driver_state("10");
    std::cout << step.t_ms << "," << step.sw << "," << step.raw << "," << state.on << ","
              << state.holding << "," << state.hold_power << "\n";
  }

  controller.clear_hw_rule(rule);
  std::cout << "bindings_after_clear=" << platform.binding_count() << "\n";
  return 0;
}
