#include "rules/platform_controller.hpp"
#include "rules/virtual_platform.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

// Fails clear_hw_rule for one switch number after recording the attempt.
class FailingClearPlatform final : public rules::VirtualPlatform {
 public:
  explicit FailingClearPlatform(std::string failing_switch)
      : rules::VirtualPlatform("failing"), failing_switch_(std::move(failing_switch)) {}

  void clear_hw_rule(const rules::SwitchSettings& switch_settings,
                     const rules::DriverSettings& driver) override {
    ++clear_attempts_;
    if (switch_settings.hw_switch.number == failing_switch_) {
      throw rules::PlatformError("clear failed for " + failing_switch_);
    }
    rules::VirtualPlatform::clear_hw_rule(switch_settings, driver);
  }

  [[nodiscard]] int clear_attempts() const noexcept { return clear_attempts_; }

 private:
  std::string failing_switch_;
  int clear_attempts_ = 0;
};

rules::DriverConfig make_driver_cfg(const std::string& number) {
  rules::DriverConfig cfg;
  cfg.number = number;
  cfg.default_pulse_ms = 20;
  cfg.max_pulse_ms = 40;
  cfg.default_pulse_power = 1.0;
  cfg.allow_enable = true;
  return cfg;
}

std::size_t rule_set_calls(const rules::VirtualPlatform& platform) {
  return platform.count_calls("set_pulse_on_hit_and_release_rule") +
         platform.count_calls("set_pulse_on_hit_and_enable_and_release_rule") +
         platform.count_calls("set_pulse_on_hit_rule") +
         platform.count_calls("set_pulse_on_hit_and_enable_and_release_and_disable_rule");
}

bool test_inversion_combines_request_and_polarity() {
  struct Case {
    rules::SwitchType type;
    bool requested;
    bool expected;
  };
  const Case cases[] = {
      {rules::SwitchType::NormallyOpen, false, false},
      {rules::SwitchType::NormallyOpen, true, true},
      {rules::SwitchType::NormallyClosed, false, true},
      {rules::SwitchType::NormallyClosed, true, false},
  };

  for (const auto& c : cases) {
    rules::VirtualPlatform platform;
    rules::Switch sw("s_test", rules::Switch::Config{"1", c.type, rules::DebounceMode::Auto}, platform);
    rules::Driver coil("c_test", make_driver_cfg("10"), platform);
    rules::PlatformController controller;

    const auto rule = controller.set_pulse_on_hit_rule({&sw, c.requested, false}, {&coil, false});
    const auto* binding = platform.find_binding("1", "10");
    REQUIRE(binding != nullptr, "binding missing after set_pulse_on_hit_rule");
    REQUIRE(binding->switch_settings.invert == c.expected,
            "effective inversion mismatch for type=" << rules::switch_type_name(c.type)
                                                     << " requested=" << c.requested);
    REQUIRE(rule.switch_settings.size() == 1, "single-switch rule must hold one switch entry");
  }
  return true;
}

bool test_each_topology_issues_one_primitive() {
  rules::VirtualPlatform platform;
  rules::Switch sw("s_flipper", rules::Switch::Config{"1"}, platform);
  rules::Switch eos("s_flipper_eos", rules::Switch::Config{"2"}, platform);
  rules::Driver coil("c_flipper", make_driver_cfg("10"), platform);
  rules::PlatformController controller;
  platform.clear_calls();

  auto r1 = controller.set_pulse_on_hit_and_release_rule({&sw}, {&coil});
  REQUIRE(platform.count_calls("set_pulse_on_hit_and_release_rule") == 1, "release rule not issued");
  REQUIRE(platform.find_binding("1", "10")->topology == rules::RuleTopology::PulseOnHitAndRelease,
          "wrong topology for release rule");
  REQUIRE(!r1.driver_settings.hold, "release rule must not carry hold settings");
  controller.clear_hw_rule(r1);

  auto r2 = controller.set_pulse_on_hit_and_enable_and_release_rule({&sw}, {&coil}, std::nullopt,
                                                                   rules::HoldRuleSettings{0.25});
  REQUIRE(platform.count_calls("set_pulse_on_hit_and_enable_and_release_rule") == 1,
          "enable+release rule not issued");
  REQUIRE(r2.driver_settings.hold && r2.driver_settings.hold->power == 0.25,
          "hold override not resolved");
  controller.clear_hw_rule(r2);

  auto r3 = controller.set_pulse_on_hit_rule({&sw}, {&coil, true}, rules::PulseRuleSettings{30, 0.5});
  REQUIRE(platform.count_calls("set_pulse_on_hit_rule") == 1, "pulse rule not issued");
  REQUIRE(r3.driver_settings.pulse.duration_ms == 30, "pulse override not used");
  REQUIRE(r3.driver_settings.pulse.power == 0.5, "power override not used");
  REQUIRE(r3.driver_settings.recycle, "recycle flag lost");
  controller.clear_hw_rule(r3);

  auto r4 = controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&sw}, {&eos},
                                                                              {&coil});
  REQUIRE(platform.count_calls("set_pulse_on_hit_and_enable_and_release_and_disable_rule") == 1,
          "disable rule not issued");
  REQUIRE(r4.switch_settings.size() == 2, "dual-switch rule must track both switches");
  REQUIRE(r4.driver_settings.hold && r4.driver_settings.hold->power == 1.0,
          "allow_enable must resolve hold to full power");
  REQUIRE(rule_set_calls(platform) == 4, "each set_* must issue exactly one primitive");
  controller.clear_hw_rule(r4);
  REQUIRE(platform.binding_count() == 0, "bindings left after clearing every rule");
  return true;
}

bool test_defaults_resolve_from_driver() {
  rules::VirtualPlatform platform;
  rules::Switch sw("s_pop1", rules::Switch::Config{"7"}, platform);
  rules::DriverConfig cfg;
  cfg.number = "pop1";
  cfg.default_pulse_power = 0.75;
  rules::Driver coil("c_pop1", cfg, platform, 12);
  rules::PlatformController controller;

  const auto rule = controller.set_pulse_on_hit_rule({&sw, false, true}, {&coil, true});
  REQUIRE(rule.driver_settings.pulse.duration_ms == 12, "machine default pulse_ms not applied");
  REQUIRE(rule.driver_settings.pulse.power == 0.75, "driver default pulse power not applied");
  REQUIRE(rule.switch_settings.front().debounce, "debounce flag lost");
  return true;
}

bool test_cross_platform_rejected_without_calls() {
  rules::VirtualPlatform a("a");
  rules::VirtualPlatform b("b");
  rules::Switch sw("s_a", rules::Switch::Config{"1"}, a);
  rules::Switch other("s_b", rules::Switch::Config{"2"}, b);
  rules::Driver coil("c_a", make_driver_cfg("10"), a);
  rules::Driver foreign("c_b", make_driver_cfg("11"), b);
  rules::PlatformController controller;
  a.clear_calls();
  b.clear_calls();

  bool threw = false;
  try {
    (void)controller.set_pulse_on_hit_rule({&sw}, {&foreign});
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "switch/driver platform mismatch must be rejected");

  threw = false;
  try {
    (void)controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&sw}, {&other},
                                                                              {&coil});
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "disable switch on another platform must be rejected");
  REQUIRE(a.calls().empty() && b.calls().empty(), "rejected rules must not touch any platform");

  threw = false;
  try {
    (void)controller.set_pulse_on_hit_rule({nullptr}, {&coil});
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "missing switch must be rejected");
  return true;
}

bool test_out_of_bounds_overrides_make_no_calls() {
  rules::VirtualPlatform platform;
  rules::Switch sw("s_sling", rules::Switch::Config{"3"}, platform);
  rules::DriverConfig cfg = make_driver_cfg("12");
  cfg.max_pulse_power = 0.8;
  cfg.allow_enable = false;
  cfg.max_hold_power = 0.3;
  cfg.default_pulse_power = 0.5;
  rules::PlatformController controller;
  rules::Driver soft("c_soft", cfg, platform, 10);
  platform.clear_calls();

  auto expect_limits = [&](const char* label, const std::function<void()>& fn) {
    try {
      fn();
    } catch (const rules::DriverLimitsError&) {
      return true;
    }
    std::cerr << label << " did not raise DriverLimitsError\n";
    return false;
  };

  REQUIRE(expect_limits("pulse_ms above max",
                        [&] { (void)controller.set_pulse_on_hit_rule({&sw}, {&soft}, rules::PulseRuleSettings{41, std::nullopt}); }),
          "pulse_ms override");
  REQUIRE(expect_limits("pulse power above max",
                        [&] { (void)controller.set_pulse_on_hit_rule({&sw}, {&soft}, rules::PulseRuleSettings{std::nullopt, 0.9}); }),
          "pulse power override");
  REQUIRE(expect_limits("pulse power negative",
                        [&] { (void)controller.set_pulse_on_hit_rule({&sw}, {&soft}, rules::PulseRuleSettings{std::nullopt, -0.1}); }),
          "negative power override");
  REQUIRE(expect_limits("hold power above max",
                        [&] {
                          (void)controller.set_pulse_on_hit_and_enable_and_release_rule(
                              {&sw}, {&soft}, std::nullopt, rules::HoldRuleSettings{0.5});
                        }),
          "hold power override");
  REQUIRE(platform.calls().empty(), "rejected overrides must perform zero platform calls");
  return true;
}

bool test_driver_defaults_validated_at_construction() {
  rules::VirtualPlatform platform;
  rules::DriverConfig cfg = make_driver_cfg("20");
  cfg.default_pulse_power = 1.0;
  cfg.max_pulse_power = 0.5;
  bool threw = false;
  try {
    rules::Driver coil("c_bad", cfg, platform);
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "default pulse power above max must fail at configuration time");
  REQUIRE(platform.count_calls("configure_driver") == 0, "invalid driver must not be configured");
  return true;
}

bool test_apply_then_clear_leaves_no_binding() {
  rules::VirtualPlatform platform;
  rules::Switch sw("s_kick", rules::Switch::Config{"4"}, platform);
  rules::Driver coil("c_kick", make_driver_cfg("13"), platform);
  rules::PlatformController controller;

  REQUIRE(platform.binding_count() == 0, "platform must start empty");
  const auto rule = controller.set_pulse_on_hit_and_release_rule({&sw}, {&coil});
  REQUIRE(platform.has_binding("4", "13"), "binding not created");
  controller.clear_hw_rule(rule);
  REQUIRE(platform.binding_count() == 0, "residual binding after clear");

  // Clearing again is harmless.
  controller.clear_hw_rule(rule);
  REQUIRE(platform.binding_count() == 0, "second clear changed the binding table");
  REQUIRE(platform.count_calls("clear_hw_rule") == 2, "each clear must reach the platform");
  return true;
}

bool test_dual_switch_clear_releases_both() {
  rules::VirtualPlatform platform;
  rules::Switch button("s_button", rules::Switch::Config{"5"}, platform);
  rules::Switch eos("s_eos", rules::Switch::Config{"6", rules::SwitchType::NormallyClosed}, platform);
  rules::Driver coil("c_main", make_driver_cfg("14"), platform);
  rules::PlatformController controller;

  const auto rule =
      controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&button}, {&eos}, {&coil});
  REQUIRE(platform.has_binding("5", "14"), "enable switch binding missing");
  REQUIRE(platform.has_binding("6", "14"), "disable switch binding missing");
  REQUIRE(platform.find_binding("6", "14")->role == rules::BindingRole::Disable,
          "second switch must be bound as the disable switch");
  REQUIRE(platform.find_binding("6", "14")->switch_settings.invert,
          "NC disable switch must carry its polarity");

  controller.clear_hw_rule(rule);
  REQUIRE(!platform.has_binding("5", "14"), "enable switch still bound after clear");
  REQUIRE(!platform.has_binding("6", "14"), "disable switch still bound after clear");
  return true;
}

bool test_partial_clear_failure_propagates() {
  FailingClearPlatform platform("6");
  rules::Switch button("s_button", rules::Switch::Config{"5"}, platform);
  rules::Switch eos("s_eos", rules::Switch::Config{"6"}, platform);
  rules::Driver coil("c_main", make_driver_cfg("14"), platform);
  rules::PlatformController controller;

  const auto rule =
      controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&button}, {&eos}, {&coil});

  bool threw = false;
  try {
    controller.clear_hw_rule(rule);
  } catch (const rules::PlatformError&) {
    threw = true;
  }
  REQUIRE(threw, "failed clear must propagate");
  REQUIRE(platform.clear_attempts() == 2, "every entry must be attempted exactly once");
  REQUIRE(!platform.has_binding("5", "14"), "successful entry must still be cleared");
  REQUIRE(platform.has_binding("6", "14"), "failing entry must stay visible as armed");
  return true;
}

bool test_rules_execute_on_virtual_platform() {
  rules::VirtualPlatform platform;
  rules::Switch button("s_button", rules::Switch::Config{"5"}, platform);
  rules::Switch eos("s_eos", rules::Switch::Config{"6"}, platform);
  rules::Switch pop("s_pop", rules::Switch::Config{"7"}, platform);
  rules::Driver flipper("c_flipper", make_driver_cfg("14"), platform);
  rules::Driver bumper("c_bumper", make_driver_cfg("15"), platform);
  rules::PlatformController controller;

  (void)controller.set_pulse_on_hit_and_enable_and_release_and_disable_rule({&button}, {&eos},
                                                                            {&flipper});
  (void)controller.set_pulse_on_hit_rule({&pop}, {&bumper});

  platform.simulate_switch("5", true, 100);
  REQUIRE(platform.driver_state("14").holding, "flipper must hold while button is down");
  platform.simulate_switch("6", true, 110);
  REQUIRE(!platform.driver_state("14").on, "eos must cut the flipper");
  platform.simulate_switch("6", false, 120);
  platform.simulate_switch("5", false, 130);

  platform.simulate_switch("7", true, 200);
  platform.simulate_switch("7", false, 201);
  REQUIRE(platform.driver_state("15").on, "pulse_on_hit must complete after release");
  platform.service(220);
  REQUIRE(!platform.driver_state("15").on, "pulse must end after its duration");
  REQUIRE(platform.driver_state("15").pulse_count == 1, "one hit, one pulse");
  return true;
}

bool test_clear_while_held_releases_coil() {
  rules::VirtualPlatform platform;
  rules::Switch button("s_magnet_button", rules::Switch::Config{"8"}, platform);
  rules::Driver magnet("c_magnet", make_driver_cfg("16"), platform);
  rules::PlatformController controller;

  const auto rule = controller.set_pulse_on_hit_and_enable_and_release_rule({&button}, {&magnet});
  platform.simulate_switch("8", true, 100);
  REQUIRE(platform.driver_state("16").holding, "hold rule must hold while the button is down");

  controller.clear_hw_rule(rule);
  REQUIRE(!platform.driver_state("16").on, "clearing a held rule must turn the coil off");
  REQUIRE(!platform.driver_state("16").holding, "clearing a held rule must end the hold");
  platform.service(5000);
  platform.simulate_switch("8", false, 5001);
  REQUIRE(!platform.driver_state("16").on, "coil must stay off once the rule is gone");
  return true;
}

bool test_call_log_can_be_switched_off() {
  rules::VirtualPlatform platform;
  rules::Switch pop("s_pop", rules::Switch::Config{"9"}, platform);
  rules::Driver bumper("c_bumper", make_driver_cfg("17"), platform);
  rules::PlatformController controller;
  REQUIRE(!platform.calls().empty(), "configuration is logged by default");

  platform.set_call_log_enabled(false);
  REQUIRE(platform.calls().empty(), "switching the log off drops what it held");
  const auto rule = controller.set_pulse_on_hit_rule({&pop}, {&bumper});
  for (uint64_t t = 0; t < 1000; t += 2) {
    platform.simulate_switch("9", true, t);
    platform.simulate_switch("9", false, t + 1);
  }
  controller.clear_hw_rule(rule);
  REQUIRE(platform.calls().empty(), "nothing is logged while the log is off");
  REQUIRE(platform.driver_state("17").pulse_count == 500, "rules still run with the log off");
  return true;
}

}  // namespace

int main() {
  if (!test_inversion_combines_request_and_polarity()) {
    return EXIT_FAILURE;
  }
  if (!test_each_topology_issues_one_primitive()) {
    return EXIT_FAILURE;
  }
  if (!test_defaults_resolve_from_driver()) {
    return EXIT_FAILURE;
  }
  if (!test_cross_platform_rejected_without_calls()) {
    return EXIT_FAILURE;
  }
  if (!test_out_of_bounds_overrides_make_no_calls()) {
    return EXIT_FAILURE;
  }
  if (!test_driver_defaults_validated_at_construction()) {
    return EXIT_FAILURE;
  }
  if (!test_apply_then_clear_leaves_no_binding()) {
    return EXIT_FAILURE;
  }
  if (!test_dual_switch_clear_releases_both()) {
    return EXIT_FAILURE;
  }
  if (!test_partial_clear_failure_propagates()) {
    return EXIT_FAILURE;
  }
  if (!test_rules_execute_on_virtual_platform()) {
    return EXIT_FAILURE;
  }
  if (!test_clear_while_held_releases_coil()) {
    return EXIT_FAILURE;
  }
  if (!test_call_log_can_be_switched_off()) {
    return EXIT_FAILURE;
  }
  std::cout << "platform_controller: ok\n";
  return EXIT_SUCCESS;
}
