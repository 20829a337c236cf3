#pragma once

#include "rules/platform.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace rules {

enum class RuleTopology : uint8_t {
  PulseOnHitAndRelease = 0,
  PulseOnHitAndEnableAndRelease = 1,
  PulseOnHit = 2,
  PulseOnHitAndEnableAndReleaseAndDisable = 3,
};

enum class BindingRole : uint8_t {
  Enable = 0,
  Disable = 1,
};

// In-memory backend. Keeps the rule table the way a controller board would and executes it
// when switches are simulated. Used by the simulator runtime, the Python bindings and tests.
class VirtualPlatform : public Platform {
 public:
  struct Binding {
    RuleTopology topology = RuleTopology::PulseOnHit;
    BindingRole role = BindingRole::Enable;
    SwitchSettings switch_settings;
    DriverSettings driver_settings;
  };

  struct Call {
    std::string kind;
    std::string switch_number;
    std::string driver_number;
  };

  struct DriverState {
    bool on = false;
    bool holding = false;
    uint64_t pulse_count = 0;
    uint32_t last_pulse_ms = 0;
    double last_pulse_power = 0.0;
    double hold_power = 0.0;
    uint64_t pulse_end_ms = 0;
  };

  explicit VirtualPlatform(std::string name = "virtual", PlatformFeatures features = {});

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  [[nodiscard]] PlatformFeatures features() const noexcept override { return features_; }

  HwSwitch configure_switch(const std::string& number, DebounceMode debounce) override;
  HwDriver configure_driver(const std::string& number) override;
  void set_switch_listener(SwitchChangeListener listener) override;

  void set_pulse_on_hit_and_release_rule(const SwitchSettings& enable_switch,
                                         const DriverSettings& driver) override;
  void set_pulse_on_hit_and_enable_and_release_rule(const SwitchSettings& enable_switch,
                                                    const DriverSettings& driver) override;
  void set_pulse_on_hit_rule(const SwitchSettings& enable_switch,
                             const DriverSettings& driver) override;
  void set_pulse_on_hit_and_enable_and_release_and_disable_rule(
      const SwitchSettings& enable_switch, const SwitchSettings& disable_switch,
      const DriverSettings& driver) override;
  void clear_hw_rule(const SwitchSettings& switch_settings, const DriverSettings& driver) override;

  void pulse(const HwDriver& driver, const PulseSettings& pulse) override;
  void enable(const HwDriver& driver, const PulseSettings& pulse, const HoldSettings& hold) override;
  void disable(const HwDriver& driver) override;

  void service(uint64_t now_ms) override;

  // Drive a raw switch level: executes matching rules, then reports to the listener.
  void simulate_switch(const std::string& number, bool raw_active, uint64_t now_ms);

  [[nodiscard]] bool has_binding(const std::string& switch_number,
                                 const std::string& driver_number) const;
  [[nodiscard]] const Binding* find_binding(const std::string& switch_number,
                                            const std::string& driver_number) const;
  [[nodiscard]] std::size_t binding_count() const noexcept { return bindings_.size(); }

  [[nodiscard]] const std::vector<Call>& calls() const noexcept { return calls_; }
  [[nodiscard]] std::size_t count_calls(const std::string& kind) const;
  void clear_calls() noexcept { calls_.clear(); }
  // The call log is on by default for tests. Long runs switch it off so it stays empty.
  void set_call_log_enabled(bool enabled) noexcept {
    log_calls_ = enabled;
    if (!enabled) {
      calls_.clear();
    }
  }
  [[nodiscard]] bool call_log_enabled() const noexcept { return log_calls_; }

  [[nodiscard]] DriverState driver_state(const std::string& number) const;
  [[nodiscard]] bool switch_level(const std::string& number) const;

 private:
  using BindingKey = std::pair<std::string, std::string>;

  void require_switch(const HwSwitch& hw_switch) const;
  void require_driver(const HwDriver& hw_driver) const;
  void add_binding(RuleTopology topology, BindingRole role, const SwitchSettings& switch_settings,
                   const DriverSettings& driver);
  void record(const std::string& kind, const std::string& switch_number,
              const std::string& driver_number);
  void fire_rule(const Binding& binding, uint64_t now_ms);
  void release_rule(const Binding& binding);

  std::string name_;
  PlatformFeatures features_;
  SwitchChangeListener listener_;
  std::set<std::string> switches_;
  std::map<std::string, bool> switch_levels_;
  std::map<std::string, DriverState> drivers_;
  std::map<BindingKey, Binding> bindings_;
  std::vector<Call> calls_;
  bool log_calls_ = true;
  uint64_t now_ms_ = 0;
};

const char* topology_name(RuleTopology topology) noexcept;

}  // namespace rules
