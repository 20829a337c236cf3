#pragma once

#include "rules/gpio_lines.hpp"
#include "rules/platform.hpp"
#include "rules/virtual_platform.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rules {

// Switches and coils wired straight to gpiochip lines. Numbers are line offsets. Rules run in
// software from service(), so their latency is one loop period.
class GpioPlatform final : public Platform {
 public:
  struct Config {
    std::string output_chip = "/dev/gpiochip0";
    std::string input_chip = "/dev/gpiochip0";
    uint32_t recycle_ms = 125;
    uint32_t debounce_samples = 3;
    uint32_t max_pulse_ms = 255;
  };

  GpioPlatform(Config cfg, std::unique_ptr<GpioLinesOut> out, std::unique_ptr<GpioLinesIn> in);
  ~GpioPlatform() override;

  GpioPlatform(const GpioPlatform&) = delete;
  GpioPlatform& operator=(const GpioPlatform&) = delete;

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  [[nodiscard]] PlatformFeatures features() const noexcept override;

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

  // Opens both line banks. Lines have to be configured before this.
  void start();
  // Drives every coil low and releases the lines.
  void stop() noexcept;
  void service(uint64_t now_ms) override;

  [[nodiscard]] bool started() const noexcept { return started_; }
  [[nodiscard]] std::size_t rule_count() const noexcept { return rules_.size(); }
  [[nodiscard]] bool driver_on(const std::string& number) const;

 private:
  struct SwitchLine {
    std::size_t index = 0;
    uint32_t required_samples = 1;
    bool raw = false;
    bool stable = false;
    bool candidate = false;
    uint32_t candidate_count = 0;
  };

  struct DriverLine {
    std::size_t index = 0;
    bool on = false;
    bool holding = false;
    uint64_t pulse_end_ms = 0;
    uint64_t off_since_ms = 0;
  };

  struct Rule {
    RuleTopology topology = RuleTopology::PulseOnHit;
    BindingRole role = BindingRole::Enable;
    SwitchSettings switch_settings;
    DriverSettings driver_settings;
  };

  using RuleKey = std::pair<std::string, std::string>;

  static uint32_t parse_line(const std::string& number, const char* what);
  SwitchLine& switch_line(const std::string& number);
  DriverLine& driver_line(const std::string& number);
  void check_no_fractional_power(const DriverSettings& driver) const;
  void add_rule(RuleTopology topology, BindingRole role, const SwitchSettings& switch_settings,
                const DriverSettings& driver);
  void evaluate_rules(const std::string& number, bool raw_changed, bool stable_changed);
  void fire(const Rule& rule);
  void release(const Rule& rule);
  void switch_off(DriverLine& line);
  void flush_outputs();

  std::string name_ = "gpio";
  Config cfg_;
  std::unique_ptr<GpioLinesOut> out_;
  std::unique_ptr<GpioLinesIn> in_;
  SwitchChangeListener listener_;
  std::map<std::string, SwitchLine> switches_;
  std::map<std::string, DriverLine> drivers_;
  std::vector<uint32_t> input_lines_;
  std::vector<uint32_t> output_lines_;
  std::map<RuleKey, Rule> rules_;
  std::vector<uint8_t> written_;
  bool started_ = false;
  uint64_t now_ms_ = 0;
};

}  // namespace rules
