#pragma once

#include "rules/platform.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace rules {

class Switch {
 public:
  using Handler = std::function<void()>;

  struct Config {
    std::string number;
    SwitchType type = SwitchType::NormallyOpen;
    DebounceMode debounce = DebounceMode::Auto;
  };

  Switch(std::string name, Config cfg, Platform& platform);

  Switch(const Switch&) = delete;
  Switch& operator=(const Switch&) = delete;

  // Handlers fire when the logical state changes to `state`. Returns an id for remove_handler().
  uint32_t add_handler(Handler callback, bool state = true);
  bool remove_handler(uint32_t id);

  // Feed a raw hardware level; polarity is applied here.
  void process_hw_state(bool raw_active, uint64_t now_ms);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const Config& config() const noexcept { return cfg_; }
  [[nodiscard]] Platform& platform() const noexcept { return *platform_; }
  [[nodiscard]] const HwSwitch& hw_switch() const noexcept { return hw_switch_; }
  [[nodiscard]] bool invert() const noexcept { return cfg_.type == SwitchType::NormallyClosed; }
  [[nodiscard]] bool is_active() const noexcept { return active_; }
  [[nodiscard]] uint64_t last_change_ms() const noexcept { return last_change_ms_; }
  [[nodiscard]] uint64_t hit_count() const noexcept { return hit_count_; }
  [[nodiscard]] std::size_t handler_count() const noexcept { return handlers_.size(); }

 private:
  struct Registration {
    uint32_t id = 0;
    bool state = true;
    Handler callback;
  };

  std::string name_;
  Config cfg_;
  Platform* platform_;
  HwSwitch hw_switch_;
  std::vector<Registration> handlers_;
  uint32_t next_handler_id_ = 1;
  bool active_ = false;
  uint64_t last_change_ms_ = 0;
  uint64_t hit_count_ = 0;
};

}  // namespace rules
