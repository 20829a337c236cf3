#pragma once

#include "devices/event_bus.hpp"
#include "devices/hit_window.hpp"
#include "devices/playfield.hpp"
#include "devices/scheduler.hpp"
#include "rules/platform_controller.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devices {

enum class DebounceOverride : uint8_t {
  Default = 0,
  Normal = 1,
  Quick = 2,
  Off = 3,
};

DebounceOverride parse_debounce_override(const std::string& value);
const char* debounce_override_name(DebounceOverride value) noexcept;

constexpr uint64_t kBallSearchIgnoreMs = 100;

struct AutofireConfig {
  std::string coil;
  std::string switch_name;
  bool reverse_switch = false;
  std::vector<std::string> enable_events{"ball_started"};
  std::vector<std::string> disable_events{"ball_will_end", "service_mode_entered"};

  // Coil and switch overrides.
  std::optional<bool> recycle;
  std::optional<uint32_t> pulse_ms;
  std::optional<double> pulse_power;
  DebounceOverride debounce = DebounceOverride::Default;

  int ball_search_order = 100;
  uint64_t timeout_watch_time_ms = 0;
  uint32_t timeout_max_hits = 0;
  uint64_t timeout_disable_time_ms = 0;
  std::vector<std::string> events_when_fired;
  bool debug = false;
};

// Coil fired by a pulse_on_hit hardware rule while enabled, e.g. pop bumpers and slingshots.
// Hits are also observed in software for playfield activity, the hit-rate limiter and events.
class AutofireCoil {
 public:
  AutofireCoil(std::string name, AutofireConfig cfg, rules::Switch& input, rules::Driver& coil,
               const rules::PlatformController& controller, Playfield& playfield,
               EventBus& events, Scheduler& scheduler);
  virtual ~AutofireCoil();

  AutofireCoil(const AutofireCoil&) = delete;
  AutofireCoil& operator=(const AutofireCoil&) = delete;

  void enable();
  void disable();

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const AutofireConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }
  [[nodiscard]] const std::optional<rules::HardwareRule>& active_rule() const noexcept {
    return rule_;
  }
  [[nodiscard]] bool ball_search_in_progress() const noexcept { return ball_search_in_progress_; }
  [[nodiscard]] bool reenable_pending() const { return delay_.check("timeout_enable"); }
  [[nodiscard]] bool recycle() const noexcept;
  [[nodiscard]] bool debounce() const noexcept;
  [[nodiscard]] virtual const char* type_name() const noexcept { return "autofire"; }

 protected:
  virtual void hit();

  EventBus& events() noexcept { return *events_; }
  void log_debug(const std::string& message) const;

 private:
  bool ball_search(int phase, int iteration);
  void timeout_enable();

  std::string name_;
  AutofireConfig cfg_;
  rules::Switch* input_;
  rules::Driver* coil_;
  const rules::PlatformController* controller_;
  Playfield* playfield_;
  EventBus* events_;
  Scheduler* scheduler_;
  DelayManager delay_;
  std::unique_ptr<HitWindow> hit_window_;
  std::optional<rules::HardwareRule> rule_;
  uint32_t switch_handler_id_ = 0;
  uint32_t ball_search_id_ = 0;
  bool enabled_ = false;
  bool ball_search_in_progress_ = false;
};

}  // namespace devices
