#include "devices/autofire.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace devices {

DebounceOverride parse_debounce_override(const std::string& value) {
  if (value.empty()) {
    return DebounceOverride::Default;
  }
  if (value == "normal" || value == "true") {
    return DebounceOverride::Normal;
  }
  if (value == "quick") {
    return DebounceOverride::Quick;
  }
  if (value == "false") {
    return DebounceOverride::Off;
  }
  throw rules::ConfigError("Invalid debounce override: " + value + " (expected normal|quick|true|false)");
}

const char* debounce_override_name(DebounceOverride value) noexcept {
  switch (value) {
    case DebounceOverride::Default:
      return "default";
    case DebounceOverride::Normal:
      return "normal";
    case DebounceOverride::Quick:
      return "quick";
    case DebounceOverride::Off:
      return "false";
  }
  return "default";
}

AutofireCoil::AutofireCoil(std::string name, AutofireConfig cfg, rules::Switch& input,
                           rules::Driver& coil, const rules::PlatformController& controller,
                           Playfield& playfield, EventBus& events, Scheduler& scheduler)
    : name_(std::move(name)),
      cfg_(std::move(cfg)),
      input_(&input),
      coil_(&coil),
      controller_(&controller),
      playfield_(&playfield),
      events_(&events),
      scheduler_(&scheduler),
      delay_(scheduler) {
  if (name_.empty()) {
    throw rules::ConfigError("Autofire device requires a name");
  }
  if (&input_->platform() != &coil_->platform()) {
    throw rules::ConfigError("Autofire '" + name_ + "': switch '" + input_->name() + "' and coil '" +
                             coil_->name() + "' have to use the same platform");
  }

  // Overrides are checked now so a bad config never reaches enable().
  (void)coil_->get_and_verify_pulse_ms(cfg_.pulse_ms);
  (void)coil_->get_and_verify_pulse_power(cfg_.pulse_power);

  if (cfg_.timeout_watch_time_ms > 0) {
    if (cfg_.timeout_max_hits == 0) {
      throw rules::ConfigError("Autofire '" + name_ +
                               "': timeout_watch_time requires timeout_max_hits > 0");
    }
    hit_window_ = std::make_unique<HitWindow>(cfg_.timeout_watch_time_ms, cfg_.timeout_max_hits);
  }

  switch_handler_id_ = input_->add_handler([this]() { hit(); }, !cfg_.reverse_switch);
  if (cfg_.ball_search_order > 0) {
    ball_search_id_ = playfield_->ball_search().register_callback(
        cfg_.ball_search_order, [this](int phase, int iteration) { return ball_search(phase, iteration); },
        name_);
  }
}

AutofireCoil::~AutofireCoil() {
  input_->remove_handler(switch_handler_id_);
  if (ball_search_id_ != 0) {
    playfield_->ball_search().unregister(ball_search_id_);
  }
}

bool AutofireCoil::recycle() const noexcept { return cfg_.recycle.value_or(true); }

bool AutofireCoil::debounce() const noexcept {
  return cfg_.debounce == DebounceOverride::Default || cfg_.debounce == DebounceOverride::Normal;
}

void AutofireCoil::enable() {
  delay_.remove("timeout_enable");
  if (enabled_) {
    return;
  }
  log_debug("enabling");

  rule_ = controller_->set_pulse_on_hit_rule({input_, cfg_.reverse_switch, debounce()},
                                             {coil_, recycle()},
                                             rules::PulseRuleSettings{cfg_.pulse_ms, cfg_.pulse_power});
  enabled_ = true;
}

void AutofireCoil::disable() {
  delay_.remove("timeout_enable");
  if (!enabled_) {
    return;
  }
  log_debug("disabling");

  controller_->clear_hw_rule(*rule_);
  rule_.reset();
  enabled_ = false;
}

void AutofireCoil::hit() {
  if (!enabled_) {
    return;
  }
  const uint64_t now = scheduler_->now_ms();
  log_debug("hit");

  if (!ball_search_in_progress_) {
    playfield_->mark_playfield_active_from_device_action();
  }

  if (hit_window_ && hit_window_->record(now)) {
    std::cerr << type_name() << " " << name_ << ": " << cfg_.timeout_max_hits << " hits within "
              << cfg_.timeout_watch_time_ms << "ms, disabling for " << cfg_.timeout_disable_time_ms
              << "ms\n";
    disable();
    delay_.add("timeout_enable", cfg_.timeout_disable_time_ms, [this]() { timeout_enable(); });
  }

  for (const auto& event : cfg_.events_when_fired) {
    events_->post(event);
  }
}

bool AutofireCoil::ball_search(int phase, int iteration) {
  (void)phase;
  (void)iteration;
  delay_.reset("ball_search_ignore_done", kBallSearchIgnoreMs,
               [this]() { ball_search_in_progress_ = false; });
  ball_search_in_progress_ = true;
  coil_->pulse();
  return true;
}

void AutofireCoil::timeout_enable() {
  try {
    enable();
  } catch (const std::exception& e) {
    std::cerr << type_name() << " " << name_ << ": timed re-enable failed, staying disabled: "
              << e.what() << "\n";
  }
}

void AutofireCoil::log_debug(const std::string& message) const {
  if (cfg_.debug) {
    std::cout << "[" << scheduler_->now_ms() << "] " << type_name() << " " << name_ << ": "
              << message << "\n";
  }
}

}  // namespace devices
