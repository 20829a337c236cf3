#include "devices/autofire.hpp"
#include "devices/clock.hpp"
#include "devices/kickback.hpp"
#include "rules/virtual_platform.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

rules::DriverConfig pop_driver_cfg() {
  rules::DriverConfig cfg;
  cfg.number = "20";
  cfg.default_pulse_ms = 15;
  cfg.default_pulse_power = 0.75;
  cfg.max_pulse_ms = 30;
  return cfg;
}

// One switch and one coil on a virtual platform, with switch changes routed to the Switch.
struct Rig {
  explicit Rig(rules::SwitchType type = rules::SwitchType::NormallyOpen)
      : sw("s_pop1", rules::Switch::Config{"1", type, rules::DebounceMode::Auto}, platform),
        coil("pop1", pop_driver_cfg(), platform),
        playfield("playfield", devices::BallSearchConfig{}, scheduler, events) {
    platform.set_switch_listener([this](const std::string&, bool raw, uint64_t now) {
      sw.process_hw_state(raw, now);
    });
  }

  // Closes and opens the switch at the given time.
  void hit(uint64_t now_ms) {
    clock.set_ms(now_ms);
    scheduler.run_due();
    const bool active_level = !sw.invert();
    platform.simulate_switch("1", active_level, now_ms);
    platform.simulate_switch("1", !active_level, now_ms);
  }

  void advance_to(uint64_t now_ms) {
    clock.set_ms(now_ms);
    scheduler.run_due();
  }

  devices::ManualClock clock;
  devices::Scheduler scheduler{clock};
  devices::EventBus events;
  rules::VirtualPlatform platform;
  rules::Switch sw;
  rules::Driver coil;
  rules::PlatformController controller;
  devices::Playfield playfield;
};

std::unique_ptr<devices::AutofireCoil> make_autofire(Rig& rig, devices::AutofireConfig cfg = {}) {
  cfg.coil = "pop1";
  cfg.switch_name = "s_pop1";
  return std::make_unique<devices::AutofireCoil>("pop1", cfg, rig.sw, rig.coil, rig.controller,
                                                 rig.playfield, rig.events, rig.scheduler);
}

bool test_pop1_enable_and_disable() {
  Rig rig(rules::SwitchType::NormallyClosed);
  auto pop = make_autofire(rig);
  rig.platform.clear_calls();

  pop->enable();
  REQUIRE(rig.platform.count_calls("set_pulse_on_hit_rule") == 1, "one pulse_on_hit rule");
  const auto* binding = rig.platform.find_binding("1", "20");
  REQUIRE(binding != nullptr, "rule bound to s_pop1/pop1");
  REQUIRE(binding->driver_settings.pulse.duration_ms == 15, "default pulse_ms from the driver");
  REQUIRE(binding->driver_settings.pulse.power == 0.75, "default pulse_power from the driver");
  REQUIRE(binding->driver_settings.recycle, "recycle defaults to true");
  REQUIRE(binding->switch_settings.debounce, "debounce defaults to true");
  REQUIRE(binding->switch_settings.invert, "inversion follows the NC switch");
  REQUIRE(pop->enabled() && pop->active_rule().has_value(), "device holds the rule");

  pop->disable();
  REQUIRE(rig.platform.count_calls("clear_hw_rule") == 1, "one clear for the pair");
  REQUIRE(rig.platform.calls().back().switch_number == "1" &&
              rig.platform.calls().back().driver_number == "20",
          "clear targets s_pop1/pop1");
  REQUIRE(rig.platform.binding_count() == 0, "no residual binding");
  REQUIRE(!pop->enabled() && !pop->active_rule().has_value(), "device released the rule");
  return true;
}

bool test_enable_disable_are_idempotent() {
  Rig rig;
  auto pop = make_autofire(rig);
  rig.platform.clear_calls();

  pop->enable();
  pop->enable();
  REQUIRE(rig.platform.count_calls("set_pulse_on_hit_rule") == 1, "second enable is a no-op");
  pop->disable();
  pop->disable();
  REQUIRE(rig.platform.count_calls("clear_hw_rule") == 1, "second disable is a no-op");
  return true;
}

bool test_overrides_shape_the_rule() {
  Rig rig;
  devices::AutofireConfig cfg;
  cfg.recycle = false;
  cfg.debounce = devices::parse_debounce_override("quick");
  cfg.pulse_ms = 25;
  cfg.pulse_power = 0.5;
  cfg.reverse_switch = true;
  auto pop = make_autofire(rig, cfg);

  pop->enable();
  const auto* binding = rig.platform.find_binding("1", "20");
  REQUIRE(binding != nullptr, "rule bound");
  REQUIRE(!binding->driver_settings.recycle, "recycle override");
  REQUIRE(!binding->switch_settings.debounce, "quick debounce disables rule debounce");
  REQUIRE(binding->driver_settings.pulse.duration_ms == 25, "pulse_ms override");
  REQUIRE(binding->driver_settings.pulse.power == 0.5, "pulse_power override");
  REQUIRE(binding->switch_settings.invert, "reverse_switch inverts an NO switch");

  REQUIRE(devices::parse_debounce_override("false") == devices::DebounceOverride::Off, "false");
  REQUIRE(devices::parse_debounce_override("true") == devices::DebounceOverride::Normal, "true");
  bool threw = false;
  try {
    (void)devices::parse_debounce_override("sometimes");
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "unknown debounce override rejected");
  return true;
}

bool test_bad_override_rejected_at_construction() {
  Rig rig;
  rig.platform.clear_calls();
  devices::AutofireConfig cfg;
  cfg.pulse_ms = 31;
  bool threw = false;
  try {
    auto pop = make_autofire(rig, cfg);
  } catch (const rules::DriverLimitsError&) {
    threw = true;
  }
  REQUIRE(threw, "pulse_ms above max_pulse_ms must fail at configuration time");
  REQUIRE(rig.platform.calls().empty(), "no platform call for a rejected device");

  devices::AutofireConfig window;
  window.timeout_watch_time_ms = 1000;
  threw = false;
  try {
    auto pop = make_autofire(rig, window);
  } catch (const rules::ConfigError&) {
    threw = true;
  }
  REQUIRE(threw, "timeout_watch_time without timeout_max_hits rejected");
  REQUIRE(rig.sw.handler_count() == 0, "rejected devices leave no switch handler");
  return true;
}

bool test_hits_mark_playfield_and_post_events() {
  Rig rig;
  devices::AutofireConfig cfg;
  cfg.events_when_fired = {"pop1_hit", "score_100"};
  auto pop = make_autofire(rig, cfg);

  rig.hit(10);
  REQUIRE(rig.playfield.activity_count() == 0, "disabled device ignores hits");
  REQUIRE(rig.events.post_count("pop1_hit") == 0, "no events while disabled");

  pop->enable();
  rig.hit(20);
  REQUIRE(rig.playfield.activity_count() == 1, "hit marks the playfield active");
  REQUIRE(rig.events.post_count("playfield_active") == 1, "playfield_active posted");
  REQUIRE(rig.events.post_count("pop1_hit") == 1 && rig.events.post_count("score_100") == 1,
          "every events_when_fired event posted");
  REQUIRE(rig.platform.driver_state("20").pulse_count == 1, "the rule fired the coil");
  return true;
}

bool test_hit_window_boundary() {
  devices::HitWindow window(1000, 3);
  REQUIRE(!window.record(0), "first hit");
  REQUIRE(!window.record(500), "second hit");
  REQUIRE(!window.record(1000), "hit exactly W ago is excluded");
  REQUIRE(window.count(1000) == 2, "0 pruned at 1000");

  devices::HitWindow inside(1000, 3);
  REQUIRE(!inside.record(1), "first hit");
  REQUIRE(!inside.record(500), "second hit");
  REQUIRE(inside.record(1000), "hit W-1 ago is included and trips");
  REQUIRE(inside.count(1000) == 0, "tripped window restarts");

  bool threw = false;
  try {
    devices::HitWindow bad(0, 3);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  REQUIRE(threw, "zero window rejected");
  return true;
}

bool test_rate_limit_disables_and_reenables() {
  Rig rig;
  devices::AutofireConfig cfg;
  cfg.timeout_watch_time_ms = 1000;
  cfg.timeout_max_hits = 3;
  cfg.timeout_disable_time_ms = 500;
  auto pop = make_autofire(rig, cfg);
  pop->enable();
  rig.platform.clear_calls();

  rig.hit(100);
  rig.hit(200);
  REQUIRE(pop->enabled(), "N-1 hits keep the device enabled");
  rig.hit(300);
  REQUIRE(!pop->enabled(), "N hits within W disable the device");
  REQUIRE(pop->reenable_pending(), "re-enable scheduled");
  REQUIRE(rig.platform.count_calls("clear_hw_rule") == 1, "rule cleared on trip");
  REQUIRE(rig.platform.binding_count() == 0, "nothing armed during cooldown");

  rig.hit(400);
  REQUIRE(rig.platform.driver_state("20").pulse_count == 3, "no fire during cooldown");

  rig.advance_to(799);
  REQUIRE(!pop->enabled(), "still cooling down");
  rig.advance_to(800);
  REQUIRE(pop->enabled(), "re-enabled after timeout_disable_time");
  REQUIRE(!pop->reenable_pending(), "timer consumed");
  REQUIRE(rig.platform.count_calls("set_pulse_on_hit_rule") == 1, "rule restored");

  // A manual enable during the cooldown replaces the pending timer.
  rig.hit(900);
  rig.hit(950);
  rig.hit(999);
  REQUIRE(pop->reenable_pending(), "tripped again");
  pop->enable();
  REQUIRE(!pop->reenable_pending(), "enable cancels the pending re-enable");
  pop->disable();
  rig.advance_to(2000);
  REQUIRE(!pop->enabled(), "no stale timer re-enables the device");
  return true;
}

bool test_ball_search_pulse_is_not_activity() {
  Rig rig;
  auto pop = make_autofire(rig);
  pop->enable();

  auto& search = rig.playfield.ball_search();
  REQUIRE(search.callback_count() == 1, "autofire registered with ball search");
  search.enable();
  search.start();
  REQUIRE(search.started(), "search running");
  REQUIRE(pop->ball_search_in_progress(), "first callback pulsed the coil");
  REQUIRE(rig.platform.driver_state("20").pulse_count == 1, "direct pulse issued");

  rig.hit(50);
  REQUIRE(rig.playfield.activity_count() == 0, "hit inside the ignore window is not activity");
  rig.hit(100);
  REQUIRE(!pop->ball_search_in_progress(), "ignore window closed after 100 ms");
  REQUIRE(rig.playfield.activity_count() == 1, "later hits count again");

  search.disable();
  pop.reset();
  REQUIRE(search.callback_count() == 0, "destroyed device unregisters");
  REQUIRE(rig.sw.handler_count() == 0, "destroyed device removes its switch handler");
  return true;
}

bool test_kickback_posts_fired_event() {
  Rig rig;
  devices::AutofireConfig cfg = devices::default_kickback_config();
  REQUIRE(cfg.enable_events.empty(), "kickbacks are not enabled by ball_started");
  cfg.coil = "pop1";
  cfg.switch_name = "s_pop1";
  devices::Kickback kickback("left", cfg, rig.sw, rig.coil, rig.controller, rig.playfield,
                             rig.events, rig.scheduler);
  REQUIRE(std::string(kickback.type_name()) == "kickback", "type name");

  rig.hit(10);
  REQUIRE(rig.events.post_count("kickback_left_fired") == 0, "disabled kickback is silent");
  kickback.enable();
  rig.hit(20);
  REQUIRE(rig.events.post_count("kickback_left_fired") == 1, "fired event posted");
  REQUIRE(rig.playfield.activity_count() == 1, "base hit processing ran");
  return true;
}

bool test_kickback_silent_when_rate_limited() {
  Rig rig;
  devices::AutofireConfig cfg = devices::default_kickback_config();
  cfg.coil = "pop1";
  cfg.switch_name = "s_pop1";
  cfg.timeout_watch_time_ms = 1000;
  cfg.timeout_max_hits = 1;
  cfg.timeout_disable_time_ms = 500;
  devices::Kickback kickback("left", cfg, rig.sw, rig.coil, rig.controller, rig.playfield,
                             rig.events, rig.scheduler);
  kickback.enable();

  rig.hit(10);
  REQUIRE(!kickback.enabled(), "the hit must trip the rate limiter");
  REQUIRE(rig.events.post_count("kickback_left_fired") == 0,
          "a kickback disabled by its own hit must not post fired");
  REQUIRE(rig.playfield.activity_count() == 1, "base hit processing still ran");

  rig.advance_to(510);
  REQUIRE(kickback.enabled(), "kickback re-enables after the disable time");
  return true;
}

}  // namespace

int main() {
  if (!test_pop1_enable_and_disable()) {
    return EXIT_FAILURE;
  }
  if (!test_enable_disable_are_idempotent()) {
    return EXIT_FAILURE;
  }
  if (!test_overrides_shape_the_rule()) {
    return EXIT_FAILURE;
  }
  if (!test_bad_override_rejected_at_construction()) {
    return EXIT_FAILURE;
  }
  if (!test_hits_mark_playfield_and_post_events()) {
    return EXIT_FAILURE;
  }
  if (!test_hit_window_boundary()) {
    return EXIT_FAILURE;
  }
  if (!test_rate_limit_disables_and_reenables()) {
    return EXIT_FAILURE;
  }
  if (!test_ball_search_pulse_is_not_activity()) {
    return EXIT_FAILURE;
  }
  if (!test_kickback_posts_fired_event()) {
    return EXIT_FAILURE;
  }
  if (!test_kickback_silent_when_rate_limited()) {
    return EXIT_FAILURE;
  }
  std::cout << "autofire: ok\n";
  return EXIT_SUCCESS;
}
