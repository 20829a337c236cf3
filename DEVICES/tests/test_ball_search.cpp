#include "devices/clock.hpp"
#include "devices/event_bus.hpp"
#include "devices/playfield.hpp"
#include "devices/scheduler.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

#define REQUIRE(cond, msg)      \
  do {                          \
    if (!(cond)) {              \
      std::cerr << msg << "\n"; \
      return false;             \
    }                           \
  } while (0)

struct CallRecord {
  std::string name;
  int phase;
  int iteration;
  uint64_t at_ms;
};

bool operator==(const CallRecord& a, const CallRecord& b) {
  return a.name == b.name && a.phase == b.phase && a.iteration == b.iteration &&
         a.at_ms == b.at_ms;
}

devices::BallSearchConfig short_search() {
  devices::BallSearchConfig cfg;
  cfg.timeout_ms = 1000;
  cfg.interval_ms = 100;
  cfg.wait_after_iteration_ms = 500;
  cfg.phase_searches = {1, 1, 1};
  return cfg;
}

void run_until(devices::ManualClock& clock, devices::Scheduler& scheduler, uint64_t end_ms) {
  while (clock.now_ms() < end_ms) {
    clock.advance_ms(1);
    scheduler.run_due();
  }
}

bool test_scheduler_and_named_delays() {
  devices::ManualClock clock(100);
  devices::Scheduler scheduler(clock);
  std::vector<int> order;

  scheduler.schedule_in(20, [&order]() { order.push_back(2); });
  scheduler.schedule_in(10, [&order]() { order.push_back(1); });
  const uint64_t cancelled = scheduler.schedule_in(15, [&order]() { order.push_back(99); });
  REQUIRE(scheduler.cancel(cancelled), "pending timer cancels");
  REQUIRE(!scheduler.cancel(cancelled), "second cancel reports nothing to do");
  REQUIRE(scheduler.next_due_ms() == uint64_t{110}, "earliest deadline reported");

  clock.set_ms(120);
  REQUIRE(scheduler.run_due() == 2, "both due timers ran");
  REQUIRE(order == std::vector<int>({1, 2}), "earliest first");
  REQUIRE(scheduler.size() == 0, "queue drained");

  devices::DelayManager delays(scheduler);
  int fired = 0;
  delays.add("timeout", 50, [&fired]() { fired += 1; });
  delays.add("timeout", 80, [&fired]() { fired += 10; });
  REQUIRE(delays.size() == 1 && scheduler.size() == 1, "same name replaces the timer");
  clock.set_ms(170);
  scheduler.run_due();
  REQUIRE(fired == 0, "replaced timer never fires");
  clock.set_ms(200);
  scheduler.run_due();
  REQUIRE(fired == 10 && !delays.check("timeout"), "replacement fired once");

  {
    devices::DelayManager scoped(scheduler);
    scoped.add("x", 10, [&fired]() { fired = -1; });
  }
  clock.set_ms(300);
  scheduler.run_due();
  REQUIRE(fired == 10, "destroyed manager cancels its timers");
  return true;
}

bool test_event_bus_queues_and_dispatches() {
  devices::EventBus bus;
  std::vector<std::string> seen;
  uint64_t second_id = 0;

  bus.add_handler("a", [&]() {
    seen.push_back("a1");
    bus.post("b");
    bus.remove_handler(second_id);
  });
  second_id = bus.add_handler("a", [&]() { seen.push_back("a2"); });
  bus.add_handler("b", [&]() { seen.push_back("b"); });

  bus.post("a");
  REQUIRE(seen.empty(), "post only queues");
  REQUIRE(bus.process_queue() == 2, "posted-from-handler event processed in the same pass");
  REQUIRE(seen == std::vector<std::string>({"a1", "b"}), "removed handler skipped");
  REQUIRE(bus.post_count("a") == 1 && bus.post_count("b") == 1, "post counts");
  REQUIRE(bus.handler_count("a") == 1, "one handler left");
  return true;
}

bool test_phases_iterations_and_give_up() {
  devices::ManualClock clock;
  devices::Scheduler scheduler(clock);
  devices::EventBus events;
  devices::Playfield playfield("playfield", short_search(), scheduler, events);
  devices::BallSearch& search = playfield.ball_search();

  std::vector<CallRecord> calls;
  auto recorder = [&](const std::string& name, bool acted) {
    return [&calls, &clock, name, acted](int phase, int iteration) {
      calls.push_back({name, phase, iteration, clock.now_ms()});
      return acted;
    };
  };
  search.register_callback(10, recorder("a", true), "a");
  search.register_callback(20, recorder("b", false), "b");
  search.register_callback(5, recorder("c", true), "c");
  REQUIRE(search.callback_names() == std::vector<std::string>({"c", "a", "b"}), "ordered");

  search.enable();
  run_until(clock, scheduler, 999);
  REQUIRE(!search.started(), "quiet for less than the timeout");
  run_until(clock, scheduler, 1000);
  REQUIRE(search.started(), "started after the timeout");
  events.process_queue();
  REQUIRE(events.post_count("ball_search_started") == 1, "started event");

  run_until(clock, scheduler, 3000);
  const std::vector<CallRecord> expected{
      {"c", 1, 1, 1000}, {"a", 1, 1, 1100}, {"b", 1, 1, 1200}, {"c", 2, 1, 1200},
      {"a", 2, 1, 1700}, {"b", 2, 1, 1800}, {"c", 3, 1, 1800}, {"a", 3, 1, 2300},
      {"b", 3, 1, 2400},
  };
  REQUIRE(calls == expected, "callbacks run in order through three phases");
  REQUIRE(!search.started() && !search.enabled(), "search gave up");
  REQUIRE(events.post_count("ball_search_failed") == 1, "failed event");
  REQUIRE(events.post_count("ball_search_stopped") == 1, "stopped event");
  return true;
}

bool test_block_unblock_and_activity() {
  devices::ManualClock clock;
  devices::Scheduler scheduler(clock);
  devices::EventBus events;
  devices::Playfield playfield("playfield", short_search(), scheduler, events);
  devices::BallSearch& search = playfield.ball_search();

  search.enable();
  REQUIRE(!search.enabled(), "nothing to search with, stays disabled");

  int calls = 0;
  const uint32_t id = search.register_callback(1, [&calls](int, int) {
    ++calls;
    return true;
  }, "coil");
  search.enable();
  REQUIRE(search.enabled(), "enabled with a callback");

  run_until(clock, scheduler, 500);
  search.block();
  run_until(clock, scheduler, 2000);
  REQUIRE(!search.started() && calls == 0, "blocked search never starts");

  search.unblock();
  run_until(clock, scheduler, 2500);
  playfield.mark_playfield_active_from_device_action();
  REQUIRE(playfield.activity_count() == 1, "activity counted");
  run_until(clock, scheduler, 3499);
  REQUIRE(!search.started(), "activity restarted the countdown");
  run_until(clock, scheduler, 3500);
  REQUIRE(search.started() && calls == 1, "started a full timeout after the last activity");

  playfield.mark_playfield_active_from_device_action();
  REQUIRE(search.started(), "activity does not stop a running search");

  search.block();
  REQUIRE(!search.started(), "block stops a running search");
  REQUIRE(search.unregister(id), "unregister");
  REQUIRE(!search.unregister(id), "unregister twice");

  bool threw = false;
  try {
    devices::BallSearchConfig bad = short_search();
    bad.phase_searches = {1, 0, 1};
    devices::BallSearch broken("pf", bad, scheduler, events);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  REQUIRE(threw, "phases need at least one iteration");
  return true;
}

}  // namespace

int main() {
  if (!test_scheduler_and_named_delays()) {
    return EXIT_FAILURE;
  }
  if (!test_event_bus_queues_and_dispatches()) {
    return EXIT_FAILURE;
  }
  if (!test_phases_iterations_and_give_up()) {
    return EXIT_FAILURE;
  }
  if (!test_block_unblock_and_activity()) {
    return EXIT_FAILURE;
  }
  std::cout << "ball_search: ok\n";
  return EXIT_SUCCESS;
}
