#pragma once

#include "devices/clock.hpp"
#include "devices/event_bus.hpp"
#include "devices/playfield.hpp"
#include "devices/registry.hpp"
#include "rules/driver.hpp"
#include "rules/gpio_platform.hpp"
#include "rules/switch.hpp"
#include "rules/virtual_platform.hpp"
#include "runtime/config/config.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace runtime {

struct MachineCliOverrides {
  double duration_sec_override = -1.0;
};

struct MachineStats {
  uint64_t ticks = 0;
  uint64_t deadline_miss_count = 0;
  uint64_t switch_changes = 0;
  uint64_t timers_run = 0;
  uint64_t events_processed = 0;
};

// One configured machine: platform backend, switches, coils, devices and servo outputs, driven
// by a single control loop. Everything except request_stop() runs on the loop thread.
class Machine {
 public:
  // clock defaults to CLOCK_MONOTONIC; tests pass a ManualClock.
  explicit Machine(MachineConfig cfg, MachineCliOverrides overrides = {},
                   std::unique_ptr<devices::Clock> clock = nullptr);
  ~Machine();

  Machine(const Machine&) = delete;
  Machine& operator=(const Machine&) = delete;

  // Opens hardware, moves servos to their reset positions and posts machine_reset_phase_3
  // followed by machine.start_events.
  void start();
  // One loop iteration: platform service, due timers, queued events.
  void tick();
  // start(), then tick() at machine.loop_hz until the run duration ends or stop is requested.
  void run();
  // Safe from a signal handler.
  void request_stop() noexcept;
  // Disables every device so no rule stays armed, then releases hardware.
  void shutdown() noexcept;

  [[nodiscard]] bool started() const noexcept;
  [[nodiscard]] const MachineConfig& config() const noexcept;
  [[nodiscard]] MachineStats stats_snapshot() const;

  [[nodiscard]] rules::Platform& platform();
  // nullptr unless machine.platform is the matching backend.
  [[nodiscard]] rules::VirtualPlatform* virtual_platform();
  [[nodiscard]] rules::GpioPlatform* gpio_platform();

  [[nodiscard]] rules::Switch* find_switch(const std::string& name) const;
  [[nodiscard]] rules::Driver* find_coil(const std::string& name) const;
  [[nodiscard]] devices::EventBus& events();
  [[nodiscard]] devices::Playfield& playfield();
  [[nodiscard]] devices::DeviceRegistry& devices();
  [[nodiscard]] uint64_t now_ms() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace runtime
