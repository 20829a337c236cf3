#pragma once

#include "devices/event_bus.hpp"
#include "devices/scheduler.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace devices {

struct BallSearchConfig {
  bool enabled = true;
  uint64_t timeout_ms = 15000;
  uint64_t interval_ms = 150;
  uint64_t wait_after_iteration_ms = 5000;
  std::array<uint32_t, 3> phase_searches{3, 3, 4};
  std::vector<std::string> enable_events{"ball_started"};
  std::vector<std::string> disable_events{"ball_will_end", "service_mode_entered"};
  std::vector<std::string> block_events{"flipper_cradle"};
  std::vector<std::string> unblock_events{"flipper_cradle_release"};
};

// Pulses registered devices in order after the playfield has been quiet for timeout_ms.
// Each pass over the callbacks is an iteration; phases 1..3 run their configured number of
// iterations before the search gives up.
class BallSearch {
 public:
  // Returns true when the device acted; the search then waits before the next callback.
  using Callback = std::function<bool(int phase, int iteration)>;

  BallSearch(std::string playfield_name, BallSearchConfig cfg, Scheduler& scheduler,
             EventBus& events);

  BallSearch(const BallSearch&) = delete;
  BallSearch& operator=(const BallSearch&) = delete;

  uint32_t register_callback(int order, Callback callback, std::string name);
  bool unregister(uint32_t id);

  void enable();
  void disable();
  void block();
  void unblock();
  void reset_timer();
  void start();
  void give_up();

  [[nodiscard]] bool enabled() const noexcept { return enabled_; }
  [[nodiscard]] bool started() const noexcept { return started_; }
  [[nodiscard]] bool blocked() const noexcept { return blocked_; }
  [[nodiscard]] int phase() const noexcept { return phase_; }
  [[nodiscard]] int iteration() const noexcept { return iteration_; }
  [[nodiscard]] std::size_t callback_count() const noexcept { return callbacks_.size(); }
  [[nodiscard]] std::vector<std::string> callback_names() const;
  [[nodiscard]] const BallSearchConfig& config() const noexcept { return cfg_; }

 private:
  struct Entry {
    int order = 0;
    uint32_t id = 0;
    std::string name;
    Callback callback;
  };

  void run();
  void stop();

  std::string name_;
  BallSearchConfig cfg_;
  EventBus* events_;
  DelayManager delay_;
  std::vector<Entry> callbacks_;
  uint32_t next_id_ = 1;
  bool enabled_ = false;
  bool started_ = false;
  bool blocked_ = false;
  int phase_ = 0;
  int iteration_ = 0;
  std::size_t next_index_ = 0;
};

class Playfield {
 public:
  Playfield(std::string name, BallSearchConfig cfg, Scheduler& scheduler, EventBus& events);

  Playfield(const Playfield&) = delete;
  Playfield& operator=(const Playfield&) = delete;

  // A device saw a real ball: restart the ball search countdown and announce activity.
  void mark_playfield_active_from_device_action();

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] BallSearch& ball_search() noexcept { return ball_search_; }
  [[nodiscard]] const BallSearch& ball_search() const noexcept { return ball_search_; }
  [[nodiscard]] uint64_t activity_count() const noexcept { return activity_count_; }

 private:
  std::string name_;
  EventBus* events_;
  BallSearch ball_search_;
  uint64_t activity_count_ = 0;
};

}  // namespace devices
