#pragma once

#include "devices/playfield.hpp"
#include "devices/scheduler.hpp"
#include "servo/servo_platform.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace devices {

struct ServoDeviceConfig {
  std::string controller;
  std::string number;
  // Calibrated travel; positions in [0, 1] are mapped into [servo_min, servo_max].
  double servo_min = 0.0;
  double servo_max = 1.0;
  double reset_position = 0.5;
  std::vector<std::string> reset_events{"machine_reset_phase_3", "ball_starting", "ball_will_end",
                                        "service_mode_entered"};
  std::map<std::string, double> positions;

  bool include_in_ball_search = true;
  int ball_search_order = 100;
  double ball_search_min = 0.0;
  double ball_search_max = 1.0;
  uint64_t ball_search_wait_ms = 5000;

  double speed_limit = -1.0;
  double acceleration_limit = -1.0;
  bool debug = false;
};

// Moves one servo to named positions. During a ball search it sweeps between the ball search
// limits and returns to the last requested position when the search stops.
class ServoDevice {
 public:
  ServoDevice(std::string name, ServoDeviceConfig cfg, servo::ServoPlatformInterface& hw,
              BallSearch& ball_search, Scheduler& scheduler);
  ~ServoDevice();

  ServoDevice(const ServoDevice&) = delete;
  ServoDevice& operator=(const ServoDevice&) = delete;

  // Applies speed and acceleration limits and moves to the reset position.
  void start();
  void reset();
  void go_to_position(double position);
  void set_speed_limit(double speed);
  void set_acceleration_limit(double acceleration);
  void stop_ball_search();

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const ServoDeviceConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] double position() const noexcept { return position_; }
  [[nodiscard]] bool ball_search_active() const noexcept { return ball_search_started_; }

 private:
  bool ball_search(int phase, int iteration);
  void sweep_to(double position, bool next_is_max);
  void move_hardware(double position);

  std::string name_;
  ServoDeviceConfig cfg_;
  servo::ServoPlatformInterface* hw_;
  BallSearch* ball_search_;
  Scheduler* scheduler_;
  DelayManager delay_;
  uint32_t ball_search_id_ = 0;
  double position_;
  bool ball_search_started_ = false;
};

}  // namespace devices
