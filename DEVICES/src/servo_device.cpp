#include "devices/servo_device.hpp"

#include "rules/platform.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace devices {

namespace {

void check_unit(double value, const std::string& what, const std::string& name) {
  if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
    throw rules::ConfigError("Servo '" + name + "': " + what + " must be within [0, 1]");
  }
}

}  // namespace

ServoDevice::ServoDevice(std::string name, ServoDeviceConfig cfg, servo::ServoPlatformInterface& hw,
                         BallSearch& ball_search, Scheduler& scheduler)
    : name_(std::move(name)),
      cfg_(std::move(cfg)),
      hw_(&hw),
      ball_search_(&ball_search),
      scheduler_(&scheduler),
      delay_(scheduler),
      position_(cfg_.reset_position) {
  check_unit(cfg_.servo_min, "servo_min", name_);
  check_unit(cfg_.servo_max, "servo_max", name_);
  check_unit(cfg_.reset_position, "reset_position", name_);
  check_unit(cfg_.ball_search_min, "ball_search_min", name_);
  check_unit(cfg_.ball_search_max, "ball_search_max", name_);
  for (const auto& entry : cfg_.positions) {
    check_unit(entry.second, "position for '" + entry.first + "'", name_);
  }

  if (cfg_.include_in_ball_search) {
    ball_search_id_ = ball_search_->register_callback(
        cfg_.ball_search_order,
        [this](int phase, int iteration) { return this->ball_search(phase, iteration); }, name_);
  }
}

ServoDevice::~ServoDevice() {
  if (ball_search_id_ != 0) {
    ball_search_->unregister(ball_search_id_);
  }
}

void ServoDevice::start() {
  set_speed_limit(cfg_.speed_limit);
  set_acceleration_limit(cfg_.acceleration_limit);
  reset();
}

void ServoDevice::reset() { go_to_position(cfg_.reset_position); }

void ServoDevice::go_to_position(double position) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    throw servo::ServoBoundsError("Servo '" + name_ + "': position " + std::to_string(position) +
                                  " is outside [0, 1]");
  }
  position_ = position;
  // The sweep owns the hardware until the search stops.
  if (!ball_search_started_) {
    move_hardware(position);
  }
}

void ServoDevice::set_speed_limit(double speed) { hw_->set_speed_limit(speed); }

void ServoDevice::set_acceleration_limit(double acceleration) {
  hw_->set_acceleration_limit(acceleration);
}

bool ServoDevice::ball_search(int phase, int iteration) {
  (void)phase;
  (void)iteration;
  ball_search_started_ = true;
  sweep_to(cfg_.ball_search_min, true);
  return true;
}

void ServoDevice::sweep_to(double position, bool next_is_max) {
  move_hardware(position);
  const double next = next_is_max ? cfg_.ball_search_max : cfg_.ball_search_min;
  delay_.reset("ball_search", cfg_.ball_search_wait_ms,
               [this, next, next_is_max]() { sweep_to(next, !next_is_max); });
}

void ServoDevice::stop_ball_search() {
  delay_.remove("ball_search");
  if (!ball_search_started_) {
    return;
  }
  ball_search_started_ = false;
  move_hardware(position_);
}

void ServoDevice::move_hardware(double position) {
  const double mapped = cfg_.servo_min + position * (cfg_.servo_max - cfg_.servo_min);
  if (cfg_.debug) {
    std::cout << "[" << scheduler_->now_ms() << "] servo " << name_ << ": position " << position
              << " -> " << mapped << "\n";
  }
  hw_->go_to_position(mapped);
}

}  // namespace devices
