#pragma once

#include "servo/servo_platform.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace servo {

// Servo without hardware for the virtual platform; remembers the last command.
class VirtualServo final : public ServoPlatformInterface {
 public:
  explicit VirtualServo(std::string name) : name_(std::move(name)) {}

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double speed) override;
  void set_acceleration_limit(double acceleration) override;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] double position() const noexcept { return position_; }
  [[nodiscard]] bool stopped() const noexcept { return stopped_; }
  [[nodiscard]] uint64_t move_count() const noexcept { return move_count_; }
  [[nodiscard]] double speed_limit() const noexcept { return speed_limit_; }
  [[nodiscard]] double acceleration_limit() const noexcept { return acceleration_limit_; }

 private:
  std::string name_;
  double position_ = 0.0;
  bool stopped_ = true;
  uint64_t move_count_ = 0;
  double speed_limit_ = -1.0;
  double acceleration_limit_ = -1.0;
};

}  // namespace servo
