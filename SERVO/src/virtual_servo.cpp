#include "servo/virtual_servo.hpp"

#include <cmath>

namespace servo {

void VirtualServo::go_to_position(double position) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    throw ServoBoundsError("Servo '" + name_ + "': position " + std::to_string(position) +
                           " is outside [0, 1]");
  }
  position_ = position;
  stopped_ = false;
  ++move_count_;
}

void VirtualServo::stop() { stopped_ = true; }

void VirtualServo::set_speed_limit(double speed) {
  if (speed >= 0.0) {
    speed_limit_ = speed;
  }
}

void VirtualServo::set_acceleration_limit(double acceleration) {
  if (acceleration >= 0.0) {
    acceleration_limit_ = acceleration;
  }
}

}  // namespace servo
