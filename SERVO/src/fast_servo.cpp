#include "servo/fast_servo.hpp"

#include <cstdio>

namespace servo {

std::string fast_servo_command(uint32_t channel, uint32_t value) {
  char buffer[16] = {};
  std::snprintf(buffer, sizeof(buffer), "XO:%02X,%02X\r", channel, value);
  return buffer;
}

FastServo::FastServo(SerialLink& link, uint32_t channel, ServoCalibration calibration)
    : link_(&link), channel_(channel), calibration_(calibration) {
  if (channel_ >= kFastServoChannels) {
    throw ServoBoundsError("FAST servo channel " + std::to_string(channel_) + " must be 0..7");
  }
  validate_calibration(calibration_, kFastServoMaxValue, "FAST");
}

void FastServo::go_to_position(double position) {
  send(interpolate_servo_value(position, calibration_));
}

void FastServo::stop() { send(0); }

void FastServo::send(uint32_t value) { link_->write(to_bytes(fast_servo_command(channel_, value))); }

}  // namespace servo
