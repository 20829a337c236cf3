#include "servo/maestro_servo.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace servo {

namespace {

constexpr uint8_t kPololuProtocolStart = 0xAA;
constexpr uint32_t kMaestroMaxValue = 0x3FFF;  // 14 bits across two 7-bit bytes

uint32_t to_limit_value(double value, const char* what) {
  if (!std::isfinite(value) || std::llround(value) > static_cast<long long>(kMaestroMaxValue)) {
    throw ServoBoundsError(std::string("Maestro ") + what + " " + std::to_string(value) +
                           " does not fit 14 bits");
  }
  return static_cast<uint32_t>(std::llround(value));
}

}  // namespace

MaestroServo::MaestroServo(SerialLink& link, uint32_t channel, MaestroServoConfig config)
    : link_(&link), channel_(channel), config_(config) {
  const uint32_t count = config_.channel_count;
  if (count != 6 && count != 12 && count != 18 && count != 24) {
    throw ServoBoundsError("Maestro channel_count must be 6, 12, 18 or 24, got " +
                           std::to_string(count));
  }
  if (channel_ >= count) {
    throw ServoBoundsError("Maestro channel " + std::to_string(channel_) + " outside 0.." +
                           std::to_string(count - 1));
  }
  validate_calibration(config_.calibration, kMaestroMaxValue, "Maestro");
}

void MaestroServo::go_to_position(double position) {
  send(kMaestroSetTarget, interpolate_servo_value(position, config_.calibration));
}

// Target 0 tells the Maestro to stop sending pulses on the channel.
void MaestroServo::stop() { send(kMaestroSetTarget, 0); }

void MaestroServo::set_speed_limit(double speed) {
  if (speed < 0.0) {
    return;
  }
  send(kMaestroSetSpeed, to_limit_value(speed, "speed"));
}

void MaestroServo::set_acceleration_limit(double acceleration) {
  if (acceleration < 0.0) {
    return;
  }
  send(kMaestroSetAcceleration, to_limit_value(acceleration, "acceleration"));
}

void MaestroServo::send(uint8_t command, uint32_t value) {
  const std::vector<uint8_t> bytes{kPololuProtocolStart,
                                   kMaestroDeviceNumber,
                                   command,
                                   static_cast<uint8_t>(channel_),
                                   static_cast<uint8_t>(value & 0x7F),
                                   static_cast<uint8_t>((value >> 7) & 0x7F)};
  link_->write(bytes);
}

}  // namespace servo
