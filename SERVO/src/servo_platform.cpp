#include "servo/servo_platform.hpp"

#include <cmath>

namespace servo {

uint32_t interpolate_servo_value(double position, const ServoCalibration& calibration) {
  if (!std::isfinite(position) || position < 0.0 || position > 1.0) {
    throw ServoBoundsError("Servo position " + std::to_string(position) +
                           " is outside [0, 1]");
  }
  const double span = static_cast<double>(calibration.max) - static_cast<double>(calibration.min);
  const double value = static_cast<double>(calibration.min) + position * span;
  return static_cast<uint32_t>(std::llround(value));
}

void validate_calibration(const ServoCalibration& calibration, uint32_t limit,
                          const std::string& backend) {
  if (calibration.min > calibration.max) {
    throw ServoBoundsError(backend + " servo min " + std::to_string(calibration.min) +
                           " is above max " + std::to_string(calibration.max));
  }
  if (calibration.max > limit) {
    throw ServoBoundsError(backend + " servo max " + std::to_string(calibration.max) +
                           " exceeds " + std::to_string(limit));
  }
}

}  // namespace servo
