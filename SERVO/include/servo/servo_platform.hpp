#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace servo {

class ServoError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Position outside [0, 1] or channel outside what the backend can address.
class ServoBoundsError : public std::out_of_range {
 public:
  using std::out_of_range::out_of_range;
};

// Raw output range of one servo in the backend's native unit.
struct ServoCalibration {
  uint32_t min = 0;
  uint32_t max = 0;
};

// One servo output bound to a channel of some controller. Commands are fire-and-forget.
class ServoPlatformInterface {
 public:
  virtual ~ServoPlatformInterface() = default;

  // position in [0, 1], mapped linearly onto the calibration range.
  virtual void go_to_position(double position) = 0;
  virtual void stop() = 0;

  // Negative values leave the current limit unchanged.
  virtual void set_speed_limit(double speed) = 0;
  virtual void set_acceleration_limit(double acceleration) = 0;
};

// round(min + position * (max - min)); throws ServoBoundsError for position outside [0, 1].
uint32_t interpolate_servo_value(double position, const ServoCalibration& calibration);

// Throws ServoBoundsError unless min <= max <= limit.
void validate_calibration(const ServoCalibration& calibration, uint32_t limit,
                          const std::string& backend);

}  // namespace servo
