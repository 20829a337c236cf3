#pragma once

#include "servo/serial_port.hpp"
#include "servo/servo_platform.hpp"

#include <cstdint>
#include <string>

namespace servo {

constexpr uint32_t kFastServoChannels = 8;
constexpr uint32_t kFastServoMaxValue = 255;

// FAST controller servo output: "XO:<channel hex>,<value hex>\r".
class FastServo final : public ServoPlatformInterface {
 public:
  FastServo(SerialLink& link, uint32_t channel, ServoCalibration calibration = {0, 255});

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double) override {}
  void set_acceleration_limit(double) override {}

  [[nodiscard]] uint32_t channel() const noexcept { return channel_; }

 private:
  void send(uint32_t value);

  SerialLink* link_;
  uint32_t channel_;
  ServoCalibration calibration_;
};

std::string fast_servo_command(uint32_t channel, uint32_t value);

}  // namespace servo
