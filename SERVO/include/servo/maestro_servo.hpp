#pragma once

#include "servo/serial_port.hpp"
#include "servo/servo_platform.hpp"

#include <cstdint>

namespace servo {

constexpr uint8_t kMaestroDeviceNumber = 12;
constexpr uint8_t kMaestroSetTarget = 0x04;
constexpr uint8_t kMaestroSetSpeed = 0x07;
constexpr uint8_t kMaestroSetAcceleration = 0x09;

struct MaestroServoConfig {
  uint32_t channel_count = 24;  // Mini Maestro 6, 12, 18 or 24
  ServoCalibration calibration{3000, 9000};  // quarter-microseconds
};

// Pololu Maestro, Pololu protocol: 0xAA <device> <command> <channel> <lsb7> <msb7>.
class MaestroServo final : public ServoPlatformInterface {
 public:
  MaestroServo(SerialLink& link, uint32_t channel, MaestroServoConfig config = {});

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double speed) override;
  void set_acceleration_limit(double acceleration) override;

  [[nodiscard]] uint32_t channel() const noexcept { return channel_; }

 private:
  void send(uint8_t command, uint32_t value);

  SerialLink* link_;
  uint32_t channel_;
  MaestroServoConfig config_;
};

}  // namespace servo
