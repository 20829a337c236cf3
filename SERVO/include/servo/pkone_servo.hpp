#pragma once

#include "servo/serial_port.hpp"
#include "servo/servo_platform.hpp"

#include <cstdint>
#include <string>

namespace servo {

constexpr uint32_t kPkoneServoMaxValue = 250;
constexpr uint32_t kPkoneMaxBoards = 8;

struct PkoneServoNumber {
  uint32_t board = 0;
  uint32_t servo = 0;
};

// Servos on an extension board are numbered directly after its coils.
struct PkoneExtensionConfig {
  uint32_t coil_count = 10;
  uint32_t servo_count = 4;
};

// "board-servo"; throws ServoBoundsError when the servo is not on the extension.
PkoneServoNumber parse_pkone_servo_number(const std::string& number,
                                          const PkoneExtensionConfig& extension);

// PKONE extension servo: "PWS<board><servo 2 digits><value 3 digits>E".
class PkoneServo final : public ServoPlatformInterface {
 public:
  PkoneServo(SerialLink& link, PkoneServoNumber number, ServoCalibration calibration = {0, 250});

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double) override {}
  void set_acceleration_limit(double) override {}

  [[nodiscard]] const PkoneServoNumber& number() const noexcept { return number_; }

 private:
  SerialLink* link_;
  PkoneServoNumber number_;
  ServoCalibration calibration_;
};

std::string pkone_servo_command(const PkoneServoNumber& number, uint32_t value);

}  // namespace servo
