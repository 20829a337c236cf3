#include "servo/pkone_servo.hpp"

#include <cstdio>
#include <exception>

namespace servo {

PkoneServoNumber parse_pkone_servo_number(const std::string& number,
                                          const PkoneExtensionConfig& extension) {
  const auto dash = number.find('-');
  if (dash == std::string::npos) {
    throw ServoError("Invalid PKONE servo number '" + number + "' (expected board-servo)");
  }
  PkoneServoNumber parsed;
  try {
    std::size_t used_board = 0;
    std::size_t used_servo = 0;
    const std::string board = number.substr(0, dash);
    const std::string servo = number.substr(dash + 1);
    parsed.board = static_cast<uint32_t>(std::stoul(board, &used_board));
    parsed.servo = static_cast<uint32_t>(std::stoul(servo, &used_servo));
    if (used_board != board.size() || used_servo != servo.size()) {
      throw ServoError("Invalid PKONE servo number '" + number + "'");
    }
  } catch (const std::logic_error&) {
    throw ServoError("Invalid PKONE servo number '" + number + "'");
  }

  if (parsed.board >= kPkoneMaxBoards) {
    throw ServoBoundsError("PKONE extension " + std::to_string(parsed.board) +
                           " does not exist for servo " + number);
  }
  const uint32_t first = extension.coil_count + 1;
  const uint32_t last = extension.coil_count + extension.servo_count;
  if (parsed.servo < first || parsed.servo > last) {
    throw ServoBoundsError("PKONE extension " + std::to_string(parsed.board) + " only has " +
                           std::to_string(extension.servo_count) + " servos (" +
                           std::to_string(first) + " - " + std::to_string(last) +
                           "). Servo: " + number);
  }
  return parsed;
}

std::string pkone_servo_command(const PkoneServoNumber& number, uint32_t value) {
  char buffer[24] = {};
  std::snprintf(buffer, sizeof(buffer), "PWS%u%02u%03uE", number.board, number.servo, value);
  return buffer;
}

PkoneServo::PkoneServo(SerialLink& link, PkoneServoNumber number, ServoCalibration calibration)
    : link_(&link), number_(number), calibration_(calibration) {
  if (number_.board >= kPkoneMaxBoards || number_.servo > 99) {
    throw ServoBoundsError("PKONE servo " + std::to_string(number_.board) + "-" +
                           std::to_string(number_.servo) + " cannot be addressed");
  }
  validate_calibration(calibration_, kPkoneServoMaxValue, "PKONE");
}

void PkoneServo::go_to_position(double position) {
  link_->write(to_bytes(pkone_servo_command(number_, interpolate_servo_value(position, calibration_))));
}

void PkoneServo::stop() { link_->write(to_bytes(pkone_servo_command(number_, 0))); }

}  // namespace servo
