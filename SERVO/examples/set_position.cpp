#include "servo/linux_i2c.hpp"
#include "servo/pca9685.hpp"
#include "servo/pwm_servo.hpp"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

// Usage: set_position pwm <chip> <channel> <position>
//        set_position pca9685 <i2c bus> <address-channel> <position>
int main(int argc, char** argv) {
  if (argc != 5) {
    std::cerr << "usage: " << argv[0] << " pwm|pca9685 <chip|bus> <channel|number> <position>\n";
    return EXIT_FAILURE;
  }
  try {
    const std::string backend = argv[1];
    const double position = std::stod(argv[4]);

    if (backend == "pwm") {
      servo::SysfsPwmConfig cfg;
      cfg.chip = static_cast<uint32_t>(std::stoul(argv[2]));
      cfg.channel = static_cast<uint32_t>(std::stoul(argv[3]));
      servo::SysfsPwmChannel channel(cfg);
      channel.begin();
      servo::PwmServo pwm_servo(channel);
      pwm_servo.go_to_position(position);
      std::cout << "Servo at " << position << " -> pulse " << pwm_servo.pulse_width_us() << " us"
                << std::endl;
      std::this_thread::sleep_for(std::chrono::seconds(1));
      channel.close();
    } else if (backend == "pca9685") {
      const servo::Pca9685Number number = servo::parse_pca9685_number(argv[3]);
      servo::LinuxI2c bus(argv[2], number.address);
      bus.open();
      servo::Pca9685 board(bus);
      board.initialize([](uint64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); });
      servo::Pca9685Servo pca_servo(board, number.channel);
      pca_servo.go_to_position(position);
      std::cout << "PCA9685 channel " << number.channel << " at " << position << std::endl;
    } else {
      std::cerr << "Unknown backend '" << backend << "'\n";
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}
