#pragma once

#include "servo/linux_i2c.hpp"
#include "servo/servo_platform.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace servo {

constexpr uint8_t kPca9685DefaultAddress = 0x40;
constexpr uint32_t kPca9685Channels = 16;
constexpr uint32_t kPca9685MaxValue = 4095;
constexpr uint8_t kPca9685Prescale = 130;  // ~47 Hz from the 25 MHz oscillator
constexpr uint64_t kPca9685SettleMs = 10;

// "address-channel" (address decimal or 0x hex) or a plain channel on the default address.
struct Pca9685Number {
  uint8_t address = kPca9685DefaultAddress;
  uint32_t channel = 0;
};

Pca9685Number parse_pca9685_number(const std::string& number);

// One PCA9685 board. Initialization needs two 10 ms oscillator waits, expressed as deadlines so
// a control loop can drive it without blocking.
class Pca9685 {
 public:
  enum class InitStage : uint8_t {
    Reset = 0,
    Sleeping = 1,
    PllSettling = 2,
    Waking = 3,
    Ready = 4,
  };

  explicit Pca9685(I2cDevice& bus);

  // Performs every step whose deadline has passed and returns the resulting stage.
  InitStage advance(uint64_t now_ms);
  // Blocking variant: runs advance() and calls sleep_fn(ms) for each pending wait.
  void initialize(const std::function<void(uint64_t)>& sleep_fn);

  [[nodiscard]] InitStage stage() const noexcept { return stage_; }
  [[nodiscard]] bool ready() const noexcept { return stage_ == InitStage::Ready; }
  [[nodiscard]] uint64_t deadline_ms() const noexcept { return deadline_ms_; }

  // Writes LEDn_ON = 0, LEDn_OFF = value. Throws ServoError before initialization completes.
  void write_channel(uint32_t channel, uint32_t value);

 private:
  I2cDevice* bus_;
  InitStage stage_ = InitStage::Reset;
  uint64_t deadline_ms_ = 0;
};

class Pca9685Servo final : public ServoPlatformInterface {
 public:
  Pca9685Servo(Pca9685& board, uint32_t channel, ServoCalibration calibration = {150, 600});

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double) override {}
  void set_acceleration_limit(double) override {}

  [[nodiscard]] uint32_t channel() const noexcept { return channel_; }

 private:
  Pca9685* board_;
  uint32_t channel_;
  ServoCalibration calibration_;
};

}  // namespace servo
