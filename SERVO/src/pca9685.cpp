#include "servo/pca9685.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace servo {

namespace {

constexpr uint8_t kRegMode1 = 0x00;
constexpr uint8_t kRegMode2 = 0x01;
constexpr uint8_t kRegPrescale = 0xFE;
constexpr uint8_t kRegLed0OnL = 0x06;

constexpr uint8_t kMode1SleepAllCall = 0x11;
constexpr uint8_t kMode1AllCall = 0x01;
constexpr uint8_t kMode2TotemPole = 0x04;

// stoul alone would accept a sign and wrap values past 32 bits.
uint32_t parse_unsigned(const std::string& text, const std::string& number) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    throw ServoError("Invalid PCA9685 servo number '" + number + "'");
  }
  std::size_t used = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &used, 0);
  } catch (const std::logic_error&) {
    throw ServoError("Invalid PCA9685 servo number '" + number + "'");
  }
  if (used != text.size() || value > UINT32_MAX) {
    throw ServoError("Invalid PCA9685 servo number '" + number + "'");
  }
  return static_cast<uint32_t>(value);
}

}  // namespace

Pca9685Number parse_pca9685_number(const std::string& number) {
  Pca9685Number parsed;
  const auto dash = number.find('-');
  if (dash == std::string::npos) {
    parsed.channel = parse_unsigned(number, number);
  } else {
    const uint32_t address = parse_unsigned(number.substr(0, dash), number);
    if (address > 0x7F) {
      throw ServoBoundsError("PCA9685 address in '" + number + "' is not a 7-bit address");
    }
    parsed.address = static_cast<uint8_t>(address);
    parsed.channel = parse_unsigned(number.substr(dash + 1), number);
  }
  if (parsed.channel >= kPca9685Channels) {
    throw ServoBoundsError("PCA9685 channel in '" + number + "' must be 0..15");
  }
  return parsed;
}

Pca9685::Pca9685(I2cDevice& bus) : bus_(&bus) {}

Pca9685::InitStage Pca9685::advance(uint64_t now_ms) {
  for (;;) {
    switch (stage_) {
      case InitStage::Reset:
        bus_->write_register(kRegMode1, kMode1SleepAllCall);
        stage_ = InitStage::Sleeping;
        break;
      case InitStage::Sleeping:
        // Prescale only latches while the oscillator is asleep.
        bus_->write_register(kRegMode2, kMode2TotemPole);
        bus_->write_register(kRegPrescale, kPca9685Prescale);
        deadline_ms_ = now_ms + kPca9685SettleMs;
        stage_ = InitStage::PllSettling;
        break;
      case InitStage::PllSettling:
        if (now_ms < deadline_ms_) {
          return stage_;
        }
        bus_->write_register(kRegMode1, kMode1AllCall);
        deadline_ms_ = now_ms + kPca9685SettleMs;
        stage_ = InitStage::Waking;
        break;
      case InitStage::Waking:
        if (now_ms < deadline_ms_) {
          return stage_;
        }
        stage_ = InitStage::Ready;
        break;
      case InitStage::Ready:
        return stage_;
    }
  }
}

void Pca9685::initialize(const std::function<void(uint64_t)>& sleep_fn) {
  uint64_t now = 0;
  while (advance(now) != InitStage::Ready) {
    sleep_fn(deadline_ms_ - now);
    now = deadline_ms_;
  }
}

void Pca9685::write_channel(uint32_t channel, uint32_t value) {
  if (stage_ != InitStage::Ready) {
    throw ServoError("PCA9685 is not initialized");
  }
  if (channel >= kPca9685Channels) {
    throw ServoBoundsError("PCA9685 channel " + std::to_string(channel) + " must be 0..15");
  }
  const auto base = static_cast<uint8_t>(kRegLed0OnL + 4 * channel);
  bus_->write_register(base, 0);
  bus_->write_register(static_cast<uint8_t>(base + 1), 0);
  bus_->write_register(static_cast<uint8_t>(base + 2), static_cast<uint8_t>(value & 0xFF));
  bus_->write_register(static_cast<uint8_t>(base + 3), static_cast<uint8_t>(value >> 8));
}

Pca9685Servo::Pca9685Servo(Pca9685& board, uint32_t channel, ServoCalibration calibration)
    : board_(&board), channel_(channel), calibration_(calibration) {
  if (channel_ >= kPca9685Channels) {
    throw ServoBoundsError("PCA9685 channel " + std::to_string(channel_) + " must be 0..15");
  }
  validate_calibration(calibration_, kPca9685MaxValue, "PCA9685");
}

void Pca9685Servo::go_to_position(double position) {
  board_->write_channel(channel_, interpolate_servo_value(position, calibration_));
}

void Pca9685Servo::stop() { board_->write_channel(channel_, 0); }

}  // namespace servo
