#pragma once

#include "servo/servo_platform.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace servo {

class PwmError : public std::runtime_error {
 public:
  explicit PwmError(const std::string& message, int error_number = 0);
  [[nodiscard]] int error_number() const noexcept;

 private:
  int error_number_;
};

// One PWM output with a fixed period.
class PwmChannel {
 public:
  virtual ~PwmChannel() = default;

  virtual void begin() = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  virtual void set_enabled(bool enabled) = 0;
  virtual void set_duty_cycle_ns(uint64_t duty_cycle_ns) = 0;
  [[nodiscard]] virtual uint64_t period_ns() const noexcept = 0;
};

struct SysfsPwmConfig {
  uint32_t chip = 0;
  uint32_t channel = 0;
  uint64_t period_ns = 20'000'000ULL;  // 50 Hz
  uint64_t duty_cycle_ns = 1'500'000ULL;
  bool invert_polarity = false;
  bool unexport_on_close = false;
  bool use_channel_lock = true;
  unsigned int retries = 3;
};

// /sys/class/pwm/pwmchipN/pwmM. begin() exports and programs the channel but leaves it disabled
// until the first position is written; duty_cycle and enable stay open until close().
class SysfsPwmChannel final : public PwmChannel {
 public:
  explicit SysfsPwmChannel(SysfsPwmConfig config = {});
  ~SysfsPwmChannel() override;

  SysfsPwmChannel(const SysfsPwmChannel&) = delete;
  SysfsPwmChannel& operator=(const SysfsPwmChannel&) = delete;
  SysfsPwmChannel(SysfsPwmChannel&&) = delete;
  SysfsPwmChannel& operator=(SysfsPwmChannel&&) = delete;

  void begin() override;
  void close() noexcept override;
  [[nodiscard]] bool is_open() const noexcept override;

  void set_enabled(bool enabled) override;
  void set_duty_cycle_ns(uint64_t duty_cycle_ns) override;
  [[nodiscard]] uint64_t period_ns() const noexcept override { return config_.period_ns; }

  [[nodiscard]] std::string channel_path() const;

 private:
  class ChannelLock;

  void write_open_attribute(int fd, const char* attr, const std::string& value);
  [[nodiscard]] std::string chip_path() const;

  SysfsPwmConfig config_;
  std::unique_ptr<ChannelLock> lock_;
  int duty_fd_ = -1;
  int enable_fd_ = -1;
  bool exported_by_us_ = false;
  mutable std::mutex mutex_;
};

// Servo on a PWM channel; calibration is the pulse width in microseconds.
class PwmServo final : public ServoPlatformInterface {
 public:
  PwmServo(PwmChannel& channel, ServoCalibration calibration = {1000, 2000});

  void go_to_position(double position) override;
  void stop() override;
  void set_speed_limit(double) override {}
  void set_acceleration_limit(double) override {}

  [[nodiscard]] uint64_t pulse_width_us() const noexcept { return pulse_width_us_; }
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }

 private:
  PwmChannel* channel_;
  ServoCalibration calibration_;
  uint64_t pulse_width_us_ = 0;
  bool enabled_ = false;
};

}  // namespace servo
