#include "servo/pwm_servo.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <iostream>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace servo {

namespace {

constexpr const char* kPwmRoot = "/sys/class/pwm";
constexpr uint64_t kNsPerUs = 1000ULL;

std::string describe(const std::string& message, int err) {
  return err == 0 ? message : message + " (errno=" + std::to_string(err) + ": " + std::strerror(err) + ")";
}

bool retry_later(int err) { return err == EINTR || err == EAGAIN || err == EBUSY || err == ETIMEDOUT; }

// Sysfs attributes take one whole write at offset 0.
int put_value(int fd, const std::string& value) {
  const ssize_t n = ::pwrite(fd, value.data(), value.size(), 0);
  if (n == static_cast<ssize_t>(value.size())) {
    return 0;
  }
  return n < 0 ? errno : EIO;
}

void write_attribute(const std::string& path, const std::string& value, unsigned int retries) {
  unsigned int attempt = 0;
  while (true) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
    const int err = fd < 0 ? errno : put_value(fd, value);
    if (fd >= 0) {
      ::close(fd);
    }
    if (err == 0) {
      return;
    }
    if (attempt++ >= retries || !retry_later(err)) {
      throw PwmError("Writing '" + value + "' to " + path + " failed", err);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2 * attempt));
  }
}

}  // namespace

// Exclusive flock on /tmp/pincore_pwmchip<N>_pwm<M>.lock held while the channel is open, so two
// processes never drive one servo.
class SysfsPwmChannel::ChannelLock {
 public:
  ChannelLock(uint32_t chip, uint32_t channel)
      : path_("/tmp/pincore_pwmchip" + std::to_string(chip) + "_pwm" + std::to_string(channel) +
              ".lock") {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw PwmError("Cannot create PWM lock " + path_, errno);
    }
    if (::flock(fd_, LOCK_EX | LOCK_NB) < 0) {
      const int err = errno;
      ::close(fd_);
      throw PwmError("PWM channel is in use by another process (" + path_ + ")", err);
    }
  }

  ~ChannelLock() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  ChannelLock(const ChannelLock&) = delete;
  ChannelLock& operator=(const ChannelLock&) = delete;

 private:
  std::string path_;
  int fd_ = -1;
};

PwmError::PwmError(const std::string& message, int error_number)
    : std::runtime_error(describe(message, error_number)), error_number_(error_number) {}

int PwmError::error_number() const noexcept { return error_number_; }

SysfsPwmChannel::SysfsPwmChannel(SysfsPwmConfig config) : config_(config) {
  if (config_.period_ns == 0) {
    throw std::invalid_argument("PWM period_ns must be > 0");
  }
  if (config_.duty_cycle_ns > config_.period_ns) {
    throw std::invalid_argument("PWM duty_cycle_ns must not exceed period_ns");
  }
}

SysfsPwmChannel::~SysfsPwmChannel() { close(); }

std::string SysfsPwmChannel::chip_path() const {
  return std::string(kPwmRoot) + "/pwmchip" + std::to_string(config_.chip);
}

std::string SysfsPwmChannel::channel_path() const {
  return chip_path() + "/pwm" + std::to_string(config_.channel);
}

void SysfsPwmChannel::begin() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (enable_fd_ >= 0) {
    return;
  }
  std::unique_ptr<ChannelLock> lock;
  if (config_.use_channel_lock) {
    lock = std::make_unique<ChannelLock>(config_.chip, config_.channel);
  }

  // EBUSY: still exported from an earlier run.
  try {
    write_attribute(chip_path() + "/export", std::to_string(config_.channel), config_.retries);
    exported_by_us_ = true;
  } catch (const PwmError& e) {
    if (e.error_number() != EBUSY) {
      throw;
    }
  }

  // udev may need a moment to create the channel directory and fix its permissions.
  struct stat st {};
  for (unsigned int attempt = 0; ::stat(channel_path().c_str(), &st) != 0; ++attempt) {
    if (attempt >= config_.retries) {
      throw PwmError(channel_path() + " did not appear after export", errno);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
  }

  const std::string base = channel_path() + "/";
  write_attribute(base + "enable", "0", config_.retries);
  write_attribute(base + "polarity", config_.invert_polarity ? "inversed" : "normal", config_.retries);
  write_attribute(base + "period", std::to_string(config_.period_ns), config_.retries);
  write_attribute(base + "duty_cycle", std::to_string(config_.duty_cycle_ns), config_.retries);

  const int duty_fd = ::open((base + "duty_cycle").c_str(), O_WRONLY | O_CLOEXEC);
  if (duty_fd < 0) {
    throw PwmError("Cannot open " + base + "duty_cycle", errno);
  }
  const int enable_fd = ::open((base + "enable").c_str(), O_WRONLY | O_CLOEXEC);
  if (enable_fd < 0) {
    const int err = errno;
    ::close(duty_fd);
    throw PwmError("Cannot open " + base + "enable", err);
  }
  duty_fd_ = duty_fd;
  enable_fd_ = enable_fd;
  lock_ = std::move(lock);
}

void SysfsPwmChannel::close() noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  if (enable_fd_ < 0) {
    return;
  }
  if (const int err = put_value(enable_fd_, "0"); err != 0) {
    std::cerr << "pwm " << channel_path() << ": disable on close failed: " << std::strerror(err) << "\n";
  }
  ::close(enable_fd_);
  ::close(duty_fd_);
  enable_fd_ = -1;
  duty_fd_ = -1;

  if (config_.unexport_on_close && exported_by_us_) {
    try {
      write_attribute(chip_path() + "/unexport", std::to_string(config_.channel), config_.retries);
    } catch (const std::exception& e) {
      std::cerr << "pwm " << channel_path() << ": " << e.what() << "\n";
    }
  }
  exported_by_us_ = false;
  lock_.reset();
}

bool SysfsPwmChannel::is_open() const noexcept {
  std::lock_guard<std::mutex> guard(mutex_);
  return enable_fd_ >= 0;
}

void SysfsPwmChannel::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> guard(mutex_);
  write_open_attribute(enable_fd_, "enable", enabled ? "1" : "0");
}

void SysfsPwmChannel::set_duty_cycle_ns(uint64_t duty_cycle_ns) {
  if (duty_cycle_ns > config_.period_ns) {
    throw std::invalid_argument("PWM duty_cycle_ns must not exceed period_ns");
  }
  std::lock_guard<std::mutex> guard(mutex_);
  write_open_attribute(duty_fd_, "duty_cycle", std::to_string(duty_cycle_ns));
  config_.duty_cycle_ns = duty_cycle_ns;
}

void SysfsPwmChannel::write_open_attribute(int fd, const char* attr, const std::string& value) {
  if (fd < 0) {
    throw PwmError("PWM channel " + channel_path() + " used before begin()");
  }
  unsigned int attempt = 0;
  while (true) {
    const int err = put_value(fd, value);
    if (err == 0) {
      return;
    }
    if (attempt++ >= config_.retries || !retry_later(err)) {
      throw PwmError("Writing '" + value + "' to " + channel_path() + "/" + attr + " failed", err);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2 * attempt));
  }
}

PwmServo::PwmServo(PwmChannel& channel, ServoCalibration calibration)
    : channel_(&channel), calibration_(calibration) {
  const uint64_t period_us = channel_->period_ns() / kNsPerUs;
  validate_calibration(calibration_, static_cast<uint32_t>(period_us), "PWM");
}

void PwmServo::go_to_position(double position) {
  const uint64_t pulse_us = interpolate_servo_value(position, calibration_);
  channel_->set_duty_cycle_ns(pulse_us * kNsPerUs);
  pulse_width_us_ = pulse_us;
  if (!enabled_) {
    channel_->set_enabled(true);
    enabled_ = true;
  }
}

void PwmServo::stop() {
  channel_->set_enabled(false);
  enabled_ = false;
}

}  // namespace servo
