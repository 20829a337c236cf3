#include "servo/linux_i2c.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <iomanip>
#include <linux/i2c-dev.h>
#include <sstream>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace servo {

namespace {

constexpr auto kRetryBackoff = std::chrono::milliseconds(2);

std::string with_errno(const std::string& message, int err) {
  if (err == 0) {
    return message;
  }
  return message + " (errno=" + std::to_string(err) + ": " + std::strerror(err) + ")";
}

// Bus arbitration loss and a busy adapter clear up on their own.
bool transient(int err) { return err == EAGAIN || err == EINTR || err == EBUSY || err == ETIMEDOUT; }

}  // namespace

I2cError::I2cError(const std::string& message, int error_number)
    : std::runtime_error(with_errno(message, error_number)), error_number_(error_number) {}

LinuxI2c::LinuxI2c(std::string bus_path, uint8_t address, unsigned int retries)
    : bus_path_(std::move(bus_path)), address_(address), retries_(retries) {
  if (bus_path_.empty()) {
    throw std::invalid_argument("I2C bus path must not be empty");
  }
  if (address_ < 0x03 || address_ > 0x77) {
    throw std::invalid_argument("I2C target " + target() + " is outside the 7-bit range 0x03..0x77");
  }
}

LinuxI2c::~LinuxI2c() { close(); }

std::string LinuxI2c::target() const {
  std::ostringstream oss;
  oss << bus_path_ << "@0x" << std::hex << std::setw(2) << std::setfill('0')
      << static_cast<unsigned>(address_);
  return oss.str();
}

void LinuxI2c::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ >= 0) {
    return;
  }
  const int fd = ::open(bus_path_.c_str(), O_RDWR | O_CLOEXEC);
  if (fd < 0) {
    throw I2cError("Cannot open " + bus_path_, errno);
  }
  if (::ioctl(fd, I2C_SLAVE, static_cast<unsigned long>(address_)) < 0) {
    const int err = errno;
    ::close(fd);
    throw I2cError("Cannot select I2C target " + target(), err);
  }
  fd_ = fd;
}

void LinuxI2c::close() noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    return;
  }
  ::close(fd_);
  fd_ = -1;
}

bool LinuxI2c::is_open() const noexcept {
  std::lock_guard<std::mutex> lock(mutex_);
  return fd_ >= 0;
}

void LinuxI2c::write_register(uint8_t reg, uint8_t value) {
  const std::array<uint8_t, 2> frame{reg, value};

  std::lock_guard<std::mutex> lock(mutex_);
  if (fd_ < 0) {
    throw I2cError("I2C target " + target() + " written before open()");
  }
  unsigned int attempt = 0;
  while (true) {
    const ssize_t n = ::write(fd_, frame.data(), frame.size());
    if (n == static_cast<ssize_t>(frame.size())) {
      return;
    }
    // A short write means the target NAKed part of the frame.
    const int err = n < 0 ? errno : EIO;
    if (attempt++ >= retries_ || !transient(err)) {
      std::ostringstream what;
      what << "Write of register 0x" << std::hex << static_cast<unsigned>(reg) << " to " << target()
           << " failed";
      throw I2cError(what.str(), err);
    }
    std::this_thread::sleep_for(kRetryBackoff);
  }
}

}  // namespace servo
