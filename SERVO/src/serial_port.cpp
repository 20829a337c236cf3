#include "servo/serial_port.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <termios.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace servo {

namespace {

std::string format_errno(const std::string& prefix, int err) {
  std::ostringstream oss;
  oss << prefix;
  if (err != 0) {
    oss << " (errno=" << err << ": " << std::strerror(err) << ")";
  }
  return oss.str();
}

speed_t to_speed(uint32_t baud) {
  switch (baud) {
    case 9600:
      return B9600;
    case 19200:
      return B19200;
    case 38400:
      return B38400;
    case 57600:
      return B57600;
    case 115200:
      return B115200;
    case 230400:
      return B230400;
    case 460800:
      return B460800;
    case 921600:
      return B921600;
    default:
      throw std::invalid_argument("Unsupported serial baud rate " + std::to_string(baud));
  }
}

}  // namespace

SerialError::SerialError(const std::string& message, int error_number)
    : std::runtime_error(format_errno(message, error_number)), error_number_(error_number) {}

int SerialError::error_number() const noexcept { return error_number_; }

std::vector<uint8_t> to_bytes(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

LinuxSerialPort::LinuxSerialPort(SerialPortConfig config) : config_(std::move(config)), fd_(-1) {
  if (config_.device.empty()) {
    throw std::invalid_argument("Serial device path must not be empty");
  }
  (void)to_speed(config_.baud);
}

LinuxSerialPort::~LinuxSerialPort() { close(); }

void LinuxSerialPort::open() {
  std::scoped_lock lock(mutex_);
  if (fd_ >= 0) {
    return;
  }

  const int fd = ::open(config_.device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd < 0) {
    throw SerialError("Failed to open serial port '" + config_.device + "'", errno);
  }

  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) {
    const int err = errno;
    ::close(fd);
    throw SerialError("tcgetattr failed on '" + config_.device + "'", err);
  }
  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CRTSCTS;
  const speed_t speed = to_speed(config_.baud);
  ::cfsetispeed(&tio, speed);
  ::cfsetospeed(&tio, speed);
  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    const int err = errno;
    ::close(fd);
    throw SerialError("tcsetattr failed on '" + config_.device + "'", err);
  }
  fd_ = fd;
}

void LinuxSerialPort::close() noexcept {
  std::scoped_lock lock(mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool LinuxSerialPort::is_open() const noexcept {
  std::scoped_lock lock(mutex_);
  return fd_ >= 0;
}

void LinuxSerialPort::write(const std::vector<uint8_t>& bytes) {
  std::scoped_lock lock(mutex_);
  if (fd_ < 0) {
    throw SerialError("Serial port '" + config_.device + "' is not open");
  }

  std::size_t offset = 0;
  unsigned int attempt = 0;
  while (offset < bytes.size()) {
    const ssize_t n = ::write(fd_, bytes.data() + offset, bytes.size() - offset);
    if (n > 0) {
      offset += static_cast<std::size_t>(n);
      continue;
    }
    const int err = (n < 0) ? errno : EIO;
    const bool transient = (err == EINTR || err == EAGAIN);
    if (!transient || attempt >= config_.retries) {
      throw SerialError("Write to '" + config_.device + "' failed", err);
    }
    ++attempt;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

}  // namespace servo
