#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace servo {

class SerialError : public std::runtime_error {
 public:
  explicit SerialError(const std::string& message, int error_number = 0);
  [[nodiscard]] int error_number() const noexcept;

 private:
  int error_number_;
};

// Outbound byte stream to a serial servo controller.
class SerialLink {
 public:
  virtual ~SerialLink() = default;

  virtual void open() = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  virtual void write(const std::vector<uint8_t>& bytes) = 0;
};

struct SerialPortConfig {
  std::string device = "/dev/ttyACM0";
  uint32_t baud = 115200;
  unsigned int retries = 2;
};

// Raw 8N1 termios port.
class LinuxSerialPort : public SerialLink {
 public:
  explicit LinuxSerialPort(SerialPortConfig config);
  ~LinuxSerialPort();

  LinuxSerialPort(const LinuxSerialPort&) = delete;
  LinuxSerialPort& operator=(const LinuxSerialPort&) = delete;
  LinuxSerialPort(LinuxSerialPort&&) = delete;
  LinuxSerialPort& operator=(LinuxSerialPort&&) = delete;

  void open() override;
  void close() noexcept override;
  [[nodiscard]] bool is_open() const noexcept override;

  void write(const std::vector<uint8_t>& bytes) override;

  [[nodiscard]] const std::string& device() const noexcept { return config_.device; }

 private:
  SerialPortConfig config_;
  int fd_;
  mutable std::mutex mutex_;
};

std::vector<uint8_t> to_bytes(const std::string& text);

}  // namespace servo
