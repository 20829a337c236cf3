#pragma once

#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>

namespace servo {

class I2cError : public std::runtime_error {
 public:
  explicit I2cError(const std::string& message, int error_number = 0);
  [[nodiscard]] int error_number() const noexcept { return error_number_; }

 private:
  int error_number_;
};

// Register-write side of an I2C target; servo controllers never read back.
class I2cDevice {
 public:
  virtual ~I2cDevice() = default;

  virtual void open() = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual bool is_open() const noexcept = 0;

  virtual void write_register(uint8_t reg, uint8_t value) = 0;
};

// One target on /dev/i2c-N, addressed once with I2C_SLAVE at open().
class LinuxI2c final : public I2cDevice {
 public:
  LinuxI2c(std::string bus_path, uint8_t address, unsigned int retries = 2);
  ~LinuxI2c() override;

  LinuxI2c(const LinuxI2c&) = delete;
  LinuxI2c& operator=(const LinuxI2c&) = delete;

  void open() override;
  void close() noexcept override;
  [[nodiscard]] bool is_open() const noexcept override;

  void write_register(uint8_t reg, uint8_t value) override;

  [[nodiscard]] const std::string& bus_path() const noexcept { return bus_path_; }
  [[nodiscard]] uint8_t address() const noexcept { return address_; }

 private:
  [[nodiscard]] std::string target() const;

  std::string bus_path_;
  uint8_t address_;
  unsigned int retries_;
  int fd_ = -1;
  mutable std::mutex mutex_;
};

}  // namespace servo
