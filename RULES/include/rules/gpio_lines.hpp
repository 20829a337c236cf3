#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rules {

class GpioError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Bank of output lines driving coil transistors. Values are indexed like the line list.
class GpioLinesOut {
 public:
  virtual ~GpioLinesOut() = default;
  virtual void open(const std::string& chip_path, const std::vector<uint32_t>& lines) = 0;
  virtual void close() noexcept = 0;
  virtual void set_values(const std::vector<uint8_t>& values) = 0;
  [[nodiscard]] virtual std::vector<uint8_t> values() const = 0;
};

// Bank of input lines reading switch levels (1 = line high).
class GpioLinesIn {
 public:
  virtual ~GpioLinesIn() = default;
  virtual void open(const std::string& chip_path, const std::vector<uint32_t>& lines) = 0;
  virtual void close() noexcept = 0;
  [[nodiscard]] virtual std::vector<uint8_t> read_values() = 0;
};

class SimGpioLinesOut final : public GpioLinesOut {
 public:
  void open(const std::string& chip_path, const std::vector<uint32_t>& lines) override;
  void close() noexcept override;
  void set_values(const std::vector<uint8_t>& values) override;
  [[nodiscard]] std::vector<uint8_t> values() const override;
  [[nodiscard]] uint64_t write_count() const noexcept { return write_count_; }

 private:
  bool open_ = false;
  std::string chip_path_;
  std::vector<uint32_t> lines_;
  std::vector<uint8_t> values_;
  uint64_t write_count_ = 0;
};

class SimGpioLinesIn final : public GpioLinesIn {
 public:
  void open(const std::string& chip_path, const std::vector<uint32_t>& lines) override;
  void close() noexcept override;
  [[nodiscard]] std::vector<uint8_t> read_values() override;
  void set_value(std::size_t index, bool high);

 private:
  bool open_ = false;
  std::string chip_path_;
  std::vector<uint32_t> lines_;
  std::vector<uint8_t> values_;
};

std::unique_ptr<GpioLinesOut> make_hardware_lines_out();
std::unique_ptr<GpioLinesIn> make_hardware_lines_in();

}  // namespace rules
