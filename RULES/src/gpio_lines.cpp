#include "rules/gpio_lines.hpp"

#include <cstring>
#include <string>
#include <utility>

#if defined(RULES_HAVE_LIBGPIOD) && (RULES_HAVE_LIBGPIOD == 1)
#include <errno.h>
#include <gpiod.h>
#endif

namespace rules {

namespace {

#if defined(RULES_HAVE_LIBGPIOD) && (RULES_HAVE_LIBGPIOD == 1)
[[noreturn]] void throw_gpiod(const std::string& call, const std::string& bank, int err) {
  throw GpioError(call + " failed for " + bank + " lines (errno=" + std::to_string(err) + ": " +
                  std::strerror(err) + ")");
}

// One bulk request on one chip; shared by the coil and switch banks. libgpiod v1 caps a bulk
// request at GPIOD_LINE_BULK_MAX_LINES.
class LibgpiodBank {
 public:
  explicit LibgpiodBank(const char* bank) : bank_(bank) {}
  ~LibgpiodBank() { release(); }

  LibgpiodBank(const LibgpiodBank&) = delete;
  LibgpiodBank& operator=(const LibgpiodBank&) = delete;

  void acquire(const std::string& chip_path, const std::vector<uint32_t>& lines) {
    release();
    if (lines.empty() || lines.size() > GPIOD_LINE_BULK_MAX_LINES) {
      throw GpioError(std::string(bank_) + " bank needs 1.." + std::to_string(GPIOD_LINE_BULK_MAX_LINES) +
                      " lines, got " + std::to_string(lines.size()));
    }
    chip_ = ::gpiod_chip_open(chip_path.c_str());
    if (chip_ == nullptr) {
      throw_gpiod("gpiod_chip_open(" + chip_path + ")", bank_, errno);
    }
    std::vector<unsigned int> offsets(lines.begin(), lines.end());
    if (::gpiod_chip_get_lines(chip_, offsets.data(), static_cast<unsigned int>(offsets.size()), &bulk_) < 0) {
      const int err = errno;
      ::gpiod_chip_close(chip_);
      chip_ = nullptr;
      throw_gpiod("gpiod_chip_get_lines", bank_, err);
    }
    count_ = lines.size();
  }

  // Called after a successful gpiod_line_request_bulk_*.
  void mark_requested() noexcept { requested_ = true; }

  void release() noexcept {
    if (requested_) {
      ::gpiod_line_release_bulk(&bulk_);
      requested_ = false;
    }
    if (chip_ != nullptr) {
      ::gpiod_chip_close(chip_);
      chip_ = nullptr;
    }
    std::memset(&bulk_, 0, sizeof(bulk_));
    count_ = 0;
  }

  void require_requested() const {
    if (!requested_) {
      throw GpioError(std::string(bank_) + " lines used before open()");
    }
  }

  [[nodiscard]] gpiod_line_bulk* bulk() noexcept { return &bulk_; }
  [[nodiscard]] std::size_t size() const noexcept { return count_; }
  [[nodiscard]] const char* name() const noexcept { return bank_; }

 private:
  const char* bank_;
  gpiod_chip* chip_ = nullptr;
  gpiod_line_bulk bulk_{};
  std::size_t count_ = 0;
  bool requested_ = false;
};

class LibgpiodLinesOut final : public GpioLinesOut {
 public:
  void open(const std::string& chip_path, const std::vector<uint32_t>& lines) override {
    bank_.acquire(chip_path, lines);
    // Coils start de-energized.
    std::vector<int> low(lines.size(), 0);
    if (::gpiod_line_request_bulk_output(bank_.bulk(), "pincore-coils", low.data()) < 0) {
      const int err = errno;
      bank_.release();
      throw_gpiod("gpiod_line_request_bulk_output", bank_.name(), err);
    }
    bank_.mark_requested();
    last_.assign(lines.size(), 0);
  }

  void close() noexcept override { bank_.release(); }

  void set_values(const std::vector<uint8_t>& values) override {
    bank_.require_requested();
    if (values.size() != bank_.size()) {
      throw GpioError("coil value count " + std::to_string(values.size()) + " does not match " +
                      std::to_string(bank_.size()) + " lines");
    }
    std::vector<int> levels(values.begin(), values.end());
    if (::gpiod_line_set_value_bulk(bank_.bulk(), levels.data()) < 0) {
      throw_gpiod("gpiod_line_set_value_bulk", bank_.name(), errno);
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
      last_[i] = values[i] != 0 ? 1U : 0U;
    }
  }

  [[nodiscard]] std::vector<uint8_t> values() const override { return last_; }

 private:
  LibgpiodBank bank_{"coil"};
  std::vector<uint8_t> last_;
};

class LibgpiodLinesIn final : public GpioLinesIn {
 public:
  void open(const std::string& chip_path, const std::vector<uint32_t>& lines) override {
    bank_.acquire(chip_path, lines);
    if (::gpiod_line_request_bulk_input(bank_.bulk(), "pincore-switches") < 0) {
      const int err = errno;
      bank_.release();
      throw_gpiod("gpiod_line_request_bulk_input", bank_.name(), err);
    }
    bank_.mark_requested();
  }

  void close() noexcept override { bank_.release(); }

  [[nodiscard]] std::vector<uint8_t> read_values() override {
    bank_.require_requested();
    std::vector<int> levels(bank_.size(), 0);
    if (::gpiod_line_get_value_bulk(bank_.bulk(), levels.data()) < 0) {
      throw_gpiod("gpiod_line_get_value_bulk", bank_.name(), errno);
    }
    std::vector<uint8_t> out;
    out.reserve(levels.size());
    for (const int level : levels) {
      out.push_back(level != 0 ? 1U : 0U);
    }
    return out;
  }

 private:
  LibgpiodBank bank_{"switch"};
};
#endif

}  // namespace

void SimGpioLinesOut::open(const std::string& chip_path, const std::vector<uint32_t>& lines) {
  chip_path_ = chip_path;
  lines_ = lines;
  values_.assign(lines.size(), 0);
  write_count_ = 0;
  open_ = true;
}

void SimGpioLinesOut::close() noexcept { open_ = false; }

void SimGpioLinesOut::set_values(const std::vector<uint8_t>& values) {
  if (!open_) {
    throw GpioError("sim coil GPIO lines not open");
  }
  if (values.size() != values_.size()) {
    throw GpioError("sim coil GPIO value count mismatch");
  }
  for (std::size_t i = 0; i < values.size(); ++i) {
    values_[i] = values[i] ? 1U : 0U;
  }
  ++write_count_;
}

std::vector<uint8_t> SimGpioLinesOut::values() const { return values_; }

void SimGpioLinesIn::open(const std::string& chip_path, const std::vector<uint32_t>& lines) {
  chip_path_ = chip_path;
  lines_ = lines;
  values_.assign(lines.size(), 0);
  open_ = true;
}

void SimGpioLinesIn::close() noexcept { open_ = false; }

std::vector<uint8_t> SimGpioLinesIn::read_values() {
  if (!open_) {
    throw GpioError("sim switch GPIO lines not open");
  }
  return values_;
}

void SimGpioLinesIn::set_value(std::size_t index, bool high) {
  if (index >= values_.size()) {
    throw GpioError("sim switch GPIO index out of range");
  }
  values_[index] = high ? 1U : 0U;
}

std::unique_ptr<GpioLinesOut> make_hardware_lines_out() {
#if defined(RULES_HAVE_LIBGPIOD) && (RULES_HAVE_LIBGPIOD == 1)
  return std::make_unique<LibgpiodLinesOut>();
#else
  throw GpioError("GPIO coil backend requires libgpiod at build time");
#endif
}

std::unique_ptr<GpioLinesIn> make_hardware_lines_in() {
#if defined(RULES_HAVE_LIBGPIOD) && (RULES_HAVE_LIBGPIOD == 1)
  return std::make_unique<LibgpiodLinesIn>();
#else
  throw GpioError("GPIO switch backend requires libgpiod at build time");
#endif
}

}  // namespace rules
