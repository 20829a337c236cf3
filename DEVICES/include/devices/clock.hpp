#pragma once

#include <cstdint>

namespace devices {

class Clock {
 public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual uint64_t now_ms() const = 0;
};

// CLOCK_MONOTONIC in milliseconds.
class MonotonicClock final : public Clock {
 public:
  [[nodiscard]] uint64_t now_ms() const override;
};

// Time only moves when told to. Used by the simulator and tests.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {}

  [[nodiscard]] uint64_t now_ms() const override { return now_ms_; }
  void set_ms(uint64_t now_ms) noexcept { now_ms_ = now_ms; }
  void advance_ms(uint64_t delta_ms) noexcept { now_ms_ += delta_ms; }

 private:
  uint64_t now_ms_;
};

}  // namespace devices
