#pragma once

#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <time.h>

namespace runtime {

constexpr uint64_t kNsPerSec = 1'000'000'000ULL;
constexpr uint64_t kNsPerMs = 1'000'000ULL;

inline timespec timespec_from_ns(uint64_t ns) {
  timespec ts{};
  ts.tv_sec = static_cast<time_t>(ns / kNsPerSec);
  ts.tv_nsec = static_cast<long>(ns % kNsPerSec);
  return ts;
}

inline uint64_t monotonic_time_ns() {
  timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    throw std::runtime_error("clock_gettime(CLOCK_MONOTONIC) failed");
  }
  return static_cast<uint64_t>(ts.tv_sec) * kNsPerSec + static_cast<uint64_t>(ts.tv_nsec);
}

inline uint64_t ns_from_ms(uint64_t ms) { return ms * kNsPerMs; }

// Control loop period; loop_hz is validated to be non-zero when the config is loaded.
inline uint64_t hz_to_period_ns(uint32_t hz) {
  if (hz == 0) {
    throw std::invalid_argument("loop rate must be > 0 Hz");
  }
  return kNsPerSec / static_cast<uint64_t>(hz);
}

// Absolute CLOCK_MONOTONIC sleep, restarted after signals.
inline void sleep_until_ns(uint64_t target_ns) {
  const timespec ts = timespec_from_ns(target_ns);
  while (::clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &ts, nullptr) == EINTR) {
  }
}

inline void sleep_for_ns(uint64_t duration_ns) { sleep_until_ns(monotonic_time_ns() + duration_ns); }

}  // namespace runtime
