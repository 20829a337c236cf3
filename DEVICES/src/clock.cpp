#include "devices/clock.hpp"

#include <stdexcept>
#include <time.h>

namespace devices {

uint64_t MonotonicClock::now_ms() const {
  timespec ts{};
  if (::clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
    throw std::runtime_error("clock_gettime(CLOCK_MONOTONIC) failed");
  }
  return static_cast<uint64_t>(ts.tv_sec) * 1000ULL + static_cast<uint64_t>(ts.tv_nsec) / 1'000'000ULL;
}

}  // namespace devices
