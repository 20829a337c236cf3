#pragma once

#include <cstdint>
#include <vector>

namespace devices {

// Fixed-capacity ring of hit timestamps. A hit at t counts while now - t < window_ms.
class HitWindow {
 public:
  HitWindow(uint64_t window_ms, uint32_t max_hits);

  // Prunes, records the hit and reports whether max_hits is reached. A tripped window is
  // emptied so the next burst is counted from scratch.
  bool record(uint64_t now_ms);
  [[nodiscard]] uint32_t count(uint64_t now_ms) const;
  void clear() noexcept;

  [[nodiscard]] uint64_t window_ms() const noexcept { return window_ms_; }
  [[nodiscard]] uint32_t max_hits() const noexcept { return max_hits_; }

 private:
  void prune(uint64_t now_ms) noexcept;
  [[nodiscard]] bool expired(uint64_t t, uint64_t now_ms) const noexcept;

  uint64_t window_ms_;
  uint32_t max_hits_;
  std::vector<uint64_t> ring_;
  std::size_t head_ = 0;
  std::size_t size_ = 0;
};

}  // namespace devices
