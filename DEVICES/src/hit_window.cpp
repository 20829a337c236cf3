#include "devices/hit_window.hpp"

#include <stdexcept>

namespace devices {

HitWindow::HitWindow(uint64_t window_ms, uint32_t max_hits)
    : window_ms_(window_ms), max_hits_(max_hits), ring_(max_hits, 0) {
  if (window_ms_ == 0) {
    throw std::invalid_argument("hit window must be > 0 ms");
  }
  if (max_hits_ == 0) {
    throw std::invalid_argument("hit window max_hits must be > 0");
  }
}

bool HitWindow::expired(uint64_t t, uint64_t now_ms) const noexcept {
  return now_ms >= t && now_ms - t >= window_ms_;
}

void HitWindow::prune(uint64_t now_ms) noexcept {
  while (size_ > 0 && expired(ring_[head_], now_ms)) {
    head_ = (head_ + 1) % ring_.size();
    --size_;
  }
}

bool HitWindow::record(uint64_t now_ms) {
  prune(now_ms);
  if (size_ == ring_.size()) {
    head_ = (head_ + 1) % ring_.size();
    --size_;
  }
  ring_[(head_ + size_) % ring_.size()] = now_ms;
  ++size_;

  if (size_ >= max_hits_) {
    clear();
    return true;
  }
  return false;
}

uint32_t HitWindow::count(uint64_t now_ms) const {
  uint32_t n = 0;
  for (std::size_t i = 0; i < size_; ++i) {
    if (!expired(ring_[(head_ + i) % ring_.size()], now_ms)) {
      ++n;
    }
  }
  return n;
}

void HitWindow::clear() noexcept {
  head_ = 0;
  size_ = 0;
}

}  // namespace devices
