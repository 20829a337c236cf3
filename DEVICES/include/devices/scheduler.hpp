#pragma once

#include "devices/clock.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace devices {

// One-shot timers run from the control loop. Not thread safe.
class Scheduler {
 public:
  using Callback = std::function<void()>;

  explicit Scheduler(const Clock& clock) : clock_(&clock) {}

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  uint64_t schedule_at(uint64_t due_ms, Callback callback);
  uint64_t schedule_in(uint64_t delay_ms, Callback callback);
  bool cancel(uint64_t id);

  // Runs every timer due at the current clock time, earliest first. Returns how many ran.
  std::size_t run_due();

  [[nodiscard]] bool pending(uint64_t id) const { return index_.count(id) != 0; }
  [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }
  [[nodiscard]] std::optional<uint64_t> next_due_ms() const;
  [[nodiscard]] uint64_t now_ms() const { return clock_->now_ms(); }

 private:
  using Key = std::pair<uint64_t, uint64_t>;  // due_ms, id

  const Clock* clock_;
  std::map<Key, Callback> queue_;
  std::unordered_map<uint64_t, uint64_t> index_;
  uint64_t next_id_ = 1;
};

// Named delays owned by one device. Adding a name that is pending replaces it, so each name has
// at most one timer. Pending timers are cancelled when the manager is destroyed.
class DelayManager {
 public:
  explicit DelayManager(Scheduler& scheduler) : scheduler_(&scheduler) {}
  ~DelayManager();

  DelayManager(const DelayManager&) = delete;
  DelayManager& operator=(const DelayManager&) = delete;

  void add(const std::string& name, uint64_t ms, Scheduler::Callback callback);
  // Same as add(); kept for call sites that restart a running timeout.
  void reset(const std::string& name, uint64_t ms, Scheduler::Callback callback);
  bool remove(const std::string& name);
  [[nodiscard]] bool check(const std::string& name) const { return timers_.count(name) != 0; }
  void clear();

  [[nodiscard]] std::size_t size() const noexcept { return timers_.size(); }

 private:
  Scheduler* scheduler_;
  std::map<std::string, uint64_t> timers_;
};

}  // namespace devices
