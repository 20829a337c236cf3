#include "devices/scheduler.hpp"

#include <stdexcept>

namespace devices {

uint64_t Scheduler::schedule_at(uint64_t due_ms, Callback callback) {
  if (!callback) {
    throw std::invalid_argument("Scheduler callback must be callable");
  }
  const uint64_t id = next_id_++;
  queue_.emplace(Key{due_ms, id}, std::move(callback));
  index_.emplace(id, due_ms);
  return id;
}

uint64_t Scheduler::schedule_in(uint64_t delay_ms, Callback callback) {
  return schedule_at(clock_->now_ms() + delay_ms, std::move(callback));
}

bool Scheduler::cancel(uint64_t id) {
  const auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  queue_.erase(Key{it->second, id});
  index_.erase(it);
  return true;
}

std::size_t Scheduler::run_due() {
  const uint64_t now = clock_->now_ms();
  std::size_t ran = 0;
  while (!queue_.empty() && queue_.begin()->first.first <= now) {
    auto node = queue_.extract(queue_.begin());
    index_.erase(node.key().second);
    node.mapped()();
    ++ran;
  }
  return ran;
}

std::optional<uint64_t> Scheduler::next_due_ms() const {
  if (queue_.empty()) {
    return std::nullopt;
  }
  return queue_.begin()->first.first;
}

DelayManager::~DelayManager() { clear(); }

void DelayManager::add(const std::string& name, uint64_t ms, Scheduler::Callback callback) {
  remove(name);
  const uint64_t id = scheduler_->schedule_in(ms, [this, name, cb = std::move(callback)]() {
    timers_.erase(name);
    cb();
  });
  timers_[name] = id;
}

void DelayManager::reset(const std::string& name, uint64_t ms, Scheduler::Callback callback) {
  add(name, ms, std::move(callback));
}

bool DelayManager::remove(const std::string& name) {
  const auto it = timers_.find(name);
  if (it == timers_.end()) {
    return false;
  }
  scheduler_->cancel(it->second);
  timers_.erase(it);
  return true;
}

void DelayManager::clear() {
  for (const auto& entry : timers_) {
    scheduler_->cancel(entry.second);
  }
  timers_.clear();
}

}  // namespace devices
