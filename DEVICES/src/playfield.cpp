#include "devices/playfield.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace devices {

BallSearch::BallSearch(std::string playfield_name, BallSearchConfig cfg, Scheduler& scheduler,
                       EventBus& events)
    : name_(std::move(playfield_name)), cfg_(std::move(cfg)), events_(&events), delay_(scheduler) {
  for (const uint32_t searches : cfg_.phase_searches) {
    if (searches == 0) {
      throw std::invalid_argument("ball search phases need at least one iteration");
    }
  }
}

uint32_t BallSearch::register_callback(int order, Callback callback, std::string name) {
  if (!callback) {
    throw std::invalid_argument("ball search callback for '" + name + "' must be callable");
  }
  const uint32_t id = next_id_++;
  Entry entry{order, id, std::move(name), std::move(callback)};
  // Equal orders keep registration order.
  const auto pos = std::upper_bound(callbacks_.begin(), callbacks_.end(), order,
                                    [](int o, const Entry& e) { return o < e.order; });
  callbacks_.insert(pos, std::move(entry));
  return id;
}

bool BallSearch::unregister(uint32_t id) {
  const auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                               [id](const Entry& e) { return e.id == id; });
  if (it == callbacks_.end()) {
    return false;
  }
  const auto index = static_cast<std::size_t>(it - callbacks_.begin());
  callbacks_.erase(it);
  if (index < next_index_) {
    --next_index_;
  }
  return true;
}

std::vector<std::string> BallSearch::callback_names() const {
  std::vector<std::string> names;
  names.reserve(callbacks_.size());
  for (const auto& entry : callbacks_) {
    names.push_back(entry.name);
  }
  return names;
}

void BallSearch::enable() {
  if (!cfg_.enabled) {
    return;
  }
  if (callbacks_.empty()) {
    std::cerr << "ball_search " << name_ << ": no devices registered, not enabling\n";
    return;
  }
  enabled_ = true;
  reset_timer();
}

void BallSearch::disable() {
  stop();
  enabled_ = false;
  delay_.remove("start");
}

void BallSearch::block() {
  blocked_ = true;
  stop();
  delay_.remove("start");
}

void BallSearch::unblock() {
  blocked_ = false;
  reset_timer();
}

void BallSearch::reset_timer() {
  if (enabled_ && !started_ && !blocked_) {
    delay_.reset("start", cfg_.timeout_ms, [this]() { start(); });
  }
}

void BallSearch::start() {
  if (!enabled_ || blocked_ || started_) {
    return;
  }
  started_ = true;
  phase_ = 1;
  iteration_ = 1;
  next_index_ = 0;
  std::cout << "ball_search " << name_ << ": started\n";
  events_->post("ball_search_started");
  run();
}

void BallSearch::run() {
  uint64_t wait_ms = cfg_.interval_ms;
  while (started_) {
    if (next_index_ >= callbacks_.size()) {
      ++iteration_;
      if (iteration_ > static_cast<int>(cfg_.phase_searches[static_cast<std::size_t>(phase_ - 1)])) {
        ++phase_;
        iteration_ = 1;
        if (phase_ > 3) {
          give_up();
          return;
        }
      }
      if (callbacks_.empty()) {
        give_up();
        return;
      }
      next_index_ = 0;
      wait_ms = cfg_.wait_after_iteration_ms;
    }

    const Callback callback = callbacks_[next_index_].callback;
    ++next_index_;
    if (callback(phase_, iteration_)) {
      delay_.add("run", wait_ms, [this]() { run(); });
      return;
    }
  }
}

void BallSearch::stop() {
  delay_.remove("run");
  if (started_) {
    started_ = false;
    events_->post("ball_search_stopped");
  }
}

void BallSearch::give_up() {
  std::cerr << "ball_search " << name_ << ": failed to find the ball, giving up\n";
  disable();
  events_->post("ball_search_failed");
}

Playfield::Playfield(std::string name, BallSearchConfig cfg, Scheduler& scheduler, EventBus& events)
    : name_(std::move(name)), events_(&events), ball_search_(name_, std::move(cfg), scheduler, events) {}

void Playfield::mark_playfield_active_from_device_action() {
  ++activity_count_;
  ball_search_.reset_timer();
  events_->post(name_ + "_active");
}

}  // namespace devices
