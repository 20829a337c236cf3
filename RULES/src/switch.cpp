#include "rules/switch.hpp"

#include <algorithm>
#include <utility>

namespace rules {

Switch::Switch(std::string name, Config cfg, Platform& platform)
    : name_(std::move(name)), cfg_(std::move(cfg)), platform_(&platform) {
  if (name_.empty()) {
    throw ConfigError("Switch requires a name");
  }
  if (cfg_.number.empty()) {
    throw ConfigError("Switch '" + name_ + "' requires a number");
  }
  hw_switch_ = platform_->configure_switch(cfg_.number, cfg_.debounce);
}

uint32_t Switch::add_handler(Handler callback, bool state) {
  if (!callback) {
    throw std::invalid_argument("Switch handler must be callable");
  }
  const uint32_t id = next_handler_id_++;
  handlers_.push_back(Registration{id, state, std::move(callback)});
  return id;
}

bool Switch::remove_handler(uint32_t id) {
  const auto it = std::find_if(handlers_.begin(), handlers_.end(),
                               [id](const Registration& r) { return r.id == id; });
  if (it == handlers_.end()) {
    return false;
  }
  handlers_.erase(it);
  return true;
}

void Switch::process_hw_state(bool raw_active, uint64_t now_ms) {
  const bool logical = raw_active != invert();
  if (logical == active_) {
    return;
  }

  active_ = logical;
  last_change_ms_ = now_ms;
  if (active_) {
    ++hit_count_;
  }

  // Handlers may add or remove handlers (or disable their device) while we dispatch.
  const std::vector<Registration> snapshot = handlers_;
  for (const auto& registration : snapshot) {
    if (registration.state != active_) {
      continue;
    }
    const bool still_registered =
        std::any_of(handlers_.begin(), handlers_.end(),
                    [&](const Registration& r) { return r.id == registration.id; });
    if (still_registered) {
      registration.callback();
    }
  }
}

}  // namespace rules
