#include "devices/event_bus.hpp"

#include <algorithm>
#include <stdexcept>

namespace devices {

uint64_t EventBus::add_handler(const std::string& event, Handler handler) {
  if (event.empty()) {
    throw std::invalid_argument("Event name must not be empty");
  }
  if (!handler) {
    throw std::invalid_argument("Event handler for '" + event + "' must be callable");
  }
  const uint64_t id = next_id_++;
  handlers_[event].push_back(Registration{id, std::move(handler)});
  return id;
}

bool EventBus::remove_handler(uint64_t id) {
  for (auto& entry : handlers_) {
    auto& list = entry.second;
    const auto it =
        std::find_if(list.begin(), list.end(), [id](const Registration& r) { return r.id == id; });
    if (it != list.end()) {
      list.erase(it);
      return true;
    }
  }
  return false;
}

void EventBus::post(const std::string& event) {
  ++post_counts_[event];
  queue_.push_back(event);
}

std::size_t EventBus::process_queue() {
  std::size_t processed = 0;
  while (!queue_.empty()) {
    const std::string event = queue_.front();
    queue_.pop_front();
    ++processed;

    const auto it = handlers_.find(event);
    if (it == handlers_.end()) {
      continue;
    }
    const std::vector<Registration> snapshot = it->second;
    for (const auto& registration : snapshot) {
      const auto& current = handlers_[event];
      const bool still_registered =
          std::any_of(current.begin(), current.end(),
                      [&](const Registration& r) { return r.id == registration.id; });
      if (still_registered) {
        registration.handler();
      }
    }
  }
  return processed;
}

uint64_t EventBus::post_count(const std::string& event) const {
  const auto it = post_counts_.find(event);
  return it == post_counts_.end() ? 0 : it->second;
}

std::size_t EventBus::handler_count(const std::string& event) const {
  const auto it = handlers_.find(event);
  return it == handlers_.end() ? 0 : it->second.size();
}

}  // namespace devices
