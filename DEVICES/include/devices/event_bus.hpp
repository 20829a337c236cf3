#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace devices {

// Named events without payload. post() only queues; handlers run from process_queue() on the
// control loop, so a device posting from inside a handler never re-enters itself.
class EventBus {
 public:
  using Handler = std::function<void()>;

  EventBus() = default;
  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  uint64_t add_handler(const std::string& event, Handler handler);
  bool remove_handler(uint64_t id);

  void post(const std::string& event);
  // Dispatches queued events, including ones posted while dispatching. Returns the number
  // of events processed.
  std::size_t process_queue();

  [[nodiscard]] uint64_t post_count(const std::string& event) const;
  [[nodiscard]] std::size_t queued() const noexcept { return queue_.size(); }
  [[nodiscard]] std::size_t handler_count(const std::string& event) const;

 private:
  struct Registration {
    uint64_t id = 0;
    Handler handler;
  };

  std::map<std::string, std::vector<Registration>> handlers_;
  std::map<std::string, uint64_t> post_counts_;
  std::deque<std::string> queue_;
  uint64_t next_id_ = 1;
};

}  // namespace devices
