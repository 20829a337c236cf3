#pragma once

#include "devices/autofire.hpp"
#include "devices/event_bus.hpp"
#include "devices/playfield.hpp"
#include "devices/servo_device.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace devices {

// Owns the configured devices and wires their config events to the event bus.
class DeviceRegistry {
 public:
  explicit DeviceRegistry(EventBus& events) : events_(&events) {}
  ~DeviceRegistry();

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Binds ball search enable/disable/block/unblock events.
  void bind_playfield(Playfield& playfield);
  // Autofires and kickbacks; binds enable_events and disable_events.
  AutofireCoil& add_autofire(std::unique_ptr<AutofireCoil> device);
  // Binds position events, reset events and ball_search_stopped.
  ServoDevice& add_servo(std::unique_ptr<ServoDevice> device);

  [[nodiscard]] AutofireCoil* find_autofire(const std::string& name) const;
  [[nodiscard]] ServoDevice* find_servo(const std::string& name) const;
  [[nodiscard]] std::size_t autofire_count() const noexcept { return autofires_.size(); }
  [[nodiscard]] std::size_t servo_count() const noexcept { return servos_.size(); }
  [[nodiscard]] std::size_t enabled_count() const noexcept;

  // Starts every servo at its reset position.
  void start();
  // Disables every autofire so no rule stays armed. Failures are logged and skipped.
  void shutdown() noexcept;

 private:
  void bind(const std::string& event, const std::string& device, std::function<void()> action);
  void check_unique(const std::string& name) const;

  EventBus* events_;
  std::vector<std::unique_ptr<AutofireCoil>> autofires_;
  std::vector<std::unique_ptr<ServoDevice>> servos_;
  std::vector<uint64_t> handler_ids_;
};

}  // namespace devices
