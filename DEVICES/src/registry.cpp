#include "devices/registry.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace devices {

DeviceRegistry::~DeviceRegistry() {
  for (const uint64_t id : handler_ids_) {
    events_->remove_handler(id);
  }
}

void DeviceRegistry::bind(const std::string& event, const std::string& device,
                          std::function<void()> action) {
  handler_ids_.push_back(events_->add_handler(event, [event, device, action = std::move(action)]() {
    try {
      action();
    } catch (const std::exception& e) {
      std::cerr << device << ": handling '" << event << "' failed: " << e.what() << "\n";
    }
  }));
}

void DeviceRegistry::check_unique(const std::string& name) const {
  if (find_autofire(name) != nullptr || find_servo(name) != nullptr) {
    throw rules::ConfigError("Duplicate device name '" + name + "'");
  }
}

void DeviceRegistry::bind_playfield(Playfield& playfield) {
  BallSearch* search = &playfield.ball_search();
  const BallSearchConfig& cfg = search->config();
  const std::string label = playfield.name() + " ball_search";
  for (const auto& event : cfg.enable_events) {
    bind(event, label, [search]() { search->enable(); });
  }
  for (const auto& event : cfg.disable_events) {
    bind(event, label, [search]() { search->disable(); });
  }
  for (const auto& event : cfg.block_events) {
    bind(event, label, [search]() { search->block(); });
  }
  for (const auto& event : cfg.unblock_events) {
    bind(event, label, [search]() { search->unblock(); });
  }
}

AutofireCoil& DeviceRegistry::add_autofire(std::unique_ptr<AutofireCoil> device) {
  if (!device) {
    throw std::invalid_argument("add_autofire requires a device");
  }
  check_unique(device->name());
  AutofireCoil* raw = device.get();
  autofires_.push_back(std::move(device));

  const std::string label = std::string(raw->type_name()) + " " + raw->name();
  for (const auto& event : raw->config().enable_events) {
    bind(event, label, [raw]() { raw->enable(); });
  }
  for (const auto& event : raw->config().disable_events) {
    bind(event, label, [raw]() { raw->disable(); });
  }
  return *raw;
}

ServoDevice& DeviceRegistry::add_servo(std::unique_ptr<ServoDevice> device) {
  if (!device) {
    throw std::invalid_argument("add_servo requires a device");
  }
  check_unique(device->name());
  ServoDevice* raw = device.get();
  servos_.push_back(std::move(device));

  const std::string label = "servo " + raw->name();
  for (const auto& entry : raw->config().positions) {
    const double position = entry.second;
    bind(entry.first, label, [raw, position]() { raw->go_to_position(position); });
  }
  for (const auto& event : raw->config().reset_events) {
    bind(event, label, [raw]() { raw->reset(); });
  }
  bind("ball_search_stopped", label, [raw]() { raw->stop_ball_search(); });
  return *raw;
}

AutofireCoil* DeviceRegistry::find_autofire(const std::string& name) const {
  for (const auto& device : autofires_) {
    if (device->name() == name) {
      return device.get();
    }
  }
  return nullptr;
}

ServoDevice* DeviceRegistry::find_servo(const std::string& name) const {
  for (const auto& device : servos_) {
    if (device->name() == name) {
      return device.get();
    }
  }
  return nullptr;
}

std::size_t DeviceRegistry::enabled_count() const noexcept {
  std::size_t count = 0;
  for (const auto& device : autofires_) {
    if (device->enabled()) {
      ++count;
    }
  }
  return count;
}

void DeviceRegistry::start() {
  for (const auto& device : servos_) {
    device->start();
  }
}

void DeviceRegistry::shutdown() noexcept {
  for (const auto& device : autofires_) {
    try {
      device->disable();
    } catch (const std::exception& e) {
      std::cerr << device->type_name() << " " << device->name()
                << ": disable during shutdown failed: " << e.what() << "\n";
    }
  }
}

}  // namespace devices
