#include "runtime/runtime/machine.hpp"

#include "devices/kickback.hpp"
#include "devices/scheduler.hpp"
#include "rules/gpio_lines.hpp"
#include "rules/platform_controller.hpp"
#include "runtime/common/time.hpp"
#include "servo/fast_servo.hpp"
#include "servo/linux_i2c.hpp"
#include "servo/maestro_servo.hpp"
#include "servo/pca9685.hpp"
#include "servo/pkone_servo.hpp"
#include "servo/pwm_servo.hpp"
#include "servo/serial_port.hpp"
#include "servo/virtual_servo.hpp"

#include <atomic>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace runtime {

namespace {

uint32_t parse_channel(const std::string& number, const std::string& servo_name) {
  if (number.empty() || !std::isdigit(static_cast<unsigned char>(number.front()))) {
    throw rules::ConfigError("servo." + servo_name + ": invalid channel number '" + number + "'");
  }
  std::size_t used = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(number, &used, 0);
  } catch (const std::exception&) {
    throw rules::ConfigError("servo." + servo_name + ": invalid channel number '" + number + "'");
  }
  if (used != number.size() || value > UINT32_MAX) {
    throw rules::ConfigError("servo." + servo_name + ": invalid channel number '" + number + "'");
  }
  return static_cast<uint32_t>(value);
}

servo::ServoCalibration calibration_or(const ServoControllerSection& ctrl,
                                       servo::ServoCalibration fallback) {
  if (ctrl.min_value && ctrl.max_value) {
    return servo::ServoCalibration{*ctrl.min_value, *ctrl.max_value};
  }
  return fallback;
}

}  // namespace

class Machine::Impl {
 public:
  Impl(MachineConfig cfg, MachineCliOverrides overrides, std::unique_ptr<devices::Clock> clock)
      : cfg_(std::move(cfg)),
        overrides_(overrides),
        clock_(clock ? std::move(clock) : std::make_unique<devices::MonotonicClock>()),
        scheduler_(*clock_) {
    build_platform();
    build_switches_and_coils();
    playfield_ = std::make_unique<devices::Playfield>("playfield", cfg_.playfield, scheduler_, events_);
    registry_ = std::make_unique<devices::DeviceRegistry>(events_);
    registry_->bind_playfield(*playfield_);
    build_autofires();
    build_servos();
  }

  ~Impl() { shutdown(); }

  void start() {
    if (started_) {
      return;
    }
    needs_release_ = true;
    if (gpio_ != nullptr) {
      gpio_->start();
    }
    open_servo_transports();
    registry_->start();

    events_.post("machine_reset_phase_3");
    for (const auto& event : cfg_.machine.start_events) {
      events_.post(event);
    }
    stats_.events_processed += events_.process_queue();
    started_ = true;

    std::cout << "[" << monotonic_time_ns() << "] pincore: started platform="
              << platform_->name() << " switches=" << switches_.size()
              << " coils=" << coils_.size() << " autofires=" << registry_->autofire_count()
              << " servos=" << registry_->servo_count() << "\n";
  }

  void tick() {
    platform_->service(clock_->now_ms());
    stats_.timers_run += scheduler_.run_due();
    stats_.events_processed += events_.process_queue();
    ++stats_.ticks;
  }

  void run() {
    start();
    try {
      loop();
    } catch (...) {
      shutdown();
      throw;
    }
    shutdown();
  }

  void request_stop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

  void shutdown() noexcept {
    if (!started_ && !needs_release_) {
      return;
    }
    registry_->shutdown();
    for (auto& [_, slot] : pca9685_boards_) {
      slot.bus->close();
    }
    for (auto& [_, link] : serial_links_) {
      link->close();
    }
    for (auto& channel : pwm_channels_) {
      channel->close();
    }
    if (gpio_ != nullptr) {
      gpio_->stop();
    }
    if (started_) {
      std::cout << "[" << monotonic_time_ns() << "] pincore: shutdown ticks=" << stats_.ticks
                << " deadline_miss=" << stats_.deadline_miss_count << "\n";
    }
    started_ = false;
    needs_release_ = false;
  }

  [[nodiscard]] bool started() const noexcept { return started_; }
  [[nodiscard]] const MachineConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] MachineStats stats_snapshot() const { return stats_; }

  rules::Platform& platform() { return *platform_; }
  rules::VirtualPlatform* virtual_platform() { return virtual_; }
  rules::GpioPlatform* gpio_platform() { return gpio_; }

  rules::Switch* find_switch(const std::string& name) const {
    const auto it = switches_.find(name);
    return it == switches_.end() ? nullptr : it->second.get();
  }

  rules::Driver* find_coil(const std::string& name) const {
    const auto it = coils_.find(name);
    return it == coils_.end() ? nullptr : it->second.get();
  }

  devices::EventBus& events() { return events_; }
  devices::Playfield& playfield() { return *playfield_; }
  devices::DeviceRegistry& devices() { return *registry_; }
  uint64_t now_ms() const { return clock_->now_ms(); }

 private:
  struct Pca9685Slot {
    std::unique_ptr<servo::LinuxI2c> bus;
    std::unique_ptr<servo::Pca9685> board;
  };

  void build_platform() {
    if (cfg_.machine.platform == PlatformKind::Gpio) {
      std::unique_ptr<rules::GpioLinesOut> out;
      std::unique_ptr<rules::GpioLinesIn> in;
      if (cfg_.gpio.sim) {
        out = std::make_unique<rules::SimGpioLinesOut>();
        in = std::make_unique<rules::SimGpioLinesIn>();
      } else {
        out = rules::make_hardware_lines_out();
        in = rules::make_hardware_lines_in();
      }
      auto gpio = std::make_unique<rules::GpioPlatform>(cfg_.gpio.lines, std::move(out), std::move(in));
      gpio_ = gpio.get();
      platform_ = std::move(gpio);
    } else {
      auto virt = std::make_unique<rules::VirtualPlatform>();
      virt->set_call_log_enabled(false);
      virtual_ = virt.get();
      platform_ = std::move(virt);
    }

    platform_->set_switch_listener([this](const std::string& number, bool raw_active, uint64_t now_ms) {
      ++stats_.switch_changes;
      const auto it = switches_by_number_.find(number);
      if (it != switches_by_number_.end()) {
        it->second->process_hw_state(raw_active, now_ms);
      }
    });
  }

  void build_switches_and_coils() {
    for (const auto& sw : cfg_.switches) {
      auto created = std::make_unique<rules::Switch>(sw.name, sw.cfg, *platform_);
      switches_by_number_[sw.cfg.number] = created.get();
      switches_.emplace(sw.name, std::move(created));
    }
    for (const auto& coil : cfg_.coils) {
      coils_.emplace(coil.name, std::make_unique<rules::Driver>(coil.name, coil.cfg, *platform_,
                                                                cfg_.machine.default_pulse_ms));
    }
  }

  void build_autofires() {
    for (const auto& af : cfg_.autofires) {
      rules::Switch* input = find_switch(af.cfg.switch_name);
      rules::Driver* coil = find_coil(af.cfg.coil);
      if (input == nullptr || coil == nullptr) {
        throw rules::ConfigError(af.name + ": switch or coil is not configured");
      }
      std::unique_ptr<devices::AutofireCoil> device;
      if (af.kickback) {
        device = std::make_unique<devices::Kickback>(af.name, af.cfg, *input, *coil, controller_,
                                                     *playfield_, events_, scheduler_);
      } else {
        device = std::make_unique<devices::AutofireCoil>(af.name, af.cfg, *input, *coil, controller_,
                                                         *playfield_, events_, scheduler_);
      }
      registry_->add_autofire(std::move(device));
    }
  }

  const ServoControllerSection& controller_section(const std::string& name) const {
    for (const auto& ctrl : cfg_.servo_controllers) {
      if (ctrl.name == name) {
        return ctrl;
      }
    }
    throw rules::ConfigError("Unknown servo_controller '" + name + "'");
  }

  servo::SerialLink& serial_link(const ServoControllerSection& ctrl) {
    auto it = serial_links_.find(ctrl.name);
    if (it == serial_links_.end()) {
      servo::SerialPortConfig port;
      port.device = ctrl.port;
      port.baud = ctrl.baud;
      it = serial_links_.emplace(ctrl.name, std::make_unique<servo::LinuxSerialPort>(port)).first;
    }
    return *it->second;
  }

  servo::Pca9685& pca9685_board(const ServoControllerSection& ctrl, uint8_t address) {
    const auto key = std::make_pair(ctrl.name, address);
    auto it = pca9685_boards_.find(key);
    if (it == pca9685_boards_.end()) {
      Pca9685Slot slot;
      slot.bus = std::make_unique<servo::LinuxI2c>(ctrl.i2c_bus, address);
      slot.board = std::make_unique<servo::Pca9685>(*slot.bus);
      it = pca9685_boards_.emplace(key, std::move(slot)).first;
    }
    return *it->second.board;
  }

  std::unique_ptr<servo::ServoPlatformInterface> make_servo_output(const ServoSection& servo) {
    const ServoControllerSection& ctrl = controller_section(servo.cfg.controller);
    const std::string& number = servo.cfg.number;
    switch (ctrl.type) {
      case ServoControllerType::Virtual:
        return std::make_unique<servo::VirtualServo>(servo.name);
      case ServoControllerType::Pca9685: {
        const servo::Pca9685Number parsed = servo::parse_pca9685_number(number);
        return std::make_unique<servo::Pca9685Servo>(pca9685_board(ctrl, parsed.address), parsed.channel,
                                                     calibration_or(ctrl, {150, 600}));
      }
      case ServoControllerType::Maestro: {
        servo::MaestroServoConfig maestro;
        maestro.channel_count = ctrl.channel_count;
        maestro.calibration = calibration_or(ctrl, maestro.calibration);
        return std::make_unique<servo::MaestroServo>(serial_link(ctrl), parse_channel(number, servo.name),
                                                     maestro);
      }
      case ServoControllerType::Fast:
        return std::make_unique<servo::FastServo>(serial_link(ctrl), parse_channel(number, servo.name),
                                                  calibration_or(ctrl, {0, servo::kFastServoMaxValue}));
      case ServoControllerType::Pkone: {
        const servo::PkoneExtensionConfig extension{ctrl.coil_count, ctrl.servo_count};
        return std::make_unique<servo::PkoneServo>(
            serial_link(ctrl), servo::parse_pkone_servo_number(number, extension),
            calibration_or(ctrl, {0, servo::kPkoneServoMaxValue}));
      }
      case ServoControllerType::Pwm: {
        servo::SysfsPwmConfig pwm;
        pwm.chip = ctrl.chip;
        pwm.channel = parse_channel(number, servo.name);
        pwm.period_ns = ctrl.period_ns;
        pwm_channels_.push_back(std::make_unique<servo::SysfsPwmChannel>(pwm));
        return std::make_unique<servo::PwmServo>(*pwm_channels_.back(), calibration_or(ctrl, {1000, 2000}));
      }
    }
    throw rules::ConfigError("servo." + servo.name + ": unsupported controller type");
  }

  void build_servos() {
    for (const auto& servo : cfg_.servos) {
      std::unique_ptr<servo::ServoPlatformInterface> output = make_servo_output(servo);
      auto device = std::make_unique<devices::ServoDevice>(servo.name, servo.cfg, *output,
                                                           playfield_->ball_search(), scheduler_);
      servo_outputs_.push_back(std::move(output));
      registry_->add_servo(std::move(device));
    }
  }

  void open_servo_transports() {
    for (auto& [_, link] : serial_links_) {
      link->open();
    }
    for (auto& channel : pwm_channels_) {
      channel->begin();
    }
    for (auto& [_, slot] : pca9685_boards_) {
      slot.bus->open();
      slot.board->initialize([](uint64_t ms) { sleep_for_ns(ns_from_ms(ms)); });
    }
  }

  double effective_run_duration_s() const {
    if (overrides_.duration_sec_override >= 0.0) {
      return overrides_.duration_sec_override;
    }
    return cfg_.machine.run_duration_s;
  }

  void loop() {
    const uint64_t period_ns = hz_to_period_ns(cfg_.machine.loop_hz);
    const double run_sec = effective_run_duration_s();
    const uint64_t start_ns = monotonic_time_ns();
    const uint64_t deadline_ns = start_ns + static_cast<uint64_t>(run_sec * 1e9);
    uint64_t next_tick_ns = start_ns;
    uint64_t last_log_ns = start_ns;

    while (!stop_requested_.load(std::memory_order_relaxed)) {
      if (run_sec > 0.0 && monotonic_time_ns() >= deadline_ns) {
        break;
      }
      tick();

      next_tick_ns += period_ns;
      const uint64_t now_ns = monotonic_time_ns();
      if (now_ns > next_tick_ns) {
        ++stats_.deadline_miss_count;
        next_tick_ns = now_ns;
      } else {
        sleep_until_ns(next_tick_ns);
      }

      if (cfg_.machine.log_period_ms > 0 && now_ns - last_log_ns >= ns_from_ms(cfg_.machine.log_period_ms)) {
        last_log_ns = now_ns;
        log_status(now_ns);
      }
    }
  }

  void log_status(uint64_t now_ns) const {
    const devices::BallSearch& search = playfield_->ball_search();
    std::cout << "[" << now_ns << "] pincore: ticks=" << stats_.ticks
              << " switch_changes=" << stats_.switch_changes << " events=" << stats_.events_processed
              << " timers=" << stats_.timers_run << " armed=" << registry_->enabled_count()
              << " ball_search=" << (search.started() ? "running" : (search.enabled() ? "on" : "off"))
              << " deadline_miss=" << stats_.deadline_miss_count << "\n";
  }

  MachineConfig cfg_;
  MachineCliOverrides overrides_;
  std::unique_ptr<devices::Clock> clock_;
  devices::Scheduler scheduler_;
  devices::EventBus events_;
  rules::PlatformController controller_;

  std::unique_ptr<rules::Platform> platform_;
  rules::VirtualPlatform* virtual_ = nullptr;
  rules::GpioPlatform* gpio_ = nullptr;
  std::map<std::string, std::unique_ptr<rules::Switch>> switches_;
  std::map<std::string, rules::Switch*> switches_by_number_;
  std::map<std::string, std::unique_ptr<rules::Driver>> coils_;

  std::unique_ptr<devices::Playfield> playfield_;

  std::map<std::string, std::unique_ptr<servo::LinuxSerialPort>> serial_links_;
  std::map<std::pair<std::string, uint8_t>, Pca9685Slot> pca9685_boards_;
  std::vector<std::unique_ptr<servo::SysfsPwmChannel>> pwm_channels_;
  std::vector<std::unique_ptr<servo::ServoPlatformInterface>> servo_outputs_;

  // Declared last so devices go before the hardware they drive.
  std::unique_ptr<devices::DeviceRegistry> registry_;

  MachineStats stats_;
  std::atomic<bool> stop_requested_{false};
  bool started_ = false;
  bool needs_release_ = false;
};

Machine::Machine(MachineConfig cfg, MachineCliOverrides overrides, std::unique_ptr<devices::Clock> clock)
    : impl_(std::make_unique<Impl>(std::move(cfg), overrides, std::move(clock))) {}

Machine::~Machine() = default;

void Machine::start() { impl_->start(); }
void Machine::tick() { impl_->tick(); }
void Machine::run() { impl_->run(); }
void Machine::request_stop() noexcept { impl_->request_stop(); }
void Machine::shutdown() noexcept { impl_->shutdown(); }

bool Machine::started() const noexcept { return impl_->started(); }
const MachineConfig& Machine::config() const noexcept { return impl_->config(); }
MachineStats Machine::stats_snapshot() const { return impl_->stats_snapshot(); }

rules::Platform& Machine::platform() { return impl_->platform(); }
rules::VirtualPlatform* Machine::virtual_platform() { return impl_->virtual_platform(); }
rules::GpioPlatform* Machine::gpio_platform() { return impl_->gpio_platform(); }

rules::Switch* Machine::find_switch(const std::string& name) const { return impl_->find_switch(name); }
rules::Driver* Machine::find_coil(const std::string& name) const { return impl_->find_coil(name); }
devices::EventBus& Machine::events() { return impl_->events(); }
devices::Playfield& Machine::playfield() { return impl_->playfield(); }
devices::DeviceRegistry& Machine::devices() { return impl_->devices(); }
uint64_t Machine::now_ms() const { return impl_->now_ms(); }

}  // namespace runtime
