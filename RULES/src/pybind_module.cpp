#include "rules/platform_controller.hpp"
#include "rules/virtual_platform.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace py = pybind11;

namespace {

// Owns a virtual platform with named switches and coils so scripts can arm and fire rules.
class RulesBench {
 public:
  RulesBench() : platform_("bench") {}

  void add_switch(const std::string& name, const std::string& number, bool normally_closed,
                  const std::string& debounce) {
    rules::Switch::Config cfg;
    cfg.number = number;
    cfg.type = normally_closed ? rules::SwitchType::NormallyClosed : rules::SwitchType::NormallyOpen;
    cfg.debounce = rules::parse_debounce_mode(debounce);
    switches_[name] = std::make_unique<rules::Switch>(name, cfg, platform_);
  }

  void add_coil(const std::string& name, const rules::DriverConfig& cfg) {
    drivers_[name] = std::make_unique<rules::Driver>(name, cfg, platform_);
  }

  uint32_t pulse_on_hit(const std::string& sw, const std::string& coil, bool invert, bool debounce,
                        bool recycle, std::optional<uint32_t> pulse_ms,
                        std::optional<double> pulse_power) {
    return store(controller_.set_pulse_on_hit_rule({&lookup_switch(sw), invert, debounce},
                                                   {&lookup_driver(coil), recycle},
                                                   rules::PulseRuleSettings{pulse_ms, pulse_power}));
  }

  uint32_t pulse_on_hit_and_release(const std::string& sw, const std::string& coil, bool invert,
                                    bool debounce, bool recycle, std::optional<uint32_t> pulse_ms,
                                    std::optional<double> pulse_power) {
    return store(controller_.set_pulse_on_hit_and_release_rule(
        {&lookup_switch(sw), invert, debounce}, {&lookup_driver(coil), recycle},
        rules::PulseRuleSettings{pulse_ms, pulse_power}));
  }

  uint32_t pulse_on_hit_and_enable_and_release(const std::string& sw, const std::string& coil,
                                               std::optional<double> hold_power) {
    return store(controller_.set_pulse_on_hit_and_enable_and_release_rule(
        {&lookup_switch(sw)}, {&lookup_driver(coil)}, std::nullopt,
        rules::HoldRuleSettings{hold_power}));
  }

  uint32_t pulse_on_hit_and_enable_and_release_and_disable(const std::string& sw,
                                                           const std::string& disable_sw,
                                                           const std::string& coil,
                                                           std::optional<double> hold_power) {
    return store(controller_.set_pulse_on_hit_and_enable_and_release_and_disable_rule(
        {&lookup_switch(sw)}, {&lookup_switch(disable_sw)}, {&lookup_driver(coil)}, std::nullopt,
        rules::HoldRuleSettings{hold_power}));
  }

  void clear(uint32_t rule_id) {
    const auto it = rules_.find(rule_id);
    if (it == rules_.end()) {
      throw py::key_error("unknown rule id " + std::to_string(rule_id));
    }
    const rules::HardwareRule rule = it->second;
    rules_.erase(it);
    controller_.clear_hw_rule(rule);
  }

  void simulate_switch(const std::string& name, bool raw_active, uint64_t now_ms) {
    rules::Switch& sw = lookup_switch(name);
    platform_.simulate_switch(sw.hw_switch().number, raw_active, now_ms);
    sw.process_hw_state(raw_active, now_ms);
  }

  void service(uint64_t now_ms) { platform_.service(now_ms); }

  rules::VirtualPlatform::DriverState coil_state(const std::string& name) {
    return platform_.driver_state(lookup_driver(name).hw_driver().number);
  }

  bool switch_active(const std::string& name) { return lookup_switch(name).is_active(); }
  std::size_t binding_count() const { return platform_.binding_count(); }

 private:
  rules::Switch& lookup_switch(const std::string& name) {
    const auto it = switches_.find(name);
    if (it == switches_.end()) {
      throw py::key_error("unknown switch " + name);
    }
    return *it->second;
  }

  rules::Driver& lookup_driver(const std::string& name) {
    const auto it = drivers_.find(name);
    if (it == drivers_.end()) {
      throw py::key_error("unknown coil " + name);
    }
    return *it->second;
  }

  uint32_t store(rules::HardwareRule rule) {
    const uint32_t id = next_rule_id_++;
    rules_.emplace(id, std::move(rule));
    return id;
  }

  rules::VirtualPlatform platform_;
  rules::PlatformController controller_;
  std::map<std::string, std::unique_ptr<rules::Switch>> switches_;
  std::map<std::string, std::unique_ptr<rules::Driver>> drivers_;
  std::map<uint32_t, rules::HardwareRule> rules_;
  uint32_t next_rule_id_ = 1;
};

}  // namespace

PYBIND11_MODULE(_pincore_rules, m) {
  m.doc() = "Hardware rule engine bindings (virtual platform)";

  py::register_exception<rules::ConfigError>(m, "ConfigError", PyExc_ValueError);
  py::register_exception<rules::PlatformError>(m, "PlatformError", PyExc_RuntimeError);

  py::enum_<rules::RuleTopology>(m, "RuleTopology")
      .value("PULSE_ON_HIT_AND_RELEASE", rules::RuleTopology::PulseOnHitAndRelease)
      .value("PULSE_ON_HIT_AND_ENABLE_AND_RELEASE", rules::RuleTopology::PulseOnHitAndEnableAndRelease)
      .value("PULSE_ON_HIT", rules::RuleTopology::PulseOnHit)
      .value("PULSE_ON_HIT_AND_ENABLE_AND_RELEASE_AND_DISABLE",
             rules::RuleTopology::PulseOnHitAndEnableAndReleaseAndDisable);

  py::class_<rules::DriverConfig>(m, "CoilConfig")
      .def(py::init<>())
      .def_readwrite("number", &rules::DriverConfig::number)
      .def_readwrite("default_pulse_ms", &rules::DriverConfig::default_pulse_ms)
      .def_readwrite("default_pulse_power", &rules::DriverConfig::default_pulse_power)
      .def_readwrite("default_hold_power", &rules::DriverConfig::default_hold_power)
      .def_readwrite("max_pulse_ms", &rules::DriverConfig::max_pulse_ms)
      .def_readwrite("max_pulse_power", &rules::DriverConfig::max_pulse_power)
      .def_readwrite("max_hold_power", &rules::DriverConfig::max_hold_power)
      .def_readwrite("allow_enable", &rules::DriverConfig::allow_enable);

  py::class_<rules::VirtualPlatform::DriverState>(m, "CoilState")
      .def_readonly("on", &rules::VirtualPlatform::DriverState::on)
      .def_readonly("holding", &rules::VirtualPlatform::DriverState::holding)
      .def_readonly("pulse_count", &rules::VirtualPlatform::DriverState::pulse_count)
      .def_readonly("last_pulse_ms", &rules::VirtualPlatform::DriverState::last_pulse_ms)
      .def_readonly("last_pulse_power", &rules::VirtualPlatform::DriverState::last_pulse_power)
      .def_readonly("hold_power", &rules::VirtualPlatform::DriverState::hold_power);

  py::class_<RulesBench>(m, "RulesBench")
      .def(py::init<>())
      .def("add_switch", &RulesBench::add_switch, py::arg("name"), py::arg("number"),
           py::arg("normally_closed") = false, py::arg("debounce") = "auto")
      .def("add_coil", &RulesBench::add_coil, py::arg("name"), py::arg("config"))
      .def("pulse_on_hit", &RulesBench::pulse_on_hit, py::arg("switch"), py::arg("coil"),
           py::arg("invert") = false, py::arg("debounce") = false, py::arg("recycle") = false,
           py::arg("pulse_ms") = py::none(), py::arg("pulse_power") = py::none())
      .def("pulse_on_hit_and_release", &RulesBench::pulse_on_hit_and_release, py::arg("switch"),
           py::arg("coil"), py::arg("invert") = false, py::arg("debounce") = false,
           py::arg("recycle") = false, py::arg("pulse_ms") = py::none(),
           py::arg("pulse_power") = py::none())
      .def("pulse_on_hit_and_enable_and_release", &RulesBench::pulse_on_hit_and_enable_and_release,
           py::arg("switch"), py::arg("coil"), py::arg("hold_power") = py::none())
      .def("pulse_on_hit_and_enable_and_release_and_disable",
           &RulesBench::pulse_on_hit_and_enable_and_release_and_disable, py::arg("switch"),
           py::arg("disable_switch"), py::arg("coil"), py::arg("hold_power") = py::none())
      .def("clear", &RulesBench::clear, py::arg("rule_id"))
      .def("simulate_switch", &RulesBench::simulate_switch, py::arg("switch"), py::arg("raw_active"),
           py::arg("now_ms"))
      .def("service", &RulesBench::service, py::arg("now_ms"))
      .def("coil_state", &RulesBench::coil_state, py::arg("coil"))
      .def("switch_active", &RulesBench::switch_active, py::arg("switch"))
      .def("binding_count", &RulesBench::binding_count);
}
