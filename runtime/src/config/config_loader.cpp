#include "runtime/config/config.hpp"

#include "devices/kickback.hpp"
#include "rules/platform.hpp"
#include "runtime/config/toml_parser.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <unordered_set>

namespace runtime {

namespace {

using rules::ConfigError;

uint32_t as_u32(const TomlValue& value, const std::string& key_name) {
  if (value.is_int()) {
    const int64_t x = value.as_int();
    if (x < 0 || x > static_cast<int64_t>(UINT32_MAX)) {
      throw ConfigError("Config key '" + key_name + "' is out of uint32 range");
    }
    return static_cast<uint32_t>(x);
  }
  if (value.is_double()) {
    const double x = value.as_double();
    if (!std::isfinite(x) || x < 0.0 || x > static_cast<double>(UINT32_MAX) || std::floor(x) != x) {
      throw ConfigError("Config key '" + key_name + "' must be an integer-compatible number");
    }
    return static_cast<uint32_t>(x);
  }
  throw ConfigError("Config key '" + key_name + "' must be integer");
}

int as_i32(const TomlValue& value, const std::string& key_name) {
  if (!value.is_int()) {
    throw ConfigError("Config key '" + key_name + "' must be integer");
  }
  const int64_t x = value.as_int();
  if (x < static_cast<int64_t>(INT32_MIN) || x > static_cast<int64_t>(INT32_MAX)) {
    throw ConfigError("Config key '" + key_name + "' is out of int32 range");
  }
  return static_cast<int>(x);
}

double as_double(const TomlValue& value, const std::string& key_name) {
  if (value.is_double() || value.is_int()) {
    const double x = value.as_double();
    if (!std::isfinite(x)) {
      throw ConfigError("Config key '" + key_name + "' must be finite");
    }
    return x;
  }
  throw ConfigError("Config key '" + key_name + "' must be numeric");
}

bool as_bool(const TomlValue& value, const std::string& key_name) {
  if (!value.is_bool()) {
    throw ConfigError("Config key '" + key_name + "' must be boolean");
  }
  return value.as_bool();
}

std::string as_string(const TomlValue& value, const std::string& key_name) {
  if (!value.is_string()) {
    throw ConfigError("Config key '" + key_name + "' must be string");
  }
  return value.as_string();
}

// Hardware numbers may be written as 5 or "0x41-5".
std::string as_number(const TomlValue& value, const std::string& key_name) {
  if (value.is_int()) {
    if (value.as_int() < 0) {
      throw ConfigError("Config key '" + key_name + "' must not be negative");
    }
    return std::to_string(value.as_int());
  }
  const std::string number = as_string(value, key_name);
  if (number.empty()) {
    throw ConfigError("Config key '" + key_name + "' must not be empty");
  }
  return number;
}

// A single string is accepted where a list of event names is expected.
std::vector<std::string> as_string_list(const TomlValue& value, const std::string& key_name) {
  if (value.is_string()) {
    return {value.as_string()};
  }
  if (!value.is_array()) {
    throw ConfigError("Config key '" + key_name + "' must be a string or an array of strings");
  }
  std::vector<std::string> out;
  for (const auto& item : value.as_array()) {
    out.push_back(as_string(item, key_name));
  }
  return out;
}

void validate_allowed_keys(const TomlSection& section, const std::unordered_set<std::string>& allowed,
                           const std::string& section_name) {
  for (const auto& [key, _] : section) {
    if (allowed.find(key) == allowed.end()) {
      throw ConfigError("Unknown key '" + key + "' in section [" + section_name + "]");
    }
  }
}

template <typename Fn>
void maybe_apply(const TomlSection& section, const std::string& key, Fn&& fn) {
  const auto it = section.find(key);
  if (it != section.end()) {
    fn(it->second);
  }
}

const TomlValue& require_key(const TomlSection& section, const std::string& key,
                             const std::string& section_name) {
  const auto it = section.find(key);
  if (it == section.end()) {
    throw ConfigError("Missing required key '" + key + "' in section [" + section_name + "]");
  }
  return it->second;
}

void parse_machine(const TomlSection& sec, MachineSection& out) {
  validate_allowed_keys(sec, {"platform", "loop_hz", "log_period_ms", "run_duration_s",
                              "default_pulse_ms", "start_events"},
                        "machine");
  maybe_apply(sec, "platform", [&](const TomlValue& v) {
    out.platform = parse_platform_kind(as_string(v, "machine.platform"));
  });
  maybe_apply(sec, "loop_hz", [&](const TomlValue& v) { out.loop_hz = as_u32(v, "machine.loop_hz"); });
  maybe_apply(sec, "log_period_ms",
              [&](const TomlValue& v) { out.log_period_ms = as_u32(v, "machine.log_period_ms"); });
  maybe_apply(sec, "run_duration_s",
              [&](const TomlValue& v) { out.run_duration_s = as_double(v, "machine.run_duration_s"); });
  maybe_apply(sec, "default_pulse_ms",
              [&](const TomlValue& v) { out.default_pulse_ms = as_u32(v, "machine.default_pulse_ms"); });
  maybe_apply(sec, "start_events",
              [&](const TomlValue& v) { out.start_events = as_string_list(v, "machine.start_events"); });

  if (out.loop_hz == 0 || out.loop_hz > 10000) {
    throw ConfigError("machine.loop_hz must be within 1..10000");
  }
  if (out.run_duration_s < 0.0) {
    throw ConfigError("machine.run_duration_s must be >= 0");
  }
  if (out.default_pulse_ms == 0) {
    throw ConfigError("machine.default_pulse_ms must be > 0");
  }
}

void parse_gpio(const TomlSection& sec, GpioSection& out) {
  validate_allowed_keys(sec, {"output_chip", "input_chip", "recycle_ms", "debounce_samples",
                              "max_pulse_ms", "sim"},
                        "gpio");
  maybe_apply(sec, "output_chip",
              [&](const TomlValue& v) { out.lines.output_chip = as_string(v, "gpio.output_chip"); });
  maybe_apply(sec, "input_chip",
              [&](const TomlValue& v) { out.lines.input_chip = as_string(v, "gpio.input_chip"); });
  maybe_apply(sec, "recycle_ms",
              [&](const TomlValue& v) { out.lines.recycle_ms = as_u32(v, "gpio.recycle_ms"); });
  maybe_apply(sec, "debounce_samples", [&](const TomlValue& v) {
    out.lines.debounce_samples = as_u32(v, "gpio.debounce_samples");
  });
  maybe_apply(sec, "max_pulse_ms",
              [&](const TomlValue& v) { out.lines.max_pulse_ms = as_u32(v, "gpio.max_pulse_ms"); });
  maybe_apply(sec, "sim", [&](const TomlValue& v) { out.sim = as_bool(v, "gpio.sim"); });

  if (out.lines.debounce_samples == 0) {
    throw ConfigError("gpio.debounce_samples must be > 0");
  }
  if (out.lines.max_pulse_ms == 0) {
    throw ConfigError("gpio.max_pulse_ms must be > 0");
  }
}

void parse_playfield(const TomlSection& sec, devices::BallSearchConfig& out) {
  validate_allowed_keys(sec, {"enable_ball_search", "ball_search_timeout_ms",
                              "ball_search_interval_ms", "ball_search_wait_after_iteration_ms",
                              "ball_search_phase_1_searches", "ball_search_phase_2_searches",
                              "ball_search_phase_3_searches", "ball_search_enable_events",
                              "ball_search_disable_events", "ball_search_block_events",
                              "ball_search_unblock_events"},
                        "playfield");
  maybe_apply(sec, "enable_ball_search",
              [&](const TomlValue& v) { out.enabled = as_bool(v, "playfield.enable_ball_search"); });
  maybe_apply(sec, "ball_search_timeout_ms", [&](const TomlValue& v) {
    out.timeout_ms = as_u32(v, "playfield.ball_search_timeout_ms");
  });
  maybe_apply(sec, "ball_search_interval_ms", [&](const TomlValue& v) {
    out.interval_ms = as_u32(v, "playfield.ball_search_interval_ms");
  });
  maybe_apply(sec, "ball_search_wait_after_iteration_ms", [&](const TomlValue& v) {
    out.wait_after_iteration_ms = as_u32(v, "playfield.ball_search_wait_after_iteration_ms");
  });
  for (std::size_t i = 0; i < out.phase_searches.size(); ++i) {
    const std::string key = "ball_search_phase_" + std::to_string(i + 1) + "_searches";
    maybe_apply(sec, key,
                [&](const TomlValue& v) { out.phase_searches[i] = as_u32(v, "playfield." + key); });
  }
  maybe_apply(sec, "ball_search_enable_events", [&](const TomlValue& v) {
    out.enable_events = as_string_list(v, "playfield.ball_search_enable_events");
  });
  maybe_apply(sec, "ball_search_disable_events", [&](const TomlValue& v) {
    out.disable_events = as_string_list(v, "playfield.ball_search_disable_events");
  });
  maybe_apply(sec, "ball_search_block_events", [&](const TomlValue& v) {
    out.block_events = as_string_list(v, "playfield.ball_search_block_events");
  });
  maybe_apply(sec, "ball_search_unblock_events", [&](const TomlValue& v) {
    out.unblock_events = as_string_list(v, "playfield.ball_search_unblock_events");
  });

  if (out.timeout_ms == 0) {
    throw ConfigError("playfield.ball_search_timeout_ms must be > 0");
  }
}

SwitchSection parse_switch(const std::string& name, const TomlSection& sec) {
  const std::string table = "switch." + name;
  validate_allowed_keys(sec, {"number", "type", "debounce"}, table);
  SwitchSection out;
  out.name = name;
  out.cfg.number = as_number(require_key(sec, "number", table), table + ".number");
  maybe_apply(sec, "type", [&](const TomlValue& v) {
    out.cfg.type = rules::parse_switch_type(as_string(v, table + ".type"));
  });
  maybe_apply(sec, "debounce", [&](const TomlValue& v) {
    out.cfg.debounce = rules::parse_debounce_mode(as_string(v, table + ".debounce"));
  });
  return out;
}

CoilSection parse_coil(const std::string& name, const TomlSection& sec) {
  const std::string table = "coil." + name;
  validate_allowed_keys(sec, {"number", "default_pulse_ms", "default_pulse_power",
                              "default_hold_power", "max_pulse_ms", "max_pulse_power",
                              "max_hold_power", "allow_enable", "default_recycle"},
                        table);
  CoilSection out;
  out.name = name;
  rules::DriverConfig& cfg = out.cfg;
  cfg.number = as_number(require_key(sec, "number", table), table + ".number");
  maybe_apply(sec, "default_pulse_ms", [&](const TomlValue& v) {
    cfg.default_pulse_ms = as_u32(v, table + ".default_pulse_ms");
  });
  maybe_apply(sec, "default_pulse_power", [&](const TomlValue& v) {
    cfg.default_pulse_power = as_double(v, table + ".default_pulse_power");
  });
  maybe_apply(sec, "default_hold_power", [&](const TomlValue& v) {
    cfg.default_hold_power = as_double(v, table + ".default_hold_power");
  });
  maybe_apply(sec, "max_pulse_ms",
              [&](const TomlValue& v) { cfg.max_pulse_ms = as_u32(v, table + ".max_pulse_ms"); });
  maybe_apply(sec, "max_pulse_power", [&](const TomlValue& v) {
    cfg.max_pulse_power = as_double(v, table + ".max_pulse_power");
  });
  maybe_apply(sec, "max_hold_power",
              [&](const TomlValue& v) { cfg.max_hold_power = as_double(v, table + ".max_hold_power"); });
  maybe_apply(sec, "allow_enable",
              [&](const TomlValue& v) { cfg.allow_enable = as_bool(v, table + ".allow_enable"); });
  maybe_apply(sec, "default_recycle",
              [&](const TomlValue& v) { cfg.default_recycle = as_bool(v, table + ".default_recycle"); });
  return out;
}

AutofireSection parse_autofire(const std::string& kind, const std::string& name,
                               const TomlSection& sec) {
  const std::string table = kind + "." + name;
  validate_allowed_keys(sec, {"coil", "switch", "reverse_switch", "enable_events", "disable_events",
                              "recycle", "pulse_ms", "pulse_power", "debounce", "ball_search_order",
                              "timeout_watch_time_ms", "timeout_max_hits",
                              "timeout_disable_time_ms", "events_when_fired", "debug"},
                        table);
  AutofireSection out;
  out.name = name;
  out.kickback = kind == "kickback";
  if (out.kickback) {
    out.cfg = devices::default_kickback_config();
  }
  devices::AutofireConfig& cfg = out.cfg;
  cfg.coil = as_string(require_key(sec, "coil", table), table + ".coil");
  cfg.switch_name = as_string(require_key(sec, "switch", table), table + ".switch");
  maybe_apply(sec, "reverse_switch",
              [&](const TomlValue& v) { cfg.reverse_switch = as_bool(v, table + ".reverse_switch"); });
  maybe_apply(sec, "enable_events", [&](const TomlValue& v) {
    cfg.enable_events = as_string_list(v, table + ".enable_events");
  });
  maybe_apply(sec, "disable_events", [&](const TomlValue& v) {
    cfg.disable_events = as_string_list(v, table + ".disable_events");
  });
  maybe_apply(sec, "recycle", [&](const TomlValue& v) { cfg.recycle = as_bool(v, table + ".recycle"); });
  maybe_apply(sec, "pulse_ms", [&](const TomlValue& v) { cfg.pulse_ms = as_u32(v, table + ".pulse_ms"); });
  maybe_apply(sec, "pulse_power",
              [&](const TomlValue& v) { cfg.pulse_power = as_double(v, table + ".pulse_power"); });
  maybe_apply(sec, "debounce", [&](const TomlValue& v) {
    if (v.is_bool()) {
      cfg.debounce = v.as_bool() ? devices::DebounceOverride::Normal : devices::DebounceOverride::Off;
      return;
    }
    cfg.debounce = devices::parse_debounce_override(as_string(v, table + ".debounce"));
  });
  maybe_apply(sec, "ball_search_order", [&](const TomlValue& v) {
    cfg.ball_search_order = as_i32(v, table + ".ball_search_order");
  });
  maybe_apply(sec, "timeout_watch_time_ms", [&](const TomlValue& v) {
    cfg.timeout_watch_time_ms = as_u32(v, table + ".timeout_watch_time_ms");
  });
  maybe_apply(sec, "timeout_max_hits", [&](const TomlValue& v) {
    cfg.timeout_max_hits = as_u32(v, table + ".timeout_max_hits");
  });
  maybe_apply(sec, "timeout_disable_time_ms", [&](const TomlValue& v) {
    cfg.timeout_disable_time_ms = as_u32(v, table + ".timeout_disable_time_ms");
  });
  maybe_apply(sec, "events_when_fired", [&](const TomlValue& v) {
    cfg.events_when_fired = as_string_list(v, table + ".events_when_fired");
  });
  maybe_apply(sec, "debug", [&](const TomlValue& v) { cfg.debug = as_bool(v, table + ".debug"); });
  return out;
}

ServoControllerSection parse_servo_controller(const std::string& name, const TomlSection& sec) {
  const std::string table = "servo_controller." + name;
  validate_allowed_keys(sec, {"type", "i2c_bus", "port", "baud", "channel_count", "coil_count",
                              "servo_count", "chip", "period_ns", "min_value", "max_value"},
                        table);
  ServoControllerSection out;
  out.name = name;
  out.type = parse_servo_controller_type(as_string(require_key(sec, "type", table), table + ".type"));
  maybe_apply(sec, "i2c_bus", [&](const TomlValue& v) { out.i2c_bus = as_string(v, table + ".i2c_bus"); });
  maybe_apply(sec, "port", [&](const TomlValue& v) { out.port = as_string(v, table + ".port"); });
  maybe_apply(sec, "baud", [&](const TomlValue& v) { out.baud = as_u32(v, table + ".baud"); });
  maybe_apply(sec, "channel_count",
              [&](const TomlValue& v) { out.channel_count = as_u32(v, table + ".channel_count"); });
  maybe_apply(sec, "coil_count", [&](const TomlValue& v) { out.coil_count = as_u32(v, table + ".coil_count"); });
  maybe_apply(sec, "servo_count",
              [&](const TomlValue& v) { out.servo_count = as_u32(v, table + ".servo_count"); });
  maybe_apply(sec, "chip", [&](const TomlValue& v) { out.chip = as_u32(v, table + ".chip"); });
  maybe_apply(sec, "period_ns", [&](const TomlValue& v) { out.period_ns = as_u32(v, table + ".period_ns"); });
  maybe_apply(sec, "min_value", [&](const TomlValue& v) { out.min_value = as_u32(v, table + ".min_value"); });
  maybe_apply(sec, "max_value", [&](const TomlValue& v) { out.max_value = as_u32(v, table + ".max_value"); });

  if (out.min_value.has_value() != out.max_value.has_value()) {
    throw ConfigError(table + ": min_value and max_value must be set together");
  }
  if (out.period_ns == 0) {
    throw ConfigError(table + ".period_ns must be > 0");
  }
  return out;
}

ServoSection parse_servo(const std::string& name, const TomlSection& sec) {
  const std::string table = "servo." + name;
  validate_allowed_keys(sec, {"controller", "number", "servo_min", "servo_max", "reset_position",
                              "reset_events", "include_in_ball_search", "ball_search_order",
                              "ball_search_min", "ball_search_max", "ball_search_wait_ms",
                              "speed_limit", "acceleration_limit", "debug"},
                        table);
  ServoSection out;
  out.name = name;
  devices::ServoDeviceConfig& cfg = out.cfg;
  cfg.controller = as_string(require_key(sec, "controller", table), table + ".controller");
  cfg.number = as_number(require_key(sec, "number", table), table + ".number");
  maybe_apply(sec, "servo_min", [&](const TomlValue& v) { cfg.servo_min = as_double(v, table + ".servo_min"); });
  maybe_apply(sec, "servo_max", [&](const TomlValue& v) { cfg.servo_max = as_double(v, table + ".servo_max"); });
  maybe_apply(sec, "reset_position",
              [&](const TomlValue& v) { cfg.reset_position = as_double(v, table + ".reset_position"); });
  maybe_apply(sec, "reset_events",
              [&](const TomlValue& v) { cfg.reset_events = as_string_list(v, table + ".reset_events"); });
  maybe_apply(sec, "include_in_ball_search", [&](const TomlValue& v) {
    cfg.include_in_ball_search = as_bool(v, table + ".include_in_ball_search");
  });
  maybe_apply(sec, "ball_search_order", [&](const TomlValue& v) {
    cfg.ball_search_order = as_i32(v, table + ".ball_search_order");
  });
  maybe_apply(sec, "ball_search_min",
              [&](const TomlValue& v) { cfg.ball_search_min = as_double(v, table + ".ball_search_min"); });
  maybe_apply(sec, "ball_search_max",
              [&](const TomlValue& v) { cfg.ball_search_max = as_double(v, table + ".ball_search_max"); });
  maybe_apply(sec, "ball_search_wait_ms", [&](const TomlValue& v) {
    cfg.ball_search_wait_ms = as_u32(v, table + ".ball_search_wait_ms");
  });
  maybe_apply(sec, "speed_limit",
              [&](const TomlValue& v) { cfg.speed_limit = as_double(v, table + ".speed_limit"); });
  maybe_apply(sec, "acceleration_limit", [&](const TomlValue& v) {
    cfg.acceleration_limit = as_double(v, table + ".acceleration_limit");
  });
  maybe_apply(sec, "debug", [&](const TomlValue& v) { cfg.debug = as_bool(v, table + ".debug"); });
  return out;
}

// [servo.<name>.positions]: event = position
void parse_servo_positions(const std::string& name, const TomlSection& sec, ServoSection& servo) {
  for (const auto& [event, value] : sec) {
    servo.cfg.positions[event] = as_double(value, "servo." + name + ".positions." + event);
  }
}

template <typename Section>
bool has_name(const std::vector<Section>& sections, const std::string& name) {
  return std::any_of(sections.begin(), sections.end(),
                     [&](const Section& s) { return s.name == name; });
}

void check_references(const MachineConfig& cfg) {
  std::set<std::string> numbers;
  for (const auto& sw : cfg.switches) {
    if (!numbers.insert(sw.cfg.number).second) {
      throw ConfigError("switch." + sw.name + ": number " + sw.cfg.number + " is used twice");
    }
  }
  numbers.clear();
  for (const auto& coil : cfg.coils) {
    if (!numbers.insert(coil.cfg.number).second) {
      throw ConfigError("coil." + coil.name + ": number " + coil.cfg.number + " is used twice");
    }
  }

  std::set<std::string> devices;
  for (const auto& af : cfg.autofires) {
    const std::string table = (af.kickback ? "kickback." : "autofire.") + af.name;
    if (!devices.insert(af.name).second) {
      throw ConfigError(table + ": device name is used twice");
    }
    if (!has_name(cfg.coils, af.cfg.coil)) {
      throw ConfigError(table + ": unknown coil '" + af.cfg.coil + "'");
    }
    if (!has_name(cfg.switches, af.cfg.switch_name)) {
      throw ConfigError(table + ": unknown switch '" + af.cfg.switch_name + "'");
    }
  }
  for (const auto& servo : cfg.servos) {
    if (!devices.insert(servo.name).second) {
      throw ConfigError("servo." + servo.name + ": device name is used twice");
    }
    if (!has_name(cfg.servo_controllers, servo.cfg.controller)) {
      throw ConfigError("servo." + servo.name + ": unknown servo_controller '" +
                        servo.cfg.controller + "'");
    }
  }
}

MachineConfig parse_machine_config(const TomlDocument& doc) {
  MachineConfig cfg;
  const auto machine = doc.find("machine");
  if (machine == doc.end()) {
    throw ConfigError("Missing required section [machine]");
  }
  parse_machine(machine->second, cfg.machine);

  // Positions tables are applied after every servo has been read.
  std::vector<std::pair<std::string, const TomlSection*>> positions;

  for (const auto& [table, section] : doc) {
    const std::vector<std::string> parts = split_table_name(table);
    const std::string& kind = parts.front();
    if (parts.size() == 1) {
      if (kind == "machine") {
        continue;
      }
      if (kind == "gpio") {
        parse_gpio(section, cfg.gpio);
        continue;
      }
      if (kind == "playfield") {
        parse_playfield(section, cfg.playfield);
        continue;
      }
    } else if (parts.size() == 2) {
      const std::string& name = parts[1];
      if (kind == "switch") {
        cfg.switches.push_back(parse_switch(name, section));
        continue;
      }
      if (kind == "coil") {
        cfg.coils.push_back(parse_coil(name, section));
        continue;
      }
      if (kind == "autofire" || kind == "kickback") {
        cfg.autofires.push_back(parse_autofire(kind, name, section));
        continue;
      }
      if (kind == "servo_controller") {
        cfg.servo_controllers.push_back(parse_servo_controller(name, section));
        continue;
      }
      if (kind == "servo") {
        cfg.servos.push_back(parse_servo(name, section));
        continue;
      }
    } else if (parts.size() == 3 && kind == "servo" && parts[2] == "positions") {
      positions.emplace_back(parts[1], &section);
      continue;
    }
    throw ConfigError("Unknown section [" + table + "]");
  }

  for (const auto& [name, section] : positions) {
    auto it = std::find_if(cfg.servos.begin(), cfg.servos.end(),
                           [&](const ServoSection& s) { return s.name == name; });
    if (it == cfg.servos.end()) {
      throw ConfigError("[servo." + name + ".positions] has no matching [servo." + name + "]");
    }
    parse_servo_positions(name, *section, *it);
  }

  check_references(cfg);
  return cfg;
}

const char* bool_text(bool value) { return value ? "true" : "false"; }

void print_list(std::ostringstream& oss, const std::vector<std::string>& items) {
  oss << "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    oss << (i == 0 ? "" : ", ") << items[i];
  }
  oss << "]";
}

}  // namespace

const char* platform_kind_name(PlatformKind kind) noexcept {
  switch (kind) {
    case PlatformKind::Virtual:
      return "virtual";
    case PlatformKind::Gpio:
      return "gpio";
  }
  return "virtual";
}

const char* servo_controller_type_name(ServoControllerType type) noexcept {
  switch (type) {
    case ServoControllerType::Pca9685:
      return "pca9685";
    case ServoControllerType::Maestro:
      return "maestro";
    case ServoControllerType::Fast:
      return "fast";
    case ServoControllerType::Pkone:
      return "pkone";
    case ServoControllerType::Pwm:
      return "pwm";
    case ServoControllerType::Virtual:
      return "virtual";
  }
  return "virtual";
}

PlatformKind parse_platform_kind(const std::string& value) {
  if (value == "virtual") {
    return PlatformKind::Virtual;
  }
  if (value == "gpio") {
    return PlatformKind::Gpio;
  }
  throw ConfigError("Invalid platform: " + value + " (expected virtual|gpio)");
}

ServoControllerType parse_servo_controller_type(const std::string& value) {
  for (const auto type : {ServoControllerType::Pca9685, ServoControllerType::Maestro,
                          ServoControllerType::Fast, ServoControllerType::Pkone,
                          ServoControllerType::Pwm, ServoControllerType::Virtual}) {
    if (value == servo_controller_type_name(type)) {
      return type;
    }
  }
  throw ConfigError("Invalid servo controller type: " + value +
                    " (expected pca9685|maestro|fast|pkone|pwm|virtual)");
}

MachineConfig load_machine_config(const std::string& path) {
  return parse_machine_config(parse_toml_file(path));
}

MachineConfig parse_machine_config_string(const std::string& text) {
  return parse_machine_config(parse_toml_string(text));
}

std::string machine_config_to_string(const MachineConfig& cfg) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3);
  oss << "[machine]\n";
  oss << "platform=" << platform_kind_name(cfg.machine.platform) << "\n";
  oss << "loop_hz=" << cfg.machine.loop_hz << ", log_period_ms=" << cfg.machine.log_period_ms
      << ", run_duration_s=" << cfg.machine.run_duration_s << "\n";
  oss << "default_pulse_ms=" << cfg.machine.default_pulse_ms << "\n";
  oss << "start_events=";
  print_list(oss, cfg.machine.start_events);
  oss << "\n";

  if (cfg.machine.platform == PlatformKind::Gpio) {
    oss << "[gpio]\n";
    oss << "output_chip=" << cfg.gpio.lines.output_chip << ", input_chip=" << cfg.gpio.lines.input_chip
        << "\n";
    oss << "recycle_ms=" << cfg.gpio.lines.recycle_ms
        << ", debounce_samples=" << cfg.gpio.lines.debounce_samples
        << ", max_pulse_ms=" << cfg.gpio.lines.max_pulse_ms << ", sim=" << bool_text(cfg.gpio.sim)
        << "\n";
  }

  const devices::BallSearchConfig& bs = cfg.playfield;
  oss << "[playfield]\n";
  oss << "enable_ball_search=" << bool_text(bs.enabled) << ", timeout_ms=" << bs.timeout_ms
      << ", interval_ms=" << bs.interval_ms
      << ", wait_after_iteration_ms=" << bs.wait_after_iteration_ms << "\n";
  oss << "phase_searches=" << bs.phase_searches[0] << "/" << bs.phase_searches[1] << "/"
      << bs.phase_searches[2] << "\n";

  for (const auto& sw : cfg.switches) {
    oss << "[switch." << sw.name << "] number=" << sw.cfg.number
        << ", type=" << rules::switch_type_name(sw.cfg.type)
        << ", debounce=" << rules::debounce_mode_name(sw.cfg.debounce) << "\n";
  }
  for (const auto& coil : cfg.coils) {
    oss << "[coil." << coil.name << "] number=" << coil.cfg.number;
    if (coil.cfg.default_pulse_ms) {
      oss << ", default_pulse_ms=" << *coil.cfg.default_pulse_ms;
    }
    if (coil.cfg.default_pulse_power) {
      oss << ", default_pulse_power=" << *coil.cfg.default_pulse_power;
    }
    if (coil.cfg.max_pulse_ms) {
      oss << ", max_pulse_ms=" << *coil.cfg.max_pulse_ms;
    }
    oss << ", allow_enable=" << bool_text(coil.cfg.allow_enable)
        << ", default_recycle=" << bool_text(coil.cfg.default_recycle) << "\n";
  }
  for (const auto& af : cfg.autofires) {
    oss << "[" << (af.kickback ? "kickback." : "autofire.") << af.name << "] coil=" << af.cfg.coil
        << ", switch=" << af.cfg.switch_name << ", reverse_switch=" << bool_text(af.cfg.reverse_switch)
        << ", debounce=" << devices::debounce_override_name(af.cfg.debounce);
    if (af.cfg.timeout_max_hits > 0) {
      oss << ", timeout=" << af.cfg.timeout_max_hits << " hits/" << af.cfg.timeout_watch_time_ms
          << " ms, off " << af.cfg.timeout_disable_time_ms << " ms";
    }
    oss << ", enable_events=";
    print_list(oss, af.cfg.enable_events);
    oss << "\n";
  }
  for (const auto& ctrl : cfg.servo_controllers) {
    oss << "[servo_controller." << ctrl.name << "] type=" << servo_controller_type_name(ctrl.type);
    switch (ctrl.type) {
      case ServoControllerType::Pca9685:
        oss << ", i2c_bus=" << ctrl.i2c_bus;
        break;
      case ServoControllerType::Maestro:
      case ServoControllerType::Fast:
      case ServoControllerType::Pkone:
        oss << ", port=" << ctrl.port << ", baud=" << ctrl.baud;
        break;
      case ServoControllerType::Pwm:
        oss << ", chip=" << ctrl.chip << ", period_ns=" << ctrl.period_ns;
        break;
      case ServoControllerType::Virtual:
        break;
    }
    if (ctrl.min_value) {
      oss << ", range=" << *ctrl.min_value << ".." << *ctrl.max_value;
    }
    oss << "\n";
  }
  for (const auto& servo : cfg.servos) {
    oss << "[servo." << servo.name << "] controller=" << servo.cfg.controller
        << ", number=" << servo.cfg.number << ", travel=" << servo.cfg.servo_min << ".."
        << servo.cfg.servo_max << ", reset_position=" << servo.cfg.reset_position
        << ", positions=" << servo.cfg.positions.size() << "\n";
  }
  return oss.str();
}

}  // namespace runtime
