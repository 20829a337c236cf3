#include "rules/platform.hpp"

namespace rules {

const char* switch_type_name(SwitchType type) noexcept {
  switch (type) {
    case SwitchType::NormallyOpen:
      return "NO";
    case SwitchType::NormallyClosed:
      return "NC";
  }
  return "NO";
}

const char* debounce_mode_name(DebounceMode mode) noexcept {
  switch (mode) {
    case DebounceMode::Auto:
      return "auto";
    case DebounceMode::Quick:
      return "quick";
    case DebounceMode::Normal:
      return "normal";
  }
  return "auto";
}

SwitchType parse_switch_type(const std::string& value) {
  if (value == "NO") {
    return SwitchType::NormallyOpen;
  }
  if (value == "NC") {
    return SwitchType::NormallyClosed;
  }
  throw ConfigError("Invalid switch type: " + value + " (expected NO|NC)");
}

DebounceMode parse_debounce_mode(const std::string& value) {
  if (value == "auto") {
    return DebounceMode::Auto;
  }
  if (value == "quick") {
    return DebounceMode::Quick;
  }
  if (value == "normal") {
    return DebounceMode::Normal;
  }
  throw ConfigError("Invalid debounce mode: " + value + " (expected auto|quick|normal)");
}

}  // namespace rules
