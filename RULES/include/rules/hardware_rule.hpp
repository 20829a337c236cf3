#pragma once

#include "rules/driver.hpp"
#include "rules/platform.hpp"
#include "rules/switch.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace rules {

struct SwitchRuleSettings {
  const Switch* input = nullptr;
  bool invert = false;
  bool debounce = false;
};

struct DriverRuleSettings {
  const Driver* driver = nullptr;
  bool recycle = false;
};

struct PulseRuleSettings {
  std::optional<uint32_t> duration_ms;
  std::optional<double> power;
};

struct HoldRuleSettings {
  std::optional<double> power;
};

// Handle for an armed rule. Holds every switch binding it created so all can be released.
struct HardwareRule {
  Platform* platform = nullptr;
  std::vector<SwitchSettings> switch_settings;
  DriverSettings driver_settings;
};

}  // namespace rules
