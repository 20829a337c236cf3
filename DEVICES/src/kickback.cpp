#include "devices/kickback.hpp"

namespace devices {

// The base hit may trip the rate limiter and disable the kickback; it stays silent then.
void Kickback::hit() {
  AutofireCoil::hit();
  if (enabled()) {
    events().post(fired_event());
  }
}

AutofireConfig default_kickback_config() {
  AutofireConfig cfg;
  cfg.enable_events.clear();
  return cfg;
}

}  // namespace devices
