#pragma once

#include "devices/autofire.hpp"

#include <string>

namespace devices {

// Autofire that also announces every hit as kickback_<name>_fired.
class Kickback final : public AutofireCoil {
 public:
  using AutofireCoil::AutofireCoil;

  [[nodiscard]] std::string fired_event() const { return "kickback_" + name() + "_fired"; }
  [[nodiscard]] const char* type_name() const noexcept override { return "kickback"; }

 protected:
  void hit() override;
};

// Kickbacks start disabled until a mode enables them.
AutofireConfig default_kickback_config();

}  // namespace devices
