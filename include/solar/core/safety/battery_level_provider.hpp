// File: include/solar/core/safety/battery_level_provider.hpp
#pragma once

#include <optional>

#include "solar/core/safety/battery_safety_monitor.hpp"

namespace solar {

// Anything that can report the battery charge for the safety monitor.
class IBatteryLevelProvider {
 public:
  virtual ~IBatteryLevelProvider() = default;

  // Latest known level with the steady time it was measured at; nullopt when
  // nothing usable has been read yet.
  virtual std::optional<BatteryState> battery_level() const = 0;
};

}  // namespace solar
