// File: include/solar/core/safety/battery_safety_monitor.hpp
#pragma once

#include <mutex>
#include <optional>

#include "solar/core/config.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

struct BatteryState {
  double percentage = 0.0;  // [0, 100]
  TimestampNs sampled_at;   // steady clock
};

// Derived per evaluation; never cached across ticks.
struct SafetyEnvelope {
  double battery_percentage = 0.0;  // value the envelope was computed from
  double allowed_distance_m = 0.0;
  bool low_battery = true;
  bool stale = true;  // no sample, or older than stale_after_s
};

// Holds the latest battery sample and turns it into a safety envelope.
//
//  allowed_distance = max_distance_factor * (pct / 100) * total_range
//  low_battery      = pct < min_battery_threshold   (the threshold itself is not low)
//
// Missing or stale data is never "safe": the envelope reports low_battery with
// zero allowed distance. Thread-safe.
class BatterySafetyMonitor {
 public:
  explicit BatterySafetyMonitor(BatterySafetyConfig cfg);

  // Rejects NaN / out-of-range values without touching the previous sample.
  Status sample(double percentage, TimestampNs at);
  Status sample(double percentage) { return sample(percentage, steady_now_ns()); }

  [[nodiscard]] SafetyEnvelope envelope(TimestampNs now) const;
  [[nodiscard]] SafetyEnvelope envelope() const { return envelope(steady_now_ns()); }

  [[nodiscard]] std::optional<BatteryState> latest() const;

  [[nodiscard]] const BatterySafetyConfig& config() const noexcept { return cfg_; }

  // Pure envelope math for a known-fresh percentage.
  [[nodiscard]] static SafetyEnvelope compute(double percentage, const BatterySafetyConfig& cfg);

 private:
  BatterySafetyConfig cfg_;

  mutable std::mutex mu_;
  std::optional<BatteryState> latest_;
};

}  // namespace solar
