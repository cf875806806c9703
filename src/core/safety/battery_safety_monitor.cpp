// File: src/core/safety/battery_safety_monitor.cpp
#include "solar/core/safety/battery_safety_monitor.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace solar {

BatterySafetyMonitor::BatterySafetyMonitor(BatterySafetyConfig cfg) : cfg_(std::move(cfg)) {}

Status BatterySafetyMonitor::sample(double percentage, TimestampNs at) {
  if (!std::isfinite(percentage) || percentage < 0.0 || percentage > 100.0) {
    return Status::invalid_argument("battery percentage out of range: " + std::to_string(percentage));
  }
  std::lock_guard<std::mutex> lock(mu_);
  latest_ = BatteryState{percentage, at};
  return Status::ok_status();
}

std::optional<BatteryState> BatterySafetyMonitor::latest() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_;
}

SafetyEnvelope BatterySafetyMonitor::compute(double percentage, const BatterySafetyConfig& cfg) {
  SafetyEnvelope env;
  env.battery_percentage = percentage;
  env.allowed_distance_m = cfg.max_distance_factor * (percentage / 100.0) * cfg.total_range_m;
  env.low_battery = percentage < cfg.min_battery_threshold;
  env.stale = false;
  return env;
}

SafetyEnvelope BatterySafetyMonitor::envelope(TimestampNs now) const {
  std::optional<BatteryState> s;
  {
    std::lock_guard<std::mutex> lock(mu_);
    s = latest_;
  }

  if (!s) return SafetyEnvelope{};  // conservative defaults

  const DurationNs age = now.ns - s->sampled_at.ns;
  if (age > seconds_to_ns(cfg_.stale_after_s)) {
    SafetyEnvelope env;
    env.battery_percentage = s->percentage;
    return env;  // low_battery + stale, zero distance
  }

  return compute(s->percentage, cfg_);
}

}  // namespace solar
