// File: src/core/config.cpp
#include "solar/core/config.hpp"

#include <cmath>
#include <set>

namespace solar {

Status validate_battery_safety(const BatterySafetyConfig& b) {
  if (!std::isfinite(b.min_battery_threshold) || b.min_battery_threshold < 0.0 ||
      b.min_battery_threshold > 100.0) {
    return Status::invalid_argument("battery_safety.min_battery_threshold must be in [0, 100]");
  }
  if (!std::isfinite(b.max_distance_factor) || b.max_distance_factor < 0.0) {
    return Status::invalid_argument("battery_safety.max_distance_factor must be >= 0");
  }
  if (!std::isfinite(b.total_range_m) || b.total_range_m < 0.0) {
    return Status::invalid_argument("battery_safety.total_range must be >= 0");
  }
  if (b.update_interval_s <= 0.0) {
    return Status::invalid_argument("battery_safety.update_interval must be > 0");
  }
  if (b.stale_after_s <= 0.0) {
    return Status::invalid_argument("battery_safety.stale_after_s must be > 0");
  }
  if (b.dock_target.empty()) {
    return Status::invalid_argument("battery_safety.dock_target must not be empty");
  }
  if (b.dock_actions.empty()) {
    return Status::invalid_argument("battery_safety.dock_actions must not be empty");
  }
  return Status::ok_status();
}

Status validate_runner_config(const RunnerConfig& r) {
  if (r.key.empty()) return Status::invalid_argument("runner key must not be empty");
  const std::string where = "runners." + r.key;
  if (r.type.empty()) return Status::invalid_argument(where + ".type must not be empty");
  if (r.interval_s <= 0.0) return Status::invalid_argument(where + ".measurement_interval must be > 0");
  if (r.max_consecutive_errors < 0) {
    return Status::invalid_argument(where + ".max_consecutive_errors must be >= 0");
  }
  if (r.max_init_attempts < 1) return Status::invalid_argument(where + ".max_init_attempts must be >= 1");
  if (r.behavior == RunBehavior::kScheduled && !r.schedule_time) {
    return Status::invalid_argument(where + ".schedule_time is required for run_behavior=scheduled");
  }
  return Status::ok_status();
}

Status validate_config(const Config& cfg) {
  if (cfg.node_id.empty()) {
    return Status::invalid_argument("node_id must not be empty");
  }

  const ApplicationConfig& app = cfg.application;
  if (app.main_loop_interval_s <= 0.0) {
    return Status::invalid_argument("application.main_loop_interval must be > 0");
  }
  if (app.shutdown_timeout_s < 0.0) {
    return Status::invalid_argument("application.shutdown_timeout must be >= 0");
  }
  if (app.heartbeat_every_s < 0) {
    return Status::invalid_argument("application.heartbeat_every_s must be >= 0");
  }
  if (app.status_report_every_s < 0) {
    return Status::invalid_argument("application.status_report_every_s must be >= 0");
  }
  if (app.max_ticks < 0) {
    return Status::invalid_argument("application.max_ticks must be >= 0");
  }
  if (app.max_run_s < 0.0) {
    return Status::invalid_argument("application.max_run_s must be >= 0");
  }
  SOLAR_RETURN_IF_ERROR(validate_battery_safety(app.battery_safety));

  std::set<RunnerKey> keys;
  for (const auto& r : cfg.runners) {
    SOLAR_RETURN_IF_ERROR(validate_runner_config(r));
    if (!keys.insert(r.key).second) {
      return Status::invalid_argument("duplicate runner key: " + r.key);
    }
  }

  if (cfg.locations.find(app.battery_safety.dock_target) == cfg.locations.end()) {
    return Status::invalid_argument("locations must contain the dock target '" +
                                    app.battery_safety.dock_target + "'");
  }

  for (std::size_t i = 0; i < cfg.tasks.size(); ++i) {
    const auto& t = cfg.tasks[i];
    const Status st = validate_task(t);
    if (!st.ok()) {
      return Status::invalid_argument("tasks[" + std::to_string(i) + "]: " + st.message());
    }
    if (t.target && cfg.locations.find(*t.target) == cfg.locations.end()) {
      return Status::invalid_argument("tasks[" + std::to_string(i) + "]: unknown target location '" +
                                      *t.target + "'");
    }
  }

  if (cfg.output.out_dir.empty()) {
    return Status::invalid_argument("output.out_dir must not be empty");
  }
  if (cfg.output.keep_last_runs < 0) {
    return Status::invalid_argument("output.keep_last_runs must be >= 0");
  }
  return Status::ok_status();
}

}  // namespace solar
