// File: include/solar/core/config.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "solar/core/events/event_sink.hpp"
#include "solar/core/schedule/schedule_task.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

// Units policy:
// - Distances in metres
// - Battery in percent [0, 100]
// - Durations in seconds at the config surface, nanoseconds internally

// -----------------------------
// Battery safety envelope
// -----------------------------
struct BatterySafetyConfig {
  // Below this percentage the robot is forced back to the dock.
  double min_battery_threshold = 20.0;

  // allowed_distance = max_distance_factor * (battery / 100) * total_range_m
  double max_distance_factor = 0.5;
  double total_range_m = 100.0;

  // How often the control loop pulls a fresh battery sample.
  double update_interval_s = 1.0;

  // No sample within this window means "low battery".
  double stale_after_s = 5.0;

  LocationName dock_target = "Dock";
  std::vector<std::string> dock_actions{"charge"};
};

// -----------------------------
// Runners
// -----------------------------
enum class RunBehavior {
  kContinuous,  // cycle every interval
  kScheduled,   // cycle once during schedule_time each day
};

struct RunnerConfig {
  RunnerKey key;
  std::string type;  // factory tag, e.g. "ina219", "pipower"
  bool enabled = true;
  std::string label;  // defaults to key

  double interval_s = 1.0;
  int max_consecutive_errors = 3;
  int max_init_attempts = 1;

  RunBehavior behavior = RunBehavior::kContinuous;
  std::optional<TimeOfDay> schedule_time;

  // Type-specific fields; opaque to the framework, parsed by the runner's creator.
  YAML::Node params;
};

// -----------------------------
// Application
// -----------------------------
struct ApplicationConfig {
  // false: no runner is instantiated at all.
  bool threaded_runners = true;

  double main_loop_interval_s = 2.0;
  double shutdown_timeout_s = 5.0;

  int heartbeat_every_s = 30;     // 0 disables
  int status_report_every_s = 0;  // 0 disables

  // Runner whose readings feed the battery safety monitor.
  RunnerKey battery_source = "pipower";

  std::int64_t max_ticks = 0;  // 0 disables
  double max_run_s = 0.0;      // 0 disables

  BatterySafetyConfig battery_safety;
};

// -----------------------------
// Output (events + logs)
// -----------------------------
struct OutputConfig {
  std::string out_dir = "out";
  int keep_last_runs = 50;
  Severity min_severity = Severity::kInfo;
  bool echo_to_stderr = true;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  NodeId node_id = "solar_001";

  ApplicationConfig application;

  // Declaration order is start order.
  std::vector<RunnerConfig> runners;

  // Declaration order is the schedule tie-break.
  std::vector<ScheduleTask> tasks;

  std::map<LocationName, Position> locations;

  OutputConfig output;
};

Status validate_battery_safety(const BatterySafetyConfig& b);
Status validate_runner_config(const RunnerConfig& r);

// Strict; fail early. Covers every section including cross references
// (task targets and the dock must exist in locations).
Status validate_config(const Config& cfg);

}  // namespace solar
