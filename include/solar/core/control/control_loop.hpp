// File: include/solar/core/control/control_loop.hpp
#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "solar/core/config.hpp"
#include "solar/core/control/action_executor.hpp"
#include "solar/core/events/event_log.hpp"
#include "solar/core/runner/runner_manager.hpp"
#include "solar/core/safety/battery_level_provider.hpp"
#include "solar/core/safety/battery_safety_monitor.hpp"
#include "solar/core/schedule/schedule_engine.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

// Fresh schedule for a new day. Locations travel with the tasks so new
// targets resolve against the same file generation.
struct ScheduleSnapshot {
  std::vector<ScheduleTask> tasks;
  std::map<LocationName, Position> locations;
};

struct TickResult {
  SelectedAction action;
  SafetyEnvelope envelope;
  bool changed = false;  // differs from the previous tick's selection
};

// Process-wide driver on the control thread.
//
// Per tick:
//  1. apply a queued reconfiguration, if any
//  2. reload the schedule on local day rollover
//  3. pull a battery level from the provider when update_interval has passed
//  4. compute the envelope and ask the engine for the action
//  5. log the action when it changed; hand it to the executor until it
//     is accepted
//  6. health check, heartbeat and periodic status report
class ControlLoop {
 public:
  using ScheduleReload = std::function<Result<ScheduleSnapshot>()>;
  using PositionSource = std::function<Position()>;

  ControlLoop(Config cfg, RunnerManager& runners, std::shared_ptr<EventLog> log,
              IActionExecutor* executor = nullptr);

  // Loads the configured schedule into the engine.
  Status init();

  // Fixed provider instead of looking up application.battery_source in the
  // runner manager on every sample.
  void set_battery_provider(std::shared_ptr<const IBatteryLevelProvider> provider);

  // Called on day rollover; without it the current schedule is kept.
  void set_schedule_reload(ScheduleReload fn);

  // Robot position for the distance check; without it the robot is assumed docked.
  void set_position_source(PositionSource fn);

  TickResult tick_once(const LocalTime& now, TimestampNs steady_now);
  TickResult tick_once() { return tick_once(local_now(), steady_now_ns()); }

  // Ticks every main_loop_interval until stop is requested or a max_ticks /
  // max_run_s limit is hit.
  Status run(std::stop_token stop);

  // Thread-safe. Applied at the start of the next tick.
  void request_reconfigure(Config next);

  [[nodiscard]] std::int64_t tick_count() const noexcept { return ticks_; }
  [[nodiscard]] const std::optional<SelectedAction>& last_action() const noexcept { return last_; }
  [[nodiscard]] const Config& config() const noexcept { return cfg_; }
  [[nodiscard]] const ScheduleEngine& engine() const noexcept { return engine_; }
  [[nodiscard]] const BatterySafetyMonitor& safety() const noexcept { return *safety_; }

 private:
  void apply_pending_reconfigure_();
  void maybe_reload_schedule_(const LocalTime& now);
  void maybe_sample_battery_(TimestampNs steady_now);
  std::shared_ptr<const IBatteryLevelProvider> resolve_provider_() const;
  void log_selection_(const TickResult& r);
  // False when the executor threw.
  bool dispatch_(const SelectedAction& action);
  void periodic_(TimestampNs steady_now, const SafetyEnvelope& env);
  void log_(Severity severity, const std::string& type, const std::string& message) const;

  Config cfg_;
  RunnerManager& runners_;
  std::shared_ptr<EventLog> log_sink_;
  IActionExecutor* executor_;

  ScheduleEngine engine_;
  std::unique_ptr<BatterySafetyMonitor> safety_;

  std::shared_ptr<const IBatteryLevelProvider> fixed_provider_;
  ScheduleReload reload_;
  PositionSource position_;

  std::optional<SelectedAction> last_;
  std::optional<LocalDate> last_date_;
  std::optional<TimestampNs> last_sample_attempt_;
  TimestampNs last_fed_sample_;
  bool was_stale_ = false;
  // The last selection reached the executor.
  bool delivered_ = true;
  std::optional<TimestampNs> last_heartbeat_;
  std::optional<TimestampNs> last_status_report_;
  std::int64_t ticks_ = 0;

  std::mutex pending_mu_;
  std::optional<Config> pending_;

  std::mutex sleep_mu_;
  std::condition_variable_any sleep_cv_;
};

}  // namespace solar
