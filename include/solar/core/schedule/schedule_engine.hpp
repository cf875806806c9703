// File: include/solar/core/schedule/schedule_engine.hpp
#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "solar/core/config.hpp"
#include "solar/core/safety/battery_safety_monitor.hpp"
#include "solar/core/schedule/schedule_task.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

enum class ActionSource {
  kIdle,      // nothing eligible, envelope safe
  kSchedule,  // routine pick from the daily schedule
  kOverride,  // forced dock return
};

enum class OverrideReason {
  kNone,
  kStaleBattery,
  kLowBattery,
  kPositionOutOfRange,  // already further from the dock than the envelope allows
  kTargetOutOfRange,    // scheduled target lies outside the envelope
};

const char* to_string(ActionSource s) noexcept;
const char* to_string(OverrideReason r) noexcept;

// Transient per-tick output; no persistent identity.
struct SelectedAction {
  ActionSource source = ActionSource::kIdle;
  std::optional<LocationName> target;
  std::vector<std::string> actions;

  // Index of the schedule task that matched this tick (also kept when it was overridden).
  std::optional<std::size_t> task_index;
  OverrideReason reason = OverrideReason::kNone;

  [[nodiscard]] bool is_override() const noexcept { return source == ActionSource::kOverride; }
  [[nodiscard]] bool is_idle() const noexcept { return source == ActionSource::kIdle; }

  // Same decision for change-detection purposes.
  [[nodiscard]] bool same_decision(const SelectedAction& o) const;

  [[nodiscard]] std::string describe() const;
};

enum class EngineState { kIdle, kEvaluating, kSelected };

// Picks the single action for the current tick.
//
// Matching: exact-time tasks match during their minute; window tasks match
// inside [start, end), wrapping past midnight when end < start.
// Tie-break: any exact-time match beats any window match; otherwise the
// earliest-declared task wins.
// Safety: a stale or low-battery envelope, a current position beyond the
// allowed distance, or a target beyond it replaces the pick with the dock
// action, tagged kOverride. Distances are measured from the dock location
// (origin when the dock has no declared position).
//
// tick() calls are serialized internally; a single control thread is expected.
class ScheduleEngine {
 public:
  ScheduleEngine(BatterySafetyConfig safety, std::map<LocationName, Position> locations);

  // Replaces the day's task list. Rejects malformed tasks and unknown targets;
  // on error the previous list stays active.
  Status load(std::vector<ScheduleTask> tasks);

  // Swap safety settings, locations and tasks together (configuration reload).
  Status reconfigure(BatterySafetyConfig safety, std::map<LocationName, Position> locations,
                     std::vector<ScheduleTask> tasks);

  SelectedAction tick(const TimeOfDay& now, const SafetyEnvelope& envelope, const Position& current);

  // Assumes the robot is at the dock.
  SelectedAction tick(const TimeOfDay& now, const SafetyEnvelope& envelope);

  // Schedule-only evaluation (no safety), for inspection and tests.
  [[nodiscard]] std::vector<std::size_t> matching(const TimeOfDay& now) const;
  [[nodiscard]] std::optional<std::size_t> pick(const TimeOfDay& now) const;

  [[nodiscard]] std::optional<double> distance_from_dock(const LocationName& name) const;

  [[nodiscard]] EngineState state() const;
  [[nodiscard]] std::vector<ScheduleTask> tasks() const;
  [[nodiscard]] std::size_t task_count() const;

 private:
  Status check_tasks_locked_(const std::vector<ScheduleTask>& tasks,
                             const std::map<LocationName, Position>& locations) const;
  std::optional<std::size_t> pick_locked_(const TimeOfDay& now) const;
  Position dock_position_locked_() const;
  SelectedAction dock_action_locked_(OverrideReason reason, std::optional<std::size_t> replaced) const;

  mutable std::mutex mu_;
  BatterySafetyConfig safety_;
  std::map<LocationName, Position> locations_;
  std::vector<ScheduleTask> tasks_;
  EngineState state_ = EngineState::kIdle;
};

}  // namespace solar
