// File: src/core/schedule/schedule_engine.cpp
#include "solar/core/schedule/schedule_engine.hpp"

#include <sstream>
#include <utility>

namespace solar {

const char* to_string(ActionSource s) noexcept {
  switch (s) {
    case ActionSource::kIdle: return "idle";
    case ActionSource::kSchedule: return "schedule";
    case ActionSource::kOverride: return "override";
  }
  return "idle";
}

const char* to_string(OverrideReason r) noexcept {
  switch (r) {
    case OverrideReason::kNone: return "none";
    case OverrideReason::kStaleBattery: return "stale_battery";
    case OverrideReason::kLowBattery: return "low_battery";
    case OverrideReason::kPositionOutOfRange: return "position_out_of_range";
    case OverrideReason::kTargetOutOfRange: return "target_out_of_range";
  }
  return "none";
}

bool SelectedAction::same_decision(const SelectedAction& o) const {
  return source == o.source && target == o.target && actions == o.actions &&
         task_index == o.task_index && reason == o.reason;
}

std::string SelectedAction::describe() const {
  std::ostringstream ss;
  ss << "source=" << to_string(source);
  if (target) ss << " target=" << *target;
  ss << " actions=[";
  for (std::size_t i = 0; i < actions.size(); ++i) {
    if (i) ss << ",";
    ss << actions[i];
  }
  ss << "]";
  if (task_index) ss << " task=" << *task_index;
  if (is_override()) ss << " reason=" << to_string(reason);
  return ss.str();
}

ScheduleEngine::ScheduleEngine(BatterySafetyConfig safety, std::map<LocationName, Position> locations)
    : safety_(std::move(safety)), locations_(std::move(locations)) {}

Status ScheduleEngine::check_tasks_locked_(const std::vector<ScheduleTask>& tasks,
                                           const std::map<LocationName, Position>& locations) const {
  for (std::size_t i = 0; i < tasks.size(); ++i) {
    const auto& t = tasks[i];
    const Status st = validate_task(t);
    if (!st.ok()) {
      return Status::invalid_argument("task " + std::to_string(i) + ": " + st.message());
    }
    if (t.target && *t.target != safety_.dock_target && locations.find(*t.target) == locations.end()) {
      return Status::invalid_argument("task " + std::to_string(i) + ": unknown target '" + *t.target + "'");
    }
  }
  return Status::ok_status();
}

Status ScheduleEngine::load(std::vector<ScheduleTask> tasks) {
  std::lock_guard<std::mutex> lock(mu_);
  SOLAR_RETURN_IF_ERROR(check_tasks_locked_(tasks, locations_));
  tasks_ = std::move(tasks);
  state_ = EngineState::kIdle;
  return Status::ok_status();
}

Status ScheduleEngine::reconfigure(BatterySafetyConfig safety, std::map<LocationName, Position> locations,
                                   std::vector<ScheduleTask> tasks) {
  SOLAR_RETURN_IF_ERROR(validate_battery_safety(safety));

  std::lock_guard<std::mutex> lock(mu_);
  // Validate against the incoming settings before touching anything.
  std::swap(safety_, safety);
  const Status st = check_tasks_locked_(tasks, locations);
  if (!st.ok()) {
    std::swap(safety_, safety);
    return st;
  }
  locations_ = std::move(locations);
  tasks_ = std::move(tasks);
  state_ = EngineState::kIdle;
  return Status::ok_status();
}

std::vector<std::size_t> ScheduleEngine::matching(const TimeOfDay& now) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    if (tasks_[i].matches(now)) out.push_back(i);
  }
  return out;
}

std::optional<std::size_t> ScheduleEngine::pick(const TimeOfDay& now) const {
  std::lock_guard<std::mutex> lock(mu_);
  return pick_locked_(now);
}

std::optional<std::size_t> ScheduleEngine::pick_locked_(const TimeOfDay& now) const {
  std::optional<std::size_t> first_window;
  for (std::size_t i = 0; i < tasks_.size(); ++i) {
    const ScheduleTask& t = tasks_[i];
    if (!t.matches(now)) continue;
    // Earliest-declared exact match wins outright.
    if (t.trigger == TriggerKind::kExactTime) return i;
    if (!first_window) first_window = i;
  }
  return first_window;
}

Position ScheduleEngine::dock_position_locked_() const {
  const auto it = locations_.find(safety_.dock_target);
  return it == locations_.end() ? Position{} : it->second;
}

std::optional<double> ScheduleEngine::distance_from_dock(const LocationName& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  if (name == safety_.dock_target) return 0.0;
  const auto it = locations_.find(name);
  if (it == locations_.end()) return std::nullopt;
  return distance(it->second, dock_position_locked_());
}

SelectedAction ScheduleEngine::dock_action_locked_(OverrideReason reason,
                                                   std::optional<std::size_t> replaced) const {
  SelectedAction a;
  a.source = ActionSource::kOverride;
  a.target = safety_.dock_target;
  a.actions = safety_.dock_actions;
  a.task_index = replaced;
  a.reason = reason;
  return a;
}

SelectedAction ScheduleEngine::tick(const TimeOfDay& now, const SafetyEnvelope& envelope,
                                    const Position& current) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = EngineState::kEvaluating;

  const std::optional<std::size_t> picked = pick_locked_(now);

  SelectedAction out;
  if (picked) {
    const ScheduleTask& t = tasks_[*picked];
    out.source = ActionSource::kSchedule;
    out.target = t.target;
    out.actions = t.actions;
    out.task_index = picked;
  }

  const Position dock = dock_position_locked_();

  if (envelope.stale) {
    out = dock_action_locked_(OverrideReason::kStaleBattery, picked);
  } else if (envelope.low_battery) {
    out = dock_action_locked_(OverrideReason::kLowBattery, picked);
  } else if (distance(current, dock) > envelope.allowed_distance_m) {
    out = dock_action_locked_(OverrideReason::kPositionOutOfRange, picked);
  } else if (out.target && *out.target != safety_.dock_target) {
    const auto it = locations_.find(*out.target);
    // load() guarantees targets are known; an unknown one is treated as unreachable.
    const bool reachable =
        it != locations_.end() && distance(it->second, dock) <= envelope.allowed_distance_m;
    if (!reachable) out = dock_action_locked_(OverrideReason::kTargetOutOfRange, picked);
  }

  state_ = EngineState::kSelected;
  return out;
}

SelectedAction ScheduleEngine::tick(const TimeOfDay& now, const SafetyEnvelope& envelope) {
  Position at_dock;
  {
    std::lock_guard<std::mutex> lock(mu_);
    at_dock = dock_position_locked_();
  }
  return tick(now, envelope, at_dock);
}

EngineState ScheduleEngine::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::vector<ScheduleTask> ScheduleEngine::tasks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_;
}

std::size_t ScheduleEngine::task_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tasks_.size();
}

}  // namespace solar
