// File: include/solar/core/schedule/schedule_task.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

enum class TriggerKind {
  kExactTime,  // fires only during its exact minute
  kWindow,     // eligible across [start, end), wrapping past midnight when end < start
};

struct TimeRange {
  TimeOfDay start;
  TimeOfDay end;
};

// One declared entry of the daily schedule. Immutable once loaded.
struct ScheduleTask {
  TriggerKind trigger = TriggerKind::kExactTime;
  TimeOfDay at;      // kExactTime
  TimeRange window;  // kWindow

  std::string category;  // e.g. "navigation", "system_check"
  std::optional<LocationName> target;
  std::vector<std::string> actions;

  [[nodiscard]] bool matches(const TimeOfDay& now) const noexcept;
  [[nodiscard]] bool wraps_midnight() const noexcept;

  // "navigation@07:00-10:00", "system_check@06:45"
  [[nodiscard]] std::string describe() const;
};

ScheduleTask make_exact_task(TimeOfDay at, std::string category, std::optional<LocationName> target,
                             std::vector<std::string> actions);
ScheduleTask make_window_task(TimeRange window, std::string category,
                              std::optional<LocationName> target, std::vector<std::string> actions);

// Strict "HH:MM", 24h clock.
Result<TimeOfDay> parse_time_of_day(const std::string& s);

// "HH:MM-HH:MM". A zero-length range is rejected.
Result<TimeRange> parse_time_range(const std::string& s);

// Structural checks only (times valid, non-empty actions, non-empty window).
Status validate_task(const ScheduleTask& task);

}  // namespace solar
