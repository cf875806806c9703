// File: src/core/schedule/schedule_task.cpp
#include "solar/core/schedule/schedule_task.hpp"

#include <cctype>
#include <utility>

namespace solar {
namespace {

bool two_digits(const std::string& s, std::size_t pos, int& out) {
  if (pos + 2 > s.size()) return false;
  const unsigned char a = static_cast<unsigned char>(s[pos]);
  const unsigned char b = static_cast<unsigned char>(s[pos + 1]);
  if (!std::isdigit(a) || !std::isdigit(b)) return false;
  out = (a - '0') * 10 + (b - '0');
  return true;
}

std::string trim(const std::string& s) {
  std::size_t b = 0;
  std::size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

}  // namespace

bool ScheduleTask::wraps_midnight() const noexcept {
  return trigger == TriggerKind::kWindow &&
         window.end.second_of_day() < window.start.second_of_day();
}

bool ScheduleTask::matches(const TimeOfDay& now) const noexcept {
  if (trigger == TriggerKind::kExactTime) {
    return now.minute_of_day() == at.minute_of_day();
  }

  const int t = now.second_of_day();
  const int s = window.start.second_of_day();
  const int e = window.end.second_of_day();

  if (s == e) return false;
  if (s < e) return t >= s && t < e;
  // Spans midnight: [s, 24:00) U [00:00, e)
  return t >= s || t < e;
}

std::string ScheduleTask::describe() const {
  std::string when = trigger == TriggerKind::kExactTime
                         ? to_string(at)
                         : to_string(window.start) + "-" + to_string(window.end);
  return (category.empty() ? std::string("task") : category) + "@" + when;
}

ScheduleTask make_exact_task(TimeOfDay at, std::string category, std::optional<LocationName> target,
                             std::vector<std::string> actions) {
  ScheduleTask t;
  t.trigger = TriggerKind::kExactTime;
  t.at = at;
  t.category = std::move(category);
  t.target = std::move(target);
  t.actions = std::move(actions);
  return t;
}

ScheduleTask make_window_task(TimeRange window, std::string category,
                              std::optional<LocationName> target, std::vector<std::string> actions) {
  ScheduleTask t;
  t.trigger = TriggerKind::kWindow;
  t.window = window;
  t.category = std::move(category);
  t.target = std::move(target);
  t.actions = std::move(actions);
  return t;
}

Result<TimeOfDay> parse_time_of_day(const std::string& raw) {
  const std::string s = trim(raw);
  int h = 0;
  int m = 0;
  if (s.size() != 5 || s[2] != ':' || !two_digits(s, 0, h) || !two_digits(s, 3, m)) {
    return Result<TimeOfDay>::err(Status::parse_error("time must be HH:MM, got '" + raw + "'"));
  }
  const TimeOfDay t{h, m, 0};
  if (!t.is_valid()) {
    return Result<TimeOfDay>::err(Status::out_of_range("time out of range: '" + raw + "'"));
  }
  return Result<TimeOfDay>::ok(t);
}

Result<TimeRange> parse_time_range(const std::string& s) {
  const auto dash = s.find('-');
  if (dash == std::string::npos) {
    return Result<TimeRange>::err(Status::parse_error("time range must be HH:MM-HH:MM, got '" + s + "'"));
  }

  auto start = parse_time_of_day(s.substr(0, dash));
  if (!start.ok()) return Result<TimeRange>::err(start.status());
  auto end = parse_time_of_day(s.substr(dash + 1));
  if (!end.ok()) return Result<TimeRange>::err(end.status());

  TimeRange r{start.take_value(), end.take_value()};
  if (r.start == r.end) {
    return Result<TimeRange>::err(Status::invalid_argument("time range is empty: '" + s + "'"));
  }
  return Result<TimeRange>::ok(r);
}

Status validate_task(const ScheduleTask& task) {
  const std::string name = task.describe();
  if (task.trigger == TriggerKind::kExactTime) {
    if (!task.at.is_valid()) return Status::invalid_argument(name + ": invalid trigger time");
  } else {
    if (!task.window.start.is_valid() || !task.window.end.is_valid()) {
      return Status::invalid_argument(name + ": invalid window bounds");
    }
    if (task.window.start == task.window.end) {
      return Status::invalid_argument(name + ": window is empty");
    }
  }
  if (task.actions.empty()) return Status::invalid_argument(name + ": actions must not be empty");
  for (const auto& a : task.actions) {
    if (a.empty()) return Status::invalid_argument(name + ": action names must not be empty");
  }
  if (task.target && task.target->empty()) {
    return Status::invalid_argument(name + ": target must not be empty when given");
  }
  return Status::ok_status();
}

}  // namespace solar
