// File: include/solar/core/types.hpp
#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

namespace solar {

// -----------------------------
// Basic identifiers
// -----------------------------

using NodeId = std::string;     // e.g. "solar_001"
using RunnerKey = std::string;  // e.g. "pipower", "solar_power"
using LocationName = std::string;

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds. Steady-clock stamps are used for
// intervals and staleness; wall-clock stamps only for reporting.

using DurationNs = std::int64_t;

constexpr DurationNs seconds_to_ns(double seconds) {
  return static_cast<DurationNs>(seconds * 1'000'000'000.0);
}

constexpr double ns_to_seconds(DurationNs ns) {
  return static_cast<double>(ns) * 1e-9;
}

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

inline TimestampNs steady_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return TimestampNs{std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()};
}

inline TimestampNs wall_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return TimestampNs{std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()};
}

// Local wall-clock time of day, second resolution.
struct TimeOfDay {
  int hour = 0;    // 0..23
  int minute = 0;  // 0..59
  int second = 0;  // 0..59

  [[nodiscard]] constexpr int minute_of_day() const noexcept { return hour * 60 + minute; }
  [[nodiscard]] constexpr int second_of_day() const noexcept { return minute_of_day() * 60 + second; }

  [[nodiscard]] constexpr bool is_valid() const noexcept {
    return hour >= 0 && hour < 24 && minute >= 0 && minute < 60 && second >= 0 && second < 60;
  }

  constexpr bool operator==(const TimeOfDay& o) const noexcept {
    return second_of_day() == o.second_of_day();
  }
  constexpr bool operator!=(const TimeOfDay& o) const noexcept { return !(*this == o); }
};

// "HH:MM" (seconds dropped).
std::string to_string(const TimeOfDay& t);

// Local calendar date; only used to detect day rollover.
struct LocalDate {
  int year = 0;
  int month = 0;
  int day = 0;

  constexpr bool operator==(const LocalDate& o) const noexcept {
    return year == o.year && month == o.month && day == o.day;
  }
  constexpr bool operator!=(const LocalDate& o) const noexcept { return !(*this == o); }
};

struct LocalTime {
  LocalDate date;
  TimeOfDay time;
};

// Current local time from the system clock.
LocalTime local_now();

// -----------------------------
// Geometry
// -----------------------------
// Planar position in metres, dock-relative frame.

struct Position {
  double x = 0.0;
  double y = 0.0;
};

inline double distance(const Position& a, const Position& b) {
  return std::hypot(a.x - b.x, a.y - b.y);
}

}  // namespace solar
