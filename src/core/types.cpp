// File: src/core/types.cpp
#include "solar/core/types.hpp"

#include <cstdio>
#include <ctime>

namespace solar {

std::string to_string(const TimeOfDay& t) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", t.hour, t.minute);
  return std::string(buf);
}

LocalTime local_now() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);

  LocalTime out;
  out.date = LocalDate{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
  // tm_sec can be 60 on a leap second.
  out.time = TimeOfDay{tm.tm_hour, tm.tm_min, tm.tm_sec > 59 ? 59 : tm.tm_sec};
  return out;
}

}  // namespace solar
