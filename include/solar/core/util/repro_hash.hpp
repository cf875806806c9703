// File: include/solar/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "solar/core/config.hpp"

namespace solar {

// Hash the full runtime config (runners, schedule, safety envelope, output).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

// Hash only the schedule + locations (what the decision engine sees).
// Goal: schedule edits should be obvious in logs after a reload.
std::string compute_schedule_hash(const std::vector<ScheduleTask>& tasks,
                                  const std::map<LocationName, Position>& locations);

}  // namespace solar
