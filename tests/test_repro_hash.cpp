// File: tests/test_repro_hash.cpp
#include <gtest/gtest.h>

#include "solar/core/util/repro_hash.hpp"

namespace solar {
namespace {

Config sample_config() {
  Config c;
  c.locations["Dock"] = Position{0.0, 0.0};
  c.locations["PlantA"] = Position{10.0, 5.0};
  c.tasks = {make_exact_task(TimeOfDay{6, 45, 0}, "system_check", std::nullopt, {"diagnostics"})};
  RunnerConfig r;
  r.key = "pipower";
  r.type = "pipower";
  r.params = YAML::Load("{empty_voltage: 6.0}");
  c.runners.push_back(r);
  return c;
}

TEST(ReproHash, StableForEqualConfigs) {
  const std::string h = compute_config_hash(sample_config());
  EXPECT_EQ(h.size(), 16u);
  EXPECT_EQ(h, compute_config_hash(sample_config()));
}

TEST(ReproHash, ChangesWithAnyRelevantField) {
  const std::string base = compute_config_hash(sample_config());

  Config threshold = sample_config();
  threshold.application.battery_safety.min_battery_threshold = 25.0;
  EXPECT_NE(compute_config_hash(threshold), base);

  Config params = sample_config();
  params.runners[0].params = YAML::Load("{empty_voltage: 6.2}");
  EXPECT_NE(compute_config_hash(params), base);

  Config moved = sample_config();
  moved.locations["PlantA"].x = 11.0;
  EXPECT_NE(compute_config_hash(moved), base);
}

TEST(ReproHash, ScheduleHashTracksTasksAndLocations) {
  const Config c = sample_config();
  const std::string base = compute_schedule_hash(c.tasks, c.locations);

  auto tasks = c.tasks;
  tasks[0].actions.push_back("sensor_check");
  EXPECT_NE(compute_schedule_hash(tasks, c.locations), base);

  auto locations = c.locations;
  locations["PlantB"] = Position{20.0, 15.0};
  EXPECT_NE(compute_schedule_hash(c.tasks, locations), base);
}

}  // namespace
}  // namespace solar
