// File: include/solar/runners/power_monitor_runner.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "solar/core/io/power_sensor.hpp"
#include "solar/core/runner/runner.hpp"
#include "solar/core/status.hpp"

namespace solar {

struct PowerMonitorSettings {
  std::uint8_t i2c_address = 0x40;
  bool log_measurements = true;

  double low_power_threshold_w = 0.5;
  double high_power_threshold_w = 10.0;
  int alert_after = 3;  // consecutive out-of-band readings before alerting

  std::size_t history_size = 100;
};

struct PowerStats {
  double avg_voltage_v = 0.0;
  double avg_current_a = 0.0;
  double avg_power_w = 0.0;
  double min_power_w = 0.0;
  double max_power_w = 0.0;
  std::size_t sample_count = 0;
};

// Runner type "ina219": samples a power sensor every interval, keeps a
// bounded history and raises low/high power alerts.
class PowerMonitorRunner final : public Runner {
 public:
  PowerMonitorRunner(RunnerConfig cfg, PowerMonitorSettings settings, std::unique_ptr<IPowerSensor> sensor);

  std::optional<PowerReading> last_reading() const;
  std::optional<PowerStats> stats() const;

  // Oldest first; count == 0 returns everything kept.
  std::vector<PowerReading> history(std::size_t count = 0) const;

  const PowerMonitorSettings& settings() const noexcept { return settings_; }

 protected:
  Status initialize() override;
  Status work_cycle() override;
  bool healthy_impl() const override;
  void cleanup() override;

 private:
  void check_alerts_(const PowerReading& r);

  const PowerMonitorSettings settings_;
  std::unique_ptr<IPowerSensor> sensor_;  // worker thread only

  mutable std::mutex data_mu_;
  std::deque<PowerReading> history_;
  int consecutive_low_ = 0;
  int consecutive_high_ = 0;
};

// Reads the type-specific fields of an "ina219" runner entry.
Result<PowerMonitorSettings> parse_power_monitor_settings(const YAML::Node& params);

// Factory creator for "ina219" (simulated adapter only).
Result<std::shared_ptr<Runner>> make_power_monitor_runner(const RunnerConfig& cfg);

}  // namespace solar
