// File: include/solar/runners/ups_monitor_runner.hpp
#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "solar/core/io/ups_sensor.hpp"
#include "solar/core/runner/runner.hpp"
#include "solar/core/safety/battery_level_provider.hpp"
#include "solar/core/status.hpp"

namespace solar {

struct UpsMonitorSettings {
  // Linear voltage -> percent mapping (2S Li-ion pack by default).
  double empty_voltage_v = 6.0;
  double full_voltage_v = 8.4;

  int low_battery_alert_threshold = 3;  // consecutive low-battery readings
  int no_usb_alert_threshold = 3;       // consecutive readings without USB input

  bool log_readings = true;
  std::size_t history_size = 100;
};

struct UpsStats {
  std::optional<double> avg_battery_voltage_v;
  std::optional<double> min_battery_voltage_v;
  std::optional<double> max_battery_voltage_v;
  double usb_power_percent = 0.0;
  double charging_percent = 0.0;
  double low_battery_percent = 0.0;
  std::size_t sample_count = 0;
};

// Runner type "pipower": watches the UPS status lines and battery voltage.
// Doubles as the battery level source for the safety monitor.
class UpsMonitorRunner final : public Runner, public IBatteryLevelProvider {
 public:
  UpsMonitorRunner(RunnerConfig cfg, UpsMonitorSettings settings, std::unique_ptr<IUpsSensor> sensor);

  std::optional<BatteryState> battery_level() const override;

  std::optional<UpsReading> last_reading() const;
  std::optional<UpsStats> stats() const;
  std::vector<UpsReading> history(std::size_t count = 0) const;

  const UpsMonitorSettings& settings() const noexcept { return settings_; }

  // Clamped to [0, 100].
  static double voltage_to_percentage(double voltage_v, const UpsMonitorSettings& s);

 protected:
  Status initialize() override;
  Status work_cycle() override;
  bool healthy_impl() const override;
  void cleanup() override;

 private:
  void check_alerts_(const UpsReading& r);

  const UpsMonitorSettings settings_;
  std::unique_ptr<IUpsSensor> sensor_;  // worker thread only

  mutable std::mutex data_mu_;
  std::deque<UpsReading> history_;
  int consecutive_low_battery_ = 0;
  int consecutive_no_usb_ = 0;
};

Result<UpsMonitorSettings> parse_ups_monitor_settings(const YAML::Node& params);

// Factory creator for "pipower" (simulated adapter only).
Result<std::shared_ptr<Runner>> make_ups_monitor_runner(const RunnerConfig& cfg);

}  // namespace solar
