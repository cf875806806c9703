// File: include/solar/adapters/sim/sim_power_sensor.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "solar/core/io/power_sensor.hpp"

namespace solar {

struct SimPowerSensorConfig {
  double base_voltage_v{12.0};
  double voltage_jitter_v{0.3};

  // Normal load; occasionally switches to a heavier load for a while.
  double current_min_a{0.2};
  double current_max_a{0.8};
  double heavy_current_min_a{0.8};
  double heavy_current_max_a{1.2};
  double heavy_probability{0.1};  // chance per state switch
  int state_min_reads{30};
  int state_max_reads{120};

  double read_failure_rate{0.0};  // [0, 1]

  std::uint32_t seed{1};
};

// Deterministic (seeded) INA219 stand-in.
class SimPowerSensor final : public IPowerSensor {
 public:
  explicit SimPowerSensor(SimPowerSensorConfig cfg);

  Status open() override;
  Status read(PowerReading* out) override;
  void close() override { open_ = false; }

  std::string name() const override { return "sim_ina219"; }

 private:
  void maybe_switch_state_();

  SimPowerSensorConfig cfg_;
  std::mt19937 rng_;
  bool open_{false};
  bool heavy_{false};
  int reads_left_in_state_{0};
};

}  // namespace solar
