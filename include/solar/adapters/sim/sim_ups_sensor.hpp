// File: include/solar/adapters/sim/sim_ups_sensor.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "solar/core/io/ups_sensor.hpp"

namespace solar {

struct SimUpsSensorConfig {
  double start_voltage_v{8.0};
  double min_voltage_v{6.0};
  double max_voltage_v{8.4};
  double low_voltage_v{6.8};  // low-battery line asserts below this

  // Per-read drift: up while on USB power, down otherwise.
  double step_min_v{0.01};
  double step_max_v{0.05};

  bool usb_connected{true};
  double usb_toggle_probability{0.05};

  // No battery-sense ADC: voltage is never reported.
  bool no_adc{false};

  double read_failure_rate{0.0};  // [0, 1]

  std::uint32_t seed{1};
};

// Deterministic (seeded) PiPower stand-in.
class SimUpsSensor final : public IUpsSensor {
 public:
  explicit SimUpsSensor(SimUpsSensorConfig cfg);

  Status open() override;
  Status read(UpsReading* out) override;
  void close() override { open_ = false; }

  std::string name() const override { return "sim_pipower"; }

 private:
  SimUpsSensorConfig cfg_;
  std::mt19937 rng_;
  bool open_{false};
  double voltage_v_{0.0};
  bool usb_{true};
};

}  // namespace solar
