// File: src/adapters/sim/sim_power_sensor.cpp
#include "solar/adapters/sim/sim_power_sensor.hpp"

#include <algorithm>
#include <utility>

namespace solar {

SimPowerSensor::SimPowerSensor(SimPowerSensorConfig cfg) : cfg_(std::move(cfg)), rng_(cfg_.seed) {}

Status SimPowerSensor::open() {
  if (cfg_.current_max_a < cfg_.current_min_a || cfg_.heavy_current_max_a < cfg_.heavy_current_min_a) {
    return Status::invalid_argument("SimPowerSensor: current range is inverted");
  }
  rng_.seed(cfg_.seed);
  heavy_ = false;
  reads_left_in_state_ = 0;
  open_ = true;
  return Status::ok_status();
}

void SimPowerSensor::maybe_switch_state_() {
  if (reads_left_in_state_ > 0) {
    --reads_left_in_state_;
    return;
  }
  std::bernoulli_distribution heavy(std::clamp(cfg_.heavy_probability, 0.0, 1.0));
  heavy_ = heavy(rng_);
  const int lo = std::max(1, cfg_.state_min_reads);
  const int hi = std::max(lo, cfg_.state_max_reads);
  reads_left_in_state_ = std::uniform_int_distribution<int>(lo, hi)(rng_);
}

Status SimPowerSensor::read(PowerReading* out) {
  if (!out) return Status::invalid_argument("SimPowerSensor::read: out is null");
  if (!open_) return Status::failed_precondition("SimPowerSensor::read: not open");

  std::bernoulli_distribution fail(std::clamp(cfg_.read_failure_rate, 0.0, 1.0));
  if (fail(rng_)) return Status::io_error("SimPowerSensor: simulated I2C read failure");

  maybe_switch_state_();

  const double jitter = std::max(0.0, cfg_.voltage_jitter_v);
  out->voltage_v = cfg_.base_voltage_v + std::uniform_real_distribution<double>(-jitter, jitter)(rng_);

  const double lo = heavy_ ? cfg_.heavy_current_min_a : cfg_.current_min_a;
  const double hi = heavy_ ? cfg_.heavy_current_max_a : cfg_.current_max_a;
  out->current_a = lo == hi ? lo : std::uniform_real_distribution<double>(lo, hi)(rng_);

  out->power_w = out->voltage_v * out->current_a;
  out->t = steady_now_ns();
  return Status::ok_status();
}

}  // namespace solar
