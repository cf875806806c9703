// File: src/adapters/sim/sim_ups_sensor.cpp
#include "solar/adapters/sim/sim_ups_sensor.hpp"

#include <algorithm>
#include <utility>

namespace solar {

SimUpsSensor::SimUpsSensor(SimUpsSensorConfig cfg) : cfg_(std::move(cfg)), rng_(cfg_.seed) {}

Status SimUpsSensor::open() {
  if (cfg_.max_voltage_v <= cfg_.min_voltage_v) {
    return Status::invalid_argument("SimUpsSensor: max_voltage must be above min_voltage");
  }
  if (cfg_.step_max_v < cfg_.step_min_v) {
    return Status::invalid_argument("SimUpsSensor: step range is inverted");
  }
  rng_.seed(cfg_.seed);
  voltage_v_ = std::clamp(cfg_.start_voltage_v, cfg_.min_voltage_v, cfg_.max_voltage_v);
  usb_ = cfg_.usb_connected;
  open_ = true;
  return Status::ok_status();
}

Status SimUpsSensor::read(UpsReading* out) {
  if (!out) return Status::invalid_argument("SimUpsSensor::read: out is null");
  if (!open_) return Status::failed_precondition("SimUpsSensor::read: not open");

  std::bernoulli_distribution fail(std::clamp(cfg_.read_failure_rate, 0.0, 1.0));
  if (fail(rng_)) return Status::io_error("SimUpsSensor: simulated GPIO read failure");

  const double step = cfg_.step_min_v == cfg_.step_max_v
                          ? cfg_.step_min_v
                          : std::uniform_real_distribution<double>(cfg_.step_min_v, cfg_.step_max_v)(rng_);
  voltage_v_ += usb_ ? step : -step;
  voltage_v_ = std::clamp(voltage_v_, cfg_.min_voltage_v, cfg_.max_voltage_v);

  out->battery_voltage_v.reset();
  if (!cfg_.no_adc) out->battery_voltage_v = voltage_v_;
  out->usb_power_input = usb_;
  out->low_battery = voltage_v_ < cfg_.low_voltage_v;
  out->charging = usb_ && voltage_v_ < cfg_.max_voltage_v - 0.05;
  out->t = steady_now_ns();

  // Flip the supply for the next read now and then.
  std::bernoulli_distribution toggle(std::clamp(cfg_.usb_toggle_probability, 0.0, 1.0));
  if (toggle(rng_)) usb_ = !usb_;

  return Status::ok_status();
}

}  // namespace solar
