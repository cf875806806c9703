// File: include/solar/core/io/power_sensor.hpp
#pragma once

#include <string>

#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

// One INA219-style measurement.
struct PowerReading {
  double voltage_v = 0.0;
  double current_a = 0.0;
  double power_w = 0.0;
  TimestampNs t;  // steady clock
};

class IPowerSensor {
 public:
  virtual ~IPowerSensor() = default;

  virtual Status open() = 0;

  // Returns:
  //  - OK on success and fills `out`
  //  - io_error / unavailable when the device did not answer
  virtual Status read(PowerReading* out) = 0;

  virtual void close() {}

  virtual std::string name() const = 0;
};

}  // namespace solar
