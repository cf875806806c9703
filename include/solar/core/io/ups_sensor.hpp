// File: include/solar/core/io/ups_sensor.hpp
#pragma once

#include <optional>
#include <string>

#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

// PiPower-style UPS status lines.
struct UpsReading {
  // Absent when no ADC is wired to the battery sense pin.
  std::optional<double> battery_voltage_v;
  bool usb_power_input = false;
  bool charging = false;
  bool low_battery = false;
  TimestampNs t;  // steady clock
};

class IUpsSensor {
 public:
  virtual ~IUpsSensor() = default;

  virtual Status open() = 0;

  // Same contract as IPowerSensor::read.
  virtual Status read(UpsReading* out) = 0;

  virtual void close() {}

  virtual std::string name() const = 0;
};

}  // namespace solar
