// File: tests/fakes/fake_sensors.hpp
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "solar/core/io/power_sensor.hpp"
#include "solar/core/io/ups_sensor.hpp"
#include "solar/core/safety/battery_level_provider.hpp"

namespace solar::test {

// Readings queued by the test; the sensor replays them in order and then
// repeats the last one. A queued error is returned once.
template <typename Reading>
class SensorScript {
 public:
  void push(Reading r) {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(Item{r, Status::ok_status()});
  }

  void push_error(Status st) {
    std::lock_guard<std::mutex> lock(mu_);
    queue_.push_back(Item{Reading{}, std::move(st)});
  }

  void fail_open(Status st) {
    std::lock_guard<std::mutex> lock(mu_);
    open_status_ = std::move(st);
  }

  Status open_status() const {
    std::lock_guard<std::mutex> lock(mu_);
    return open_status_;
  }

  Status next(Reading* out) {
    std::lock_guard<std::mutex> lock(mu_);
    ++reads_;
    if (!queue_.empty()) {
      Item item = queue_.front();
      queue_.pop_front();
      if (!item.status.ok()) return item.status;
      last_ = item.reading;
    }
    if (!last_) return Status::unavailable("no scripted reading");
    *out = *last_;
    out->t = steady_now_ns();
    return Status::ok_status();
  }

  int reads() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reads_;
  }

  std::atomic<bool> closed{false};

 private:
  struct Item {
    Reading reading;
    Status status;
  };

  mutable std::mutex mu_;
  std::deque<Item> queue_;
  std::optional<Reading> last_;
  Status open_status_;
  int reads_ = 0;
};

class ScriptedPowerSensor final : public IPowerSensor {
 public:
  explicit ScriptedPowerSensor(std::shared_ptr<SensorScript<PowerReading>> script) : script_(std::move(script)) {}

  Status open() override { return script_->open_status(); }
  Status read(PowerReading* out) override { return script_->next(out); }
  void close() override { script_->closed = true; }
  std::string name() const override { return "scripted_power"; }

 private:
  std::shared_ptr<SensorScript<PowerReading>> script_;
};

class ScriptedUpsSensor final : public IUpsSensor {
 public:
  explicit ScriptedUpsSensor(std::shared_ptr<SensorScript<UpsReading>> script) : script_(std::move(script)) {}

  Status open() override { return script_->open_status(); }
  Status read(UpsReading* out) override { return script_->next(out); }
  void close() override { script_->closed = true; }
  std::string name() const override { return "scripted_ups"; }

 private:
  std::shared_ptr<SensorScript<UpsReading>> script_;
};

inline PowerReading power_reading(double volts, double amps) {
  PowerReading r;
  r.voltage_v = volts;
  r.current_a = amps;
  r.power_w = volts * amps;
  return r;
}

inline UpsReading ups_reading(std::optional<double> volts, bool usb, bool low = false) {
  UpsReading r;
  r.battery_voltage_v = volts;
  r.usb_power_input = usb;
  r.charging = usb;
  r.low_battery = low;
  return r;
}

// Battery level set directly by the test.
class FakeBatteryProvider final : public IBatteryLevelProvider {
 public:
  void set(double pct, TimestampNs at) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = BatteryState{pct, at};
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    level_.reset();
  }

  std::optional<BatteryState> battery_level() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
  }

 private:
  mutable std::mutex mu_;
  std::optional<BatteryState> level_;
};

}  // namespace solar::test
