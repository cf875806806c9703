// File: src/runners/power_monitor_runner.cpp
#include "solar/runners/power_monitor_runner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include "solar/adapters/sim/sim_power_sensor.hpp"

namespace solar {
namespace {

template <typename T>
void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n.IsMap() || !n[key]) return;
  out = n[key].as<T>();
}

Result<std::uint8_t> parse_i2c_address(const YAML::Node& n) {
  using R = Result<std::uint8_t>;
  const std::string s = n.as<std::string>();
  unsigned long v = 0;
  try {
    std::size_t used = 0;
    v = std::stoul(s, &used, 0);  // "0x40" or "64"
    if (used != s.size()) return R::err(Status::invalid_argument("i2c_address: trailing characters in '" + s + "'"));
  } catch (const std::exception&) {
    return R::err(Status::invalid_argument("i2c_address: not a number: '" + s + "'"));
  }
  if (v < 0x03 || v > 0x77) return R::err(Status::out_of_range("i2c_address outside 0x03..0x77: " + s));
  return R::ok(static_cast<std::uint8_t>(v));
}

std::string fmt(double v, int prec) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
  return buf;
}

}  // namespace

Result<PowerMonitorSettings> parse_power_monitor_settings(const YAML::Node& params) {
  using R = Result<PowerMonitorSettings>;
  PowerMonitorSettings s;
  if (params && params.IsMap() && params["i2c_address"]) {
    auto addr = parse_i2c_address(params["i2c_address"]);
    if (!addr.ok()) return R::err(addr.status());
    s.i2c_address = addr.value();
  }
  maybe_set(params, "log_measurements", s.log_measurements);
  maybe_set(params, "low_power_threshold", s.low_power_threshold_w);
  maybe_set(params, "high_power_threshold", s.high_power_threshold_w);
  maybe_set(params, "alert_after", s.alert_after);
  maybe_set(params, "history_size", s.history_size);

  if (s.low_power_threshold_w >= s.high_power_threshold_w) {
    return R::err(Status::invalid_argument("low_power_threshold must be below high_power_threshold"));
  }
  if (s.alert_after < 1) return R::err(Status::invalid_argument("alert_after must be >= 1"));
  if (s.history_size == 0) return R::err(Status::invalid_argument("history_size must be > 0"));
  return R::ok(s);
}

Result<std::shared_ptr<Runner>> make_power_monitor_runner(const RunnerConfig& cfg) {
  using R = Result<std::shared_ptr<Runner>>;

  auto settings = parse_power_monitor_settings(cfg.params);
  if (!settings.ok()) return R::err(Status::invalid_argument("runners." + cfg.key + ": " + settings.status().message()));

  std::string adapter = "sim";
  maybe_set(cfg.params, "adapter", adapter);
  if (adapter != "sim") {
    return R::err(Status::unsupported("runners." + cfg.key + ": adapter '" + adapter + "' is not available"));
  }

  SimPowerSensorConfig sim;
  const YAML::Node n = cfg.params && cfg.params.IsMap() ? cfg.params["sim"] : YAML::Node();
  maybe_set(n, "base_voltage", sim.base_voltage_v);
  maybe_set(n, "voltage_jitter", sim.voltage_jitter_v);
  maybe_set(n, "current_min", sim.current_min_a);
  maybe_set(n, "current_max", sim.current_max_a);
  maybe_set(n, "heavy_probability", sim.heavy_probability);
  maybe_set(n, "read_failure_rate", sim.read_failure_rate);
  maybe_set(n, "seed", sim.seed);

  return R::ok(std::make_shared<PowerMonitorRunner>(cfg, settings.take_value(),
                                                    std::make_unique<SimPowerSensor>(sim)));
}

PowerMonitorRunner::PowerMonitorRunner(RunnerConfig cfg, PowerMonitorSettings settings,
                                       std::unique_ptr<IPowerSensor> sensor)
    : Runner(std::move(cfg)), settings_(settings), sensor_(std::move(sensor)) {}

Status PowerMonitorRunner::initialize() {
  if (!sensor_) return Status::failed_precondition("no power sensor attached");
  SOLAR_RETURN_IF_ERROR(sensor_->open());

  // A first reading proves the device answers.
  PowerReading r;
  SOLAR_RETURN_IF_ERROR(sensor_->read(&r));
  log(Severity::kDebug, "power_reading",
      "test " + fmt(r.voltage_v, 2) + "V " + fmt(r.current_a, 3) + "A " + fmt(r.power_w, 2) + "W");
  return Status::ok_status();
}

Status PowerMonitorRunner::work_cycle() {
  if (!sensor_) return Status::failed_precondition("no power sensor attached");

  PowerReading r;
  SOLAR_RETURN_IF_ERROR(sensor_->read(&r));

  {
    std::lock_guard<std::mutex> lock(data_mu_);
    history_.push_back(r);
    while (history_.size() > settings_.history_size) history_.pop_front();
  }

  if (settings_.log_measurements) {
    log(Severity::kDebug, "power_reading",
        fmt(r.voltage_v, 2) + "V " + fmt(r.current_a, 3) + "A " + fmt(r.power_w, 2) + "W");
  }
  check_alerts_(r);
  return Status::ok_status();
}

void PowerMonitorRunner::check_alerts_(const PowerReading& r) {
  int low = 0;
  int high = 0;
  {
    std::lock_guard<std::mutex> lock(data_mu_);
    if (r.power_w < settings_.low_power_threshold_w) {
      ++consecutive_low_;
      consecutive_high_ = 0;
    } else if (r.power_w > settings_.high_power_threshold_w) {
      ++consecutive_high_;
      consecutive_low_ = 0;
    } else {
      consecutive_low_ = 0;
      consecutive_high_ = 0;
    }
    low = consecutive_low_;
    high = consecutive_high_;
  }

  // Alert once per excursion.
  if (low == settings_.alert_after) {
    log(Severity::kWarning, "power_low_alert",
        fmt(r.power_w, 2) + "W for " + std::to_string(low) + " readings (threshold " +
            fmt(settings_.low_power_threshold_w, 2) + "W)");
  }
  if (high == settings_.alert_after) {
    log(Severity::kWarning, "power_high_alert",
        fmt(r.power_w, 2) + "W for " + std::to_string(high) + " readings (threshold " +
            fmt(settings_.high_power_threshold_w, 2) + "W)");
  }
}

bool PowerMonitorRunner::healthy_impl() const {
  const auto r = last_reading();
  if (!r) return false;
  // A scheduled check reads once a day; only continuous monitors go stale.
  if (config().behavior == RunBehavior::kContinuous &&
      steady_now_ns().ns - r->t.ns > 2 * seconds_to_ns(config().interval_s)) {
    return false;
  }
  return std::isfinite(r->voltage_v) && std::isfinite(r->current_a) && r->voltage_v > 0.0;
}

void PowerMonitorRunner::cleanup() {
  if (sensor_) sensor_->close();
}

std::optional<PowerReading> PowerMonitorRunner::last_reading() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (history_.empty()) return std::nullopt;
  return history_.back();
}

std::optional<PowerStats> PowerMonitorRunner::stats() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (history_.empty()) return std::nullopt;

  PowerStats s;
  s.sample_count = history_.size();
  s.min_power_w = history_.front().power_w;
  s.max_power_w = history_.front().power_w;
  for (const auto& r : history_) {
    s.avg_voltage_v += r.voltage_v;
    s.avg_current_a += r.current_a;
    s.avg_power_w += r.power_w;
    s.min_power_w = std::min(s.min_power_w, r.power_w);
    s.max_power_w = std::max(s.max_power_w, r.power_w);
  }
  const double n = static_cast<double>(s.sample_count);
  s.avg_voltage_v /= n;
  s.avg_current_a /= n;
  s.avg_power_w /= n;
  return s;
}

std::vector<PowerReading> PowerMonitorRunner::history(std::size_t count) const {
  std::lock_guard<std::mutex> lock(data_mu_);
  const std::size_t n = (count == 0 || count > history_.size()) ? history_.size() : count;
  return std::vector<PowerReading>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

}  // namespace solar
