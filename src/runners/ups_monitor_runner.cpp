// File: src/runners/ups_monitor_runner.cpp
#include "solar/runners/ups_monitor_runner.hpp"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

#include "solar/adapters/sim/sim_ups_sensor.hpp"

namespace solar {
namespace {

template <typename T>
void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n.IsMap() || !n[key]) return;
  out = n[key].as<T>();
}

std::string describe(const UpsReading& r) {
  std::string s;
  if (r.battery_voltage_v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fV ", *r.battery_voltage_v);
    s += buf;
  }
  s += r.usb_power_input ? "usb" : "no_usb";
  s += r.charging ? " charging" : " not_charging";
  s += r.low_battery ? " LOW" : " ok";
  return s;
}

}  // namespace

Result<UpsMonitorSettings> parse_ups_monitor_settings(const YAML::Node& params) {
  using R = Result<UpsMonitorSettings>;
  UpsMonitorSettings s;
  maybe_set(params, "empty_voltage", s.empty_voltage_v);
  maybe_set(params, "full_voltage", s.full_voltage_v);
  maybe_set(params, "low_battery_alert_threshold", s.low_battery_alert_threshold);
  maybe_set(params, "no_usb_alert_threshold", s.no_usb_alert_threshold);
  maybe_set(params, "log_readings", s.log_readings);
  maybe_set(params, "history_size", s.history_size);

  if (s.full_voltage_v <= s.empty_voltage_v) {
    return R::err(Status::invalid_argument("full_voltage must be above empty_voltage"));
  }
  if (s.low_battery_alert_threshold < 1 || s.no_usb_alert_threshold < 1) {
    return R::err(Status::invalid_argument("alert thresholds must be >= 1"));
  }
  if (s.history_size == 0) return R::err(Status::invalid_argument("history_size must be > 0"));
  return R::ok(s);
}

Result<std::shared_ptr<Runner>> make_ups_monitor_runner(const RunnerConfig& cfg) {
  using R = Result<std::shared_ptr<Runner>>;

  auto settings = parse_ups_monitor_settings(cfg.params);
  if (!settings.ok()) return R::err(Status::invalid_argument("runners." + cfg.key + ": " + settings.status().message()));

  std::string adapter = "sim";
  maybe_set(cfg.params, "adapter", adapter);
  if (adapter != "sim") {
    return R::err(Status::unsupported("runners." + cfg.key + ": adapter '" + adapter + "' is not available"));
  }

  SimUpsSensorConfig sim;
  sim.min_voltage_v = settings.value().empty_voltage_v;
  sim.max_voltage_v = settings.value().full_voltage_v;
  const YAML::Node n = cfg.params && cfg.params.IsMap() ? cfg.params["sim"] : YAML::Node();
  maybe_set(n, "start_voltage", sim.start_voltage_v);
  maybe_set(n, "low_voltage", sim.low_voltage_v);
  maybe_set(n, "usb_connected", sim.usb_connected);
  maybe_set(n, "usb_toggle_probability", sim.usb_toggle_probability);
  maybe_set(n, "no_adc", sim.no_adc);
  maybe_set(n, "read_failure_rate", sim.read_failure_rate);
  maybe_set(n, "seed", sim.seed);

  return R::ok(std::make_shared<UpsMonitorRunner>(cfg, settings.take_value(),
                                                  std::make_unique<SimUpsSensor>(sim)));
}

UpsMonitorRunner::UpsMonitorRunner(RunnerConfig cfg, UpsMonitorSettings settings,
                                   std::unique_ptr<IUpsSensor> sensor)
    : Runner(std::move(cfg)), settings_(settings), sensor_(std::move(sensor)) {}

double UpsMonitorRunner::voltage_to_percentage(double voltage_v, const UpsMonitorSettings& s) {
  const double pct = (voltage_v - s.empty_voltage_v) / (s.full_voltage_v - s.empty_voltage_v) * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

Status UpsMonitorRunner::initialize() {
  if (!sensor_) return Status::failed_precondition("no UPS sensor attached");
  SOLAR_RETURN_IF_ERROR(sensor_->open());

  UpsReading r;
  SOLAR_RETURN_IF_ERROR(sensor_->read(&r));
  {
    // Battery level is available before the first cycle.
    std::lock_guard<std::mutex> lock(data_mu_);
    history_.push_back(r);
  }
  log(Severity::kInfo, "ups_reading", "initial " + describe(r));
  if (!r.battery_voltage_v) {
    log(Severity::kWarning, "ups_no_voltage", "battery voltage not available; level unknown");
  }
  return Status::ok_status();
}

Status UpsMonitorRunner::work_cycle() {
  if (!sensor_) return Status::failed_precondition("no UPS sensor attached");

  UpsReading r;
  SOLAR_RETURN_IF_ERROR(sensor_->read(&r));

  {
    std::lock_guard<std::mutex> lock(data_mu_);
    history_.push_back(r);
    while (history_.size() > settings_.history_size) history_.pop_front();
  }

  if (settings_.log_readings) log(Severity::kDebug, "ups_reading", describe(r));
  check_alerts_(r);
  return Status::ok_status();
}

void UpsMonitorRunner::check_alerts_(const UpsReading& r) {
  int low = 0;
  int no_usb = 0;
  bool restored = false;
  {
    std::lock_guard<std::mutex> lock(data_mu_);
    consecutive_low_battery_ = r.low_battery ? consecutive_low_battery_ + 1 : 0;
    if (r.usb_power_input) {
      restored = consecutive_no_usb_ >= settings_.no_usb_alert_threshold;
      consecutive_no_usb_ = 0;
    } else {
      ++consecutive_no_usb_;
    }
    low = consecutive_low_battery_;
    no_usb = consecutive_no_usb_;
  }

  if (low == settings_.low_battery_alert_threshold) {
    log(Severity::kWarning, "ups_low_battery", describe(r) + " for " + std::to_string(low) + " readings");
  }
  if (no_usb == settings_.no_usb_alert_threshold) {
    log(Severity::kWarning, "ups_usb_lost", "no USB power for " + std::to_string(no_usb) + " readings");
  }
  if (restored) log(Severity::kInfo, "ups_usb_restored", describe(r));
}

std::optional<BatteryState> UpsMonitorRunner::battery_level() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  // Newest reading that carried a voltage.
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->battery_voltage_v) {
      return BatteryState{voltage_to_percentage(*it->battery_voltage_v, settings_), it->t};
    }
  }
  return std::nullopt;
}

bool UpsMonitorRunner::healthy_impl() const {
  const auto r = last_reading();
  if (!r) return false;
  return steady_now_ns().ns - r->t.ns <= 2 * seconds_to_ns(config().interval_s);
}

void UpsMonitorRunner::cleanup() {
  if (sensor_) sensor_->close();
}

std::optional<UpsReading> UpsMonitorRunner::last_reading() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (history_.empty()) return std::nullopt;
  return history_.back();
}

std::optional<UpsStats> UpsMonitorRunner::stats() const {
  std::lock_guard<std::mutex> lock(data_mu_);
  if (history_.empty()) return std::nullopt;

  UpsStats s;
  s.sample_count = history_.size();
  double v_sum = 0.0;
  std::size_t v_count = 0;
  std::size_t usb = 0, charging = 0, low = 0;
  for (const auto& r : history_) {
    if (r.battery_voltage_v) {
      const double v = *r.battery_voltage_v;
      v_sum += v;
      ++v_count;
      s.min_battery_voltage_v = s.min_battery_voltage_v ? std::min(*s.min_battery_voltage_v, v) : v;
      s.max_battery_voltage_v = s.max_battery_voltage_v ? std::max(*s.max_battery_voltage_v, v) : v;
    }
    if (r.usb_power_input) ++usb;
    if (r.charging) ++charging;
    if (r.low_battery) ++low;
  }
  if (v_count > 0) s.avg_battery_voltage_v = v_sum / static_cast<double>(v_count);

  const double n = static_cast<double>(s.sample_count);
  s.usb_power_percent = 100.0 * static_cast<double>(usb) / n;
  s.charging_percent = 100.0 * static_cast<double>(charging) / n;
  s.low_battery_percent = 100.0 * static_cast<double>(low) / n;
  return s;
}

std::vector<UpsReading> UpsMonitorRunner::history(std::size_t count) const {
  std::lock_guard<std::mutex> lock(data_mu_);
  const std::size_t n = (count == 0 || count > history_.size()) ? history_.size() : count;
  return std::vector<UpsReading>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

}  // namespace solar
