// File: src/core/control/control_loop.cpp
#include "solar/core/control/control_loop.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <utility>

#include "solar/core/util/repro_hash.hpp"

namespace solar {
namespace {

using clock = std::chrono::steady_clock;

std::chrono::nanoseconds to_duration(double seconds) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}

std::string fmt(double v, int prec) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
  return buf;
}

std::string describe_envelope(const SafetyEnvelope& e) {
  std::string s = "battery=" + fmt(e.battery_percentage, 1) + "% allowed=" + fmt(e.allowed_distance_m, 1) + "m";
  if (e.stale) s += " stale";
  else if (e.low_battery) s += " low";
  return s;
}

}  // namespace

ControlLoop::ControlLoop(Config cfg, RunnerManager& runners, std::shared_ptr<EventLog> log,
                         IActionExecutor* executor)
    : cfg_(std::move(cfg)),
      runners_(runners),
      log_sink_(std::move(log)),
      executor_(executor),
      engine_(cfg_.application.battery_safety, cfg_.locations),
      safety_(std::make_unique<BatterySafetyMonitor>(cfg_.application.battery_safety)) {}

void ControlLoop::log_(Severity severity, const std::string& type, const std::string& message) const {
  if (!log_sink_) return;
  (void)log_sink_->log(severity, "control", type, message);
}

Status ControlLoop::init() {
  SOLAR_RETURN_IF_ERROR(validate_battery_safety(cfg_.application.battery_safety));
  SOLAR_RETURN_IF_ERROR(engine_.load(cfg_.tasks));
  log_(Severity::kInfo, "schedule_loaded",
       std::to_string(cfg_.tasks.size()) + " task(s) hash=" + compute_schedule_hash(cfg_.tasks, cfg_.locations));
  return Status::ok_status();
}

void ControlLoop::set_battery_provider(std::shared_ptr<const IBatteryLevelProvider> provider) {
  fixed_provider_ = std::move(provider);
}

void ControlLoop::set_schedule_reload(ScheduleReload fn) { reload_ = std::move(fn); }

void ControlLoop::set_position_source(PositionSource fn) { position_ = std::move(fn); }

void ControlLoop::request_reconfigure(Config next) {
  std::lock_guard<std::mutex> lock(pending_mu_);
  pending_ = std::move(next);  // latest request wins
}

void ControlLoop::apply_pending_reconfigure_() {
  std::optional<Config> next;
  {
    std::lock_guard<std::mutex> lock(pending_mu_);
    next.swap(pending_);
  }
  if (!next) return;

  Status st = validate_config(*next);
  if (st.ok()) st = runners_.reconcile(next->runners, to_duration(next->application.shutdown_timeout_s));
  if (st.ok()) st = engine_.reconfigure(next->application.battery_safety, next->locations, next->tasks);
  if (!st.ok()) {
    log_(Severity::kError, "config_reload_failed", st.message());
    return;
  }

  // Carry the latest sample over so the envelope does not go stale on reload.
  const auto latest = safety_->latest();
  safety_ = std::make_unique<BatterySafetyMonitor>(next->application.battery_safety);
  if (latest) (void)safety_->sample(latest->percentage, latest->sampled_at);

  cfg_ = std::move(*next);
  last_sample_attempt_.reset();
  log_(Severity::kInfo, "config_reloaded",
       std::to_string(cfg_.runners.size()) + " runner(s), " + std::to_string(cfg_.tasks.size()) + " task(s)");
}

void ControlLoop::maybe_reload_schedule_(const LocalTime& now) {
  if (!last_date_) {
    last_date_ = now.date;
    return;
  }
  if (*last_date_ == now.date) return;
  last_date_ = now.date;
  if (!reload_) return;

  auto snap = reload_();
  if (!snap.ok()) {
    log_(Severity::kError, "schedule_reload_failed", snap.status().message());
    return;
  }
  ScheduleSnapshot next = snap.take_value();
  const Status st = engine_.reconfigure(cfg_.application.battery_safety, next.locations, next.tasks);
  if (!st.ok()) {
    log_(Severity::kError, "schedule_reload_failed", st.message());
    return;
  }
  cfg_.tasks = std::move(next.tasks);
  cfg_.locations = std::move(next.locations);
  log_(Severity::kInfo, "schedule_reloaded",
       std::to_string(cfg_.tasks.size()) + " task(s) hash=" + compute_schedule_hash(cfg_.tasks, cfg_.locations));
}

std::shared_ptr<const IBatteryLevelProvider> ControlLoop::resolve_provider_() const {
  if (fixed_provider_) return fixed_provider_;
  return std::dynamic_pointer_cast<const IBatteryLevelProvider>(
      runners_.get_runner(cfg_.application.battery_source));
}

void ControlLoop::maybe_sample_battery_(TimestampNs steady_now) {
  const DurationNs every = seconds_to_ns(cfg_.application.battery_safety.update_interval_s);
  if (last_sample_attempt_ && steady_now.ns - last_sample_attempt_->ns < every) return;
  last_sample_attempt_ = steady_now;

  const auto provider = resolve_provider_();
  if (!provider) return;  // envelope goes stale on its own

  const auto level = provider->battery_level();
  if (!level || level->sampled_at <= last_fed_sample_) return;
  last_fed_sample_ = level->sampled_at;

  const Status st = safety_->sample(level->percentage, level->sampled_at);
  if (!st.ok()) log_(Severity::kWarning, "battery_sample_rejected", st.message());
}

void ControlLoop::log_selection_(const TickResult& r) {
  const std::string msg = r.action.describe() + " " + describe_envelope(r.envelope);
  if (r.action.is_override()) {
    log_(Severity::kWarning, "safety_override", msg);
  } else {
    log_(Severity::kInfo, "action_selected", msg);
  }
}

bool ControlLoop::dispatch_(const SelectedAction& action) {
  if (!executor_) return true;
  try {
    executor_->execute(action);
  } catch (const std::exception& e) {
    log_(Severity::kError, "executor_failed", action.describe() + ": " + e.what());
    return false;
  }
  return true;
}

void ControlLoop::periodic_(TimestampNs steady_now, const SafetyEnvelope& env) {
  (void)runners_.health_check();

  const int hb = cfg_.application.heartbeat_every_s;
  if (hb > 0 && (!last_heartbeat_ || steady_now.ns - last_heartbeat_->ns >= seconds_to_ns(hb))) {
    last_heartbeat_ = steady_now;
    if (log_sink_) {
      (void)log_sink_->emit_heartbeat("alive tick=" + std::to_string(ticks_) + " " + describe_envelope(env));
    }
  }

  const int sr = cfg_.application.status_report_every_s;
  if (sr > 0 && (!last_status_report_ || steady_now.ns - last_status_report_->ns >= seconds_to_ns(sr))) {
    last_status_report_ = steady_now;
    const SystemStatus s = runners_.get_system_status();
    log_(Severity::kInfo, "status_report",
         "running=" + std::to_string(s.running) + "/" + std::to_string(s.total) +
             " healthy=" + std::to_string(s.healthy) + "/" + std::to_string(s.total) +
             " overall=" + (s.overall_healthy ? "healthy" : "degraded"));
  }
}

TickResult ControlLoop::tick_once(const LocalTime& now, TimestampNs steady_now) {
  apply_pending_reconfigure_();
  maybe_reload_schedule_(now);
  maybe_sample_battery_(steady_now);

  TickResult r;
  r.envelope = safety_->envelope(steady_now);
  if (r.envelope.stale && !was_stale_) {
    log_(Severity::kWarning, "battery_stale",
         "no battery sample within " + fmt(cfg_.application.battery_safety.stale_after_s, 1) + "s");
  }
  was_stale_ = r.envelope.stale;

  r.action = position_ ? engine_.tick(now.time, r.envelope, position_()) : engine_.tick(now.time, r.envelope);
  r.changed = !last_ || !last_->same_decision(r.action);
  if (r.changed) log_selection_(r);
  // A failed dispatch is retried every tick until the executor accepts it.
  if (r.changed || !delivered_) delivered_ = dispatch_(r.action);
  last_ = r.action;

  ++ticks_;
  periodic_(steady_now, r.envelope);
  return r;
}

Status ControlLoop::run(std::stop_token stop) {
  const auto t_start = clock::now();
  auto next_tick = t_start;
  std::int64_t n = 0;

  while (!stop.stop_requested()) {
    const auto now = clock::now();
    const ApplicationConfig& app = cfg_.application;

    if (app.max_ticks > 0 && n >= app.max_ticks) {
      log_(Severity::kInfo, "shutdown", "max_ticks reached");
      return Status::ok_status();
    }
    if (app.max_run_s > 0.0 && now - t_start >= to_duration(app.max_run_s)) {
      log_(Severity::kInfo, "shutdown", "max_runtime reached");
      return Status::ok_status();
    }

    (void)tick_once();
    ++n;

    if (log_sink_) SOLAR_RETURN_IF_ERROR(log_sink_->flush());

    // Re-read: a reconfiguration may have changed the period.
    const auto period = to_duration(cfg_.application.main_loop_interval_s);
    next_tick += period;
    const auto after = clock::now();
    if (next_tick < after) next_tick = after + period;

    std::unique_lock<std::mutex> lock(sleep_mu_);
    sleep_cv_.wait_until(lock, stop, next_tick, [] { return false; });
  }

  log_(Severity::kInfo, "shutdown", "stop requested");
  return Status::ok_status();
}

}  // namespace solar
