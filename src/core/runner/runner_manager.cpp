// File: src/core/runner/runner_manager.cpp
#include "solar/core/runner/runner_manager.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

namespace solar {
namespace {

using clock = std::chrono::steady_clock;

bool same_settings(const RunnerConfig& a, const RunnerConfig& b) {
  if (a.type != b.type || a.enabled != b.enabled || a.label != b.label) return false;
  if (a.interval_s != b.interval_s || a.max_consecutive_errors != b.max_consecutive_errors ||
      a.max_init_attempts != b.max_init_attempts || a.behavior != b.behavior) {
    return false;
  }
  if (a.schedule_time.has_value() != b.schedule_time.has_value()) return false;
  if (a.schedule_time && *a.schedule_time != *b.schedule_time) return false;

  const std::string pa = a.params ? YAML::Dump(a.params) : std::string();
  const std::string pb = b.params ? YAML::Dump(b.params) : std::string();
  return pa == pb;
}

std::string fmt_seconds(double s) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", s);
  return buf;
}

}  // namespace

const RunnerStatus* SystemStatus::find(const RunnerKey& key) const {
  for (const auto& r : runners) {
    if (r.key == key) return &r;
  }
  return nullptr;
}

RunnerManager::RunnerManager(RunnerFactory factory, std::shared_ptr<EventLog> log, bool threaded_runners)
    : factory_(std::move(factory)), log_sink_(std::move(log)), threaded_runners_(threaded_runners) {}

RunnerManager::~RunnerManager() {
  bool need_shutdown = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    need_shutdown = started_ && !shut_down_;
  }
  if (need_shutdown) (void)shutdown(kDefaultShutdownTimeout);
}

void RunnerManager::log_(Severity severity, const std::string& type, const std::string& message) const {
  if (!log_sink_) return;
  (void)log_sink_->log(severity, "manager", type, message);
}

Status RunnerManager::validate_(const std::vector<RunnerConfig>& configs) const {
  std::set<RunnerKey> seen;
  for (const auto& c : configs) {
    if (!seen.insert(c.key).second) {
      return Status::invalid_argument("duplicate runner key: " + c.key);
    }
    // Disabled entries cost nothing, so their type is never resolved.
    if (!c.enabled) continue;
    SOLAR_RETURN_IF_ERROR(validate_runner_config(c));
    if (!factory_.knows(c.type)) {
      return Status::invalid_argument("runners." + c.key + ": unknown runner type '" + c.type + "'");
    }
  }
  return Status::ok_status();
}

Result<std::vector<RunnerManager::Entry>> RunnerManager::create_enabled_(
    const std::vector<RunnerConfig>& configs) const {
  using R = Result<std::vector<Entry>>;
  std::vector<Entry> out;
  for (const auto& c : configs) {
    if (!c.enabled) continue;
    auto r = factory_.create(c);
    if (!r.ok()) return R::err(r.status());
    out.push_back(Entry{c.key, r.take_value()});
  }
  return R::ok(std::move(out));
}

void RunnerManager::start_entry_(const Entry& e) {
  log_(Severity::kInfo, "runner_registered", e.key + " type=" + e.runner->config().type);
  const Status st = e.runner->start(log_sink_);
  if (!st.ok()) log_(Severity::kError, "runner_init_failed", e.key + ": " + st.message());
}

bool RunnerManager::stop_entry_(const Entry& e, clock::time_point deadline) {
  if (e.runner->wait_stopped(deadline)) return true;
  e.runner->abandon();
  return false;
}

Status RunnerManager::start(const std::vector<RunnerConfig>& configs) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shut_down_) return Status::failed_precondition("RunnerManager::start after shutdown");
  if (started_) return Status::failed_precondition("RunnerManager already started");

  SOLAR_RETURN_IF_ERROR(validate_(configs));

  started_ = true;
  started_at_ = steady_now_ns();

  if (!threaded_runners_) {
    log_(Severity::kInfo, "runners_disabled", "threaded_runners=false; no runner started");
    return Status::ok_status();
  }

  // Everything is built before anything starts, so a bad entry aborts cleanly.
  auto created = create_enabled_(configs);
  if (!created.ok()) {
    started_ = false;
    return created.status();
  }

  entries_ = created.take_value();
  for (const auto& e : entries_) start_entry_(e);

  log_(Severity::kInfo, "runners_started",
       std::to_string(entries_.size()) + " of " + std::to_string(configs.size()) + " configured");
  return Status::ok_status();
}

std::shared_ptr<Runner> RunnerManager::get_runner(const RunnerKey& key) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& e : entries_) {
    if (e.key == key) return e.runner;
  }
  return nullptr;
}

SystemStatus RunnerManager::build_status_(const std::vector<Entry>& entries) const {
  SystemStatus s;
  s.total = entries.size();
  s.runners.reserve(entries.size());
  for (const auto& e : entries) {
    RunnerStatus rs = e.runner->status();
    s.by_state[static_cast<std::size_t>(rs.state)] += 1;
    if (rs.state == RunnerState::kRunning) ++s.running;
    if (rs.healthy) ++s.healthy;
    if (rs.forced_stop) ++s.forced_stops;
    if (!rs.healthy || rs.error_ceiling_exceeded) s.overall_healthy = false;
    s.runners.push_back(std::move(rs));
  }
  return s;
}

SystemStatus RunnerManager::get_system_status() const {
  std::vector<Entry> snapshot;
  TimestampNs since;
  bool started = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot = entries_;
    since = started_at_;
    started = started_;
  }
  SystemStatus s = build_status_(snapshot);
  if (started) s.uptime_s = ns_to_seconds(steady_now_ns().ns - since.ns);
  return s;
}

SystemStatus RunnerManager::shutdown(std::chrono::nanoseconds timeout) {
  std::lock_guard<std::mutex> shutdown_lock(shutdown_mu_);
  if (final_status_) return *final_status_;

  std::vector<Entry> snapshot;
  std::vector<Entry> abandoned;
  TimestampNs since;
  {
    std::lock_guard<std::mutex> lock(mu_);
    snapshot = entries_;
    abandoned = abandoned_;
    since = started_at_;
    shut_down_ = true;
  }

  log_(Severity::kInfo, "shutdown", "stopping " + std::to_string(snapshot.size()) + " runner(s)");

  for (const auto& e : snapshot) e.runner->request_stop();

  const auto deadline = clock::now() + timeout;
  for (const auto& e : snapshot) (void)stop_entry_(e, deadline);

  // Runners a reconcile gave up on are still reported as force-stopped.
  snapshot.insert(snapshot.end(), abandoned.begin(), abandoned.end());
  SystemStatus s = build_status_(snapshot);
  if (since.ns > 0) s.uptime_s = ns_to_seconds(steady_now_ns().ns - since.ns);
  final_status_ = s;
  return s;
}

Status RunnerManager::reconcile(const std::vector<RunnerConfig>& configs, std::chrono::nanoseconds stop_timeout) {
  // shutdown() waits for the swap to finish, so it never sees replacements
  // that are registered but not yet started.
  std::lock_guard<std::mutex> shutdown_lock(shutdown_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  if (shut_down_) return Status::failed_precondition("RunnerManager::reconcile after shutdown");
  if (!started_) return Status::failed_precondition("RunnerManager::reconcile before start");

  SOLAR_RETURN_IF_ERROR(validate_(configs));
  if (!threaded_runners_) return Status::ok_status();

  std::map<RunnerKey, const RunnerConfig*> wanted;
  for (const auto& c : configs) {
    if (c.enabled) wanted[c.key] = &c;
  }

  // Build replacements first; a failing creator leaves everything untouched.
  std::map<RunnerKey, std::shared_ptr<Runner>> kept;
  std::vector<Entry> to_stop;
  for (const auto& e : entries_) {
    const auto it = wanted.find(e.key);
    if (it != wanted.end() && same_settings(e.runner->config(), *it->second)) {
      kept[e.key] = e.runner;
    } else {
      to_stop.push_back(e);
    }
  }

  std::vector<Entry> next;
  std::vector<Entry> to_start;
  for (const auto& c : configs) {
    if (!c.enabled) continue;
    const auto k = kept.find(c.key);
    if (k != kept.end()) {
      next.push_back(Entry{c.key, k->second});
      continue;
    }
    auto r = factory_.create(c);
    if (!r.ok()) return r.status();
    next.push_back(Entry{c.key, r.value()});
    to_start.push_back(Entry{c.key, r.take_value()});
  }

  entries_ = std::move(next);
  for (const auto& e : to_stop) unhealthy_.erase(e.key);
  lock.unlock();

  // Old instances must be gone before their replacements touch the hardware.
  for (const auto& e : to_stop) e.runner->request_stop();
  const auto deadline = clock::now() + stop_timeout;
  for (const auto& e : to_stop) {
    if (stop_entry_(e, deadline)) {
      log_(Severity::kInfo, "runner_removed", e.key);
    } else {
      std::lock_guard<std::mutex> relock(mu_);
      abandoned_.push_back(e);
    }
  }
  for (const auto& e : to_start) start_entry_(e);

  log_(Severity::kInfo, "runners_reconciled",
       "stopped=" + std::to_string(to_stop.size()) + " started=" + std::to_string(to_start.size()));
  return Status::ok_status();
}

std::vector<RunnerKey> RunnerManager::health_check() {
  std::vector<Entry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (shut_down_) return {};
    snapshot = entries_;
  }

  std::vector<RunnerKey> unhealthy;
  std::vector<RunnerStatus> newly_unhealthy;
  for (const auto& e : snapshot) {
    const RunnerStatus rs = e.runner->status();
    const bool active = rs.state == RunnerState::kRunning || rs.state == RunnerState::kError;
    if (active && !rs.healthy) {
      unhealthy.push_back(e.key);
      std::lock_guard<std::mutex> lock(mu_);
      if (unhealthy_.insert(e.key).second) newly_unhealthy.push_back(rs);
    } else {
      std::lock_guard<std::mutex> lock(mu_);
      unhealthy_.erase(e.key);
    }
  }

  for (const auto& rs : newly_unhealthy) {
    std::string msg = rs.key + " state=" + to_string(rs.state) +
                      " consecutive_errors=" + std::to_string(rs.consecutive_errors);
    if (!rs.last_error.empty()) msg += " last_error=" + rs.last_error;
    log_(Severity::kWarning, "runner_unhealthy", msg);
  }
  return unhealthy;
}

std::string RunnerManager::format_status_report() const {
  const SystemStatus s = get_system_status();

  std::ostringstream ss;
  ss << "=== Runner status (uptime " << fmt_seconds(s.uptime_s) << ") ===\n";
  if (s.runners.empty()) {
    ss << "(no runners)\n";
  } else {
    ss << std::left << std::setw(16) << "KEY" << std::setw(10) << "TYPE" << std::setw(14) << "STATE"
       << std::setw(9) << "HEALTHY" << std::setw(9) << "ERRORS" << std::setw(9) << "CYCLES"
       << std::setw(10) << "UPTIME" << "LAST ERROR\n";
    for (const auto& r : s.runners) {
      std::string state = to_string(r.state);
      if (r.forced_stop) state += "(forced)";
      ss << std::left << std::setw(16) << r.key << std::setw(10) << r.type << std::setw(14) << state
         << std::setw(9) << (r.healthy ? "yes" : "no")
         << std::setw(9) << (std::to_string(r.consecutive_errors) + "/" + std::to_string(r.total_errors))
         << std::setw(9) << r.cycle_count << std::setw(10) << fmt_seconds(r.uptime_s) << r.last_error
         << "\n";
    }
  }
  ss << "running " << s.running << "/" << s.total << "  healthy " << s.healthy << "/" << s.total
     << "  overall: " << (s.overall_healthy ? "HEALTHY" : "DEGRADED") << "\n";
  return ss.str();
}

bool RunnerManager::started() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_;
}

bool RunnerManager::is_shut_down() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shut_down_;
}

std::vector<RunnerKey> RunnerManager::keys() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<RunnerKey> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(e.key);
  return out;
}

}  // namespace solar
