// File: src/core/runner/runner.cpp
#include "solar/core/runner/runner.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

namespace solar {
namespace {

using clock = std::chrono::steady_clock;

std::chrono::nanoseconds to_duration(double seconds) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}

// Scheduled runners wake at least this often to catch their minute.
constexpr std::chrono::seconds kScheduledPoll{15};

}  // namespace

const char* to_string(RunnerState s) noexcept {
  switch (s) {
    case RunnerState::kCreated: return "created";
    case RunnerState::kInitializing: return "initializing";
    case RunnerState::kRunning: return "running";
    case RunnerState::kError: return "error";
    case RunnerState::kStopped: return "stopped";
  }
  return "unknown";
}

Runner::Runner(RunnerConfig cfg) : cfg_(std::move(cfg)) {}

Runner::~Runner() {
  if (!worker_.joinable()) return;
  // The worker may drop the last reference itself on its way out.
  if (worker_.get_id() == std::this_thread::get_id()) {
    worker_.detach();
    return;
  }
  worker_.request_stop();
  worker_.join();
}

Status Runner::start(std::shared_ptr<EventLog> log) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == RunnerState::kStopped) return Status::failed_precondition("runner '" + cfg_.key + "' is stopped");
    if (started_) return Status::failed_precondition("runner '" + cfg_.key + "' already started");
    started_ = true;
  }
  log_ = std::move(log);

  try {
    worker_ = std::jthread([self = shared_from_this()](std::stop_token stop) { self->run_(std::move(stop)); });
  } catch (const std::bad_weak_ptr&) {
    return Status::failed_precondition("runner '" + cfg_.key + "' is not owned by a shared_ptr");
  } catch (const std::system_error& e) {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = RunnerState::kError;
    last_error_ = e.what();
    done_ = true;
    return Status::unavailable("runner '" + cfg_.key + "': cannot spawn worker: " + e.what());
  }
  return Status::ok_status();
}

void Runner::request_stop() {
  worker_.request_stop();
}

bool Runner::wait_stopped(clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mu_);
  if (!started_) {
    state_ = RunnerState::kStopped;
    return true;
  }
  if (!done_cv_.wait_until(lock, deadline, [this] { return done_; })) return false;
  state_ = RunnerState::kStopped;
  lock.unlock();

  if (worker_.joinable()) worker_.join();
  return true;
}

void Runner::abandon() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (done_) return;
    forced_stop_ = true;
    state_ = RunnerState::kStopped;
  }
  worker_.request_stop();
  if (worker_.joinable()) worker_.detach();
  log(Severity::kError, "runner_forced_stop", "worker did not exit before the shutdown deadline");
}

void Runner::log(Severity severity, const std::string& type, const std::string& message) const {
  if (!log_) return;
  (void)log_->log(severity, cfg_.key, type, message);
}

void Runner::set_state_(RunnerState s) {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ == RunnerState::kStopped) return;  // terminal
  state_ = s;
}

void Runner::mark_done_() {
  std::lock_guard<std::mutex> lock(mu_);
  done_ = true;
  done_cv_.notify_all();
}

bool Runner::sleep_until_(std::stop_token stop, clock::time_point t) {
  std::unique_lock<std::mutex> lock(sleep_mu_);
  sleep_cv_.wait_until(lock, stop, t, [] { return false; });
  return !stop.stop_requested();
}

bool Runner::initialize_with_retries_(std::stop_token stop) {
  const int attempts = std::max(1, cfg_.max_init_attempts);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    if (stop.stop_requested()) return false;
    set_state_(RunnerState::kInitializing);

    Status st;
    try {
      st = initialize();
    } catch (const std::exception& e) {
      st = Status::internal(std::string("initialize threw: ") + e.what());
    }

    if (st.ok()) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ != RunnerState::kStopped) state_ = RunnerState::kRunning;
        running_since_ = steady_now_ns();
        last_error_.clear();
      }
      log(Severity::kInfo, "runner_initialized", label());
      return true;
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      last_error_ = st.message();
    }

    if (attempt < attempts) {
      log(Severity::kWarning, "runner_init_failed",
          "attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) + ": " + st.message());
      if (!sleep_until_(stop, clock::now() + to_duration(cfg_.interval_s))) return false;
    } else {
      set_state_(RunnerState::kError);
      log(Severity::kError, "runner_init_failed", st.message());
    }
  }
  return false;
}

void Runner::record_failure_(const std::string& what) {
  int consecutive = 0;
  bool crossed_ceiling = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == RunnerState::kStopped) return;
    ++consecutive_errors_;
    ++total_errors_;
    last_error_ = what;
    state_ = RunnerState::kError;
    consecutive = consecutive_errors_;
    crossed_ceiling = consecutive_errors_ == cfg_.max_consecutive_errors + 1;
  }
  log(crossed_ceiling ? Severity::kError : Severity::kWarning, "runner_cycle_failed",
      "consecutive=" + std::to_string(consecutive) + " " + what);
}

void Runner::run_cycle_() {
  Status st;
  try {
    st = work_cycle();
  } catch (const std::exception& e) {
    st = Status::internal(std::string("work_cycle threw: ") + e.what());
  }

  if (!st.ok()) {
    record_failure_(st.message());
    return;
  }

  bool recovered = false;
  int previous_errors = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (state_ == RunnerState::kStopped) return;
    recovered = state_ == RunnerState::kError;
    previous_errors = consecutive_errors_;
    state_ = RunnerState::kRunning;
    consecutive_errors_ = 0;
    last_success_steady_ = steady_now_ns();
    last_success_wall_ = wall_now_ns();
    ++cycle_count_;
  }
  if (recovered) {
    log(Severity::kInfo, "runner_recovered", "after " + std::to_string(previous_errors) + " failed cycle(s)");
  }
}

bool Runner::scheduled_slot_due_() {
  if (!cfg_.schedule_time) return false;
  const LocalTime now = local_now();
  if (now.time.minute_of_day() != cfg_.schedule_time->minute_of_day()) return false;
  if (last_scheduled_day_ && *last_scheduled_day_ == now.date) return false;
  last_scheduled_day_ = now.date;
  return true;
}

void Runner::run_(std::stop_token stop) {
  if (!initialize_with_retries_(stop)) {
    mark_done_();
    return;
  }

  const auto interval = to_duration(cfg_.interval_s);
  auto next = clock::now();

  while (!stop.stop_requested()) {
    if (cfg_.behavior == RunBehavior::kContinuous) {
      run_cycle_();
      next += interval;
      const auto after = clock::now();
      if (next < after) next = after + interval;  // overran; don't burst to catch up
    } else {
      if (scheduled_slot_due_()) run_cycle_();
      next = clock::now() + std::min<std::chrono::nanoseconds>(interval, kScheduledPoll);
    }

    if (stop.stop_requested()) break;
    if (!sleep_until_(stop, next)) break;
  }

  try {
    cleanup();
  } catch (const std::exception& e) {
    log(Severity::kWarning, "runner_cleanup_failed", e.what());
  }

  set_state_(RunnerState::kStopped);
  log(Severity::kInfo, "runner_stopped", label());
  mark_done_();
}

RunnerState Runner::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

RunnerStatus Runner::status() const {
  RunnerStatus s;
  s.key = cfg_.key;
  s.label = cfg_.label;
  s.type = cfg_.type;
  s.enabled = cfg_.enabled;

  TimestampNs last_success_steady;
  TimestampNs running_since;
  {
    std::lock_guard<std::mutex> lock(mu_);
    s.state = state_;
    s.consecutive_errors = consecutive_errors_;
    s.total_errors = total_errors_;
    s.last_error = last_error_;
    s.last_success_wall_ns = last_success_wall_;
    s.cycle_count = cycle_count_;
    s.forced_stop = forced_stop_;
    last_success_steady = last_success_steady_;
    running_since = running_since_;
  }

  s.error_ceiling_exceeded = s.consecutive_errors > cfg_.max_consecutive_errors;
  if (running_since.ns > 0 && s.state != RunnerState::kStopped) {
    s.uptime_s = ns_to_seconds(steady_now_ns().ns - running_since.ns);
  }

  s.healthy = healthy_from_(s.state, s.consecutive_errors, last_success_steady, running_since);
  return s;
}

bool Runner::is_healthy() const {
  RunnerState state = RunnerState::kCreated;
  int consecutive = 0;
  TimestampNs last_success;
  TimestampNs running_since;
  {
    std::lock_guard<std::mutex> lock(mu_);
    state = state_;
    consecutive = consecutive_errors_;
    last_success = last_success_steady_;
    running_since = running_since_;
  }
  return healthy_from_(state, consecutive, last_success, running_since);
}

bool Runner::healthy_from_(RunnerState state, int consecutive_errors, TimestampNs last_success,
                           TimestampNs running_since) const {
  if (state != RunnerState::kRunning) return false;
  if (consecutive_errors > cfg_.max_consecutive_errors) return false;

  // Scheduled runners only cycle once a day; recency is not meaningful for them.
  if (cfg_.behavior == RunBehavior::kContinuous) {
    const TimestampNs ref = last_success.ns > 0 ? last_success : running_since;
    const DurationNs age = steady_now_ns().ns - ref.ns;
    if (age > 2 * seconds_to_ns(cfg_.interval_s)) return false;
  }

  return healthy_impl();
}

}  // namespace solar
