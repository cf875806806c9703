// File: include/solar/core/runner/runner.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "solar/core/config.hpp"
#include "solar/core/events/event_log.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

//  Created -> Initializing -> Running <-> Error -> Stopped
// Stopped is terminal for the instance.
enum class RunnerState {
  kCreated,
  kInitializing,
  kRunning,
  kError,
  kStopped,
};

const char* to_string(RunnerState s) noexcept;

// Consistent per-runner snapshot.
struct RunnerStatus {
  RunnerKey key;
  std::string label;
  std::string type;
  RunnerState state = RunnerState::kCreated;
  bool enabled = true;
  bool healthy = false;

  int consecutive_errors = 0;
  std::int64_t total_errors = 0;
  bool error_ceiling_exceeded = false;
  std::string last_error;

  TimestampNs last_success_wall_ns;  // 0 = never
  double uptime_s = 0.0;             // since initialization succeeded
  std::int64_t cycle_count = 0;      // successful cycles

  // Abandoned at shutdown with its worker still busy.
  bool forced_stop = false;
};

// Abstract unit of concurrent work.
//
// Each runner owns one worker thread. initialize() and every work_cycle()
// run on that thread, so cycles of one runner never overlap. Derived classes
// only implement the hooks; the lifecycle, error accounting and cadence live
// here.
//
// The worker holds a shared_ptr to its runner, so runners must be owned by a
// shared_ptr before start() is called.
class Runner : public std::enable_shared_from_this<Runner> {
 public:
  explicit Runner(RunnerConfig cfg);
  virtual ~Runner();

  Runner(const Runner&) = delete;
  Runner& operator=(const Runner&) = delete;

  // Spawns the worker. failed_precondition when called twice or after the
  // runner was stopped.
  Status start(std::shared_ptr<EventLog> log);

  // Cooperative stop request; does not wait.
  void request_stop();

  // Blocks until the worker has exited or the deadline passes.
  // Returns true when the worker is finished (and joined).
  bool wait_stopped(std::chrono::steady_clock::time_point deadline);

  // Gives up on a worker that did not finish in time. The thread is
  // detached and keeps the runner alive until it returns; status reports
  // the runner as force-stopped.
  void abandon();

  [[nodiscard]] bool is_healthy() const;
  [[nodiscard]] RunnerStatus status() const;
  [[nodiscard]] RunnerState state() const;

  [[nodiscard]] const RunnerConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] const RunnerKey& key() const noexcept { return cfg_.key; }

 protected:
  // One-time setup on the worker thread.
  virtual Status initialize() = 0;

  // One unit of periodic work. A non-OK status (or an exception) counts as
  // a failed cycle.
  virtual Status work_cycle() = 0;

  // Implementation-specific part of the health predicate. Must be cheap.
  virtual bool healthy_impl() const { return true; }

  // Called on the worker thread as it exits.
  virtual void cleanup() {}

  // Null-safe logging for derived runners.
  void log(Severity severity, const std::string& type, const std::string& message) const;

  const std::string& label() const noexcept { return cfg_.label; }

 private:
  void run_(std::stop_token stop);
  bool initialize_with_retries_(std::stop_token stop);
  void run_cycle_();
  void record_failure_(const std::string& what);
  bool sleep_until_(std::stop_token stop, std::chrono::steady_clock::time_point t);
  bool scheduled_slot_due_();
  // Health from one snapshot of the locked fields; only healthy_impl() reads
  // anything newer.
  bool healthy_from_(RunnerState state, int consecutive_errors, TimestampNs last_success,
                     TimestampNs running_since) const;
  void set_state_(RunnerState s);
  void mark_done_();

  const RunnerConfig cfg_;
  std::shared_ptr<EventLog> log_;

  std::jthread worker_;

  // Worker writes, readers snapshot.
  mutable std::mutex mu_;
  RunnerState state_ = RunnerState::kCreated;
  int consecutive_errors_ = 0;
  std::int64_t total_errors_ = 0;
  std::string last_error_;
  TimestampNs last_success_steady_;
  TimestampNs last_success_wall_;
  TimestampNs running_since_;
  std::int64_t cycle_count_ = 0;
  bool forced_stop_ = false;
  bool started_ = false;
  bool done_ = false;
  std::condition_variable done_cv_;

  // Interruptible sleep.
  std::mutex sleep_mu_;
  std::condition_variable_any sleep_cv_;

  // Scheduled runners: local date of the last slot that ran.
  std::optional<LocalDate> last_scheduled_day_;
};

}  // namespace solar
