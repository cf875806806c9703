// File: include/solar/core/runner/runner_manager.hpp
#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "solar/core/config.hpp"
#include "solar/core/events/event_log.hpp"
#include "solar/core/runner/runner.hpp"
#include "solar/core/runner/runner_factory.hpp"
#include "solar/core/status.hpp"

namespace solar {

// Aggregated view of every registered runner, with stable field names.
struct SystemStatus {
  std::size_t total = 0;
  std::size_t running = 0;
  std::size_t healthy = 0;
  std::size_t forced_stops = 0;

  // Indexed by RunnerState.
  std::array<std::size_t, 5> by_state{};

  // True when every registered runner is healthy and none is past its error ceiling.
  bool overall_healthy = true;

  double uptime_s = 0.0;

  // Registration order.
  std::vector<RunnerStatus> runners;

  [[nodiscard]] std::size_t count(RunnerState s) const noexcept {
    return by_state[static_cast<std::size_t>(s)];
  }
  [[nodiscard]] const RunnerStatus* find(const RunnerKey& key) const;
};

// Owns and supervises the configured runners.
//
// Runners are created, registered and started in configuration order.
// Configuration errors (duplicate keys, unknown types, bad fields) fail
// start() before any runner is started; per-runner initialization failures
// do not, and only show up in status.
//
// Thread-safe. Lookups and status reads never wait on a runner's cycle.
class RunnerManager {
 public:
  RunnerManager(RunnerFactory factory, std::shared_ptr<EventLog> log, bool threaded_runners = true);

  // Shuts down with kDefaultShutdownTimeout if still running.
  ~RunnerManager();

  RunnerManager(const RunnerManager&) = delete;
  RunnerManager& operator=(const RunnerManager&) = delete;

  static constexpr std::chrono::seconds kDefaultShutdownTimeout{5};

  Status start(const std::vector<RunnerConfig>& configs);

  // Null when the key is absent, disabled or never started.
  [[nodiscard]] std::shared_ptr<Runner> get_runner(const RunnerKey& key) const;

  [[nodiscard]] SystemStatus get_system_status() const;

  // Signals every runner, waits for all of them against one shared deadline,
  // and abandons whatever is still busy afterwards. A second call returns the
  // first call's result without doing anything.
  SystemStatus shutdown(std::chrono::nanoseconds timeout);

  // Applies a new runner list: stops removed or disabled runners, starts new
  // or newly enabled ones, and restarts runners whose settings changed.
  // Validated as a whole first; on error nothing changes. A concurrent
  // shutdown() waits until the new set is started.
  Status reconcile(const std::vector<RunnerConfig>& configs, std::chrono::nanoseconds stop_timeout);

  // Logs runners that turned unhealthy since the last check. Returns the
  // currently unhealthy keys.
  std::vector<RunnerKey> health_check();

  // Human-readable status table.
  [[nodiscard]] std::string format_status_report() const;

  [[nodiscard]] bool started() const;
  [[nodiscard]] bool is_shut_down() const;
  [[nodiscard]] std::vector<RunnerKey> keys() const;

 private:
  struct Entry {
    RunnerKey key;
    std::shared_ptr<Runner> runner;
  };

  Status validate_(const std::vector<RunnerConfig>& configs) const;
  Result<std::vector<Entry>> create_enabled_(const std::vector<RunnerConfig>& configs) const;
  void start_entry_(const Entry& e);
  // Returns false when the runner had to be abandoned.
  bool stop_entry_(const Entry& e, std::chrono::steady_clock::time_point deadline);
  SystemStatus build_status_(const std::vector<Entry>& entries) const;
  void log_(Severity severity, const std::string& type, const std::string& message) const;

  RunnerFactory factory_;
  std::shared_ptr<EventLog> log_sink_;
  const bool threaded_runners_;

  mutable std::mutex mu_;
  std::vector<Entry> entries_;
  std::set<RunnerKey> unhealthy_;
  // Replaced by reconcile() but still busy at its deadline.
  std::vector<Entry> abandoned_;
  bool started_ = false;
  bool shut_down_ = false;
  TimestampNs started_at_;

  // Held for the whole of shutdown() and reconcile(). Taken before mu_.
  std::mutex shutdown_mu_;
  std::optional<SystemStatus> final_status_;
};

}  // namespace solar
