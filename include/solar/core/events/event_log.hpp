// File: include/solar/core/events/event_log.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "solar/core/events/event_sink.hpp"
#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

struct EventLogOptions {
  std::string out_dir = "out";
  std::size_t keep_last_runs = 50;  // 0 keeps everything
  Severity min_severity = Severity::kInfo;
  bool echo_to_stderr = false;      // warnings and errors only
};

// EventLog owns the run lifecycle of the event stream and is the single
// logging entry point shared by every component (including runner threads).
// Time contract:
//  - t_ns      = relative since run start (starts at 0) using steady clock
//  - t_wall_ns = absolute epoch ns at the moment of emission
class EventLog {
 public:
  EventLog(std::shared_ptr<EventSink> sink, EventLogOptions opts);

  Status start(const NodeId& node_id, const std::string& config_path, const std::string& config_hash);

  // Thread-safe. Events below min_severity are dropped.
  Status log(Severity severity, const std::string& source, const std::string& type,
             const std::string& message);

  Status debug(const std::string& source, const std::string& type, const std::string& message) {
    return log(Severity::kDebug, source, type, message);
  }
  Status info(const std::string& source, const std::string& type, const std::string& message) {
    return log(Severity::kInfo, source, type, message);
  }
  Status warn(const std::string& source, const std::string& type, const std::string& message) {
    return log(Severity::kWarning, source, type, message);
  }
  Status error(const std::string& source, const std::string& type, const std::string& message) {
    return log(Severity::kError, source, type, message);
  }

  Status emit_heartbeat(const std::string& message);

  Status flush();
  void stop();

  [[nodiscard]] bool started() const noexcept { return started_.load(); }
  [[nodiscard]] const EventLogOptions& options() const noexcept { return opts_; }

 private:
  TimestampNs since_start_ns() const;

  static void prune_out_dir(const std::string& out_dir, std::size_t keep_last);

  std::shared_ptr<EventSink> sink_;
  EventLogOptions opts_;

  std::atomic<std::int64_t> t0_steady_ns_{0};
  std::atomic<bool> started_{false};
};

}  // namespace solar
