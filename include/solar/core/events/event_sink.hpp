// File: include/solar/core/events/event_sink.hpp
#pragma once

#include <string>

#include "solar/core/status.hpp"
#include "solar/core/types.hpp"

namespace solar {

// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

enum class Severity : int {
  kDebug = 0,
  kInfo = 1,
  kWarning = 2,
  kError = 3,
};

const char* to_string(Severity s) noexcept;
Result<Severity> parse_severity(const std::string& s);

struct RunInfo {
  NodeId node_id;
  std::string config_path;
  std::string out_dir;

  std::string config_hash;

  // Logical time starts at zero; wall time is absolute epoch.
  TimestampNs start_time_ns;
  TimestampNs wall_start_time_ns;
};

struct Event {
  std::string type;    // e.g. "runner_initialized", "action_selected", "heartbeat"
  Severity severity = Severity::kInfo;
  std::string source;  // component name or runner key

  TimestampNs t_ns;       // relative to run start (steady clock)
  TimestampNs t_wall_ns;  // absolute epoch

  std::string message;  // optional human-readable hint
};

// Implementations must accept emit() from several threads at once.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace solar
