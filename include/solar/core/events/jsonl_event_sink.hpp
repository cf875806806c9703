// File: include/solar/core/events/jsonl_event_sink.hpp
#pragma once

#include <fstream>
#include <mutex>
#include <string>

#include "solar/core/events/event_sink.hpp"
#include "solar/core/status.hpp"

namespace solar {

// JSONL sink for events.
// Writes every event line to:
//   1) a unique per-run file: events_<wall_start_time_ns>.jsonl
//   2) a stable "latest" file: events_latest.jsonl (truncated each run)
// All public methods are serialized on one mutex.
class JsonlEventSink final : public EventSink {
 public:
  JsonlEventSink() = default;
  ~JsonlEventSink() override;

  std::string path() const;
  std::string latest_path() const;

  Status open(const RunInfo& run) override;
  Status emit(const Event& e) override;
  Status flush() override;
  void close() override;

 private:
  Status write_line_(const std::string& line);
  Status flush_locked_();
  void close_locked_();

  mutable std::mutex mu_;
  bool open_{false};

  std::string path_;
  std::string latest_path_;

  std::ofstream f_;
  std::ofstream latest_;
};

// Escapes quotes, backslashes and control characters for a JSON string body.
std::string json_escape(const std::string& s);

}  // namespace solar
