// File: tests/fakes/memory_event_sink.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "solar/core/events/event_log.hpp"
#include "solar/core/events/event_sink.hpp"

namespace solar::test {

// Keeps every emitted event in memory.
class MemoryEventSink final : public EventSink {
 public:
  Status open(const RunInfo& run) override {
    std::lock_guard<std::mutex> lock(mu_);
    run_ = run;
    open_ = true;
    return Status::ok_status();
  }

  Status emit(const Event& e) override {
    std::lock_guard<std::mutex> lock(mu_);
    events_.push_back(e);
    return Status::ok_status();
  }

  Status flush() override { return Status::ok_status(); }

  void close() override {
    std::lock_guard<std::mutex> lock(mu_);
    open_ = false;
  }

  std::vector<Event> events() const {
    std::lock_guard<std::mutex> lock(mu_);
    return events_;
  }

  std::size_t count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(), [&](const Event& e) { return e.type == type; }));
  }

  std::size_t count(const std::string& source, const std::string& type) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<std::size_t>(std::count_if(events_.begin(), events_.end(), [&](const Event& e) {
      return e.source == source && e.type == type;
    }));
  }

  bool is_open() const {
    std::lock_guard<std::mutex> lock(mu_);
    return open_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    events_.clear();
  }

 private:
  mutable std::mutex mu_;
  RunInfo run_;
  bool open_ = false;
  std::vector<Event> events_;
};

// EventLog over a MemoryEventSink that records debug events too.
struct MemoryLog {
  std::shared_ptr<MemoryEventSink> sink = std::make_shared<MemoryEventSink>();
  std::shared_ptr<EventLog> log;

  MemoryLog() {
    EventLogOptions opts;
    opts.min_severity = Severity::kDebug;
    log = std::make_shared<EventLog>(sink, opts);
  }
};

}  // namespace solar::test
