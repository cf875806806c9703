// File: src/core/events/event_log.cpp
#include "solar/core/events/event_log.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace solar {
namespace {

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::int64_t parse_events_epoch_ns_from_name(const std::string& name) {
  const std::string prefix = "events_";
  const std::string suffix = ".jsonl";

  // Never touch the stable tail target.
  if (name == "events_latest.jsonl") return -1;

  if (name.rfind(prefix, 0) != 0) return -1;
  if (name.size() <= prefix.size() + suffix.size()) return -1;
  if (name.substr(name.size() - suffix.size()) != suffix) return -1;

  const std::string mid =
      name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
  if (!is_digits(mid)) return -1;

  try {
    return std::stoll(mid);
  } catch (const std::out_of_range&) {
    return -1;
  }
}

}  // namespace

EventLog::EventLog(std::shared_ptr<EventSink> sink, EventLogOptions opts)
    : sink_(std::move(sink)), opts_(std::move(opts)) {}

TimestampNs EventLog::since_start_ns() const {
  if (!started_.load()) return TimestampNs{0};
  return TimestampNs{steady_now_ns().ns - t0_steady_ns_.load()};
}

void EventLog::prune_out_dir(const std::string& out_dir, std::size_t keep_last) {
  namespace fs = std::filesystem;

  if (keep_last == 0) return;

  std::error_code ec;
  if (!fs::exists(out_dir, ec)) return;

  struct Entry {
    std::int64_t key_epoch_ns;
    fs::path path;
  };

  std::vector<Entry> files;
  for (const auto& it : fs::directory_iterator(out_dir, ec)) {
    if (ec) return;
    if (!it.is_regular_file(ec)) continue;

    const std::string name = it.path().filename().string();
    const std::int64_t k = parse_events_epoch_ns_from_name(name);
    if (k < 0) continue;

    files.push_back(Entry{k, it.path()});
  }

  // The run about to start adds one more file.
  if (files.size() < keep_last) return;

  // Newest first, delete the tail.
  std::sort(files.begin(), files.end(),
            [](const Entry& a, const Entry& b) { return a.key_epoch_ns > b.key_epoch_ns; });

  for (std::size_t i = keep_last - 1; i < files.size(); ++i) {
    fs::remove(files[i].path, ec);
    ec.clear();  // best-effort housekeeping
  }
}

Status EventLog::start(const NodeId& node_id, const std::string& config_path,
                       const std::string& config_hash) {
  if (!sink_) return Status::invalid_argument("EventLog::start: sink is null");

  prune_out_dir(opts_.out_dir, opts_.keep_last_runs);

  t0_steady_ns_.store(steady_now_ns().ns);

  RunInfo run;
  run.node_id = node_id;
  run.config_path = config_path;
  run.out_dir = opts_.out_dir;
  run.config_hash = config_hash;
  run.start_time_ns = TimestampNs{0};
  run.wall_start_time_ns = wall_now_ns();

  const Status st = sink_->open(run);
  if (st.ok()) started_.store(true);
  return st;
}

Status EventLog::log(Severity severity, const std::string& source, const std::string& type,
                     const std::string& message) {
  if (static_cast<int>(severity) < static_cast<int>(opts_.min_severity)) return Status{};

  if (opts_.echo_to_stderr && severity >= Severity::kWarning) {
    std::cerr << "[" << to_string(severity) << "] " << source << ": " << type;
    if (!message.empty()) std::cerr << " - " << message;
    std::cerr << "\n";
  }

  if (!sink_) return Status::failed_precondition("EventLog has no sink");

  Event e;
  e.type = type;
  e.severity = severity;
  e.source = source;
  e.t_ns = since_start_ns();
  e.t_wall_ns = wall_now_ns();
  e.message = message;
  return sink_->emit(e);
}

Status EventLog::emit_heartbeat(const std::string& message) {
  return log(Severity::kInfo, "control", "heartbeat", message);
}

Status EventLog::flush() {
  if (!sink_) return Status{};
  return sink_->flush();
}

void EventLog::stop() {
  if (!sink_) return;
  (void)sink_->flush();
  sink_->close();
  started_.store(false);
}

}  // namespace solar
