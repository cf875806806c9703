// File: src/core/events/jsonl_event_sink.cpp
#include "solar/core/events/jsonl_event_sink.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

namespace solar {
namespace {

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

const char* to_string(Severity s) noexcept {
  switch (s) {
    case Severity::kDebug: return "debug";
    case Severity::kInfo: return "info";
    case Severity::kWarning: return "warning";
    case Severity::kError: return "error";
  }
  return "info";
}

Result<Severity> parse_severity(const std::string& s) {
  const std::string v = to_lower(s);
  if (v == "debug") return Result<Severity>::ok(Severity::kDebug);
  if (v == "info") return Result<Severity>::ok(Severity::kInfo);
  if (v == "warning" || v == "warn") return Result<Severity>::ok(Severity::kWarning);
  if (v == "error") return Result<Severity>::ok(Severity::kError);
  return Result<Severity>::err(Status::invalid_argument("unknown severity: " + s));
}

std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

JsonlEventSink::~JsonlEventSink() { close(); }

std::string JsonlEventSink::path() const {
  std::lock_guard<std::mutex> lock(mu_);
  return path_;
}

std::string JsonlEventSink::latest_path() const {
  std::lock_guard<std::mutex> lock(mu_);
  return latest_path_;
}

Status JsonlEventSink::open(const RunInfo& run) {
  std::lock_guard<std::mutex> lock(mu_);
  close_locked_();

  std::error_code ec;
  std::filesystem::create_directories(run.out_dir, ec);
  if (ec) {
    return Status::io_error("failed creating out_dir '" + run.out_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time_ns.ns;
  const std::int64_t t0 = run.start_time_ns.ns;

  path_ = join_path(run.out_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.out_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_ns\":" << t0 << ","
     << "\"t_s\":" << ns_to_seconds(t0) << ","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_seconds(wall0) << ","
     << "\"node_id\":\"" << json_escape(run.node_id) << "\","
     << "\"config_path\":\"" << json_escape(run.config_path) << "\","
     << "\"config_hash\":\"" << json_escape(run.config_hash) << "\""
     << "}";

  SOLAR_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush_locked_();
}

Status JsonlEventSink::emit(const Event& e) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!open_) return Status::failed_precondition("JsonlEventSink::emit called while not open");

  const std::int64_t t = e.t_ns.ns;
  const std::int64_t tw = e.t_wall_ns.ns;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":\"" << json_escape(e.type) << "\","
     << "\"severity\":\"" << to_string(e.severity) << "\","
     << "\"t_ns\":" << t << ","
     << "\"t_s\":" << ns_to_seconds(t) << ","
     << "\"t_wall_ns\":" << tw << ","
     << "\"t_wall_s\":" << ns_to_seconds(tw);

  if (!e.source.empty()) {
    ss << ",\"source\":\"" << json_escape(e.source) << "\"";
  }
  if (!e.message.empty()) {
    ss << ",\"message\":\"" << json_escape(e.message) << "\"";
  }

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  std::lock_guard<std::mutex> lock(mu_);
  return flush_locked_();
}

Status JsonlEventSink::flush_locked_() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  std::lock_guard<std::mutex> lock(mu_);
  close_locked_();
}

void JsonlEventSink::close_locked_() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace solar
