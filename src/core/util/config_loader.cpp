// File: src/core/util/config_loader.cpp
#include "solar/core/util/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace solar {
namespace fs = std::filesystem;

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }
static bool is_scalar(const YAML::Node& n) { return n && n.IsScalar(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  // For scalars, sequences, etc., override completely.
  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, int depth) {
  if (depth > 16) {
    return Result<YAML::Node>::err(Status::invalid_argument("includes nested too deeply at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;  // empty
  const fs::path dir = path.parent_path();

  // Optional top-level includes: ["a.yaml", "b.yaml"]
  if (root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, depth + 1);  // recursive
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
  }

  // Finally override with this file's contents (excluding includes itself).
  if (root["includes"]) root.remove("includes");
  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static Result<std::vector<std::string>> parse_string_list(const YAML::Node& n, const std::string& where) {
  std::vector<std::string> out;
  if (!n) return Result<std::vector<std::string>>::ok(out);
  if (!n.IsSequence()) {
    return Result<std::vector<std::string>>::err(Status::invalid_argument(where + " must be a YAML sequence"));
  }
  for (std::size_t i = 0; i < n.size(); ++i) out.push_back(n[i].as<std::string>());
  return Result<std::vector<std::string>>::ok(out);
}

static Result<RunBehavior> parse_run_behavior(const YAML::Node& n) {
  if (!n) return Result<RunBehavior>::ok(RunBehavior::kContinuous);
  if (!is_scalar(n)) return Result<RunBehavior>::err(Status::invalid_argument("run_behavior must be a string"));
  const auto s = to_lower(n.as<std::string>());
  if (s == "continuous") return Result<RunBehavior>::ok(RunBehavior::kContinuous);
  if (s == "scheduled") return Result<RunBehavior>::ok(RunBehavior::kScheduled);
  return Result<RunBehavior>::err(Status::invalid_argument("unknown run_behavior: " + s));
}

static Status parse_battery_safety(const YAML::Node& b, BatterySafetyConfig& out) {
  maybe_set(b, "min_battery_threshold", out.min_battery_threshold);
  maybe_set(b, "max_distance_factor", out.max_distance_factor);
  maybe_set(b, "total_range", out.total_range_m);
  maybe_set(b, "update_interval", out.update_interval_s);
  maybe_set(b, "stale_after_s", out.stale_after_s);
  maybe_set(b, "dock_target", out.dock_target);
  if (b["dock_actions"]) {
    auto actions = parse_string_list(b["dock_actions"], "battery_safety.dock_actions");
    if (!actions.ok()) return actions.status();
    out.dock_actions = actions.take_value();
  }
  return Status::ok_status();
}

static Result<RunnerConfig> parse_runner(const std::string& key, const YAML::Node& n) {
  if (!is_map(n)) {
    return Result<RunnerConfig>::err(Status::invalid_argument("runners." + key + " must be a mapping"));
  }

  RunnerConfig r;
  r.key = key;
  r.label = key;
  maybe_set(n, "type", r.type);
  maybe_set(n, "enabled", r.enabled);
  maybe_set(n, "label", r.label);
  maybe_set(n, "measurement_interval", r.interval_s);
  maybe_set(n, "max_consecutive_errors", r.max_consecutive_errors);
  maybe_set(n, "max_init_attempts", r.max_init_attempts);

  auto behavior = parse_run_behavior(n["run_behavior"]);
  if (!behavior.ok()) {
    return Result<RunnerConfig>::err(Status::invalid_argument("runners." + key + ": " + behavior.status().message()));
  }
  r.behavior = behavior.take_value();

  if (n["schedule_time"]) {
    auto t = parse_time_of_day(n["schedule_time"].as<std::string>());
    if (!t.ok()) {
      return Result<RunnerConfig>::err(Status::invalid_argument("runners." + key + ".schedule_time: " + t.status().message()));
    }
    r.schedule_time = t.take_value();
  }

  r.params = YAML::Clone(n);
  return Result<RunnerConfig>::ok(r);
}

static Result<ScheduleTask> parse_task(std::size_t index, const YAML::Node& n) {
  const std::string where = "tasks[" + std::to_string(index) + "]";
  if (!is_map(n)) return Result<ScheduleTask>::err(Status::invalid_argument(where + " must be a mapping"));

  const bool has_time = static_cast<bool>(n["time"]);
  const bool has_range = static_cast<bool>(n["time_range"]);
  if (has_time == has_range) {
    return Result<ScheduleTask>::err(
        Status::invalid_argument(where + " needs exactly one of 'time' or 'time_range'"));
  }

  ScheduleTask t;
  if (has_time) {
    auto at = parse_time_of_day(n["time"].as<std::string>());
    if (!at.ok()) return Result<ScheduleTask>::err(Status::invalid_argument(where + ".time: " + at.status().message()));
    t.trigger = TriggerKind::kExactTime;
    t.at = at.take_value();
  } else {
    auto range = parse_time_range(n["time_range"].as<std::string>());
    if (!range.ok()) {
      return Result<ScheduleTask>::err(Status::invalid_argument(where + ".time_range: " + range.status().message()));
    }
    t.trigger = TriggerKind::kWindow;
    t.window = range.take_value();
  }

  maybe_set(n, "type", t.category);
  if (n["target"]) t.target = n["target"].as<std::string>();

  auto actions = parse_string_list(n["actions"], where + ".actions");
  if (!actions.ok()) return Result<ScheduleTask>::err(actions.status());
  t.actions = actions.take_value();

  return Result<ScheduleTask>::ok(t);
}

static Result<Config> parse_config_impl(const YAML::Node& y) {
  Config cfg;  // defaults

  // --- high-level
  maybe_set(y, "node_id", cfg.node_id);

  // --- application
  if (is_map(y["application"])) {
    const auto a = y["application"];
    maybe_set(a, "threaded_runners", cfg.application.threaded_runners);
    maybe_set(a, "main_loop_interval", cfg.application.main_loop_interval_s);
    maybe_set(a, "shutdown_timeout", cfg.application.shutdown_timeout_s);
    maybe_set(a, "heartbeat_every_s", cfg.application.heartbeat_every_s);
    maybe_set(a, "status_report_every_s", cfg.application.status_report_every_s);
    maybe_set(a, "battery_source", cfg.application.battery_source);
    maybe_set(a, "max_ticks", cfg.application.max_ticks);
    maybe_set(a, "max_run_s", cfg.application.max_run_s);

    if (is_map(a["battery_safety"])) {
      const Status s = parse_battery_safety(a["battery_safety"], cfg.application.battery_safety);
      if (!s.ok()) return Result<Config>::err(s);
    }
  }

  // --- runners (mapping order is start order)
  if (y["runners"]) {
    const auto rs = y["runners"];
    if (!rs.IsMap()) return Result<Config>::err(Status::invalid_argument("runners must be a mapping"));
    for (auto it : rs) {
      auto r = parse_runner(it.first.as<std::string>(), it.second);
      if (!r.ok()) return Result<Config>::err(r.status());
      cfg.runners.push_back(r.take_value());
    }
  }

  // --- schedule
  if (y["tasks"]) {
    const auto ts = y["tasks"];
    if (!ts.IsSequence()) return Result<Config>::err(Status::invalid_argument("tasks must be a YAML sequence"));
    for (std::size_t i = 0; i < ts.size(); ++i) {
      auto t = parse_task(i, ts[i]);
      if (!t.ok()) return Result<Config>::err(t.status());
      cfg.tasks.push_back(t.take_value());
    }
  }

  // --- locations
  if (y["locations"]) {
    const auto ls = y["locations"];
    if (!ls.IsMap()) return Result<Config>::err(Status::invalid_argument("locations must be a mapping"));
    for (auto it : ls) {
      const auto name = it.first.as<std::string>();
      if (!is_map(it.second)) {
        return Result<Config>::err(Status::invalid_argument("locations." + name + " must be a mapping with x and y"));
      }
      Position p;
      maybe_set(it.second, "x", p.x);
      maybe_set(it.second, "y", p.y);
      cfg.locations[name] = p;
    }
  }

  // --- output
  if (is_map(y["output"])) {
    const auto o = y["output"];
    maybe_set(o, "out_dir", cfg.output.out_dir);
    maybe_set(o, "keep_last_runs", cfg.output.keep_last_runs);
    maybe_set(o, "echo_to_stderr", cfg.output.echo_to_stderr);
    if (o["min_severity"]) {
      auto sev = parse_severity(o["min_severity"].as<std::string>());
      if (!sev.ok()) return Result<Config>::err(sev.status());
      cfg.output.min_severity = sev.take_value();
    }
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Result<Config> parse_config(const YAML::Node& root) {
  if (root && !root.IsMap()) {
    return Result<Config>::err(Status::invalid_argument("config root must be a mapping"));
  }
  try {
    return parse_config_impl(root);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("invalid config value: ") + e.what()));
  }
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  try {
    auto yaml_r = load_with_includes(path, 0);
    if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
    return parse_config(yaml_r.take_value());
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("YAML error while merging " + path.string() + ": " + e.what()));
  }
}

}  // namespace solar
