// File: src/core/util/repro_hash.cpp
#include "solar/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace solar {
namespace {

// FNV-1a 64-bit. Not cryptographic. Exactly what we want for fast, stable fingerprints.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_time(Fnv1a64& h, const TimeOfDay& t) { h.add_i32(t.second_of_day()); }

void add_task(Fnv1a64& h, const ScheduleTask& t) {
  h.add_i32(t.trigger == TriggerKind::kExactTime ? 1 : 2);
  if (t.trigger == TriggerKind::kExactTime) {
    add_time(h, t.at);
  } else {
    add_time(h, t.window.start);
    add_time(h, t.window.end);
  }
  h.add_string(t.category);
  h.add_bool(t.target.has_value());
  if (t.target) h.add_string(*t.target);
  h.add_u64(t.actions.size());
  for (const auto& a : t.actions) h.add_string(a);
}

void add_locations(Fnv1a64& h, const std::map<LocationName, Position>& locations) {
  // std::map iteration is sorted, so the hash is independent of YAML key order.
  h.add_u64(locations.size());
  for (const auto& [name, p] : locations) {
    h.add_string(name);
    h.add_double(p.x);
    h.add_double(p.y);
  }
}

void add_runner(Fnv1a64& h, const RunnerConfig& r) {
  h.add_string(r.key);
  h.add_string(r.type);
  h.add_bool(r.enabled);
  h.add_string(r.label);
  h.add_double(r.interval_s);
  h.add_i32(r.max_consecutive_errors);
  h.add_i32(r.max_init_attempts);
  h.add_i32(r.behavior == RunBehavior::kContinuous ? 1 : 2);
  h.add_bool(r.schedule_time.has_value());
  if (r.schedule_time) add_time(h, *r.schedule_time);

  // Type-specific payload: hash its canonical emitter form.
  if (r.params) h.add_string(YAML::Dump(r.params));
}

}  // namespace

std::string compute_schedule_hash(const std::vector<ScheduleTask>& tasks,
                                  const std::map<LocationName, Position>& locations) {
  Fnv1a64 h;
  h.add_u64(tasks.size());
  for (const auto& t : tasks) add_task(h, t);
  add_locations(h, locations);
  return to_hex(h.h);
}

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.node_id);

  // Application.
  const ApplicationConfig& a = cfg.application;
  h.add_bool(a.threaded_runners);
  h.add_double(a.main_loop_interval_s);
  h.add_double(a.shutdown_timeout_s);
  h.add_i32(a.heartbeat_every_s);
  h.add_i32(a.status_report_every_s);
  h.add_string(a.battery_source);
  h.add_i64(a.max_ticks);
  h.add_double(a.max_run_s);

  // Safety envelope.
  const BatterySafetyConfig& b = a.battery_safety;
  h.add_double(b.min_battery_threshold);
  h.add_double(b.max_distance_factor);
  h.add_double(b.total_range_m);
  h.add_double(b.update_interval_s);
  h.add_double(b.stale_after_s);
  h.add_string(b.dock_target);
  h.add_u64(b.dock_actions.size());
  for (const auto& act : b.dock_actions) h.add_string(act);

  // Runners (order matters: it is the start order).
  h.add_u64(cfg.runners.size());
  for (const auto& r : cfg.runners) add_runner(h, r);

  // Schedule + locations.
  h.add_u64(cfg.tasks.size());
  for (const auto& t : cfg.tasks) add_task(h, t);
  add_locations(h, cfg.locations);

  // Output.
  h.add_string(cfg.output.out_dir);
  h.add_i32(cfg.output.keep_last_runs);
  h.add_i32(static_cast<std::int32_t>(cfg.output.min_severity));
  h.add_bool(cfg.output.echo_to_stderr);

  return to_hex(h.h);
}

}  // namespace solar
