// File: src/apps/solar_node/main.cpp
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "solar/core/control/action_executor.hpp"
#include "solar/core/control/control_loop.hpp"
#include "solar/core/events/event_log.hpp"
#include "solar/core/events/jsonl_event_sink.hpp"
#include "solar/core/runner/runner_manager.hpp"
#include "solar/core/util/config_loader.hpp"
#include "solar/core/util/repro_hash.hpp"
#include "solar/runners/default_runner_factory.hpp"

namespace {

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "solar_node\n"
            << "  --config <path>\n"
            << "\n"
            << "  SIGINT/SIGTERM  stop\n"
            << "  SIGHUP          reload configuration\n";
}

// Stand-in for the navigation stack: prints what the robot should be doing.
class StdoutExecutor final : public solar::IActionExecutor {
 public:
  void execute(const solar::SelectedAction& action) override {
    std::cout << (action.is_override() ? "[override] " : "[action] ") << action.describe() << "\n";
  }
};

std::chrono::nanoseconds to_duration(double seconds) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::duration<double>(seconds));
}

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  // Signals are consumed synchronously below; block them before any thread exists
  // so every runner thread inherits the mask.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGHUP);
  if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
    std::cerr << "failed to block signals\n";
    return 2;
  }

  auto cfg_r = solar::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  solar::Config cfg = cfg_r.take_value();

  auto sink = std::make_shared<solar::JsonlEventSink>();

  solar::EventLogOptions opts;
  opts.out_dir = cfg.output.out_dir;
  opts.keep_last_runs = static_cast<std::size_t>(cfg.output.keep_last_runs);
  opts.min_severity = cfg.output.min_severity;
  opts.echo_to_stderr = cfg.output.echo_to_stderr;
  auto log = std::make_shared<solar::EventLog>(sink, opts);

  const solar::Status st_log = log->start(cfg.node_id, args.config_path, solar::compute_config_hash(cfg));
  if (!st_log.ok()) {
    std::cerr << st_log.message() << "\n";
    return 2;
  }

  // Ensure we always flush/close the event stream.
  struct Guard {
    solar::EventLog& l;
    ~Guard() { l.stop(); }
  } guard{*log};

  solar::RunnerManager manager(solar::make_default_runner_factory(), log, cfg.application.threaded_runners);
  const solar::Status st_runners = manager.start(cfg.runners);
  if (!st_runners.ok()) {
    (void)log->error("manager", "config_error", st_runners.message());
    std::cerr << st_runners.message() << "\n";
    return 1;
  }

  StdoutExecutor executor;
  solar::ControlLoop loop(cfg, manager, log, &executor);
  const solar::Status st_init = loop.init();
  if (!st_init.ok()) {
    (void)log->error("control", "config_error", st_init.message());
    std::cerr << st_init.message() << "\n";
    return 1;
  }

  const std::string config_path = args.config_path;
  loop.set_schedule_reload([config_path]() -> solar::Result<solar::ScheduleSnapshot> {
    using R = solar::Result<solar::ScheduleSnapshot>;
    auto c = solar::load_config(config_path);
    if (!c.ok()) return R::err(c.status());
    solar::Config loaded = c.take_value();
    return R::ok(solar::ScheduleSnapshot{std::move(loaded.tasks), std::move(loaded.locations)});
  });

  std::cout << "Events: " << sink->path() << " (latest: " << sink->latest_path() << ")\n";
  std::cout << "Node: " << cfg.node_id << "  runners=" << manager.keys().size()
            << "  tasks=" << cfg.tasks.size()
            << "  main_loop_interval=" << cfg.application.main_loop_interval_s << "s\n\n";

  std::atomic<bool> loop_done{false};
  solar::Status loop_status;
  std::jthread control([&](std::stop_token stop) {
    loop_status = loop.run(stop);
    loop_done.store(true);
  });

  const timespec poll{0, 200'000'000};
  while (!loop_done.load()) {
    siginfo_t info;
    const int sig = sigtimedwait(&signals, &info, &poll);
    if (sig < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      std::cerr << "sigtimedwait failed\n";
      control.request_stop();
      break;
    }

    if (sig == SIGHUP) {
      auto next = solar::load_config(config_path);
      if (!next.ok()) {
        (void)log->error("control", "config_reload_failed", next.status().message());
        continue;
      }
      loop.request_reconfigure(next.take_value());
      continue;
    }

    (void)log->info("control", "signal", sig == SIGINT ? "SIGINT" : "SIGTERM");
    control.request_stop();
  }
  control.join();

  const solar::SystemStatus final_status =
      manager.shutdown(to_duration(loop.config().application.shutdown_timeout_s));

  std::cout << "\n" << manager.format_status_report();
  if (final_status.forced_stops > 0) {
    std::cerr << final_status.forced_stops << " runner(s) force-stopped at shutdown\n";
  }

  if (!loop_status.ok()) {
    std::cerr << loop_status.message() << "\n";
    return 2;
  }
  std::cout << "OK\n";
  return 0;
}
