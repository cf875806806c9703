// File: tests/test_control_loop.cpp
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

#include "fakes/fake_runners.hpp"
#include "fakes/fake_sensors.hpp"
#include "fakes/memory_event_sink.hpp"
#include "solar/core/control/control_loop.hpp"
#include "solar/runners/ups_monitor_runner.hpp"

namespace solar {
namespace {

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::Optional;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class MockActionExecutor : public IActionExecutor {
 public:
  MOCK_METHOD(void, execute, (const SelectedAction& action), (override));
};

TimestampNs at_s(double s) { return TimestampNs{seconds_to_ns(s)}; }

LocalTime local(int day, int h, int m) { return LocalTime{LocalDate{2026, 6, day}, TimeOfDay{h, m, 0}}; }

Config base_config() {
  Config c;
  c.locations["Dock"] = Position{0.0, 0.0};
  c.locations["PlantA"] = Position{10.0, 5.0};
  c.tasks = {make_window_task({TimeOfDay{7, 0, 0}, TimeOfDay{10, 0, 0}}, "navigation", "PlantA", {"water"}),
             make_exact_task(TimeOfDay{12, 30, 0}, "navigation", "Dock", {"charge"})};
  c.application.heartbeat_every_s = 0;
  return c;
}

class ControlLoopTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(manager.start({}).ok()); }

  std::unique_ptr<ControlLoop> make(Config cfg = base_config()) {
    auto loop = std::make_unique<ControlLoop>(std::move(cfg), manager, m.log, &executor);
    loop->set_battery_provider(battery);
    EXPECT_TRUE(loop->init().ok());
    return loop;
  }

  test::MemoryLog m;
  RunnerManager manager{test::make_fake_factory(), m.log};
  StrictMock<MockActionExecutor> executor;
  std::shared_ptr<test::FakeBatteryProvider> battery = std::make_shared<test::FakeBatteryProvider>();
};

TEST_F(ControlLoopTest, InitLogsScheduleAndRejectsUnknownTargets) {
  auto loop = make();
  EXPECT_EQ(m.sink->count("control", "schedule_loaded"), 1u);
  EXPECT_EQ(loop->engine().task_count(), 2u);

  Config bad = base_config();
  bad.tasks.push_back(make_exact_task(TimeOfDay{1, 0, 0}, "navigation", "Nowhere", {"x"}));
  ControlLoop other(bad, manager, m.log, &executor);
  EXPECT_FALSE(other.init().ok());
}

TEST_F(ControlLoopTest, PublishesOnlyWhenSelectionChanges) {
  auto loop = make();
  battery->set(80.0, at_s(100));

  EXPECT_CALL(executor, execute(AllOf(Field(&SelectedAction::source, ActionSource::kSchedule),
                                      Field(&SelectedAction::target, Optional(std::string("PlantA"))))))
      .Times(1);
  const TickResult first = loop->tick_once(local(1, 8, 0), at_s(100));
  EXPECT_TRUE(first.changed);
  EXPECT_FALSE(first.envelope.stale);
  EXPECT_DOUBLE_EQ(first.envelope.allowed_distance_m, 40.0);

  battery->set(79.0, at_s(101));
  const TickResult second = loop->tick_once(local(1, 8, 0), at_s(101.5));
  EXPECT_FALSE(second.changed);
  EXPECT_EQ(m.sink->count("control", "action_selected"), 1u);
  EXPECT_EQ(loop->tick_count(), 2);
  ::testing::Mock::VerifyAndClearExpectations(&executor);

  // Leaving the window goes idle.
  EXPECT_CALL(executor, execute(Field(&SelectedAction::source, ActionSource::kIdle))).Times(1);
  const TickResult third = loop->tick_once(local(1, 10, 0), at_s(102));
  EXPECT_TRUE(third.changed);
  EXPECT_EQ(m.sink->count("control", "action_selected"), 2u);
}

TEST_F(ControlLoopTest, LowBatteryPublishesSafetyOverride) {
  auto loop = make();
  battery->set(10.0, at_s(100));

  EXPECT_CALL(executor, execute(AllOf(Field(&SelectedAction::source, ActionSource::kOverride),
                                      Field(&SelectedAction::reason, OverrideReason::kLowBattery),
                                      Field(&SelectedAction::target, Optional(std::string("Dock"))))));
  const TickResult r = loop->tick_once(local(1, 8, 0), at_s(100));
  EXPECT_TRUE(r.envelope.low_battery);
  EXPECT_EQ(m.sink->count("control", "safety_override"), 1u);
  EXPECT_EQ(m.sink->count("control", "action_selected"), 0u);
}

TEST_F(ControlLoopTest, MissingBatterySourceIsStale) {
  // No fixed provider, and no "pipower" runner registered.
  ControlLoop loop(base_config(), manager, m.log, &executor);
  ASSERT_TRUE(loop.init().ok());

  EXPECT_CALL(executor, execute(Field(&SelectedAction::reason, OverrideReason::kStaleBattery)));
  const TickResult r = loop.tick_once(local(1, 8, 0), at_s(100));
  EXPECT_TRUE(r.envelope.stale);
  EXPECT_EQ(m.sink->count("control", "battery_stale"), 1u);

  (void)loop.tick_once(local(1, 8, 0), at_s(102));
  EXPECT_EQ(m.sink->count("control", "battery_stale"), 1u);
}

TEST_F(ControlLoopTest, ProviderThatStopsUpdatingGoesStale) {
  auto loop = make();
  battery->set(90.0, at_s(100));

  EXPECT_CALL(executor, execute(Field(&SelectedAction::source, ActionSource::kSchedule)));
  (void)loop->tick_once(local(1, 8, 0), at_s(100));

  EXPECT_CALL(executor, execute(Field(&SelectedAction::reason, OverrideReason::kStaleBattery)));
  const TickResult r = loop->tick_once(local(1, 8, 0), at_s(106));
  EXPECT_TRUE(r.envelope.stale);
  EXPECT_EQ(m.sink->count("control", "battery_stale"), 1u);

  // Fresh data clears it.
  EXPECT_CALL(executor, execute(Field(&SelectedAction::source, ActionSource::kSchedule)));
  battery->set(90.0, at_s(107));
  EXPECT_FALSE(loop->tick_once(local(1, 8, 0), at_s(107)).envelope.stale);
}

TEST_F(ControlLoopTest, InvalidSampleIsRejectedAndLogged) {
  auto loop = make();
  battery->set(150.0, at_s(100));
  EXPECT_CALL(executor, execute(_));
  const TickResult r = loop->tick_once(local(1, 8, 0), at_s(100));
  EXPECT_TRUE(r.envelope.stale);
  EXPECT_EQ(m.sink->count("control", "battery_sample_rejected"), 1u);
}

TEST_F(ControlLoopTest, CurrentPositionOutsideEnvelopeOverrides) {
  auto loop = make();
  loop->set_position_source([] { return Position{45.0, 0.0}; });
  battery->set(80.0, at_s(100));  // 40 m allowed

  EXPECT_CALL(executor, execute(Field(&SelectedAction::reason, OverrideReason::kPositionOutOfRange)));
  (void)loop->tick_once(local(1, 8, 0), at_s(100));
}

TEST_F(ControlLoopTest, ExecutorExceptionIsLoggedNotPropagated) {
  auto loop = make();
  battery->set(80.0, at_s(100));
  EXPECT_CALL(executor, execute(_)).WillOnce(Throw(std::runtime_error("motor driver offline")));
  const TickResult r = loop->tick_once(local(1, 8, 0), at_s(100));
  EXPECT_TRUE(r.changed);
  EXPECT_EQ(m.sink->count("control", "executor_failed"), 1u);
  ::testing::Mock::VerifyAndClearExpectations(&executor);

  // Same selection next tick: not logged again, but handed over again.
  EXPECT_CALL(executor, execute(Field(&SelectedAction::source, ActionSource::kSchedule)));
  const TickResult again = loop->tick_once(local(1, 8, 1), at_s(100.5));
  EXPECT_FALSE(again.changed);
  EXPECT_EQ(m.sink->count("control", "action_selected"), 1u);
}

TEST_F(ControlLoopTest, FailedOverrideDispatchIsRetriedUntilAccepted) {
  auto loop = make();
  battery->set(10.0, at_s(100));

  const auto dock_override = AllOf(Field(&SelectedAction::source, ActionSource::kOverride),
                                   Field(&SelectedAction::reason, OverrideReason::kLowBattery));
  {
    ::testing::InSequence seq;
    EXPECT_CALL(executor, execute(dock_override))
        .Times(2)
        .WillRepeatedly(Throw(std::runtime_error("motor driver offline")));
    EXPECT_CALL(executor, execute(dock_override)).WillOnce(Return());
  }

  for (int i = 0; i < 5; ++i) {
    const TickResult r = loop->tick_once(local(1, 8, 0), at_s(100 + 0.1 * i));
    EXPECT_TRUE(r.action.is_override());
  }
  EXPECT_EQ(m.sink->count("control", "safety_override"), 1u);
  EXPECT_EQ(m.sink->count("control", "executor_failed"), 2u);
}

TEST_F(ControlLoopTest, ReconfigureAppliesOnNextTick) {
  auto loop = make();
  battery->set(80.0, at_s(100));
  EXPECT_CALL(executor, execute(Field(&SelectedAction::source, ActionSource::kSchedule)));
  (void)loop->tick_once(local(1, 8, 0), at_s(100));

  Config next = base_config();
  next.application.battery_safety.min_battery_threshold = 90.0;
  loop->request_reconfigure(next);

  // The carried-over sample is judged by the new threshold.
  EXPECT_CALL(executor, execute(Field(&SelectedAction::reason, OverrideReason::kLowBattery)));
  const TickResult r = loop->tick_once(local(1, 8, 0), at_s(100.5));
  EXPECT_FALSE(r.envelope.stale);
  EXPECT_TRUE(r.envelope.low_battery);
  EXPECT_EQ(m.sink->count("control", "config_reloaded"), 1u);
  EXPECT_DOUBLE_EQ(loop->config().application.battery_safety.min_battery_threshold, 90.0);
}

TEST_F(ControlLoopTest, InvalidReconfigureKeepsCurrentConfig) {
  auto loop = make();
  Config bad = base_config();
  bad.application.main_loop_interval_s = 0.0;
  loop->request_reconfigure(bad);

  battery->set(80.0, at_s(100));
  EXPECT_CALL(executor, execute(_));
  (void)loop->tick_once(local(1, 8, 0), at_s(100));
  EXPECT_EQ(m.sink->count("control", "config_reload_failed"), 1u);
  EXPECT_DOUBLE_EQ(loop->config().application.main_loop_interval_s, 2.0);
}

TEST_F(ControlLoopTest, ScheduleReloadsOnDayRollover) {
  auto loop = make();
  int reloads = 0;
  loop->set_schedule_reload([&reloads]() {
    ++reloads;
    ScheduleSnapshot snap;
    snap.tasks = {make_window_task({TimeOfDay{0, 0, 0}, TimeOfDay{6, 0, 0}}, "system_check", std::nullopt, {"scan"})};
    snap.locations = base_config().locations;
    return Result<ScheduleSnapshot>::ok(std::move(snap));
  });

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtLeast(1));
  battery->set(80.0, at_s(100));
  (void)loop->tick_once(local(1, 23, 59), at_s(100));
  EXPECT_EQ(reloads, 0);

  battery->set(80.0, at_s(101));
  const TickResult r = loop->tick_once(local(2, 0, 1), at_s(101));
  EXPECT_EQ(reloads, 1);
  EXPECT_EQ(loop->engine().task_count(), 1u);
  EXPECT_EQ(r.action.actions, std::vector<std::string>{"scan"});
  EXPECT_EQ(m.sink->count("control", "schedule_reloaded"), 1u);
}

TEST_F(ControlLoopTest, FailedScheduleReloadKeepsOldSchedule) {
  auto loop = make();
  loop->set_schedule_reload(
      [] { return Result<ScheduleSnapshot>::err(Status::parse_error("daily_schedule.yaml: bad")); });

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtLeast(1));
  battery->set(80.0, at_s(100));
  (void)loop->tick_once(local(1, 23, 59), at_s(100));
  (void)loop->tick_once(local(2, 0, 1), at_s(101));
  EXPECT_EQ(loop->engine().task_count(), 2u);
  EXPECT_EQ(m.sink->count("control", "schedule_reload_failed"), 1u);
}

TEST_F(ControlLoopTest, ScheduleReloadPicksUpNewLocations) {
  auto loop = make();
  loop->set_schedule_reload([] {
    ScheduleSnapshot snap;
    snap.locations = base_config().locations;
    snap.locations["Greenhouse"] = Position{0.0, 12.0};
    snap.tasks = {make_window_task({TimeOfDay{0, 0, 0}, TimeOfDay{6, 0, 0}}, "navigation", "Greenhouse", {"water"})};
    return Result<ScheduleSnapshot>::ok(std::move(snap));
  });

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtLeast(1));
  battery->set(80.0, at_s(100));
  (void)loop->tick_once(local(1, 23, 59), at_s(100));

  battery->set(80.0, at_s(101));
  const TickResult r = loop->tick_once(local(2, 0, 1), at_s(101));
  EXPECT_EQ(m.sink->count("control", "schedule_reload_failed"), 0u);
  EXPECT_EQ(m.sink->count("control", "schedule_reloaded"), 1u);
  EXPECT_EQ(r.action.source, ActionSource::kSchedule);
  EXPECT_EQ(r.action.target, std::optional<std::string>("Greenhouse"));
  EXPECT_EQ(loop->config().locations.count("Greenhouse"), 1u);
}

TEST_F(ControlLoopTest, ScheduleReloadWithUnknownTargetKeepsOldSchedule) {
  auto loop = make();
  loop->set_schedule_reload([] {
    ScheduleSnapshot snap;
    snap.locations = base_config().locations;
    snap.tasks = {make_exact_task(TimeOfDay{1, 0, 0}, "navigation", "Nowhere", {"x"})};
    return Result<ScheduleSnapshot>::ok(std::move(snap));
  });

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtLeast(1));
  battery->set(80.0, at_s(100));
  (void)loop->tick_once(local(1, 23, 59), at_s(100));
  (void)loop->tick_once(local(2, 0, 1), at_s(101));
  EXPECT_EQ(loop->engine().task_count(), 2u);
  EXPECT_EQ(loop->config().tasks.size(), 2u);
  EXPECT_EQ(m.sink->count("control", "schedule_reload_failed"), 1u);
}

TEST_F(ControlLoopTest, HeartbeatAndStatusReportFollowTheirPeriods) {
  Config cfg = base_config();
  cfg.application.heartbeat_every_s = 30;
  cfg.application.status_report_every_s = 60;
  auto loop = make(cfg);

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtLeast(1));
  for (int i = 0; i <= 60; i += 2) {
    battery->set(80.0, at_s(100 + i));
    (void)loop->tick_once(local(1, 8, 0), at_s(100 + i));
  }
  EXPECT_EQ(m.sink->count("control", "heartbeat"), 3u);      // t=0, 30, 60
  EXPECT_EQ(m.sink->count("control", "status_report"), 2u);  // t=0, 60
}

TEST_F(ControlLoopTest, RunStopsAfterMaxTicks) {
  Config cfg = base_config();
  cfg.application.max_ticks = 3;
  cfg.application.main_loop_interval_s = 0.01;
  auto loop = make(cfg);
  battery->set(80.0, steady_now_ns());

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtMost(3));
  std::stop_source stop;
  ASSERT_TRUE(loop->run(stop.get_token()).ok());
  EXPECT_EQ(loop->tick_count(), 3);
  EXPECT_EQ(m.sink->count("control", "shutdown"), 1u);
}

TEST_F(ControlLoopTest, RunReturnsPromptlyOnStop) {
  Config cfg = base_config();
  cfg.application.main_loop_interval_s = 3600.0;
  auto loop = make(cfg);

  EXPECT_CALL(executor, execute(_)).Times(::testing::AtMost(1));
  std::stop_source stop;
  std::jthread stopper([&stop] {
    std::this_thread::sleep_for(50ms);
    stop.request_stop();
  });

  const auto t0 = std::chrono::steady_clock::now();
  ASSERT_TRUE(loop->run(stop.get_token()).ok());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  EXPECT_EQ(loop->tick_count(), 1);
}

// The "pipower" runner feeds the safety monitor through the manager.
TEST(ControlLoopWithRunners, BatteryComesFromConfiguredRunner) {
  test::MemoryLog m;
  auto script = std::make_shared<test::SensorScript<UpsReading>>();
  script->push(test::ups_reading(8.4, true));

  RunnerFactory factory;
  ASSERT_TRUE(factory
                  .register_type("pipower",
                                 [script](const RunnerConfig& c) -> Result<std::shared_ptr<Runner>> {
                                   return Result<std::shared_ptr<Runner>>::ok(std::make_shared<UpsMonitorRunner>(
                                       c, UpsMonitorSettings{}, std::make_unique<test::ScriptedUpsSensor>(script)));
                                 })
                  .ok());

  RunnerManager manager(std::move(factory), m.log);
  ASSERT_TRUE(manager.start({test::make_runner_config("pipower", "pipower", 0.05)}).ok());
  auto ups = std::dynamic_pointer_cast<UpsMonitorRunner>(manager.get_runner("pipower"));
  ASSERT_NE(ups, nullptr);
  ASSERT_TRUE(test::wait_for([&] { return ups->battery_level().has_value(); }));

  ControlLoop loop(base_config(), manager, m.log);
  ASSERT_TRUE(loop.init().ok());
  const TickResult r = loop.tick_once(local(1, 8, 0), steady_now_ns());
  EXPECT_FALSE(r.envelope.stale);
  EXPECT_NEAR(r.envelope.battery_percentage, 100.0, 1e-9);
  EXPECT_EQ(r.action.source, ActionSource::kSchedule);

  (void)manager.shutdown(2s);
}

}  // namespace
}  // namespace solar
