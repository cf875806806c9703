// File: tests/test_power_monitor_runner.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "fakes/fake_runners.hpp"
#include "fakes/fake_sensors.hpp"
#include "fakes/memory_event_sink.hpp"
#include "solar/adapters/sim/sim_power_sensor.hpp"
#include "solar/runners/power_monitor_runner.hpp"

namespace solar {
namespace {

using namespace std::chrono_literals;
using test::power_reading;
using test::wait_for;

std::chrono::steady_clock::time_point in(std::chrono::milliseconds d) { return std::chrono::steady_clock::now() + d; }

class PowerMonitorRunnerTest : public ::testing::Test {
 protected:
  std::shared_ptr<PowerMonitorRunner> make(PowerMonitorSettings settings = {}, double interval_s = 0.005) {
    return std::make_shared<PowerMonitorRunner>(test::make_runner_config("solar_power", "ina219", interval_s),
                                                settings, std::make_unique<test::ScriptedPowerSensor>(script));
  }

  void stop(const std::shared_ptr<PowerMonitorRunner>& r) {
    r->request_stop();
    ASSERT_TRUE(r->wait_stopped(in(2000ms)));
  }

  test::MemoryLog m;
  std::shared_ptr<test::SensorScript<PowerReading>> script = std::make_shared<test::SensorScript<PowerReading>>();
};

TEST_F(PowerMonitorRunnerTest, RecordsReadingsAndStats) {
  script->push(power_reading(12.0, 0.5));  // consumed by initialize
  script->push(power_reading(12.0, 0.25));
  script->push(power_reading(12.0, 0.75));
  script->push(power_reading(12.0, 0.5));

  auto r = make();
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return r->history().size() >= 4; }));
  stop(r);

  const auto h = r->history();
  EXPECT_DOUBLE_EQ(h[0].power_w, 3.0);
  EXPECT_DOUBLE_EQ(h[1].power_w, 9.0);
  EXPECT_DOUBLE_EQ(h[2].power_w, 6.0);
  EXPECT_DOUBLE_EQ(h.back().power_w, 6.0);

  const auto s = r->stats();
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->sample_count, h.size());
  EXPECT_DOUBLE_EQ(s->min_power_w, 3.0);
  EXPECT_DOUBLE_EQ(s->max_power_w, 9.0);
  EXPECT_DOUBLE_EQ(s->avg_voltage_v, 12.0);

  EXPECT_EQ(r->history(2).size(), 2u);
  ASSERT_TRUE(r->last_reading().has_value());
  EXPECT_DOUBLE_EQ(r->last_reading()->power_w, 6.0);
  EXPECT_TRUE(script->closed.load());
}

TEST_F(PowerMonitorRunnerTest, HistoryIsBounded) {
  script->push(power_reading(12.0, 0.5));
  PowerMonitorSettings settings;
  settings.history_size = 5;

  auto r = make(settings);
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return script->reads() >= 12; }));
  stop(r);
  EXPECT_EQ(r->history().size(), 5u);
}

TEST_F(PowerMonitorRunnerTest, NoStatsBeforeFirstCycle) {
  auto r = make();
  EXPECT_FALSE(r->stats().has_value());
  EXPECT_FALSE(r->last_reading().has_value());
  EXPECT_TRUE(r->history().empty());
}

TEST_F(PowerMonitorRunnerTest, LowPowerAlertsOncePerExcursion) {
  script->push(power_reading(12.0, 0.5));  // init
  for (int i = 0; i < 5; ++i) script->push(power_reading(5.0, 0.05));  // 0.25 W
  script->push(power_reading(12.0, 0.5));

  PowerMonitorSettings settings;
  settings.alert_after = 3;
  auto r = make(settings);
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return script->reads() >= 10; }));
  EXPECT_EQ(m.sink->count("solar_power", "power_low_alert"), 1u);
  EXPECT_EQ(m.sink->count("solar_power", "power_high_alert"), 0u);

  // A second excursion alerts again, once.
  for (int i = 0; i < 4; ++i) script->push(power_reading(5.0, 0.05));
  ASSERT_TRUE(wait_for([&] { return m.sink->count("solar_power", "power_low_alert") == 2; }));
  const int reads = script->reads();
  ASSERT_TRUE(wait_for([&] { return script->reads() >= reads + 5; }));
  EXPECT_EQ(m.sink->count("solar_power", "power_low_alert"), 2u);
  stop(r);
}

TEST_F(PowerMonitorRunnerTest, HighPowerAlert) {
  script->push(power_reading(12.0, 0.5));
  script->push(power_reading(12.0, 1.5));  // 18 W

  auto r = make();
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return m.sink->count("solar_power", "power_high_alert") == 1; }));
  stop(r);
}

TEST_F(PowerMonitorRunnerTest, ReadErrorIsAFailedCycle) {
  script->push(power_reading(12.0, 0.5));
  script->push_error(Status::io_error("i2c nack"));
  script->push(power_reading(12.0, 0.5));

  auto r = make();
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return m.sink->count("solar_power", "runner_recovered") == 1; }));
  EXPECT_EQ(r->status().total_errors, 1);
  EXPECT_EQ(r->status().last_error, "i2c nack");
  stop(r);
}

TEST_F(PowerMonitorRunnerTest, OpenFailureFailsInitialization) {
  script->fail_open(Status::unavailable("no device at 0x40"));
  auto r = make();
  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return r->state() == RunnerState::kError; }));
  EXPECT_EQ(m.sink->count("solar_power", "runner_init_failed"), 1u);
  stop(r);
}

TEST_F(PowerMonitorRunnerTest, HealthyWhileReadingsAreFresh) {
  script->push(power_reading(12.0, 0.5));
  auto r = make({}, 0.1);
  ASSERT_TRUE(r->start(m.log).ok());
  EXPECT_TRUE(wait_for([&] { return r->is_healthy(); }));
  stop(r);
}

TEST_F(PowerMonitorRunnerTest, ScheduledCheckStaysHealthyBetweenSlots) {
  script->push(power_reading(12.0, 0.5));  // consumed by initialize

  RunnerConfig cfg = test::make_runner_config("panel_noon_check", "ina219", 0.005);
  cfg.behavior = RunBehavior::kScheduled;
  const int later = (local_now().time.minute_of_day() + 180) % (24 * 60);
  cfg.schedule_time = TimeOfDay{later / 60, later % 60, 0};
  auto r = std::make_shared<PowerMonitorRunner>(cfg, PowerMonitorSettings{},
                                                std::make_unique<test::ScriptedPowerSensor>(script));

  ASSERT_TRUE(r->start(m.log).ok());
  ASSERT_TRUE(wait_for([&] { return r->state() == RunnerState::kRunning; }));
  std::this_thread::sleep_for(50ms);  // many intervals, no slot
  EXPECT_EQ(r->status().cycle_count, 0);
  EXPECT_TRUE(r->is_healthy());
  stop(r);
}

TEST(PowerMonitorSettings, ParsesFieldsAndAddresses) {
  const YAML::Node n = YAML::Load(R"(
i2c_address: "0x41"
low_power_threshold: 1.0
high_power_threshold: 15.0
log_measurements: false
history_size: 10
)");
  const auto s = parse_power_monitor_settings(n);
  ASSERT_TRUE(s.ok()) << s.status().message();
  EXPECT_EQ(s.value().i2c_address, 0x41);
  EXPECT_DOUBLE_EQ(s.value().low_power_threshold_w, 1.0);
  EXPECT_DOUBLE_EQ(s.value().high_power_threshold_w, 15.0);
  EXPECT_FALSE(s.value().log_measurements);
  EXPECT_EQ(s.value().history_size, 10u);

  EXPECT_EQ(parse_power_monitor_settings(YAML::Load("i2c_address: 64")).value().i2c_address, 0x40);
}

TEST(PowerMonitorSettings, RejectsBadValues) {
  EXPECT_EQ(parse_power_monitor_settings(YAML::Load("i2c_address: \"0x80\"")).status().code(),
            Status::Code::kOutOfRange);
  EXPECT_FALSE(parse_power_monitor_settings(YAML::Load("i2c_address: \"0x4g\"")).ok());
  EXPECT_FALSE(parse_power_monitor_settings(YAML::Load("i2c_address: banana")).ok());
  EXPECT_FALSE(parse_power_monitor_settings(YAML::Load("{low_power_threshold: 5, high_power_threshold: 5}")).ok());
  EXPECT_FALSE(parse_power_monitor_settings(YAML::Load("history_size: 0")).ok());
}

TEST(PowerMonitorFactory, OnlySimulatedAdapterIsAvailable) {
  RunnerConfig cfg = test::make_runner_config("p", "ina219");
  cfg.params = YAML::Load("{adapter: sim, sim: {seed: 3}}");
  const auto ok = make_power_monitor_runner(cfg);
  ASSERT_TRUE(ok.ok()) << ok.status().message();
  EXPECT_NE(std::dynamic_pointer_cast<PowerMonitorRunner>(ok.value()), nullptr);

  cfg.params = YAML::Load("{adapter: i2c}");
  EXPECT_EQ(make_power_monitor_runner(cfg).status().code(), Status::Code::kUnsupported);

  cfg.params = YAML::Load("{i2c_address: \"0x01\"}");
  EXPECT_EQ(make_power_monitor_runner(cfg).status().code(), Status::Code::kInvalidArgument);
}

TEST(SimPowerSensor, SameSeedSameReadings) {
  SimPowerSensorConfig cfg;
  cfg.seed = 42;
  SimPowerSensor a(cfg);
  SimPowerSensor b(cfg);
  ASSERT_TRUE(a.open().ok());
  ASSERT_TRUE(b.open().ok());
  for (int i = 0; i < 50; ++i) {
    PowerReading ra;
    PowerReading rb;
    ASSERT_TRUE(a.read(&ra).ok());
    ASSERT_TRUE(b.read(&rb).ok());
    EXPECT_DOUBLE_EQ(ra.voltage_v, rb.voltage_v);
    EXPECT_DOUBLE_EQ(ra.current_a, rb.current_a);
    EXPECT_NEAR(ra.voltage_v, cfg.base_voltage_v, cfg.voltage_jitter_v + 1e-9);
    EXPECT_GE(ra.current_a, cfg.current_min_a);
    EXPECT_LE(ra.current_a, cfg.heavy_current_max_a);
  }
}

TEST(SimPowerSensor, ReadBeforeOpenFails) {
  SimPowerSensor s(SimPowerSensorConfig{});
  PowerReading r;
  EXPECT_EQ(s.read(&r).code(), Status::Code::kFailedPrecondition);
}

}  // namespace
}  // namespace solar
