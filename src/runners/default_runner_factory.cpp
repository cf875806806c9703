// File: src/runners/default_runner_factory.cpp
#include "solar/runners/default_runner_factory.hpp"

#include "solar/runners/power_monitor_runner.hpp"
#include "solar/runners/ups_monitor_runner.hpp"

namespace solar {

RunnerFactory make_default_runner_factory() {
  RunnerFactory f;
  // Fresh factory; registration of distinct tags cannot fail.
  (void)f.register_type("ina219", make_power_monitor_runner);
  (void)f.register_type("pipower", make_ups_monitor_runner);
  return f;
}

}  // namespace solar
