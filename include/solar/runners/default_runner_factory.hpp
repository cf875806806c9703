// File: include/solar/runners/default_runner_factory.hpp
#pragma once

#include "solar/core/runner/runner_factory.hpp"

namespace solar {

// Factory with every runner type this build ships: "ina219", "pipower".
RunnerFactory make_default_runner_factory();

}  // namespace solar
