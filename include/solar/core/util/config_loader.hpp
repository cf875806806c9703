// File: include/solar/core/util/config_loader.hpp
#pragma once

#include <string>

#include <yaml-cpp/yaml.h>

#include "solar/core/config.hpp"
#include "solar/core/status.hpp"

namespace solar {

// Loads a YAML config file (supports optional `includes:` for layering).
// - Includes are loaded first (in order), then overridden by the main file.
// - Relative include paths are resolved relative to the including file.
//
// Returns a fully populated Config with defaults applied + validated.
Result<Config> load_config(const std::string& path);

// Same as load_config for an already-merged document (no includes handling).
Result<Config> parse_config(const YAML::Node& root);

}  // namespace solar
