// File: include/solar/core/runner/runner_factory.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "solar/core/config.hpp"
#include "solar/core/runner/runner.hpp"
#include "solar/core/status.hpp"

namespace solar {

// Explicit type tag -> constructor mapping, resolved once at startup.
// Unknown tags are configuration errors.
class RunnerFactory {
 public:
  // Creators parse cfg.params themselves and report bad fields as errors.
  using Creator = std::function<Result<std::shared_ptr<Runner>>(const RunnerConfig& cfg)>;

  // invalid_argument when the tag is empty or already registered.
  Status register_type(const std::string& type, Creator creator);

  [[nodiscard]] bool knows(const std::string& type) const;
  [[nodiscard]] std::vector<std::string> types() const;

  Result<std::shared_ptr<Runner>> create(const RunnerConfig& cfg) const;

 private:
  std::map<std::string, Creator> creators_;
};

}  // namespace solar
