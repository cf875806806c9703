// File: src/core/runner/runner_factory.cpp
#include "solar/core/runner/runner_factory.hpp"

#include <exception>
#include <utility>

namespace solar {

Status RunnerFactory::register_type(const std::string& type, Creator creator) {
  if (type.empty()) return Status::invalid_argument("runner type tag must not be empty");
  if (!creator) return Status::invalid_argument("runner type '" + type + "': null creator");
  if (!creators_.emplace(type, std::move(creator)).second) {
    return Status::invalid_argument("runner type '" + type + "' registered twice");
  }
  return Status::ok_status();
}

bool RunnerFactory::knows(const std::string& type) const {
  return creators_.find(type) != creators_.end();
}

std::vector<std::string> RunnerFactory::types() const {
  std::vector<std::string> out;
  out.reserve(creators_.size());
  for (const auto& [type, creator] : creators_) out.push_back(type);
  return out;
}

Result<std::shared_ptr<Runner>> RunnerFactory::create(const RunnerConfig& cfg) const {
  using R = Result<std::shared_ptr<Runner>>;

  const auto it = creators_.find(cfg.type);
  if (it == creators_.end()) {
    return R::err(Status::invalid_argument("runners." + cfg.key + ": unknown runner type '" + cfg.type + "'"));
  }

  try {
    auto r = it->second(cfg);
    if (r.ok() && !r.value()) {
      return R::err(Status::internal("runners." + cfg.key + ": creator returned null"));
    }
    return r;
  } catch (const YAML::Exception& e) {
    return R::err(Status::invalid_argument("runners." + cfg.key + ": " + e.what()));
  } catch (const std::exception& e) {
    return R::err(Status::internal("runners." + cfg.key + ": " + e.what()));
  }
}

}  // namespace solar
