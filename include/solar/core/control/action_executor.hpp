// File: include/solar/core/control/action_executor.hpp
#pragma once

#include "solar/core/schedule/schedule_engine.hpp"

namespace solar {

// Downstream consumer of selections (navigation / actuation). Called when
// the selection changes, and again on later ticks while it keeps throwing.
class IActionExecutor {
 public:
  virtual ~IActionExecutor() = default;
  virtual void execute(const SelectedAction& action) = 0;
};

}  // namespace solar
