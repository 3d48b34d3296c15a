// All comments are in English.
#pragma once
#include <iostream>
#include <optional>
#include <vector>

#include "common/types.hpp"
#include "planner/batch_plan.hpp"
#include "runner/config.hpp"

namespace rf {

struct PlanResult {
  Reconciliation              reconciliation;
  std::vector<Count>          forward_trace;   // length entering each stage, then final output
  std::optional<planner::BatchPlan> plan;      // set when the config has a batch section
};

// Builds the chain, reconciles input_count and, if cfg.has_batch, selects
// windows. Progress goes to `log`. Errors propagate unchanged.
PlanResult RunPlan(const PlanConfig& cfg, Count input_count, std::ostream& log = std::cout);

} // namespace rf
