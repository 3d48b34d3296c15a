// All comments are in English.
#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "model/chain.hpp"
#include "model/stage.hpp"
#include "planner/batch_plan.hpp"
#include "planner/window_selector.hpp"

namespace rf {

/**
 * PlanConfig
 * Model chain description plus optional batch request, as read from JSON:
 *
 * {
 *   "name": "frontend",
 *   "stages": [ {"name": "conv1", "kernel_size": 3, "stride": 1,
 *                "dilation": 1, "padding": {"left": 0, "right": 0}}, ... ],
 *   "batch":  {"window_count": 3, "window_output_span": 2,
 *              "stride_between_windows": 2, "output_offset": 0,
 *              "sub_selection": [1], "require_distinct": true}
 * }
 */
struct PlanConfig {
  std::string name;
  std::vector<model::Stage::Params> stages;

  bool                  has_batch = false;
  planner::BatchRequest batch;
};

// Throws InvalidConfiguration on unreadable file, malformed JSON or missing
// required fields. Stage parameter ranges are checked by BuildChain.
PlanConfig ParseConfig(const std::string& json_path);
PlanConfig ParseConfigText(const std::string& json_text);

model::Chain BuildChain(const PlanConfig& cfg);

nlohmann::json ReconciliationToJson(const Reconciliation& r);
nlohmann::json BatchPlanToJson(const planner::BatchPlan& plan);

} // namespace rf
