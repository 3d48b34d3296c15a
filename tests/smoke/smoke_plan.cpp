// Smoke: config file -> RunPlan -> JSON, on a three-stage front end.
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "runner/config.hpp"
#include "runner/plan_runner.hpp"

int main() {
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() / "rfield_smoke_plan.json";
  {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    assert(ofs && "cannot write temp config");
    ofs << R"({
      "name": "frontend",
      "stages": [
        {"name": "conv1", "kernel_size": 3, "stride": 1},
        {"name": "conv2", "kernel_size": 3, "stride": 2},
        {"name": "dil1",  "kernel_size": 2, "stride": 1, "dilation": 2}
      ],
      "batch": {"window_count": 3, "window_output_span": 2,
                "stride_between_windows": 2, "sub_selection": [1]}
    })";
  }

  rf::PlanConfig cfg = rf::ParseConfig(path.string());
  fs::remove(path);

  std::ostringstream log;
  rf::PlanResult result = rf::RunPlan(cfg, 64, log);
  std::cout << log.str();

  // 64 -> 62 -> 30 -> 28 ; 28 outputs consume 63 inputs.
  assert((result.forward_trace == std::vector<rf::Count>{64, 62, 30, 28}));
  assert(result.reconciliation.achievable_output_count == 28);
  assert(result.reconciliation.consumed_input_count == 63);
  assert(result.reconciliation.unused_input_count == 1);

  assert(result.plan.has_value());
  assert(result.plan->NumWindows() == 3);
  assert((result.plan->active_indices == std::vector<rf::Count>{1, 3, 5}));
  assert(result.plan->input_bound.end <= result.reconciliation.consumed_input_count);

  assert(log.str().find("[Planner] stage 1 \"conv2\": 62 -> 30") != std::string::npos);
  assert(log.str().find("unused_trailing=1") != std::string::npos);

  const std::string dumped = rf::BatchPlanToJson(*result.plan).dump();
  assert(dumped.find("\"active_indices\":[1,3,5]") != std::string::npos);

  std::cout << "[OK] Plan smoke test passed.\n";
  return 0;
}
