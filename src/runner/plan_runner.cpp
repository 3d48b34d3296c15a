// All comments are in English.
#include "runner/plan_runner.hpp"
#include "model/chain.hpp"
#include "model/chain/shape_propagator.hpp"
#include "planner/window_selector.hpp"

namespace rf {

PlanResult RunPlan(const PlanConfig& cfg, Count input_count, std::ostream& log) {
  const model::Chain chain = BuildChain(cfg);
  log << "[Planner] " << chain.DebugString();

  PlanResult result;
  result.forward_trace  = model::ForwardTrace(chain, input_count);
  result.reconciliation = model::Reconcile(chain, input_count);

  for (std::size_t i = 0; i < chain.Size(); ++i) {
    log << "[Planner] stage " << i << " \"" << chain.At(i).Name() << "\": "
        << result.forward_trace[i] << " -> " << result.forward_trace[i + 1] << "\n";
  }

  const auto& r = result.reconciliation;
  log << "[Planner] input=" << input_count
      << " consumed=" << r.consumed_input_count
      << " achievable_output=" << r.achievable_output_count
      << " unused_trailing=" << r.unused_input_count << "\n";

  if (cfg.has_batch) {
    result.plan = planner::SelectWindows(chain, r, cfg.batch);
    log << "[Planner] " << result.plan->DebugString();
  }
  return result;
}

} // namespace rf
