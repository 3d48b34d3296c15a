#include "model/chain/shape_propagator.hpp"
#include "common/errors.hpp"
#include <string>

namespace rf {
namespace model {

std::vector<Count> BackwardTrace(const Chain& chain, Count output_count) {
  chain.RequireStages("BackwardPass");
  if (output_count < 0) {
    throw InvalidArgument("BackwardPass: negative output_count " + std::to_string(output_count));
  }
  const auto& stages = chain.Stages();
  std::vector<Count> trace(stages.size() + 1, 0);
  trace[stages.size()] = output_count;
  for (std::size_t i = stages.size(); i-- > 0;) {
    trace[i] = stages[i].RequiredInputCount(trace[i + 1]);
  }
  return trace;
}

Count BackwardPass(const Chain& chain, Count output_count) {
  return BackwardTrace(chain, output_count).front();
}

std::vector<Count> ForwardTrace(const Chain& chain, Count input_count) {
  chain.RequireStages("ForwardPass");
  if (input_count < 0) {
    throw InvalidArgument("ForwardPass: negative input_count " + std::to_string(input_count));
  }
  const auto& stages = chain.Stages();
  std::vector<Count> trace;
  trace.reserve(stages.size() + 1);
  trace.push_back(input_count);
  for (const auto& stage : stages) {
    trace.push_back(stage.ProducedOutputCount(trace.back()));
  }
  return trace;
}

Count ForwardPass(const Chain& chain, Count input_count) {
  return ForwardTrace(chain, input_count).back();
}

Reconciliation Reconcile(const Chain& chain, Count available_input_count) {
  Reconciliation r;
  r.achievable_output_count = ForwardPass(chain, available_input_count);
  r.consumed_input_count    = BackwardPass(chain, r.achievable_output_count);
  r.unused_input_count      = available_input_count - r.consumed_input_count;
  return r;
}

bool IsReconciled(const Chain& chain, const LengthPair& pair) {
  if (pair.input_count < 0 || pair.output_count < 0) return false;
  return BackwardPass(chain, pair.output_count) == pair.input_count &&
         ForwardPass(chain, pair.input_count) == pair.output_count;
}

} // namespace model
} // namespace rf
