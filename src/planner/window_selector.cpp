#include "planner/window_selector.hpp"
#include "model/chain/receptive_field.hpp"
#include "model/chain/shape_propagator.hpp"
#include "common/errors.hpp"
#include <limits>
#include <string>
#include <utility>

namespace rf {
namespace planner {

namespace {

void ValidateRequest(const BatchRequest& req) {
  if (req.window_count < 1) {
    throw InvalidArgument("SelectWindows: window_count must be >= 1, got " +
                          std::to_string(req.window_count));
  }
  if (req.window_output_span < 1) {
    throw InvalidArgument("SelectWindows: window_output_span must be >= 1, got " +
                          std::to_string(req.window_output_span));
  }
  if (req.stride_between_windows < 0) {
    throw InvalidArgument("SelectWindows: stride_between_windows must be >= 0");
  }
  if (req.output_offset < 0) {
    throw InvalidArgument("SelectWindows: output_offset must be >= 0");
  }
  for (Count off : req.sub_selection) {
    if (off < 0 || off >= req.window_output_span) {
      throw InvalidArgument("SelectWindows: sub_selection offset " + std::to_string(off) +
                            " outside [0, " + std::to_string(req.window_output_span) + ")");
    }
  }
}

void ValidateLengths(const model::Chain& chain, const Reconciliation& lengths) {
  if (lengths.unused_input_count < 0) {
    throw InvalidArgument("SelectWindows: negative unused_input_count");
  }
  if (!model::IsReconciled(chain, lengths.AsPair())) {
    throw InvalidArgument("SelectWindows: lengths (" +
                          std::to_string(lengths.consumed_input_count) + ", " +
                          std::to_string(lengths.achievable_output_count) +
                          ") are not reconciled for this chain");
  }
}

// Fit test for windows in [output_offset, available) without forming the
// (possibly overflowing) used extent. Needs stride > 0 when window_count > 1.
bool FitsInOutputs(const BatchRequest& req, Count available) {
  if (req.output_offset > available) return false;
  const Count room = available - req.output_offset;
  if (req.window_output_span > room) return false;
  if (req.window_count == 1) return true;
  return (room - req.window_output_span) / req.stride_between_windows >= req.window_count - 1;
}

} // namespace

Count UsedOutputCount(const BatchRequest& req) {
  const Count max = std::numeric_limits<Count>::max();
  if (req.window_count > 1 && req.stride_between_windows > 0 &&
      req.window_count - 1 > (max - req.window_output_span) / req.stride_between_windows) {
    throw InsufficientLength("UsedOutputCount: " + std::to_string(req.window_count) +
                             " windows span more outputs than Count can hold");
  }
  return (req.window_count - 1) * req.stride_between_windows + req.window_output_span;
}

BatchPlan SelectWindows(const model::Chain& chain,
                        const Reconciliation& lengths,
                        const BatchRequest& req) {
  chain.RequireStages("SelectWindows");
  ValidateRequest(req);
  ValidateLengths(chain, lengths);

  if (req.window_count > 1) {
    if (req.stride_between_windows == 0) {
      throw DuplicateWindow("SelectWindows: stride_between_windows == 0 makes all " +
                            std::to_string(req.window_count) + " windows identical");
    }
    if (req.require_distinct && req.stride_between_windows < req.window_output_span) {
      throw DuplicateWindow("SelectWindows: stride_between_windows " +
                            std::to_string(req.stride_between_windows) +
                            " < window_output_span " +
                            std::to_string(req.window_output_span) +
                            " overlaps windows while distinct windows are required");
    }
  }

  // (1) Truncate the output range to what the windows actually cover.
  const Count achievable = lengths.achievable_output_count;
  if (!FitsInOutputs(req, achievable)) {
    throw InsufficientLength("SelectWindows: " + std::to_string(req.window_count) +
                             " windows of " + std::to_string(req.window_output_span) +
                             " outputs (stride " + std::to_string(req.stride_between_windows) +
                             ", offset " + std::to_string(req.output_offset) +
                             ") do not fit in " + std::to_string(achievable) +
                             " achievable outputs");
  }
  const Count used = UsedOutputCount(req);

  std::vector<bool> selected(static_cast<std::size_t>(req.window_output_span),
                             req.sub_selection.empty());
  for (Count off : req.sub_selection) selected[static_cast<std::size_t>(off)] = true;

  BatchPlan plan;
  plan.lengths = lengths;
  plan.used_output_count = used;
  plan.input_bound = model::ReceptiveField(
      chain, IndexRange{req.output_offset, req.output_offset + used}, achievable);
  plan.mask_begin = req.output_offset;
  plan.mask.assign(static_cast<std::size_t>(used), false);
  plan.windows.reserve(static_cast<std::size_t>(req.window_count));

  // (2)+(3) Windows in ascending offset; a position already claimed
  // in-register by an earlier window is out-of-register in later ones.
  for (Count k = 0; k < req.window_count; ++k) {
    const Count first = req.output_offset + k * req.stride_between_windows;
    const IndexRange out{first, first + req.window_output_span};
    const IndexRange in = model::ReceptiveField(chain, out, achievable);

    Window win;
    win.input_span = Span{in.begin, in.Size()};
    win.output_indices.reserve(static_cast<std::size_t>(req.window_output_span));
    win.in_register.reserve(static_cast<std::size_t>(req.window_output_span));
    for (Count j = 0; j < req.window_output_span; ++j) {
      const Count idx = first + j;
      const auto slot = static_cast<std::size_t>(idx - plan.mask_begin);
      const bool active = selected[static_cast<std::size_t>(j)] && !plan.mask[slot];
      if (active) plan.mask[slot] = true;
      win.output_indices.push_back(idx);
      win.in_register.push_back(active);
    }
    plan.windows.push_back(std::move(win));
  }

  for (std::size_t i = 0; i < plan.mask.size(); ++i) {
    if (plan.mask[i]) plan.active_indices.push_back(plan.mask_begin + static_cast<Count>(i));
  }
  return plan;
}

BatchPlan PlanBatch(const model::Chain& chain,
                    Count available_input_count,
                    const BatchRequest& req) {
  const Reconciliation lengths = model::Reconcile(chain, available_input_count);
  return SelectWindows(chain, lengths, req);
}

} // namespace planner
} // namespace rf
