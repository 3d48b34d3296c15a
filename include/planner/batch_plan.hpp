#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace rf {
namespace planner {

/**
 * Window
 * One aligned selection of consecutive final-output positions together with
 * the raw-input slice that produces them.
 *
 *  - output_indices: ascending global output indices (prediction order)
 *  - in_register:    parallel to output_indices; true when the position counts
 *                    toward the primary loss
 *  - input_span:     raw input slice covering the receptive field of every
 *                    output index
 */
struct Window {
  std::vector<Count> output_indices;
  std::vector<bool>  in_register;
  Span               input_span;

  Count FirstOutput() const;
  Count LastOutput() const;
  std::size_t NumInRegister() const;

  // Throws std::out_of_range if output_index is not part of this window.
  bool InRegister(Count output_index) const;
};

/**
 * BatchPlan
 * Windows in temporal order (ascending input offset) plus a boolean mask over
 * the union of candidate output positions
 * [mask_begin, mask_begin + mask.size()). Positions between windows under
 * skip selection stay false.
 */
struct BatchPlan {
  Reconciliation lengths;          // reconciled lengths the plan was built from
  Count          used_output_count = 0;  // output extent covered by the windows
  IndexRange     input_bound;      // raw input every window lies inside

  std::vector<Window> windows;

  Count             mask_begin = 0;
  std::vector<bool> mask;
  std::vector<Count> active_indices;  // ascending global indices where mask is true

  std::size_t NumWindows() const noexcept { return windows.size(); }
  std::size_t NumActive() const noexcept { return active_indices.size(); }

  // Mask lookup by global output index; false outside the mask range.
  bool MaskAt(Count output_index) const;

  std::string DebugString() const;
};

} // namespace planner
} // namespace rf
