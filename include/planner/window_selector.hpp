#pragma once
#include <vector>
#include "common/types.hpp"
#include "model/chain.hpp"
#include "planner/batch_plan.hpp"

namespace rf {
namespace planner {

/**
 * BatchRequest
 * Batch descriptor from the training-loop configuration.
 *
 * Window k covers final outputs
 *   [output_offset + k*stride_between_windows,
 *    output_offset + k*stride_between_windows + window_output_span)
 *
 * stride_between_windows == window_output_span  -> consecutive (clumped)
 * stride_between_windows >  window_output_span  -> skip (spread out)
 * stride_between_windows <  window_output_span  -> overlapping; rejected
 *                                                  unless !require_distinct
 *
 * sub_selection lists window-relative offsets in [0, window_output_span)
 * that are in-register. Empty means every position is in-register.
 */
struct BatchRequest {
  Count window_count           = 1;
  Count window_output_span     = 1;
  Count stride_between_windows = 1;
  Count output_offset          = 0;
  std::vector<Count> sub_selection;
  bool require_distinct        = true;
};

// Output extent covered by the request's windows, starting at output_offset.
// Throws InsufficientLength if the extent does not fit in a Count.
Count UsedOutputCount(const BatchRequest& req);

/**
 * Build a BatchPlan over a reconciled chain length.
 *
 * Throws:
 *  - InvalidArgument     bad request fields, or `lengths` not reconciled
 *  - DuplicateWindow     identical windows, or overlap with require_distinct
 *  - InsufficientLength  windows do not fit in achievable_output_count
 *  - EmptyChain          chain without stages
 * Nothing is returned on failure.
 */
BatchPlan SelectWindows(const model::Chain& chain,
                        const Reconciliation& lengths,
                        const BatchRequest& req);

// Reconcile available_input_count, then SelectWindows.
BatchPlan PlanBatch(const model::Chain& chain,
                    Count available_input_count,
                    const BatchRequest& req);

} // namespace planner
} // namespace rf
