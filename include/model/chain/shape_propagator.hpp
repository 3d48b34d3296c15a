#pragma once
#include <vector>
#include "common/types.hpp"
#include "model/chain.hpp"

namespace rf {
namespace model {

/*
 * Length propagation along a Chain.
 *
 * Traces have Size()+1 entries: trace[i] is the length entering stage i,
 * trace[Size()] is the final output length.
 *
 * All functions throw EmptyChain on a chain without stages and
 * InvalidArgument on a negative count.
 */

// Backward pass: minimal raw input length realising output_count final outputs.
Count BackwardPass(const Chain& chain, Count output_count);
std::vector<Count> BackwardTrace(const Chain& chain, Count output_count);

// Forward pass: final outputs achievable from input_count raw inputs.
Count ForwardPass(const Chain& chain, Count input_count);
std::vector<Count> ForwardTrace(const Chain& chain, Count input_count);

/**
 * Reconcile an available raw length that need not be aligned:
 *   achievable = ForwardPass(available)
 *   consumed   = BackwardPass(achievable)   (<= available)
 *   unused     = available - consumed       (trailing surplus)
 * Idempotent: Reconcile(consumed) yields the same consumed/achievable pair
 * with unused == 0.
 */
Reconciliation Reconcile(const Chain& chain, Count available_input_count);

// True when pair is a fixed point of Reconcile for this chain.
bool IsReconciled(const Chain& chain, const LengthPair& pair);

} // namespace model
} // namespace rf
