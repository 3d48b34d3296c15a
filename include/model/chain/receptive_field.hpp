#pragma once
#include <cstddef>
#include "common/types.hpp"
#include "model/chain.hpp"

namespace rf {
namespace model {

/**
 * Receptive field of the final-output range [out.begin, out.end) for a chain
 * whose final output length is output_count. Stage lengths are taken from
 * BackwardTrace(chain, output_count), i.e. the raw input is assumed to be
 * exactly the consumed length. The result is clipped to real input.
 *
 * Empty `out` yields [0, 0). Throws InvalidArgument if `out` is not inside
 * [0, output_count), EmptyChain on an empty chain.
 */
IndexRange ReceptiveField(const Chain& chain, const IndexRange& out, Count output_count);

/**
 * Same, restricted to stages [first_stage, last_stage]. `out` indexes the
 * output of last_stage (length output_count); the result indexes the input
 * of first_stage. Throws InvalidArgument unless
 * first_stage <= last_stage < chain.Size().
 */
IndexRange ReceptiveField(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                          const IndexRange& out, Count output_count);

/**
 * Maximal final-output range in which every element's receptive field is a
 * subset of raw input [in.begin, in.end), for a raw input of length
 * input_count. Padding is only used where `in` touches either end of the
 * input. Returns [0, 0) if no element qualifies.
 */
IndexRange OutputRange(const Chain& chain, const IndexRange& in, Count input_count);

// Stages [first_stage, last_stage] only; input_count enters first_stage.
IndexRange OutputRange(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                       const IndexRange& in, Count input_count);

/**
 * Shadow
 * Where the output of OutputRange(in) sits when laid back onto the input
 * grid: each output element is placed at the input position under its
 * kernel centre (left wing minus left padding, accumulated over stages),
 * and consecutive outputs are spaced by the product of strides.
 *
 * Returns [first, last + 1) over input positions, or [0, 0) when the output
 * range is empty. Useful for aligning an intermediate feature map with the
 * input that fed it.
 */
IndexRange Shadow(const Chain& chain, const IndexRange& in, Count input_count);
IndexRange Shadow(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                  const IndexRange& in, Count input_count);

} // namespace model
} // namespace rf
