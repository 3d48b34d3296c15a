#pragma once
#include <cstdint>
#include <string>

namespace rf {

// Sequence lengths and indices. Signed so negative inputs can be rejected
// instead of wrapping.
using Count = std::int64_t;

/**
 * LengthPair
 * (input_count, output_count) for one chain, always consistent with the
 * chain's forward/backward mapping. Transient; recomputed on demand.
 */
struct LengthPair {
  Count input_count  = 0;
  Count output_count = 0;
};

/**
 * Reconciliation
 * Result of forward-then-backward propagation of an available raw length.
 *   consumed_input_count + unused_input_count == available input
 */
struct Reconciliation {
  Count consumed_input_count    = 0;
  Count achievable_output_count = 0;
  Count unused_input_count      = 0;

  LengthPair AsPair() const noexcept {
    return LengthPair{consumed_input_count, achievable_output_count};
  }
  Count AvailableInputCount() const noexcept {
    return consumed_input_count + unused_input_count;
  }
};

// Half-open index range [begin, end).
struct IndexRange {
  Count begin = 0;
  Count end   = 0;

  Count Size() const noexcept { return end - begin; }
  bool Empty() const noexcept { return end <= begin; }

  std::string DebugString() const {
    return "[" + std::to_string(begin) + ", " + std::to_string(end) + ")";
  }
};

inline bool operator==(const IndexRange& a, const IndexRange& b) {
  return a.begin == b.begin && a.end == b.end;
}
inline bool operator!=(const IndexRange& a, const IndexRange& b) { return !(a == b); }

// Start offset + length into the raw input.
struct Span {
  Count offset = 0;
  Count length = 0;

  Count End() const noexcept { return offset + length; }
};

} // namespace rf
