#pragma once
#include <string>
#include "common/types.hpp"

namespace rf {
namespace model {

/**
 * Stage
 * Length-mapping rule of one scanning-window transform (a strided, dilated
 * 1D convolution or pooling step).
 *
 *   effective_kernel = (kernel_size - 1) * dilation + 1
 *
 * The filter is viewed as a left wing, a key element and a right wing:
 *   left_wing  = (effective_kernel - 1) / 2
 *   right_wing = (effective_kernel - 1) - left_wing
 * Padding on a side may not exceed the wing on that side, so the key element
 * always sits over real input.
 *
 * Immutable after construction. Construction throws InvalidConfiguration on
 * kernel/stride/dilation < 1 or padding outside [0, wing].
 */
class Stage {
public:
  struct Params {
    Count kernel_size   = 1;
    Count stride        = 1;
    Count dilation      = 1;
    Count left_padding  = 0;
    Count right_padding = 0;
    std::string name;
  };

  explicit Stage(const Params& p);
  Stage(Count kernel_size, Count stride, Count dilation = 1);

  Count KernelSize()   const noexcept { return kernel_size_; }
  Count Stride()       const noexcept { return stride_; }
  Count Dilation()     const noexcept { return dilation_; }
  Count LeftPadding()  const noexcept { return left_padding_; }
  Count RightPadding() const noexcept { return right_padding_; }
  const std::string& Name() const noexcept { return name_; }

  Count EffectiveKernel() const noexcept { return (kernel_size_ - 1) * dilation_ + 1; }
  Count LeftWing()  const noexcept { return (EffectiveKernel() - 1) / 2; }
  Count RightWing() const noexcept { return (EffectiveKernel() - 1) - LeftWing(); }

  // Number of outputs yielded by input_count inputs. Remainder inputs that
  // cannot fill another stride step are dropped.
  Count ProducedOutputCount(Count input_count) const;

  // Minimum number of inputs yielding exactly output_count outputs.
  // ProducedOutputCount(RequiredInputCount(n)) == n for every n >= 0.
  Count RequiredInputCount(Count output_count) const;

  // Input range influencing outputs [out.begin, out.end), clipped to
  // [0, input_count). Padding positions are not part of the result.
  IndexRange ReceptiveField(const IndexRange& out, Count input_count) const;

  // Maximal output range whose receptive fields all lie inside `in`.
  // Padding is usable only where `in` touches the ends of [0, input_count).
  // Returns [0, 0) when nothing qualifies.
  IndexRange OutputRange(const IndexRange& in, Count input_count) const;

  // [l^r, s=S, d=D, lp--rp, "name"]
  std::string DebugString() const;

private:
  void Validate_() const;

  Count kernel_size_   = 1;
  Count stride_        = 1;
  Count dilation_      = 1;
  Count left_padding_  = 0;
  Count right_padding_ = 0;
  std::string name_;
};

} // namespace model
} // namespace rf
