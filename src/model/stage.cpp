#include "model/stage.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace rf {
namespace model {

namespace {

// floor division for a possibly negative numerator and positive denominator
Count FloorDiv(Count num, Count den) {
  Count q = num / den;
  if ((num % den != 0) && (num < 0)) --q;
  return q;
}

Count CeilDiv(Count num, Count den) {
  return -FloorDiv(-num, den);
}

} // namespace

Stage::Stage(const Params& p)
    : kernel_size_(p.kernel_size),
      stride_(p.stride),
      dilation_(p.dilation),
      left_padding_(p.left_padding),
      right_padding_(p.right_padding),
      name_(p.name) {
  Validate_();
}

Stage::Stage(Count kernel_size, Count stride, Count dilation)
    : kernel_size_(kernel_size), stride_(stride), dilation_(dilation) {
  Validate_();
}

void Stage::Validate_() const {
  if (kernel_size_ < 1) {
    throw InvalidConfiguration("Stage: kernel_size must be >= 1, got " +
                               std::to_string(kernel_size_));
  }
  if (stride_ < 1) {
    throw InvalidConfiguration("Stage: stride must be >= 1, got " + std::to_string(stride_));
  }
  if (dilation_ < 1) {
    throw InvalidConfiguration("Stage: dilation must be >= 1, got " +
                               std::to_string(dilation_));
  }
  if (kernel_size_ - 1 > (std::numeric_limits<Count>::max() - 1) / dilation_) {
    throw InvalidConfiguration("Stage: effective kernel of kernel_size " +
                               std::to_string(kernel_size_) + " and dilation " +
                               std::to_string(dilation_) + " overflows");
  }
  if (left_padding_ < 0 || right_padding_ < 0) {
    throw InvalidConfiguration("Stage: padding must be non-negative");
  }
  if (left_padding_ > LeftWing() || right_padding_ > RightWing()) {
    throw InvalidConfiguration("Stage: padding exceeds filter wing in " + DebugString());
  }
}

Count Stage::ProducedOutputCount(Count input_count) const {
  if (input_count < 0) {
    throw InvalidArgument("ProducedOutputCount: negative input_count " +
                          std::to_string(input_count));
  }
  if (input_count == 0) return 0;
  // padded - eff, ordered so it cannot overflow (padding < eff)
  const Count excess = input_count - EffectiveKernel() + left_padding_ + right_padding_;
  if (excess < 0) return 0;
  return excess / stride_ + 1;
}

Count Stage::RequiredInputCount(Count output_count) const {
  if (output_count < 0) {
    throw InvalidArgument("RequiredInputCount: negative output_count " +
                          std::to_string(output_count));
  }
  if (output_count == 0) return 0;
  // padding <= wings keeps this >= 1
  const Count tail = EffectiveKernel() - left_padding_ - right_padding_;
  if (output_count - 1 > (std::numeric_limits<Count>::max() - tail) / stride_) {
    throw InvalidArgument("RequiredInputCount: output_count " + std::to_string(output_count) +
                          " needs more inputs than Count can hold");
  }
  return (output_count - 1) * stride_ + tail;
}

IndexRange Stage::ReceptiveField(const IndexRange& out, Count input_count) const {
  if (input_count < 0) {
    throw InvalidArgument("ReceptiveField: negative input_count");
  }
  const Count output_count = ProducedOutputCount(input_count);
  if (out.begin < 0 || out.end < out.begin || out.end > output_count) {
    throw InvalidArgument("ReceptiveField: output range " + out.DebugString() +
                          " outside [0, " + std::to_string(output_count) + ")");
  }
  if (out.Empty()) return IndexRange{0, 0};

  // Output j reads padded positions [j*stride, j*stride + eff).
  // Padded position p is input position p - left_padding.
  const Count first = out.begin * stride_ - left_padding_;
  const Count last  = (out.end - 1) * stride_ + EffectiveKernel() - left_padding_;
  return IndexRange{std::max<Count>(0, first), std::min(last, input_count)};
}

IndexRange Stage::OutputRange(const IndexRange& in, Count input_count) const {
  if (input_count < 0) {
    throw InvalidArgument("OutputRange: negative input_count");
  }
  if (in.begin < 0 || in.end < in.begin || in.end > input_count) {
    throw InvalidArgument("OutputRange: input range " + in.DebugString() +
                          " outside [0, " + std::to_string(input_count) + ")");
  }
  if (in.Empty()) return IndexRange{0, 0};

  // Bounds in padded coordinates; padding only counts at the sequence ends.
  const Count p_begin = (in.begin == 0) ? 0 : in.begin + left_padding_;
  const Count p_end   = (in.end == input_count) ? input_count + left_padding_ + right_padding_
                                                : in.end + left_padding_;
  const Count eff = EffectiveKernel();
  if (p_end - p_begin < eff) return IndexRange{0, 0};

  const Count out_begin = CeilDiv(p_begin, stride_);
  const Count out_end   = FloorDiv(p_end - eff, stride_) + 1;
  if (out_end <= out_begin) return IndexRange{0, 0};
  return IndexRange{out_begin, out_end};
}

std::string Stage::DebugString() const {
  std::ostringstream oss;
  oss << "[" << LeftWing() << "^" << RightWing()
      << ", s=" << stride_
      << ", d=" << dilation_
      << ", " << left_padding_ << "--" << right_padding_
      << ", \"" << name_ << "\"]";
  return oss.str();
}

} // namespace model
} // namespace rf
