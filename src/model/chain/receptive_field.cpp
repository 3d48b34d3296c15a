#include "model/chain/receptive_field.hpp"
#include "common/errors.hpp"
#include <string>
#include <vector>

namespace rf {
namespace model {

namespace {

void RequireStageRange(const Chain& chain, const char* caller,
                       std::size_t first_stage, std::size_t last_stage) {
  chain.RequireStages(caller);
  if (first_stage > last_stage || last_stage >= chain.Size()) {
    throw InvalidArgument(std::string(caller) + ": stage range [" +
                          std::to_string(first_stage) + ", " + std::to_string(last_stage) +
                          "] invalid for a chain of " + std::to_string(chain.Size()) +
                          " stages");
  }
}

} // namespace

IndexRange ReceptiveField(const Chain& chain, const IndexRange& out, Count output_count) {
  chain.RequireStages("ReceptiveField");
  return ReceptiveField(chain, 0, chain.Size() - 1, out, output_count);
}

IndexRange ReceptiveField(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                          const IndexRange& out, Count output_count) {
  RequireStageRange(chain, "ReceptiveField", first_stage, last_stage);
  if (output_count < 0) {
    throw InvalidArgument("ReceptiveField: negative output_count " +
                          std::to_string(output_count));
  }
  if (out.begin < 0 || out.end < out.begin || out.end > output_count) {
    throw InvalidArgument("ReceptiveField: output range " + out.DebugString() +
                          " outside [0, " + std::to_string(output_count) + ")");
  }
  if (out.Empty()) return IndexRange{0, 0};

  // Backward over the sub-range: the range and the length entering each stage.
  const auto& stages = chain.Stages();
  IndexRange range = out;
  Count length = output_count;
  for (std::size_t i = last_stage + 1; i-- > first_stage;) {
    length = stages[i].RequiredInputCount(length);
    range = stages[i].ReceptiveField(range, length);
  }
  return range;
}

IndexRange OutputRange(const Chain& chain, const IndexRange& in, Count input_count) {
  chain.RequireStages("OutputRange");
  return OutputRange(chain, 0, chain.Size() - 1, in, input_count);
}

IndexRange OutputRange(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                       const IndexRange& in, Count input_count) {
  RequireStageRange(chain, "OutputRange", first_stage, last_stage);
  if (input_count < 0) {
    throw InvalidArgument("OutputRange: negative input_count " + std::to_string(input_count));
  }
  if (in.begin < 0 || in.end < in.begin || in.end > input_count) {
    throw InvalidArgument("OutputRange: input range " + in.DebugString() +
                          " outside [0, " + std::to_string(input_count) + ")");
  }

  const auto& stages = chain.Stages();
  IndexRange range = in;
  Count length = input_count;
  for (std::size_t i = first_stage; i <= last_stage; ++i) {
    range = stages[i].OutputRange(range, length);
    length = stages[i].ProducedOutputCount(length);
    if (range.Empty()) return IndexRange{0, 0};
  }
  return range;
}

IndexRange Shadow(const Chain& chain, const IndexRange& in, Count input_count) {
  chain.RequireStages("Shadow");
  return Shadow(chain, 0, chain.Size() - 1, in, input_count);
}

IndexRange Shadow(const Chain& chain, std::size_t first_stage, std::size_t last_stage,
                  const IndexRange& in, Count input_count) {
  const IndexRange out = OutputRange(chain, first_stage, last_stage, in, input_count);
  if (out.Empty()) return IndexRange{0, 0};

  // spacing: input positions between neighbouring outputs
  // centre:  input position of output 0
  const auto& stages = chain.Stages();
  Count spacing = 1;
  Count centre = 0;
  for (std::size_t i = first_stage; i <= last_stage; ++i) {
    centre += (stages[i].LeftWing() - stages[i].LeftPadding()) * spacing;
    spacing *= stages[i].Stride();
  }
  return IndexRange{centre + out.begin * spacing, centre + (out.end - 1) * spacing + 1};
}

} // namespace model
} // namespace rf
