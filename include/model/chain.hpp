#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "model/stage.hpp"

namespace rf {
namespace model {

/**
 * Chain
 * Ordered stack of Stages. Index 0 reads the raw input, index Size()-1
 * produces the final output. The chain owns its stages by value and is
 * read-only after construction, so one instance may be shared by concurrent
 * propagation calls.
 *
 * An empty chain can be built (e.g. from an empty model description) but
 * every propagation on it throws EmptyChain.
 */
class Chain {
public:
  Chain() = default;
  explicit Chain(std::vector<Stage> stages, std::string name = {});

  // Builds each stage in order. A stage rejected by Stage's constructor is
  // reported as InvalidConfiguration naming its index.
  static Chain FromParams(const std::vector<Stage::Params>& params, std::string name = {});

  std::size_t Size() const noexcept { return stages_.size(); }
  bool Empty() const noexcept { return stages_.empty(); }

  const Stage& At(std::size_t i) const;
  const std::vector<Stage>& Stages() const noexcept { return stages_; }
  const std::string& Name() const noexcept { return name_; }

  // Throws EmptyChain naming `caller` if there are no stages.
  void RequireStages(const char* caller) const;

  std::string DebugString() const;

private:
  std::vector<Stage> stages_;
  std::string name_;
};

} // namespace model
} // namespace rf
