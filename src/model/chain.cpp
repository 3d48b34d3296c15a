#include "model/chain.hpp"
#include "common/errors.hpp"
#include <sstream>
#include <utility>

namespace rf {
namespace model {

Chain::Chain(std::vector<Stage> stages, std::string name)
    : stages_(std::move(stages)), name_(std::move(name)) {}

Chain Chain::FromParams(const std::vector<Stage::Params>& params, std::string name) {
  std::vector<Stage> stages;
  stages.reserve(params.size());
  for (std::size_t i = 0; i < params.size(); ++i) {
    try {
      stages.emplace_back(params[i]);
    } catch (const InvalidConfiguration& ex) {
      throw InvalidConfiguration("Chain: stage " + std::to_string(i) + ": " + ex.what());
    }
  }
  return Chain(std::move(stages), std::move(name));
}

const Stage& Chain::At(std::size_t i) const {
  if (i >= stages_.size()) {
    throw std::out_of_range("Chain::At: stage index " + std::to_string(i) + " out of range");
  }
  return stages_[i];
}

void Chain::RequireStages(const char* caller) const {
  if (stages_.empty()) {
    throw EmptyChain(std::string(caller) + ": chain has no stages");
  }
}

std::string Chain::DebugString() const {
  std::ostringstream oss;
  oss << "Chain{name=\"" << name_ << "\", stages=" << stages_.size() << "}\n";
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    oss << "  stage[" << i << "]: " << stages_[i].DebugString() << "\n";
  }
  return oss.str();
}

} // namespace model
} // namespace rf
