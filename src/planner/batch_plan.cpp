#include "planner/batch_plan.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace rf {
namespace planner {

Count Window::FirstOutput() const {
  if (output_indices.empty()) throw std::out_of_range("Window::FirstOutput: empty window");
  return output_indices.front();
}

Count Window::LastOutput() const {
  if (output_indices.empty()) throw std::out_of_range("Window::LastOutput: empty window");
  return output_indices.back();
}

std::size_t Window::NumInRegister() const {
  return static_cast<std::size_t>(std::count(in_register.begin(), in_register.end(), true));
}

bool Window::InRegister(Count output_index) const {
  auto it = std::lower_bound(output_indices.begin(), output_indices.end(), output_index);
  if (it == output_indices.end() || *it != output_index) {
    throw std::out_of_range("Window::InRegister: output index " +
                            std::to_string(output_index) + " not in window");
  }
  return in_register[static_cast<std::size_t>(it - output_indices.begin())];
}

bool BatchPlan::MaskAt(Count output_index) const {
  const Count rel = output_index - mask_begin;
  if (rel < 0 || rel >= static_cast<Count>(mask.size())) return false;
  return mask[static_cast<std::size_t>(rel)];
}

std::string BatchPlan::DebugString() const {
  std::ostringstream oss;
  oss << "BatchPlan{windows=" << windows.size()
      << ", consumed_input=" << lengths.consumed_input_count
      << ", achievable_output=" << lengths.achievable_output_count
      << ", used_output=" << used_output_count
      << ", input_bound=" << input_bound.DebugString()
      << ", active=" << active_indices.size() << "}\n";
  for (std::size_t w = 0; w < windows.size(); ++w) {
    const auto& win = windows[w];
    oss << "  Window " << w << ": input=[" << win.input_span.offset << ", "
        << win.input_span.End() << ") outputs=[";
    for (std::size_t i = 0; i < win.output_indices.size(); ++i) {
      oss << win.output_indices[i] << (win.in_register[i] ? "*" : "");
      if (i + 1 < win.output_indices.size()) oss << ", ";
    }
    oss << "]\n";
  }
  return oss.str();
}

} // namespace planner
} // namespace rf
