// All comments are in English.
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "runner/config.hpp"
#include "runner/plan_runner.hpp"

namespace {

// Whole-argument integer parse; false on junk, empty text or overflow.
bool ParseCount(const char* text, rf::Count& value) {
  try {
    std::size_t pos = 0;
    value = std::stoll(text, &pos);
    return pos == std::string(text).size();
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

int Usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <config.json> <input_count>\n";
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  // Usage: ./rfplan <config.json> <input_count>
  if (argc < 3) return Usage(argv[0]);

  const std::string json_path = argv[1];
  rf::Count input_count = 0;
  if (!ParseCount(argv[2], input_count)) {
    std::cerr << "[rfplan] Error: input_count '" << argv[2] << "' is not an integer\n";
    return Usage(argv[0]);
  }

  try {

    // (1) Parse config -> chain description + batch request
    auto cfg = rf::ParseConfig(json_path);

    // (2) Reconcile and select windows
    auto result = rf::RunPlan(cfg, input_count);

    // (3) Emit machine-readable result
    nlohmann::json out{{"lengths", rf::ReconciliationToJson(result.reconciliation)},
                       {"forward_trace", result.forward_trace}};
    if (result.plan) out["plan"] = rf::BatchPlanToJson(*result.plan);
    std::cout << out.dump(2) << "\n";

    std::cout << "[rfplan] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[rfplan] Error: " << ex.what() << "\n";
    return 2;
  }
}
