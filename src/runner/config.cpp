// All comments are in English.
#include "runner/config.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using nlohmann::json;

namespace rf {

namespace {

model::Stage::Params ParseStage_(const json& js, std::size_t index) {
  model::Stage::Params p;
  p.name        = js.value("name", std::string("stage") + std::to_string(index));
  p.kernel_size = js.at("kernel_size").get<Count>();
  p.stride      = js.value("stride", Count{1});
  p.dilation    = js.value("dilation", Count{1});

  if (js.contains("padding")) {
    const auto& pad = js.at("padding");
    if (pad.is_number_integer()) {
      // symmetric shorthand: "padding": 1
      p.left_padding  = pad.get<Count>();
      p.right_padding = p.left_padding;
    } else {
      p.left_padding  = pad.value("left", Count{0});
      p.right_padding = pad.value("right", Count{0});
    }
  }
  return p;
}

planner::BatchRequest ParseBatch_(const json& jb) {
  planner::BatchRequest req;
  req.window_count           = jb.at("window_count").get<Count>();
  req.window_output_span     = jb.at("window_output_span").get<Count>();
  // consecutive selection unless told otherwise
  req.stride_between_windows = jb.value("stride_between_windows", req.window_output_span);
  req.output_offset          = jb.value("output_offset", Count{0});
  req.require_distinct       = jb.value("require_distinct", true);
  if (jb.contains("sub_selection")) {
    req.sub_selection = jb.at("sub_selection").get<std::vector<Count>>();
  }
  return req;
}

} // namespace

PlanConfig ParseConfigText(const std::string& json_text) {
  PlanConfig cfg;
  try {
    json j = json::parse(json_text);
    if (!j.contains("stages") || !j["stages"].is_array()) {
      throw InvalidConfiguration("ParseConfig: missing 'stages' array");
    }

    cfg.name = j.value("name", std::string());
    cfg.stages.reserve(j["stages"].size());
    std::size_t index = 0;
    for (const auto& js : j["stages"]) {
      cfg.stages.push_back(ParseStage_(js, index++));
    }
    if (cfg.stages.empty()) {
      std::cerr << "[ParseConfig][Warn] '" << cfg.name
                << "' has no stages; every propagation will fail.\n";
    }

    if (j.contains("batch")) {
      cfg.batch = ParseBatch_(j.at("batch"));
      cfg.has_batch = true;
    }
  } catch (const json::exception& ex) {
    throw InvalidConfiguration(std::string("ParseConfig: ") + ex.what());
  }
  return cfg;
}

PlanConfig ParseConfig(const std::string& json_path) {
  std::ifstream ifs(json_path);
  if (!ifs) throw InvalidConfiguration("ParseConfig: cannot open json file: " + json_path);
  std::string jtxt((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  PlanConfig cfg = ParseConfigText(jtxt);
  if (cfg.name.empty()) cfg.name = json_path;
  return cfg;
}

model::Chain BuildChain(const PlanConfig& cfg) {
  return model::Chain::FromParams(cfg.stages, cfg.name);
}

json ReconciliationToJson(const Reconciliation& r) {
  return json{
      {"consumed_input_count", r.consumed_input_count},
      {"achievable_output_count", r.achievable_output_count},
      {"unused_input_count", r.unused_input_count},
  };
}

json BatchPlanToJson(const planner::BatchPlan& plan) {
  json jw = json::array();
  for (const auto& w : plan.windows) {
    jw.push_back(json{
        {"input_offset", w.input_span.offset},
        {"input_length", w.input_span.length},
        {"output_indices", w.output_indices},
        {"in_register", w.in_register},
    });
  }

  return json{
      {"lengths", ReconciliationToJson(plan.lengths)},
      {"used_output_count", plan.used_output_count},
      {"input_bound", json{{"begin", plan.input_bound.begin}, {"end", plan.input_bound.end}}},
      {"windows", jw},
      {"mask_begin", plan.mask_begin},
      {"mask", plan.mask},
      {"active_indices", plan.active_indices},
  };
}

} // namespace rf
