#include "runner/config.hpp"
#include "model/chain/shape_propagator.hpp"
#include "planner/window_selector.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace rf;

namespace {
int g_failures = 0;
void CHECK(bool cond, const char* msg) {
    if (!cond) { ++g_failures; std::cerr << "[FAIL] " << msg << "\n"; }
}

#define EXPECT_THROW_AS(stmt, ExType)                             \
    do {                                                          \
        bool threw = false;                                       \
        try { (void)(stmt); }                                     \
        catch (const ExType&) { threw = true; }                   \
        CHECK(threw, #stmt " should throw " #ExType);             \
    } while (0)

const char* kFullConfig = R"({
  "name": "frontend",
  "stages": [
    {"name": "conv1", "kernel_size": 3, "stride": 1},
    {"kernel_size": 3, "stride": 2, "dilation": 1},
    {"name": "same", "kernel_size": 3, "padding": 1},
    {"name": "asym", "kernel_size": 4, "stride": 2, "padding": {"left": 1, "right": 2}}
  ],
  "batch": {"window_count": 3, "window_output_span": 2, "sub_selection": [1]}
})";

void TEST_ParseFull() {
    std::cout << "[RUN ] ParseFull\n";
    PlanConfig cfg = ParseConfigText(kFullConfig);
    CHECK(cfg.name == "frontend", "name parsed");
    CHECK(cfg.stages.size() == 4, "four stages parsed");
    CHECK(cfg.stages[0].name == "conv1" && cfg.stages[0].kernel_size == 3, "stage 0 fields");
    CHECK(cfg.stages[1].name == "stage1", "unnamed stage gets a default name");
    CHECK(cfg.stages[1].stride == 2 && cfg.stages[1].dilation == 1, "stage 1 fields");
    CHECK(cfg.stages[2].left_padding == 1 && cfg.stages[2].right_padding == 1,
          "integer padding is symmetric");
    CHECK(cfg.stages[3].left_padding == 1 && cfg.stages[3].right_padding == 2,
          "object padding is per side");

    CHECK(cfg.has_batch, "batch section found");
    CHECK(cfg.batch.window_count == 3 && cfg.batch.window_output_span == 2, "batch sizes");
    CHECK(cfg.batch.stride_between_windows == 2, "stride defaults to the span (consecutive)");
    CHECK(cfg.batch.output_offset == 0 && cfg.batch.require_distinct, "batch defaults");
    CHECK(cfg.batch.sub_selection == (std::vector<Count>{1}), "sub_selection parsed");

    model::Chain chain = BuildChain(cfg);
    CHECK(chain.Size() == 4 && chain.Name() == "frontend", "chain built from config");
    std::cout << "[DONE] ParseFull\n";
}

void TEST_ParseErrors() {
    std::cout << "[RUN ] ParseErrors\n";
    EXPECT_THROW_AS(ParseConfigText("{ not json"), InvalidConfiguration);
    EXPECT_THROW_AS(ParseConfigText(R"({"name": "x"})"), InvalidConfiguration);
    EXPECT_THROW_AS(ParseConfigText(R"({"stages": [{"stride": 2}]})"), InvalidConfiguration);
    EXPECT_THROW_AS(ParseConfigText(R"({"stages": [{"kernel_size": "3"}]})"),
                    InvalidConfiguration);
    EXPECT_THROW_AS(ParseConfigText(R"({"stages": [{"kernel_size": 3}],
                                        "batch": {"window_count": 2}})"),
                    InvalidConfiguration);
    EXPECT_THROW_AS(ParseConfig("/nonexistent/rfield/config.json"), InvalidConfiguration);

    PlanConfig bad = ParseConfigText(R"({"stages": [{"kernel_size": 0}]})");
    bool threw = false;
    try {
        (void)BuildChain(bad);
    } catch (const InvalidConfiguration& ex) {
        threw = true;
        CHECK(std::string(ex.what()).find("stage 0") != std::string::npos,
              "build error names the stage");
    }
    CHECK(threw, "kernel_size 0 rejected when building the chain");

    PlanConfig empty = ParseConfigText(R"({"name": "empty", "stages": []})");
    model::Chain chain = BuildChain(empty);
    CHECK(chain.Empty(), "empty stage list gives an empty chain");
    EXPECT_THROW_AS(model::ForwardPass(chain, 10), EmptyChain);
    std::cout << "[DONE] ParseErrors\n";
}

void TEST_PlanJson() {
    std::cout << "[RUN ] PlanJson\n";
    model::Chain chain({model::Stage(3, 1), model::Stage(3, 2)}, "example");
    planner::BatchRequest req;
    req.window_count = 3; req.window_output_span = 2; req.stride_between_windows = 2;
    req.sub_selection = {1};
    planner::BatchPlan plan = planner::PlanBatch(chain, 24, req);

    nlohmann::json j = BatchPlanToJson(plan);
    CHECK(j["lengths"]["consumed_input_count"].get<Count>() == 23, "lengths exported");
    CHECK(j["lengths"]["unused_input_count"].get<Count>() == 1, "unused exported");
    CHECK(j["windows"].size() == 3, "three windows exported");
    CHECK(j["windows"][2]["input_offset"].get<Count>() == 8, "window 2 offset");
    CHECK(j["windows"][2]["input_length"].get<Count>() == 7, "window 2 length");
    CHECK(j["windows"][2]["in_register"][0].get<bool>() == false, "position 4 out of register");
    CHECK(j["windows"][2]["in_register"][1].get<bool>() == true, "position 5 in register");
    CHECK(j["active_indices"].get<std::vector<Count>>() == (std::vector<Count>{1, 3, 5}),
          "active indices exported");
    CHECK(j["mask"].size() == 6, "mask exported");
    std::cout << "[DONE] PlanJson\n";
}

} // namespace

int main() {
    TEST_ParseFull();
    TEST_ParseErrors();
    TEST_PlanJson();

    if (g_failures == 0) {
        std::cout << "[OK] Config tests passed.\n";
        return 0;
    }
    std::cerr << "[ERR] " << g_failures << " check(s) failed.\n";
    return 1;
}
