#include <gtest/gtest.h>
#include <boost/json.hpp>
#include "ammsim/harness/output.hpp"
#include "ammsim/harness/runner.hpp"

using namespace ammsim;
using namespace ammsim::harness;

namespace json = boost::json;

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        point_.pool = json::parse(R"({
            "kind": "stableswap",
            "coins": ["DAI", "USDC", "USDT"],
            "A": 250,
            "D": "3000000000000000000000000"
        })").as_object();
        point_.params["A"] = 250;

        samples_ = parse_samples(json::parse(R"({
            "pairs": [["DAI", "USDC"], ["DAI", "USDT"], ["USDC", "USDT"]],
            "samples": [
                { "timestamp": 1690000000, "prices": [0.998, 1.0, 1.0], "volumes": [1e9, 1e9, 1e9] },
                { "timestamp": 1690003600, "prices": [1.0, 1.0, 1.0], "volumes": [1e9, 1e9, 1e9] }
            ]
        })"));

        cfg_.verbose = false;
    }

    pools::GridPoint point_;
    std::vector<PriceSample> samples_;
    RunConfig cfg_;
};

// ============================================================================
// Single run
// ============================================================================

TEST_F(RunnerTest, RunsEverySample) {
    const auto r = run_single(point_, samples_, cfg_);
    ASSERT_TRUE(r.success) << r.error_msg;
    EXPECT_EQ(r.samples_run, 2u);
    EXPECT_GE(r.n_trades, 1u);
    EXPECT_GT(r.volume, Int(0));
    EXPECT_EQ(r.params.at("A").as_int64(), 250);
    EXPECT_STREQ(r.final_state.at("kind").as_string().c_str(), "stableswap");
    EXPECT_EQ(r.final_state.at("balances").as_array().size(), 3u);
}

TEST_F(RunnerTest, SimpleTraderRuns) {
    cfg_.trader = pools::TraderKind::Simple;
    const auto r = run_single(point_, samples_, cfg_);
    ASSERT_TRUE(r.success) << r.error_msg;
    EXPECT_EQ(r.samples_run, 2u);
    EXPECT_GE(r.n_trades, 1u);
}

TEST_F(RunnerTest, UnknownCoinFailsRun) {
    samples_[1].prices[{"DAI", "FRAX"}] = 1.0;
    samples_[1].volumes[{"DAI", "FRAX"}] = 1.0;

    const auto r = run_single(point_, samples_, cfg_);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, "ConfigError");
    EXPECT_EQ(r.samples_run, 1u);
    EXPECT_TRUE(r.final_state.empty());
}

TEST_F(RunnerTest, MissingVolumesFailRun) {
    samples_[0].volumes.clear();
    const auto r = run_single(point_, samples_, cfg_);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error_kind, "ConfigError");
    EXPECT_EQ(r.samples_run, 0u);
}

TEST_F(RunnerTest, GridRunsEachPoint) {
    pools::SimConfig sim;
    sim.pool = point_.pool;
    sim.param_grid.push_back({"A", {json::value(100), json::value(400)}});

    const auto results = run_grid(sim, samples_, cfg_);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].params.at("A").as_int64(), 100);
    EXPECT_EQ(results[1].params.at("A").as_int64(), 400);
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
}

// ============================================================================
// Output
// ============================================================================

TEST_F(RunnerTest, OutputCarriesStateOrError) {
    std::vector<RunResult> results;
    results.push_back(run_single(point_, samples_, cfg_));

    RunResult failed;
    failed.success = false;
    failed.error_kind = "CalculationError";
    failed.error_msg = "D did not converge";
    results.push_back(failed);

    const auto out = build_output_json(results, "sweep", samples_.size(), "samples.json", 1.5, 20.0);

    const auto& meta = out.at("metadata").as_object();
    EXPECT_STREQ(meta.at("tag").as_string().c_str(), "sweep");
    EXPECT_EQ(meta.at("samples").as_uint64(), 2u);
    EXPECT_STREQ(meta.at("samples_file").as_string().c_str(), "samples.json");

    const auto& runs = out.at("runs").as_array();
    ASSERT_EQ(runs.size(), 2u);

    const auto& ok = runs[0].as_object();
    EXPECT_TRUE(ok.at("success").as_bool());
    EXPECT_TRUE(ok.contains("final_state"));
    EXPECT_FALSE(ok.contains("error"));
    EXPECT_EQ(ok.at("result").as_object().at("samples").as_uint64(), 2u);

    const auto& bad = runs[1].as_object();
    EXPECT_FALSE(bad.at("success").as_bool());
    EXPECT_FALSE(bad.contains("final_state"));
    EXPECT_STREQ(bad.at("error").as_object().at("kind").as_string().c_str(), "CalculationError");
}

TEST_F(RunnerTest, OutputOmitsEmptyTag) {
    const auto out = build_output_json({}, "", 0, "samples.json", 0.0, 0.0);
    EXPECT_FALSE(out.at("metadata").as_object().contains("tag"));
    EXPECT_TRUE(out.at("runs").as_array().empty());
}
