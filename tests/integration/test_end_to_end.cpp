#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"
#include "runner.hpp"
#include "scenarios/target_requests.hpp"
#include "support/running_target.hpp"
#include "support/summary_lookup.hpp"

using namespace std::chrono_literals;

namespace {

// Hammers one user lookup per iteration with no think time.
class LookupScenario : public IScenario {
    std::map<std::string, std::vector<std::string>> thresholds;
    Rate* errors = nullptr;

public:
    explicit LookupScenario(std::map<std::string, std::vector<std::string>> t) : thresholds(std::move(t)) {}

    std::string name() const override { return "lookup"; }
    std::string description() const override { return "single user lookup"; }

    ScenarioOptions options() const override {
        ScenarioOptions opts;
        opts.stages = {{300ms, 10}, {300ms, 10}, {100ms, 0}};
        opts.thresholds = thresholds;
        return opts;
    }

    void register_metrics(MetricRegistry& metrics) override {
        errors = &metrics.AddRate("errors");
    }

    void iterate(VuContext& ctx) override {
        RequestOutcome res = ctx.Http().Send(target_requests::user(ctx.UniformInt(0, 99)));
        errors->Add(!ctx.Check(res, {status_is(200)}));
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<LookupScenario>(*this);
    }
};

ScenarioCatalog lookup_catalog(std::map<std::string, std::vector<std::string>> thresholds) {
    ScenarioCatalog catalog;
    catalog.Register([thresholds] { return std::make_unique<LookupScenario>(thresholds); });
    return catalog;
}

RunConfig test_config(const std::string& base_url, const std::string& test_name) {
    RunConfig config;
    config.test_name = test_name;
    config.base_url = base_url;
    config.quiet = true;
    config.tick = 10ms;
    config.ready_retries = 3;
    config.ready_delay = 20ms;
    config.request_timeout = 5s;
    return config;
}

TargetBehavior lookup_behavior() {
    TargetBehavior b;
    b.thread_count = 32; // keep-alive holds one worker per VU
    b.user_lookup_ms = 50;
    return b;
}

const std::map<std::string, std::vector<std::string>> kLookupThresholds = {
    {"http_req_duration", {"p(95)<1000"}},
    {"errors", {"rate<0.1"}},
};

} // namespace

TEST(EndToEndTest, test_healthy_target_passes) {
    RunningTarget target(lookup_behavior());
    auto catalog = lookup_catalog(kLookupThresholds);
    TestRunner runner(catalog, test_config(target.BaseUrl(), "lookup"));

    auto scenario = runner.Resolve("lookup");
    std::atomic<bool> interrupt{false};
    RunSummary summary = runner.Execute(*scenario, interrupt);

    EXPECT_TRUE(summary.passed);
    EXPECT_FALSE(summary.interrupted);
    EXPECT_EQ(summary.peak_vus, 10);
    EXPECT_GT(summary_value(summary, "http_reqs", "count"), 0.0);
    EXPECT_DOUBLE_EQ(summary_value(summary, "errors", "rate"), 0.0);
    EXPECT_DOUBLE_EQ(summary_value(summary, "http_req_failed", "rate"), 0.0);
    double p95 = summary_value(summary, "http_req_duration", "p(95)");
    EXPECT_GE(p95, 49.0);
    EXPECT_LT(p95, 250.0);

    const ThresholdResult* latency = find_threshold(summary, "http_req_duration", "p(95)<1000");
    ASSERT_NE(latency, nullptr);
    EXPECT_TRUE(latency->passed);

    const CheckSummary* check = find_check(summary, "status is 200");
    ASSERT_NE(check, nullptr);
    EXPECT_EQ(check->fails, 0);
    EXPECT_EQ(static_cast<double>(check->passes), summary_value(summary, "http_reqs", "count"));
}

TEST(EndToEndTest, test_failing_target_fails_thresholds) {
    TargetBehavior b = lookup_behavior();
    b.failure_ratio = 0.5;
    RunningTarget target(b);
    auto catalog = lookup_catalog(kLookupThresholds);

    TestRunner runner(catalog, test_config(target.BaseUrl(), "lookup"));
    auto scenario = runner.Resolve("lookup");
    std::atomic<bool> interrupt{false};
    RunSummary summary = runner.Execute(*scenario, interrupt);

    EXPECT_NEAR(summary_value(summary, "errors", "rate"), 0.5, 0.05);
    const ThresholdResult* errors = find_threshold(summary, "errors", "rate<0.1");
    ASSERT_NE(errors, nullptr);
    EXPECT_FALSE(errors->passed);
    EXPECT_FALSE(summary.passed);
}

TEST(EndToEndTest, test_failed_threshold_exit_status) {
    TargetBehavior b = lookup_behavior();
    b.failure_ratio = 0.5;
    RunningTarget target(b);
    auto catalog = lookup_catalog(kLookupThresholds);

    RunConfig config = test_config(target.BaseUrl(), "lookup");
    config.summary_export = ::testing::TempDir() + "loadharness_e2e_summary.json";
    TestRunner runner(catalog, config);

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::ThresholdsFailed);
    EXPECT_NE(out.str().find("Result:         FAIL"), std::string::npos);
    EXPECT_NE(err.str().find("Threshold failed: errors rate<0.1"), std::string::npos);

    std::ifstream in(config.summary_export);
    std::stringstream json;
    json << in.rdbuf();
    EXPECT_NE(json.str().find("\"passed\": false"), std::string::npos);
    std::remove(config.summary_export.c_str());
}

TEST(EndToEndTest, test_unreachable_target_is_environment_error) {
    auto catalog = lookup_catalog(kLookupThresholds);
    RunConfig config = test_config("http://127.0.0.1:1", "lookup");
    config.ready_retries = 2;
    TestRunner runner(catalog, config);

    auto scenario = runner.Resolve("lookup");
    std::atomic<bool> interrupt{false};
    EXPECT_THROW(runner.Execute(*scenario, interrupt), EnvironmentUnavailable);

    std::ostringstream out, err;
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::EnvironmentUnavailable);
}

TEST(EndToEndTest, test_unknown_threshold_metric_sends_nothing) {
    RunningTarget target(lookup_behavior());
    auto catalog = lookup_catalog({{"no_such_metric", {"rate<0.1"}}});
    TestRunner runner(catalog, test_config(target.BaseUrl(), "lookup"));

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::ConfigurationError);
    EXPECT_NE(err.str().find("no_such_metric"), std::string::npos);
    EXPECT_EQ(target.Server().Served(), 0);
}

TEST(EndToEndTest, test_https_base_url_is_configuration_error) {
    auto catalog = lookup_catalog(kLookupThresholds);
    TestRunner runner(catalog, test_config("https://127.0.0.1:8443", "lookup"));

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::ConfigurationError);
    EXPECT_NE(err.str().find("only http://"), std::string::npos);
}

TEST(EndToEndTest, test_unexpected_exception_is_reported_not_fatal) {
    class BrokenScenario : public LookupScenario {
    public:
        BrokenScenario() : LookupScenario({}) {}
        void register_metrics(MetricRegistry&) override { throw std::runtime_error("metric backend gone"); }
    };

    ScenarioCatalog catalog;
    catalog.Register([] { return std::make_unique<BrokenScenario>(); });
    TestRunner runner(catalog, test_config("http://127.0.0.1:1", "lookup"));

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::Aborted);
    EXPECT_NE(err.str().find("metric backend gone"), std::string::npos);
}

TEST(EndToEndTest, test_unknown_test_name_lists_tests) {
    auto catalog = ScenarioCatalog::Builtin();
    TestRunner runner(catalog, test_config("http://127.0.0.1:1", "does-not-exist"));

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::ConfigurationError);
    EXPECT_NE(err.str().find("Test 'does-not-exist' not found"), std::string::npos);
    EXPECT_NE(err.str().find("basic-load - "), std::string::npos);
}

TEST(EndToEndTest, test_list_mode) {
    auto catalog = ScenarioCatalog::Builtin();
    RunConfig config = test_config("http://127.0.0.1:1", "");
    config.mode = RunConfig::Mode::List;
    TestRunner runner(catalog, config);

    std::ostringstream out, err;
    std::atomic<bool> interrupt{false};
    EXPECT_EQ(runner.Run(interrupt, out, err), ExitStatus::Passed);
    EXPECT_NE(out.str().find("soak-test - "), std::string::npos);
}

// ========== Built-in scenarios on a compressed schedule ==========

TEST(EndToEndTest, test_soak_batch_sends_two_requests_per_iteration) {
    TargetBehavior b;
    b.thread_count = 32;
    b.user_lookup_ms = 10;
    RunningTarget target(b);

    auto catalog = ScenarioCatalog::Builtin();
    RunConfig config = test_config(target.BaseUrl(), "soak-test");
    config.stages = {{300ms, 3}};
    TestRunner runner(catalog, config);

    auto scenario = runner.Resolve("soak-test");
    std::atomic<bool> interrupt{false};
    RunSummary summary = runner.Execute(*scenario, interrupt);

    double iterations = summary_value(summary, "iterations", "count");
    EXPECT_GT(iterations, 0.0);
    EXPECT_EQ(summary_value(summary, "http_reqs", "count"), 2.0 * iterations);

    const CheckSummary* check = find_check(summary, "status is 200");
    ASSERT_NE(check, nullptr);
    EXPECT_EQ(check->fails, 0);
    EXPECT_EQ(static_cast<double>(check->passes), 2.0 * iterations);
}

TEST(EndToEndTest, test_error_test_designed_failures_are_not_failures) {
    TargetBehavior b;
    b.thread_count = 32;
    RunningTarget target(b);

    auto catalog = ScenarioCatalog::Builtin();
    RunConfig config = test_config(target.BaseUrl(), "error-test");
    config.stages = {{200ms, 8}, {300ms, 8}};
    TestRunner runner(catalog, config);

    auto scenario = runner.Resolve("error-test");
    std::atomic<bool> interrupt{false};
    RunSummary summary = runner.Execute(*scenario, interrupt);

    EXPECT_DOUBLE_EQ(summary_value(summary, "http_req_failed", "rate"), 0.0);
    for (const auto& check : summary.checks) {
        EXPECT_EQ(check.fails, 0) << check.name;
    }

    // Every iteration is either a designed failure or an organic request
    double intentional = summary_value(summary, "intentional_errors", "count");
    const CheckSummary* organic = find_check(summary, "success status");
    double organic_total = organic ? static_cast<double>(organic->passes + organic->fails) : 0.0;
    EXPECT_EQ(intentional + organic_total, summary_value(summary, "iterations", "count"));
}
