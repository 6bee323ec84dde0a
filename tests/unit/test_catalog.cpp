#include <gtest/gtest.h>

#include <algorithm>

#include "errors.hpp"
#include "scenario_catalog.hpp"
#include "threshold.hpp"

namespace {

class NamedScenario : public IScenario {
public:
    explicit NamedScenario(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "test scenario"; }
    ScenarioOptions options() const override {
        ScenarioOptions opts;
        opts.stages = {{std::chrono::seconds(1), 1}};
        return opts;
    }
    void iterate(VuContext&) override {}
    std::unique_ptr<IScenario> clone() const override { return std::make_unique<NamedScenario>(*this); }

private:
    std::string name_;
};

} // namespace

TEST(ScenarioCatalogTest, test_builtin_names) {
    auto names = ScenarioCatalog::Builtin().Names();
    std::vector<std::string> expected = {"basic-load", "stress-test", "spike-test",
                                         "soak-test",  "error-test",  "profiling-test"};
    EXPECT_EQ(names, expected);
}

TEST(ScenarioCatalogTest, test_resolve_returns_named_scenario) {
    auto catalog = ScenarioCatalog::Builtin();
    auto scenario = catalog.Resolve("spike-test");
    ASSERT_NE(scenario, nullptr);
    EXPECT_EQ(scenario->name(), "spike-test");
}

TEST(ScenarioCatalogTest, test_unknown_name_lists_known_names) {
    auto catalog = ScenarioCatalog::Builtin();
    try {
        catalog.Resolve("nope");
        FAIL() << "expected ScenarioNotFound";
    } catch (const ScenarioNotFound& e) {
        EXPECT_EQ(e.known(), catalog.Names());
        std::string msg = e.what();
        EXPECT_NE(msg.find("nope"), std::string::npos);
        EXPECT_NE(msg.find("basic-load"), std::string::npos);
    }
}

TEST(ScenarioCatalogTest, test_not_found_is_a_configuration_error) {
    auto catalog = ScenarioCatalog::Builtin();
    EXPECT_THROW(catalog.Resolve(""), ConfigurationError);
}

TEST(ScenarioCatalogTest, test_duplicate_registration_is_rejected) {
    ScenarioCatalog catalog;
    catalog.Register([] { return std::make_unique<NamedScenario>("custom"); });
    EXPECT_THROW(catalog.Register([] { return std::make_unique<NamedScenario>("custom"); }), ConfigurationError);
    EXPECT_EQ(catalog.Names().size(), 1u);
}

TEST(ScenarioCatalogTest, test_every_builtin_is_well_formed) {
    auto catalog = ScenarioCatalog::Builtin();
    for (const auto& entry : catalog.Entries()) {
        SCOPED_TRACE(entry.name);
        auto scenario = catalog.Resolve(entry.name);
        EXPECT_FALSE(entry.description.empty());

        ScenarioOptions opts = scenario->options();
        EXPECT_NO_THROW(Schedule(opts.stages, opts.start_vus));
        EXPECT_GE(opts.think_time.base.count(), 0);

        MetricRegistry registry;
        scenario->register_metrics(registry);
        EXPECT_NO_THROW(ThresholdEvaluator::FromOptions(opts.thresholds).Validate(registry));

        auto copy = scenario->clone();
        ASSERT_NE(copy, nullptr);
        EXPECT_EQ(copy->name(), entry.name);
    }
}

TEST(ScenarioCatalogTest, test_declared_shapes) {
    auto catalog = ScenarioCatalog::Builtin();

    Schedule basic(catalog.Resolve("basic-load")->options().stages);
    EXPECT_EQ(basic.MaxTarget(), 20);
    EXPECT_EQ(basic.TotalDuration(), std::chrono::minutes(4));

    Schedule stress(catalog.Resolve("stress-test")->options().stages);
    EXPECT_EQ(stress.MaxTarget(), 150);

    Schedule spike(catalog.Resolve("spike-test")->options().stages);
    EXPECT_EQ(spike.MaxTarget(), 300);

    Schedule soak(catalog.Resolve("soak-test")->options().stages);
    EXPECT_EQ(soak.TotalDuration(), std::chrono::minutes(13));
    EXPECT_EQ(soak.FinalTarget(), 0);
}

TEST(ScenarioCatalogTest, test_error_test_declares_intentional_errors) {
    auto scenario = ScenarioCatalog::Builtin().Resolve("error-test");
    MetricRegistry registry;
    scenario->register_metrics(registry);

    const Metric* intentional = registry.Find("intentional_errors");
    ASSERT_NE(intentional, nullptr);
    EXPECT_EQ(intentional->Type(), MetricType::Counter);
    ASSERT_NE(registry.Find("errors"), nullptr);
    EXPECT_EQ(registry.Find("errors")->Type(), MetricType::Rate);
}
