#pragma once

#include "../scenario.hpp"
#include "target_requests.hpp"

/**
 * @brief "stress-test": pushes to 150 users, alternating health and user
 * lookups over a larger id space.
 */
class StressScenario : public IScenario {
    Rate* errors = nullptr;

public:
    std::string name() const override { return "stress-test"; }
    std::string description() const override { return "High load stress test (10min, 150 users)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{1min, 50}, {2min, 100}, {3min, 100}, {1min, 150}, {2min, 150}, {1min, 0}};
        opts.think_time = ThinkTime::Fixed(500ms);
        return opts;
    }

    void register_metrics(MetricRegistry& metrics) override {
        errors = &metrics.AddRate("errors");
    }

    void iterate(VuContext& ctx) override {
        RequestSpec spec = ctx.UniformInt(0, 1) == 0
            ? target_requests::health()
            : target_requests::user(ctx.UniformInt(0, 999));

        RequestOutcome res = ctx.Http().Send(spec);
        bool success = ctx.Check(res, {status_is(200)});
        errors->Add(!success);
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<StressScenario>(*this);
    }
};
