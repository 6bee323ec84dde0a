#pragma once

#include "../scenario.hpp"
#include "../weighted_choice.hpp"
#include "target_requests.hpp"

/**
 * @brief "error-test": mixes succeeding requests with designed failures
 * (division by zero, simulated server error).
 *
 * Designed failures are counted in `intentional_errors` and checked for an
 * error status; only unexpected outcomes of the succeeding requests feed
 * the `errors` rate.
 */
class ErrorScenario : public IScenario {
    std::vector<Weighted<RequestSpec>> requests;
    Counter* intentional_errors = nullptr;
    Rate* errors = nullptr;

public:
    ErrorScenario() {
        requests = uniformly<RequestSpec>({
            target_requests::health(),
            target_requests::add(10, 20),
            target_requests::divide(100, 0, Expectation::Error),
            target_requests::simulated_error(),
        });
    }

    std::string name() const override { return "error-test"; }
    std::string description() const override { return "Error handling test (3min, 10 users)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{30s, 10}, {2min, 10}, {30s, 0}};
        opts.think_time = ThinkTime::Between(500ms, 2000ms);
        return opts;
    }

    void register_metrics(MetricRegistry& metrics) override {
        intentional_errors = &metrics.AddCounter("intentional_errors");
        errors = &metrics.AddRate("errors");
    }

    void iterate(VuContext& ctx) override {
        const RequestSpec& spec = pick_weighted(requests, ctx.Rng());
        RequestOutcome res = ctx.Http().Send(spec);

        if (spec.expect == Expectation::Error) {
            ctx.Check(res, {status_at_least(400, "expected error status")});
            intentional_errors->Add(1);
        } else {
            bool success = ctx.Check(res, {status_in({200}, "success status")});
            errors->Add(!success);
        }
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<ErrorScenario>(*this);
    }
};
