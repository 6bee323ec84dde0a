#pragma once

#include <functional>

#include "../scenario.hpp"
#include "../weighted_choice.hpp"
#include "target_requests.hpp"

/**
 * @brief "basic-load": standard load, ramping to 10 then 20 users.
 * Each iteration sends one request drawn uniformly from health, user
 * lookup, addition and division (with a non-zero divisor).
 */
class BasicLoadScenario : public IScenario {
    using RequestFactory = std::function<RequestSpec(VuContext&)>;

    std::vector<Weighted<RequestFactory>> requests;
    Rate* errors = nullptr;
    Trend* request_duration = nullptr;
    Counter* request_count = nullptr;

public:
    BasicLoadScenario() {
        requests = uniformly<RequestFactory>({
            [](VuContext&) { return target_requests::health(); },
            [](VuContext& ctx) { return target_requests::user(ctx.UniformInt(0, 99)); },
            [](VuContext& ctx) {
                return target_requests::add(ctx.UniformReal(0, 100), ctx.UniformReal(0, 100));
            },
            [](VuContext& ctx) {
                return target_requests::divide(ctx.UniformReal(0, 100), ctx.UniformInt(1, 10));
            },
        });
    }

    std::string name() const override { return "basic-load"; }
    std::string description() const override { return "Standard load test (4min, 20 users)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{30s, 10}, {1min, 10}, {30s, 20}, {1min, 20}, {30s, 0}};
        opts.thresholds = {
            {"http_req_duration", {"p(95)<500", "p(99)<1000"}},
            {"http_req_failed", {"rate<0.1"}},
            {"errors", {"rate<0.1"}},
        };
        opts.think_time = ThinkTime::Between(500ms, 2500ms);
        return opts;
    }

    void register_metrics(MetricRegistry& metrics) override {
        errors = &metrics.AddRate("errors");
        request_duration = &metrics.AddTrend("request_duration");
        request_count = &metrics.AddCounter("requests");
    }

    void iterate(VuContext& ctx) override {
        RequestSpec spec = pick_weighted(requests, ctx.Rng())(ctx);
        RequestOutcome res = ctx.Http().Send(spec);

        request_duration->Add(res.elapsed_ms);
        request_count->Add(1);

        // Division by zero is answered with 400 and still counts as handled
        bool success = ctx.Check(res, {status_in({200, 400}, "status is 200 or 400"), has_body()});
        errors->Add(!success);
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<BasicLoadScenario>(*this);
    }
};
