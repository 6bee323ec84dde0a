#pragma once

#include "../scenario.hpp"
#include "target_requests.hpp"

/**
 * @brief "spike-test": two sudden jumps (to 200 and 300 users) on the
 * health endpoint.
 */
class SpikeScenario : public IScenario {
public:
    std::string name() const override { return "spike-test"; }
    std::string description() const override { return "Sudden traffic spikes (4min, 300 peak)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{30s, 10}, {10s, 200}, {1min, 200}, {10s, 10},
                       {30s, 10}, {10s, 300}, {30s, 300}, {10s, 0}};
        opts.think_time = ThinkTime::Fixed(300ms);
        return opts;
    }

    void iterate(VuContext& ctx) override {
        RequestOutcome res = ctx.Http().Send(target_requests::health());
        ctx.Check(res, {status_is(200)});
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<SpikeScenario>(*this);
    }
};
