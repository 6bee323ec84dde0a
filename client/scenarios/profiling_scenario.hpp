#pragma once

#include "../scenario.hpp"
#include "target_requests.hpp"

/**
 * @brief "profiling-test": light load that includes the slow endpoint, to
 * give a profiler CPU time to sample. No checks.
 */
class ProfilingScenario : public IScenario {
public:
    std::string name() const override { return "profiling-test"; }
    std::string description() const override { return "CPU profiling test (3min, 5 users)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{30s, 5}, {2min, 5}, {30s, 0}};
        opts.think_time = ThinkTime::Fixed(1s);
        return opts;
    }

    void iterate(VuContext& ctx) override {
        switch (ctx.UniformInt(0, 3)) {
            case 0:
                ctx.Http().Send(target_requests::health());
                break;
            case 1:
                ctx.Http().Send(target_requests::user(ctx.UniformInt(0, 99)));
                break;
            case 2:
                ctx.Http().Send(target_requests::slow());
                break;
            default:
                ctx.Http().Send(target_requests::add(ctx.UniformReal(0, 1000), ctx.UniformReal(0, 1000)));
                break;
        }
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<ProfilingScenario>(*this);
    }
};
