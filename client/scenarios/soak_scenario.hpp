#pragma once

#include "../scenario.hpp"
#include "target_requests.hpp"

/**
 * @brief "soak-test": long steady run at 20 users. Each iteration is a
 * batch of a health check and a user lookup issued concurrently.
 */
class SoakScenario : public IScenario {
public:
    std::string name() const override { return "soak-test"; }
    std::string description() const override { return "Long-running stability test (13min, 20 users)"; }

    ScenarioOptions options() const override {
        using namespace std::chrono_literals;
        ScenarioOptions opts;
        opts.stages = {{2min, 20}, {10min, 20}, {1min, 0}};
        opts.think_time = ThinkTime::Fixed(1s);
        return opts;
    }

    void iterate(VuContext& ctx) override {
        auto responses = ctx.Http().SendBatch({
            target_requests::health(),
            target_requests::user(ctx.UniformInt(0, 99)),
        });

        for (const auto& res : responses) {
            ctx.Check(res, {status_is(200)});
        }
    }

    std::unique_ptr<IScenario> clone() const override {
        return std::make_unique<SoakScenario>(*this);
    }
};
