#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "http_session.hpp"
#include "pacing.hpp"
#include "schedule/stage.hpp"
#include "vu_context.hpp"

/**
 * @brief Declared defaults of a scenario. Command-line options override the
 * schedule part.
 */
struct ScenarioOptions {
    std::vector<Stage> stages;
    int start_vus = 0;
    // metric name -> expressions, e.g. {"http_req_duration", {"p(95)<500"}}
    std::map<std::string, std::vector<std::string>> thresholds;
    ThinkTime think_time;
};

/**
 * @brief Abstract interface for a traffic scenario.
 *
 * Each VU receives its own clone of the scenario, so per-VU state (such
 * as request tables) needs no locking. Shared state lives only in the
 * MetricRegistry.
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual ScenarioOptions options() const = 0;

    /**
     * @brief Registers the scenario's custom metrics. Called once, before
     * the run and before cloning, so clones share the same registers.
     */
    virtual void register_metrics(MetricRegistry& /*metrics*/) {
        // Default implementation does nothing.
    }

    /**
     * @brief (Optional) Puts the target in the state the scenario expects
     * before the load starts.
     * @param http A session for executing preparation requests.
     */
    virtual void prepare(HttpSession& /*http*/) {
        // Default implementation does nothing.
    }

    /**
     * @brief Executes one iteration: pick the work, issue the HTTP call(s),
     * run checks, record metrics. The think time is applied by the caller.
     */
    virtual void iterate(VuContext& ctx) = 0;

    /**
     * @brief Creates a deep copy of the scenario object.
     */
    virtual std::unique_ptr<IScenario> clone() const = 0;
};
