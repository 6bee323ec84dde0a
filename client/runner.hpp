#pragma once

#include <atomic>
#include <memory>
#include <ostream>
#include <string>

#include "run_config.hpp"
#include "run_summary.hpp"
#include "scenario.hpp"
#include "scenario_catalog.hpp"

enum class ExitStatus : int {
    Passed = 0,
    EnvironmentUnavailable = 1,
    Aborted = 1, // anything outside the error taxonomy
    ThresholdsFailed = 99,
    ConfigurationError = 104,
};

/**
 * @brief Resolves a test name, makes sure the target is reachable, runs
 * the scenario and turns the verdict into an exit status.
 */
class TestRunner {
public:
    TestRunner(const ScenarioCatalog& catalog, RunConfig config);

    // Throws ScenarioNotFound.
    std::unique_ptr<IScenario> Resolve(const std::string& name) const;

    /**
     * @brief Polls the health endpoint until it answers 200, then runs the
     * scenario's preparation step.
     * @throws EnvironmentUnavailable once the retries are exhausted.
     */
    void PrepareEnvironment(IScenario& scenario) const;

    /**
     * @brief Validates the configuration, prepares the environment and
     * drives the scenario through its schedule.
     * @throws ConfigurationError or EnvironmentUnavailable before any VU starts.
     */
    RunSummary Execute(IScenario& scenario, const std::atomic<bool>& interrupt) const;

    // Whole flow for the configured mode. Prints errors and maps them to an
    // exit status instead of throwing.
    ExitStatus Run(const std::atomic<bool>& interrupt, std::ostream& out, std::ostream& err) const;

    void PrintList(std::ostream& out) const;

private:
    const ScenarioCatalog& catalog_;
    RunConfig config_;
};
