#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "schedule/stage.hpp"
#include "scenario.hpp"

/**
 * @brief Every option the runner recognizes, with its default.
 *
 * Schedule precedence: stages > vus/duration > the scenario's own options.
 */
struct RunConfig {
    enum class Mode { Run, List, Help };

    Mode mode = Mode::Run;
    std::string test_name;

    std::string base_url;                              // --base-url, $BASE_URL, or the default
    std::optional<int> vus;                            // -u, --vus
    std::optional<std::chrono::milliseconds> duration; // -d, --duration
    std::vector<Stage> stages;                         // -s, --stage (repeatable)

    std::string summary_export;                        // --summary-export
    int seed = -1;                                     // --seed
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)}; // --timeout
    int ready_retries = 5;                             // --ready-retries
    std::chrono::milliseconds ready_delay{std::chrono::seconds(1)};      // --ready-delay
    bool no_thresholds = false;                        // --no-thresholds
    bool quiet = false;                                // -q, --quiet

    std::chrono::milliseconds tick{50};
    std::chrono::milliseconds progress_interval{std::chrono::seconds(10)};
};

// $BASE_URL if set and non-empty, otherwise the target default.
std::string default_base_url();

// Plain http:// (or a bare host). Throws ConfigurationError otherwise.
void validate_base_url(const std::string& url);

/**
 * @brief Parses `<test-name> [options]`. Accepts `--opt value` and `--opt=value`.
 * @throws ConfigurationError on an unknown option or a bad value.
 */
RunConfig parse_run_args(int argc, char* argv[]);

/**
 * @brief The schedule to run: the scenario's, unless the config overrides it.
 * @throws ConfigurationError if the result is not a valid schedule.
 */
Schedule resolve_schedule(const ScenarioOptions& options, const RunConfig& config);

void print_usage(const char* program);
