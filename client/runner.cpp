#include "runner.hpp"

#include <iostream>
#include <thread>

#include "errors.hpp"
#include "schedule/vu_scheduler.hpp"
#include "threshold.hpp"
#include "TargetDefaults.h"

TestRunner::TestRunner(const ScenarioCatalog& catalog, RunConfig config)
    : catalog_(catalog), config_(std::move(config))
{
}

std::unique_ptr<IScenario> TestRunner::Resolve(const std::string& name) const
{
    return catalog_.Resolve(name);
}

void TestRunner::PrepareEnvironment(IScenario& scenario) const
{
    // Preparation traffic is kept out of the run's metrics
    MetricRegistry scratch;
    HttpSession http(config_.base_url, scratch, config_.request_timeout);

    int attempts = config_.ready_retries > 0 ? config_.ready_retries : 1;
    RequestOutcome last;
    bool ready = false;
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        last = http.Send(RequestSpec::Get(target_defaults::kHealthPath));
        if (last.status == 200) {
            ready = true;
            break;
        }
        std::cerr << "[runner] Target not ready (attempt " << attempt << "/" << attempts << "): "
                  << (last.status ? "HTTP " + std::to_string(last.status) : last.error) << "\n";
        if (attempt < attempts) {
            std::this_thread::sleep_for(config_.ready_delay);
        }
    }

    if (!ready) {
        throw EnvironmentUnavailable("Target " + config_.base_url + " is not reachable after " +
                                     std::to_string(attempts) + " attempt(s)");
    }

    std::cout << "Running preparation step for '" << scenario.name() << "'...\n";
    scenario.prepare(http);
}

RunSummary TestRunner::Execute(IScenario& scenario, const std::atomic<bool>& interrupt) const
{
    // --- Configuration, all validated before anything is sent ---
    validate_base_url(config_.base_url);
    ScenarioOptions options = scenario.options();
    Schedule schedule = resolve_schedule(options, config_);

    MetricRegistry registry;
    scenario.register_metrics(registry);

    ThresholdEvaluator thresholds;
    if (!config_.no_thresholds) {
        thresholds = ThresholdEvaluator::FromOptions(options.thresholds);
        thresholds.Validate(registry);
    }

    // --- Environment ---
    PrepareEnvironment(scenario);

    std::cout << "Starting load test...\n"
              << "   Target:    " << config_.base_url << "\n"
              << "   Scenario:  " << scenario.name() << "\n"
              << "   Stages:    " << schedule.Stages().size() << " (max " << schedule.MaxTarget() << " VUs)\n"
              << "   Duration:  " << format_duration(schedule.TotalDuration()) << "\n";
    if (config_.seed != -1) {
        std::cout << "   Seed:      " << config_.seed << " (Deterministic, varied per VU)\n\n";
    } else {
        std::cout << "   Seed:      Random\n\n";
    }

    // --- Run ---
    EngineSettings settings;
    settings.base_url = config_.base_url;
    settings.request_timeout = config_.request_timeout;
    settings.tick = config_.tick;
    settings.progress_interval = config_.progress_interval;
    settings.seed = config_.seed;
    settings.quiet = config_.quiet;

    ScheduleEngine engine(schedule, scenario, registry, settings);
    EngineReport report = engine.Run(interrupt);

    // --- Verdict ---
    RunSummary summary = summarize(scenario.name(), registry, report.elapsed);
    summary.interrupted = report.interrupted;
    summary.peak_vus = report.peak_vus;
    summary.thresholds = thresholds.Evaluate(registry, static_cast<double>(report.elapsed.count()) / 1000.0);
    summary.passed = ThresholdEvaluator::AllPassed(summary.thresholds);
    return summary;
}

ExitStatus TestRunner::Run(const std::atomic<bool>& interrupt, std::ostream& out, std::ostream& err) const
{
    if (config_.mode == RunConfig::Mode::List) {
        PrintList(out);
        return ExitStatus::Passed;
    }

    try {
        auto scenario = Resolve(config_.test_name);
        RunSummary summary = Execute(*scenario, interrupt);

        print_summary(out, summary);

        if (!config_.summary_export.empty()) {
            try {
                write_summary_file(summary, config_.summary_export);
                out << "Summary written to '" << config_.summary_export << "'\n";
            } catch (const std::runtime_error& e) {
                err << "[runner] " << e.what() << "\n";
            }
        }

        if (!summary.passed) {
            for (const auto& r : summary.thresholds) {
                if (!r.passed) {
                    err << "[runner] Threshold failed: " << r.threshold.metric << " " << r.threshold.expression
                        << " (actual " << r.value << ")\n";
                }
            }
            return ExitStatus::ThresholdsFailed;
        }
        return ExitStatus::Passed;
    } catch (const ScenarioNotFound& e) {
        err << "Error: " << e.what() << "\n\n";
        PrintList(err);
        return ExitStatus::ConfigurationError;
    } catch (const ConfigurationError& e) {
        err << "Configuration error: " << e.what() << "\n";
        return ExitStatus::ConfigurationError;
    } catch (const EnvironmentUnavailable& e) {
        err << "Environment unavailable: " << e.what() << "\n";
        return ExitStatus::EnvironmentUnavailable;
    } catch (const std::exception& e) {
        err << "[runner] Run aborted: " << e.what() << "\n";
        return ExitStatus::Aborted;
    }
}

void TestRunner::PrintList(std::ostream& out) const
{
    out << "Available tests:\n\n";
    for (const auto& entry : catalog_.Entries()) {
        out << "  " << entry.name << " - " << entry.description << "\n";
    }
    out << "\n";
}
