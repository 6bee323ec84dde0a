#include <atomic>
#include <csignal>
#include <iostream>
#include <string>

#include "errors.hpp"
#include "run_config.hpp"
#include "runner.hpp"
#include "scenario_catalog.hpp"

// --- Stop flag, raised by SIGINT/SIGTERM ---
static std::atomic<bool> interrupted{false};

extern "C" void on_interrupt(int /*signum*/) {
    interrupted.store(true);
}

int main(int argc, char* argv[]) {
    RunConfig config;
    try {
        config = parse_run_args(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        print_usage(argv[0]);
        return static_cast<int>(ExitStatus::ConfigurationError);
    }

    if (config.mode == RunConfig::Mode::Help) {
        print_usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    ScenarioCatalog catalog = ScenarioCatalog::Builtin();
    TestRunner runner(catalog, config);

    ExitStatus status = runner.Run(interrupted, std::cout, std::cerr);

    if (config.mode == RunConfig::Mode::Run) {
        if (status == ExitStatus::Passed) {
            std::cout << "Test completed successfully\n";
        } else {
            std::cerr << "Test failed with exit code " << static_cast<int>(status) << "\n";
        }
    }
    return static_cast<int>(status);
}
