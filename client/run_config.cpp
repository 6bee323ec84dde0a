#include "run_config.hpp"

#include <cstdlib>
#include <iostream>

#include "errors.hpp"
#include "TargetDefaults.h"

namespace {

int parse_int(const std::string& option, const std::string& value) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used == value.size()) return n;
    } catch (const std::logic_error&) {
    }
    throw ConfigurationError("Option " + option + " expects an integer, got '" + value + "'");
}

int parse_non_negative(const std::string& option, const std::string& value) {
    int n = parse_int(option, value);
    if (n < 0) {
        throw ConfigurationError("Option " + option + " must not be negative");
    }
    return n;
}

} // namespace

std::string default_base_url() {
    const char* env = std::getenv("BASE_URL");
    if (env && *env) return env;
    return target_defaults::kBaseUrl;
}

void validate_base_url(const std::string& url) {
    if (url.empty()) {
        throw ConfigurationError("Base URL must not be empty");
    }

    size_t host_start = 0;
    auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        if (url.compare(0, scheme_end, "http") != 0) {
            throw ConfigurationError("Unsupported scheme in base URL '" + url + "', only http:// is supported");
        }
        host_start = scheme_end + 3;
    }
    if (host_start >= url.size() || url[host_start] == '/') {
        throw ConfigurationError("Base URL '" + url + "' has no host");
    }
}

RunConfig parse_run_args(int argc, char* argv[]) {
    RunConfig config;
    config.base_url = default_base_url();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.empty() || arg[0] != '-') {
            if (!config.test_name.empty()) {
                throw ConfigurationError("Unexpected argument '" + arg + "'");
            }
            config.test_name = arg;
            continue;
        }

        // Split "--opt=value"
        std::string option = arg;
        std::string inline_value;
        bool has_inline = false;
        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            option = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
            has_inline = true;
        }

        auto value = [&]() -> std::string {
            if (has_inline) return inline_value;
            if (i + 1 >= argc) {
                throw ConfigurationError("Option " + option + " requires a value");
            }
            return argv[++i];
        };

        if (option == "--help" || option == "-h") {
            config.mode = RunConfig::Mode::Help;
        } else if (option == "--list") {
            config.mode = RunConfig::Mode::List;
        } else if (option == "--base-url") {
            config.base_url = value();
        } else if (option == "--vus" || option == "-u") {
            config.vus = parse_non_negative(option, value());
        } else if (option == "--duration" || option == "-d") {
            config.duration = parse_duration(value());
        } else if (option == "--stage" || option == "-s") {
            config.stages.push_back(parse_stage(value()));
        } else if (option == "--summary-export") {
            config.summary_export = value();
        } else if (option == "--seed") {
            config.seed = parse_non_negative(option, value());
        } else if (option == "--timeout") {
            config.request_timeout = parse_duration(value());
        } else if (option == "--ready-retries") {
            config.ready_retries = parse_non_negative(option, value());
        } else if (option == "--ready-delay") {
            config.ready_delay = parse_duration(value());
        } else if (option == "--no-thresholds") {
            config.no_thresholds = true;
        } else if (option == "--quiet" || option == "-q") {
            config.quiet = true;
        } else {
            throw ConfigurationError("Unknown option '" + arg + "'");
        }
    }

    if (config.mode == RunConfig::Mode::Run && config.test_name.empty()) {
        config.mode = RunConfig::Mode::Help;
    }
    validate_base_url(config.base_url);
    return config;
}

Schedule resolve_schedule(const ScenarioOptions& options, const RunConfig& config) {
    if (!config.stages.empty()) {
        return Schedule(config.stages);
    }

    if (config.duration) {
        return Schedule::Constant(config.vus.value_or(1), *config.duration);
    }

    if (config.vus) {
        Schedule declared(options.stages, options.start_vus);
        return Schedule::Constant(*config.vus, declared.TotalDuration());
    }

    return Schedule(options.stages, options.start_vus);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <test-name> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --list                   List all available tests\n"
              << "  --help                   Show this help message\n"
              << "  --base-url URL           Target base URL (default: $BASE_URL or "
              << target_defaults::kBaseUrl << ")\n"
              << "  -u, --vus N              Run N constant VUs\n"
              << "  -d, --duration D         Constant-load duration, e.g. 30s, 1m30s\n"
              << "  -s, --stage D:N          Replace the stages (repeatable), e.g. 30s:10\n"
              << "  --summary-export PATH    Write the run summary as JSON\n"
              << "  --seed N                 Deterministic per-VU random seeds\n"
              << "  --timeout D              Per-request timeout (default 60s)\n"
              << "  --ready-retries N        Health-check attempts before giving up (default 5)\n"
              << "  --ready-delay D          Delay between health-check attempts (default 1s)\n"
              << "  --no-thresholds          Skip threshold evaluation\n"
              << "  -q, --quiet              No progress output\n"
              << "\n"
              << "Examples:\n"
              << "  " << program << " basic-load\n"
              << "  " << program << " stress-test --summary-export=results.json\n"
              << "  " << program << " basic-load --vus 50 --duration 30s\n";
}
