#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "metrics/registry.hpp"
#include "threshold.hpp"

struct MetricSummary {
    std::string name;
    MetricType type;
    std::vector<std::pair<std::string, double>> values; // aggregate label -> value
};

struct CheckSummary {
    std::string name;
    long long passes;
    long long fails;
};

struct RunSummary {
    std::string scenario;
    std::chrono::milliseconds elapsed{0};
    bool interrupted = false;
    int peak_vus = 0;
    std::vector<MetricSummary> metrics;
    std::vector<CheckSummary> checks;
    std::vector<ThresholdResult> thresholds;
    bool passed = true;
};

// Snapshot of every register; `thresholds` and `passed` are left to the caller.
RunSummary summarize(const std::string& scenario, const MetricRegistry& registry,
                     std::chrono::milliseconds elapsed);

void print_summary(std::ostream& out, const RunSummary& summary);

std::string summary_to_json(const RunSummary& summary);

// Overwrites `path`. Throws std::runtime_error if the file cannot be written.
void write_summary_file(const RunSummary& summary, const std::string& path);
