#pragma once

#include <map>
#include <string>
#include <vector>

#include "metrics/metric.hpp"
#include "metrics/registry.hpp"

enum class Comparison { Less, LessEqual, Greater, GreaterEqual };

const char* comparison_symbol(Comparison cmp);

/**
 * @brief A pass/fail condition over one aggregate of one metric,
 * e.g. http_req_duration "p(95)<500".
 */
struct Threshold {
    std::string metric;
    std::string expression;
    Aggregation aggregation;
    Comparison comparison = Comparison::Less;
    double bound = 0.0;

    /**
     * @brief Parses "<aggregate> <op> <number>" where aggregate is one of
     * count, rate, value, avg, min, max, med or p(N).
     * @throws ConfigurationError on anything else.
     */
    static Threshold Parse(const std::string& metric, const std::string& expression);

    // NaN never satisfies a comparison.
    bool Holds(double value) const;
};

struct ThresholdResult {
    Threshold threshold;
    double value;
    bool passed;
};

class ThresholdEvaluator {
public:
    ThresholdEvaluator() = default;
    explicit ThresholdEvaluator(std::vector<Threshold> thresholds)
        : thresholds_(std::move(thresholds)) {}

    // From the metric -> expressions map of ScenarioOptions.
    static ThresholdEvaluator FromOptions(const std::map<std::string, std::vector<std::string>>& spec);

    /**
     * @brief Fails fast on an unknown metric, or an aggregate the metric's
     * type does not provide.
     * @throws ConfigurationError
     */
    void Validate(const MetricRegistry& metrics) const;

    std::vector<ThresholdResult> Evaluate(const MetricRegistry& metrics, double elapsed_seconds) const;

    bool Empty() const { return thresholds_.empty(); }

    static bool AllPassed(const std::vector<ThresholdResult>& results);

private:
    std::vector<Threshold> thresholds_;
};
