#include "threshold.hpp"

#include "errors.hpp"

#include <cctype>
#include <cmath>

namespace {

std::string strip_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) out += c;
    }
    return out;
}

double parse_number(const std::string& text, const std::string& expression) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size() && std::isfinite(value)) return value;
    } catch (const std::logic_error&) {
    }
    throw ConfigurationError("Invalid number '" + text + "' in threshold '" + expression + "'");
}

Aggregation parse_aggregation(const std::string& text, const std::string& expression) {
    Aggregation agg;
    if (text == "count") {
        agg.kind = Aggregation::Kind::Count;
    } else if (text == "rate") {
        agg.kind = Aggregation::Kind::Rate;
    } else if (text == "value") {
        agg.kind = Aggregation::Kind::Value;
    } else if (text == "avg") {
        agg.kind = Aggregation::Kind::Avg;
    } else if (text == "min") {
        agg.kind = Aggregation::Kind::Min;
    } else if (text == "max") {
        agg.kind = Aggregation::Kind::Max;
    } else if (text == "med") {
        agg.kind = Aggregation::Kind::Med;
    } else if (text.size() > 3 && text.compare(0, 2, "p(") == 0 && text.back() == ')') {
        agg.kind = Aggregation::Kind::Percentile;
        agg.percentile = parse_number(text.substr(2, text.size() - 3), expression);
        if (!(agg.percentile >= 0.0 && agg.percentile <= 100.0)) {
            throw ConfigurationError("Percentile out of range in threshold '" + expression + "'");
        }
    } else {
        throw ConfigurationError("Unknown aggregate '" + text + "' in threshold '" + expression + "'");
    }
    return agg;
}

} // namespace

const char* comparison_symbol(Comparison cmp) {
    switch (cmp) {
        case Comparison::Less: return "<";
        case Comparison::LessEqual: return "<=";
        case Comparison::Greater: return ">";
        case Comparison::GreaterEqual: return ">=";
    }
    return "?";
}

Threshold Threshold::Parse(const std::string& metric, const std::string& expression) {
    std::string expr = strip_spaces(expression);

    size_t op_pos = expr.find_first_of("<>");
    if (op_pos == std::string::npos) {
        throw ConfigurationError("Threshold '" + expression + "' has no comparison operator");
    }

    Threshold t;
    t.metric = metric;
    t.expression = expression;

    size_t op_len = 1;
    bool or_equal = op_pos + 1 < expr.size() && expr[op_pos + 1] == '=';
    if (or_equal) op_len = 2;
    if (expr[op_pos] == '<') {
        t.comparison = or_equal ? Comparison::LessEqual : Comparison::Less;
    } else {
        t.comparison = or_equal ? Comparison::GreaterEqual : Comparison::Greater;
    }

    std::string lhs = expr.substr(0, op_pos);
    std::string rhs = expr.substr(op_pos + op_len);
    if (lhs.empty() || rhs.empty()) {
        throw ConfigurationError("Threshold '" + expression + "' is incomplete");
    }

    t.aggregation = parse_aggregation(lhs, expression);
    t.bound = parse_number(rhs, expression);
    return t;
}

bool Threshold::Holds(double value) const {
    if (std::isnan(value)) return false;
    switch (comparison) {
        case Comparison::Less: return value < bound;
        case Comparison::LessEqual: return value <= bound;
        case Comparison::Greater: return value > bound;
        case Comparison::GreaterEqual: return value >= bound;
    }
    return false;
}

ThresholdEvaluator ThresholdEvaluator::FromOptions(const std::map<std::string, std::vector<std::string>>& spec) {
    std::vector<Threshold> thresholds;
    for (const auto& entry : spec) {
        for (const auto& expression : entry.second) {
            thresholds.push_back(Threshold::Parse(entry.first, expression));
        }
    }
    return ThresholdEvaluator(std::move(thresholds));
}

void ThresholdEvaluator::Validate(const MetricRegistry& metrics) const {
    for (const auto& t : thresholds_) {
        const Metric* metric = metrics.Find(t.metric);
        if (!metric) {
            throw ConfigurationError("Threshold references unknown metric '" + t.metric + "'");
        }
        if (!metric->Supports(t.aggregation.kind)) {
            throw ConfigurationError("Metric '" + t.metric + "' (" + metric_type_name(metric->Type()) +
                                     ") has no aggregate '" + t.aggregation.label() + "'");
        }
    }
}

std::vector<ThresholdResult> ThresholdEvaluator::Evaluate(const MetricRegistry& metrics, double elapsed_seconds) const {
    Validate(metrics);

    std::vector<ThresholdResult> results;
    results.reserve(thresholds_.size());
    for (const auto& t : thresholds_) {
        double value = metrics.Find(t.metric)->Compute(t.aggregation, elapsed_seconds);
        results.push_back(ThresholdResult{t, value, t.Holds(value)});
    }
    return results;
}

bool ThresholdEvaluator::AllPassed(const std::vector<ThresholdResult>& results) {
    for (const auto& r : results) {
        if (!r.passed) return false;
    }
    return true;
}
