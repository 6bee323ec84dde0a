#include "run_summary.hpp"

#include "schedule/stage.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

std::string json_string(const std::string& s) {
    std::ostringstream ss;
    ss << '"';
    for (char c : s) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\n': ss << "\\n"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                       << std::dec << std::setfill(' ');
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

// Formats into a scratch stream so the caller's stream state is untouched.
std::string fixed4(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << v;
    return ss.str();
}

std::string json_number(double v) {
    if (!std::isfinite(v)) return "null";
    return fixed4(v);
}

std::string display_value(const MetricSummary& m, const std::string& label, double v) {
    if (std::isnan(v)) return "n/a";
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (m.type == MetricType::Rate) {
        ss << v * 100.0 << "%";
    } else if (m.type == MetricType::Trend) {
        ss << v << "ms";
    } else if (label == "rate") {
        ss << v << "/s";
    } else {
        ss << std::setprecision(0) << v;
    }
    return ss.str();
}

std::string padded(const std::string& name, int width) {
    std::ostringstream ss;
    ss << std::left << std::setw(width) << name;
    return ss.str();
}

} // namespace

RunSummary summarize(const std::string& scenario, const MetricRegistry& registry,
                     std::chrono::milliseconds elapsed) {
    RunSummary summary;
    summary.scenario = scenario;
    summary.elapsed = elapsed;

    double seconds = static_cast<double>(elapsed.count()) / 1000.0;
    for (const Metric* metric : registry.All()) {
        MetricSummary m{metric->Name(), metric->Type(), {}};
        for (const auto& agg : metric->SummaryAggregations()) {
            m.values.emplace_back(agg.label(), metric->Compute(agg, seconds));
        }
        summary.metrics.push_back(std::move(m));
    }

    for (const Rate* tally : registry.CheckTallies()) {
        summary.checks.push_back(CheckSummary{tally->Name(), tally->Passes(), tally->Fails()});
    }
    return summary;
}

void print_summary(std::ostream& out, const RunSummary& summary) {
    out << "\n--- Test Complete (" << summary.scenario << ") ---\n"
        << "Duration:       " << format_duration(summary.elapsed)
        << (summary.interrupted ? " (interrupted)" : "") << "\n"
        << "Peak VUs:       " << summary.peak_vus << "\n";

    if (!summary.checks.empty()) {
        out << "\nChecks:\n";
        for (const auto& c : summary.checks) {
            out << "  " << (c.fails == 0 ? "ok   " : "FAIL ") << c.name << "  (" << c.passes << " passed, "
                << c.fails << " failed)\n";
        }
    }

    out << "\nMetrics:\n";
    for (const auto& m : summary.metrics) {
        out << "  " << padded(m.name, 22);
        bool first = true;
        for (const auto& v : m.values) {
            if (m.values.size() > 1) {
                out << (first ? "" : "  ") << v.first << "=";
            }
            out << display_value(m, v.first, v.second);
            first = false;
        }
        out << "\n";
    }

    if (!summary.thresholds.empty()) {
        out << "\nThresholds:\n";
        for (const auto& r : summary.thresholds) {
            out << "  " << (r.passed ? "ok   " : "FAIL ") << r.threshold.metric << ": " << r.threshold.expression
                << "  (actual " << fixed4(r.value) << ", bound " << fixed4(r.threshold.bound) << ")\n";
        }
    }

    out << "\nResult:         " << (summary.passed ? "PASS" : "FAIL") << "\n";
}

std::string summary_to_json(const RunSummary& summary) {
    std::ostringstream ss;
    ss << "{"
       << "\"scenario\": " << json_string(summary.scenario) << ", "
       << "\"duration_ms\": " << summary.elapsed.count() << ", "
       << "\"interrupted\": " << (summary.interrupted ? "true" : "false") << ", "
       << "\"passed\": " << (summary.passed ? "true" : "false") << ", "
       << "\"peak_vus\": " << summary.peak_vus << ", ";

    ss << "\"metrics\": {";
    for (size_t i = 0; i < summary.metrics.size(); ++i) {
        const auto& m = summary.metrics[i];
        ss << (i ? ", " : "") << json_string(m.name) << ": {\"type\": " << json_string(metric_type_name(m.type));
        for (const auto& v : m.values) {
            ss << ", " << json_string(v.first) << ": " << json_number(v.second);
        }
        ss << "}";
    }
    ss << "}, ";

    ss << "\"checks\": {";
    for (size_t i = 0; i < summary.checks.size(); ++i) {
        const auto& c = summary.checks[i];
        ss << (i ? ", " : "") << json_string(c.name) << ": {\"passes\": " << c.passes << ", \"fails\": " << c.fails
           << "}";
    }
    ss << "}, ";

    ss << "\"thresholds\": [";
    for (size_t i = 0; i < summary.thresholds.size(); ++i) {
        const auto& r = summary.thresholds[i];
        ss << (i ? ", " : "") << "{\"metric\": " << json_string(r.threshold.metric)
           << ", \"expression\": " << json_string(r.threshold.expression)
           << ", \"value\": " << json_number(r.value)
           << ", \"bound\": " << json_number(r.threshold.bound)
           << ", \"passed\": " << (r.passed ? "true" : "false") << "}";
    }
    ss << "]}";

    return ss.str();
}

void write_summary_file(const RunSummary& summary, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.good()) {
        throw std::runtime_error("Cannot open '" + path + "' for writing");
    }
    out << summary_to_json(summary) << "\n";
    if (!out.good()) {
        throw std::runtime_error("Failed writing summary to '" + path + "'");
    }
}
