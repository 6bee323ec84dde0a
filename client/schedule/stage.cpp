#include "stage.hpp"

#include "../errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

std::chrono::milliseconds parse_duration(const std::string& text)
{
    if (text.empty()) {
        throw ConfigurationError("Empty duration");
    }

    double total_ms = 0.0;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t num_start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (pos == num_start) {
            throw ConfigurationError("Invalid duration '" + text + "'");
        }

        std::string number = text.substr(num_start, pos - num_start);
        double value = 0.0;
        size_t used = 0;
        try {
            value = std::stod(number, &used);
        } catch (const std::logic_error&) {
            throw ConfigurationError("Invalid duration '" + text + "'");
        }
        if (used != number.size()) {
            throw ConfigurationError("Invalid duration '" + text + "'");
        }

        size_t unit_start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        std::string unit = text.substr(unit_start, pos - unit_start);

        if (unit.empty() || unit == "s") {
            // A bare number is only allowed as the whole string
            if (unit.empty() && (num_start != 0 || pos != text.size())) {
                throw ConfigurationError("Missing unit in duration '" + text + "'");
            }
            total_ms += value * 1000.0;
        } else if (unit == "ms") {
            total_ms += value;
        } else if (unit == "m") {
            total_ms += value * 60.0 * 1000.0;
        } else if (unit == "h") {
            total_ms += value * 3600.0 * 1000.0;
        } else {
            throw ConfigurationError("Unknown unit '" + unit + "' in duration '" + text + "'");
        }
    }

    return std::chrono::milliseconds(static_cast<long long>(std::llround(total_ms)));
}

std::string format_duration(std::chrono::milliseconds d)
{
    long long ms = d.count();
    if (ms < 0) ms = 0;

    std::ostringstream ss;
    if (ms != 0 && ms < 1000) {
        ss << ms << "ms";
        return ss.str();
    }

    long long total_sec = ms / 1000;
    long long h = total_sec / 3600;
    long long m = (total_sec % 3600) / 60;
    long long s = total_sec % 60;
    if (h > 0) ss << h << "h";
    if (m > 0) ss << m << "m";
    if (s > 0 || (h == 0 && m == 0)) ss << s << "s";
    return ss.str();
}

Stage parse_stage(const std::string& text)
{
    auto colon = text.find(':');
    if (colon == std::string::npos) {
        throw ConfigurationError("Stage '" + text + "' must look like <duration>:<target>");
    }

    Stage stage;
    stage.duration = parse_duration(text.substr(0, colon));

    std::string target = text.substr(colon + 1);
    try {
        size_t used = 0;
        stage.target = std::stoi(target, &used);
        if (used != target.size()) {
            throw ConfigurationError("Invalid stage target '" + target + "'");
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid stage target '" + target + "'");
    }
    return stage;
}

Schedule::Schedule(std::vector<Stage> stages, int start_target)
    : stages_(std::move(stages)), start_target_(start_target)
{
    if (stages_.empty()) {
        throw ConfigurationError("Schedule needs at least one stage");
    }
    if (start_target_ < 0) {
        throw ConfigurationError("Start target must not be negative");
    }

    for (size_t i = 0; i < stages_.size(); ++i) {
        const Stage& stage = stages_[i];
        if (stage.duration.count() <= 0) {
            throw ConfigurationError("Stage " + std::to_string(i + 1) + " has a zero or negative duration");
        }
        if (stage.target < 0) {
            throw ConfigurationError("Stage " + std::to_string(i + 1) + " has a negative target");
        }
        total_ += stage.duration;
    }
}

Schedule Schedule::Constant(int vus, std::chrono::milliseconds duration)
{
    return Schedule({Stage{duration, vus}}, vus);
}

int Schedule::TargetAt(std::chrono::milliseconds elapsed) const
{
    if (elapsed.count() <= 0) {
        return start_target_;
    }

    int from = start_target_;
    std::chrono::milliseconds stage_start{0};
    for (const Stage& stage : stages_) {
        auto stage_end = stage_start + stage.duration;
        if (elapsed < stage_end) {
            double frac = static_cast<double>((elapsed - stage_start).count()) /
                          static_cast<double>(stage.duration.count());
            double exact = from + (stage.target - from) * frac;
            long long rounded = std::llround(exact);
            return static_cast<int>(std::max(0LL, rounded));
        }
        from = stage.target;
        stage_start = stage_end;
    }
    return stages_.back().target;
}

int Schedule::MaxTarget() const
{
    int peak = start_target_;
    for (const Stage& stage : stages_) {
        peak = std::max(peak, stage.target);
    }
    return peak;
}
