#pragma once

#include <chrono>
#include <string>
#include <vector>

struct Stage {
    std::chrono::milliseconds duration{0};
    int target = 0;
};

/**
 * @brief Parses "500ms", "30s", "1m30s", "2h", "1.5s". A bare number is seconds.
 * @throws ConfigurationError on malformed or negative input.
 */
std::chrono::milliseconds parse_duration(const std::string& text);

// "1m30s", "500ms", "0s"
std::string format_duration(std::chrono::milliseconds d);

// "<duration>:<target>", e.g. "30s:10"
Stage parse_stage(const std::string& text);

/**
 * @brief Piecewise-linear VU target over time.
 *
 * Stage i ramps from the previous stage's target (or the start target for
 * the first stage) to its own target over its duration. Two consecutive
 * stages with the same target form a hold.
 */
class Schedule {
public:
    /**
     * @throws ConfigurationError if the list is empty, a stage has a
     *         non-positive duration, or a target is negative.
     */
    explicit Schedule(std::vector<Stage> stages, int start_target = 0);

    // Hold `vus` for `duration`, starting at `vus`.
    static Schedule Constant(int vus, std::chrono::milliseconds duration);

    // Rounded to nearest and never negative. Past the end: the last target.
    int TargetAt(std::chrono::milliseconds elapsed) const;

    std::chrono::milliseconds TotalDuration() const { return total_; }
    int FinalTarget() const { return stages_.back().target; }
    int MaxTarget() const;
    const std::vector<Stage>& Stages() const { return stages_; }

private:
    std::vector<Stage> stages_;
    int start_target_;
    std::chrono::milliseconds total_{0};
};
