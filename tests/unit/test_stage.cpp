#include <gtest/gtest.h>

#include "errors.hpp"
#include "schedule/stage.hpp"

using namespace std::chrono_literals;
using std::chrono::milliseconds;

// ========== Durations ==========

TEST(DurationTest, test_parses_single_units) {
    EXPECT_EQ(parse_duration("500ms"), 500ms);
    EXPECT_EQ(parse_duration("30s"), 30s);
    EXPECT_EQ(parse_duration("2m"), 120s);
    EXPECT_EQ(parse_duration("1h"), 3600s);
}

TEST(DurationTest, test_parses_compound_and_decimal) {
    EXPECT_EQ(parse_duration("1m30s"), 90s);
    EXPECT_EQ(parse_duration("1h2m3s"), 3723s);
    EXPECT_EQ(parse_duration("1.5s"), 1500ms);
}

TEST(DurationTest, test_bare_number_is_seconds) {
    EXPECT_EQ(parse_duration("45"), 45s);
}

TEST(DurationTest, test_rejects_garbage) {
    EXPECT_THROW(parse_duration(""), ConfigurationError);
    EXPECT_THROW(parse_duration("abc"), ConfigurationError);
    EXPECT_THROW(parse_duration("10x"), ConfigurationError);
    EXPECT_THROW(parse_duration("-5s"), ConfigurationError);
    EXPECT_THROW(parse_duration("1m30"), ConfigurationError);
    EXPECT_THROW(parse_duration("1.2.3s"), ConfigurationError);
    EXPECT_THROW(parse_duration(".s"), ConfigurationError);
}

TEST(DurationTest, test_format_round_trips_readable_values) {
    EXPECT_EQ(format_duration(90s), "1m30s");
    EXPECT_EQ(format_duration(250ms), "250ms");
    EXPECT_EQ(format_duration(0ms), "0s");
    EXPECT_EQ(format_duration(3600s), "1h");
}

TEST(StageTest, test_parse_stage) {
    Stage s = parse_stage("30s:10");
    EXPECT_EQ(s.duration, 30s);
    EXPECT_EQ(s.target, 10);

    EXPECT_THROW(parse_stage("30s"), ConfigurationError);
    EXPECT_THROW(parse_stage("30s:ten"), ConfigurationError);
    EXPECT_THROW(parse_stage("30s:10x"), ConfigurationError);
}

// ========== Schedule validation ==========

TEST(ScheduleTest, test_rejects_empty_schedule) {
    EXPECT_THROW(Schedule({}), ConfigurationError);
}

TEST(ScheduleTest, test_rejects_zero_duration_stage) {
    EXPECT_THROW(Schedule({{10s, 5}, {0s, 10}}), ConfigurationError);
}

TEST(ScheduleTest, test_rejects_negative_target) {
    EXPECT_THROW(Schedule({{10s, -1}}), ConfigurationError);
    EXPECT_THROW(Schedule({{10s, 1}}, -3), ConfigurationError);
}

TEST(ScheduleTest, test_total_and_max) {
    Schedule s({{30s, 10}, {30s, 10}, {10s, 0}});
    EXPECT_EQ(s.TotalDuration(), 70s);
    EXPECT_EQ(s.MaxTarget(), 10);
    EXPECT_EQ(s.FinalTarget(), 0);
}

// ========== Target interpolation ==========

TEST(ScheduleTest, test_endpoints_match_start_and_last_target) {
    Schedule s({{30s, 10}, {30s, 10}, {10s, 0}});
    EXPECT_EQ(s.TargetAt(0ms), 0);
    EXPECT_EQ(s.TargetAt(s.TotalDuration()), 0);

    Schedule up({{10s, 7}}, 2);
    EXPECT_EQ(up.TargetAt(0ms), 2);
    EXPECT_EQ(up.TargetAt(10s), 7);
    EXPECT_EQ(up.TargetAt(1h), 7);
}

TEST(ScheduleTest, test_linear_ramp_rounds_to_nearest) {
    Schedule s({{10s, 10}});
    EXPECT_EQ(s.TargetAt(1s), 1);
    EXPECT_EQ(s.TargetAt(5s), 5);
    EXPECT_EQ(s.TargetAt(1449ms), 1);
    EXPECT_EQ(s.TargetAt(1500ms), 2);
}

TEST(ScheduleTest, test_hold_is_flat) {
    Schedule s({{10s, 10}, {20s, 10}, {10s, 0}});
    for (int sec = 10; sec < 30; ++sec) {
        EXPECT_EQ(s.TargetAt(std::chrono::seconds(sec)), 10) << "at " << sec << "s";
    }
}

TEST(ScheduleTest, test_ramp_down) {
    Schedule s({{10s, 20}, {10s, 0}});
    EXPECT_EQ(s.TargetAt(10s), 20);
    EXPECT_EQ(s.TargetAt(15s), 10);
    EXPECT_EQ(s.TargetAt(20s), 0);
}

TEST(ScheduleTest, test_monotonic_within_each_stage) {
    Schedule s({{30s, 10}, {10s, 200}, {1min, 200}, {10s, 10}, {30s, 0}});

    milliseconds stage_start{0};
    for (const Stage& stage : s.Stages()) {
        int prev = s.TargetAt(stage_start);
        bool rising = stage.target >= prev;
        for (milliseconds t = stage_start; t <= stage_start + stage.duration; t += 100ms) {
            int cur = s.TargetAt(t);
            if (rising) {
                EXPECT_GE(cur, prev) << "at " << t.count() << "ms";
            } else {
                EXPECT_LE(cur, prev) << "at " << t.count() << "ms";
            }
            prev = cur;
        }
        stage_start += stage.duration;
    }
}

TEST(ScheduleTest, test_continuous_at_stage_boundaries) {
    Schedule s({{10s, 10}, {10s, 30}, {10s, 0}});
    for (milliseconds boundary : {10000ms, 20000ms}) {
        int before = s.TargetAt(boundary - 1ms);
        int at = s.TargetAt(boundary);
        EXPECT_LE(std::abs(at - before), 1) << "at " << boundary.count() << "ms";
    }
}

TEST(ScheduleTest, test_constant_schedule_holds_from_time_zero) {
    Schedule s = Schedule::Constant(25, 30s);
    EXPECT_EQ(s.TargetAt(0ms), 25);
    EXPECT_EQ(s.TargetAt(15s), 25);
    EXPECT_EQ(s.TargetAt(30s), 25);
    EXPECT_EQ(s.TotalDuration(), 30s);
}
