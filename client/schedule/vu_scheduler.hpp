#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../metrics/registry.hpp"
#include "../scenario.hpp"
#include "stage.hpp"

struct EngineSettings {
    std::string base_url;
    std::chrono::milliseconds request_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds tick{50};
    std::chrono::milliseconds progress_interval{std::chrono::seconds(10)};
    int seed = -1; // -1: seed every VU from std::random_device
    bool quiet = false;
};

struct EngineReport {
    std::chrono::milliseconds elapsed{0};
    bool interrupted = false;
    int peak_vus = 0;
    int vus_started = 0;
};

/**
 * @brief Drives a scenario through a Schedule.
 *
 * A single controller (the thread calling Run) evaluates the schedule every
 * tick and converges the number of live VUs to the target: it spawns a
 * fresh VU thread per missing VU and marks the newest VUs as retiring when
 * there are too many. A retiring VU finishes its current iteration and then
 * exits; the controller joins it on a later tick. Retiring VUs are never
 * revived.
 *
 * At the end of the last stage, or when the interrupt flag is raised, every
 * VU is asked to stop and Run returns once all of them have finished their
 * current iteration.
 */
class ScheduleEngine {
public:
    ScheduleEngine(Schedule schedule, const IScenario& scenario, MetricRegistry& metrics,
                   EngineSettings settings);
    ~ScheduleEngine();

    ScheduleEngine(const ScheduleEngine&) = delete;
    ScheduleEngine& operator=(const ScheduleEngine&) = delete;

    EngineReport Run(const std::atomic<bool>& interrupt);

    // VUs currently running iterations (not retiring).
    int LiveVus() const { return live_vus_.load(); }

private:
    struct VirtualUser {
        int id = 0;
        std::atomic<bool> retiring{false};
        std::atomic<bool> finished{false};
        std::thread thread;
    };

    void Converge(int target);
    void Spawn();
    void RetireNewest(int count);
    void Reap(bool wait_all);
    void StopAll();

    void VuLoop(VirtualUser& vu, std::unique_ptr<IScenario> scenario);
    void Pause(VirtualUser& vu, std::chrono::milliseconds duration);
    bool ShouldExit(const VirtualUser& vu) const;

    void ReportProgress(std::chrono::milliseconds elapsed);

    Schedule schedule_;
    const IScenario& scenario_;
    MetricRegistry& metrics_;
    EngineSettings settings_;
    ThinkTime think_time_;

    // Owned by the controller thread only
    std::vector<std::unique_ptr<VirtualUser>> active_;
    std::vector<std::unique_ptr<VirtualUser>> draining_;
    int next_vu_id_ = 1;
    int peak_vus_ = 0;

    std::atomic<int> live_vus_{0};
    std::atomic<bool> stopping_{false};

    // Wakes VUs sleeping between iterations when they retire or the run stops
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};
