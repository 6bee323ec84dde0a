#include "vu_scheduler.hpp"

#include <iostream>
#include <random>

ScheduleEngine::ScheduleEngine(Schedule schedule, const IScenario& scenario, MetricRegistry& metrics,
                               EngineSettings settings)
    : schedule_(std::move(schedule)),
      scenario_(scenario),
      metrics_(metrics),
      settings_(std::move(settings)),
      think_time_(scenario.options().think_time)
{
}

ScheduleEngine::~ScheduleEngine()
{
    // Only reached with live VUs if Run threw
    StopAll();
}

EngineReport ScheduleEngine::Run(const std::atomic<bool>& interrupt)
{
    using clock = std::chrono::steady_clock;

    EngineReport report;
    auto start = clock::now();
    auto total = schedule_.TotalDuration();
    auto next_progress = settings_.progress_interval;

    while (true) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);

        if (interrupt.load()) {
            report.interrupted = true;
            std::cout << "[engine] Interrupted at " << format_duration(elapsed)
                      << ", waiting for in-flight iterations...\n";
            break;
        }
        if (elapsed >= total) {
            break;
        }

        Converge(schedule_.TargetAt(elapsed));
        Reap(false);

        if (!settings_.quiet && elapsed >= next_progress) {
            ReportProgress(elapsed);
            next_progress += settings_.progress_interval;
        }

        std::this_thread::sleep_for(settings_.tick);
    }

    StopAll();

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
    report.peak_vus = peak_vus_;
    report.vus_started = next_vu_id_ - 1;
    return report;
}

void ScheduleEngine::Converge(int target)
{
    int live = static_cast<int>(active_.size());
    if (target > live) {
        for (int i = live; i < target; ++i) {
            Spawn();
        }
    } else if (target < live) {
        RetireNewest(live - target);
    }

    live_vus_.store(static_cast<int>(active_.size()));
    metrics_.Vus().Set(static_cast<long long>(active_.size()));
    if (static_cast<int>(active_.size()) > peak_vus_) {
        peak_vus_ = static_cast<int>(active_.size());
    }
}

void ScheduleEngine::Spawn()
{
    auto vu = std::make_unique<VirtualUser>();
    vu->id = next_vu_id_++;
    VirtualUser& ref = *vu;
    vu->thread = std::thread(&ScheduleEngine::VuLoop, this, std::ref(ref), scenario_.clone());
    active_.push_back(std::move(vu));
}

void ScheduleEngine::RetireNewest(int count)
{
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        for (int i = 0; i < count && !active_.empty(); ++i) {
            auto vu = std::move(active_.back());
            active_.pop_back();
            vu->retiring.store(true);
            draining_.push_back(std::move(vu));
        }
    }
    wake_cv_.notify_all();
}

void ScheduleEngine::Reap(bool wait_all)
{
    auto it = draining_.begin();
    while (it != draining_.end()) {
        VirtualUser& vu = **it;
        if (wait_all || vu.finished.load()) {
            if (vu.thread.joinable()) vu.thread.join();
            it = draining_.erase(it);
        } else {
            ++it;
        }
    }
}

void ScheduleEngine::StopAll()
{
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stopping_.store(true);
        for (auto& vu : active_) {
            vu->retiring.store(true);
            draining_.push_back(std::move(vu));
        }
        active_.clear();
    }
    wake_cv_.notify_all();

    Reap(true);
    live_vus_.store(0);
    metrics_.Vus().Set(0);
}

bool ScheduleEngine::ShouldExit(const VirtualUser& vu) const
{
    return vu.retiring.load() || stopping_.load();
}

void ScheduleEngine::VuLoop(VirtualUser& vu, std::unique_ptr<IScenario> scenario)
{
    // Each VU gets its own persistent session and random number generator
    HttpSession http(settings_.base_url, metrics_, settings_.request_timeout);

    std::mt19937 gen;
    if (settings_.seed == -1) {
        gen.seed(std::random_device{}());
    } else {
        gen.seed(static_cast<std::mt19937::result_type>(settings_.seed + vu.id));
    }

    VuContext ctx(vu.id, http, metrics_, gen);

    while (!ShouldExit(vu)) {
        auto start_time = std::chrono::steady_clock::now();

        try {
            scenario->iterate(ctx);
        } catch (const std::exception& e) {
            std::cerr << "[VU " << vu.id << "] Iteration " << ctx.Iteration() << " failed: " << e.what() << "\n";
        }

        auto end_time = std::chrono::steady_clock::now();
        metrics_.Iterations().Add(1);
        metrics_.IterationDuration().Add(
            std::chrono::duration<double, std::milli>(end_time - start_time).count());
        ctx.NextIteration();

        Pause(vu, think_time_.Draw(gen));
    }

    vu.finished.store(true);
}

void ScheduleEngine::Pause(VirtualUser& vu, std::chrono::milliseconds duration)
{
    if (duration.count() <= 0) return;
    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, duration, [this, &vu] { return ShouldExit(vu); });
}

void ScheduleEngine::ReportProgress(std::chrono::milliseconds elapsed)
{
    std::cout << "running (" << format_duration(elapsed) << "/" << format_duration(schedule_.TotalDuration())
              << "), " << live_vus_.load() << "/" << schedule_.MaxTarget() << " VUs, "
              << metrics_.Iterations().Value() << " complete iterations\n";
}
