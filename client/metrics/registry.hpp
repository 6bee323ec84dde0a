#pragma once

#include "metric.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Process-wide set of metric registers for one run.
 *
 * Created before the run, handed by reference to every VU. Registration
 * returns stable references: VUs look a register up once and then write to
 * it directly without touching the registry lock.
 */
class MetricRegistry {
public:
    MetricRegistry();

    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;

    // Returns the existing register when the name is already taken by the
    // same type; throws ConfigurationError when taken by another type.
    Counter& AddCounter(const std::string& name);
    Gauge& AddGauge(const std::string& name);
    Rate& AddRate(const std::string& name);
    Trend& AddTrend(const std::string& name);

    // nullptr when unknown.
    const Metric* Find(const std::string& name) const;

    // Sorted by name.
    std::vector<const Metric*> All() const;

    // Per-check pass/fail tally, created on first use.
    Rate& CheckTally(const std::string& check_name);
    std::vector<const Rate*> CheckTallies() const;

    // --- Built-in registers ---
    Counter& HttpReqs() { return *http_reqs_; }
    Trend& HttpReqDuration() { return *http_req_duration_; }
    Rate& HttpReqFailed() { return *http_req_failed_; }
    Counter& DataReceived() { return *data_received_; }
    Rate& Checks() { return *checks_; }
    Counter& Iterations() { return *iterations_; }
    Trend& IterationDuration() { return *iteration_duration_; }
    Gauge& Vus() { return *vus_; }

private:
    template <typename T>
    T& add(const std::string& name, MetricType type);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Metric>> metrics_;
    std::map<std::string, std::unique_ptr<Rate>> check_tallies_;

    Counter* http_reqs_;
    Trend* http_req_duration_;
    Rate* http_req_failed_;
    Counter* data_received_;
    Rate* checks_;
    Counter* iterations_;
    Trend* iteration_duration_;
    Gauge* vus_;
};
