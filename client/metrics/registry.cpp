#include "registry.hpp"

#include "../errors.hpp"

MetricRegistry::MetricRegistry()
{
    http_reqs_ = &AddCounter("http_reqs");
    http_req_duration_ = &AddTrend("http_req_duration");
    http_req_failed_ = &AddRate("http_req_failed");
    data_received_ = &AddCounter("data_received");
    checks_ = &AddRate("checks");
    iterations_ = &AddCounter("iterations");
    iteration_duration_ = &AddTrend("iteration_duration");
    vus_ = &AddGauge("vus");
}

template <typename T>
T& MetricRegistry::add(const std::string& name, MetricType type)
{
    if (name.empty()) {
        throw ConfigurationError("Metric name must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    if (it != metrics_.end()) {
        if (it->second->Type() != type) {
            throw ConfigurationError("Metric '" + name + "' already registered as " +
                                     metric_type_name(it->second->Type()));
        }
        return static_cast<T&>(*it->second);
    }

    auto metric = std::make_unique<T>(name);
    T& ref = *metric;
    metrics_.emplace(name, std::move(metric));
    return ref;
}

Counter& MetricRegistry::AddCounter(const std::string& name)
{
    return add<Counter>(name, MetricType::Counter);
}

Gauge& MetricRegistry::AddGauge(const std::string& name)
{
    return add<Gauge>(name, MetricType::Gauge);
}

Rate& MetricRegistry::AddRate(const std::string& name)
{
    return add<Rate>(name, MetricType::Rate);
}

Trend& MetricRegistry::AddTrend(const std::string& name)
{
    return add<Trend>(name, MetricType::Trend);
}

const Metric* MetricRegistry::Find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    return it == metrics_.end() ? nullptr : it->second.get();
}

std::vector<const Metric*> MetricRegistry::All() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const Metric*> out;
    out.reserve(metrics_.size());
    for (const auto& entry : metrics_) {
        out.push_back(entry.second.get());
    }
    return out;
}

Rate& MetricRegistry::CheckTally(const std::string& check_name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = check_tallies_[check_name];
    if (!slot) {
        slot = std::make_unique<Rate>(check_name);
    }
    return *slot;
}

std::vector<const Rate*> MetricRegistry::CheckTallies() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const Rate*> out;
    out.reserve(check_tallies_.size());
    for (const auto& entry : check_tallies_) {
        out.push_back(entry.second.get());
    }
    return out;
}
