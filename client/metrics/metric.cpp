#include "metric.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

Aggregation make(Aggregation::Kind kind, double p = 0.0) {
    Aggregation agg;
    agg.kind = kind;
    agg.percentile = p;
    return agg;
}

// Interpolated percentile over an already sorted, non-empty vector.
double percentile_of_sorted(const std::vector<double>& sorted, double p) {
    if (sorted.size() == 1) return sorted.front();
    double rank = (p / 100.0) * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(rank));
    size_t upper = static_cast<size_t>(std::ceil(rank));
    double frac = rank - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * frac;
}

} // namespace

const char* metric_type_name(MetricType type) {
    switch (type) {
        case MetricType::Counter: return "counter";
        case MetricType::Gauge: return "gauge";
        case MetricType::Rate: return "rate";
        case MetricType::Trend: return "trend";
    }
    return "unknown";
}

std::string Aggregation::label() const {
    switch (kind) {
        case Kind::Count: return "count";
        case Kind::Rate: return "rate";
        case Kind::Value: return "value";
        case Kind::Avg: return "avg";
        case Kind::Min: return "min";
        case Kind::Max: return "max";
        case Kind::Med: return "med";
        case Kind::Percentile: {
            std::ostringstream ss;
            ss << "p(" << percentile << ")";
            return ss.str();
        }
    }
    return "?";
}

// --- Counter ---

void Counter::Add(long long n) {
    if (n < 0) {
        throw std::invalid_argument("Counter '" + Name() + "' cannot decrease");
    }
    sum_.fetch_add(n, std::memory_order_relaxed);
}

bool Counter::Supports(Aggregation::Kind kind) const {
    return kind == Aggregation::Kind::Count || kind == Aggregation::Kind::Rate;
}

double Counter::Compute(const Aggregation& agg, double elapsed_seconds) const {
    double count = static_cast<double>(Value());
    if (agg.kind == Aggregation::Kind::Rate) {
        return elapsed_seconds > 0.0 ? count / elapsed_seconds : kNaN;
    }
    return count;
}

std::vector<Aggregation> Counter::SummaryAggregations() const {
    return {make(Aggregation::Kind::Count), make(Aggregation::Kind::Rate)};
}

// --- Gauge ---

void Gauge::Set(long long value) {
    value_.store(value, std::memory_order_relaxed);

    bool first = !written_.exchange(true);
    if (first) {
        min_.store(value);
        max_.store(value);
        return;
    }

    long long seen = min_.load();
    while (value < seen && !min_.compare_exchange_weak(seen, value)) {
    }
    seen = max_.load();
    while (value > seen && !max_.compare_exchange_weak(seen, value)) {
    }
}

bool Gauge::Supports(Aggregation::Kind kind) const {
    return kind == Aggregation::Kind::Value || kind == Aggregation::Kind::Min ||
           kind == Aggregation::Kind::Max;
}

double Gauge::Compute(const Aggregation& agg, double /*elapsed_seconds*/) const {
    if (Empty()) return kNaN;
    switch (agg.kind) {
        case Aggregation::Kind::Min: return static_cast<double>(Min());
        case Aggregation::Kind::Max: return static_cast<double>(Max());
        default: return static_cast<double>(Value());
    }
}

std::vector<Aggregation> Gauge::SummaryAggregations() const {
    return {make(Aggregation::Kind::Value), make(Aggregation::Kind::Min), make(Aggregation::Kind::Max)};
}

// --- Rate ---

void Rate::Add(bool value) {
    // Total is bumped before the release on trues_; readers acquire trues_
    // first, so they never see more trues than total.
    total_.fetch_add(1, std::memory_order_relaxed);
    if (value) trues_.fetch_add(1, std::memory_order_release);
}

double Rate::Value() const {
    long long passes = Passes();
    long long total = Total();
    if (total == 0) return kNaN;
    return static_cast<double>(passes) / static_cast<double>(total);
}

bool Rate::Supports(Aggregation::Kind kind) const {
    return kind == Aggregation::Kind::Rate;
}

double Rate::Compute(const Aggregation& /*agg*/, double /*elapsed_seconds*/) const {
    return Value();
}

std::vector<Aggregation> Rate::SummaryAggregations() const {
    return {make(Aggregation::Kind::Rate)};
}

// --- Trend ---

void Trend::Add(double sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(sample);
    sum_ += sample;
}

size_t Trend::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

double Trend::Mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) return kNaN;
    return sum_ / static_cast<double>(samples_.size());
}

double Trend::Min() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) return kNaN;
    return *std::min_element(samples_.begin(), samples_.end());
}

double Trend::Max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) return kNaN;
    return *std::max_element(samples_.begin(), samples_.end());
}

double Trend::Percentile(double p) const {
    if (!(p >= 0.0 && p <= 100.0)) {
        throw std::out_of_range("Percentile must be within [0, 100]");
    }
    auto sorted = SortedSamples();
    if (sorted.empty()) return kNaN;
    return percentile_of_sorted(sorted, p);
}

std::vector<double> Trend::SortedSamples() const {
    std::vector<double> copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = samples_;
    }
    std::sort(copy.begin(), copy.end());
    return copy;
}

bool Trend::Supports(Aggregation::Kind kind) const {
    return kind == Aggregation::Kind::Avg || kind == Aggregation::Kind::Min ||
           kind == Aggregation::Kind::Max || kind == Aggregation::Kind::Med ||
           kind == Aggregation::Kind::Percentile;
}

double Trend::Compute(const Aggregation& agg, double /*elapsed_seconds*/) const {
    switch (agg.kind) {
        case Aggregation::Kind::Avg: return Mean();
        case Aggregation::Kind::Min: return Min();
        case Aggregation::Kind::Max: return Max();
        case Aggregation::Kind::Med: return Percentile(50.0);
        default: return Percentile(agg.percentile);
    }
}

std::vector<Aggregation> Trend::SummaryAggregations() const {
    return {make(Aggregation::Kind::Avg), make(Aggregation::Kind::Min), make(Aggregation::Kind::Med),
            make(Aggregation::Kind::Max), make(Aggregation::Kind::Percentile, 90.0),
            make(Aggregation::Kind::Percentile, 95.0)};
}
