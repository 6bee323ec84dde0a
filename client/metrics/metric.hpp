#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

enum class MetricType { Counter, Gauge, Rate, Trend };

const char* metric_type_name(MetricType type);

/**
 * @brief An aggregate that a threshold (or the summary) can ask a metric for.
 */
struct Aggregation {
    enum class Kind { Count, Rate, Value, Avg, Min, Max, Med, Percentile };

    Kind kind = Kind::Count;
    double percentile = 0.0; // only meaningful for Kind::Percentile

    std::string label() const;
};

/**
 * @brief Base class of every metric register.
 *
 * Registers are written concurrently by all VUs. Every write is a single
 * merge (atomic add, or an append under the register's own lock), so no
 * update is ever lost and registers never need to be locked together.
 */
class Metric {
public:
    explicit Metric(std::string name) : name_(std::move(name)) {}
    virtual ~Metric() = default;

    Metric(const Metric&) = delete;
    Metric& operator=(const Metric&) = delete;

    const std::string& Name() const { return name_; }

    virtual MetricType Type() const = 0;

    virtual bool Supports(Aggregation::Kind kind) const = 0;

    /**
     * @brief Computes an aggregate over the current state.
     * @param agg      A kind for which Supports() returned true.
     * @param elapsed_seconds Run time, used by per-second rates.
     * @return The value, or NaN if there are no observations.
     */
    virtual double Compute(const Aggregation& agg, double elapsed_seconds) const = 0;

    // Aggregates shown in the run summary, in display order.
    virtual std::vector<Aggregation> SummaryAggregations() const = 0;

private:
    std::string name_;
};

class Counter : public Metric {
public:
    using Metric::Metric;

    // Throws std::invalid_argument for negative n.
    void Add(long long n = 1);
    long long Value() const { return sum_.load(std::memory_order_relaxed); }

    MetricType Type() const override { return MetricType::Counter; }
    bool Supports(Aggregation::Kind kind) const override;
    double Compute(const Aggregation& agg, double elapsed_seconds) const override;
    std::vector<Aggregation> SummaryAggregations() const override;

private:
    std::atomic<long long> sum_{0};
};

class Gauge : public Metric {
public:
    using Metric::Metric;

    void Set(long long value);
    long long Value() const { return value_.load(std::memory_order_relaxed); }
    long long Min() const { return min_.load(std::memory_order_relaxed); }
    long long Max() const { return max_.load(std::memory_order_relaxed); }
    bool Empty() const { return !written_.load(std::memory_order_relaxed); }

    MetricType Type() const override { return MetricType::Gauge; }
    bool Supports(Aggregation::Kind kind) const override;
    double Compute(const Aggregation& agg, double elapsed_seconds) const override;
    std::vector<Aggregation> SummaryAggregations() const override;

private:
    std::atomic<long long> value_{0};
    std::atomic<long long> min_{0};
    std::atomic<long long> max_{0};
    std::atomic<bool> written_{false};
};

class Rate : public Metric {
public:
    using Metric::Metric;

    void Add(bool value);
    long long Passes() const { return trues_.load(std::memory_order_acquire); }
    long long Fails() const {
        long long passes = Passes();
        return Total() - passes;
    }
    long long Total() const { return total_.load(std::memory_order_relaxed); }

    // NaN while empty.
    double Value() const;

    MetricType Type() const override { return MetricType::Rate; }
    bool Supports(Aggregation::Kind kind) const override;
    double Compute(const Aggregation& agg, double elapsed_seconds) const override;
    std::vector<Aggregation> SummaryAggregations() const override;

private:
    std::atomic<long long> total_{0};
    std::atomic<long long> trues_{0};
};

class Trend : public Metric {
public:
    using Metric::Metric;

    void Add(double sample);

    size_t Count() const;
    double Mean() const;
    double Min() const;
    double Max() const;

    /**
     * @brief Linear interpolation between the closest ranks.
     * @param p Percentile in [0, 100]. p(0) is the minimum, p(100) the maximum.
     */
    double Percentile(double p) const;

    MetricType Type() const override { return MetricType::Trend; }
    bool Supports(Aggregation::Kind kind) const override;
    double Compute(const Aggregation& agg, double elapsed_seconds) const override;
    std::vector<Aggregation> SummaryAggregations() const override;

private:
    std::vector<double> SortedSamples() const;

    mutable std::mutex mutex_;
    std::vector<double> samples_;
    double sum_ = 0.0;
};
