#pragma once

#include <functional>
#include <random>
#include <string>
#include <vector>

#include "http_session.hpp"
#include "metrics/registry.hpp"

/**
 * @brief A named boolean assertion over a response. Tallied, never fatal.
 */
struct NamedCheck {
    std::string name;
    std::function<bool(const RequestOutcome&)> predicate;
};

NamedCheck status_is(int status);
NamedCheck status_in(std::vector<int> statuses, std::string name);
NamedCheck status_at_least(int status, std::string name);
NamedCheck has_body(std::string name = "response has body");

/**
 * @brief Everything one VU iteration may touch: its own HTTP session and
 * random generator, plus the shared metric registry.
 */
class VuContext {
public:
    VuContext(int vu_id, HttpSession& http, MetricRegistry& metrics, std::mt19937& gen)
        : vu_id_(vu_id), http_(http), metrics_(metrics), gen_(gen) {}

    int VuId() const { return vu_id_; }
    long long Iteration() const { return iteration_; }
    void NextIteration() { ++iteration_; }

    HttpSession& Http() { return http_; }
    MetricRegistry& Metrics() { return metrics_; }
    std::mt19937& Rng() { return gen_; }

    /**
     * @brief Runs every check against the outcome, records each result in
     * the `checks` rate and in the per-check tally.
     * @return true if all checks passed.
     */
    bool Check(const RequestOutcome& outcome, const std::vector<NamedCheck>& checks);

    int UniformInt(int lo, int hi);        // [lo, hi]
    double UniformReal(double lo, double hi); // [lo, hi)

private:
    int vu_id_;
    long long iteration_ = 0;
    HttpSession& http_;
    MetricRegistry& metrics_;
    std::mt19937& gen_;
};
