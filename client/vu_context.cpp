#include "vu_context.hpp"

#include <algorithm>

NamedCheck status_is(int status) {
    return NamedCheck{"status is " + std::to_string(status),
                      [status](const RequestOutcome& r) { return r.status == status; }};
}

NamedCheck status_in(std::vector<int> statuses, std::string name) {
    return NamedCheck{std::move(name), [statuses](const RequestOutcome& r) {
                          return std::find(statuses.begin(), statuses.end(), r.status) != statuses.end();
                      }};
}

NamedCheck status_at_least(int status, std::string name) {
    return NamedCheck{std::move(name), [status](const RequestOutcome& r) { return r.status >= status; }};
}

NamedCheck has_body(std::string name) {
    return NamedCheck{std::move(name), [](const RequestOutcome& r) { return r.body_length > 0; }};
}

bool VuContext::Check(const RequestOutcome& outcome, const std::vector<NamedCheck>& checks) {
    bool all_passed = true;
    for (const auto& check : checks) {
        bool ok = check.predicate(outcome);
        metrics_.Checks().Add(ok);
        metrics_.CheckTally(check.name).Add(ok);
        all_passed = all_passed && ok;
    }
    return all_passed;
}

int VuContext::UniformInt(int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(gen_);
}

double VuContext::UniformReal(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(gen_);
}
