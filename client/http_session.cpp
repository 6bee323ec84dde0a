#include "http_session.hpp"

#include <future>

RequestSpec RequestSpec::Get(std::string path, Expectation expect) {
    RequestSpec spec;
    spec.method = HttpMethod::Get;
    spec.path = std::move(path);
    spec.expect = expect;
    return spec;
}

RequestSpec RequestSpec::PostJson(std::string path, std::string body, Expectation expect) {
    RequestSpec spec;
    spec.method = HttpMethod::Post;
    spec.path = std::move(path);
    spec.body = std::move(body);
    spec.content_type = "application/json";
    spec.expect = expect;
    return spec;
}

HttpSession::HttpSession(const std::string& base_url, MetricRegistry& metrics,
                         std::chrono::milliseconds timeout)
    : metrics_(metrics), timeout_(timeout)
{
    // Split "http://host:port/prefix" into origin and path prefix
    auto scheme_end = base_url.find("://");
    auto path_start = base_url.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
    if (path_start == std::string::npos) {
        origin_ = base_url;
    } else {
        origin_ = base_url.substr(0, path_start);
        path_prefix_ = base_url.substr(path_start);
        while (!path_prefix_.empty() && path_prefix_.back() == '/') {
            path_prefix_.pop_back();
        }
    }
}

httplib::Client& HttpSession::ClientAt(size_t index) {
    while (clients_.size() <= index) {
        auto cli = std::make_unique<httplib::Client>(origin_);
        cli->set_keep_alive(true);
        cli->set_tcp_nodelay(true);

        auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout_);
        auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout_ - secs);
        cli->set_connection_timeout(secs.count(), usecs.count());
        cli->set_read_timeout(secs.count(), usecs.count());
        cli->set_write_timeout(secs.count(), usecs.count());

        clients_.push_back(std::move(cli));
    }
    return *clients_[index];
}

RequestOutcome HttpSession::Send(const RequestSpec& spec) {
    RequestOutcome outcome = Perform(ClientAt(0), spec);
    Record(outcome);
    return outcome;
}

std::vector<RequestOutcome> HttpSession::SendBatch(const std::vector<RequestSpec>& specs) {
    // Connections are created up front, on this thread
    for (size_t i = 0; i < specs.size(); ++i) {
        ClientAt(i);
    }

    std::vector<std::future<RequestOutcome>> pending;
    pending.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        httplib::Client* cli = clients_[i].get();
        const RequestSpec* spec = &specs[i];
        pending.push_back(std::async(std::launch::async, [this, cli, spec]() {
            return Perform(*cli, *spec);
        }));
    }

    std::vector<RequestOutcome> outcomes;
    outcomes.reserve(specs.size());
    for (auto& f : pending) {
        outcomes.push_back(f.get());
        Record(outcomes.back());
    }
    return outcomes;
}

RequestOutcome HttpSession::Perform(httplib::Client& cli, const RequestSpec& spec) {
    std::string path = path_prefix_ + spec.path;

    auto start_time = std::chrono::steady_clock::now();

    httplib::Result res;
    switch (spec.method) {
        case HttpMethod::Get:
            res = cli.Get(path);
            break;
        case HttpMethod::Post:
            res = cli.Post(path, spec.body, spec.content_type);
            break;
    }

    auto end_time = std::chrono::steady_clock::now();

    RequestOutcome outcome;
    outcome.elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    outcome.expected_error = spec.expect == Expectation::Error;
    if (res) {
        outcome.status = res->status;
        outcome.body_length = res->body.size();
    } else {
        outcome.error = httplib::to_string(res.error());
    }
    return outcome;
}

void HttpSession::Record(const RequestOutcome& outcome) {
    bool got_response = outcome.status != 0;
    bool failed;
    if (!got_response) {
        failed = true;
    } else if (outcome.expected_error) {
        failed = outcome.status < 400;
    } else {
        failed = outcome.status >= 400;
    }

    metrics_.HttpReqs().Add(1);
    metrics_.HttpReqDuration().Add(outcome.elapsed_ms);
    metrics_.HttpReqFailed().Add(failed);
    metrics_.DataReceived().Add(static_cast<long long>(outcome.body_length));
}
