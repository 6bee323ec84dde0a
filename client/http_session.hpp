#pragma once

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "metrics/registry.hpp"

enum class HttpMethod { Get, Post };

// Whether a request is meant to succeed or is a designed negative test.
enum class Expectation { Success, Error };

/**
 * @brief One request to issue against the target, relative to the base URL.
 */
struct RequestSpec {
    HttpMethod method = HttpMethod::Get;
    std::string path;
    std::string body;
    std::string content_type;
    Expectation expect = Expectation::Success;

    static RequestSpec Get(std::string path, Expectation expect = Expectation::Success);
    static RequestSpec PostJson(std::string path, std::string body, Expectation expect = Expectation::Success);
};

/**
 * @brief Result of a single HTTP call. Status 0 means the call never got a
 * response (connection refused, timeout, ...); `error` then says why.
 */
struct RequestOutcome {
    int status = 0;
    size_t body_length = 0;
    double elapsed_ms = 0.0;
    bool expected_error = false;
    std::string error;
};

/**
 * @brief Per-VU HTTP client.
 *
 * Owns keep-alive connections to the target and records the built-in HTTP
 * metrics for every call. Not thread-safe: one session per VU. Batches run
 * their sub-requests on separate connections owned by the session.
 */
class HttpSession {
public:
    HttpSession(const std::string& base_url, MetricRegistry& metrics,
                std::chrono::milliseconds timeout = std::chrono::seconds(60));

    RequestOutcome Send(const RequestSpec& spec);

    // Issues every request concurrently and returns once all have completed,
    // outcomes in request order.
    std::vector<RequestOutcome> SendBatch(const std::vector<RequestSpec>& specs);

    const std::string& Origin() const { return origin_; }
    const std::string& PathPrefix() const { return path_prefix_; }

private:
    httplib::Client& ClientAt(size_t index);
    RequestOutcome Perform(httplib::Client& cli, const RequestSpec& spec);
    void Record(const RequestOutcome& outcome);

    std::string origin_;       // scheme://host:port
    std::string path_prefix_;  // path part of the base URL, without trailing '/'
    MetricRegistry& metrics_;
    std::chrono::milliseconds timeout_;
    std::vector<std::unique_ptr<httplib::Client>> clients_;
};
