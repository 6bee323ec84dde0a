#pragma once

#include <httplib.h>

#include <atomic>
#include <string>

#include "TargetDefaults.h"

/**
 * @brief Tunables of the target service.
 *
 * `extra_latency_ms` is added to every route except /health.
 * `failure_ratio` in [0, 1]: the n-th non-health request answers 500 when
 * floor(n * ratio) advances, so 0.5 fails every second request.
 */
struct TargetBehavior {
    int thread_count = 10;
    int extra_latency_ms = 0;
    double failure_ratio = 0.0;
    int slow_route_ms = target_defaults::kSlowRouteMs;
    int user_lookup_ms = target_defaults::kUserLookupMs;
};

class TargetServer
{
    httplib::Server server;
    TargetBehavior behavior;

    std::atomic<long long> served{0};
    std::atomic<long long> injected_failures{0};

public:
    explicit TargetServer(TargetBehavior config = TargetBehavior());

    void Root(const httplib::Request &req, httplib::Response &res);
    void Health(const httplib::Request &req, httplib::Response &res);
    void Add(const httplib::Request &req, httplib::Response &res);
    void Divide(const httplib::Request &req, httplib::Response &res);
    void Slow(const httplib::Request &req, httplib::Response &res);
    void Error(const httplib::Request &req, httplib::Response &res);
    void User(const httplib::Request &req, httplib::Response &res);

    // Blocks until Stop().
    int Listen(const std::string &host, int port);

    // For in-process use: bind first, then serve on another thread.
    int BindToAnyPort(const std::string &host);
    bool ListenAfterBind();
    bool IsRunning() const;
    void Stop();

    long long Served() const { return served.load(); }
    long long InjectedFailures() const { return injected_failures.load(); }

private:
    // Applies latency and failure injection; true when the request must fail.
    bool Simulate();
};
