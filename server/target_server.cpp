#include "target_server.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

namespace {

using json = nlohmann::json;

// Top-level "a" and "b" of a calculation body.
std::pair<double, double> operands(const std::string &body)
{
    json doc = json::parse(body);
    if (!doc.is_object()) {
        throw std::invalid_argument("body must be a JSON object");
    }

    auto number = [&doc](const char *key) {
        auto it = doc.find(key);
        if (it == doc.end() || !it->is_number()) {
            throw std::invalid_argument(std::string("missing numeric field '") + key + "'");
        }
        return it->get<double>();
    };
    return {number("a"), number("b")};
}

// Answers 400 and returns false when the body is not a valid calculation.
bool read_operands(const httplib::Request &req, httplib::Response &res, std::pair<double, double> &out)
{
    try
    {
        out = operands(req.body);
        return true;
    }
    catch (const json::exception &e)
    {
        res.status = 400;
        res.set_content(std::string("Invalid request body: ") + e.what(), "text/plain");
    }
    catch (const std::invalid_argument &e)
    {
        res.status = 400;
        res.set_content(std::string("Invalid request body: ") + e.what(), "text/plain");
    }
    return false;
}

void send_json(httplib::Response &res, int status, const json &body)
{
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_text(httplib::Response &res, int status, const std::string &text)
{
    res.status = status;
    res.set_content(text, "text/plain");
}

} // namespace

TargetServer::TargetServer(TargetBehavior config):
    behavior(config)
{
    if (behavior.thread_count <= 0) {
        throw std::invalid_argument("Thread count must be greater than 0");
    }
    if (behavior.failure_ratio < 0.0 || behavior.failure_ratio > 1.0) {
        throw std::invalid_argument("Failure ratio must be within [0, 1]");
    }

    int thread_count = behavior.thread_count;
    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(thread_count);
    };

    server.set_tcp_nodelay(true);

    server.Get("/", [this](const httplib::Request &req, httplib::Response &res) {
        Root(req, res);
    });
    server.Get(target_defaults::kHealthPath, [this](const httplib::Request &req, httplib::Response &res) {
        Health(req, res);
    });
    server.Post("/calculate/add", [this](const httplib::Request &req, httplib::Response &res) {
        Add(req, res);
    });
    server.Post("/calculate/divide", [this](const httplib::Request &req, httplib::Response &res) {
        Divide(req, res);
    });
    server.Get("/simulate/slow", [this](const httplib::Request &req, httplib::Response &res) {
        Slow(req, res);
    });
    server.Get("/simulate/error", [this](const httplib::Request &req, httplib::Response &res) {
        Error(req, res);
    });
    server.Get("/user/(\\d+)", [this](const httplib::Request &req, httplib::Response &res) {
        User(req, res);
    });
}

bool TargetServer::Simulate()
{
    if (behavior.extra_latency_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(behavior.extra_latency_ms));
    }

    long long n = ++served;
    if (behavior.failure_ratio <= 0.0) return false;

    auto before = static_cast<long long>(std::floor(static_cast<double>(n - 1) * behavior.failure_ratio));
    auto after = static_cast<long long>(std::floor(static_cast<double>(n) * behavior.failure_ratio));
    if (after > before) {
        injected_failures++;
        return true;
    }
    return false;
}

void TargetServer::Root(const httplib::Request & /*req*/, httplib::Response &res)
{
    if (Simulate()) {
        send_text(res, 500, "Injected failure");
        return;
    }

    std::stringstream ss;
    ss << "Available endpoints:" << std::endl;
    ss << "  GET  /health" << std::endl;
    ss << "  POST /calculate/add" << std::endl;
    ss << "  POST /calculate/divide" << std::endl;
    ss << "  GET  /simulate/slow" << std::endl;
    ss << "  GET  /simulate/error" << std::endl;
    ss << "  GET  /user/:id" << std::endl;
    ss << "served:" << served.load() << std::endl;
    ss << "injectedFailures:" << injected_failures.load() << std::endl;
    send_text(res, 200, ss.str());
}

void TargetServer::Health(const httplib::Request & /*req*/, httplib::Response &res)
{
    send_json(res, 200, {{"status", "healthy"}, {"service", "loadharness-target"}});
}

void TargetServer::Add(const httplib::Request &req, httplib::Response &res)
{
    if (Simulate()) {
        send_text(res, 500, "Injected failure");
        return;
    }

    std::pair<double, double> ab;
    if (!read_operands(req, res, ab)) return;

    send_json(res, 200, {{"result", ab.first + ab.second}, {"operation", "addition"}});
}

void TargetServer::Divide(const httplib::Request &req, httplib::Response &res)
{
    if (Simulate()) {
        send_text(res, 500, "Injected failure");
        return;
    }

    std::pair<double, double> ab;
    if (!read_operands(req, res, ab)) return;

    if (ab.second == 0.0) {
        send_text(res, 400, "Cannot divide by zero");
        return;
    }

    send_json(res, 200, {{"result", ab.first / ab.second}, {"operation", "division"}});
}

void TargetServer::Slow(const httplib::Request & /*req*/, httplib::Response &res)
{
    if (Simulate()) {
        send_text(res, 500, "Injected failure");
        return;
    }

    auto start = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(behavior.slow_route_ms));
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    send_json(res, 200, {{"message", "Slow operation completed"}, {"duration_seconds", seconds}});
}

void TargetServer::Error(const httplib::Request & /*req*/, httplib::Response &res)
{
    // Fails regardless; still delayed and counted
    Simulate();
    send_text(res, 500, "Simulated error occurred");
}

void TargetServer::User(const httplib::Request &req, httplib::Response &res)
{
    if (Simulate()) {
        send_text(res, 500, "Injected failure");
        return;
    }

    long long id = 0;
    try
    {
        id = std::stoll(req.matches[1].str());
    }
    catch (const std::logic_error &)
    {
        send_text(res, 400, "Invalid user id");
        return;
    }

    // Simulated database lookup
    std::this_thread::sleep_for(std::chrono::milliseconds(behavior.user_lookup_ms));

    send_json(res, 200, {{"id", id},
                         {"name", "User " + std::to_string(id)},
                         {"email", "user" + std::to_string(id) + "@example.com"}});
}

int TargetServer::Listen(const std::string &host, int port)
{
    std::cout << "[target] Starting server on http://" << host << ":" << port << std::endl;
    if (!server.listen(host, port))
    {
        std::cerr << "[target] Failed to start server!" << std::endl;
        return -1;
    }
    return 0;
}

int TargetServer::BindToAnyPort(const std::string &host)
{
    return server.bind_to_any_port(host);
}

bool TargetServer::ListenAfterBind()
{
    return server.listen_after_bind();
}

bool TargetServer::IsRunning() const
{
    return server.is_running();
}

void TargetServer::Stop()
{
    server.stop();
}
