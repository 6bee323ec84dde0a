#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

#include "target_server.hpp"

// Target service listening on an ephemeral localhost port for the
// lifetime of the object.
class RunningTarget {
public:
    explicit RunningTarget(TargetBehavior behavior = TargetBehavior()) : server_(behavior) {
        port_ = server_.BindToAnyPort("127.0.0.1");
        if (port_ <= 0) {
            throw std::runtime_error("Could not bind the target service");
        }
        thread_ = std::thread([this] { server_.ListenAfterBind(); });

        for (int i = 0; i < 400 && !server_.IsRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!server_.IsRunning()) {
            server_.Stop();
            thread_.join();
            throw std::runtime_error("Target service did not start");
        }
    }

    ~RunningTarget() {
        server_.Stop();
        if (thread_.joinable()) thread_.join();
    }

    RunningTarget(const RunningTarget&) = delete;
    RunningTarget& operator=(const RunningTarget&) = delete;

    int Port() const { return port_; }
    std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }
    TargetServer& Server() { return server_; }

private:
    TargetServer server_;
    int port_ = 0;
    std::thread thread_;
};
