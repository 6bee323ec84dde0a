#include <string>
#include <iostream>

#include "target_server.hpp"
#include "TargetDefaults.h"

int main(int argc, char* argv[])
{
    if (argc > 5) {
        std::cerr << "Usage: " << argv[0]
                  << " [port] [threads] [extra_latency_ms] [failure_ratio]\n"
                  << "Example: " << argv[0] << " 8080 16 50 0.5\n";
        return 1;
    }

    TargetBehavior behavior;
    int port = target_defaults::kPort;

    try {
        if (argc > 1) port = std::stoi(argv[1]);
        if (argc > 2) behavior.thread_count = std::stoi(argv[2]);
        if (argc > 3) behavior.extra_latency_ms = std::stoi(argv[3]);
        if (argc > 4) behavior.failure_ratio = std::stod(argv[4]);

        TargetServer svr(behavior);

        std::cout << "[target] threads=" << behavior.thread_count
                  << " extra_latency_ms=" << behavior.extra_latency_ms
                  << " failure_ratio=" << behavior.failure_ratio << std::endl;

        return svr.Listen("0.0.0.0", port) == 0 ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }
}
