// apps/probe_tool/src/main.cpp
// reroute probe_tool
// Purpose: Standalone helper that runs the provider health monitor for N rounds
// and prints the resulting health table. This is NOT the fallback core, it is a
// demo/testing utility for the monitor's bookkeeping.
//
// Usage:
//   ./probe_tool [rounds] [provider...]
//
// Notes:
// - Probes are simulated (randomized RTT, ~15% failures).
// - Rounds run synchronously through tick(); no background thread.

#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "reroute/health/health_monitor.hpp"
#include "reroute/obs/observability.hpp"

namespace {

class RandomProbe final : public reroute::health::HealthProbe {
public:
    reroute::health::ProbeResult probe(const std::string&) override {
        return {fail_(rng_) > 0.15, static_cast<double>(rtt_(rng_))};
    }

private:
    std::mt19937 rng_{std::random_device{}()};
    std::uniform_int_distribution<int> rtt_{10, 50}; // Simulated RTT (ms)
    std::uniform_real_distribution<double> fail_{0.0, 1.0};
};

} // namespace

int main(int argc, char** argv) {
    using namespace reroute;

    int rounds = 5;
    if (argc > 1) {
        try {
            rounds = std::stoi(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "probe_tool: rounds must be an integer, got '" << argv[1] << "'\n";
            return 1;
        }
    }

    health::MonitorConfig cfg;
    if (argc > 2) cfg.providers.assign(argv + 2, argv + argc);

    std::cout << "reroute probe_tool starting" << std::endl;
    std::cout << "Providers: " << cfg.providers.size() << ", rounds: " << rounds << std::endl;

    health::ProviderHealthMonitor mon(cfg, std::make_shared<RandomProbe>(), os::steady_clock(),
                                      obs::make_log_observer(obs::LogLevel::Warn));
    for (int i = 0; i < rounds; ++i) mon.tick();

    std::cout << std::left << std::setw(14) << "provider" << std::setw(9) << "healthy"
              << std::setw(10) << "success" << std::setw(10) << "avg_ms" << "streak" << '\n';
    for (const auto& [id, h] : mon.snapshot()) {
        std::cout << std::left << std::setw(14) << id
                  << std::setw(9) << (h.is_healthy ? "yes" : "no")
                  << std::fixed << std::setprecision(3) << std::setw(10) << h.success_rate
                  << std::setprecision(1) << std::setw(10) << h.average_response_time_ms
                  << h.consecutive_failures << '\n';
    }

    std::cout << "probe_tool finished" << std::endl;
    return 0;
}
