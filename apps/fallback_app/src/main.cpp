/**
 * @file main.cpp
 * @brief fallback_app: wires the fallback core from configuration and replays a failure scenario.
 *
 * **Bootstrap**
 * - Load config (YAML path as argv[1], otherwise named defaults).
 * - Construct registry, breakers, metrics, health monitor and orchestrator; seed routes.
 *
 * **Scenario**
 * - Simulated executors succeed with probability equal to the route's current success rate.
 * - Replays provider and agent failures, then flips emergency mode for the last round.
 *
 * **Observability & lifecycle**
 * - JSON-line event log at the configured level; metrics and breaker table on exit.
 */

#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include "reroute/config/config_loader.hpp"
#include "reroute/health/health_monitor.hpp"
#include "reroute/obs/observability.hpp"
#include "reroute/routing/fallback_orchestrator.hpp"
#include "reroute/version.hpp"

namespace {

using namespace reroute;

/// Executor that rolls a die against the route's success rate.
class SimulatedExecutor final : public routing::RouteExecutor {
public:
    explicit SimulatedExecutor(std::uint32_t seed) : rng_(seed) {}

    routing::ExecutionOutcome execute(const routing::FallbackRoute& route,
                                      const routing::FallbackContext& ctx) override {
        double roll;
        {
            std::lock_guard<std::mutex> lk(mu_);
            roll = dist_(rng_);
        }
        routing::ExecutionOutcome out;
        if (roll < route.success_rate) {
            out.success = true;
            out.data["response"] = "answer for " + ctx.request_id + " from " + route.target;
            out.quality_score = 0.6 + 0.4 * roll;
        } else {
            out.error = routing::FallbackError{"PROVIDER_UNAVAILABLE", 503,
                                               route.target + " did not answer", {}};
        }
        return out;
    }

private:
    std::mutex mu_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

/// Probe with a randomized response time and an occasional outage.
class SimulatedProbe final : public health::HealthProbe {
public:
    health::ProbeResult probe(const std::string&) override {
        std::lock_guard<std::mutex> lk(mu_);
        return health::ProbeResult{outage_(rng_) > 0.1, rtt_(rng_)};
    }

private:
    std::mutex mu_;
    std::mt19937 rng_{std::random_device{}()};
    std::uniform_real_distribution<double> rtt_{40.0, 400.0};
    std::uniform_real_distribution<double> outage_{0.0, 1.0};
};

routing::FallbackContext provider_failure(int n, const char* provider) {
    routing::FallbackContext ctx;
    ctx.request_id = "req-" + std::to_string(n);
    ctx.original_provider = provider;
    ctx.error = routing::FallbackError{"PROVIDER_TIMEOUT", 504, "upstream timed out", {}};
    return ctx;
}

routing::FallbackContext agent_failure(int n, const char* agent) {
    routing::FallbackContext ctx;
    ctx.request_id = "req-" + std::to_string(n);
    ctx.original_agent = agent;
    ctx.error = routing::FallbackError{"MODEL_OVERLOADED", 529, "model overloaded", agent};
    return ctx;
}

void print_report(const routing::FallbackOrchestrator& fo) {
    const auto m = fo.get_metrics();
    std::cout << "\nmetrics\n"
              << "  total=" << m.total_fallbacks
              << " ok=" << m.successful_fallbacks
              << " failed=" << m.failed_fallbacks
              << " provider_switches=" << m.provider_switches
              << " agent_switches=" << m.agent_switches
              << " emergency=" << m.emergency_activations
              << " avg_ms=" << std::fixed << std::setprecision(1) << m.average_fallback_time_ms << '\n';
    for (const auto& [id, n] : m.routes_used) {
        std::cout << "  route " << std::left << std::setw(28) << id << n << '\n';
    }

    std::cout << "circuit breakers\n";
    for (const auto& [target, st] : fo.get_circuit_breaker_status()) {
        std::cout << "  " << std::left << std::setw(18) << target
                  << routing::to_string(st.state) << " failures=" << st.failures << '\n';
    }

    std::cout << "routes\n";
    for (const auto& [id, r] : fo.get_fallback_routes()) {
        std::cout << "  " << std::left << std::setw(28) << id
                  << std::setprecision(3) << r.success_rate << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    using namespace reroute;

    auto loaded = (argc > 1) ? config::Loader::load_from_file(argv[1])
                             : config::Expected<config::RouterConfig>(config::Loader::defaults());
    if (!loaded) {
        std::cerr << "config error: " << loaded.error().message << '\n';
        return EXIT_FAILURE;
    }
    auto cfg = std::move(*loaded);
    // The demo replays many requests; a real pause per attempt would only slow it down.
    if (argc <= 1) cfg.fallback.fallback_delay_ms = 0;

    std::cout << "reroute " << reroute::version_string << " fallback_app\n";

    auto bus = std::make_shared<obs::EventBus>();
    (void)bus->subscribe(obs::make_log_observer(cfg.log_level));

    auto clock = os::steady_clock();
    auto monitor = std::make_shared<health::ProviderHealthMonitor>(
        cfg.health, std::make_shared<SimulatedProbe>(), clock, bus);

    routing::FallbackOrchestrator::Components parts;
    parts.breakers = std::make_shared<routing::CircuitBreakerManager>(cfg.breaker, clock, bus);
    parts.health = monitor;
    parts.executors.bind(routing::RouteType::Provider, std::make_shared<SimulatedExecutor>(1))
                   .bind(routing::RouteType::Agent,    std::make_shared<SimulatedExecutor>(2))
                   .bind(routing::RouteType::Endpoint, std::make_shared<SimulatedExecutor>(3))
                   .bind(routing::RouteType::Model,    std::make_shared<SimulatedExecutor>(4));
    parts.clock = clock;
    parts.observer = bus;

    try {
        routing::FallbackOrchestrator fo(cfg.fallback, std::move(parts));
        for (const auto& spec : cfg.routes) fo.add_fallback_route(spec);

        monitor->tick(); // one synchronous round so the report has data
        (void)monitor->start();

        const char* providers[] = {"openai", "claude", "gemini"};
        const char* agents[] = {"gpt-4", "claude-3-sonnet"};
        int n = 0;
        for (int round = 0; round < 4; ++round) {
            for (const char* p : providers) {
                auto ctx = provider_failure(++n, p);
                (void)fo.execute_fallback(ctx);
            }
            for (const char* a : agents) {
                auto ctx = agent_failure(++n, a);
                (void)fo.execute_fallback(ctx);
            }
        }

        fo.set_emergency_mode(true);
        auto ctx = provider_failure(++n, "unlisted-provider");
        const auto res = fo.execute_fallback(ctx);
        std::cout << "emergency round: success=" << std::boolalpha << res.success << '\n';
        fo.set_emergency_mode(false);

        monitor->stop();
        print_report(fo);
    } catch (const std::exception& e) {
        std::cerr << "fallback_app: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
