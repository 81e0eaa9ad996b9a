#pragma once
/**
 * @file fallback_orchestrator.hpp
 * @brief Top-level fallback control loop and the public API of the core.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "reroute/config/constants.hpp"
#include "reroute/health/health_monitor.hpp"
#include "reroute/obs/metrics.hpp"
#include "reroute/obs/observability.hpp"
#include "reroute/os/clock.hpp"
#include "reroute/routing/circuit_breaker.hpp"
#include "reroute/routing/route.hpp"
#include "reroute/routing/route_executor.hpp"
#include "reroute/routing/route_registry.hpp"

namespace reroute::routing {

/** @struct OrchestratorConfig
 *  @brief Behaviour switches and budgets of the fallback loop.
 */
struct OrchestratorConfig {
    bool     enable_fallbacks{config::constants::FALLBACK_ENABLED_DEFAULT};        ///< Master switch
    uint32_t max_fallback_attempts{config::constants::FALLBACK_MAX_ATTEMPTS};      ///< Executors tried per context
    uint32_t fallback_delay_ms{config::constants::FALLBACK_DELAY_MS};              ///< Pause before each attempt
    bool     emergency_mode{config::constants::FALLBACK_EMERGENCY_MODE};           ///< Arms the emergency route
    double   quality_threshold{config::constants::FALLBACK_QUALITY_THRESHOLD};     ///< Minimum acceptable quality
    bool     enforce_quality_threshold{config::constants::FALLBACK_ENFORCE_QUALITY}; ///< Low quality = soft failure
    bool     install_default_routes{config::constants::FALLBACK_INSTALL_DEFAULT_ROUTES}; ///< Seed built-in routes
};

/** @class FallbackOrchestrator
 *  @brief Walks the applicable routes of a failed request until one succeeds.
 *
 * Coordinates RouteRegistry (candidates), CircuitBreakerManager (eligibility),
 * the per-type RouteExecutors (the actual call), MetricsAggregator and the
 * observer. It owns no shared state besides the two runtime switches; every
 * map lives in its component. execute_fallback() may run on many threads at
 * once; attempts inside one call are strictly sequential in priority order.
 */
class FallbackOrchestrator {
public:
    /// Collaborators. Null members are replaced by fresh defaults (health stays optional).
    struct Components {
        std::shared_ptr<RouteRegistry>                  registry;
        std::shared_ptr<CircuitBreakerManager>          breakers;
        std::shared_ptr<obs::MetricsAggregator>         metrics;
        std::shared_ptr<health::ProviderHealthMonitor>  health;
        ExecutorTable                                   executors;
        std::shared_ptr<os::Clock>                      clock;
        std::shared_ptr<obs::Observer>                  observer;
    };

    /**
     * @brief Wire the collaborators and optionally seed the built-in routes.
     * @throws std::invalid_argument if a built-in route has no executor for its type.
     */
    FallbackOrchestrator(OrchestratorConfig cfg, Components parts);

    // --------------------------- Route management ----------------------------
    /**
     * @brief Register or overwrite a route.
     * @throws std::invalid_argument when the route is malformed or its type has no executor.
     */
    void add_fallback_route(FallbackRoute route);

    /// Same, from a declarative RouteSpec. Unknown condition names throw std::invalid_argument.
    void add_fallback_route(const RouteSpec& spec);

    bool remove_fallback_route(std::string_view id);

    // --------------------------- Hot path ------------------------------------
    /**
     * @brief Try the applicable routes for a failed request.
     * @param ctx Failure context; `attempt` is incremented for every route tried.
     * @return Structured outcome. Business failures never throw.
     */
    FallbackResult execute_fallback(FallbackContext& ctx);

    // --------------------------- Runtime switches ----------------------------
    void set_fallback_enabled(bool enabled);
    void set_emergency_mode(bool enabled);
    [[nodiscard]] bool fallback_enabled() const noexcept { return enabled_.load(std::memory_order_acquire); }
    [[nodiscard]] bool emergency_mode() const noexcept { return emergency_->load(std::memory_order_acquire); }

    // --------------------------- Introspection -------------------------------
    [[nodiscard]] obs::Metrics get_metrics() const;
    [[nodiscard]] std::map<std::string, health::ProviderHealth> get_provider_health() const;
    [[nodiscard]] std::map<std::string, CircuitBreakerState> get_circuit_breaker_status() const;
    [[nodiscard]] std::map<std::string, FallbackRoute> get_fallback_routes() const;
    void reset_metrics();

    /// Current configuration (runtime switches included).
    [[nodiscard]] OrchestratorConfig config() const;

private:
    /// Executor call with exceptions folded into a failed outcome.
    ExecutionOutcome invoke(const FallbackRoute& route, const FallbackContext& ctx) const;

    /// Turns a low-quality success into a failure when enforcement is on.
    void apply_quality_gate(const FallbackRoute& route, ExecutionOutcome& outcome) const;

    /// Attempts allowed for this context (caller budget capped by configuration).
    uint32_t attempt_limit(const FallbackContext& ctx) const noexcept;

private:
    const OrchestratorConfig cfg_;
    std::atomic<bool> enabled_;
    std::shared_ptr<std::atomic<bool>> emergency_;

    std::shared_ptr<RouteRegistry>                 registry_;
    std::shared_ptr<CircuitBreakerManager>         breakers_;
    std::shared_ptr<obs::MetricsAggregator>        metrics_;
    std::shared_ptr<health::ProviderHealthMonitor> health_;
    ExecutorTable                                  executors_;
    std::shared_ptr<os::Clock>                     clock_;
    std::shared_ptr<obs::Observer>                 observer_;
};

} // namespace reroute::routing
