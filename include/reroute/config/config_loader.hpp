#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden from a YAML document.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <string>
#include <vector>

#include "reroute/compat/expected.hpp"
#include "reroute/health/health_monitor.hpp"
#include "reroute/obs/observability.hpp"
#include "reroute/routing/circuit_breaker.hpp"
#include "reroute/routing/fallback_orchestrator.hpp"
#include "reroute/routing/route.hpp"

namespace reroute::config {

    /** @struct RouterConfig
     *  @brief Aggregate of sub-configs required by the fallback core.
     */
    struct RouterConfig {
        reroute::routing::OrchestratorConfig fallback;    ///< Loop switches and budgets
        reroute::routing::BreakerConfig      breaker;     ///< Thresholds + cooldown
        reroute::health::MonitorConfig       health;      ///< Probe schedule and roster
        reroute::obs::LogLevel               log_level{reroute::obs::LogLevel::Info};
        std::vector<reroute::routing::RouteSpec> routes;  ///< Extra routes seeded at startup
    };

    /** @struct ConfigError
     *  @brief Why a configuration source was rejected.
     */
    struct ConfigError {
        enum class Code { FileNotFound, ParseError, InvalidValue };
        Code        code{Code::ParseError};
        std::string message;
    };

    template <class T>
    using Expected = reroute_detail::expected<T, ConfigError>;

    /** @class Loader
     *  @brief Source of router configuration (defaults or parsed YAML).
     *
     * Recognized top-level keys mirror the service options: enableFallbacks,
     * maxFallbackAttempts, fallbackDelay, providerFailureThreshold,
     * agentFailureThreshold, healthCheckInterval, emergencyMode, qualityThreshold,
     * circuitBreakerCooldown, enforceQualityThreshold, healthEventsOnTransitionOnly,
     * installDefaultRoutes, monitoredProviders, logLevel, routes. Missing keys keep
     * their defaults.
     */
    class Loader {
    public:
        /// Named defaults only.
        static RouterConfig defaults();

        /**
         * @brief Parse a YAML file.
         * @param path File to read.
         * @return RouterConfig, or FileNotFound / ParseError / InvalidValue.
         */
        static Expected<RouterConfig> load_from_file(const std::string& path);

        /// Parse YAML text (same schema as load_from_file).
        static Expected<RouterConfig> load_from_string(const std::string& yaml);
    };

} // namespace reroute::config
