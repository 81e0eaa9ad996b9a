#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the fallback core.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (YAML) in production deployments.
 */

#include <cstdint>

namespace reroute::config::constants {

// =====================
// Orchestrator Defaults
// =====================
inline constexpr bool     FALLBACK_ENABLED_DEFAULT        = true;   ///< Fallback routing on at startup
inline constexpr uint32_t FALLBACK_MAX_ATTEMPTS           = 3;      ///< Route executors tried per context
inline constexpr uint32_t FALLBACK_DELAY_MS               = 1000;   ///< Pause before each attempt
inline constexpr bool     FALLBACK_EMERGENCY_MODE         = false;  ///< Emergency route armed at startup
inline constexpr double   FALLBACK_QUALITY_THRESHOLD      = 0.7;    ///< Minimum acceptable quality score
inline constexpr bool     FALLBACK_ENFORCE_QUALITY        = false;  ///< Treat low-quality success as failure
inline constexpr bool     FALLBACK_INSTALL_DEFAULT_ROUTES = true;   ///< Seed built-in provider/agent/emergency routes

// =====================
// Route Scoring
// =====================
inline constexpr double   ROUTE_SUCCESS_EMA_ALPHA         = 0.1;    ///< Weight of the newest outcome

// =====================
// Circuit Breaker Defaults
// =====================
inline constexpr uint32_t BREAKER_PROVIDER_FAILURE_THRESHOLD = 5;     ///< Failures before a target opens
inline constexpr uint32_t BREAKER_AGENT_FAILURE_THRESHOLD    = 3;     ///< Same, for agent routes
inline constexpr uint32_t BREAKER_COOLDOWN_MS                = 60000; ///< open -> half-open after this long

// =====================
// Health Monitor Defaults
// =====================
inline constexpr uint32_t HEALTH_CHECK_INTERVAL_MS        = 30000;  ///< Probe round period
inline constexpr double   HEALTH_RESPONSE_EMA_PREV_WEIGHT = 0.8;    ///< averageResponseTime smoothing
inline constexpr double   HEALTH_SUCCESS_EMA_ALPHA        = 0.1;    ///< successRate smoothing
inline constexpr double   HEALTH_INITIAL_SUCCESS_RATE     = 0.95;   ///< First-seen provider assumption
inline constexpr double   HEALTH_INITIAL_ERROR_RATE       = 0.05;   ///< 1 - initial success rate

// =====================
// Emergency Response
// =====================
inline constexpr const char* EMERGENCY_TARGET             = "emergency";
inline constexpr const char* EMERGENCY_ROUTE_ID           = "emergency-simple-response";
inline constexpr int32_t     EMERGENCY_ROUTE_PRIORITY     = 10;     ///< Tried after every regular route
inline constexpr double      EMERGENCY_QUALITY_SCORE      = 0.3;    ///< Degraded canned payload

} // namespace reroute::config::constants
