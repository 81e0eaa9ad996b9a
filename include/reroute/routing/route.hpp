#pragma once
/**
 * @file route.hpp
 * @brief Fallback route model shared across registry, breaker, executors and orchestrator.
 *
 * Defines the closed set of route types, the route rule itself, the mutable
 * per-request context handed to every condition and executor, and the
 * structured result returned by the orchestrator. Centralizing these types
 * keeps copies consistent across modules (routes are always passed by value
 * out of the registry).
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "reroute/os/clock.hpp"

namespace reroute::routing {

/**
 * @enum RouteType
 * @brief What kind of alternative a route switches to. Dispatch key for executors.
 */
enum class RouteType : std::uint8_t {
    Provider = 0, ///< Another upstream AI provider
    Agent,        ///< Another agent / assistant profile
    Endpoint,     ///< Another endpoint (including the emergency responder)
    Model         ///< Another model variant on the same provider
};

/// Number of RouteType enumerators (size of per-type tables).
inline constexpr std::size_t kRouteTypeCount = 4;

/// Stable lowercase name ("provider", "agent", "endpoint", "model").
std::string_view to_string(RouteType t) noexcept;

/// Parse a lowercase name; std::nullopt when unknown.
std::optional<RouteType> parse_route_type(std::string_view s) noexcept;

/// Open key/value map used for metadata and opaque payloads.
using Attributes = std::map<std::string, std::string>;

/**
 * @struct FallbackError
 * @brief Description of a failed call (the primary one or a fallback attempt).
 */
struct FallbackError {
    std::string code;    ///< Machine-readable code, e.g. "PROVIDER_TIMEOUT"
    int         status{0}; ///< Upstream HTTP-like status, 0 when not applicable
    std::string message; ///< Human-readable message
    std::string model;   ///< Model implicated in the failure, empty when none

    bool operator==(const FallbackError&) const = default;
};

struct FallbackContext;

/// Applicability predicate. Must be pure; an empty function means "always".
using RouteCondition = std::function<bool(const FallbackContext&)>;

/**
 * @struct FallbackRoute
 * @brief A rule mapping a failing source to an alternate target.
 */
struct FallbackRoute {
    std::string    id;                 ///< Globally unique route identifier
    RouteType      type{RouteType::Provider}; ///< Executor selection
    std::int32_t   priority{0};        ///< Smaller is tried earlier
    std::string    source;             ///< Exact provider/agent/endpoint, or "*"
    std::string    target;             ///< Alternative to try; circuit breaker key
    RouteCondition condition;          ///< Extra applicability predicate
    bool           enabled{true};      ///< Disabled routes are never candidates
    double         success_rate{1.0};  ///< EMA of attempt outcomes in [0,1]
    os::Clock::time_point last_used{}; ///< Last successful use (epoch when never)
    Attributes     metadata;           ///< Free-form annotations
};

/**
 * @struct RouteSpec
 * @brief Declarative form of a route (condition referenced by name), e.g. from config.
 */
struct RouteSpec {
    std::string  id;
    RouteType    type{RouteType::Provider};
    std::int32_t priority{0};
    std::string  source{"*"};
    std::string  target;
    std::string  condition{"always"}; ///< See conditions::by_name()
    bool         enabled{true};
    double       success_rate{1.0};
    Attributes   metadata;
};

/**
 * @struct FallbackContext
 * @brief Why the primary call failed and how far the fallback chain has progressed.
 * @note Mutated in place by the orchestrator: `attempt` is incremented per tried route.
 */
struct FallbackContext {
    std::string                request_id;
    std::optional<std::string> original_provider;
    std::optional<std::string> original_agent;
    std::optional<std::string> original_endpoint;
    FallbackError              error;            ///< The failure that triggered the fallback
    std::uint32_t              attempt{0};       ///< Attempts already made
    std::uint32_t              max_attempts{0};  ///< Caller's own attempt budget
    std::optional<double>      quality;          ///< Desired quality hint
    std::optional<std::chrono::milliseconds> timeout; ///< Overall deadline for the fallback chain
    std::optional<std::string> user_id;
    Attributes                 metadata;
};

/**
 * @struct ExecutionOutcome
 * @brief What a RouteExecutor reports for one attempt.
 */
struct ExecutionOutcome {
    bool                  success{false};
    Attributes            data;          ///< Payload on success
    std::optional<double> quality_score; ///< Executor's own quality estimate
    FallbackError         error;         ///< Failure description when !success
};

/**
 * @struct FallbackResult
 * @brief Structured outcome of one executeFallback call. Never thrown, always returned.
 */
struct FallbackResult {
    bool                         success{false};
    Attributes                   data;                ///< Payload of the winning route
    std::optional<FallbackError> error;               ///< Most recent failure when !success
    std::optional<FallbackRoute> route_used;          ///< Snapshot of the winning route
    std::vector<std::string>     fallbacks_attempted; ///< Route ids actually tried, in order
    std::chrono::milliseconds    total_duration{0};
    std::optional<double>        quality_score;
    Attributes                   metadata;
};

} // namespace reroute::routing
