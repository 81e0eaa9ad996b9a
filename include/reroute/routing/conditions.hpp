#pragma once
/**
 * @file conditions.hpp
 * @brief Failure classification predicates and the built-in route set.
 */

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "reroute/routing/route.hpp"

namespace reroute::routing {

/// Shared on/off switch read by conditions (e.g. emergency mode).
using SwitchFlag = std::shared_ptr<const std::atomic<bool>>;

namespace conditions {

    /// PROVIDER_TIMEOUT / PROVIDER_UNAVAILABLE / API_LIMIT_EXCEEDED, or a 5xx status.
    bool is_provider_error(const FallbackContext& ctx) noexcept;

    /// MODEL_UNAVAILABLE / MODEL_OVERLOADED / UNSUPPORTED_OPERATION, or a failing model named.
    bool is_model_error(const FallbackContext& ctx) noexcept;

    /// BUDGET_EXCEEDED, or the caller asked for cost optimization via metadata.
    bool is_cost_constraint(const FallbackContext& ctx) noexcept;

    /// Condition that reads a shared flag at evaluation time.
    RouteCondition when(SwitchFlag flag);

    /**
     * @brief Resolve a condition by its config name.
     * @details Known names: always, provider_error, model_error, cost_constraint,
     *          model_or_cost, emergency_mode (reads `emergency`).
     * @return std::nullopt for unknown names.
     */
    std::optional<RouteCondition> by_name(std::string_view name, SwitchFlag emergency);

} // namespace conditions

/// Catch-all last resort: source "*", priority 10, endpoint "emergency", armed by `emergency`.
FallbackRoute emergency_route(SwitchFlag emergency);

/// Built-in provider chain, agent downgrades and the emergency route.
std::vector<FallbackRoute> default_routes(SwitchFlag emergency);

} // namespace reroute::routing
