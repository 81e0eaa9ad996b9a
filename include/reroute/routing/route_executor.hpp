#pragma once
/**
 * @file route_executor.hpp
 * @brief Per-route-type execution capability and the emergency responder.
 */

#include <array>
#include <cstddef>
#include <memory>

#include "reroute/routing/route.hpp"

namespace reroute::routing {

/** @class RouteExecutor
 *  @brief Performs the actual call for one route (provider SDK, agent, endpoint, model).
 *
 * Implementations report ordinary failures through ExecutionOutcome::success = false;
 * a thrown std::exception is also treated as a failed attempt by the orchestrator.
 */
class RouteExecutor {
public:
    virtual ~RouteExecutor() = default;
    virtual ExecutionOutcome execute(const FallbackRoute& route, const FallbackContext& ctx) = 0;
};

/** @class ExecutorTable
 *  @brief One executor slot per RouteType; dispatch is an array index, not a string switch.
 */
class ExecutorTable {
public:
    ExecutorTable& bind(RouteType type, std::shared_ptr<RouteExecutor> exec) noexcept {
        slots_[index(type)] = std::move(exec);
        return *this;
    }

    [[nodiscard]] const std::shared_ptr<RouteExecutor>& find(RouteType type) const noexcept {
        return slots_[index(type)];
    }

    [[nodiscard]] bool has(RouteType type) const noexcept { return static_cast<bool>(find(type)); }

private:
    static constexpr std::size_t index(RouteType t) noexcept { return static_cast<std::size_t>(t); }

    std::array<std::shared_ptr<RouteExecutor>, kRouteTypeCount> slots_{};
};

/** @class EmergencyEndpointExecutor
 *  @brief Endpoint executor that answers the reserved "emergency" target itself.
 *
 * The emergency target always succeeds with a degraded canned payload
 * (quality 0.3, data["emergency"] == "true"). Any other endpoint target is
 * forwarded to the delegate; without a delegate those attempts fail.
 */
class EmergencyEndpointExecutor final : public RouteExecutor {
public:
    explicit EmergencyEndpointExecutor(std::shared_ptr<RouteExecutor> delegate = nullptr) noexcept
        : delegate_(std::move(delegate)) {}

    ExecutionOutcome execute(const FallbackRoute& route, const FallbackContext& ctx) override;

    /// True for endpoint routes aimed at the reserved emergency target.
    static bool is_emergency(const FallbackRoute& route) noexcept;

    /// The canned degraded response.
    static ExecutionOutcome emergency_response();

private:
    std::shared_ptr<RouteExecutor> delegate_;
};

} // namespace reroute::routing
