/**
 * @file route_executor.cpp
 * @brief Emergency responder.
 */
#include "reroute/routing/route_executor.hpp"

#include "reroute/config/constants.hpp"

namespace reroute::routing {

using namespace reroute::config::constants;

bool EmergencyEndpointExecutor::is_emergency(const FallbackRoute& route) noexcept {
    return route.type == RouteType::Endpoint && route.target == EMERGENCY_TARGET;
}

ExecutionOutcome EmergencyEndpointExecutor::emergency_response() {
    ExecutionOutcome out;
    out.success = true;
    out.data = {
        {"status",    "emergency_mode"},
        {"message",   "Service is currently experiencing issues. Emergency fallback activated."},
        {"response",  "I apologize, but I am currently experiencing technical difficulties. "
                      "Please try again later or contact support."},
        {"emergency", "true"},
    };
    out.quality_score = EMERGENCY_QUALITY_SCORE;
    return out;
}

ExecutionOutcome EmergencyEndpointExecutor::execute(const FallbackRoute& route, const FallbackContext& ctx) {
    if (is_emergency(route)) return emergency_response();
    if (delegate_) return delegate_->execute(route, ctx);

    ExecutionOutcome out;
    out.error = FallbackError{"NO_ENDPOINT_EXECUTOR", 0,
                              "no endpoint executor bound for target " + route.target, {}};
    return out;
}

} // namespace reroute::routing
