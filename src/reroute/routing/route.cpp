/**
 * @file route.cpp
 * @brief RouteType name mapping.
 */
#include "reroute/routing/route.hpp"

namespace reroute::routing {

std::string_view to_string(RouteType t) noexcept {
    switch (t) {
        case RouteType::Provider: return "provider";
        case RouteType::Agent:    return "agent";
        case RouteType::Endpoint: return "endpoint";
        case RouteType::Model:    return "model";
    }
    return "unknown";
}

std::optional<RouteType> parse_route_type(std::string_view s) noexcept {
    if (s == "provider") return RouteType::Provider;
    if (s == "agent")    return RouteType::Agent;
    if (s == "endpoint") return RouteType::Endpoint;
    if (s == "model")    return RouteType::Model;
    return std::nullopt;
}

} // namespace reroute::routing
