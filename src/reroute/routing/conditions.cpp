/**
 * @file conditions.cpp
 * @brief Failure classification and built-in routes.
 */
#include "reroute/routing/conditions.hpp"

#include <array>
#include <utility>

#include "reroute/config/constants.hpp"

namespace reroute::routing {

namespace {
    constexpr std::array<std::string_view, 3> kProviderCodes{
        "PROVIDER_TIMEOUT", "PROVIDER_UNAVAILABLE", "API_LIMIT_EXCEEDED"};
    constexpr std::array<std::string_view, 3> kModelCodes{
        "MODEL_UNAVAILABLE", "MODEL_OVERLOADED", "UNSUPPORTED_OPERATION"};

    template <std::size_t N>
    bool contains(const std::array<std::string_view, N>& set, std::string_view v) noexcept {
        for (auto s : set) if (s == v) return true;
        return false;
    }

    FallbackRoute make_route(std::string id, RouteType type, int32_t priority,
                             std::string source, std::string target, RouteCondition cond,
                             double success_rate, std::string kind, std::string reason) {
        FallbackRoute r;
        r.id = std::move(id);
        r.type = type;
        r.priority = priority;
        r.source = std::move(source);
        r.target = std::move(target);
        r.condition = std::move(cond);
        r.enabled = true;
        r.success_rate = success_rate;
        r.metadata = {{"type", std::move(kind)}, {"reason", std::move(reason)}};
        return r;
    }
} // namespace

namespace conditions {

    bool is_provider_error(const FallbackContext& ctx) noexcept {
        return contains(kProviderCodes, ctx.error.code) ||
               (ctx.error.status >= 500 && ctx.error.status < 600);
    }

    bool is_model_error(const FallbackContext& ctx) noexcept {
        return contains(kModelCodes, ctx.error.code) || !ctx.error.model.empty();
    }

    bool is_cost_constraint(const FallbackContext& ctx) noexcept {
        if (ctx.error.code == "BUDGET_EXCEEDED") return true;
        const auto it = ctx.metadata.find("costOptimization");
        return it != ctx.metadata.end() && it->second == "true";
    }

    RouteCondition when(SwitchFlag flag) {
        return [flag = std::move(flag)](const FallbackContext&) {
            return flag && flag->load(std::memory_order_relaxed);
        };
    }

    std::optional<RouteCondition> by_name(std::string_view name, SwitchFlag emergency) {
        if (name == "always")          return RouteCondition{};
        if (name == "provider_error")  return RouteCondition{&is_provider_error};
        if (name == "model_error")     return RouteCondition{&is_model_error};
        if (name == "cost_constraint") return RouteCondition{&is_cost_constraint};
        if (name == "model_or_cost") {
            return RouteCondition{[](const FallbackContext& c) {
                return is_model_error(c) || is_cost_constraint(c);
            }};
        }
        if (name == "emergency_mode")  return when(std::move(emergency));
        return std::nullopt;
    }

} // namespace conditions

FallbackRoute emergency_route(SwitchFlag emergency) {
    using namespace config::constants;
    return make_route(EMERGENCY_ROUTE_ID, RouteType::Endpoint, EMERGENCY_ROUTE_PRIORITY,
                      "*", EMERGENCY_TARGET, conditions::when(std::move(emergency)),
                      1.0, "emergency", "system_emergency");
}

std::vector<FallbackRoute> default_routes(SwitchFlag emergency) {
    using conditions::is_provider_error;
    using conditions::is_model_error;

    const RouteCondition provider_err{&is_provider_error};
    const RouteCondition model_or_cost = *conditions::by_name("model_or_cost", nullptr);

    std::vector<FallbackRoute> routes;
    routes.reserve(6);
    routes.push_back(make_route("openai-to-claude", RouteType::Provider, 1, "openai", "claude",
                                provider_err, 0.8, "provider_fallback", "provider_failure"));
    routes.push_back(make_route("claude-to-gemini", RouteType::Provider, 2, "claude", "gemini",
                                provider_err, 0.75, "provider_fallback", "provider_failure"));
    routes.push_back(make_route("gemini-to-openai", RouteType::Provider, 3, "gemini", "openai",
                                provider_err, 0.85, "provider_fallback", "provider_failure"));
    routes.push_back(make_route("gpt4-to-gpt35", RouteType::Agent, 1, "gpt-4", "gpt-3.5-turbo",
                                model_or_cost, 0.9, "agent_fallback", "cost_optimization"));
    routes.push_back(make_route("claude3-to-claude2", RouteType::Agent, 2, "claude-3-sonnet", "claude-instant",
                                RouteCondition{&is_model_error}, 0.85, "agent_fallback", "model_failure"));
    routes.push_back(emergency_route(std::move(emergency)));
    return routes;
}

} // namespace reroute::routing
