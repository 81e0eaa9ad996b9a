/**
 * @file fallback_orchestrator.cpp
 * @brief Implementation of the fallback loop and the public operations.
 */
#include "reroute/routing/fallback_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include "reroute/routing/conditions.hpp"

namespace reroute::routing {

FallbackOrchestrator::FallbackOrchestrator(OrchestratorConfig cfg, Components parts)
    : cfg_(cfg),
      enabled_(cfg.enable_fallbacks),
      emergency_(std::make_shared<std::atomic<bool>>(cfg.emergency_mode)),
      registry_(std::move(parts.registry)),
      breakers_(std::move(parts.breakers)),
      metrics_(std::move(parts.metrics)),
      health_(std::move(parts.health)),
      executors_(std::move(parts.executors)),
      clock_(parts.clock ? std::move(parts.clock) : os::steady_clock()),
      observer_(parts.observer ? std::move(parts.observer) : obs::make_null_observer()) {
    if (!registry_) registry_ = std::make_shared<RouteRegistry>(observer_);
    if (!breakers_) breakers_ = std::make_shared<CircuitBreakerManager>(BreakerConfig{}, clock_, observer_);
    if (!metrics_)  metrics_  = std::make_shared<obs::MetricsAggregator>();

    // The endpoint slot always answers the emergency target.
    const auto& endpoint = executors_.find(RouteType::Endpoint);
    if (!std::dynamic_pointer_cast<EmergencyEndpointExecutor>(endpoint)) {
        executors_.bind(RouteType::Endpoint, std::make_shared<EmergencyEndpointExecutor>(endpoint));
    }

    if (cfg_.install_default_routes) {
        for (auto& r : default_routes(emergency_)) add_fallback_route(std::move(r));
    }
}

// --------------------------- Route management --------------------------------

void FallbackOrchestrator::add_fallback_route(FallbackRoute route) {
    if (!executors_.has(route.type)) {
        throw std::invalid_argument("no executor bound for route type '" +
                                    std::string(to_string(route.type)) + "' (route " + route.id + ")");
    }

    obs::RouteAdded ev{route.id, route.type, route.source, route.target, route.priority};
    switch (registry_->add(std::move(route))) {
        case RegistryErr::Ok:
            break;
        case RegistryErr::Invalid:
            throw std::invalid_argument("invalid fallback route '" + ev.id + "'");
    }
    observer_->record(ev);
}

void FallbackOrchestrator::add_fallback_route(const RouteSpec& spec) {
    auto cond = conditions::by_name(spec.condition, emergency_);
    if (!cond) {
        throw std::invalid_argument("unknown route condition '" + spec.condition + "' (route " + spec.id + ")");
    }

    FallbackRoute r;
    r.id = spec.id;
    r.type = spec.type;
    r.priority = spec.priority;
    r.source = spec.source;
    r.target = spec.target;
    r.condition = std::move(*cond);
    r.enabled = spec.enabled;
    r.success_rate = spec.success_rate;
    r.metadata = spec.metadata;
    add_fallback_route(std::move(r));
}

bool FallbackOrchestrator::remove_fallback_route(std::string_view id) {
    const bool removed = registry_->remove(id);
    if (removed) observer_->record(obs::RouteRemoved{std::string(id)});
    return removed;
}

// --------------------------- Hot path ----------------------------------------

uint32_t FallbackOrchestrator::attempt_limit(const FallbackContext& ctx) const noexcept {
    // max_attempts == 0: the caller sets no budget of its own.
    if (ctx.max_attempts == 0) return cfg_.max_fallback_attempts;
    return std::min(ctx.max_attempts, cfg_.max_fallback_attempts);
}

ExecutionOutcome FallbackOrchestrator::invoke(const FallbackRoute& route, const FallbackContext& ctx) const {
    const auto& exec = executors_.find(route.type);
    if (!exec) {
        ExecutionOutcome out;
        out.error = FallbackError{"NO_EXECUTOR", 0,
                                  "no executor bound for route type " + std::string(to_string(route.type)), {}};
        return out;
    }
    try {
        return exec->execute(route, ctx);
    } catch (const std::exception& e) {
        ExecutionOutcome out;
        out.error = FallbackError{"EXECUTOR_EXCEPTION", 0, e.what(), {}};
        return out;
    }
}

void FallbackOrchestrator::apply_quality_gate(const FallbackRoute& route, ExecutionOutcome& outcome) const {
    if (!cfg_.enforce_quality_threshold || !outcome.success) return;
    if (EmergencyEndpointExecutor::is_emergency(route)) return; // degraded by definition
    if (!outcome.quality_score || *outcome.quality_score >= cfg_.quality_threshold) return;

    outcome.success = false;
    outcome.error = FallbackError{"QUALITY_BELOW_THRESHOLD", 0,
                                  "quality " + std::to_string(*outcome.quality_score) +
                                  " below threshold " + std::to_string(cfg_.quality_threshold), {}};
}

FallbackResult FallbackOrchestrator::execute_fallback(FallbackContext& ctx) {
    const auto started = clock_->now();
    metrics_->record_fallback_started();

    if (!fallback_enabled()) {
        FallbackResult res;
        res.error = FallbackError{"FALLBACK_DISABLED", 0, "Fallback routing is disabled", {}};
        res.total_duration = os::elapsed_ms(started, clock_->now());
        res.metadata["fallbackDisabled"] = "true";
        return res;
    }

    const std::vector<FallbackRoute> routes = registry_->find_applicable(ctx);
    const uint32_t limit = attempt_limit(ctx);
    const auto delay = std::chrono::milliseconds(cfg_.fallback_delay_ms);

    std::vector<std::string> attempted;
    FallbackError last_error = ctx.error;
    bool deadline_exceeded = false;

    for (const auto& route : routes) {
        if (ctx.attempt >= limit) break;
        if (ctx.timeout && os::elapsed_ms(started, clock_->now()) >= *ctx.timeout) {
            deadline_exceeded = true;
            break;
        }

        if (breakers_->is_open(route.target)) {
            observer_->record(obs::RouteSkipped{ctx.request_id, route.id, route.target});
            continue;
        }

        attempted.push_back(route.id);
        ctx.attempt++;
        observer_->record(obs::RouteAttempted{ctx.request_id, route.id, route.target, ctx.attempt});

        if (delay.count() > 0) clock_->sleep_for(delay);

        ExecutionOutcome outcome = invoke(route, ctx);
        apply_quality_gate(route, outcome);
        metrics_->record_route_use(route.id);

        if (outcome.success) {
            const auto now = clock_->now();
            auto updated = registry_->record_outcome(route.id, true, now);
            breakers_->record_success(route.target);

            FallbackResult res;
            res.success = true;
            res.data = std::move(outcome.data);
            res.route_used = updated ? std::move(*updated) : route;
            res.fallbacks_attempted = std::move(attempted);
            res.total_duration = os::elapsed_ms(started, now);
            res.quality_score = outcome.quality_score;
            res.metadata = {
                {"routeId",      route.id},
                {"routeType",    std::string(to_string(route.type))},
                {"target",       route.target},
                {"attemptCount", std::to_string(ctx.attempt)},
            };

            metrics_->record_success(route.type, res.total_duration,
                                     EmergencyEndpointExecutor::is_emergency(route));
            observer_->record(obs::FallbackSuccess{ctx, res, *res.route_used});
            return res;
        }

        (void)registry_->record_outcome(route.id, false);
        breakers_->record_failure(route.target, route.type);
        last_error = std::move(outcome.error);
        observer_->record(obs::RouteFailed{ctx.request_id, route.id, route.target, last_error.message});
    }

    metrics_->record_failure();

    FallbackResult res;
    res.error = std::move(last_error);
    res.fallbacks_attempted = attempted;
    res.total_duration = os::elapsed_ms(started, clock_->now());
    res.metadata = {
        {"allFallbacksFailed", "true"},
        {"totalAttempts",      std::to_string(ctx.attempt)},
        {"routesEvaluated",    std::to_string(routes.size())},
    };
    if (deadline_exceeded) res.metadata["deadlineExceeded"] = "true";

    observer_->record(obs::FallbackFailed{ctx, res, std::move(attempted)});
    return res;
}

// --------------------------- Runtime switches --------------------------------

void FallbackOrchestrator::set_fallback_enabled(bool enabled) {
    enabled_.store(enabled, std::memory_order_release);
    observer_->record(obs::FallbackToggled{enabled});
}

void FallbackOrchestrator::set_emergency_mode(bool enabled) {
    emergency_->store(enabled, std::memory_order_release);
    if (enabled) observer_->record(obs::EmergencyModeActivated{});
    else         observer_->record(obs::EmergencyModeDeactivated{});
}

// --------------------------- Introspection -----------------------------------

obs::Metrics FallbackOrchestrator::get_metrics() const {
    return metrics_->snapshot();
}

std::map<std::string, health::ProviderHealth> FallbackOrchestrator::get_provider_health() const {
    if (!health_) return {};
    return health_->snapshot();
}

std::map<std::string, CircuitBreakerState> FallbackOrchestrator::get_circuit_breaker_status() const {
    return breakers_->status();
}

std::map<std::string, FallbackRoute> FallbackOrchestrator::get_fallback_routes() const {
    std::map<std::string, FallbackRoute> out;
    for (auto& r : registry_->all()) {
        std::string key = r.id;
        out.emplace(std::move(key), std::move(r));
    }
    return out;
}

void FallbackOrchestrator::reset_metrics() {
    metrics_->reset();
    observer_->record(obs::MetricsReset{});
}

OrchestratorConfig FallbackOrchestrator::config() const {
    OrchestratorConfig c = cfg_;
    c.enable_fallbacks = fallback_enabled();
    c.emergency_mode = emergency_mode();
    return c;
}

} // namespace reroute::routing
