// RouteRegistry: RCU Implementation Notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: lock write_mu_, copy current map, mutate, atomic_store (RELEASE).
// The shared_ptr reference count provides the grace period: old snapshots stay
// alive until the last reader drops its ref.

#include "reroute/routing/route_registry.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include "reroute/config/constants.hpp"

namespace reroute::routing {

//------------------------------- Validation -----------------------------------

// Ids are opaque: any non-empty string, e.g. "openai/gpt-4->claude".
bool RouteRegistry::validateRoute(const FallbackRoute& r) noexcept {
    if (r.id.empty() || r.source.empty() || r.target.empty()) return false;
    if (!std::isfinite(r.success_rate) || r.success_rate < 0.0 || r.success_rate > 1.0) return false;
    return true;
}

//------------------------------- Matching -------------------------------------

bool RouteRegistry::sourceMatches(const FallbackRoute& r, const FallbackContext& ctx) noexcept {
    if (r.source == "*") return true;
    return (ctx.original_provider && *ctx.original_provider == r.source) ||
           (ctx.original_agent    && *ctx.original_agent    == r.source) ||
           (ctx.original_endpoint && *ctx.original_endpoint == r.source);
}

bool RouteRegistry::conditionHolds(const FallbackRoute& r, const FallbackContext& ctx) const noexcept {
    if (!r.condition) return true;
    try {
        return r.condition(ctx);
    } catch (const std::exception& ex) {
        if (observer_) {
            try {
                observer_->record(obs::RouteConditionFailed{ctx.request_id, r.id, ex.what()});
            } catch (const std::exception&) {
                // Event payload could not be built; the route is still excluded.
            }
        }
        return false;
    }
}

void RouteRegistry::sortByPriority(std::vector<const Entry*>& v) {
    std::sort(v.begin(), v.end(), [](const Entry* a, const Entry* b) {
        if (a->route.priority != b->route.priority) return a->route.priority < b->route.priority;
        return a->seq < b->seq;
    });
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const RouteRegistry::Map>
RouteRegistry::snapshot() const noexcept {
    // RCU read: acquire pairs with the RELEASE in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::vector<FallbackRoute> RouteRegistry::find_applicable(const FallbackContext& ctx) const {
    auto snap = snapshot();
    std::vector<FallbackRoute> out;
    if (!snap) return out;

    std::vector<const Entry*> hits;
    hits.reserve(snap->size());
    for (const auto& kv : *snap) {
        const auto& r = kv.second.route;
        if (!r.enabled) continue;
        if (!sourceMatches(r, ctx)) continue;
        if (!conditionHolds(r, ctx)) continue;
        hits.push_back(&kv.second);
    }
    sortByPriority(hits);

    out.reserve(hits.size());
    for (const Entry* e : hits) out.push_back(e->route); // copy
    return out;
}

std::vector<FallbackRoute> RouteRegistry::all() const {
    auto snap = snapshot();
    std::vector<FallbackRoute> out;
    if (!snap) return out;

    std::vector<const Entry*> entries;
    entries.reserve(snap->size());
    for (const auto& kv : *snap) entries.push_back(&kv.second);
    sortByPriority(entries);

    out.reserve(entries.size());
    for (const Entry* e : entries) out.push_back(e->route);
    return out;
}

std::optional<FallbackRoute> RouteRegistry::get(std::string_view id) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(id);
    if (it == snap->end()) return std::nullopt;
    return it->second.route;
}

bool RouteRegistry::contains(std::string_view id) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(id) != snap->end());
}

std::size_t RouteRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

RouteRegistry::Stats RouteRegistry::stats() const noexcept {
    return Stats{adds_.load(std::memory_order_relaxed),
                 overwrites_.load(std::memory_order_relaxed),
                 removes_.load(std::memory_order_relaxed),
                 failures_.load(std::memory_order_relaxed)};
}

//------------------------------- Mutations ------------------------------------

void RouteRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: RELEASE pairs with reader ACQUIRE so the fully built map is visible.
    std::shared_ptr<const Map> cnext = std::move(next);
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

RegistryErr RouteRegistry::add(FallbackRoute route) {
    if (!validateRoute(route)) { failures_.fetch_add(1, std::memory_order_relaxed); return RegistryErr::Invalid; }

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    auto it = snap->find(std::string_view{route.id});
    const bool exists = (it != snap->end());

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    if (exists) {
        auto nit = next->find(std::string_view{route.id});
        nit->second.route = std::move(route); // keep the original seq
        publish(std::move(next));
        overwrites_.fetch_add(1, std::memory_order_relaxed);
    } else {
        const uint64_t seq = next_seq_.fetch_add(1, std::memory_order_relaxed);
        std::string key = route.id;
        next->emplace(std::move(key), Entry{std::move(route), seq});
        publish(std::move(next));
        adds_.fetch_add(1, std::memory_order_relaxed);
    }
    return RegistryErr::Ok;
}

bool RouteRegistry::remove(std::string_view id) noexcept {
    try {
        std::lock_guard<std::mutex> lk(write_mu_);
        auto snap = snapshot();
        if (!snap || snap->find(id) == snap->end()) return false;

        auto next = std::make_shared<Map>(*snap);
        next->erase(next->find(id));
        publish(std::move(next));
        removes_.fetch_add(1, std::memory_order_relaxed);
        return true;
    } catch (const std::exception&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return false; // allocation failure: registry left untouched
    }
}

std::optional<FallbackRoute>
RouteRegistry::record_outcome(std::string_view id, bool success,
                              std::optional<os::Clock::time_point> used_at) {
    using config::constants::ROUTE_SUCCESS_EMA_ALPHA;

    std::lock_guard<std::mutex> lk(write_mu_);
    auto snap = snapshot();
    if (snap->find(id) == snap->end()) return std::nullopt;

    auto next = std::make_shared<Map>(*snap);
    auto& route = next->find(id)->second.route;
    const double sample = success ? 1.0 : 0.0;
    route.success_rate = ROUTE_SUCCESS_EMA_ALPHA * sample + (1.0 - ROUTE_SUCCESS_EMA_ALPHA) * route.success_rate;
    if (used_at) route.last_used = *used_at;

    FallbackRoute updated = route;
    publish(std::move(next));
    return updated;
}

void RouteRegistry::clear() noexcept {
    try {
        std::lock_guard<std::mutex> lk(write_mu_);
        publish(std::make_shared<Map>());
    } catch (const std::exception&) {
        failures_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace reroute::routing
