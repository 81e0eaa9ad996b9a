#pragma once
// reroute: RouteRegistry
// Concurrency Model: RCU (Read-Copy-Update) via atomic shared_ptr snapshot swap.
//   • Read-mostly workload: every fallback call resolves candidates from a snapshot (ACQUIRE).
//   • Writers copy the whole map, mutate, and atomically swap it in (RELEASE).
//   • Writers are serialized by a mutex so concurrent EMA updates are never lost.
//   • Readers never block writers; writers never block readers.
// Runtime policy: no exceptions in lookups or mutations. A condition that throws is
// reported to the observer and its route is left out of that lookup.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "reroute/obs/observability.hpp"
#include "reroute/routing/route.hpp"

namespace reroute::routing {

// -----------------------------------------------------------------------------
// Error codes returned by registry operations. Never throw exceptions in hot path.
// -----------------------------------------------------------------------------
/// Result codes for registry mutations.
enum class RegistryErr {
    Ok,         ///< Operation succeeded.
    Invalid     ///< Input validation failed (empty id, source or target; success rate outside [0,1]).
};

///
/// Maintains the mapping RouteId → FallbackRoute.
/// - add() inserts or overwrites by id; an overwrite keeps the original insertion slot.
///   Any non-empty string is a valid id and the number of routes is unbounded.
/// - find_applicable() returns copies ordered by (priority, insertion order).
/// - record_outcome() folds an attempt result into the route's success-rate EMA.
///
/// Thread-safety:
///   - Reads are lock-free (snapshot copy of a shared_ptr).
///   - Writes are serialized per registry, may allocate.
///   - Readers may see slightly stale data, but always a consistent map.
//
class RouteRegistry final {
public:
    // Transparent hash/equal functors enable heterogeneous lookup with string_view.
    struct SKeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view s) const noexcept {
            return std::hash<std::string_view>{}(s);
        }
    };
    struct SKeyEq {
        using is_transparent = void;
        bool operator()(std::string_view a, std::string_view b) const noexcept {
            return a == b;
        }
    };

    /// Stored route plus its insertion sequence (tie-break for equal priorities).
    struct Entry {
        FallbackRoute route;
        uint64_t      seq{0};
    };

    using Map = std::unordered_map<std::string, Entry, SKeyHash, SKeyEq>;

    /// @param observer Receives RouteConditionFailed when a condition throws. May be null.
    explicit RouteRegistry(std::shared_ptr<obs::Observer> observer = nullptr) noexcept
        : observer_(std::move(observer)) {}

    // --------------------------- RCU Snapshot API ----------------------------
    /// Consistent snapshot of the entire registry map.
    std::shared_ptr<const Map> snapshot() const noexcept;

    // --------------------------- Queries -------------------------------------
    /**
     * @brief Enabled routes whose source matches the context and whose condition holds.
     * @details Source matches when it is "*" or equals the context's original
     *          provider, agent or endpoint. Result is sorted ascending by priority;
     *          equal priorities keep insertion order. A condition that throws
     *          excludes its route and publishes RouteConditionFailed.
     */
    [[nodiscard]] std::vector<FallbackRoute> find_applicable(const FallbackContext& ctx) const;

    /// Copy of every route, in (priority, insertion) order.
    [[nodiscard]] std::vector<FallbackRoute> all() const;

    /// Copy of one route.
    [[nodiscard]] std::optional<FallbackRoute> get(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

    /// Monotonic version counter. Increments on every successful mutation.
    [[nodiscard]] uint64_t version() const noexcept { return version_.load(std::memory_order_relaxed); }

    // --------------------------- Mutations -----------------------------------
    /// Insert or overwrite by id.
    RegistryErr add(FallbackRoute route);

    /// Remove a route. Returns true if it existed.
    bool remove(std::string_view id) noexcept;

    /**
     * @brief Fold one attempt into the route's success-rate EMA (alpha = 0.1).
     * @param used_at When set, also stamps last_used.
     * @return Updated copy, or std::nullopt if the route vanished meanwhile.
     */
    std::optional<FallbackRoute> record_outcome(std::string_view id, bool success,
                                                std::optional<os::Clock::time_point> used_at = std::nullopt);

    /// Remove every route. Treated as maintenance operation.
    void clear() noexcept;

    /// Stats counters (cumulative since start).
    struct Stats {
        uint64_t adds{0}, overwrites{0}, removes{0}, failures{0};
    };
    [[nodiscard]] Stats stats() const noexcept;

private:
    std::shared_ptr<const Map> map_{std::make_shared<Map>()};
    std::atomic<uint64_t> version_{0};
    std::atomic<uint64_t> next_seq_{0};
    std::mutex write_mu_;
    std::shared_ptr<obs::Observer> observer_;

    std::atomic<uint64_t> adds_{0}, overwrites_{0}, removes_{0}, failures_{0};

    static bool validateRoute(const FallbackRoute& r) noexcept;
    static bool sourceMatches(const FallbackRoute& r, const FallbackContext& ctx) noexcept;
    bool conditionHolds(const FallbackRoute& r, const FallbackContext& ctx) const noexcept;
    static void sortByPriority(std::vector<const Entry*>& v);

    void publish(std::shared_ptr<Map> next) noexcept;
};

} // namespace reroute::routing
