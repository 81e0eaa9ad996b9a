#pragma once
/**
 * @file metrics.hpp
 * @brief Fallback counters and per-route usage statistics.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "reroute/routing/route.hpp"

namespace reroute::obs {

    /** @struct Metrics
     *  @brief Value snapshot of all fallback counters.
     */
    struct Metrics {
        uint64_t total_fallbacks{0};       ///< execute_fallback calls (disabled ones included)
        uint64_t successful_fallbacks{0};  ///< Calls that ended on a successful route
        uint64_t failed_fallbacks{0};      ///< Calls that exhausted routes or budget
        uint64_t provider_switches{0};     ///< Successes through a provider route
        uint64_t agent_switches{0};        ///< Successes through an agent route
        uint64_t emergency_activations{0}; ///< Successes through the emergency responder
        std::map<std::string, uint64_t> routes_used; ///< Route id -> attempts (success or failure)
        double   average_fallback_time_ms{0.0}; ///< Running mean of successful total_duration

        bool operator==(const Metrics&) const = default;
    };

    /** @class MetricsAggregator
     *  @brief Thread-safe owner of the fallback counters.
     */
    class MetricsAggregator {
    public:
        /// An execute_fallback call started.
        void record_fallback_started();

        /// One route attempt finished (either way).
        void record_route_use(const std::string& route_id);

        /**
         * @brief A fallback call ended successfully.
         * @param type Type of the winning route (drives provider/agent switch counters).
         * @param duration Wall time of the whole call; folded into the running mean.
         * @param emergency True when the emergency responder produced the result.
         */
        void record_success(routing::RouteType type, std::chrono::milliseconds duration, bool emergency);

        /// A fallback call ended without success.
        void record_failure();

        /// Defensive copy of every counter.
        [[nodiscard]] Metrics snapshot() const;

        /// Zero every counter and clear the route map.
        void reset();

    private:
        mutable std::mutex mu_;
        Metrics m_;
    };

} // namespace reroute::obs
