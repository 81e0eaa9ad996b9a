/**
 * @file metrics.cpp
 * @brief MetricsAggregator implementation.
 */
#include "reroute/obs/metrics.hpp"

namespace reroute::obs {

    void MetricsAggregator::record_fallback_started() {
        std::lock_guard<std::mutex> lk(mu_);
        m_.total_fallbacks++;
    }

    void MetricsAggregator::record_route_use(const std::string& route_id) {
        std::lock_guard<std::mutex> lk(mu_);
        m_.routes_used[route_id]++;
    }

    void MetricsAggregator::record_success(routing::RouteType type,
                                           std::chrono::milliseconds duration,
                                           bool emergency) {
        std::lock_guard<std::mutex> lk(mu_);
        m_.successful_fallbacks++;
        if (type == routing::RouteType::Provider) m_.provider_switches++;
        if (type == routing::RouteType::Agent)    m_.agent_switches++;
        if (emergency) m_.emergency_activations++;

        // Incremental mean over successes only.
        const double n = static_cast<double>(m_.successful_fallbacks);
        const double sample = static_cast<double>(duration.count());
        m_.average_fallback_time_ms += (sample - m_.average_fallback_time_ms) / n;
    }

    void MetricsAggregator::record_failure() {
        std::lock_guard<std::mutex> lk(mu_);
        m_.failed_fallbacks++;
    }

    Metrics MetricsAggregator::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return m_; // value copy; callers cannot reach internal state
    }

    void MetricsAggregator::reset() {
        std::lock_guard<std::mutex> lk(mu_);
        m_ = Metrics{};
    }

} // namespace reroute::obs
