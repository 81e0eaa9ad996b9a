#pragma once
/**
 * @file health_monitor.hpp
 * @brief Background provider health probing, independent of the request path.
 * @details Publishes observational health signals only; nothing here gates which
 *          routes the orchestrator attempts.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "reroute/config/constants.hpp"
#include "reroute/obs/observability.hpp"
#include "reroute/os/clock.hpp"

namespace reroute::health {

/** @struct ProbeResult
 *  @brief One availability sample for one provider.
 */
struct ProbeResult {
    bool   is_healthy{false};
    double response_time_ms{0.0};
};

/** @class HealthProbe
 *  @brief External availability check (HTTP ping, SDK status call, ...).
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual ProbeResult probe(const std::string& provider_id) = 0;
};

/** @struct ProviderHealth
 *  @brief Rolling health record of one provider.
 */
struct ProviderHealth {
    std::string provider_id;
    bool        is_healthy{true};
    double      success_rate{config::constants::HEALTH_INITIAL_SUCCESS_RATE}; ///< EMA of probe outcomes
    double      average_response_time_ms{0.0}; ///< 0.8 * previous + 0.2 * sample; seeded by the first answer
    uint64_t    response_samples{0};           ///< Answered probes folded into the average
    double      error_rate{config::constants::HEALTH_INITIAL_ERROR_RATE};     ///< 1 - success_rate
    os::Clock::time_point last_health_check{};
    uint32_t    consecutive_failures{0};
    std::optional<std::string> last_error;
    routing::Attributes metadata;
};

/** @struct MonitorConfig
 *  @brief Schedule and roster for the monitor.
 */
struct MonitorConfig {
    uint32_t interval_ms{config::constants::HEALTH_CHECK_INTERVAL_MS}; ///< Period between probe rounds
    std::vector<std::string> providers{"openai", "claude", "gemini"};  ///< Probed every round
    bool emit_on_transition_only{false}; ///< Publish healthStatusChanged only when is_healthy flips
};

/** @class ProviderHealthMonitor
 *  @brief Start/stop-able periodic prober owning the provider health map.
 *
 * start() spawns one worker thread that waits `interval_ms` on the injected
 * Clock, runs a probe round, and repeats until stop(). tick() runs one round on
 * the caller's thread.
 *
 * Subscribers are called on the worker thread and may call stop() from there; the
 * worker then finishes its round and exits, and the next start(), stop() or the
 * destructor on another thread reaps it. The monitor must not be destroyed from
 * one of its own subscribers.
 */
class ProviderHealthMonitor {
public:
    ProviderHealthMonitor(MonitorConfig cfg,
                          std::shared_ptr<HealthProbe> probe,
                          std::shared_ptr<os::Clock> clock,
                          std::shared_ptr<obs::Observer> observer);
    ~ProviderHealthMonitor();

    ProviderHealthMonitor(const ProviderHealthMonitor&) = delete;
    ProviderHealthMonitor& operator=(const ProviderHealthMonitor&) = delete;

    /// Launch the worker. Returns false if it is already running.
    bool start();

    /// Request shutdown and join the worker. Idempotent. Called on the worker
    /// thread it only requests shutdown.
    void stop() noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Probe every provider once and update the health map.
    void tick();

    /// Completed probe rounds since construction.
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }

    /// Copy of the health map, keyed by provider id.
    [[nodiscard]] std::map<std::string, ProviderHealth> snapshot() const;

    [[nodiscard]] std::optional<ProviderHealth> health_of(const std::string& provider_id) const;

    [[nodiscard]] const MonitorConfig& config() const noexcept { return cfg_; }

private:
    void run();

    /// Fold one sample into the record; returns the event to publish, if any.
    std::optional<obs::HealthStatusChanged> apply(const std::string& provider_id,
                                                  const ProbeResult& sample,
                                                  const std::optional<std::string>& probe_error);

private:
    const MonitorConfig cfg_;
    std::shared_ptr<HealthProbe> probe_;
    std::shared_ptr<os::Clock> clock_;
    std::shared_ptr<obs::Observer> observer_;

    mutable std::mutex health_mu_;
    std::map<std::string, ProviderHealth> health_;

    std::mutex run_mu_;
    std::condition_variable cv_;
    bool stop_requested_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread worker_;
};

} // namespace reroute::health
