#pragma once
/**
 * @file circuit_breaker.hpp
 * @brief Per-target circuit breakers: closed -> open -> half-open -> closed.
 * @details All defaults are named in constants.hpp to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "reroute/config/constants.hpp"
#include "reroute/obs/observability.hpp"
#include "reroute/os/clock.hpp"
#include "reroute/routing/route.hpp"

namespace reroute::routing {

/** @enum CircuitState
 *  @brief Breaker position for one target.
 */
enum class CircuitState : uint8_t {
    Closed,   ///< Traffic allowed (also the state of targets never seen failing)
    Open,     ///< Traffic blocked until the cooldown elapses
    HalfOpen  ///< Cooldown elapsed; trial attempts allowed
};

std::string_view to_string(CircuitState s) noexcept;

/** @struct BreakerConfig
 *  @brief Thresholds and cooldown for every breaker of one manager.
 */
struct BreakerConfig {
    uint32_t provider_failure_threshold{config::constants::BREAKER_PROVIDER_FAILURE_THRESHOLD}; ///< Non-agent routes
    uint32_t agent_failure_threshold{config::constants::BREAKER_AGENT_FAILURE_THRESHOLD};       ///< Agent routes
    uint32_t cooldown_ms{config::constants::BREAKER_COOLDOWN_MS}; ///< open -> half-open delay
};

/** @struct CircuitBreakerState
 *  @brief Snapshot of one target's breaker.
 */
struct CircuitBreakerState {
    CircuitState          state{CircuitState::Closed};
    uint32_t              failures{0};         ///< Failures since the last success
    os::Clock::time_point last_failure_time{};
    std::optional<os::Clock::time_point> next_attempt_time; ///< Earliest half-open trial
};

/** @class CircuitBreakerManager
 *  @brief Owns every breaker; decides whether a target may currently be attempted.
 *
 * Entries are created lazily on the first failure; a missing entry reads as
 * closed with zero failures. One mutex guards the whole map; events are
 * published after the lock is released.
 */
class CircuitBreakerManager {
public:
    CircuitBreakerManager(BreakerConfig cfg,
                          std::shared_ptr<os::Clock> clock,
                          std::shared_ptr<obs::Observer> observer);

    /**
     * @brief True while the target must not be attempted.
     * @note An open breaker whose cooldown has elapsed moves to half-open here and
     *       the call returns false. Half-open never blocks.
     */
    bool is_open(const std::string& target);

    /// Count a failure; opens the breaker once the threshold for `type` is reached.
    void record_failure(const std::string& target, RouteType type = RouteType::Provider);

    /// Close the breaker and zero its failures (no-op for unknown targets).
    void record_success(const std::string& target);

    /// Failure threshold applied to routes of this type.
    [[nodiscard]] uint32_t threshold_for(RouteType type) const noexcept;

    [[nodiscard]] std::optional<CircuitBreakerState> state_of(const std::string& target) const;

    /// Copy of every breaker, keyed by target.
    [[nodiscard]] std::map<std::string, CircuitBreakerState> status() const;

    /// Drop every breaker (all targets read as closed afterwards).
    void clear();

    [[nodiscard]] BreakerConfig config() const;
    void update_config(BreakerConfig cfg);

private:
    mutable std::mutex mu_;
    BreakerConfig cfg_;
    std::shared_ptr<os::Clock> clock_;
    std::shared_ptr<obs::Observer> observer_;
    std::unordered_map<std::string, CircuitBreakerState> breakers_;
};

} // namespace reroute::routing
