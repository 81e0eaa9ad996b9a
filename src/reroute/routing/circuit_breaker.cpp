/**
 * @file circuit_breaker.cpp
 * @brief CircuitBreakerManager state machine.
 */
#include "reroute/routing/circuit_breaker.hpp"

#include <utility>

namespace reroute::routing {

std::string_view to_string(CircuitState s) noexcept {
    switch (s) {
        case CircuitState::Closed:   return "closed";
        case CircuitState::Open:     return "open";
        case CircuitState::HalfOpen: return "half-open";
    }
    return "closed";
}

CircuitBreakerManager::CircuitBreakerManager(BreakerConfig cfg,
                                             std::shared_ptr<os::Clock> clock,
                                             std::shared_ptr<obs::Observer> observer)
    : cfg_(cfg),
      clock_(clock ? std::move(clock) : os::steady_clock()),
      observer_(observer ? std::move(observer) : obs::make_null_observer()) {}

uint32_t CircuitBreakerManager::threshold_for(RouteType type) const noexcept {
    std::lock_guard<std::mutex> lk(mu_);
    return type == RouteType::Agent ? cfg_.agent_failure_threshold
                                    : cfg_.provider_failure_threshold;
}

bool CircuitBreakerManager::is_open(const std::string& target) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = breakers_.find(target);
    if (it == breakers_.end()) return false;

    auto& b = it->second;
    switch (b.state) {
        case CircuitState::Closed:
        case CircuitState::HalfOpen:
            return false;
        case CircuitState::Open: {
            const auto now = clock_->now();
            if (os::elapsed_ms(b.last_failure_time, now).count() > static_cast<int64_t>(cfg_.cooldown_ms)) {
                b.state = CircuitState::HalfOpen; // allow a trial
                return false;
            }
            return true;
        }
    }
    return false;
}

void CircuitBreakerManager::record_failure(const std::string& target, RouteType type) {
    std::optional<obs::CircuitBreakerOpened> opened;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& b = breakers_[target]; // lazily created as closed
        const auto now = clock_->now();
        b.failures++;
        b.last_failure_time = now;

        const uint32_t threshold = type == RouteType::Agent ? cfg_.agent_failure_threshold
                                                            : cfg_.provider_failure_threshold;
        if (b.failures >= threshold) {
            b.state = CircuitState::Open;
            b.next_attempt_time = now + std::chrono::milliseconds(cfg_.cooldown_ms);
            opened = obs::CircuitBreakerOpened{target, b.failures};
        }
    }
    if (opened) observer_->record(*opened);
}

void CircuitBreakerManager::record_success(const std::string& target) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = breakers_.find(target);
        if (it == breakers_.end()) return;
        it->second.failures = 0;
        it->second.state = CircuitState::Closed;
        it->second.next_attempt_time.reset();
    }
    observer_->record(obs::CircuitBreakerReset{target});
}

std::optional<CircuitBreakerState> CircuitBreakerManager::state_of(const std::string& target) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = breakers_.find(target);
    if (it == breakers_.end()) return std::nullopt;
    return it->second;
}

std::map<std::string, CircuitBreakerState> CircuitBreakerManager::status() const {
    std::lock_guard<std::mutex> lk(mu_);
    return {breakers_.begin(), breakers_.end()};
}

void CircuitBreakerManager::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    breakers_.clear();
}

BreakerConfig CircuitBreakerManager::config() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cfg_;
}

void CircuitBreakerManager::update_config(BreakerConfig cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
}

} // namespace reroute::routing
