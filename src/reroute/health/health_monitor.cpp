/**
 * @file health_monitor.cpp
 * @brief ProviderHealthMonitor worker loop and EMA bookkeeping.
 */
#include "reroute/health/health_monitor.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

namespace reroute::health {

using namespace reroute::config::constants;

ProviderHealthMonitor::ProviderHealthMonitor(MonitorConfig cfg,
                                             std::shared_ptr<HealthProbe> probe,
                                             std::shared_ptr<os::Clock> clock,
                                             std::shared_ptr<obs::Observer> observer)
    : cfg_(std::move(cfg)),
      probe_(std::move(probe)),
      clock_(clock ? std::move(clock) : os::steady_clock()),
      observer_(observer ? std::move(observer) : obs::make_null_observer()) {}

ProviderHealthMonitor::~ProviderHealthMonitor() {
    stop();
}

bool ProviderHealthMonitor::start() {
    std::unique_lock<std::mutex> lk(run_mu_);
    if (running_.load(std::memory_order_acquire)) return false;
    if (worker_.joinable()) {
        // Worker stopped itself from a subscriber and has not been reaped yet.
        if (worker_.get_id() == std::this_thread::get_id()) return false;
        lk.unlock();
        worker_.join();
        lk.lock();
        if (running_.load(std::memory_order_acquire)) return false;
    }
    stop_requested_ = false;
    worker_ = std::thread([this] { run(); });
    running_.store(true, std::memory_order_release);
    return true;
}

void ProviderHealthMonitor::stop() noexcept {
    {
        std::lock_guard<std::mutex> lk(run_mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() == std::this_thread::get_id()) {
        // Called from a subscriber on the worker itself: joining would deadlock.
        running_.store(false, std::memory_order_release);
        return;
    }
    if (worker_.joinable()) worker_.join();
    running_.store(false, std::memory_order_release);
}

void ProviderHealthMonitor::run() {
    const auto period = std::chrono::milliseconds(cfg_.interval_ms);
    std::unique_lock<std::mutex> lk(run_mu_);
    while (!stop_requested_) {
        if (clock_->wait_for(lk, cv_, period, [this] { return stop_requested_; })) break;
        lk.unlock();
        tick();
        lk.lock();
    }
}

void ProviderHealthMonitor::tick() {
    for (const auto& id : cfg_.providers) {
        ProbeResult sample{};
        std::optional<std::string> probe_error;
        if (!probe_) {
            probe_error = "no health probe configured";
        } else {
            try {
                sample = probe_->probe(id);
            } catch (const std::exception& e) {
                probe_error = e.what();
            }
        }

        if (probe_error) observer_->record(obs::HealthProbeError{id, *probe_error});
        if (auto ev = apply(id, sample, probe_error)) observer_->record(*ev);
    }
    ticks_.fetch_add(1, std::memory_order_relaxed);
}

std::optional<obs::HealthStatusChanged>
ProviderHealthMonitor::apply(const std::string& provider_id,
                             const ProbeResult& sample,
                             const std::optional<std::string>& probe_error) {
    const bool healthy = sample.is_healthy && !probe_error;

    std::lock_guard<std::mutex> lk(health_mu_);
    auto it = health_.find(provider_id);
    const bool first_seen = (it == health_.end());
    if (first_seen) {
        ProviderHealth h;
        h.provider_id = provider_id;
        it = health_.emplace(provider_id, std::move(h)).first;
    }

    auto& h = it->second;
    const bool was_healthy = h.is_healthy;

    h.is_healthy = healthy;
    if (!probe_error) {
        h.average_response_time_ms =
            h.response_samples == 0
                ? sample.response_time_ms
                : HEALTH_RESPONSE_EMA_PREV_WEIGHT * h.average_response_time_ms +
                      (1.0 - HEALTH_RESPONSE_EMA_PREV_WEIGHT) * sample.response_time_ms;
        h.response_samples++;
    }
    h.success_rate = HEALTH_SUCCESS_EMA_ALPHA * (healthy ? 1.0 : 0.0) +
                     (1.0 - HEALTH_SUCCESS_EMA_ALPHA) * h.success_rate;
    h.error_rate = 1.0 - h.success_rate;
    h.last_health_check = clock_->now();

    if (healthy) {
        h.consecutive_failures = 0;
    } else {
        h.consecutive_failures++;
        h.last_error = probe_error ? *probe_error : "Health check failed for " + provider_id;
    }

    if (cfg_.emit_on_transition_only && !first_seen && was_healthy == healthy) return std::nullopt;
    return obs::HealthStatusChanged{provider_id, healthy, h.consecutive_failures};
}

std::map<std::string, ProviderHealth> ProviderHealthMonitor::snapshot() const {
    std::lock_guard<std::mutex> lk(health_mu_);
    return health_;
}

std::optional<ProviderHealth> ProviderHealthMonitor::health_of(const std::string& provider_id) const {
    std::lock_guard<std::mutex> lk(health_mu_);
    auto it = health_.find(provider_id);
    if (it == health_.end()) return std::nullopt;
    return it->second;
}

} // namespace reroute::health
