/**
 * @file clock.cpp
 * @brief SteadyClock implementation.
 */
#include "reroute/os/clock.hpp"

#include <thread>

namespace reroute::os {

void SteadyClock::sleep_for(std::chrono::milliseconds d) {
    if (d.count() <= 0) return;
    std::this_thread::sleep_for(d);
}

bool SteadyClock::wait_for(std::unique_lock<std::mutex>& lk, std::condition_variable& cv,
                           std::chrono::milliseconds d, const std::function<bool()>& stop_waiting) {
    return cv.wait_for(lk, d, stop_waiting);
}

std::shared_ptr<Clock> steady_clock() {
    static const auto clk = std::make_shared<SteadyClock>(); // process-wide
    return clk;
}

} // namespace reroute::os
