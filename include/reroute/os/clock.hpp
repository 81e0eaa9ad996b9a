#pragma once
/**
 * @file clock.hpp
 * @brief Time source and suspension primitive used by the fallback core.
 * @details Everything that reads the time or pauses goes through a Clock so tests
 *          can substitute a manual clock and never sleep for real.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace reroute::os {

    /** @class Clock
     *  @brief Monotonic time + sleep and wait capability.
     */
    class Clock {
    public:
        using time_point = std::chrono::steady_clock::time_point;

        virtual ~Clock() = default;

        /// Current monotonic time.
        virtual time_point now() const noexcept = 0;

        /// Suspend the calling thread. Non-positive durations return immediately.
        virtual void sleep_for(std::chrono::milliseconds d) = 0;

        /**
         * @brief Interruptible wait measured on this clock.
         * @details Blocks on `cv` with `lk` held until `stop_waiting()` is true or
         *          `d` has elapsed. Whoever makes `stop_waiting()` true must notify `cv`.
         * @return The value of `stop_waiting()` on wake-up.
         */
        virtual bool wait_for(std::unique_lock<std::mutex>& lk,
                              std::condition_variable& cv,
                              std::chrono::milliseconds d,
                              const std::function<bool()>& stop_waiting) = 0;
    };

    /** @class SteadyClock
     *  @brief Production clock backed by std::chrono::steady_clock.
     */
    class SteadyClock final : public Clock {
    public:
        time_point now() const noexcept override { return std::chrono::steady_clock::now(); }
        void sleep_for(std::chrono::milliseconds d) override;
        bool wait_for(std::unique_lock<std::mutex>& lk, std::condition_variable& cv,
                      std::chrono::milliseconds d, const std::function<bool()>& stop_waiting) override;
    };

    /// Process-wide SteadyClock instance.
    std::shared_ptr<Clock> steady_clock();

    /// Whole milliseconds between two time points (never negative).
    inline std::chrono::milliseconds elapsed_ms(Clock::time_point from, Clock::time_point to) noexcept {
        using namespace std::chrono;
        if (to <= from) return milliseconds{0};
        return duration_cast<milliseconds>(to - from);
    }

} // namespace reroute::os
