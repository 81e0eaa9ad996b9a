#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: typed fallback events, fan-out bus, JSON-line logger.
 * @details Components publish fire-and-forget events; subscribers never block or
 *          acknowledge. The printf-backed log observer is the process logging sink.
 */

#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "reroute/routing/route.hpp"

namespace reroute::obs {

    /** @enum LogLevel
     *  @brief Severity attached to every event when it is logged.
     */
    enum class LogLevel : uint8_t { Debug = 0, Info, Warn, Error };

    std::string_view to_string(LogLevel l) noexcept;
    std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

    // ---------------------------------------------------------------------
    // Event payloads
    // ---------------------------------------------------------------------

    /// A fallback route produced a successful response.
    struct FallbackSuccess {
        routing::FallbackContext context;
        routing::FallbackResult  result;
        routing::FallbackRoute   route;
    };

    /// Every candidate failed, was skipped, or the budget ran out.
    struct FallbackFailed {
        routing::FallbackContext context;
        routing::FallbackResult  result;
        std::vector<std::string> routes_attempted;
    };

    struct CircuitBreakerOpened {
        std::string target;
        uint32_t    failures{0};
    };

    struct CircuitBreakerReset {
        std::string target;
    };

    struct HealthStatusChanged {
        std::string provider_id;
        bool        is_healthy{false};
        uint32_t    consecutive_failures{0};
    };

    /// The probe itself raised instead of answering.
    struct HealthProbeError {
        std::string provider_id;
        std::string message;
    };

    struct EmergencyModeActivated {};
    struct EmergencyModeDeactivated {};

    struct FallbackToggled {
        bool enabled{true};
    };

    struct RouteAdded {
        std::string        id;
        routing::RouteType type{routing::RouteType::Provider};
        std::string        source;
        std::string        target;
        int32_t            priority{0};
    };

    struct RouteRemoved {
        std::string id;
    };

    struct RouteAttempted {
        std::string request_id;
        std::string route_id;
        std::string target;
        uint32_t    attempt{0};
    };

    /// Candidate not tried because its target's breaker is open.
    struct RouteSkipped {
        std::string request_id;
        std::string route_id;
        std::string target;
    };

    struct RouteFailed {
        std::string request_id;
        std::string route_id;
        std::string target;
        std::string error;
    };

    /// A route's condition threw while candidates were being resolved.
    struct RouteConditionFailed {
        std::string request_id;
        std::string route_id;
        std::string error;
    };

    struct MetricsReset {};

    /// Closed set of everything the core publishes.
    using Event = std::variant<FallbackSuccess, FallbackFailed,
                               CircuitBreakerOpened, CircuitBreakerReset,
                               HealthStatusChanged, HealthProbeError,
                               EmergencyModeActivated, EmergencyModeDeactivated,
                               FallbackToggled,
                               RouteAdded, RouteRemoved,
                               RouteAttempted, RouteSkipped, RouteFailed,
                               RouteConditionFailed, MetricsReset>;

    /// Event name as published ("fallbackSuccess", "circuitBreakerOpened", ...).
    std::string_view name_of(const Event& e) noexcept;

    /// Severity used when the event is logged.
    LogLevel level_of(const Event& e) noexcept;

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single event. Must not throw into the publisher.
        virtual void record(const Event& e) noexcept = 0;
    };

    /** @class EventBus
     *  @brief Observer that fans each event out to zero or more subscribers.
     *
     * Subscribers are called on the publishing thread, outside the bus lock, so a
     * subscriber may itself subscribe or unsubscribe.
     */
    class EventBus final : public Observer {
    public:
        using SubscriptionId = uint64_t;

        SubscriptionId subscribe(std::shared_ptr<Observer> sub);
        bool unsubscribe(SubscriptionId id);
        [[nodiscard]] std::size_t subscriber_count() const;

        void record(const Event& e) noexcept override;

    private:
        struct Slot {
            SubscriptionId            id;
            std::shared_ptr<Observer> sub;
        };
        mutable std::mutex mu_;
        std::vector<Slot>  subs_;
        SubscriptionId     next_id_{1};
    };

    /**
     * @brief printf-backed observer writing one JSON line per event.
     * @param min_level Events below this severity are dropped.
     * @param out Destination stream (stdout by default); not owned.
     */
    std::shared_ptr<Observer> make_log_observer(LogLevel min_level = LogLevel::Info,
                                                std::FILE* out = stdout);

    /// Observer that discards everything.
    std::shared_ptr<Observer> make_null_observer();

} // namespace reroute::obs
