/**
* @file observability.cpp
 * @brief EventBus fan-out and the printf-backed JSON-line observer.
 */
#include "reroute/obs/observability.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <type_traits>

namespace reroute::obs {

    namespace {
        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

        std::string escape(std::string_view s) {
            std::string out;
            out.reserve(s.size() + 2);
            for (char c : s) {
                switch (c) {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n";  break;
                    case '\r': out += "\\r";  break;
                    case '\t': out += "\\t";  break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) out += ' ';
                        else out += c;
                }
            }
            return out;
        }

        std::string join_ids(const std::vector<std::string>& ids) {
            std::string out = "[";
            for (std::size_t i = 0; i < ids.size(); ++i) {
                if (i) out += ',';
                out += '"';
                out += escape(ids[i]);
                out += '"';
            }
            out += ']';
            return out;
        }

        // Event-specific JSON fields (without braces, leading comma included).
        std::string fields_of(const Event& e) {
            return std::visit(overloaded{
                [](const FallbackSuccess& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.context.request_id) +
                           R"(","route":")" + escape(ev.route.id) +
                           R"(","target":")" + escape(ev.route.target) +
                           R"(","duration_ms":)" + std::to_string(ev.result.total_duration.count());
                },
                [](const FallbackFailed& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.context.request_id) +
                           R"(","routes_attempted":)" + join_ids(ev.routes_attempted) +
                           R"(,"duration_ms":)" + std::to_string(ev.result.total_duration.count());
                },
                [](const CircuitBreakerOpened& ev) {
                    return std::string(R"(,"target":")") + escape(ev.target) +
                           R"(","failures":)" + std::to_string(ev.failures);
                },
                [](const CircuitBreakerReset& ev) {
                    return std::string(R"(,"target":")") + escape(ev.target) + "\"";
                },
                [](const HealthStatusChanged& ev) {
                    return std::string(R"(,"provider":")") + escape(ev.provider_id) +
                           R"(","healthy":)" + (ev.is_healthy ? "true" : "false") +
                           R"(,"consecutive_failures":)" + std::to_string(ev.consecutive_failures);
                },
                [](const HealthProbeError& ev) {
                    return std::string(R"(,"provider":")") + escape(ev.provider_id) +
                           R"(","error":")" + escape(ev.message) + "\"";
                },
                [](const EmergencyModeActivated&) { return std::string{}; },
                [](const EmergencyModeDeactivated&) { return std::string{}; },
                [](const FallbackToggled& ev) {
                    return std::string(R"(,"enabled":)") + (ev.enabled ? "true" : "false");
                },
                [](const RouteAdded& ev) {
                    return std::string(R"(,"route":")") + escape(ev.id) +
                           R"(","type":")" + std::string(routing::to_string(ev.type)) +
                           R"(","source":")" + escape(ev.source) +
                           R"(","target":")" + escape(ev.target) +
                           R"(","priority":)" + std::to_string(ev.priority);
                },
                [](const RouteRemoved& ev) {
                    return std::string(R"(,"route":")") + escape(ev.id) + "\"";
                },
                [](const RouteAttempted& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.request_id) +
                           R"(","route":")" + escape(ev.route_id) +
                           R"(","target":")" + escape(ev.target) +
                           R"(","attempt":)" + std::to_string(ev.attempt);
                },
                [](const RouteSkipped& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.request_id) +
                           R"(","route":")" + escape(ev.route_id) +
                           R"(","target":")" + escape(ev.target) + R"(","reason":"circuit_open")";
                },
                [](const RouteFailed& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.request_id) +
                           R"(","route":")" + escape(ev.route_id) +
                           R"(","target":")" + escape(ev.target) +
                           R"(","error":")" + escape(ev.error) + "\"";
                },
                [](const RouteConditionFailed& ev) {
                    return std::string(R"(,"request_id":")") + escape(ev.request_id) +
                           R"(","route":")" + escape(ev.route_id) +
                           R"(","error":")" + escape(ev.error) + "\"";
                },
                [](const MetricsReset&) { return std::string{}; },
            }, e);
        }

        class LogObserver final : public Observer {
        public:
            LogObserver(LogLevel min_level, std::FILE* out) noexcept
                : min_(min_level), out_(out) {}

            void record(const Event& e) noexcept override {
                const LogLevel lvl = level_of(e);
                if (lvl < min_ || !out_) return;
                try {
                    const std::string extra = fields_of(e);
                    std::lock_guard<std::mutex> lk(mu_);
                    std::fprintf(out_, R"({"level":"%s","event":"%s"%s})" "\n",
                                 std::string(to_string(lvl)).c_str(),
                                 std::string(name_of(e)).c_str(),
                                 extra.c_str());
                    std::fflush(out_);
                } catch (const std::exception&) {
                    // Allocation failure while formatting: the line is lost, the publisher is not.
                }
            }

        private:
            LogLevel    min_;
            std::FILE*  out_;
            std::mutex  mu_;
        };

        class NullObserver final : public Observer {
        public:
            void record(const Event&) noexcept override {}
        };
    } // namespace

    std::string_view to_string(LogLevel l) noexcept {
        switch (l) {
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
        }
        return "info";
    }

    std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
        if (s == "debug") return LogLevel::Debug;
        if (s == "info")  return LogLevel::Info;
        if (s == "warn")  return LogLevel::Warn;
        if (s == "error") return LogLevel::Error;
        return std::nullopt;
    }

    std::string_view name_of(const Event& e) noexcept {
        return std::visit(overloaded{
            [](const FallbackSuccess&)          { return std::string_view{"fallbackSuccess"}; },
            [](const FallbackFailed&)           { return std::string_view{"fallbackFailed"}; },
            [](const CircuitBreakerOpened&)     { return std::string_view{"circuitBreakerOpened"}; },
            [](const CircuitBreakerReset&)      { return std::string_view{"circuitBreakerReset"}; },
            [](const HealthStatusChanged&)      { return std::string_view{"healthStatusChanged"}; },
            [](const HealthProbeError&)         { return std::string_view{"healthProbeError"}; },
            [](const EmergencyModeActivated&)   { return std::string_view{"emergencyModeActivated"}; },
            [](const EmergencyModeDeactivated&) { return std::string_view{"emergencyModeDeactivated"}; },
            [](const FallbackToggled&)          { return std::string_view{"fallbackToggled"}; },
            [](const RouteAdded&)               { return std::string_view{"routeAdded"}; },
            [](const RouteRemoved&)             { return std::string_view{"routeRemoved"}; },
            [](const RouteAttempted&)           { return std::string_view{"routeAttempted"}; },
            [](const RouteSkipped&)             { return std::string_view{"routeSkipped"}; },
            [](const RouteFailed&)              { return std::string_view{"routeFailed"}; },
            [](const RouteConditionFailed&)     { return std::string_view{"routeConditionFailed"}; },
            [](const MetricsReset&)             { return std::string_view{"metricsReset"}; },
        }, e);
    }

    LogLevel level_of(const Event& e) noexcept {
        return std::visit(overloaded{
            [](const FallbackSuccess&)          { return LogLevel::Info; },
            [](const FallbackFailed&)           { return LogLevel::Error; },
            [](const CircuitBreakerOpened&)     { return LogLevel::Warn; },
            [](const CircuitBreakerReset&)      { return LogLevel::Info; },
            [](const HealthStatusChanged& ev)   { return ev.is_healthy ? LogLevel::Debug : LogLevel::Warn; },
            [](const HealthProbeError&)         { return LogLevel::Error; },
            [](const EmergencyModeActivated&)   { return LogLevel::Warn; },
            [](const EmergencyModeDeactivated&) { return LogLevel::Warn; },
            [](const FallbackToggled&)          { return LogLevel::Info; },
            [](const RouteAdded&)               { return LogLevel::Info; },
            [](const RouteRemoved&)             { return LogLevel::Info; },
            [](const RouteAttempted&)           { return LogLevel::Info; },
            [](const RouteSkipped&)             { return LogLevel::Warn; },
            [](const RouteFailed&)              { return LogLevel::Error; },
            [](const RouteConditionFailed&)     { return LogLevel::Error; },
            [](const MetricsReset&)             { return LogLevel::Info; },
        }, e);
    }

    EventBus::SubscriptionId EventBus::subscribe(std::shared_ptr<Observer> sub) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto id = next_id_++;
        if (sub) subs_.push_back(Slot{id, std::move(sub)});
        return id;
    }

    bool EventBus::unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto it = std::find_if(subs_.begin(), subs_.end(),
                                     [&](const Slot& s){ return s.id == id; });
        if (it == subs_.end()) return false;
        subs_.erase(it);
        return true;
    }

    std::size_t EventBus::subscriber_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return subs_.size();
    }

    void EventBus::record(const Event& e) noexcept {
        std::vector<std::shared_ptr<Observer>> targets;
        try {
            std::lock_guard<std::mutex> lk(mu_);
            targets.reserve(subs_.size());
            for (const auto& s : subs_) targets.push_back(s.sub);
        } catch (const std::exception&) {
            return; // could not snapshot subscribers; event dropped
        }
        for (const auto& t : targets) t->record(e);
    }

    std::shared_ptr<Observer> make_log_observer(LogLevel min_level, std::FILE* out) {
        return std::make_shared<LogObserver>(min_level, out);
    }

    std::shared_ptr<Observer> make_null_observer() {
        static const auto obs = std::make_shared<NullObserver>(); // process-wide singleton
        return obs;
    }

} // namespace reroute::obs
