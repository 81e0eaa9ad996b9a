/**
* @file config_loader.cpp
 * @brief YAML-backed loader (yaml-cpp) over the named defaults.
 */
#include "reroute/config/config_loader.hpp"
#include "reroute/config/constants.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <optional>

#include <yaml-cpp/yaml.h>

namespace reroute::config {
    using namespace reroute::routing;

    namespace {
        using Code = ConfigError::Code;

        reroute_detail::unexpected<ConfigError> fail(Code code, std::string msg) {
            return reroute_detail::unexpected<ConfigError>(ConfigError{code, std::move(msg)});
        }

        std::optional<ConfigError> read_bool(const YAML::Node& root, const char* key, bool& out) {
            if (const auto n = root[key]) out = n.as<bool>();
            return std::nullopt;
        }

        std::optional<ConfigError> read_count(const YAML::Node& root, const char* key, uint32_t& out) {
            const auto n = root[key];
            if (!n) return std::nullopt;
            const auto v = n.as<int64_t>();
            if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) {
                return ConfigError{Code::InvalidValue, std::string(key) + " must be a non-negative integer"};
            }
            out = static_cast<uint32_t>(v);
            return std::nullopt;
        }

        std::optional<ConfigError> read_unit(const YAML::Node& root, const char* key, double& out) {
            const auto n = root[key];
            if (!n) return std::nullopt;
            const auto v = n.as<double>();
            if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
                return ConfigError{Code::InvalidValue, std::string(key) + " must be within [0, 1]"};
            }
            out = v;
            return std::nullopt;
        }

        std::optional<ConfigError> read_route(const YAML::Node& node, RouteSpec& spec) {
            if (!node.IsMap()) return ConfigError{Code::InvalidValue, "routes entries must be maps"};
            if (!node["id"] || !node["target"]) {
                return ConfigError{Code::InvalidValue, "route requires id and target"};
            }
            spec.id = node["id"].as<std::string>();
            spec.target = node["target"].as<std::string>();

            if (const auto t = node["type"]) {
                const auto name = t.as<std::string>();
                const auto type = parse_route_type(name);
                if (!type) return ConfigError{Code::InvalidValue, "route " + spec.id + ": unknown type '" + name + "'"};
                spec.type = *type;
            }
            if (const auto p = node["priority"])  spec.priority = p.as<int32_t>();
            if (const auto s = node["source"])    spec.source = s.as<std::string>();
            if (const auto c = node["condition"]) spec.condition = c.as<std::string>();
            if (auto err = read_bool(node, "enabled", spec.enabled)) return err;
            if (auto err = read_unit(node, "successRate", spec.success_rate)) return err;
            if (const auto m = node["metadata"]) {
                if (!m.IsMap()) return ConfigError{Code::InvalidValue, "route " + spec.id + ": metadata must be a map"};
                for (const auto& kv : m) spec.metadata[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }
            return std::nullopt;
        }

        Expected<RouterConfig> parse(const YAML::Node& root) {
            RouterConfig rc = Loader::defaults();
            if (!root || root.IsNull()) return rc; // empty document: defaults
            if (!root.IsMap()) return fail(Code::InvalidValue, "top-level YAML node must be a map");

            auto& fb = rc.fallback;
            auto& br = rc.breaker;
            auto& hm = rc.health;
            std::optional<ConfigError> err;

            if ((err = read_bool(root,  "enableFallbacks",              fb.enable_fallbacks)))          return fail(err->code, err->message);
            if ((err = read_count(root, "maxFallbackAttempts",          fb.max_fallback_attempts)))     return fail(err->code, err->message);
            if ((err = read_count(root, "fallbackDelay",                fb.fallback_delay_ms)))         return fail(err->code, err->message);
            if ((err = read_bool(root,  "emergencyMode",                fb.emergency_mode)))            return fail(err->code, err->message);
            if ((err = read_unit(root,  "qualityThreshold",             fb.quality_threshold)))         return fail(err->code, err->message);
            if ((err = read_bool(root,  "enforceQualityThreshold",      fb.enforce_quality_threshold))) return fail(err->code, err->message);
            if ((err = read_bool(root,  "installDefaultRoutes",         fb.install_default_routes)))    return fail(err->code, err->message);
            if ((err = read_count(root, "providerFailureThreshold",     br.provider_failure_threshold))) return fail(err->code, err->message);
            if ((err = read_count(root, "agentFailureThreshold",        br.agent_failure_threshold)))   return fail(err->code, err->message);
            if ((err = read_count(root, "circuitBreakerCooldown",       br.cooldown_ms)))               return fail(err->code, err->message);
            if ((err = read_count(root, "healthCheckInterval",          hm.interval_ms)))               return fail(err->code, err->message);
            if ((err = read_bool(root,  "healthEventsOnTransitionOnly", hm.emit_on_transition_only)))   return fail(err->code, err->message);

            if (br.provider_failure_threshold == 0 || br.agent_failure_threshold == 0) {
                return fail(Code::InvalidValue, "failure thresholds must be at least 1");
            }
            if (hm.interval_ms == 0) return fail(Code::InvalidValue, "healthCheckInterval must be positive");

            if (const auto providers = root["monitoredProviders"]) {
                if (!providers.IsSequence()) return fail(Code::InvalidValue, "monitoredProviders must be a list");
                hm.providers.clear();
                for (const auto& p : providers) hm.providers.push_back(p.as<std::string>());
            }

            if (const auto lvl = root["logLevel"]) {
                const auto name = lvl.as<std::string>();
                const auto parsed = reroute::obs::parse_log_level(name);
                if (!parsed) return fail(Code::InvalidValue, "unknown logLevel '" + name + "'");
                rc.log_level = *parsed;
            }

            if (const auto routes = root["routes"]) {
                if (!routes.IsSequence()) return fail(Code::InvalidValue, "routes must be a list");
                for (const auto& node : routes) {
                    RouteSpec spec;
                    if ((err = read_route(node, spec))) return fail(err->code, err->message);
                    rc.routes.push_back(std::move(spec));
                }
            }
            return rc;
        }
    } // namespace

    RouterConfig Loader::defaults() {
        RouterConfig rc;
        rc.fallback = OrchestratorConfig{};          // picks defaults from constants
        rc.breaker  = BreakerConfig{};               // thresholds/cooldown from constants
        rc.health   = reroute::health::MonitorConfig{}; // interval + default roster
        return rc;
    }

    Expected<RouterConfig> Loader::load_from_file(const std::string& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return fail(Code::FileNotFound, "config file not found: " + path);
        }
        try {
            return parse(YAML::LoadFile(path));
        } catch (const YAML::Exception& e) {
            return fail(Code::ParseError, path + ": " + e.what());
        }
    }

    Expected<RouterConfig> Loader::load_from_string(const std::string& yaml) {
        try {
            return parse(YAML::Load(yaml));
        } catch (const YAML::Exception& e) {
            return fail(Code::ParseError, e.what());
        }
    }

} // namespace reroute::config
