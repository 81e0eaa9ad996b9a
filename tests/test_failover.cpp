/**
 * @file test_failover.cpp
 * @brief Tests for FallbackOrchestrator: the fallback loop and its public operations.
 *
 * Validates:
 *  - Route selection, attempt budget and priority order
 *  - Breaker skipping, exception folding, quality gate and overall deadline
 *  - Disabled mode, emergency responder and built-in routes
 *  - Metrics, events and route management round-trips
 */

#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "reroute/config/constants.hpp"
#include "reroute/routing/fallback_orchestrator.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using reroute::routing::BreakerConfig;
using reroute::routing::CircuitBreakerManager;
using reroute::routing::FallbackContext;
using reroute::routing::FallbackOrchestrator;
using reroute::routing::FallbackRoute;
using reroute::routing::OrchestratorConfig;
using reroute::routing::RouteSpec;
using reroute::routing::RouteType;
using reroute::testing::ManualClock;
using reroute::testing::RecordingObserver;
using reroute::testing::ScriptedExecutor;
using reroute::testing::make_route;
using reroute::testing::provider_failure;

namespace {

OrchestratorConfig quiet_config() {
  OrchestratorConfig c;
  c.fallback_delay_ms = 0;
  c.install_default_routes = false;
  return c;
}

/// Orchestrator wired to scripted executors, a manual clock and a recording observer.
struct Harness {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::shared_ptr<RecordingObserver> events = std::make_shared<RecordingObserver>();
  std::shared_ptr<ScriptedExecutor> providers = std::make_shared<ScriptedExecutor>(clock);
  std::shared_ptr<ScriptedExecutor> agents = std::make_shared<ScriptedExecutor>(clock);
  std::shared_ptr<ScriptedExecutor> endpoints = std::make_shared<ScriptedExecutor>(clock);
  std::unique_ptr<FallbackOrchestrator> fo;

  explicit Harness(OrchestratorConfig cfg = quiet_config(), BreakerConfig bc = BreakerConfig{}) {
    FallbackOrchestrator::Components parts;
    parts.breakers = std::make_shared<CircuitBreakerManager>(bc, clock, events);
    parts.executors.bind(RouteType::Provider, providers)
                   .bind(RouteType::Agent, agents)
                   .bind(RouteType::Endpoint, endpoints);
    parts.clock = clock;
    parts.observer = events;
    fo = std::make_unique<FallbackOrchestrator>(cfg, std::move(parts));
  }
};

std::vector<std::string> route_ids(const std::map<std::string, FallbackRoute>& m) {
  std::vector<std::string> out;
  for (const auto& kv : m) out.push_back(kv.first);
  return out;
}

} // namespace

// --------------------------- Selection and budget --------------------------

/**
 * @test Fallback_No_Matching_Route
 * @brief Nothing applicable: failure, nothing attempted, original error reported.
 */
TEST(FallbackOrchestrator, Fallback_No_Matching_Route) {
  Harness h;
  h.fo->add_fallback_route(make_route("gemini-only", "gemini", "openai", 1));

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  EXPECT_FALSE(res.success);
  EXPECT_TRUE(res.fallbacks_attempted.empty());
  ASSERT_TRUE(res.error);
  EXPECT_EQ(res.error->code, "PROVIDER_TIMEOUT");
  EXPECT_EQ(res.metadata.at("allFallbacksFailed"), "true");
  EXPECT_EQ(res.metadata.at("totalAttempts"), "0");
  EXPECT_TRUE(h.providers->calls().empty());
  EXPECT_EQ(h.fo->get_metrics().failed_fallbacks, 1u);
}

/**
 * @test Fallback_First_Fails_Second_Succeeds
 * @brief A(prio 1) fails, B(prio 2) succeeds: B wins and both are listed in order.
 */
TEST(FallbackOrchestrator, Fallback_First_Fails_Second_Succeeds) {
  Harness h;
  h.fo->add_fallback_route(make_route("B", "openai", "Y", 2));
  h.fo->add_fallback_route(make_route("A", "openai", "X", 1));
  h.providers->fail("X");

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  ASSERT_TRUE(res.success);
  ASSERT_TRUE(res.route_used);
  EXPECT_EQ(res.route_used->id, "B");
  EXPECT_EQ(res.fallbacks_attempted, (std::vector<std::string>{"A", "B"}));
  EXPECT_EQ(res.data.at("response"), "ok from Y");
  EXPECT_EQ(res.metadata.at("routeId"), "B");
  EXPECT_EQ(res.metadata.at("routeType"), "provider");
  EXPECT_EQ(res.metadata.at("target"), "Y");
  EXPECT_EQ(res.metadata.at("attemptCount"), "2");
  EXPECT_EQ(ctx.attempt, 2u);
  EXPECT_FALSE(res.error);

  // Winning route snapshot carries the updated EMA and last_used.
  EXPECT_DOUBLE_EQ(res.route_used->success_rate, 1.0);
  EXPECT_EQ(res.route_used->last_used, h.clock->now());
  EXPECT_NEAR(h.fo->get_fallback_routes().at("A").success_rate, 0.9, 1e-12);
}

/**
 * @test Fallback_Attempt_Budget
 * @brief Never more executor calls than max_fallback_attempts, however many candidates.
 */
TEST(FallbackOrchestrator, Fallback_Attempt_Budget) {
  Harness h;
  for (int i = 0; i < 8; ++i) {
    const auto t = "t" + std::to_string(i);
    h.fo->add_fallback_route(make_route("r" + std::to_string(i), "*", t, i));
    h.providers->fail(t);
  }

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  EXPECT_FALSE(res.success);
  EXPECT_EQ(h.providers->calls().size(), 3u);
  EXPECT_EQ(res.fallbacks_attempted, (std::vector<std::string>{"r0", "r1", "r2"}));
  EXPECT_EQ(res.metadata.at("routesEvaluated"), "8");
  ASSERT_TRUE(res.error);
  EXPECT_EQ(res.error->code, "PROVIDER_UNAVAILABLE");
  EXPECT_EQ(res.error->message, "t2 failed");
}

/**
 * @test Fallback_Context_Budget_Caps_Config
 * @brief A smaller caller budget wins over the configured one, and prior attempts count.
 */
TEST(FallbackOrchestrator, Fallback_Context_Budget_Caps_Config) {
  Harness h;
  for (int i = 0; i < 5; ++i) {
    const auto t = "t" + std::to_string(i);
    h.fo->add_fallback_route(make_route("r" + std::to_string(i), "*", t, i));
    h.providers->fail(t);
  }

  auto ctx = provider_failure("openai");
  ctx.max_attempts = 2;
  (void)h.fo->execute_fallback(ctx);
  EXPECT_EQ(h.providers->calls().size(), 2u);

  auto resumed = provider_failure("openai");
  resumed.attempt = 2; // two attempts already spent upstream
  (void)h.fo->execute_fallback(resumed);
  EXPECT_EQ(h.providers->calls().size(), 3u);
}

// --------------------------- Breakers --------------------------------------

/**
 * @test Fallback_Skips_Open_Breaker
 * @brief A route whose target breaker is open is skipped without spending budget.
 */
TEST(FallbackOrchestrator, Fallback_Skips_Open_Breaker) {
  OrchestratorConfig cfg = quiet_config();
  Harness h(cfg, BreakerConfig{1, 1, 60000});
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->add_fallback_route(make_route("B", "*", "Y", 2));
  h.providers->fail("X");

  auto first = provider_failure("openai");
  ASSERT_TRUE(h.fo->execute_fallback(first).success); // X fails once -> open

  h.events->clear();
  auto second = provider_failure("openai");
  const auto res = h.fo->execute_fallback(second);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.fallbacks_attempted, (std::vector<std::string>{"B"}));
  const auto skipped = h.events->of<reroute::obs::RouteSkipped>();
  ASSERT_EQ(skipped.size(), 1u);
  EXPECT_EQ(skipped[0].route_id, "A");

  const auto status = h.fo->get_circuit_breaker_status();
  EXPECT_EQ(status.at("X").state, reroute::routing::CircuitState::Open);
  EXPECT_EQ(status.count("Y"), 0u); // success on an unknown target creates no entry
}

/**
 * @test Fallback_Agent_Failures_Use_Agent_Threshold
 * @brief Agent route failures open the breaker at the agent threshold.
 */
TEST(FallbackOrchestrator, Fallback_Agent_Failures_Use_Agent_Threshold) {
  Harness h(quiet_config(), BreakerConfig{5, 2, 60000});
  h.fo->add_fallback_route(make_route("downgrade", "gpt-4", "gpt-3.5-turbo", 1, RouteType::Agent));
  h.agents->fail("gpt-3.5-turbo", "MODEL_UNAVAILABLE");

  for (int i = 0; i < 2; ++i) {
    FallbackContext ctx;
    ctx.original_agent = "gpt-4";
    (void)h.fo->execute_fallback(ctx);
  }
  EXPECT_EQ(h.fo->get_circuit_breaker_status().at("gpt-3.5-turbo").state,
            reroute::routing::CircuitState::Open);
}

// --------------------------- Executor behaviour ----------------------------

/**
 * @test Fallback_Executor_Exception_Is_Failed_Attempt
 * @brief A throwing executor counts as a failure and the loop continues.
 */
TEST(FallbackOrchestrator, Fallback_Executor_Exception_Is_Failed_Attempt) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->add_fallback_route(make_route("B", "*", "Y", 2));
  h.providers->raise("X", "socket closed");

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.route_used->id, "B");
  const auto failed = h.events->of<reroute::obs::RouteFailed>();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].error, "socket closed");
  EXPECT_EQ(h.fo->get_circuit_breaker_status().at("X").failures, 1u);
}

/**
 * @test Fallback_Success_Rate_Converges
 * @brief Long runs of outcomes drive the route EMA toward 1.0 / 0.0.
 */
TEST(FallbackOrchestrator, Fallback_Success_Rate_Converges) {
  Harness h(quiet_config(), BreakerConfig{1000, 1000, 60000});
  auto good = make_route("good", "openai", "claude", 1);
  good.success_rate = 0.2;
  h.fo->add_fallback_route(good);
  auto bad = make_route("bad", "gemini", "openai", 1);
  h.fo->add_fallback_route(bad);
  h.providers->fail("openai");

  for (int i = 0; i < 200; ++i) {
    auto a = provider_failure("openai");
    (void)h.fo->execute_fallback(a);
    auto b = provider_failure("gemini");
    (void)h.fo->execute_fallback(b);
  }
  const auto routes = h.fo->get_fallback_routes();
  EXPECT_NEAR(routes.at("good").success_rate, 1.0, 1e-6);
  EXPECT_NEAR(routes.at("bad").success_rate, 0.0, 1e-6);
}

/**
 * @test Fallback_Delay_Before_Each_Attempt
 * @brief The configured pause runs once per attempted route, through the clock.
 */
TEST(FallbackOrchestrator, Fallback_Delay_Before_Each_Attempt) {
  OrchestratorConfig cfg = quiet_config();
  cfg.fallback_delay_ms = 1000;
  Harness h(cfg);
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->add_fallback_route(make_route("B", "*", "Y", 2));
  h.providers->fail("X");

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(h.clock->slept(), 2000ms);
  EXPECT_EQ(res.total_duration, 2000ms);
}

/**
 * @test Fallback_Deadline_Stops_Loop
 * @brief Once the context timeout has elapsed no further route is attempted.
 */
TEST(FallbackOrchestrator, Fallback_Deadline_Stops_Loop) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->add_fallback_route(make_route("B", "*", "Y", 2));
  h.providers->fail("X");
  h.providers->cost("X", 500ms);

  auto ctx = provider_failure("openai");
  ctx.timeout = 300ms;
  const auto res = h.fo->execute_fallback(ctx);

  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.fallbacks_attempted, (std::vector<std::string>{"A"}));
  EXPECT_EQ(res.metadata.at("deadlineExceeded"), "true");
  EXPECT_EQ(h.providers->calls(), (std::vector<std::string>{"X"}));
}

/**
 * @test Fallback_Quality_Gate
 * @brief With enforcement on, a low-quality success is a failure and the next route is tried.
 */
TEST(FallbackOrchestrator, Fallback_Quality_Gate) {
  OrchestratorConfig cfg = quiet_config();
  cfg.enforce_quality_threshold = true;
  cfg.quality_threshold = 0.7;
  Harness h(cfg);
  h.fo->add_fallback_route(make_route("cheap", "*", "X", 1));
  h.fo->add_fallback_route(make_route("good", "*", "Y", 2));
  h.providers->succeed("X", 0.4);
  h.providers->succeed("Y", 0.9);

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.route_used->id, "good");
  ASSERT_TRUE(res.quality_score);
  EXPECT_DOUBLE_EQ(*res.quality_score, 0.9);
  const auto failed = h.events->of<reroute::obs::RouteFailed>();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].route_id, "cheap");
}

/**
 * @test Fallback_Quality_Not_Enforced_By_Default
 * @brief Without enforcement the first success wins regardless of its quality.
 */
TEST(FallbackOrchestrator, Fallback_Quality_Not_Enforced_By_Default) {
  Harness h;
  h.fo->add_fallback_route(make_route("cheap", "*", "X", 1));
  h.providers->succeed("X", 0.1);

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);
  ASSERT_TRUE(res.success);
  EXPECT_DOUBLE_EQ(*res.quality_score, 0.1);
}

// --------------------------- Switches --------------------------------------

/**
 * @test Fallback_Disabled_Returns_Immediately
 * @brief Disabled: no executor runs, the result is flagged and the call is counted.
 */
TEST(FallbackOrchestrator, Fallback_Disabled_Returns_Immediately) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->set_fallback_enabled(false);

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);

  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.metadata.at("fallbackDisabled"), "true");
  ASSERT_TRUE(res.error);
  EXPECT_EQ(res.error->message, "Fallback routing is disabled");
  EXPECT_TRUE(res.fallbacks_attempted.empty());
  EXPECT_TRUE(h.providers->calls().empty());
  EXPECT_EQ(h.fo->get_metrics().total_fallbacks, 1u);
  EXPECT_FALSE(h.fo->config().enable_fallbacks);

  const auto toggles = h.events->of<reroute::obs::FallbackToggled>();
  ASSERT_EQ(toggles.size(), 1u);
  EXPECT_FALSE(toggles[0].enabled);
}

/**
 * @test Fallback_Emergency_Mode
 * @brief Emergency mode with nothing else applicable yields the canned degraded payload.
 */
TEST(FallbackOrchestrator, Fallback_Emergency_Mode) {
  OrchestratorConfig cfg = quiet_config();
  cfg.install_default_routes = true;
  Harness h(cfg);

  auto ctx = provider_failure("unknown-provider", "SOMETHING_ELSE");
  ctx.error.status = 400;
  auto off = h.fo->execute_fallback(ctx);
  EXPECT_FALSE(off.success); // emergency route not armed yet

  h.fo->set_emergency_mode(true);
  const auto before = h.fo->get_metrics().emergency_activations;
  auto ctx2 = provider_failure("unknown-provider", "SOMETHING_ELSE");
  ctx2.error.status = 400;
  const auto res = h.fo->execute_fallback(ctx2);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.data.at("emergency"), "true");
  EXPECT_EQ(res.data.at("status"), "emergency_mode");
  ASSERT_TRUE(res.quality_score);
  EXPECT_DOUBLE_EQ(*res.quality_score, 0.3);
  EXPECT_EQ(res.route_used->id, reroute::config::constants::EMERGENCY_ROUTE_ID);
  EXPECT_EQ(h.fo->get_metrics().emergency_activations, before + 1);
  EXPECT_TRUE(h.endpoints->calls().empty()); // served without the endpoint delegate
  EXPECT_EQ(h.events->of<reroute::obs::EmergencyModeActivated>().size(), 1u);
}

/**
 * @test Fallback_Emergency_Exempt_From_Quality_Gate
 * @brief The degraded emergency payload is accepted even when quality is enforced.
 */
TEST(FallbackOrchestrator, Fallback_Emergency_Exempt_From_Quality_Gate) {
  OrchestratorConfig cfg = quiet_config();
  cfg.install_default_routes = true;
  cfg.emergency_mode = true;
  cfg.enforce_quality_threshold = true;
  Harness h(cfg);

  FallbackContext ctx;
  const auto res = h.fo->execute_fallback(ctx);
  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.data.at("emergency"), "true");
}

/**
 * @test Fallback_Default_Routes_Provider_Chain
 * @brief Built-in routes send an OpenAI provider failure to Claude.
 */
TEST(FallbackOrchestrator, Fallback_Default_Routes_Provider_Chain) {
  OrchestratorConfig cfg = quiet_config();
  cfg.install_default_routes = true;
  Harness h(cfg);

  EXPECT_EQ(route_ids(h.fo->get_fallback_routes()), (std::vector<std::string>{
    "claude-to-gemini", "claude3-to-claude2", "emergency-simple-response",
    "gemini-to-openai", "gpt4-to-gpt35", "openai-to-claude"}));

  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);
  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.route_used->id, "openai-to-claude");
  EXPECT_EQ(h.fo->get_metrics().provider_switches, 1u);
}

/**
 * @test Fallback_Default_Routes_Need_Executors
 * @brief Installing built-in routes without an agent executor is a construction error.
 */
TEST(FallbackOrchestrator, Fallback_Default_Routes_Need_Executors) {
  OrchestratorConfig cfg = quiet_config();
  cfg.install_default_routes = true;
  FallbackOrchestrator::Components parts;
  parts.executors.bind(RouteType::Provider, std::make_shared<ScriptedExecutor>());
  EXPECT_THROW({ FallbackOrchestrator fo(cfg, std::move(parts)); }, std::invalid_argument);
}

// --------------------------- Route management ------------------------------

/**
 * @test Routes_Add_Get_Remove_RoundTrip
 * @brief An added route is returned unchanged; after removal it is gone.
 */
TEST(FallbackOrchestrator, Routes_Add_Get_Remove_RoundTrip) {
  Harness h;
  auto r = make_route("custom", "claude", "openai", 7);
  r.success_rate = 0.6;
  r.metadata = {{"reason", "manual"}};
  h.fo->add_fallback_route(r);

  const auto routes = h.fo->get_fallback_routes();
  ASSERT_EQ(routes.count("custom"), 1u);
  const auto& got = routes.at("custom");
  EXPECT_EQ(got.type, r.type);
  EXPECT_EQ(got.priority, r.priority);
  EXPECT_EQ(got.source, r.source);
  EXPECT_EQ(got.target, r.target);
  EXPECT_EQ(got.enabled, r.enabled);
  EXPECT_DOUBLE_EQ(got.success_rate, r.success_rate);
  EXPECT_EQ(got.metadata, r.metadata);

  EXPECT_TRUE(h.fo->remove_fallback_route("custom"));
  EXPECT_EQ(h.fo->get_fallback_routes().count("custom"), 0u);
  EXPECT_FALSE(h.fo->remove_fallback_route("custom"));

  EXPECT_EQ(h.events->of<reroute::obs::RouteAdded>().size(), 1u);
  EXPECT_EQ(h.events->of<reroute::obs::RouteRemoved>().size(), 1u);
}

/**
 * @test Routes_RoundTrip_Free_Form_Id
 * @brief Ids naming a provider path or containing spaces round-trip like any other.
 */
TEST(FallbackOrchestrator, Routes_RoundTrip_Free_Form_Id) {
  Harness h;
  for (const std::string id : {"openai/gpt-4->claude", "route 1"}) {
    auto r = make_route(id, "openai", "claude", 1);
    r.metadata = {{"model", "gpt-4"}};
    h.fo->add_fallback_route(r);

    const auto routes = h.fo->get_fallback_routes();
    ASSERT_EQ(routes.count(id), 1u) << id;
    EXPECT_EQ(routes.at(id).id, id);
    EXPECT_EQ(routes.at(id).target, "claude");
    EXPECT_EQ(routes.at(id).metadata, r.metadata);

    EXPECT_TRUE(h.fo->remove_fallback_route(id));
    EXPECT_EQ(h.fo->get_fallback_routes().count(id), 0u);
  }

  // Selected and reported under its own id.
  h.fo->add_fallback_route(make_route("openai/gpt-4->claude", "openai", "claude", 1));
  auto ctx = provider_failure("openai");
  const auto res = h.fo->execute_fallback(ctx);
  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.metadata.at("routeId"), "openai/gpt-4->claude");
}

/**
 * @test Routes_Many_Custom_Routes
 * @brief Hundreds of custom routes can be registered.
 */
TEST(FallbackOrchestrator, Routes_Many_Custom_Routes) {
  Harness h;
  for (int i = 0; i < 300; ++i) {
    h.fo->add_fallback_route(make_route("custom-" + std::to_string(i), "openai", "claude", 10 + i));
  }
  EXPECT_EQ(h.fo->get_fallback_routes().size(), 300u);
}

/**
 * @test Routes_Throwing_Condition_Is_Reported
 * @brief A condition that throws excludes its route and publishes routeConditionFailed.
 */
TEST(FallbackOrchestrator, Routes_Throwing_Condition_Is_Reported) {
  Harness h;
  auto broken = make_route("broken", "openai", "X", 1);
  broken.condition = [](const FallbackContext&) -> bool { throw std::runtime_error("lookup table missing"); };
  h.fo->add_fallback_route(broken);
  h.fo->add_fallback_route(make_route("sound", "openai", "Y", 2));

  auto ctx = provider_failure("openai");
  ctx.request_id = "req-42";
  const auto res = h.fo->execute_fallback(ctx);

  ASSERT_TRUE(res.success);
  EXPECT_EQ(res.fallbacks_attempted, (std::vector<std::string>{"sound"}));
  EXPECT_EQ(h.providers->calls(), (std::vector<std::string>{"Y"}));

  const auto failed = h.events->of<reroute::obs::RouteConditionFailed>();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].request_id, "req-42");
  EXPECT_EQ(failed[0].route_id, "broken");
  EXPECT_EQ(failed[0].error, "lookup table missing");
}

/**
 * @test Routes_Add_Rejections
 * @brief Malformed routes and types without an executor throw std::invalid_argument.
 */
TEST(FallbackOrchestrator, Routes_Add_Rejections) {
  Harness h;
  EXPECT_THROW(h.fo->add_fallback_route(make_route("", "*", "X", 1)), std::invalid_argument);
  EXPECT_THROW(h.fo->add_fallback_route(make_route("no-target", "*", "", 1)), std::invalid_argument);
  EXPECT_THROW(h.fo->add_fallback_route(make_route("m", "*", "gpt-4o-mini", 1, RouteType::Model)),
               std::invalid_argument);

  RouteSpec spec;
  spec.id = "named-route";
  spec.target = "gemini";
  spec.condition = "sometimes";
  EXPECT_THROW(h.fo->add_fallback_route(spec), std::invalid_argument);

  spec.condition = "provider_error";
  h.fo->add_fallback_route(spec);
  EXPECT_EQ(h.fo->get_fallback_routes().count("named-route"), 1u);
}

// --------------------------- Metrics and events ----------------------------

/**
 * @test Metrics_Snapshot_Is_A_Copy
 * @brief Mutating a returned Metrics value leaves the internal counters untouched.
 */
TEST(FallbackOrchestrator, Metrics_Snapshot_Is_A_Copy) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  auto ctx = provider_failure("openai");
  (void)h.fo->execute_fallback(ctx);

  auto m = h.fo->get_metrics();
  const auto original = m;
  m.total_fallbacks = 999;
  m.routes_used["A"] = 999;
  m.routes_used["ghost"] = 1;

  EXPECT_EQ(h.fo->get_metrics(), original);
  EXPECT_EQ(original.routes_used.at("A"), 1u);
}

/**
 * @test Metrics_Reset
 * @brief reset_metrics() zeroes every counter and publishes metricsReset.
 */
TEST(FallbackOrchestrator, Metrics_Reset) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  auto ctx = provider_failure("openai");
  (void)h.fo->execute_fallback(ctx);

  h.fo->reset_metrics();
  EXPECT_EQ(h.fo->get_metrics(), reroute::obs::Metrics{});
  EXPECT_EQ(h.events->of<reroute::obs::MetricsReset>().size(), 1u);
}

/**
 * @test Events_Success_Sequence
 * @brief Publication order for one failed attempt followed by a success.
 */
TEST(FallbackOrchestrator, Events_Success_Sequence) {
  Harness h(quiet_config(), BreakerConfig{1, 1, 60000});
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.fo->add_fallback_route(make_route("B", "*", "Y", 2));
  h.providers->fail("X");
  h.events->clear();

  auto ctx = provider_failure("openai");
  (void)h.fo->execute_fallback(ctx);

  EXPECT_EQ(h.events->names(), (std::vector<std::string>{
    "routeAttempted", "circuitBreakerOpened", "routeFailed", "routeAttempted", "fallbackSuccess"}));
  const auto ok = h.events->of<reroute::obs::FallbackSuccess>();
  ASSERT_EQ(ok.size(), 1u);
  EXPECT_EQ(ok[0].route.id, "B");
  EXPECT_EQ(ok[0].context.request_id, "req-1");
}

/**
 * @test Events_Failure_Lists_Attempts
 * @brief fallbackFailed carries the ids of the routes actually tried.
 */
TEST(FallbackOrchestrator, Events_Failure_Lists_Attempts) {
  Harness h;
  h.fo->add_fallback_route(make_route("A", "*", "X", 1));
  h.providers->fail("X");

  auto ctx = provider_failure("openai");
  (void)h.fo->execute_fallback(ctx);

  const auto failed = h.events->of<reroute::obs::FallbackFailed>();
  ASSERT_EQ(failed.size(), 1u);
  EXPECT_EQ(failed[0].routes_attempted, (std::vector<std::string>{"A"}));
  EXPECT_FALSE(failed[0].result.success);
}

/**
 * @test Health_Absent_Without_Monitor
 * @brief Without a monitor the provider health view is empty.
 */
TEST(FallbackOrchestrator, Health_Absent_Without_Monitor) {
  Harness h;
  EXPECT_TRUE(h.fo->get_provider_health().empty());
}
