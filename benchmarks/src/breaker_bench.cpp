/**
 * @file breaker_bench.cpp
 * @brief Microbenchmark for the fallback hot path under contention.
 *
 * Measures throughput for:
 *   1) CircuitBreakerManager::is_open + record_failure/record_success pairs
 *   2) RouteRegistry::find_applicable on a populated registry
 *
 * Reports: ops/sec and ns per op for 1..N threads.
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "reroute/routing/circuit_breaker.hpp"
#include "reroute/routing/route_registry.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "breaker@4"
  std::size_t ops = 0;       // operations across all threads
  double      seconds = 0.0; // wall time
  double      ops_per_s = 0.0;
  double      ns_per_op = 0.0;
};

// -----------------------------------------------------------------------------
// Core runner: `threads` workers each call body(thread_index, i) `per_thread` times
// -----------------------------------------------------------------------------

template <class Body>
Result run(std::string name, unsigned threads, std::size_t per_thread, Body body) {
  std::barrier sync(static_cast<std::ptrdiff_t>(threads) + 1);
  std::vector<std::thread> workers;
  workers.reserve(threads);

  for (unsigned t = 0; t < threads; ++t) {
    workers.emplace_back([&, t] {
      sync.arrive_and_wait();
      for (std::size_t i = 0; i < per_thread; ++i) body(t, i);
    });
  }

  sync.arrive_and_wait();
  const auto t_start = clock::now();
  for (auto& w : workers) w.join();
  const auto t_end = clock::now();

  const double seconds = std::chrono::duration_cast<ns>(t_end - t_start).count() / 1e9;
  Result r;
  r.name      = std::move(name);
  r.ops       = threads * per_thread;
  r.seconds   = seconds;
  r.ops_per_s = (seconds > 0.0) ? (static_cast<double>(r.ops) / seconds) : 0.0;
  r.ns_per_op = (r.ops_per_s > 0.0) ? 1e9 / r.ops_per_s : 0.0;
  return r;
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(18) << r.name
            << "  ops=" << std::setw(9) << r.ops
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  ops/s=" << std::setw(12) << r.ops_per_s
            << "  ns/op=" << std::setw(10) << r.ns_per_op
            << '\n';
}

} // namespace bench

int main() {
  using namespace reroute::routing;

  constexpr std::size_t N = 200'000; // ops per thread
  const std::vector<unsigned> thread_counts = {1, 2, 4, 8};
  const std::vector<std::string> targets = {"openai", "claude", "gemini", "mistral"};

  std::cout << "Fallback hot-path microbenchmark\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto threads : thread_counts) {
    // High threshold keeps breakers closed so every op takes the full path.
    CircuitBreakerManager cb(BreakerConfig{1u << 30, 1u << 30, 60000}, nullptr, nullptr);
    auto r1 = bench::run("breaker@" + std::to_string(threads), threads, N,
                         [&](unsigned t, std::size_t i) {
      const auto& target = targets[(t + i) % targets.size()];
      if (!cb.is_open(target)) {
        if (i & 1) cb.record_failure(target);
        else       cb.record_success(target);
      }
    });
    bench::print(r1);
  }

  RouteRegistry reg;
  for (int i = 0; i < 64; ++i) {
    FallbackRoute r;
    r.id = "route-" + std::to_string(i);
    r.priority = i % 7;
    r.source = (i % 4 == 0) ? "*" : "provider-" + std::to_string(i % 8);
    r.target = "target-" + std::to_string(i);
    (void)reg.add(std::move(r));
  }
  FallbackContext ctx;
  ctx.original_provider = "provider-1";

  for (auto threads : thread_counts) {
    std::atomic<std::size_t> sink{0};
    auto r2 = bench::run("registry@" + std::to_string(threads), threads, N / 10,
                         [&](unsigned, std::size_t) {
      sink.fetch_add(reg.find_applicable(ctx).size(), std::memory_order_relaxed);
    });
    bench::print(r2);
  }

  std::cout << std::flush;
  return 0;
}
