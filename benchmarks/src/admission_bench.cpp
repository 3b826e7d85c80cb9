/**
 * @file admission_bench.cpp
 * @brief Microbenchmark for the per-call admission path (rate limiter, circuit breaker, cache).
 *
 * Every outbound client call passes a SlidingWindowRateLimiter check and a CircuitBreaker
 * acquire/record pair; cached GETs add a TtlCache lookup. Each is measured with 1 and 4
 * threads hammering one shared instance.
 *
 * Reports: ops/sec and ns per op (wall time over all threads).
 */

#include <atomic>
#include <barrier>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "hearth/cache/ttl_cache.hpp"
#include "hearth/resilience/circuit_breaker.hpp"
#include "hearth/resilience/rate_limiter.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "limiter@4t"
  std::size_t ops = 0;       // total operations across threads
  double      seconds = 0.0; // wall time
  double      ops_per_s = 0.0;
  double      ns_per_op = 0.0;
};

// -----------------------------------------------------------------------------
// Runner: `threads` workers each call body(thread_index, i) `per_thread` times.
// -----------------------------------------------------------------------------

Result run(std::string name, unsigned threads, std::size_t per_thread,
           const std::function<void(unsigned, std::size_t)>& body) {
  std::barrier sync(static_cast<std::ptrdiff_t>(threads + 1));
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
  using bench::print;
  using bench::run;

  constexpr std::size_t N = 200'000;   // operations per thread
  const std::vector<unsigned> thread_counts = {1, 4};

  std::cout << "Admission path microbenchmark\n";
  std::cout << "----------------------------------------------------------\n";

  for (auto threads : thread_counts) {
    const std::string suffix = "@" + std::to_string(threads) + "t";

    // Limiter sized so the window stays small: most calls evict and reject.
    hearth::resilience::SlidingWindowRateLimiter limiter({1000, 1000});
    std::atomic<uint64_t> admitted{0};
    print(run("limiter" + suffix, threads, N, [&](unsigned, std::size_t) {
      if (limiter.check_and_record()) admitted.fetch_add(1, std::memory_order_relaxed);
    }));

    // Breaker stays CLOSED: acquire + success pairs.
    hearth::resilience::CircuitBreaker breaker("bench", {});
    print(run("breaker" + suffix, threads, N, [&](unsigned, std::size_t) {
      if (breaker.try_acquire() != hearth::resilience::Admission::Rejected) breaker.record_success();
    }));

    // Cache: one set per 8 gets over a small key space.
    hearth::cache::TtlCache cache;
    const nlohmann::json value = {{"status", 200}, {"body", "ok"}};
    print(run("cache" + suffix, threads, N, [&](unsigned t, std::size_t i) {
      const std::string key = "k" + std::to_string((i + t) % 512);
      if (i % 8 == 0) {
        (void)cache.set(key, value);
      } else {
        (void)cache.get(key);
      }
    }));

    if (admitted.load() == 0) std::cerr << "limiter admitted nothing\n";
  }

  std::cout << std::flush;
  return 0;
}
