/**
 * @file test_singleton_registry.cpp
 * @brief Tests for SingletonRegistry: lazy construction, identity, type safety, removal.
 *
 * Validates:
 *  - get_or_create runs the factory once per live binding
 *  - Heterogeneous lookup with std::string_view names
 *  - TypeMismatch / NotFound / Invalid / FactoryFailed error codes
 *  - remove() / clear() drop bindings; later get_or_create rebuilds
 *  - Instances released by remove()/replace() are destroyed outside the registry lock
 *  - Concurrent get_or_create converges on one instance
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "hearth/core/singleton_registry.hpp"
#include "support/fakes.hpp"

using hearth::core::RegistryErr;
using hearth::core::SingletonRegistry;
using hearth::test_support::ManualClock;

namespace {
struct Counter {
  int value = 0;
};
struct Other {};

/// On destruction, checks from another thread whether the registry lock is free.
struct LockCheckOnDestroy {
  SingletonRegistry* reg = nullptr;
  bool*              lock_free = nullptr;
  ~LockCheckOnDestroy() {
    auto done = std::make_shared<std::promise<void>>();
    auto f = done->get_future();
    std::thread([r = reg, done] {
      (void)r->size();
      done->set_value();
    }).detach();
    *lock_free = f.wait_for(std::chrono::seconds(1)) == std::future_status::ready;
  }
};
} // namespace

// --------------------------- Construction ----------------------------------

/**
 * @test Registry_Construct_Empty
 * @brief Fresh registry has no bindings and zero counters.
 */
TEST(SingletonRegistry, Registry_Construct_Empty) {
  SingletonRegistry reg;
  EXPECT_EQ(reg.size(), 0u);
  EXPECT_TRUE(reg.names().empty());
  EXPECT_FALSE(reg.exists("cache"));
  EXPECT_EQ(reg.stats().creates, 0u);
}

/**
 * @test Registry_GetOrCreate_Idempotent
 * @brief Second call returns the same instance without invoking the factory.
 */
TEST(SingletonRegistry, Registry_GetOrCreate_Idempotent) {
  SingletonRegistry reg;
  int factory_calls = 0;
  auto factory = [&] {
    ++factory_calls;
    return std::make_shared<Counter>();
  };

  auto a = reg.get_or_create<Counter>("counter", factory);
  ASSERT_TRUE(a);
  (*a)->value = 7;

  auto b = reg.get_or_create<Counter>(std::string_view{"counter"}, factory);
  ASSERT_TRUE(b);
  EXPECT_EQ(a->get(), b->get());
  EXPECT_EQ((*b)->value, 7);
  EXPECT_EQ(factory_calls, 1);

  const auto s = reg.stats();
  EXPECT_EQ(s.creates, 1u);
  EXPECT_EQ(s.hits, 1u);
}

/**
 * @test Registry_CreatedAt_UsesClock
 * @brief Creation time comes from the injected clock.
 */
TEST(SingletonRegistry, Registry_CreatedAt_UsesClock) {
  ManualClock clock;
  SingletonRegistry reg(clock);
  const auto t0 = clock.now();

  ASSERT_TRUE(reg.get_or_create<Counter>("counter", [] { return std::make_shared<Counter>(); }));
  auto at = reg.created_at("counter");
  ASSERT_TRUE(at.has_value());
  EXPECT_EQ(*at, t0);
  EXPECT_FALSE(reg.created_at("missing").has_value());
}

// --------------------------- Errors ----------------------------------------

/**
 * @test Registry_TypeMismatch
 * @brief Name bound to Counter cannot be fetched as Other.
 */
TEST(SingletonRegistry, Registry_TypeMismatch) {
  SingletonRegistry reg;
  ASSERT_TRUE(reg.get_or_create<Counter>("x", [] { return std::make_shared<Counter>(); }));

  auto wrong = reg.get_or_create<Other>("x", [] { return std::make_shared<Other>(); });
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error(), RegistryErr::TypeMismatch);

  auto wrong_get = reg.get<Other>("x");
  ASSERT_FALSE(wrong_get);
  EXPECT_EQ(wrong_get.error(), RegistryErr::TypeMismatch);
}

/**
 * @test Registry_Get_NotFound_And_Invalid
 * @brief get() never constructs; empty names and null factories are rejected.
 */
TEST(SingletonRegistry, Registry_Get_NotFound_And_Invalid) {
  SingletonRegistry reg;

  auto missing = reg.get<Counter>("nope");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error(), RegistryErr::NotFound);

  auto empty = reg.get_or_create<Counter>("", [] { return std::make_shared<Counter>(); });
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error(), RegistryErr::Invalid);

  auto null = reg.get_or_create<Counter>("null", [] { return std::shared_ptr<Counter>{}; });
  ASSERT_FALSE(null);
  EXPECT_EQ(null.error(), RegistryErr::FactoryFailed);
  EXPECT_FALSE(reg.exists("null"));
  EXPECT_EQ(hearth::core::to_string(RegistryErr::FactoryFailed), "factory_failed");
}

/**
 * @test Registry_FactoryThrows_NothingRegistered
 * @brief Factory exception propagates and leaves the registry untouched.
 */
TEST(SingletonRegistry, Registry_FactoryThrows_NothingRegistered) {
  SingletonRegistry reg;
  EXPECT_THROW((void)reg.get_or_create<Counter>("boom", []() -> std::shared_ptr<Counter> {
                 throw std::runtime_error("factory failed");
               }),
               std::runtime_error);
  EXPECT_FALSE(reg.exists("boom"));

  // A later successful factory binds normally.
  EXPECT_TRUE(reg.get_or_create<Counter>("boom", [] { return std::make_shared<Counter>(); }));
}

// --------------------------- Replace / Remove / Clear ----------------------

/**
 * @test Registry_Replace_Swaps_Instance
 * @brief replace() rebinds; holders of the old instance keep it alive.
 */
TEST(SingletonRegistry, Registry_Replace_Swaps_Instance) {
  SingletonRegistry reg;
  auto first = reg.get_or_create<Counter>("c", [] { return std::make_shared<Counter>(); });
  ASSERT_TRUE(first);
  std::shared_ptr<Counter> held = *first;
  held->value = 1;

  auto fresh = std::make_shared<Counter>();
  fresh->value = 2;
  EXPECT_EQ(reg.replace("c", fresh), RegistryErr::Ok);
  EXPECT_EQ(reg.replace<Counter>("c", nullptr), RegistryErr::Invalid);

  auto now = reg.get<Counter>("c");
  ASSERT_TRUE(now);
  EXPECT_EQ((*now)->value, 2);
  EXPECT_EQ(held->value, 1);
}

/**
 * @test Registry_Remove_Then_Recreate
 * @brief After remove() the next get_or_create builds a new instance.
 */
TEST(SingletonRegistry, Registry_Remove_Then_Recreate) {
  SingletonRegistry reg;
  int factory_calls = 0;
  auto factory = [&] {
    ++factory_calls;
    return std::make_shared<Counter>();
  };

  auto a = reg.get_or_create<Counter>("c", factory);
  ASSERT_TRUE(a);
  EXPECT_TRUE(reg.remove("c"));
  EXPECT_FALSE(reg.remove("c"));
  EXPECT_FALSE(reg.exists("c"));

  auto b = reg.get_or_create<Counter>("c", factory);
  ASSERT_TRUE(b);
  EXPECT_NE(a->get(), b->get());
  EXPECT_EQ(factory_calls, 2);
}

/**
 * @test Registry_Remove_Destroys_Outside_Lock
 * @brief The last reference dropped by remove() or replace() is released after unlocking.
 */
TEST(SingletonRegistry, Registry_Remove_Destroys_Outside_Lock) {
  SingletonRegistry reg;
  bool lock_free = false;
  auto make_lock_check = [&] {
    auto p = std::make_shared<LockCheckOnDestroy>();
    p->reg = &reg;
    p->lock_free = &lock_free;
    return p;
  };
  ASSERT_TRUE(reg.get_or_create<LockCheckOnDestroy>(
      "ws", make_lock_check));
  ASSERT_TRUE(reg.remove("ws"));
  EXPECT_TRUE(lock_free);

  lock_free = false;
  ASSERT_TRUE(reg.get_or_create<LockCheckOnDestroy>(
      "ws", make_lock_check));
  ASSERT_EQ(reg.replace("ws", std::make_shared<Counter>()), RegistryErr::Ok);
  EXPECT_TRUE(lock_free);
}

/**
 * @test Registry_Clear_And_Names
 * @brief names() lists every binding; clear() drops them all.
 */
TEST(SingletonRegistry, Registry_Clear_And_Names) {
  SingletonRegistry reg;
  for (const char* n : {"cache", "http_client", "websocket"}) {
    ASSERT_TRUE(reg.get_or_create<Counter>(n, [] { return std::make_shared<Counter>(); }));
  }
  auto names = reg.names();
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"cache", "http_client", "websocket"}));

  EXPECT_EQ(reg.clear(), 3u);
  EXPECT_EQ(reg.size(), 0u);
  EXPECT_EQ(reg.stats().removes, 3u);
}

// --------------------------- Concurrency -----------------------------------

/**
 * @test Registry_Concurrent_GetOrCreate_SingleInstance
 * @brief Many threads racing on one name observe exactly one instance.
 */
TEST(SingletonRegistry, Registry_Concurrent_GetOrCreate_SingleInstance) {
  SingletonRegistry reg;
  std::atomic<int> factory_calls{0};
  constexpr int kThreads = 8;
  std::vector<Counter*> seen(kThreads, nullptr);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto r = reg.get_or_create<Counter>("shared", [&] {
        factory_calls.fetch_add(1);
        return std::make_shared<Counter>();
      });
      if (r) seen[t] = r->get();
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_EQ(factory_calls.load(), 1);
  for (auto* p : seen) EXPECT_EQ(p, seen[0]);
  EXPECT_NE(seen[0], nullptr);
}
