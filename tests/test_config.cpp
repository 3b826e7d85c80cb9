/**
 * @file test_config.cpp
 * @brief Tests for the JSON configuration loader and the dotted-key provider.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "hearth/config/config_loader.hpp"

using namespace std::chrono_literals;
using hearth::config::JsonConfigProvider;
using hearth::config::Loader;

/**
 * @test Config_Defaults
 * @brief Defaults mirror the named constants.
 */
TEST(Config, Config_Defaults) {
  const auto rc = Loader::defaults();
  EXPECT_EQ(rc.http.retry.max_attempts, 3u);
  EXPECT_EQ(rc.http.rate.ceiling, 500u);
  EXPECT_EQ(rc.websocket.rate.ceiling, 300u);
  EXPECT_EQ(rc.http.timeout, 30000ms);
  EXPECT_EQ(rc.breaker.failure_threshold, 5u);
  EXPECT_EQ(rc.breaker.recovery_timeout_ms, 45000u);
  EXPECT_EQ(rc.cache_settings.default_ttl_s, 300);
  EXPECT_EQ(rc.log_level, "info");
  EXPECT_EQ(rc.document["circuit_breaker"]["failure_threshold"], 5);
}

/**
 * @test Config_Load_Overrides
 * @brief Present keys replace defaults; absent keys keep them.
 */
TEST(Config, Config_Load_Overrides) {
  const nlohmann::json doc = {
      {"retry", {{"max_attempts", 4}, {"backoff_base_ms", 200}}},
      {"http", {{"rate_limit_per_window", 50}, {"timeout_ms", 5000}}},
      {"websocket", {{"max_connections", 4}, {"allow_private_hosts", true}}},
      {"circuit_breaker", {{"failure_threshold", 3},
                           {"overrides", {{"payments:443", {{"failure_threshold", 1}}}}}}},
      {"cache", {{"max_bytes", 65536}, {"host_memory_limit_mb", 0},
                 {"cleanup_mark", 0.6}, {"evict_mark", 0.7}, {"critical_target", 0.4}}},
      {"logging", {{"level", "debug"}}}};

  auto rc = Loader::load_from_json(doc);
  ASSERT_TRUE(rc) << rc.error();
  EXPECT_EQ(rc->http.retry.max_attempts, 4u);
  EXPECT_EQ(rc->websocket.retry.backoff_base_ms, 200u);
  EXPECT_EQ(rc->http.rate.ceiling, 50u);
  EXPECT_EQ(rc->http.rate.window_ms, 1000u);
  EXPECT_EQ(rc->http.timeout, 5000ms);
  EXPECT_EQ(rc->websocket.max_connections, 4u);
  EXPECT_TRUE(rc->websocket.allow_private_hosts);
  EXPECT_EQ(rc->breaker.failure_threshold, 3u);
  ASSERT_EQ(rc->breaker_overrides.count("payments:443"), 1u);
  EXPECT_EQ(rc->breaker_overrides.at("payments:443").failure_threshold, 1u);
  EXPECT_EQ(rc->breaker_overrides.at("payments:443").recovery_timeout_ms, 45000u);
  EXPECT_EQ(rc->cache_settings.max_bytes, 65536u);
  EXPECT_EQ(rc->host_memory_limit_mb, 0u);
  EXPECT_DOUBLE_EQ(rc->cache_settings.cleanup_mark, 0.6);
  EXPECT_DOUBLE_EQ(rc->cache_settings.evict_mark, 0.7);
  EXPECT_DOUBLE_EQ(rc->cache_settings.critical_mark, 0.95);
  EXPECT_DOUBLE_EQ(rc->cache_settings.emergency_mark, 0.98);
  EXPECT_DOUBLE_EQ(rc->cache_settings.critical_target, 0.4);
  EXPECT_DOUBLE_EQ(rc->to_json()["cache"]["evict_mark"].get<double>(), 0.7);
  EXPECT_EQ(rc->log_level, "debug");
}

/**
 * @test Config_Range_Errors_Name_Key
 * @brief Out-of-range or mistyped values fail with the dotted key in the message.
 */
TEST(Config, Config_Range_Errors_Name_Key) {
  struct Case {
    nlohmann::json doc;
    std::string    key;
  };
  const Case cases[] = {
      {{{"http", {{"timeout_ms", 0}}}}, "http.timeout_ms"},
      {{{"websocket", {{"timeout_s", 120}}}}, "websocket.timeout_s"},
      {{{"websocket", {{"max_connections", 100}}}}, "websocket.max_connections"},
      {{{"websocket", {{"allow_private_hosts", "yes"}}}}, "websocket.allow_private_hosts"},
      {{{"circuit_breaker", {{"recovery_timeout_ms", 1000}}}}, "circuit_breaker.recovery_timeout_ms"},
      {{{"cache", {{"max_bytes", 10}}}}, "cache.max_bytes"},
      {{{"cache", {{"default_ttl_s", 7200}}}}, "cache.default_ttl_s"},
      {{{"cache", {{"evict_mark", 1.5}}}}, "cache.evict_mark"},
      {{{"cache", {{"cleanup_mark", 0.0}}}}, "cache.cleanup_mark"},
      {{{"cache", {{"emergency_mark", "high"}}}}, "cache.emergency_mark"},
      {{{"cache", {{"cleanup_mark", 0.9}}}}, "cache.evict_mark"},
      {{{"cache", {{"critical_mark", 0.99}}}}, "cache.emergency_mark"},
      {{{"cache", {{"critical_target", 0.8}}}}, "cache.critical_target"},
      {{{"retry", {{"backoff_multiplier", 9.0}}}}, "backoff_multiplier"},
      {{{"logging", {{"level", "loud"}}}}, "logging.level"},
      {{{"http", 5}}, "http"},
  };
  for (const auto& c : cases) {
    auto rc = Loader::load_from_json(c.doc);
    ASSERT_FALSE(rc) << c.doc.dump();
    EXPECT_NE(rc.error().find(c.key), std::string::npos) << rc.error();
  }
  EXPECT_FALSE(Loader::load_from_json(nlohmann::json::array()));
}

/**
 * @test Config_Load_File_With_Comments
 * @brief Files may carry comments; unknown sections stay visible in the document.
 */
TEST(Config, Config_Load_File_With_Comments) {
  const std::string path = ::testing::TempDir() + "hearth_config_test.json";
  {
    std::ofstream out(path);
    out << "{\n"
           "  // tighter limits for the test\n"
           "  \"http\": { \"rate_limit_per_window\": 10 },\n"
           "  \"features\": { \"beta\": true }\n"
           "}\n";
  }
  auto rc = Loader::load_from_file(path);
  ASSERT_TRUE(rc) << rc.error();
  EXPECT_EQ(rc->http.rate.ceiling, 10u);
  EXPECT_EQ(rc->document["features"]["beta"], true);
  EXPECT_EQ(rc->document["http"]["timeout_ms"], 30000);

  EXPECT_FALSE(Loader::load_from_file(path + ".missing"));
}

/**
 * @test Config_Provider_Dotted_Get
 * @brief Dotted keys walk nested objects; missing paths are nullopt.
 */
TEST(Config, Config_Provider_Dotted_Get) {
  JsonConfigProvider p(nlohmann::json{{"cache", {{"max_ttl_s", 3600}}}, {"name", "edge"}});
  EXPECT_EQ(p.get("cache.max_ttl_s").value(), 3600);
  EXPECT_EQ(p.get("name").value(), "edge");
  EXPECT_TRUE(p.get("cache").value().is_object());
  EXPECT_FALSE(p.get("cache.missing").has_value());
  EXPECT_FALSE(p.get("name.inner").has_value());
  EXPECT_FALSE(p.get("").has_value());
}
