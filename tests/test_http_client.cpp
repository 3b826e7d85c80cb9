/**
 * @file test_http_client.cpp
 * @brief Tests for RetryingHttpClient against a scripted transport and a manual clock.
 *
 * Validates:
 *  - Retriable statuses back off geometrically and retry; success reports attempts_used
 *  - Exhaustion → RetryExhausted with last status/kind; terminal statuses → Upstream
 *  - Breaker opens after repeated failures and then rejects with zero I/O
 *  - HALF_OPEN admits one request; concurrent callers are rejected
 *  - Limiter rejections never reach the transport
 *  - Read-through GET cache, default headers, input validation
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <vector>

#include "hearth/cache/ttl_cache.hpp"
#include "hearth/net/http_client.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/resilience/circuit_breaker.hpp"
#include "hearth/version.hpp"
#include "support/fakes.hpp"

using namespace std::chrono_literals;
using hearth::core::ErrorKind;
using hearth::net::HttpClientConfig;
using hearth::net::RequestOptions;
using hearth::net::RetryingHttpClient;
using hearth::net::RetryPolicy;
using hearth::net::TransportErrc;
using hearth::resilience::BreakerConfig;
using hearth::resilience::BreakerState;
using hearth::test_support::FakeHttpTransport;
using hearth::test_support::ManualClock;
using hearth::test_support::http_status;
using hearth::test_support::transport_error;

namespace {

constexpr const char* kUrl = "https://api.example.com/v1/items";

/// Client wired to fakes; every collaborator stays inspectable.
struct Harness {
  explicit Harness(HttpClientConfig cfg = {}, BreakerConfig breaker = {5, 30000, 1})
      : transport(std::make_shared<FakeHttpTransport>()),
        breakers(std::make_shared<hearth::resilience::CircuitBreakerRegistry>(breaker, clock)),
        cache(std::make_shared<hearth::cache::TtlCache>(hearth::cache::CacheConfig{}, clock)),
        metrics(std::make_shared<hearth::obs::InMemoryMetrics>()),
        client(cfg, transport, breakers, clock, cache, hearth::obs::null_logger(), metrics) {}

  ManualClock                                               clock;
  std::shared_ptr<FakeHttpTransport>                        transport;
  std::shared_ptr<hearth::resilience::CircuitBreakerRegistry> breakers;
  std::shared_ptr<hearth::cache::TtlCache>                  cache;
  std::shared_ptr<hearth::obs::InMemoryMetrics>             metrics;
  RetryingHttpClient                                        client;
};

RequestOptions single_attempt() {
  RequestOptions o;
  o.use_retry = false;
  return o;
}

} // namespace

// --------------------------- Retries ---------------------------------------

/**
 * @test Http_Retry_Then_Success
 * @brief 503, 503, 200 → success after 3 attempts with 100 ms and 200 ms sleeps.
 */
TEST(HttpClient, Http_Retry_Then_Success) {
  Harness h;
  h.transport->push(http_status(503));
  h.transport->push(http_status(503));
  h.transport->push(http_status(200, R"({"items":[1,2]})"));

  auto r = h.client.get(kUrl);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.data["status_code"], 200);
  EXPECT_EQ(r.data["attempts_used"], 3);
  EXPECT_EQ(r.data["body"]["items"].size(), 2u);
  EXPECT_EQ(r.data["from_cache"], false);
  EXPECT_EQ(h.transport->calls(), 3u);
  EXPECT_EQ(h.clock.sleeps(), (std::vector<std::chrono::milliseconds>{100ms, 200ms}));

  const auto s = h.client.stats();
  EXPECT_EQ(s.retries, 2u);
  EXPECT_EQ(s.successful, 1u);
  EXPECT_EQ(s.total_backoff_ms, 300u);
  EXPECT_DOUBLE_EQ(h.metrics->sum("http.backoff_ms"), 300.0);
}

/**
 * @test Http_Retry_Exhausted
 * @brief Three 503s → RetryExhausted carrying the last status; no sleep after the final attempt.
 */
TEST(HttpClient, Http_Retry_Exhausted) {
  Harness h;
  for (int i = 0; i < 3; ++i) h.transport->push(http_status(503));

  auto r = h.client.get(kUrl);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::RetryExhausted);
  EXPECT_EQ(r.data["attempts_used"], 3);
  EXPECT_EQ(r.data["last_status"], 503);
  EXPECT_EQ(r.data["last_error_kind"], "UpstreamError");
  EXPECT_EQ(r.data["dependency"], "api.example.com:443");
  EXPECT_EQ(h.clock.sleeps().size(), 2u);
}

/**
 * @test Http_Transport_Timeout_Is_Retried
 * @brief Timeout then 200 → success on attempt 2.
 */
TEST(HttpClient, Http_Transport_Timeout_Is_Retried) {
  Harness h;
  h.transport->push(transport_error(TransportErrc::Timeout, "read timed out"));

  auto r = h.client.get(kUrl);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.data["attempts_used"], 2);
  EXPECT_EQ(h.clock.sleeps(), (std::vector<std::chrono::milliseconds>{100ms}));
}

/**
 * @test Http_Exhausted_On_Connection_Errors
 * @brief Connection failures exhaust with last_status null and last_error_kind ConnectionError.
 */
TEST(HttpClient, Http_Exhausted_On_Connection_Errors) {
  Harness h;
  for (int i = 0; i < 3; ++i) h.transport->push(transport_error(TransportErrc::Connection, "refused"));

  auto r = h.client.post(kUrl);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::RetryExhausted);
  EXPECT_TRUE(r.data["last_status"].is_null());
  EXPECT_EQ(r.data["last_error_kind"], "ConnectionError");
  EXPECT_EQ(r.data["last_error"], "refused");
}

/**
 * @test Http_Terminal_Status_Not_Retried
 * @brief 404 is returned immediately as Upstream.
 */
TEST(HttpClient, Http_Terminal_Status_Not_Retried) {
  Harness h;
  h.transport->push(http_status(404, R"({"detail":"missing"})"));

  auto r = h.client.get(kUrl);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::Upstream);
  EXPECT_EQ(r.data["status_code"], 404);
  EXPECT_EQ(r.data["body"]["detail"], "missing");
  EXPECT_EQ(h.transport->calls(), 1u);
  EXPECT_TRUE(h.clock.sleeps().empty());
}

/**
 * @test Http_Protocol_Error_Is_Terminal
 * @brief Unparseable response → Connection without retry.
 */
TEST(HttpClient, Http_Protocol_Error_Is_Terminal) {
  Harness h;
  h.transport->push(transport_error(TransportErrc::Protocol, "bad status line"));

  auto r = h.client.get(kUrl);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::Connection);
  EXPECT_EQ(h.transport->calls(), 1u);
}

/**
 * @test Http_No_Retry_Returns_Underlying_Kind
 * @brief use_retry=false makes exactly one attempt and reports its own kind.
 */
TEST(HttpClient, Http_No_Retry_Returns_Underlying_Kind) {
  Harness h;
  h.transport->push(transport_error(TransportErrc::Timeout, "deadline"));

  auto r = h.client.get(kUrl, single_attempt());
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::Timeout);
  EXPECT_EQ(r.data["attempts_used"], 1);
  EXPECT_EQ(h.transport->calls(), 1u);
}

// --------------------------- Admission -------------------------------------

/**
 * @test Http_Breaker_Opens_Then_Rejects_Without_IO
 * @brief Threshold 3: three failed calls open the breaker; the fourth does no I/O.
 */
TEST(HttpClient, Http_Breaker_Opens_Then_Rejects_Without_IO) {
  Harness h({}, BreakerConfig{3, 30000, 1});
  for (int i = 0; i < 3; ++i) {
    h.transport->push(http_status(500));
    EXPECT_FALSE(h.client.get(kUrl, single_attempt()).success);
  }
  ASSERT_EQ(h.breakers->get("api.example.com:443")->state(), BreakerState::Open);

  auto r = h.client.get(kUrl, single_attempt());
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::CircuitOpen);
  EXPECT_EQ(r.data["state"], "OPEN");
  EXPECT_EQ(h.transport->calls(), 3u);
  EXPECT_EQ(h.client.stats().circuit_rejected, 1u);
}

/**
 * @test Http_Breaker_Half_Open_Admits_One_Request
 * @brief After recovery_timeout one request reaches the transport; a request issued while
 *        it is outstanding is rejected without I/O. Its failure reopens the breaker.
 */
TEST(HttpClient, Http_Breaker_Half_Open_Admits_One_Request) {
  Harness h({}, BreakerConfig{1, 30000, 1});
  h.transport->push(http_status(500));
  EXPECT_FALSE(h.client.get(kUrl, single_attempt()).success);
  auto breaker = h.breakers->get("api.example.com:443");
  ASSERT_EQ(breaker->state(), BreakerState::Open);

  h.clock.advance(30001ms);
  ASSERT_EQ(breaker->state(), BreakerState::HalfOpen);

  hearth::core::OperationResult concurrent;
  h.transport->on_send([&](const hearth::net::HttpRequest&) {
    h.transport->on_send(nullptr);
    concurrent = h.client.get(kUrl, single_attempt());
  });
  h.transport->push(http_status(503));
  auto trial = h.client.get(kUrl, single_attempt());

  EXPECT_FALSE(trial.success);
  EXPECT_EQ(trial.error_kind, ErrorKind::Upstream);
  EXPECT_FALSE(concurrent.success);
  EXPECT_EQ(concurrent.error_kind, ErrorKind::CircuitOpen);
  EXPECT_EQ(concurrent.data["state"], "HALF_OPEN");
  EXPECT_EQ(h.transport->calls(), 2u);

  EXPECT_EQ(breaker->state(), BreakerState::Open);
  EXPECT_EQ(h.client.get(kUrl, single_attempt()).error_kind, ErrorKind::CircuitOpen);
  EXPECT_EQ(h.transport->calls(), 2u);
  EXPECT_EQ(h.client.stats().circuit_rejected, 2u);
}

/**
 * @test Http_Breaker_Dependency_Override
 * @brief options.dependency selects the breaker instead of host:port.
 */
TEST(HttpClient, Http_Breaker_Dependency_Override) {
  Harness h({}, BreakerConfig{1, 30000, 1});
  RequestOptions o = single_attempt();
  o.dependency = "billing";
  h.transport->push(http_status(502));
  EXPECT_FALSE(h.client.get(kUrl, o).success);

  EXPECT_EQ(h.breakers->get("billing")->state(), BreakerState::Open);
  EXPECT_EQ(h.breakers->find("api.example.com:443"), nullptr);
  EXPECT_EQ(h.client.get(kUrl, o).error_kind, ErrorKind::CircuitOpen);
  EXPECT_TRUE(h.client.get(kUrl).success);
}

/**
 * @test Http_RateLimit_Before_Transport
 * @brief Ceiling 2 per window: the third call is rejected locally.
 */
TEST(HttpClient, Http_RateLimit_Before_Transport) {
  HttpClientConfig cfg;
  cfg.rate = {2, 1000};
  Harness h(cfg);

  EXPECT_TRUE(h.client.get(kUrl).success);
  EXPECT_TRUE(h.client.get(kUrl).success);
  auto r = h.client.get(kUrl);
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error_kind, ErrorKind::RateLimit);
  EXPECT_EQ(h.transport->calls(), 2u);

  h.clock.advance(1000ms);
  EXPECT_TRUE(h.client.get(kUrl).success);
}

// --------------------------- Cache / headers / validation ------------------

/**
 * @test Http_Get_Cache_ReadThrough
 * @brief Cached GET is served without I/O until its TTL elapses.
 */
TEST(HttpClient, Http_Get_Cache_ReadThrough) {
  Harness h;
  RequestOptions o;
  o.cache_ttl_s = 60;
  h.transport->push(http_status(200, R"({"v":1})"));

  auto first = h.client.get(kUrl, o);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.data["from_cache"], false);

  auto second = h.client.get(kUrl, o);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(second.data["from_cache"], true);
  EXPECT_EQ(second.data["body"]["v"], 1);
  EXPECT_EQ(h.transport->calls(), 1u);

  h.clock.advance(61s);
  auto third = h.client.get(kUrl, o);
  ASSERT_TRUE(third.success);
  EXPECT_EQ(third.data["from_cache"], false);
  EXPECT_EQ(h.transport->calls(), 2u);

  // Non-GET methods never use the cache.
  EXPECT_TRUE(h.client.post(kUrl, o).success);
  EXPECT_EQ(h.transport->calls(), 3u);
}

/**
 * @test Http_Default_Headers
 * @brief User-Agent, Accept, Content-Type and correlation id are set; caller headers win.
 */
TEST(HttpClient, Http_Default_Headers) {
  Harness h;
  RequestOptions o;
  o.correlation_id = "abc123";
  o.json_body = {{"name", "widget"}};
  o.headers.emplace("accept", "text/plain");

  ASSERT_TRUE(h.client.request("post", kUrl, o).success);
  const auto reqs = h.transport->requests();
  ASSERT_EQ(reqs.size(), 1u);
  const auto& req = reqs[0];
  EXPECT_EQ(req.method, "POST");
  EXPECT_EQ(req.url.target, "/v1/items");
  EXPECT_EQ(req.headers.at("User-Agent"), hearth::user_agent);
  EXPECT_EQ(req.headers.at("Accept"), "text/plain");
  EXPECT_EQ(req.headers.at("content-type"), "application/json");
  EXPECT_EQ(req.headers.at("X-Correlation-ID"), "abc123");
  EXPECT_EQ(req.body, R"({"name":"widget"})");
  EXPECT_EQ(req.timeout, 30000ms);
}

/**
 * @test Http_Validation_Errors
 * @brief Bad method, URL, scheme, timeout or TTL → Validation with no I/O.
 */
TEST(HttpClient, Http_Validation_Errors) {
  Harness h;
  EXPECT_EQ(h.client.request("TRACE", kUrl).error_kind, ErrorKind::Validation);
  EXPECT_EQ(h.client.get("not a url").error_kind, ErrorKind::Validation);
  EXPECT_EQ(h.client.get("wss://api.example.com/ws").error_kind, ErrorKind::Validation);

  RequestOptions slow;
  slow.timeout = 61s;
  EXPECT_EQ(h.client.get(kUrl, slow).error_kind, ErrorKind::Validation);

  RequestOptions bad_ttl;
  bad_ttl.cache_ttl_s = -5;
  EXPECT_EQ(h.client.get(kUrl, bad_ttl).error_kind, ErrorKind::Validation);
  EXPECT_EQ(h.transport->calls(), 0u);
}

/**
 * @test Http_Text_Body_Passthrough
 * @brief Non-JSON bodies are returned as strings; empty bodies as null.
 */
TEST(HttpClient, Http_Text_Body_Passthrough) {
  Harness h;
  h.transport->push(http_status(200, "plain text"));
  h.transport->push(http_status(204, ""));

  EXPECT_EQ(h.client.get(kUrl).data["body"], "plain text");
  EXPECT_TRUE(h.client.del(kUrl).data["body"].is_null());
}

/**
 * @test Http_Configure_Retry
 * @brief Valid policies replace the current one; invalid ones leave it untouched.
 */
TEST(HttpClient, Http_Configure_Retry) {
  Harness h;
  RetryPolicy p;
  p.max_attempts = 1;
  ASSERT_TRUE(h.client.configure_retry(p));
  EXPECT_EQ(h.client.retry_policy().max_attempts, 1u);

  h.transport->push(http_status(503));
  auto r = h.client.get(kUrl);
  EXPECT_EQ(r.error_kind, ErrorKind::RetryExhausted);
  EXPECT_EQ(r.data["attempts_used"], 1);

  p.max_attempts = 50;
  auto bad = h.client.configure_retry(p);
  ASSERT_FALSE(bad);
  EXPECT_NE(bad.error().find("max_attempts"), std::string::npos);
  EXPECT_EQ(h.client.retry_policy().max_attempts, 1u);
}

/**
 * @test Http_Reset_Clears_Counters
 * @brief reset() zeroes counters and forgets the limiter window.
 */
TEST(HttpClient, Http_Reset_Clears_Counters) {
  HttpClientConfig cfg;
  cfg.rate = {1, 1000};
  Harness h(cfg);

  EXPECT_TRUE(h.client.get(kUrl).success);
  EXPECT_EQ(h.client.get(kUrl).error_kind, ErrorKind::RateLimit);
  h.client.reset();
  EXPECT_EQ(h.client.stats().requests, 0u);
  EXPECT_TRUE(h.client.get(kUrl).success);
  EXPECT_EQ(h.client.stats_json()["requests"], 1);
}
