/**
 * @file test_observability.cpp
 * @brief Tests for secret redaction, structured event lines and in-memory metrics.
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "hearth/core/result.hpp"
#include "hearth/obs/observability.hpp"

using hearth::obs::EventLogger;
using hearth::obs::InMemoryMetrics;
using hearth::obs::is_secret_key;
using hearth::obs::redact;

namespace {

/// EventLogger over a ring buffer so emitted lines can be inspected.
struct CapturedLogger {
  CapturedLogger()
      : sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16)),
        backend(std::make_shared<spdlog::logger>("capture", sink)),
        log(backend) {
    backend->set_pattern("%v");
    backend->set_level(spdlog::level::info);
  }

  nlohmann::json last() const {
    const auto lines = sink->last_formatted(1);
    if (lines.empty()) return nullptr;
    return nlohmann::json::parse(lines.back());
  }

  std::size_t count() const { return sink->last_formatted().size(); }

  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
  std::shared_ptr<spdlog::logger>                    backend;
  EventLogger                                        log;
};

} // namespace

// --------------------------- Redaction -------------------------------------

/**
 * @test Redact_Secret_Keys
 * @brief Key names containing secret markers are recognised case-insensitively.
 */
TEST(Observability, Redact_Secret_Keys) {
  for (const char* k : {"token", "Authorization", "db_password", "client_secret", "API_KEY", "Set-Cookie"}) {
    EXPECT_TRUE(is_secret_key(k)) << k;
  }
  for (const char* k : {"status", "url", "dependency", "attempts_used"}) {
    EXPECT_FALSE(is_secret_key(k)) << k;
  }
}

/**
 * @test Redact_Nested_Values
 * @brief Secrets are masked at any depth; other values pass through.
 */
TEST(Observability, Redact_Nested_Values) {
  const nlohmann::json in = {
      {"url", "https://api.example.com"},
      {"headers", {{"Authorization", "Bearer abc"}, {"Accept", "application/json"}}},
      {"items", nlohmann::json::array({{{"password", "hunter2"}}, 3})}};

  const auto out = redact(in);
  EXPECT_EQ(out["url"], "https://api.example.com");
  EXPECT_EQ(out["headers"]["Authorization"], "***");
  EXPECT_EQ(out["headers"]["Accept"], "application/json");
  EXPECT_EQ(out["items"][0]["password"], "***");
  EXPECT_EQ(out["items"][1], 3);
}

// --------------------------- EventLogger -----------------------------------

/**
 * @test Logger_Emits_Json_Line
 * @brief One JSON object per event: cid, tag, msg and redacted fields.
 */
TEST(Observability, Logger_Emits_Json_Line) {
  CapturedLogger cap;
  cap.log.log_warn("cid-1", "HTTP", "backing off", {{"attempt", 2}, {"api_key", "k-123"}});

  const auto line = cap.last();
  EXPECT_EQ(line["cid"], "cid-1");
  EXPECT_EQ(line["tag"], "HTTP");
  EXPECT_EQ(line["msg"], "backing off");
  EXPECT_EQ(line["attempt"], 2);
  EXPECT_EQ(line["api_key"], "***");
}

/**
 * @test Logger_Respects_Level
 * @brief Events below the backend level are dropped.
 */
TEST(Observability, Logger_Respects_Level) {
  CapturedLogger cap;
  cap.log.log_debug("c", "T", "hidden");
  EXPECT_EQ(cap.count(), 0u);
  cap.log.log_error("c", "T", "shown", nlohmann::json::array({1, 2}));
  ASSERT_EQ(cap.count(), 1u);
  EXPECT_EQ(cap.last()["fields"], nlohmann::json::array({1, 2}));
}

// --------------------------- Metrics ---------------------------------------

/**
 * @test Metrics_Aggregate_By_Name
 * @brief count/sum/last/unit accumulate per metric name.
 */
TEST(Observability, Metrics_Aggregate_By_Name) {
  InMemoryMetrics m;
  m.record("http.attempt_ms", 12.5, "ms");
  m.record("http.attempt_ms", 7.5, "ms");
  m.record("http.requests", 1);

  EXPECT_DOUBLE_EQ(m.sum("http.attempt_ms"), 20.0);
  EXPECT_DOUBLE_EQ(m.sum("never"), 0.0);

  const auto snap = m.snapshot();
  ASSERT_EQ(snap.size(), 2u);
  EXPECT_EQ(snap.at("http.attempt_ms").count, 2u);
  EXPECT_DOUBLE_EQ(snap.at("http.attempt_ms").last, 7.5);

  const auto j = m.to_json();
  EXPECT_EQ(j["http.requests"]["unit"], "count");
  EXPECT_EQ(j["http.attempt_ms"]["unit"], "ms");
}

// --------------------------- OperationResult -------------------------------

/**
 * @test Result_Wire_Form
 * @brief Success omits error fields; failure names its kind.
 */
TEST(Observability, Result_Wire_Form) {
  using hearth::core::ErrorKind;
  using hearth::core::OperationResult;

  const auto ok = OperationResult::ok({{"hit", true}}, "cid").to_json();
  EXPECT_EQ(ok["success"], true);
  EXPECT_EQ(ok["data"]["hit"], true);
  EXPECT_EQ(ok["correlation_id"], "cid");
  EXPECT_FALSE(ok.contains("error"));

  const auto bad = OperationResult::failure(ErrorKind::CircuitOpen, "circuit open").to_json();
  EXPECT_EQ(bad["success"], false);
  EXPECT_EQ(bad["error_kind"], "CircuitOpenError");
  EXPECT_EQ(bad["error"], "circuit open");
  EXPECT_FALSE(bad.contains("data"));
}
