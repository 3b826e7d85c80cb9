/**
 * @file http_client.cpp
 * @brief RetryingHttpClient request pipeline.
 */
#include "hearth/net/http_client.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

#include "hearth/version.hpp"

namespace hearth::net {

    using core::ErrorKind;
    using core::OperationResult;
    using namespace hearth::config::constants;

    namespace {

    constexpr std::array<std::string_view, 5> kMethods = {"GET", "POST", "PUT", "DELETE", "PATCH"};

    std::string upper(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    bool is_success(int status) noexcept { return status >= 200 && status <= 299; }

    /// JSON document if the body parses, otherwise the raw text (null when empty).
    nlohmann::json parse_body(const std::string& body) {
        if (body.empty()) return nullptr;
        auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded()) return body;
        return j;
    }

    nlohmann::json headers_json(const Headers& headers) {
        nlohmann::json out = nlohmann::json::object();
        for (const auto& [name, value] : headers) out[name] = value;
        return out;
    }

    } // namespace

    RetryingHttpClient::RetryingHttpClient(HttpClientConfig cfg, std::shared_ptr<HttpTransport> transport,
                                           std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                                           core::Clock& clock, std::shared_ptr<cache::TtlCache> cache,
                                           std::shared_ptr<obs::EventLogger> log,
                                           std::shared_ptr<obs::MetricsSink> metrics)
        : cfg_(std::move(cfg)),
          transport_(std::move(transport)),
          breakers_(std::move(breakers)),
          clock_(&clock),
          cache_(std::move(cache)),
          log_(std::move(log)),
          metrics_(std::move(metrics)),
          limiter_(cfg_.rate, clock),
          policy_(cfg_.retry) {}

    void RetryingHttpClient::count(std::string_view metric, double value, std::string_view unit) {
        if (metrics_) metrics_->record(metric, value, unit);
    }

    OperationResult RetryingHttpClient::fail(ErrorKind kind, std::string message, const std::string& cid,
                                             nlohmann::json details) {
        failed_.fetch_add(1, std::memory_order_relaxed);
        count("http.failure");
        return OperationResult::failure(kind, std::move(message), cid, std::move(details));
    }

    OperationResult RetryingHttpClient::request(std::string_view method, std::string_view url_text,
                                                const RequestOptions& opts) {
        const std::string& cid = opts.correlation_id;
        requests_.fetch_add(1, std::memory_order_relaxed);
        count("http.requests");

        // ---- validation ----
        const std::string verb = upper(method);
        if (std::find(kMethods.begin(), kMethods.end(), verb) == kMethods.end()) {
            return fail(ErrorKind::Validation, "unsupported HTTP method '" + verb + "'", cid);
        }
        auto url = parse_url(url_text);
        if (!url) return fail(ErrorKind::Validation, "invalid URL: " + url.error(), cid);
        if (url->scheme != "http" && url->scheme != "https") {
            return fail(ErrorKind::Validation, "HTTP client requires an http:// or https:// URL", cid);
        }
        const auto timeout = opts.timeout.count() > 0 ? opts.timeout : cfg_.timeout;
        if (timeout > std::chrono::milliseconds(HTTP_TIMEOUT_MS_MAX)) {
            return fail(ErrorKind::Validation, "timeout exceeds " + std::to_string(HTTP_TIMEOUT_MS_MAX) + " ms", cid);
        }
        if (opts.cache_ttl_s < 0) return fail(ErrorKind::Validation, "cache_ttl must not be negative", cid);

        // ---- read-through cache (bypasses limiter, breaker and retries) ----
        const bool cacheable = cache_ && verb == "GET" && opts.cache_ttl_s > 0;
        const std::string cache_key = cacheable ? "http:GET:" + std::string(url_text) : std::string{};
        if (cacheable) {
            if (auto hit = cache_->get(cache_key)) {
                cache_hits_.fetch_add(1, std::memory_order_relaxed);
                successful_.fetch_add(1, std::memory_order_relaxed);
                count("http.cache_hit");
                nlohmann::json data = std::move(*hit);
                data["from_cache"] = true;
                return OperationResult::ok(std::move(data), cid);
            }
        }

        // ---- admission ----
        if (!limiter_.check_and_record()) {
            rate_limited_.fetch_add(1, std::memory_order_relaxed);
            count("http.rate_limited");
            log_->log_warn(cid, "HTTP", "rate limit exceeded", {{"ceiling", cfg_.rate.ceiling}});
            return fail(ErrorKind::RateLimit, "HTTP client rate limit exceeded", cid,
                        {{"ceiling", cfg_.rate.ceiling}, {"window_ms", cfg_.rate.window_ms}});
        }

        const std::string dependency = opts.dependency.empty() ? url->dependency() : opts.dependency;
        auto breaker = breakers_->get(dependency);
        if (breaker->try_acquire() == resilience::Admission::Rejected) {
            circuit_rejected_.fetch_add(1, std::memory_order_relaxed);
            count("http.circuit_rejected");
            return fail(ErrorKind::CircuitOpen, "circuit open for " + dependency, cid,
                        {{"dependency", dependency}, {"state", std::string(to_string(breaker->state()))}});
        }

        // ---- attempts ----
        const RetryPolicy policy = retry_policy();
        const uint32_t attempts = opts.use_retry ? policy.max_attempts : 1;

        HttpRequest req;
        req.method  = verb;
        req.url     = *url;
        req.timeout = timeout;
        req.headers.insert_or_assign("User-Agent", hearth::user_agent);
        req.headers.insert_or_assign("Accept", "application/json");
        if (!opts.json_body.is_null()) {
            req.body = opts.json_body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            req.headers.insert_or_assign("Content-Type", "application/json");
        }
        if (!cid.empty()) req.headers.insert_or_assign("X-Correlation-ID", cid);
        for (const auto& [name, value] : opts.headers) req.headers.insert_or_assign(name, value);

        ErrorKind   last_kind = ErrorKind::Connection;
        std::string last_error;
        int         last_status = 0;
        uint32_t    used = 0;

        for (uint32_t attempt = 0; attempt < attempts; ++attempt) {
            used = attempt + 1;
            if (attempt > 0) {
                retries_.fetch_add(1, std::memory_order_relaxed);
                count("http.retries");
            }

            const auto started = clock_->now();
            auto res = transport_->send(req);
            count("http.attempt_ms",
                  std::chrono::duration<double, std::milli>(clock_->now() - started).count(), "ms");

            if (res) {
                last_status = res->status;
                if (is_success(res->status)) {
                    breaker->record_success();
                    nlohmann::json data = {{"status_code", res->status},
                                           {"headers", headers_json(res->headers)},
                                           {"body", parse_body(res->body)},
                                           {"method", verb},
                                           {"url", std::string(url_text)},
                                           {"attempts_used", used},
                                           {"from_cache", false}};
                    if (cacheable) {
                        if (auto rc = cache_->set(cache_key, data, opts.cache_ttl_s); rc != cache::CacheErr::Ok) {
                            log_->log_warn(cid, "HTTP", "response not cached",
                                           {{"reason", std::string(cache::to_string(rc))}});
                        }
                    }
                    successful_.fetch_add(1, std::memory_order_relaxed);
                    count("http.success");
                    log_->log_debug(cid, "HTTP", "request succeeded",
                                    {{"method", verb}, {"dependency", dependency}, {"status", res->status},
                                     {"attempts_used", used}});
                    return OperationResult::ok(std::move(data), cid);
                }

                breaker->record_failure();
                if (!policy.is_retriable_status(res->status)) {
                    log_->log_error(cid, "HTTP", "terminal upstream status",
                                    {{"method", verb}, {"dependency", dependency}, {"status", res->status}});
                    return fail(ErrorKind::Upstream, "HTTP " + std::to_string(res->status), cid,
                                {{"status_code", res->status},
                                 {"body", parse_body(res->body)},
                                 {"attempts_used", used},
                                 {"dependency", dependency}});
                }
                last_kind  = ErrorKind::Upstream;
                last_error = "HTTP " + std::to_string(res->status);
            } else {
                breaker->record_failure();
                const TransportError& err = res.error();
                if (err.code == TransportErrc::Protocol) {
                    return fail(ErrorKind::Connection, err.message, cid,
                                {{"attempts_used", used}, {"dependency", dependency}});
                }
                last_kind  = (err.code == TransportErrc::Timeout) ? ErrorKind::Timeout : ErrorKind::Connection;
                last_error = err.message;
            }

            if (attempt + 1 < attempts) {
                const auto delay = policy.backoff_delay(attempt);
                log_->log_warn(cid, "HTTP", "transient failure, backing off",
                               {{"dependency", dependency}, {"attempt", used},
                                {"delay_ms", delay.count()}, {"error", last_error}});
                clock_->sleep_for(delay);
                total_backoff_ms_.fetch_add(static_cast<uint64_t>(delay.count()), std::memory_order_relaxed);
                count("http.backoff_ms", static_cast<double>(delay.count()), "ms");
            }
        }

        nlohmann::json details = {{"attempts_used", used},
                                  {"last_error_kind", std::string(to_string(last_kind))},
                                  {"last_error", last_error},
                                  {"dependency", dependency}};
        details["last_status"] = last_status == 0 ? nlohmann::json(nullptr) : nlohmann::json(last_status);

        if (!opts.use_retry) return fail(last_kind, last_error, cid, std::move(details));

        log_->log_error(cid, "HTTP", "retries exhausted",
                        {{"method", verb}, {"dependency", dependency}, {"attempts_used", used}, {"error", last_error}});
        return fail(ErrorKind::RetryExhausted,
                    "request failed after " + std::to_string(used) + " attempt(s): " + last_error, cid,
                    std::move(details));
    }

    hearth_detail::expected<void, std::string> RetryingHttpClient::configure_retry(RetryPolicy policy) {
        auto valid = validate(std::move(policy));
        if (!valid) return hearth_detail::unexpected<std::string>(valid.error());
        std::lock_guard<std::mutex> lk(policy_mu_);
        policy_ = std::move(*valid);
        return {};
    }

    RetryPolicy RetryingHttpClient::retry_policy() const {
        std::lock_guard<std::mutex> lk(policy_mu_);
        return policy_;
    }

    RetryingHttpClient::Stats RetryingHttpClient::stats() const noexcept {
        Stats s;
        s.requests         = requests_.load(std::memory_order_relaxed);
        s.successful       = successful_.load(std::memory_order_relaxed);
        s.failed           = failed_.load(std::memory_order_relaxed);
        s.retries          = retries_.load(std::memory_order_relaxed);
        s.rate_limited     = rate_limited_.load(std::memory_order_relaxed);
        s.circuit_rejected = circuit_rejected_.load(std::memory_order_relaxed);
        s.cache_hits       = cache_hits_.load(std::memory_order_relaxed);
        s.total_backoff_ms = total_backoff_ms_.load(std::memory_order_relaxed);
        return s;
    }

    nlohmann::json RetryingHttpClient::stats_json() const {
        const Stats s = stats();
        return {{"requests", s.requests},
                {"successful", s.successful},
                {"failed", s.failed},
                {"retries", s.retries},
                {"rate_limited", s.rate_limited},
                {"circuit_rejected", s.circuit_rejected},
                {"cache_hits", s.cache_hits},
                {"total_backoff_ms", s.total_backoff_ms},
                {"limiter_admitted", limiter_.stats().admitted},
                {"limiter_rejected", limiter_.stats().rejected},
                {"retry_policy", retry_policy().to_json()}};
    }

    void RetryingHttpClient::reset() {
        for (auto* c : {&requests_, &successful_, &failed_, &retries_, &rate_limited_, &circuit_rejected_,
                        &cache_hits_, &total_backoff_ms_}) {
            c->store(0, std::memory_order_relaxed);
        }
        limiter_.reset();
    }

} // namespace hearth::net
