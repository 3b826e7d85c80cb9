/**
 * @file ttl_cache.cpp
 * @brief TtlCache: TTL expiry, LRU recency and the staged pressure response.
 */
#include "hearth/cache/ttl_cache.hpp"

#include <algorithm>
#include <utility>

namespace hearth::cache {

    using std::chrono::duration;
    using std::chrono::seconds;

    namespace {
    double secs(core::Clock::duration d) { return duration<double>(d).count(); }
    } // namespace

    std::string_view to_string(CacheErr e) noexcept {
        switch (e) {
            case CacheErr::Ok:         return "ok";
            case CacheErr::InvalidKey: return "invalid_key";
            case CacheErr::InvalidTtl: return "invalid_ttl";
            case CacheErr::TooLarge:   return "too_large";
        }
        return "unknown";
    }

    std::size_t estimate_size(std::string_view key, const nlohmann::json& value) {
        const std::string dumped = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        return dumped.size() + key.size() + hearth::config::constants::CACHE_ENTRY_OVERHEAD;
    }

    nlohmann::json EntryMetadata::to_json() const {
        return {{"age_seconds", age_s},
                {"ttl_seconds", ttl_s},
                {"remaining_seconds", remaining_s},
                {"size_bytes", size_bytes},
                {"access_count", access_count},
                {"idle_seconds", idle_s}};
    }

    nlohmann::json MaintenanceReport::to_json() const {
        return {{"pressure", pressure},
                {"expired_purged", expired_purged},
                {"evicted", evicted},
                {"emergency_clear", emergency_clear}};
    }

    TtlCache::TtlCache(CacheConfig cfg, core::Clock& clock, std::shared_ptr<os::MemoryGauge> gauge,
                       std::shared_ptr<obs::EventLogger> log)
        : cfg_(cfg), clock_(&clock), gauge_(std::move(gauge)), log_(std::move(log)) {
        stats_.max_bytes = cfg_.max_bytes;
    }

    bool TtlCache::expired(const Entry& e, core::Clock::time_point now) const noexcept {
        return now - e.inserted_at > seconds(e.ttl_s);
    }

    void TtlCache::erase(Map::iterator it) {
        bytes_ -= it->second.size_bytes;
        lru_.erase(it->second.lru_pos);
        map_.erase(it);
    }

    std::optional<nlohmann::json> TtlCache::get(std::string_view key) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        auto it = map_.find(key);
        if (it == map_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        if (expired(it->second, now)) {
            erase(it);
            ++stats_.expirations;
            ++stats_.misses;
            return std::nullopt;
        }
        Entry& e = it->second;
        e.last_access = now;
        ++e.access_count;
        lru_.splice(lru_.begin(), lru_, e.lru_pos);
        ++stats_.hits;
        return e.value;
    }

    CacheErr TtlCache::set(std::string_view key, nlohmann::json value, int32_t ttl_s) {
        if (key.empty()) return CacheErr::InvalidKey;
        if (ttl_s < 0) return CacheErr::InvalidTtl;
        const int32_t ttl = (ttl_s == 0) ? cfg_.default_ttl_s : std::min(ttl_s, cfg_.max_ttl_s);

        const std::size_t size = estimate_size(key, value);
        if (size > max_entry_bytes()) return CacheErr::TooLarge;

        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        if (auto it = map_.find(key); it != map_.end()) erase(it);

        // Hard budget: make room before inserting.
        if (bytes_ + size > cfg_.max_bytes) stats_.evictions += evict_lru_to(cfg_.max_bytes - size, {});

        lru_.emplace_front(key);
        Entry e;
        e.value        = std::move(value);
        e.inserted_at  = now;
        e.last_access  = now;
        e.ttl_s        = ttl;
        e.size_bytes   = size;
        e.lru_pos      = lru_.begin();
        map_.emplace(std::string(key), std::move(e));
        bytes_ += size;
        ++stats_.sets;

        (void)maintain_locked(key);
        return CacheErr::Ok;
    }

    bool TtlCache::exists(std::string_view key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        if (expired(it->second, clock_->now())) {
            erase(it);
            ++stats_.expirations;
            return false;
        }
        return true;
    }

    bool TtlCache::invalidate(std::string_view key) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        erase(it);
        return true;
    }

    std::size_t TtlCache::clear() {
        Map dropped;
        Lru dropped_lru;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped.swap(map_);
            dropped_lru.swap(lru_);
            bytes_ = 0;
        }
        return dropped.size();
    }

    std::size_t TtlCache::purge_expired(core::Clock::time_point now) {
        std::size_t n = 0;
        for (auto it = map_.begin(); it != map_.end();) {
            if (expired(it->second, now)) {
                auto victim = it++;
                erase(victim);
                ++n;
            } else {
                ++it;
            }
        }
        stats_.expirations += n;
        return n;
    }

    std::size_t TtlCache::cleanup_expired() {
        std::lock_guard<std::mutex> lk(mu_);
        return purge_expired(clock_->now());
    }

    std::size_t TtlCache::max_entry_bytes() const noexcept {
        // An entry must fit below the cleanup mark, or the pass that follows its own write evicts it.
        const double mark = std::min(1.0, cfg_.cleanup_mark);
        return static_cast<std::size_t>(static_cast<double>(cfg_.max_bytes) * mark);
    }

    std::size_t TtlCache::evict_lru_to(std::size_t target_bytes, std::string_view keep) {
        std::size_t n = 0;
        while (bytes_ > target_bytes && !lru_.empty()) {
            if (!keep.empty() && lru_.back() == keep) break;  // only the kept entry is left
            auto it = map_.find(lru_.back());
            if (it == map_.end()) { // unreachable while lru_ and map_ agree
                lru_.pop_back();
                continue;
            }
            erase(it);
            ++n;
        }
        return n;
    }

    double TtlCache::pressure_locked() {
        double p = cfg_.max_bytes == 0 ? 0.0
                                       : static_cast<double>(bytes_) / static_cast<double>(cfg_.max_bytes);
        if (gauge_) {
            if (auto host = gauge_->pressure()) p = std::max(p, *host);
        }
        return p;
    }

    double TtlCache::pressure() {
        std::lock_guard<std::mutex> lk(mu_);
        return pressure_locked();
    }

    MaintenanceReport TtlCache::maintain_locked(std::string_view keep) {
        MaintenanceReport rep;
        rep.pressure = pressure_locked();
        const double p = rep.pressure;
        if (p < cfg_.cleanup_mark) return rep;

        if (p >= cfg_.emergency_mark) {
            std::optional<std::pair<std::string, Entry>> kept;
            if (auto it = map_.find(keep); !keep.empty() && it != map_.end()) {
                kept.emplace(it->first, std::move(it->second));
            }
            rep.evicted = map_.size() - (kept ? 1 : 0);
            map_.clear();
            lru_.clear();
            bytes_ = 0;
            if (kept) {
                lru_.emplace_front(kept->first);
                kept->second.lru_pos = lru_.begin();
                bytes_ = kept->second.size_bytes;
                map_.emplace(std::move(kept->first), std::move(kept->second));
            }
            stats_.evictions += rep.evicted;
            ++stats_.emergency_clears;
            log_->log_warn("", "CACHE", "emergency clear",
                           {{"pressure", p}, {"entries_dropped", rep.evicted}});
            rep.emergency_clear = true;
            return rep;
        }

        rep.expired_purged = purge_expired(clock_->now());

        if (p >= cfg_.evict_mark) {
            const double target = (p >= cfg_.critical_mark) ? cfg_.critical_target : cfg_.cleanup_mark;
            // Shrink cache bytes by the ratio that brings pressure down to the target; when the
            // cache itself drives pressure this is exactly target * max_bytes.
            const auto target_bytes = static_cast<std::size_t>(static_cast<double>(bytes_) * (target / p));
            rep.evicted = evict_lru_to(target_bytes, keep);
            stats_.evictions += rep.evicted;
            if (rep.evicted > 0) {
                log_->log_info("", "CACHE", "pressure eviction",
                               {{"pressure", p}, {"target", target}, {"evicted", rep.evicted}});
            }
        }
        return rep;
    }

    MaintenanceReport TtlCache::maintain() {
        std::lock_guard<std::mutex> lk(mu_);
        return maintain_locked();
    }

    std::optional<EntryMetadata> TtlCache::metadata(std::string_view key) {
        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock_->now();
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        if (expired(it->second, now)) {
            erase(it);
            ++stats_.expirations;
            return std::nullopt;
        }
        const Entry& e = it->second;
        EntryMetadata md;
        md.age_s        = secs(now - e.inserted_at);
        md.ttl_s        = e.ttl_s;
        md.remaining_s  = std::max(0.0, static_cast<double>(e.ttl_s) - md.age_s);
        md.size_bytes   = e.size_bytes;
        md.access_count = e.access_count;
        md.idle_s       = secs(now - e.last_access);
        return md;
    }

    TtlCache::Stats TtlCache::stats() const {
        std::lock_guard<std::mutex> lk(mu_);
        Stats s = stats_;
        s.entries = map_.size();
        s.bytes = bytes_;
        s.max_bytes = cfg_.max_bytes;
        return s;
    }

    nlohmann::json TtlCache::stats_json() const {
        const Stats s = stats();
        const uint64_t lookups = s.hits + s.misses;
        return {{"hits", s.hits},
                {"misses", s.misses},
                {"hit_rate", lookups == 0 ? 0.0 : static_cast<double>(s.hits) / static_cast<double>(lookups)},
                {"sets", s.sets},
                {"expirations", s.expirations},
                {"evictions", s.evictions},
                {"emergency_clears", s.emergency_clears},
                {"entries", s.entries},
                {"bytes", s.bytes},
                {"max_bytes", s.max_bytes}};
    }

} // namespace hearth::cache
