#pragma once
/**
 * @file ttl_cache.hpp
 * @brief Bounded key → JSON value cache with per-entry TTL and staged pressure eviction.
 *
 * Pressure is the larger of (estimated cache bytes / max_bytes) and the optional host
 * memory gauge. A maintenance pass (after every write, or on demand) responds in stages:
 *
 *   pressure >= 0.75  purge expired entries
 *   pressure >= 0.85  LRU-evict down to the 0.75 mark
 *   pressure >= 0.95  LRU-evict down to the 0.50 mark
 *   pressure >= 0.98  emergency: clear the whole cache
 *
 * An entry with `now - inserted_at > ttl` is never returned; an expired read removes it.
 * A miss is not an error: get() returns an empty optional.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "hearth/config/constants.hpp"
#include "hearth/core/clock.hpp"
#include "hearth/obs/observability.hpp"
#include "hearth/os/memory_gauge.hpp"

namespace hearth::cache {

    /// Result codes for cache mutations.
    enum class CacheErr : uint8_t {
        Ok,
        InvalidKey,  ///< Empty key
        InvalidTtl,  ///< Negative TTL
        TooLarge     ///< Entry estimate exceeds cleanup_mark * max_bytes
    };

    std::string_view to_string(CacheErr e) noexcept;

    /** @struct CacheConfig
     *  @brief TTL bounds, byte budget and pressure stage marks.
     */
    struct CacheConfig {
        int32_t     default_ttl_s{hearth::config::constants::CACHE_DEFAULT_TTL_S}; ///< Used when ttl == 0
        int32_t     max_ttl_s{hearth::config::constants::CACHE_MAX_TTL_S};         ///< Larger TTLs are clamped
        std::size_t max_bytes{hearth::config::constants::CACHE_MAX_BYTES};
        double cleanup_mark{hearth::config::constants::CACHE_PRESSURE_CLEANUP};
        double evict_mark{hearth::config::constants::CACHE_PRESSURE_EVICT};
        double critical_mark{hearth::config::constants::CACHE_PRESSURE_CRITICAL};
        double emergency_mark{hearth::config::constants::CACHE_PRESSURE_EMERGENCY};
        double critical_target{hearth::config::constants::CACHE_CRITICAL_TARGET};
    };

    /** @struct EntryMetadata
     *  @brief Per-entry bookkeeping exposed by TtlCache::metadata().
     */
    struct EntryMetadata {
        double      age_s{0};
        int32_t     ttl_s{0};
        double      remaining_s{0};
        std::size_t size_bytes{0};
        uint64_t    access_count{0};
        double      idle_s{0};   ///< Since last read or write

        nlohmann::json to_json() const;
    };

    /** @struct MaintenanceReport
     *  @brief What one maintenance pass did.
     */
    struct MaintenanceReport {
        double      pressure{0};
        std::size_t expired_purged{0};
        std::size_t evicted{0};
        bool        emergency_clear{false};

        nlohmann::json to_json() const;
    };

    /** @class TtlCache
     *  @brief LRU-ordered TTL cache. All operations serialize on one mutex.
     */
    class TtlCache {
    public:
        explicit TtlCache(CacheConfig cfg = {},
                          core::Clock& clock = core::steady_clock(),
                          std::shared_ptr<os::MemoryGauge> gauge = nullptr,
                          std::shared_ptr<obs::EventLogger> log = obs::null_logger());

        TtlCache(const TtlCache&)            = delete;
        TtlCache& operator=(const TtlCache&) = delete;

        /// Value for @p key, or nullopt on miss (absent or expired).
        [[nodiscard]] std::optional<nlohmann::json> get(std::string_view key);

        /**
         * @brief Insert or overwrite @p key, then run maintenance.
         * @param ttl_s 0 selects the default TTL; values above max_ttl_s are clamped.
         * @note A stored entry is never evicted by the maintenance pass of its own write, so a
         *       get() that follows an Ok set() hits.
         */
        CacheErr set(std::string_view key, nlohmann::json value, int32_t ttl_s = 0);

        /// Live (unexpired) entry present? Does not touch recency.
        [[nodiscard]] bool exists(std::string_view key);

        /// Remove @p key. Returns true if an entry was removed.
        bool invalidate(std::string_view key);

        /// Drop every entry atomically; returns the number removed.
        std::size_t clear();

        /// Remove every expired entry; returns the number removed.
        std::size_t cleanup_expired();

        /// Run the staged pressure response once.
        MaintenanceReport maintain();

        [[nodiscard]] std::optional<EntryMetadata> metadata(std::string_view key);

        /// Current pressure (cache bytes or host gauge, whichever is larger).
        [[nodiscard]] double pressure();

        struct Stats {
            uint64_t hits{0}, misses{0}, sets{0}, expirations{0}, evictions{0}, emergency_clears{0};
            std::size_t entries{0}, bytes{0}, max_bytes{0};
        };
        [[nodiscard]] Stats stats() const;
        [[nodiscard]] nlohmann::json stats_json() const;

        [[nodiscard]] const CacheConfig& config() const noexcept { return cfg_; }

    private:
        struct SKeyHash {
            using is_transparent = void;
            std::size_t operator()(std::string_view s) const noexcept {
                return std::hash<std::string_view>{}(s);
            }
        };
        struct SKeyEq {
            using is_transparent = void;
            bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
        };

        using Lru = std::list<std::string>; ///< Most recently used at front

        struct Entry {
            nlohmann::json          value;
            core::Clock::time_point inserted_at;
            core::Clock::time_point last_access;
            int32_t                 ttl_s{0};
            std::size_t             size_bytes{0};
            uint64_t                access_count{0};
            Lru::iterator           lru_pos;
        };

        using Map = std::unordered_map<std::string, Entry, SKeyHash, SKeyEq>;

        // All helpers below require mu_ held.
        bool expired(const Entry& e, core::Clock::time_point now) const noexcept;
        void erase(Map::iterator it);
        std::size_t purge_expired(core::Clock::time_point now);
        /// Evict from the LRU tail until bytes_ <= target_bytes, never taking @p keep.
        std::size_t evict_lru_to(std::size_t target_bytes, std::string_view keep);
        std::size_t max_entry_bytes() const noexcept;
        double pressure_locked();
        /// Staged response; @p keep (the key just written, if any) survives every stage.
        MaintenanceReport maintain_locked(std::string_view keep = {});

        CacheConfig                       cfg_;
        core::Clock*                      clock_;
        std::shared_ptr<os::MemoryGauge>  gauge_;
        std::shared_ptr<obs::EventLogger> log_;

        mutable std::mutex mu_;
        Map                map_;
        Lru                lru_;
        std::size_t        bytes_{0};
        Stats              stats_{};
    };

    /// Estimated footprint of one entry: serialized value + key + fixed overhead.
    std::size_t estimate_size(std::string_view key, const nlohmann::json& value);

} // namespace hearth::cache
