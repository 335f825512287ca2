// === Report Cache ============================================================
//
// Short-TTL store of parsed reports with request coalescing. A miss with no
// fetch underway makes the caller the owner of a new in-flight fetch; every
// other caller for the same key waits on the owner's shared future and sees
// the same report or the same error. Expiry is enforced on read; the optional
// sweep only reclaims memory.

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "wx_gateway/clock.hpp"
#include "wx_gateway/logging.hpp"
#include "wx_gateway/report.hpp"

namespace wx_gateway {

/** @brief Tunables for the report cache. */
struct ReportCacheConfig final {
    Duration ttl{Duration{120.0}};          /**< Lifetime of a cached report. */
    Duration wait_timeout{Duration{30.0}};  /**< Longest a waiter blocks on another caller's fetch; zero waits forever. */
    std::size_t shard_count{16};            /**< Independent lock domains. */
};

/** @brief How a get_or_fetch call was satisfied. */
enum class CacheOutcome {
    Hit,        /**< Live entry returned without suspension. */
    Fetched,    /**< Caller owned the in-flight fetch. */
    Coalesced   /**< Caller waited on another caller's fetch. */
};

/** @brief Report plus the path that produced it. */
struct CacheLookup final {
    ReportPtr report{};
    CacheOutcome outcome{CacheOutcome::Hit};
};

/** @brief Sharded, coalescing report cache. */
class ReportCache final {
  public:
    using FetchFunction = std::function<ReportPtr()>;

    ReportCache(ReportCacheConfig config, ClockPtr clock);

    /**
     * @brief Return the live report for @p key, or fetch it exactly once.
     *
     * Failures of @p fetch_fn are not cached and are rethrown to the owner and
     * to every waiter. A waiter whose wait exceeds the configured timeout gets
     * ServiceError(ServiceUnavailable); the fetch itself keeps running.
     */
    [[nodiscard]] CacheLookup get_or_fetch(const CacheKey& key, const FetchFunction& fetch_fn);

    /** @brief Remove expired entries that have no fetch underway; returns the number removed. */
    std::size_t purge_expired();

    /** @brief Number of live or expired entries currently held. */
    [[nodiscard]] std::size_t size() const;
    /** @brief Number of fetches currently underway. */
    [[nodiscard]] std::size_t in_flight() const;

    [[nodiscard]] const ReportCacheConfig& config() const noexcept;

  private:
    struct CacheEntry final {
        ReportPtr report{};
        TimePoint fetched_at{};
    };

    struct Slot final {
        std::optional<CacheEntry> entry{};
        std::optional<std::shared_future<ReportPtr>> in_flight{};
    };

    struct Shard final {
        mutable std::mutex mutex;
        std::unordered_map<CacheKey, Slot, CacheKeyHash> map_slots;
    };

    [[nodiscard]] Shard& shard_for(const CacheKey& key) const;
    [[nodiscard]] bool expired(const CacheEntry& entry, TimePoint now) const;
    /** @brief Run @p fetch_fn as the owner and publish the result to the slot and promise. */
    ReportPtr complete_fetch(Shard& shard, const CacheKey& key, const FetchFunction& fetch_fn, std::promise<ReportPtr>& promise);

    ReportCacheConfig config_;
    ClockPtr clock_;
    std::vector<std::unique_ptr<Shard>> list_shards_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
