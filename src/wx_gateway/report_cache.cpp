#include "wx_gateway/report_cache.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
WallClock::duration to_clock_duration(Duration duration) {
    return std::chrono::duration_cast<WallClock::duration>(duration);
}
}  // namespace

ReportCache::ReportCache(ReportCacheConfig config, ClockPtr clock)
    : config_(config),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (clock_ == nullptr) {
        throw std::invalid_argument("ReportCache requires a clock");
    }
    if (config_.ttl.count() <= 0.0) {
        throw std::invalid_argument("ReportCache TTL must be positive");
    }
    if (config_.shard_count == 0) {
        config_.shard_count = 1;
    }
    list_shards_.reserve(config_.shard_count);
    for (std::size_t index = 0; index < config_.shard_count; ++index) {
        list_shards_.push_back(std::make_unique<Shard>());
    }
}

CacheLookup ReportCache::get_or_fetch(const CacheKey& key, const FetchFunction& fetch_fn) {
    Shard& shard = shard_for(key);
    std::promise<ReportPtr> promise;
    std::shared_future<ReportPtr> pending;
    bool owner = false;
    {
        std::scoped_lock lock(shard.mutex);
        Slot& slot = shard.map_slots[key];
        if (slot.entry.has_value()) {
            if (!expired(slot.entry.value(), clock_->now())) {
                return CacheLookup{slot.entry->report, CacheOutcome::Hit};
            }
            slot.entry.reset();
        }
        if (slot.in_flight.has_value()) {
            pending = slot.in_flight.value();
        } else {
            pending = promise.get_future().share();
            slot.in_flight = pending;
            owner = true;
        }
    }

    if (owner) {
        logger_->debug(R"({{"component":"report_cache","key":"{}","action":"fetch"}})", key.to_string());
        return CacheLookup{complete_fetch(shard, key, fetch_fn, promise), CacheOutcome::Fetched};
    }

    logger_->debug(R"({{"component":"report_cache","key":"{}","action":"coalesce"}})", key.to_string());
    if (config_.wait_timeout.count() > 0.0
        && pending.wait_for(config_.wait_timeout) != std::future_status::ready) {
        throw ServiceError(ErrorKind::ServiceUnavailable, "Timed out waiting for report " + key.to_string());
    }
    return CacheLookup{pending.get(), CacheOutcome::Coalesced};
}

std::size_t ReportCache::purge_expired() {
    const TimePoint now = clock_->now();
    std::size_t removed_count = 0;
    for (const std::unique_ptr<Shard>& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (auto iterator_slot = shard->map_slots.begin(); iterator_slot != shard->map_slots.end();) {
            const Slot& slot = iterator_slot->second;
            const bool stale = !slot.entry.has_value() || expired(slot.entry.value(), now);
            if (stale && !slot.in_flight.has_value()) {
                iterator_slot = shard->map_slots.erase(iterator_slot);
                ++removed_count;
            } else {
                ++iterator_slot;
            }
        }
    }
    if (removed_count > 0) {
        logger_->debug("Report cache purged {} expired entries", removed_count);
    }
    return removed_count;
}

std::size_t ReportCache::size() const {
    std::size_t entry_count = 0;
    for (const std::unique_ptr<Shard>& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (const auto& [key, slot] : shard->map_slots) {
            if (slot.entry.has_value()) {
                ++entry_count;
            }
        }
    }
    return entry_count;
}

std::size_t ReportCache::in_flight() const {
    std::size_t fetch_count = 0;
    for (const std::unique_ptr<Shard>& shard : list_shards_) {
        std::scoped_lock lock(shard->mutex);
        for (const auto& [key, slot] : shard->map_slots) {
            if (slot.in_flight.has_value()) {
                ++fetch_count;
            }
        }
    }
    return fetch_count;
}

const ReportCacheConfig& ReportCache::config() const noexcept {
    return config_;
}

ReportCache::Shard& ReportCache::shard_for(const CacheKey& key) const {
    return *list_shards_[CacheKeyHash{}(key) % list_shards_.size()];
}

bool ReportCache::expired(const CacheEntry& entry, TimePoint now) const {
    return now - entry.fetched_at > to_clock_duration(config_.ttl);
}

ReportPtr ReportCache::complete_fetch(Shard& shard, const CacheKey& key, const FetchFunction& fetch_fn, std::promise<ReportPtr>& promise) {
    ReportPtr report;
    try {
        report = fetch_fn();
        if (report == nullptr) {
            throw ServiceError(ErrorKind::InternalError, "Fetcher returned no report for " + key.to_string());
        }
    } catch (...) {
        {
            std::scoped_lock lock(shard.mutex);
            const auto iterator_slot = shard.map_slots.find(key);
            if (iterator_slot != shard.map_slots.end()) {
                iterator_slot->second.in_flight.reset();
                if (!iterator_slot->second.entry.has_value()) {
                    shard.map_slots.erase(iterator_slot);
                }
            }
        }
        // Waiters observe the same failure as the owner.
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::scoped_lock lock(shard.mutex);
        Slot& slot = shard.map_slots[key];
        slot.entry = CacheEntry{report, clock_->now()};
        slot.in_flight.reset();
    }
    promise.set_value(report);
    return report;
}

}  // namespace wx_gateway
