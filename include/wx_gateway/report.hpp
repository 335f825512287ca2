// === Report ==================================================================
//
// Parsed report payload shared between the cache, the fetcher, and every
// request that coalesced onto the same fetch, plus the canonical cache key.

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "wx_gateway/station.hpp"
#include "wx_gateway/types.hpp"

namespace wx_gateway {

/** @brief Immutable parsed report as produced by the parsing engine. */
struct Report final {
    Station station{};                        /**< Station the report was fetched for. */
    ReportType report_type{ReportType::Metar}; /**< Product type. */
    OptionSet options{};                      /**< Options the payload was rendered with. */
    nlohmann::json payload{};                 /**< Opaque parsed-report document. */
    TimePoint fetched_at{};                   /**< Upstream fetch completion time. */
};

using ReportPtr = std::shared_ptr<const Report>;

/**
 * @brief Canonical identity of a cacheable unit of work.
 *
 * Built from the resolved station, so a coordinate request and a code request
 * for the same station share a key; OptionSet is ordered, so option order and
 * duplicates in the request do not matter.
 */
struct CacheKey final {
    std::string station_id{};
    ReportType report_type{ReportType::Metar};
    OptionSet options{};

    [[nodiscard]] bool operator==(const CacheKey& other) const = default;
    /** @brief Human-readable form, e.g. "metar:KJFK:info,summary". */
    [[nodiscard]] std::string to_string() const;
};

struct CacheKeyHash final {
    [[nodiscard]] std::size_t operator()(const CacheKey& key) const noexcept;
};

[[nodiscard]] CacheKey make_cache_key(const Station& station, ReportType report_type, const OptionSet& options);

}  // namespace wx_gateway
