// === Station Index ===========================================================
//
// Resolves client-supplied identifiers or coordinate pairs to a canonical
// Station. The index holds an immutable snapshot that is replaced wholesale on
// refresh; a resolution keeps the snapshot it started with, so readers never
// observe a partially loaded index and never wait on a reload.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "wx_gateway/logging.hpp"
#include "wx_gateway/station.hpp"
#include "wx_gateway/station_source.hpp"

namespace wx_gateway {

/** @brief Station paired with its distance from a query coordinate. */
struct StationDistance final {
    Station station{};
    double distance_deg{};  /**< Great-circle central angle in degrees. */
    double distance_km{};   /**< Great-circle distance in kilometres. */
};

/** @brief Immutable view of every station known at load time. */
struct StationSnapshot final {
    std::vector<Station> stations{};                           /**< Sorted by identifier. */
    std::unordered_map<std::string, std::size_t> map_by_code{}; /**< Identifier to index in stations. */
    std::size_t reporting_count{};                             /**< Stations that publish reports. */
    TimePoint loaded_at{};                                     /**< Wall-clock load time. */
};

using StationSnapshotPtr = std::shared_ptr<const StationSnapshot>;

/** @brief Thread-safe station lookup over an atomically swapped snapshot. */
class StationIndex final {
  public:
    StationIndex();

    /**
     * @brief Exact, case-insensitive lookup of a station code.
     *
     * @throws ServiceError NotFound for unknown codes, ServiceUnavailable before
     *         the first load.
     */
    [[nodiscard]] Station resolve_by_code(std::string_view code) const;

    /**
     * @brief Nearest station to a coordinate; ties go to the smallest identifier.
     *
     * Only reporting stations are candidates when the snapshot contains any.
     * The coordinate is validated before the index is consulted.
     *
     * @throws ServiceError InvalidInput for out-of-range coordinates,
     *         ServiceUnavailable before the first load.
     */
    [[nodiscard]] Station resolve_by_coordinate(double latitude_deg, double longitude_deg) const;

    /**
     * @brief Up to @p count stations ordered by distance then identifier.
     *
     * @param max_distance_deg Largest great-circle arc, in degrees, to include.
     * @param reporting_only Restrict candidates to stations that publish reports.
     */
    [[nodiscard]] std::vector<StationDistance> nearest(double latitude_deg,
                                                       double longitude_deg,
                                                       std::size_t count,
                                                       double max_distance_deg,
                                                       bool reporting_only) const;

    /**
     * @brief Up to @p count stations matching free text, best match first.
     *
     * Every whitespace-separated word of @p text must appear, case-insensitively,
     * in the identifier, name, or country. Exact identifier matches rank first,
     * then identifier prefixes, then names containing the whole text; ties go
     * to the smallest identifier.
     */
    [[nodiscard]] std::vector<Station> search(std::string_view text, std::size_t count, bool reporting_only) const;

    /** @brief Build a new snapshot from @p stations and swap it in. */
    void replace(std::vector<Station> stations, TimePoint loaded_at = WallClock::now());
    /** @brief Replace the snapshot with the contents of @p source; keeps the old one on failure. */
    void reload(StationSource& source);

    [[nodiscard]] bool loaded() const;
    [[nodiscard]] std::size_t size() const;
    /** @brief Load time of the active snapshot, std::nullopt before the first load. */
    [[nodiscard]] std::optional<TimePoint> loaded_at() const;

  private:
    /** @brief Copy of the active snapshot pointer; throws ServiceUnavailable when empty. */
    [[nodiscard]] StationSnapshotPtr require_snapshot() const;
    [[nodiscard]] StationSnapshotPtr snapshot() const;

    mutable std::mutex mutex_;     /**< Guards the snapshot pointer only. */
    StationSnapshotPtr snapshot_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace wx_gateway
