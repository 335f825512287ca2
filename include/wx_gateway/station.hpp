#pragma once

#include <optional>
#include <string>

#include "wx_gateway/types.hpp"

namespace wx_gateway {

/**
 * @brief Fixed weather-reporting location. Immutable once loaded.
 */
struct Station final {
    std::string identifier{};                /**< Four-letter uppercase ICAO code. */
    GeodeticCoordinate location{};           /**< Aerodrome reference point. */
    std::string name{};                      /**< Human-readable station name. */
    std::string country{};                   /**< ISO country code. */
    std::optional<double> elevation_m{};     /**< Field elevation in metres, if known. */
    bool reporting{true};                    /**< True when the station publishes reports. */
};

/** @brief Great-circle central angle between two coordinates, in degrees. */
[[nodiscard]] double great_circle_deg(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/** @brief Great-circle distance between two coordinates, in kilometres. */
[[nodiscard]] double great_circle_km(const GeodeticCoordinate& from, const GeodeticCoordinate& to);

/**
 * @brief Throw ServiceError(InvalidInput) unless lat ∈ [-90, 90] and lon ∈ [-180, 180].
 */
void validate_coordinate(double latitude_deg, double longitude_deg);

}  // namespace wx_gateway
