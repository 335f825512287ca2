#include "wx_gateway/station.hpp"

#include <cmath>
#include <numbers>

#include <fmt/format.h>

#include "wx_gateway/errors.hpp"

namespace wx_gateway {

namespace {
constexpr double k_earth_radius_km{6'371.0};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

double central_angle_rad(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    return 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}
}  // namespace

double great_circle_deg(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    return central_angle_rad(from, to) * 180.0 / std::numbers::pi;
}

double great_circle_km(const GeodeticCoordinate& from, const GeodeticCoordinate& to) {
    return central_angle_rad(from, to) * k_earth_radius_km;
}

void validate_coordinate(double latitude_deg, double longitude_deg) {
    // Negated comparisons so NaN is rejected too.
    if (!(latitude_deg >= -90.0 && latitude_deg <= 90.0)) {
        throw ServiceError(ErrorKind::InvalidInput, fmt::format("{} is not a valid latitude", latitude_deg), "coord");
    }
    if (!(longitude_deg >= -180.0 && longitude_deg <= 180.0)) {
        throw ServiceError(ErrorKind::InvalidInput, fmt::format("{} is not a valid longitude", longitude_deg), "coord");
    }
}

}  // namespace wx_gateway
