#include "rescue_dispatch/geo_cost.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace rescue_dispatch {

namespace {
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    // Rounding can push a slightly past 1 for antipodal points.
    const double clamped_a = std::clamp(a, 0.0, 1.0);
    const double c = 2.0 * std::atan2(std::sqrt(clamped_a), std::sqrt(1.0 - clamped_a));
    return k_earth_radius_m * c;
}

bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept {
    return std::isfinite(coordinate.latitude_deg)
        && std::isfinite(coordinate.longitude_deg)
        && coordinate.latitude_deg >= -90.0
        && coordinate.latitude_deg <= 90.0
        && coordinate.longitude_deg >= -180.0
        && coordinate.longitude_deg <= 180.0;
}

GeoCost::GeoCost(double travel_speed_mps)
    : travel_speed_mps_(travel_speed_mps) {
    if (!std::isfinite(travel_speed_mps_) || travel_speed_mps_ <= 0.0) {
        throw std::invalid_argument("GeoCost travel speed must be positive");
    }
}

double GeoCost::distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) const noexcept {
    if (from == to) {
        return 0.0;
    }
    return haversine_distance_m(from, to);
}

double GeoCost::travel_time_s(double distance_m) const noexcept {
    return distance_m / travel_speed_mps_;
}

double GeoCost::travel_speed_mps() const noexcept {
    return travel_speed_mps_;
}

}  // namespace rescue_dispatch
