// === Geographic Cost Model ===================================================
//
// Great-circle distance and travel-time conversion between coordinates. The
// traversal speed is a single instance-level knob configured once at
// startup; callers never pass a speed per call.

#pragma once

#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

inline constexpr double k_earth_radius_m{6'371'000.0};             /**< Mean Earth radius for the spherical model. */
inline constexpr double k_default_travel_speed_mps{5000.0 / 3600.0}; /**< 5 km/h average pace over rubble. */

/**
 * @brief Haversine distance in metres on a spherical Earth.
 */
[[nodiscard]] double haversine_distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) noexcept;

/**
 * @brief True when both components are finite and inside WGS84 bounds.
 */
[[nodiscard]] bool is_valid_coordinate(const GeodeticCoordinate& coordinate) noexcept;

/** @brief Distance/time cost model shared by the registry and the planner. */
class GeoCost final {
  public:
    /**
     * @brief Construct a cost model for the given average traversal speed.
     *
     * @param travel_speed_mps Average responder speed in m/s; must be positive.
     */
    explicit GeoCost(double travel_speed_mps = k_default_travel_speed_mps);

    /** @brief Great-circle distance in metres. Symmetric, zero for equal points. */
    [[nodiscard]] double distance_m(const GeodeticCoordinate& from, const GeodeticCoordinate& to) const noexcept;
    /** @brief Seconds needed to cover @p distance_m at the configured speed. */
    [[nodiscard]] double travel_time_s(double distance_m) const noexcept;
    /** @brief Configured traversal speed in m/s. */
    [[nodiscard]] double travel_speed_mps() const noexcept;

  private:
    double travel_speed_mps_;
};

}  // namespace rescue_dispatch
