// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the dispatch engine (time primitives, geodetic coordinates, lifecycle
// states for victims and responders).

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace rescue_dispatch {

/**
 * @brief Alias for the steady clock used across the engine.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in WGS84 decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    friend bool operator==(const GeodeticCoordinate&, const GeodeticCoordinate&) = default;
};

/**
 * @brief Ordinal injury severity reported by the detection feed.
 */
enum class InjuryLevel {
    None,         /**< No visible injury. */
    Minor,        /**< Ambulatory, minor injuries. */
    Severe,       /**< Severe injuries requiring assistance. */
    Unconscious   /**< Unresponsive victim. */
};

/**
 * @brief Lifecycle of a victim record. Served and Expired are terminal.
 */
enum class VictimStatus {
    Active,   /**< Awaiting rescue; eligible for planning. */
    Served,   /**< Reached by a responder whose route completed. */
    Expired   /**< Aged out without any responder assignment. */
};

/**
 * @brief Availability of a responder team.
 */
enum class ResponderStatus {
    Available,    /**< Idle and ready for a new route. */
    EnRoute,      /**< Working through a route assigned by the planner. */
    Unavailable   /**< Off duty or otherwise not dispatchable. */
};

[[nodiscard]] std::string_view to_string(InjuryLevel level) noexcept;
[[nodiscard]] std::string_view to_string(VictimStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ResponderStatus status) noexcept;

}  // namespace rescue_dispatch
