// === Responder Records =======================================================
//
// Declares the responder record held by ResponderRegistry plus the status and
// completion events consumed from responder teams.

#pragma once

#include <string>
#include <vector>

#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

/**
 * @brief Registry record for one responder team.
 */
struct Responder final {
    std::string id{};                                      /**< Unique responder identifier. */
    GeodeticCoordinate location{};                         /**< Current position. */
    int capacity{};                                        /**< Maximum victims per route. */
    ResponderStatus status{ResponderStatus::Available};    /**< Availability state. */
    std::vector<std::string> current_route{};              /**< Assigned victim ids in visit order. */
};

/** @brief Periodic status report published by a responder team. */
struct ResponderStatusEvent final {
    std::string responder_id{};
    GeodeticCoordinate location{};
    int capacity{};
    ResponderStatus status{ResponderStatus::Available};
};

/** @brief Signal that a responder finished its assigned route. */
struct RouteCompletionEvent final {
    std::string responder_id{};
    TimePoint completed_at{SteadyClock::now()};
};

}  // namespace rescue_dispatch
