// === Victim Records ==========================================================
//
// Declares the victim record held by VictimRegistry and the detection event
// shape consumed from the drone feed.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

/**
 * @brief Single observation asserting that a victim exists at a location.
 */
struct DetectionEvent final {
    std::optional<std::string> candidate_id{};        /**< Upstream person id, when the feed supplies one. */
    GeodeticCoordinate location{};                    /**< Observed position. */
    InjuryLevel injury_level{InjuryLevel::None};      /**< Observed severity. */
    double survival_likelihood{};                     /**< External estimate in [0, 1]. */
    TimePoint detected_at{SteadyClock::now()};        /**< Observation timestamp. */
};

/**
 * @brief Registry record for one physical victim.
 */
struct Victim final {
    std::string id{};                                 /**< Stable registry identifier. */
    GeodeticCoordinate location{};                    /**< Latest known position. */
    InjuryLevel injury_level{InjuryLevel::None};      /**< Most severe level observed. */
    double survival_likelihood{};                     /**< Estimate captured at first detection. */
    TimePoint detected_at{};                          /**< Earliest detection merged into this record. */
    TimePoint last_seen_at{};                         /**< Newest detection merged into this record. */
    double priority_score{};                          /**< Derived; rewritten on every scoring pass. */
    VictimStatus status{VictimStatus::Active};        /**< Lifecycle flag. */
    std::optional<TimePoint> status_changed_at{};     /**< Time of the terminal transition, if any. */
    std::size_t detection_count{};                    /**< Number of detections merged. */
    std::vector<std::string> candidate_ids{};         /**< Upstream ids merged into this record. */
};

/** @brief Outcome of VictimRegistry::upsert_detection. */
struct UpsertResult final {
    std::string victim_id{};
    bool created{};
};

}  // namespace rescue_dispatch
