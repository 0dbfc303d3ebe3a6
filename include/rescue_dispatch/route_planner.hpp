// === Route Planner ===========================================================
//
// Capacitated, time-bounded, multi-responder routing over open paths: every
// responder starts at its own location and there is no return leg. Routes
// are built by priority-ordered greedy nearest insertion and then shortened
// with a 2-opt pass. Planning is bounded by a wall-clock limit; on expiry the
// best routes found so far are returned and the report is flagged.

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rescue_dispatch/geo_cost.hpp"
#include "rescue_dispatch/logging.hpp"
#include "rescue_dispatch/responder.hpp"
#include "rescue_dispatch/victim.hpp"

namespace rescue_dispatch {

/** @brief Ordered assignment of victims to one responder for one planning pass. */
struct RouteSolution final {
    std::string responder_id{};
    std::vector<std::string> ordered_victim_ids{};
    double total_distance_m{};
    double estimated_duration_s{};

    friend bool operator==(const RouteSolution&, const RouteSolution&) = default;
};

/** @brief Why a victim was left out of every route. */
enum class UnassignableReason {
    ExceedsTimeBudget,     /**< Out of budget from every responder on its own. */
    InsufficientCapacity,  /**< Reachable, but every fitting route was full. */
    NoResponders,          /**< No responder could be planned for. */
    PlanningTimedOut       /**< The pass hit its time limit before settling this victim. */
};

[[nodiscard]] std::string_view to_string(UnassignableReason reason) noexcept;

/** @brief Non-fatal report that a victim stays active without a route. */
struct UnassignableVictim final {
    std::string victim_id{};
    UnassignableReason reason{UnassignableReason::InsufficientCapacity};

    friend bool operator==(const UnassignableVictim&, const UnassignableVictim&) = default;
};

/** @brief Diagnostics for a single planning pass. */
struct PlanningReport final {
    bool timed_out{};                                 /**< Wall-clock limit hit; solutions are partial. */
    std::vector<UnassignableVictim> unassignable{};   /**< Active victims without a route, in rank order. */
};

/** @brief Routes plus diagnostics produced by RoutePlanner::plan. */
struct PlanningResult final {
    std::vector<RouteSolution> solutions{};
    PlanningReport report{};
};

/** @brief Limits applied to every route in a pass. */
struct PlanningConstraints final {
    Duration max_route_duration{Duration{5.0 * 3600.0}};  /**< Travel-time budget per responder. */
    int max_victims_per_responder{5};                     /**< Cap on top of each responder's capacity. */
    Duration time_limit{Duration{30.0}};                  /**< Wall-clock ceiling for one pass. */
};

/** @brief Greedy-construction plus local-search route planner. */
class RoutePlanner final {
  public:
    RoutePlanner(GeoCost geo_cost, PlanningConstraints constraints);

    [[nodiscard]] const PlanningConstraints& constraints() const noexcept;
    [[nodiscard]] const GeoCost& geo_cost() const noexcept;

    /**
     * @brief Partition @p victims across @p responders and order each route.
     *
     * Victims are ranked by their current priority_score (see
     * PriorityScorer::ranks_before); responders are visited in id order.
     * The output is deterministic for identical inputs unless the time
     * limit expires.
     */
    [[nodiscard]] PlanningResult plan(std::vector<Victim> victims, std::vector<Responder> responders) const;

  private:
    struct RouteDraft {
        const Responder* responder{};
        std::vector<std::size_t> stops{};
        double distance_m{};
        std::size_t cap{};
    };

    struct Insertion {
        std::size_t position{};
        double added_distance_m{};
    };

    [[nodiscard]] Insertion best_insertion(const RouteDraft& draft,
                                           const std::vector<Victim>& victims,
                                           std::size_t candidate) const;
    [[nodiscard]] double path_distance_m(const RouteDraft& draft, const std::vector<Victim>& victims) const;
    /** @brief Apply improving segment reversals until none remain; false if the deadline hit first. */
    bool improve_with_two_opt(RouteDraft& draft, const std::vector<Victim>& victims, TimePoint deadline) const;
    [[nodiscard]] bool fits_budget(double distance_m) const;
    [[nodiscard]] RouteSolution to_solution(const RouteDraft& draft, const std::vector<Victim>& victims) const;
    [[nodiscard]] UnassignableReason classify_unassigned(const Victim& victim,
                                                         const std::vector<Responder>& responders) const;

    GeoCost geo_cost_;
    PlanningConstraints constraints_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rescue_dispatch
