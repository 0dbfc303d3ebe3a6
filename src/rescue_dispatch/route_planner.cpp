#include "rescue_dispatch/route_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include "rescue_dispatch/logging.hpp"
#include "rescue_dispatch/priority_scorer.hpp"

namespace rescue_dispatch {

namespace {
constexpr double k_improvement_epsilon_m{1e-6}; /**< Minimum gain for a 2-opt move to count. */
constexpr double k_max_time_limit_s{24.0 * 3600.0};

bool deadline_passed(TimePoint deadline) {
    return SteadyClock::now() >= deadline;
}
}  // namespace

std::string_view to_string(UnassignableReason reason) noexcept {
    switch (reason) {
        case UnassignableReason::ExceedsTimeBudget:
            return "exceeds_time_budget";
        case UnassignableReason::InsufficientCapacity:
            return "insufficient_capacity";
        case UnassignableReason::NoResponders:
            return "no_responders";
        case UnassignableReason::PlanningTimedOut:
            return "planning_timed_out";
    }
    return "unknown";
}

RoutePlanner::RoutePlanner(GeoCost geo_cost, PlanningConstraints constraints)
    : geo_cost_(geo_cost),
      constraints_(constraints),
      logger_(get_logger()) {
    if (!std::isfinite(constraints_.max_route_duration.count()) || constraints_.max_route_duration.count() <= 0.0) {
        throw std::invalid_argument("RoutePlanner route duration budget must be positive and finite");
    }
    if (constraints_.max_victims_per_responder < 1) {
        throw std::invalid_argument("RoutePlanner victims-per-responder cap must be at least 1");
    }
    // The deadline is converted to integer clock ticks.
    if (!std::isfinite(constraints_.time_limit.count())
        || constraints_.time_limit.count() < 0.0
        || constraints_.time_limit.count() > k_max_time_limit_s) {
        throw std::invalid_argument("RoutePlanner time limit must lie in [0, 86400] seconds");
    }
}

const PlanningConstraints& RoutePlanner::constraints() const noexcept {
    return constraints_;
}

const GeoCost& RoutePlanner::geo_cost() const noexcept {
    return geo_cost_;
}

PlanningResult RoutePlanner::plan(std::vector<Victim> victims, std::vector<Responder> responders) const {
    const TimePoint deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(constraints_.time_limit);

    PlanningResult result{};
    if (victims.empty()) {
        return result;
    }

    std::sort(victims.begin(), victims.end(), &PriorityScorer::ranks_before);
    std::sort(responders.begin(), responders.end(), [](const Responder& lhs, const Responder& rhs) {
        return lhs.id < rhs.id;
    });

    std::vector<bool> list_assigned(victims.size(), false);
    for (const Responder& responder : responders) {
        if (result.report.timed_out) {
            break;
        }

        RouteDraft draft{};
        draft.responder = &responder;
        draft.cap = static_cast<std::size_t>(std::max(0, std::min(responder.capacity, constraints_.max_victims_per_responder)));

        while (draft.stops.size() < draft.cap) {
            if (deadline_passed(deadline)) {
                result.report.timed_out = true;
                break;
            }
            bool inserted = false;
            for (std::size_t candidate = 0; candidate < victims.size(); ++candidate) {
                if (list_assigned[candidate]) {
                    continue;
                }
                const Insertion insertion = best_insertion(draft, victims, candidate);
                if (!fits_budget(draft.distance_m + insertion.added_distance_m)) {
                    continue;
                }
                draft.stops.insert(draft.stops.begin() + static_cast<std::ptrdiff_t>(insertion.position), candidate);
                draft.distance_m += insertion.added_distance_m;
                list_assigned[candidate] = true;
                inserted = true;
                break;
            }
            if (!inserted) {
                break;
            }
        }

        if (draft.stops.empty()) {
            continue;
        }
        if (!result.report.timed_out && !improve_with_two_opt(draft, victims, deadline)) {
            result.report.timed_out = true;
        }
        result.solutions.push_back(to_solution(draft, victims));
    }

    for (std::size_t index = 0; index < victims.size(); ++index) {
        if (list_assigned[index]) {
            continue;
        }
        const UnassignableReason reason = result.report.timed_out
            ? UnassignableReason::PlanningTimedOut
            : classify_unassigned(victims[index], responders);
        result.report.unassignable.push_back(UnassignableVictim{victims[index].id, reason});
    }

    logger_->debug(
        R"({{"component":"route_planner","victims":{},"responders":{},"routes":{},"unassignable":{},"timed_out":{}}})",
        victims.size(),
        responders.size(),
        result.solutions.size(),
        result.report.unassignable.size(),
        result.report.timed_out ? "true" : "false"
    );
    return result;
}

RoutePlanner::Insertion RoutePlanner::best_insertion(const RouteDraft& draft,
                                                     const std::vector<Victim>& victims,
                                                     std::size_t candidate) const {
    const GeodeticCoordinate& candidate_location = victims[candidate].location;
    Insertion best{0, std::numeric_limits<double>::infinity()};

    for (std::size_t position = 0; position <= draft.stops.size(); ++position) {
        const GeodeticCoordinate& previous = position == 0
            ? draft.responder->location
            : victims[draft.stops[position - 1]].location;

        double added_m = geo_cost_.distance_m(previous, candidate_location);
        if (position < draft.stops.size()) {
            const GeodeticCoordinate& next = victims[draft.stops[position]].location;
            added_m += geo_cost_.distance_m(candidate_location, next) - geo_cost_.distance_m(previous, next);
        }
        if (added_m < best.added_distance_m) {
            best = Insertion{position, added_m};
        }
    }
    return best;
}

double RoutePlanner::path_distance_m(const RouteDraft& draft, const std::vector<Victim>& victims) const {
    double total_m = 0.0;
    GeodeticCoordinate previous = draft.responder->location;
    for (const std::size_t stop : draft.stops) {
        total_m += geo_cost_.distance_m(previous, victims[stop].location);
        previous = victims[stop].location;
    }
    return total_m;
}

bool RoutePlanner::improve_with_two_opt(RouteDraft& draft, const std::vector<Victim>& victims, TimePoint deadline) const {
    const std::size_t stop_count = draft.stops.size();
    if (stop_count < 2) {
        return true;
    }

    const auto location_at = [&](std::size_t position) -> const GeodeticCoordinate& {
        return victims[draft.stops[position]].location;
    };

    bool improved = true;
    while (improved) {
        if (deadline_passed(deadline)) {
            return false;
        }
        improved = false;
        for (std::size_t first = 0; first + 1 < stop_count && !improved; ++first) {
            const GeodeticCoordinate& before_segment = first == 0 ? draft.responder->location : location_at(first - 1);
            for (std::size_t last = first + 1; last < stop_count; ++last) {
                double removed_m = geo_cost_.distance_m(before_segment, location_at(first));
                double added_m = geo_cost_.distance_m(before_segment, location_at(last));
                if (last + 1 < stop_count) {
                    removed_m += geo_cost_.distance_m(location_at(last), location_at(last + 1));
                    added_m += geo_cost_.distance_m(location_at(first), location_at(last + 1));
                }
                if (added_m + k_improvement_epsilon_m < removed_m) {
                    std::reverse(
                        draft.stops.begin() + static_cast<std::ptrdiff_t>(first),
                        draft.stops.begin() + static_cast<std::ptrdiff_t>(last) + 1
                    );
                    improved = true;
                    break;
                }
            }
        }
    }
    draft.distance_m = path_distance_m(draft, victims);
    return true;
}

bool RoutePlanner::fits_budget(double distance_m) const {
    return geo_cost_.travel_time_s(distance_m) <= constraints_.max_route_duration.count();
}

RouteSolution RoutePlanner::to_solution(const RouteDraft& draft, const std::vector<Victim>& victims) const {
    RouteSolution solution{};
    solution.responder_id = draft.responder->id;
    solution.ordered_victim_ids.reserve(draft.stops.size());
    for (const std::size_t stop : draft.stops) {
        solution.ordered_victim_ids.push_back(victims[stop].id);
    }
    solution.total_distance_m = path_distance_m(draft, victims);
    solution.estimated_duration_s = geo_cost_.travel_time_s(solution.total_distance_m);
    return solution;
}

UnassignableReason RoutePlanner::classify_unassigned(const Victim& victim, const std::vector<Responder>& responders) const {
    if (responders.empty()) {
        return UnassignableReason::NoResponders;
    }
    const bool reachable = std::any_of(responders.begin(), responders.end(), [&](const Responder& responder) {
        return fits_budget(geo_cost_.distance_m(responder.location, victim.location));
    });
    return reachable ? UnassignableReason::InsufficientCapacity : UnassignableReason::ExceedsTimeBudget;
}

}  // namespace rescue_dispatch
