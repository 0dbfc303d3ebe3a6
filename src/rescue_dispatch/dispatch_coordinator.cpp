#include "rescue_dispatch/dispatch_coordinator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "rescue_dispatch/errors.hpp"
#include "rescue_dispatch/logging.hpp"

namespace rescue_dispatch {

namespace {
PlanningConstraints make_constraints(const DispatchConfig& config) {
    PlanningConstraints constraints{};
    constraints.max_route_duration = config.max_route_duration;
    constraints.max_victims_per_responder = config.max_victims_per_responder;
    constraints.time_limit = config.planning_time_limit;
    return constraints;
}
}  // namespace

DispatchCoordinator::DispatchCoordinator(DispatchConfig config)
    : config_(config),
      geo_cost_(config_.travel_speed_mps),
      victim_registry_(config_.merge_radius_m),
      route_planner_(geo_cost_, make_constraints(config_)),
      logger_(get_logger()) {
    if (!std::isfinite(config_.max_victim_age.count()) || config_.max_victim_age.count() <= 0.0) {
        throw std::invalid_argument("DispatchCoordinator max victim age must be positive and finite");
    }
    if (!std::isfinite(config_.retention_window.count()) || config_.retention_window.count() < 0.0) {
        throw std::invalid_argument("DispatchCoordinator retention window must be finite and not negative");
    }
    logger_->info(
        "Dispatch coordinator ready: merge_radius_m={} speed_mps={:.3f} route_budget_s={} cap={} planning_limit_s={}",
        config_.merge_radius_m,
        config_.travel_speed_mps,
        config_.max_route_duration.count(),
        config_.max_victims_per_responder,
        config_.planning_time_limit.count()
    );
}

const DispatchConfig& DispatchCoordinator::config() const noexcept {
    return config_;
}

UpsertResult DispatchCoordinator::on_detection(const DetectionEvent& detection) {
    UpsertResult result{};
    {
        std::shared_lock state_lock(state_mutex_);
        result = victim_registry_.upsert_detection(detection);
    }
    if (result.created) {
        logger_->info(
            R"({{"component":"dispatch","event":"victim_detected","victim":"{}","injury":"{}","survival":{:.3f}}})",
            result.victim_id,
            to_string(detection.injury_level),
            detection.survival_likelihood
        );
        if (config_.replan_on_new_victim) {
            flag_replan_requested_.store(true);
        }
    } else {
        logger_->debug("Detection merged into {}", result.victim_id);
    }
    return result;
}

void DispatchCoordinator::on_responder_status(const ResponderStatusEvent& update) {
    Responder responder{};
    responder.id = update.responder_id;
    responder.location = update.location;
    responder.capacity = update.capacity;
    responder.status = update.status;

    std::shared_lock state_lock(state_mutex_);
    responder_registry_.upsert(responder);
    logger_->debug("Responder {} reported status {}", update.responder_id, to_string(update.status));
}

std::vector<std::string> DispatchCoordinator::on_route_completion(const RouteCompletionEvent& completion) {
    std::vector<std::string> list_served;
    {
        std::unique_lock state_lock(state_mutex_);
        const std::vector<std::string> former_route = responder_registry_.set_available(completion.responder_id);
        for (const std::string& victim_id : former_route) {
            if (victim_registry_.mark_served(victim_id, completion.completed_at)) {
                list_served.push_back(victim_id);
            }
        }
    }
    {
        std::scoped_lock results_lock(results_mutex_);
        std::erase_if(list_routes_, [&completion](const RouteSolution& solution) {
            return solution.responder_id == completion.responder_id;
        });
    }
    logger_->info(
        R"({{"component":"dispatch","event":"route_completed","responder":"{}","served":{}}})",
        completion.responder_id,
        list_served.size()
    );
    return list_served;
}

std::vector<RouteSolution> DispatchCoordinator::replan(TimePoint now) {
    std::scoped_lock plan_lock(plan_mutex_);

    std::vector<Victim> snapshot_victims;
    std::vector<Responder> snapshot_responders;
    std::unordered_set<std::string> set_routed_victims;
    {
        std::unique_lock state_lock(state_mutex_);
        snapshot_victims = victim_registry_.active_victims();
        snapshot_responders = responder_registry_.available_responders();
        set_routed_victims = responder_registry_.assigned_victim_ids();
    }

    priority_scorer_.rank(snapshot_victims, now);
    std::unordered_map<std::string, double> map_scores;
    for (const Victim& victim : snapshot_victims) {
        map_scores.emplace(victim.id, victim.priority_score);
    }
    victim_registry_.apply_scores(map_scores);

    // Victims already on an en-route responder's path keep that assignment.
    std::erase_if(snapshot_victims, [&set_routed_victims](const Victim& victim) {
        return set_routed_victims.contains(victim.id);
    });

    const PlanningResult result = route_planner_.plan(std::move(snapshot_victims), std::move(snapshot_responders));
    const std::vector<RouteSolution> applied = apply_solutions(result);
    std::vector<RouteSolution> published = held_routes();

    {
        std::scoped_lock results_lock(results_mutex_);
        list_routes_ = published;
        last_report_ = result.report;
    }
    log_plan(applied, result.report);
    return published;
}

std::vector<std::string> DispatchCoordinator::expire_stale(TimePoint now) {
    std::vector<std::string> list_expired;
    std::size_t purged_count = 0;
    {
        std::unique_lock state_lock(state_mutex_);
        list_expired = victim_registry_.expire_stale(now, config_.max_victim_age, responder_registry_.assigned_victim_ids());
        purged_count = victim_registry_.purge_retired(now, config_.retention_window);
    }
    for (const std::string& victim_id : list_expired) {
        logger_->warn(R"({{"component":"dispatch","event":"victim_expired","victim":"{}"}})", victim_id);
    }
    if (purged_count > 0) {
        logger_->info("Purged {} retired victim records", purged_count);
    }
    return list_expired;
}

bool DispatchCoordinator::take_replan_request() noexcept {
    return flag_replan_requested_.exchange(false);
}

std::vector<RouteSolution> DispatchCoordinator::routes() const {
    std::scoped_lock results_lock(results_mutex_);
    return list_routes_;
}

std::vector<Victim> DispatchCoordinator::victims() const {
    std::vector<Victim> list_victims = victim_registry_.all_victims();
    std::sort(list_victims.begin(), list_victims.end(), &PriorityScorer::ranks_before);
    return list_victims;
}

SystemStatus DispatchCoordinator::system_status() const {
    std::vector<Victim> list_active;
    std::vector<Responder> list_responders;
    {
        std::shared_lock state_lock(state_mutex_);
        list_active = victim_registry_.active_victims();
        list_responders = responder_registry_.all_responders();
    }

    SystemStatus status{};
    status.total_active_victims = list_active.size();
    status.available_responders = static_cast<std::size_t>(std::count_if(
        list_responders.begin(), list_responders.end(), [](const Responder& responder) {
            return responder.status == ResponderStatus::Available;
        }));
    status.enroute_responders = static_cast<std::size_t>(std::count_if(
        list_responders.begin(), list_responders.end(), [](const Responder& responder) {
            return responder.status == ResponderStatus::EnRoute;
        }));
    if (!list_active.empty()) {
        const double survival_sum = std::accumulate(
            list_active.begin(), list_active.end(), 0.0, [](double sum, const Victim& victim) {
                return sum + victim.survival_likelihood;
            });
        status.average_survival_likelihood = survival_sum / static_cast<double>(list_active.size());
    }
    status.system_load = static_cast<double>(status.total_active_victims)
        / static_cast<double>(std::max<std::size_t>(status.available_responders, 1));

    std::scoped_lock results_lock(results_mutex_);
    status.unassignable_victims = last_report_.unassignable.size();
    status.last_plan_timed_out = last_report_.timed_out;
    return status;
}

std::optional<RouteVisualization> DispatchCoordinator::route_visualization(const std::string& responder_id) const {
    std::optional<RouteSolution> optional_solution;
    {
        std::scoped_lock results_lock(results_mutex_);
        const auto iterator_solution = std::find_if(list_routes_.begin(), list_routes_.end(), [&](const RouteSolution& solution) {
            return solution.responder_id == responder_id;
        });
        if (iterator_solution != list_routes_.end()) {
            optional_solution = *iterator_solution;
        }
    }
    if (!optional_solution.has_value()) {
        return std::nullopt;
    }
    const std::optional<Responder> optional_responder = responder_registry_.find(responder_id);
    if (!optional_responder.has_value()) {
        return std::nullopt;
    }

    RouteVisualization visualization{};
    visualization.responder_id = responder_id;
    visualization.path.push_back(optional_responder->location);
    for (const std::string& victim_id : optional_solution->ordered_victim_ids) {
        if (const std::optional<Victim> optional_victim = victim_registry_.find(victim_id); optional_victim.has_value()) {
            visualization.path.push_back(optional_victim->location);
        }
    }
    visualization.total_distance_m = optional_solution->total_distance_m;
    visualization.estimated_duration_s = optional_solution->estimated_duration_s;
    visualization.victim_count = optional_solution->ordered_victim_ids.size();
    return visualization;
}

PlanningReport DispatchCoordinator::last_report() const {
    std::scoped_lock results_lock(results_mutex_);
    return last_report_;
}

const VictimRegistry& DispatchCoordinator::victim_registry() const noexcept {
    return victim_registry_;
}

const ResponderRegistry& DispatchCoordinator::responder_registry() const noexcept {
    return responder_registry_;
}

std::vector<RouteSolution> DispatchCoordinator::apply_solutions(const PlanningResult& result) {
    std::vector<RouteSolution> list_applied;

    std::unique_lock state_lock(state_mutex_);
    for (const RouteSolution& planned : result.solutions) {
        const std::optional<Responder> optional_responder = responder_registry_.find(planned.responder_id);
        if (!optional_responder.has_value()
            || optional_responder->status != ResponderStatus::Available
            || !optional_responder->current_route.empty()) {
            logger_->warn("Responder {} left Available during planning; dropping its route", planned.responder_id);
            continue;
        }

        // Victims served or expired while planning ran are dropped from the route.
        std::vector<std::string> list_victim_ids = planned.ordered_victim_ids;
        std::erase_if(list_victim_ids, [this](const std::string& victim_id) {
            const std::optional<Victim> optional_victim = victim_registry_.find(victim_id);
            return !optional_victim.has_value() || optional_victim->status != VictimStatus::Active;
        });
        if (list_victim_ids.empty()) {
            continue;
        }

        try {
            responder_registry_.set_route(planned.responder_id, std::move(list_victim_ids));
        } catch (const CapacityExceeded& exc) {
            logger_->warn("Route for {} no longer fits: {}", planned.responder_id, exc.what());
            continue;
        }
        if (const std::optional<Responder> optional_routed = responder_registry_.find(planned.responder_id);
            optional_routed.has_value()) {
            list_applied.push_back(solution_for(optional_routed.value()));
        }
    }
    return list_applied;
}

std::vector<RouteSolution> DispatchCoordinator::held_routes() const {
    std::shared_lock state_lock(state_mutex_);
    std::vector<RouteSolution> list_held;
    for (const Responder& responder : responder_registry_.all_responders()) {
        if (responder.status == ResponderStatus::EnRoute && !responder.current_route.empty()) {
            list_held.push_back(solution_for(responder));
        }
    }
    return list_held;
}

RouteSolution DispatchCoordinator::solution_for(const Responder& responder) const {
    RouteSolution solution{};
    solution.responder_id = responder.id;
    solution.ordered_victim_ids = responder.current_route;

    double total_m = 0.0;
    GeodeticCoordinate previous = responder.location;
    for (const std::string& victim_id : responder.current_route) {
        const std::optional<Victim> optional_victim = victim_registry_.find(victim_id);
        if (!optional_victim.has_value()) {
            continue;
        }
        total_m += geo_cost_.distance_m(previous, optional_victim->location);
        previous = optional_victim->location;
    }
    solution.total_distance_m = total_m;
    solution.estimated_duration_s = geo_cost_.travel_time_s(total_m);
    return solution;
}

void DispatchCoordinator::log_plan(const std::vector<RouteSolution>& applied, const PlanningReport& report) const {
    for (const RouteSolution& solution : applied) {
        logger_->info(
            R"({{"component":"dispatch","event":"route","responder":"{}","victims":"{}","distance_m":{:.1f},"duration_s":{:.1f}}})",
            solution.responder_id,
            fmt::join(solution.ordered_victim_ids, ","),
            solution.total_distance_m,
            solution.estimated_duration_s
        );
    }
    for (const UnassignableVictim& unassignable : report.unassignable) {
        logger_->info(
            R"({{"component":"dispatch","event":"unassignable","victim":"{}","reason":"{}"}})",
            unassignable.victim_id,
            to_string(unassignable.reason)
        );
    }
    if (report.timed_out) {
        logger_->warn(
            R"({{"component":"dispatch","event":"planning_timeout","limit_s":{},"routes":{}}})",
            config_.planning_time_limit.count(),
            applied.size()
        );
    }
}

}  // namespace rescue_dispatch
