// === Dispatch Coordinator ====================================================
//
// Owns the victim and responder registries and is the only component that
// writes across them. Ingests detection, status, and completion events,
// rescores victims, runs the route planner over a consistent snapshot of
// both registries, and applies the resulting routes. Exposes the read-side
// views (routes, victims, system status) consumed by the API layer.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "rescue_dispatch/geo_cost.hpp"
#include "rescue_dispatch/logging.hpp"
#include "rescue_dispatch/priority_scorer.hpp"
#include "rescue_dispatch/responder_registry.hpp"
#include "rescue_dispatch/route_planner.hpp"
#include "rescue_dispatch/victim_registry.hpp"

namespace rescue_dispatch {

/**
 * @brief Tunable parameters for deduplication, ageing, and planning.
 *
 * Populated at startup by ConfigurationLoader and treated as immutable while
 * the engine runs.
 */
struct DispatchConfig final {
    double merge_radius_m{k_default_merge_radius_m};
    double travel_speed_mps{k_default_travel_speed_mps};
    Duration max_route_duration{Duration{5.0 * 3600.0}};
    int max_victims_per_responder{5};
    Duration max_victim_age{Duration{24.0 * 3600.0}};
    Duration retention_window{Duration{3600.0}};
    Duration planning_time_limit{Duration{30.0}};
    bool replan_on_new_victim{true};
};

/** @brief Aggregate view of the engine for dashboards and health checks. */
struct SystemStatus final {
    std::size_t total_active_victims{};
    std::size_t available_responders{};
    double average_survival_likelihood{};
    double system_load{};
    std::size_t enroute_responders{};
    std::size_t unassignable_victims{};
    bool last_plan_timed_out{};
};

/** @brief Polyline for drawing one responder's current route. */
struct RouteVisualization final {
    std::string responder_id{};
    std::vector<GeodeticCoordinate> path{};  /**< Responder start followed by each victim in visit order. */
    double total_distance_m{};
    double estimated_duration_s{};
    std::size_t victim_count{};
};

/** @brief Orchestrates ingestion, scoring, planning, and route application. */
class DispatchCoordinator final {
  public:
    explicit DispatchCoordinator(DispatchConfig config);

    [[nodiscard]] const DispatchConfig& config() const noexcept;

    /**
     * @brief Record a detection; a new victim may request a fast-reaction replan.
     *
     * @throws ValidationError when the detection is malformed.
     */
    UpsertResult on_detection(const DetectionEvent& detection);

    /**
     * @brief Apply a responder status report.
     *
     * @throws ValidationError / CapacityExceeded from ResponderRegistry::upsert.
     */
    void on_responder_status(const ResponderStatusEvent& update);

    /** @brief Serve every victim on the responder's route and free the responder. */
    std::vector<std::string> on_route_completion(const RouteCompletionEvent& completion);

    /**
     * @brief Rescore, plan the unrouted victims over Available responders, and apply the routes.
     *
     * Routes already held by en-route responders are never changed here;
     * they only end through a completion signal or a status report. The
     * returned list holds every current route, new and held, in responder
     * id order. Safe to call at any time and from any thread; concurrent
     * calls run one after another. Ingestion is only paused while the
     * snapshot is copied and while routes are written back.
     */
    std::vector<RouteSolution> replan(TimePoint now);

    /** @brief Expire unassigned victims past max age and purge retired records. */
    std::vector<std::string> expire_stale(TimePoint now);

    /** @brief Consume the pending fast-reaction replan request, if any. */
    [[nodiscard]] bool take_replan_request() noexcept;

    [[nodiscard]] std::vector<RouteSolution> routes() const;
    /** @brief All retained victim records, highest priority first. */
    [[nodiscard]] std::vector<Victim> victims() const;
    [[nodiscard]] SystemStatus system_status() const;
    [[nodiscard]] std::optional<RouteVisualization> route_visualization(const std::string& responder_id) const;
    [[nodiscard]] PlanningReport last_report() const;

    [[nodiscard]] const VictimRegistry& victim_registry() const noexcept;
    [[nodiscard]] const ResponderRegistry& responder_registry() const noexcept;

  private:
    /** @brief Write planner output back to the responder registry; returns what was applied. */
    std::vector<RouteSolution> apply_solutions(const PlanningResult& result);
    /** @brief Every non-empty route held in the responder registry, in responder id order. */
    [[nodiscard]] std::vector<RouteSolution> held_routes() const;
    /** @brief Solution view of @p responder's current route; caller holds state_mutex_. */
    [[nodiscard]] RouteSolution solution_for(const Responder& responder) const;
    void log_plan(const std::vector<RouteSolution>& applied, const PlanningReport& report) const;

    DispatchConfig config_;
    GeoCost geo_cost_;
    VictimRegistry victim_registry_;
    ResponderRegistry responder_registry_;
    PriorityScorer priority_scorer_;
    RoutePlanner route_planner_;

    mutable std::shared_mutex state_mutex_;  /**< Shared for single-registry ingestion, exclusive for cross-registry work. */
    std::mutex plan_mutex_;                  /**< Serialises replan calls. */
    mutable std::mutex results_mutex_;       /**< Guards the published routes and report. */
    std::vector<RouteSolution> list_routes_;
    PlanningReport last_report_;

    std::atomic<bool> flag_replan_requested_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rescue_dispatch
