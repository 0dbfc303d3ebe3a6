// === Victim Registry =========================================================
//
// Owns every victim record for the lifetime of the engine. Deduplicates
// detections by upstream candidate id and by merge radius, ages out stale
// victims, and retains served/expired records for audit until the retention
// window elapses. Every public operation is atomic with respect to other
// callers.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "rescue_dispatch/geo_cost.hpp"
#include "rescue_dispatch/victim.hpp"

namespace rescue_dispatch {

inline constexpr double k_default_merge_radius_m{50.0};

/** @brief Thread-safe store of victim records in insertion order. */
class VictimRegistry final {
  public:
    explicit VictimRegistry(double merge_radius_m = k_default_merge_radius_m);

    /**
     * @brief Merge @p detection into an existing active victim or insert a new one.
     *
     * The merge target is the active victim already carrying the detection's
     * candidate id, otherwise the nearest active victim within the merge
     * radius. Merging keeps the earliest detection time, the most severe
     * injury level, and the location of the newest detection, so repeated or
     * reordered deliveries converge on the same record.
     *
     * @throws ValidationError for invalid coordinates or survival likelihood.
     */
    UpsertResult upsert_detection(const DetectionEvent& detection);

    /** @brief Transition an active victim to Served. Returns false when nothing changed. */
    bool mark_served(const std::string& victim_id, TimePoint when);

    /** @brief Expire every active victim detected more than @p max_age before @p now. */
    std::vector<std::string> expire_stale(TimePoint now, Duration max_age);
    /** @brief As above, skipping victims listed in @p assigned_victim_ids. */
    std::vector<std::string> expire_stale(TimePoint now,
                                          Duration max_age,
                                          const std::unordered_set<std::string>& assigned_victim_ids);

    /** @brief Drop served/expired records whose transition is older than @p retention. */
    std::size_t purge_retired(TimePoint now, Duration retention);

    /** @brief Overwrite the derived priority score of each listed victim. */
    void apply_scores(const std::unordered_map<std::string, double>& scores_by_id);

    [[nodiscard]] std::vector<Victim> active_victims() const;
    [[nodiscard]] std::vector<Victim> all_victims() const;
    [[nodiscard]] std::optional<Victim> find(const std::string& victim_id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] double merge_radius_m() const noexcept;

  private:
    std::optional<std::size_t> find_merge_target(const DetectionEvent& detection) const;
    void merge_into(Victim& victim, const DetectionEvent& detection);
    std::string next_identifier();
    void rebuild_index();

    GeoCost geo_cost_;
    double merge_radius_m_;
    mutable std::mutex mutex_;
    std::vector<Victim> list_victims_;
    std::unordered_map<std::string, std::size_t> map_index_by_id_;
    std::unordered_map<std::string, std::string> map_victim_by_candidate_;
    std::size_t next_sequence_{1};
};

}  // namespace rescue_dispatch
