#include "rescue_dispatch/victim_registry.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

#include "rescue_dispatch/errors.hpp"

namespace rescue_dispatch {

namespace {
void validate_detection(const DetectionEvent& detection) {
    if (!is_valid_coordinate(detection.location)) {
        throw ValidationError(fmt::format(
            "Detection coordinates out of range: lat={} lon={}",
            detection.location.latitude_deg,
            detection.location.longitude_deg
        ));
    }
    if (!std::isfinite(detection.survival_likelihood)
        || detection.survival_likelihood < 0.0
        || detection.survival_likelihood > 1.0) {
        throw ValidationError(fmt::format("Survival likelihood {} outside [0, 1]", detection.survival_likelihood));
    }
    if (detection.candidate_id.has_value() && detection.candidate_id->empty()) {
        throw ValidationError("Detection candidate id must not be empty when present");
    }
}
}  // namespace

VictimRegistry::VictimRegistry(double merge_radius_m)
    : merge_radius_m_(merge_radius_m) {
    if (!std::isfinite(merge_radius_m_) || merge_radius_m_ < 0.0) {
        throw std::invalid_argument("VictimRegistry merge radius must be non-negative");
    }
}

UpsertResult VictimRegistry::upsert_detection(const DetectionEvent& detection) {
    validate_detection(detection);

    std::scoped_lock lock(mutex_);
    if (const std::optional<std::size_t> optional_index = find_merge_target(detection); optional_index.has_value()) {
        Victim& victim = list_victims_[optional_index.value()];
        merge_into(victim, detection);
        return UpsertResult{victim.id, false};
    }

    Victim victim{};
    victim.id = next_identifier();
    victim.location = detection.location;
    victim.injury_level = detection.injury_level;
    victim.survival_likelihood = detection.survival_likelihood;
    victim.detected_at = detection.detected_at;
    victim.last_seen_at = detection.detected_at;
    victim.status = VictimStatus::Active;
    victim.detection_count = 1;
    if (detection.candidate_id.has_value()) {
        victim.candidate_ids.push_back(detection.candidate_id.value());
        map_victim_by_candidate_[detection.candidate_id.value()] = victim.id;
    }

    map_index_by_id_.emplace(victim.id, list_victims_.size());
    list_victims_.push_back(std::move(victim));
    return UpsertResult{list_victims_.back().id, true};
}

bool VictimRegistry::mark_served(const std::string& victim_id, TimePoint when) {
    std::scoped_lock lock(mutex_);
    const auto iterator_index = map_index_by_id_.find(victim_id);
    if (iterator_index == map_index_by_id_.end()) {
        return false;
    }
    Victim& victim = list_victims_[iterator_index->second];
    if (victim.status != VictimStatus::Active) {
        return false;
    }
    victim.status = VictimStatus::Served;
    victim.status_changed_at = when;
    return true;
}

std::vector<std::string> VictimRegistry::expire_stale(TimePoint now, Duration max_age) {
    return expire_stale(now, max_age, {});
}

std::vector<std::string> VictimRegistry::expire_stale(TimePoint now,
                                                      Duration max_age,
                                                      const std::unordered_set<std::string>& assigned_victim_ids) {
    std::scoped_lock lock(mutex_);
    std::vector<std::string> list_expired;
    for (Victim& victim : list_victims_) {
        if (victim.status != VictimStatus::Active || assigned_victim_ids.contains(victim.id)) {
            continue;
        }
        const Duration age = now - victim.detected_at;
        if (age > max_age) {
            victim.status = VictimStatus::Expired;
            victim.status_changed_at = now;
            list_expired.push_back(victim.id);
        }
    }
    return list_expired;
}

std::size_t VictimRegistry::purge_retired(TimePoint now, Duration retention) {
    std::scoped_lock lock(mutex_);
    const auto iterator_first_removed = std::remove_if(
        list_victims_.begin(),
        list_victims_.end(),
        [now, retention](const Victim& victim) {
            if (victim.status == VictimStatus::Active || !victim.status_changed_at.has_value()) {
                return false;
            }
            return Duration{now - victim.status_changed_at.value()} > retention;
        }
    );
    const auto purged_count = static_cast<std::size_t>(std::distance(iterator_first_removed, list_victims_.end()));
    if (purged_count == 0) {
        return 0;
    }
    list_victims_.erase(iterator_first_removed, list_victims_.end());
    rebuild_index();
    return purged_count;
}

void VictimRegistry::apply_scores(const std::unordered_map<std::string, double>& scores_by_id) {
    std::scoped_lock lock(mutex_);
    for (const auto& [victim_id, score] : scores_by_id) {
        const auto iterator_index = map_index_by_id_.find(victim_id);
        if (iterator_index == map_index_by_id_.end()) {
            continue;
        }
        list_victims_[iterator_index->second].priority_score = score;
    }
}

std::vector<Victim> VictimRegistry::active_victims() const {
    std::scoped_lock lock(mutex_);
    std::vector<Victim> list_active;
    list_active.reserve(list_victims_.size());
    std::copy_if(
        list_victims_.begin(),
        list_victims_.end(),
        std::back_inserter(list_active),
        [](const Victim& victim) { return victim.status == VictimStatus::Active; }
    );
    return list_active;
}

std::vector<Victim> VictimRegistry::all_victims() const {
    std::scoped_lock lock(mutex_);
    return list_victims_;
}

std::optional<Victim> VictimRegistry::find(const std::string& victim_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_index = map_index_by_id_.find(victim_id);
    if (iterator_index == map_index_by_id_.end()) {
        return std::nullopt;
    }
    return list_victims_[iterator_index->second];
}

std::size_t VictimRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return list_victims_.size();
}

double VictimRegistry::merge_radius_m() const noexcept {
    return merge_radius_m_;
}

std::optional<std::size_t> VictimRegistry::find_merge_target(const DetectionEvent& detection) const {
    if (detection.candidate_id.has_value()) {
        const auto iterator_candidate = map_victim_by_candidate_.find(detection.candidate_id.value());
        if (iterator_candidate != map_victim_by_candidate_.end()) {
            const auto iterator_index = map_index_by_id_.find(iterator_candidate->second);
            if (iterator_index != map_index_by_id_.end()
                && list_victims_[iterator_index->second].status == VictimStatus::Active) {
                return iterator_index->second;
            }
        }
    }

    std::optional<std::size_t> optional_nearest;
    double nearest_distance_m = std::numeric_limits<double>::infinity();
    for (std::size_t index = 0; index < list_victims_.size(); ++index) {
        const Victim& victim = list_victims_[index];
        if (victim.status != VictimStatus::Active) {
            continue;
        }
        const double distance_m = geo_cost_.distance_m(victim.location, detection.location);
        if (distance_m <= merge_radius_m_ && distance_m < nearest_distance_m) {
            nearest_distance_m = distance_m;
            optional_nearest = index;
        }
    }
    return optional_nearest;
}

void VictimRegistry::merge_into(Victim& victim, const DetectionEvent& detection) {
    if (detection.detected_at >= victim.last_seen_at) {
        victim.location = detection.location;
        victim.last_seen_at = detection.detected_at;
    }
    victim.detected_at = std::min(victim.detected_at, detection.detected_at);
    victim.injury_level = std::max(victim.injury_level, detection.injury_level);
    ++victim.detection_count;

    if (detection.candidate_id.has_value()) {
        const std::string& candidate_id = detection.candidate_id.value();
        if (std::find(victim.candidate_ids.begin(), victim.candidate_ids.end(), candidate_id) == victim.candidate_ids.end()) {
            victim.candidate_ids.push_back(candidate_id);
        }
        map_victim_by_candidate_[candidate_id] = victim.id;
    }
}

std::string VictimRegistry::next_identifier() {
    return fmt::format("victim-{:06d}", next_sequence_++);
}

void VictimRegistry::rebuild_index() {
    map_index_by_id_.clear();
    for (std::size_t index = 0; index < list_victims_.size(); ++index) {
        map_index_by_id_.emplace(list_victims_[index].id, index);
    }
    std::erase_if(map_victim_by_candidate_, [this](const auto& entry) {
        return !map_index_by_id_.contains(entry.second);
    });
}

}  // namespace rescue_dispatch
