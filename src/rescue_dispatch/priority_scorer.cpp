#include "rescue_dispatch/priority_scorer.hpp"

#include <algorithm>

namespace rescue_dispatch {

namespace {
constexpr double k_survival_scale{100.0};
constexpr double k_seconds_per_hour{3600.0};
constexpr double k_urgency_horizon_hours{24.0};
}  // namespace

double PriorityScorer::injury_multiplier(InjuryLevel level) noexcept {
    switch (level) {
        case InjuryLevel::Unconscious:
            return 1.5;
        case InjuryLevel::Severe:
            return 1.3;
        case InjuryLevel::Minor:
            return 1.1;
        case InjuryLevel::None:
            return 1.0;
    }
    return 1.0;
}

double PriorityScorer::urgency_multiplier(TimePoint detected_at, TimePoint now) noexcept {
    const Duration elapsed = now - detected_at;
    const double elapsed_hours = std::max(0.0, elapsed.count() / k_seconds_per_hour);
    return 1.0 + elapsed_hours / k_urgency_horizon_hours;
}

double PriorityScorer::score(const Victim& victim, TimePoint now) const noexcept {
    const double base = victim.survival_likelihood * k_survival_scale;
    return base * injury_multiplier(victim.injury_level) * urgency_multiplier(victim.detected_at, now);
}

bool PriorityScorer::ranks_before(const Victim& lhs, const Victim& rhs) noexcept {
    if (lhs.priority_score != rhs.priority_score) {
        return lhs.priority_score > rhs.priority_score;
    }
    if (lhs.detected_at != rhs.detected_at) {
        return lhs.detected_at < rhs.detected_at;
    }
    return lhs.id < rhs.id;
}

void PriorityScorer::rank(std::vector<Victim>& victims, TimePoint now) const {
    for (Victim& victim : victims) {
        victim.priority_score = score(victim, now);
    }
    std::sort(victims.begin(), victims.end(), &PriorityScorer::ranks_before);
}

}  // namespace rescue_dispatch
