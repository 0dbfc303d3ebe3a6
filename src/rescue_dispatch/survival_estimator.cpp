#include "rescue_dispatch/survival_estimator.hpp"

namespace rescue_dispatch {

double InjuryTableEstimator::estimate(const VictimObservation& observation) const {
    switch (observation.injury_level) {
        case InjuryLevel::None:
            return 0.9;
        case InjuryLevel::Minor:
            return 0.7;
        case InjuryLevel::Severe:
            return 0.4;
        case InjuryLevel::Unconscious:
            return 0.2;
    }
    return 0.5;
}

}  // namespace rescue_dispatch
