// === Survival Estimator ======================================================
//
// Boundary to the external survival-probability model. The engine never calls
// an estimator itself; producers fill DetectionEvent::survival_likelihood
// before publishing. InjuryTableEstimator is the fallback used when no
// trained model is available.

#pragma once

#include <memory>

#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

/** @brief Attributes a producer knows about a person when it detects them. */
struct VictimObservation final {
    InjuryLevel injury_level{InjuryLevel::None};
    int age_estimate_years{};
    double detection_confidence{};
};

/** @brief Opaque survival model returning a probability in [0, 1]. */
class SurvivalEstimator {
  public:
    virtual ~SurvivalEstimator() = default;

    [[nodiscard]] virtual double estimate(const VictimObservation& observation) const = 0;
};

/** @brief Lookup-table estimator keyed on injury level only. */
class InjuryTableEstimator final : public SurvivalEstimator {
  public:
    [[nodiscard]] double estimate(const VictimObservation& observation) const override;
};

using SurvivalEstimatorPtr = std::unique_ptr<SurvivalEstimator>;

}  // namespace rescue_dispatch
