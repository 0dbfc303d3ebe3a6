// === Priority Scorer =========================================================
//
// Fuses the external survival estimate, injury severity, and time since first
// detection into a single dispatch priority. The score never decreases as
// time passes for a fixed victim.

#pragma once

#include <vector>

#include "rescue_dispatch/types.hpp"
#include "rescue_dispatch/victim.hpp"

namespace rescue_dispatch {

/** @brief Stateless scoring and ranking of victims. */
class PriorityScorer final {
  public:
    /** @brief Multiplier applied for each injury level (1.0 to 1.5). */
    [[nodiscard]] static double injury_multiplier(InjuryLevel level) noexcept;
    /** @brief 1 + elapsed hours / 24; elapsed time is clamped at zero. */
    [[nodiscard]] static double urgency_multiplier(TimePoint detected_at, TimePoint now) noexcept;

    /** @brief Priority of @p victim as of @p now. */
    [[nodiscard]] double score(const Victim& victim, TimePoint now) const noexcept;

    /**
     * @brief Strict ordering used for planning: higher score first, then
     *        older detection, then smaller id.
     */
    [[nodiscard]] static bool ranks_before(const Victim& lhs, const Victim& rhs) noexcept;

    /** @brief Rescore every victim as of @p now and sort them by rank. */
    void rank(std::vector<Victim>& victims, TimePoint now) const;
};

}  // namespace rescue_dispatch
