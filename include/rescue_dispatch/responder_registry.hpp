// === Responder Registry ======================================================
//
// Owns responder records, their availability, and the route currently
// assigned to each. Routes are only ever written through set_route, which
// enforces the capacity invariant.

#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "rescue_dispatch/responder.hpp"

namespace rescue_dispatch {

/** @brief Thread-safe store of responder records keyed and ordered by id. */
class ResponderRegistry final {
  public:
    /**
     * @brief Insert a responder or replace its status, location, and capacity.
     *
     * The stored route survives only while the new status is EnRoute; any
     * route carried by @p responder itself is ignored.
     *
     * @throws ValidationError for an empty id, invalid coordinates, or capacity < 1.
     * @throws CapacityExceeded when the kept route no longer fits the new capacity.
     */
    void upsert(const Responder& responder);

    /** @brief Mark the responder Available and return the route it held. */
    std::vector<std::string> set_available(const std::string& responder_id);

    /**
     * @brief Replace the responder's route; EnRoute when non-empty, Available otherwise.
     *
     * @return false when the responder is unknown.
     * @throws CapacityExceeded when @p victim_ids exceeds the responder's capacity.
     */
    bool set_route(const std::string& responder_id, std::vector<std::string> victim_ids);

    [[nodiscard]] std::vector<Responder> available_responders() const;
    [[nodiscard]] std::vector<Responder> all_responders() const;
    [[nodiscard]] std::unordered_set<std::string> assigned_victim_ids() const;
    [[nodiscard]] std::optional<Responder> find(const std::string& responder_id) const;
    [[nodiscard]] std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, Responder> map_responders_;
};

}  // namespace rescue_dispatch
