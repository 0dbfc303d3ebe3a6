// === Dispatch Errors =========================================================
//
// Exception types raised at the engine's ingestion boundary. Planning
// timeouts and unassignable victims are not exceptions; they are reported
// through PlanningReport (see route_planner.hpp).

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace rescue_dispatch {

/** @brief Base class for recoverable dispatch engine failures. */
class DispatchError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed coordinates, identifiers, or attribute values. */
class ValidationError final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief A route assignment would exceed a responder's capacity. */
class CapacityExceeded final : public DispatchError {
  public:
    CapacityExceeded(const std::string& responder_id, std::size_t requested, int capacity);

    [[nodiscard]] const std::string& responder_id() const noexcept;

  private:
    std::string str_responder_id_;
};

}  // namespace rescue_dispatch
