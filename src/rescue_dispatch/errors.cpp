#include "rescue_dispatch/errors.hpp"

#include <fmt/format.h>

namespace rescue_dispatch {

CapacityExceeded::CapacityExceeded(const std::string& responder_id, std::size_t requested, int capacity)
    : DispatchError(fmt::format("Responder {} cannot take {} victims (capacity {})", responder_id, requested, capacity)),
      str_responder_id_(responder_id) {}

const std::string& CapacityExceeded::responder_id() const noexcept {
    return str_responder_id_;
}

}  // namespace rescue_dispatch
