#include "rescue_dispatch/types.hpp"

namespace rescue_dispatch {

std::string_view to_string(InjuryLevel level) noexcept {
    switch (level) {
        case InjuryLevel::None:
            return "none";
        case InjuryLevel::Minor:
            return "minor";
        case InjuryLevel::Severe:
            return "severe";
        case InjuryLevel::Unconscious:
            return "unconscious";
    }
    return "unknown";
}

std::string_view to_string(VictimStatus status) noexcept {
    switch (status) {
        case VictimStatus::Active:
            return "active";
        case VictimStatus::Served:
            return "served";
        case VictimStatus::Expired:
            return "expired";
    }
    return "unknown";
}

std::string_view to_string(ResponderStatus status) noexcept {
    switch (status) {
        case ResponderStatus::Available:
            return "available";
        case ResponderStatus::EnRoute:
            return "enroute";
        case ResponderStatus::Unavailable:
            return "unavailable";
    }
    return "unknown";
}

}  // namespace rescue_dispatch
