#include "rescue_dispatch/responder_registry.hpp"

#include <utility>

#include <fmt/format.h>

#include "rescue_dispatch/errors.hpp"
#include "rescue_dispatch/geo_cost.hpp"

namespace rescue_dispatch {

namespace {
void validate_responder(const Responder& responder) {
    if (responder.id.empty()) {
        throw ValidationError("Responder id must not be empty");
    }
    if (!is_valid_coordinate(responder.location)) {
        throw ValidationError(fmt::format(
            "Responder {} coordinates out of range: lat={} lon={}",
            responder.id,
            responder.location.latitude_deg,
            responder.location.longitude_deg
        ));
    }
    if (responder.capacity < 1) {
        throw ValidationError(fmt::format("Responder {} capacity must be at least 1", responder.id));
    }
}

template <typename Predicate>
std::vector<Responder> collect_if(const std::map<std::string, Responder>& map_responders, Predicate predicate) {
    std::vector<Responder> list_selected;
    for (const auto& [responder_id, responder] : map_responders) {
        if (predicate(responder)) {
            list_selected.push_back(responder);
        }
    }
    return list_selected;
}
}  // namespace

void ResponderRegistry::upsert(const Responder& responder) {
    validate_responder(responder);

    std::scoped_lock lock(mutex_);
    const auto iterator_existing = map_responders_.find(responder.id);
    if (iterator_existing == map_responders_.end()) {
        // Routes are only written through set_route.
        Responder inserted = responder;
        inserted.current_route.clear();
        map_responders_.emplace(inserted.id, std::move(inserted));
        return;
    }

    Responder& existing = iterator_existing->second;
    std::vector<std::string> kept_route;
    if (responder.status == ResponderStatus::EnRoute) {
        kept_route = existing.current_route;
    }
    if (kept_route.size() > static_cast<std::size_t>(responder.capacity)) {
        throw CapacityExceeded(responder.id, kept_route.size(), responder.capacity);
    }
    existing.location = responder.location;
    existing.capacity = responder.capacity;
    existing.status = responder.status;
    existing.current_route = std::move(kept_route);
}

std::vector<std::string> ResponderRegistry::set_available(const std::string& responder_id) {
    std::scoped_lock lock(mutex_);
    const auto iterator_responder = map_responders_.find(responder_id);
    if (iterator_responder == map_responders_.end()) {
        return {};
    }
    Responder& responder = iterator_responder->second;
    std::vector<std::string> former_route = std::exchange(responder.current_route, {});
    responder.status = ResponderStatus::Available;
    return former_route;
}

bool ResponderRegistry::set_route(const std::string& responder_id, std::vector<std::string> victim_ids) {
    std::scoped_lock lock(mutex_);
    const auto iterator_responder = map_responders_.find(responder_id);
    if (iterator_responder == map_responders_.end()) {
        return false;
    }
    Responder& responder = iterator_responder->second;
    if (victim_ids.size() > static_cast<std::size_t>(responder.capacity)) {
        throw CapacityExceeded(responder_id, victim_ids.size(), responder.capacity);
    }
    responder.status = victim_ids.empty() ? ResponderStatus::Available : ResponderStatus::EnRoute;
    responder.current_route = std::move(victim_ids);
    return true;
}

std::vector<Responder> ResponderRegistry::available_responders() const {
    std::scoped_lock lock(mutex_);
    return collect_if(map_responders_, [](const Responder& responder) {
        return responder.status == ResponderStatus::Available;
    });
}

std::vector<Responder> ResponderRegistry::all_responders() const {
    std::scoped_lock lock(mutex_);
    return collect_if(map_responders_, [](const Responder&) { return true; });
}

std::unordered_set<std::string> ResponderRegistry::assigned_victim_ids() const {
    std::scoped_lock lock(mutex_);
    std::unordered_set<std::string> set_assigned;
    for (const auto& [responder_id, responder] : map_responders_) {
        set_assigned.insert(responder.current_route.begin(), responder.current_route.end());
    }
    return set_assigned;
}

std::optional<Responder> ResponderRegistry::find(const std::string& responder_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_responder = map_responders_.find(responder_id);
    if (iterator_responder == map_responders_.end()) {
        return std::nullopt;
    }
    return iterator_responder->second;
}

std::size_t ResponderRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return map_responders_.size();
}

}  // namespace rescue_dispatch
