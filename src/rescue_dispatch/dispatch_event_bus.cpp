#include "rescue_dispatch/dispatch_event_bus.hpp"

#include <utility>

namespace rescue_dispatch {

void DispatchEventBus::publish(DispatchEvent event) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(std::move(event));
}

std::optional<DispatchEvent> DispatchEventBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    DispatchEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t DispatchEventBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

}  // namespace rescue_dispatch
