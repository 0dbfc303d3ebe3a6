// === Dispatch Event Bus ======================================================
//
// Provides a minimal thread-safe queue that carries detection, responder
// status, and route completion events from many producers to the single
// ingestion loop owned by DispatchRuntime.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <variant>

#include "rescue_dispatch/responder.hpp"
#include "rescue_dispatch/victim.hpp"

namespace rescue_dispatch {

/** @brief Any event the engine consumes from its collaborators. */
using DispatchEvent = std::variant<DetectionEvent, ResponderStatusEvent, RouteCompletionEvent>;

/** @brief Thread-safe FIFO used to hand events to the dispatch loop. */
class DispatchEventBus final {
  public:
    /** @brief Enqueue an event; safe to call from any producer thread. */
    void publish(DispatchEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<DispatchEvent> try_consume();
    /** @brief Number of events waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<DispatchEvent> queue_events_;
};

}  // namespace rescue_dispatch
