// === Dispatch Runtime ========================================================
//
// Hosts the dispatch service: an ingestion thread drains the event bus into
// the coordinator while a planning thread expires stale victims and replans
// on a fixed cadence, or sooner when a new victim asks for fast reaction.
// Ingestion and planning run concurrently.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>

#include "rescue_dispatch/configuration.hpp"
#include "rescue_dispatch/dispatch_coordinator.hpp"
#include "rescue_dispatch/dispatch_event_bus.hpp"
#include "rescue_dispatch/logging.hpp"

namespace rescue_dispatch {

/** @brief Owns the coordinator, the event bus, and the worker threads. */
class DispatchRuntime final {
  public:
    explicit DispatchRuntime(Configuration configuration);
    ~DispatchRuntime();

    DispatchRuntime(const DispatchRuntime&) = delete;
    DispatchRuntime& operator=(const DispatchRuntime&) = delete;

    /** @brief Queue shared with every producer. */
    [[nodiscard]] DispatchEventBus& event_bus() noexcept;
    [[nodiscard]] DispatchCoordinator& coordinator() noexcept;
    [[nodiscard]] const DispatchCoordinator& coordinator() const noexcept;

    /** @brief Start the ingestion and planning threads. */
    void run();
    /** @brief Stop worker threads; pending events stay queued. */
    void shutdown();

    /** @brief Apply every queued event; malformed events are logged and dropped. */
    std::size_t drain_events();
    /** @brief One planning tick: expire stale victims, then replan. */
    void run_planning_cycle(TimePoint now);

  private:
    /** @brief Loop feeding bus events into the coordinator. */
    void ingest_loop();
    /** @brief Loop driving scheduled and on-demand replans. */
    void planning_loop();
    void apply_event(const DispatchEvent& event);

    Configuration configuration_;
    DispatchEventBus event_bus_;
    DispatchCoordinator coordinator_;
    std::atomic<bool> flag_running_{false};
    std::thread ingest_thread_;
    std::thread planning_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rescue_dispatch
