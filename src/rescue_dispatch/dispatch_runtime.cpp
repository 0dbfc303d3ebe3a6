#include "rescue_dispatch/dispatch_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "rescue_dispatch/errors.hpp"
#include "rescue_dispatch/logging.hpp"

namespace rescue_dispatch {

namespace {
constexpr std::chrono::milliseconds k_ingest_idle_sleep{10};   /**< Back-off when the bus is empty. */
constexpr std::chrono::milliseconds k_planning_poll_interval{50}; /**< Granularity for fast-reaction checks. */
constexpr double k_max_replan_interval_s{24.0 * 3600.0};
}  // namespace

DispatchRuntime::DispatchRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      event_bus_(),
      coordinator_(configuration_.dispatch),
      logger_(get_logger()) {
    const double interval_s = configuration_.replan_interval.count();
    if (!std::isfinite(interval_s) || interval_s <= 0.0 || interval_s > k_max_replan_interval_s) {
        throw std::invalid_argument("DispatchRuntime replan interval must lie in (0, 86400] seconds");
    }
}

DispatchRuntime::~DispatchRuntime() {
    shutdown();
}

DispatchEventBus& DispatchRuntime::event_bus() noexcept {
    return event_bus_;
}

DispatchCoordinator& DispatchRuntime::coordinator() noexcept {
    return coordinator_;
}

const DispatchCoordinator& DispatchRuntime::coordinator() const noexcept {
    return coordinator_;
}

/**
 * @brief Start the background ingestion and planning threads.
 */
void DispatchRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting dispatch runtime (replan every {} s)", configuration_.replan_interval.count());
    ingest_thread_ = std::thread(&DispatchRuntime::ingest_loop, this);
    planning_thread_ = std::thread(&DispatchRuntime::planning_loop, this);
}

/**
 * @brief Stop worker threads and flush logs.
 */
void DispatchRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down dispatch runtime");
    if (ingest_thread_.joinable()) {
        ingest_thread_.join();
    }
    if (planning_thread_.joinable()) {
        planning_thread_.join();
    }
    logger_->flush();
}

std::size_t DispatchRuntime::drain_events() {
    std::size_t applied_count = 0;
    while (true) {
        std::optional<DispatchEvent> optional_event = event_bus_.try_consume();
        if (!optional_event.has_value()) {
            break;
        }
        apply_event(optional_event.value());
        ++applied_count;
    }
    return applied_count;
}

void DispatchRuntime::run_planning_cycle(TimePoint now) {
    coordinator_.expire_stale(now);
    coordinator_.replan(now);
}

/**
 * @brief Drain the bus continuously, sleeping briefly when it runs dry.
 */
void DispatchRuntime::ingest_loop() {
    while (flag_running_.load()) {
        std::size_t applied_count = 0;
        try {
            applied_count = drain_events();
        } catch (const std::exception& exc) {
            logger_->error("Ingest loop error: {}", exc.what());
        }
        if (applied_count == 0) {
            std::this_thread::sleep_for(k_ingest_idle_sleep);
        }
    }
}

/**
 * @brief Fixed-cadence planning loop that also honours fast-reaction requests.
 */
void DispatchRuntime::planning_loop() {
    const SteadyClock::duration steady_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration_.replan_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const TimePoint now = SteadyClock::now();
        const bool fast_reaction = coordinator_.take_replan_request();
        if (now < next_tick && !fast_reaction) {
            std::this_thread::sleep_for(std::min<SteadyClock::duration>(next_tick - now, k_planning_poll_interval));
            continue;
        }
        try {
            run_planning_cycle(now);
        } catch (const std::exception& exc) {
            logger_->error("Planning loop error: {}", exc.what());
        }
        next_tick = now + steady_interval;
    }
}

void DispatchRuntime::apply_event(const DispatchEvent& event) {
    try {
        std::visit(
            [this](const auto& typed_event) {
                using EventType = std::decay_t<decltype(typed_event)>;
                if constexpr (std::is_same_v<EventType, DetectionEvent>) {
                    coordinator_.on_detection(typed_event);
                } else if constexpr (std::is_same_v<EventType, ResponderStatusEvent>) {
                    coordinator_.on_responder_status(typed_event);
                } else {
                    coordinator_.on_route_completion(typed_event);
                }
            },
            event
        );
    } catch (const DispatchError& exc) {
        logger_->warn(R"({{"component":"runtime","event":"dropped","error":"{}"}})", exc.what());
    }
}

}  // namespace rescue_dispatch
