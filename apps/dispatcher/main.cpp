#include <array>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "rescue_dispatch/configuration.hpp"
#include "rescue_dispatch/dispatch_runtime.hpp"
#include "rescue_dispatch/logging.hpp"
#include "rescue_dispatch/survival_estimator.hpp"
#include "rescue_dispatch/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr rescue_dispatch::GeodeticCoordinate k_epicenter{34.0522, -118.2437}; /**< Demo earthquake epicentre. */
constexpr int k_responder_count{5};
constexpr int k_responder_capacity{5};
constexpr double k_responder_spread_deg{0.01};   /**< Roughly 1 km around the epicentre. */
constexpr double k_victim_spread_deg{0.02};      /**< Roughly 2 km around the epicentre. */
constexpr double k_duplicate_jitter_deg{0.0001}; /**< Roughly 10 m of sensor noise. */
constexpr double k_new_detection_probability{0.12};
constexpr double k_duplicate_probability{0.3};
constexpr int k_completion_every_ticks{45};
constexpr std::chrono::milliseconds k_feed_tick{1000};

constexpr std::array<rescue_dispatch::InjuryLevel, 4> k_injury_levels{
    rescue_dispatch::InjuryLevel::None,
    rescue_dispatch::InjuryLevel::Minor,
    rescue_dispatch::InjuryLevel::Severe,
    rescue_dispatch::InjuryLevel::Unconscious,
};

void handle_signal(int) {
    should_terminate.store(true);
}

/**
 * @brief Publish the initial status of the demo responder teams.
 */
void seed_responders(rescue_dispatch::DispatchEventBus& bus, std::mt19937& generator) {
    std::uniform_real_distribution<double> offset(-k_responder_spread_deg, k_responder_spread_deg);
    for (int index = 0; index < k_responder_count; ++index) {
        rescue_dispatch::ResponderStatusEvent update{};
        update.responder_id = fmt::format("responder-{:02d}", index);
        update.location = rescue_dispatch::GeodeticCoordinate{
            k_epicenter.latitude_deg + offset(generator),
            k_epicenter.longitude_deg + offset(generator)
        };
        update.capacity = k_responder_capacity;
        update.status = rescue_dispatch::ResponderStatus::Available;
        bus.publish(update);
    }
}

/**
 * @brief Synthetic drone feed: new sightings, noisy re-sightings, and route completions.
 */
void run_synthetic_feed(rescue_dispatch::DispatchRuntime& runtime) {
    using namespace rescue_dispatch;

    std::mt19937 generator{42};
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> victim_offset(-k_victim_spread_deg, k_victim_spread_deg);
    std::uniform_real_distribution<double> jitter(-k_duplicate_jitter_deg, k_duplicate_jitter_deg);
    std::uniform_int_distribution<std::size_t> injury_index(0, k_injury_levels.size() - 1);
    std::uniform_int_distribution<int> age_years(1, 90);

    const SurvivalEstimatorPtr estimator = std::make_unique<InjuryTableEstimator>();
    DispatchEventBus& bus = runtime.event_bus();
    seed_responders(bus, generator);

    std::vector<DetectionEvent> list_sightings;
    int tick = 0;
    while (!should_terminate.load()) {
        ++tick;
        if (unit(generator) < k_new_detection_probability) {
            VictimObservation observation{};
            observation.injury_level = k_injury_levels[injury_index(generator)];
            observation.age_estimate_years = age_years(generator);
            observation.detection_confidence = 0.6 + 0.4 * unit(generator);

            DetectionEvent detection{};
            detection.candidate_id = fmt::format("person-{:04d}", list_sightings.size() + 1);
            detection.location = GeodeticCoordinate{
                k_epicenter.latitude_deg + victim_offset(generator),
                k_epicenter.longitude_deg + victim_offset(generator)
            };
            detection.injury_level = observation.injury_level;
            detection.survival_likelihood = estimator->estimate(observation);
            detection.detected_at = SteadyClock::now();
            list_sightings.push_back(detection);
            bus.publish(detection);
        } else if (!list_sightings.empty() && unit(generator) < k_duplicate_probability) {
            std::uniform_int_distribution<std::size_t> pick(0, list_sightings.size() - 1);
            DetectionEvent resend = list_sightings[pick(generator)];
            resend.location.latitude_deg += jitter(generator);
            resend.location.longitude_deg += jitter(generator);
            resend.detected_at = SteadyClock::now();
            bus.publish(resend);
        }

        if (tick % k_completion_every_ticks == 0) {
            const std::vector<RouteSolution> current_routes = runtime.coordinator().routes();
            if (!current_routes.empty()) {
                bus.publish(RouteCompletionEvent{current_routes.front().responder_id, SteadyClock::now()});
            }
        }
        std::this_thread::sleep_for(k_feed_tick);
    }
}
}  // namespace

int main() {
    using namespace rescue_dispatch;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load(".");
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }
        get_logger()->info("rescue_dispatcher {} starting", k_version);

        DispatchRuntime runtime{std::move(configuration)};
        runtime.run();

        std::thread feed_thread(run_synthetic_feed, std::ref(runtime));
        feed_thread.join();

        runtime.shutdown();
        const SystemStatus status = runtime.coordinator().system_status();
        get_logger()->info(
            "Final status: active_victims={} available_responders={} avg_survival={:.3f} load={:.2f}",
            status.total_active_victims,
            status.available_responders,
            status.average_survival_likelihood,
            status.system_load
        );
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
