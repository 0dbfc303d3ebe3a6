#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "rescue_dispatch/dispatch_runtime.hpp"

using namespace rescue_dispatch;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    rescue_dispatch::test::ensure_logger_initialized();
    return true;
}();

DetectionEvent make_detection(GeodeticCoordinate location) {
    DetectionEvent detection{};
    detection.location = location;
    detection.injury_level = InjuryLevel::Severe;
    detection.survival_likelihood = 0.5;
    return detection;
}

ResponderStatusEvent make_status(const std::string& responder_id, GeodeticCoordinate location) {
    ResponderStatusEvent update{};
    update.responder_id = responder_id;
    update.location = location;
    update.capacity = 5;
    update.status = ResponderStatus::Available;
    return update;
}
}  // namespace

TEST_CASE("DispatchEventBus preserves publish order") {
    DispatchEventBus bus{};
    bus.publish(make_status("responder-00", GeodeticCoordinate{0.0, 0.0}));
    bus.publish(make_detection(GeodeticCoordinate{0.0, 0.001}));
    REQUIRE(bus.pending() == 2);

    const auto first = bus.try_consume();
    const auto second = bus.try_consume();

    REQUIRE(first.has_value());
    REQUIRE(std::holds_alternative<ResponderStatusEvent>(first.value()));
    REQUIRE(second.has_value());
    REQUIRE(std::holds_alternative<DetectionEvent>(second.value()));
    REQUIRE_FALSE(bus.try_consume().has_value());
}

TEST_CASE("Draining applies valid events and drops malformed ones") {
    DispatchRuntime runtime{Configuration{}};
    DispatchEventBus& bus = runtime.event_bus();
    bus.publish(make_status("responder-00", GeodeticCoordinate{0.0, 0.0}));
    bus.publish(make_detection(GeodeticCoordinate{0.0, 0.001}));
    bus.publish(make_detection(GeodeticCoordinate{-100.0, 0.0}));
    bus.publish(RouteCompletionEvent{"responder-unknown", SteadyClock::now()});

    REQUIRE(runtime.drain_events() == 4);
    REQUIRE(bus.pending() == 0);
    REQUIRE(runtime.coordinator().victim_registry().size() == 1);
    REQUIRE(runtime.coordinator().responder_registry().size() == 1);
}

TEST_CASE("Concurrent producers never lose detections") {
    DispatchRuntime runtime{Configuration{}};
    constexpr int k_producer_count{4};
    constexpr int k_events_per_producer{250};

    std::vector<std::thread> list_producers;
    for (int producer = 0; producer < k_producer_count; ++producer) {
        list_producers.emplace_back([&runtime, producer]() {
            for (int index = 0; index < k_events_per_producer; ++index) {
                runtime.event_bus().publish(make_detection(GeodeticCoordinate{producer * 1.0, index * 0.001}));
            }
        });
    }
    for (std::thread& producer : list_producers) {
        producer.join();
    }

    REQUIRE(runtime.drain_events() == static_cast<std::size_t>(k_producer_count * k_events_per_producer));
    REQUIRE(runtime.coordinator().victim_registry().size() == static_cast<std::size_t>(k_producer_count * k_events_per_producer));
}

TEST_CASE("A planning cycle routes drained victims") {
    DispatchRuntime runtime{Configuration{}};
    runtime.event_bus().publish(make_status("responder-00", GeodeticCoordinate{0.0, 0.0}));
    runtime.event_bus().publish(make_detection(GeodeticCoordinate{0.0, 0.001}));
    runtime.drain_events();

    runtime.run_planning_cycle(SteadyClock::now());

    REQUIRE(runtime.coordinator().routes().size() == 1);
    REQUIRE(runtime.coordinator().system_status().enroute_responders == 1);
}

TEST_CASE("Running runtime ingests and replans in the background") {
    Configuration configuration{};
    configuration.replan_interval = Duration{0.05};
    DispatchRuntime runtime{configuration};
    runtime.run();

    runtime.event_bus().publish(make_status("responder-00", GeodeticCoordinate{0.0, 0.0}));
    runtime.event_bus().publish(make_detection(GeodeticCoordinate{0.0, 0.001}));

    const auto deadline = SteadyClock::now() + std::chrono::seconds(5);
    while (runtime.coordinator().routes().empty() && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    runtime.shutdown();
    runtime.shutdown();

    REQUIRE(runtime.coordinator().routes().size() == 1);
    REQUIRE(runtime.event_bus().pending() == 0);
}

TEST_CASE("Runtime rejects a replan interval it cannot schedule") {
    Configuration zero_interval{};
    zero_interval.replan_interval = Duration{0.0};
    REQUIRE_THROWS_AS(DispatchRuntime{zero_interval}, std::invalid_argument);

    Configuration infinite_interval{};
    infinite_interval.replan_interval = Duration{std::numeric_limits<double>::infinity()};
    REQUIRE_THROWS_AS(DispatchRuntime{infinite_interval}, std::invalid_argument);
}
