#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "rescue_dispatch/errors.hpp"
#include "rescue_dispatch/responder_registry.hpp"

using namespace rescue_dispatch;

namespace {
Responder make_responder(const std::string& responder_id, int capacity, ResponderStatus status = ResponderStatus::Available) {
    Responder responder{};
    responder.id = responder_id;
    responder.location = GeodeticCoordinate{34.05, -118.24};
    responder.capacity = capacity;
    responder.status = status;
    return responder;
}
}  // namespace

TEST_CASE("ResponderRegistry tracks availability by status") {
    ResponderRegistry registry{};
    registry.upsert(make_responder("team-b", 3));
    registry.upsert(make_responder("team-a", 3));
    registry.upsert(make_responder("team-c", 3, ResponderStatus::Unavailable));

    const std::vector<Responder> available = registry.available_responders();
    REQUIRE(available.size() == 2);
    REQUIRE(available.front().id == "team-a");
    REQUIRE(registry.all_responders().size() == 3);
}

TEST_CASE("Routes beyond capacity raise CapacityExceeded") {
    ResponderRegistry registry{};
    registry.upsert(make_responder("team-a", 2));

    const std::vector<std::string> oversized{"victim-000001", "victim-000002", "victim-000003"};
    REQUIRE_THROWS_AS(registry.set_route("team-a", oversized), CapacityExceeded);
    REQUIRE(registry.find("team-a")->current_route.empty());
    REQUIRE(registry.find("team-a")->status == ResponderStatus::Available);

    try {
        registry.set_route("team-a", oversized);
        FAIL("expected CapacityExceeded");
    } catch (const CapacityExceeded& exc) {
        REQUIRE(exc.responder_id() == "team-a");
    }
}

TEST_CASE("Setting a route moves the responder en route") {
    ResponderRegistry registry{};
    registry.upsert(make_responder("team-a", 2));

    REQUIRE(registry.set_route("team-a", {"victim-000001"}));
    REQUIRE(registry.find("team-a")->status == ResponderStatus::EnRoute);
    REQUIRE(registry.assigned_victim_ids().contains("victim-000001"));
    REQUIRE(registry.available_responders().empty());
    REQUIRE_FALSE(registry.set_route("team-missing", {"victim-000001"}));

    const std::vector<std::string> former = registry.set_available("team-a");
    REQUIRE(former == std::vector<std::string>{"victim-000001"});
    REQUIRE(registry.find("team-a")->status == ResponderStatus::Available);
    REQUIRE(registry.assigned_victim_ids().empty());
}

TEST_CASE("Status reports keep the route only while en route") {
    ResponderRegistry registry{};
    registry.upsert(make_responder("team-a", 3));
    REQUIRE(registry.set_route("team-a", {"v1", "v2"}));

    registry.upsert(make_responder("team-a", 3, ResponderStatus::EnRoute));
    REQUIRE(registry.find("team-a")->current_route.size() == 2);

    REQUIRE_THROWS_AS(registry.upsert(make_responder("team-a", 1, ResponderStatus::EnRoute)), CapacityExceeded);
    REQUIRE(registry.find("team-a")->capacity == 3);

    registry.upsert(make_responder("team-a", 3, ResponderStatus::Unavailable));
    REQUIRE(registry.find("team-a")->current_route.empty());
    REQUIRE(registry.find("team-a")->status == ResponderStatus::Unavailable);
    REQUIRE(registry.available_responders().empty());
}

TEST_CASE("New responders start without a route") {
    ResponderRegistry registry{};
    Responder responder = make_responder("team-a", 2, ResponderStatus::EnRoute);
    responder.current_route = {"v1"};
    registry.upsert(responder);

    REQUIRE(registry.find("team-a")->current_route.empty());
}

TEST_CASE("Malformed responders are rejected") {
    ResponderRegistry registry{};
    REQUIRE_THROWS_AS(registry.upsert(make_responder("", 2)), ValidationError);
    REQUIRE_THROWS_AS(registry.upsert(make_responder("team-a", 0)), ValidationError);

    Responder off_map = make_responder("team-b", 2);
    off_map.location = GeodeticCoordinate{0.0, 200.0};
    REQUIRE_THROWS_AS(registry.upsert(off_map), ValidationError);
    REQUIRE(registry.size() == 0);
}
