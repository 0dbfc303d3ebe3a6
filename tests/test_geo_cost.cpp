#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "rescue_dispatch/geo_cost.hpp"

using namespace rescue_dispatch;

TEST_CASE("Haversine distance matches one degree of latitude") {
    const GeodeticCoordinate origin{0.0, 0.0};
    const GeodeticCoordinate north{1.0, 0.0};

    REQUIRE(haversine_distance_m(origin, north) == Approx(111'194.93).epsilon(1e-4));
}

TEST_CASE("GeoCost distance is symmetric and zero for identical points") {
    const GeoCost geo_cost{};
    const GeodeticCoordinate downtown{34.0522, -118.2437};
    const GeodeticCoordinate harbour{33.7405, -118.2786};

    REQUIRE(geo_cost.distance_m(downtown, downtown) == 0.0);
    REQUIRE(geo_cost.distance_m(downtown, harbour) == Approx(geo_cost.distance_m(harbour, downtown)));
    REQUIRE(geo_cost.distance_m(downtown, harbour) > 30'000.0);
}

TEST_CASE("Haversine stays finite for antipodal points") {
    const double distance_m = haversine_distance_m(GeodeticCoordinate{0.0, 0.0}, GeodeticCoordinate{0.0, 180.0});

    REQUIRE(distance_m == Approx(k_earth_radius_m * 3.141592653589793).epsilon(1e-6));
}

TEST_CASE("GeoCost converts distance with the configured speed") {
    const GeoCost walking{};
    REQUIRE(walking.travel_time_s(5'000.0) == Approx(3'600.0));

    const GeoCost driving{10.0};
    REQUIRE(driving.travel_time_s(1'000.0) == Approx(100.0));
    REQUIRE(driving.travel_speed_mps() == 10.0);
}

TEST_CASE("GeoCost rejects non-positive speeds") {
    REQUIRE_THROWS_AS(GeoCost{0.0}, std::invalid_argument);
    REQUIRE_THROWS_AS(GeoCost{-2.0}, std::invalid_argument);
    REQUIRE_THROWS_AS(GeoCost{std::numeric_limits<double>::quiet_NaN()}, std::invalid_argument);
}

TEST_CASE("Coordinate validation enforces WGS84 bounds") {
    REQUIRE(is_valid_coordinate(GeodeticCoordinate{90.0, 180.0}));
    REQUIRE(is_valid_coordinate(GeodeticCoordinate{-90.0, -180.0}));
    REQUIRE_FALSE(is_valid_coordinate(GeodeticCoordinate{90.5, 0.0}));
    REQUIRE_FALSE(is_valid_coordinate(GeodeticCoordinate{0.0, -180.1}));
    REQUIRE_FALSE(is_valid_coordinate(GeodeticCoordinate{std::numeric_limits<double>::infinity(), 0.0}));
}
