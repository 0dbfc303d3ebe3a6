#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include <catch2/catch.hpp>

#include "rescue_dispatch/errors.hpp"
#include "rescue_dispatch/victim_registry.hpp"

using namespace rescue_dispatch;

namespace {
const TimePoint k_base_time = SteadyClock::now();

TimePoint at_seconds(double seconds) {
    return k_base_time + std::chrono::duration_cast<SteadyClock::duration>(Duration{seconds});
}

DetectionEvent make_detection(GeodeticCoordinate location, InjuryLevel injury_level, double seconds) {
    DetectionEvent detection{};
    detection.location = location;
    detection.injury_level = injury_level;
    detection.survival_likelihood = 0.6;
    detection.detected_at = at_seconds(seconds);
    return detection;
}
}  // namespace

TEST_CASE("Duplicate detections seconds apart collapse into one victim") {
    VictimRegistry registry{};
    const GeodeticCoordinate location{34.0522, -118.2437};

    const UpsertResult first = registry.upsert_detection(make_detection(location, InjuryLevel::Minor, 0.0));
    const UpsertResult second = registry.upsert_detection(make_detection(location, InjuryLevel::Minor, 2.0));

    REQUIRE(first.created);
    REQUIRE_FALSE(second.created);
    REQUIRE(second.victim_id == first.victim_id);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.active_victims().size() == 1);
    REQUIRE(registry.find(first.victim_id)->detection_count == 2);
}

TEST_CASE("Merging converges regardless of delivery order") {
    const DetectionEvent earlier = make_detection(GeodeticCoordinate{0.0, 0.0}, InjuryLevel::Minor, 0.0);
    const DetectionEvent later = make_detection(GeodeticCoordinate{0.0, 0.0001}, InjuryLevel::Severe, 2.0);

    VictimRegistry in_order{};
    in_order.upsert_detection(earlier);
    in_order.upsert_detection(later);

    VictimRegistry reordered{};
    reordered.upsert_detection(later);
    reordered.upsert_detection(earlier);

    const Victim lhs = in_order.active_victims().front();
    const Victim rhs = reordered.active_victims().front();

    REQUIRE(in_order.size() == 1);
    REQUIRE(reordered.size() == 1);
    REQUIRE(lhs.location == later.location);
    REQUIRE(rhs.location == later.location);
    REQUIRE(lhs.detected_at == earlier.detected_at);
    REQUIRE(rhs.detected_at == earlier.detected_at);
    REQUIRE(lhs.injury_level == InjuryLevel::Severe);
    REQUIRE(rhs.injury_level == InjuryLevel::Severe);
}

TEST_CASE("Detections merge into the nearest active victim inside the radius") {
    VictimRegistry registry{50.0};
    const UpsertResult west = registry.upsert_detection(make_detection(GeodeticCoordinate{0.0, 0.0}, InjuryLevel::None, 0.0));
    const UpsertResult east = registry.upsert_detection(make_detection(GeodeticCoordinate{0.0, 0.0018}, InjuryLevel::None, 1.0));
    REQUIRE(west.created);
    REQUIRE(east.created);

    const UpsertResult merged = registry.upsert_detection(make_detection(GeodeticCoordinate{0.0, 0.0015}, InjuryLevel::None, 2.0));

    REQUIRE_FALSE(merged.created);
    REQUIRE(merged.victim_id == east.victim_id);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Victim identifiers are sequential and zero padded") {
    VictimRegistry registry{};
    REQUIRE(registry.upsert_detection(make_detection(GeodeticCoordinate{1.0, 1.0}, InjuryLevel::None, 0.0)).victim_id == "victim-000001");
    REQUIRE(registry.upsert_detection(make_detection(GeodeticCoordinate{2.0, 2.0}, InjuryLevel::None, 0.0)).victim_id == "victim-000002");
}

TEST_CASE("A known candidate id wins over the merge radius") {
    VictimRegistry registry{};
    DetectionEvent first = make_detection(GeodeticCoordinate{0.0, 0.0}, InjuryLevel::Minor, 0.0);
    first.candidate_id = "person-0001";
    const UpsertResult created = registry.upsert_detection(first);

    DetectionEvent moved = make_detection(GeodeticCoordinate{0.0, 0.005}, InjuryLevel::Minor, 5.0);
    moved.candidate_id = "person-0001";
    const UpsertResult merged = registry.upsert_detection(moved);

    const UpsertResult stranger = registry.upsert_detection(make_detection(GeodeticCoordinate{0.0, 0.010}, InjuryLevel::Minor, 6.0));

    REQUIRE_FALSE(merged.created);
    REQUIRE(merged.victim_id == created.victim_id);
    REQUIRE(registry.find(created.victim_id)->location == moved.location);
    REQUIRE(stranger.created);
    REQUIRE(registry.size() == 2);
}

TEST_CASE("Served victims are never merge targets") {
    VictimRegistry registry{};
    const GeodeticCoordinate location{10.0, 10.0};
    const UpsertResult first = registry.upsert_detection(make_detection(location, InjuryLevel::Minor, 0.0));

    REQUIRE(registry.mark_served(first.victim_id, at_seconds(10.0)));
    REQUIRE_FALSE(registry.mark_served(first.victim_id, at_seconds(11.0)));
    REQUIRE_FALSE(registry.mark_served("victim-999999", at_seconds(11.0)));

    const UpsertResult second = registry.upsert_detection(make_detection(location, InjuryLevel::Minor, 20.0));
    REQUIRE(second.created);
    REQUIRE(second.victim_id != first.victim_id);
    REQUIRE(registry.find(first.victim_id)->status == VictimStatus::Served);
}

TEST_CASE("Stale unassigned victims expire and leave the active set") {
    VictimRegistry registry{};
    const UpsertResult result = registry.upsert_detection(make_detection(GeodeticCoordinate{5.0, 5.0}, InjuryLevel::Severe, 0.0));
    const Duration max_age{24.0 * 3600.0};

    REQUIRE(registry.expire_stale(at_seconds(3600.0), max_age).empty());

    const std::vector<std::string> expired = registry.expire_stale(at_seconds(25.0 * 3600.0), max_age);

    REQUIRE(expired == std::vector<std::string>{result.victim_id});
    REQUIRE(registry.active_victims().empty());
    REQUIRE(registry.find(result.victim_id)->status == VictimStatus::Expired);
}

TEST_CASE("Victims on a route are not expired") {
    VictimRegistry registry{};
    const UpsertResult result = registry.upsert_detection(make_detection(GeodeticCoordinate{5.0, 5.0}, InjuryLevel::Severe, 0.0));
    const std::unordered_set<std::string> assigned{result.victim_id};

    REQUIRE(registry.expire_stale(at_seconds(25.0 * 3600.0), Duration{24.0 * 3600.0}, assigned).empty());
    REQUIRE(registry.active_victims().size() == 1);
}

TEST_CASE("Retired records are purged after the retention window") {
    VictimRegistry registry{};
    DetectionEvent detection = make_detection(GeodeticCoordinate{5.0, 5.0}, InjuryLevel::Minor, 0.0);
    detection.candidate_id = "person-0042";
    const UpsertResult result = registry.upsert_detection(detection);
    REQUIRE(registry.mark_served(result.victim_id, at_seconds(100.0)));

    REQUIRE(registry.purge_retired(at_seconds(1000.0), Duration{3600.0}) == 0);
    REQUIRE(registry.size() == 1);

    REQUIRE(registry.purge_retired(at_seconds(5000.0), Duration{3600.0}) == 1);
    REQUIRE(registry.size() == 0);
    REQUIRE_FALSE(registry.find(result.victim_id).has_value());

    detection.detected_at = at_seconds(5001.0);
    REQUIRE(registry.upsert_detection(detection).created);
}

TEST_CASE("Malformed detections are rejected") {
    VictimRegistry registry{};

    DetectionEvent bad_latitude = make_detection(GeodeticCoordinate{91.0, 0.0}, InjuryLevel::None, 0.0);
    REQUIRE_THROWS_AS(registry.upsert_detection(bad_latitude), ValidationError);

    DetectionEvent bad_survival = make_detection(GeodeticCoordinate{0.0, 0.0}, InjuryLevel::None, 0.0);
    bad_survival.survival_likelihood = 1.5;
    REQUIRE_THROWS_AS(registry.upsert_detection(bad_survival), ValidationError);

    DetectionEvent empty_candidate = make_detection(GeodeticCoordinate{0.0, 0.0}, InjuryLevel::None, 0.0);
    empty_candidate.candidate_id = std::string{};
    REQUIRE_THROWS_AS(registry.upsert_detection(empty_candidate), ValidationError);

    REQUIRE(registry.size() == 0);
    REQUIRE_THROWS_AS(VictimRegistry{-1.0}, std::invalid_argument);
}
