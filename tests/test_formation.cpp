#include <cmath>
#include <set>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "swarm_ops/formation.hpp"

using namespace swarm_ops;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();

double planar_distance(const Vector3& a, const Vector3& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}
}  // namespace

TEST_CASE("Hexagonal formation places six slots on the circle") {
    const Vector3 center{12.0, -4.0, 75.0};
    const HexagonSlots slots = hexagonal_formation(center, 30.0);

    for (const Vector3& slot : slots) {
        REQUIRE(planar_distance(slot, center) == Approx(30.0).margin(1e-9));
        REQUIRE(slot.z == Approx(75.0));
    }
}

TEST_CASE("Hexagonal formation slots sit at 60 degree steps from +x") {
    const HexagonSlots slots = hexagonal_formation(Vector3{0.0, 0.0, 10.0}, 30.0);

    REQUIRE(slots[0].x == Approx(30.0));
    REQUIRE(slots[0].y == Approx(0.0).margin(1e-9));
    REQUIRE(slots[1].x == Approx(15.0));
    REQUIRE(slots[1].y == Approx(25.980762).epsilon(1e-6));
    REQUIRE(slots[3].x == Approx(-30.0));
    REQUIRE(slots[3].y == Approx(0.0).margin(1e-9));
    REQUIRE(slots[5].x == Approx(15.0));
    REQUIRE(slots[5].y == Approx(-25.980762).epsilon(1e-6));

    // Adjacent slots of a regular hexagon are one radius apart.
    for (std::size_t index = 0; index < k_hexagon_slots; ++index) {
        const Vector3& next = slots[(index + 1) % k_hexagon_slots];
        REQUIRE(planar_distance(slots[index], next) == Approx(30.0).margin(1e-9));
    }
}

TEST_CASE("Hexagonal formation rejects non-positive radius") {
    REQUIRE_THROWS_AS(hexagonal_formation(Vector3{}, 0.0), std::invalid_argument);
    REQUIRE_THROWS_AS(hexagonal_formation(Vector3{}, -5.0), std::invalid_argument);
}

TEST_CASE("Index slot assignment maps vehicle i to slot i") {
    const HexagonSlots slots = hexagonal_formation(Vector3{}, 10.0);
    IndexSlotAssignment strategy{};

    const auto assignment = strategy.assign({"a", "b", "c"}, slots, VehicleSnapshot{});
    REQUIRE(assignment == std::vector<std::size_t>{0, 1, 2});
    REQUIRE_THROWS_AS(
        strategy.assign({"1", "2", "3", "4", "5", "6", "7"}, slots, VehicleSnapshot{}),
        std::invalid_argument
    );
}

TEST_CASE("Nearest slot assignment gives each vehicle the closest free slot") {
    const HexagonSlots slots = hexagonal_formation(Vector3{0.0, 0.0, 50.0}, 30.0);

    Vehicle west{};
    west.identifier = "west";
    west.position = Vector3{-40.0, 0.0, 0.0};
    Vehicle east{};
    east.identifier = "east";
    east.position = Vector3{40.0, 1.0, 0.0};
    Vehicle also_east{};
    also_east.identifier = "also-east";
    also_east.position = Vector3{39.0, 0.0, 0.0};
    const VehicleSnapshot observed{{west, east, also_east}};

    NearestSlotAssignment strategy{};
    const auto assignment = strategy.assign({"west", "east", "also-east", "unseen"}, slots, observed);

    REQUIRE(assignment.size() == 4);
    REQUIRE(assignment[0] == 3);
    REQUIRE(assignment[1] == 0);
    // Slot 0 is taken, so the second eastern vehicle gets a neighbouring slot.
    REQUIRE((assignment[2] == 1 || assignment[2] == 5));
    const std::set<std::size_t> distinct(assignment.begin(), assignment.end());
    REQUIRE(distinct.size() == assignment.size());
}

TEST_CASE("Slot assignment strategies are selected by name") {
    REQUIRE(make_slot_assignment("index")->name() == "index");
    REQUIRE(make_slot_assignment("nearest")->name() == "nearest");
    REQUIRE_THROWS_AS(make_slot_assignment("random"), std::invalid_argument);
}
