#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "swarm_ops/configuration.hpp"

using namespace swarm_ops;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();

const std::vector<std::string> k_managed_variables{
    "SWARM_OPS_LOG_LEVEL",
    "SWARM_OPS_BIND_ADDRESS",
    "SWARM_OPS_PORT",
    "SWARM_OPS_OBSERVER_PATH",
    "SWARM_OPS_SIMULATOR_PATH",
    "SWARM_OPS_SEED_FLEET",
    "SWARM_OPS_COLLABORATOR_HOST",
    "SWARM_OPS_COLLABORATOR_PORT",
    "SWARM_OPS_FORMATION_RADIUS_M",
    "SWARM_OPS_INITIAL_ALTITUDE_M",
    "SWARM_OPS_TELEPORT_RADIUS_M",
    "SWARM_OPS_BASE_LAT",
    "SWARM_OPS_BASE_LNG",
    "SWARM_OPS_COMMAND_DELAY_MS",
    "SWARM_OPS_WAYPOINT_STAGGER_MS",
    "SWARM_OPS_SETTLE_ARM_S",
    "SWARM_OPS_SETTLE_TAKEOFF_S",
    "SWARM_OPS_SETTLE_FORMATION_S",
    "SWARM_OPS_SETTLE_WAYPOINT_S",
    "SWARM_OPS_SETTLE_LAND_S",
    "SWARM_OPS_SLOT_ASSIGNMENT",
    "SWARM_OPS_PHASE_GATE",
    "SWARM_OPS_CONVERGENCE_TOLERANCE_M",
};

/** @brief Clears the loader's variables on entry and exit. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() {
        clear();
    }

    ~ScopedEnvironment() {
        clear();
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    void set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

  private:
    static void clear() {
        for (const std::string& name : k_managed_variables) {
            ::unsetenv(name.c_str());
        }
    }
};
}  // namespace

TEST_CASE("Configuration defaults match the reference deployment") {
    ScopedEnvironment environment{};
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_level == "info");
    REQUIRE(config.hub.bind_address == "0.0.0.0");
    REQUIRE(config.hub.port == 3001);
    REQUIRE(config.hub.observer_path == "/ws/client");
    REQUIRE(config.hub.simulator_path == "/ws/simulator");
    REQUIRE(config.hub.seed_fleet);
    REQUIRE(config.collaborator.host == "127.0.0.1");
    REQUIRE(config.collaborator.port == "3002");
    REQUIRE(config.mission.formation_radius_m == Approx(30.0));
    REQUIRE(config.mission.initial_altitude_m == Approx(100.0));
    REQUIRE(config.mission.teleport_radius_m == Approx(5.0));
    REQUIRE(config.mission.geo_reference.base_latitude_deg == Approx(37.5139));
    REQUIRE(config.mission.geo_reference.base_longitude_deg == Approx(-122.4961));
    REQUIRE(config.mission.timing.command_delay.count() == Approx(0.1));
    REQUIRE(config.mission.timing.waypoint_settle.count() == Approx(10.0));
    REQUIRE(config.slot_assignment == "index");
    REQUIRE(config.phase_gate == "fixed");
}

TEST_CASE("Configuration reads overrides from the environment") {
    ScopedEnvironment environment{};
    environment.set("SWARM_OPS_PORT", "4100");
    environment.set("SWARM_OPS_SEED_FLEET", "false");
    environment.set("SWARM_OPS_FORMATION_RADIUS_M", "45.5");
    environment.set("SWARM_OPS_BASE_LNG", "-120.25");
    environment.set("SWARM_OPS_COMMAND_DELAY_MS", "250");
    environment.set("SWARM_OPS_SETTLE_LAND_S", "1.5");
    environment.set("SWARM_OPS_SLOT_ASSIGNMENT", "nearest");
    environment.set("SWARM_OPS_PHASE_GATE", "telemetry");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.hub.port == 4100);
    REQUIRE_FALSE(config.hub.seed_fleet);
    REQUIRE(config.mission.formation_radius_m == Approx(45.5));
    REQUIRE(config.mission.geo_reference.base_longitude_deg == Approx(-120.25));
    REQUIRE(config.mission.timing.command_delay.count() == Approx(0.25));
    REQUIRE(config.mission.timing.land_settle.count() == Approx(1.5));
    REQUIRE(config.slot_assignment == "nearest");
    REQUIRE(config.phase_gate == "telemetry");
}

TEST_CASE("Unparseable or out-of-range values fall back to defaults") {
    ScopedEnvironment environment{};
    environment.set("SWARM_OPS_PORT", "70000");
    environment.set("SWARM_OPS_FORMATION_RADIUS_M", "-3");
    environment.set("SWARM_OPS_INITIAL_ALTITUDE_M", "high");
    environment.set("SWARM_OPS_SEED_FLEET", "maybe");
    environment.set("SWARM_OPS_PHASE_GATE", "psychic");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.hub.port == 3001);
    REQUIRE(config.mission.formation_radius_m == Approx(30.0));
    REQUIRE(config.mission.initial_altitude_m == Approx(100.0));
    REQUIRE(config.hub.seed_fleet);
    REQUIRE(config.phase_gate == "fixed");
}

TEST_CASE("Observer and simulator channels must differ") {
    ScopedEnvironment environment{};
    environment.set("SWARM_OPS_SIMULATOR_PATH", "/ws/client");
    REQUIRE_THROWS_AS(ConfigurationLoader::load(), std::runtime_error);
}
