// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the relay server and the mission orchestrator. `ConfigurationLoader`
// transforms raw `SWARM_OPS_*` variables into the strongly-typed
// `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults and sane bounds for ports, formation geometry and the
//   per-phase settle windows.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or names an unknown strategy.
// - Shield the rest of the codebase from `std::getenv` lookups.
//
// Note: callers are expected to populate the process environment ahead of
// time (shell-sourced `.env`, service unit, container definition).

#include "swarm_ops/configuration.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string_view>

#include "swarm_ops/logging.hpp"

namespace swarm_ops {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr double k_milliseconds_per_second{1000.0};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse {} as a number; using fallback {}", name, fallback);
        return fallback;
    }
}

/** @brief Like parse_double but accepts any finite value, including negatives. */
double parse_coordinate(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        return std::stod(raw_value);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse {} as a coordinate; using fallback {}", name, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        return parsed_value <= 0 ? fallback : parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse {} as an integer; using fallback {}", name, fallback);
        return fallback;
    }
}

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

bool parse_flag(const char* name, bool fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string_view value{raw_value};
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse {} as a flag; using fallback {}", name, fallback);
    return fallback;
}

std::string parse_choice(const char* name, std::string_view first, std::string_view second) {
    std::string value = parse_string(name, first);
    if (value != first && value != second) {
        get_logger()->warn("{}={} is not one of {}|{}; using {}", name, value, first, second, first);
        value = std::string{first};
    }
    return value;
}

Duration parse_seconds(const char* name, Duration fallback) {
    return Duration{parse_double(name, fallback.count())};
}

Duration parse_milliseconds(const char* name, Duration fallback) {
    const double fallback_ms = fallback.count() * k_milliseconds_per_second;
    return Duration{parse_double(name, fallback_ms) / k_milliseconds_per_second};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("SWARM_OPS_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("SWARM_OPS_LOG_LEVEL", "info");

    config.hub.bind_address = parse_string("SWARM_OPS_BIND_ADDRESS", config.hub.bind_address);
    const int port = parse_int("SWARM_OPS_PORT", config.hub.port);
    if (port > std::numeric_limits<std::uint16_t>::max()) {
        logger->warn("SWARM_OPS_PORT {} out of range; using {}", port, config.hub.port);
    } else {
        config.hub.port = static_cast<std::uint16_t>(port);
    }
    config.hub.observer_path = parse_string("SWARM_OPS_OBSERVER_PATH", config.hub.observer_path);
    config.hub.simulator_path = parse_string("SWARM_OPS_SIMULATOR_PATH", config.hub.simulator_path);
    if (config.hub.observer_path == config.hub.simulator_path) {
        throw std::runtime_error("Observer and simulator channels must use different paths");
    }
    config.hub.seed_fleet = parse_flag("SWARM_OPS_SEED_FLEET", config.hub.seed_fleet);

    config.collaborator.host = parse_string("SWARM_OPS_COLLABORATOR_HOST", config.collaborator.host);
    config.collaborator.port = parse_string("SWARM_OPS_COLLABORATOR_PORT", config.collaborator.port);

    MissionParameters& mission = config.mission;
    mission.formation_radius_m = parse_double("SWARM_OPS_FORMATION_RADIUS_M", mission.formation_radius_m);
    mission.initial_altitude_m = parse_double("SWARM_OPS_INITIAL_ALTITUDE_M", mission.initial_altitude_m);
    mission.teleport_radius_m = parse_double("SWARM_OPS_TELEPORT_RADIUS_M", mission.teleport_radius_m);
    mission.geo_reference.base_latitude_deg = parse_coordinate("SWARM_OPS_BASE_LAT", mission.geo_reference.base_latitude_deg);
    mission.geo_reference.base_longitude_deg = parse_coordinate("SWARM_OPS_BASE_LNG", mission.geo_reference.base_longitude_deg);

    MissionTiming& timing = mission.timing;
    timing.command_delay = parse_milliseconds("SWARM_OPS_COMMAND_DELAY_MS", timing.command_delay);
    timing.waypoint_stagger = parse_milliseconds("SWARM_OPS_WAYPOINT_STAGGER_MS", timing.waypoint_stagger);
    timing.arm_settle = parse_seconds("SWARM_OPS_SETTLE_ARM_S", timing.arm_settle);
    timing.takeoff_settle = parse_seconds("SWARM_OPS_SETTLE_TAKEOFF_S", timing.takeoff_settle);
    timing.formation_settle = parse_seconds("SWARM_OPS_SETTLE_FORMATION_S", timing.formation_settle);
    timing.waypoint_settle = parse_seconds("SWARM_OPS_SETTLE_WAYPOINT_S", timing.waypoint_settle);
    timing.land_settle = parse_seconds("SWARM_OPS_SETTLE_LAND_S", timing.land_settle);

    config.slot_assignment = parse_choice("SWARM_OPS_SLOT_ASSIGNMENT", "index", "nearest");
    config.phase_gate = parse_choice("SWARM_OPS_PHASE_GATE", "fixed", "telemetry");
    config.convergence_tolerance_m = parse_double("SWARM_OPS_CONVERGENCE_TOLERANCE_M", config.convergence_tolerance_m);

    logger->info(
        "Configuration loaded: listen={}:{} collaborator={}:{} radius={} m altitude={} m gate={} slots={}",
        config.hub.bind_address,
        config.hub.port,
        config.collaborator.host,
        config.collaborator.port,
        mission.formation_radius_m,
        mission.initial_altitude_m,
        config.phase_gate,
        config.slot_assignment
    );

    return config;
}

}  // namespace swarm_ops
