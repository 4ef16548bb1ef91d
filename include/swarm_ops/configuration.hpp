// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects for the relay server, the
// collaborator client and mission runs. `ConfigurationLoader` translates
// environment variables into these structures so downstream modules never
// touch `std::getenv` directly.

#pragma once

#include <cstdint>
#include <string>

#include "swarm_ops/collaborator_client.hpp"
#include "swarm_ops/mission_orchestrator.hpp"

namespace swarm_ops {

/** @brief Listening socket and channel paths of the relay server. */
struct HubConfig final {
    std::string bind_address{"0.0.0.0"};
    std::uint16_t port{3001};
    std::string observer_path{"/ws/client"};
    std::string simulator_path{"/ws/simulator"};
    bool seed_fleet{true};  /**< Seed the snapshot with the default twelve-vehicle fleet. */
};

/**
 * @brief Immutable bundle of runtime knobs for the relay and orchestrator.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};          /**< Destination directory for structured logs. */
    std::string log_level{"info"};        /**< spdlog level name. */
    HubConfig hub{};                      /**< Relay server settings. */
    CollaboratorConfig collaborator{};    /**< Mission authoring service endpoint. */
    MissionParameters mission{};          /**< Mission geometry and pacing. */
    std::string slot_assignment{"index"}; /**< "index" or "nearest". */
    std::string phase_gate{"fixed"};      /**< "fixed" or "telemetry". */
    double convergence_tolerance_m{2.0};  /**< Position tolerance for the telemetry gate. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initializing the logger on the way. */
    static Configuration load();
};

}  // namespace swarm_ops
