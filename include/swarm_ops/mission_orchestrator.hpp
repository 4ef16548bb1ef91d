// === Mission Orchestrator ====================================================
//
// Drives a list of vehicles through one choreographed mission run:
// teleport to origin, arm, take off, assemble into a hexagon over the first
// waypoint, traverse the remaining waypoints on a descending profile, land.
// Progression is gated by a pluggable PhaseGate; commands are fire-and-forget.

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "swarm_ops/collaborator_client.hpp"
#include "swarm_ops/command_dispatcher.hpp"
#include "swarm_ops/formation.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission.hpp"
#include "swarm_ops/mission_clock.hpp"
#include "swarm_ops/phase_gate.hpp"

namespace swarm_ops {

/** @brief Dispatch pacing and per-phase settle windows. */
struct MissionTiming final {
    Duration command_delay{0.1};     /**< Gap between per-vehicle sends in a phase. */
    Duration waypoint_stagger{0.1};  /**< Gap between per-vehicle gotos at a waypoint. */
    Duration arm_settle{2.0};
    Duration takeoff_settle{5.0};
    Duration formation_settle{8.0};
    Duration waypoint_settle{10.0};
    Duration land_settle{5.0};
};

/**
 * @brief Geometry and pacing knobs of a mission run.
 *
 * Populated from the configuration loader and treated as immutable while a
 * run is active.
 */
struct MissionParameters final {
    double formation_radius_m{30.0};
    double initial_altitude_m{100.0};
    double teleport_radius_m{5.0};
    GeoReference geo_reference{};
    MissionTiming timing{};
};

/** @brief Inputs of one run. Vehicle ids are captured by value for the whole run. */
struct MissionRunRequest final {
    Mission mission{};
    std::vector<std::string> vehicle_ids{};
};

/** @brief Terminal outcome of a run. */
struct MissionResult final {
    MissionPhase phase{MissionPhase::Idle};
    std::string message{};
    std::size_t commands_dispatched{};
};

/** @brief Phase state machine for one mission run at a time. */
class MissionOrchestrator final {
  public:
    MissionOrchestrator(
        MissionParameters parameters,
        CommandDispatcher& dispatcher,
        RepositionService& reposition_service,
        PhaseGate& phase_gate,
        MissionClock& clock,
        const VehicleStateSource& state_source,
        std::unique_ptr<SlotAssignment> slot_assignment
    );

    /**
     * @brief Execute @p request to completion on the calling thread.
     *
     * Failures inside the run end in MissionPhase::Failed with their message
     * in the result.
     *
     * @throws ReentrancyError when a run is already active; nothing is dispatched.
     */
    MissionResult run(const MissionRunRequest& request);

    /**
     * @brief Claim the orchestrator for a run that starts later, possibly on another thread.
     *
     * A cancel() issued after reserve() returns is honoured by the following
     * run_reserved().
     *
     * @throws ReentrancyError when a run is already active or reserved.
     */
    void reserve();

    /** @brief Execute @p request under a reservation taken by reserve(). */
    MissionResult run_reserved(const MissionRunRequest& request);

    /** @brief Give back a reservation without running; the phase becomes Failed. */
    void release(const std::string& reason);

    /** @brief Abort the active or reserved run at its next suspension point. */
    void cancel();

    [[nodiscard]] MissionPhase phase() const noexcept;
    [[nodiscard]] bool is_running() const noexcept;
    /** @brief Commands handed to the dispatcher by the current or last run. */
    [[nodiscard]] std::size_t commands_dispatched() const noexcept;
    [[nodiscard]] const MissionParameters& parameters() const noexcept;

  private:
    void execute(const MissionRunRequest& request);
    void validate(const MissionRunRequest& request, const std::vector<Waypoint>& waypoints) const;
    void teleport_to_origin(const Mission& mission);
    void dispatch_uniform(MissionPhase phase, const std::vector<std::string>& vehicle_ids, CommandVerb verb, Duration settle);
    void fly_formation(MissionPhase phase, const std::vector<std::string>& vehicle_ids, const Vector3& center, Duration stagger, Duration settle);
    void dispatch(const Command& command);
    void pause(Duration duration);
    void await_phase(const PhaseExpectation& expectation);
    void enter_phase(MissionPhase phase);
    [[nodiscard]] EpochMillis next_timestamp();

    MissionParameters parameters_;
    CommandDispatcher& dispatcher_;
    RepositionService& reposition_service_;
    PhaseGate& phase_gate_;
    MissionClock& clock_;
    const VehicleStateSource& state_source_;
    std::unique_ptr<SlotAssignment> slot_assignment_;
    CancellationToken cancellation_token_;
    std::atomic<bool> flag_running_{false};
    std::atomic<MissionPhase> phase_{MissionPhase::Idle};
    std::atomic<std::size_t> commands_dispatched_{0};
    EpochMillis last_timestamp_ms_{};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
