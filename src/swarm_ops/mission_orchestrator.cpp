#include "swarm_ops/mission_orchestrator.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace {

constexpr char k_cancelled_message[] = "mission cancelled";

/** @brief Clears the running flag however the run ends. */
class RunningFlagGuard final {
  public:
    explicit RunningFlagGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~RunningFlagGuard() { flag_.store(false); }

    RunningFlagGuard(const RunningFlagGuard&) = delete;
    RunningFlagGuard& operator=(const RunningFlagGuard&) = delete;

  private:
    std::atomic<bool>& flag_;
};

Command make_uniform_command(CommandVerb verb, const std::string& vehicle_id, double altitude_m, EpochMillis timestamp_ms) {
    switch (verb) {
        case CommandVerb::Arm:
            return make_arm(vehicle_id, timestamp_ms);
        case CommandVerb::Takeoff:
            return make_takeoff(vehicle_id, altitude_m, timestamp_ms);
        case CommandVerb::Land:
            return make_land(vehicle_id, timestamp_ms);
        default:
            break;
    }
    throw std::logic_error(fmt::format("Verb {} is not a uniform phase command", to_string(verb)));
}

std::vector<VehicleStatus> statuses_after(CommandVerb verb) {
    switch (verb) {
        case CommandVerb::Arm:
            return {VehicleStatus::Armed};
        case CommandVerb::Takeoff:
            return {VehicleStatus::Flying};
        case CommandVerb::Land:
            return {VehicleStatus::Armed, VehicleStatus::Idle};
        default:
            return {};
    }
}

}  // namespace

MissionOrchestrator::MissionOrchestrator(
    MissionParameters parameters,
    CommandDispatcher& dispatcher,
    RepositionService& reposition_service,
    PhaseGate& phase_gate,
    MissionClock& clock,
    const VehicleStateSource& state_source,
    std::unique_ptr<SlotAssignment> slot_assignment
)
    : parameters_(parameters),
      dispatcher_(dispatcher),
      reposition_service_(reposition_service),
      phase_gate_(phase_gate),
      clock_(clock),
      state_source_(state_source),
      slot_assignment_(std::move(slot_assignment)),
      logger_(get_logger()) {
    if (slot_assignment_ == nullptr) {
        throw std::invalid_argument("MissionOrchestrator requires a slot assignment strategy");
    }
    if (parameters_.formation_radius_m <= 0.0) {
        throw std::invalid_argument("Formation radius must be positive");
    }
    if (parameters_.initial_altitude_m <= 0.0) {
        throw std::invalid_argument("Initial altitude must be positive");
    }
    logger_->info(
        "Mission orchestrator ready: radius={} m altitude={} m gate={} slots={}",
        parameters_.formation_radius_m,
        parameters_.initial_altitude_m,
        phase_gate_.name(),
        slot_assignment_->name()
    );
}

MissionResult MissionOrchestrator::run(const MissionRunRequest& request) {
    reserve();
    return run_reserved(request);
}

void MissionOrchestrator::reserve() {
    if (flag_running_.exchange(true)) {
        logger_->warn("Mission run rejected: a run is already active");
        throw ReentrancyError("A mission run is already active");
    }
    cancellation_token_.reset();
    commands_dispatched_.store(0);
}

MissionResult MissionOrchestrator::run_reserved(const MissionRunRequest& request) {
    if (!flag_running_.load()) {
        throw std::logic_error("run_reserved() called without a reservation");
    }
    RunningFlagGuard running_guard(flag_running_);

    logger_->info(
        "Mission {} starting with {} vehicles",
        request.mission.identifier,
        request.vehicle_ids.size()
    );

    MissionResult result{};
    try {
        execute(request);
        enter_phase(MissionPhase::Complete);
        result.message = "mission complete";
        logger_->info("Mission {} complete", request.mission.identifier);
    } catch (const std::exception& exc) {
        enter_phase(MissionPhase::Failed);
        result.message = exc.what();
        logger_->error("Mission {} failed: {}", request.mission.identifier, exc.what());
    }
    result.phase = phase_.load();
    result.commands_dispatched = commands_dispatched_.load();
    return result;
}

void MissionOrchestrator::release(const std::string& reason) {
    if (!flag_running_.load()) {
        return;
    }
    enter_phase(MissionPhase::Failed);
    logger_->error("Mission abandoned before start: {}", reason);
    flag_running_.store(false);
}

void MissionOrchestrator::cancel() {
    if (!flag_running_.load()) {
        return;
    }
    logger_->warn("Mission cancellation requested");
    cancellation_token_.request_cancel();
    clock_.interrupt();
}

MissionPhase MissionOrchestrator::phase() const noexcept {
    return phase_.load();
}

bool MissionOrchestrator::is_running() const noexcept {
    return flag_running_.load();
}

std::size_t MissionOrchestrator::commands_dispatched() const noexcept {
    return commands_dispatched_.load();
}

const MissionParameters& MissionOrchestrator::parameters() const noexcept {
    return parameters_;
}

void MissionOrchestrator::execute(const MissionRunRequest& request) {
    if (cancellation_token_.is_cancelled()) {
        throw MissionAbortError(k_cancelled_message);
    }
    const std::vector<Waypoint> list_waypoints = flatten_waypoints(request.mission);
    validate(request, list_waypoints);
    const std::vector<std::string>& vehicle_ids = request.vehicle_ids;
    const MissionTiming& timing = parameters_.timing;

    teleport_to_origin(request.mission);
    dispatch_uniform(MissionPhase::ArmAll, vehicle_ids, CommandVerb::Arm, timing.arm_settle);
    dispatch_uniform(MissionPhase::TakeoffAll, vehicle_ids, CommandVerb::Takeoff, timing.takeoff_settle);

    const PlanarPoint first = project_waypoint(list_waypoints.front(), parameters_.geo_reference);
    fly_formation(
        MissionPhase::AssembleFormation,
        vehicle_ids,
        Vector3{first.x, first.y, parameters_.initial_altitude_m},
        timing.command_delay,
        timing.formation_settle
    );

    const std::size_t waypoint_count = list_waypoints.size();
    for (std::size_t index = 1; index < waypoint_count; ++index) {
        const PlanarPoint center = project_waypoint(list_waypoints[index], parameters_.geo_reference);
        const double altitude_m = altitude_for_waypoint(parameters_.initial_altitude_m, index, waypoint_count);
        logger_->info("Waypoint {}/{} at ({:.1f}, {:.1f}) altitude {:.1f} m", index + 1, waypoint_count, center.x, center.y, altitude_m);
        fly_formation(
            MissionPhase::TraverseWaypoints,
            vehicle_ids,
            Vector3{center.x, center.y, altitude_m},
            timing.waypoint_stagger,
            timing.waypoint_settle
        );
    }

    dispatch_uniform(MissionPhase::LandAll, vehicle_ids, CommandVerb::Land, timing.land_settle);
}

void MissionOrchestrator::validate(const MissionRunRequest& request, const std::vector<Waypoint>& waypoints) const {
    if (request.vehicle_ids.empty()) {
        throw MissionAbortError("No target vehicles for mission");
    }
    if (request.vehicle_ids.size() > k_hexagon_slots) {
        throw MissionAbortError(fmt::format(
            "Hexagonal formation supports at most {} vehicles, got {}",
            k_hexagon_slots,
            request.vehicle_ids.size()
        ));
    }
    const std::set<std::string> unique_ids(request.vehicle_ids.begin(), request.vehicle_ids.end());
    if (unique_ids.size() != request.vehicle_ids.size() || unique_ids.count("") != 0) {
        throw MissionAbortError("Target vehicle ids must be unique and non-empty");
    }
    if (waypoints.empty()) {
        throw MissionAbortError(fmt::format("Mission {} has no waypoints", request.mission.identifier));
    }
}

void MissionOrchestrator::teleport_to_origin(const Mission& mission) {
    enter_phase(MissionPhase::TeleportToOrigin);
    const PlanarPoint origin = project_waypoint(mission.origin, parameters_.geo_reference);
    try {
        if (!reposition_service_.reposition(RepositionRequest::around(origin, parameters_.teleport_radius_m))) {
            logger_->warn("Teleport to origin ({:.1f}, {:.1f}) refused; continuing", origin.x, origin.y);
        }
    } catch (const TransportError& exc) {
        // Reposition failure does not stop the run.
        logger_->warn("Teleport to origin failed: {}; continuing", exc.what());
    }
    if (cancellation_token_.is_cancelled()) {
        throw MissionAbortError(k_cancelled_message);
    }
}

void MissionOrchestrator::dispatch_uniform(
    MissionPhase phase,
    const std::vector<std::string>& vehicle_ids,
    CommandVerb verb,
    Duration settle
) {
    enter_phase(phase);
    for (std::size_t index = 0; index < vehicle_ids.size(); ++index) {
        if (index > 0) {
            pause(parameters_.timing.command_delay);
        }
        dispatch(make_uniform_command(verb, vehicle_ids[index], parameters_.initial_altitude_m, next_timestamp()));
    }

    PhaseExpectation expectation{};
    expectation.phase = phase;
    expectation.vehicle_ids = vehicle_ids;
    expectation.accepted_statuses = statuses_after(verb);
    expectation.settle_window = settle;
    await_phase(expectation);
}

void MissionOrchestrator::fly_formation(
    MissionPhase phase,
    const std::vector<std::string>& vehicle_ids,
    const Vector3& center,
    Duration stagger,
    Duration settle
) {
    enter_phase(phase);
    const HexagonSlots slots = hexagonal_formation(center, parameters_.formation_radius_m);
    const std::vector<std::size_t> list_assignment = slot_assignment_->assign(vehicle_ids, slots, state_source_.current());

    PhaseExpectation expectation{};
    expectation.phase = phase;
    expectation.vehicle_ids = vehicle_ids;
    expectation.settle_window = settle;
    for (std::size_t index = 0; index < vehicle_ids.size(); ++index) {
        if (index > 0) {
            pause(stagger);
        }
        const Vector3& target = slots.at(list_assignment.at(index));
        dispatch(make_goto(vehicle_ids[index], target, next_timestamp()));
        expectation.targets.push_back(target);
    }
    await_phase(expectation);
}

void MissionOrchestrator::dispatch(const Command& command) {
    if (cancellation_token_.is_cancelled()) {
        throw MissionAbortError(k_cancelled_message);
    }
    ++commands_dispatched_;
    try {
        dispatcher_.dispatch(command);
        logger_->info("[{}] {}", command.target_id, to_string(command.verb));
    } catch (const TransportError& exc) {
        logger_->warn("[{}] {} not delivered: {}", command.target_id, to_string(command.verb), exc.what());
    }
}

void MissionOrchestrator::pause(Duration duration) {
    if (!clock_.wait_for(duration, cancellation_token_)) {
        throw MissionAbortError(k_cancelled_message);
    }
}

void MissionOrchestrator::await_phase(const PhaseExpectation& expectation) {
    if (!phase_gate_.await_completion(expectation, cancellation_token_)) {
        throw MissionAbortError(k_cancelled_message);
    }
}

void MissionOrchestrator::enter_phase(MissionPhase phase) {
    phase_.store(phase);
    logger_->info("Mission phase -> {}", to_string(phase));
}

EpochMillis MissionOrchestrator::next_timestamp() {
    last_timestamp_ms_ = std::max(now_epoch_millis(), last_timestamp_ms_ + 1);
    return last_timestamp_ms_;
}

}  // namespace swarm_ops
