#include "swarm_ops/phase_gate.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace swarm_ops {

std::string_view to_string(MissionPhase phase) noexcept {
    switch (phase) {
        case MissionPhase::Idle:
            return "idle";
        case MissionPhase::TeleportToOrigin:
            return "teleport_to_origin";
        case MissionPhase::ArmAll:
            return "arm_all";
        case MissionPhase::TakeoffAll:
            return "takeoff_all";
        case MissionPhase::AssembleFormation:
            return "assemble_formation";
        case MissionPhase::TraverseWaypoints:
            return "traverse_waypoints";
        case MissionPhase::LandAll:
            return "land_all";
        case MissionPhase::Complete:
            return "complete";
        case MissionPhase::Failed:
            return "failed";
    }
    return "idle";
}

FixedDelayPhaseGate::FixedDelayPhaseGate(MissionClock& clock)
    : clock_(clock) {}

bool FixedDelayPhaseGate::await_completion(const PhaseExpectation& expectation, const CancellationToken& token) {
    return clock_.wait_for(expectation.settle_window, token);
}

std::string_view FixedDelayPhaseGate::name() const noexcept {
    return "fixed";
}

TelemetryConvergencePhaseGate::TelemetryConvergencePhaseGate(
    MissionClock& clock,
    const VehicleStateSource& source,
    double tolerance_m,
    Duration poll_interval
)
    : clock_(clock),
      source_(source),
      tolerance_m_(tolerance_m),
      poll_interval_(poll_interval),
      logger_(get_logger()) {
    if (tolerance_m_ <= 0.0) {
        throw std::invalid_argument("Convergence tolerance must be positive");
    }
    if (poll_interval_.count() <= 0.0) {
        throw std::invalid_argument("Convergence poll interval must be positive");
    }
}

bool TelemetryConvergencePhaseGate::await_completion(const PhaseExpectation& expectation, const CancellationToken& token) {
    Duration waited{0.0};
    while (true) {
        if (has_converged(expectation, source_.current())) {
            logger_->debug("Phase {} converged after {:.1f} s", to_string(expectation.phase), waited.count());
            return true;
        }
        if (waited >= expectation.settle_window) {
            logger_->warn(
                "Phase {} did not converge within {:.1f} s; continuing",
                to_string(expectation.phase),
                expectation.settle_window.count()
            );
            return true;
        }
        const Duration step = std::min(poll_interval_, expectation.settle_window - waited);
        if (!clock_.wait_for(step, token)) {
            return false;
        }
        waited += step;
    }
}

std::string_view TelemetryConvergencePhaseGate::name() const noexcept {
    return "telemetry";
}

bool TelemetryConvergencePhaseGate::has_converged(const PhaseExpectation& expectation, const VehicleSnapshot& observed) const {
    for (std::size_t index = 0; index < expectation.vehicle_ids.size(); ++index) {
        const std::optional<Vehicle> optional_vehicle = observed.find(expectation.vehicle_ids[index]);
        if (!optional_vehicle.has_value()) {
            return false;
        }
        const Vehicle& vehicle = optional_vehicle.value();

        if (!expectation.accepted_statuses.empty()) {
            const bool status_ok = std::find(
                expectation.accepted_statuses.begin(),
                expectation.accepted_statuses.end(),
                vehicle.status
            ) != expectation.accepted_statuses.end();
            if (!status_ok) {
                return false;
            }
        }

        if (index < expectation.targets.size()) {
            const Vector3& target = expectation.targets[index];
            const double distance = std::sqrt(
                std::pow(vehicle.position.x - target.x, 2)
                + std::pow(vehicle.position.y - target.y, 2)
                + std::pow(vehicle.position.z - target.z, 2)
            );
            if (distance > tolerance_m_) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace swarm_ops
