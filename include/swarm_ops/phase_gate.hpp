// === Phase Gates =============================================================
//
// The "phase complete" signal a mission run waits on after dispatching a
// phase. The fixed-delay gate reproduces the settle-window behaviour; the
// telemetry gate ends the wait early once observed state has converged.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission_clock.hpp"
#include "swarm_ops/types.hpp"
#include "swarm_ops/vehicle_state.hpp"

namespace swarm_ops {

/** @brief Phases of one mission run. */
enum class MissionPhase {
    Idle,
    TeleportToOrigin,
    ArmAll,
    TakeoffAll,
    AssembleFormation,
    TraverseWaypoints,
    LandAll,
    Complete,
    Failed
};

[[nodiscard]] std::string_view to_string(MissionPhase phase) noexcept;

/** @brief What a phase asked of the vehicles and how long it may take. */
struct PhaseExpectation final {
    MissionPhase phase{MissionPhase::Idle};
    std::vector<std::string> vehicle_ids{};
    std::vector<VehicleStatus> accepted_statuses{}; /**< Empty when status is not checked. */
    std::vector<Vector3> targets{};                 /**< Per-vehicle goto targets; empty when position is not checked. */
    Duration settle_window{};
};

/** @brief Pluggable completion signal for a dispatched phase. */
class PhaseGate {
  public:
    virtual ~PhaseGate() = default;

    /**
     * @brief Block until @p expectation is considered met.
     *
     * @return false when the wait was cut short by cancellation.
     */
    virtual bool await_completion(const PhaseExpectation& expectation, const CancellationToken& token) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/** @brief Waits out the settle window without looking at telemetry. */
class FixedDelayPhaseGate final : public PhaseGate {
  public:
    explicit FixedDelayPhaseGate(MissionClock& clock);

    bool await_completion(const PhaseExpectation& expectation, const CancellationToken& token) override;
    [[nodiscard]] std::string_view name() const noexcept override;

  private:
    MissionClock& clock_;
};

/**
 * @brief Polls observed state until every vehicle meets the expectation.
 *
 * Gives up with a warning, not a failure, when the settle window elapses.
 */
class TelemetryConvergencePhaseGate final : public PhaseGate {
  public:
    TelemetryConvergencePhaseGate(MissionClock& clock, const VehicleStateSource& source, double tolerance_m, Duration poll_interval);

    bool await_completion(const PhaseExpectation& expectation, const CancellationToken& token) override;
    [[nodiscard]] std::string_view name() const noexcept override;

    /** @brief Whether @p observed satisfies @p expectation right now. */
    [[nodiscard]] bool has_converged(const PhaseExpectation& expectation, const VehicleSnapshot& observed) const;

  private:
    MissionClock& clock_;
    const VehicleStateSource& source_;
    double tolerance_m_;
    Duration poll_interval_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
