// === State Synchronization Hub ===============================================
//
// The relay between the single authoritative simulator connection and any
// number of observers. Owns the canonical vehicle snapshot: commands flow from
// observers to the simulator verbatim, telemetry flows back, is merged into the
// snapshot, and is broadcast verbatim to every observer.

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swarm_ops/connection.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/vehicle_state.hpp"

namespace swarm_ops {

/** @brief Result of handing a command to the simulator channel. */
enum class ForwardOutcome {
    Relayed,               /**< Sent verbatim to the simulator. */
    SimulatorUnavailable,  /**< No open simulator connection. */
    Rejected               /**< Envelope failed protocol validation. */
};

/** @brief Single source of truth for vehicle state and relay fan-out. */
class StateHub final {
  public:
    StateHub();
    explicit StateHub(std::vector<Vehicle> seed);

    StateHub(const StateHub&) = delete;
    StateHub& operator=(const StateHub&) = delete;

    /** @brief Add @p observer to the broadcast set and send it `initial_state`. */
    void register_observer(const ConnectionPtr& observer);
    /** @brief Remove @p observer from the broadcast set. */
    void unregister_observer(const ConnectionPtr& observer);

    /**
     * @brief Make @p simulator the authoritative connection, superseding any other.
     *
     * @param vehicle_id Vehicle that state updates without a `targetId` belong
     *        to, taken from the `id` query parameter of the simulator upgrade.
     */
    void register_simulator(const ConnectionPtr& simulator, std::optional<std::string> vehicle_id = std::nullopt);
    /** @brief Clear the authoritative pointer if it is still @p simulator. */
    void unregister_simulator(const ConnectionPtr& simulator);

    /**
     * @brief Relay a command from @p origin to the simulator.
     *
     * When the simulator is unavailable only @p origin receives an error
     * message. Malformed envelopes are logged and dropped.
     */
    ForwardOutcome forward(const ConnectionPtr& origin, std::string_view message);

    /** @brief Relay a command that has no observer to answer (REST surface). */
    ForwardOutcome relay(std::string_view message);

    /** @brief Send a hub-originated frame to every observer. */
    void announce(const std::string& message);

    /**
     * @brief Accept a telemetry frame from @p source.
     *
     * Frames from anything but the current simulator are ignored. A state
     * update is merged into its `targetId`, else into the simulator's own
     * vehicle id, else read as a map of vehicle id to payload. An update that
     * names no vehicle at all is not merged. Every valid frame is broadcast
     * verbatim.
     */
    void ingest(const ConnectionPtr& source, std::string_view message);

    [[nodiscard]] VehicleSnapshot snapshot() const;
    [[nodiscard]] std::vector<std::string> vehicles_in_swarm(const std::string& swarm_id) const;
    [[nodiscard]] bool simulator_connected() const;
    [[nodiscard]] std::size_t observer_count() const;

  private:
    ForwardOutcome relay_locked(std::string_view message, const std::string& origin_label);
    void send_best_effort(const ConnectionPtr& connection, const std::string& message) const;

    mutable std::mutex mutex_;
    std::vector<ConnectionPtr> list_observers_;
    ConnectionPtr simulator_;
    std::optional<std::string> optional_simulator_vehicle_id_;
    VehicleSnapshot struct_snapshot_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
