// === Vehicle State ===========================================================
//
// Declares the per-vehicle record relayed between the simulator and observers
// and the snapshot container that applies partial telemetry merges. The hub
// owns the canonical snapshot; observers keep their own possibly-stale copy.

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "swarm_ops/types.hpp"

namespace swarm_ops {

/**
 * @brief Captures the observable state of one simulated vehicle.
 */
struct Vehicle final {
    std::string identifier{};                   /**< Unique vehicle id (`id`). */
    std::string swarm_id{};                     /**< Swarm membership (`swarm`). */
    Vector3 position{};                         /**< Local-frame position in metres. */
    Vector3 velocity{};                         /**< Local-frame velocity in m/s. */
    Orientation orientation{};                  /**< Attitude in degrees. */
    double battery_percent{100.0};              /**< Remaining battery percentage. */
    VehicleStatus status{VehicleStatus::Idle};  /**< Lifecycle status. */
    bool armed{};                               /**< Motor arming flag. */
    std::string color{};                        /**< Display colour, e.g. "#00bfff". */
};

void to_json(nlohmann::json& j, const Vector3& value);
void from_json(const nlohmann::json& j, Vector3& value);
void to_json(nlohmann::json& j, const Orientation& value);
void from_json(const nlohmann::json& j, Orientation& value);
void to_json(nlohmann::json& j, const Vehicle& vehicle);

/**
 * @brief Replace the top-level fields of @p vehicle present in @p payload.
 *
 * Nested objects such as `position` are replaced as a whole. Unknown keys are
 * ignored. The merge is all-or-nothing: on a malformed field @p vehicle is left
 * untouched.
 *
 * @throws ProtocolError when @p payload is not an object or a field has the
 *         wrong shape.
 */
void merge_partial(Vehicle& vehicle, const nlohmann::json& payload);

/**
 * @brief True when @p data reads as a map of vehicle id to partial payload.
 *
 * A single vehicle's payload (keys such as `position` or `battery`) is not a
 * bulk payload, nor is an empty object.
 */
[[nodiscard]] bool is_bulk_state_payload(const nlohmann::json& data);

/** @brief Canonical or observed mapping of vehicle id to vehicle state. */
class VehicleSnapshot final {
  public:
    VehicleSnapshot() = default;
    explicit VehicleSnapshot(std::vector<Vehicle> seed);

    /**
     * @brief Merge a partial payload into @p vehicle_id, creating it on first sight.
     */
    void merge(const std::string& vehicle_id, const nlohmann::json& payload);

    /**
     * @brief Apply the `data`/`targetId` portion of a state update message.
     *
     * With a target id, @p data is the partial payload of that vehicle. Without
     * one, @p data maps vehicle ids to partial payloads. Either every entry is
     * applied or none is.
     */
    void apply_state_update(const std::optional<std::string>& target_id, const nlohmann::json& data);

    /** @brief Replace the whole snapshot from an `initial_state` data object. */
    void replace_all(const nlohmann::json& data);

    [[nodiscard]] std::optional<Vehicle> find(const std::string& vehicle_id) const;
    /** @brief Members of @p swarm_id in natural id order (HORNET-7 before HORNET-10). */
    [[nodiscard]] std::vector<std::string> vehicles_in_swarm(const std::string& swarm_id) const;
    [[nodiscard]] const std::map<std::string, Vehicle>& vehicles() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] nlohmann::json to_json() const;

  private:
    std::map<std::string, Vehicle> map_vehicles_;
};

/** @brief Read access to a point-in-time, possibly stale, vehicle view. */
class VehicleStateSource {
  public:
    virtual ~VehicleStateSource() = default;
    [[nodiscard]] virtual VehicleSnapshot current() const = 0;
};

/** @brief The twelve-vehicle, two-swarm fleet the hub seeds on startup. */
[[nodiscard]] std::vector<Vehicle> default_fleet();

}  // namespace swarm_ops
