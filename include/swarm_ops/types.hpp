// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the relay and mission orchestrator (time primitives, planar vectors,
// orientation and vehicle lifecycle status).

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace swarm_ops {

/**
 * @brief Alias for the steady clock used for settle windows and staggering.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Milliseconds since the Unix epoch, as carried on the wire.
 */
using EpochMillis = std::int64_t;

/**
 * @brief Cartesian vector in the simulator's local frame (metres).
 */
struct Vector3 final {
    double x{};  /**< North offset in metres. */
    double y{};  /**< East offset in metres. */
    double z{};  /**< Altitude above ground in metres. */
};

/**
 * @brief Point on the ground plane of the simulator frame.
 */
struct PlanarPoint final {
    double x{};
    double y{};
};

/**
 * @brief Euler attitude reported by the simulator, in degrees.
 */
struct Orientation final {
    double pitch{};
    double roll{};
    double yaw{};
};

/**
 * @brief Enumerates the lifecycle states reported for simulated vehicles.
 */
enum class VehicleStatus {
    Idle,     /**< On the ground, disarmed. */
    Armed,    /**< On the ground, motors armed. */
    Flying,   /**< Airborne and accepting navigation commands. */
    Landing   /**< Descending to the ground. */
};

/** @brief Wire name of @p status. */
[[nodiscard]] std::string_view to_string(VehicleStatus status) noexcept;

/**
 * @brief Parse a wire status name.
 *
 * @throws ProtocolError when @p text is not a known status.
 */
[[nodiscard]] VehicleStatus parse_vehicle_status(std::string_view text);

/** @brief Wall-clock milliseconds since the Unix epoch. */
[[nodiscard]] EpochMillis now_epoch_millis();

}  // namespace swarm_ops
