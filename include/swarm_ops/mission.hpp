// === Mission Model ===========================================================
//
// Mission definitions as served by the mission authoring service: an origin
// and ordered trajectories of waypoints. Waypoints may be planar or
// geographic; `GeoReference` projects them into the simulator frame.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "swarm_ops/types.hpp"

namespace swarm_ops {

/**
 * @brief Flat lng/lat to local-frame conversion anchored at the launch base.
 */
struct GeoReference final {
    double base_latitude_deg{37.5139};
    double base_longitude_deg{-122.4961};
    double degrees_per_metre{0.0001};
};

/** @brief Geographic coordinate in decimal degrees. */
struct GeoPoint final {
    double longitude_deg{};
    double latitude_deg{};
};

/**
 * @brief A mission waypoint. At least one of planar/geographic is present.
 */
struct Waypoint final {
    std::optional<PlanarPoint> planar{};
    std::optional<GeoPoint> geographic{};
    std::optional<double> altitude_m{};
};

struct Trajectory final {
    std::vector<Waypoint> waypoints{};
};

struct Mission final {
    std::string identifier{};
    Waypoint origin{};
    std::vector<Trajectory> trajectories{};
};

/**
 * @brief Resolve @p waypoint into the simulator frame; planar wins over geographic.
 *
 * @throws ProtocolError when neither representation is present.
 */
[[nodiscard]] PlanarPoint project_waypoint(const Waypoint& waypoint, const GeoReference& reference);

/** @brief Waypoints of every trajectory, concatenated in trajectory order. */
[[nodiscard]] std::vector<Waypoint> flatten_waypoints(const Mission& mission);

/**
 * @brief Path-progress-linear descent: `initial * (1 - index / (count - 1))`.
 *
 * A single-waypoint path stays at @p initial_altitude_m.
 *
 * @throws std::out_of_range when @p index is not below @p waypoint_count.
 */
[[nodiscard]] double altitude_for_waypoint(double initial_altitude_m, std::size_t index, std::size_t waypoint_count);

/**
 * @brief Parse a mission document, accepting either the bare object or `{"mission": {...}}`.
 *
 * @throws ProtocolError on a malformed document.
 */
[[nodiscard]] Mission parse_mission(const nlohmann::json& document);

}  // namespace swarm_ops
