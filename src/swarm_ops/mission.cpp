#include "swarm_ops/mission.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace {

std::optional<double> optional_number(const nlohmann::json& object, const char* key) {
    const auto iterator_value = object.find(key);
    if (iterator_value == object.end() || iterator_value->is_null()) {
        return std::nullopt;
    }
    if (!iterator_value->is_number()) {
        throw ProtocolError(fmt::format("Waypoint field '{}' is not numeric", key));
    }
    return iterator_value->get<double>();
}

Waypoint parse_waypoint(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw ProtocolError("Waypoint is not an object");
    }
    Waypoint waypoint{};
    const std::optional<double> x = optional_number(object, "x");
    const std::optional<double> y = optional_number(object, "y");
    if (x.has_value() && y.has_value()) {
        waypoint.planar = PlanarPoint{x.value(), y.value()};
    }
    const std::optional<double> lng = optional_number(object, "lng");
    const std::optional<double> lat = optional_number(object, "lat");
    if (lng.has_value() && lat.has_value()) {
        waypoint.geographic = GeoPoint{lng.value(), lat.value()};
    }
    if (!waypoint.planar.has_value() && !waypoint.geographic.has_value()) {
        throw ProtocolError("Waypoint carries neither x/y nor lng/lat");
    }
    waypoint.altitude_m = optional_number(object, "altitude");
    return waypoint;
}

}  // namespace

PlanarPoint project_waypoint(const Waypoint& waypoint, const GeoReference& reference) {
    if (waypoint.planar.has_value()) {
        return waypoint.planar.value();
    }
    if (waypoint.geographic.has_value()) {
        const GeoPoint& point = waypoint.geographic.value();
        return PlanarPoint{
            (point.latitude_deg - reference.base_latitude_deg) / reference.degrees_per_metre,
            (point.longitude_deg - reference.base_longitude_deg) / reference.degrees_per_metre
        };
    }
    throw ProtocolError("Waypoint has no coordinates to project");
}

std::vector<Waypoint> flatten_waypoints(const Mission& mission) {
    std::vector<Waypoint> list_waypoints;
    for (const Trajectory& trajectory : mission.trajectories) {
        list_waypoints.insert(list_waypoints.end(), trajectory.waypoints.begin(), trajectory.waypoints.end());
    }
    return list_waypoints;
}

double altitude_for_waypoint(double initial_altitude_m, std::size_t index, std::size_t waypoint_count) {
    if (index >= waypoint_count) {
        throw std::out_of_range(fmt::format("Waypoint index {} outside path of {}", index, waypoint_count));
    }
    if (waypoint_count == 1) {
        return initial_altitude_m;
    }
    const double progress = static_cast<double>(index) / static_cast<double>(waypoint_count - 1);
    return initial_altitude_m * (1.0 - progress);
}

Mission parse_mission(const nlohmann::json& document) {
    const nlohmann::json& body = document.contains("mission") ? document.at("mission") : document;
    if (!body.is_object()) {
        throw ProtocolError("Mission document is not an object");
    }

    Mission mission{};
    if (const auto it = body.find("id"); it != body.end()) {
        mission.identifier = it->is_string() ? it->get<std::string>() : it->dump();
    }

    const auto iterator_origin = body.find("origin");
    if (iterator_origin == body.end()) {
        throw ProtocolError("Mission has no origin");
    }
    mission.origin = parse_waypoint(*iterator_origin);

    const auto iterator_trajectories = body.find("trajectories");
    if (iterator_trajectories == body.end() || !iterator_trajectories->is_array()) {
        throw ProtocolError("Mission has no trajectories array");
    }
    for (const nlohmann::json& trajectory_json : *iterator_trajectories) {
        const auto iterator_waypoints = trajectory_json.find("waypoints");
        if (!trajectory_json.is_object() || iterator_waypoints == trajectory_json.end() || !iterator_waypoints->is_array()) {
            throw ProtocolError("Trajectory has no waypoints array");
        }
        Trajectory trajectory{};
        for (const nlohmann::json& waypoint_json : *iterator_waypoints) {
            trajectory.waypoints.push_back(parse_waypoint(waypoint_json));
        }
        mission.trajectories.push_back(std::move(trajectory));
    }
    return mission;
}

}  // namespace swarm_ops
