#include "swarm_ops/vehicle_state.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace {

struct FleetSeed final {
    const char* identifier;
    const char* swarm_id;
    double x;
    double y;
    const char* color;
};

constexpr std::array<FleetSeed, 12> k_default_fleet{{
    {"HORNET-1", "SWARM-1", 0.0, 0.0, "#00bfff"},
    {"HORNET-2", "SWARM-1", 10.0, 10.0, "#1e90ff"},
    {"HORNET-3", "SWARM-1", 20.0, 0.0, "#4169e1"},
    {"HORNET-4", "SWARM-1", 10.0, -10.0, "#6495ed"},
    {"HORNET-5", "SWARM-1", -10.0, -10.0, "#7b68ee"},
    {"HORNET-6", "SWARM-1", -10.0, 10.0, "#00ced1"},
    {"HORNET-7", "SWARM-2", -50.0, 50.0, "#ff0000"},
    {"HORNET-8", "SWARM-2", -40.0, 60.0, "#ff4500"},
    {"HORNET-9", "SWARM-2", -30.0, 50.0, "#ff6347"},
    {"HORNET-10", "SWARM-2", -40.0, 40.0, "#ff8c00"},
    {"HORNET-11", "SWARM-2", -60.0, 40.0, "#ffa500"},
    {"HORNET-12", "SWARM-2", -60.0, 60.0, "#ffa07a"},
}};

constexpr std::array<std::string_view, 9> k_vehicle_fields{
    "id", "swarm", "position", "velocity", "orientation", "battery", "status", "armed", "color",
};

/** @brief Split "HORNET-12" into "HORNET-" and "12"; the digits part may be empty. */
std::pair<std::string_view, std::string_view> split_numeric_suffix(std::string_view identifier) {
    std::size_t digits_begin = identifier.size();
    while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(identifier[digits_begin - 1])) != 0) {
        --digits_begin;
    }
    std::string_view digits = identifier.substr(digits_begin);
    while (digits.size() > 1 && digits.front() == '0') {
        digits.remove_prefix(1);
    }
    return {identifier.substr(0, digits_begin), digits};
}

/** @brief Orders HORNET-2 before HORNET-10. */
bool natural_id_less(const std::string& lhs, const std::string& rhs) {
    const auto [lhs_prefix, lhs_digits] = split_numeric_suffix(lhs);
    const auto [rhs_prefix, rhs_digits] = split_numeric_suffix(rhs);
    if (lhs_prefix != rhs_prefix) {
        return lhs < rhs;
    }
    if (lhs_digits.size() != rhs_digits.size()) {
        return lhs_digits.size() < rhs_digits.size();
    }
    if (lhs_digits != rhs_digits) {
        return lhs_digits < rhs_digits;
    }
    return lhs < rhs;
}

}  // namespace

bool is_bulk_state_payload(const nlohmann::json& data) {
    if (!data.is_object() || data.empty()) {
        return false;
    }
    for (const auto& [key, value] : data.items()) {
        if (!value.is_object()) {
            return false;
        }
        if (std::find(k_vehicle_fields.begin(), k_vehicle_fields.end(), key) != k_vehicle_fields.end()) {
            return false;
        }
    }
    return true;
}

void to_json(nlohmann::json& j, const Vector3& value) {
    j = nlohmann::json{{"x", value.x}, {"y", value.y}, {"z", value.z}};
}

void from_json(const nlohmann::json& j, Vector3& value) {
    j.at("x").get_to(value.x);
    j.at("y").get_to(value.y);
    j.at("z").get_to(value.z);
}

void to_json(nlohmann::json& j, const Orientation& value) {
    j = nlohmann::json{{"pitch", value.pitch}, {"roll", value.roll}, {"yaw", value.yaw}};
}

void from_json(const nlohmann::json& j, Orientation& value) {
    j.at("pitch").get_to(value.pitch);
    j.at("roll").get_to(value.roll);
    j.at("yaw").get_to(value.yaw);
}

void to_json(nlohmann::json& j, const Vehicle& vehicle) {
    j = nlohmann::json{
        {"id", vehicle.identifier},
        {"swarm", vehicle.swarm_id},
        {"position", vehicle.position},
        {"velocity", vehicle.velocity},
        {"orientation", vehicle.orientation},
        {"battery", vehicle.battery_percent},
        {"status", std::string{to_string(vehicle.status)}},
        {"armed", vehicle.armed},
        {"color", vehicle.color},
    };
}

void merge_partial(Vehicle& vehicle, const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw ProtocolError(fmt::format("State payload for {} is not an object", vehicle.identifier));
    }

    Vehicle merged = vehicle;
    try {
        if (const auto it = payload.find("swarm"); it != payload.end()) {
            merged.swarm_id = it->get<std::string>();
        }
        if (const auto it = payload.find("position"); it != payload.end()) {
            merged.position = it->get<Vector3>();
        }
        if (const auto it = payload.find("velocity"); it != payload.end()) {
            merged.velocity = it->get<Vector3>();
        }
        if (const auto it = payload.find("orientation"); it != payload.end()) {
            merged.orientation = it->get<Orientation>();
        }
        if (const auto it = payload.find("battery"); it != payload.end()) {
            merged.battery_percent = it->get<double>();
        }
        if (const auto it = payload.find("status"); it != payload.end()) {
            merged.status = parse_vehicle_status(it->get<std::string>());
        }
        if (const auto it = payload.find("armed"); it != payload.end()) {
            merged.armed = it->get<bool>();
        }
        if (const auto it = payload.find("color"); it != payload.end()) {
            merged.color = it->get<std::string>();
        }
    } catch (const nlohmann::json::exception& exc) {
        throw ProtocolError(fmt::format("Malformed state payload for {}: {}", vehicle.identifier, exc.what()));
    }

    vehicle = std::move(merged);
}

VehicleSnapshot::VehicleSnapshot(std::vector<Vehicle> seed) {
    for (Vehicle& vehicle : seed) {
        const std::string identifier = vehicle.identifier;
        map_vehicles_.insert_or_assign(identifier, std::move(vehicle));
    }
}

void VehicleSnapshot::merge(const std::string& vehicle_id, const nlohmann::json& payload) {
    if (vehicle_id.empty()) {
        throw ProtocolError("State update has an empty vehicle id");
    }
    const auto iterator_vehicle = map_vehicles_.find(vehicle_id);
    if (iterator_vehicle != map_vehicles_.end()) {
        merge_partial(iterator_vehicle->second, payload);
        return;
    }
    Vehicle created{};
    created.identifier = vehicle_id;
    merge_partial(created, payload);
    map_vehicles_.emplace(vehicle_id, std::move(created));
}

void VehicleSnapshot::apply_state_update(const std::optional<std::string>& target_id, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ProtocolError("State update data is not an object");
    }

    // Stage into a copy so a bad entry in a bulk frame leaves the snapshot as it was.
    VehicleSnapshot staged = *this;
    if (target_id.has_value()) {
        staged.merge(target_id.value(), data);
    } else {
        for (const auto& [vehicle_id, payload] : data.items()) {
            staged.merge(vehicle_id, payload);
        }
    }
    map_vehicles_ = std::move(staged.map_vehicles_);
}

void VehicleSnapshot::replace_all(const nlohmann::json& data) {
    VehicleSnapshot fresh{};
    fresh.apply_state_update(std::nullopt, data);
    map_vehicles_ = std::move(fresh.map_vehicles_);
}

std::optional<Vehicle> VehicleSnapshot::find(const std::string& vehicle_id) const {
    const auto iterator_vehicle = map_vehicles_.find(vehicle_id);
    if (iterator_vehicle == map_vehicles_.end()) {
        return std::nullopt;
    }
    return iterator_vehicle->second;
}

std::vector<std::string> VehicleSnapshot::vehicles_in_swarm(const std::string& swarm_id) const {
    std::vector<std::string> list_members;
    for (const auto& [vehicle_id, vehicle] : map_vehicles_) {
        if (vehicle.swarm_id == swarm_id) {
            list_members.push_back(vehicle_id);
        }
    }
    std::sort(list_members.begin(), list_members.end(), natural_id_less);
    return list_members;
}

const std::map<std::string, Vehicle>& VehicleSnapshot::vehicles() const noexcept {
    return map_vehicles_;
}

std::size_t VehicleSnapshot::size() const noexcept {
    return map_vehicles_.size();
}

nlohmann::json VehicleSnapshot::to_json() const {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [vehicle_id, vehicle] : map_vehicles_) {
        data[vehicle_id] = vehicle;
    }
    return data;
}

std::vector<Vehicle> default_fleet() {
    std::vector<Vehicle> list_fleet;
    list_fleet.reserve(k_default_fleet.size());
    for (const FleetSeed& seed : k_default_fleet) {
        Vehicle vehicle{};
        vehicle.identifier = seed.identifier;
        vehicle.swarm_id = seed.swarm_id;
        vehicle.position = Vector3{seed.x, seed.y, 0.0};
        vehicle.color = seed.color;
        list_fleet.push_back(std::move(vehicle));
    }
    return list_fleet;
}

}  // namespace swarm_ops
