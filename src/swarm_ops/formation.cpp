#include "swarm_ops/formation.hpp"

#include <array>
#include <cmath>
#include <limits>
#include <numbers>
#include <optional>
#include <stdexcept>

#include <fmt/format.h>

namespace swarm_ops {

namespace {
constexpr double k_slot_spacing_deg{60.0};

constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

double planar_distance_sq(const Vector3& from, const Vector3& to) {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;
    return dx * dx + dy * dy;
}

void require_slot_capacity(const std::vector<std::string>& vehicle_ids) {
    if (vehicle_ids.size() > k_hexagon_slots) {
        throw std::invalid_argument(
            fmt::format("Hexagonal formation holds {} vehicles, got {}", k_hexagon_slots, vehicle_ids.size())
        );
    }
}
}  // namespace

HexagonSlots hexagonal_formation(const Vector3& center, double radius_m) {
    if (!(radius_m > 0.0)) {
        throw std::invalid_argument("Formation radius must be positive");
    }
    HexagonSlots slots{};
    for (std::size_t index = 0; index < k_hexagon_slots; ++index) {
        const double angle_rad = degrees_to_radians(static_cast<double>(index) * k_slot_spacing_deg);
        slots[index] = Vector3{
            center.x + radius_m * std::cos(angle_rad),
            center.y + radius_m * std::sin(angle_rad),
            center.z
        };
    }
    return slots;
}

std::vector<std::size_t> IndexSlotAssignment::assign(
    const std::vector<std::string>& vehicle_ids,
    const HexagonSlots&,
    const VehicleSnapshot&
) const {
    require_slot_capacity(vehicle_ids);
    std::vector<std::size_t> list_slots(vehicle_ids.size());
    for (std::size_t index = 0; index < vehicle_ids.size(); ++index) {
        list_slots[index] = index;
    }
    return list_slots;
}

std::string_view IndexSlotAssignment::name() const noexcept {
    return "index";
}

std::vector<std::size_t> NearestSlotAssignment::assign(
    const std::vector<std::string>& vehicle_ids,
    const HexagonSlots& slots,
    const VehicleSnapshot& observed
) const {
    require_slot_capacity(vehicle_ids);
    std::array<bool, k_hexagon_slots> taken{};
    std::vector<std::size_t> list_slots;
    list_slots.reserve(vehicle_ids.size());

    for (const std::string& vehicle_id : vehicle_ids) {
        const std::optional<Vehicle> optional_vehicle = observed.find(vehicle_id);
        std::size_t chosen = k_hexagon_slots;
        double best_distance = std::numeric_limits<double>::max();
        for (std::size_t slot = 0; slot < k_hexagon_slots; ++slot) {
            if (taken[slot]) {
                continue;
            }
            if (!optional_vehicle.has_value()) {
                chosen = slot;
                break;
            }
            const double distance = planar_distance_sq(optional_vehicle->position, slots[slot]);
            if (distance < best_distance) {
                best_distance = distance;
                chosen = slot;
            }
        }
        taken[chosen] = true;
        list_slots.push_back(chosen);
    }
    return list_slots;
}

std::string_view NearestSlotAssignment::name() const noexcept {
    return "nearest";
}

std::unique_ptr<SlotAssignment> make_slot_assignment(std::string_view strategy_name) {
    if (strategy_name == "index") {
        return std::make_unique<IndexSlotAssignment>();
    }
    if (strategy_name == "nearest") {
        return std::make_unique<NearestSlotAssignment>();
    }
    throw std::invalid_argument(fmt::format("Unknown slot assignment strategy '{}'", strategy_name));
}

}  // namespace swarm_ops
