#include "swarm_ops/types.hpp"

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

std::string_view to_string(VehicleStatus status) noexcept {
    switch (status) {
        case VehicleStatus::Idle:
            return "idle";
        case VehicleStatus::Armed:
            return "armed";
        case VehicleStatus::Flying:
            return "flying";
        case VehicleStatus::Landing:
            return "landing";
    }
    return "idle";
}

VehicleStatus parse_vehicle_status(std::string_view text) {
    if (text == "idle") {
        return VehicleStatus::Idle;
    }
    if (text == "armed") {
        return VehicleStatus::Armed;
    }
    if (text == "flying") {
        return VehicleStatus::Flying;
    }
    if (text == "landing") {
        return VehicleStatus::Landing;
    }
    throw ProtocolError(fmt::format("Unknown vehicle status '{}'", text));
}

EpochMillis now_epoch_millis() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

}  // namespace swarm_ops
