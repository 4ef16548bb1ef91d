#include "swarm_ops/rest_api.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <optional>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/errors.hpp"
#include "swarm_ops/formation.hpp"
#include "swarm_ops/version.hpp"

namespace swarm_ops {

namespace http = boost::beast::http;
using nlohmann::json;

namespace {
constexpr std::string_view k_missions_prefix{"/api/missions/"};
constexpr std::string_view k_execute_suffix{"/execute"};
constexpr char k_hexagon_formation[] = "hexagon";
constexpr double k_swarm_formation_radius_m{30.0};
constexpr double k_min_formation_altitude_m{50.0};

std::string iso8601_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

std::string_view strip_query(std::string_view target) {
    const auto query_pos = target.find('?');
    return query_pos == std::string_view::npos ? target : target.substr(0, query_pos);
}

json error_body(std::string_view message) {
    return json{{"error", std::string{message}}};
}

json failure_body(std::string_view message) {
    return json{{"success", false}, {"message", std::string{message}}};
}

/** @brief Centroid of the members' positions, held at or above the formation floor. */
Vector3 swarm_centroid(const VehicleSnapshot& snapshot, const std::vector<std::string>& member_ids) {
    Vector3 sum{};
    std::size_t count = 0;
    for (const std::string& vehicle_id : member_ids) {
        if (const std::optional<Vehicle> vehicle = snapshot.find(vehicle_id)) {
            sum.x += vehicle->position.x;
            sum.y += vehicle->position.y;
            sum.z += vehicle->position.z;
            ++count;
        }
    }
    if (count == 0) {
        return Vector3{0.0, 0.0, k_min_formation_altitude_m};
    }
    const auto divisor = static_cast<double>(count);
    return Vector3{sum.x / divisor, sum.y / divisor, std::max(sum.z / divisor, k_min_formation_altitude_m)};
}
}  // namespace

HttpResponse make_json_response(const HttpRequest& request, http::status status, const json& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = body.dump();
    response.prepare_payload();
    return response;
}

RestApi::RestApi(StateHub& hub, MissionController* controller)
    : hub_(hub),
      controller_(controller),
      logger_(get_logger()) {}

HttpResponse RestApi::handle(const HttpRequest& request) const {
    const std::string_view path = strip_query(std::string_view{request.target().data(), request.target().size()});
    const http::verb method = request.method();

    if (path == "/api/health" && method == http::verb::get) {
        return health(request);
    }
    if (path == "/api/status" && method == http::verb::get) {
        return status(request);
    }
    if (path == "/api/logs" && method == http::verb::get) {
        return logs(request);
    }
    if (path == "/api/command" && method == http::verb::post) {
        return relay_command(request);
    }
    if (path == "/api/swarm-target" && method == http::verb::post) {
        return swarm_target(request);
    }
    if (path == "/api/swarm-formation" && method == http::verb::post) {
        return swarm_formation(request);
    }
    if (path == "/api/missions/cancel" && method == http::verb::post) {
        return cancel_mission(request);
    }
    if (method == http::verb::post && path.size() > k_missions_prefix.size() + k_execute_suffix.size()
        && path.substr(0, k_missions_prefix.size()) == k_missions_prefix
        && path.substr(path.size() - k_execute_suffix.size()) == k_execute_suffix) {
        const std::string_view mission_id = path.substr(
            k_missions_prefix.size(),
            path.size() - k_missions_prefix.size() - k_execute_suffix.size()
        );
        if (mission_id.find('/') == std::string_view::npos) {
            return execute_mission(request, std::string{mission_id});
        }
    }

    const auto method_name = request.method_string();
    logger_->debug("No route for {} {}", std::string{method_name.data(), method_name.size()}, std::string{path});
    return make_json_response(request, http::status::not_found, error_body("not found"));
}

HttpResponse RestApi::health(const HttpRequest& request) const {
    return make_json_response(
        request,
        http::status::ok,
        json{{"status", "healthy"}, {"timestamp", iso8601_now()}, {"version", std::string{k_version}}}
    );
}

HttpResponse RestApi::status(const HttpRequest& request) const {
    json body{
        {"vehicles", hub_.snapshot().to_json()},
        {"simulatorConnected", hub_.simulator_connected()},
        {"observersConnected", hub_.observer_count()},
    };
    if (controller_ != nullptr) {
        const MissionStatus mission_status = controller_->status();
        json mission{
            {"running", mission_status.running},
            {"phase", std::string{to_string(mission_status.phase)}},
            {"missionId", mission_status.mission_id},
        };
        if (mission_status.last_result) {
            mission["lastResult"] = json{
                {"phase", std::string{to_string(mission_status.last_result->phase)}},
                {"message", mission_status.last_result->message},
                {"commandsDispatched", mission_status.last_result->commands_dispatched},
            };
        }
        body["mission"] = std::move(mission);
    }
    return make_json_response(request, http::status::ok, body);
}

HttpResponse RestApi::relay_command(const HttpRequest& request) const {
    switch (hub_.relay(request.body())) {
        case ForwardOutcome::Relayed:
            return make_json_response(request, http::status::ok, json{{"success", true}});
        case ForwardOutcome::Rejected:
            return make_json_response(request, http::status::bad_request, error_body("malformed command"));
        case ForwardOutcome::SimulatorUnavailable:
            break;
    }
    return make_json_response(request, http::status::service_unavailable, error_body("simulator not connected"));
}

HttpResponse RestApi::swarm_target(const HttpRequest& request) const {
    std::string swarm_id;
    Vector3 target{};
    try {
        const json body = json::parse(request.body());
        swarm_id = body.at("swarmId").get<std::string>();
        target = Vector3{body.at("x").get<double>(), body.at("y").get<double>(), body.at("z").get<double>()};
    } catch (const json::exception& exc) {
        logger_->warn("Rejected swarm target request: {}", exc.what());
        return make_json_response(request, http::status::bad_request, failure_body("swarmId, x, y and z required"));
    }

    const std::vector<std::string> list_members = hub_.vehicles_in_swarm(swarm_id);
    if (list_members.empty()) {
        return make_json_response(request, http::status::not_found, failure_body("Swarm not found"));
    }

    const EpochMillis timestamp_ms = now_epoch_millis();
    std::size_t relayed = 0;
    for (const std::string& vehicle_id : list_members) {
        if (hub_.relay(encode_command(make_goto(vehicle_id, target, timestamp_ms)).dump()) == ForwardOutcome::Relayed) {
            ++relayed;
        }
    }
    hub_.announce(make_swarm_target_message(swarm_id, target, timestamp_ms));
    logger_->info(
        "Swarm {} sent to ({:.1f}, {:.1f}, {:.1f}); {}/{} commands relayed",
        swarm_id, target.x, target.y, target.z, relayed, list_members.size()
    );

    return make_json_response(
        request,
        http::status::ok,
        json{
            {"success", true},
            {"target", {{"x", target.x}, {"y", target.y}, {"z", target.z}, {"timestamp", timestamp_ms}}},
            {"commandsRelayed", relayed},
        }
    );
}

HttpResponse RestApi::swarm_formation(const HttpRequest& request) const {
    std::string swarm_id;
    std::string formation;
    std::optional<double> optional_center_x;
    std::optional<double> optional_center_y;
    try {
        const json body = json::parse(request.body());
        swarm_id = body.at("swarmId").get<std::string>();
        formation = body.at("formation").get<std::string>();
        if (const auto it = body.find("centerX"); it != body.end() && !it->is_null()) {
            optional_center_x = it->get<double>();
        }
        if (const auto it = body.find("centerY"); it != body.end() && !it->is_null()) {
            optional_center_y = it->get<double>();
        }
    } catch (const json::exception& exc) {
        logger_->warn("Rejected swarm formation request: {}", exc.what());
        return make_json_response(request, http::status::bad_request, failure_body("swarmId and formation required"));
    }

    const VehicleSnapshot snapshot = hub_.snapshot();
    const std::vector<std::string> list_members = snapshot.vehicles_in_swarm(swarm_id);
    if (list_members.empty()) {
        return make_json_response(request, http::status::not_found, failure_body("Swarm not found"));
    }
    if (formation != k_hexagon_formation || list_members.size() != k_hexagon_slots) {
        return make_json_response(
            request,
            http::status::bad_request,
            failure_body(fmt::format(
                "Formation '{}' not supported or wrong number of drones (need {} for hexagon)",
                formation,
                k_hexagon_slots
            ))
        );
    }

    // An explicit center needs both coordinates; it flies at the formation floor.
    const Vector3 center = optional_center_x && optional_center_y
        ? Vector3{*optional_center_x, *optional_center_y, k_min_formation_altitude_m}
        : swarm_centroid(snapshot, list_members);
    const HexagonSlots slots = hexagonal_formation(center, k_swarm_formation_radius_m);

    const EpochMillis timestamp_ms = now_epoch_millis();
    json positions = json::array();
    std::size_t relayed = 0;
    for (std::size_t index = 0; index < list_members.size(); ++index) {
        const Vector3& slot = slots[index];
        positions.push_back(json{{"x", slot.x}, {"y", slot.y}, {"z", slot.z}});
        if (hub_.relay(encode_command(make_goto(list_members[index], slot, timestamp_ms)).dump()) == ForwardOutcome::Relayed) {
            ++relayed;
        }
    }
    logger_->info(
        "Swarm {} forming hexagon around ({:.1f}, {:.1f}, {:.1f}); {}/{} commands relayed",
        swarm_id, center.x, center.y, center.z, relayed, list_members.size()
    );

    return make_json_response(
        request,
        http::status::ok,
        json{
            {"success", true},
            {"message", fmt::format("{} forming hexagon", swarm_id)},
            {"formation", k_hexagon_formation},
            {"positions", std::move(positions)},
            {"commandsRelayed", relayed},
        }
    );
}

HttpResponse RestApi::logs(const HttpRequest& request) const {
    return make_json_response(request, http::status::ok, json{{"entries", recent_log_entries()}});
}

HttpResponse RestApi::execute_mission(const HttpRequest& request, const std::string& mission_id) const {
    if (controller_ == nullptr) {
        return make_json_response(request, http::status::service_unavailable, error_body("mission execution disabled"));
    }

    std::vector<std::string> vehicle_ids;
    try {
        const json body = json::parse(request.body());
        if (body.contains("vehicleIds")) {
            vehicle_ids = body.at("vehicleIds").get<std::vector<std::string>>();
        } else if (body.contains("swarmId")) {
            vehicle_ids = hub_.vehicles_in_swarm(body.at("swarmId").get<std::string>());
        } else {
            return make_json_response(request, http::status::bad_request, error_body("vehicleIds or swarmId required"));
        }
    } catch (const json::exception& exc) {
        logger_->warn("Rejected execute request for mission {}: {}", mission_id, exc.what());
        return make_json_response(request, http::status::bad_request, error_body("invalid request body"));
    }

    // The mission is fetched on the controller's worker; fetch failures show in /api/status.
    try {
        controller_->start(mission_id, std::move(vehicle_ids));
    } catch (const ReentrancyError& exc) {
        return make_json_response(request, http::status::conflict, error_body(exc.what()));
    }

    return make_json_response(request, http::status::accepted, json{{"started", true}, {"missionId", mission_id}});
}

HttpResponse RestApi::cancel_mission(const HttpRequest& request) const {
    if (controller_ != nullptr) {
        controller_->cancel();
    }
    return make_json_response(request, http::status::ok, json{{"cancelled", true}});
}

}  // namespace swarm_ops
