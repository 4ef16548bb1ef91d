#include "swarm_ops/collaborator_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
constexpr char k_reposition_target[] = "/api/reset-positions";
constexpr char k_missions_target_prefix[] = "/api/missions/";
constexpr int k_http_version{11};
}  // namespace

RepositionRequest RepositionRequest::around(PlanarPoint center, double radius_m) {
    RepositionRequest request{};
    request.center = center;
    request.radius_m = radius_m;
    return request;
}

RepositionRequest RepositionRequest::for_vehicle(std::string vehicle_id) {
    RepositionRequest request{};
    request.vehicle_id = std::move(vehicle_id);
    return request;
}

RepositionRequest RepositionRequest::for_swarm(std::string swarm_id) {
    RepositionRequest request{};
    request.swarm_id = std::move(swarm_id);
    return request;
}

nlohmann::json RepositionRequest::to_json() const {
    nlohmann::json body = nlohmann::json::object();
    if (center.has_value()) {
        body["centerX"] = center->x;
        body["centerY"] = center->y;
        body["radius"] = radius_m;
    } else if (vehicle_id.has_value()) {
        body["uavId"] = vehicle_id.value();
    } else if (swarm_id.has_value()) {
        body["swarmId"] = swarm_id.value();
    }
    return body;
}

HttpCollaboratorClient::HttpCollaboratorClient(CollaboratorConfig config)
    : config_(std::move(config)),
      logger_(get_logger()) {
    if (config_.host.empty() || config_.port.empty()) {
        throw std::invalid_argument("Collaborator host and port are required");
    }
}

bool HttpCollaboratorClient::reposition(const RepositionRequest& request) {
    const std::string body = request.to_json().dump();
    const HttpReply reply = exchange("POST", k_reposition_target, body);
    if (reply.status < 200 || reply.status >= 300) {
        logger_->warn("Reposition {} refused with HTTP {}", body, reply.status);
        return false;
    }
    logger_->info("Reposition {} accepted", body);
    return true;
}

Mission HttpCollaboratorClient::fetch_mission(const std::string& mission_id) {
    if (mission_id.empty()) {
        throw std::invalid_argument("Mission id cannot be empty");
    }
    const HttpReply reply = exchange("GET", std::string{k_missions_target_prefix} + mission_id, "");
    if (reply.status != 200) {
        throw TransportError(fmt::format("Mission {} fetch failed with HTTP {}", mission_id, reply.status));
    }
    const nlohmann::json document = nlohmann::json::parse(reply.body, nullptr, false);
    if (document.is_discarded()) {
        throw ProtocolError(fmt::format("Mission {} is not valid JSON", mission_id));
    }
    Mission mission = parse_mission(document);
    if (mission.identifier.empty()) {
        mission.identifier = mission_id;
    }
    return mission;
}

HttpCollaboratorClient::HttpReply HttpCollaboratorClient::exchange(
    const std::string& method,
    const std::string& target,
    const std::string& body
) const {
    net::io_context io_context;
    tcp::resolver resolver(io_context);
    beast::tcp_stream stream(io_context);
    beast::flat_buffer buffer;
    http::response<http::string_body> response;

    http::request<http::string_body> request{http::string_to_verb(method), target, k_http_version};
    request.set(http::field::host, config_.host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!body.empty()) {
        request.set(http::field::content_type, "application/json");
        request.body() = body;
    }
    request.prepare_payload();

    beast::error_code error;
    const auto endpoints = resolver.resolve(config_.host, config_.port, error);
    if (error) {
        throw TransportError(fmt::format("Resolve {}:{} failed: {}", config_.host, config_.port, error.message()));
    }

    // Asynchronous chain so the stream deadline applies to every step.
    stream.expires_after(config_.timeout);
    stream.async_connect(endpoints, [&](beast::error_code connect_error, const tcp::endpoint&) {
        if (connect_error) {
            error = connect_error;
            return;
        }
        http::async_write(stream, request, [&](beast::error_code write_error, std::size_t) {
            if (write_error) {
                error = write_error;
                return;
            }
            http::async_read(stream, buffer, response, [&](beast::error_code read_error, std::size_t) {
                error = read_error;
            });
        });
    });
    io_context.run();

    if (error) {
        throw TransportError(fmt::format("{} {} failed: {}", method, target, error.message()));
    }

    beast::error_code shutdown_error;
    stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_error);
    if (shutdown_error && shutdown_error != beast::errc::not_connected) {
        logger_->debug("Collaborator socket shutdown: {}", shutdown_error.message());
    }

    return HttpReply{response.result_int(), response.body()};
}

}  // namespace swarm_ops
