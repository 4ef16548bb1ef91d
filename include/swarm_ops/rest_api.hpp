// === REST API ================================================================
//
// Request router for the relay's HTTP surface: health, status, direct command
// relay, swarm moves and formations, the rolling log, and mission execution
// control. Transport-agnostic so
// the relay server and the tests drive it the same way.

#pragma once

#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission_controller.hpp"
#include "swarm_ops/state_hub.hpp"

namespace swarm_ops {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

class RestApi final {
  public:
    /** @param controller May be null when mission execution is disabled. */
    RestApi(StateHub& hub, MissionController* controller);

    [[nodiscard]] HttpResponse handle(const HttpRequest& request) const;

  private:
    [[nodiscard]] HttpResponse health(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse status(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse relay_command(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse logs(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse swarm_target(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse swarm_formation(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse execute_mission(const HttpRequest& request, const std::string& mission_id) const;
    [[nodiscard]] HttpResponse cancel_mission(const HttpRequest& request) const;

    StateHub& hub_;
    MissionController* controller_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Build a JSON response mirroring the request's version and keep-alive. */
[[nodiscard]] HttpResponse make_json_response(
    const HttpRequest& request,
    boost::beast::http::status status,
    const nlohmann::json& body
);

}  // namespace swarm_ops
