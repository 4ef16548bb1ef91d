// === Collaborator Client =====================================================
//
// Contract with the mission authoring service that sits outside the relay:
// repositioning vehicles on the ground and serving mission definitions. The
// HTTP implementation speaks the service's JSON REST surface over Boost.Beast.

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission.hpp"

namespace swarm_ops {

/** @brief Exactly one of the three addressing forms is populated. */
struct RepositionRequest final {
    std::optional<PlanarPoint> center{};
    double radius_m{};
    std::optional<std::string> vehicle_id{};
    std::optional<std::string> swarm_id{};

    [[nodiscard]] static RepositionRequest around(PlanarPoint center, double radius_m);
    [[nodiscard]] static RepositionRequest for_vehicle(std::string vehicle_id);
    [[nodiscard]] static RepositionRequest for_swarm(std::string swarm_id);

    [[nodiscard]] nlohmann::json to_json() const;
};

/** @brief Moves vehicles on the ground before a run. */
class RepositionService {
  public:
    virtual ~RepositionService() = default;

    /**
     * @return true when the service accepted the request.
     * @throws TransportError when the service could not be reached.
     */
    virtual bool reposition(const RepositionRequest& request) = 0;
};

/** @brief Supplies mission definitions by id. */
class MissionSource {
  public:
    virtual ~MissionSource() = default;

    /**
     * @throws TransportError when the service could not be reached or refused.
     * @throws ProtocolError when the returned document is malformed.
     */
    virtual Mission fetch_mission(const std::string& mission_id) = 0;
};

struct CollaboratorConfig final {
    std::string host{"127.0.0.1"};
    std::string port{"3002"};
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

/** @brief Synchronous HTTP/1.1 client for the collaborator REST surface. */
class HttpCollaboratorClient final : public RepositionService, public MissionSource {
  public:
    explicit HttpCollaboratorClient(CollaboratorConfig config);

    bool reposition(const RepositionRequest& request) override;
    Mission fetch_mission(const std::string& mission_id) override;

  private:
    struct HttpReply final {
        unsigned status{};
        std::string body{};
    };

    HttpReply exchange(const std::string& method, const std::string& target, const std::string& body) const;

    CollaboratorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
