// === Relay Server ============================================================
//
// Network front of the hub. A single listening port serves the observer and
// simulator WebSocket channels (selected by upgrade path) and the REST API.
// All socket work runs on the caller's io_context; each session is confined to
// its own strand.

#pragma once

#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>

#include "swarm_ops/configuration.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/rest_api.hpp"
#include "swarm_ops/state_hub.hpp"

namespace swarm_ops {

class RelayListener;

class RelayServer final {
  public:
    RelayServer(boost::asio::io_context& io_context, HubConfig config, StateHub& hub, const RestApi& rest_api);
    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /**
     * @brief Bind the listening socket and begin accepting.
     *
     * @throws TransportError when the address cannot be bound.
     */
    void start();

    /** @brief Stop accepting new connections. Established sessions are left to the io_context. */
    void stop();

    /** @brief Port actually bound, which differs from the configured one when that is 0. */
    [[nodiscard]] std::uint16_t bound_port() const noexcept;

  private:
    boost::asio::io_context& io_context_;
    HubConfig config_;
    StateHub& hub_;
    const RestApi& rest_api_;
    std::shared_ptr<RelayListener> listener_;
    std::uint16_t bound_port_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
