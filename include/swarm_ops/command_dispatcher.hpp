#pragma once

#include <memory>

#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/connection.hpp"
#include "swarm_ops/state_hub.hpp"

namespace swarm_ops {

/** @brief Sink for addressed commands issued by the orchestrator. */
class CommandDispatcher {
  public:
    virtual ~CommandDispatcher() = default;

    /**
     * @brief Send @p command toward the simulator without waiting for a reply.
     *
     * @throws TransportError when the command could not be handed off.
     */
    virtual void dispatch(const Command& command) = 0;
};

/**
 * @brief Routes commands through the hub's observer-to-simulator path.
 *
 * Hub error replies land on @p origin, normally the orchestrator's observer view.
 */
class HubCommandDispatcher final : public CommandDispatcher {
  public:
    HubCommandDispatcher(StateHub& hub, ConnectionPtr origin);

    void dispatch(const Command& command) override;

  private:
    StateHub& hub_;
    ConnectionPtr origin_;
};

}  // namespace swarm_ops
