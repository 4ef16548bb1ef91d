#pragma once

#include <memory>
#include <string>

namespace swarm_ops {

/**
 * @brief One end of a relay channel as seen by the hub.
 *
 * Implementations must tolerate `send` from any thread and must not block on
 * the network.
 */
class Connection {
  public:
    virtual ~Connection() = default;

    /** @brief Stable label used in logs. */
    [[nodiscard]] virtual const std::string& label() const noexcept = 0;
    /** @brief Whether the peer can currently accept messages. */
    [[nodiscard]] virtual bool is_open() const noexcept = 0;
    /**
     * @brief Queue a text frame for the peer.
     *
     * @throws TransportError when the frame cannot be queued.
     */
    virtual void send(const std::string& message) = 0;
};

using ConnectionPtr = std::shared_ptr<Connection>;

}  // namespace swarm_ops
