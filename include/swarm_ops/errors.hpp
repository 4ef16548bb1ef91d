// === Error Taxonomy ==========================================================
//
// Exception types shared by the hub and the mission orchestrator. Transport
// and protocol errors are logged and swallowed at component boundaries;
// mission aborts and reentrancy rejections surface to the caller.

#pragma once

#include <stdexcept>
#include <string>

namespace swarm_ops {

/** @brief A socket or HTTP exchange could not be completed. */
class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief An inbound payload did not match the wire protocol. */
class ProtocolError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Raised inside a mission run to abort it into the Failed phase. */
class MissionAbortError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief A mission run was requested while another one is active. */
class ReentrancyError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

}  // namespace swarm_ops
