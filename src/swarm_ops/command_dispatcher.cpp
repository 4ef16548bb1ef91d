#include "swarm_ops/command_dispatcher.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

HubCommandDispatcher::HubCommandDispatcher(StateHub& hub, ConnectionPtr origin)
    : hub_(hub),
      origin_(std::move(origin)) {
    if (origin_ == nullptr) {
        throw std::invalid_argument("HubCommandDispatcher requires an origin connection");
    }
}

void HubCommandDispatcher::dispatch(const Command& command) {
    const std::string message = encode_command(command).dump();
    switch (hub_.forward(origin_, message)) {
        case ForwardOutcome::Relayed:
            return;
        case ForwardOutcome::SimulatorUnavailable:
            throw TransportError(fmt::format("{} for {}: simulator not connected", to_string(command.verb), command.target_id));
        case ForwardOutcome::Rejected:
            throw ProtocolError(fmt::format("Hub rejected {} for {}", to_string(command.verb), command.target_id));
    }
}

}  // namespace swarm_ops
