#include "swarm_ops/state_hub.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace {
constexpr std::string_view k_simulator_not_connected{"simulator not connected"};
const std::string k_rest_origin_label{"rest"};
}  // namespace

StateHub::StateHub()
    : logger_(get_logger()) {}

StateHub::StateHub(std::vector<Vehicle> seed)
    : struct_snapshot_(std::move(seed)),
      logger_(get_logger()) {
    logger_->info("Hub seeded with {} vehicles", struct_snapshot_.size());
}

void StateHub::register_observer(const ConnectionPtr& observer) {
    if (observer == nullptr) {
        throw std::invalid_argument("Observer connection cannot be null");
    }
    std::scoped_lock lock(mutex_);
    list_observers_.push_back(observer);
    logger_->info("Observer {} connected ({} total)", observer->label(), list_observers_.size());
    // Sent under the lock so no state_update can overtake the snapshot.
    send_best_effort(observer, make_initial_state_message(struct_snapshot_.to_json()));
}

void StateHub::unregister_observer(const ConnectionPtr& observer) {
    std::scoped_lock lock(mutex_);
    const auto iterator_end = std::remove(list_observers_.begin(), list_observers_.end(), observer);
    if (iterator_end == list_observers_.end()) {
        return;
    }
    list_observers_.erase(iterator_end, list_observers_.end());
    logger_->info("Observer {} disconnected ({} remaining)", observer->label(), list_observers_.size());
}

void StateHub::register_simulator(const ConnectionPtr& simulator, std::optional<std::string> vehicle_id) {
    if (simulator == nullptr) {
        throw std::invalid_argument("Simulator connection cannot be null");
    }
    if (vehicle_id && vehicle_id->empty()) {
        vehicle_id.reset();
    }
    std::scoped_lock lock(mutex_);
    if (simulator_ != nullptr && simulator_ != simulator) {
        logger_->warn("Simulator {} superseded by {}", simulator_->label(), simulator->label());
    } else {
        logger_->info("Simulator {} connected", simulator->label());
    }
    simulator_ = simulator;
    optional_simulator_vehicle_id_ = std::move(vehicle_id);
    if (optional_simulator_vehicle_id_) {
        logger_->info("Untargeted state updates are attributed to {}", *optional_simulator_vehicle_id_);
    }
}

void StateHub::unregister_simulator(const ConnectionPtr& simulator) {
    std::scoped_lock lock(mutex_);
    if (simulator_ != simulator) {
        logger_->debug("Ignoring disconnect of superseded simulator {}", simulator ? simulator->label() : "<null>");
        return;
    }
    logger_->warn("Simulator {} disconnected; commands will fail until a simulator registers", simulator_->label());
    simulator_.reset();
    optional_simulator_vehicle_id_.reset();
}

ForwardOutcome StateHub::forward(const ConnectionPtr& origin, std::string_view message) {
    std::scoped_lock lock(mutex_);
    const std::string& origin_label = origin ? origin->label() : k_rest_origin_label;
    const ForwardOutcome outcome = relay_locked(message, origin_label);
    if (outcome == ForwardOutcome::SimulatorUnavailable && origin != nullptr) {
        send_best_effort(origin, make_error_message(k_simulator_not_connected));
    }
    return outcome;
}

ForwardOutcome StateHub::relay(std::string_view message) {
    std::scoped_lock lock(mutex_);
    return relay_locked(message, k_rest_origin_label);
}

void StateHub::announce(const std::string& message) {
    std::scoped_lock lock(mutex_);
    for (const ConnectionPtr& observer : list_observers_) {
        send_best_effort(observer, message);
    }
}

void StateHub::ingest(const ConnectionPtr& source, std::string_view message) {
    std::scoped_lock lock(mutex_);
    if (source == nullptr || source != simulator_) {
        logger_->debug("Dropping frame from non-authoritative connection {}", source ? source->label() : "<null>");
        return;
    }

    try {
        const nlohmann::json envelope = parse_envelope(message);
        const MessageType type = parse_message_type(envelope.at("type").get<std::string>());
        if (type == MessageType::StateUpdate) {
            std::optional<std::string> target_id;
            if (const auto it = envelope.find("targetId"); it != envelope.end() && !it->is_null()) {
                if (!it->is_string()) {
                    throw ProtocolError("state_update targetId is not a string");
                }
                target_id = it->get<std::string>();
            }
            const auto iterator_data = envelope.find("data");
            if (iterator_data == envelope.end()) {
                throw ProtocolError("state_update has no data");
            }
            if (!target_id) {
                target_id = optional_simulator_vehicle_id_;
            }
            if (target_id || is_bulk_state_payload(*iterator_data)) {
                struct_snapshot_.apply_state_update(target_id, *iterator_data);
            } else {
                logger_->debug("State update from {} names no vehicle; relaying without merge", source->label());
            }
        }
    } catch (const ProtocolError& exc) {
        logger_->warn("Dropping malformed frame from simulator {}: {}", source->label(), exc.what());
        return;
    }

    const std::string verbatim{message};
    for (const ConnectionPtr& observer : list_observers_) {
        send_best_effort(observer, verbatim);
    }
}

VehicleSnapshot StateHub::snapshot() const {
    std::scoped_lock lock(mutex_);
    return struct_snapshot_;
}

std::vector<std::string> StateHub::vehicles_in_swarm(const std::string& swarm_id) const {
    std::scoped_lock lock(mutex_);
    return struct_snapshot_.vehicles_in_swarm(swarm_id);
}

bool StateHub::simulator_connected() const {
    std::scoped_lock lock(mutex_);
    return simulator_ != nullptr && simulator_->is_open();
}

std::size_t StateHub::observer_count() const {
    std::scoped_lock lock(mutex_);
    return list_observers_.size();
}

ForwardOutcome StateHub::relay_locked(std::string_view message, const std::string& origin_label) {
    try {
        const nlohmann::json envelope = parse_envelope(message);
        static_cast<void>(decode_command(envelope));
    } catch (const ProtocolError& exc) {
        logger_->warn("Dropping malformed command from {}: {}", origin_label, exc.what());
        return ForwardOutcome::Rejected;
    }

    if (simulator_ == nullptr || !simulator_->is_open()) {
        logger_->warn("Command from {} not relayed: {}", origin_label, k_simulator_not_connected);
        return ForwardOutcome::SimulatorUnavailable;
    }

    try {
        simulator_->send(std::string{message});
    } catch (const TransportError& exc) {
        logger_->warn("Command from {} not relayed: {}", origin_label, exc.what());
        return ForwardOutcome::SimulatorUnavailable;
    }
    logger_->debug("Relayed command from {} to simulator {}", origin_label, simulator_->label());
    return ForwardOutcome::Relayed;
}

void StateHub::send_best_effort(const ConnectionPtr& connection, const std::string& message) const {
    if (connection == nullptr || !connection->is_open()) {
        return;
    }
    try {
        connection->send(message);
    } catch (const TransportError& exc) {
        logger_->warn("Skipping observer {}: {}", connection->label(), exc.what());
    }
}

}  // namespace swarm_ops
