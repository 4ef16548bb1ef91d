#include "swarm_ops/observer_view.hpp"

#include <optional>

#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/errors.hpp"

namespace swarm_ops {

ObserverView::ObserverView(std::string label)
    : str_label_(std::move(label)),
      logger_(get_logger()) {}

const std::string& ObserverView::label() const noexcept {
    return str_label_;
}

bool ObserverView::is_open() const noexcept {
    return true;
}

void ObserverView::send(const std::string& message) {
    try {
        const nlohmann::json envelope = parse_envelope(message);
        switch (parse_message_type(envelope.at("type").get<std::string>())) {
            case MessageType::InitialState: {
                std::scoped_lock lock(mutex_);
                struct_snapshot_.replace_all(envelope.value("data", nlohmann::json::object()));
                break;
            }
            case MessageType::StateUpdate: {
                std::optional<std::string> target_id;
                if (const auto it = envelope.find("targetId"); it != envelope.end() && it->is_string()) {
                    target_id = it->get<std::string>();
                }
                const nlohmann::json data = envelope.value("data", nlohmann::json::object());
                if (!target_id && !is_bulk_state_payload(data)) {
                    // Attributed by the hub to the sending simulator; not addressable here.
                    logger_->debug("[{}] skipping untargeted single-vehicle update", str_label_);
                    break;
                }
                std::scoped_lock lock(mutex_);
                struct_snapshot_.apply_state_update(target_id, data);
                break;
            }
            case MessageType::Error:
                ++error_count_;
                logger_->warn("[{}] hub error: {}", str_label_, envelope.value("message", std::string{"unknown"}));
                break;
            case MessageType::CommandResponse:
                logger_->info(
                    "[{}] command {}: {}",
                    str_label_,
                    envelope.value("command", std::string{"?"}),
                    envelope.value("message", std::string{})
                );
                break;
            case MessageType::Command:
            case MessageType::Unknown:
                break;
        }
    } catch (const ProtocolError& exc) {
        logger_->warn("[{}] ignoring malformed broadcast: {}", str_label_, exc.what());
    } catch (const nlohmann::json::exception& exc) {
        logger_->warn("[{}] ignoring malformed broadcast: {}", str_label_, exc.what());
    }
}

VehicleSnapshot ObserverView::current() const {
    std::scoped_lock lock(mutex_);
    return struct_snapshot_;
}

std::size_t ObserverView::error_count() const noexcept {
    return error_count_.load();
}

}  // namespace swarm_ops
