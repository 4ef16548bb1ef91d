#include "swarm_ops/command_protocol.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

namespace {

struct VerbSignature final {
    CommandVerb verb;
    std::string_view name;
    std::array<std::string_view, 3> required_params;
    std::size_t param_count;
};

constexpr std::array<VerbSignature, 7> k_verb_signatures{{
    {CommandVerb::Arm, "arm", {}, 0},
    {CommandVerb::Disarm, "disarm", {}, 0},
    {CommandVerb::Takeoff, "takeoff", {"altitude"}, 1},
    {CommandVerb::Land, "land", {}, 0},
    {CommandVerb::Goto, "goto", {"x", "y", "z"}, 3},
    {CommandVerb::Rotate, "rotate", {"yaw"}, 1},
    {CommandVerb::Move, "move", {"dx", "dy", "dz"}, 3},
}};

const VerbSignature& signature_for(CommandVerb verb) noexcept {
    for (const VerbSignature& signature : k_verb_signatures) {
        if (signature.verb == verb) {
            return signature;
        }
    }
    return k_verb_signatures.front();
}

Command make_command(CommandVerb verb, std::string target_id, nlohmann::json params, EpochMillis timestamp_ms) {
    if (target_id.empty()) {
        throw std::invalid_argument("Command target id cannot be empty");
    }
    Command command{};
    command.verb = verb;
    command.params = std::move(params);
    command.target_id = std::move(target_id);
    command.timestamp_ms = timestamp_ms;
    return command;
}

}  // namespace

std::string_view to_string(CommandVerb verb) noexcept {
    return signature_for(verb).name;
}

CommandVerb parse_command_verb(std::string_view text) {
    for (const VerbSignature& signature : k_verb_signatures) {
        if (signature.name == text) {
            return signature.verb;
        }
    }
    throw ProtocolError(fmt::format("Unknown command '{}'", text));
}

std::string_view to_string(MessageType type) noexcept {
    switch (type) {
        case MessageType::InitialState:
            return "initial_state";
        case MessageType::StateUpdate:
            return "state_update";
        case MessageType::Command:
            return "command";
        case MessageType::CommandResponse:
            return "command_response";
        case MessageType::Error:
            return "error";
        case MessageType::Unknown:
            break;
    }
    return "unknown";
}

MessageType parse_message_type(std::string_view text) noexcept {
    if (text == "initial_state") {
        return MessageType::InitialState;
    }
    if (text == "state_update") {
        return MessageType::StateUpdate;
    }
    if (text == "command") {
        return MessageType::Command;
    }
    if (text == "command_response") {
        return MessageType::CommandResponse;
    }
    if (text == "error") {
        return MessageType::Error;
    }
    return MessageType::Unknown;
}

Command make_arm(std::string target_id, EpochMillis timestamp_ms) {
    return make_command(CommandVerb::Arm, std::move(target_id), nlohmann::json::object(), timestamp_ms);
}

Command make_disarm(std::string target_id, EpochMillis timestamp_ms) {
    return make_command(CommandVerb::Disarm, std::move(target_id), nlohmann::json::object(), timestamp_ms);
}

Command make_land(std::string target_id, EpochMillis timestamp_ms) {
    return make_command(CommandVerb::Land, std::move(target_id), nlohmann::json::object(), timestamp_ms);
}

Command make_takeoff(std::string target_id, double altitude_m, EpochMillis timestamp_ms) {
    return make_command(CommandVerb::Takeoff, std::move(target_id), nlohmann::json{{"altitude", altitude_m}}, timestamp_ms);
}

Command make_goto(std::string target_id, const Vector3& target, EpochMillis timestamp_ms) {
    return make_command(
        CommandVerb::Goto,
        std::move(target_id),
        nlohmann::json{{"x", target.x}, {"y", target.y}, {"z", target.z}},
        timestamp_ms
    );
}

Command make_rotate(std::string target_id, double yaw_deg, EpochMillis timestamp_ms) {
    return make_command(CommandVerb::Rotate, std::move(target_id), nlohmann::json{{"yaw", yaw_deg}}, timestamp_ms);
}

Command make_move(std::string target_id, const Vector3& delta, EpochMillis timestamp_ms) {
    return make_command(
        CommandVerb::Move,
        std::move(target_id),
        nlohmann::json{{"dx", delta.x}, {"dy", delta.y}, {"dz", delta.z}},
        timestamp_ms
    );
}

nlohmann::json encode_command(const Command& command) {
    return nlohmann::json{
        {"type", "command"},
        {"command", std::string{to_string(command.verb)}},
        {"params", command.params},
        {"targetId", command.target_id},
        {"timestamp", command.timestamp_ms},
    };
}

Command decode_command(const nlohmann::json& envelope) {
    if (!envelope.is_object()) {
        throw ProtocolError("Command envelope is not an object");
    }
    const auto iterator_type = envelope.find("type");
    if (iterator_type == envelope.end() || !iterator_type->is_string() || iterator_type->get<std::string>() != "command") {
        throw ProtocolError("Envelope type is not 'command'");
    }
    const auto iterator_verb = envelope.find("command");
    if (iterator_verb == envelope.end() || !iterator_verb->is_string()) {
        throw ProtocolError("Command envelope is missing 'command'");
    }
    const auto iterator_target = envelope.find("targetId");
    if (iterator_target == envelope.end() || !iterator_target->is_string() || iterator_target->get<std::string>().empty()) {
        throw ProtocolError("Command envelope is missing an explicit 'targetId'");
    }

    const CommandVerb verb = parse_command_verb(iterator_verb->get<std::string>());
    const VerbSignature& signature = signature_for(verb);

    nlohmann::json params = nlohmann::json::object();
    const auto iterator_params = envelope.find("params");
    if (iterator_params != envelope.end() && !iterator_params->is_null()) {
        if (!iterator_params->is_object()) {
            throw ProtocolError("Command 'params' is not an object");
        }
        params = *iterator_params;
    }
    for (std::size_t index = 0; index < signature.param_count; ++index) {
        const std::string key{signature.required_params[index]};
        const auto iterator_param = params.find(key);
        if (iterator_param == params.end() || !iterator_param->is_number()) {
            throw ProtocolError(fmt::format("Command '{}' requires numeric param '{}'", signature.name, key));
        }
    }

    Command command{};
    command.verb = verb;
    command.params = std::move(params);
    command.target_id = iterator_target->get<std::string>();
    const auto iterator_timestamp = envelope.find("timestamp");
    if (iterator_timestamp != envelope.end() && iterator_timestamp->is_number_integer()) {
        // Fractional, string and out-of-range timestamps are ignored.
        if (!iterator_timestamp->is_number_unsigned()
            || iterator_timestamp->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<EpochMillis>::max())) {
            command.timestamp_ms = iterator_timestamp->get<EpochMillis>();
        }
    }
    return command;
}

nlohmann::json parse_envelope(std::string_view text) {
    nlohmann::json envelope = nlohmann::json::parse(text, nullptr, false);
    if (envelope.is_discarded()) {
        throw ProtocolError("Message is not valid JSON");
    }
    if (!envelope.is_object()) {
        throw ProtocolError("Message is not a JSON object");
    }
    const auto iterator_type = envelope.find("type");
    if (iterator_type == envelope.end() || !iterator_type->is_string()) {
        throw ProtocolError("Message has no string 'type'");
    }
    return envelope;
}

std::string make_initial_state_message(const nlohmann::json& snapshot) {
    return nlohmann::json{{"type", "initial_state"}, {"data", snapshot}}.dump();
}

std::string make_state_update_message(const std::optional<std::string>& target_id, const nlohmann::json& data) {
    nlohmann::json message{{"type", "state_update"}, {"data", data}};
    if (target_id.has_value()) {
        message["targetId"] = target_id.value();
    }
    return message.dump();
}

std::string make_command_response_message(CommandVerb verb, std::string_view message) {
    return nlohmann::json{
        {"type", "command_response"},
        {"command", std::string{to_string(verb)}},
        {"message", std::string{message}},
    }.dump();
}

std::string make_swarm_target_message(const std::string& swarm_id, const Vector3& target, EpochMillis timestamp_ms) {
    return nlohmann::json{
        {"type", "swarm_target_update"},
        {"swarmId", swarm_id},
        {"target", {{"x", target.x}, {"y", target.y}, {"z", target.z}, {"timestamp", timestamp_ms}}},
    }.dump();
}

std::string make_error_message(std::string_view message) {
    return nlohmann::json{{"type", "error"}, {"message", std::string{message}}}.dump();
}

}  // namespace swarm_ops
