// === Command Protocol ========================================================
//
// Typed command envelope exchanged between command issuers, the hub and the
// simulator, plus builders for the other relay message types. Every command
// names its target vehicle explicitly at construction time.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "swarm_ops/types.hpp"

namespace swarm_ops {

/** @brief Verbs understood by the simulator. */
enum class CommandVerb {
    Arm,
    Disarm,
    Takeoff,
    Land,
    Goto,
    Rotate,
    Move
};

/** @brief Message kinds carried on the relay channels. */
enum class MessageType {
    InitialState,
    StateUpdate,
    Command,
    CommandResponse,
    Error,
    Unknown
};

[[nodiscard]] std::string_view to_string(CommandVerb verb) noexcept;

/** @throws ProtocolError for an unknown verb name. */
[[nodiscard]] CommandVerb parse_command_verb(std::string_view text);

[[nodiscard]] std::string_view to_string(MessageType type) noexcept;
[[nodiscard]] MessageType parse_message_type(std::string_view text) noexcept;

/**
 * @brief A single addressed command.
 *
 * `params` holds exactly the members the verb requires. Use the factory
 * functions below; they stamp the wall-clock time unless one is supplied.
 */
struct Command final {
    CommandVerb verb{CommandVerb::Arm};
    nlohmann::json params = nlohmann::json::object();
    std::string target_id{};
    EpochMillis timestamp_ms{};
};

[[nodiscard]] Command make_arm(std::string target_id, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_disarm(std::string target_id, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_land(std::string target_id, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_takeoff(std::string target_id, double altitude_m, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_goto(std::string target_id, const Vector3& target, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_rotate(std::string target_id, double yaw_deg, EpochMillis timestamp_ms = now_epoch_millis());
[[nodiscard]] Command make_move(std::string target_id, const Vector3& delta, EpochMillis timestamp_ms = now_epoch_millis());

/** @brief Serialize @p command to its wire envelope. */
[[nodiscard]] nlohmann::json encode_command(const Command& command);

/**
 * @brief Validate and decode a command envelope.
 *
 * @throws ProtocolError on a wrong `type`, an unknown verb, a missing or empty
 *         `targetId`, or missing/non-numeric required params. A timestamp
 *         that is not an in-range integer is ignored and left at zero.
 */
[[nodiscard]] Command decode_command(const nlohmann::json& envelope);

/**
 * @brief Parse raw text into a JSON object carrying a string `type`.
 *
 * @throws ProtocolError when the text is not such an object.
 */
[[nodiscard]] nlohmann::json parse_envelope(std::string_view text);

[[nodiscard]] std::string make_initial_state_message(const nlohmann::json& snapshot);
[[nodiscard]] std::string make_state_update_message(const std::optional<std::string>& target_id, const nlohmann::json& data);
[[nodiscard]] std::string make_command_response_message(CommandVerb verb, std::string_view message);
/** @brief Hub notice that a swarm was sent to a new target point. */
[[nodiscard]] std::string make_swarm_target_message(const std::string& swarm_id, const Vector3& target, EpochMillis timestamp_ms);
[[nodiscard]] std::string make_error_message(std::string_view message);

}  // namespace swarm_ops
