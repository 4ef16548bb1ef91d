#include <cstdint>
#include <limits>
#include <stdexcept>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/errors.hpp"

using namespace swarm_ops;
using nlohmann::json;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Goto command encodes its target and coordinates") {
    const Command command = make_goto("HORNET-3", Vector3{1.5, -2.0, 40.0}, 1'700'000'000'000);
    const json envelope = encode_command(command);

    REQUIRE(envelope.at("type") == "command");
    REQUIRE(envelope.at("command") == "goto");
    REQUIRE(envelope.at("targetId") == "HORNET-3");
    REQUIRE(envelope.at("timestamp") == 1'700'000'000'000);
    REQUIRE(envelope.at("params").at("x") == 1.5);
    REQUIRE(envelope.at("params").at("y") == -2.0);
    REQUIRE(envelope.at("params").at("z") == 40.0);
}

TEST_CASE("Command factories refuse an empty target") {
    REQUIRE_THROWS_AS(make_arm(""), std::invalid_argument);
    REQUIRE_THROWS_AS(make_takeoff("", 10.0), std::invalid_argument);
}

TEST_CASE("Decoding accepts every verb produced by the factories") {
    const std::vector<Command> commands{
        make_arm("A", 1),
        make_disarm("A", 2),
        make_takeoff("A", 25.0, 3),
        make_land("A", 4),
        make_goto("A", Vector3{1.0, 2.0, 3.0}, 5),
        make_rotate("A", 90.0, 6),
        make_move("A", Vector3{0.5, 0.0, -1.0}, 7),
    };
    for (const Command& command : commands) {
        const Command decoded = decode_command(encode_command(command));
        REQUIRE(decoded.verb == command.verb);
        REQUIRE(decoded.target_id == "A");
        REQUIRE(decoded.params == command.params);
        REQUIRE(decoded.timestamp_ms == command.timestamp_ms);
    }
}

TEST_CASE("Decoding rejects commands without an explicit target") {
    json envelope{{"type", "command"}, {"command", "arm"}, {"params", json::object()}};
    REQUIRE_THROWS_AS(decode_command(envelope), ProtocolError);

    envelope["targetId"] = "";
    REQUIRE_THROWS_AS(decode_command(envelope), ProtocolError);

    envelope["targetId"] = 7;
    REQUIRE_THROWS_AS(decode_command(envelope), ProtocolError);
}

TEST_CASE("Decoding rejects unknown verbs and missing parameters") {
    REQUIRE_THROWS_AS(
        decode_command(json{{"type", "command"}, {"command", "hover"}, {"targetId", "A"}}),
        ProtocolError
    );
    REQUIRE_THROWS_AS(
        decode_command(json{{"type", "command"}, {"command", "takeoff"}, {"targetId", "A"}, {"params", json::object()}}),
        ProtocolError
    );
    REQUIRE_THROWS_AS(
        decode_command(json{
            {"type", "command"},
            {"command", "goto"},
            {"targetId", "A"},
            {"params", {{"x", 1.0}, {"y", "north"}, {"z", 3.0}}},
        }),
        ProtocolError
    );
    REQUIRE_THROWS_AS(
        decode_command(json{{"type", "state_update"}, {"command", "arm"}, {"targetId", "A"}}),
        ProtocolError
    );
}

TEST_CASE("Decoding ignores timestamps that are not integral milliseconds") {
    json envelope = encode_command(make_land("HORNET-1", 1'700'000'000'000));

    envelope["timestamp"] = 1e300;
    REQUIRE(decode_command(envelope).timestamp_ms == 0);
    envelope["timestamp"] = 1700000000000.5;
    REQUIRE(decode_command(envelope).timestamp_ms == 0);
    envelope["timestamp"] = std::numeric_limits<std::uint64_t>::max();
    REQUIRE(decode_command(envelope).timestamp_ms == 0);
    envelope["timestamp"] = "2024-05-01T12:00:00Z";
    REQUIRE(decode_command(envelope).timestamp_ms == 0);
    envelope["timestamp"] = 1'700'000'000'001;
    REQUIRE(decode_command(envelope).timestamp_ms == 1'700'000'000'001);
}

TEST_CASE("Envelope parsing requires a JSON object with a string type") {
    REQUIRE(parse_envelope(R"({"type":"state_update","data":{}})").at("type") == "state_update");
    REQUIRE_THROWS_AS(parse_envelope("not json"), ProtocolError);
    REQUIRE_THROWS_AS(parse_envelope("[1,2,3]"), ProtocolError);
    REQUIRE_THROWS_AS(parse_envelope(R"({"data":{}})"), ProtocolError);
    REQUIRE_THROWS_AS(parse_envelope(R"({"type":3})"), ProtocolError);
}

TEST_CASE("Relay message builders produce the documented shapes") {
    const json error = json::parse(make_error_message("simulator not connected"));
    REQUIRE(error.at("type") == "error");
    REQUIRE(error.at("message") == "simulator not connected");

    const json update = json::parse(make_state_update_message(std::string{"HORNET-1"}, json{{"battery", 80}}));
    REQUIRE(update.at("type") == "state_update");
    REQUIRE(update.at("targetId") == "HORNET-1");
    REQUIRE(update.at("data").at("battery") == 80);

    const json bulk = json::parse(make_state_update_message(std::nullopt, json::object()));
    REQUIRE_FALSE(bulk.contains("targetId"));

    const json response = json::parse(make_command_response_message(CommandVerb::Land, "landing"));
    REQUIRE(response.at("command") == "land");
    REQUIRE(parse_message_type("command_response") == MessageType::CommandResponse);
    REQUIRE(parse_message_type("telemetry") == MessageType::Unknown);

    const json swarm_target = json::parse(make_swarm_target_message("SWARM-2", Vector3{1.0, 2.0, 60.0}, 7));
    REQUIRE(swarm_target.at("type") == "swarm_target_update");
    REQUIRE(swarm_target.at("swarmId") == "SWARM-2");
    REQUIRE(swarm_target.at("target").at("z") == 60.0);
    REQUIRE(swarm_target.at("target").at("timestamp") == 7);
}
