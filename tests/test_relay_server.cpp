#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "swarm_ops/command_protocol.hpp"
#include "swarm_ops/errors.hpp"
#include "swarm_ops/relay_server.hpp"

using namespace swarm_ops;
using nlohmann::json;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();

using ClientSocket = websocket::stream<tcp::socket>;

HubConfig loopback_hub_config() {
    HubConfig config{};
    config.bind_address = "127.0.0.1";
    config.port = 0;
    return config;
}

bool eventually(const std::function<bool()>& condition) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

/** @brief Relay on an ephemeral loopback port with its own network thread. */
struct RelayHarness final {
    net::io_context io_context{};
    StateHub hub{default_fleet()};
    RestApi api{hub, nullptr};
    RelayServer server{io_context, loopback_hub_config(), hub, api};
    std::thread network_thread{};

    RelayHarness() {
        server.start();
        network_thread = std::thread([this]() { io_context.run(); });
    }

    ~RelayHarness() {
        server.stop();
        io_context.stop();
        network_thread.join();
    }

    RelayHarness(const RelayHarness&) = delete;
    RelayHarness& operator=(const RelayHarness&) = delete;

    [[nodiscard]] tcp::endpoint endpoint() const {
        return tcp::endpoint{net::ip::make_address("127.0.0.1"), server.bound_port()};
    }
};

ClientSocket connect_channel(net::io_context& client_context, const tcp::endpoint& endpoint, const std::string& path) {
    tcp::socket socket{client_context};
    socket.connect(endpoint);
    ClientSocket ws{std::move(socket)};
    ws.handshake("127.0.0.1", path);
    ws.text(true);
    return ws;
}

std::string read_frame(ClientSocket& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    return beast::buffers_to_string(buffer.data());
}
}  // namespace

TEST_CASE("Relay serves observers, the simulator and REST on one port") {
    RelayHarness relay{};
    REQUIRE(relay.server.bound_port() != 0);
    net::io_context client_context;

    ClientSocket observer = connect_channel(client_context, relay.endpoint(), "/ws/client");
    const json initial = json::parse(read_frame(observer));
    REQUIRE(initial.at("type") == "initial_state");
    REQUIRE(initial.at("data").size() == 12);

    ClientSocket simulator = connect_channel(client_context, relay.endpoint(), "/ws/simulator?session=1");
    REQUIRE(eventually([&relay]() { return relay.hub.simulator_connected(); }));

    SECTION("telemetry reaches observers verbatim") {
        const std::string update = R"({"type":"state_update","targetId":"HORNET-5","data":{"status":"armed"}})";
        simulator.write(net::buffer(update));
        REQUIRE(read_frame(observer) == update);
        REQUIRE(relay.hub.snapshot().find("HORNET-5")->status == VehicleStatus::Armed);
    }

    SECTION("commands reach the simulator verbatim") {
        const std::string command = encode_command(make_goto("HORNET-2", Vector3{5.0, 5.0, 20.0}, 9)).dump();
        observer.write(net::buffer(command));
        REQUIRE(read_frame(simulator) == command);
    }

    SECTION("simulator disconnect turns commands into errors") {
        simulator.close(websocket::close_code::normal);
        REQUIRE(eventually([&relay]() { return !relay.hub.simulator_connected(); }));

        observer.write(net::buffer(encode_command(make_land("HORNET-2", 10)).dump()));
        const json error = json::parse(read_frame(observer));
        REQUIRE(error.at("type") == "error");
        REQUIRE(error.at("message") == "simulator not connected");
    }

    SECTION("plain HTTP requests go to the REST API") {
        tcp::socket socket{client_context};
        socket.connect(relay.endpoint());
        http::request<http::string_body> request{http::verb::get, "/api/health", 11};
        request.set(http::field::host, "127.0.0.1");
        request.keep_alive(false);
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        REQUIRE(response.result() == http::status::ok);
        REQUIRE(json::parse(response.body()).at("status") == "healthy");
    }
}

TEST_CASE("Simulator upgrade id names the vehicle of untargeted telemetry") {
    RelayHarness relay{};
    net::io_context client_context;

    ClientSocket observer = connect_channel(client_context, relay.endpoint(), "/ws/client");
    static_cast<void>(read_frame(observer));
    ClientSocket simulator = connect_channel(client_context, relay.endpoint(), "/ws/simulator?session=1&id=HORNET-5");
    REQUIRE(eventually([&relay]() { return relay.hub.simulator_connected(); }));

    const std::string update = R"({"type":"state_update","data":{"battery":64.0,"status":"flying"}})";
    simulator.write(net::buffer(update));
    REQUIRE(read_frame(observer) == update);

    const Vehicle vehicle = *relay.hub.snapshot().find("HORNET-5");
    REQUIRE(vehicle.battery_percent == Approx(64.0));
    REQUIRE(vehicle.status == VehicleStatus::Flying);
}

TEST_CASE("Relay refuses WebSocket upgrades on unknown paths") {
    RelayHarness relay{};
    net::io_context client_context;
    REQUIRE_THROWS_AS(
        connect_channel(client_context, relay.endpoint(), "/ws/elsewhere"),
        boost::system::system_error
    );
    REQUIRE(relay.hub.observer_count() == 0);
}

TEST_CASE("Relay reports an address it cannot bind") {
    net::io_context io_context;
    StateHub hub{};
    RestApi api{hub, nullptr};

    RelayServer first{io_context, loopback_hub_config(), hub, api};
    first.start();

    HubConfig taken = loopback_hub_config();
    taken.port = first.bound_port();
    RelayServer second{io_context, taken, hub, api};
    // SO_REUSEADDR does not permit two listeners on one port.
    REQUIRE_THROWS_AS(second.start(), TransportError);

    HubConfig invalid = loopback_hub_config();
    invalid.bind_address = "not-an-address";
    RelayServer third{io_context, invalid, hub, api};
    REQUIRE_THROWS_AS(third.start(), TransportError);
}
