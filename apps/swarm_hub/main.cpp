#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include "swarm_ops/collaborator_client.hpp"
#include "swarm_ops/command_dispatcher.hpp"
#include "swarm_ops/configuration.hpp"
#include "swarm_ops/formation.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission_clock.hpp"
#include "swarm_ops/mission_controller.hpp"
#include "swarm_ops/mission_orchestrator.hpp"
#include "swarm_ops/observer_view.hpp"
#include "swarm_ops/phase_gate.hpp"
#include "swarm_ops/relay_server.hpp"
#include "swarm_ops/rest_api.hpp"
#include "swarm_ops/state_hub.hpp"
#include "swarm_ops/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr swarm_ops::Duration k_convergence_poll_interval{0.25};

void handle_signal(int) {
    should_terminate.store(true);
}

std::unique_ptr<swarm_ops::PhaseGate> make_phase_gate(
    const swarm_ops::Configuration& configuration,
    swarm_ops::MissionClock& clock,
    const swarm_ops::VehicleStateSource& state_source
) {
    if (configuration.phase_gate == "telemetry") {
        return std::make_unique<swarm_ops::TelemetryConvergencePhaseGate>(
            clock,
            state_source,
            configuration.convergence_tolerance_m,
            k_convergence_poll_interval
        );
    }
    return std::make_unique<swarm_ops::FixedDelayPhaseGate>(clock);
}
}  // namespace

int main() {
    using namespace swarm_ops;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);

        auto logger = get_logger();
        logger->info("swarm_hub {} starting", k_version);

        // Declared first so sessions still held by the hub are torn down before it.
        boost::asio::io_context io_context;

        StateHub hub{configuration.hub.seed_fleet ? default_fleet() : std::vector<Vehicle>{}};

        auto observer_view = std::make_shared<ObserverView>("orchestrator");
        hub.register_observer(observer_view);
        HubCommandDispatcher dispatcher{hub, observer_view};

        HttpCollaboratorClient collaborator{configuration.collaborator};
        SteadyMissionClock clock;
        std::unique_ptr<PhaseGate> phase_gate = make_phase_gate(configuration, clock, *observer_view);

        MissionOrchestrator orchestrator{
            configuration.mission,
            dispatcher,
            collaborator,
            *phase_gate,
            clock,
            *observer_view,
            make_slot_assignment(configuration.slot_assignment),
        };
        MissionController controller{collaborator, orchestrator};
        const RestApi rest_api{hub, &controller};

        RelayServer server{io_context, configuration.hub, hub, rest_api};
        server.start();

        auto work_guard = boost::asio::make_work_guard(io_context);
        std::thread network_thread([&io_context]() {
            io_context.run();
        });

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        logger->info("Shutdown requested");
        controller.shutdown();
        server.stop();
        work_guard.reset();
        io_context.stop();
        network_thread.join();
        hub.unregister_observer(observer_view);
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
