#include <chrono>
#include <thread>

#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "logging_test_fixture.hpp"
#include "swarm_ops/phase_gate.hpp"

using namespace swarm_ops;
using swarm_ops::test::ManualMissionClock;
using swarm_ops::test::StaticStateSource;
using nlohmann::json;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();

PhaseExpectation takeoff_expectation() {
    PhaseExpectation expectation{};
    expectation.phase = MissionPhase::TakeoffAll;
    expectation.vehicle_ids = {"A", "B"};
    expectation.accepted_statuses = {VehicleStatus::Flying};
    expectation.settle_window = Duration{5.0};
    return expectation;
}
}  // namespace

TEST_CASE("Fixed delay gate waits out the settle window") {
    ManualMissionClock clock{};
    FixedDelayPhaseGate gate{clock};
    CancellationToken token{};

    REQUIRE(gate.await_completion(takeoff_expectation(), token));
    REQUIRE(clock.waits().size() == 1);
    REQUIRE(clock.waits().front().count() == Approx(5.0));

    token.request_cancel();
    REQUIRE_FALSE(gate.await_completion(takeoff_expectation(), token));
}

TEST_CASE("Telemetry gate returns as soon as state converges") {
    ManualMissionClock clock{};
    StaticStateSource source{};
    source.snapshot().apply_state_update(
        std::nullopt,
        json{{"A", {{"status", "flying"}}}, {"B", {{"status", "armed"}}}}
    );
    TelemetryConvergencePhaseGate gate{clock, source, 2.0, Duration{0.5}};
    CancellationToken token{};

    // B lifts off after the second poll.
    clock.set_on_wait([&source](std::size_t wait_count) {
        if (wait_count == 2) {
            source.snapshot().apply_state_update(std::string{"B"}, json{{"status", "flying"}});
        }
    });

    REQUIRE(gate.await_completion(takeoff_expectation(), token));
    REQUIRE(clock.waits().size() == 2);
}

TEST_CASE("Telemetry gate gives up after the settle window without failing") {
    ManualMissionClock clock{};
    StaticStateSource source{};
    TelemetryConvergencePhaseGate gate{clock, source, 2.0, Duration{1.0}};
    CancellationToken token{};

    REQUIRE(gate.await_completion(takeoff_expectation(), token));
    REQUIRE(clock.waits().size() == 5);
}

TEST_CASE("Telemetry gate checks positions against goto targets") {
    ManualMissionClock clock{};
    StaticStateSource source{};
    TelemetryConvergencePhaseGate gate{clock, source, 2.0, Duration{1.0}};

    PhaseExpectation expectation{};
    expectation.phase = MissionPhase::AssembleFormation;
    expectation.vehicle_ids = {"A"};
    expectation.targets = {Vector3{30.0, 0.0, 100.0}};

    source.snapshot().merge("A", json{{"position", {{"x", 29.0}, {"y", 0.5}, {"z", 100.0}}}});
    REQUIRE(gate.has_converged(expectation, source.current()));

    source.snapshot().merge("A", json{{"position", {{"x", 20.0}, {"y", 0.0}, {"z", 100.0}}}});
    REQUIRE_FALSE(gate.has_converged(expectation, source.current()));
}

TEST_CASE("Steady clock wakes early on cancellation") {
    SteadyMissionClock clock{};
    CancellationToken token{};

    std::thread canceller([&clock, &token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.request_cancel();
        clock.interrupt();
    });

    const auto started = SteadyClock::now();
    const bool completed = clock.wait_for(Duration{10.0}, token);
    const auto elapsed = SteadyClock::now() - started;
    canceller.join();

    REQUIRE_FALSE(completed);
    REQUIRE(elapsed < std::chrono::seconds(5));
    REQUIRE(clock.wait_for(Duration{0.0}, CancellationToken{}));
}
