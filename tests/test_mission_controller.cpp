#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "logging_test_fixture.hpp"
#include "swarm_ops/errors.hpp"
#include "swarm_ops/mission_controller.hpp"

using namespace swarm_ops;
using namespace swarm_ops::test;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    swarm_ops::test::ensure_logger_initialized();
    return true;
}();

Mission single_waypoint_mission() {
    Mission mission{};
    mission.identifier = "m";
    mission.origin.planar = PlanarPoint{0.0, 0.0};
    Waypoint waypoint{};
    waypoint.planar = PlanarPoint{0.0, 0.0};
    mission.trajectories = {Trajectory{{waypoint}}};
    return mission;
}

MissionParameters short_windows() {
    const Duration settle{0.01};
    MissionParameters parameters{};
    parameters.timing = MissionTiming{settle, settle, settle, settle, settle, settle, settle};
    return parameters;
}

/** @brief Mission source whose fetch waits until the test opens it. */
class GatedMissionSource final : public MissionSource {
  public:
    Mission fetch_mission(const std::string& mission_id) override {
        std::unique_lock lock(mutex_);
        flag_entered_ = true;
        condition_.notify_all();
        condition_.wait(lock, [this]() { return flag_open_; });
        Mission mission = single_waypoint_mission();
        mission.identifier = mission_id;
        return mission;
    }

    bool wait_entered() {
        std::unique_lock lock(mutex_);
        return condition_.wait_for(lock, std::chrono::seconds(5), [this]() { return flag_entered_; });
    }

    void open() {
        std::scoped_lock lock(mutex_);
        flag_open_ = true;
        condition_.notify_all();
    }

  private:
    std::mutex mutex_;
    std::condition_variable condition_;
    bool flag_entered_{false};
    bool flag_open_{false};
};

/** @brief Controller driving a real-time clock with short settle windows. */
template <typename Source>
struct ControllerHarness final {
    Source missions{};
    RecordingDispatcher dispatcher{};
    RecordingRepositionService reposition{};
    SteadyMissionClock clock{};
    FixedDelayPhaseGate gate{clock};
    StaticStateSource state{};
    MissionOrchestrator orchestrator{
        short_windows(),
        dispatcher,
        reposition,
        gate,
        clock,
        state,
        std::make_unique<IndexSlotAssignment>(),
    };
    MissionController controller{missions, orchestrator};
};
}  // namespace

TEST_CASE("Cancel right after start aborts the run") {
    for (int attempt = 0; attempt < 20; ++attempt) {
        ControllerHarness<InMemoryMissionSource> harness{};
        harness.missions.add(single_waypoint_mission());

        harness.controller.start("m", {"A"});
        harness.controller.cancel();
        harness.controller.shutdown();

        const MissionStatus status = harness.controller.status();
        REQUIRE_FALSE(status.running);
        REQUIRE(status.last_result.has_value());
        REQUIRE(status.last_result->phase == MissionPhase::Failed);
        REQUIRE(status.last_result->message == "mission cancelled");
        REQUIRE(harness.dispatcher.commands().empty());
    }
}

TEST_CASE("Start returns while the mission is still being fetched") {
    ControllerHarness<GatedMissionSource> harness{};

    harness.controller.start("m", {"A", "B"});
    REQUIRE(harness.missions.wait_entered());
    REQUIRE(harness.controller.status().running);
    REQUIRE(harness.controller.status().mission_id == "m");
    REQUIRE_THROWS_AS(harness.controller.start("m", {"A"}), ReentrancyError);

    harness.controller.cancel();
    harness.missions.open();
    harness.controller.shutdown();

    const MissionStatus status = harness.controller.status();
    REQUIRE(status.last_result->phase == MissionPhase::Failed);
    REQUIRE(status.last_result->message == "mission cancelled");
    REQUIRE(harness.dispatcher.commands().empty());
    REQUIRE(harness.reposition.requests().empty());
}

TEST_CASE("Fetch failure is reported as a failed run") {
    ControllerHarness<InMemoryMissionSource> harness{};

    harness.controller.start("absent", {"A"});
    harness.controller.shutdown();

    const MissionStatus status = harness.controller.status();
    REQUIRE_FALSE(status.running);
    REQUIRE(status.phase == MissionPhase::Failed);
    REQUIRE(status.last_result->phase == MissionPhase::Failed);
    REQUIRE(status.last_result->message == "mission service returned 404");
    REQUIRE_FALSE(harness.orchestrator.is_running());
}

TEST_CASE("Uncancelled run completes in the background") {
    ControllerHarness<InMemoryMissionSource> harness{};
    harness.missions.add(single_waypoint_mission());

    harness.controller.start("m", {"A"});
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (harness.controller.status().running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    const MissionStatus status = harness.controller.status();
    REQUIRE_FALSE(status.running);
    REQUIRE(status.last_result->phase == MissionPhase::Complete);
    // arm, takeoff, formation goto, land
    REQUIRE(status.last_result->commands_dispatched == 4);
}
