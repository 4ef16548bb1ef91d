// === Mission Controller ======================================================
//
// Runs mission orchestration on a dedicated worker thread so the relay's
// network loop keeps serving while a mission is in flight. At most one run is
// active. The mission definition is fetched on the worker thread, so a slow
// collaborator never blocks the caller; fetch failures surface through status().

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "swarm_ops/collaborator_client.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/mission_orchestrator.hpp"

namespace swarm_ops {

/** @brief Observable state of the controller for status reporting. */
struct MissionStatus final {
    bool running{};
    MissionPhase phase{MissionPhase::Idle};
    std::string mission_id{};
    std::optional<MissionResult> last_result{};
};

class MissionController final {
  public:
    MissionController(MissionSource& mission_source, MissionOrchestrator& orchestrator);
    ~MissionController();

    MissionController(const MissionController&) = delete;
    MissionController& operator=(const MissionController&) = delete;

    /**
     * @brief Fetch @p mission_id and run it against @p vehicle_ids in the background.
     *
     * The orchestrator is reserved before this returns, so a cancel() issued
     * right afterwards aborts the run even if the worker has not started yet.
     *
     * @throws ReentrancyError when a run is active.
     */
    void start(const std::string& mission_id, std::vector<std::string> vehicle_ids);

    /** @brief Request cancellation of the active run, if any. */
    void cancel();

    /** @brief Cancel any active run and join the worker thread. */
    void shutdown();

    [[nodiscard]] MissionStatus status() const;

  private:
    void join_worker();

    MissionSource& mission_source_;
    MissionOrchestrator& orchestrator_;
    std::atomic<bool> flag_busy_{false};
    mutable std::mutex mutex_;
    std::string str_mission_id_;
    std::optional<MissionResult> optional_last_result_;
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace swarm_ops
