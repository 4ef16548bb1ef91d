#include "swarm_ops/mission_controller.hpp"

#include <stdexcept>

#include "swarm_ops/errors.hpp"

namespace swarm_ops {

MissionController::MissionController(MissionSource& mission_source, MissionOrchestrator& orchestrator)
    : mission_source_(mission_source),
      orchestrator_(orchestrator),
      logger_(get_logger()) {}

MissionController::~MissionController() {
    shutdown();
}

void MissionController::start(const std::string& mission_id, std::vector<std::string> vehicle_ids) {
    if (flag_busy_.exchange(true)) {
        throw ReentrancyError("A mission run is already active");
    }
    try {
        orchestrator_.reserve();
    } catch (const ReentrancyError&) {
        flag_busy_.store(false);
        throw;
    }

    join_worker();
    {
        std::scoped_lock lock(mutex_);
        str_mission_id_ = mission_id;
    }
    logger_->info("Launching mission {} for {} vehicles", mission_id, vehicle_ids.size());

    worker_thread_ = std::thread([this, mission_id, vehicle_ids = std::move(vehicle_ids)]() mutable {
        MissionResult result{};
        std::optional<std::string> optional_fetch_error;
        MissionRunRequest request{};
        try {
            request.mission = mission_source_.fetch_mission(mission_id);
        } catch (const TransportError& exc) {
            optional_fetch_error = exc.what();
        } catch (const ProtocolError& exc) {
            optional_fetch_error = exc.what();
        } catch (const std::invalid_argument& exc) {
            optional_fetch_error = exc.what();
        }

        if (optional_fetch_error) {
            logger_->error("Mission {} could not be fetched: {}", mission_id, *optional_fetch_error);
            orchestrator_.release(*optional_fetch_error);
            result.phase = MissionPhase::Failed;
            result.message = *optional_fetch_error;
        } else {
            request.vehicle_ids = std::move(vehicle_ids);
            result = orchestrator_.run_reserved(request);
        }
        {
            std::scoped_lock lock(mutex_);
            optional_last_result_ = result;
        }
        flag_busy_.store(false);
    });
}

void MissionController::cancel() {
    orchestrator_.cancel();
}

void MissionController::shutdown() {
    orchestrator_.cancel();
    join_worker();
}

MissionStatus MissionController::status() const {
    MissionStatus status{};
    status.running = flag_busy_.load();
    status.phase = orchestrator_.phase();
    std::scoped_lock lock(mutex_);
    status.mission_id = str_mission_id_;
    status.last_result = optional_last_result_;
    return status;
}

void MissionController::join_worker() {
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

}  // namespace swarm_ops
