// === Observer View ===========================================================
//
// In-process observer connection. Registered with the hub like any socket
// client, it keeps its own copy of vehicle state from the broadcasts it
// receives, which the mission orchestrator reads for its decisions.

#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "swarm_ops/connection.hpp"
#include "swarm_ops/logging.hpp"
#include "swarm_ops/vehicle_state.hpp"

namespace swarm_ops {

class ObserverView final : public Connection, public VehicleStateSource {
  public:
    explicit ObserverView(std::string label);

    [[nodiscard]] const std::string& label() const noexcept override;
    [[nodiscard]] bool is_open() const noexcept override;
    void send(const std::string& message) override;

    [[nodiscard]] VehicleSnapshot current() const override;
    /** @brief Number of `error` messages the hub has addressed to this view. */
    [[nodiscard]] std::size_t error_count() const noexcept;

  private:
    std::string str_label_;
    mutable std::mutex mutex_;
    VehicleSnapshot struct_snapshot_;
    std::atomic<std::size_t> error_count_{0};
    std::shared_ptr<spdlog::logger> logger_;
};

using ObserverViewPtr = std::shared_ptr<ObserverView>;

}  // namespace swarm_ops
