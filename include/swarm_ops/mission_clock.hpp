// === Mission Clock ===========================================================
//
// Suspension points of a mission run: timed waits that can be interrupted by
// cancellation. Tests substitute a clock that records waits and returns at
// once.

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

#include "swarm_ops/types.hpp"

namespace swarm_ops {

/** @brief Cooperative cancellation flag shared by a run and its controller. */
class CancellationToken final {
  public:
    void request_cancel() noexcept;
    void reset() noexcept;
    [[nodiscard]] bool is_cancelled() const noexcept;

  private:
    std::atomic<bool> flag_cancelled_{false};
};

/** @brief Source of the timed waits a mission run performs. */
class MissionClock {
  public:
    virtual ~MissionClock() = default;

    /**
     * @brief Wait for @p duration, returning early once @p token is cancelled.
     *
     * @return false when the wait ended because of cancellation.
     */
    virtual bool wait_for(Duration duration, const CancellationToken& token) = 0;

    /** @brief Wake every pending wait so it can observe cancellation. */
    virtual void interrupt() = 0;
};

/** @brief Real-time clock sleeping on a condition variable. */
class SteadyMissionClock final : public MissionClock {
  public:
    bool wait_for(Duration duration, const CancellationToken& token) override;
    void interrupt() override;

  private:
    std::mutex mutex_;
    std::condition_variable condition_;
};

}  // namespace swarm_ops
