#include "swarm_ops/mission_clock.hpp"

namespace swarm_ops {

void CancellationToken::request_cancel() noexcept {
    flag_cancelled_.store(true);
}

void CancellationToken::reset() noexcept {
    flag_cancelled_.store(false);
}

bool CancellationToken::is_cancelled() const noexcept {
    return flag_cancelled_.load();
}

bool SteadyMissionClock::wait_for(Duration duration, const CancellationToken& token) {
    if (token.is_cancelled()) {
        return false;
    }
    if (duration.count() <= 0.0) {
        return true;
    }
    const auto deadline = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(duration);
    std::unique_lock lock(mutex_);
    condition_.wait_until(lock, deadline, [&token]() { return token.is_cancelled(); });
    return !token.is_cancelled();
}

void SteadyMissionClock::interrupt() {
    {
        // Serialises with the predicate check so the wake-up cannot be lost.
        std::scoped_lock lock(mutex_);
    }
    condition_.notify_all();
}

}  // namespace swarm_ops
