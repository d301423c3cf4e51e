#pragma once

#include "../core/types.hpp"
#include <atomic>
#include <chrono>
#include <optional>

namespace portfolio_opt {

using Clock = std::chrono::steady_clock;

// Cooperative stop signal consulted between swarm iterations.
// Both members are optional; a default-constructed condition never fires.
struct StopCondition {
    std::optional<Clock::time_point> deadline;
    const std::atomic<bool>* cancel_flag{nullptr};

    [[nodiscard]] static StopCondition after(std::chrono::milliseconds budget) {
        StopCondition stop;
        stop.deadline = Clock::now() + budget;
        return stop;
    }

    [[nodiscard]] std::optional<TerminationReason> check() const {
        if (cancel_flag != nullptr && cancel_flag->load(std::memory_order_relaxed)) {
            return TerminationReason::Cancelled;
        }
        if (deadline && Clock::now() >= *deadline) {
            return TerminationReason::DeadlineExceeded;
        }
        return std::nullopt;
    }
};

}  // namespace portfolio_opt
