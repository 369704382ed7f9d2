#pragma once

#include "cumulus/cpi/config.hpp"
#include "cumulus/cpi/core.hpp"
#include <algorithm>
#include <cstdint>

namespace cumulus {
namespace cpi {

/**
 * Bounded wait for create_worker
 *
 * Fixed-interval polling with a hard ceiling:
 * - requested timeout is clamped to ceiling_ms
 * - with a host budget, the wait also ends early enough for the reply to make it
 * - NotFound while polling is eventual consistency, keep polling
 * - terminal states end the wait early
 */
class WaitPolicy {
public:
    struct Config {
        int64_t poll_interval_ms = 2000;   // Delay between describe calls
        int64_t ceiling_ms = 300000;       // Upper bound for any requested timeout
        int64_t host_budget_ms = 0;        // Host call timeout, 0 = unbounded
    };

    WaitPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Effective timeout for a request.
     * Negative requests fall back to the ceiling.
     */
    int64_t effective_timeout_ms(int64_t requested_ms) const {
        int64_t timeout = requested_ms < 0 ? config_.ceiling_ms
                                           : std::min(requested_ms, config_.ceiling_ms);
        if (config_.host_budget_ms > 0) {
            int64_t reserve = std::min(HOST_CALL_RESERVE_MS, config_.host_budget_ms / 2);
            timeout = std::min(timeout, config_.host_budget_ms - reserve);
        }
        return std::max<int64_t>(timeout, 0);
    }

    bool is_budget_exhausted(int64_t elapsed_ms, int64_t timeout_ms) const {
        return elapsed_ms >= timeout_ms;
    }

    // Sleep before the next describe; never past the timeout
    int64_t next_sleep_ms(int64_t elapsed_ms, int64_t timeout_ms) const {
        return std::max<int64_t>(0, std::min(config_.poll_interval_ms, timeout_ms - elapsed_ms));
    }

    // Errors worth another describe; everything else ends the wait
    bool should_keep_polling(ErrorKind kind) const {
        switch (kind) {
            case ErrorKind::not_found:
            case ErrorKind::rate_limited:
                return true;
            default:
                return false;
        }
    }

    static bool is_target_state(WorkerState state) {
        return state == WorkerState::running;
    }

    // States from which the worker never reaches running on its own
    static bool is_dead_end_state(WorkerState state) {
        return state == WorkerState::stopping
            || state == WorkerState::stopped
            || state == WorkerState::terminated;
    }

private:
    Config config_;
};

} // namespace cpi
} // namespace cumulus
