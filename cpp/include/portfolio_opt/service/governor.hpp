#pragma once

#include "../core/types.hpp"
#include "../constraints/evaluator.hpp"
#include "../solvers/stop_condition.hpp"
#include "../solvers/swarm.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace portfolio_opt {

/**
 * Bounded worker pool in front of the swarm optimizer.
 *
 * A fixed number of worker threads (slots) pull jobs from a FIFO queue of
 * fixed capacity. Admission counts running and queued jobs together under
 * the queue lock, so at most `slots` jobs ever run and a submission beyond
 * `slots + queue_capacity` is rejected with OverloadError before any work
 * is done.
 *
 * Every job gets its own swarm and an absolute deadline fixed at admission.
 * The swarm checks the deadline between iterations and the job completes
 * with its best-so-far candidate once it passes.
 */
class JobGovernor {
public:
    struct Config {
        int slots{0};                                           // 0: hardware concurrency
        int queue_capacity{64};                                 // Jobs allowed to wait for a slot
        std::chrono::milliseconds default_budget{10000};        // Per-job budget when none is given
        std::chrono::milliseconds max_budget{60000};            // Ceiling on any requested budget
        SwarmOptimizer::Config swarm;
        ConstraintEvaluator::Config evaluator;
        int n_starts{1};                                        // Independent swarms per job
        bool verbose{false};
    };

    struct Stats {
        int slots{0};
        int queue_capacity{0};
        int running{0};
        int queued{0};
        int peak_running{0};
        uint64_t admitted{0};
        uint64_t rejected{0};
        uint64_t completed{0};
        uint64_t deadline_exceeded{0};
        uint64_t cancelled{0};
        uint64_t failed{0};
    };

    explicit JobGovernor() : JobGovernor(Config{}) {}
    explicit JobGovernor(const Config& config);
    ~JobGovernor();

    JobGovernor(const JobGovernor&) = delete;
    JobGovernor& operator=(const JobGovernor&) = delete;

    // Validate and admit a request. Throws ValidationError for a bad request
    // and OverloadError when the pool and queue are full or shutting down.
    // The budget overrides request.timeout_ms, both are capped at max_budget.
    [[nodiscard]] std::future<OptimizationResult> submit(
        OptimizationRequest request,
        std::optional<std::chrono::milliseconds> budget = std::nullopt
    );

    [[nodiscard]] Stats stats() const;

    // Stop admission, cancel running jobs, fail queued ones, join workers.
    // Idempotent.
    void shutdown();

    [[nodiscard]] int slots() const { return slots_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Job {
        uint64_t id{0};
        OptimizationRequest request;
        uint64_t seed{0};
        StopCondition stop;
        std::promise<OptimizationResult> promise;
    };

    Config config_;
    int slots_{1};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Job> queue_;
    std::vector<std::thread> workers_;
    std::atomic<bool> cancel_{false};
    bool stopping_{false};
    uint64_t next_id_{0};

    // Guarded by mutex_
    Stats stats_;

    void worker_loop();
    void run_job(Job& job);
    [[nodiscard]] std::chrono::milliseconds effective_budget(
        const OptimizationRequest& request,
        std::optional<std::chrono::milliseconds> budget
    ) const;
};

}  // namespace portfolio_opt
