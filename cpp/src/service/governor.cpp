#include "portfolio_opt/service/governor.hpp"
#include "portfolio_opt/core/errors.hpp"
#include "portfolio_opt/core/validation.hpp"
#include "portfolio_opt/random/rng.hpp"
#include "portfolio_opt/solvers/multistart.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace portfolio_opt {

JobGovernor::JobGovernor(const Config& config) : config_(config) {
    if (config_.queue_capacity < 0) {
        throw std::invalid_argument("JobGovernor queue_capacity must be non-negative");
    }
    if (config_.default_budget.count() <= 0 || config_.max_budget.count() <= 0) {
        throw std::invalid_argument("JobGovernor budgets must be positive");
    }

    slots_ = config_.slots;
    if (slots_ <= 0) {
        slots_ = static_cast<int>(std::thread::hardware_concurrency());
    }
    slots_ = std::max(1, slots_);

    stats_.slots = slots_;
    stats_.queue_capacity = config_.queue_capacity;

    workers_.reserve(static_cast<size_t>(slots_));
    for (int i = 0; i < slots_; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }

    if (config_.verbose) {
        std::cout << "[governor] started " << slots_ << " workers, queue capacity "
                  << config_.queue_capacity << "\n";
    }
}

JobGovernor::~JobGovernor() {
    shutdown();
}

std::chrono::milliseconds JobGovernor::effective_budget(
    const OptimizationRequest& request,
    std::optional<std::chrono::milliseconds> budget
) const {
    std::chrono::milliseconds chosen = config_.default_budget;
    if (budget) {
        chosen = *budget;
    } else if (request.timeout_ms) {
        chosen = std::chrono::milliseconds(*request.timeout_ms);
    }
    return std::clamp(chosen, std::chrono::milliseconds(1), config_.max_budget);
}

std::future<OptimizationResult> JobGovernor::submit(
    OptimizationRequest request,
    std::optional<std::chrono::milliseconds> budget
) {
    validate_request(request);

    Job job;
    job.seed = seed_or_secure(request.seed);
    job.stop.cancel_flag = &cancel_;
    std::future<OptimizationResult> future = job.promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const int in_flight = stats_.running + static_cast<int>(queue_.size());
        if (stopping_ || in_flight >= slots_ + config_.queue_capacity) {
            ++stats_.rejected;
            if (config_.verbose) {
                std::cerr << "[governor] rejected job (running=" << stats_.running
                          << ", queued=" << queue_.size() << ")\n";
            }
            throw OverloadError(stopping_ ? "Service is shutting down" : "Job queue is full");
        }

        // Deadline is fixed at admission, queue wait counts against it
        job.stop.deadline = Clock::now() + effective_budget(request, budget);
        job.id = next_id_++;
        job.request = std::move(request);
        ++stats_.admitted;
        queue_.push_back(std::move(job));
        stats_.queued = static_cast<int>(queue_.size());
    }
    cv_.notify_one();
    return future;
}

JobGovernor::Stats JobGovernor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void JobGovernor::shutdown() {
    std::deque<Job> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) return;
        stopping_ = true;
        abandoned.swap(queue_);
        stats_.queued = 0;
    }
    cancel_.store(true);
    cv_.notify_all();

    for (auto& job : abandoned) {
        job.promise.set_exception(
            std::make_exception_ptr(OverloadError("Service shut down before the job started"))
        );
    }

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();

    if (config_.verbose) {
        std::cout << "[governor] stopped, " << abandoned.size() << " queued jobs abandoned\n";
    }
}

void JobGovernor::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;

            job = std::move(queue_.front());
            queue_.pop_front();
            // Slot is claimed under the same lock that admission reads
            ++stats_.running;
            stats_.queued = static_cast<int>(queue_.size());
            stats_.peak_running = std::max(stats_.peak_running, stats_.running);
        }

        run_job(job);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --stats_.running;
        }
    }
}

void JobGovernor::run_job(Job& job) {
    if (config_.verbose) {
        std::cout << "[governor] job " << job.id << " started (seed=" << job.seed << ")\n";
    }

    try {
        OptimizationResult result;
        if (config_.n_starts > 1) {
            // One core per slot: starts run sequentially inside a worker
            MultiStartOptimizer::Config multistart;
            multistart.n_starts = config_.n_starts;
            multistart.n_threads = 1;
            MultiStartOptimizer optimizer(config_.swarm, multistart, config_.evaluator);
            result = optimizer.optimize(job.request, job.seed, job.stop);
        } else {
            SwarmOptimizer optimizer(config_.swarm, config_.evaluator);
            result = optimizer.optimize(job.request, job.seed, job.stop);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.completed;
            if (result.termination_reason == TerminationReason::DeadlineExceeded) {
                ++stats_.deadline_exceeded;
            } else if (result.termination_reason == TerminationReason::Cancelled) {
                ++stats_.cancelled;
            }
        }

        if (config_.verbose) {
            std::cout << "[governor] job " << job.id << " finished: "
                      << to_string(result.termination_reason)
                      << " after " << result.iterations << " iterations, feasible="
                      << result.score.feasible << "\n";
        }
        job.promise.set_value(std::move(result));
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.failed;
        }
        std::cerr << "[governor] job " << job.id << " failed: " << e.what() << "\n";
        job.promise.set_exception(std::current_exception());
    }
}

}  // namespace portfolio_opt
