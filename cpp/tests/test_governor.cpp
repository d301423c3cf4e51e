#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portfolio_opt/portfolio_opt.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace portfolio_opt;
using namespace portfolio_opt::testing;
using namespace std::chrono_literals;

namespace {

JobGovernor::Config quick_config(int slots, int queue_capacity) {
    JobGovernor::Config config;
    config.slots = slots;
    config.queue_capacity = queue_capacity;
    config.swarm.n_particles = 16;
    config.swarm.max_iterations = 40;
    return config;
}

// Jobs that only stop on their deadline or on shutdown
JobGovernor::Config endless_config(int slots, int queue_capacity) {
    JobGovernor::Config config = quick_config(slots, queue_capacity);
    config.swarm.max_iterations = 100000000;
    config.swarm.stagnation_window = 0;
    return config;
}

void wait_until_running(const JobGovernor& governor, int count) {
    const auto give_up = std::chrono::steady_clock::now() + 10s;
    while (governor.stats().running < count && std::chrono::steady_clock::now() < give_up) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(governor.stats().running == count);
}

}  // namespace

TEST_CASE("Governor runs jobs", "[governor]") {
    SECTION("Result arrives through the future") {
        JobGovernor governor(quick_config(2, 4));
        OptimizationRequest request = make_mixed_request();
        request.seed = 7;

        OptimizationResult result = governor.submit(request).get();
        REQUIRE(result.seed == 7);
        REQUIRE(weight_sum(result.weights) == Catch::Approx(1.0).margin(1e-9));

        // Same seed outside the governor gives the same allocation
        const OptimizationResult direct = SwarmOptimizer(governor.config().swarm).optimize(request, 7);
        REQUIRE(result.weights == direct.weights);

        const auto stats = governor.stats();
        REQUIRE(stats.admitted == 1);
        REQUIRE(stats.completed == 1);
    }

    SECTION("Slot count defaults to the hardware") {
        JobGovernor governor(quick_config(0, 1));
        REQUIRE(governor.slots() >= 1);
        REQUIRE(governor.stats().slots == governor.slots());
    }

    SECTION("Multi-start jobs") {
        JobGovernor::Config config = quick_config(1, 2);
        config.n_starts = 3;
        JobGovernor governor(config);
        OptimizationRequest request = make_mixed_request();
        request.seed = 99;
        const OptimizationResult result = governor.submit(request).get();
        REQUIRE(result.seed == 99);
    }

    SECTION("Invalid requests are rejected before admission") {
        JobGovernor governor(quick_config(1, 1));
        OptimizationRequest request = make_mixed_request();
        request.dimension = 0;
        REQUIRE_THROWS_AS(governor.submit(request), ValidationError);
        REQUIRE(governor.stats().admitted == 0);
    }

    SECTION("Bad configuration") {
        JobGovernor::Config config = quick_config(1, -1);
        REQUIRE_THROWS_AS(JobGovernor(config), std::invalid_argument);
    }
}

TEST_CASE("Governor concurrency limits", "[governor]") {
    SECTION("Never runs more jobs than slots") {
        JobGovernor governor(quick_config(2, 16));
        std::vector<std::future<OptimizationResult>> futures;
        for (int i = 0; i < 12; ++i) {
            OptimizationRequest request = make_mixed_request();
            request.seed = static_cast<uint64_t>(i);
            futures.push_back(governor.submit(request));
        }
        for (auto& f : futures) {
            (void)f.get();
        }
        const auto stats = governor.stats();
        REQUIRE(stats.completed == 12);
        REQUIRE(stats.peak_running >= 1);
        REQUIRE(stats.peak_running <= 2);
        REQUIRE(stats.rejected == 0);
    }

    SECTION("Submission beyond slots plus queue is rejected") {
        JobGovernor governor(endless_config(1, 1));
        auto running = governor.submit(make_mixed_request(), 30s);
        wait_until_running(governor, 1);
        auto queued = governor.submit(make_mixed_request(), 30s);

        REQUIRE_THROWS_AS(governor.submit(make_mixed_request(), 30s), OverloadError);

        auto stats = governor.stats();
        REQUIRE(stats.running == 1);
        REQUIRE(stats.queued == 1);
        REQUIRE(stats.rejected == 1);
        REQUIRE(stats.admitted == 2);

        // Shutdown cancels the running job and abandons the queued one
        governor.shutdown();
        const OptimizationResult cancelled = running.get();
        REQUIRE(cancelled.termination_reason == TerminationReason::Cancelled);
        REQUIRE(weight_sum(cancelled.weights) == Catch::Approx(1.0).margin(1e-9));
        REQUIRE_THROWS_AS(queued.get(), OverloadError);

        stats = governor.stats();
        REQUIRE(stats.cancelled == 1);
        REQUIRE(stats.peak_running == 1);
    }

    SECTION("Queued jobs start in submission order") {
        JobGovernor governor(endless_config(1, 3));
        auto blocker = governor.submit(make_mixed_request(), 200ms);
        wait_until_running(governor, 1);

        // Each job runs until its deadline, which is fixed at admission.
        // In FIFO order every job gets time to iterate and they finish in order.
        std::vector<std::future<OptimizationResult>> queued;
        const std::chrono::milliseconds budgets[] = {600ms, 1000ms, 1400ms};
        for (int i = 0; i < 3; ++i) {
            OptimizationRequest request = make_mixed_request();
            request.seed = static_cast<uint64_t>(100 + i);
            queued.push_back(governor.submit(request, budgets[i]));
        }
        REQUIRE(governor.stats().queued == 3);

        std::vector<int> finish_order;
        const auto give_up = std::chrono::steady_clock::now() + 10s;
        while (finish_order.size() < queued.size() && std::chrono::steady_clock::now() < give_up) {
            for (int i = 0; i < 3; ++i) {
                const bool seen = std::find(finish_order.begin(), finish_order.end(), i) != finish_order.end();
                if (!seen && queued[static_cast<size_t>(i)].wait_for(0ms) == std::future_status::ready) {
                    finish_order.push_back(i);
                }
            }
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(finish_order == std::vector<int>{0, 1, 2});

        REQUIRE(blocker.get().termination_reason == TerminationReason::DeadlineExceeded);
        for (int i = 0; i < 3; ++i) {
            const OptimizationResult result = queued[static_cast<size_t>(i)].get();
            REQUIRE(result.seed == static_cast<uint64_t>(100 + i));
            REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
            REQUIRE(result.iterations > 0);
        }
        REQUIRE(governor.stats().peak_running == 1);
    }

    SECTION("No admission after shutdown") {
        JobGovernor governor(quick_config(1, 4));
        governor.shutdown();
        REQUIRE_THROWS_AS(governor.submit(make_mixed_request()), OverloadError);
        governor.shutdown();   // Idempotent
    }
}

TEST_CASE("Governor deadlines", "[governor]") {
    SECTION("Budget ends a long job with its best so far") {
        JobGovernor governor(endless_config(1, 1));
        const auto start = std::chrono::steady_clock::now();
        const OptimizationResult result = governor.submit(make_mixed_request(), 100ms).get();
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
        REQUIRE(result.iterations < governor.config().swarm.max_iterations);
        REQUIRE(elapsed < 5s);
        REQUIRE(governor.stats().deadline_exceeded == 1);
    }

    SECTION("Request timeout is used when no budget is given") {
        JobGovernor governor(endless_config(1, 1));
        OptimizationRequest request = make_mixed_request();
        request.timeout_ms = 50;
        const OptimizationResult result = governor.submit(request).get();
        REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
    }

    SECTION("Requested budgets are capped") {
        JobGovernor::Config config = endless_config(1, 1);
        config.max_budget = 50ms;
        JobGovernor governor(config);
        const auto start = std::chrono::steady_clock::now();
        const OptimizationResult result = governor.submit(make_mixed_request(), 3600s).get();
        REQUIRE(result.termination_reason == TerminationReason::DeadlineExceeded);
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }
}
