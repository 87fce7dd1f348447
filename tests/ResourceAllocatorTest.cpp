// =================================================================
// tests/ResourceAllocatorTest.cpp
// =================================================================
// Unit tests for ResourceAllocator component.

#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <memory>
#include <atomic>
#include <limits>
#include <thread>
#include <vector>

class ResourceAllocatorTest {
private:
    std::shared_ptr<Maestro::Clock::time_point> m_now;

    Maestro::AllocatorConfig makeConfig() {
        Maestro::AllocatorConfig config;
        auto now = m_now;
        config.clock = [now]() { return *now; };
        return config;
    }

    void advance(std::chrono::milliseconds delta) {
        *m_now += delta;
    }

    static Maestro::RouteOptions makeRoute(const std::string& executor, const Maestro::RouteCost& cost,
                                           double confidence = 0.5) {
        Maestro::RouteOptions route;
        route.primary_route.planner = "planner";
        route.primary_route.executor = executor;
        route.estimated_costs.push_back(cost);
        route.confidence_scores[executor] = confidence;
        return route;
    }

    static bool near(double a, double b, double tolerance = 1e-6) {
        return std::fabs(a - b) < tolerance;
    }

    static void assertConserved(const Maestro::ResourceAllocator& allocator) {
        auto available = allocator.getAvailable();
        auto allocated = allocator.getAllocatedTotal();
        auto total = allocator.getTotalCapacity();
        assert(near(available.memory + allocated.memory, total.memory));
        assert(near(available.cpu + allocated.cpu, total.cpu));
        assert(near(available.tokens + allocated.tokens, total.tokens));
    }

public:
    ResourceAllocatorTest()
        : m_now(std::make_shared<Maestro::Clock::time_point>(Maestro::Clock::now())) {
        Maestro::Logger::getInstance().setConsoleLogLevel(Maestro::LogLevel::CRITICAL);
        Maestro::Logger::getInstance().setFileLogging(false);
    }

    void testAllocateAndRelease() {
        std::cout << "Testing allocation and release..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());
        assertConserved(allocator);

        auto result = allocator.allocateResources(makeRoute("whisper", {1000.0, 0.3, 100.0, 100.0}));
        assert(result.reservation_id == "whisper-1");
        assert(result.allocated.memory == 1000.0);
        assert(allocator.hasReservation(result.reservation_id));
        assert(allocator.getReservationCount() == 1);
        assert(near(allocator.getAvailable().memory, 7192.0));
        assertConserved(allocator);

        auto second = allocator.allocateResources(makeRoute("whisper", {500.0, 0.2, 100.0, 50.0}));
        assert(second.reservation_id == "whisper-2");
        assertConserved(allocator);

        assert(allocator.releaseResources(result));
        assert(!allocator.hasReservation(result.reservation_id));
        assertConserved(allocator);

        // Second release credits nothing
        assert(!allocator.releaseResources(result));
        assert(!allocator.releaseResources("never-existed"));

        assert(allocator.releaseResources(second.reservation_id));
        auto available = allocator.getAvailable();
        assert(near(available.memory, 8192.0));
        assert(near(available.cpu, 1.0));
        assert(near(available.tokens, 1000.0));
        assert(allocator.getReservationCount() == 0);

        std::cout << "✓ Allocate and release test passed" << std::endl;
    }

    void testShrinkToFit() {
        std::cout << "Testing shrink-and-retry admission..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());

        auto result = allocator.allocateResources(makeRoute("big", {10000.0, 0.5, 100.0, 100.0}));
        assert(near(result.allocated.memory, 8000.0));
        assert(near(result.allocated.cpu, 0.5));
        assert(near(result.allocated.tokens, 100.0));
        assertConserved(allocator);

        std::cout << "✓ Shrink to fit test passed" << std::endl;
    }

    void testInfeasibleAllocation() {
        std::cout << "Testing infeasible allocation..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());
        auto before = allocator.getAvailable();

        bool threw = false;
        try {
            allocator.allocateResources(makeRoute("huge", {100000.0, 0.5, 100.0, 100.0}));
        } catch (const Maestro::AllocationInfeasibleError& e) {
            threw = true;
            assert(std::string(e.what()).find("huge") != std::string::npos);
        }
        assert(threw);

        auto after = allocator.getAvailable();
        assert(after.memory == before.memory);
        assert(after.cpu == before.cpu);
        assert(after.tokens == before.tokens);
        assert(allocator.getReservationCount() == 0);

        // Missing cost estimate is a validation failure
        Maestro::RouteOptions empty;
        empty.primary_route.executor = "nothing";
        threw = false;
        try {
            allocator.allocateResources(empty);
        } catch (const Maestro::ValidationError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Infeasible allocation test passed" << std::endl;
    }

    void testPriorityMapping() {
        std::cout << "Testing priority from confidence..." << std::endl;

        Maestro::RouteCost cost{100.0, 0.1, 50.0, 10.0};
        using Maestro::Priority;
        using Maestro::ResourceAllocator;

        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.9)) == Priority::CRITICAL);
        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.7)) == Priority::HIGH);
        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.5)) == Priority::MEDIUM);
        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.3)) == Priority::LOW);
        // Boundaries are exclusive
        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.8)) == Priority::HIGH);
        assert(ResourceAllocator::determinePriority(makeRoute("m", cost, 0.4)) == Priority::LOW);

        Maestro::RouteOptions unscored = makeRoute("m", cost);
        unscored.confidence_scores.clear();
        assert(ResourceAllocator::determinePriority(unscored) == Priority::LOW);

        assert(Maestro::priorityToString(Priority::MEDIUM) == "medium");

        std::cout << "✓ Priority mapping test passed" << std::endl;
    }

    void testConstraintsAndTimeout() {
        std::cout << "Testing constraints and timeout..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());

        auto constrained = allocator.allocateResources(makeRoute("c", {1000.0, 0.9, 100.0, 100.0}));
        assert(constrained.constraints.memory == 1200.0);
        assert(constrained.constraints.cpu == 1.0);
        assert(constrained.constraints.tokens == 110.0);
        allocator.releaseResources(constrained);

        auto timed = allocator.allocateResources(makeRoute("t", {4096.0, 0.5, 100.0, 500.0}));
        assert(timed.timeout_ms == 45000);
        allocator.releaseResources(timed);

        auto config = makeConfig();
        config.max_timeout_ms = 40000;
        Maestro::ResourceAllocator capped(config);
        auto clamped = capped.allocateResources(makeRoute("t", {4096.0, 0.5, 100.0, 500.0}));
        assert(clamped.timeout_ms == 40000);

        std::cout << "✓ Constraints and timeout test passed" << std::endl;
    }

    void testExpirySweepOrder() {
        std::cout << "Testing expiry sweep order..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());
        auto t0 = *m_now;

        Maestro::RouteCost small{100.0, 0.01, 50.0, 10.0};
        Maestro::RouteCost big{4096.0, 0.5, 100.0, 500.0};

        auto r1 = allocator.allocateResources(makeRoute("small", small));
        auto r3 = allocator.allocateResources(makeRoute("big", big));
        advance(std::chrono::seconds(10));
        auto r2 = allocator.allocateResources(makeRoute("small", small));

        // Nothing has expired yet
        assert(allocator.sweepExpiredReservations().empty());

        auto partial = allocator.sweepExpiredReservations(t0 + std::chrono::seconds(35));
        assert(partial.size() == 1);
        assert(partial[0] == r1.reservation_id);
        assertConserved(allocator);

        auto rest = allocator.sweepExpiredReservations(t0 + std::chrono::seconds(100));
        assert(rest.size() == 2);
        assert(rest[0] == r2.reservation_id);
        assert(rest[1] == r3.reservation_id);
        assert(allocator.getReservationCount() == 0);
        assert(near(allocator.getAvailable().memory, 8192.0));

        // Expired reservations are gone, releasing them again is a no-op
        assert(!allocator.releaseResources(r1));

        std::cout << "✓ Expiry sweep order test passed" << std::endl;
    }

    void testMonitorAndAdjust() {
        std::cout << "Testing usage monitoring and adjustment..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());

        auto result = allocator.allocateResources(makeRoute("adj", {1000.0, 0.4, 100.0, 100.0}));

        auto metrics = allocator.monitorUsage(result);
        assert(metrics.reservation_id == result.reservation_id);
        assert(metrics.usage.memory == 1000.0);
        assert(near(metrics.memory_utilization, 1000.0 / 8192.0));
        assert(near(metrics.cpu_utilization, 0.4));
        assert(metrics.remaining_ms == result.timeout_ms);

        assert(allocator.recordUsage(result.reservation_id, {600.0, 0.2, 50.0}));
        assert(!allocator.recordUsage("missing", {1.0, 0.1, 1.0}));

        metrics = allocator.monitorUsage(result);
        assert(metrics.usage.memory == 600.0);

        auto shrunk = allocator.adjustAllocation(metrics);
        assert(shrunk.allocated.memory == 600.0);
        assert(near(allocator.getAvailable().memory, 8192.0 - 600.0));
        assertConserved(allocator);

        // Growth past the pool keeps the current size
        auto hog = allocator.allocateResources(makeRoute("hog", {7000.0, 0.5, 100.0, 100.0}));
        Maestro::UsageMetrics grow = metrics;
        grow.usage = {2000.0, 0.2, 50.0};
        auto unchanged = allocator.adjustAllocation(grow);
        assert(unchanged.allocated.memory == 600.0);
        assertConserved(allocator);

        allocator.releaseResources(hog);
        auto grown = allocator.adjustAllocation(grow);
        assert(grown.allocated.memory == 2000.0);
        assertConserved(allocator);

        Maestro::UsageMetrics unknown;
        unknown.reservation_id = "ghost";
        bool threw = false;
        try {
            allocator.adjustAllocation(unknown);
        } catch (const Maestro::OrchestrationError&) {
            threw = true;
        }
        assert(threw);

        auto missing = allocator.monitorUsage(Maestro::AllocationResult());
        assert(missing.usage.memory == 0.0);

        std::cout << "✓ Monitor and adjust test passed" << std::endl;
    }

    void testRejectsInvalidCost() {
        std::cout << "Testing rejection of negative and non-finite costs..." << std::endl;

        Maestro::ResourceAllocator allocator(makeConfig());
        auto total = allocator.getTotalCapacity();

        std::vector<Maestro::RouteCost> invalid = {
            {-4096.0, 0.1, 0.0, 10.0},
            {100.0, -0.2, 0.0, 10.0},
            {100.0, 0.1, 0.0, -50.0},
            {std::numeric_limits<double>::quiet_NaN(), 0.1, 0.0, 10.0},
            {std::numeric_limits<double>::infinity(), 0.1, 0.0, 10.0}
        };

        for (const auto& cost : invalid) {
            bool threw = false;
            try {
                allocator.allocateResources(makeRoute("broken", cost));
            } catch (const Maestro::ValidationError&) {
                threw = true;
            }
            assert(threw);
            assert(allocator.getReservationCount() == 0);
            assert(near(allocator.getAvailable().memory, total.memory));
            assert(near(allocator.getAvailable().cpu, total.cpu));
            assert(near(allocator.getAvailable().tokens, total.tokens));
        }

        // A later oversized route is still bounded by the configured pool
        auto big = allocator.allocateResources(makeRoute("big", {12000.0, 0.5, 0.0, 10.0}));
        assert(big.allocated.memory <= total.memory);
        assertConserved(allocator);

        std::cout << "✓ Invalid cost rejection test passed" << std::endl;
    }

    void testConcurrentAllocationAndSweep() {
        std::cout << "Testing concurrent allocation with expiry sweep..." << std::endl;

        Maestro::ResourceAllocator allocator{Maestro::AllocatorConfig{}};
        std::atomic<bool> done{false};

        std::thread sweeper([&allocator, &done]() {
            while (!done.load()) {
                allocator.sweepExpiredReservations(Maestro::Clock::now() + std::chrono::hours(1));
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
        });

        std::vector<std::thread> workers;
        for (int t = 0; t < 6; ++t) {
            workers.emplace_back([&allocator, t]() {
                for (int i = 0; i < 200; ++i) {
                    try {
                        auto result = allocator.allocateResources(
                            makeRoute("worker" + std::to_string(t), {700.0, 0.1, 50.0, 40.0}));
                        // The sweeper may already have reclaimed it
                        allocator.releaseResources(result);
                    } catch (const Maestro::AllocationInfeasibleError&) {
                        // Pool momentarily full
                        std::this_thread::yield();
                    }
                }
            });
        }

        for (auto& worker : workers) {
            worker.join();
        }
        done.store(true);
        sweeper.join();

        auto available = allocator.getAvailable();
        assert(available.memory >= -1e-6);
        assert(available.cpu >= -1e-6);
        assert(available.tokens >= -1e-6);
        assertConserved(allocator);
        assert(allocator.getReservationCount() == 0);

        std::cout << "✓ Concurrent allocation and sweep test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ResourceAllocator Tests..." << std::endl;
        std::cout << "==================================" << std::endl;

        testAllocateAndRelease();
        std::cout << std::endl;

        testShrinkToFit();
        std::cout << std::endl;

        testInfeasibleAllocation();
        std::cout << std::endl;

        testRejectsInvalidCost();
        std::cout << std::endl;

        testPriorityMapping();
        std::cout << std::endl;

        testConstraintsAndTimeout();
        std::cout << std::endl;

        testExpirySweepOrder();
        std::cout << std::endl;

        testMonitorAndAdjust();
        std::cout << std::endl;

        testConcurrentAllocationAndSweep();
        std::cout << std::endl;

        std::cout << "All ResourceAllocator tests passed!" << std::endl;
    }
};

int main() {
    try {
        ResourceAllocatorTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
