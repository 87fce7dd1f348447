// =================================================================
// tests/DegradationControllerTest.cpp
// =================================================================
// Unit tests for DegradationController component.

#include "Maestro/DegradationController.hpp"
#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

using Maestro::DegradationLevel;
using Maestro::Priority;

/**
 * @brief Probe reporting a settable used-memory percentage
 */
class MockMemoryProbe : public Maestro::MemoryProbe {
public:
    explicit MockMemoryProbe(double used_percent = 0.0) : m_used_percent(used_percent) {}

    uint64_t totalMemory() const override { return kTotal; }

    uint64_t freeMemory() const override {
        return static_cast<uint64_t>(kTotal * (100.0 - m_used_percent.load()) / 100.0);
    }

    void setUsedPercent(double percent) { m_used_percent.store(percent); }

private:
    static constexpr uint64_t kTotal = 10000;
    std::atomic<double> m_used_percent;
};

/**
 * @brief Probe whose single readings drift between calls
 */
class DriftingProbe : public Maestro::MemoryProbe {
public:
    uint64_t totalMemory() const override { return 10000 + 1000 * m_reads++; }
    uint64_t freeMemory() const override { return 1000 * m_reads++; }

    Maestro::MemorySnapshot sample() const override {
        Maestro::MemorySnapshot snapshot;
        snapshot.total = 10000;
        snapshot.free = 2500;
        return snapshot;
    }

    int getReads() const { return m_reads.load(); }

private:
    mutable std::atomic<int> m_reads{0};
};

/**
 * @brief Observer recording every event it receives
 */
class RecordingObserver : public Maestro::DegradationObserver {
public:
    void onDegradationChange(const Maestro::DegradationEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        changes.push_back(event);
    }

    void onResourcesReleased(const Maestro::ResourcesReleasedEvent& event) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        releases.push_back(event);
    }

    void onResourceAllocated(const Maestro::ResourceEntry& entry) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        allocated.push_back(entry.id);
    }

    void onResourceReleased(const std::string& id) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        released.push_back(id);
    }

    std::vector<Maestro::DegradationEvent> changes;
    std::vector<Maestro::ResourcesReleasedEvent> releases;
    std::vector<std::string> allocated;
    std::vector<std::string> released;

private:
    std::mutex m_mutex;
};

/**
 * @brief Observer that always throws
 */
class ThrowingObserver : public Maestro::DegradationObserver {
public:
    void onDegradationChange(const Maestro::DegradationEvent&) override {
        throw std::runtime_error("observer failure");
    }
};

class DegradationControllerTest {
private:
    static Maestro::DegradationConfig manualConfig() {
        Maestro::DegradationConfig config;
        config.start_monitoring = false;
        return config;
    }

public:
    DegradationControllerTest() {
        Maestro::Logger::getInstance().setConsoleLogLevel(Maestro::LogLevel::CRITICAL);
        Maestro::Logger::getInstance().setFileLogging(false);
    }

    void testClassification() {
        std::cout << "Testing level classification..." << std::endl;

        using Maestro::DegradationController;
        assert(DegradationController::classify(0.0, 70.0, 90.0) == DegradationLevel::NONE);
        assert(DegradationController::classify(69.9, 70.0, 90.0) == DegradationLevel::NONE);
        assert(DegradationController::classify(70.0, 70.0, 90.0) == DegradationLevel::LIGHT);
        assert(DegradationController::classify(80.0, 70.0, 90.0) == DegradationLevel::MODERATE);
        assert(DegradationController::classify(85.0, 70.0, 90.0) == DegradationLevel::HEAVY);
        assert(DegradationController::classify(90.0, 70.0, 90.0) == DegradationLevel::CRITICAL);
        assert(DegradationController::classify(100.0, 70.0, 90.0) == DegradationLevel::CRITICAL);

        // Critical threshold wins over the offsets
        assert(DegradationController::classify(82.0, 70.0, 80.0) == DegradationLevel::CRITICAL);

        assert(Maestro::degradationLevelToString(DegradationLevel::MODERATE) == "Moderate");

        std::cout << "✓ Classification test passed" << std::endl;
    }

    void testLevelTransitions() {
        std::cout << "Testing level transitions from probe readings..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>();
        Maestro::DegradationController controller(probe, manualConfig());
        auto observer = std::make_shared<RecordingObserver>();
        controller.addObserver(observer);

        assert(!controller.isRunning());
        assert(controller.getCurrentDegradation() == DegradationLevel::NONE);

        probe->setUsedPercent(72.0);
        assert(controller.checkResourceUsage() == DegradationLevel::LIGHT);
        probe->setUsedPercent(82.0);
        assert(controller.checkResourceUsage() == DegradationLevel::MODERATE);
        probe->setUsedPercent(87.0);
        assert(controller.checkResourceUsage() == DegradationLevel::HEAVY);
        probe->setUsedPercent(95.0);
        assert(controller.checkResourceUsage() == DegradationLevel::CRITICAL);
        probe->setUsedPercent(50.0);
        assert(controller.checkResourceUsage() == DegradationLevel::NONE);

        assert(observer->changes.size() == 5);
        assert(observer->changes[0].previous == DegradationLevel::NONE);
        assert(observer->changes[0].level == DegradationLevel::LIGHT);
        assert(observer->changes[3].level == DegradationLevel::CRITICAL);
        assert(observer->changes[4].previous == DegradationLevel::CRITICAL);

        // Same level again emits nothing
        controller.checkResourceUsage();
        assert(observer->changes.size() == 5);

        std::cout << "✓ Level transitions test passed" << std::endl;
    }

    void testReleaseOrdering() {
        std::cout << "Testing release order on a jump to Critical..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationController controller(probe, manualConfig());
        auto observer = std::make_shared<RecordingObserver>();
        controller.addObserver(observer);

        assert(controller.allocateResource("high", {Priority::HIGH, 100.0}));
        assert(controller.allocateResource("low", {Priority::LOW, 100.0}));
        assert(controller.allocateResource("medium", {Priority::MEDIUM, 100.0}));
        assert(controller.allocateResource("low2", {Priority::LOW, 100.0}));
        assert(controller.allocateResource("critical", {Priority::CRITICAL, 100.0}));
        assert(controller.getActiveResources().size() == 5);
        assert(observer->allocated.size() == 5);

        probe->setUsedPercent(95.0);
        controller.checkResourceUsage();

        assert(observer->releases.size() == 1);
        const auto& event = observer->releases[0];
        assert(event.count == 4);
        assert(event.resources.size() == 4);
        assert(event.resources[0] == "low");
        assert(event.resources[1] == "low2");
        assert(event.resources[2] == "medium");
        assert(event.resources[3] == "high");

        auto active = controller.getActiveResources();
        assert(active.size() == 1);
        assert(active[0].id == "critical");

        std::cout << "✓ Release ordering test passed" << std::endl;
    }

    void testLightReleasesOnlyLow() {
        std::cout << "Testing release policy at Light..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationController controller(probe, manualConfig());

        controller.allocateResource("low", {Priority::LOW, 10.0});
        controller.allocateResource("medium", {Priority::MEDIUM, 10.0});

        probe->setUsedPercent(75.0);
        controller.checkResourceUsage();

        auto active = controller.getActiveResources();
        assert(active.size() == 1);
        assert(active[0].id == "medium");

        std::cout << "✓ Light release policy test passed" << std::endl;
    }

    void testAdmissionGating() {
        std::cout << "Testing admission gating..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(95.0);
        Maestro::DegradationController controller(probe, manualConfig());
        controller.checkResourceUsage();
        assert(controller.getCurrentDegradation() == DegradationLevel::CRITICAL);

        assert(!controller.allocateResource("h", {Priority::HIGH, 10.0}));
        assert(!controller.allocateResource("m", {Priority::MEDIUM, 10.0}));
        assert(controller.allocateResource("c", {Priority::CRITICAL, 10.0}));

        probe->setUsedPercent(87.0);
        controller.checkResourceUsage();
        assert(controller.getCurrentDegradation() == DegradationLevel::HEAVY);

        assert(!controller.allocateResource("l", {Priority::LOW, 10.0}));
        assert(!controller.allocateResource("m", {Priority::MEDIUM, 10.0}));
        assert(controller.allocateResource("h", {Priority::HIGH, 10.0}));

        probe->setUsedPercent(82.0);
        controller.checkResourceUsage();
        assert(controller.allocateResource("m", {Priority::MEDIUM, 10.0}));
        assert(controller.allocateResource("l", {Priority::LOW, 10.0}));

        std::cout << "✓ Admission gating test passed" << std::endl;
    }

    void testReleaseResource() {
        std::cout << "Testing explicit resource release..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationController controller(probe, manualConfig());
        auto observer = std::make_shared<RecordingObserver>();
        controller.addObserver(observer);

        controller.releaseResource("unknown");
        assert(observer->released.empty());

        controller.allocateResource("task", {Priority::MEDIUM, 50.0});
        controller.releaseResource("task");
        assert(observer->released.size() == 1);
        assert(observer->released[0] == "task");
        assert(controller.getActiveResources().empty());

        // Released entries cannot be released twice
        controller.releaseResource("task");
        assert(observer->released.size() == 1);

        controller.removeObserver(observer);
        controller.allocateResource("quiet", {Priority::MEDIUM, 50.0});
        assert(observer->allocated.size() == 1);

        std::cout << "✓ Release resource test passed" << std::endl;
    }

    void testObserverFailureIsContained() {
        std::cout << "Testing observer failures..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationController controller(probe, manualConfig());
        auto recorder = std::make_shared<RecordingObserver>();
        controller.addObserver(std::make_shared<ThrowingObserver>());
        controller.addObserver(recorder);

        probe->setUsedPercent(75.0);
        assert(controller.checkResourceUsage() == DegradationLevel::LIGHT);
        assert(recorder->changes.size() == 1);

        std::cout << "✓ Observer failure test passed" << std::endl;
    }

    void testShutdown() {
        std::cout << "Testing shutdown..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationConfig config;
        config.monitoring_interval = std::chrono::milliseconds(20);
        Maestro::DegradationController controller(probe, config);
        auto observer = std::make_shared<RecordingObserver>();
        controller.addObserver(observer);

        assert(controller.isRunning());
        controller.allocateResource("a", {Priority::CRITICAL, 10.0});
        controller.allocateResource("b", {Priority::LOW, 10.0});

        controller.shutdown();
        assert(!controller.isRunning());
        assert(controller.getActiveResources().empty());
        assert(observer->releases.size() == 1);
        assert(observer->releases[0].resources[0] == "b");
        assert(observer->releases[0].resources[1] == "a");

        controller.shutdown();
        assert(observer->releases.size() == 1);

        bool threw = false;
        try {
            Maestro::DegradationController invalid(nullptr, manualConfig());
        } catch (const Maestro::OrchestrationError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ Shutdown test passed" << std::endl;
    }

    void testBackgroundMonitoring() {
        std::cout << "Testing background monitoring thread..." << std::endl;

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationConfig config;
        config.monitoring_interval = std::chrono::milliseconds(20);
        Maestro::DegradationController controller(probe, config);

        probe->setUsedPercent(95.0);

        bool reached = false;
        for (int i = 0; i < 100 && !reached; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            reached = controller.getCurrentDegradation() == DegradationLevel::CRITICAL;
        }
        assert(reached);

        controller.shutdown();

        std::cout << "✓ Background monitoring test passed" << std::endl;
    }

    void testExpiredReservationSweep() {
        std::cout << "Testing reservation sweep on tick..." << std::endl;

        auto now = std::make_shared<Maestro::Clock::time_point>(Maestro::Clock::now());
        Maestro::AllocatorConfig allocator_config;
        allocator_config.clock = [now]() { return *now; };
        auto allocator = std::make_shared<Maestro::ResourceAllocator>(allocator_config);

        Maestro::RouteOptions route;
        route.primary_route.executor = "sweeper";
        route.estimated_costs.push_back({512.0, 0.2, 100.0, 50.0});
        auto reservation = allocator->allocateResources(route);

        auto probe = std::make_shared<MockMemoryProbe>(10.0);
        Maestro::DegradationController controller(probe, manualConfig(), allocator);

        controller.checkResourceUsage();
        assert(allocator->hasReservation(reservation.reservation_id));

        *now += std::chrono::milliseconds(reservation.timeout_ms + 1);
        controller.checkResourceUsage();
        assert(!allocator->hasReservation(reservation.reservation_id));
        assert(allocator->getAvailable().memory == allocator->getTotalCapacity().memory);

        std::cout << "✓ Expired reservation sweep test passed" << std::endl;
    }

    void testMemorySampling() {
        std::cout << "Testing memory percentage from one sample..." << std::endl;

        DriftingProbe drifting;
        assert(drifting.usedMemoryPercent() == 75.0);
        assert(drifting.getReads() == 0);

        MockMemoryProbe mock(40.0);
        assert(mock.usedMemoryPercent() == 40.0);

        Maestro::MemorySnapshot overfull;
        overfull.total = 100;
        overfull.free = 250;
        assert(Maestro::MemoryProbe::usedPercentOf(overfull) == 0.0);
        assert(Maestro::MemoryProbe::usedPercentOf(Maestro::MemorySnapshot()) == 0.0);

        Maestro::SystemMemoryProbe system;
        auto snapshot = system.sample();
        assert(snapshot.free <= snapshot.total);
        double used = system.usedMemoryPercent();
        assert(used >= 0.0 && used <= 100.0);

        std::cout << "✓ Memory sampling test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running DegradationController Tests..." << std::endl;
        std::cout << "======================================" << std::endl;

        testMemorySampling();
        std::cout << std::endl;

        testClassification();
        std::cout << std::endl;

        testLevelTransitions();
        std::cout << std::endl;

        testReleaseOrdering();
        std::cout << std::endl;

        testLightReleasesOnlyLow();
        std::cout << std::endl;

        testAdmissionGating();
        std::cout << std::endl;

        testReleaseResource();
        std::cout << std::endl;

        testObserverFailureIsContained();
        std::cout << std::endl;

        testShutdown();
        std::cout << std::endl;

        testBackgroundMonitoring();
        std::cout << std::endl;

        testExpiredReservationSweep();
        std::cout << std::endl;

        std::cout << "All DegradationController tests passed!" << std::endl;
    }
};

int main() {
    try {
        DegradationControllerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
