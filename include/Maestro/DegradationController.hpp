// =================================================================
// include/Maestro/DegradationController.hpp
// =================================================================
// Memory-pressure state machine with priority-based reclamation.

#pragma once

#include "Maestro/ResourceTypes.hpp"
#include "Maestro/MemoryProbe.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace Maestro {

class ResourceAllocator;

/**
 * @brief Ordered degradation levels
 */
enum class DegradationLevel {
    NONE = 0,
    LIGHT = 1,      ///< Low priority entries released
    MODERATE = 2,   ///< Low and medium released
    HEAVY = 3,      ///< Low and medium released, new allocations need High
    CRITICAL = 4    ///< Everything but Critical released and refused
};

std::string degradationLevelToString(DegradationLevel level);

/**
 * @brief Degradation controller configuration
 */
struct DegradationConfig {
    double memory_threshold = 70.0;                        ///< Percent used that enters Light
    double critical_threshold = 90.0;                      ///< Percent used that enters Critical
    std::chrono::milliseconds monitoring_interval{1000};   ///< Tick period
    bool start_monitoring = true;                          ///< Start the tick thread on construction
};

/**
 * @brief Resource registered with the controller
 */
struct ResourceEntry {
    std::string id;
    Priority priority = Priority::MEDIUM;
    double memory_usage = 0.0;
    bool active = false;
    uint64_t sequence = 0;
};

/**
 * @brief Admission request for allocateResource
 */
struct ResourceRequest {
    Priority priority = Priority::MEDIUM;
    double memory_usage = 0.0;
};

struct DegradationEvent {
    DegradationLevel previous = DegradationLevel::NONE;
    DegradationLevel level = DegradationLevel::NONE;
    double memory_usage = 0.0;       ///< Used memory percent that triggered the change
};

struct ResourcesReleasedEvent {
    size_t count = 0;
    std::vector<std::string> resources;   ///< Released in ascending priority order
};

/**
 * @brief Listener for controller events
 *
 * Callbacks run on the thread that caused the event, never under the
 * controller's lock, so they may call back into the controller.
 */
class DegradationObserver {
public:
    virtual ~DegradationObserver() = default;

    virtual void onDegradationChange(const DegradationEvent& event) {}
    virtual void onResourcesReleased(const ResourcesReleasedEvent& event) {}
    virtual void onResourceAllocated(const ResourceEntry& entry) {}
    virtual void onResourceReleased(const std::string& id) {}
};

/**
 * @brief Samples memory pressure and reclaims resources by priority
 *
 * A background thread ticks every monitoring_interval: it samples the
 * probe, applies the release policy on a level change and sweeps expired
 * allocator reservations.
 */
class DegradationController {
public:
    /**
     * @brief Constructor
     * @param probe Memory source sampled on each tick
     * @param config Thresholds and tick interval
     * @param allocator Allocator whose expired reservations are swept on each tick, may be null
     */
    DegradationController(std::shared_ptr<MemoryProbe> probe,
                          const DegradationConfig& config = DegradationConfig(),
                          std::shared_ptr<ResourceAllocator> allocator = nullptr);

    /**
     * @brief Destructor, runs shutdown()
     */
    virtual ~DegradationController();

    /**
     * @brief Start the tick thread if it is not running
     */
    void start();

    /**
     * @brief Run one tick synchronously
     * @return Level after the tick
     */
    DegradationLevel checkResourceUsage();

    /**
     * @brief Admit a resource under the current level
     * @param id Resource identifier, replaces an existing entry with the same id
     * @param request Priority and memory usage
     * @return False at Critical for non-Critical priority and at Heavy below High
     */
    bool allocateResource(const std::string& id, const ResourceRequest& request);

    /**
     * @brief Remove a resource; unknown ids are ignored
     */
    void releaseResource(const std::string& id);

    DegradationLevel getCurrentDegradation() const;
    std::vector<ResourceEntry> getActiveResources() const;
    bool isRunning() const { return m_running.load(); }

    void addObserver(std::shared_ptr<DegradationObserver> observer);
    void removeObserver(const std::shared_ptr<DegradationObserver>& observer);

    /**
     * @brief Stop the tick thread and release every resource; idempotent
     */
    void shutdown();

    /**
     * @brief Map a used-memory percentage to a level
     */
    static DegradationLevel classify(double used_percent, double memory_threshold, double critical_threshold);

    /**
     * @brief Priorities released when entering a level, ascending
     */
    static std::vector<Priority> releasePolicy(DegradationLevel level);

private:
    std::shared_ptr<MemoryProbe> m_probe;
    DegradationConfig m_config;
    std::shared_ptr<ResourceAllocator> m_allocator;

    DegradationLevel m_current_level = DegradationLevel::NONE;
    std::unordered_map<std::string, ResourceEntry> m_resources;
    uint64_t m_next_sequence = 0;
    mutable std::mutex m_mutex;

    std::vector<std::shared_ptr<DegradationObserver>> m_observers;
    mutable std::mutex m_observers_mutex;

    std::unique_ptr<std::thread> m_monitor_thread;
    std::atomic<bool> m_stop_monitoring{false};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_shut_down{false};
    std::mutex m_wait_mutex;
    std::condition_variable m_wait_cv;

    void monitorLoop();

    /**
     * @brief Remove active entries with the given priorities; caller holds the lock
     */
    std::vector<std::string> releaseByPriorityLocked(const std::vector<Priority>& priorities);

    std::vector<std::shared_ptr<DegradationObserver>> snapshotObservers() const;
    void notifyDegradationChange(const DegradationEvent& event);
    void notifyResourcesReleased(const ResourcesReleasedEvent& event);
    void notifyResourceAllocated(const ResourceEntry& entry);
    void notifyResourceReleased(const std::string& id);
};

} // namespace Maestro
