// =================================================================
// include/Maestro/ResourceAllocator.hpp
// =================================================================
// Bounded resource pool with reservations, shrink-and-retry admission
// and timeout-based expiry.

#pragma once

#include "Maestro/ResourceTypes.hpp"
#include "Maestro/CapabilityScorer.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace Maestro {

/**
 * @brief Resource allocator configuration
 */
struct AllocatorConfig {
    double max_memory_mb = 8192.0;               ///< Pool memory capacity
    double max_cpu = 1.0;                        ///< Pool CPU capacity
    double max_tokens_per_second = 1000.0;       ///< Pool token throughput
    int64_t default_timeout_ms = 30000;          ///< Base reservation timeout
    int64_t max_timeout_ms = 300000;
    int64_t min_timeout_ms = 1000;
    double high_utilization_threshold = 0.8;     ///< Logged as warning above this
    double critical_utilization_threshold = 0.9; ///< Logged as error above this
    int max_optimization_attempts = 10;          ///< Shrink rounds before giving up
    TimeSource clock;                            ///< Time source, system clock when empty

    ResourceMap totalCapacity() const {
        return ResourceMap{max_memory_mb, max_cpu, max_tokens_per_second};
    }
};

/**
 * @brief Live reservation held against the pool
 */
struct Reservation {
    std::string id;
    ResourceMap resources;
    std::optional<ResourceMap> observed_usage;   ///< Last usage reported for the route
    Priority priority = Priority::MEDIUM;
    Clock::time_point expires_at;
    uint64_t sequence = 0;                       ///< Creation order, breaks expiry ties
};

/**
 * @brief Reserves slices of a bounded pool on behalf of routes
 *
 * available + sum(allocated) always equals the configured capacity, and
 * every debit is matched by exactly one credit.
 */
class ResourceAllocator {
public:
    explicit ResourceAllocator(const AllocatorConfig& config = AllocatorConfig());

    virtual ~ResourceAllocator() = default;

    /**
     * @brief Reserve resources for a route
     *
     * Bottleneck dimensions are shrunk (memory and cpu by 0.8, tokens by 0.9)
     * and retried until they fit or the attempts run out.
     *
     * @param route Route with at least one cost estimate
     * @return Reservation details
     * @throws AllocationInfeasibleError if nothing fits; the pool is unchanged
     * @throws ValidationError if the route has no cost estimate
     */
    virtual AllocationResult allocateResources(const RouteOptions& route);

    /**
     * @brief Report the current usage of a reservation and of the pool
     * @param allocation Reservation to inspect
     * @return Usage metrics; usage is zero for unknown reservations
     */
    virtual UsageMetrics monitorUsage(const AllocationResult& allocation) const;

    /**
     * @brief Record observed usage for a reservation
     * @return False for unknown reservations
     */
    virtual bool recordUsage(const std::string& reservation_id, const ResourceMap& usage);

    /**
     * @brief Resize a reservation to the observed usage
     *
     * Shrinking always succeeds. Growth is granted only if it fits in the
     * available pool; otherwise the reservation keeps its size.
     *
     * @param metrics Metrics returned by monitorUsage
     * @return Updated reservation details
     * @throws OrchestrationError if the reservation does not exist
     */
    virtual AllocationResult adjustAllocation(const UsageMetrics& metrics);

    /**
     * @brief Return a reservation to the pool
     * @return True if resources were credited; a second release is a no-op
     */
    virtual bool releaseResources(const AllocationResult& allocation);

    /**
     * @brief Return a reservation to the pool by id
     */
    virtual bool releaseResources(const std::string& reservation_id);

    /**
     * @brief Release every reservation expired at the given time
     * @return Released ids in expiry order
     */
    std::vector<std::string> sweepExpiredReservations(Clock::time_point now);

    /**
     * @brief Release every reservation expired now
     */
    std::vector<std::string> sweepExpiredReservations();

    ResourceMap getAvailable() const;
    ResourceMap getAllocatedTotal() const;
    ResourceMap getTotalCapacity() const { return m_config.totalCapacity(); }
    size_t getReservationCount() const;
    bool hasReservation(const std::string& reservation_id) const;
    std::optional<Reservation> getReservation(const std::string& reservation_id) const;

    const AllocatorConfig& getConfig() const { return m_config; }

    static Priority determinePriority(const RouteOptions& route);

private:
    AllocatorConfig m_config;
    ResourceMap m_available;
    std::unordered_map<std::string, Reservation> m_reservations;
    uint64_t m_next_sequence = 0;
    mutable std::mutex m_mutex;

    std::optional<ResourceMap> optimizeNeeds(const ResourceMap& needs) const;
    ResourceMap generateConstraints(const ResourceMap& granted) const;
    int64_t calculateTimeout(const ResourceMap& granted) const;
    void creditLocked(const ResourceMap& resources);
    void logUtilizationLocked() const;
    Clock::time_point now() const;
};

} // namespace Maestro
