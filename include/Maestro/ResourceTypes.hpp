// =================================================================
// include/Maestro/ResourceTypes.hpp
// =================================================================
// Resource quantities, routes and priorities shared by the allocator,
// the degradation controller and the orchestrator.

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <cstdint>

namespace Maestro {

/**
 * @brief Reclamation priority, ordered Low < Medium < High < Critical
 */
enum class Priority {
    LOW = 0,
    MEDIUM = 1,     ///< The allocator's "normal"
    HIGH = 2,
    CRITICAL = 3
};

std::string priorityToString(Priority priority);

/**
 * @brief A quantity of each pooled resource
 */
struct ResourceMap {
    double memory = 0.0;     ///< Megabytes
    double cpu = 0.0;        ///< Fraction of total CPU
    double tokens = 0.0;     ///< Tokens per second

    bool fitsWithin(const ResourceMap& other) const {
        return memory <= other.memory && cpu <= other.cpu && tokens <= other.tokens;
    }

    ResourceMap& operator+=(const ResourceMap& other) {
        memory += other.memory;
        cpu += other.cpu;
        tokens += other.tokens;
        return *this;
    }

    ResourceMap& operator-=(const ResourceMap& other) {
        memory -= other.memory;
        cpu -= other.cpu;
        tokens -= other.tokens;
        return *this;
    }
};

/**
 * @brief Estimated cost of executing one route
 */
struct RouteCost {
    double memory = 0.0;             ///< Megabytes
    double cpu = 0.0;                ///< Fraction of total CPU
    double expected_latency = 0.0;   ///< Milliseconds
    double tokens = 0.0;             ///< Tokens per second

    ResourceMap toResourceMap() const {
        return ResourceMap{memory, cpu, tokens};
    }
};

/**
 * @brief Planner/executor pair selected for a task
 */
struct Route {
    std::string planner;
    std::string executor;
};

/**
 * @brief Route plus its cost estimates and model confidences
 */
struct RouteOptions {
    Route primary_route;
    std::vector<RouteCost> estimated_costs;                    ///< First entry drives allocation
    std::unordered_map<std::string, double> confidence_scores; ///< Model id -> confidence in [0,1]
};

/**
 * @brief Outcome of a successful reservation
 */
struct AllocationResult {
    std::string reservation_id;
    ResourceMap allocated;
    ResourceMap constraints;                 ///< Usage ceilings enforced on the route
    Priority priority = Priority::MEDIUM;
    int64_t timeout_ms = 0;
};

/**
 * @brief Observed usage of one reservation and of the whole pool
 */
struct UsageMetrics {
    std::string reservation_id;
    ResourceMap usage;                       ///< What the route is using now
    double memory_utilization = 0.0;         ///< Pool fraction allocated, [0,1]
    double cpu_utilization = 0.0;
    double token_utilization = 0.0;
    int64_t remaining_ms = 0;                ///< Time until the reservation expires
};

} // namespace Maestro
