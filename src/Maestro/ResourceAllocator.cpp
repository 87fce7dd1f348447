// =================================================================
// src/Maestro/ResourceAllocator.cpp
// =================================================================
// Implementation of the bounded resource pool.

#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace Maestro {

std::string priorityToString(Priority priority) {
    switch (priority) {
        case Priority::LOW: return "low";
        case Priority::MEDIUM: return "medium";
        case Priority::HIGH: return "high";
        case Priority::CRITICAL: return "critical";
        default: return "unknown";
    }
}

namespace {

std::string describe(const ResourceMap& resources) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2)
       << "memory=" << resources.memory << "MB cpu=" << resources.cpu
       << " tokens=" << resources.tokens;
    return ss.str();
}

double ratio(double value, double capacity) {
    return capacity > 0.0 ? value / capacity : 0.0;
}

// Ceiling that ignores representation error, e.g. 100 * 1.1
double ceilTolerant(double value) {
    return std::ceil(value - 1e-9);
}

bool isValidAmount(double value) {
    return std::isfinite(value) && value >= 0.0;
}

} // namespace

ResourceAllocator::ResourceAllocator(const AllocatorConfig& config)
    : m_config(config), m_available(config.totalCapacity()) {
    Logger::getInstance().info("ResourceAllocator", "Initialized resource pool",
        describe(m_available));
}

AllocationResult ResourceAllocator::allocateResources(const RouteOptions& route) {
    if (route.estimated_costs.empty()) {
        throw ValidationError("Route for executor '" + route.primary_route.executor +
                              "' has no cost estimate");
    }

    ResourceMap needs = route.estimated_costs.front().toResourceMap();
    if (!isValidAmount(needs.memory) || !isValidAmount(needs.cpu) || !isValidAmount(needs.tokens)) {
        throw ValidationError("Route for executor '" + route.primary_route.executor +
                              "' has a negative or non-finite cost " + describe(needs));
    }
    Priority priority = determinePriority(route);

    AllocationResult result;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        ResourceMap granted = needs;
        if (!needs.fitsWithin(m_available)) {
            auto optimized = optimizeNeeds(needs);
            if (!optimized) {
                Logger::getInstance().logAllocation(route.primary_route.executor,
                    needs.memory, needs.cpu, needs.tokens, false);
                throw AllocationInfeasibleError("Cannot allocate " + describe(needs) +
                    " for '" + route.primary_route.executor + "'; available " + describe(m_available));
            }
            granted = *optimized;
        }

        Reservation reservation;
        reservation.sequence = ++m_next_sequence;
        reservation.id = route.primary_route.executor + "-" + std::to_string(reservation.sequence);
        reservation.resources = granted;
        reservation.priority = priority;

        result.reservation_id = reservation.id;
        result.allocated = granted;
        result.constraints = generateConstraints(granted);
        result.priority = priority;
        result.timeout_ms = calculateTimeout(granted);

        reservation.expires_at = now() + std::chrono::milliseconds(result.timeout_ms);

        m_available -= granted;
        m_reservations[reservation.id] = reservation;

        logUtilizationLocked();
    }

    Logger::getInstance().logAllocation(result.reservation_id,
        result.allocated.memory, result.allocated.cpu, result.allocated.tokens, true);

    return result;
}

UsageMetrics ResourceAllocator::monitorUsage(const AllocationResult& allocation) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    UsageMetrics metrics;
    metrics.reservation_id = allocation.reservation_id;

    auto total = m_config.totalCapacity();
    metrics.memory_utilization = ratio(total.memory - m_available.memory, total.memory);
    metrics.cpu_utilization = ratio(total.cpu - m_available.cpu, total.cpu);
    metrics.token_utilization = ratio(total.tokens - m_available.tokens, total.tokens);

    auto it = m_reservations.find(allocation.reservation_id);
    if (it == m_reservations.end()) {
        return metrics;
    }

    const auto& reservation = it->second;
    metrics.usage = reservation.observed_usage.value_or(reservation.resources);
    metrics.remaining_ms = std::max<int64_t>(0,
        std::chrono::duration_cast<std::chrono::milliseconds>(reservation.expires_at - now()).count());

    return metrics;
}

bool ResourceAllocator::recordUsage(const std::string& reservation_id, const ResourceMap& usage) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_reservations.find(reservation_id);
    if (it == m_reservations.end()) {
        return false;
    }

    it->second.observed_usage = usage;
    return true;
}

AllocationResult ResourceAllocator::adjustAllocation(const UsageMetrics& metrics) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_reservations.find(metrics.reservation_id);
    if (it == m_reservations.end()) {
        throw OrchestrationError("Cannot adjust unknown reservation '" + metrics.reservation_id + "'");
    }

    auto& reservation = it->second;
    ResourceMap target{
        std::max(0.0, metrics.usage.memory),
        std::max(0.0, metrics.usage.cpu),
        std::max(0.0, metrics.usage.tokens)
    };

    // Only the growing dimensions draw on the pool
    ResourceMap growth{
        std::max(0.0, target.memory - reservation.resources.memory),
        std::max(0.0, target.cpu - reservation.resources.cpu),
        std::max(0.0, target.tokens - reservation.resources.tokens)
    };

    if (growth.fitsWithin(m_available)) {
        creditLocked(reservation.resources);
        m_available -= target;
        reservation.resources = target;
        Logger::getInstance().debug("ResourceAllocator", "Adjusted reservation " + reservation.id,
            describe(target));
    } else {
        Logger::getInstance().warning("ResourceAllocator",
            "Growth of reservation " + reservation.id + " does not fit, keeping size",
            "Requested " + describe(target) + ", available " + describe(m_available));
    }

    AllocationResult result;
    result.reservation_id = reservation.id;
    result.allocated = reservation.resources;
    result.constraints = generateConstraints(reservation.resources);
    result.priority = reservation.priority;
    result.timeout_ms = calculateTimeout(reservation.resources);
    reservation.expires_at = now() + std::chrono::milliseconds(result.timeout_ms);

    logUtilizationLocked();
    return result;
}

bool ResourceAllocator::releaseResources(const AllocationResult& allocation) {
    return releaseResources(allocation.reservation_id);
}

bool ResourceAllocator::releaseResources(const std::string& reservation_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_reservations.find(reservation_id);
    if (it == m_reservations.end()) {
        Logger::getInstance().debug("ResourceAllocator",
            "Ignoring release of unknown reservation " + reservation_id);
        return false;
    }

    creditLocked(it->second.resources);
    m_reservations.erase(it);

    Logger::getInstance().debug("ResourceAllocator", "Released reservation " + reservation_id,
        "Available: " + describe(m_available));
    return true;
}

std::vector<std::string> ResourceAllocator::sweepExpiredReservations(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<const Reservation*> expired;
    for (const auto& [id, reservation] : m_reservations) {
        if (reservation.expires_at <= now) {
            expired.push_back(&reservation);
        }
    }

    std::sort(expired.begin(), expired.end(),
        [](const Reservation* a, const Reservation* b) {
            if (a->expires_at != b->expires_at) {
                return a->expires_at < b->expires_at;
            }
            return a->sequence < b->sequence;
        });

    std::vector<std::string> released;
    released.reserve(expired.size());
    for (const auto* reservation : expired) {
        released.push_back(reservation->id);
    }

    for (const auto& id : released) {
        auto it = m_reservations.find(id);
        creditLocked(it->second.resources);
        m_reservations.erase(it);
    }

    if (!released.empty()) {
        Logger::getInstance().info("ResourceAllocator",
            "Expired " + std::to_string(released.size()) + " reservation(s)",
            "Available: " + describe(m_available));
    }

    return released;
}

std::vector<std::string> ResourceAllocator::sweepExpiredReservations() {
    return sweepExpiredReservations(now());
}

ResourceMap ResourceAllocator::getAvailable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available;
}

ResourceMap ResourceAllocator::getAllocatedTotal() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    ResourceMap total;
    for (const auto& [id, reservation] : m_reservations) {
        total += reservation.resources;
    }
    return total;
}

size_t ResourceAllocator::getReservationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reservations.size();
}

bool ResourceAllocator::hasReservation(const std::string& reservation_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reservations.count(reservation_id) > 0;
}

std::optional<Reservation> ResourceAllocator::getReservation(const std::string& reservation_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_reservations.find(reservation_id);
    if (it == m_reservations.end()) {
        return std::nullopt;
    }
    return it->second;
}

Priority ResourceAllocator::determinePriority(const RouteOptions& route) {
    double score = 0.0;
    auto it = route.confidence_scores.find(route.primary_route.executor);
    if (it != route.confidence_scores.end()) {
        score = it->second;
    }

    if (score > 0.8) return Priority::CRITICAL;
    if (score > 0.6) return Priority::HIGH;
    if (score > 0.4) return Priority::MEDIUM;
    return Priority::LOW;
}

std::optional<ResourceMap> ResourceAllocator::optimizeNeeds(const ResourceMap& needs) const {
    ResourceMap optimized = needs;

    for (int attempt = 0; attempt < m_config.max_optimization_attempts; ++attempt) {
        if (optimized.memory > m_available.memory) {
            optimized.memory *= 0.8;
        }
        if (optimized.cpu > m_available.cpu) {
            optimized.cpu *= 0.8;
        }
        if (optimized.tokens > m_available.tokens) {
            optimized.tokens *= 0.9;
        }

        if (optimized.fitsWithin(m_available)) {
            Logger::getInstance().info("ResourceAllocator",
                "Shrunk request to fit after " + std::to_string(attempt + 1) + " attempt(s)",
                describe(needs) + " -> " + describe(optimized));
            return optimized;
        }
    }

    return std::nullopt;
}

ResourceMap ResourceAllocator::generateConstraints(const ResourceMap& granted) const {
    return ResourceMap{
        ceilTolerant(granted.memory * 1.2),
        std::min(1.0, granted.cpu * 1.2),
        ceilTolerant(granted.tokens * 1.1)
    };
}

int64_t ResourceAllocator::calculateTimeout(const ResourceMap& granted) const {
    double load = (ratio(granted.memory, m_config.max_memory_mb) +
                   ratio(granted.cpu, m_config.max_cpu) +
                   ratio(granted.tokens, m_config.max_tokens_per_second)) / 3.0;

    double timeout = static_cast<double>(m_config.default_timeout_ms) * (1.0 + load);
    timeout = std::min(std::max(timeout, static_cast<double>(m_config.min_timeout_ms)),
                       static_cast<double>(m_config.max_timeout_ms));
    return static_cast<int64_t>(timeout);
}

void ResourceAllocator::creditLocked(const ResourceMap& resources) {
    m_available += resources;

    // Rounding must never push the pool past its capacity
    auto total = m_config.totalCapacity();
    m_available.memory = std::min(m_available.memory, total.memory);
    m_available.cpu = std::min(m_available.cpu, total.cpu);
    m_available.tokens = std::min(m_available.tokens, total.tokens);
}

void ResourceAllocator::logUtilizationLocked() const {
    auto total = m_config.totalCapacity();
    double utilization = std::max({
        ratio(total.memory - m_available.memory, total.memory),
        ratio(total.cpu - m_available.cpu, total.cpu),
        ratio(total.tokens - m_available.tokens, total.tokens)
    });

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << (utilization * 100.0) << "%";

    if (utilization >= m_config.critical_utilization_threshold) {
        Logger::getInstance().error("ResourceAllocator", "Critical pool utilization", ss.str());
    } else if (utilization >= m_config.high_utilization_threshold) {
        Logger::getInstance().warning("ResourceAllocator", "High pool utilization", ss.str());
    }
}

Clock::time_point ResourceAllocator::now() const {
    return m_config.clock ? m_config.clock() : Clock::now();
}

} // namespace Maestro
