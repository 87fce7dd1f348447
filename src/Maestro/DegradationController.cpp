// =================================================================
// src/Maestro/DegradationController.cpp
// =================================================================
// Implementation of the degradation state machine and its tick thread.

#include "Maestro/DegradationController.hpp"
#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace Maestro {

std::string degradationLevelToString(DegradationLevel level) {
    switch (level) {
        case DegradationLevel::NONE: return "None";
        case DegradationLevel::LIGHT: return "Light";
        case DegradationLevel::MODERATE: return "Moderate";
        case DegradationLevel::HEAVY: return "Heavy";
        case DegradationLevel::CRITICAL: return "Critical";
        default: return "Unknown";
    }
}

DegradationController::DegradationController(std::shared_ptr<MemoryProbe> probe,
                                             const DegradationConfig& config,
                                             std::shared_ptr<ResourceAllocator> allocator)
    : m_probe(std::move(probe)), m_config(config), m_allocator(std::move(allocator)) {
    if (!m_probe) {
        throw OrchestrationError("DegradationController requires a memory probe");
    }

    if (m_config.start_monitoring) {
        start();
    }
}

DegradationController::~DegradationController() {
    shutdown();
}

void DegradationController::start() {
    if (m_shut_down.load() || m_monitor_thread) {
        return;
    }

    m_stop_monitoring.store(false);
    m_running.store(true);
    m_monitor_thread = std::make_unique<std::thread>(&DegradationController::monitorLoop, this);

    Logger::getInstance().info("DegradationController", "Started memory monitoring",
        "Interval: " + std::to_string(m_config.monitoring_interval.count()) + "ms");
}

DegradationLevel DegradationController::checkResourceUsage() {
    double used_percent = m_probe->usedMemoryPercent();
    DegradationLevel new_level = classify(used_percent, m_config.memory_threshold, m_config.critical_threshold);

    DegradationEvent change;
    std::vector<std::string> released;
    bool changed = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (new_level != m_current_level) {
            released = releaseByPriorityLocked(releasePolicy(new_level));
            change.previous = m_current_level;
            change.level = new_level;
            change.memory_usage = used_percent;
            m_current_level = new_level;
            changed = true;
        }
    }

    if (changed) {
        Logger::getInstance().logDegradationChange(degradationLevelToString(change.previous),
            degradationLevelToString(change.level), used_percent);

        if (!released.empty()) {
            ResourcesReleasedEvent event;
            event.count = released.size();
            event.resources = released;
            notifyResourcesReleased(event);
        }
        notifyDegradationChange(change);
    }

    if (m_allocator) {
        m_allocator->sweepExpiredReservations();
    }

    return new_level;
}

bool DegradationController::allocateResource(const std::string& id, const ResourceRequest& request) {
    ResourceEntry entry;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_current_level == DegradationLevel::CRITICAL && request.priority != Priority::CRITICAL) {
            Logger::getInstance().warning("DegradationController", "Refused resource " + id,
                "Level Critical, priority " + priorityToString(request.priority));
            return false;
        }

        if (m_current_level == DegradationLevel::HEAVY && request.priority < Priority::HIGH) {
            Logger::getInstance().warning("DegradationController", "Refused resource " + id,
                "Level Heavy, priority " + priorityToString(request.priority));
            return false;
        }

        entry.id = id;
        entry.priority = request.priority;
        entry.memory_usage = request.memory_usage;
        entry.active = true;
        entry.sequence = ++m_next_sequence;
        m_resources[id] = entry;
    }

    notifyResourceAllocated(entry);
    return true;
}

void DegradationController::releaseResource(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_resources.find(id);
        if (it == m_resources.end()) {
            return;
        }
        it->second.active = false;
        m_resources.erase(it);
    }

    notifyResourceReleased(id);
}

DegradationLevel DegradationController::getCurrentDegradation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_level;
}

std::vector<ResourceEntry> DegradationController::getActiveResources() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<ResourceEntry> active;
    for (const auto& [id, entry] : m_resources) {
        if (entry.active) {
            active.push_back(entry);
        }
    }

    std::sort(active.begin(), active.end(),
        [](const ResourceEntry& a, const ResourceEntry& b) { return a.sequence < b.sequence; });
    return active;
}

void DegradationController::addObserver(std::shared_ptr<DegradationObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_observers_mutex);
    m_observers.push_back(std::move(observer));
}

void DegradationController::removeObserver(const std::shared_ptr<DegradationObserver>& observer) {
    std::lock_guard<std::mutex> lock(m_observers_mutex);
    m_observers.erase(std::remove(m_observers.begin(), m_observers.end(), observer), m_observers.end());
}

void DegradationController::shutdown() {
    if (m_shut_down.exchange(true)) {
        return;
    }

    if (m_monitor_thread) {
        {
            std::lock_guard<std::mutex> lock(m_wait_mutex);
            m_stop_monitoring.store(true);
        }
        m_wait_cv.notify_all();
        m_monitor_thread->join();
        m_monitor_thread.reset();
        m_running.store(false);
        Logger::getInstance().info("DegradationController", "Stopped memory monitoring");
    }

    std::vector<std::string> released;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        released = releaseByPriorityLocked({Priority::LOW, Priority::MEDIUM, Priority::HIGH, Priority::CRITICAL});
        m_resources.clear();
    }

    if (!released.empty()) {
        ResourcesReleasedEvent event;
        event.count = released.size();
        event.resources = released;
        notifyResourcesReleased(event);
    }
}

DegradationLevel DegradationController::classify(double used_percent, double memory_threshold,
                                                 double critical_threshold) {
    if (used_percent >= critical_threshold) return DegradationLevel::CRITICAL;
    if (used_percent >= memory_threshold + 15.0) return DegradationLevel::HEAVY;
    if (used_percent >= memory_threshold + 10.0) return DegradationLevel::MODERATE;
    if (used_percent >= memory_threshold) return DegradationLevel::LIGHT;
    return DegradationLevel::NONE;
}

std::vector<Priority> DegradationController::releasePolicy(DegradationLevel level) {
    switch (level) {
        case DegradationLevel::LIGHT:
            return {Priority::LOW};
        case DegradationLevel::MODERATE:
        case DegradationLevel::HEAVY:
            return {Priority::LOW, Priority::MEDIUM};
        case DegradationLevel::CRITICAL:
            return {Priority::LOW, Priority::MEDIUM, Priority::HIGH};
        case DegradationLevel::NONE:
        default:
            return {};
    }
}

void DegradationController::monitorLoop() {
    while (!m_stop_monitoring.load()) {
        try {
            checkResourceUsage();
        } catch (const std::exception& e) {
            Logger::getInstance().error("DegradationController",
                "Monitoring tick failed: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(m_wait_mutex);
        m_wait_cv.wait_for(lock, m_config.monitoring_interval, [this] {
            return m_stop_monitoring.load();
        });
    }
}

std::vector<std::string> DegradationController::releaseByPriorityLocked(const std::vector<Priority>& priorities) {
    std::vector<ResourceEntry*> victims;
    for (auto& [id, entry] : m_resources) {
        if (entry.active && std::find(priorities.begin(), priorities.end(), entry.priority) != priorities.end()) {
            victims.push_back(&entry);
        }
    }

    std::sort(victims.begin(), victims.end(),
        [](const ResourceEntry* a, const ResourceEntry* b) {
            if (a->priority != b->priority) {
                return a->priority < b->priority;
            }
            return a->sequence < b->sequence;
        });

    std::vector<std::string> released;
    released.reserve(victims.size());
    for (auto* entry : victims) {
        entry->active = false;
        released.push_back(entry->id);
    }

    for (const auto& id : released) {
        m_resources.erase(id);
    }

    return released;
}

std::vector<std::shared_ptr<DegradationObserver>> DegradationController::snapshotObservers() const {
    std::lock_guard<std::mutex> lock(m_observers_mutex);
    return m_observers;
}

void DegradationController::notifyDegradationChange(const DegradationEvent& event) {
    for (const auto& observer : snapshotObservers()) {
        try {
            observer->onDegradationChange(event);
        } catch (const std::exception& e) {
            Logger::getInstance().error("DegradationController",
                "Observer failed on degradation change: " + std::string(e.what()));
        }
    }
}

void DegradationController::notifyResourcesReleased(const ResourcesReleasedEvent& event) {
    std::stringstream ss;
    for (size_t i = 0; i < event.resources.size(); ++i) {
        ss << (i > 0 ? ", " : "") << event.resources[i];
    }
    Logger::getInstance().info("DegradationController",
        "Released " + std::to_string(event.count) + " resource(s)", ss.str());

    for (const auto& observer : snapshotObservers()) {
        try {
            observer->onResourcesReleased(event);
        } catch (const std::exception& e) {
            Logger::getInstance().error("DegradationController",
                "Observer failed on resource release: " + std::string(e.what()));
        }
    }
}

void DegradationController::notifyResourceAllocated(const ResourceEntry& entry) {
    for (const auto& observer : snapshotObservers()) {
        try {
            observer->onResourceAllocated(entry);
        } catch (const std::exception& e) {
            Logger::getInstance().error("DegradationController",
                "Observer failed on allocation: " + std::string(e.what()));
        }
    }
}

void DegradationController::notifyResourceReleased(const std::string& id) {
    for (const auto& observer : snapshotObservers()) {
        try {
            observer->onResourceReleased(id);
        } catch (const std::exception& e) {
            Logger::getInstance().error("DegradationController",
                "Observer failed on release of " + id + ": " + std::string(e.what()));
        }
    }
}

} // namespace Maestro
