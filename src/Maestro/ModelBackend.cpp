// =================================================================
// src/Maestro/ModelBackend.cpp
// =================================================================
// Simulated model backend.

#include "Maestro/ModelBackend.hpp"
#include "Maestro/Logger.hpp"
#include <stdexcept>
#include <thread>

namespace Maestro {

SimulatedBackend::SimulatedBackend(std::chrono::milliseconds processing_delay)
    : m_processing_delay(processing_delay) {}

void SimulatedBackend::load(const ModelType& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded.insert(model.id);
    m_load_count++;
}

void SimulatedBackend::unload(const ModelType& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loaded.erase(model.id);
    m_unload_count++;
}

std::string SimulatedBackend::process(const ModelType& model, const ProcessingStep& step) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_loaded.count(model.id) == 0) {
            throw std::runtime_error("Model " + model.id + " is not loaded");
        }
        if (m_failing.count(model.id) > 0) {
            throw std::runtime_error("Simulated failure in model " + model.id);
        }
        m_process_count++;
    }

    if (m_processing_delay.count() > 0) {
        std::this_thread::sleep_for(m_processing_delay);
    }

    Logger::getInstance().debug("SimulatedBackend", "Processed " + step.operation + " on " + model.id);
    return step.operation + " result from " + model.name;
}

void SimulatedBackend::setFailing(const std::string& model_id, bool failing) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (failing) {
        m_failing.insert(model_id);
    } else {
        m_failing.erase(model_id);
    }
}

bool SimulatedBackend::isLoaded(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.count(model_id) > 0;
}

size_t SimulatedBackend::getLoadedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded.size();
}

size_t SimulatedBackend::getLoadCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_load_count;
}

size_t SimulatedBackend::getUnloadCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_unload_count;
}

size_t SimulatedBackend::getProcessCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_process_count;
}

} // namespace Maestro
