// =================================================================
// src/Maestro/CapabilityScorer.cpp
// =================================================================
// Implementation of the capability scoring feedback loop.

#include "Maestro/CapabilityScorer.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace Maestro {

namespace {

constexpr double kMillisecondsPerDay = 24.0 * 60.0 * 60.0 * 1000.0;
constexpr double kLatencyReferenceMs = 500.0;
constexpr double kSevereLatencyMs = 800.0;
constexpr double kSevereResourceUsage = 0.8;

} // namespace

CapabilityScorer::CapabilityScorer(const ScoringConfig& config)
    : m_config(config) {
    if (m_config.min_samples == 0) {
        m_config.min_samples = 1;
    }
}

void CapabilityScorer::recordSuccess(const std::string& model_id, ModelCapability capability,
                                     const OutcomeMetrics& metrics) {
    PerformanceRecord record;
    record.success = true;
    record.latency_ms = metrics.latency_ms;
    record.resource_usage = std::clamp(metrics.resource_usage, 0.0, 1.0);
    record.timestamp = now();
    recordPerformance(model_id, capability, record);
}

void CapabilityScorer::recordFailure(const std::string& model_id, ModelCapability capability,
                                     const OutcomeMetrics& metrics) {
    PerformanceRecord record;
    record.success = false;
    record.latency_ms = metrics.latency_ms;
    record.resource_usage = std::clamp(metrics.resource_usage, 0.0, 1.0);
    record.timestamp = now();
    recordPerformance(model_id, capability, record);
}

double CapabilityScorer::getCapabilityScore(const std::string& model_id, ModelCapability capability) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto* data = findData(model_id, capability);
    if (!data) {
        return 0.0;
    }

    return computeScore(*data, now());
}

CapabilityScore CapabilityScorer::getModelScores(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(m_mutex);

    CapabilityScore result;
    result.model_id = model_id;

    auto model_it = m_model_data.find(model_id);
    if (model_it == m_model_data.end()) {
        return result;
    }

    auto current = now();
    size_t confident_capabilities = 0;

    for (auto& [capability, data] : model_it->second) {
        double score = computeScore(data, current);
        if (data.records.size() < m_config.min_samples) {
            continue;
        }

        result.capabilities[capability] = score;

        auto metrics = calculatePerformanceMetrics(data.records);
        result.performance_metrics.success_rate += metrics.success_rate;
        result.performance_metrics.latency_ms += metrics.latency_ms;
        result.performance_metrics.resource_usage += metrics.resource_usage;
        confident_capabilities++;
    }

    if (confident_capabilities > 0) {
        result.performance_metrics.success_rate /= confident_capabilities;
        result.performance_metrics.latency_ms /= confident_capabilities;
        result.performance_metrics.resource_usage /= confident_capabilities;
    }

    return result;
}

size_t CapabilityScorer::getSampleCount(const std::string& model_id, ModelCapability capability) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto* data = findData(model_id, capability);
    if (!data) {
        return 0;
    }

    pruneOldRecords(data->records, now());
    return data->records.size();
}

void CapabilityScorer::clear(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_model_data.erase(model_id);
    Logger::getInstance().debug("CapabilityScorer", "Cleared history for model " + model_id);
}

void CapabilityScorer::recordPerformance(const std::string& model_id, ModelCapability capability,
                                         const PerformanceRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto& data = m_model_data[model_id][capability];
    data.records.push_back(record);
    data.last_updated = record.timestamp;

    double score = computeScore(data, record.timestamp);

    Logger::getInstance().debug("CapabilityScorer",
        "Recorded " + std::string(record.success ? "success" : "failure") + " for " + model_id +
        "/" + ModelCapabilityUtils::capabilityToString(capability),
        "Samples: " + std::to_string(data.records.size()) + ", Score: " + std::to_string(score));
}

ModelCapabilityData* CapabilityScorer::findData(const std::string& model_id, ModelCapability capability) {
    auto model_it = m_model_data.find(model_id);
    if (model_it == m_model_data.end()) {
        return nullptr;
    }

    auto cap_it = model_it->second.find(capability);
    if (cap_it == model_it->second.end()) {
        return nullptr;
    }

    return &cap_it->second;
}

double CapabilityScorer::computeScore(ModelCapabilityData& data, Clock::time_point now) {
    pruneOldRecords(data.records, now);

    if (data.records.size() < m_config.min_samples) {
        data.aggregate_score = 0.0;
        return 0.0;
    }

    auto metrics = calculatePerformanceMetrics(data.records);
    double raw = calculateAggregateScore(metrics);

    // Decay runs from the latest record, not from the previous read
    double elapsed_ms = static_cast<double>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now - data.last_updated).count());
    double days = std::max(0.0, elapsed_ms / kMillisecondsPerDay);

    data.aggregate_score = std::clamp(raw * std::pow(m_config.decay_factor, days), 0.0, 1.0);
    return data.aggregate_score;
}

PerformanceMetrics CapabilityScorer::calculatePerformanceMetrics(const std::vector<PerformanceRecord>& records) const {
    PerformanceMetrics metrics;
    if (records.empty()) {
        return metrics;
    }

    size_t window = std::min(records.size(), m_config.min_samples);
    auto first = records.end() - static_cast<std::ptrdiff_t>(window);

    size_t successes = 0;
    double latency_sum = 0.0;
    double usage_sum = 0.0;

    for (auto it = first; it != records.end(); ++it) {
        if (it->success) {
            successes++;
        }
        latency_sum += it->latency_ms;
        usage_sum += it->resource_usage;
    }

    metrics.success_rate = static_cast<double>(successes) / window;
    metrics.latency_ms = latency_sum / window;
    metrics.resource_usage = usage_sum / window;
    return metrics;
}

double CapabilityScorer::calculateAggregateScore(const PerformanceMetrics& metrics) const {
    const auto& weights = m_config.weight_factors;

    // Superlinear penalty past the reference latency, quadratic on resources
    double latency_score = std::max(0.0, 1.0 - std::pow(metrics.latency_ms / kLatencyReferenceMs, 1.5));
    double resource_score = std::max(0.0, 1.0 - std::pow(metrics.resource_usage, 2.0));

    double score =
        metrics.success_rate * weights.success_rate +
        latency_score * weights.latency +
        resource_score * weights.resource_usage;

    if (metrics.latency_ms > kSevereLatencyMs || metrics.resource_usage > kSevereResourceUsage) {
        score *= 0.5;
    }

    return score;
}

void CapabilityScorer::pruneOldRecords(std::vector<PerformanceRecord>& records, Clock::time_point now) const {
    auto cutoff = now - m_config.time_window;
    records.erase(
        std::remove_if(records.begin(), records.end(),
            [cutoff](const PerformanceRecord& record) { return record.timestamp < cutoff; }),
        records.end());
}

Clock::time_point CapabilityScorer::now() const {
    return m_config.clock ? m_config.clock() : Clock::now();
}

} // namespace Maestro
