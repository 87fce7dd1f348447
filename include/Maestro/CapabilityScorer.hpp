// =================================================================
// include/Maestro/CapabilityScorer.hpp
// =================================================================
// Historical performance tracking and decayed capability scores.

#pragma once

#include "Maestro/ModelCapabilities.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <functional>
#include <mutex>

namespace Maestro {

using Clock = std::chrono::system_clock;
using TimeSource = std::function<Clock::time_point()>;

/**
 * @brief Outcome of one model invocation for one capability
 */
struct PerformanceRecord {
    bool success = false;                  ///< Whether the invocation succeeded
    double latency_ms = 0.0;               ///< Observed latency
    double resource_usage = 0.0;           ///< Fraction of budget used, in [0,1]
    Clock::time_point timestamp;           ///< When the outcome was recorded
};

/**
 * @brief Score state for one (model, capability) pair
 */
struct ModelCapabilityData {
    std::vector<PerformanceRecord> records;  ///< Ordered oldest first
    double aggregate_score = 0.0;            ///< Last computed score
    Clock::time_point last_updated;          ///< Time of the latest record
};

/**
 * @brief Averaged metrics over the most recent samples
 */
struct PerformanceMetrics {
    double success_rate = 0.0;
    double latency_ms = 0.0;
    double resource_usage = 0.0;
};

/**
 * @brief Per-model score summary
 */
struct CapabilityScore {
    std::string model_id;
    std::unordered_map<ModelCapability, double> capabilities;
    PerformanceMetrics performance_metrics;
};

/**
 * @brief Metrics reported with a success or failure
 */
struct OutcomeMetrics {
    double latency_ms = 0.0;
    double resource_usage = 0.0;
};

/**
 * @brief Relative weights of the score components
 */
struct WeightFactors {
    double success_rate = 0.5;
    double latency = 0.3;
    double resource_usage = 0.2;
};

/**
 * @brief Scoring configuration
 */
struct ScoringConfig {
    double decay_factor = 0.95;                               ///< Per-day multiplicative decay
    std::chrono::milliseconds time_window{7LL * 24 * 60 * 60 * 1000}; ///< Record retention window
    size_t min_samples = 5;                                   ///< Samples needed for a confident score
    WeightFactors weight_factors;                             ///< Component weights
    TimeSource clock;                                         ///< Time source, system clock when empty
};

/**
 * @brief Tracks per-model, per-capability outcomes and produces [0,1] scores
 *
 * Scores are zero until min_samples records survive the retention window.
 * Without new records a score only decays. Never throws.
 */
class CapabilityScorer {
public:
    explicit CapabilityScorer(const ScoringConfig& config = ScoringConfig());

    /**
     * @brief Record a successful invocation
     * @param model_id Model identifier
     * @param capability Capability that was exercised
     * @param metrics Latency and resource usage of the invocation
     */
    void recordSuccess(const std::string& model_id, ModelCapability capability,
                       const OutcomeMetrics& metrics);

    /**
     * @brief Record a failed invocation
     * @param model_id Model identifier
     * @param capability Capability that was exercised
     * @param metrics Latency and resource usage of the invocation
     */
    void recordFailure(const std::string& model_id, ModelCapability capability,
                       const OutcomeMetrics& metrics);

    /**
     * @brief Decayed aggregate score for a pair
     * @return Score in [0,1]; 0 when there is no confident signal
     */
    double getCapabilityScore(const std::string& model_id, ModelCapability capability);

    /**
     * @brief Scores and averaged metrics for all confident capabilities of a model
     */
    CapabilityScore getModelScores(const std::string& model_id);

    /**
     * @brief Number of records inside the retention window
     */
    size_t getSampleCount(const std::string& model_id, ModelCapability capability);

    /**
     * @brief Drop all history of a model
     */
    void clear(const std::string& model_id);

    const ScoringConfig& getConfig() const { return m_config; }

private:
    ScoringConfig m_config;
    std::unordered_map<std::string, std::unordered_map<ModelCapability, ModelCapabilityData>> m_model_data;
    mutable std::mutex m_mutex;

    void recordPerformance(const std::string& model_id, ModelCapability capability,
                           const PerformanceRecord& record);

    ModelCapabilityData* findData(const std::string& model_id, ModelCapability capability);

    /**
     * @brief Prune, score and decay one pair; caller holds the lock
     */
    double computeScore(ModelCapabilityData& data, Clock::time_point now);

    PerformanceMetrics calculatePerformanceMetrics(const std::vector<PerformanceRecord>& records) const;
    double calculateAggregateScore(const PerformanceMetrics& metrics) const;
    void pruneOldRecords(std::vector<PerformanceRecord>& records, Clock::time_point now) const;
    Clock::time_point now() const;
};

} // namespace Maestro
