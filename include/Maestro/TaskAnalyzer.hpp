// =================================================================
// include/Maestro/TaskAnalyzer.hpp
// =================================================================
// Derivation of capability and resource requirements from tasks.

#pragma once

#include "Maestro/ModelCapabilities.hpp"
#include "Maestro/ResourceTypes.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <memory>

namespace Maestro {

class CapabilityScorer;

/**
 * @brief What a task optimizes for
 */
enum class TaskPriority {
    SPEED,
    QUALITY,
    EFFICIENCY
};

/**
 * @brief Per-task resource ceilings
 */
struct ResourceConstraints {
    double max_memory = 1000.0;   ///< Megabytes
    double max_cpu = 0.8;         ///< Fraction in (0,1]
    double max_latency = 200.0;   ///< Milliseconds
};

/**
 * @brief A unit of work submitted to the orchestrator
 */
struct Task {
    std::string id;
    std::string type;                                        ///< e.g. "transcription", "analysis"
    std::string input;                                       ///< Serialized payload
    std::optional<TaskPriority> priority;
    std::optional<ResourceConstraints> resource_constraints;
};

/**
 * @brief Capability and resource needs derived from a task
 */
struct TaskRequirements {
    std::optional<ModelCapability> primary_capability;
    std::vector<ModelCapability> secondary_capabilities;
    std::unordered_map<ModelCapability, double> min_capability_scores;
    int64_t context_size = 0;
    TaskPriority priority = TaskPriority::QUALITY;
    ResourceConstraints resource_constraints;
};

/**
 * @brief A model the orchestrator may route to, with its declared profile
 */
struct ModelProfile {
    ModelType model;
    std::unordered_map<ModelCapability, double> baseline_scores; ///< Declared scores used until history is confident
    RouteCost estimated_cost{500.0, 0.5, 100.0, 100.0};
};

/**
 * @brief Candidate with the score it was ranked by
 */
struct RankedCandidate {
    ModelProfile profile;
    double score = 0.0;
    bool confident = false;   ///< Score comes from recorded history
};

/**
 * @brief Planner and executor suggested for a task
 */
struct ModelChain {
    ModelProfile planner;
    ModelProfile executor;
};

/**
 * @brief Maps tasks to requirements and ranks candidate models
 *
 * The type lookup table is fixed; unknown task types fall back to reasoning.
 */
class TaskAnalyzer {
public:
    /**
     * @brief Constructor
     * @param scorer Capability scorer used for ranking, may be null
     */
    explicit TaskAnalyzer(std::shared_ptr<CapabilityScorer> scorer = nullptr);

    /**
     * @brief Derive requirements for a task
     * @param task Task to analyze
     * @return Validated requirements
     * @throws ValidationError if the derived requirements are invalid
     */
    TaskRequirements analyze(const Task& task) const;

    /**
     * @brief Check requirements for structural validity
     * @return True if valid; never throws
     */
    bool validateRequirements(const TaskRequirements& requirements) const;

    /**
     * @brief Order candidates declaring the primary capability by effective score
     * @param requirements Requirements with a primary capability
     * @param candidates Registered model profiles
     * @return Best first; candidates with a confident score below the primary minimum are excluded
     */
    std::vector<RankedCandidate> rankCandidates(const TaskRequirements& requirements,
                                                const std::vector<ModelProfile>& candidates) const;

    /**
     * @brief Suggest default planner and executor descriptors
     */
    ModelChain suggestModelChain(const TaskRequirements& requirements) const;

    /**
     * @brief Suggest planner and executor from registered candidates
     *
     * Falls back to the default descriptors for a role with no eligible candidate.
     */
    ModelChain suggestModelChain(const TaskRequirements& requirements,
                                 const std::vector<ModelProfile>& candidates) const;

    /**
     * @brief Capability a task type maps to
     */
    static ModelCapability inferCapability(const std::string& type);

    /**
     * @brief Secondary capabilities a task type maps to
     */
    static std::vector<ModelCapability> inferSecondaryCapabilities(const std::string& type);

    static std::string priorityToString(TaskPriority priority);
    static TaskPriority stringToPriority(const std::string& str);

private:
    std::shared_ptr<CapabilityScorer> m_scorer;

    int64_t calculateContextSize(const Task& task) const;
    std::unordered_map<ModelCapability, double> buildMinScores(
        ModelCapability primary, const std::vector<ModelCapability>& secondaries) const;

    std::vector<RankedCandidate> rankByCapability(ModelCapability capability, double minimum,
                                                  const std::vector<ModelProfile>& candidates) const;

    static ModelProfile defaultProfile(const std::string& id, const std::string& name,
                                       ModelCapability capability);
};

} // namespace Maestro
