// =================================================================
// src/Maestro/TaskAnalyzer.cpp
// =================================================================
// Implementation of task requirement derivation and candidate ranking.

#include "Maestro/TaskAnalyzer.hpp"
#include "Maestro/CapabilityScorer.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Maestro {

namespace {

constexpr double kPrimaryMinScore = 0.8;
constexpr double kSecondaryMinScore = 0.6;
constexpr double kDefaultDescriptorScore = 0.9;
constexpr int64_t kArchitectureContextSize = 4096;
constexpr int64_t kDefaultContextSize = 2048;
constexpr size_t kLargeInputThreshold = 1000;

} // namespace

TaskAnalyzer::TaskAnalyzer(std::shared_ptr<CapabilityScorer> scorer)
    : m_scorer(std::move(scorer)) {}

TaskRequirements TaskAnalyzer::analyze(const Task& task) const {
    TaskRequirements requirements;

    ModelCapability primary = inferCapability(task.type);
    requirements.primary_capability = primary;
    requirements.secondary_capabilities = inferSecondaryCapabilities(task.type);
    requirements.min_capability_scores = buildMinScores(primary, requirements.secondary_capabilities);
    requirements.context_size = calculateContextSize(task);
    requirements.priority = task.priority.value_or(TaskPriority::QUALITY);
    requirements.resource_constraints = task.resource_constraints.value_or(ResourceConstraints());

    if (!validateRequirements(requirements)) {
        Logger::getInstance().warning("TaskAnalyzer", "Rejected task " + task.id,
            "Type: " + task.type);
        throw ValidationError("Invalid requirements derived for task '" + task.id + "' of type '" + task.type + "'");
    }

    Logger::getInstance().debug("TaskAnalyzer",
        "Analyzed task " + task.id + " as " + ModelCapabilityUtils::capabilityToString(primary),
        "Context: " + std::to_string(requirements.context_size));

    return requirements;
}

bool TaskAnalyzer::validateRequirements(const TaskRequirements& requirements) const {
    if (!requirements.primary_capability.has_value()) {
        return false;
    }
    if (requirements.secondary_capabilities.empty()) {
        return false;
    }
    if (requirements.min_capability_scores.empty()) {
        return false;
    }
    if (requirements.context_size <= 0) {
        return false;
    }

    switch (requirements.priority) {
        case TaskPriority::SPEED:
        case TaskPriority::QUALITY:
        case TaskPriority::EFFICIENCY:
            break;
        default:
            return false;
    }

    const auto& constraints = requirements.resource_constraints;
    if (!(constraints.max_memory > 0.0)) {
        return false;
    }
    if (!(constraints.max_cpu > 0.0 && constraints.max_cpu <= 1.0)) {
        return false;
    }
    if (!(constraints.max_latency > 0.0)) {
        return false;
    }

    return true;
}

std::vector<RankedCandidate> TaskAnalyzer::rankCandidates(const TaskRequirements& requirements,
                                                          const std::vector<ModelProfile>& candidates) const {
    if (!requirements.primary_capability.has_value()) {
        return {};
    }

    ModelCapability primary = *requirements.primary_capability;
    double minimum = kPrimaryMinScore;
    auto it = requirements.min_capability_scores.find(primary);
    if (it != requirements.min_capability_scores.end()) {
        minimum = it->second;
    }

    return rankByCapability(primary, minimum, candidates);
}

ModelChain TaskAnalyzer::suggestModelChain(const TaskRequirements& requirements) const {
    return suggestModelChain(requirements, {});
}

ModelChain TaskAnalyzer::suggestModelChain(const TaskRequirements& requirements,
                                           const std::vector<ModelProfile>& candidates) const {
    ModelCapability primary = requirements.primary_capability.value_or(ModelCapability::REASONING);

    ModelChain chain;
    chain.planner = defaultProfile("default-planner", "Default Planning Model", ModelCapability::REASONING);
    chain.executor = defaultProfile("default-executor", "Default Execution Model", primary);

    auto planners = rankByCapability(ModelCapability::REASONING, 0.0, candidates);
    if (!planners.empty()) {
        chain.planner = planners.front().profile;
    }

    auto executors = rankCandidates(requirements, candidates);
    if (!executors.empty()) {
        chain.executor = executors.front().profile;
    }

    return chain;
}

ModelCapability TaskAnalyzer::inferCapability(const std::string& type) {
    if (type == "architecture") return ModelCapability::REASONING;
    if (type == "code_generation") return ModelCapability::CODE;
    if (type == "transcription") return ModelCapability::TRANSCRIPTION;
    if (type == "synthesis") return ModelCapability::SYNTHESIS;
    if (type == "analysis") return ModelCapability::ANALYSIS;
    return ModelCapability::REASONING;
}

std::vector<ModelCapability> TaskAnalyzer::inferSecondaryCapabilities(const std::string& type) {
    if (type == "architecture") {
        return {ModelCapability::ANALYSIS, ModelCapability::CODE, ModelCapability::REASONING};
    }
    if (type == "code_generation") {
        return {ModelCapability::ANALYSIS, ModelCapability::REASONING};
    }
    if (type == "transcription") {
        return {ModelCapability::ANALYSIS};
    }
    if (type == "synthesis") {
        return {ModelCapability::INTERACTION};
    }
    if (type == "analysis") {
        return {ModelCapability::REASONING};
    }
    return {ModelCapability::ANALYSIS, ModelCapability::REASONING};
}

std::string TaskAnalyzer::priorityToString(TaskPriority priority) {
    switch (priority) {
        case TaskPriority::SPEED: return "speed";
        case TaskPriority::QUALITY: return "quality";
        case TaskPriority::EFFICIENCY: return "efficiency";
        default: return "unknown";
    }
}

TaskPriority TaskAnalyzer::stringToPriority(const std::string& str) {
    if (str == "speed") return TaskPriority::SPEED;
    if (str == "quality") return TaskPriority::QUALITY;
    if (str == "efficiency") return TaskPriority::EFFICIENCY;
    throw std::invalid_argument("Unknown task priority: " + str);
}

int64_t TaskAnalyzer::calculateContextSize(const Task& task) const {
    int64_t base = task.type == "architecture" ? kArchitectureContextSize : kDefaultContextSize;

    if (task.input.size() > kLargeInputThreshold) {
        auto scaled = static_cast<int64_t>(std::ceil(static_cast<double>(task.input.size()) * 1.5));
        return std::max(base, scaled);
    }

    return base;
}

std::unordered_map<ModelCapability, double> TaskAnalyzer::buildMinScores(
    ModelCapability primary, const std::vector<ModelCapability>& secondaries) const {

    // A primary that is also listed as a secondary takes the secondary minimum
    std::unordered_map<ModelCapability, double> scores;
    scores[primary] = kPrimaryMinScore;
    for (const auto& capability : secondaries) {
        scores[capability] = kSecondaryMinScore;
    }
    return scores;
}

std::vector<RankedCandidate> TaskAnalyzer::rankByCapability(ModelCapability capability, double minimum,
                                                            const std::vector<ModelProfile>& candidates) const {
    std::vector<RankedCandidate> ranked;

    for (const auto& profile : candidates) {
        if (!ModelCapabilityUtils::hasCapability(profile.model, capability)) {
            continue;
        }

        RankedCandidate candidate;
        candidate.profile = profile;

        if (m_scorer && m_scorer->getSampleCount(profile.model.id, capability) >= m_scorer->getConfig().min_samples) {
            candidate.score = m_scorer->getCapabilityScore(profile.model.id, capability);
            candidate.confident = true;
            if (candidate.score < minimum) {
                continue;
            }
        } else {
            auto baseline = profile.baseline_scores.find(capability);
            candidate.score = baseline != profile.baseline_scores.end() ? baseline->second : 0.0;
        }

        ranked.push_back(std::move(candidate));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
        [](const RankedCandidate& a, const RankedCandidate& b) {
            return a.score > b.score;
        });

    return ranked;
}

ModelProfile TaskAnalyzer::defaultProfile(const std::string& id, const std::string& name,
                                          ModelCapability capability) {
    ModelProfile profile;
    profile.model.id = id;
    profile.model.name = name;
    profile.model.capabilities = {capability};
    profile.baseline_scores[capability] = kDefaultDescriptorScore;
    return profile;
}

} // namespace Maestro
