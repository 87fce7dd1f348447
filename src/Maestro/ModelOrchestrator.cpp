// =================================================================
// src/Maestro/ModelOrchestrator.cpp
// =================================================================
// Implementation of the end-to-end task pipeline.

#include "Maestro/ModelOrchestrator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <optional>

namespace Maestro {

/**
 * @brief Returns allocator reservations reclaimed by degradation to the pool
 */
class ModelOrchestrator::ReservationReleaser : public DegradationObserver {
public:
    explicit ReservationReleaser(std::weak_ptr<ResourceAllocator> allocator)
        : m_allocator(std::move(allocator)) {}

    void onResourcesReleased(const ResourcesReleasedEvent& event) override {
        auto allocator = m_allocator.lock();
        if (!allocator) {
            return;
        }
        for (const auto& id : event.resources) {
            allocator->releaseResources(id);
        }
    }

private:
    std::weak_ptr<ResourceAllocator> m_allocator;
};

ModelOrchestrator::ModelOrchestrator(const MaestroConfig& config,
                                     std::shared_ptr<ModelBackend> backend,
                                     std::shared_ptr<MemoryProbe> probe)
    : m_config(config) {
    m_scorer = std::make_shared<CapabilityScorer>(m_config.scoring);
    m_analyzer = std::make_unique<TaskAnalyzer>(m_scorer);
    m_allocator = std::make_shared<ResourceAllocator>(m_config.resources);
    m_sequential = std::make_unique<SequentialOrchestrator>(std::move(backend),
        m_config.orchestrator.memory_limit,
        m_config.orchestrator.check_system_memory ? probe : nullptr);

    m_degradation = std::make_unique<DegradationController>(probe, m_config.degradation, m_allocator);
    m_releaser = std::make_shared<ReservationReleaser>(m_allocator);
    m_degradation->addObserver(m_releaser);

    for (const auto& profile : m_config.models) {
        registerModel(profile);
    }

    Logger::getInstance().info("ModelOrchestrator", "Initialized orchestration pipeline",
        std::to_string(m_config.models.size()) + " model(s) configured");
}

ModelOrchestrator::~ModelOrchestrator() {
    shutdown();
}

void ModelOrchestrator::registerModel(const ModelProfile& profile) {
    std::lock_guard<std::mutex> lock(m_models_mutex);

    auto it = std::find_if(m_models.begin(), m_models.end(),
        [&profile](const ModelProfile& existing) { return existing.model.id == profile.model.id; });

    if (it != m_models.end()) {
        *it = profile;
    } else {
        m_models.push_back(profile);
    }

    Logger::getInstance().debug("ModelOrchestrator", "Registered model " + profile.model.id,
        "Capabilities: " + std::to_string(profile.model.capabilities.size()));
}

std::vector<ModelProfile> ModelOrchestrator::getRegisteredModels() const {
    std::lock_guard<std::mutex> lock(m_models_mutex);
    return m_models;
}

TaskResponse ModelOrchestrator::submitTask(const Task& task) {
    auto start_time = std::chrono::steady_clock::now();

    TaskResponse response;
    response.task_id = task.id;
    response.pipeline_steps.push_back("pipeline_start");

    std::optional<AllocationResult> allocation;
    bool admitted = false;

    try {
        if (m_shut_down.load()) {
            throw OrchestrationError("Orchestrator is shut down");
        }

        // Step 1: Requirements
        response.pipeline_steps.push_back("task_analysis");
        auto requirements = m_analyzer->analyze(task);

        // Step 2: Candidate ranking
        response.pipeline_steps.push_back("candidate_ranking");
        auto candidates = getRegisteredModels();
        auto ranked = m_analyzer->rankCandidates(requirements, candidates);
        if (ranked.empty()) {
            throw ModelOrchestratorError("No registered model offers capability '" +
                ModelCapabilityUtils::capabilityToString(*requirements.primary_capability) + "'");
        }

        const auto& executor = ranked.front();
        auto chain = m_analyzer->suggestModelChain(requirements, candidates);
        response.selected_model = executor.profile.model.id;
        response.planner_model = chain.planner.model.id;

        // Step 3: Resource allocation
        response.pipeline_steps.push_back("resource_allocation");
        allocation = m_allocator->allocateResources(buildRoute(executor, chain));
        response.reservation_id = allocation->reservation_id;
        response.priority = allocation->priority;

        // Step 4: Degradation admission
        response.pipeline_steps.push_back("degradation_admission");
        response.degradation_level = m_degradation->getCurrentDegradation();
        ResourceRequest request;
        request.priority = allocation->priority;
        request.memory_usage = allocation->allocated.memory;
        admitted = m_degradation->allocateResource(allocation->reservation_id, request);

        if (!admitted) {
            fail(response, "degradation", "Task '" + task.id + "' refused at " +
                degradationLevelToString(response.degradation_level) + " degradation with " +
                priorityToString(allocation->priority) + " priority");
        } else {
            // Step 5: Load or hand off, then execute
            response.pipeline_steps.push_back("model_load");
            response.pipeline_steps.push_back("execution");
            ModelCapability capability = *requirements.primary_capability;
            OutcomeMetrics metrics;
            metrics.resource_usage = m_config.resources.max_memory_mb > 0.0
                ? allocation->allocated.memory / m_config.resources.max_memory_mb : 0.0;

            auto exec_start = std::chrono::steady_clock::now();
            try {
                response.output = m_sequential->processTaskOn(executor.profile.model, task);
                response.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - exec_start);
                metrics.latency_ms = static_cast<double>(response.execution_time.count());
                m_scorer->recordSuccess(executor.profile.model.id, capability, metrics);
            } catch (const ModelOrchestratorError&) {
                response.execution_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - exec_start);
                metrics.latency_ms = static_cast<double>(response.execution_time.count());
                m_scorer->recordFailure(executor.profile.model.id, capability, metrics);
                throw;
            }

            response.success = true;
            response.pipeline_steps.push_back("outcome_recorded");
        }
    } catch (const ValidationError& e) {
        fail(response, "validation", e.what());
    } catch (const AllocationInfeasibleError& e) {
        fail(response, "allocation", e.what());
    } catch (const InsufficientMemoryError& e) {
        fail(response, "memory", e.what());
    } catch (const ModelOrchestratorError& e) {
        fail(response, "model", e.what());
    } catch (const OrchestrationError& e) {
        fail(response, "orchestration", e.what());
    } catch (const std::exception& e) {
        fail(response, "internal", e.what());
    }

    // Step 6: Release
    if (allocation) {
        if (admitted) {
            m_degradation->releaseResource(allocation->reservation_id);
        }
        m_allocator->releaseResources(*allocation);
        response.pipeline_steps.push_back("resources_released");
    }

    response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    updateStatistics(response);

    Logger::getInstance().logTaskOutcome(task.id, response.selected_model,
        static_cast<long>(response.total_time.count()), response.success);

    return response;
}

std::future<TaskResponse> ModelOrchestrator::submitTaskAsync(const Task& task) {
    return std::async(std::launch::async, [this, task]() {
        return submitTask(task);
    });
}

OrchestratorStatistics ModelOrchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

void ModelOrchestrator::shutdown() {
    if (m_shut_down.exchange(true)) {
        return;
    }

    m_degradation->shutdown();

    try {
        m_sequential->unloadModel();
    } catch (const ModelOrchestratorError& e) {
        Logger::getInstance().error("ModelOrchestrator", "Failed to unload model during shutdown", e.what());
    }

    Logger::getInstance().info("ModelOrchestrator", "Shut down orchestration pipeline");
}

RouteOptions ModelOrchestrator::buildRoute(const RankedCandidate& executor, const ModelChain& chain) const {
    RouteOptions route;
    route.primary_route.planner = chain.planner.model.id;
    route.primary_route.executor = executor.profile.model.id;
    route.estimated_costs.push_back(executor.profile.estimated_cost);
    route.confidence_scores[executor.profile.model.id] = executor.score;
    return route;
}

void ModelOrchestrator::fail(TaskResponse& response, const std::string& category, const std::string& message) const {
    response.success = false;
    response.error_category = category;
    response.error_message = message;
    response.pipeline_steps.push_back("failed_" + category);

    Logger::getInstance().warning("ModelOrchestrator", "Task " + response.task_id + " failed", message);
}

void ModelOrchestrator::updateStatistics(const TaskResponse& response) {
    std::lock_guard<std::mutex> lock(m_stats_mutex);

    m_stats.total_tasks++;
    if (response.success) {
        m_stats.successful_tasks++;
        m_total_response_time += static_cast<double>(response.total_time.count());
        m_stats.average_response_time = m_total_response_time / m_stats.successful_tasks;
        m_stats.model_usage[response.selected_model]++;
    } else if (response.error_category == "degradation") {
        m_stats.rejected_tasks++;
        m_stats.error_counts[response.error_category]++;
    } else {
        m_stats.failed_tasks++;
        m_stats.error_counts[response.error_category]++;
    }
}

} // namespace Maestro
