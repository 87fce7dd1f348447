// =================================================================
// include/Maestro/ModelOrchestrator.hpp
// =================================================================
// End-to-end task pipeline combining analysis, scoring, allocation,
// degradation admission and sequential execution.

#pragma once

#include "Maestro/Config.hpp"
#include "Maestro/CapabilityScorer.hpp"
#include "Maestro/TaskAnalyzer.hpp"
#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/DegradationController.hpp"
#include "Maestro/SequentialOrchestrator.hpp"
#include "Maestro/ModelBackend.hpp"
#include "Maestro/MemoryProbe.hpp"
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <future>
#include <mutex>
#include <atomic>

namespace Maestro {

/**
 * @brief Result of one submitted task
 */
struct TaskResponse {
    std::string task_id;                          ///< Original task ID
    bool success = false;                         ///< Whether the task completed
    std::string output;                           ///< Backend output
    std::string error_category;                   ///< validation, allocation, degradation, memory, model, orchestration, internal
    std::string error_message;                    ///< Error message if failed
    std::string selected_model;                   ///< Executor that ran the task
    std::string planner_model;                    ///< Suggested planner
    std::string reservation_id;                   ///< Allocator reservation used
    Priority priority = Priority::LOW;            ///< Priority of the reservation
    DegradationLevel degradation_level = DegradationLevel::NONE; ///< Level at admission
    std::chrono::milliseconds total_time{0};      ///< Total pipeline time
    std::chrono::milliseconds execution_time{0};  ///< Time spent in the backend
    std::vector<std::string> pipeline_steps;      ///< Steps taken in pipeline
};

/**
 * @brief Pipeline statistics
 */
struct OrchestratorStatistics {
    size_t total_tasks = 0;
    size_t successful_tasks = 0;
    size_t failed_tasks = 0;
    size_t rejected_tasks = 0;                    ///< Refused by degradation admission
    double average_response_time = 0.0;           ///< Milliseconds, successful tasks only
    std::unordered_map<std::string, size_t> model_usage;
    std::unordered_map<std::string, size_t> error_counts;  ///< By error category
};

/**
 * @brief Facade owning every orchestration component
 *
 * submitTask never throws; failures are reported in the response.
 */
class ModelOrchestrator {
public:
    /**
     * @brief Constructor
     * @param config Component configuration; config.models are registered
     * @param backend Backend that loads and runs models
     * @param probe Memory source for degradation monitoring
     */
    ModelOrchestrator(const MaestroConfig& config,
                      std::shared_ptr<ModelBackend> backend,
                      std::shared_ptr<MemoryProbe> probe);

    /**
     * @brief Destructor, runs shutdown()
     */
    virtual ~ModelOrchestrator();

    /**
     * @brief Register or replace a routable model
     */
    virtual void registerModel(const ModelProfile& profile);

    virtual std::vector<ModelProfile> getRegisteredModels() const;

    /**
     * @brief Run a task through the full pipeline
     * @param task Task to execute
     * @return Response with output or error category and message
     */
    virtual TaskResponse submitTask(const Task& task);

    virtual std::future<TaskResponse> submitTaskAsync(const Task& task);

    virtual OrchestratorStatistics getStatistics() const;

    /**
     * @brief Stop monitoring, release everything and unload the model; idempotent
     */
    virtual void shutdown();

    CapabilityScorer& getScorer() { return *m_scorer; }
    TaskAnalyzer& getAnalyzer() { return *m_analyzer; }
    ResourceAllocator& getAllocator() { return *m_allocator; }
    DegradationController& getDegradationController() { return *m_degradation; }
    SequentialOrchestrator& getSequentialOrchestrator() { return *m_sequential; }

private:
    class ReservationReleaser;

    MaestroConfig m_config;
    std::shared_ptr<CapabilityScorer> m_scorer;
    std::unique_ptr<TaskAnalyzer> m_analyzer;
    std::shared_ptr<ResourceAllocator> m_allocator;
    std::unique_ptr<DegradationController> m_degradation;
    std::unique_ptr<SequentialOrchestrator> m_sequential;
    std::shared_ptr<ReservationReleaser> m_releaser;

    std::vector<ModelProfile> m_models;
    mutable std::mutex m_models_mutex;

    OrchestratorStatistics m_stats;
    double m_total_response_time = 0.0;
    mutable std::mutex m_stats_mutex;

    std::atomic<bool> m_shut_down{false};

    RouteOptions buildRoute(const RankedCandidate& executor, const ModelChain& chain) const;
    void fail(TaskResponse& response, const std::string& category, const std::string& message) const;
    void updateStatistics(const TaskResponse& response);
};

} // namespace Maestro
