// =================================================================
// include/Maestro/SequentialOrchestrator.hpp
// =================================================================
// Single-slot model loader enforcing a hard memory ceiling.

#pragma once

#include "Maestro/ModelBackend.hpp"
#include "Maestro/MemoryProbe.hpp"
#include "Maestro/TaskAnalyzer.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <future>
#include <mutex>
#include <unordered_map>

namespace Maestro {

/**
 * @brief Catalog entry used to build plan steps for a task type
 */
struct StepTemplate {
    ModelType model_type;
    std::string operation;
    std::string expected_output;
};

/**
 * @brief Loads at most one model at a time and runs tasks on it
 *
 * The loaded model never requires more than the memory limit. Loading a
 * different model unloads the current one first; every transition and
 * execution is serialized.
 */
class SequentialOrchestrator {
public:
    static constexpr uint64_t kDefaultMemoryLimit = 16ULL * 1024 * 1024 * 1024;

    /**
     * @brief Constructor
     * @param backend Backend that loads and runs models
     * @param memory_limit Memory ceiling in bytes
     * @param probe Optional system memory source checked before each load
     */
    explicit SequentialOrchestrator(std::shared_ptr<ModelBackend> backend,
                                    uint64_t memory_limit = kDefaultMemoryLimit,
                                    std::shared_ptr<MemoryProbe> probe = nullptr);

    virtual ~SequentialOrchestrator() = default;

    /**
     * @brief Load a model, unloading the current one if it differs
     * @param model Model to load
     * @throws InsufficientMemoryError if the model cannot fit; the current model stays loaded
     * @throws ModelOrchestratorError if the backend fails
     */
    virtual void loadModel(const ModelType& model);

    /**
     * @brief Unload the current model; no-op when nothing is loaded
     * @throws ModelOrchestratorError if the backend fails
     */
    virtual void unloadModel();

    /**
     * @brief Run a task on the loaded model
     * @param task Task whose type selects the required capability
     * @return Backend output
     * @throws ModelOrchestratorError if no suitable model is loaded or the backend fails
     */
    virtual std::string processTask(const Task& task);

    /**
     * @brief Load a model if needed and run a task on it as one transition
     *
     * No other load can hand off the slot between the load and the execution.
     *
     * @throws InsufficientMemoryError if the model cannot fit
     * @throws ModelOrchestratorError if the model is unsuitable or the backend fails
     */
    virtual std::string processTaskOn(const ModelType& model, const Task& task);

    /**
     * @brief Build the ordered steps for a task from the step catalog
     * @return Steps; empty for task types without a catalog entry
     * @throws InsufficientMemoryError if any step needs more than the memory limit
     */
    std::vector<ProcessingStep> planTask(const Task& task) const;

    /**
     * @brief Plan a task and run each step with load, execute, unload
     * @return One output per step
     */
    std::vector<std::string> executePlan(const Task& task);

    /**
     * @brief Replace the catalog entry for a task type
     */
    void registerStepTemplate(const std::string& task_type, const std::vector<StepTemplate>& steps);

    std::future<void> loadModelAsync(const ModelType& model);
    std::future<void> unloadModelAsync();
    std::future<std::string> processTaskAsync(const Task& task);
    std::future<std::vector<std::string>> executePlanAsync(const Task& task);

    uint64_t getMemoryLimit() const { return m_memory_limit; }

    /**
     * @brief Memory accounted to the loaded model, 0 when empty
     */
    uint64_t getCurrentMemoryUsage() const;

    std::optional<ModelType> getLoadedModel() const;

private:
    std::shared_ptr<ModelBackend> m_backend;
    uint64_t m_memory_limit;
    std::shared_ptr<MemoryProbe> m_probe;

    std::optional<ModelType> m_loaded_model;
    uint64_t m_current_memory_usage = 0;
    std::unordered_map<std::string, std::vector<StepTemplate>> m_step_catalog;

    mutable std::mutex m_mutex;
    mutable std::mutex m_catalog_mutex;

    void initializeDefaultCatalog();
    void checkAdmissionLocked(const ModelType& model) const;
    void loadModelLocked(const ModelType& model);
    void unloadModelLocked();
    std::string processTaskLocked(const Task& task);
    std::string executeStepLocked(const ProcessingStep& step);
    std::string operationFor(const std::string& task_type) const;
};

} // namespace Maestro
