// =================================================================
// src/Maestro/SequentialOrchestrator.cpp
// =================================================================
// Implementation of serialized model handoff and sequential plans.

#include "Maestro/SequentialOrchestrator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"

namespace Maestro {

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024 * 1024;

} // namespace

SequentialOrchestrator::SequentialOrchestrator(std::shared_ptr<ModelBackend> backend,
                                               uint64_t memory_limit,
                                               std::shared_ptr<MemoryProbe> probe)
    : m_backend(std::move(backend)), m_memory_limit(memory_limit), m_probe(std::move(probe)) {
    if (!m_backend) {
        throw ModelOrchestratorError("SequentialOrchestrator requires a model backend");
    }
    initializeDefaultCatalog();
}

void SequentialOrchestrator::loadModel(const ModelType& model) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadModelLocked(model);
}

void SequentialOrchestrator::unloadModel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    unloadModelLocked();
}

std::string SequentialOrchestrator::processTask(const Task& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return processTaskLocked(task);
}

std::string SequentialOrchestrator::processTaskOn(const ModelType& model, const Task& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    loadModelLocked(model);
    return processTaskLocked(task);
}

std::string SequentialOrchestrator::processTaskLocked(const Task& task) {
    if (!m_loaded_model) {
        throw ModelOrchestratorError("No model loaded for task '" + task.id + "'");
    }

    ModelCapability required = TaskAnalyzer::inferCapability(task.type);
    if (!ModelCapabilityUtils::hasCapability(*m_loaded_model, required)) {
        throw ModelOrchestratorError("Loaded model " + m_loaded_model->id + " lacks capability '" +
            ModelCapabilityUtils::capabilityToString(required) + "' required by task '" + task.id + "'");
    }

    ProcessingStep step;
    step.model_type = *m_loaded_model;
    step.operation = operationFor(task.type);
    step.input = task.input;
    step.expected_output = task.type;

    return executeStepLocked(step);
}

std::vector<ProcessingStep> SequentialOrchestrator::planTask(const Task& task) const {
    std::vector<StepTemplate> templates;
    {
        std::lock_guard<std::mutex> lock(m_catalog_mutex);
        auto it = m_step_catalog.find(task.type);
        if (it != m_step_catalog.end()) {
            templates = it->second;
        }
    }

    std::vector<ProcessingStep> steps;
    steps.reserve(templates.size());

    for (const auto& step_template : templates) {
        if (step_template.model_type.memory_requirement > m_memory_limit) {
            throw InsufficientMemoryError("Insufficient memory to load model " + step_template.model_type.name +
                ". Required: " + std::to_string(step_template.model_type.memory_requirement) +
                ", Available: " + std::to_string(m_memory_limit));
        }

        ProcessingStep step;
        step.model_type = step_template.model_type;
        step.operation = step_template.operation;
        step.input = task.input;
        step.expected_output = step_template.expected_output;
        steps.push_back(std::move(step));
    }

    return steps;
}

std::vector<std::string> SequentialOrchestrator::executePlan(const Task& task) {
    auto plan = planTask(task);

    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> results;
    results.reserve(plan.size());

    for (const auto& step : plan) {
        loadModelLocked(step.model_type);
        results.push_back(executeStepLocked(step));
        unloadModelLocked();
    }

    Logger::getInstance().info("SequentialOrchestrator",
        "Executed " + std::to_string(plan.size()) + " step(s) for task " + task.id);

    return results;
}

void SequentialOrchestrator::registerStepTemplate(const std::string& task_type,
                                                  const std::vector<StepTemplate>& steps) {
    std::lock_guard<std::mutex> lock(m_catalog_mutex);
    m_step_catalog[task_type] = steps;
}

std::future<void> SequentialOrchestrator::loadModelAsync(const ModelType& model) {
    return std::async(std::launch::async, [this, model]() {
        loadModel(model);
    });
}

std::future<void> SequentialOrchestrator::unloadModelAsync() {
    return std::async(std::launch::async, [this]() {
        unloadModel();
    });
}

std::future<std::string> SequentialOrchestrator::processTaskAsync(const Task& task) {
    return std::async(std::launch::async, [this, task]() {
        return processTask(task);
    });
}

std::future<std::vector<std::string>> SequentialOrchestrator::executePlanAsync(const Task& task) {
    return std::async(std::launch::async, [this, task]() {
        return executePlan(task);
    });
}

uint64_t SequentialOrchestrator::getCurrentMemoryUsage() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_memory_usage;
}

std::optional<ModelType> SequentialOrchestrator::getLoadedModel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loaded_model;
}

void SequentialOrchestrator::initializeDefaultCatalog() {
    StepTemplate transcription;
    transcription.model_type = {"transcription-model", "Speech Recognition Model", 4 * kGiB,
                                {ModelCapability::TRANSCRIPTION}};
    transcription.operation = "transcribe";
    transcription.expected_output = "text";

    StepTemplate synthesis;
    synthesis.model_type = {"synthesis-model", "Speech Synthesis Model", 3 * kGiB,
                            {ModelCapability::SYNTHESIS}};
    synthesis.operation = "synthesize";
    synthesis.expected_output = "audio";

    StepTemplate analysis;
    analysis.model_type = {"analysis-model", "Audio Analysis Model", 2 * kGiB,
                           {ModelCapability::ANALYSIS, ModelCapability::STREAMING}};
    analysis.operation = "analyze";
    analysis.expected_output = "analysis";

    m_step_catalog["transcription"] = {transcription};
    m_step_catalog["synthesis"] = {synthesis};
    m_step_catalog["analysis"] = {analysis};
}

void SequentialOrchestrator::checkAdmissionLocked(const ModelType& model) const {
    if (model.memory_requirement > m_memory_limit) {
        throw InsufficientMemoryError("Insufficient memory to load model " + model.name +
            ". Required: " + std::to_string(model.memory_requirement) +
            ", Available: " + std::to_string(m_memory_limit));
    }

    if (m_probe) {
        // The current model's memory comes back during handoff
        uint64_t available = m_probe->freeMemory() + m_current_memory_usage;
        if (model.memory_requirement > available) {
            throw InsufficientMemoryError("Insufficient memory to load model " + model.name +
                ". Required: " + std::to_string(model.memory_requirement) +
                ", Available: " + std::to_string(available));
        }
    }
}

void SequentialOrchestrator::loadModelLocked(const ModelType& model) {
    if (m_loaded_model && m_loaded_model->id == model.id) {
        return;
    }

    checkAdmissionLocked(model);

    if (m_loaded_model) {
        unloadModelLocked();
    }

    try {
        m_backend->load(model);
    } catch (const std::exception& e) {
        Logger::getInstance().error("SequentialOrchestrator", "Failed to load model " + model.id, e.what());
        throw ModelOrchestratorError("Backend failed to load model " + model.id + ": " + e.what());
    }

    m_loaded_model = model;
    m_current_memory_usage = model.memory_requirement;
    Logger::getInstance().logModelTransition("load", model.id, model.memory_requirement);
}

void SequentialOrchestrator::unloadModelLocked() {
    if (!m_loaded_model) {
        return;
    }

    ModelType model = *m_loaded_model;

    // The slot stays occupied until the backend confirms the unload
    try {
        m_backend->unload(model);
    } catch (const std::exception& e) {
        Logger::getInstance().error("SequentialOrchestrator", "Failed to unload model " + model.id, e.what());
        throw ModelOrchestratorError("Backend failed to unload model " + model.id + ": " + e.what());
    }

    m_loaded_model.reset();
    m_current_memory_usage = 0;
    Logger::getInstance().logModelTransition("unload", model.id, model.memory_requirement);
}

std::string SequentialOrchestrator::executeStepLocked(const ProcessingStep& step) {
    if (!m_loaded_model) {
        throw ModelOrchestratorError("No active model loaded for operation '" + step.operation + "'");
    }

    try {
        return m_backend->process(*m_loaded_model, step);
    } catch (const std::exception& e) {
        Logger::getInstance().error("SequentialOrchestrator",
            "Step '" + step.operation + "' failed on model " + m_loaded_model->id, e.what());
        throw ModelOrchestratorError("Model " + m_loaded_model->id + " failed during '" +
            step.operation + "': " + e.what());
    }
}

std::string SequentialOrchestrator::operationFor(const std::string& task_type) const {
    std::lock_guard<std::mutex> lock(m_catalog_mutex);
    auto it = m_step_catalog.find(task_type);
    if (it != m_step_catalog.end() && !it->second.empty()) {
        return it->second.front().operation;
    }
    return "process";
}

} // namespace Maestro
