// =================================================================
// src/Maestro/Core.cpp
// =================================================================
// Implementation of the command-line application.

#include "Maestro/Core.hpp"
#include "Maestro/ModelOrchestrator.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <chrono>

namespace fs = std::filesystem;

namespace Maestro {

namespace {

constexpr double kBytesPerGB = 1024.0 * 1024.0 * 1024.0;
constexpr uint64_t kMB = 1024ULL * 1024;

/**
 * @brief Probe that reports a fixed used-memory percentage
 */
class FixedMemoryProbe : public MemoryProbe {
public:
    explicit FixedMemoryProbe(double used_percent, uint64_t total = 16ULL * 1024 * kMB)
        : m_total(total), m_used_percent(used_percent) {}

    uint64_t totalMemory() const override { return m_total; }

    uint64_t freeMemory() const override {
        return static_cast<uint64_t>(static_cast<double>(m_total) * (100.0 - m_used_percent) / 100.0);
    }

private:
    uint64_t m_total;
    double m_used_percent;
};

ModelProfile makeProfile(const std::string& id, const std::string& name, uint64_t memory_mb,
                         const std::vector<ModelCapability>& capabilities,
                         double baseline, const RouteCost& cost) {
    ModelProfile profile;
    profile.model.id = id;
    profile.model.name = name;
    profile.model.memory_requirement = memory_mb * kMB;
    profile.model.capabilities = capabilities;
    for (const auto& capability : capabilities) {
        profile.baseline_scores[capability] = baseline;
    }
    profile.estimated_cost = cost;
    return profile;
}

} // namespace

Core::Core(const Commands& commands)
    : m_commands(commands) {}

int Core::run() {
    auto start_time = std::chrono::steady_clock::now();

    try {
        loadConfiguration();
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().logSessionStart(m_commands.active_command);

    int exit_code = 0;
    if (m_commands.active_command == "status") {
        exit_code = handleStatus();
    } else if (m_commands.active_command == "plan") {
        exit_code = handlePlan();
    } else if (m_commands.active_command == "simulate") {
        exit_code = handleSimulate();
    } else if (!m_commands.active_command.empty()) {
        std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
        exit_code = 1;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd(m_commands.active_command, exit_code,
        static_cast<long>(duration.count()));
    Logger::getInstance().flush();

    return exit_code;
}

std::vector<ModelProfile> Core::defaultModels() {
    return {
        makeProfile("whisper-medium", "Speech Recognition Model", 4096,
                    {ModelCapability::TRANSCRIPTION, ModelCapability::STREAMING},
                    0.85, RouteCost{2048.0, 0.5, 400.0, 200.0}),
        makeProfile("voice-synth", "Speech Synthesis Model", 3072,
                    {ModelCapability::SYNTHESIS, ModelCapability::INTERACTION},
                    0.8, RouteCost{1536.0, 0.4, 300.0, 150.0}),
        makeProfile("audio-analyst", "Audio Analysis Model", 2048,
                    {ModelCapability::ANALYSIS, ModelCapability::STREAMING},
                    0.82, RouteCost{1024.0, 0.3, 150.0, 100.0}),
        makeProfile("general-reasoner", "General Reasoning Model", 6144,
                    {ModelCapability::REASONING, ModelCapability::CODE, ModelCapability::ANALYSIS},
                    0.75, RouteCost{3072.0, 0.6, 600.0, 300.0})
    };
}

int Core::handleStatus() {
    SystemMemoryProbe probe;
    MemorySnapshot snapshot = probe.sample();
    uint64_t total = snapshot.total;
    uint64_t free_bytes = snapshot.free;
    double used_percent = MemoryProbe::usedPercentOf(snapshot);

    auto level = DegradationController::classify(used_percent,
        m_config.degradation.memory_threshold, m_config.degradation.critical_threshold);

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "System memory:" << std::endl;
    std::cout << "  Total:        " << static_cast<double>(total) / kBytesPerGB << " GB" << std::endl;
    std::cout << "  Free:         " << static_cast<double>(free_bytes) / kBytesPerGB << " GB" << std::endl;
    std::cout << "  Used:         " << used_percent << "%" << std::endl;
    std::cout << "Degradation:    " << degradationLevelToString(level)
              << " (light at " << m_config.degradation.memory_threshold
              << "%, critical at " << m_config.degradation.critical_threshold << "%)" << std::endl;
    std::cout << "Resource pool:  " << m_config.resources.max_memory_mb << " MB, "
              << m_config.resources.max_cpu << " CPU, "
              << m_config.resources.max_tokens_per_second << " tokens/s" << std::endl;
    std::cout << "Memory limit:   " << static_cast<double>(m_config.orchestrator.memory_limit) / kBytesPerGB
              << " GB" << std::endl;

    return 0;
}

int Core::handlePlan() {
    SequentialOrchestrator orchestrator(std::make_shared<SimulatedBackend>(), m_config.orchestrator.memory_limit);

    Task task;
    task.id = "plan-" + m_commands.task_type;
    task.type = m_commands.task_type;

    try {
        auto steps = orchestrator.planTask(task);
        if (steps.empty()) {
            std::cout << "No steps are registered for task type '" << m_commands.task_type << "'." << std::endl;
            return 0;
        }

        std::cout << "Plan for '" << m_commands.task_type << "':" << std::endl;
        for (size_t i = 0; i < steps.size(); ++i) {
            const auto& step = steps[i];
            std::cout << "  " << (i + 1) << ". " << step.operation << " with " << step.model_type.name
                      << " (" << step.model_type.id << ", " << std::fixed << std::setprecision(2)
                      << static_cast<double>(step.model_type.memory_requirement) / kBytesPerGB << " GB) -> "
                      << step.expected_output << std::endl;
        }
    } catch (const InsufficientMemoryError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

int Core::handleSimulate() {
    std::shared_ptr<MemoryProbe> probe;
    if (m_commands.used_memory_percent >= 0.0) {
        probe = std::make_shared<FixedMemoryProbe>(m_commands.used_memory_percent);
    } else {
        probe = std::make_shared<SystemMemoryProbe>();
    }

    auto backend = std::make_shared<SimulatedBackend>(std::chrono::milliseconds(10));
    for (const auto& model_id : m_commands.failing_models) {
        backend->setFailing(model_id, true);
    }

    MaestroConfig config = m_config;
    if (config.models.empty()) {
        config.models = defaultModels();
    }

    ModelOrchestrator orchestrator(config, backend, probe);
    orchestrator.getDegradationController().checkResourceUsage();

    std::vector<std::string> types = m_commands.task_types;
    if (types.empty()) {
        types = {"transcription", "synthesis", "analysis", "code_generation", "architecture"};
    }

    std::cout << "Degradation level: "
              << degradationLevelToString(orchestrator.getDegradationController().getCurrentDegradation())
              << std::endl;

    for (size_t i = 0; i < m_commands.task_count; ++i) {
        Task task;
        task.id = "task-" + std::to_string(i + 1);
        task.type = types[i % types.size()];
        task.input = "simulated " + task.type + " input";
        if (!m_commands.priority.empty()) {
            task.priority = TaskAnalyzer::stringToPriority(m_commands.priority);
        }

        auto response = orchestrator.submitTask(task);
        std::cout << "[" << task.id << "] " << task.type << " -> ";
        if (response.success) {
            std::cout << response.selected_model << " (" << priorityToString(response.priority) << ", "
                      << response.total_time.count() << "ms): " << response.output << std::endl;
        } else {
            std::cout << "FAILED [" << response.error_category << "] " << response.error_message << std::endl;
        }
    }

    auto stats = orchestrator.getStatistics();
    std::cout << std::endl << "Submitted: " << stats.total_tasks
              << ", succeeded: " << stats.successful_tasks
              << ", failed: " << stats.failed_tasks
              << ", rejected: " << stats.rejected_tasks << std::endl;

    for (const auto& profile : orchestrator.getRegisteredModels()) {
        auto scores = orchestrator.getScorer().getModelScores(profile.model.id);
        if (scores.capabilities.empty()) {
            continue;
        }
        std::cout << "  " << profile.model.id << ":";
        for (const auto& [capability, score] : scores.capabilities) {
            std::cout << " " << ModelCapabilityUtils::capabilityToString(capability) << "="
                      << std::fixed << std::setprecision(3) << score;
        }
        std::cout << std::endl;
    }

    orchestrator.shutdown();
    return stats.failed_tasks == 0 ? 0 : 1;
}

void Core::loadConfiguration() {
    if (fs::exists(m_commands.config_path)) {
        m_config = ConfigLoader::loadFromFile(m_commands.config_path);
    }

    if (m_commands.verbose) {
        m_config.logging.console_level = "debug";
    }
    ConfigLoader::applyLogging(m_config.logging);
}

} // namespace Maestro
