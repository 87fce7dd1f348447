// =================================================================
// src/Maestro/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Maestro/CliParser.hpp"

namespace Maestro {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Maestro: resource-constrained model orchestration.");
    m_app->require_subcommand(0, 1);

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.");
    m_app->add_flag("-v,--verbose", m_commands.verbose, "Log debug messages to the console.");

    // Store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupStatusCommand(*m_app);
    setupPlanCommand(*m_app);
    setupSimulateCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupStatusCommand(CLI::App& app) {
    app.add_subcommand("status", "Shows system memory, the degradation level and the resource pool.");
}

void CliParser::setupPlanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("plan", "Prints the sequential execution plan for a task type.");
    sub->add_option("type", m_commands.task_type, "Task type (e.g. 'transcription', 'synthesis', 'analysis').")->required();
}

void CliParser::setupSimulateCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("simulate", "Runs tasks through the full pipeline against a simulated backend.");
    sub->add_option("-n,--tasks", m_commands.task_count, "Number of tasks to submit (default: 5)")->check(CLI::PositiveNumber);
    sub->add_option("-t,--type", m_commands.task_types, "Task types to cycle through (default: all built-in types)");
    sub->add_option("--used-memory", m_commands.used_memory_percent,
                    "Pretend the system uses this percentage of memory")->check(CLI::Range(0.0, 100.0));
    sub->add_option("--fail", m_commands.failing_models, "Models whose simulated execution fails");
    sub->add_option("--priority", m_commands.priority, "Task priority")
        ->check(CLI::IsMember({"speed", "quality", "efficiency"}));
}

} // namespace Maestro
