// =================================================================
// include/Maestro/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Maestro {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered
    std::string config_path = "config/maestro.yml";
    bool verbose = false;

    // Options for 'plan'
    std::string task_type;

    // Options for 'simulate'
    size_t task_count = 5;
    std::vector<std::string> task_types;
    double used_memory_percent = -1.0;   // Negative reads the system probe
    std::vector<std::string> failing_models;
    std::string priority;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupStatusCommand(CLI::App& app);
    void setupPlanCommand(CLI::App& app);
    void setupSimulateCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Maestro
