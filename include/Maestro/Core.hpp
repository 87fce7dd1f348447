// =================================================================
// include/Maestro/Core.hpp
// =================================================================
// Defines the command-line application.

#pragma once

#include "Maestro/CliParser.hpp"
#include "Maestro/Config.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Maestro {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Models registered by 'simulate' when the configuration lists none.
     */
    static std::vector<ModelProfile> defaultModels();

private:
    // Command Handlers
    int handleStatus();
    int handlePlan();
    int handleSimulate();

    void loadConfiguration();

    const Commands& m_commands;
    MaestroConfig m_config;
};

} // namespace Maestro
