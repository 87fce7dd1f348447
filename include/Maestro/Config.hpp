// =================================================================
// include/Maestro/Config.hpp
// =================================================================
// Configuration for all orchestration components, loaded from YAML.

#pragma once

#include "Maestro/ResourceAllocator.hpp"
#include "Maestro/CapabilityScorer.hpp"
#include "Maestro/DegradationController.hpp"
#include "Maestro/SequentialOrchestrator.hpp"
#include "Maestro/TaskAnalyzer.hpp"
#include <string>
#include <vector>

namespace Maestro {

/**
 * @brief Settings of the sequential model slot
 */
struct OrchestratorSettings {
    uint64_t memory_limit = SequentialOrchestrator::kDefaultMemoryLimit; ///< Bytes
    bool check_system_memory = false;   ///< Also require the probe to report enough free memory
};

/**
 * @brief Settings applied to the Logger singleton
 */
struct LoggingSettings {
    std::string directory = ".maestro/logs";
    std::string console_level = "info";
    std::string file_level = "debug";
    bool console_enabled = true;
    bool file_enabled = false;
    size_t max_file_size = 10 * 1024 * 1024;   ///< Bytes per log file
    size_t max_files = 5;
};

/**
 * @brief Complete configuration; every field has a usable default
 */
struct MaestroConfig {
    AllocatorConfig resources;
    ScoringConfig scoring;
    DegradationConfig degradation;
    OrchestratorSettings orchestrator;
    LoggingSettings logging;
    std::vector<ModelProfile> models;   ///< Models registered at startup
};

/**
 * @brief Reads MaestroConfig from YAML
 *
 * Missing sections and keys keep their defaults.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a file
     * @param path Path to a YAML file
     * @return Parsed configuration
     * @throws ConfigError if the file cannot be read or holds invalid values
     */
    static MaestroConfig loadFromFile(const std::string& path);

    /**
     * @brief Load configuration from YAML text
     * @throws ConfigError on malformed YAML or invalid values
     */
    static MaestroConfig loadFromString(const std::string& yaml);

    /**
     * @brief Check value ranges
     * @throws ConfigError naming the first invalid key
     */
    static void validate(const MaestroConfig& config);

    /**
     * @brief Apply logging settings to the Logger singleton
     */
    static void applyLogging(const LoggingSettings& settings);
};

} // namespace Maestro
