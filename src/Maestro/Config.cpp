// =================================================================
// src/Maestro/Config.cpp
// =================================================================
// YAML configuration loading and validation.

#include "Maestro/Config.hpp"
#include "Maestro/Errors.hpp"
#include "Maestro/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace Maestro {

namespace {

constexpr double kBytesPerMB = 1024.0 * 1024.0;

template <typename T>
bool readValue(const YAML::Node& node, const std::string& scope, const std::string& key, T& target) {
    if (!node[key]) {
        return false;
    }
    try {
        target = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for '" + scope + "." + key + "': " + e.what());
    }
    return true;
}

YAML::Node section(const YAML::Node& root, const std::string& name) {
    YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw ConfigError("Section '" + name + "' must be a mapping");
    }
    return node;
}

bool isLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "debug" || lowered == "info" || lowered == "warning" || lowered == "warn" ||
           lowered == "error" || lowered == "critical" || lowered == "crit";
}

ModelCapability parseCapability(const std::string& value, const std::string& key) {
    try {
        return ModelCapabilityUtils::stringToCapability(value);
    } catch (const std::invalid_argument& e) {
        throw ConfigError("Invalid capability in '" + key + "': " + e.what());
    }
}

void parseResources(const YAML::Node& node, AllocatorConfig& config) {
    if (!node) {
        return;
    }
    readValue(node, "resources", "max_memory_mb", config.max_memory_mb);
    readValue(node, "resources", "max_cpu", config.max_cpu);
    readValue(node, "resources", "max_tokens_per_second", config.max_tokens_per_second);
    readValue(node, "resources", "default_timeout_ms", config.default_timeout_ms);
    readValue(node, "resources", "max_timeout_ms", config.max_timeout_ms);
    readValue(node, "resources", "min_timeout_ms", config.min_timeout_ms);
    readValue(node, "resources", "high_utilization_threshold", config.high_utilization_threshold);
    readValue(node, "resources", "critical_utilization_threshold", config.critical_utilization_threshold);
    readValue(node, "resources", "max_optimization_attempts", config.max_optimization_attempts);
}

void parseScoring(const YAML::Node& node, ScoringConfig& config) {
    if (!node) {
        return;
    }
    readValue(node, "scoring", "decay_factor", config.decay_factor);

    int64_t window_ms = config.time_window.count();
    if (readValue(node, "scoring", "time_window_ms", window_ms)) {
        config.time_window = std::chrono::milliseconds(window_ms);
    }

    readValue(node, "scoring", "min_samples", config.min_samples);

    YAML::Node weights = node["weight_factors"];
    if (weights) {
        if (!weights.IsMap()) {
            throw ConfigError("'scoring.weight_factors' must be a mapping");
        }
        readValue(weights, "scoring.weight_factors", "success_rate", config.weight_factors.success_rate);
        readValue(weights, "scoring.weight_factors", "latency", config.weight_factors.latency);
        readValue(weights, "scoring.weight_factors", "resource_usage", config.weight_factors.resource_usage);
    }
}

void parseDegradation(const YAML::Node& node, DegradationConfig& config) {
    if (!node) {
        return;
    }
    readValue(node, "degradation", "memory_threshold", config.memory_threshold);
    readValue(node, "degradation", "critical_threshold", config.critical_threshold);

    int64_t interval_ms = config.monitoring_interval.count();
    if (readValue(node, "degradation", "monitoring_interval_ms", interval_ms)) {
        config.monitoring_interval = std::chrono::milliseconds(interval_ms);
    }
}

void parseOrchestrator(const YAML::Node& node, OrchestratorSettings& settings) {
    if (!node) {
        return;
    }
    double limit_mb = static_cast<double>(settings.memory_limit) / kBytesPerMB;
    if (readValue(node, "orchestrator", "memory_limit_mb", limit_mb)) {
        if (limit_mb <= 0.0) {
            throw ConfigError("'orchestrator.memory_limit_mb' must be positive");
        }
        settings.memory_limit = static_cast<uint64_t>(limit_mb * kBytesPerMB);
    }
    readValue(node, "orchestrator", "check_system_memory", settings.check_system_memory);
}

void parseLogging(const YAML::Node& node, LoggingSettings& settings) {
    if (!node) {
        return;
    }
    readValue(node, "logging", "directory", settings.directory);
    readValue(node, "logging", "console_level", settings.console_level);
    readValue(node, "logging", "file_level", settings.file_level);
    readValue(node, "logging", "console", settings.console_enabled);
    readValue(node, "logging", "file", settings.file_enabled);

    double size_mb = static_cast<double>(settings.max_file_size) / kBytesPerMB;
    if (readValue(node, "logging", "max_file_size_mb", size_mb)) {
        if (size_mb <= 0.0) {
            throw ConfigError("'logging.max_file_size_mb' must be positive");
        }
        settings.max_file_size = static_cast<size_t>(size_mb * kBytesPerMB);
    }
    readValue(node, "logging", "max_files", settings.max_files);
}

std::vector<ModelProfile> parseModels(const YAML::Node& node) {
    std::vector<ModelProfile> profiles;
    if (!node) {
        return profiles;
    }

    for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
        ModelProfile profile;
        profile.model.id = it->first.as<std::string>();
        profile.model.name = profile.model.id;

        const std::string key = "models." + profile.model.id;
        YAML::Node model_node = it->second;
        if (!model_node.IsMap()) {
            throw ConfigError("'" + key + "' must be a mapping");
        }

        readValue(model_node, key, "name", profile.model.name);

        double memory_mb = 0.0;
        if (readValue(model_node, key, "memory_mb", memory_mb)) {
            if (memory_mb < 0.0) {
                throw ConfigError("'" + key + ".memory_mb' must not be negative");
            }
            profile.model.memory_requirement = static_cast<uint64_t>(memory_mb * kBytesPerMB);
        }

        if (model_node["capabilities"]) {
            for (const auto& cap : model_node["capabilities"]) {
                profile.model.capabilities.push_back(parseCapability(cap.as<std::string>(), key + ".capabilities"));
            }
        }

        YAML::Node baselines = model_node["baseline_scores"];
        if (baselines) {
            for (YAML::const_iterator score_it = baselines.begin(); score_it != baselines.end(); ++score_it) {
                auto capability = parseCapability(score_it->first.as<std::string>(), key + ".baseline_scores");
                double score = 0.0;
                try {
                    score = score_it->second.as<double>();
                } catch (const YAML::Exception& e) {
                    throw ConfigError("Invalid value in '" + key + ".baseline_scores': " + e.what());
                }
                if (score < 0.0 || score > 1.0) {
                    throw ConfigError("'" + key + ".baseline_scores' values must be in [0,1]");
                }
                profile.baseline_scores[capability] = score;
            }
        }

        YAML::Node cost = model_node["cost"];
        if (cost) {
            readValue(cost, key + ".cost", "memory_mb", profile.estimated_cost.memory);
            readValue(cost, key + ".cost", "cpu", profile.estimated_cost.cpu);
            readValue(cost, key + ".cost", "tokens", profile.estimated_cost.tokens);
            readValue(cost, key + ".cost", "latency_ms", profile.estimated_cost.expected_latency);
        }

        profiles.push_back(profile);
    }

    return profiles;
}

MaestroConfig parseRoot(const YAML::Node& root) {
    MaestroConfig config;

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    parseResources(section(root, "resources"), config.resources);
    parseScoring(section(root, "scoring"), config.scoring);
    parseDegradation(section(root, "degradation"), config.degradation);
    parseOrchestrator(section(root, "orchestrator"), config.orchestrator);
    parseLogging(section(root, "logging"), config.logging);
    config.models = parseModels(section(root, "models"));

    ConfigLoader::validate(config);
    return config;
}

} // namespace

MaestroConfig ConfigLoader::loadFromFile(const std::string& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    MaestroConfig config;
    try {
        config = parseRoot(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse " + path + ": " + e.what());
    }

    Logger::getInstance().info("ConfigLoader", "Loaded configuration", path);
    return config;
}

MaestroConfig ConfigLoader::loadFromString(const std::string& yaml) {
    try {
        return parseRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
}

void ConfigLoader::validate(const MaestroConfig& config) {
    const auto& resources = config.resources;
    if (resources.max_memory_mb <= 0.0) {
        throw ConfigError("'resources.max_memory_mb' must be positive");
    }
    if (resources.max_cpu <= 0.0 || resources.max_cpu > 1.0) {
        throw ConfigError("'resources.max_cpu' must be in (0,1]");
    }
    if (resources.max_tokens_per_second <= 0.0) {
        throw ConfigError("'resources.max_tokens_per_second' must be positive");
    }
    if (resources.min_timeout_ms <= 0 || resources.min_timeout_ms > resources.max_timeout_ms) {
        throw ConfigError("'resources.min_timeout_ms' must be positive and not above max_timeout_ms");
    }
    if (resources.default_timeout_ms <= 0) {
        throw ConfigError("'resources.default_timeout_ms' must be positive");
    }
    if (resources.high_utilization_threshold <= 0.0 ||
        resources.high_utilization_threshold > resources.critical_utilization_threshold) {
        throw ConfigError("'resources.high_utilization_threshold' must be positive and not above the critical threshold");
    }
    if (resources.max_optimization_attempts < 0) {
        throw ConfigError("'resources.max_optimization_attempts' must not be negative");
    }

    const auto& scoring = config.scoring;
    if (scoring.decay_factor <= 0.0 || scoring.decay_factor > 1.0) {
        throw ConfigError("'scoring.decay_factor' must be in (0,1]");
    }
    if (scoring.time_window.count() <= 0) {
        throw ConfigError("'scoring.time_window_ms' must be positive");
    }
    if (scoring.min_samples == 0) {
        throw ConfigError("'scoring.min_samples' must be at least 1");
    }
    const auto& weights = scoring.weight_factors;
    if (weights.success_rate < 0.0 || weights.latency < 0.0 || weights.resource_usage < 0.0) {
        throw ConfigError("'scoring.weight_factors' must not be negative");
    }

    const auto& degradation = config.degradation;
    if (degradation.memory_threshold <= 0.0 || degradation.memory_threshold > 100.0) {
        throw ConfigError("'degradation.memory_threshold' must be in (0,100]");
    }
    if (degradation.critical_threshold < degradation.memory_threshold || degradation.critical_threshold > 100.0) {
        throw ConfigError("'degradation.critical_threshold' must be between memory_threshold and 100");
    }
    if (degradation.monitoring_interval.count() <= 0) {
        throw ConfigError("'degradation.monitoring_interval_ms' must be positive");
    }

    if (!isLogLevel(config.logging.console_level)) {
        throw ConfigError("Unknown log level for 'logging.console_level': " + config.logging.console_level);
    }
    if (!isLogLevel(config.logging.file_level)) {
        throw ConfigError("Unknown log level for 'logging.file_level': " + config.logging.file_level);
    }

    for (const auto& profile : config.models) {
        if (profile.model.capabilities.empty()) {
            throw ConfigError("Model '" + profile.model.id + "' declares no capabilities");
        }
        if (profile.estimated_cost.cpu <= 0.0 || profile.estimated_cost.cpu > 1.0) {
            throw ConfigError("'models." + profile.model.id + ".cost.cpu' must be in (0,1]");
        }
        if (profile.estimated_cost.memory < 0.0) {
            throw ConfigError("'models." + profile.model.id + ".cost.memory_mb' must not be negative");
        }
        if (profile.estimated_cost.tokens < 0.0) {
            throw ConfigError("'models." + profile.model.id + ".cost.tokens' must not be negative");
        }
    }
}

void ConfigLoader::applyLogging(const LoggingSettings& settings) {
    auto& logger = Logger::getInstance();
    logger.setConsoleLogging(settings.console_enabled);
    logger.setFileLogging(settings.file_enabled);
    logger.setConsoleLogLevel(Logger::parseLevel(settings.console_level));
    logger.setFileLogLevel(Logger::parseLevel(settings.file_level));
    logger.initialize(settings.directory, settings.max_file_size, settings.max_files);
}

} // namespace Maestro
